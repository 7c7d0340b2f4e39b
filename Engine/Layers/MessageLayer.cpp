/**
 *  MessageLayer.cpp
 *  SNRScripter
 *
 *  Message window: box, name plate, timed glyphs, key wait and voice playback.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Layers/MessageLayer.hpp"
#include "Support/Errors.hpp"
#include "Support/FileDefs.hpp"

#include <algorithm>
#include <cmath>

constexpr float SlideInterpolator::RATE_PER_TICK;

float SlideInterpolator::update(Ticks delta) {
	float step = delta.value * RATE_PER_TICK * (increasing ? 1 : -1);
	current    = std::min(std::max(current + step, 0.0f), 1.0f);
	return current;
}

namespace {

FloatColor4 boxColor(MessageboxType type) {
	switch (type) {
		case MessageboxType::Neutral:
			return {0, 0, 0, 0.6f};
		case MessageboxType::WitchSpace:
			return {0.15f, 0.02f, 0.2f, 0.6f};
		case MessageboxType::Ushiromiya:
			return {0.2f, 0.1f, 0.02f, 0.6f};
		case MessageboxType::Novel:
			return {0, 0, 0, 0.5f};
		case MessageboxType::Transparent:
		case MessageboxType::NoText:
			break;
	}
	return FloatColor4::transparent();
}

DynamicBuffer::Slice pushTextQuad(DynamicBuffer &buffer, const Vec4 &rect, const Vec2 &uvMax) {
	float left = rect.x(), top = rect.y(), right = rect.x() + rect.z(), bottom = rect.y() + rect.w();
	TextVertex vertices[4]{
	    {{left, top, 0, 0}, 0},
	    {{right, top, uvMax.x(), 0}, 0},
	    {{left, bottom, 0, uvMax.y()}, 0},
	    {{right, bottom, uvMax.x(), uvMax.y()}, 0}};
	return buffer.allocate(vertices, sizeof(vertices));
}

} // namespace

void MessageLayer::setFonts(std::shared_ptr<const Font> normal, std::shared_ptr<const Font> bold) {
	fontNormal = std::move(normal);
	fontBold   = bold ? std::move(bold) : fontNormal;
	glyphTextures.clear();
}

void MessageLayer::resetMessage() {
	chars.clear();
	lines.clear();
	blocks.clear();
	messageSize = Vec2::Zero();
}

void MessageLayer::setStyle(const MessageboxStyle &newStyle) {
	if (!(newStyle == style) && slide.value() > 0) {
		slidingOut.push_back({style.type, SlideInterpolator(slide.value(), false), height});
		slide.set(0);
	}
	style = newStyle;
}

void MessageLayer::setMessage(uint32_t id, const std::string &text, uint32_t messageFlags, bool keepSlide) {
	resetMessage();

	flags     = messageFlags;
	messageId = id;
	slide.setIncreasing(true);

	currentBlock       = 0;
	currentTime        = 0;
	wait               = WaitKind::None;
	timeToSkipWait     = 0;
	autoplayVoiceDelay = 0;
	voicePlaying       = false;
	completedSections  = 0;
	receivedSyncs      = 0;
	sinceLastWait      = Ticks();
	cursor             = Vec2::Zero();
	voiceBlock         = 0;

	if (style.type == MessageboxType::Novel) {
		height = targetHeight = CANVAS_HEIGHT;
	} else {
		if (slide.value() == 0)
			height = BOX_HEIGHT;
		targetHeight = BOX_HEIGHT;
	}

	Layout::Defaults defaults;
	defaults.drawSpeed = style.type == MessageboxType::NoText ? 100 : drawSpeed;

	FallbackMetrics fallback;
	std::unique_ptr<FontFileMetrics> normalMetrics, boldMetrics;
	const FontMetrics *normal = &fallback, *bold = &fallback;
	if (fontNormal) {
		normalMetrics = std::make_unique<FontFileMetrics>(*fontNormal);
		boldMetrics   = std::make_unique<FontFileMetrics>(*fontBold);
		normal        = normalMetrics.get();
		bold          = boldMetrics.get();
	}

	Layout::Result result;
	try {
		result = Layout::layoutMessage(text, *normal, *bold, style.type, style.layout, defaults);
	} catch (const ParseError &e) {
		sendToLog(LogLevel::Error, "Message %u could not be laid out: %s\n", id, e.what());
		result = Layout::layoutMessage("", *normal, *bold, style.type, style.layout, defaults);
	}

	float waitAutoDelay = 0;
	for (auto &cmd : result.commands) {
		Block block;
		block.type = cmd.type;
		block.time = cmd.time;
		switch (cmd.type) {
			case Layout::CommandType::Char: {
				MessageChar c;
				c.layout = cmd;
				if (fontNormal)
					c.glyphId = (cmd.bold ? fontBold : fontNormal)->glyphId(cmd.codepoint);
				c.block        = blocks.size();
				c.progressRate = cmd.fade == 0 ? 1 : 1 / cmd.fade / Ticks::PER_SECOND;
				if (!cmd.isRubi)
					waitAutoDelay += 0.05f;
				chars.push_back(std::move(c));
				continue;
			}
			case Layout::CommandType::Section:
			case Layout::CommandType::Sync:
				block.index = cmd.index;
				break;
			case Layout::CommandType::Voice:
				block.filename        = cmd.filename;
				block.volume          = cmd.volume;
				block.lipsync         = cmd.lipsync;
				block.segmentDuration = static_cast<uint32_t>(std::max(cmd.timeToFirstSync, 0));
				break;
			case Layout::CommandType::VoiceSync:
				block.segmentStart    = static_cast<uint32_t>(std::max(cmd.targetInstant, 0));
				block.segmentDuration = static_cast<uint32_t>(std::max(cmd.timeToNextSync, 0));
				break;
			case Layout::CommandType::VoiceWait:
				break;
			case Layout::CommandType::Wait:
				block.autoDelay   = waitAutoDelay;
				block.isLastWait  = cmd.isLastWait;
				block.isAutoClick = cmd.isAutoClick;
				waitAutoDelay     = 0;
				break;
		}
		blocks.push_back(std::move(block));
	}
	lines       = std::move(result.lines);
	messageSize = result.size;

	if (!keepSlide)
		slide.set(1);
}

void MessageLayer::close(bool keepSlide) {
	stopVoice();
	slide.setIncreasing(false);
	if (!keepSlide)
		slide.set(0);
	resetMessage();
	currentBlock = 0;
	wait         = WaitKind::None;
}

void MessageLayer::playVoice(size_t voiceIndex, uint32_t segmentStart, uint32_t segmentDuration) {
	if (voiceIndex >= blocks.size() || blocks[voiceIndex].type != Layout::CommandType::Voice) {
		sendToLog(LogLevel::Warn, "Voice segment without a voice in message %u\n", messageId);
		return;
	}
	if (!voice || skipping)
		return;
	auto &block = blocks[voiceIndex];
	sendToLog(LogLevel::Info, "Playing voice %s (segment %u+%u)\n", block.filename.c_str(), segmentStart, segmentDuration);
	voicePlaying       = voice->playVoice(block.filename, segmentStart, segmentDuration, block.lipsync, block.volume);
	autoplayVoiceDelay = voicePlaying ? 0.5f : 0;
}

void MessageLayer::stopVoice() {
	if (voice)
		voice->stopVoice();
	voicePlaying       = false;
	autoplayVoiceDelay = 0;
}

bool MessageLayer::interestedInInput() const {
	if (!slide.fullyShown())
		return false;
	if (currentBlock >= blocks.size())
		return false;
	if (flags & MESSAGE_IGNORE_INPUT)
		return false;
	if (style.type == MessageboxType::NoText && wait == WaitKind::AutoClick)
		return false;
	return true;
}

bool MessageLayer::advance() {
	if (!slide.fullyShown() || currentBlock >= blocks.size() || (flags & MESSAGE_IGNORE_INPUT))
		return false;

	// A click first completes the glyphs that are still fading in
	bool completedChars = false;
	for (auto &c : chars) {
		if (c.block > currentBlock || c.progress >= 1)
			continue;
		c.progress     = 1;
		completedChars = true;
	}
	if (completedChars) {
		currentTime = blocks[currentBlock].time;
		return true;
	}

	if (wait != WaitKind::None) {
		stopVoice();
		wait = WaitKind::None;
		currentBlock++;
		return true;
	}

	auto &block = blocks[currentBlock];
	switch (block.type) {
		case Layout::CommandType::Voice:
		case Layout::CommandType::VoiceWait:
			stopVoice();
			break;
		case Layout::CommandType::VoiceSync:
			playVoice(voiceBlock, block.segmentStart, block.segmentDuration);
			currentBlock++;
			break;
		default:
			break;
	}
	return true;
}

void MessageLayer::fastForward() {
	stopVoice();
	skipping = true;
	height   = targetHeight;
	while (!finished()) {
		size_t before       = currentBlock;
		WaitKind waitBefore = wait;
		for (auto &c : chars)
			if (c.block <= currentBlock)
				c.progress = 1;
		if (wait != WaitKind::None) {
			wait = WaitKind::None;
			currentBlock++;
		} else {
			currentTime = std::max(currentTime, blocks[currentBlock].time);
			runBlocks();
		}
		// Held by a sync that was not signalled yet
		if (currentBlock == before && wait == waitBefore)
			break;
	}
	for (auto &c : chars)
		if (c.block <= currentBlock)
			c.progress = 1;
	skipping = false;
}

bool MessageLayer::sectionFinished(int32_t section) const {
	if (section < 0)
		return reachedLastWait();
	return finished() || completedSections > static_cast<uint32_t>(section);
}

size_t MessageLayer::visibleChars() const {
	return std::count_if(chars.begin(), chars.end(), [](const MessageChar &c) { return c.progress > 0; });
}

void MessageLayer::runBlocks() {
	while (currentBlock < blocks.size()) {
		auto &block = blocks[currentBlock];
		if (block.time > currentTime)
			break;

		bool stop = false;
		switch (block.type) {
			case Layout::CommandType::Voice:
				if (voicePlaying) {
					stop = true;
					break;
				}
				playVoice(currentBlock, 0, block.segmentDuration);
				voiceBlock = currentBlock;
				break;
			case Layout::CommandType::Wait: {
				if (std::fabs(height - targetHeight) > 0.5f) {
					stop = true;
					break;
				}
				auto current    = currentBlock;
				bool incomplete = std::any_of(chars.begin(), chars.end(), [current](const MessageChar &c) {
					return c.progress < 1 && c.block <= current;
				});
				if (incomplete || wait != WaitKind::None) {
					stop = true;
					break;
				}
				if (!(flags & MESSAGE_IGNORE_INPUT)) {
					if (block.isAutoClick)
						wait = WaitKind::AutoClick;
					else if (block.isLastWait)
						wait = WaitKind::Last;
					else
						wait = WaitKind::Regular;
					sinceLastWait = Ticks();
					// Skip speed of 80
					timeToSkipWait = block.autoDelay * 0.2f;
					stop           = true;
					break;
				}
				if (voice && voice->voicePlaying())
					stop = true;
				break;
			}
			case Layout::CommandType::Section:
				completedSections = block.index;
				break;
			case Layout::CommandType::Sync:
				if (receivedSyncs <= block.index)
					stop = true;
				break;
			case Layout::CommandType::VoiceSync:
				playVoice(voiceBlock, block.segmentStart, block.segmentDuration);
				break;
			case Layout::CommandType::VoiceWait:
				if (voicePlaying)
					stop = true;
				break;
			case Layout::CommandType::Char:
				break;
		}
		if (stop)
			break;
		currentBlock++;
	}
}

void MessageLayer::update(const UpdateContext &ctx) {
	Layer::update(ctx);
	Ticks dt = ctx.delta;

	slide.update(dt);
	for (auto &box : slidingOut)
		box.slide.update(dt);
	slidingOut.erase(std::remove_if(slidingOut.begin(), slidingOut.end(), [](const SlidingOut &box) { return box.slide.value() <= 0; }),
	                 slidingOut.end());

	if (slide.value() < 1)
		return;

	if (voicePlaying && !(voice && voice->voicePlaying()))
		voicePlaying = false;

	if (wait != WaitKind::None) {
		timeToSkipWait = std::max(timeToSkipWait - dt.seconds(), 0.0f);
		bool autoplayEffective = wait == WaitKind::AutoClick || ((autoplay || ctx.fastForwarding) && !(flags & MESSAGE_IGNORE_INPUT));
		if (!autoplayEffective) {
			if (!voicePlaying)
				autoplayVoiceDelay = 0.5f;
		} else if (timeToSkipWait <= 0 && !voicePlaying) {
			autoplayVoiceDelay = ctx.fastForwarding ? 0 : std::max(autoplayVoiceDelay - dt.seconds(), 0.0f);
			if (autoplayVoiceDelay <= 0) {
				wait = WaitKind::None;
				currentBlock++;
			}
		}
	}

	if (wait == WaitKind::None)
		runBlocks();

	for (auto &c : chars) {
		if (c.block > currentBlock || c.layout.time > currentTime)
			continue;
		c.progress = ctx.fastForwarding ? 1 : std::min(1.0f, c.progress + c.progressRate * dt.value);

		if (!c.layout.isRubi && c.layout.lineIndex < lines.size())
			targetHeight = std::max(targetHeight, std::min<float>(c.layout.position.y() + lines[c.layout.lineIndex].lineAdvance + 64, CANVAS_HEIGHT));

		Vec2 candidate(c.layout.rightBorder(), c.layout.position.y());
		if (cursor.y() == candidate.y()) {
			if (cursor.x() < candidate.x())
				cursor = candidate;
		} else if (cursor.y() < candidate.y()) {
			cursor = candidate;
		}
	}

	// The box grows towards the text at 30 units per tick
	if (height < targetHeight)
		height = std::min(targetHeight, height + 30 * dt.value);
	else
		height = targetHeight;

	if (currentBlock < blocks.size())
		currentTime = std::min(blocks[currentBlock].time, currentTime + dt.seconds());

	sinceLastWait += dt;
}

float MessageLayer::textY() const {
	if (style.type == MessageboxType::Novel)
		return std::max(32.0f, (CANVAS_HEIGHT - messageSize.y()) * 0.35f);
	return (1 - slide.value()) * 64 + (CANVAS_HEIGHT - height) - 32;
}

void MessageLayer::preRenderContent(PreRenderContext &ctx, const TransformParams &, const DrawableParams &) {
	if (!fontNormal)
		return;
	for (auto &c : chars) {
		if (c.progress <= 0)
			continue;
		auto key = std::make_pair(c.layout.bold, c.glyphId);
		if (glyphTextures.count(key))
			continue;
		auto &font  = c.layout.bold ? *fontBold : *fontNormal;
		Glyph glyph = font.glyph(c.glyphId).decompress();
		if (glyph.info.textureWidth == 0 || glyph.info.textureHeight == 0) {
			glyphTextures[key] = nullptr;
			continue;
		}
		glyphTextures[key] = ctx.backend.createTexture(glyph.mipWidth(0), glyph.mipHeight(0), TextureFormat::R8, glyph.mips[0].data());
	}
}

void MessageLayer::renderBox(RenderPass &pass, const Mat4 &transform, uint8_t stencilRef, MessageboxType type, float slideValue, float boxHeight) const {
	FloatColor4 color = boxColor(type);
	color.a *= slideValue * props.drawableParams().colorMultiplier.a;
	if (color.a <= 0)
		return;
	// The name plate sits on top of the box
	float top = CANVAS_HEIGHT - boxHeight - 32 + (1 - slideValue) * 64;

	ShaderArgs args;
	args.shader    = ShaderName::Fill;
	args.transform = transform;
	pass.run(RenderRequestBuilder()
	             .shader(args)
	             .depthStencilShorthand(stencilRef, true, false)
	             .colorBlend(ColorBlendType::LayerPremultiplied1)
	             .primitive(DrawPrimitive::TriangleStrip)
	             .vertices(VertexFormat::PosCol, pushQuad(pass.dynamicBuffer(), Vec4(0, top, CANVAS_WIDTH, boxHeight + 32), color.premultiply()), 4)
	             .build());
}

void MessageLayer::renderText(RenderPass &pass, const Mat4 &transform, uint8_t stencilRef) const {
	float alpha    = props.drawableParams().colorMultiplier.a;
	Mat4 textSpace = transform * Xform::translation(Vec3(static_cast<float>(TEXT_X), textY(), 0.0f));

	for (int border = 1; border >= 0; border--) {
		for (auto &c : chars) {
			if (c.progress <= 0)
				continue;
			auto it = glyphTextures.find(std::make_pair(c.layout.bold, c.glyphId));
			if (it == glyphTextures.end() || !it->second)
				continue;
			auto &font = c.layout.bold ? *fontBold : *fontNormal;
			auto &info = font.glyph(c.glyphId).info();

			float left = c.layout.position.x() + c.layout.horizontalScale * info.bearingX;
			float top  = c.layout.position.y() - c.layout.scale * info.bearingY;
			Vec4 rect(left, top, c.layout.horizontalScale * info.actualWidth, c.layout.scale * info.actualHeight);
			Vec2 uvMax(static_cast<float>(info.actualWidth) / info.textureWidth, static_cast<float>(info.actualHeight) / info.textureHeight);

			ShaderArgs args;
			args.transform   = textSpace;
			args.textures[0] = it->second;
			if (border) {
				args.shader = ShaderName::FontBorder;
				args.color  = {0, 0, 0, c.progress * alpha};
				// Four directions, the shader samples each one both ways
				float h = 1.5f / std::max(c.layout.horizontalScale, 0.01f), v = 1.5f / std::max(c.layout.scale, 0.01f);
				float d = static_cast<float>(M_SQRT1_2);
				args.distances = {{-d * h, -d * v, 0, -v, d * h, -d * v, -h, 0}};
			} else {
				args.shader = ShaderName::Font;
				args.color  = c.layout.color;
				args.color.a *= c.progress * alpha;
				args.color2 = args.color;
			}
			pass.run(RenderRequestBuilder()
			             .shader(args)
			             .depthStencilShorthand(stencilRef + 2, true, false)
			             .colorBlend(ColorBlendType::Layer1)
			             .primitive(DrawPrimitive::TriangleStrip)
			             .vertices(VertexFormat::Text, pushTextQuad(pass.dynamicBuffer(), rect, uvMax), 4)
			             .build());
		}
	}
}

void MessageLayer::renderContent(RenderPass &pass, const TransformParams &transform, const DrawableParams &, uint8_t stencilRef) const {
	if (pass.kind != PassKind::Transparent)
		return;

	Mat4 canvas = transform.finalTransform() * Xform::translation(Vec3(-CANVAS_WIDTH / 2.0f, -CANVAS_HEIGHT / 2.0f, 0.0f));

	for (auto &box : slidingOut)
		renderBox(pass, canvas, stencilRef, box.type, box.slide.value(), box.height);
	renderBox(pass, canvas, stencilRef, style.type, slide.value(), height);

	if (slide.value() < 1 || chars.empty())
		return;

	if (wait == WaitKind::Regular || wait == WaitKind::Last) {
		float wiggle = std::sin(sinceLastWait.seconds() * static_cast<float>(M_PI));
		FloatColor4 color{1, 1, 1, (wiggle * 0.4f + 0.6f) * props.drawableParams().colorMultiplier.a};
		Vec2 at = style.type == MessageboxType::NoText ? Vec2(1870.0f, 1030.0f) : Vec2(cursor.x() + TEXT_X, cursor.y() + textY() - KEYWAIT_SIZE);
		// The last wait blinks in a wider box
		float w = wait == WaitKind::Last ? KEYWAIT_SIZE * 1.5f : KEYWAIT_SIZE;

		ShaderArgs args;
		args.shader    = ShaderName::Fill;
		args.transform = canvas;
		pass.run(RenderRequestBuilder()
		             .shader(args)
		             .depthStencilShorthand(stencilRef + 1, true, false)
		             .colorBlend(ColorBlendType::LayerPremultiplied1)
		             .primitive(DrawPrimitive::TriangleStrip)
		             .vertices(VertexFormat::PosCol, pushQuad(pass.dynamicBuffer(), Vec4(at.x(), at.y(), w, KEYWAIT_SIZE), color.premultiply()), 4)
		             .build());
	}

	if (style.type == MessageboxType::NoText)
		return;
	renderText(pass, canvas, stencilRef);
}
