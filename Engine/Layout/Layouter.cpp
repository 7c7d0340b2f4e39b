/**
 *  Layouter.cpp
 *  SNRScripter
 *
 *  Message text layouter: turns a message with @ escapes into timed glyph, voice and wait commands.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Layout/Layouter.hpp"
#include "Support/Errors.hpp"
#include "Support/FileDefs.hpp"
#include "Support/Unicode.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>

namespace Layout {

namespace {
const std::u32string CANT_START_LINE = U")>]―’”‥…─♪、。々〉》」』】〕〟ぁぃぅぇぉっゃゅょゎんゝゞァィゥェォッャュョヮヵヶ・ーヽヾ！）：；？｝～";
const std::u32string CANT_END_LINE   = U"(<[‘“〈《「『【〔〝（｛";

const char32_t IDEOGRAPHIC_SPACE     = 0x3000;
const char32_t IDEOGRAPHIC_COMMA     = 0x3001;
const char32_t IDEOGRAPHIC_FULL_STOP = 0x3002;

// Spacing between the commands of one block
const float TIME_EPSILON = 0.001f;

float fadeFromNumber(int32_t fade) {
	return std::max(fade, 0) * 0.001f;
}

float fontScaleFromNumber(int32_t size) {
	return std::min(std::max(size, 10), 200) * 0.01f;
}

float voiceVolumeFromNumber(int32_t volume) {
	return std::min(std::max(volume, 0), 100) * 0.01f;
}

bool isQuotationOpener(char32_t cp) {
	return cp == U'「' || cp == U'（' || cp == U'『';
}
} // namespace

const char *commandTypeName(CommandType type) {
	switch (type) {
		case CommandType::Char:
			return "Char";
		case CommandType::Section:
			return "Section";
		case CommandType::Sync:
			return "Sync";
		case CommandType::Voice:
			return "Voice";
		case CommandType::VoiceSync:
			return "VoiceSync";
		case CommandType::VoiceWait:
			return "VoiceWait";
		case CommandType::Wait:
			return "Wait";
	}
	return "Unknown";
}

Params Params::messageWindow(MessageTextLayout alignment) {
	Params p;
	p.layoutWidth             = 1500;
	p.alignment               = alignment;
	p.lineSpacing             = 0;
	p.lineBelow               = 0;
	p.lineGap                 = 4;
	p.rubiSize                = 20;
	p.textSize                = 50;
	p.horizontalScale         = 0.9697f;
	p.kinsoku                 = true;
	p.alwaysLeaveSpaceForRubi = true;
	p.softBreaks              = true;
	return p;
}

FloatColor4 colorFromDecimal(int32_t rgb) {
	rgb = std::min(std::max(rgb, 0), 999);
	return {(rgb / 100) / 9.0f, ((rgb / 10) % 10) / 9.0f, (rgb % 10) / 9.0f, 1};
}

float drawSpeedFromNumber(int32_t speed) {
	speed = std::min(std::max(speed, 0), 100);
	return (100 - speed) * 0.0001f * 0.25f;
}

/* ---------------- TextLayouter ----------------- */

TextLayouter::TextLayouter(const FontMetrics &normal, const FontMetrics &bold, const Params &p, const Defaults &defaults)
    : fontNormal(normal), fontBold(bold), params(p) {
	if (params.rubiSize == 0)
		params.rubiSize = params.textSize * 0.4f;
	defaultColor     = colorFromDecimal(defaults.color);
	defaultDrawSpeed = drawSpeedFromNumber(defaults.drawSpeed);
	defaultFade      = fadeFromNumber(defaults.fade);
}

void TextLayouter::onMessageStart() {
	commands.clear();
	lines.clear();
	finalizedCount = 0;
	position       = Vec2::Zero();

	currentTime    = 0;
	blockStartTime = 0;
	blockMaxTime   = 0;
	fontScale      = 1;
	color          = defaultColor;
	drawSpeed      = defaultDrawSpeed;
	fade           = defaultFade;
	instant        = false;
	autoClick      = false;
	lipsync        = true;
	voiceVolume    = 1;
	lastVoiceIndex = 0;

	// The rubi text survives between messages
	rubiOpen       = false;
	rubiStartIndex = 0;
	rubiStartX     = 0;
	rubiStartTime  = 0;
	bold           = false;

	sectionCounter = 1;
	syncCounter    = 0;
	size           = Vec2::Zero();
}

void TextLayouter::onMessageEnd() {
	onRubiBaseEnd();

	Command cmd;
	cmd.type        = CommandType::Wait;
	cmd.time        = blockEndTime();
	cmd.isLastWait  = true;
	cmd.isAutoClick = autoClick;

	blockMaxTime = 0;
	currentTime += TIME_EPSILON;
	blockStartTime = currentTime;

	commands.push_back(std::move(cmd));
	onNewline();

	std::stable_sort(commands.begin(), commands.end(), [](const Command &a, const Command &b) {
		return a.time < b.time;
	});
}

Result TextLayouter::finish() {
	Result result;
	result.commands = std::move(commands);
	result.lines    = std::move(lines);
	result.size     = size;
	commands.clear();
	lines.clear();
	return result;
}

void TextLayouter::onChar(char32_t codepoint) {
	bool cantStart = params.kinsoku && CANT_START_LINE.find(codepoint) != std::u32string::npos;
	bool cantEnd   = params.kinsoku && CANT_END_LINE.find(codepoint) != std::u32string::npos;

	auto &font = bold ? fontBold : fontNormal;
	auto info  = font.glyphInfo(codepoint);

	float scale           = params.textSize / (font.ascent() + font.descent()) * fontScale;
	float horizontalScale = scale * params.horizontalScale;

	// Once past the start of the rubi base the line may not break
	if (rubiOpen)
		cantStart = rubiStartX != position.x();

	Command cmd;
	cmd.type            = CommandType::Char;
	cmd.time            = currentTime;
	cmd.codepoint       = codepoint;
	cmd.bold            = bold;
	cmd.cantStartLine   = cantStart;
	cmd.cantEndLine     = cantEnd;
	cmd.hasRubi         = rubiOpen;
	cmd.width           = horizontalScale * info.advanceWidth;
	cmd.height          = params.textSize * fontScale;
	cmd.position        = position;
	cmd.horizontalScale = horizontalScale;
	cmd.scale           = scale;
	cmd.color           = color;
	cmd.fade            = fade;

	if (instant) {
		cmd.fade = 0;
	} else {
		currentTime += cmd.width * drawSpeed;
		float punctuationDelay = 0;
		if (codepoint == IDEOGRAPHIC_FULL_STOP)
			punctuationDelay = 4;
		else if (codepoint == IDEOGRAPHIC_COMMA)
			punctuationDelay = 2;
		currentTime += params.textSize * punctuationDelay * drawSpeed;
	}
	position.x() += cmd.width;

	commands.push_back(std::move(cmd));
}

void TextLayouter::onNewline() {
	onRubiBaseEnd();

	std::vector<size_t> chars;
	for (size_t i = finalizedCount; i < commands.size(); i++)
		if (commands[i].type == CommandType::Char && !commands[i].isRubi)
			chars.push_back(i);

	// Line break prohibitions hold pairwise
	for (size_t i = 1; i < chars.size(); i++) {
		auto &prev = commands[chars[i - 1]];
		auto &cur  = commands[chars[i]];
		if (cur.cantStartLine)
			prev.cantEndLine = true;
		else if (prev.cantEndLine)
			cur.cantStartLine = true;
	}
	if (!chars.empty()) {
		commands[chars.front()].cantStartLine = false;
		commands[chars.back()].cantEndLine    = false;
	}

	if (params.softBreaks) {
		while (!chars.empty()) {
			size_t validLineEnd = chars.size();
			size_t breakAt      = chars.size();
			for (size_t i = 0; i < chars.size(); i++) {
				auto &c = commands[chars[i]];
				// finalizeUpTo may have changed the width
				float width = params.layoutWidth;
				if (c.position.x() >= width || c.rightBorder() > width + width * 0.05f) {
					breakAt = validLineEnd != chars.size() ? validLineEnd : i;
					break;
				}
				breakAt = i + 1;
				if (c.cantEndLine)
					breakAt = validLineEnd;
				validLineEnd = breakAt;
			}

			if (breakAt == chars.size())
				break;
			// A single glyph wider than the line still gets one
			if (breakAt == 0)
				breakAt = 1;
			if (breakAt == chars.size())
				break;

			finalizeUpTo(chars[breakAt], false);
			chars.erase(chars.begin(), chars.begin() + breakAt);
		}
	}

	finalizeUpTo(commands.size(), true);
	position.x() = 0;
}

void TextLayouter::onClickWait() {
	onRubiBaseEnd();

	Command cmd;
	cmd.type = CommandType::Wait;
	cmd.time = blockEndTime();

	blockMaxTime = 0;
	currentTime += TIME_EPSILON;
	blockStartTime = currentTime;

	commands.push_back(std::move(cmd));
}

void TextLayouter::onAutoClick() {
	autoClick = true;
}

void TextLayouter::onSetFontScale(int32_t scale) {
	fontScale = scale < 0 ? defaultFontScale : fontScaleFromNumber(scale);
}

void TextLayouter::onSetColor(int32_t value) {
	color = value < 0 ? defaultColor : colorFromDecimal(value);
}

void TextLayouter::onSetDrawSpeed(int32_t speed) {
	drawSpeed = speed < 0 ? defaultDrawSpeed : drawSpeedFromNumber(speed);
}

void TextLayouter::onSetFade(int32_t value) {
	fade = value < 0 ? defaultFade : fadeFromNumber(value);
}

void TextLayouter::onWait(int32_t delay) {
	currentTime += delay * 0.001f;
}

void TextLayouter::onStartParallel() {
	blockMaxTime = std::max(blockMaxTime, currentTime);
	currentTime  = blockStartTime;
}

void TextLayouter::onSection() {
	Command cmd;
	cmd.type  = CommandType::Section;
	cmd.time  = blockEndTime();
	cmd.index = sectionCounter++;

	currentTime    = cmd.time;
	blockStartTime = currentTime;
	blockMaxTime   = 0;

	commands.push_back(std::move(cmd));
}

void TextLayouter::onSync() {
	onRubiBaseEnd();

	Command cmd;
	cmd.type  = CommandType::Sync;
	cmd.time  = blockEndTime();
	cmd.index = syncCounter++;

	currentTime    = cmd.time + TIME_EPSILON;
	blockStartTime = currentTime;
	blockMaxTime   = 0;

	commands.push_back(std::move(cmd));
}

void TextLayouter::onInstantStart() {
	onRubiBaseEnd();
	instant = true;
}

void TextLayouter::onInstantEnd() {
	onRubiBaseEnd();
	instant = false;
}

void TextLayouter::onLipsync(bool enabled) {
	lipsync = enabled;
}

void TextLayouter::onSetVoiceVolume(int32_t volume) {
	voiceVolume = volume < 0 ? 1 : voiceVolumeFromNumber(volume);
}

void TextLayouter::onVoice(const std::string &filename) {
	onRubiBaseEnd();

	Command cmd;
	cmd.type     = CommandType::Voice;
	cmd.time     = currentTime;
	cmd.filename = filename;
	cmd.volume   = voiceVolume;
	cmd.lipsync  = lipsync;

	blockStartTime = currentTime;
	blockMaxTime   = 0;

	lastVoiceIndex = commands.size();
	commands.push_back(std::move(cmd));
}

void TextLayouter::onVoiceSync(int32_t targetInstant) {
	onRubiBaseEnd();

	Command cmd;
	cmd.type          = CommandType::VoiceSync;
	cmd.time          = blockEndTime();
	cmd.targetInstant = targetInstant;

	if (lastVoiceIndex < commands.size()) {
		auto &last = commands[lastVoiceIndex];
		if (last.type == CommandType::Voice)
			last.timeToFirstSync = targetInstant;
		else if (last.type == CommandType::VoiceSync)
			last.timeToNextSync = targetInstant - last.targetInstant;
	}

	currentTime    = cmd.time;
	blockStartTime = currentTime;
	blockMaxTime   = 0;

	lastVoiceIndex = commands.size();
	commands.push_back(std::move(cmd));
}

void TextLayouter::onVoiceWait() {
	Command cmd;
	cmd.type = CommandType::VoiceWait;
	cmd.time = blockEndTime();

	currentTime    = cmd.time + TIME_EPSILON;
	blockStartTime = currentTime;
	blockMaxTime   = 0;

	commands.push_back(std::move(cmd));
}

void TextLayouter::onRubiContent(const std::u32string &content) {
	rubiText = content;
}

void TextLayouter::onRubiBaseStart() {
	if (rubiOpen)
		return;
	rubiOpen       = true;
	rubiStartIndex = commands.size();
	rubiStartX     = position.x();
	rubiStartTime  = currentTime;
}

void TextLayouter::onRubiBaseEnd() {
	if (!rubiOpen)
		return;
	rubiOpen = false;
	if (rubiText.empty() || rubiStartX == position.x())
		return;

	float scale           = params.rubiSize / (fontNormal.ascent() + fontNormal.descent());
	float horizontalScale = scale * params.horizontalScale;
	float rubiX = 0, rubiTime = 0;

	std::vector<Command> rubi;
	rubi.reserve(rubiText.size());
	for (auto codepoint : rubiText) {
		auto info = fontNormal.glyphInfo(codepoint);

		Command cmd;
		cmd.type            = CommandType::Char;
		cmd.time            = rubiStartTime + rubiTime;
		cmd.codepoint       = codepoint;
		cmd.isRubi          = true;
		cmd.width           = horizontalScale * info.advanceWidth;
		cmd.height          = params.rubiSize;
		cmd.position        = Vec2(rubiStartX + rubiX, position.y());
		cmd.horizontalScale = horizontalScale;
		cmd.scale           = scale;
		cmd.color           = color;
		// Instant rubi keeps its fade
		cmd.fade = fade;

		if (!instant)
			rubiTime += cmd.width * drawSpeed;
		rubiX += cmd.width;
		rubi.push_back(std::move(cmd));
	}

	// The narrower of the two runs is spread evenly over the wider one
	auto reflow = [](Command *first, size_t count, float extraWidth, float extraTime) {
		float widthEach = extraWidth / (count + 1);
		float timeEach  = extraTime / (count + 1);
		float x = widthEach, t = timeEach;
		for (size_t i = 0; i < count; i++) {
			first[i].position.x() += x;
			first[i].time += t;
			x += widthEach;
			t += timeEach;
		}
	};

	float baseWidth = position.x() - rubiStartX;
	float baseTime  = currentTime - rubiStartTime;

	if (rubiX <= baseWidth) {
		reflow(rubi.data(), rubi.size(), baseWidth - rubiX, baseTime - rubiTime);
	} else {
		reflow(commands.data() + rubiStartIndex, commands.size() - rubiStartIndex, rubiX - baseWidth, rubiTime - baseTime);
		position.x() = rubiStartX + rubiX;
		currentTime  = rubiStartTime + rubiTime;
	}

	for (auto &cmd : rubi)
		commands.push_back(std::move(cmd));
}

void TextLayouter::onBold(bool enabled) {
	bold = enabled;
}

void TextLayouter::finalizeUpTo(size_t index, bool hardBreak) {
	float maxWidth = 0, lineHeight = 0, rubiHeight = 0;
	size_t charCount = 0;
	for (size_t i = finalizedCount; i < index; i++) {
		auto &c = commands[i];
		if (c.type != CommandType::Char)
			continue;
		maxWidth = std::max(maxWidth, c.rightBorder());
		if (c.isRubi) {
			rubiHeight = params.rubiSize;
		} else {
			lineHeight = std::max(lineHeight, c.height);
			if (params.alwaysLeaveSpaceForRubi)
				rubiHeight = params.rubiSize;
			charCount++;
		}
	}

	if (charCount == 0) {
		lineHeight = params.textSize * fontScale;
		if (params.alwaysLeaveSpaceForRubi)
			rubiHeight = params.rubiSize;
	}

	float layoutWidth = params.layoutWidth;
	float lineWidth   = maxWidth;

	float ascent       = fontNormal.ascent();
	float descent      = fontNormal.descent();
	float ascentScaled = (charCount == 0 ? params.textSize : lineHeight) / (ascent + descent) * ascent;
	float rubiAscent   = rubiHeight / (ascent + descent) * ascent;

	if (charCount > 0) {
		if (maxWidth >= layoutWidth) {
			// Soft breaks allow up to 5% of overflow, squish it back in
			float squish = layoutWidth / maxWidth;
			for (size_t i = finalizedCount; i < index; i++) {
				auto &c = commands[i];
				if (c.type != CommandType::Char)
					continue;
				c.position.x() *= squish;
				c.width *= squish;
				c.horizontalScale *= squish;
			}
			lineWidth = layoutWidth;
		} else if (!hardBreak && params.alignment == MessageTextLayout::Layout && layoutWidth - maxWidth < layoutWidth * 0.05f) {
			for (size_t i = finalizedCount; i < index; i++) {
				auto &c = commands[i];
				if (c.type != CommandType::Char)
					continue;
				float x        = c.position.x();
				float denom    = x + (maxWidth - (x + c.width));
				c.position.x() = denom == 0 ? 0 : (layoutWidth - c.width) * (x / denom);
			}
			lineWidth = layoutWidth;
		}

		float xOffset = 0;
		if (params.alignment == MessageTextLayout::Center)
			xOffset = (layoutWidth - lineWidth) / 2;
		else if (params.alignment == MessageTextLayout::Right)
			xOffset = layoutWidth - lineWidth;

		for (size_t i = finalizedCount; i < index; i++) {
			auto &c = commands[i];
			if (c.type != CommandType::Char)
				continue;
			c.position.x() += xOffset;
			c.position.y() += params.lineSpacing + (c.isRubi ? rubiAscent : rubiHeight + ascentScaled);
		}
	}

	for (size_t i = finalizedCount; i < index; i++)
		commands[i].lineIndex = lines.size();

	float lineAdvance = params.lineSpacing + rubiHeight + lineHeight + params.lineBelow;

	LineInfo line;
	line.width       = lineWidth;
	line.y           = position.y();
	line.lineAdvance = lineAdvance;
	line.totalHeight = params.lineSpacing + rubiHeight + ascentScaled;
	line.rubiHeight  = rubiHeight;
	lines.push_back(line);

	size.x() = std::max(size.x(), lineWidth);
	size.y() = position.y() + lineAdvance;

	float advance = lineAdvance + params.lineGap;

	// What follows moves down a line, an ideographic space at its start is swallowed
	bool first           = true;
	float negativeOffset = maxWidth;
	for (size_t i = index; i < commands.size(); i++) {
		auto &c = commands[i];
		if (c.type != CommandType::Char)
			continue;
		if (first && !c.hasRubi && c.codepoint == IDEOGRAPHIC_SPACE) {
			negativeOffset += c.width;
			c.width           = 0;
			c.horizontalScale = 0;
		}
		first = false;
		c.position.x() -= negativeOffset;
		c.position.y() += advance;
	}

	position.x() -= maxWidth;
	position.y() += advance;
	finalizedCount = index;
}

/* ---------------- MessageLayerLayouter ----------------- */

constexpr int32_t MessageLayerLayouter::CHARACTER_NAME_FONT_SIZE;
constexpr float MessageLayerLayouter::CHARACTER_NAME_WIDTH;

MessageLayerLayouter::MessageLayerLayouter(const FontMetrics &normal, const FontMetrics &bold, MessageboxType type,
                                           const Params &params, const Defaults &defaults)
    : TextLayouter(normal, bold, params, defaults), boxType(type) {}

void MessageLayerLayouter::onMessageStart() {
	TextLayouter::onMessageStart();
	lineIndex       = 0;
	quotation       = QuotationState::Uninit;
	quotationOpener = 0;
	quotationLevel  = 0;
	quotationIndent = 0;
}

void MessageLayerLayouter::onChar(char32_t codepoint) {
	if (lineIndex == 0) {
		// The novel box has no name plate
		if (boxType == MessageboxType::Novel)
			return;
		fontScale = fontScaleFromNumber(CHARACTER_NAME_FONT_SIZE);
		instant   = true;
	}
	TextLayouter::onChar(codepoint);
}

void MessageLayerLayouter::onNewline() {
	if (lineIndex == 0) {
		if (boxType != MessageboxType::Novel) {
			bool leaveSpaceForRubi         = params.alwaysLeaveSpaceForRubi;
			params.alwaysLeaveSpaceForRubi = true;
			fontScale                      = fontScaleFromNumber(CHARACTER_NAME_FONT_SIZE);
			// Names get no quotation handling
			TextLayouter::finalizeUpTo(commands.size(), true);

			auto &line = lines.front();
			if (line.width > 0) {
				float xOffset = 0;
				if (line.width < CHARACTER_NAME_WIDTH) {
					xOffset    = (CHARACTER_NAME_WIDTH - line.width) / 2;
					line.width = CHARACTER_NAME_WIDTH;
				}
				for (auto &c : commands) {
					if (c.type != CommandType::Char)
						continue;
					c.position.x() += xOffset;
					if (!c.isRubi)
						c.position.y() -= params.rubiSize;
				}
			}

			fontScale = defaultFontScale;
			position.y() -= params.lineGap + params.rubiSize - 20;
			instant                        = false;
			params.alwaysLeaveSpaceForRubi = leaveSpaceForRubi;
		}
	} else {
		TextLayouter::onNewline();
		if (quotation == QuotationState::Ignored)
			quotation = QuotationState::Uninit;
	}
	lineIndex++;
}

void MessageLayerLayouter::finalizeUpTo(size_t index, bool hardBreak) {
	size_t from = finalizedCount;
	TextLayouter::finalizeUpTo(index, hardBreak);

	switch (quotation) {
		case QuotationState::Uninit:
			for (size_t i = from; i < index; i++) {
				auto &c = commands[i];
				if (c.type != CommandType::Char || c.isRubi)
					continue;
				if (!isQuotationOpener(c.codepoint)) {
					quotation = QuotationState::Ignored;
					return;
				}
				// Following lines line up after the opening bracket
				params.layoutWidth += quotationIndent;
				quotation       = QuotationState::Open;
				quotationIndent = c.width;
				quotationOpener = c.codepoint;
				quotationLevel  = 0;
				params.layoutWidth -= quotationIndent;
				break;
			}
			break;
		case QuotationState::Open:
			for (size_t i = from; i < index; i++)
				if (commands[i].type == CommandType::Char)
					commands[i].position.x() += quotationIndent;
			break;
		case QuotationState::Ignored:
			return;
	}

	for (size_t i = from; i < index; i++) {
		auto &c = commands[i];
		if (c.type != CommandType::Char || c.isRubi)
			continue;
		if (c.codepoint == quotationOpener)
			quotationLevel++;
		else if (quotationOpener != 0 && c.codepoint == quotationOpener + 1)
			quotationLevel--;
	}

	if (quotationLevel < 1) {
		params.layoutWidth += quotationIndent;
		quotationIndent = 0;
		quotation       = QuotationState::Uninit;
	}
}

/* ---------------- Parsing ----------------- */

namespace {
class EscapeReader {
	const std::string &message;
	size_t pos{0};

public:
	explicit EscapeReader(const std::string &m)
	    : message(m) {}

	bool done() const {
		return pos >= message.size();
	}
	size_t offset() const {
		return pos;
	}

	char32_t next() {
		char32_t cp = 0;
		size_t n    = decodeUTF8Symbol(message.data() + pos, message.size() - pos, cp);
		if (n == 0)
			throw ParseError(ParseError::Kind::InvalidByte, "malformed UTF-8 at offset " + std::to_string(pos));
		pos += n;
		return cp;
	}

	// Everything up to the terminating dot
	std::string argument(char escape) {
		auto end = message.find('.', pos);
		if (end == std::string::npos)
			throw ParseError(ParseError::Kind::TruncatedStream, std::string("unterminated @") + escape + " argument");
		auto arg = message.substr(pos, end - pos);
		pos      = end + 1;
		return arg;
	}

	// Empty arguments mean the default, reported as -1
	int32_t number(char escape) {
		auto arg = argument(escape);
		if (arg.empty())
			return -1;
		int64_t value = 0;
		for (auto c : arg) {
			if (c < '0' || c > '9')
				throw ParseError(ParseError::Kind::InvalidByte, std::string("non-numeric @") + escape + " argument '" + arg + "'");
			value = std::min<int64_t>(value * 10 + (c - '0'), INT32_MAX);
		}
		return static_cast<int32_t>(value);
	}
};
} // namespace

void parseMessage(const std::string &message, TextLayouter &layouter) {
	EscapeReader reader(message);
	while (!reader.done()) {
		char32_t cp = reader.next();
		if (cp == '\n') {
			layouter.onNewline();
			continue;
		}
		if (cp != '@') {
			layouter.onChar(cp);
			continue;
		}
		if (reader.done())
			throw ParseError(ParseError::Kind::TruncatedStream, "dangling @ at the end of the message");

		char32_t escape = reader.next();
		char e          = escape < 0x80 ? static_cast<char>(escape) : '?';
		switch (escape) {
			case '+':
				layouter.onLipsync(true);
				break;
			case '-':
				layouter.onLipsync(false);
				break;
			case 'a':
				layouter.onSetFade(reader.number(e));
				break;
			case 'b':
				layouter.onRubiContent(decodeUTF8String(reader.argument(e)));
				break;
			case '<':
				layouter.onRubiBaseStart();
				break;
			case '>':
				layouter.onRubiBaseEnd();
				break;
			case 'c':
				layouter.onSetColor(reader.number(e));
				break;
			case 'e':
				layouter.onAutoClick();
				break;
			case 'k':
				layouter.onClickWait();
				break;
			case 'o':
				layouter.onSetVoiceVolume(reader.number(e));
				break;
			case 'r':
				layouter.onNewline();
				break;
			case 's':
				layouter.onSetDrawSpeed(reader.number(e));
				break;
			case 't':
				layouter.onStartParallel();
				break;
			case 'u':
				layouter.onVoiceWait();
				break;
			case 'v':
				layouter.onVoice(reader.argument(e));
				break;
			case 'w':
				layouter.onWait(std::max(reader.number(e), 0));
				break;
			case 'x':
				layouter.onVoiceSync(std::max(reader.number(e), 0));
				break;
			case 'y':
				layouter.onSync();
				break;
			case 'z':
				layouter.onSetFontScale(reader.number(e));
				break;
			case '|':
				layouter.onSection();
				break;
			case '[':
				layouter.onInstantStart();
				break;
			case ']':
				layouter.onInstantEnd();
				break;
			case '{':
				layouter.onBold(true);
				break;
			case '}':
				layouter.onBold(false);
				break;
			case 'U': {
				auto arg = reader.argument(e);
				char *end{nullptr};
				auto value = std::strtoul(arg.c_str(), &end, 16);
				if (arg.empty() || *end != '\0' || value > 0x10FFFF)
					throw ParseError(ParseError::Kind::InvalidByte, "bad @U code point '" + arg + "'");
				layouter.onChar(static_cast<char32_t>(value));
				break;
			}
			case '@':
				layouter.onChar('@');
				break;
			default:
				throw ParseError(ParseError::Kind::InvalidByte, "unknown escape @" + std::string(1, e) + " at offset " + std::to_string(reader.offset()));
		}
	}
}

Result layoutMessage(const std::string &message, const FontMetrics &normal, const FontMetrics &bold,
                     MessageboxType type, MessageTextLayout alignment, const Defaults &defaults) {
	MessageLayerLayouter layouter(normal, bold, type, Params::messageWindow(alignment), defaults);
	layouter.onMessageStart();
	parseMessage(message, layouter);
	layouter.onMessageEnd();
	return layouter.finish();
}

} // namespace Layout
