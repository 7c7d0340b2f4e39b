/**
 *  MessageLayer.hpp
 *  SNRScripter
 *
 *  Message window: box, name plate, timed glyphs, key wait and voice playback.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Core/VmState.hpp"
#include "Engine/Formats/Font.hpp"
#include "Engine/Layers/Layer.hpp"
#include "Engine/Layout/Layouter.hpp"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <cstdint>

// Where the message window sends the voices of a message
class VoiceOutput {
public:
	virtual ~VoiceOutput() = default;
	// Segment times are in milliseconds, a zero duration plays to the end. False if nothing plays.
	virtual bool playVoice(const std::string &filename, uint32_t segmentStart, uint32_t segmentDuration, bool lipsync, float volume) = 0;
	virtual void stopVoice()          = 0;
	virtual bool voicePlaying() const = 0;
};

// MSGSET flags
const uint32_t MESSAGE_IGNORE_INPUT = 0x2;

// Clamped 0..1 value that moves a tenth per tick in its direction
class SlideInterpolator {
	float current{0};
	bool increasing{false};

public:
	static constexpr float RATE_PER_TICK = 0.1f;

	SlideInterpolator(float value, bool isIncreasing)
	    : current(value), increasing(isIncreasing) {}

	float update(Ticks delta);
	void setIncreasing(bool isIncreasing) {
		increasing = isIncreasing;
	}
	void set(float value) {
		current = value;
	}
	float value() const {
		return current;
	}
	bool isIncreasing() const {
		return increasing;
	}
	bool fullyShown() const {
		return increasing && current >= 1;
	}
	bool fullyHidden() const {
		return !increasing && current <= 0;
	}
};

class MessageLayer : public Layer {
public:
	enum class WaitKind {
		None,
		Regular,
		Last,
		AutoClick
	};

	static const int32_t BOX_HEIGHT     = 357;
	static const int32_t TEXT_X         = 210;
	static const int32_t KEYWAIT_SIZE   = 30;
	static const int32_t CANVAS_WIDTH   = 1920;
	static const int32_t CANVAS_HEIGHT  = 1080;

private:
	struct Block {
		Layout::CommandType type;
		float time;
		// Section and Sync
		uint32_t index{0};
		// Voice
		std::string filename;
		float volume{1};
		bool lipsync{false};
		// Voice and VoiceSync, milliseconds
		uint32_t segmentStart{0};
		uint32_t segmentDuration{0};
		// Wait
		float autoDelay{0};
		bool isLastWait{false};
		bool isAutoClick{false};
	};

	struct MessageChar {
		Layout::Command layout;
		uint32_t glyphId{0};
		size_t block{0};
		float progressRate{1};
		float progress{0};
	};

	std::shared_ptr<const Font> fontNormal;
	std::shared_ptr<const Font> fontBold;
	// Glyph textures by (bold, glyph id)
	std::map<std::pair<bool, uint32_t>, TextureHandle> glyphTextures;
	VoiceOutput *voice{nullptr};

	SlideInterpolator slide{0, false};
	// Boxes of the previous style sliding out after a style change
	struct SlidingOut {
		MessageboxType type;
		SlideInterpolator slide;
		float height;
	};
	std::vector<SlidingOut> slidingOut;

	bool autoplay{false};
	int32_t drawSpeed{80};
	MessageboxStyle style;
	uint32_t flags{0};
	uint32_t messageId{0};

	std::vector<MessageChar> chars;
	std::vector<Layout::LineInfo> lines;
	std::vector<Block> blocks;
	Vec2 messageSize{Vec2::Zero()};

	size_t currentBlock{0};
	float currentTime{0};
	float height{BOX_HEIGHT};
	float targetHeight{BOX_HEIGHT};

	WaitKind wait{WaitKind::None};
	float timeToSkipWait{0};
	float autoplayVoiceDelay{0};
	bool voicePlaying{false};
	// Set while fast forwarding, voices are not started
	bool skipping{false};
	uint32_t completedSections{0};
	uint32_t receivedSyncs{0};
	Ticks sinceLastWait;
	Vec2 cursor{Vec2::Zero()};
	size_t voiceBlock{0};

	void resetMessage();
	void playVoice(size_t voiceIndex, uint32_t segmentStart, uint32_t segmentDuration);
	void stopVoice();
	void runBlocks();
	float textY() const;
	void renderBox(RenderPass &pass, const Mat4 &transform, uint8_t stencilRef, MessageboxType type, float slideValue, float boxHeight) const;
	void renderText(RenderPass &pass, const Mat4 &transform, uint8_t stencilRef) const;

protected:
	void preRenderContent(PreRenderContext &ctx, const TransformParams &transform, const DrawableParams &params) override;
	void renderContent(RenderPass &pass, const TransformParams &transform, const DrawableParams &params, uint8_t stencilRef) const override;

public:
	MessageLayer() = default;
	MessageLayer(const MessageLayer &) = delete;
	MessageLayer &operator=(const MessageLayer &) = delete;

	void setFonts(std::shared_ptr<const Font> normal, std::shared_ptr<const Font> bold);
	void setVoiceOutput(VoiceOutput *output) {
		voice = output;
	}
	// Waits advance by themselves once the voice is done
	void setAutoplay(bool enabled) {
		autoplay = enabled;
	}
	void setDrawSpeed(int32_t speed) {
		drawSpeed = speed;
	}

	// MSGINIT
	void setStyle(const MessageboxStyle &newStyle);
	const MessageboxStyle &currentStyle() const {
		return style;
	}
	// MSGSET, keepSlide leaves the box slide animated
	void setMessage(uint32_t id, const std::string &text, uint32_t messageFlags = 0, bool keepSlide = false);
	// MSGCLOSE
	void close(bool keepSlide = false);

	// A click, true when the message consumed it
	bool advance();
	// MSGSIGNAL
	void signal() {
		receivedSyncs++;
	}
	// Completes every glyph and wait up to the end of the message
	void fastForward();

	// Every block was processed
	bool finished() const {
		return currentBlock >= blocks.size();
	}
	// Waiting on the terminal wait or past it
	bool reachedLastWait() const {
		return finished() || wait == WaitKind::Last || wait == WaitKind::AutoClick;
	}
	// Negative section ids wait for the whole message
	bool sectionFinished(int32_t section) const;
	bool shown() const {
		return slide.value() > 0;
	}
	bool closed() const {
		return slide.fullyHidden() && slidingOut.empty();
	}
	WaitKind waitKind() const {
		return wait;
	}
	bool interestedInInput() const;
	size_t charCount() const {
		return chars.size();
	}
	size_t visibleChars() const;
	size_t blockCount() const {
		return blocks.size();
	}
	size_t lineCount() const {
		return lines.size();
	}
	uint32_t currentMessageId() const {
		return messageId;
	}

	uint8_t stencilBump() const override {
		return 3;
	}
	void update(const UpdateContext &ctx) override;
};
