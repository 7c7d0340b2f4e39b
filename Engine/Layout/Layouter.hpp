/**
 *  Layouter.hpp
 *  SNRScripter
 *
 *  Message text layouter: turns a message with @ escapes into timed glyph, voice and wait commands.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Core/VmState.hpp"
#include "Engine/Formats/Font.hpp"
#include "Engine/Graphics/Common.hpp"

#include <algorithm>
#include <string>
#include <vector>
#include <cstdint>

class FontMetrics {
public:
	virtual ~FontMetrics() = default;
	virtual uint32_t ascent() const  = 0;
	virtual uint32_t descent() const = 0;
	// Code points missing from the font resolve to the replacement glyph
	virtual GlyphInfo glyphInfo(char32_t codepoint) const = 0;
};

class FontFileMetrics : public FontMetrics {
	const Font &font;

public:
	explicit FontFileMetrics(const Font &f)
	    : font(f) {}
	uint32_t ascent() const override {
		return font.ascent();
	}
	uint32_t descent() const override {
		return font.descent();
	}
	GlyphInfo glyphInfo(char32_t codepoint) const override {
		return font.glyphFor(codepoint).info();
	}
};

// Used when no font file is at hand: half width ASCII, full width for the rest
class FallbackMetrics : public FontMetrics {
public:
	uint32_t ascent() const override {
		return 40;
	}
	uint32_t descent() const override {
		return 10;
	}
	GlyphInfo glyphInfo(char32_t codepoint) const override {
		GlyphInfo info;
		info.advanceWidth = codepoint < 0x80 ? 25 : 50;
		return info;
	}
};

namespace Layout {

enum class CommandType {
	Char,
	Section,
	Sync,
	Voice,
	VoiceSync,
	VoiceWait,
	Wait
};

const char *commandTypeName(CommandType type);

// Times are seconds since the message started
struct Command {
	CommandType type{CommandType::Char};
	float time{0};
	size_t lineIndex{0};

	// Char
	char32_t codepoint{0};
	bool bold{false};
	bool isRubi{false};
	bool cantStartLine{false};
	bool cantEndLine{false};
	bool hasRubi{false};
	float width{0};
	float height{0};
	// Baseline origin of the glyph
	Vec2 position{Vec2::Zero()};
	float horizontalScale{0};
	float scale{0};
	FloatColor4 color;
	// Seconds the glyph takes to fade in
	float fade{0};

	// Section, Sync
	uint32_t index{0};

	// Voice
	std::string filename;
	float volume{1};
	bool lipsync{false};
	int32_t timeToFirstSync{0};

	// VoiceSync
	int32_t targetInstant{0};
	int32_t timeToNextSync{0};

	// Wait
	bool isLastWait{false};
	bool isAutoClick{false};

	float rightBorder() const {
		return position.x() + width;
	}
};

struct LineInfo {
	float width{0};
	float y{0};
	// y distance to the next line without the extra spacing
	float lineAdvance{0};
	// y distance to the baseline of the base text
	float totalHeight{0};
	float rubiHeight{0};
};

struct Params {
	float layoutWidth{640};
	MessageTextLayout alignment{MessageTextLayout::Layout};
	// Space above each line
	float lineSpacing{0};
	// Space below each line
	float lineBelow{0};
	// Space between consecutive lines
	float lineGap{0};
	// Zero picks 40% of the text size
	float rubiSize{0};
	float textSize{20};
	float horizontalScale{1};
	bool kinsoku{true};
	bool alwaysLeaveSpaceForRubi{false};
	bool softBreaks{true};

	// The parameters the message window lays its text out with
	static Params messageWindow(MessageTextLayout alignment);
};

// Unparsed values, see the @c, @s and @a escapes
struct Defaults {
	int32_t color{999};
	int32_t drawSpeed{80};
	int32_t fade{200};
};

struct Result {
	std::vector<Command> commands;
	std::vector<LineInfo> lines;
	Vec2 size{Vec2::Zero()};
};

// Three decimal digits, one per channel from 0 to 9
FloatColor4 colorFromDecimal(int32_t rgb);
// Seconds per horizontal unit of text for a speed in 0..100
float drawSpeedFromNumber(int32_t speed);

class TextLayouter {
public:
	TextLayouter(const FontMetrics &normal, const FontMetrics &bold, const Params &params, const Defaults &defaults);
	virtual ~TextLayouter() = default;

	virtual void onMessageStart();
	void onMessageEnd();
	virtual void onChar(char32_t codepoint);
	virtual void onNewline();
	void onClickWait();
	void onAutoClick();
	// Negative values restore the default
	void onSetFontScale(int32_t scale);
	void onSetColor(int32_t color);
	void onSetDrawSpeed(int32_t speed);
	void onSetFade(int32_t fade);
	// Milliseconds
	void onWait(int32_t delay);
	void onStartParallel();
	void onSection();
	void onSync();
	void onInstantStart();
	void onInstantEnd();
	void onLipsync(bool enabled);
	void onSetVoiceVolume(int32_t volume);
	void onVoice(const std::string &filename);
	void onVoiceSync(int32_t targetInstant);
	void onVoiceWait();
	void onRubiContent(const std::u32string &content);
	void onRubiBaseStart();
	void onRubiBaseEnd();
	void onBold(bool enabled);

	// Sorts the commands by time and hands them out
	Result finish();

protected:
	std::vector<Command> commands;
	std::vector<LineInfo> lines;
	const FontMetrics &fontNormal;
	const FontMetrics &fontBold;
	Params params;

	float defaultFontScale{1};
	FloatColor4 defaultColor;
	float defaultDrawSpeed{0};
	float defaultFade{0};

	size_t finalizedCount{0};
	Vec2 position{Vec2::Zero()};

	float currentTime{0};
	float blockStartTime{0};
	float blockMaxTime{0};

	float fontScale{1};
	FloatColor4 color;
	float drawSpeed{0};
	float fade{0};

	bool instant{false};
	bool autoClick{false};
	bool lipsync{true};
	float voiceVolume{1};

	size_t lastVoiceIndex{0};
	std::u32string rubiText;
	bool rubiOpen{false};
	size_t rubiStartIndex{0};
	float rubiStartX{0};
	float rubiStartTime{0};

	bool bold{false};
	uint32_t sectionCounter{1};
	uint32_t syncCounter{0};

	Vec2 size{Vec2::Zero()};

	float blockEndTime() const {
		return std::max(currentTime, blockMaxTime);
	}
	// Turns commands [finalizedCount, index) into a line
	virtual void finalizeUpTo(size_t index, bool hardBreak);
};

// The layouter of the message window: the first line is the character name, quotations are indented
class MessageLayerLayouter : public TextLayouter {
	enum class QuotationState {
		Ignored,
		Uninit,
		Open
	};

	MessageboxType boxType;
	uint32_t lineIndex{0};
	QuotationState quotation{QuotationState::Uninit};
	char32_t quotationOpener{0};
	int32_t quotationLevel{0};
	float quotationIndent{0};

protected:
	void finalizeUpTo(size_t index, bool hardBreak) override;

public:
	static constexpr int32_t CHARACTER_NAME_FONT_SIZE = 90;
	static constexpr float CHARACTER_NAME_WIDTH       = 360;

	MessageLayerLayouter(const FontMetrics &normal, const FontMetrics &bold, MessageboxType type, const Params &params, const Defaults &defaults);

	void onMessageStart() override;
	void onChar(char32_t codepoint) override;
	void onNewline() override;
};

// Feeds the escapes of a message into a layouter. Throws ParseError on malformed escapes.
void parseMessage(const std::string &message, TextLayouter &layouter);

// Complete layout of one message with the message window parameters
Result layoutMessage(const std::string &message, const FontMetrics &normal, const FontMetrics &bold,
                     MessageboxType type, MessageTextLayout alignment, const Defaults &defaults = Defaults());

} // namespace Layout
