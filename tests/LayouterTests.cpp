/**
 *  LayouterTests.cpp
 *  SNRScripter
 *
 *  Message text layout.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Layout/Layouter.hpp"
#include "Support/Errors.hpp"

#include <gtest/gtest.h>

using namespace Layout;

namespace {
FallbackMetrics metrics;

Result layout(const std::string &message, MessageboxType type = MessageboxType::Ushiromiya,
              MessageTextLayout alignment = MessageTextLayout::Layout) {
	return layoutMessage(message, metrics, metrics, type, alignment);
}

std::vector<const Command *> chars(const Result &r, bool rubi = false) {
	std::vector<const Command *> out;
	for (auto &c : r.commands)
		if (c.type == CommandType::Char && c.isRubi == rubi)
			out.push_back(&c);
	return out;
}

std::vector<const Command *> ofType(const Result &r, CommandType type) {
	std::vector<const Command *> out;
	for (auto &c : r.commands)
		if (c.type == type)
			out.push_back(&c);
	return out;
}
} // namespace

TEST(Layouter, VoiceNameAndTimedText) {
	auto r = layout("Beatrice@r@vCHAR0001.Hello@w30. world@k@vCHAR0002.Again.");

	auto voices = ofType(r, CommandType::Voice);
	ASSERT_EQ(voices.size(), 2u);
	EXPECT_EQ(voices[0]->filename, "CHAR0001");
	EXPECT_EQ(voices[1]->filename, "CHAR0002");
	EXPECT_TRUE(voices[0]->lipsync);

	auto text = chars(r);
	// "Beatrice", "Hello world" and "Again."
	ASSERT_EQ(text.size(), 8u + 11 + 6);
	for (size_t i = 0; i < 8; i++) {
		EXPECT_EQ(text[i]->lineIndex, 0u);
		EXPECT_EQ(text[i]->time, 0.0f);
	}

	const Command *hello = text[8];
	EXPECT_EQ(hello->codepoint, U'H');
	EXPECT_EQ(hello->lineIndex, 1u);
	EXPECT_GE(hello->time, voices[0]->time);
	for (size_t i = 9; i < 14; i++) EXPECT_GT(text[i]->time, text[i - 1]->time);

	// The space follows the delay
	const Command *o     = text[12];
	const Command *space = text[13];
	EXPECT_EQ(space->codepoint, U' ');
	float drawSpeed = drawSpeedFromNumber(Defaults().drawSpeed);
	EXPECT_NEAR(space->time, o->time + o->width * drawSpeed + 0.030f, 1e-4f);

	auto waits = ofType(r, CommandType::Wait);
	ASSERT_EQ(waits.size(), 2u);
	EXPECT_FALSE(waits[0]->isLastWait);
	EXPECT_TRUE(waits[1]->isLastWait);
	EXPECT_GE(waits[0]->time, text[18]->time);
	EXPECT_LE(waits[0]->time, voices[1]->time);
	EXPECT_GE(waits[1]->time, text.back()->time);

	for (size_t i = 1; i < r.commands.size(); i++) EXPECT_LE(r.commands[i - 1].time, r.commands[i].time);
}

TEST(Layouter, NamePlateIsCentred) {
	auto r = layout("Ann@rHi");
	ASSERT_EQ(r.lines.size(), 2u);
	EXPECT_FLOAT_EQ(r.lines[0].width, MessageLayerLayouter::CHARACTER_NAME_WIDTH);

	auto text = chars(r);
	ASSERT_EQ(text.size(), 5u);
	float nameWidth = text[2]->rightBorder() - text[0]->position.x();
	EXPECT_NEAR(text[0]->position.x(), (MessageLayerLayouter::CHARACTER_NAME_WIDTH - nameWidth) / 2, 1e-3f);
	EXPECT_FLOAT_EQ(text[3]->position.x(), 0);
	EXPECT_GT(text[3]->position.y(), text[0]->position.y());
}

TEST(Layouter, NovelBoxesHaveNoName) {
	auto r    = layout("Ann@rHi", MessageboxType::Novel);
	auto text = chars(r);
	ASSERT_EQ(text.size(), 2u);
	EXPECT_EQ(text[0]->codepoint, U'H');
}

TEST(Layouter, LongLinesBreakSoftly) {
	auto r    = layout("@r" + std::string(100, 'a'));
	auto text = chars(r);
	ASSERT_EQ(text.size(), 100u);
	ASSERT_EQ(r.lines.size(), 3u);
	EXPECT_EQ(text.front()->lineIndex, 1u);
	EXPECT_EQ(text.back()->lineIndex, 2u);
	for (auto c : text) EXPECT_LE(c->rightBorder(), 1500.0f + 0.01f);
	EXPECT_FLOAT_EQ(r.lines[1].width, 1500);
}

TEST(Layouter, QuotationsIndentFollowingLines) {
	auto r    = layout(u8"@r「abc\ndef」\nghi");
	auto text = chars(r);
	ASSERT_EQ(text.size(), 11u);
	float indent = text[0]->width;
	EXPECT_GT(indent, 0);
	// 'd' lines up after the bracket
	EXPECT_NEAR(text[4]->position.x(), indent, 1e-3f);
	// The closing bracket ends the indentation
	EXPECT_NEAR(text[8]->position.x(), 0, 1e-3f);
}

TEST(Layouter, InstantTextSharesOneTime) {
	auto r    = layout("@r@[abc@]d");
	auto text = chars(r);
	ASSERT_EQ(text.size(), 4u);
	EXPECT_EQ(text[0]->time, text[2]->time);
	EXPECT_EQ(text[0]->fade, 0);
	EXPECT_EQ(text[3]->time, text[0]->time);
	EXPECT_GT(text[3]->fade, 0);
}

TEST(Layouter, RubiSpreadsOverItsBase) {
	auto r    = layout(u8"@r@bあ.@<ab@>");
	auto rubi = chars(r, true);
	auto base = chars(r);
	ASSERT_EQ(rubi.size(), 1u);
	ASSERT_EQ(base.size(), 2u);
	EXPECT_TRUE(base[0]->hasRubi);
	float centre = (base[0]->position.x() + base[1]->rightBorder()) / 2;
	EXPECT_NEAR(rubi[0]->position.x() + rubi[0]->width / 2, centre, 1e-3f);
	EXPECT_LT(rubi[0]->position.y(), base[0]->position.y());
}

TEST(Layouter, SectionsAndSyncsAreCounted) {
	auto r        = layout("@r@|a@y@|b@y");
	auto sections = ofType(r, CommandType::Section);
	auto syncs    = ofType(r, CommandType::Sync);
	ASSERT_EQ(sections.size(), 2u);
	ASSERT_EQ(syncs.size(), 2u);
	EXPECT_EQ(sections[0]->index, 1u);
	EXPECT_EQ(sections[1]->index, 2u);
	EXPECT_EQ(syncs[0]->index, 0u);
	EXPECT_EQ(syncs[1]->index, 1u);
}

TEST(Layouter, VoiceSyncLinksTheVoice) {
	auto r      = layout("@r@vA.a@x500.b@x800.c");
	auto voices = ofType(r, CommandType::Voice);
	auto syncs  = ofType(r, CommandType::VoiceSync);
	ASSERT_EQ(voices.size(), 1u);
	ASSERT_EQ(syncs.size(), 2u);
	EXPECT_EQ(voices[0]->timeToFirstSync, 500);
	EXPECT_EQ(syncs[0]->timeToNextSync, 300);
}

TEST(Layouter, MalformedEscapesThrow) {
	EXPECT_THROW(layout("@q"), ParseError);
	EXPECT_THROW(layout("@vnoterminator"), ParseError);
	EXPECT_THROW(layout("@wabc."), ParseError);
	EXPECT_THROW(layout("text@"), ParseError);
	EXPECT_THROW(layout("@UZZ."), ParseError);
}

TEST(Layouter, EscapedCharacters) {
	auto r    = layout("@r@U3042.@@");
	auto text = chars(r);
	ASSERT_EQ(text.size(), 2u);
	EXPECT_EQ(text[0]->codepoint, U'あ');
	EXPECT_EQ(text[1]->codepoint, U'@');
}

TEST(Layouter, ColorsAndSpeeds) {
	auto red = colorFromDecimal(900);
	EXPECT_FLOAT_EQ(red.r, 1);
	EXPECT_FLOAT_EQ(red.g, 0);
	EXPECT_FLOAT_EQ(colorFromDecimal(5000).b, 1);
	EXPECT_FLOAT_EQ(drawSpeedFromNumber(100), 0);
	EXPECT_GT(drawSpeedFromNumber(0), drawSpeedFromNumber(50));

	auto r    = layout("@r@c900.a@c.b");
	auto text = chars(r);
	ASSERT_EQ(text.size(), 2u);
	EXPECT_FLOAT_EQ(text[0]->color.r, 1);
	EXPECT_FLOAT_EQ(text[0]->color.g, 0);
	EXPECT_FLOAT_EQ(text[1]->color.g, 1);
}
