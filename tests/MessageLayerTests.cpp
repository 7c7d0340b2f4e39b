/**
 *  MessageLayerTests.cpp
 *  SNRScripter
 *
 *  Message window timing, waits, sections and voices.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Layers/MessageLayer.hpp"

#include <gtest/gtest.h>

namespace {
class RecordingVoice : public VoiceOutput {
public:
	std::vector<std::string> played;
	size_t stops{0};
	bool playing{false};

	bool playVoice(const std::string &filename, uint32_t, uint32_t, bool, float) override {
		played.push_back(filename);
		playing = true;
		return true;
	}
	void stopVoice() override {
		stops++;
		playing = false;
	}
	bool voicePlaying() const override {
		return playing;
	}
};

UpdateContext oneTick() {
	UpdateContext ctx;
	ctx.delta = Ticks(1);
	return ctx;
}

// Ticks until the predicate holds, false if it never does
template <typename F>
bool tickUntil(MessageLayer &message, F done, int limit = 3000) {
	for (int i = 0; i < limit; i++) {
		if (done())
			return true;
		message.update(oneTick());
	}
	return done();
}
} // namespace

TEST(SlideInterpolator, MovesATenthPerTick) {
	SlideInterpolator slide(0, true);
	EXPECT_FLOAT_EQ(slide.update(Ticks(3)), 0.3f);
	EXPECT_FLOAT_EQ(slide.update(Ticks(20)), 1.0f);
	EXPECT_TRUE(slide.fullyShown());
	slide.setIncreasing(false);
	EXPECT_FALSE(slide.fullyShown());
	EXPECT_FLOAT_EQ(slide.update(Ticks(20)), 0.0f);
	EXPECT_TRUE(slide.fullyHidden());
}

TEST(MessageLayer, ClicksThroughWaits) {
	MessageLayer message;
	message.setMessage(1, "@rHello@kWorld");
	EXPECT_TRUE(message.shown());
	EXPECT_EQ(message.currentMessageId(), 1u);
	EXPECT_EQ(message.charCount(), 10u);
	EXPECT_EQ(message.visibleChars(), 0u);

	ASSERT_TRUE(tickUntil(message, [&] { return message.waitKind() == MessageLayer::WaitKind::Regular; }));
	EXPECT_EQ(message.visibleChars(), 5u);
	EXPECT_TRUE(message.interestedInInput());
	EXPECT_FALSE(message.reachedLastWait());

	// Nothing advances a key wait without a click
	for (int i = 0; i < 120; i++) message.update(oneTick());
	EXPECT_EQ(message.waitKind(), MessageLayer::WaitKind::Regular);

	EXPECT_TRUE(message.advance());
	ASSERT_TRUE(tickUntil(message, [&] { return message.reachedLastWait(); }));
	EXPECT_EQ(message.visibleChars(), 10u);
	EXPECT_FALSE(message.finished());

	EXPECT_TRUE(message.advance());
	EXPECT_TRUE(message.finished());
	EXPECT_FALSE(message.advance());
}

TEST(MessageLayer, FirstClickCompletesFadingGlyphs) {
	MessageLayer message;
	message.setDrawSpeed(0);
	message.setMessage(2, "@rA long line of text");
	message.update(oneTick());
	message.update(oneTick());
	ASSERT_LT(message.visibleChars(), message.charCount());

	EXPECT_TRUE(message.advance());
	EXPECT_EQ(message.waitKind(), MessageLayer::WaitKind::None);
	ASSERT_TRUE(tickUntil(message, [&] { return message.reachedLastWait(); }, 10));
}

TEST(MessageLayer, AutoplayAdvancesWaits) {
	MessageLayer message;
	message.setAutoplay(true);
	message.setMessage(3, "@rOne@kTwo@kThree");
	EXPECT_TRUE(tickUntil(message, [&] { return message.finished(); }));
}

TEST(MessageLayer, FastForwardStopsAtUnsignalledSyncs) {
	MessageLayer message;
	message.setMessage(4, "@ra@|b@yc");

	message.fastForward();
	EXPECT_FALSE(message.finished());
	EXPECT_TRUE(message.sectionFinished(0));
	EXPECT_FALSE(message.sectionFinished(1));

	message.signal();
	message.fastForward();
	EXPECT_TRUE(message.finished());
	EXPECT_TRUE(message.sectionFinished(1));
	EXPECT_EQ(message.visibleChars(), 3u);
}

TEST(MessageLayer, SyncsHoldTimedText) {
	MessageLayer message;
	message.setMessage(5, "@ra@yb");
	for (int i = 0; i < 600; i++) message.update(oneTick());
	EXPECT_EQ(message.visibleChars(), 1u);

	message.signal();
	ASSERT_TRUE(tickUntil(message, [&] { return message.reachedLastWait(); }));
	EXPECT_EQ(message.visibleChars(), 2u);
}

TEST(MessageLayer, VoicesPlayWithTheText) {
	RecordingVoice voice;
	MessageLayer message;
	message.setVoiceOutput(&voice);
	message.setMessage(6, "Beatrice@r@vCHAR0001.Hello");

	message.update(oneTick());
	ASSERT_EQ(voice.played.size(), 1u);
	EXPECT_EQ(voice.played[0], "CHAR0001");

	// The terminal wait holds while the voice plays
	message.setAutoplay(true);
	for (int i = 0; i < 600; i++) message.update(oneTick());
	EXPECT_FALSE(message.finished());

	voice.playing = false;
	EXPECT_TRUE(tickUntil(message, [&] { return message.finished(); }));
}

TEST(MessageLayer, SkippingDoesNotStartVoices) {
	RecordingVoice voice;
	MessageLayer message;
	message.setVoiceOutput(&voice);
	message.setMessage(7, "@r@vCHAR0002.Hi");
	message.fastForward();
	EXPECT_TRUE(message.finished());
	EXPECT_TRUE(voice.played.empty());
	EXPECT_GE(voice.stops, 1u);
}

TEST(MessageLayer, CloseSlidesOut) {
	RecordingVoice voice;
	MessageLayer message;
	message.setVoiceOutput(&voice);
	message.setMessage(8, "@rBye");
	EXPECT_FALSE(message.closed());

	message.close(true);
	EXPECT_EQ(voice.stops, 1u);
	EXPECT_FALSE(message.closed());
	EXPECT_TRUE(message.finished());
	EXPECT_TRUE(tickUntil(message, [&] { return message.closed(); }, 20));
	EXPECT_FALSE(message.shown());

	message.setMessage(9, "@rAgain");
	message.close();
	EXPECT_TRUE(message.closed());
}

TEST(MessageLayer, IgnoredInputNeedsNoClick) {
	MessageLayer message;
	message.setMessage(10, "@rNo@kclicks", MESSAGE_IGNORE_INPUT);
	EXPECT_FALSE(message.interestedInInput());
	EXPECT_FALSE(message.advance());
	EXPECT_TRUE(tickUntil(message, [&] { return message.finished(); }));
}

TEST(MessageLayer, StyleChanges) {
	MessageLayer message;
	MessageboxStyle novel;
	novel.type = MessageboxType::Novel;
	message.setStyle(novel);
	EXPECT_EQ(message.currentStyle().type, MessageboxType::Novel);

	message.setMessage(11, "@rLine one@kLine two");
	EXPECT_TRUE(message.shown());
	// The old box slides out under the new one
	message.setStyle(MessageboxStyle());
	EXPECT_FALSE(message.shown());
	EXPECT_EQ(message.currentStyle().type, MessageboxType::Neutral);
}
