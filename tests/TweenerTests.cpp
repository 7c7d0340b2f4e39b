/**
 *  TweenerTests.cpp
 *  SNRScripter
 *
 *  Tweens, wobblers and layer properties.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Entities/Properties.hpp"
#include "Engine/Entities/Tweener.hpp"
#include "Engine/Entities/Wobbler.hpp"

#include <gtest/gtest.h>

TEST(Easing, DecodesScenarioFlags) {
	EXPECT_EQ(Easing::fromScenario(0, 0).type, EasingType::Linear);
	EXPECT_EQ(Easing::fromScenario(0x203, 0).type, EasingType::SineInOut);
	auto power = Easing::fromScenario(5, -3);
	EXPECT_EQ(power.type, EasingType::Power);
	EXPECT_FLOAT_EQ(power.power, -3);
	EXPECT_EQ(Easing::fromScenario(0x3F, 0).type, EasingType::Linear);
}

TEST(Easing, CurvesMeetTheEndpoints) {
	for (int t = 0; t <= static_cast<int>(EasingType::Power); t++) {
		Easing e;
		e.type  = static_cast<EasingType>(t);
		e.power = 2;
		EXPECT_NEAR(e.apply(1.0f), 1.0f, 1e-6f) << t;
		EXPECT_NEAR(e.apply(0.0f), 0.0f, 1e-6f) << t;
	}
	Easing in;
	in.type  = EasingType::Power;
	in.power = 2;
	EXPECT_FLOAT_EQ(in.apply(0.5f), 0.25f);
	in.power = -2;
	EXPECT_FLOAT_EQ(in.apply(0.5f), 0.75f);

	Easing jump;
	jump.type = EasingType::Jump;
	EXPECT_EQ(jump.apply(0.99f), 0.0f);
}

TEST(Tweener, InterpolatesLinearly) {
	Tweener t(10);
	t.enqueue(20, Tween::linear(Ticks(10)));
	EXPECT_FALSE(t.isIdle());
	EXPECT_EQ(t.targetValue(), 20);
	t.update(Ticks(5));
	EXPECT_FLOAT_EQ(t.value(), 15);
	t.update(Ticks(5));
	EXPECT_FLOAT_EQ(t.value(), 20);
	EXPECT_TRUE(t.isIdle());
}

TEST(Tweener, QueuedTweensCarryTheRemainder) {
	Tweener t(0);
	t.enqueue(10, Tween::linear(Ticks(2)));
	t.enqueue(0, Tween::linear(Ticks(4)));
	t.enqueue(100, Tween::immediate());
	EXPECT_EQ(t.queued(), 3u);
	EXPECT_EQ(t.targetValue(), 100);

	// 2 ticks finish the first, 1 tick goes into the second
	t.update(Ticks(3));
	EXPECT_FLOAT_EQ(t.value(), 7.5f);
	EXPECT_EQ(t.queued(), 2u);
	t.update(Ticks(3));
	EXPECT_FLOAT_EQ(t.value(), 100);
	EXPECT_TRUE(t.isIdle());
}

TEST(Tweener, FastForwardCompletesTheQueue) {
	Tweener t(0);
	t.enqueue(5, Tween::linear(Ticks(100)));
	t.enqueue(9, Tween::linear(Ticks(100)));
	t.fastForward();
	EXPECT_EQ(t.value(), 9);
	EXPECT_TRUE(t.isIdle());

	t.enqueue(1, Tween::linear(Ticks(100)));
	t.fastForwardTo(3);
	EXPECT_EQ(t.value(), 3);
	EXPECT_TRUE(t.isIdle());
}

TEST(Tweener, EnqueueNowStartsFromTheCurrentValue) {
	Tweener t(0);
	t.enqueue(100, Tween::linear(Ticks(10)));
	t.enqueue(200, Tween::linear(Ticks(10)));
	t.update(Ticks(5));
	t.enqueueNow(0, Tween::linear(Ticks(5)));
	EXPECT_EQ(t.queued(), 1u);
	EXPECT_FLOAT_EQ(t.value(), 50);
	t.update(Ticks(1));
	EXPECT_FLOAT_EQ(t.value(), 40);
}

TEST(Ticks, Conversions) {
	EXPECT_FLOAT_EQ(Ticks::fromSeconds(2).value, 120);
	EXPECT_FLOAT_EQ(Ticks::fromMillis(500).value, 30);
	EXPECT_FLOAT_EQ(Ticks(90).seconds(), 1.5f);
	EXPECT_TRUE(Ticks::fromI32(-5).zero());
}

TEST(Wobbler, PeriodicShapes) {
	Wobbler w;
	EXPECT_FALSE(w.isActive());
	w.update(Ticks(0), static_cast<int32_t>(WobbleMode::Triangular), Ticks(8));
	ASSERT_TRUE(w.isActive());
	w.update(Ticks(2), static_cast<int32_t>(WobbleMode::Triangular), Ticks(8));
	EXPECT_FLOAT_EQ(w.value(), 1.0f);
	w.update(Ticks(4), static_cast<int32_t>(WobbleMode::Triangular), Ticks(8));
	EXPECT_FLOAT_EQ(w.value(), -1.0f);

	// A new mode restarts the phase
	w.update(Ticks(2), static_cast<int32_t>(WobbleMode::Sawtooth), Ticks(8));
	EXPECT_FLOAT_EQ(w.phase(), 0.25f);
	EXPECT_FLOAT_EQ(w.value(), -0.5f);
}

TEST(Wobbler, RandomIsStableWithinACycle) {
	Wobbler w(7);
	w.update(Ticks(1), static_cast<int32_t>(WobbleMode::Random), Ticks(10));
	float first = w.value();
	w.update(Ticks(1), static_cast<int32_t>(WobbleMode::Random), Ticks(10));
	EXPECT_EQ(w.value(), first);
	EXPECT_GE(first, -1.0f);
	EXPECT_LE(first, 1.0f);
}

TEST(LayerProperties, StartFromTheirInitialValues) {
	LayerProperties p;
	EXPECT_EQ(p.get(LayerProperty::ScaleX), 1000);
	EXPECT_EQ(p.get(LayerProperty::ShowLayer), 1);
	EXPECT_EQ(p.get(LayerProperty::TranslateX), 0);
	EXPECT_TRUE(p.isVisible());
	EXPECT_TRUE(p.isIdle());
	EXPECT_FALSE(p.isBlendingNontrivial());
	EXPECT_EQ(p.colorMultiplier(), FloatColor4::white());
}

TEST(LayerProperties, SnapshotHoldsTargets) {
	LayerProperties p;
	p.tweener(LayerProperty::TranslateX).enqueue(300, Tween::linear(Ticks(60)));
	p.update(Ticks(30));
	EXPECT_FLOAT_EQ(p.get(LayerProperty::TranslateX), 150);

	auto snapshot = p.snapshot();
	EXPECT_EQ(snapshot.get(LayerProperty::TranslateX), 300);

	LayerProperties restored;
	restored.restore(snapshot);
	EXPECT_EQ(restored.get(LayerProperty::TranslateX), 300);
	EXPECT_TRUE(restored.isIdle());
}

TEST(LayerProperties, HiddenAndTransparentLayers) {
	LayerProperties p;
	p.tweener(LayerProperty::MulColorAlpha).fastForwardTo(0);
	EXPECT_FALSE(p.isVisible());
	p.tweener(LayerProperty::MulColorAlpha).fastForwardTo(500);
	EXPECT_TRUE(p.isVisible());
	EXPECT_TRUE(p.isBlendingNontrivial());
	EXPECT_FLOAT_EQ(p.colorMultiplier().a, 0.5f);
	p.tweener(LayerProperty::ScaleY).fastForwardTo(0);
	EXPECT_FALSE(p.isVisible());
}

TEST(LayerProperties, ColorChannelsAllowDoubling) {
	LayerProperties p;
	p.tweener(LayerProperty::MulColorRed).fastForwardTo(2000);
	p.tweener(LayerProperty::MulColorGreen).fastForwardTo(5000);
	auto c = p.colorMultiplier();
	EXPECT_FLOAT_EQ(c.r, 2.0f);
	EXPECT_FLOAT_EQ(c.g, 2.0f);
	EXPECT_FLOAT_EQ(c.b, 1.0f);
}

TEST(LayerProperties, NamesAndRanges) {
	EXPECT_TRUE(isValidLayerProperty(0));
	EXPECT_FALSE(isValidLayerProperty(LAYER_PROPERTIES_COUNT));
	EXPECT_FALSE(isValidLayerProperty(-1));
	EXPECT_STREQ(layerPropertyName(static_cast<int32_t>(LayerProperty::Rotation)), "Rotation");
}
