/**
 *  LayerTests.cpp
 *  SNRScripter
 *
 *  Planes, pages and the frozen page of a transition.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Graphics/Render.hpp"
#include "Engine/Graphics/Software.hpp"
#include "Engine/Layers/LayerGroup.hpp"

#include <gtest/gtest.h>

namespace {
UserLayer tile(const FloatColor4 &color) {
	TileLayerContent content;
	content.color = color;
	content.rect  = Vec4(-VIRTUAL_CANVAS_WIDTH / 2, -VIRTUAL_CANVAS_HEIGHT / 2, VIRTUAL_CANVAS_WIDTH, VIRTUAL_CANVAS_HEIGHT);
	return UserLayer(std::move(content));
}

UpdateContext step(float ticks) {
	UpdateContext ctx;
	ctx.delta = Ticks(ticks);
	return ctx;
}

const FloatColor4 RED{1, 0, 0, 1};
const FloatColor4 GREEN{0, 1, 0, 1};
} // namespace

TEST(LayerGroup, LayerbanksHoldOneLayer) {
	LayerGroup group;
	group.add(0, 10, tile(RED));
	group.add(1, 11, UserLayer());
	EXPECT_EQ(group.size(), 2u);
	EXPECT_EQ(group.get(0)->kind(), UserLayer::Kind::Tile);

	group.add(0, 10, UserLayer());
	EXPECT_EQ(group.size(), 2u);
	EXPECT_EQ(group.get(0)->kind(), UserLayer::Kind::Null);
	EXPECT_EQ(group.get(7), nullptr);

	group.remove(1);
	EXPECT_EQ(group.get(1), nullptr);
	group.remove(5);
	group.clear();
	EXPECT_EQ(group.size(), 0u);
}

TEST(LayerGroup, DelayedRemoval) {
	LayerGroup group;
	group.add(0, 1, tile(RED));
	group.add(1, 2, tile(GREEN));
	group.remove(0, Ticks(3));
	group.remove(1, Ticks(100));

	group.update(step(2));
	EXPECT_NE(group.get(0), nullptr);
	group.update(step(1));
	EXPECT_EQ(group.get(0), nullptr);

	UpdateContext skipping = step(0);
	skipping.fastForwarding = true;
	group.update(skipping);
	EXPECT_EQ(group.size(), 0u);
}

TEST(LayerGroup, DrawOrder) {
	LayerGroup group;
	group.add(0, 30, UserLayer());
	group.add(1, 10, UserLayer());
	group.add(2, 20, UserLayer());
	// Lower layer ids first
	EXPECT_EQ(group.order(), (std::vector<int32_t>{1, 2, 0}));

	// The render position overrides the id
	group.get(1)->properties().tweener(LayerProperty::RenderPosition).fastForwardTo(5);
	EXPECT_EQ(group.order(), (std::vector<int32_t>{2, 0, 1}));

	group.swap(0, 2);
	EXPECT_EQ(group.order(), (std::vector<int32_t>{0, 2, 1}));

	// Swapping with an empty layerbank moves the layer
	group.swap(1, 6);
	EXPECT_EQ(group.get(1), nullptr);
	ASSERT_NE(group.get(6), nullptr);
	EXPECT_EQ(group.order(), (std::vector<int32_t>{0, 2, 6}));
}

TEST(LayerGroup, IdleOnceTweensFinish) {
	LayerGroup group;
	group.add(0, 1, tile(RED));
	EXPECT_TRUE(group.isIdle());

	group.get(0)->properties().tweener(LayerProperty::TranslateX).enqueue(100, Tween::linear(Ticks(4)));
	EXPECT_FALSE(group.isIdle());
	group.update(step(4));
	EXPECT_TRUE(group.isIdle());
	EXPECT_FLOAT_EQ(group.get(0)->properties().get(LayerProperty::TranslateX), 100);
}

TEST(PageLayer, CopiesAreIndependent) {
	PageLayer page;
	page.plane(0).add(0, 1, tile(RED));
	PageLayer frozen(page);

	page.plane(0).add(0, 1, tile(GREEN));
	page.plane(0).get(0)->properties().tweener(LayerProperty::Rotation).fastForwardTo(90);
	page.plane(3).add(4, 7, UserLayer());

	ASSERT_NE(frozen.plane(0).get(0), nullptr);
	EXPECT_EQ(frozen.plane(0).get(0)->properties().get(LayerProperty::Rotation), 0);
	EXPECT_EQ(frozen.plane(3).size(), 0u);
	EXPECT_THROW(page.plane(PLANES_COUNT), std::out_of_range);
}

TEST(UserLayerLoad, TilesNeedNoAssets) {
	ScenarioInfo info;
	UserLayerLoad load(info, LayerType::Tile, {{0xF00F, 0, 0, 100, 50, 0, 0, 0}});
	ASSERT_TRUE(load.ready());
	auto layer = load.finish();
	EXPECT_EQ(layer.kind(), UserLayer::Kind::Tile);

	UserLayerLoad rain(info, LayerType::Rain, {});
	EXPECT_EQ(rain.finish().kind(), UserLayer::Kind::Null);
}

TEST(ScreenLayer, TransitionCrossfades) {
	SoftwareBackend backend;
	Renderer renderer(backend);
	auto target = backend.createTarget(32, 18);
	RootLayerGroup root;
	auto &screen = root.screen();

	auto centre = [&]() {
		renderer.renderFrame(root, *target, FloatColor4{0, 0, 0, 1});
		return backend.readPixels(*target)[9 * 32 + 16];
	};

	screen.page().plane(0).add(0, 1, tile(RED));
	EXPECT_NEAR(centre().r, 1.0f, 1e-3f);

	screen.prepareTransition();
	EXPECT_TRUE(screen.transitionPending());
	screen.page().plane(0).add(0, 1, tile(GREEN));
	// Changes stay behind the frozen page
	root.update(step(5));
	EXPECT_NEAR(centre().r, 1.0f, 1e-3f);

	screen.startTransition(Ticks(10));
	EXPECT_TRUE(screen.inTransition());
	root.update(step(5));
	auto half = centre();
	EXPECT_NEAR(half.r, 0.5f, 0.02f);
	EXPECT_NEAR(half.g, 0.5f, 0.02f);

	root.update(step(5));
	EXPECT_FALSE(screen.inTransition());
	auto done = centre();
	EXPECT_NEAR(done.r, 0.0f, 1e-3f);
	EXPECT_NEAR(done.g, 1.0f, 1e-3f);
}

TEST(ScreenLayer, ZeroLengthTransitionsCut) {
	ScreenLayer screen;
	screen.startTransition(Ticks(5));
	EXPECT_FALSE(screen.inTransition());

	screen.prepareTransition();
	screen.startTransition(Ticks());
	EXPECT_FALSE(screen.inTransition());
	EXPECT_FALSE(screen.transitionPending());
}
