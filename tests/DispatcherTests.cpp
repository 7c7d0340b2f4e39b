/**
 *  DispatcherTests.cpp
 *  SNRScripter
 *
 *  Command effects on the VM state and the scene graph.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Core/Dispatcher.hpp"
#include "Engine/Components/Assets.hpp"
#include "Engine/Readers/Rom.hpp"
#include "Support/Errors.hpp"
#include "tests/Builders.hpp"
#include "tests/TempDir.hpp"

#include <gtest/gtest.h>

using namespace TestData;

namespace {
class Literals : public NumberResolver {
public:
	int32_t resolve(const NumberSpec &spec) const override {
		return spec.constant;
	}
};

RuntimeCommand command(uint8_t opcode, std::vector<CommandArg> args = {}) {
	return makeCommand(opcode, std::move(args)).resolve(Literals());
}

RuntimeCommand layerload(int32_t layer, LayerType type, int32_t flags, std::vector<NumberSpec> params) {
	return command(Cmd::LAYERLOAD, {Arg::number(layer), Arg::number(static_cast<int32_t>(type)), Arg::number(flags),
	                                Arg::mask(std::move(params))});
}

// White tile over the whole canvas
RuntimeCommand tileload(int32_t layer) {
	return layerload(layer, LayerType::Tile, 0, {n(0xFFFF), n(-960), n(-540), n(1920), n(1080)});
}

RuntimeCommand layerctrl(int32_t layer, LayerProperty prop, int32_t target, int32_t time, int32_t flags = 0) {
	return command(Cmd::LAYERCTRL, {Arg::number(layer), Arg::number(static_cast<int32_t>(prop)),
	                                Arg::mask({n(target), n(time), n(flags)})});
}

RuntimeCommand layerwait(int32_t layer, LayerProperty prop) {
	return command(Cmd::LAYERWAIT, {Arg::number(layer), Arg::list({n(static_cast<int32_t>(prop))})});
}

class DispatcherTest : public ::testing::Test {
protected:
	RootLayerGroup root;
	std::unique_ptr<CommandDispatcher> dispatcher;

	void SetUp() override {
		ScenarioInfo info;
		info.pictures.resize(18);
		info.pictures[17].name = "Sky";
		auto scenario = std::make_shared<const Scenario>(Scenario::build({}, info));
		dispatcher    = std::make_unique<CommandDispatcher>(scenario, root);
	}

	LayerGroup &plane(int32_t index = 0) {
		return root.screen().page().plane(index);
	}
	PlaneState &planeState() {
		return dispatcher->state().layers.plane();
	}
	// Advances the scene, then polls the command once
	bool tick(CommandStart &started, float ticks = 1) {
		UpdateContext ctx;
		ctx.delta = Ticks(ticks);
		root.update(ctx);
		CommandResult result;
		return started.executing->update(ctx, result);
	}
	// Zero length tweens land on the next update
	void settle() {
		root.update(UpdateContext());
	}
	// Runs a command to completion, the loads here never wait on a worker
	void run(const RuntimeCommand &cmd) {
		auto started = dispatcher->execute(cmd);
		if (started.kind == CommandStart::Kind::Yield)
			ASSERT_TRUE(tick(started, 0));
	}
};
} // namespace

TEST_F(DispatcherTest, PictureLoadThenWait) {
	TempDir dir;
	auto archive = dir.write("data.rom", rom({{"picture/sky.pic", solidPicture(8, 4, {0, 0, 0xFF, 0xFF})}}));
	auto reader  = std::make_unique<RomReader>(archive);
	ASSERT_EQ(reader->open(), 0);
	assets.setReader(std::move(reader));

	auto load = dispatcher->execute(layerload(3, LayerType::Picture, 0, {n(17)}));
	ASSERT_EQ(load.kind, CommandStart::Kind::Yield);
	EXPECT_FALSE(dispatcher->allowRunningAnimations());

	int32_t bank = planeState().allocator.layerbank(3);
	ASSERT_GE(bank, 0);
	EXPECT_EQ(plane().get(bank), nullptr);

	ASSERT_TRUE(tick(load));
	auto layer = plane().get(bank);
	ASSERT_NE(layer, nullptr);
	EXPECT_EQ(layer->kind(), UserLayer::Kind::Picture);
	EXPECT_TRUE(dispatcher->allowRunningAnimations());
	EXPECT_EQ(planeState().layerbanks[bank].type.get(), LayerType::Picture);
	EXPECT_EQ(planeState().layerbanks[bank].layer, 3);

	// Nothing is animating, the wait completes on its first poll
	auto wait = dispatcher->execute(layerwait(3, LayerProperty::MulColorAlpha));
	ASSERT_EQ(wait.kind, CommandStart::Kind::Yield);
	EXPECT_TRUE(tick(wait, 0));

	assets.setReader(nullptr);
}

TEST_F(DispatcherTest, MissingPicturesLoadANullLayer) {
	auto load = dispatcher->execute(layerload(4, LayerType::Picture, 0, {n(99)}));
	ASSERT_EQ(load.kind, CommandStart::Kind::Yield);
	ASSERT_TRUE(tick(load));

	auto layer = plane().get(planeState().allocator.layerbank(4));
	ASSERT_NE(layer, nullptr);
	EXPECT_EQ(layer->kind(), UserLayer::Kind::Null);
}

TEST_F(DispatcherTest, ReloadingTheSameLayerKeepsTheNode) {
	run(tileload(1));
	int32_t bank = planeState().allocator.layerbank(1);
	auto first   = plane().get(bank);
	ASSERT_NE(first, nullptr);

	auto again = dispatcher->execute(tileload(1));
	EXPECT_EQ(again.kind, CommandStart::Kind::Continue);
	EXPECT_EQ(plane().get(bank), first);
	EXPECT_EQ(planeState().allocator.allocated(), 1u);
}

TEST_F(DispatcherTest, LayerCtrlTweensAndWaits) {
	run(tileload(5));
	int32_t bank = planeState().allocator.layerbank(5);

	auto ctrl = dispatcher->execute(layerctrl(5, LayerProperty::MulColorAlpha, 500, 10));
	EXPECT_EQ(ctrl.kind, CommandStart::Kind::Continue);
	auto &tweener = plane().get(bank)->properties().tweener(LayerProperty::MulColorAlpha);
	EXPECT_FLOAT_EQ(tweener.targetValue(), 500);
	EXPECT_FALSE(tweener.isIdle());
	EXPECT_EQ(planeState().layerbanks[bank].properties.get(LayerProperty::MulColorAlpha), 500);

	auto wait = dispatcher->execute(layerwait(5, LayerProperty::MulColorAlpha));
	ASSERT_EQ(wait.kind, CommandStart::Kind::Yield);
	EXPECT_FALSE(tick(wait, 5));
	EXPECT_TRUE(tick(wait, 5));
	EXPECT_FLOAT_EQ(tweener.value(), 500);

	// Relative targets add to the queued target
	const int32_t DELTA = 1 << 7;
	dispatcher->execute(layerctrl(5, LayerProperty::MulColorAlpha, 100, 0, DELTA));
	EXPECT_FLOAT_EQ(tweener.targetValue(), 600);
	EXPECT_EQ(planeState().layerbanks[bank].properties.get(LayerProperty::MulColorAlpha), 600);
}

TEST_F(DispatcherTest, FastForwardingCompletesWaits) {
	run(tileload(2));
	dispatcher->execute(layerctrl(2, LayerProperty::TranslateX, 300, 1000));
	auto wait = dispatcher->execute(layerwait(2, LayerProperty::TranslateX));

	UpdateContext ctx;
	ctx.fastForwarding = true;
	CommandResult result;
	EXPECT_TRUE(wait.executing->update(ctx, result));
	EXPECT_FLOAT_EQ(plane().get(planeState().allocator.layerbank(2))->properties().get(LayerProperty::TranslateX), 300);
}

TEST_F(DispatcherTest, FixedNodesAndSelections) {
	EXPECT_EQ(dispatcher->execute(layerctrl(-3, LayerProperty::TranslateY, 40, 0)).kind, CommandStart::Kind::Continue);
	settle();
	EXPECT_FLOAT_EQ(root.screen().page().properties().get(LayerProperty::TranslateY), 40);
	EXPECT_EQ(dispatcher->state().layers.pageLayer.get(LayerProperty::TranslateY), 40);

	run(tileload(1));
	run(tileload(2));
	run(tileload(9));
	dispatcher->execute(command(Cmd::LAYERSELECT, {Arg::number(2), Arg::number(1)}));
	EXPECT_EQ(dispatcher->state().layers.selection.from, 1);
	EXPECT_EQ(dispatcher->state().layers.selection.to, 2);

	dispatcher->execute(layerctrl(-5, LayerProperty::Rotation, 250, 0));
	settle();
	auto rotation = [this](int32_t layer) {
		return plane().get(planeState().allocator.layerbank(layer))->properties().get(LayerProperty::Rotation);
	};
	EXPECT_FLOAT_EQ(rotation(1), 250);
	EXPECT_FLOAT_EQ(rotation(2), 250);
	EXPECT_FLOAT_EQ(rotation(9), 0);

	EXPECT_THROW(dispatcher->execute(layerctrl(LAYERS_COUNT, LayerProperty::Rotation, 0, 0)), VmError);
}

TEST_F(DispatcherTest, SwapAndUnload) {
	run(tileload(1));
	run(tileload(2));
	int32_t bank1 = planeState().allocator.layerbank(1);
	int32_t bank2 = planeState().allocator.layerbank(2);
	ASSERT_NE(bank1, bank2);

	dispatcher->execute(command(Cmd::LAYERSWAP, {Arg::number(1), Arg::number(2)}));
	EXPECT_EQ(planeState().allocator.layerbank(1), bank2);
	EXPECT_EQ(planeState().allocator.layerbank(2), bank1);
	EXPECT_EQ(planeState().layerbanks[bank1].layer, 2);
	EXPECT_EQ(planeState().layerbanks[bank2].layer, 1);

	dispatcher->execute(command(Cmd::LAYERUNLOAD, {Arg::number(1), Arg::number(0)}));
	EXPECT_EQ(planeState().allocator.layerbank(1), -1);
	EXPECT_FALSE(planeState().layerbanks[bank2].type.has());
	EXPECT_EQ(plane().get(bank2), nullptr);
	EXPECT_NE(plane().get(bank1), nullptr);
}

TEST_F(DispatcherTest, PlanesAreIndependent) {
	dispatcher->execute(command(Cmd::PLANESELECT, {Arg::number(2)}));
	run(tileload(1));
	EXPECT_EQ(plane(2).size(), 1u);
	EXPECT_EQ(plane(0).size(), 0u);

	dispatcher->execute(command(Cmd::PLANESELECT, {Arg::number(PLANES_COUNT)}));
	EXPECT_EQ(dispatcher->state().layers.currentPlane, 2);

	dispatcher->execute(command(Cmd::PLANECLEAR));
	EXPECT_EQ(plane(2).size(), 0u);
	EXPECT_EQ(planeState().allocator.allocated(), 0u);
}

TEST_F(DispatcherTest, PagebackAndWipeCrossfade) {
	auto &screen = root.screen();
	EXPECT_EQ(dispatcher->execute(command(Cmd::WIPE, {Arg::number(0), Arg::number(10), Arg::number(0), Arg::mask({})})).kind,
	          CommandStart::Kind::Continue);

	dispatcher->execute(command(Cmd::PAGEBACK));
	EXPECT_TRUE(screen.transitionPending());
	EXPECT_TRUE(dispatcher->state().layers.pageBackStarted);
	run(tileload(1));
	// A second PAGEBACK keeps the first frozen page
	dispatcher->execute(command(Cmd::PAGEBACK));

	auto wipe = dispatcher->execute(command(Cmd::WIPE, {Arg::number(0), Arg::number(10), Arg::number(0), Arg::mask({})}));
	ASSERT_EQ(wipe.kind, CommandStart::Kind::Yield);
	EXPECT_FALSE(dispatcher->state().layers.pageBackStarted);
	EXPECT_TRUE(screen.inTransition());
	EXPECT_FALSE(screen.transitionPending());
	EXPECT_FALSE(tick(wipe, 4));
	EXPECT_TRUE(tick(wipe, 6));
	EXPECT_FALSE(screen.inTransition());
}

TEST_F(DispatcherTest, PersistentValues) {
	dispatcher->execute(command(Cmd::SSET, {Arg::number(12), Arg::number(345)}));
	auto get = dispatcher->execute(command(Cmd::SGET, {Arg::dest(v(4)), Arg::number(12)}));
	ASSERT_EQ(get.kind, CommandStart::Kind::Continue);
	EXPECT_TRUE(get.result.writesMemory);
	EXPECT_EQ(get.result.dest, v(4));
	EXPECT_EQ(get.result.value, 345);

	auto unset = dispatcher->execute(command(Cmd::SGET, {Arg::dest(v(4)), Arg::number(13)}));
	EXPECT_EQ(unset.result.value, 0);
}

TEST_F(DispatcherTest, FlowCommands) {
	auto wait = dispatcher->execute(command(Cmd::WAIT, {Arg::flag(false), Arg::number(3)}));
	ASSERT_EQ(wait.kind, CommandStart::Kind::Yield);
	EXPECT_FALSE(tick(wait, 2));
	EXPECT_TRUE(tick(wait, 1));

	EXPECT_EQ(dispatcher->execute(command(Cmd::EXIT, {Arg::u8(0), Arg::number(0)})).kind, CommandStart::Kind::Exit);

	auto select = dispatcher->execute(command(
	    Cmd::SELECT, {Arg::u16(0), Arg::u16(0), Arg::dest(v(9)), Arg::number(0), Arg::string("Where to?"), Arg::strings({"Left", "Right"})}));
	EXPECT_EQ(select.kind, CommandStart::Kind::Continue);
	EXPECT_TRUE(select.result.writesMemory);
	EXPECT_EQ(select.result.dest, v(9));
	EXPECT_EQ(select.result.value, 0);

	auto quiz = dispatcher->execute(command(Cmd::QUIZ, {Arg::dest(v(2)), Arg::number(5)}));
	EXPECT_TRUE(quiz.result.writesMemory);
	EXPECT_EQ(quiz.result.value, 0);

	auto ignored = dispatcher->execute(command(Cmd::AUTOSAVE));
	EXPECT_EQ(ignored.kind, CommandStart::Kind::Continue);
	EXPECT_FALSE(ignored.result.writesMemory);
}

TEST_F(DispatcherTest, SaveInfoAndMessageStyle) {
	dispatcher->execute(command(Cmd::SAVEINFO, {Arg::number(1), Arg::string("Episode 1", true)}));
	EXPECT_EQ(dispatcher->state().saveInfo.info[1], "Episode 1");

	dispatcher->execute(command(Cmd::MSGINIT, {Arg::number(0x24)}));
	EXPECT_EQ(dispatcher->state().message.style.type, MessageboxType::Novel);
	EXPECT_EQ(dispatcher->state().message.style.layout, MessageTextLayout::Center);
}

TEST(DebugOut, FormatsIntegers) {
	EXPECT_EQ(formatDebugOut("x=%d y=%i", {3, -4}), "x=3 y=-4");
	EXPECT_EQ(formatDebugOut("100%%", {}), "100%");
	// Unknown specifiers and missing arguments stay as written
	EXPECT_EQ(formatDebugOut("%s %d %d", {1}), "%s 1 %d");
	EXPECT_EQ(formatDebugOut("trailing %", {}), "trailing %");
}

TEST(VLayerId, Ranges) {
	EXPECT_EQ(VLayerId::fromNumber(-1).kind, VLayerId::Kind::RootLayerGroup);
	EXPECT_EQ(VLayerId::fromNumber(-4).kind, VLayerId::Kind::PlaneLayerGroup);
	EXPECT_EQ(VLayerId::fromNumber(-5).kind, VLayerId::Kind::Selected);
	auto layer = VLayerId::fromNumber(LAYERS_COUNT - 1);
	EXPECT_EQ(layer.kind, VLayerId::Kind::Layer);
	EXPECT_EQ(layer.layer, LAYERS_COUNT - 1);
	EXPECT_THROW(VLayerId::fromNumber(-6), VmError);
	EXPECT_THROW(VLayerId::fromNumber(LAYERS_COUNT), VmError);
}

TEST(LayerbankAllocator, BoundedSlots) {
	LayerbankAllocator allocator;
	EXPECT_EQ(allocator.alloc(10), 0);
	EXPECT_EQ(allocator.alloc(3), 1);
	EXPECT_EQ(allocator.alloc(10), 0);
	EXPECT_EQ(allocator.layer(1), 3);

	allocator.free(10);
	EXPECT_EQ(allocator.layerbank(10), -1);
	EXPECT_EQ(allocator.alloc(7), 0);

	allocator.swap(7, 50);
	EXPECT_EQ(allocator.layerbank(7), -1);
	EXPECT_EQ(allocator.layerbank(50), 0);
	EXPECT_EQ(allocator.layer(0), 50);

	auto range = allocator.layersInRange(0, LAYERS_COUNT);
	ASSERT_EQ(range.size(), 2u);
	EXPECT_EQ(range[0].layer, 3);
	EXPECT_EQ(range[1].layer, 50);

	for (int32_t l = 100; l < 100 + LAYERBANKS_COUNT; l++) allocator.alloc(l);
	EXPECT_EQ(allocator.allocated(), static_cast<size_t>(LAYERBANKS_COUNT));
	EXPECT_EQ(allocator.alloc(200), -1);
	EXPECT_EQ(allocator.alloc(-1), -1);
}
