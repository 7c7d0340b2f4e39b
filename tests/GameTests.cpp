/**
 *  GameTests.cpp
 *  SNRScripter
 *
 *  Headless main loop.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Core/Game.hpp"
#include "Engine/Graphics/Software.hpp"
#include "Support/Errors.hpp"
#include "tests/Builders.hpp"

#include <gtest/gtest.h>

using namespace TestData;

namespace {
void whiteTile(Assembler &as, int32_t layer) {
	as.cmd(Cmd::LAYERLOAD, {Arg::number(layer), Arg::number(static_cast<int32_t>(LayerType::Tile)), Arg::number(0),
	                        Arg::mask({n(0xFFFF), n(-960), n(-540), n(1920), n(1080)})});
}

void exitCommand(Assembler &as) {
	as.cmd(Cmd::EXIT, {Arg::u8(0), Arg::number(0)});
}

GameOptions headless() {
	GameOptions options;
	options.headless = true;
	options.seed     = 42;
	return options;
}

const Ticks ONE_TICK(1);
} // namespace

TEST(Game, RunsUntilExit) {
	auto scenario = assemble([](Assembler &as) {
		as.cmd(Cmd::SSET, {Arg::number(5), Arg::number(42)});
		as.cmd(Cmd::WAIT, {Arg::flag(false), Arg::number(3)});
		whiteTile(as, 1);
		exitCommand(as);
	});
	Game game(scenario, headless());

	// SSET runs and WAIT yields on the first tick, it then needs three more
	EXPECT_TRUE(game.tick(ONE_TICK));
	EXPECT_EQ(game.dispatcher().state().persist.get(5), 42);
	EXPECT_TRUE(game.tick(ONE_TICK));
	EXPECT_TRUE(game.tick(ONE_TICK));
	EXPECT_EQ(game.root().screen().page().plane(0).size(), 0u);

	// The load is yielded here and installed on the next tick, EXIT follows
	EXPECT_TRUE(game.tick(ONE_TICK));
	EXPECT_FALSE(game.tick(ONE_TICK));
	EXPECT_TRUE(game.finished());
	EXPECT_EQ(game.ticks(), 5u);
	EXPECT_EQ(game.root().screen().page().plane(0).size(), 1u);

	EXPECT_FALSE(game.tick(ONE_TICK));
	EXPECT_EQ(game.ticks(), 5u);
}

TEST(Game, FrameLimitStopsEndlessScenarios) {
	auto scenario = assemble([](Assembler &as) {
		as.label("top");
		as.cmd(Cmd::WAIT, {Arg::flag(false), Arg::number(1)});
		as << Ins::j(as.at("top"));
	});
	auto options       = headless();
	options.frameLimit = 10;
	Game game(scenario, options);

	EXPECT_EQ(game.run(), ExitSuccess);
	EXPECT_EQ(game.ticks(), 10u);
	EXPECT_TRUE(game.finished());
}

TEST(Game, FastForwardSkipsWaits) {
	auto scenario = assemble([](Assembler &as) {
		as.cmd(Cmd::WAIT, {Arg::flag(false), Arg::number(1000)});
		exitCommand(as);
	});
	auto options        = headless();
	options.fastForward = true;
	Game game(scenario, options);

	EXPECT_TRUE(game.tick(ONE_TICK));
	EXPECT_FALSE(game.tick(ONE_TICK));
	EXPECT_EQ(game.ticks(), 2u);
}

TEST(Game, HeadlessFramesAreRendered) {
	auto scenario = assemble([](Assembler &as) {
		whiteTile(as, 1);
		as.cmd(Cmd::WAIT, {Arg::flag(false), Arg::number(100)});
		exitCommand(as);
	});
	Game game(scenario, headless());
	game.prepareAssets();
	game.prepareRenderer();
	ASSERT_NE(game.renderer(), nullptr);
	ASSERT_NE(game.renderTarget(), nullptr);
	EXPECT_EQ(game.renderTarget()->width, 480);
	EXPECT_EQ(game.renderTarget()->height, 270);

	game.tick(ONE_TICK);
	game.tick(ONE_TICK);

	auto backend = dynamic_cast<SoftwareBackend *>(&game.renderer()->backend());
	ASSERT_NE(backend, nullptr);
	auto pixels = backend->readPixels(*game.renderTarget());
	auto centre = pixels[135 * 480 + 240];
	EXPECT_NEAR(centre.r, 1.0f, 1e-3f);
	EXPECT_NEAR(centre.g, 1.0f, 1e-3f);
	EXPECT_NEAR(centre.a, 1.0f, 1e-3f);
}

TEST(Game, SameSeedSameRandomNumbers) {
	auto scenario = assemble([](Assembler &as) {
		as << Ins::rnd(v(1), n(0), n(1000000));
		as.cmd(Cmd::WAIT, {Arg::flag(false), Arg::number(1)});
		exitCommand(as);
	});
	Game first(scenario, headless());
	Game second(scenario, headless());
	first.tick(ONE_TICK);
	second.tick(ONE_TICK);
	EXPECT_EQ(first.machine().context().read(v(1)), second.machine().context().read(v(1)));
	EXPECT_EQ(first.machine().context().prngState(), second.machine().context().prngState());
}
