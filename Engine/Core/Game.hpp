/**
 *  Game.hpp
 *  SNRScripter
 *
 *  Main loop: runs the virtual machine, ticks the scene and presents frames.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Core/Dispatcher.hpp"
#include "Engine/Core/VirtualMachine.hpp"
#include "Engine/Graphics/Render.hpp"
#include "Engine/Layers/LayerGroup.hpp"
#include "Support/Clock.hpp"

#include <memory>
#include <cstdint>

struct GameOptions {
	int32_t initVal{0};
	uint32_t seed{0};
	// Software renderer and no window
	bool headless{false};
	bool fullscreen{false};
	uint16_t windowWidth{1280};
	uint32_t fps{60};
	// Stop after this many ticks, 0 runs until EXIT
	uint64_t frameLimit{0};
	int debugLevel{0};
	bool fastForward{false};
};

class Game {
	GameOptions options;
	std::shared_ptr<const Scenario> scenario;
	VirtualMachine vm;
	RootLayerGroup root_;
	CommandDispatcher dispatcher_;

	// Command being polled, nullptr when the machine may run
	std::unique_ptr<ExecutingCommand> executing;
	CommandResult pending;

	std::unique_ptr<RenderBackend> ownBackend;
	std::unique_ptr<RenderTarget> ownTarget;
	std::unique_ptr<Renderer> renderer_;
	RenderTarget *target{nullptr};

	uint64_t ticksDone{0};
	bool exited{false};

	// Runs commands until one of them yields or the scenario exits
	void advanceScenario(const UpdateContext &ctx);
	bool pumpEvents();

public:
	Game(std::shared_ptr<const Scenario> s, const GameOptions &opts);
	Game(const Game &) = delete;
	Game &operator=(const Game &) = delete;

	// Loads the fonts and the system sound bank, optional assets are only warned about
	void prepareAssets();
	// Renders into the window when there is one, into an offscreen target otherwise
	void prepareRenderer();

	// One fixed step, false once the game is over
	bool tick(Ticks dt);
	// Runs at the configured rate until EXIT, the frame limit or a window close
	int run();

	RootLayerGroup &root() {
		return root_;
	}
	CommandDispatcher &dispatcher() {
		return dispatcher_;
	}
	const VirtualMachine &machine() const {
		return vm;
	}
	Renderer *renderer() {
		return renderer_.get();
	}
	RenderTarget *renderTarget() {
		return target;
	}
	uint64_t ticks() const {
		return ticksDone;
	}
	bool finished() const {
		return exited;
	}
};
