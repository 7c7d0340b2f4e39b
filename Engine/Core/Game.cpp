/**
 *  Game.cpp
 *  SNRScripter
 *
 *  Main loop: runs the virtual machine, ticks the scene and presents frames.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Core/Game.hpp"
#include "Engine/Components/Assets.hpp"
#include "Engine/Components/Audio.hpp"
#include "Engine/Components/Base.hpp"
#include "Engine/Graphics/GPU.hpp"
#include "Engine/Graphics/Software.hpp"
#include "Support/Errors.hpp"
#include "Support/FileDefs.hpp"

#include <SDL2/SDL.h>

namespace {
const char *const FONT_NORMAL = "/newrodin-medium.fnt";
const char *const FONT_BOLD   = "/newrodin-bold.fnt";
const char *const SYSSE_BANK  = "/sysse.bin";

// Offscreen frame size without a window, the canvas is scaled into it
const int HEADLESS_WIDTH  = 480;
const int HEADLESS_HEIGHT = 270;

template <typename T>
std::shared_ptr<const T> loadOptional(const char *path) {
	if (!assets.hasReader() || !assets.io().hasFile(path)) {
		sendToLog(LogLevel::Warn, "Optional asset %s is missing\n", path);
		return nullptr;
	}
	try {
		return assets.loadSync<T>(path);
	} catch (AssetError &e) {
		sendToLog(LogLevel::Warn, "Failed to load %s: %s\n", path, e.what());
	}
	return nullptr;
}
} // namespace

Game::Game(std::shared_ptr<const Scenario> s, const GameOptions &opts)
    : options(opts),
      scenario(s),
      vm(s, opts.initVal, opts.seed),
      dispatcher_(s, root_) {
	root_.message().setVoiceOutput(&audio.voice);
	// Nobody clicks through the messages without a window
	root_.message().setAutoplay(options.headless);
}

void Game::prepareAssets() {
	auto normal = loadOptional<Font>(FONT_NORMAL);
	if (normal)
		root_.message().setFonts(normal, loadOptional<Font>(FONT_BOLD));
	else
		sendToLog(LogLevel::Warn, "Messages will be laid out without glyphs\n");

	auto bank = loadOptional<SysSe>(SYSSE_BANK);
	if (bank)
		audio.sysSe.setBank(bank);
}

void Game::prepareRenderer() {
	if (options.headless) {
		ownBackend = std::make_unique<SoftwareBackend>();
		ownTarget  = std::make_unique<SoftwareTarget>(HEADLESS_WIDTH, HEADLESS_HEIGHT);
		renderer_  = std::make_unique<Renderer>(*ownBackend);
		target     = ownTarget.get();
	} else {
		renderer_ = std::make_unique<Renderer>(gpu);
		target    = &gpu.screenTarget();
	}
	sendToLog(LogLevel::Info, "Rendering %dx%d frames with the %s backend\n",
	          target->width, target->height, renderer_->backend().name());
}

void Game::advanceScenario(const UpdateContext &ctx) {
	if (executing) {
		CommandResult result;
		if (!executing->update(ctx, result))
			return;
		if (options.debugLevel >= 2)
			sendToLog(LogLevel::Info, "%08x: %s done\n", vm.position(), executing->describe().c_str());
		executing.reset();
		pending = result;
	}

	while (!exited) {
		RuntimeCommand cmd;
		CommandStart started;
		try {
			cmd = vm.run(pending);
			pending = CommandResult::none();

			if (options.debugLevel >= 2)
				sendToLog(LogLevel::Info, "%08x: %s\n", vm.position(), cmd.toString().c_str());

			CommandStateInfo info;
			dispatcher_.applyState(cmd, info);
			started = dispatcher_.start(cmd, info);
		} catch (VmError &e) {
			ctrl.quit(ExitCorruptScript, "error: corrupt scenario at 0x%08x: %s", e.pc, e.what());
		}

		switch (started.kind) {
			case CommandStart::Kind::Continue:
				pending = started.result;
				break;
			case CommandStart::Kind::Yield:
				executing = std::move(started.executing);
				// Commands may be done right away, the answer then goes out on the next tick
				return;
			case CommandStart::Kind::Exit:
				sendToLog(LogLevel::Info, "Scenario exited at 0x%08x\n", vm.position());
				exited = true;
				return;
		}
	}
}

bool Game::tick(Ticks dt) {
	if (exited)
		return false;

	UpdateContext ctx;
	ctx.delta          = dt;
	ctx.fastForwarding = options.fastForward;

	advanceScenario(ctx);

	// A layer load or a wipe in progress freezes the scene
	UpdateContext sceneCtx = ctx;
	if (!dispatcher_.allowRunningAnimations())
		sceneCtx.delta = Ticks();
	root_.update(sceneCtx);

	audio.update(dt);
	dispatcher_.updateLipSync();

	if (renderer_) {
		renderer_->renderFrame(root_, *target, FloatColor4{0, 0, 0, 1});
		if (!options.headless)
			gpu.present();
	}

	ticksDone++;
	if (options.frameLimit && ticksDone >= options.frameLimit) {
		sendToLog(LogLevel::Info, "Stopping after %llu ticks\n", static_cast<unsigned long long>(ticksDone));
		exited = true;
	}
	return !exited;
}

bool Game::pumpEvents() {
	SDL_Event event;
	while (SDL_PollEvent(&event)) {
		if (event.type == SDL_QUIT)
			return false;
		if (event.type == SDL_KEYDOWN && event.key.keysym.sym == SDLK_LCTRL)
			options.fastForward = true;
		else if (event.type == SDL_KEYUP && event.key.keysym.sym == SDLK_LCTRL)
			options.fastForward = false;
		else if (event.type == SDL_MOUSEBUTTONDOWN || (event.type == SDL_KEYDOWN && event.key.keysym.sym == SDLK_RETURN))
			root_.message().advance();
	}
	return true;
}

int Game::run() {
	uint32_t fps = options.fps ? options.fps : 60;
	// One tick is 1/60 s of game time whatever the frame rate
	Ticks step   = Ticks(Ticks::PER_SECOND / fps);
	uint32_t frameMs = 1000 / fps;

	uint32_t last = SDL_GetTicks();
	while (true) {
		if (!options.headless && !pumpEvents()) {
			sendToLog(LogLevel::Info, "Window closed\n");
			break;
		}
		if (!tick(step))
			break;

		if (!options.headless) {
			uint32_t now     = SDL_GetTicks();
			uint32_t elapsed = now - last;
			if (elapsed < frameMs)
				SDL_Delay(frameMs - elapsed);
			last = SDL_GetTicks();
		}
	}

	return ExitSuccess;
}
