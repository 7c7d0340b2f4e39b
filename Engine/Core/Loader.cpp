/**
 *  Loader.cpp
 *  SNRScripter
 *
 *  Engine entry point (main).
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "External/Compatibility.hpp"
#include "Engine/Components/Assets.hpp"
#include "Engine/Components/Async.hpp"
#include "Engine/Components/Audio.hpp"
#include "Engine/Components/Base.hpp"
#include "Engine/Core/Game.hpp"
#include "Engine/Graphics/GPU.hpp"
#include "Engine/Readers/Direct.hpp"
#include "Engine/Readers/Layered.hpp"
#include "Engine/Readers/Rom.hpp"
#include "Support/Errors.hpp"
#include "Support/FileIO.hpp"
#include "Resources/Support/Version.hpp"

#include <SDL2/SDL.h>

#include <exception>
#include <memory>
#include <new>
#include <string>
#include <unordered_map>
#include <vector>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace {
const char *const CFG_FILE             = "snr.cfg";
const char *const DEFAULT_CFG_FILE     = "default.cfg";
const char *const DEFAULT_SCENARIO     = "main.snr";
const char *const DEFAULT_ARCHIVE      = "data.rom";
const uint16_t DEFAULT_WINDOW_WIDTH    = 1280;

// Everything that was passed on the command line or in an option file, "noval" for flags
std::unordered_map<std::string, std::string> cfg_options;
int debug_level{0};
bool has_root_path{false};
} // namespace

[[noreturn]] static void optionHelp() {
	std::printf("Usage: snrscripter [option ...] [root]\n");
	std::printf(" -r, --root path                  set the root path to the game\n");
	std::printf(" -s, --save path                  set the path to use for saved games\n");
	std::printf("     --scenario file              set the scenario file inside the game (default: %s)\n", DEFAULT_SCENARIO);
	std::printf("     --archive file               set the asset archive inside the root (default: %s)\n", DEFAULT_ARCHIVE);
	std::printf("     --init-val value             initial value of every virtual machine register (default: 0)\n");
	std::printf("     --seed value                 initial random generator state (default: 0)\n");
	std::printf("     --fullscreen                 start in fullscreen mode\n");
	std::printf("     --window                     start in window mode\n");
	std::printf("     --window-width width         set preferred window width (default: %u)\n", DEFAULT_WINDOW_WIDTH);
	std::printf("     --force-fps value            run the game loop at this rate (default: 60)\n");
	std::printf("     --volume-bgm value           music volume in percent (default: 100)\n");
	std::printf("     --volume-se value            sound effect volume in percent (default: 100)\n");
	std::printf("     --volume-voice value         voice volume in percent (default: 100)\n");
	std::printf("     --audio-buffer frames        set the audio buffer size in sample frames (default: 2048)\n");
	std::printf("     --headless                   render in software without opening a window or an audio device\n");
	std::printf("     --frames count               stop after this many ticks\n");
	std::printf("     --use-logfile                use out.txt and err.txt for application output\n");
	std::printf("     --use-console                use the console for application output\n");
	std::printf("     --debug                      generate runtime debugging output (use multiple times to increase debug level)\n");
	std::printf(" -h, --help                       show this help and exit\n");
	std::printf(" -v, --version                    show the version information and exit\n");
	ctrl.quit(ExitSuccess);
}

[[noreturn]] static void optionVersion() {
	std::printf("%s version %s '%s'\n", VERSION_STR1, SNR_VERSION, SNR_CODENAME);
	std::printf("%s\n", VERSION_STR2);
	std::printf("This is free software; see the source for copying conditions.\n");
	ctrl.quit(ExitSuccess);
}

static void parseOptions(const std::vector<std::string> &args) {
	for (size_t i = 0; i < args.size(); i++) {
		const std::string &arg = args[i];

		// Options with a value take the next argument
		auto value = [&args, &i, &arg]() -> const std::string & {
			if (i + 1 >= args.size())
				ctrl.quit(ExitIoError, "error: option %s expects a value", arg.c_str());
			return args[++i];
		};

		if (arg.empty() || arg[0] != '-') {
			if (has_root_path)
				optionHelp();
			has_root_path       = true;
			cfg_options["root"] = arg;
		} else if (arg == "-h" || arg == "--help") {
			optionHelp();
		} else if (arg == "-v" || arg == "--version") {
			optionVersion();
		} else if (arg == "-r" || arg == "--root") {
			// Unlike saves that could be redefined, do not allow changing root path later!
			auto &path = value();
			if (!has_root_path) {
				has_root_path       = true;
				cfg_options["root"] = path;
			} else {
				sendToLog(LogLevel::Error, "Ignoring next attempt to redefine root path from %s to %s!\n",
				          cfg_options["root"].c_str(), path.c_str());
			}
		} else if (arg == "-s" || arg == "--save") {
			cfg_options["save"] = value();
		} else if (arg == "--scenario" || arg == "--archive" || arg == "--init-val" || arg == "--seed" ||
		           arg == "--window-width" || arg == "--force-fps" || arg == "--volume-bgm" ||
		           arg == "--volume-se" || arg == "--volume-voice" || arg == "--audio-buffer" || arg == "--frames") {
			cfg_options[arg.substr(2)] = value();
		} else if (arg == "--fullscreen") {
			cfg_options["fullscreen"] = "noval";
			cfg_options.erase("window");
		} else if (arg == "--window") {
			cfg_options["window"] = "noval";
			cfg_options.erase("fullscreen");
		} else if (arg == "--headless") {
			cfg_options["headless"] = "noval";
		} else if (arg == "--use-logfile") {
			FileIO::setLogMode(FileIO::LogMode::File);
			cfg_options["use-logfile"] = "noval";
		} else if (arg == "--use-console") {
			FileIO::setLogMode(FileIO::LogMode::Console);
			cfg_options["use-console"] = "noval";
		} else if (arg == "--debug") {
			debug_level++;
		} else {
			sendToLog(LogLevel::Error, "Unknown option %s, ignoring\n", arg.c_str());
		}
	}
}

static bool parseOptionFile(const std::string &filename) {
	size_t flen = 0;
	std::vector<uint8_t> fbuf;

	if (!FileIO::readFile(filename, flen, fbuf)) {
		// This should not be fatal probably because we might have other files...
		sendToLog(LogLevel::Error, "Couldn't open option file '%s'\n", filename.c_str());
		return false;
	}

	sendToLog(LogLevel::Info, "Parsing command-line options from '%s'\n", filename.c_str());

	if (fbuf.size() >= 3 && fbuf[0] == 0xEF && fbuf[1] == 0xBB && fbuf[2] == 0xBF) {
		sendToLog(LogLevel::Warn, "Unicode Byte Order Mark detected in '%s'. This should be avoided!\n", filename.c_str());
		fbuf.erase(fbuf.begin(), fbuf.begin() + 3);
	}

	std::vector<std::string> arguments;
	std::string currarg;

	bool lastend       = true;
	bool withinstr     = false;
	bool withincomment = false;
	bool leadingdashes = true;

	auto appendArgument = [&arguments, &currarg, &lastend, &withinstr, &leadingdashes]() {
		if (!lastend && !currarg.empty()) {
			lastend   = true;
			withinstr = false;
			// Quotes only group words
			std::string arg;
			for (auto ch : currarg)
				if (ch != '\'' && ch != '\"')
					arg += ch;
			// Arguments names should start with with two leading dashes
			arguments.emplace_back((leadingdashes ? "--" : "") + arg);
			currarg.clear();
		}
	};

	for (auto &ch : fbuf) {
		if (lastend && (ch == ';' || ch == '#'))
			withincomment = true;

		if ((!withinstr && !withincomment && (ch == '=' || ch == ' ' || ch == '\t')) ||
		    ch == '\0' || ch == '\r' || ch == '\n') {
			withincomment = false;
			appendArgument();
			// If the argument is a=b, then it should become --a b
			leadingdashes = ch != '=';
		} else if (!withincomment) {
			lastend = false;
			currarg += static_cast<char>(ch);
		}

		if (!withincomment && (ch == '\'' || ch == '\"'))
			withinstr = !withinstr;
	}

	// If we still have something
	appendArgument();

	parseOptions(arguments);
	return true;
}

static std::string rootPath() {
	auto it = cfg_options.find("root");
	std::string path = it != cfg_options.end() ? it->second : std::string(CURRENT_REL_PATH);
	FileIO::terminatePath(path);
	return path;
}

static void readOptionFiles() {
	// A --root from the command line decides where the option file is looked up
	auto path = rootPath();
	if (FileIO::accessFile(path + CFG_FILE, FileType::File))
		parseOptionFile(path + CFG_FILE);
	else if (FileIO::accessFile(path + DEFAULT_CFG_FILE, FileType::File))
		parseOptionFile(path + DEFAULT_CFG_FILE);
}

static std::string option(const char *name, const char *fallback) {
	auto it = cfg_options.find(name);
	return it != cfg_options.end() ? it->second : fallback;
}

static long numericOption(const char *name, long fallback, long min, long max) {
	auto it = cfg_options.find(name);
	if (it == cfg_options.end())
		return fallback;
	char *end    = nullptr;
	long value   = std::strtol(it->second.c_str(), &end, 0);
	if (it->second.empty() || *end != '\0' || value < min || value > max)
		ctrl.quit(ExitIoError, "error: invalid value '%s' for --%s", it->second.c_str(), name);
	return value;
}

static bool flagOption(const char *name) {
	return cfg_options.count(name) > 0;
}

static std::unique_ptr<BaseReader> mountGame(const std::string &root) {
	auto layered = std::make_unique<LayeredReader>();
	// Loose files in the root take priority over the archive
	layered->addReader(std::make_unique<DirectReader>(root));

	auto archive = root + option("archive", DEFAULT_ARCHIVE);
	if (FileIO::accessFile(archive, FileType::File))
		layered->addReader(std::make_unique<RomReader>(archive));
	else
		sendToLog(LogLevel::Warn, "No archive at %s, using the loose files only\n", archive.c_str());

	if (layered->open() < 0)
		ctrl.quit(ExitIoError, "error: failed to mount the game at %s", root.c_str());
	sendToLog(LogLevel::Info, "Mounted %zu files from %s\n", layered->getNumFiles(), root.c_str());
	return std::move(layered);
}

static std::shared_ptr<const Scenario> loadScenario() {
	auto path = "/" + option("scenario", DEFAULT_SCENARIO);

	std::vector<uint8_t> bytes;
	try {
		bytes = assets.readBytes(path);
	} catch (AssetError &e) {
		ctrl.quit(ExitIoError, "error: %s", e.what());
	}

	try {
		return std::make_shared<const Scenario>(std::move(bytes));
	} catch (ParseError &e) {
		ctrl.quit(ExitParseError, "error: failed to parse %s: %s", path.c_str(), e.what());
	}
}

static void memoryAllocFailure() {
	sendToLog(LogLevel::Error, "Memory allocation failure!\n");
	std::terminate();
}

int main(int argc, char **argv) {
	FileIO::init("SNRScripter", "snrscripter");
	std::set_new_handler(memoryAllocFailure);

	std::atexit([]() {
		ctrl.deinit();
	});

#ifndef PUBLIC_RELEASE
	FileIO::setLogMode(FileIO::LogMode::Console); // Enable console logging in development mode
#endif

	//Firstly, read command line options
	parseOptions(std::vector<std::string>(argv + 1, argv + argc));
	// The option file never overrides the root that was already chosen
	readOptionFiles();

	auto root = rootPath();
	if (!FileIO::accessFile(root, FileType::Directory))
		ctrl.quit(ExitIoError, "error: invalid game directory %s", root.c_str());

	if (!FileIO::setStorageDir(option("save", "")) || !FileIO::makeDir(FileIO::getStorageDir(), true))
		ctrl.quit(ExitIoError, "error: failed to access storage directory");

	if (FileIO::getLogMode() == FileIO::LogMode::File) {
		std::string log_path(FileIO::getStorageDir());
		FileIO::fileHandleReopen(log_path + "out.txt", stdout);
		FileIO::fileHandleReopen(log_path + "err.txt", stderr);
	}

	sendToLog(LogLevel::Info, "%s %s starting in %s\n", VERSION_STR1, SNR_VERSION, root.c_str());

	GameOptions opts;
	opts.initVal     = static_cast<int32_t>(numericOption("init-val", 0, INT32_MIN, INT32_MAX));
	opts.seed        = static_cast<uint32_t>(numericOption("seed", 0, 0, UINT32_MAX));
	opts.headless    = flagOption("headless");
	opts.fullscreen  = flagOption("fullscreen");
	opts.windowWidth = static_cast<uint16_t>(numericOption("window-width", DEFAULT_WINDOW_WIDTH, 320, 7680));
	opts.fps         = static_cast<uint32_t>(numericOption("force-fps", 60, 1, 1000));
	opts.frameLimit  = static_cast<uint64_t>(numericOption("frames", 0, 0, LONG_MAX));
	opts.debugLevel  = debug_level;

	// The controllers are initialised in a defined order and deinitialised
	// in reverse by ctrl.deinit, which the atexit hook above calls.
	//  AsyncController [IO and compute pools]
	//  AssetServer [uses both pools]
	//  AudioController [SDL_mixer device, or a software mixer when headless]
	//  GPUController [window and shader programs, skipped when headless]
	// ctrl.quit(exit_code) ends up there as well.

	if (async.init())
		ctrl.quit(ExitIoError, "error: failed to start the worker pools");

	assets.setReader(mountGame(root));
	if (assets.init())
		ctrl.quit(ExitIoError, "error: failed to start the asset server");

	audio.setHeadless(opts.headless);
	if (flagOption("audio-buffer") && !audio.setBufferSize(static_cast<int>(numericOption("audio-buffer", 2048, 1, 65536))))
		ctrl.quit(ExitIoError, "error: invalid audio buffer size");
	audio.bgmVolume   = numericOption("volume-bgm", 100, 0, 100) / 100.0f;
	audio.seVolume    = numericOption("volume-se", 100, 0, 100) / 100.0f;
	audio.voiceVolume = numericOption("volume-voice", 100, 0, 100) / 100.0f;
	audio.voice.setMasterVolume(audio.voiceVolume);
	if (audio.init())
		ctrl.quit(ExitIoError, "error: failed to initialise audio");

	if (!opts.headless) {
		if (gpu.init())
			ctrl.quit(ExitIoError, "error: failed to initialise the renderer");
		auto height = static_cast<uint16_t>(opts.windowWidth * VIRTUAL_CANVAS_HEIGHT / VIRTUAL_CANVAS_WIDTH);
		if (!gpu.rendererInit(opts.windowWidth, height, opts.fullscreen))
			ctrl.quit(ExitIoError, "error: no usable renderer");
		SDL_SetWindowTitle(SDL_GL_GetCurrentWindow(), VERSION_STR1);
	}

	Game game(loadScenario(), opts);
	game.prepareAssets();
	game.prepareRenderer();

	ctrl.quit(game.run());
}
