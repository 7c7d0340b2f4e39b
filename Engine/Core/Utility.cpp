/**
 *  Utility.cpp
 *  SNRScripter
 *
 *  Diagnostics tool entry point (main): bustups, scenarios, archives and saves.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "External/Compatibility.hpp"
#include "Engine/Components/Base.hpp"
#include "Engine/Core/VirtualMachine.hpp"
#include "Engine/Formats/Bustup.hpp"
#include "Engine/Formats/Font.hpp"
#include "Engine/Formats/Savedata.hpp"
#include "Engine/Formats/Scenario.hpp"
#include "Engine/Graphics/PNG.hpp"
#include "Engine/Layout/Layouter.hpp"
#include "Engine/Readers/Rom.hpp"
#include "Support/Errors.hpp"
#include "Support/FileIO.hpp"
#include "Support/Unicode.hpp"
#include "Resources/Support/Version.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace {

// Seed of the random generator, as the game starts it
const uint32_t TRACE_SEED  = 42;
const size_t DEFAULT_TOP_K = 64;

using Arguments = std::vector<std::string>;

[[noreturn]] void usage() {
	std::printf("Usage: snrutil <group> <command> [argument ...]\n");
	std::printf("  bustup decode <file.bup> <outdir>              write every block, the base image and metadata.txt\n");
	std::printf("  bustup bake <file.bup> <outdir>                write one composite per expression, mouth and eye\n");
	std::printf("  scenario trace <file.snr> [init-val] [out]     print every executed command with dummy answers\n");
	std::printf("  scenario test-layouter <file.snr> [init-val] [font.fnt]\n");
	std::printf("                                                 lay out every message and report failures\n");
	std::printf("  scenario char-frequency <file.snr> [init-val] [top-k]\n");
	std::printf("                                                 print the most used message characters\n");
	std::printf("  scenario dump-info <file.snr> [out]            print the info tables\n");
	std::printf("  scenario disassemble <file.snr> [out]          print every instruction from the entry point\n");
	std::printf("  rom list <file.rom>                            list the archive entries\n");
	std::printf("  rom extract <file.rom> <outdir> [name ...]     extract all or the named files\n");
	std::printf("  save decode <file> [--key-seed seed]           print a decoded save file\n");
	std::printf("  save deobfuscate <file> <out> [--key-seed seed]\n");
	std::printf("  save obfuscate <file> <out> [--key-seed seed]\n");
	std::printf("  version                                        show the version information\n");
	ctrl.quit(ExitIoError);
}

std::vector<uint8_t> readHostFile(const std::string &path) {
	size_t len = 0;
	std::vector<uint8_t> data;
	if (!FileIO::readFile(path, len, data))
		ctrl.quit(ExitIoError, "error: failed to read %s", path.c_str());
	return data;
}

void writeHostFile(const std::string &path, const std::string &text) {
	if (!FileIO::writeFile(path, text))
		ctrl.quit(ExitIoError, "error: failed to write %s", path.c_str());
}

void writeHostFile(const std::string &path, const std::vector<uint8_t> &data) {
	if (!FileIO::writeFile(path, data.data(), data.size()))
		ctrl.quit(ExitIoError, "error: failed to write %s", path.c_str());
}

std::string prepareOutputDir(std::string path) {
	FileIO::terminatePath(path);
	if (!FileIO::makeDir(path, true))
		ctrl.quit(ExitIoError, "error: failed to create %s", path.c_str());
	return path;
}

int32_t numberArgument(const Arguments &args, size_t index, int32_t fallback) {
	if (index >= args.size())
		return fallback;
	char *end  = nullptr;
	long value = std::strtol(args[index].c_str(), &end, 0);
	if (*end != '\0')
		ctrl.quit(ExitIoError, "error: '%s' is not a number", args[index].c_str());
	return static_cast<int32_t>(value);
}

// Output file when the argument is present, stdout otherwise
class Output {
	std::string path;
	std::string text;

public:
	explicit Output(const Arguments &args, size_t index) {
		if (index < args.size())
			path = args[index];
	}
	__attribute__((format(printf, 2, 3))) void line(const char *fmt, ...) {
		va_list args;
		va_start(args, fmt);
		char buf[1024];
		int n = std::vsnprintf(buf, sizeof(buf), fmt, args);
		va_end(args);
		if (n >= static_cast<int>(sizeof(buf))) {
			std::vector<char> big(static_cast<size_t>(n) + 1);
			va_start(args, fmt);
			std::vsnprintf(big.data(), big.size(), fmt, args);
			va_end(args);
			text.append(big.data(), static_cast<size_t>(n));
		} else if (n > 0) {
			text.append(buf, static_cast<size_t>(n));
		}
		text += '\n';
		if (path.empty()) {
			std::fputs(text.c_str(), stdout);
			text.clear();
		}
	}
	void write(const std::string &chunk) {
		text += chunk;
		if (path.empty()) {
			std::fputs(text.c_str(), stdout);
			text.clear();
		}
	}
	void close() {
		if (!path.empty())
			writeHostFile(path, text);
	}
};

PNGImage blockImage(const PictureBlock &block) {
	PNGImage image;
	image.width  = block.width;
	image.height = block.height;
	image.rgba   = block.rgba;
	return image;
}

void savePng(const std::string &path, const PNGImage &image) {
	if (!PNGCodec::save(path, image))
		ctrl.quit(ExitIoError, "error: failed to write %s", path.c_str());
}

Bustup<PictureBlock> loadBustup(const std::string &path) {
	auto data = readHostFile(path);
	try {
		return readBustupImage(data.data(), data.size());
	} catch (ParseError &e) {
		ctrl.quit(ExitParseError, "error: %s: %s", path.c_str(), e.what());
	}
}

std::shared_ptr<const Scenario> loadScenario(const std::string &path) {
	auto data = readHostFile(path);
	try {
		return std::make_shared<const Scenario>(std::move(data));
	} catch (ParseError &e) {
		ctrl.quit(ExitParseError, "error: %s: %s", path.c_str(), e.what());
	}
}

// Runs the scenario the way a host without any presentation would, until EXIT
void runScenario(const std::shared_ptr<const Scenario> &scenario, int32_t initVal,
                 const std::function<void(const VirtualMachine &, const RuntimeCommand &)> &onCommand) {
	VirtualMachine vm(scenario, initVal, TRACE_SEED);
	CommandResult result;
	try {
		while (true) {
			auto cmd = vm.run(result);
			onCommand(vm, cmd);
			if (cmd.opcode == Cmd::EXIT)
				break;
			result = CommandResult::dummyFor(cmd);
		}
	} catch (VmError &e) {
		ctrl.quit(ExitCorruptScript, "error: corrupt scenario at 0x%08x: %s", e.pc, e.what());
	}
}

void bustupDecode(const Arguments &args) {
	if (args.size() < 2)
		usage();
	auto bustup = loadBustup(args[0]);
	auto outdir = prepareOutputDir(args[1]);

	auto position = [](const std::shared_ptr<const PictureBlock> &block) {
		return "(" + std::to_string(block->offsetX) + ", " + std::to_string(block->offsetY) + ")";
	};

	auto sorted = bustup.expressions;
	std::sort(sorted.begin(), sorted.end(), [](const std::pair<std::string, BustupExpression<PictureBlock>> &a,
	                                           const std::pair<std::string, BustupExpression<PictureBlock>> &b) {
		return a.first < b.first;
	});

	std::string metadata = "expressions:\n";
	for (auto &e : sorted) {
		std::string name = e.first;
		for (size_t at = name.find('"'); at != std::string::npos; at = name.find('"', at + 2))
			name.replace(at, 1, "\\\"");
		metadata += "  \"" + name + "\":\n";
		if (e.second.face1)
			metadata += "    face1_pos: " + position(e.second.face1) + "\n";
		if (e.second.face2)
			metadata += "    face2_pos: " + position(e.second.face2) + "\n";
		metadata += "    mouths:\n";
		for (size_t i = 0; i < e.second.mouths.size(); i++)
			if (e.second.mouths[i])
				metadata += "      " + std::to_string(i) + ": " + position(e.second.mouths[i]) + "\n";
		metadata += "    eyes:\n";
		for (size_t i = 0; i < e.second.eyes.size(); i++)
			if (e.second.eyes[i])
				metadata += "      " + std::to_string(i) + ": " + position(e.second.eyes[i]) + "\n";
	}
	writeHostFile(outdir + "metadata.txt", metadata);

	PNGImage base;
	base.width  = bustup.info.effectiveWidth;
	base.height = bustup.info.effectiveHeight;
	base.rgba   = composeBustupBase(bustup);
	savePng(outdir + "base.png", base);

	auto saveBlock = [&outdir](const std::shared_ptr<const PictureBlock> &block, const std::string &name) {
		if (block && !block->empty())
			savePng(outdir + name + ".png", blockImage(*block));
	};

	for (auto &e : bustup.expressions) {
		saveBlock(e.second.face1, e.first + "_face1");
		saveBlock(e.second.face2, e.first + "_face2");
		for (size_t i = 0; i < e.second.mouths.size(); i++)
			saveBlock(e.second.mouths[i], e.first + "_mouth_" + std::to_string(i));
		for (size_t i = 0; i < e.second.eyes.size(); i++)
			saveBlock(e.second.eyes[i], e.first + "_eye_" + std::to_string(i));
	}
	sendToLog(LogLevel::Info, "Decoded %zu expressions of bustup %u into %s\n", bustup.expressions.size(), bustup.bustupId, outdir.c_str());
}

void bustupBake(const Arguments &args) {
	if (args.size() < 2)
		usage();
	auto bustup = loadBustup(args[0]);
	auto outdir = prepareOutputDir(args[1]);

	size_t written = 0;
	for (auto &e : bustup.expressions) {
		size_t mouths = std::max<size_t>(e.second.mouths.size(), 1);
		size_t eyes   = std::max<size_t>(e.second.eyes.size(), 1);
		for (size_t m = 0; m < mouths; m++) {
			for (size_t eye = 0; eye < eyes; eye++) {
				PNGImage image;
				image.width  = bustup.info.effectiveWidth;
				image.height = bustup.info.effectiveHeight;
				image.rgba   = composeBustupExpression(bustup, e.first, m, eye);
				savePng(outdir + e.first + "_m" + std::to_string(m) + "_e" + std::to_string(eye) + ".png", image);
				written++;
			}
		}
	}
	sendToLog(LogLevel::Info, "Baked %zu images into %s\n", written, outdir.c_str());
}

void scenarioTrace(const Arguments &args) {
	if (args.empty())
		usage();
	auto scenario = loadScenario(args[0]);
	Output out(args, 2);
	runScenario(scenario, numberArgument(args, 1, 0), [&out](const VirtualMachine &vm, const RuntimeCommand &cmd) {
		out.line("%08x %s", vm.position(), cmd.toString().c_str());
	});
	out.close();
}

// Lays the message out and counts the characters on the way
class CountingLayouter : public Layout::MessageLayerLayouter {
public:
	std::map<char32_t, uint64_t> &counts;

	CountingLayouter(const FontMetrics &metrics, std::map<char32_t, uint64_t> &c)
	    : Layout::MessageLayerLayouter(metrics, metrics, MessageboxType::Neutral,
	                                   Layout::Params::messageWindow(MessageTextLayout::Layout), Layout::Defaults()),
	      counts(c) {}

	void onChar(char32_t codepoint) override {
		counts[codepoint]++;
		Layout::MessageLayerLayouter::onChar(codepoint);
	}
};

void scenarioTestLayouter(const Arguments &args) {
	if (args.empty())
		usage();
	auto scenario = loadScenario(args[0]);

	std::unique_ptr<Font> font;
	std::unique_ptr<FontMetrics> metrics(new FallbackMetrics);
	if (args.size() > 2) {
		auto data = readHostFile(args[2]);
		try {
			font    = std::make_unique<Font>(readFont(data.data(), data.size()));
			metrics = std::make_unique<FontFileMetrics>(*font);
		} catch (ParseError &e) {
			ctrl.quit(ExitParseError, "error: %s: %s", args[2].c_str(), e.what());
		}
	}

	size_t messages = 0, failures = 0;
	runScenario(scenario, numberArgument(args, 1, 0), [&](const VirtualMachine &vm, const RuntimeCommand &cmd) {
		if (cmd.opcode != Cmd::MSGSET)
			return;
		messages++;
		try {
			auto result = Layout::layoutMessage(cmd.string(2), *metrics, *metrics, MessageboxType::Neutral, MessageTextLayout::Layout);
			std::printf("%08x: %zu commands, %zu lines\n", vm.position(), result.commands.size(), result.lines.size());
		} catch (ParseError &e) {
			failures++;
			std::printf("%08x: FAILED %s\n  %s\n", vm.position(), e.what(), cmd.string(2).c_str());
		}
	});

	std::printf("%zu messages, %zu failures\n", messages, failures);
	if (failures)
		ctrl.quit(ExitParseError);
}

void scenarioCharFrequency(const Arguments &args) {
	if (args.empty())
		usage();
	auto scenario = loadScenario(args[0]);
	auto topK     = static_cast<size_t>(std::max(numberArgument(args, 2, static_cast<int32_t>(DEFAULT_TOP_K)), 0));

	FallbackMetrics metrics;
	std::map<char32_t, uint64_t> counts;
	runScenario(scenario, numberArgument(args, 1, 0), [&](const VirtualMachine &vm, const RuntimeCommand &cmd) {
		if (cmd.opcode != Cmd::MSGSET)
			return;
		CountingLayouter layouter(metrics, counts);
		try {
			Layout::parseMessage(cmd.string(2), layouter);
		} catch (ParseError &e) {
			sendToLog(LogLevel::Warn, "%08x: skipping a malformed message: %s\n", vm.position(), e.what());
		}
	});

	std::vector<std::pair<char32_t, uint64_t>> ranked(counts.begin(), counts.end());
	std::stable_sort(ranked.begin(), ranked.end(), [](const std::pair<char32_t, uint64_t> &a, const std::pair<char32_t, uint64_t> &b) {
		return a.second > b.second;
	});
	if (ranked.size() > topK)
		ranked.resize(topK);

	// The top characters are printed in code point order
	std::set<char32_t> top;
	for (auto &r : ranked)
		top.insert(r.first);
	std::string text;
	for (auto cp : top)
		appendUTF8(text, cp);
	std::printf("\"%s\"\n", text.c_str());
}

void scenarioDumpInfo(const Arguments &args) {
	if (args.empty())
		usage();
	auto scenario = loadScenario(args[0]);
	Output out(args, 1);
	out.write(scenario->info().describe());
	out.close();
}

void scenarioDisassemble(const Arguments &args) {
	if (args.empty())
		usage();
	auto scenario = loadScenario(args[0]);
	Output out(args, 1);

	auto &image = *scenario->data();
	size_t end  = image.size();
	// Images are padded with zeroes to 16 bytes
	while (end > 0 && image[end - 1] == 0)
		end--;

	CodeAddress address = scenario->entryPoint();
	while (address < end) {
		CodeAddress at = address;
		try {
			auto ins = scenario->instructionAt(address);
			out.line("%08x %s", at, ins.toString().c_str());
		} catch (ParseError &e) {
			out.close();
			ctrl.quit(ExitParseError, "error: reading the instruction at 0x%08x: %s", at, e.what());
		}
	}
	out.close();
}

RomReader &openRom(RomReader &rom, const std::string &path) {
	if (rom.open(path.c_str()) < 0)
		ctrl.quit(ExitIoError, "error: failed to open archive %s", path.c_str());
	return rom;
}

void romList(const Arguments &args) {
	if (args.empty())
		usage();
	RomReader rom;
	openRom(rom, args[0]);

	std::vector<BaseReader::FileInfo> files;
	rom.listFiles(files);
	for (auto &f : files) {
		if (f.directory)
			std::printf("DIR  %s\n", f.name.c_str());
		else
			std::printf("FILE %s %zu\n", f.name.c_str(), f.length);
	}
}

void romExtract(const Arguments &args) {
	if (args.size() < 2)
		usage();
	RomReader rom;
	openRom(rom, args[0]);
	auto outdir = prepareOutputDir(args[1]);

	std::vector<std::string> names(args.begin() + 2, args.end());
	if (names.empty()) {
		std::vector<BaseReader::FileInfo> files;
		rom.listFiles(files);
		for (auto &f : files)
			if (!f.directory)
				names.push_back(f.name);
	}

	for (auto &name : names) {
		std::vector<uint8_t> data;
		if (!rom.getFile(name.c_str(), data))
			ctrl.quit(ExitIoError, "error: %s is not in the archive", name.c_str());

		std::string relative = name;
		while (!relative.empty() && relative[0] == '/')
			relative.erase(0, 1);
		std::replace(relative.begin(), relative.end(), '/', DELIMITER);
		std::string target = outdir + relative;
		if (!FileIO::makeDir(FileIO::extractDirpath(target), true))
			ctrl.quit(ExitIoError, "error: failed to create the directory of %s", target.c_str());
		writeHostFile(target, data);
		std::printf("%s\n", name.c_str());
	}
}

// Strips --key-seed from the arguments and turns it into a key
uint32_t saveKey(Arguments &args) {
	for (size_t i = 0; i < args.size(); i++) {
		if (args[i] == "--key-seed") {
			if (i + 1 >= args.size())
				usage();
			uint32_t key = saveKeyFromSeed(args[i + 1]);
			args.erase(args.begin() + i, args.begin() + i + 2);
			return key;
		}
	}
	return saveGameKey();
}

void saveDecode(Arguments args) {
	uint32_t key = saveKey(args);
	if (args.empty())
		usage();
	auto data = readHostFile(args[0]);
	try {
		auto save = Savedata::decode(data, key);
		std::fputs(describeSavedata(save).c_str(), stdout);
	} catch (ParseError &e) {
		ctrl.quit(ExitParseError, "error: %s: %s", args[0].c_str(), e.what());
	}
}

void saveDeobfuscate(Arguments args) {
	uint32_t key = saveKey(args);
	if (args.size() < 2)
		usage();
	auto data = readHostFile(args[0]);
	try {
		writeHostFile(args[1], deobfuscateSave(data, key));
	} catch (ParseError &e) {
		ctrl.quit(ExitParseError, "error: %s: %s", args[0].c_str(), e.what());
	}
}

void saveObfuscate(Arguments args) {
	uint32_t key = saveKey(args);
	if (args.size() < 2)
		usage();
	writeHostFile(args[1], obfuscateSave(readHostFile(args[0]), key));
}

struct UtilityCommand {
	const char *group;
	const char *name;
	void (*run)(const Arguments &args);
};

const UtilityCommand commands[]{
    {"bustup", "decode", bustupDecode},
    {"bustup", "bake", bustupBake},
    {"scenario", "trace", scenarioTrace},
    {"scenario", "test-layouter", scenarioTestLayouter},
    {"scenario", "char-frequency", scenarioCharFrequency},
    {"scenario", "dump-info", scenarioDumpInfo},
    {"scenario", "disassemble", scenarioDisassemble},
    {"rom", "list", romList},
    {"rom", "extract", romExtract},
    {"save", "decode", [](const Arguments &args) { saveDecode(args); }},
    {"save", "deobfuscate", [](const Arguments &args) { saveDeobfuscate(args); }},
    {"save", "obfuscate", [](const Arguments &args) { saveObfuscate(args); }}};

} // namespace

int main(int argc, char **argv) {
	FileIO::init("SNRScripter", "snrscripter");
	// Diagnostics go to the terminal, the results to stdout
	FileIO::setLogMode(FileIO::LogMode::Console);

	std::atexit([]() {
		ctrl.deinit();
	});

	Arguments args(argv + 1, argv + argc);
	if (args.size() == 1 && (args[0] == "version" || args[0] == "-v" || args[0] == "--version")) {
		std::printf("%s utility version %s '%s'\n", VERSION_STR1, SNR_VERSION, SNR_CODENAME);
		ctrl.quit(ExitSuccess);
	}
	if (args.size() < 2)
		usage();

	for (auto &command : commands) {
		if (args[0] == command.group && args[1] == command.name) {
			command.run(Arguments(args.begin() + 2, args.end()));
			ctrl.quit(ExitSuccess);
		}
	}

	sendToLog(LogLevel::Error, "Unknown command %s %s\n", args[0].c_str(), args[1].c_str());
	usage();
}
