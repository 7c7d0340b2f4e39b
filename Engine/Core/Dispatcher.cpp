/**
 *  Dispatcher.cpp
 *  SNRScripter
 *
 *  Executes the commands yielded by the virtual machine against the game state and the scene.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Core/Dispatcher.hpp"
#include "Engine/Components/Assets.hpp"
#include "Engine/Components/Audio.hpp"
#include "Support/Errors.hpp"
#include "Support/FileDefs.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

const std::unordered_map<uint8_t, CommandDispatcher::Handler> CommandDispatcher::handlers{
    {Cmd::EXIT, {nullptr, &CommandDispatcher::exitCommand}},
    {Cmd::SGET, {&CommandDispatcher::sgetApply, &CommandDispatcher::sgetCommand}},
    {Cmd::SSET, {&CommandDispatcher::ssetApply, &CommandDispatcher::doneCommand}},
    {Cmd::WAIT, {nullptr, &CommandDispatcher::waitCommand}},
    {Cmd::MSGINIT, {&CommandDispatcher::msginitApply, &CommandDispatcher::msginitCommand}},
    {Cmd::MSGSET, {&CommandDispatcher::msgsetApply, &CommandDispatcher::msgsetCommand}},
    {Cmd::MSGWAIT, {nullptr, &CommandDispatcher::msgwaitCommand}},
    {Cmd::MSGSIGNAL, {nullptr, &CommandDispatcher::msgsignalCommand}},
    {Cmd::MSGSYNC, {nullptr, &CommandDispatcher::msgsyncCommand}},
    {Cmd::MSGCLOSE, {&CommandDispatcher::msgcloseApply, &CommandDispatcher::msgcloseCommand}},
    {Cmd::SELECT, {nullptr, &CommandDispatcher::selectCommand}},
    {Cmd::WIPE, {&CommandDispatcher::wipeApply, &CommandDispatcher::wipeCommand}},
    {Cmd::WIPEWAIT, {nullptr, &CommandDispatcher::wipewaitCommand}},
    {Cmd::BGMPLAY, {&CommandDispatcher::bgmplayApply, &CommandDispatcher::bgmplayCommand}},
    {Cmd::BGMSTOP, {&CommandDispatcher::bgmstopApply, &CommandDispatcher::bgmstopCommand}},
    {Cmd::BGMVOL, {&CommandDispatcher::bgmvolApply, &CommandDispatcher::bgmvolCommand}},
    {Cmd::BGMWAIT, {nullptr, &CommandDispatcher::bgmwaitCommand}},
    {Cmd::BGMSYNC, {nullptr, &CommandDispatcher::bgmsyncCommand}},
    {Cmd::SEPLAY, {&CommandDispatcher::seplayApply, &CommandDispatcher::seplayCommand}},
    {Cmd::SESTOP, {&CommandDispatcher::sestopApply, &CommandDispatcher::sestopCommand}},
    {Cmd::SESTOPALL, {&CommandDispatcher::sestopallApply, &CommandDispatcher::sestopallCommand}},
    {Cmd::SEVOL, {&CommandDispatcher::sevolApply, &CommandDispatcher::sevolCommand}},
    {Cmd::SEPAN, {&CommandDispatcher::sepanApply, &CommandDispatcher::sepanCommand}},
    {Cmd::SEWAIT, {nullptr, &CommandDispatcher::sewaitCommand}},
    {Cmd::SEONCE, {nullptr, &CommandDispatcher::seonceCommand}},
    {Cmd::VOICEPLAY, {nullptr, &CommandDispatcher::voiceplayCommand}},
    {Cmd::VOICESTOP, {nullptr, &CommandDispatcher::voicestopCommand}},
    {Cmd::VOICEWAIT, {nullptr, &CommandDispatcher::voicewaitCommand}},
    {Cmd::SYSSE, {nullptr, &CommandDispatcher::sysseCommand}},
    {Cmd::SAVEINFO, {&CommandDispatcher::saveinfoApply, &CommandDispatcher::doneCommand}},
    {Cmd::AUTOSAVE, {nullptr, &CommandDispatcher::ignoredCommand}},
    {Cmd::EVBEGIN, {nullptr, &CommandDispatcher::ignoredCommand}},
    {Cmd::EVEND, {nullptr, &CommandDispatcher::ignoredCommand}},
    {Cmd::RESUMESET, {nullptr, &CommandDispatcher::ignoredCommand}},
    {Cmd::RESUME, {nullptr, &CommandDispatcher::ignoredCommand}},
    {Cmd::SYSCALL, {nullptr, &CommandDispatcher::ignoredCommand}},
    {Cmd::TROPHY, {nullptr, &CommandDispatcher::presentationCommand}},
    {Cmd::UNLOCK, {nullptr, &CommandDispatcher::presentationCommand}},
    {Cmd::LAYERINIT, {&CommandDispatcher::layerinitApply, &CommandDispatcher::layerinitCommand}},
    {Cmd::LAYERLOAD, {&CommandDispatcher::layerloadApply, &CommandDispatcher::layerloadCommand}},
    {Cmd::LAYERUNLOAD, {&CommandDispatcher::layerunloadApply, &CommandDispatcher::layerunloadCommand}},
    {Cmd::LAYERCTRL, {&CommandDispatcher::layerctrlApply, &CommandDispatcher::layerctrlCommand}},
    {Cmd::LAYERWAIT, {&CommandDispatcher::layerwaitApply, &CommandDispatcher::layerwaitCommand}},
    {Cmd::LAYERSWAP, {&CommandDispatcher::layerswapApply, &CommandDispatcher::layerswapCommand}},
    {Cmd::LAYERSELECT, {&CommandDispatcher::layerselectApply, &CommandDispatcher::doneCommand}},
    {Cmd::MOVIEWAIT, {nullptr, &CommandDispatcher::moviewaitCommand}},
    {Cmd::TRANSSET, {nullptr, &CommandDispatcher::ignoredCommand}},
    {Cmd::TRANSWAIT, {nullptr, &CommandDispatcher::ignoredCommand}},
    {Cmd::PAGEBACK, {&CommandDispatcher::pagebackApply, &CommandDispatcher::pagebackCommand}},
    {Cmd::PLANESELECT, {&CommandDispatcher::planeselectApply, &CommandDispatcher::doneCommand}},
    {Cmd::PLANECLEAR, {&CommandDispatcher::planeclearApply, &CommandDispatcher::planeclearCommand}},
    {Cmd::MASKLOAD, {&CommandDispatcher::maskloadApply, &CommandDispatcher::maskloadCommand}},
    {Cmd::MASKUNLOAD, {&CommandDispatcher::maskunloadApply, &CommandDispatcher::maskunloadCommand}},
    {Cmd::CHARS, {nullptr, &CommandDispatcher::presentationCommand}},
    {Cmd::TIPSGET, {nullptr, &CommandDispatcher::presentationCommand}},
    {Cmd::QUIZ, {nullptr, &CommandDispatcher::presentationCommand}},
    {Cmd::SHOWCHARS, {nullptr, &CommandDispatcher::presentationCommand}},
    {Cmd::NOTIFYSET, {nullptr, &CommandDispatcher::presentationCommand}},
    {Cmd::DEBUGOUT, {nullptr, &CommandDispatcher::debugoutCommand}}};

namespace {

// LAYERLOAD arguments
const size_t LOAD_LAYER  = 0;
const size_t LOAD_TYPE   = 1;
const size_t LOAD_FLAGS  = 2;
const size_t LOAD_PARAMS = 3;

// WIPE flags, the crossfade needs nothing loaded so animations are never held back
const int32_t WIPE_DONT_WAIT = 2;

std::array<int32_t, 8> loadParams(const RuntimeCommand &cmd) {
	std::array<int32_t, 8> params{};
	for (size_t i = 0; i < params.size(); i++) params[i] = cmd.listValue(LOAD_PARAMS, i);
	return params;
}

bool validSeSlot(int32_t slot) {
	return slot >= 0 && slot < SE_SLOT_COUNT;
}

class WaitCommand : public ExecutingCommand {
	Ticks left;

public:
	explicit WaitCommand(Ticks t)
	    : left(t) {}
	bool update(const UpdateContext &ctx, CommandResult &) override {
		left -= ctx.delta;
		return left.zero() || ctx.fastForwarding;
	}
	std::string describe() const override {
		return "WAIT " + std::to_string(left.value);
	}
};

// Completes once the predicate holds, fast forwarding does not shorten it
template <typename F>
class UntilCommand : public ExecutingCommand {
	const char *name;
	F done;

public:
	UntilCommand(const char *n, F f)
	    : name(n), done(std::move(f)) {}
	bool update(const UpdateContext &, CommandResult &) override {
		return done();
	}
	std::string describe() const override {
		return name;
	}
};

template <typename F>
std::unique_ptr<ExecutingCommand> until(const char *name, F f) {
	return std::make_unique<UntilCommand<F>>(name, std::move(f));
}

class MessageWaitCommand : public ExecutingCommand {
	MessageLayer &message;
	// Negative waits for the last wait of the message
	int32_t section;
	bool untilFinished;

public:
	MessageWaitCommand(MessageLayer &m, int32_t s, bool whole)
	    : message(m), section(s), untilFinished(whole) {}
	bool update(const UpdateContext &ctx, CommandResult &) override {
		if (ctx.fastForwarding)
			message.fastForward();
		if (untilFinished)
			return message.finished();
		if (section < 0)
			return message.reachedLastWait();
		return message.sectionFinished(section);
	}
	std::string describe() const override {
		return untilFinished ? "MSGSET" : "MSGWAIT " + std::to_string(section);
	}
};

class LayerLoadCommand : public ExecutingCommand {
public:
	struct Pending {
		int32_t layerbank;
		int32_t layer;
		bool keepProperties;
		float volume;
		std::unique_ptr<UserLayerLoad> load;
	};

private:
	CommandDispatcher &dispatcher;
	LayerGroup &group;
	std::vector<Pending> pending;

public:
	LayerLoadCommand(CommandDispatcher &d, LayerGroup &g, std::vector<Pending> &&p)
	    : dispatcher(d), group(g), pending(std::move(p)) {}

	bool update(const UpdateContext &, CommandResult &) override {
		for (auto &p : pending)
			if (!p.load->ready())
				return false;

		for (auto &p : pending) {
			UserLayer layer = p.load->finish();
			auto previous   = group.get(p.layerbank);
			if (p.keepProperties && previous)
				layer.properties() = previous->properties();
			group.add(p.layerbank, p.layer, std::move(layer));
			auto installed = group.get(p.layerbank);
			if (installed && installed->moviePlayer())
				audio.attachMovie(*installed->moviePlayer(), p.volume);
		}
		dispatcher.setAllowRunningAnimations(true);
		return true;
	}
	std::string describe() const override {
		std::string out = "LAYERLOAD";
		for (auto &p : pending) out += " " + std::to_string(p.layer) + "@" + std::to_string(p.layerbank);
		return out;
	}
};

class LayerWaitCommand : public ExecutingCommand {
	std::vector<LayerProperties *> nodes;
	std::vector<int32_t> properties;

	bool busy(LayerProperties &props, bool fastForward) {
		bool waiting = false;
		for (auto prop : properties) {
			auto &tweener = props.tweener(prop);
			if (fastForward)
				tweener.fastForward();
			if (!tweener.isIdle())
				waiting = true;
		}
		return waiting;
	}

public:
	LayerWaitCommand(std::vector<LayerProperties *> &&n, std::vector<int32_t> &&p)
	    : nodes(std::move(n)), properties(std::move(p)) {}

	bool update(const UpdateContext &ctx, CommandResult &) override {
		bool waiting = false;
		for (auto node : nodes)
			if (busy(*node, ctx.fastForwarding))
				waiting = true;
		return !waiting;
	}
	std::string describe() const override {
		return "LAYERWAIT " + std::to_string(nodes.size()) + " nodes, " + std::to_string(properties.size()) + " properties";
	}
};

class MaskLoadCommand : public ExecutingCommand {
	LayerGroup &group;
	int32_t flags;
	std::string path;
	AssetFuture<MaskTexture> mask;

public:
	MaskLoadCommand(LayerGroup &g, int32_t f, const std::string &p)
	    : group(g), flags(f), path(p), mask(assets.load<MaskTexture>(p)) {}

	bool update(const UpdateContext &, CommandResult &) override {
		if (!mask->ready())
			return false;
		try {
			group.setMask(mask->wait(), flags);
		} catch (AssetError &e) {
			sendToLog(LogLevel::Error, "MASKLOAD: %s\n", e.what());
			group.clearMask();
		}
		return true;
	}
	std::string describe() const override {
		return "MASKLOAD " + path;
	}
};

} // namespace

std::string formatDebugOut(const std::string &format, const std::vector<int32_t> &args) {
	std::string out;
	size_t next = 0;
	for (size_t i = 0; i < format.size(); i++) {
		char c = format[i];
		if (c != '%' || i + 1 >= format.size()) {
			out += c;
			continue;
		}
		char spec = format[++i];
		switch (spec) {
			case '%':
				out += '%';
				break;
			case 'd':
			case 'i':
				if (next < args.size()) {
					out += std::to_string(args[next++]);
				} else {
					sendToLog(LogLevel::Warn, "DEBUGOUT: missing an argument for %s\n", format.c_str());
					out += "%";
					out += spec;
				}
				break;
			default:
				sendToLog(LogLevel::Warn, "DEBUGOUT: unknown specifier %%%c\n", spec);
				out += '%';
				out += spec;
				break;
		}
	}
	return out;
}

CommandDispatcher::CommandDispatcher(std::shared_ptr<const Scenario> s, RootLayerGroup &r)
    : scenario(std::move(s)), root(r) {}

void CommandDispatcher::applyState(const RuntimeCommand &cmd, CommandStateInfo &info) {
	info.plane = vmState.layers.currentPlane;
	auto it    = handlers.find(cmd.opcode);
	if (it != handlers.end() && it->second.apply)
		(this->*it->second.apply)(cmd, info);
}

CommandStart CommandDispatcher::start(const RuntimeCommand &cmd, CommandStateInfo &info) {
	auto it = handlers.find(cmd.opcode);
	if (it == handlers.end()) {
		sendToLog(LogLevel::Warn, "Command %s has no handler, continuing\n", cmd.name());
		return CommandStart::finish(CommandResult::dummyFor(cmd));
	}
	return (this->*it->second.start)(cmd, info);
}

CommandStart CommandDispatcher::execute(const RuntimeCommand &cmd) {
	CommandStateInfo info;
	applyState(cmd, info);
	return start(cmd, info);
}

Layer *CommandDispatcher::fixedLayer(const VLayerId &id, int32_t plane) {
	switch (id.kind) {
		case VLayerId::Kind::RootLayerGroup:
			return &root;
		case VLayerId::Kind::ScreenLayer:
			return &root.screen();
		case VLayerId::Kind::PageLayer:
			return &root.screen().page();
		case VLayerId::Kind::PlaneLayerGroup:
			return &planeGroup(plane);
		default:
			return nullptr;
	}
}

std::vector<LayerProperties *> CommandDispatcher::targetProperties(const VLayerId &id, const CommandStateInfo &info) {
	std::vector<LayerProperties *> result;
	auto fixed = fixedLayer(id, info.plane);
	if (fixed) {
		result.push_back(&fixed->properties());
		return result;
	}
	auto &group = planeGroup(info.plane);
	for (auto &target : info.targets) {
		auto layer = group.get(target.layerbank);
		if (layer)
			result.push_back(&layer->properties());
		else
			sendToLog(LogLevel::Warn, "Layer %d has a layerbank but no scene node\n", target.layer);
	}
	return result;
}

std::shared_ptr<const AudioFile> CommandDispatcher::loadAudio(const std::string &path) {
	try {
		return assets.loadSync<AudioFile>(path);
	} catch (AssetError &e) {
		sendToLog(LogLevel::Error, "%s\n", e.what());
	}
	return nullptr;
}

void CommandDispatcher::updateLipSync() {
	float level                 = audio.voice.lipsyncLevel();
	const std::string &filename = audio.voice.filename();
	const VoiceMapping *speaking{nullptr};
	if (!filename.empty()) {
		for (auto &mapping : tables().voiceMappings) {
			if (filename.compare(0, mapping.prefix.size(), mapping.prefix) == 0) {
				speaking = &mapping;
				break;
			}
		}
	}

	for (int32_t p = 0; p < PLANES_COUNT; p++) {
		auto &plane = vmState.layers.planes[p];
		for (int32_t bank = 0; bank < LAYERBANKS_COUNT; bank++) {
			auto &state = plane.layerbanks[bank];
			if (!state.type.has() || state.type.get() != LayerType::Bustup)
				continue;
			auto layer = planeGroup(p).get(bank);
			if (!layer)
				continue;
			int32_t id = state.params[0];
			bool talks = false;
			if (speaking && id >= 0 && static_cast<size_t>(id) < tables().bustups.size()) {
				auto character = tables().bustups[id].lipsyncCharacter;
				talks          = std::find(speaking->characters.begin(), speaking->characters.end(), character) != speaking->characters.end();
			}
			layer->setLipSync(talks ? level : 0);
		}
	}
}

/* ---------------- Flow and persistent data ----------------- */

CommandStart CommandDispatcher::exitCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	sendToLog(LogLevel::Info, "Scenario exited with %d, %d\n", cmd.number(0), cmd.number(1));
	return CommandStart::exit();
}

void CommandDispatcher::sgetApply(const RuntimeCommand &, CommandStateInfo &) {}

CommandStart CommandDispatcher::sgetCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	return CommandStart::finish(CommandResult::writeMemory(cmd.dest(), vmState.persist.get(cmd.number(1))));
}

void CommandDispatcher::ssetApply(const RuntimeCommand &cmd, CommandStateInfo &) {
	vmState.persist.set(cmd.number(0), cmd.number(1));
}

CommandStart CommandDispatcher::waitCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	if (cmd.flag(0))
		sendToLog(LogLevel::Warn, "WAIT: interruptible waits are not supported, waiting the full time\n");
	return CommandStart::yield(std::make_unique<WaitCommand>(Ticks::fromI32(cmd.number(1))));
}

void CommandDispatcher::saveinfoApply(const RuntimeCommand &cmd, CommandStateInfo &) {
	vmState.saveInfo.set(cmd.number(0), cmd.string(1));
}

CommandStart CommandDispatcher::doneCommand(const RuntimeCommand &, CommandStateInfo &) {
	return CommandStart::finish();
}

CommandStart CommandDispatcher::ignoredCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	sendToLog(LogLevel::Info, "%s is not supported, continuing\n", cmd.toString().c_str());
	return CommandStart::finish(CommandResult::dummyFor(cmd));
}

CommandStart CommandDispatcher::presentationCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	// These drive menus and notifications that are not part of the core
	sendToLog(LogLevel::Info, "%s answered with the default\n", cmd.toString().c_str());
	return CommandStart::finish(CommandResult::dummyFor(cmd));
}

CommandStart CommandDispatcher::selectCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	auto &choices = cmd.strings(5);
	sendToLog(LogLevel::Info, "SELECT \"%s\" with %zu choices, picking the first\n", cmd.string(4).c_str(), choices.size());
	for (size_t i = 0; i < choices.size(); i++) sendToLog(LogLevel::Info, "  %zu: %s\n", i, choices[i].c_str());
	return CommandStart::finish(CommandResult::writeMemory(cmd.dest(), 0));
}

CommandStart CommandDispatcher::debugoutCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	sendToLog(LogLevel::Info, "DEBUGOUT: %s\n", formatDebugOut(cmd.string(0), cmd.list(1)).c_str());
	return CommandStart::finish();
}

/* ---------------- Messages ----------------- */

void CommandDispatcher::msginitApply(const RuntimeCommand &cmd, CommandStateInfo &) {
	vmState.message.style = MessageboxStyle::fromNumber(cmd.number(0));
}

CommandStart CommandDispatcher::msginitCommand(const RuntimeCommand &, CommandStateInfo &) {
	root.message().setStyle(vmState.message.style);
	return CommandStart::finish();
}

void CommandDispatcher::msgsetApply(const RuntimeCommand &cmd, CommandStateInfo &) {
	vmState.message.text    = cmd.string(2);
	vmState.message.hasText = true;
	vmState.message.shown   = true;
}

CommandStart CommandDispatcher::msgsetCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	auto &message = root.message();
	message.setMessage(static_cast<uint32_t>(cmd.number(0)), cmd.string(2));
	if (!cmd.flag(1))
		return CommandStart::finish();
	return CommandStart::yield(std::make_unique<MessageWaitCommand>(message, -1, true));
}

CommandStart CommandDispatcher::msgwaitCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	return CommandStart::yield(std::make_unique<MessageWaitCommand>(root.message(), cmd.number(0), false));
}

CommandStart CommandDispatcher::msgsignalCommand(const RuntimeCommand &, CommandStateInfo &) {
	root.message().signal();
	return CommandStart::finish();
}

CommandStart CommandDispatcher::msgsyncCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	auto target = static_cast<uint32_t>(std::max(cmd.number(1), 0));
	return CommandStart::yield(until("MSGSYNC", [target]() {
		return !audio.voice.voicePlaying() || audio.voice.positionMillis() >= target;
	}));
}

void CommandDispatcher::msgcloseApply(const RuntimeCommand &, CommandStateInfo &) {
	vmState.message.shown   = false;
	vmState.message.hasText = false;
	vmState.message.text.clear();
}

CommandStart CommandDispatcher::msgcloseCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	auto &message = root.message();
	message.close();
	if (!cmd.flag(0))
		return CommandStart::finish();
	return CommandStart::yield(until("MSGCLOSE", [&message]() { return message.closed(); }));
}

/* ---------------- Audio ----------------- */

void CommandDispatcher::bgmplayApply(const RuntimeCommand &cmd, CommandStateInfo &) {
	if (cmd.flag(2)) {
		vmState.audio.bgm.unset();
		return;
	}
	BgmState bgm;
	bgm.bgmId  = cmd.number(0);
	bgm.volume = volumeFromNumber(cmd.number(3));
	vmState.audio.bgm.set(bgm);
}

CommandStart CommandDispatcher::bgmplayCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	int32_t id = cmd.number(0);
	auto path  = tables().bgmPath(id);
	if (path.empty()) {
		sendToLog(LogLevel::Warn, "BGMPLAY: no BGM with id %d\n", id);
		return CommandStart::finish();
	}
	auto file = loadAudio(path);
	if (file)
		audio.bgm.play(file, tables().bgms[id].displayName, !cmd.flag(2), volumeFromNumber(cmd.number(3)), Tween::linear(Ticks::fromI32(cmd.number(1))));
	return CommandStart::finish();
}

void CommandDispatcher::bgmstopApply(const RuntimeCommand &, CommandStateInfo &) {
	vmState.audio.bgm.unset();
}

CommandStart CommandDispatcher::bgmstopCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	audio.bgm.stop(Tween::linear(Ticks::fromI32(cmd.number(0))));
	return CommandStart::finish();
}

void CommandDispatcher::bgmvolApply(const RuntimeCommand &cmd, CommandStateInfo &) {
	if (vmState.audio.bgm.has())
		vmState.audio.bgm.get().volume = volumeFromNumber(cmd.number(0));
}

CommandStart CommandDispatcher::bgmvolCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	audio.bgm.setVolume(volumeFromNumber(cmd.number(0)), Tween::linear(Ticks::fromI32(cmd.number(1))));
	return CommandStart::finish();
}

CommandStart CommandDispatcher::bgmwaitCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	int32_t unwanted = cmd.number(0);
	return CommandStart::yield(until("BGMWAIT", [unwanted]() { return (audio.bgm.waitStatus() & unwanted) == 0; }));
}

CommandStart CommandDispatcher::bgmsyncCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	Ticks target = Ticks::fromI32(cmd.number(0));
	return CommandStart::yield(until("BGMSYNC", [target]() {
		return (audio.bgm.waitStatus() & AudioWaitStatus::STOPPED) || Ticks::fromSeconds(audio.bgm.position()) >= target;
	}));
}

void CommandDispatcher::seplayApply(const RuntimeCommand &cmd, CommandStateInfo &) {
	int32_t slot = cmd.number(0);
	if (!validSeSlot(slot))
		return;
	if (cmd.flag(3)) {
		vmState.audio.se[slot].unset();
		return;
	}
	SeState se;
	se.seId      = cmd.number(1);
	se.volume    = volumeFromNumber(cmd.number(4));
	se.pan       = panFromNumber(cmd.number(5));
	se.playSpeed = cmd.number(6) / 1000.0f;
	vmState.audio.se[slot].set(se);
}

CommandStart CommandDispatcher::seplayCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	int32_t id = cmd.number(1);
	auto path  = tables().sePath(id);
	if (path.empty()) {
		sendToLog(LogLevel::Warn, "SEPLAY: no SE with id %d\n", id);
		return CommandStart::finish();
	}
	auto file = loadAudio(path);
	if (file)
		audio.se.play(cmd.number(0), file, !cmd.flag(3), volumeFromNumber(cmd.number(4)), panFromNumber(cmd.number(5)),
		              cmd.number(6) / 1000.0f, Tween::linear(Ticks::fromI32(cmd.number(2))));
	return CommandStart::finish();
}

void CommandDispatcher::sestopApply(const RuntimeCommand &cmd, CommandStateInfo &) {
	if (validSeSlot(cmd.number(0)))
		vmState.audio.se[cmd.number(0)].unset();
}

CommandStart CommandDispatcher::sestopCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	audio.se.stop(cmd.number(0), Tween::linear(Ticks::fromI32(cmd.number(1))));
	return CommandStart::finish();
}

void CommandDispatcher::sestopallApply(const RuntimeCommand &, CommandStateInfo &) {
	for (auto &se : vmState.audio.se) se.unset();
}

CommandStart CommandDispatcher::sestopallCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	audio.se.stopAll(Tween::linear(Ticks::fromI32(cmd.number(0))));
	return CommandStart::finish();
}

void CommandDispatcher::sevolApply(const RuntimeCommand &cmd, CommandStateInfo &) {
	int32_t slot = cmd.number(0);
	if (validSeSlot(slot) && vmState.audio.se[slot].has())
		vmState.audio.se[slot].get().volume = volumeFromNumber(cmd.number(1));
}

CommandStart CommandDispatcher::sevolCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	audio.se.setVolume(cmd.number(0), volumeFromNumber(cmd.number(1)), Tween::linear(Ticks::fromI32(cmd.number(2))));
	return CommandStart::finish();
}

void CommandDispatcher::sepanApply(const RuntimeCommand &cmd, CommandStateInfo &) {
	int32_t slot = cmd.number(0);
	if (validSeSlot(slot) && vmState.audio.se[slot].has())
		vmState.audio.se[slot].get().pan = panFromNumber(cmd.number(1));
}

CommandStart CommandDispatcher::sepanCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	audio.se.setPanning(cmd.number(0), panFromNumber(cmd.number(1)), Tween::linear(Ticks::fromI32(cmd.number(2))));
	return CommandStart::finish();
}

CommandStart CommandDispatcher::sewaitCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	int32_t slot = cmd.number(0), unwanted = cmd.number(1);
	return CommandStart::yield(until("SEWAIT", [slot, unwanted]() { return (audio.se.waitStatus(slot) & unwanted) == 0; }));
}

CommandStart CommandDispatcher::seonceCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	int32_t id = cmd.number(0);
	auto path  = tables().sePath(id);
	if (path.empty()) {
		sendToLog(LogLevel::Warn, "SEONCE: no SE with id %d\n", id);
		return CommandStart::finish();
	}

	// Scenario slots are allocated from the bottom, one-shot sounds take the highest idle one
	int32_t slot = -1;
	for (int32_t i = SE_SLOT_COUNT - 1; i >= 0; i--) {
		if (!vmState.audio.se[i].has() && (audio.se.waitStatus(i) & AudioWaitStatus::STOPPED)) {
			slot = i;
			break;
		}
	}
	if (slot < 0) {
		sendToLog(LogLevel::Warn, "SEONCE: every SE slot is busy, dropping SE %d\n", id);
		return CommandStart::finish();
	}

	int32_t speed = cmd.number(3);
	auto file     = loadAudio(path);
	if (file)
		audio.se.play(slot, file, false, volumeFromNumber(cmd.number(1)), panFromNumber(cmd.number(2)),
		              speed > 0 ? speed / 1000.0f : 1.0f, Tween::immediate());
	return CommandStart::finish();
}

CommandStart CommandDispatcher::voiceplayCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	audio.voice.playVoice(cmd.string(0), 0, 0, true, volumeFromNumber(cmd.number(1)));
	return CommandStart::finish();
}

CommandStart CommandDispatcher::voicestopCommand(const RuntimeCommand &, CommandStateInfo &) {
	audio.voice.stopVoice();
	return CommandStart::finish();
}

CommandStart CommandDispatcher::voicewaitCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	int32_t unwanted = cmd.number(0);
	return CommandStart::yield(until("VOICEWAIT", [unwanted]() { return (audio.voice.waitStatus() & unwanted) == 0; }));
}

CommandStart CommandDispatcher::sysseCommand(const RuntimeCommand &cmd, CommandStateInfo &) {
	auto name = audio.sysSe.nameOf(cmd.number(0));
	if (name.empty() || !audio.sysSe.play(name, volumeFromNumber(cmd.number(1))))
		sendToLog(LogLevel::Warn, "SYSSE: no system sound %d\n", cmd.number(0));
	return CommandStart::finish();
}

/* ---------------- Layers ----------------- */

void CommandDispatcher::layerinitApply(const RuntimeCommand &cmd, CommandStateInfo &info) {
	auto id     = VLayerId::fromNumber(cmd.number(0));
	auto &layer = vmState.layers;
	auto fixed  = layer.fixedNode(id);
	if (fixed) {
		fixed->init();
		return;
	}
	info.targets = layer.targets(id);
	for (auto &t : info.targets) layer.plane().layerbanks[t.layerbank].properties.init();
}

CommandStart CommandDispatcher::layerinitCommand(const RuntimeCommand &cmd, CommandStateInfo &info) {
	for (auto props : targetProperties(VLayerId::fromNumber(cmd.number(0)), info)) props->init();
	return CommandStart::finish();
}

void CommandDispatcher::layerloadApply(const RuntimeCommand &cmd, CommandStateInfo &info) {
	auto id     = VLayerId::fromNumber(cmd.number(LOAD_LAYER));
	auto &state = vmState.layers;
	auto &plane = state.plane();

	LayerType type;
	if (!layerTypeFromNumber(cmd.number(LOAD_TYPE), type)) {
		sendToLog(LogLevel::Warn, "LAYERLOAD: unknown layer type %d, loading a null layer\n", cmd.number(LOAD_TYPE));
		type = LayerType::Null;
	}
	auto params  = loadParams(cmd);
	int32_t flag = cmd.number(LOAD_FLAGS);

	switch (id.kind) {
		case VLayerId::Kind::Layer: {
			int32_t bank = plane.allocator.alloc(id.layer);
			if (bank < 0) {
				sendToLog(LogLevel::Warn, "LAYERLOAD: plane %d has no free layerbank for layer %d\n", state.currentPlane, id.layer);
				return;
			}
			info.targets.push_back({id.layer, bank});
			break;
		}
		case VLayerId::Kind::Selected:
			info.targets = state.targets(id);
			break;
		default:
			sendToLog(LogLevel::Warn, "LAYERLOAD: %s cannot be loaded\n", id.toString().c_str());
			return;
	}

	for (auto &t : info.targets) {
		auto &bank = plane.layerbanks[t.layerbank];
		bool same  = bank.type.has() && bank.type.get() == type && bank.params == params;
		info.sameAsBefore.push_back(same);

		bank.loadCounter = ++state.loadCounter;
		if (!(flag & LayerLoad::KEEP_PREVIOUS_PROPERTIES)) {
			bank.properties.init();
			state.loadWithInitCounter++;
		}
		bank.type.set(type);
		bank.plane  = state.currentPlane;
		bank.layer  = t.layer;
		bank.params = params;
	}
}

CommandStart CommandDispatcher::layerloadCommand(const RuntimeCommand &cmd, CommandStateInfo &info) {
	int32_t flag = cmd.number(LOAD_FLAGS);
	bool keep    = flag & LayerLoad::KEEP_PREVIOUS_PROPERTIES;
	auto params  = loadParams(cmd);
	auto &group  = planeGroup(info.plane);

	if (flag & LayerLoad::AUTO_WIPE)
		sendToLog(LogLevel::Info, "LAYERLOAD: automatic wipes are not supported, the layer appears at once\n");

	LayerType type;
	if (!layerTypeFromNumber(cmd.number(LOAD_TYPE), type))
		type = LayerType::Null;

	std::vector<LayerLoadCommand::Pending> pending;
	for (size_t i = 0; i < info.targets.size(); i++) {
		auto &t       = info.targets[i];
		auto existing = group.get(t.layerbank);
		if (info.sameAsBefore[i] && existing) {
			if (!keep)
				existing->properties().init();
			continue;
		}
		LayerLoadCommand::Pending p;
		p.layerbank      = t.layerbank;
		p.layer          = t.layer;
		p.keepProperties = keep;
		p.volume         = volumeFromNumber(params[1]);
		p.load           = std::make_unique<UserLayerLoad>(tables(), type, params);
		pending.push_back(std::move(p));
	}

	if (pending.empty())
		return CommandStart::finish();
	if (!(flag & LayerLoad::DONT_BLOCK_ANIMATIONS))
		animationsAllowed = false;
	return CommandStart::yield(std::make_unique<LayerLoadCommand>(*this, group, std::move(pending)));
}

void CommandDispatcher::layerunloadApply(const RuntimeCommand &cmd, CommandStateInfo &info) {
	auto id     = VLayerId::fromNumber(cmd.number(0));
	auto &plane = vmState.layers.plane();
	if (id.kind != VLayerId::Kind::Layer && id.kind != VLayerId::Kind::Selected) {
		sendToLog(LogLevel::Warn, "LAYERUNLOAD: %s cannot be unloaded\n", id.toString().c_str());
		return;
	}
	info.targets = vmState.layers.targets(id);
	for (auto &t : info.targets) {
		plane.layerbanks[t.layerbank].type.unset();
		plane.allocator.free(t.layer);
	}
}

CommandStart CommandDispatcher::layerunloadCommand(const RuntimeCommand &cmd, CommandStateInfo &info) {
	auto &group = planeGroup(info.plane);
	for (auto &t : info.targets) group.remove(t.layerbank, Ticks::fromI32(cmd.number(1)));
	return CommandStart::finish();
}

void CommandDispatcher::layerctrlApply(const RuntimeCommand &cmd, CommandStateInfo &info) {
	auto id      = VLayerId::fromNumber(cmd.number(0));
	int32_t prop = cmd.number(1);
	if (!isValidLayerProperty(prop)) {
		sendToLog(LogLevel::Warn, "LAYERCTRL: unknown property %d\n", prop);
		return;
	}
	int32_t target = cmd.listValue(2, 0);
	LayerCtrlFlags flags{cmd.listValue(2, 2)};

	auto apply = [&](LayerPropertiesSnapshot &snapshot) {
		snapshot.set(prop, flags.delta() ? snapshot.get(prop) + target : target);
	};

	auto fixed = vmState.layers.fixedNode(id);
	if (fixed) {
		apply(*fixed);
		return;
	}
	info.targets = vmState.layers.targets(id);
	for (auto &t : info.targets) apply(vmState.layers.plane().layerbanks[t.layerbank].properties);
}

CommandStart CommandDispatcher::layerctrlCommand(const RuntimeCommand &cmd, CommandStateInfo &info) {
	int32_t prop = cmd.number(1);
	if (!isValidLayerProperty(prop))
		return CommandStart::finish();

	auto target = static_cast<float>(cmd.listValue(2, 0));
	int32_t time = cmd.listValue(2, 1);
	LayerCtrlFlags flags{cmd.listValue(2, 2)};
	Easing easing = Easing::fromScenario(flags.raw, cmd.listValue(2, 3));

	if (flags.hasUnusedBits())
		sendToLog(LogLevel::Warn, "LAYERCTRL: unknown flags set in 0x%x\n", flags.raw);
	bool ffToCurrent = flags.ffToCurrent();
	if (ffToCurrent && flags.ffToTarget()) {
		sendToLog(LogLevel::Warn, "LAYERCTRL: both fast forward flags are set, completing to the target\n");
		ffToCurrent = false;
	}

	for (auto props : targetProperties(VLayerId::fromNumber(cmd.number(0)), info)) {
		auto &tweener = props->tweener(prop);
		float from    = tweener.targetValue();
		float to      = flags.delta() ? from + target : target;

		Ticks duration = Ticks::fromI32(time);
		if (flags.scaleTime()) {
			// The time is a rate in value per tick
			duration = time > 0 ? Ticks(std::fabs(to - from) / time) : Ticks();
		}

		if (ffToCurrent)
			tweener.fastForwardTo(tweener.value());
		if (flags.ffToTarget())
			tweener.fastForward();
		tweener.enqueue(to, Tween{duration, easing});
	}
	return CommandStart::finish();
}

void CommandDispatcher::layerwaitApply(const RuntimeCommand &cmd, CommandStateInfo &info) {
	info.targets = vmState.layers.targets(VLayerId::fromNumber(cmd.number(0)));
}

CommandStart CommandDispatcher::layerwaitCommand(const RuntimeCommand &cmd, CommandStateInfo &info) {
	std::vector<int32_t> properties;
	for (auto p : cmd.list(1)) {
		if (isValidLayerProperty(p))
			properties.push_back(p);
		else
			sendToLog(LogLevel::Warn, "LAYERWAIT: unknown property %d\n", p);
	}
	auto nodes = targetProperties(VLayerId::fromNumber(cmd.number(0)), info);
	return CommandStart::yield(std::make_unique<LayerWaitCommand>(std::move(nodes), std::move(properties)));
}

void CommandDispatcher::layerswapApply(const RuntimeCommand &cmd, CommandStateInfo &info) {
	int32_t layer1 = cmd.number(0), layer2 = cmd.number(1);
	auto &plane    = vmState.layers.plane();
	int32_t bank1  = plane.allocator.layerbank(layer1);
	int32_t bank2  = plane.allocator.layerbank(layer2);
	plane.allocator.swap(layer1, layer2);
	if (bank1 >= 0) {
		plane.layerbanks[bank1].layer = layer2;
		info.targets.push_back({layer2, bank1});
	}
	if (bank2 >= 0) {
		plane.layerbanks[bank2].layer = layer1;
		info.targets.push_back({layer1, bank2});
	}
}

CommandStart CommandDispatcher::layerswapCommand(const RuntimeCommand &, CommandStateInfo &info) {
	auto &group = planeGroup(info.plane);
	for (auto &t : info.targets) group.relabel(t.layerbank, t.layer);
	return CommandStart::finish();
}

void CommandDispatcher::layerselectApply(const RuntimeCommand &cmd, CommandStateInfo &) {
	int32_t from = cmd.number(0), to = cmd.number(1);
	if (from > to) {
		sendToLog(LogLevel::Warn, "LAYERSELECT: range %d..%d is reversed\n", from, to);
		std::swap(from, to);
	}
	vmState.layers.selection.from = from;
	vmState.layers.selection.to   = to;
}

CommandStart CommandDispatcher::moviewaitCommand(const RuntimeCommand &cmd, CommandStateInfo &info) {
	int32_t layer = cmd.number(0);
	int32_t bank  = vmState.layers.plane().allocator.layerbank(layer);
	auto &group   = planeGroup(info.plane);
	auto node     = bank >= 0 ? group.get(bank) : nullptr;
	if (!node || node->kind() != UserLayer::Kind::Movie) {
		sendToLog(LogLevel::Warn, "MOVIEWAIT: layer %d is not a movie layer\n", layer);
		return CommandStart::finish();
	}
	if (cmd.number(1) != 2)
		sendToLog(LogLevel::Warn, "MOVIEWAIT: unknown target status %d, waiting for the end\n", cmd.number(1));
	return CommandStart::yield(until("MOVIEWAIT", [&group, bank]() {
		auto n = group.get(bank);
		return !n || n->finished();
	}));
}

/* ---------------- Transitions and planes ----------------- */

void CommandDispatcher::pagebackApply(const RuntimeCommand &, CommandStateInfo &info) {
	info.needed = !vmState.layers.pageBackStarted;
	vmState.layers.pageBackStarted = true;
}

CommandStart CommandDispatcher::pagebackCommand(const RuntimeCommand &, CommandStateInfo &info) {
	if (info.needed)
		root.screen().prepareTransition();
	return CommandStart::finish();
}

void CommandDispatcher::wipeApply(const RuntimeCommand &, CommandStateInfo &info) {
	info.needed = vmState.layers.pageBackStarted;
	vmState.layers.pageBackStarted = false;
}

CommandStart CommandDispatcher::wipeCommand(const RuntimeCommand &cmd, CommandStateInfo &info) {
	if (!info.needed)
		return CommandStart::finish();

	int32_t kind = cmd.number(0), flags = cmd.number(2);
	if (kind != 0)
		sendToLog(LogLevel::Info, "WIPE: wipe type %d is drawn as a crossfade\n", kind);

	auto &screen = root.screen();
	screen.startTransition(Ticks::fromI32(cmd.number(1)));
	if (flags & WIPE_DONT_WAIT)
		return CommandStart::finish();
	return CommandStart::yield(until("WIPE", [&screen]() { return !screen.inTransition(); }));
}

CommandStart CommandDispatcher::wipewaitCommand(const RuntimeCommand &, CommandStateInfo &) {
	auto &screen = root.screen();
	return CommandStart::yield(until("WIPEWAIT", [&screen]() { return !screen.inTransition(); }));
}

void CommandDispatcher::planeselectApply(const RuntimeCommand &cmd, CommandStateInfo &) {
	int32_t plane = cmd.number(0);
	if (plane < 0 || plane >= PLANES_COUNT) {
		sendToLog(LogLevel::Warn, "PLANESELECT: invalid plane %d\n", plane);
		return;
	}
	vmState.layers.currentPlane = plane;
}

void CommandDispatcher::planeclearApply(const RuntimeCommand &, CommandStateInfo &) {
	auto &plane = vmState.layers.plane();
	for (auto &bank : plane.layerbanks) bank.type.unset();
	plane.allocator.clear();
	plane.maskId    = -1;
	plane.maskFlags = 0;
}

CommandStart CommandDispatcher::planeclearCommand(const RuntimeCommand &, CommandStateInfo &info) {
	auto &group = planeGroup(info.plane);
	group.clear();
	group.clearMask();
	return CommandStart::finish();
}

void CommandDispatcher::maskloadApply(const RuntimeCommand &cmd, CommandStateInfo &) {
	auto &plane     = vmState.layers.plane();
	plane.maskId    = cmd.number(0);
	plane.maskFlags = cmd.number(1);
}

CommandStart CommandDispatcher::maskloadCommand(const RuntimeCommand &cmd, CommandStateInfo &info) {
	auto &group = planeGroup(info.plane);
	int32_t id  = cmd.number(0);
	auto path   = tables().maskPath(id);
	if (id < 0 || path.empty()) {
		if (id >= 0)
			sendToLog(LogLevel::Warn, "MASKLOAD: no mask with id %d\n", id);
		group.clearMask();
		return CommandStart::finish();
	}
	return CommandStart::yield(std::make_unique<MaskLoadCommand>(group, cmd.number(1), path));
}

void CommandDispatcher::maskunloadApply(const RuntimeCommand &, CommandStateInfo &) {
	vmState.layers.plane().maskId    = -1;
	vmState.layers.plane().maskFlags = 0;
}

CommandStart CommandDispatcher::maskunloadCommand(const RuntimeCommand &, CommandStateInfo &info) {
	planeGroup(info.plane).clearMask();
	return CommandStart::finish();
}
