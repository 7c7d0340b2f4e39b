/**
 *  Dispatcher.hpp
 *  SNRScripter
 *
 *  Executes the commands yielded by the virtual machine against the game state and the scene.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Core/VirtualMachine.hpp"
#include "Engine/Core/VmState.hpp"
#include "Engine/Layers/LayerGroup.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <cstdint>

// A command that needs ticks to complete, polled once per tick
class ExecutingCommand {
public:
	virtual ~ExecutingCommand() = default;
	// true when done, result then holds the answer for the machine
	virtual bool update(const UpdateContext &ctx, CommandResult &result) = 0;
	virtual std::string describe() const = 0;
};

struct CommandStart {
	enum class Kind {
		Continue,
		Yield,
		Exit
	};

	Kind kind{Kind::Continue};
	CommandResult result;
	std::unique_ptr<ExecutingCommand> executing;

	static CommandStart finish(const CommandResult &r = CommandResult::none()) {
		CommandStart s;
		s.result = r;
		return s;
	}
	static CommandStart yield(std::unique_ptr<ExecutingCommand> e) {
		CommandStart s;
		s.kind      = Kind::Yield;
		s.executing = std::move(e);
		return s;
	}
	static CommandStart exit() {
		CommandStart s;
		s.kind = Kind::Exit;
		return s;
	}
};

// Whatever applyState works out for start to act on
struct CommandStateInfo {
	LayerOperationTargetList targets;
	// Plane the command operated on
	int32_t plane{0};
	// Targets of LAYERLOAD whose type and parameters did not change
	std::vector<bool> sameAsBefore;
	// PAGEBACK and WIPE
	bool needed{false};
};

// printf-like formatting of DEBUGOUT, only %d, %i and %% are known
std::string formatDebugOut(const std::string &format, const std::vector<int32_t> &args);

class CommandDispatcher {
	using ApplyFunc = void (CommandDispatcher::*)(const RuntimeCommand &, CommandStateInfo &);
	using StartFunc = CommandStart (CommandDispatcher::*)(const RuntimeCommand &, CommandStateInfo &);
	struct Handler {
		ApplyFunc apply;
		StartFunc start;
	};
	static const std::unordered_map<uint8_t, Handler> handlers;

	std::shared_ptr<const Scenario> scenario;
	RootLayerGroup &root;
	VmState vmState;
	bool animationsAllowed{true};

	const ScenarioInfo &tables() const {
		return scenario->info();
	}
	LayerGroup &planeGroup(int32_t plane) {
		return root.screen().page().plane(plane);
	}
	// Scene node of a fixed VLayerId, nullptr for Layer and Selected
	Layer *fixedLayer(const VLayerId &id, int32_t plane);
	// Properties of every node a layer id addresses
	std::vector<LayerProperties *> targetProperties(const VLayerId &id, const CommandStateInfo &info);
	std::shared_ptr<const AudioFile> loadAudio(const std::string &path);

	void sgetApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void ssetApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void msginitApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void msgsetApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void msgcloseApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void bgmplayApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void bgmstopApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void bgmvolApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void seplayApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void sestopApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void sestopallApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void sevolApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void sepanApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void saveinfoApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void layerinitApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void layerloadApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void layerunloadApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void layerctrlApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void layerwaitApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void layerswapApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void layerselectApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void pagebackApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void wipeApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void planeselectApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void planeclearApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void maskloadApply(const RuntimeCommand &cmd, CommandStateInfo &info);
	void maskunloadApply(const RuntimeCommand &cmd, CommandStateInfo &info);

	CommandStart exitCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart sgetCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart waitCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart msginitCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart msgsetCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart msgwaitCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart msgsignalCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart msgsyncCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart msgcloseCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart selectCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart wipeCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart wipewaitCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart bgmplayCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart bgmstopCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart bgmvolCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart bgmwaitCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart bgmsyncCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart seplayCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart sestopCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart sestopallCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart sevolCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart sepanCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart sewaitCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart seonceCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart voiceplayCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart voicestopCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart voicewaitCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart sysseCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart ignoredCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart presentationCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart layerinitCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart layerloadCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart layerunloadCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart layerctrlCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart layerwaitCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart layerswapCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart moviewaitCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart pagebackCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart planeclearCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart maskloadCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart maskunloadCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart debugoutCommand(const RuntimeCommand &cmd, CommandStateInfo &info);
	CommandStart doneCommand(const RuntimeCommand &cmd, CommandStateInfo &info);

public:
	CommandDispatcher(std::shared_ptr<const Scenario> s, RootLayerGroup &r);

	// Declarative part, touches nothing but the VmState. Throws VmError for malformed layer ids.
	void applyState(const RuntimeCommand &cmd, CommandStateInfo &info);
	// Scene and audio part, the command either completes or yields
	CommandStart start(const RuntimeCommand &cmd, CommandStateInfo &info);
	// Both phases in a row
	CommandStart execute(const RuntimeCommand &cmd);

	// Mouth frames of the bustups that speak the current voice
	void updateLipSync();

	const VmState &state() const {
		return vmState;
	}
	VmState &state() {
		return vmState;
	}
	// Cleared while a layer load or a wipe prevents the scene from animating
	bool allowRunningAnimations() const {
		return animationsAllowed;
	}
	void setAllowRunningAnimations(bool allow) {
		animationsAllowed = allow;
	}
};
