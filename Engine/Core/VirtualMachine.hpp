/**
 *  VirtualMachine.hpp
 *  SNRScripter
 *
 *  Scenario bytecode interpreter.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Formats/Scenario.hpp"

#include <array>
#include <memory>
#include <vector>
#include <cstdint>

// Answer of the host to a yielded command
struct CommandResult {
	bool writesMemory{false};
	Register dest;
	int32_t value{0};

	static CommandResult none() {
		return {};
	}
	static CommandResult writeMemory(Register r, int32_t v) {
		CommandResult res;
		res.writesMemory = true;
		res.dest         = r;
		res.value        = v;
		return res;
	}
	// What a host without any presentation answers, zero for commands with a destination
	static CommandResult dummyFor(const RuntimeCommand &cmd) {
		return cmd.hasDest() ? writeMemory(cmd.dest(), 0) : none();
	}
};

// Registers, stacks and the random generator of a running scenario
class VmContext {
	std::array<int32_t, Register::REGISTER_COUNT> memory{};
	// Holds return addresses as well as values saved with push
	std::vector<uint32_t> codeStack;
	// Argument frames, every frame is followed by its size
	std::vector<int32_t> dataStack;
	uint32_t prng{0};

	size_t argumentSlot(Register r) const;

public:
	// Room below the first frame, scenarios address arguments outside of any call
	static const size_t DATA_STACK_RESERVE = 0x16;

	VmContext(int32_t initVal, uint32_t seed);

	int32_t read(Register r) const;
	void write(Register r, int32_t value);
	int32_t number(const NumberSpec &n) const {
		return n.isRegister ? read(n.reg) : n.constant;
	}

	void stepPrng() {
		prng = prng * 0x343FD + 0x269EC3;
	}
	uint32_t prngState() const {
		return prng;
	}
	// Random value within [a, b], the state itself is not advanced
	int32_t random(int32_t a, int32_t b) const;

	void pushCode(uint32_t value) {
		codeStack.push_back(value);
	}
	// false on an empty stack
	bool popCode(uint32_t &value);
	void pushFrame(const std::vector<int32_t> &args);
	bool popFrame();

	const std::vector<uint32_t> &codeStackView() const {
		return codeStack;
	}
	const std::vector<int32_t> &dataStackView() const {
		return dataStack;
	}
	const std::array<int32_t, Register::REGISTER_COUNT> &registers() const {
		return memory;
	}
};

// Expression and operation semantics, shared by the interpreter and the tools
namespace VmMath {
int32_t evaluate(const VmContext &ctx, const Expression &e);
int32_t unary(UnaryOperationType type, int32_t value, CodeAddress pc);
int32_t binary(BinaryOperationType type, int32_t left, int32_t right, CodeAddress pc);
bool condition(const JumpCond &cond, int32_t left, int32_t right);
} // namespace VmMath

class VirtualMachine : public NumberResolver {
	std::shared_ptr<const Scenario> scenario;
	VmContext ctx;
	CodeAddress cursor{0};
	// Address of the most recently executed instruction
	CodeAddress pc{0};

	// true when the instruction was a command to yield
	bool execute(const Instruction &ins);

public:
	VirtualMachine(std::shared_ptr<const Scenario> s, int32_t initVal, uint32_t seed);

	// Runs until the next command, throws VmError
	RuntimeCommand run(const CommandResult &previous);

	int32_t resolve(const NumberSpec &spec) const override {
		return ctx.number(spec);
	}

	// Restarts from a saved position
	void jump(CodeAddress address) {
		cursor = address;
	}
	CodeAddress position() const {
		return pc;
	}
	CodeAddress nextPosition() const {
		return cursor;
	}
	const VmContext &context() const {
		return ctx;
	}
	VmContext &context() {
		return ctx;
	}
	const Scenario &image() const {
		return *scenario;
	}
};
