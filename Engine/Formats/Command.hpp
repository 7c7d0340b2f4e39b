/**
 *  Command.hpp
 *  SNRScripter
 *
 *  Host visible scenario commands and their argument layouts.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Formats/Instruction.hpp"

#include <string>
#include <vector>
#include <cstdint>

enum class ArgKind : uint8_t {
	U8,
	U16,
	Number,
	Dest,
	MessageId,
	Bool8,
	String,
	FixupString,
	StringArray,
	NumberMask,
	NumberList
};

// Each character of the signature names one argument:
// b u8, w u16, n number, d destination register, m 24-bit message id, f bool,
// s string, x string with fix-up, a string array, k 8-slot number mask, l number list
struct CommandDescriptor {
	uint8_t opcode;
	const char *name;
	const char *signature;
};

namespace Cmd {
enum : uint8_t {
	EXIT        = 0x00,
	SGET        = 0x81,
	SSET        = 0x82,
	WAIT        = 0x83,
	MSGINIT     = 0x85,
	MSGSET      = 0x86,
	MSGWAIT     = 0x87,
	MSGSIGNAL   = 0x88,
	MSGSYNC     = 0x89,
	MSGCLOSE    = 0x8A,
	SELECT      = 0x8D,
	WIPE        = 0x8E,
	WIPEWAIT    = 0x8F,
	BGMPLAY     = 0x90,
	BGMSTOP     = 0x91,
	BGMVOL      = 0x92,
	BGMWAIT     = 0x93,
	BGMSYNC     = 0x94,
	SEPLAY      = 0x95,
	SESTOP      = 0x96,
	SESTOPALL   = 0x97,
	SEVOL       = 0x98,
	SEPAN       = 0x99,
	SEWAIT      = 0x9A,
	SEONCE      = 0x9B,
	VOICEPLAY   = 0x9C,
	VOICESTOP   = 0x9D,
	VOICEWAIT   = 0x9E,
	SYSSE       = 0x9F,
	SAVEINFO    = 0xA0,
	AUTOSAVE    = 0xA1,
	EVBEGIN     = 0xA2,
	EVEND       = 0xA3,
	RESUMESET   = 0xA4,
	RESUME      = 0xA5,
	SYSCALL     = 0xA6,
	TROPHY      = 0xB0,
	UNLOCK      = 0xB1,
	LAYERINIT   = 0xC0,
	LAYERLOAD   = 0xC1,
	LAYERUNLOAD = 0xC2,
	LAYERCTRL   = 0xC3,
	LAYERWAIT   = 0xC4,
	LAYERSWAP   = 0xC5,
	LAYERSELECT = 0xC6,
	MOVIEWAIT   = 0xC7,
	TRANSSET    = 0xC9,
	TRANSWAIT   = 0xCA,
	PAGEBACK    = 0xCB,
	PLANESELECT = 0xCC,
	PLANECLEAR  = 0xCD,
	MASKLOAD    = 0xCE,
	MASKUNLOAD  = 0xCF,
	CHARS       = 0xE0,
	TIPSGET     = 0xE1,
	QUIZ        = 0xE2,
	SHOWCHARS   = 0xE3,
	NOTIFYSET   = 0xE4,
	DEBUGOUT    = 0xFF
};
} // namespace Cmd

// nullptr for opcodes that are neither instructions nor known commands
const CommandDescriptor *findCommand(uint8_t opcode);
const CommandDescriptor *findCommand(const char *name);
const std::vector<CommandDescriptor> &commandTable();

ArgKind argKindFromSignature(char c);

struct CommandArg {
	ArgKind kind{ArgKind::Number};
	// U8, U16, MessageId and Bool8
	uint32_t raw{0};
	NumberSpec number;
	Register dest;
	std::string text;
	std::vector<std::string> strings;
	// NumberMask always holds 8 entries, absent slots are literal zeroes
	std::vector<NumberSpec> numbers;

	bool operator==(const CommandArg &o) const;
};

// Resolves numbers against the live machine state
class NumberResolver {
public:
	virtual int32_t resolve(const NumberSpec &spec) const = 0;
	virtual ~NumberResolver() = default;
};

struct RuntimeArg {
	ArgKind kind{ArgKind::Number};
	int32_t value{0};
	Register dest;
	std::string text;
	std::vector<std::string> strings;
	std::vector<int32_t> values;
};

struct RuntimeCommand {
	uint8_t opcode{Cmd::EXIT};
	std::vector<RuntimeArg> args;

	const char *name() const;
	// Commands with a destination register expect a WriteMemory answer
	bool hasDest() const;
	Register dest() const;

	int32_t number(size_t i) const {
		return args.at(i).value;
	}
	bool flag(size_t i) const {
		return args.at(i).value != 0;
	}
	const std::string &string(size_t i) const {
		return args.at(i).text;
	}
	const std::vector<std::string> &strings(size_t i) const {
		return args.at(i).strings;
	}
	const std::vector<int32_t> &list(size_t i) const {
		return args.at(i).values;
	}
	// Entry of a number mask or list, 0 when absent
	int32_t listValue(size_t i, size_t j) const {
		auto &v = args.at(i).values;
		return j < v.size() ? v[j] : 0;
	}

	std::string toString() const;
};

struct CompiletimeCommand {
	uint8_t opcode{Cmd::EXIT};
	std::vector<CommandArg> args;

	// Throws ParseError for an unknown opcode or malformed arguments
	static CompiletimeCommand read(uint8_t opcode, ByteReader &r);
	void write(ByteWriter &w) const;

	RuntimeCommand resolve(const NumberResolver &resolver) const;
	std::string toString() const;

	bool operator==(const CompiletimeCommand &o) const {
		return opcode == o.opcode && args == o.args;
	}
};

// Convenience constructors for building commands by hand
namespace Arg {
CommandArg u8(uint8_t v);
CommandArg u16(uint16_t v);
CommandArg number(NumberSpec n);
CommandArg number(int32_t v);
CommandArg dest(Register r);
CommandArg messageId(uint32_t id);
CommandArg flag(bool v);
CommandArg string(std::string s, bool fixup = false);
CommandArg strings(std::vector<std::string> s);
CommandArg mask(std::vector<NumberSpec> n);
CommandArg list(std::vector<NumberSpec> n);
} // namespace Arg

// Builds a command and checks the arguments against the signature, throws std::invalid_argument
CompiletimeCommand makeCommand(uint8_t opcode, std::vector<CommandArg> args);
