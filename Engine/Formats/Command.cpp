/**
 *  Command.cpp
 *  SNRScripter
 *
 *  Host visible scenario commands and their argument layouts.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Formats/Command.hpp"
#include "Engine/Formats/Text.hpp"

#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace {
const std::vector<CommandDescriptor> COMMANDS{
    {Cmd::EXIT, "EXIT", "bn"},
    {Cmd::SGET, "SGET", "dn"},
    {Cmd::SSET, "SSET", "nn"},
    {Cmd::WAIT, "WAIT", "fn"},
    {Cmd::MSGINIT, "MSGINIT", "n"},
    {Cmd::MSGSET, "MSGSET", "mfx"},
    {Cmd::MSGWAIT, "MSGWAIT", "n"},
    {Cmd::MSGSIGNAL, "MSGSIGNAL", ""},
    {Cmd::MSGSYNC, "MSGSYNC", "nn"},
    {Cmd::MSGCLOSE, "MSGCLOSE", "f"},
    {Cmd::SELECT, "SELECT", "wwdnsa"},
    {Cmd::WIPE, "WIPE", "nnnk"},
    {Cmd::WIPEWAIT, "WIPEWAIT", ""},
    {Cmd::BGMPLAY, "BGMPLAY", "nnnn"},
    {Cmd::BGMSTOP, "BGMSTOP", "n"},
    {Cmd::BGMVOL, "BGMVOL", "nn"},
    {Cmd::BGMWAIT, "BGMWAIT", "n"},
    {Cmd::BGMSYNC, "BGMSYNC", "n"},
    {Cmd::SEPLAY, "SEPLAY", "nnnnnnn"},
    {Cmd::SESTOP, "SESTOP", "nn"},
    {Cmd::SESTOPALL, "SESTOPALL", "n"},
    {Cmd::SEVOL, "SEVOL", "nnn"},
    {Cmd::SEPAN, "SEPAN", "nnn"},
    {Cmd::SEWAIT, "SEWAIT", "nn"},
    {Cmd::SEONCE, "SEONCE", "nnnnn"},
    {Cmd::VOICEPLAY, "VOICEPLAY", "snn"},
    {Cmd::VOICESTOP, "VOICESTOP", ""},
    {Cmd::VOICEWAIT, "VOICEWAIT", "n"},
    {Cmd::SYSSE, "SYSSE", "nn"},
    {Cmd::SAVEINFO, "SAVEINFO", "nx"},
    {Cmd::AUTOSAVE, "AUTOSAVE", ""},
    {Cmd::EVBEGIN, "EVBEGIN", "n"},
    {Cmd::EVEND, "EVEND", ""},
    {Cmd::RESUMESET, "RESUMESET", ""},
    {Cmd::RESUME, "RESUME", ""},
    {Cmd::SYSCALL, "SYSCALL", "nn"},
    {Cmd::TROPHY, "TROPHY", "n"},
    {Cmd::UNLOCK, "UNLOCK", "bl"},
    {Cmd::LAYERINIT, "LAYERINIT", "n"},
    {Cmd::LAYERLOAD, "LAYERLOAD", "nnnk"},
    {Cmd::LAYERUNLOAD, "LAYERUNLOAD", "nn"},
    {Cmd::LAYERCTRL, "LAYERCTRL", "nnk"},
    {Cmd::LAYERWAIT, "LAYERWAIT", "nl"},
    {Cmd::LAYERSWAP, "LAYERSWAP", "nn"},
    {Cmd::LAYERSELECT, "LAYERSELECT", "nn"},
    {Cmd::MOVIEWAIT, "MOVIEWAIT", "nn"},
    {Cmd::TRANSSET, "TRANSSET", "nnnk"},
    {Cmd::TRANSWAIT, "TRANSWAIT", "n"},
    {Cmd::PAGEBACK, "PAGEBACK", ""},
    {Cmd::PLANESELECT, "PLANESELECT", "n"},
    {Cmd::PLANECLEAR, "PLANECLEAR", ""},
    {Cmd::MASKLOAD, "MASKLOAD", "nnn"},
    {Cmd::MASKUNLOAD, "MASKUNLOAD", ""},
    {Cmd::CHARS, "CHARS", "nn"},
    {Cmd::TIPSGET, "TIPSGET", "l"},
    {Cmd::QUIZ, "QUIZ", "dn"},
    {Cmd::SHOWCHARS, "SHOWCHARS", ""},
    {Cmd::NOTIFYSET, "NOTIFYSET", "n"},
    {Cmd::DEBUGOUT, "DEBUGOUT", "sl"},
};

const size_t NUMBER_MASK_SLOTS = 8;

CommandArg readArg(ArgKind kind, ByteReader &r) {
	CommandArg arg;
	arg.kind = kind;
	switch (kind) {
		case ArgKind::U8:
		case ArgKind::Bool8:
			arg.raw = r.u8();
			break;
		case ArgKind::U16:
			arg.raw = r.u16();
			break;
		case ArgKind::MessageId:
			arg.raw = r.u24();
			break;
		case ArgKind::Number:
			arg.number = NumberSpec::read(r);
			break;
		case ArgKind::Dest:
			arg.dest = Register::fromRaw(r.u16());
			break;
		case ArgKind::String:
			arg.text = readU16String(r);
			break;
		case ArgKind::FixupString:
			arg.text = readU16String(r, true);
			break;
		case ArgKind::StringArray:
			arg.strings = readStringArray(r);
			break;
		case ArgKind::NumberMask: {
			uint8_t mask = r.u8();
			for (size_t i = 0; i < NUMBER_MASK_SLOTS; i++)
				arg.numbers.push_back(mask & (1 << i) ? NumberSpec::read(r) : NumberSpec::literal(0));
			break;
		}
		case ArgKind::NumberList: {
			uint8_t count = r.u8();
			for (uint8_t i = 0; i < count; i++) arg.numbers.push_back(NumberSpec::read(r));
			break;
		}
	}
	return arg;
}

void writeArg(const CommandArg &arg, ByteWriter &w) {
	switch (arg.kind) {
		case ArgKind::U8:
		case ArgKind::Bool8:
			w.u8(static_cast<uint8_t>(arg.raw));
			break;
		case ArgKind::U16:
			w.u16(static_cast<uint16_t>(arg.raw));
			break;
		case ArgKind::MessageId:
			w.u24(arg.raw);
			break;
		case ArgKind::Number:
			arg.number.write(w);
			break;
		case ArgKind::Dest:
			w.u16(arg.dest.raw());
			break;
		case ArgKind::String:
			writeU16String(w, arg.text);
			break;
		case ArgKind::FixupString:
			writeU16String(w, arg.text, true);
			break;
		case ArgKind::StringArray:
			writeStringArray(w, arg.strings);
			break;
		case ArgKind::NumberMask: {
			if (arg.numbers.size() > NUMBER_MASK_SLOTS)
				throw ParseError(ParseError::Kind::BadLength, "number mask with " + std::to_string(arg.numbers.size()) + " slots");
			uint8_t mask = 0;
			for (size_t i = 0; i < arg.numbers.size(); i++)
				if (arg.numbers[i] != NumberSpec::literal(0))
					mask |= 1 << i;
			w.u8(mask);
			for (size_t i = 0; i < arg.numbers.size(); i++)
				if (mask & (1 << i))
					arg.numbers[i].write(w);
			break;
		}
		case ArgKind::NumberList:
			if (arg.numbers.size() > 0xFF)
				throw ParseError(ParseError::Kind::BadLength, "number list with " + std::to_string(arg.numbers.size()) + " entries");
			w.u8(static_cast<uint8_t>(arg.numbers.size()));
			for (auto &n : arg.numbers) n.write(w);
			break;
	}
}

std::string quote(const std::string &s) {
	return "\"" + s + "\"";
}
} // namespace

const std::vector<CommandDescriptor> &commandTable() {
	return COMMANDS;
}

const CommandDescriptor *findCommand(uint8_t opcode) {
	for (auto &c : COMMANDS)
		if (c.opcode == opcode)
			return &c;
	return nullptr;
}

const CommandDescriptor *findCommand(const char *name) {
	for (auto &c : COMMANDS)
		if (!std::strcmp(c.name, name))
			return &c;
	return nullptr;
}

ArgKind argKindFromSignature(char c) {
	switch (c) {
		case 'b':
			return ArgKind::U8;
		case 'w':
			return ArgKind::U16;
		case 'n':
			return ArgKind::Number;
		case 'd':
			return ArgKind::Dest;
		case 'm':
			return ArgKind::MessageId;
		case 'f':
			return ArgKind::Bool8;
		case 's':
			return ArgKind::String;
		case 'x':
			return ArgKind::FixupString;
		case 'a':
			return ArgKind::StringArray;
		case 'k':
			return ArgKind::NumberMask;
		case 'l':
			return ArgKind::NumberList;
		default:
			throw std::invalid_argument(std::string("unknown argument kind ") + c);
	}
}

bool CommandArg::operator==(const CommandArg &o) const {
	if (kind != o.kind)
		return false;
	switch (kind) {
		case ArgKind::U8:
		case ArgKind::U16:
		case ArgKind::MessageId:
		case ArgKind::Bool8:
			return raw == o.raw;
		case ArgKind::Number:
			return number == o.number;
		case ArgKind::Dest:
			return dest == o.dest;
		case ArgKind::String:
		case ArgKind::FixupString:
			return text == o.text;
		case ArgKind::StringArray:
			return strings == o.strings;
		case ArgKind::NumberMask:
		case ArgKind::NumberList:
			return numbers == o.numbers;
	}
	return false;
}

CompiletimeCommand CompiletimeCommand::read(uint8_t opcode, ByteReader &r) {
	auto desc = findCommand(opcode);
	if (!desc)
		throw ParseError(ParseError::Kind::InvalidByte, "unknown command opcode " + std::to_string(opcode));

	CompiletimeCommand cmd;
	cmd.opcode = opcode;
	for (const char *s = desc->signature; *s; s++) cmd.args.push_back(readArg(argKindFromSignature(*s), r));
	return cmd;
}

void CompiletimeCommand::write(ByteWriter &w) const {
	auto desc = findCommand(opcode);
	if (!desc || std::strlen(desc->signature) != args.size())
		throw ParseError(ParseError::Kind::BadLength, "command " + std::to_string(opcode) + " does not match its signature");
	w.u8(opcode);
	for (auto &a : args) writeArg(a, w);
}

RuntimeCommand CompiletimeCommand::resolve(const NumberResolver &resolver) const {
	RuntimeCommand rt;
	rt.opcode = opcode;
	rt.args.reserve(args.size());
	for (auto &a : args) {
		RuntimeArg v;
		v.kind = a.kind;
		switch (a.kind) {
			case ArgKind::U8:
			case ArgKind::U16:
			case ArgKind::MessageId:
			case ArgKind::Bool8:
				v.value = static_cast<int32_t>(a.raw);
				break;
			case ArgKind::Number:
				v.value = resolver.resolve(a.number);
				break;
			case ArgKind::Dest:
				v.dest = a.dest;
				break;
			case ArgKind::String:
			case ArgKind::FixupString:
				v.text = a.text;
				break;
			case ArgKind::StringArray:
				v.strings = a.strings;
				break;
			case ArgKind::NumberMask:
			case ArgKind::NumberList:
				for (auto &n : a.numbers) v.values.push_back(resolver.resolve(n));
				break;
		}
		rt.args.push_back(std::move(v));
	}
	return rt;
}

std::string CompiletimeCommand::toString() const {
	auto desc       = findCommand(opcode);
	std::string out = desc ? desc->name : "???";
	for (size_t i = 0; i < args.size(); i++) {
		auto &a = args[i];
		out += i ? ", " : " ";
		switch (a.kind) {
			case ArgKind::U8:
			case ArgKind::U16:
			case ArgKind::MessageId:
			case ArgKind::Bool8:
				out += std::to_string(a.raw);
				break;
			case ArgKind::Number:
				out += a.number.toString();
				break;
			case ArgKind::Dest:
				out += "-> " + a.dest.toString();
				break;
			case ArgKind::String:
			case ArgKind::FixupString:
				out += quote(a.text);
				break;
			case ArgKind::StringArray: {
				out += "[";
				for (size_t j = 0; j < a.strings.size(); j++) out += (j ? ", " : "") + quote(a.strings[j]);
				out += "]";
				break;
			}
			case ArgKind::NumberMask:
			case ArgKind::NumberList: {
				out += "[";
				for (size_t j = 0; j < a.numbers.size(); j++) out += (j ? ", " : "") + a.numbers[j].toString();
				out += "]";
				break;
			}
		}
	}
	return out;
}

const char *RuntimeCommand::name() const {
	auto desc = findCommand(opcode);
	return desc ? desc->name : "???";
}

bool RuntimeCommand::hasDest() const {
	return std::any_of(args.begin(), args.end(), [](const RuntimeArg &a) { return a.kind == ArgKind::Dest; });
}

Register RuntimeCommand::dest() const {
	for (auto &a : args)
		if (a.kind == ArgKind::Dest)
			return a.dest;
	throw std::logic_error(std::string(name()) + " has no destination");
}

std::string RuntimeCommand::toString() const {
	std::string out = name();
	for (size_t i = 0; i < args.size(); i++) {
		auto &a = args[i];
		out += i ? ", " : " ";
		switch (a.kind) {
			case ArgKind::Dest:
				out += "-> " + a.dest.toString();
				break;
			case ArgKind::String:
			case ArgKind::FixupString:
				out += quote(a.text);
				break;
			case ArgKind::StringArray: {
				out += "[";
				for (size_t j = 0; j < a.strings.size(); j++) out += (j ? ", " : "") + quote(a.strings[j]);
				out += "]";
				break;
			}
			case ArgKind::NumberMask:
			case ArgKind::NumberList: {
				out += "[";
				for (size_t j = 0; j < a.values.size(); j++) out += (j ? ", " : "") + std::to_string(a.values[j]);
				out += "]";
				break;
			}
			default:
				out += std::to_string(a.value);
				break;
		}
	}
	return out;
}

namespace Arg {
CommandArg u8(uint8_t v) {
	CommandArg a;
	a.kind = ArgKind::U8;
	a.raw  = v;
	return a;
}
CommandArg u16(uint16_t v) {
	CommandArg a;
	a.kind = ArgKind::U16;
	a.raw  = v;
	return a;
}
CommandArg number(NumberSpec n) {
	CommandArg a;
	a.kind   = ArgKind::Number;
	a.number = n;
	return a;
}
CommandArg number(int32_t v) {
	return number(NumberSpec::literal(v));
}
CommandArg dest(Register r) {
	CommandArg a;
	a.kind = ArgKind::Dest;
	a.dest = r;
	return a;
}
CommandArg messageId(uint32_t id) {
	CommandArg a;
	a.kind = ArgKind::MessageId;
	a.raw  = id & 0xFFFFFF;
	return a;
}
CommandArg flag(bool v) {
	CommandArg a;
	a.kind = ArgKind::Bool8;
	a.raw  = v ? 1 : 0;
	return a;
}
CommandArg string(std::string s, bool fixup) {
	CommandArg a;
	a.kind = fixup ? ArgKind::FixupString : ArgKind::String;
	a.text = std::move(s);
	return a;
}
CommandArg strings(std::vector<std::string> s) {
	CommandArg a;
	a.kind    = ArgKind::StringArray;
	a.strings = std::move(s);
	return a;
}
CommandArg mask(std::vector<NumberSpec> n) {
	CommandArg a;
	a.kind    = ArgKind::NumberMask;
	a.numbers = std::move(n);
	a.numbers.resize(NUMBER_MASK_SLOTS, NumberSpec::literal(0));
	return a;
}
CommandArg list(std::vector<NumberSpec> n) {
	CommandArg a;
	a.kind    = ArgKind::NumberList;
	a.numbers = std::move(n);
	return a;
}
} // namespace Arg

CompiletimeCommand makeCommand(uint8_t opcode, std::vector<CommandArg> args) {
	auto desc = findCommand(opcode);
	if (!desc)
		throw std::invalid_argument("unknown command opcode " + std::to_string(opcode));
	size_t n = std::strlen(desc->signature);
	if (n != args.size())
		throw std::invalid_argument(std::string(desc->name) + " takes " + std::to_string(n) + " arguments");
	for (size_t i = 0; i < n; i++)
		if (argKindFromSignature(desc->signature[i]) != args[i].kind)
			throw std::invalid_argument(std::string(desc->name) + " argument " + std::to_string(i) + " has the wrong kind");

	CompiletimeCommand cmd;
	cmd.opcode = opcode;
	cmd.args   = std::move(args);
	return cmd;
}
