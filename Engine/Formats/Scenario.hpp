/**
 *  Scenario.hpp
 *  SNRScripter
 *
 *  Scenario image: header, info tables and the instruction stream.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Formats/Instruction.hpp"
#include "Engine/Formats/Command.hpp"

#include <memory>
#include <string>
#include <vector>
#include <cstdint>

struct Instruction {
	uint8_t opcode{0};
	// UnaryOperationType or BinaryOperationType
	uint8_t operation{0};
	// uo and bo elide the source or left operand when it equals dest
	bool elided{false};
	Register dest;
	// uo: right is the source; bo/jc: left and right; rnd: min and max; gt/jt: left is the index
	NumberSpec left, right;
	Expression expression;
	JumpCond cond;
	CodeAddress target{0};
	// gt table, push values, call arguments
	std::vector<NumberSpec> numbers;
	std::vector<CodeAddress> targets;
	std::vector<Register> registers;
	CompiletimeCommand command;

	bool isCommand() const {
		return !isInstructionOpcode(opcode);
	}

	// Throws ParseError for unknown opcodes and truncated data
	static Instruction read(ByteReader &r);
	void write(ByteWriter &w) const;
	std::string toString() const;

	bool operator==(const Instruction &o) const;
};

// Builders for hand-written bytecode
namespace Ins {
Instruction uo(UnaryOperationType type, Register dest, cmp::optional<NumberSpec> source = {});
Instruction bo(BinaryOperationType type, Register dest, cmp::optional<NumberSpec> left, NumberSpec right);
Instruction exp(Register dest, Expression e);
Instruction gt(Register dest, NumberSpec index, std::vector<NumberSpec> table);
Instruction jc(JumpCond cond, NumberSpec left, NumberSpec right, CodeAddress target);
Instruction j(CodeAddress target);
Instruction gosub(CodeAddress target);
Instruction retsub();
Instruction jt(NumberSpec index, std::vector<CodeAddress> table);
Instruction rnd(Register dest, NumberSpec min, NumberSpec max);
Instruction push(std::vector<NumberSpec> values);
Instruction pop(std::vector<Register> dest);
Instruction call(CodeAddress target, std::vector<NumberSpec> args);
Instruction ret();
Instruction command(CompiletimeCommand c);
} // namespace Ins

struct MaskEntry {
	std::string name;
};

struct PictureEntry {
	std::string name;
	// Only exposed to the scenario
	int16_t linkedCgId{-1};
};

struct BustupEntry {
	std::string name;
	std::string emotion;
	uint16_t lipsyncCharacter{0};
};

struct BgmEntry {
	std::string name;
	std::string displayName;
	uint16_t linkedId{0};
};

struct SeEntry {
	std::string name;
};

struct MovieEntry {
	std::string name;
	uint16_t linkedPicture{0};
	uint16_t flags{0};
	int16_t linkedBgm{-1};
};

struct VoiceMapping {
	std::string prefix;
	std::vector<uint8_t> characters;
};

struct PictureBoxEntry {
	std::string name;
	std::vector<uint16_t> pictureIds;
};

struct MusicBoxEntry {
	uint16_t bgmId{0};
	uint16_t nameIndex{0};
	uint16_t flags{0};
};

struct CharacterBoxSegment {
	uint8_t kind{0};
	uint16_t characterId{0};
	int16_t x{0};
	int16_t y{0};
};

struct CharacterSpriteSegment {
	uint16_t characterId{0};
	uint16_t bustupId{0};
	uint16_t pictureId{0};
};

struct CharacterGrid {
	uint16_t gridId{0};
	std::vector<uint16_t> segments;
};

struct TipsEntry {
	uint8_t episode{0};
	uint16_t id{0};
	std::string title;
	std::string content;
};

struct ScenarioInfo {
	std::vector<MaskEntry> masks;
	std::vector<PictureEntry> pictures;
	std::vector<BustupEntry> bustups;
	std::vector<BgmEntry> bgms;
	std::vector<SeEntry> ses;
	std::vector<MovieEntry> movies;
	std::vector<VoiceMapping> voiceMappings;
	std::vector<PictureBoxEntry> pictureBox;
	std::vector<MusicBoxEntry> musicBox;
	std::vector<CharacterBoxSegment> characterBox;
	std::vector<CharacterSpriteSegment> characterSprites;
	std::vector<CharacterGrid> characterGrids;
	std::vector<TipsEntry> tips;

	// Asset paths for a table index, empty when out of range
	std::string maskPath(int32_t id) const;
	std::string picturePath(int32_t id) const;
	std::string bustupPath(int32_t id) const;
	std::string bgmPath(int32_t id) const;
	std::string sePath(int32_t id) const;
	std::string moviePath(int32_t id) const;
	static std::string voicePath(const std::string &name);

	std::string describe() const;
};

const size_t SCENARIO_INFO_TABLES = 15;

class Scenario {
	std::shared_ptr<const std::vector<uint8_t>> image;
	uint32_t codeOffset{0};
	uint32_t unknownWords[6]{};
	ScenarioInfo tables;

public:
	static const uint32_t MAGIC = 0x20524E53; // "SNR "

	// Throws ParseError on a malformed header or info table
	explicit Scenario(std::vector<uint8_t> &&data);

	const std::shared_ptr<const std::vector<uint8_t>> &data() const {
		return image;
	}
	CodeAddress entryPoint() const {
		return codeOffset;
	}
	const ScenarioInfo &info() const {
		return tables;
	}
	// Decodes the instruction at address, advances address past it
	Instruction instructionAt(CodeAddress &address) const;

	// Assembles an image around a code stream, used by tools and tests
	static std::vector<uint8_t> build(const std::vector<uint8_t> &code, const ScenarioInfo &info = {});
};
