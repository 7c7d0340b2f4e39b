/**
 *  Scenario.cpp
 *  SNRScripter
 *
 *  Scenario image: header, info tables and the instruction stream.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Formats/Scenario.hpp"
#include "Engine/Formats/Text.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace {
const size_t HEADER_SIZE = 4 + 4 + 6 * 4 + 4 + SCENARIO_INFO_TABLES * 4;

void readUo(ByteReader &r, Instruction &ins) {
	uint8_t t     = r.u8();
	ins.operation = t & 0x7F;
	if (ins.operation > static_cast<uint8_t>(UnaryOperationType::BitwiseNot))
		throw ParseError(ParseError::Kind::InvalidByte, "unary operation " + std::to_string(ins.operation));
	ins.dest = Register::fromRaw(r.u16());
	if (t & 0x80) {
		ins.right = NumberSpec::read(r);
	} else {
		ins.elided = true;
		ins.right  = NumberSpec::of(ins.dest);
	}
}

void readBo(ByteReader &r, Instruction &ins) {
	uint8_t t     = r.u8();
	ins.operation = t & 0x7F;
	if (ins.operation > static_cast<uint8_t>(BinaryOperationType::TrailingZeroMask))
		throw ParseError(ParseError::Kind::InvalidByte, "binary operation " + std::to_string(ins.operation));
	ins.dest = Register::fromRaw(r.u16());
	if (t & 0x80) {
		ins.left = NumberSpec::read(r);
	} else {
		ins.elided = true;
		ins.left   = NumberSpec::of(ins.dest);
	}
	ins.right = NumberSpec::read(r);
}

JumpCond readCond(ByteReader &r) {
	uint8_t t = r.u8();
	if ((t & 0x7F) > static_cast<uint8_t>(JumpCondType::BitSet))
		throw ParseError(ParseError::Kind::InvalidByte, "jump condition " + std::to_string(t));
	JumpCond c;
	c.condition = static_cast<JumpCondType>(t & 0x7F);
	c.negated   = t & 0x80;
	return c;
}

std::string lower(std::string s) {
	std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return s;
}

template <typename T, typename F>
std::string assetPath(const std::vector<T> &table, int32_t id, const char *dir, const char *ext, F name) {
	if (id < 0 || static_cast<size_t>(id) >= table.size())
		return {};
	return std::string("/") + dir + "/" + lower(name(table[id])) + ext;
}

// Info tables are {u32 byte size, u32 count, records}, an offset of 0 is an empty table
template <typename T, typename F>
std::vector<T> readTable(const std::vector<uint8_t> &data, uint32_t offset, const char *what, F record) {
	std::vector<T> out;
	if (offset == 0)
		return out;

	ByteReader head(data, offset);
	uint32_t size  = head.u32();
	uint32_t count = head.u32();
	if (size < 8 || size > data.size() - offset)
		throw ParseError(ParseError::Kind::BadLength, std::string(what) + " table of " + std::to_string(size) + " bytes");

	ByteReader r(data.data() + offset, size, 8);
	out.reserve(std::min<uint32_t>(count, size));
	for (uint32_t i = 0; i < count; i++) out.push_back(record(r));
	return out;
}

template <typename T, typename F>
void writeTable(ByteWriter &w, uint32_t tableIndex, const std::vector<T> &items, F record) {
	if (items.empty())
		return;
	uint32_t start = static_cast<uint32_t>(w.position());
	w.patchU32(4 + 4 + 6 * 4 + 4 + tableIndex * 4, start);
	w.u32(0);
	w.u32(static_cast<uint32_t>(items.size()));
	for (auto &item : items) record(w, item);
	w.patchU32(start, static_cast<uint32_t>(w.position()) - start);
}
} // namespace

Instruction Instruction::read(ByteReader &r) {
	Instruction ins;
	ins.opcode = r.u8();

	switch (static_cast<Opcode>(ins.opcode)) {
		case Opcode::Uo:
			readUo(r, ins);
			return ins;
		case Opcode::Bo:
			readBo(r, ins);
			return ins;
		case Opcode::Exp:
			ins.dest       = Register::fromRaw(r.u16());
			ins.expression = Expression::read(r);
			return ins;
		case Opcode::Gt: {
			ins.dest       = Register::fromRaw(r.u16());
			ins.left       = NumberSpec::read(r);
			uint16_t count = r.u16();
			for (uint16_t i = 0; i < count; i++) {
				size_t start = r.position();
				ins.numbers.push_back(NumberSpec::read(r));
				r.skip(4 - (r.position() - start));
			}
			return ins;
		}
		case Opcode::Jc:
			ins.cond   = readCond(r);
			ins.left   = NumberSpec::read(r);
			ins.right  = NumberSpec::read(r);
			ins.target = r.u32();
			return ins;
		case Opcode::J:
		case Opcode::Gosub:
			ins.target = r.u32();
			return ins;
		case Opcode::Retsub:
		case Opcode::Return:
			return ins;
		case Opcode::Jt: {
			ins.left       = NumberSpec::read(r);
			uint16_t count = r.u16();
			for (uint16_t i = 0; i < count; i++) ins.targets.push_back(r.u32());
			return ins;
		}
		case Opcode::Rnd:
			ins.dest  = Register::fromRaw(r.u16());
			ins.left  = NumberSpec::read(r);
			ins.right = NumberSpec::read(r);
			return ins;
		case Opcode::Push: {
			uint8_t count = r.u8();
			for (uint8_t i = 0; i < count; i++) ins.numbers.push_back(NumberSpec::read(r));
			return ins;
		}
		case Opcode::Pop: {
			uint8_t count = r.u8();
			for (uint8_t i = 0; i < count; i++) ins.registers.push_back(Register::fromRaw(r.u16()));
			return ins;
		}
		case Opcode::Call: {
			ins.target    = r.u32();
			uint8_t count = r.u8();
			for (uint8_t i = 0; i < count; i++) ins.numbers.push_back(NumberSpec::read(r));
			return ins;
		}
	}

	ins.command = CompiletimeCommand::read(ins.opcode, r);
	return ins;
}

void Instruction::write(ByteWriter &w) const {
	if (isCommand()) {
		command.write(w);
		return;
	}

	w.u8(opcode);
	switch (static_cast<Opcode>(opcode)) {
		case Opcode::Uo:
			w.u8(operation | (elided ? 0 : 0x80));
			w.u16(dest.raw());
			if (!elided)
				right.write(w);
			break;
		case Opcode::Bo:
			w.u8(operation | (elided ? 0 : 0x80));
			w.u16(dest.raw());
			if (!elided)
				left.write(w);
			right.write(w);
			break;
		case Opcode::Exp:
			w.u16(dest.raw());
			expression.write(w);
			break;
		case Opcode::Gt:
			w.u16(dest.raw());
			left.write(w);
			w.u16(static_cast<uint16_t>(numbers.size()));
			for (auto &n : numbers) {
				size_t start = w.position();
				n.write(w);
				w.zeroes(4 - (w.position() - start));
			}
			break;
		case Opcode::Jc:
			w.u8(cond.encode());
			left.write(w);
			right.write(w);
			w.u32(target);
			break;
		case Opcode::J:
		case Opcode::Gosub:
			w.u32(target);
			break;
		case Opcode::Retsub:
		case Opcode::Return:
			break;
		case Opcode::Jt:
			left.write(w);
			w.u16(static_cast<uint16_t>(targets.size()));
			for (auto t : targets) w.u32(t);
			break;
		case Opcode::Rnd:
			w.u16(dest.raw());
			left.write(w);
			right.write(w);
			break;
		case Opcode::Push:
			w.u8(static_cast<uint8_t>(numbers.size()));
			for (auto &n : numbers) n.write(w);
			break;
		case Opcode::Pop:
			w.u8(static_cast<uint8_t>(registers.size()));
			for (auto &reg : registers) w.u16(reg.raw());
			break;
		case Opcode::Call:
			w.u32(target);
			w.u8(static_cast<uint8_t>(numbers.size()));
			for (auto &n : numbers) n.write(w);
			break;
	}
}

std::string Instruction::toString() const {
	if (isCommand())
		return command.toString();

	auto list = [](const std::vector<NumberSpec> &v) {
		std::string s = "[";
		for (size_t i = 0; i < v.size(); i++) s += (i ? ", " : "") + v[i].toString();
		return s + "]";
	};
	auto addr = [](CodeAddress a) {
		char buf[16];
		std::snprintf(buf, sizeof(buf), "0x%08x", a);
		return std::string(buf);
	};

	switch (static_cast<Opcode>(opcode)) {
		case Opcode::Uo:
			return std::string("uo ") + unaryOperationName(static_cast<UnaryOperationType>(operation)) + " " + dest.toString() +
			       ", " + right.toString();
		case Opcode::Bo:
			return std::string("bo ") + binaryOperationName(static_cast<BinaryOperationType>(operation)) + " " + dest.toString() +
			       ", " + left.toString() + ", " + right.toString();
		case Opcode::Exp:
			return "exp " + dest.toString() + ", " + expression.toString();
		case Opcode::Gt:
			return "gt " + dest.toString() + ", " + left.toString() + ", " + list(numbers);
		case Opcode::Jc:
			return std::string("jc ") + (cond.negated ? "!" : "") + jumpCondName(cond.condition) + " " + left.toString() + ", " +
			       right.toString() + ", " + addr(target);
		case Opcode::J:
			return "j " + addr(target);
		case Opcode::Gosub:
			return "gosub " + addr(target);
		case Opcode::Retsub:
			return "retsub";
		case Opcode::Jt: {
			std::string s = "jt " + left.toString() + ", [";
			for (size_t i = 0; i < targets.size(); i++) s += (i ? ", " : "") + addr(targets[i]);
			return s + "]";
		}
		case Opcode::Rnd:
			return "rnd " + dest.toString() + ", " + left.toString() + ", " + right.toString();
		case Opcode::Push:
			return "push " + list(numbers);
		case Opcode::Pop: {
			std::string s = "pop [";
			for (size_t i = 0; i < registers.size(); i++) s += (i ? ", " : "") + registers[i].toString();
			return s + "]";
		}
		case Opcode::Call:
			return "call " + addr(target) + ", " + list(numbers);
		case Opcode::Return:
			return "return";
	}
	return "???";
}

bool Instruction::operator==(const Instruction &o) const {
	if (opcode != o.opcode)
		return false;
	if (isCommand())
		return command == o.command;
	return operation == o.operation && elided == o.elided && dest == o.dest && left == o.left && right == o.right &&
	       expression == o.expression && cond == o.cond && target == o.target && numbers == o.numbers &&
	       targets == o.targets && registers == o.registers;
}

namespace Ins {
namespace {
Instruction make(Opcode op) {
	Instruction ins;
	ins.opcode = static_cast<uint8_t>(op);
	return ins;
}
} // namespace

Instruction uo(UnaryOperationType type, Register dest, cmp::optional<NumberSpec> source) {
	auto ins      = make(Opcode::Uo);
	ins.operation = static_cast<uint8_t>(type);
	ins.dest      = dest;
	ins.elided    = !source.has();
	ins.right     = source.get(NumberSpec::of(dest));
	return ins;
}

Instruction bo(BinaryOperationType type, Register dest, cmp::optional<NumberSpec> left, NumberSpec right) {
	auto ins      = make(Opcode::Bo);
	ins.operation = static_cast<uint8_t>(type);
	ins.dest      = dest;
	ins.elided    = !left.has();
	ins.left      = left.get(NumberSpec::of(dest));
	ins.right     = right;
	return ins;
}

Instruction exp(Register dest, Expression e) {
	auto ins       = make(Opcode::Exp);
	ins.dest       = dest;
	ins.expression = std::move(e);
	return ins;
}

Instruction gt(Register dest, NumberSpec index, std::vector<NumberSpec> table) {
	auto ins    = make(Opcode::Gt);
	ins.dest    = dest;
	ins.left    = index;
	ins.numbers = std::move(table);
	return ins;
}

Instruction jc(JumpCond cond, NumberSpec left, NumberSpec right, CodeAddress target) {
	auto ins   = make(Opcode::Jc);
	ins.cond   = cond;
	ins.left   = left;
	ins.right  = right;
	ins.target = target;
	return ins;
}

Instruction j(CodeAddress target) {
	auto ins   = make(Opcode::J);
	ins.target = target;
	return ins;
}

Instruction gosub(CodeAddress target) {
	auto ins   = make(Opcode::Gosub);
	ins.target = target;
	return ins;
}

Instruction retsub() {
	return make(Opcode::Retsub);
}

Instruction jt(NumberSpec index, std::vector<CodeAddress> table) {
	auto ins    = make(Opcode::Jt);
	ins.left    = index;
	ins.targets = std::move(table);
	return ins;
}

Instruction rnd(Register dest, NumberSpec min, NumberSpec max) {
	auto ins  = make(Opcode::Rnd);
	ins.dest  = dest;
	ins.left  = min;
	ins.right = max;
	return ins;
}

Instruction push(std::vector<NumberSpec> values) {
	auto ins    = make(Opcode::Push);
	ins.numbers = std::move(values);
	return ins;
}

Instruction pop(std::vector<Register> dest) {
	auto ins      = make(Opcode::Pop);
	ins.registers = std::move(dest);
	return ins;
}

Instruction call(CodeAddress target, std::vector<NumberSpec> args) {
	auto ins    = make(Opcode::Call);
	ins.target  = target;
	ins.numbers = std::move(args);
	return ins;
}

Instruction ret() {
	return make(Opcode::Return);
}

Instruction command(CompiletimeCommand c) {
	Instruction ins;
	ins.opcode  = c.opcode;
	ins.command = std::move(c);
	return ins;
}
} // namespace Ins

std::string ScenarioInfo::maskPath(int32_t id) const {
	return assetPath(masks, id, "mask", ".msk", [](const MaskEntry &i) { return i.name; });
}

std::string ScenarioInfo::picturePath(int32_t id) const {
	return assetPath(pictures, id, "picture", ".pic", [](const PictureEntry &i) { return i.name; });
}

std::string ScenarioInfo::bustupPath(int32_t id) const {
	return assetPath(bustups, id, "bustup", ".bup", [](const BustupEntry &i) { return i.name; });
}

std::string ScenarioInfo::bgmPath(int32_t id) const {
	return assetPath(bgms, id, "bgm", ".nxa", [](const BgmEntry &i) { return i.name; });
}

std::string ScenarioInfo::sePath(int32_t id) const {
	return assetPath(ses, id, "se", ".nxa", [](const SeEntry &i) { return i.name; });
}

std::string ScenarioInfo::moviePath(int32_t id) const {
	return assetPath(movies, id, "movie", ".mp4", [](const MovieEntry &i) { return i.name; });
}

std::string ScenarioInfo::voicePath(const std::string &name) {
	return "/voice/" + lower(name) + ".nxa";
}

std::string ScenarioInfo::describe() const {
	std::string out;
	char line[512];
	auto section = [&](const char *name, size_t count) {
		std::snprintf(line, sizeof(line), "%s (%zu):\n", name, count);
		out += line;
	};

	section("masks", masks.size());
	for (size_t i = 0; i < masks.size(); i++) out += "  " + std::to_string(i) + ": " + masks[i].name + "\n";
	section("pictures", pictures.size());
	for (size_t i = 0; i < pictures.size(); i++)
		out += "  " + std::to_string(i) + ": " + pictures[i].name + " cg=" + std::to_string(pictures[i].linkedCgId) + "\n";
	section("bustups", bustups.size());
	for (size_t i = 0; i < bustups.size(); i++)
		out += "  " + std::to_string(i) + ": " + bustups[i].name + " " + bustups[i].emotion +
		       " lipsync=" + std::to_string(bustups[i].lipsyncCharacter) + "\n";
	section("bgm", bgms.size());
	for (size_t i = 0; i < bgms.size(); i++)
		out += "  " + std::to_string(i) + ": " + bgms[i].name + " \"" + bgms[i].displayName +
		       "\" linked=" + std::to_string(bgms[i].linkedId) + "\n";
	section("se", ses.size());
	for (size_t i = 0; i < ses.size(); i++) out += "  " + std::to_string(i) + ": " + ses[i].name + "\n";
	section("movies", movies.size());
	for (size_t i = 0; i < movies.size(); i++) {
		std::snprintf(line, sizeof(line), "  %zu: %s picture=%u flags=0x%x bgm=%d\n", i, movies[i].name.c_str(),
		              movies[i].linkedPicture, movies[i].flags, movies[i].linkedBgm);
		out += line;
	}
	section("voice mappings", voiceMappings.size());
	for (auto &v : voiceMappings) {
		out += "  " + v.prefix + ":";
		for (auto c : v.characters) out += " " + std::to_string(c);
		out += "\n";
	}
	section("picture box", pictureBox.size());
	for (auto &p : pictureBox) {
		out += "  " + p.name + ":";
		for (auto id : p.pictureIds) out += " " + std::to_string(id);
		out += "\n";
	}
	section("music box", musicBox.size());
	for (auto &m : musicBox) {
		std::snprintf(line, sizeof(line), "  bgm=%u name=%u flags=0x%x\n", m.bgmId, m.nameIndex, m.flags);
		out += line;
	}
	section("character box", characterBox.size());
	for (auto &c : characterBox) {
		std::snprintf(line, sizeof(line), "  kind=%u character=%u at %d,%d\n", c.kind, c.characterId, c.x, c.y);
		out += line;
	}
	section("character sprites", characterSprites.size());
	for (auto &c : characterSprites) {
		std::snprintf(line, sizeof(line), "  character=%u bustup=%u picture=%u\n", c.characterId, c.bustupId, c.pictureId);
		out += line;
	}
	section("character grids", characterGrids.size());
	for (auto &g : characterGrids) {
		out += "  " + std::to_string(g.gridId) + ":";
		for (auto s : g.segments) out += " " + std::to_string(s);
		out += "\n";
	}
	section("tips", tips.size());
	for (auto &t : tips)
		out += "  ep" + std::to_string(t.episode) + " #" + std::to_string(t.id) + " " + t.title + "\n";
	return out;
}

Scenario::Scenario(std::vector<uint8_t> &&data) {
	auto owned = std::make_shared<std::vector<uint8_t>>(std::move(data));
	const std::vector<uint8_t> &d = *owned;

	ByteReader r(d);
	if (r.u32() != MAGIC)
		throw ParseError(ParseError::Kind::InvalidMagic, "not a scenario file");
	uint32_t size = r.u32();
	if (size != d.size())
		throw ParseError(ParseError::Kind::BadLength,
		                 "scenario claims " + std::to_string(size) + " bytes but has " + std::to_string(d.size()));
	for (auto &w : unknownWords) w = r.u32();
	codeOffset = r.u32();
	if (codeOffset < HEADER_SIZE || codeOffset >= d.size())
		throw ParseError(ParseError::Kind::BadLength, "code offset " + std::to_string(codeOffset) + " outside of the file");

	uint32_t offsets[SCENARIO_INFO_TABLES];
	for (auto &o : offsets) {
		o = r.u32();
		if (o >= d.size())
			throw ParseError(ParseError::Kind::BadLength, "info table offset " + std::to_string(o) + " outside of the file");
	}

	tables.masks    = readTable<MaskEntry>(d, offsets[0], "mask", [](ByteReader &t) { return MaskEntry{readU16String(t)}; });
	tables.pictures = readTable<PictureEntry>(d, offsets[1], "picture", [](ByteReader &t) {
		PictureEntry i;
		i.name       = readU16String(t);
		i.linkedCgId = t.i16();
		return i;
	});
	tables.bustups = readTable<BustupEntry>(d, offsets[2], "bustup", [](ByteReader &t) {
		BustupEntry i;
		i.name             = readU16String(t);
		i.emotion          = readU16String(t);
		i.lipsyncCharacter = t.u16();
		return i;
	});
	tables.bgms = readTable<BgmEntry>(d, offsets[3], "bgm", [](ByteReader &t) {
		BgmEntry i;
		i.name        = readU16String(t);
		i.displayName = readU16String(t);
		i.linkedId    = t.u16();
		return i;
	});
	tables.ses    = readTable<SeEntry>(d, offsets[4], "se", [](ByteReader &t) { return SeEntry{readU16String(t)}; });
	tables.movies = readTable<MovieEntry>(d, offsets[5], "movie", [](ByteReader &t) {
		MovieEntry i;
		i.name          = readU16String(t);
		i.linkedPicture = t.u16();
		i.flags         = t.u16();
		i.linkedBgm     = t.i16();
		return i;
	});
	tables.voiceMappings = readTable<VoiceMapping>(d, offsets[6], "voice", [](ByteReader &t) {
		VoiceMapping i;
		i.prefix      = readU16String(t);
		uint8_t count = t.u8();
		for (uint8_t c = 0; c < count; c++) i.characters.push_back(t.u8());
		return i;
	});
	tables.pictureBox = readTable<PictureBoxEntry>(d, offsets[7], "picture box", [](ByteReader &t) {
		PictureBoxEntry i;
		i.name         = readU16String(t);
		uint16_t count = t.u16();
		for (uint16_t c = 0; c < count; c++) i.pictureIds.push_back(t.u16());
		return i;
	});
	tables.musicBox = readTable<MusicBoxEntry>(d, offsets[8], "music box", [](ByteReader &t) {
		MusicBoxEntry i;
		i.bgmId     = t.u16();
		i.nameIndex = t.u16();
		i.flags     = t.u16();
		return i;
	});
	tables.characterBox = readTable<CharacterBoxSegment>(d, offsets[9], "character box", [](ByteReader &t) {
		CharacterBoxSegment i;
		i.kind        = t.u8();
		i.characterId = t.u16();
		i.x           = t.i16();
		i.y           = t.i16();
		return i;
	});
	tables.characterSprites = readTable<CharacterSpriteSegment>(d, offsets[10], "character sprite", [](ByteReader &t) {
		CharacterSpriteSegment i;
		i.characterId = t.u16();
		i.bustupId    = t.u16();
		i.pictureId   = t.u16();
		return i;
	});
	tables.characterGrids = readTable<CharacterGrid>(d, offsets[11], "character grid", [](ByteReader &t) {
		CharacterGrid i;
		i.gridId      = t.u16();
		uint8_t count = t.u8();
		for (uint8_t c = 0; c < count; c++) i.segments.push_back(t.u16());
		return i;
	});
	tables.tips = readTable<TipsEntry>(d, offsets[12], "tips", [](ByteReader &t) {
		TipsEntry i;
		i.episode = t.u8();
		i.id      = t.u16();
		i.title   = readU16String(t);
		i.content = readU16String(t);
		return i;
	});

	image = std::move(owned);
}

Instruction Scenario::instructionAt(CodeAddress &address) const {
	ByteReader r(*image, address);
	auto ins = Instruction::read(r);
	address  = static_cast<CodeAddress>(r.position());
	return ins;
}

std::vector<uint8_t> Scenario::build(const std::vector<uint8_t> &code, const ScenarioInfo &info) {
	ByteWriter w;
	w.u32(MAGIC);
	w.u32(0);
	w.zeroes(6 * 4);
	w.u32(0);
	w.zeroes(SCENARIO_INFO_TABLES * 4);

	writeTable(w, 0, info.masks, [](ByteWriter &t, const MaskEntry &i) { writeU16String(t, i.name); });
	writeTable(w, 1, info.pictures, [](ByteWriter &t, const PictureEntry &i) {
		writeU16String(t, i.name);
		t.i16(i.linkedCgId);
	});
	writeTable(w, 2, info.bustups, [](ByteWriter &t, const BustupEntry &i) {
		writeU16String(t, i.name);
		writeU16String(t, i.emotion);
		t.u16(i.lipsyncCharacter);
	});
	writeTable(w, 3, info.bgms, [](ByteWriter &t, const BgmEntry &i) {
		writeU16String(t, i.name);
		writeU16String(t, i.displayName);
		t.u16(i.linkedId);
	});
	writeTable(w, 4, info.ses, [](ByteWriter &t, const SeEntry &i) { writeU16String(t, i.name); });
	writeTable(w, 5, info.movies, [](ByteWriter &t, const MovieEntry &i) {
		writeU16String(t, i.name);
		t.u16(i.linkedPicture);
		t.u16(i.flags);
		t.i16(i.linkedBgm);
	});
	writeTable(w, 6, info.voiceMappings, [](ByteWriter &t, const VoiceMapping &i) {
		writeU16String(t, i.prefix);
		t.u8(static_cast<uint8_t>(i.characters.size()));
		for (auto c : i.characters) t.u8(c);
	});
	writeTable(w, 7, info.pictureBox, [](ByteWriter &t, const PictureBoxEntry &i) {
		writeU16String(t, i.name);
		t.u16(static_cast<uint16_t>(i.pictureIds.size()));
		for (auto id : i.pictureIds) t.u16(id);
	});
	writeTable(w, 8, info.musicBox, [](ByteWriter &t, const MusicBoxEntry &i) {
		t.u16(i.bgmId);
		t.u16(i.nameIndex);
		t.u16(i.flags);
	});
	writeTable(w, 9, info.characterBox, [](ByteWriter &t, const CharacterBoxSegment &i) {
		t.u8(i.kind);
		t.u16(i.characterId);
		t.i16(i.x);
		t.i16(i.y);
	});
	writeTable(w, 10, info.characterSprites, [](ByteWriter &t, const CharacterSpriteSegment &i) {
		t.u16(i.characterId);
		t.u16(i.bustupId);
		t.u16(i.pictureId);
	});
	writeTable(w, 11, info.characterGrids, [](ByteWriter &t, const CharacterGrid &i) {
		t.u16(i.gridId);
		t.u8(static_cast<uint8_t>(i.segments.size()));
		for (auto s : i.segments) t.u16(s);
	});
	writeTable(w, 12, info.tips, [](ByteWriter &t, const TipsEntry &i) {
		t.u8(i.episode);
		t.u16(i.id);
		writeU16String(t, i.title);
		writeU16String(t, i.content);
	});

	w.patchU32(4 + 4 + 6 * 4, static_cast<uint32_t>(w.position()));
	w.bytes(code.data(), code.size());
	w.patchU32(4, static_cast<uint32_t>(w.position()));
	return w.take();
}
