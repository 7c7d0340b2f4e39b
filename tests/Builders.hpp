/**
 *  Builders.hpp
 *  SNRScripter
 *
 *  Writers for hand-made scenarios, pictures, bustups, masks, fonts and archives.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Formats/Scenario.hpp"
#include "Support/ByteStream.hpp"

#include <algorithm>
#include <array>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <cstdint>

namespace TestData {

inline Register v(uint16_t index) {
	return Register::regular(index);
}

inline Register a(uint16_t index) {
	return Register::argument(index);
}

inline NumberSpec n(int32_t value) {
	return NumberSpec::literal(value);
}

inline NumberSpec r(Register reg) {
	return NumberSpec::of(reg);
}

// Writes instructions at their final addresses. Labels resolve to the addresses
// recorded by the previous pass, see assemble().
class Assembler {
	CodeAddress base;
	const std::map<std::string, CodeAddress> &known;
	std::map<std::string, CodeAddress> defined;
	ByteWriter code;

public:
	Assembler(CodeAddress b, const std::map<std::string, CodeAddress> &k)
	    : base(b), known(k) {}

	CodeAddress here() const {
		return base + static_cast<CodeAddress>(code.position());
	}
	void label(const std::string &name) {
		defined[name] = here();
	}
	CodeAddress at(const std::string &name) const {
		auto it = known.find(name);
		return it == known.end() ? base : it->second;
	}

	Assembler &operator<<(const Instruction &ins) {
		ins.write(code);
		return *this;
	}
	Assembler &cmd(uint8_t opcode, std::vector<CommandArg> args = {}) {
		return *this << Ins::command(makeCommand(opcode, std::move(args)));
	}

	const std::map<std::string, CodeAddress> &labels() const {
		return defined;
	}
	std::vector<uint8_t> take() {
		return code.take();
	}
};

// Instruction sizes never depend on jump targets, so two passes resolve every label
inline std::shared_ptr<const Scenario> assemble(const std::function<void(Assembler &)> &body,
                                                const ScenarioInfo &info = {}) {
	auto base = static_cast<CodeAddress>(Scenario::build({}, info).size());

	std::map<std::string, CodeAddress> none;
	Assembler first(base, none);
	body(first);
	auto labels = first.labels();

	Assembler second(base, labels);
	body(second);
	return std::make_shared<const Scenario>(Scenario::build(second.take(), info));
}

using Rgba = std::array<uint8_t, 4>;

struct BlockRect {
	uint16_t fromX, fromY, toX, toY;
};

// A dictionary encoded block of a single colour, stored without compression
inline std::vector<uint8_t> pictureBlock(uint16_t width, uint16_t height, Rgba color, uint16_t offsetX = 0,
                                         uint16_t offsetY = 0, std::vector<BlockRect> opaque = {}) {
	ByteWriter w;
	w.u16(0x3); // dictionary, inline alpha
	w.u16(static_cast<uint16_t>(opaque.size()));
	w.u16(0);
	w.u16(0);
	w.u16(offsetX);
	w.u16(offsetY);
	w.u16(width);
	w.u16(height);
	w.u16(0);
	w.u16(0);
	for (auto &rect : opaque) {
		w.u16(rect.fromX);
		w.u16(rect.fromY);
		w.u16(rect.toX);
		w.u16(rect.toY);
	}

	std::vector<uint8_t> dictionary(0x400, 0);
	std::copy(color.begin(), color.end(), dictionary.begin());
	w.bytes(dictionary);
	size_t stride = (width + 3) & ~3u;
	w.zeroes(stride * height);
	return w.take();
}

struct PictureSpec {
	int16_t originX{0};
	int16_t originY{0};
	uint16_t width{0};
	uint16_t height{0};
	uint32_t pictureId{0};
	std::vector<std::vector<uint8_t>> blocks;

	struct Placement {
		uint16_t x, y;
		size_t block;
	};
	std::vector<Placement> placements;
};

inline std::vector<uint8_t> picture(const PictureSpec &spec) {
	const size_t headerSize = 36 + spec.placements.size() * 12;
	std::vector<uint32_t> offsets;
	uint32_t cursor = static_cast<uint32_t>(headerSize);
	for (auto &b : spec.blocks) {
		offsets.push_back(cursor);
		cursor += static_cast<uint32_t>(b.size());
	}

	ByteWriter w;
	w.u32(0x34434950);
	w.u32(3);
	w.u32(cursor);
	w.i16(spec.originX);
	w.i16(spec.originY);
	w.u16(spec.width);
	w.u16(spec.height);
	w.u32(0);
	w.u32(static_cast<uint32_t>(spec.placements.size()));
	w.u32(spec.pictureId);
	w.u32(0x1000);
	for (auto &p : spec.placements) {
		w.u16(p.x);
		w.u16(p.y);
		w.u32(offsets.at(p.block));
		w.u32(static_cast<uint32_t>(spec.blocks.at(p.block).size()));
	}
	for (auto &b : spec.blocks) w.bytes(b);
	return w.take();
}

// One block covering the whole picture
inline std::vector<uint8_t> solidPicture(uint16_t width, uint16_t height, Rgba color) {
	PictureSpec spec;
	spec.width  = width;
	spec.height = height;
	spec.blocks.push_back(pictureBlock(width, height, color));
	spec.placements.push_back({0, 0, 0});
	return picture(spec);
}

struct BustupSpec {
	uint16_t width{0};
	uint16_t height{0};
	uint32_t bustupId{0};
	std::vector<std::vector<uint8_t>> blocks;
	std::vector<size_t> base;

	// Block indices, -1 for an absent face or an empty frame
	struct Expression {
		std::string name;
		int face1{-1};
		int face2{-1};
		std::vector<int> mouths;
		std::vector<int> eyes;
	};
	std::vector<Expression> expressions;
};

inline std::vector<uint8_t> bustup(const BustupSpec &spec) {
	auto header = [&spec](const std::vector<uint32_t> &offsets, uint32_t total) {
		ByteWriter w;
		auto promise = [&](int block) {
			w.u32(block < 0 ? 0 : offsets.at(block));
			w.u32(block < 0 ? 0 : static_cast<uint32_t>(spec.blocks.at(block).size()));
		};
		w.u32(0x34505542);
		w.u32(1);
		w.u32(total);
		w.i16(0);
		w.i16(0);
		w.u16(spec.width);
		w.u16(spec.height);
		w.u32(spec.bustupId);
		w.u32(static_cast<uint32_t>(spec.base.size()));
		w.u32(static_cast<uint32_t>(spec.expressions.size()));
		for (auto b : spec.base) promise(static_cast<int>(b));
		for (auto &e : spec.expressions) {
			w.u16(static_cast<uint16_t>(e.name.size() + 1));
			w.bytes(reinterpret_cast<const uint8_t *>(e.name.data()), e.name.size());
			w.u8(0);
			promise(e.face1);
			promise(e.face2);
			w.u16(static_cast<uint16_t>(e.mouths.size()));
			for (auto m : e.mouths) promise(m);
			w.u16(static_cast<uint16_t>(e.eyes.size()));
			for (auto eye : e.eyes) promise(eye);
		}
		return w.take();
	};

	std::vector<uint32_t> placeholder(spec.blocks.size(), 0);
	size_t headerSize = header(placeholder, 0).size();

	std::vector<uint32_t> offsets;
	uint32_t cursor = static_cast<uint32_t>(headerSize);
	for (auto &b : spec.blocks) {
		offsets.push_back(cursor);
		cursor += static_cast<uint32_t>(b.size());
	}

	auto out = header(offsets, cursor);
	for (auto &b : spec.blocks) out.insert(out.end(), b.begin(), b.end());
	return out;
}

struct MaskSpec {
	uint32_t id{0};
	uint16_t width{0};
	uint16_t height{0};
	std::vector<uint8_t> texels;
	// Black, white and transparent rectangles
	std::array<std::vector<BlockRect>, 3> regions;
};

inline std::vector<uint8_t> mask(const MaskSpec &spec) {
	ByteWriter vertices;
	for (auto &region : spec.regions) {
		vertices.u32(static_cast<uint32_t>(region.size()));
		uint32_t area = 0;
		for (auto &rect : region) area += (rect.toX - rect.fromX) * (rect.toY - rect.fromY) / 16;
		vertices.u32(area);
	}
	for (auto &region : spec.regions)
		for (auto &rect : region) {
			vertices.u16(rect.fromX);
			vertices.u16(rect.fromY);
			vertices.u16(rect.toX);
			vertices.u16(rect.toY);
		}

	ByteWriter data;
	data.u32(0);
	size_t stride = (spec.width + 0xF) & ~0xFu;
	for (size_t y = 0; y < spec.height; y++) {
		data.bytes(spec.texels.data() + y * spec.width, spec.width);
		data.zeroes(stride - spec.width);
	}

	auto vertexBytes = vertices.take();
	auto dataBytes   = data.take();
	const uint32_t headerSize = 36;

	ByteWriter w;
	w.u32(0x344B534D);
	w.u32(1);
	w.u32(static_cast<uint32_t>(headerSize + vertexBytes.size() + dataBytes.size()));
	w.u32(spec.id);
	w.u16(spec.width);
	w.u16(spec.height);
	w.u32(static_cast<uint32_t>(headerSize + vertexBytes.size()));
	w.u32(static_cast<uint32_t>(dataBytes.size()));
	w.u32(headerSize);
	w.u32(static_cast<uint32_t>(vertexBytes.size()));
	w.bytes(vertexBytes);
	w.bytes(dataBytes);
	return w.take();
}

struct GlyphSpec {
	int8_t bearingX{0};
	int8_t bearingY{20};
	uint8_t width{8};
	uint8_t height{8};
	uint8_t advance{10};
	uint8_t coverage{0xFF};
};

// Every code point without an entry of its own shows the fallback glyph
inline std::vector<uint8_t> font(uint16_t ascent, uint16_t descent, const GlyphSpec &fallback,
                                 const std::map<char32_t, GlyphSpec> &glyphs = {}) {
	const size_t characters = 0x10000;
	const size_t headerSize = 16 + characters * 4;

	ByteWriter body;
	auto glyph = [&body](const GlyphSpec &g) {
		uint32_t at = static_cast<uint32_t>(body.position());
		body.i8(g.bearingX);
		body.i8(g.bearingY);
		body.u8(g.width);
		body.u8(g.height);
		body.u8(g.advance);
		body.u8(0);
		body.u8(8);
		body.u8(8);
		body.u16(0);
		for (size_t level = 0; level < 4; level++) {
			size_t side = 8 >> level;
			std::vector<uint8_t> mip(side * side, g.coverage);
			body.bytes(mip);
		}
		return at;
	};

	uint32_t fallbackAt = glyph(fallback);
	std::map<char32_t, uint32_t> at;
	for (auto &g : glyphs) at[g.first] = glyph(g.second);

	ByteWriter w;
	w.u32(0x34544E46);
	w.u32(1);
	w.u32(static_cast<uint32_t>(headerSize + body.position()));
	w.u16(ascent);
	w.u16(descent);
	for (size_t c = 0; c < characters; c++) {
		auto it = at.find(static_cast<char32_t>(c));
		w.u32(static_cast<uint32_t>(headerSize) + (it == at.end() ? fallbackAt : it->second));
	}
	w.bytes(body.buffer());
	return w.take();
}

// ADP1 sound of silent mono blocks
inline std::vector<uint8_t> adpcmSound(uint16_t sampleRate, uint32_t blocks) {
	ByteWriter w;
	w.u32(0x31504441);
	w.u32(static_cast<uint32_t>(20 + blocks * 16));
	w.u16(1);
	w.u16(sampleRate);
	w.u32(blocks * 30);
	w.zeroes(blocks * 16);
	return w.take();
}

inline std::vector<uint8_t> sysSeBank(const std::vector<std::pair<std::string, std::vector<uint8_t>>> &sounds) {
	uint32_t cursor = static_cast<uint32_t>(12 + sounds.size() * 24);
	ByteWriter w;
	w.u32(0x45535953);
	w.u32(0);
	w.u32(static_cast<uint32_t>(sounds.size()));
	for (auto &s : sounds) {
		std::vector<uint8_t> name(16, 0);
		std::copy(s.first.begin(), s.first.begin() + std::min<size_t>(15, s.first.size()), name.begin());
		w.bytes(name);
		w.u32(cursor);
		w.u32(static_cast<uint32_t>(s.second.size()));
		cursor += static_cast<uint32_t>(s.second.size());
	}
	for (auto &s : sounds) w.bytes(s.second);
	w.patchU32(4, static_cast<uint32_t>(w.position()));
	return w.take();
}

// ROM2 archive, paths are relative to the root ("bg/sky.pic")
inline std::vector<uint8_t> rom(const std::map<std::string, std::vector<uint8_t>> &files) {
	struct Dir {
		std::map<std::string, size_t> dirs;
		std::map<std::string, const std::vector<uint8_t> *> files;
		uint32_t offset{0};
	};
	std::vector<Dir> dirs(1);
	for (auto &f : files) {
		size_t current = 0;
		size_t start   = 0;
		while (true) {
			size_t slash = f.first.find('/', start);
			if (slash == std::string::npos) {
				dirs[current].files[f.first.substr(start)] = &f.second;
				break;
			}
			auto part = f.first.substr(start, slash - start);
			auto it   = dirs[current].dirs.find(part);
			if (it == dirs[current].dirs.end()) {
				size_t id = dirs.size();
				dirs.emplace_back();
				dirs[current].dirs[part] = id;
				current = id;
			} else {
				current = it->second;
			}
			start = slash + 1;
		}
	}

	const uint32_t headerSize = 32;
	const uint32_t multiplier = 16;
	auto align = [](uint32_t v) { return (v + 15) & ~15u; };
	auto dirSize = [](const Dir &d) {
		uint32_t size = 4 + 12 * static_cast<uint32_t>(d.dirs.size() + d.files.size());
		for (auto &e : d.dirs) size += static_cast<uint32_t>(e.first.size()) + 1;
		for (auto &e : d.files) size += static_cast<uint32_t>(e.first.size()) + 1;
		return size;
	};

	uint32_t cursor = headerSize;
	for (auto &d : dirs) {
		d.offset = cursor;
		cursor   = align(cursor + dirSize(d));
	}

	std::map<const std::vector<uint8_t> *, uint32_t> dataAt;
	for (auto &d : dirs)
		for (auto &f : d.files) {
			dataAt[f.second] = cursor;
			cursor           = align(cursor + static_cast<uint32_t>(f.second->size()));
		}

	std::vector<uint8_t> out(cursor, 0);
	auto put = [&out](uint32_t at, uint32_t value) { storeLE32(out.data() + at, value); };
	put(0, 0x324D4F52);
	put(4, 0x10001);
	put(12, multiplier);

	for (auto &d : dirs) {
		uint32_t count = static_cast<uint32_t>(d.dirs.size() + d.files.size());
		put(d.offset, count);
		uint32_t entry = d.offset + 4;
		uint32_t name  = 4 + 12 * count;
		auto writeName = [&](const std::string &s) {
			std::copy(s.begin(), s.end(), out.begin() + d.offset + name);
			uint32_t at = name;
			name += static_cast<uint32_t>(s.size()) + 1;
			return at;
		};
		for (auto &sub : d.dirs) {
			put(entry, writeName(sub.first) | 0x80000000u);
			put(entry + 4, (dirs[sub.second].offset - headerSize) / 16);
			put(entry + 8, 0);
			entry += 12;
		}
		for (auto &f : d.files) {
			put(entry, writeName(f.first));
			put(entry + 4, dataAt[f.second] / multiplier);
			put(entry + 8, static_cast<uint32_t>(f.second->size()));
			std::copy(f.second->begin(), f.second->end(), out.begin() + dataAt[f.second]);
			entry += 12;
		}
	}
	return out;
}

} // namespace TestData
