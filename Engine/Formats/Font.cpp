/**
 *  Font.cpp
 *  SNRScripter
 *
 *  FNT4 bitmap fonts with four mip levels per glyph.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Formats/Font.hpp"
#include "Engine/Formats/Lz77.hpp"
#include "Support/ByteStream.hpp"

#include <unordered_map>
#include <string>

namespace {
const uint32_t FNT_MAGIC      = 0x34544E46; // "FNT4"
const size_t CHARACTER_COUNT  = 0x10000;

size_t mipChainSize(const GlyphInfo &info) {
	size_t total = 0;
	for (size_t level = 0; level < GLYPH_MIP_LEVELS; level++)
		total += static_cast<size_t>(info.textureWidth >> level) * (info.textureHeight >> level);
	return total;
}

LazyGlyph readGlyph(ByteReader &r) {
	GlyphInfo info;
	info.bearingX      = r.i8();
	info.bearingY      = r.i8();
	info.actualWidth   = r.u8();
	info.actualHeight  = r.u8();
	info.advanceWidth  = r.u8();
	uint8_t unused     = r.u8();
	info.textureWidth  = r.u8();
	info.textureHeight = r.u8();
	uint16_t packed    = r.u16();

	if (unused != 0)
		throw ParseError(ParseError::Kind::InvalidByte, "glyph header reserved byte is " + std::to_string(unused));

	size_t size = packed ? packed : mipChainSize(info);
	auto bytes  = r.bytes(size);
	return LazyGlyph(info, packed != 0, std::vector<uint8_t>(bytes, bytes + size));
}
} // namespace

Glyph LazyGlyph::decompress() const {
	std::vector<uint8_t> unpacked;
	const std::vector<uint8_t> *src = &payload;
	if (compressed) {
		lz77Decompress(LZ77_FONT_OFFSET_BITS, payload.data(), payload.size(), unpacked);
		src = &unpacked;
	}

	if (src->size() < mipChainSize(glyphInfo))
		throw ParseError(ParseError::Kind::TruncatedStream, "glyph data is shorter than its mip chain");

	Glyph glyph;
	glyph.info = glyphInfo;
	auto cursor = src->begin();
	for (size_t level = 0; level < GLYPH_MIP_LEVELS; level++) {
		size_t size = static_cast<size_t>(glyph.mipWidth(level)) * glyph.mipHeight(level);
		glyph.mips[level].assign(cursor, cursor + size);
		cursor += size;
	}
	return glyph;
}

uint32_t Font::glyphId(char32_t codepoint) const {
	if (codepoint >= CHARACTER_COUNT)
		codepoint = REPLACEMENT_CHARACTER;
	return characters[codepoint];
}

Font readFont(const uint8_t *data, size_t len) {
	ByteReader r(data, len);
	if (r.u32() != FNT_MAGIC)
		throw ParseError(ParseError::Kind::InvalidMagic, "not a FNT4 file");
	uint32_t version = r.u32();
	if (version != 1)
		throw ParseError(ParseError::Kind::Unsupported, "font version " + std::to_string(version));
	if (r.u32() != len)
		throw ParseError(ParseError::Kind::BadLength, "font size in header does not match the data");

	Font font;
	font.fontAscent  = r.u16();
	font.fontDescent = r.u16();

	std::vector<uint32_t> offsets(CHARACTER_COUNT);
	for (auto &offset : offsets) offset = r.u32();

	// Many code points share a glyph, ids are assigned in order of first use
	std::unordered_map<uint32_t, uint32_t> known;
	font.characters.resize(CHARACTER_COUNT);
	for (size_t c = 0; c < CHARACTER_COUNT; c++) {
		auto it = known.find(offsets[c]);
		if (it != known.end()) {
			font.characters[c] = it->second;
			continue;
		}

		uint32_t id = static_cast<uint32_t>(font.glyphs.size());
		ByteReader glyphReader(data, len, offsets[c]);
		font.glyphs.push_back(readGlyph(glyphReader));
		known.emplace(offsets[c], id);
		font.characters[c] = id;
	}

	return font;
}
