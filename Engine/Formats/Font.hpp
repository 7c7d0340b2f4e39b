/**
 *  Font.hpp
 *  SNRScripter
 *
 *  FNT4 bitmap fonts with four mip levels per glyph.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"

#include <array>
#include <vector>
#include <cstdint>

const size_t GLYPH_MIP_LEVELS = 4;

struct GlyphInfo {
	// Pen position to the left of the bitmap
	int8_t bearingX{0};
	// Baseline to the top of the bitmap
	int8_t bearingY{0};
	uint8_t advanceWidth{0};
	// Bitmap size without padding
	uint8_t actualWidth{0};
	uint8_t actualHeight{0};
	// Padded texture size, a power of two
	uint8_t textureWidth{0};
	uint8_t textureHeight{0};
};

struct Glyph {
	GlyphInfo info;
	// Level i is (textureWidth >> i) x (textureHeight >> i) coverage values
	std::array<std::vector<uint8_t>, GLYPH_MIP_LEVELS> mips;

	uint32_t mipWidth(size_t level) const {
		return info.textureWidth >> level;
	}
	uint32_t mipHeight(size_t level) const {
		return info.textureHeight >> level;
	}
};

// Glyph data that is only unpacked on demand, most glyphs are never shown
class LazyGlyph {
	GlyphInfo glyphInfo;
	bool compressed{false};
	std::vector<uint8_t> payload;

public:
	LazyGlyph(const GlyphInfo &info, bool isCompressed, std::vector<uint8_t> &&data)
	    : glyphInfo(info), compressed(isCompressed), payload(std::move(data)) {}

	const GlyphInfo &info() const {
		return glyphInfo;
	}
	Glyph decompress() const;
};

class Font {
	uint16_t fontAscent{0};
	uint16_t fontDescent{0};
	// Dense glyph id per BMP code point
	std::vector<uint32_t> characters;
	std::vector<LazyGlyph> glyphs;

	friend Font readFont(const uint8_t *data, size_t len);

public:
	static const char32_t REPLACEMENT_CHARACTER = 0x30FB;

	uint16_t ascent() const {
		return fontAscent;
	}
	uint16_t descent() const {
		return fontDescent;
	}
	uint16_t lineHeight() const {
		return fontAscent + fontDescent;
	}
	size_t glyphCount() const {
		return glyphs.size();
	}

	// Code points outside of the table resolve to the replacement glyph
	uint32_t glyphId(char32_t codepoint) const;
	const LazyGlyph &glyph(uint32_t id) const {
		return glyphs.at(id);
	}
	const LazyGlyph &glyphFor(char32_t codepoint) const {
		return glyphs[glyphId(codepoint)];
	}
};

Font readFont(const uint8_t *data, size_t len);
