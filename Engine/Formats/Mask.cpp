/**
 *  Mask.cpp
 *  SNRScripter
 *
 *  MSK4 transition masks: rectangle lists and an 8-bit texture.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Formats/Mask.hpp"
#include "Engine/Formats/Lz77.hpp"
#include "Support/ByteStream.hpp"

#include <string>

#include <cstring>

namespace {
const uint32_t MSK_MAGIC = 0x344B534D; // "MSK4"

void readTexels(ByteReader r, MaskTexture &mask) {
	uint32_t compressedSize = r.u32();
	size_t stride           = (mask.width + 0xF) & ~0xFu;
	size_t expected         = stride * mask.height;

	std::vector<uint8_t> unpacked;
	const uint8_t *src;
	if (compressedSize != 0) {
		unpacked.reserve(expected);
		lz77Decompress(LZ77_PICTURE_OFFSET_BITS, r.bytes(compressedSize), compressedSize, unpacked);
		if (unpacked.size() != expected)
			throw ParseError(ParseError::Kind::BadLength, "mask texels unpacked to " + std::to_string(unpacked.size()) +
			                                                  " bytes, expected " + std::to_string(expected));
		src = unpacked.data();
	} else {
		if (r.remaining() != expected)
			throw ParseError(ParseError::Kind::BadLength, "raw mask texel size mismatch");
		src = r.bytes(expected);
	}

	mask.texels.resize(static_cast<size_t>(mask.width) * mask.height);
	for (size_t y = 0; y < mask.height; y++)
		std::memcpy(&mask.texels[y * mask.width], src + y * stride, mask.width);
}

void readRegions(ByteReader r, MaskTexture &mask) {
	uint32_t total = 0;
	for (auto &region : mask.regions) {
		region.rectCount = r.u32();
		region.area      = r.u32();
		total += region.rectCount;
	}

	mask.rects.reserve(total);
	for (uint32_t i = 0; i < total; i++) {
		MaskRect rect;
		rect.fromX = r.u16();
		rect.fromY = r.u16();
		rect.toX   = r.u16();
		rect.toY   = r.u16();
		mask.rects.push_back(rect);
	}
}

void buildVertices(MaskTexture &mask) {
	float w = mask.width ? static_cast<float>(mask.width) : 1.0f;
	float h = mask.height ? static_cast<float>(mask.height) : 1.0f;

	auto vertex = [w, h](uint16_t x, uint16_t y) {
		MaskVertex v;
		v.position = {static_cast<float>(x), static_cast<float>(y)};
		v.texCoord = {x / w, y / h};
		return v;
	};

	mask.vertices.reserve(mask.rects.size() * 6);
	size_t rect = 0;
	for (int i = 0; i < 3; i++) {
		mask.ranges[i].first = static_cast<uint32_t>(mask.vertices.size());
		for (uint32_t n = 0; n < mask.regions[i].rectCount; n++, rect++) {
			auto &r = mask.rects[rect];
			mask.vertices.push_back(vertex(r.fromX, r.fromY));
			mask.vertices.push_back(vertex(r.toX, r.fromY));
			mask.vertices.push_back(vertex(r.fromX, r.toY));
			mask.vertices.push_back(vertex(r.toX, r.fromY));
			mask.vertices.push_back(vertex(r.toX, r.toY));
			mask.vertices.push_back(vertex(r.fromX, r.toY));
		}
		mask.ranges[i].count = static_cast<uint32_t>(mask.vertices.size()) - mask.ranges[i].first;
	}
}
} // namespace

MaskTexture readMask(const uint8_t *data, size_t len) {
	ByteReader r(data, len);
	if (r.u32() != MSK_MAGIC)
		throw ParseError(ParseError::Kind::InvalidMagic, "not a MSK4 file");
	uint32_t version = r.u32();
	if (version != 1)
		throw ParseError(ParseError::Kind::Unsupported, "mask version " + std::to_string(version));
	if (r.u32() != len)
		throw ParseError(ParseError::Kind::BadLength, "mask file size mismatch");

	MaskTexture mask;
	mask.id                 = r.u32();
	mask.width              = r.u16();
	mask.height             = r.u16();
	uint32_t dataOffset     = r.u32();
	uint32_t dataSize       = r.u32();
	uint32_t verticesOffset = r.u32();
	uint32_t verticesSize   = r.u32();

	if (dataOffset > len || dataSize > len - dataOffset || verticesOffset > len || verticesSize > len - verticesOffset)
		throw ParseError(ParseError::Kind::TruncatedStream, "mask section outside of the file");

	readRegions(ByteReader(data + verticesOffset, verticesSize), mask);
	readTexels(ByteReader(data + dataOffset, dataSize), mask);
	buildVertices(mask);

	return mask;
}
