/**
 *  Picture.cpp
 *  SNRScripter
 *
 *  PIC4 block-structured picture container.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Formats/Picture.hpp"
#include "Engine/Formats/Lz77.hpp"
#include "Support/FileDefs.hpp"

#include <map>
#include <cstring>
#include <string>

namespace {
const uint32_t PIC_MAGIC          = 0x34434950; // "PIC4"
const uint16_t FLAG_INLINE_ALPHA  = 0x1;
const uint16_t FLAG_DICT_ENCODING = 0x2;
const size_t DICTIONARY_SIZE      = 0x400;

struct BlockHeader {
	uint16_t flags;
	uint16_t opaqueCount;
	uint16_t transparentCount;
	uint16_t paddingWords;
	uint16_t offsetX;
	uint16_t offsetY;
	uint16_t width;
	uint16_t height;
	uint16_t compressedSize;
	uint16_t unknown;
};

void decodeTexels(PictureBlock &block, const BlockHeader &hdr, ByteReader &r) {
	if (!(hdr.flags & FLAG_DICT_ENCODING))
		throw ParseError(ParseError::Kind::Unsupported, "differential picture blocks are not supported");

	bool inlineAlpha = hdr.flags & FLAG_INLINE_ALPHA;
	size_t stride    = (block.width + 3) & ~3u;
	size_t plane     = stride * block.height;
	size_t expected  = DICTIONARY_SIZE + plane * (inlineAlpha ? 1 : 2);

	std::vector<uint8_t> unpacked;
	const uint8_t *texels = nullptr;
	if (hdr.compressedSize != 0) {
		unpacked.reserve(expected);
		lz77Decompress(LZ77_PICTURE_OFFSET_BITS, r.bytes(hdr.compressedSize), hdr.compressedSize, unpacked);
		if (unpacked.size() != expected)
			throw ParseError(ParseError::Kind::BadLength, "picture block unpacked to " + std::to_string(unpacked.size()) +
			                                                  " bytes, expected " + std::to_string(expected));
		texels = unpacked.data();
	} else {
		texels = r.bytes(expected);
	}

	const uint8_t *dict    = texels;
	const uint8_t *indices = texels + DICTIONARY_SIZE;
	const uint8_t *alpha   = inlineAlpha ? nullptr : indices + plane;

	block.rgba.resize(static_cast<size_t>(block.width) * block.height * 4);
	uint8_t *dst = block.rgba.data();
	for (size_t y = 0; y < block.height; y++) {
		for (size_t x = 0; x < block.width; x++) {
			const uint8_t *entry = dict + indices[y * stride + x] * 4;
			dst[0]               = entry[0];
			dst[1]               = entry[1];
			dst[2]               = entry[2];
			dst[3]               = alpha ? alpha[y * stride + x] : entry[3];
			dst += 4;
		}
	}
}
} // namespace

PictureBlock readPictureBlock(const uint8_t *data, size_t len) {
	PictureBlock block;
	if (len == 0)
		return block;

	ByteReader r(data, len);
	BlockHeader hdr;
	hdr.flags            = r.u16();
	hdr.opaqueCount      = r.u16();
	hdr.transparentCount = r.u16();
	hdr.paddingWords     = r.u16();
	hdr.offsetX          = r.u16();
	hdr.offsetY          = r.u16();
	hdr.width            = r.u16();
	hdr.height           = r.u16();
	hdr.compressedSize   = r.u16();
	hdr.unknown          = r.u16();

	if (hdr.flags & ~(FLAG_INLINE_ALPHA | FLAG_DICT_ENCODING))
		throw ParseError(ParseError::Kind::InvalidByte, "invalid picture compression flags " + std::to_string(hdr.flags));

	auto readRects = [&r](size_t count, std::vector<PicRect> &out) {
		out.reserve(count);
		for (size_t i = 0; i < count; i++) {
			PicRect rect;
			rect.fromX = r.u16();
			rect.fromY = r.u16();
			rect.toX   = r.u16();
			rect.toY   = r.u16();
			out.push_back(rect);
		}
	};
	readRects(hdr.opaqueCount, block.opaqueRects);
	readRects(hdr.transparentCount, block.transparentRects);

	r.skip(hdr.paddingWords * 2);

	block.offsetX = hdr.offsetX;
	block.offsetY = hdr.offsetY;
	block.width   = hdr.width;
	block.height  = hdr.height;

	decodeTexels(block, hdr, r);
	return block;
}

void readPicture(const uint8_t *data, size_t len, PictureBuilder &builder) {
	ByteReader r(data, len);
	if (r.u32() != PIC_MAGIC)
		throw ParseError(ParseError::Kind::InvalidMagic, "not a PIC4 file");

	uint32_t version = r.u32();
	if (version != 3)
		throw ParseError(ParseError::Kind::Unsupported, "picture version " + std::to_string(version));
	if (r.u32() != len)
		throw ParseError(ParseError::Kind::BadLength, "picture file size mismatch");

	PictureInfo info;
	info.originX         = r.i16();
	info.originY         = r.i16();
	info.effectiveWidth  = r.u16();
	info.effectiveHeight = r.u16();
	uint32_t field20     = r.u32();
	uint32_t blockCount  = r.u32();
	info.pictureId       = r.u32();
	uint32_t field32     = r.u32();

	if (field20 > 1)
		throw ParseError(ParseError::Kind::Unsupported, "unknown picture field_20 value " + std::to_string(field20));
	if (field32 != 0x1000)
		throw ParseError(ParseError::Kind::Unsupported, "unknown picture field_32 value " + std::to_string(field32));

	// Identical blocks are stored once and referenced from several places
	struct Placement {
		uint32_t size;
		std::vector<ushort2> positions;
	};
	std::map<uint32_t, Placement> blocks;
	for (uint32_t i = 0; i < blockCount; i++) {
		ushort2 pos;
		pos.x           = r.u16();
		pos.y           = r.u16();
		uint32_t offset = r.u32();
		uint32_t size   = r.u32();
		if (offset > len || size > len - offset)
			throw ParseError(ParseError::Kind::TruncatedStream, "picture block outside of the file");
		auto &placement = blocks[offset];
		if (!placement.positions.empty() && placement.size != size)
			throw ParseError(ParseError::Kind::BadLength, "picture block size mismatch between references");
		placement.size = size;
		placement.positions.push_back(pos);
	}

	builder.begin(info);
	for (auto &b : blocks)
		builder.addBlock(b.first, b.second.positions, readPictureBlock(data + b.first, b.second.size));
}

void blitPictureBlock(const PictureBlock &block, int32_t x, int32_t y, std::vector<uint8_t> &canvas,
                      uint32_t canvasWidth, uint32_t canvasHeight, bool overlay) {
	x += block.offsetX;
	y += block.offsetY;
	for (uint32_t by = 0; by < block.height; by++) {
		int64_t cy = y + static_cast<int64_t>(by);
		if (cy < 0 || cy >= canvasHeight)
			continue;
		for (uint32_t bx = 0; bx < block.width; bx++) {
			int64_t cx = x + static_cast<int64_t>(bx);
			if (cx < 0 || cx >= canvasWidth)
				continue;
			const uint8_t *src = &block.rgba[(static_cast<size_t>(by) * block.width + bx) * 4];
			uint8_t *dst       = &canvas[(static_cast<size_t>(cy) * canvasWidth + cx) * 4];
			if (!overlay) {
				std::memcpy(dst, src, 4);
				continue;
			}
			// Straight alpha "over"
			float sa = src[3] / 255.0f;
			float da = dst[3] / 255.0f;
			float oa = sa + da * (1 - sa);
			for (int c = 0; c < 3; c++) {
				float v = oa > 0 ? (src[c] * sa + dst[c] * da * (1 - sa)) / oa : 0;
				dst[c]  = static_cast<uint8_t>(cmp::clamp(v + 0.5f, 0.0f, 255.0f));
			}
			dst[3] = static_cast<uint8_t>(cmp::clamp(oa * 255.0f + 0.5f, 0.0f, 255.0f));
		}
	}
}

void MergedPictureBuilder::begin(const PictureInfo &i) {
	info = i;
	rgba.assign(static_cast<size_t>(info.effectiveWidth) * info.effectiveHeight * 4, 0);
}

void MergedPictureBuilder::addBlock(uint32_t, const std::vector<ushort2> &positions, PictureBlock &&block) {
	for (auto &pos : positions)
		blitPictureBlock(block, pos.x, pos.y, rgba, info.effectiveWidth, info.effectiveHeight, false);
}
