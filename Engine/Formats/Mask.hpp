/**
 *  Mask.hpp
 *  SNRScripter
 *
 *  MSK4 transition masks: rectangle lists and an 8-bit texture.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"

#include <vector>
#include <cstdint>

struct MaskRect {
	uint16_t fromX, fromY, toX, toY;
};

struct MaskRegion {
	uint32_t rectCount{0};
	// Area in 4x4 blocks
	uint32_t area{0};
};

// Vertices of a range are consecutive in MaskTexture::vertices
struct MaskVertexRange {
	uint32_t first{0};
	uint32_t count{0};
};

struct MaskVertex {
	float2 position;
	float2 texCoord;
};

enum class MaskRegionType {
	Black,
	White,
	Transparent
};

struct MaskTexture {
	uint32_t id{0};
	uint32_t width{0};
	uint32_t height{0};
	// Tightly packed, width * height
	std::vector<uint8_t> texels;

	MaskRegion regions[3];
	std::vector<MaskRect> rects;
	// Two triangles per rectangle, black then white then transparent
	std::vector<MaskVertex> vertices;
	MaskVertexRange ranges[3];

	const MaskVertexRange &range(MaskRegionType type) const {
		return ranges[static_cast<int>(type)];
	}
};

MaskTexture readMask(const uint8_t *data, size_t len);
