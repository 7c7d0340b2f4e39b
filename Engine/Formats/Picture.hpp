/**
 *  Picture.hpp
 *  SNRScripter
 *
 *  PIC4 block-structured picture container.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Support/ByteStream.hpp"

#include <vector>
#include <cstdint>

// Rectangle inside a block, in block texels
struct PicRect {
	uint16_t fromX, fromY, toX, toY;
};

struct PictureBlock {
	// Position of the texel data inside the block's logical area
	uint32_t offsetX{0};
	uint32_t offsetY{0};
	uint32_t width{0};
	uint32_t height{0};
	std::vector<PicRect> opaqueRects;
	std::vector<PicRect> transparentRects;
	// Tightly packed RGBA8, width * height * 4 bytes
	std::vector<uint8_t> rgba;

	bool empty() const {
		return width == 0 && height == 0;
	}
};

struct PictureInfo {
	uint32_t effectiveWidth{0};
	uint32_t effectiveHeight{0};
	int32_t originX{0};
	int32_t originY{0};
	uint32_t pictureId{0};
};

// Receives every unique block exactly once together with all positions it is placed at.
class PictureBuilder {
public:
	virtual void begin(const PictureInfo &info)                                                          = 0;
	virtual void addBlock(uint32_t dataOffset, const std::vector<ushort2> &positions, PictureBlock &&block) = 0;
	virtual ~PictureBuilder()                                                                            = default;
};

// Decodes a single block. An empty span yields an empty block (bustups use them).
PictureBlock readPictureBlock(const uint8_t *data, size_t len);

void readPicture(const uint8_t *data, size_t len, PictureBuilder &builder);

// Composites all blocks into one RGBA canvas of the effective size
class MergedPictureBuilder : public PictureBuilder {
public:
	PictureInfo info;
	std::vector<uint8_t> rgba;

	void begin(const PictureInfo &i) override;
	void addBlock(uint32_t dataOffset, const std::vector<ushort2> &positions, PictureBlock &&block) override;
};

// Copies (or alpha-composites with overlay) a block onto an RGBA canvas at (x, y), clipping to the canvas
void blitPictureBlock(const PictureBlock &block, int32_t x, int32_t y, std::vector<uint8_t> &canvas,
                      uint32_t canvasWidth, uint32_t canvasHeight, bool overlay);
