/**
 *  Lz77.hpp
 *  SNRScripter
 *
 *  LZ77 variant shared by the picture, mask and font containers.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"

#include <vector>
#include <cstdint>
#include <cstddef>

const unsigned LZ77_PICTURE_OFFSET_BITS = 12;
const unsigned LZ77_FONT_OFFSET_BITS    = 10;

// Each map byte is read LSB first, a set bit is a big-endian back reference
// of (length - 3) << offsetBits | (distance - 1). Output is appended.
// Throws ParseError on references before the start of the output.
void lz77Decompress(unsigned offsetBits, const uint8_t *input, size_t len, std::vector<uint8_t> &output);
