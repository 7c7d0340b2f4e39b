/**
 *  Lz77.cpp
 *  SNRScripter
 *
 *  LZ77 variant shared by the picture, mask and font containers.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Formats/Lz77.hpp"
#include "Support/Errors.hpp"

void lz77Decompress(unsigned offsetBits, const uint8_t *input, size_t len, std::vector<uint8_t> &output) {
	const uint16_t mask = (1u << offsetBits) - 1;
	size_t base         = output.size();
	size_t pos          = 0;

	while (pos < len) {
		uint8_t map = input[pos++];
		for (unsigned i = 0; i < 8 && pos < len; i++) {
			if (((map >> i) & 1) == 0) {
				output.push_back(input[pos++]);
				continue;
			}

			if (pos + 2 > len)
				throw ParseError(ParseError::Kind::TruncatedStream, "lz77 back reference cut off");
			uint16_t spec = loadBE16(input + pos);
			pos += 2;

			size_t count = (spec >> offsetBits) + 3;
			size_t back  = (spec & mask) + 1;
			if (back > output.size() - base)
				throw ParseError(ParseError::Kind::InvalidByte, "lz77 back reference before the start of data");

			// Overlapping copies are allowed, go byte by byte
			for (size_t n = 0; n < count; n++) output.push_back(output[output.size() - back]);
		}
	}
}
