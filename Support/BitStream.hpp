/**
 *  BitStream.hpp
 *  SNRScripter
 *
 *  MSB-first bit packing used by the save file.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Support/Errors.hpp"

#include <vector>
#include <cstdint>

class BitReader {
	const std::vector<uint8_t> &data;
	size_t bitpos{0};

public:
	explicit BitReader(const std::vector<uint8_t> &d)
	    : data(d) {}

	uint32_t read(unsigned bits) {
		if (bits > 32)
			throw ParseError(ParseError::Kind::BadLength, "bit field wider than 32");
		if (bitpos + bits > data.size() * 8)
			throw ParseError(ParseError::Kind::TruncatedStream, "bit stream ended at bit " + std::to_string(bitpos));
		uint32_t v = 0;
		for (unsigned i = 0; i < bits; i++, bitpos++) {
			uint8_t byte = data[bitpos >> 3];
			v            = (v << 1) | ((byte >> (7 - (bitpos & 7))) & 1);
		}
		return v;
	}
	bool readBool() {
		return read(1) != 0;
	}
	void align() {
		bitpos = (bitpos + 7) & ~static_cast<size_t>(7);
	}
	size_t position() const {
		return bitpos;
	}
};

class BitWriter {
	std::vector<uint8_t> data;
	size_t bitpos{0};

public:
	void write(uint32_t v, unsigned bits) {
		for (unsigned i = bits; i > 0; i--, bitpos++) {
			if ((bitpos >> 3) >= data.size())
				data.push_back(0);
			if ((v >> (i - 1)) & 1)
				data[bitpos >> 3] |= 0x80 >> (bitpos & 7);
		}
	}
	void writeBool(bool v) {
		write(v ? 1 : 0, 1);
	}
	void align() {
		bitpos = (bitpos + 7) & ~static_cast<size_t>(7);
		data.resize(bitpos >> 3);
	}
	std::vector<uint8_t> take() {
		align();
		return std::move(data);
	}
};
