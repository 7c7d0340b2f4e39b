/**
 *  ByteStream.hpp
 *  SNRScripter
 *
 *  Bounds-checked cursor over little-endian binary data and its writer counterpart.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Support/Errors.hpp"

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <cstring>

class ByteReader {
	const uint8_t *data{nullptr};
	size_t length{0};
	size_t pos{0};

	void need(size_t n) const {
		if (UNLIKELY(n > length || pos > length - n))
			throw ParseError(ParseError::Kind::TruncatedStream,
			                 "need " + std::to_string(n) + " bytes at " + std::to_string(pos) + " of " + std::to_string(length));
	}

public:
	ByteReader() = default;
	ByteReader(const uint8_t *d, size_t len, size_t start = 0)
	    : data(d), length(len), pos(start) {
		if (start > len)
			throw ParseError(ParseError::Kind::TruncatedStream, "offset " + std::to_string(start) + " past the end");
	}
	explicit ByteReader(const std::vector<uint8_t> &v, size_t start = 0)
	    : ByteReader(v.data(), v.size(), start) {}

	size_t position() const {
		return pos;
	}
	size_t size() const {
		return length;
	}
	size_t remaining() const {
		return length - pos;
	}
	bool eof() const {
		return pos >= length;
	}
	const uint8_t *base() const {
		return data;
	}
	const uint8_t *current() const {
		return data + pos;
	}

	void seek(size_t p) {
		if (p > length)
			throw ParseError(ParseError::Kind::TruncatedStream, "seek to " + std::to_string(p) + " past the end");
		pos = p;
	}
	void skip(size_t n) {
		need(n);
		pos += n;
	}
	void align(size_t a) {
		size_t p = (pos + a - 1) / a * a;
		seek(p < length ? p : length);
	}

	uint8_t u8() {
		need(1);
		return data[pos++];
	}
	int8_t i8() {
		return static_cast<int8_t>(u8());
	}
	uint16_t u16() {
		need(2);
		auto v = loadLE16(data + pos);
		pos += 2;
		return v;
	}
	int16_t i16() {
		return static_cast<int16_t>(u16());
	}
	uint16_t u16be() {
		need(2);
		auto v = loadBE16(data + pos);
		pos += 2;
		return v;
	}
	uint32_t u24() {
		need(3);
		uint32_t v = data[pos] | (data[pos + 1] << 8) | (data[pos + 2] << 16);
		pos += 3;
		return v;
	}
	uint32_t u32() {
		need(4);
		auto v = loadLE32(data + pos);
		pos += 4;
		return v;
	}
	int32_t i32() {
		return static_cast<int32_t>(u32());
	}
	float f32() {
		uint32_t v = u32();
		float f;
		std::memcpy(&f, &v, sizeof(f));
		return f;
	}
	const uint8_t *bytes(size_t n) {
		need(n);
		auto p = data + pos;
		pos += n;
		return p;
	}
	void read(uint8_t *dst, size_t n) {
		std::memcpy(dst, bytes(n), n);
	}
	// Reads a fixed-size field padded with zeroes
	std::string fixedString(size_t n) {
		auto p   = reinterpret_cast<const char *>(bytes(n));
		size_t l = 0;
		while (l < n && p[l]) l++;
		return std::string(p, l);
	}
	// Reads a NUL terminated byte string, the terminator is consumed
	std::string cString() {
		size_t start = pos;
		while (true) {
			need(1);
			if (data[pos++] == 0)
				break;
		}
		return std::string(reinterpret_cast<const char *>(data + start), pos - start - 1);
	}
	// A child reader over [pos, pos + n), the parent cursor is advanced
	ByteReader sub(size_t n) {
		auto p = bytes(n);
		return ByteReader(p, n);
	}
};

class ByteWriter {
	std::vector<uint8_t> out;

public:
	std::vector<uint8_t> &buffer() {
		return out;
	}
	const std::vector<uint8_t> &buffer() const {
		return out;
	}
	std::vector<uint8_t> take() {
		return std::move(out);
	}
	size_t position() const {
		return out.size();
	}

	void u8(uint8_t v) {
		out.push_back(v);
	}
	void i8(int8_t v) {
		u8(static_cast<uint8_t>(v));
	}
	void u16(uint16_t v) {
		out.push_back(v & 0xFF);
		out.push_back(v >> 8);
	}
	void i16(int16_t v) {
		u16(static_cast<uint16_t>(v));
	}
	void u16be(uint16_t v) {
		out.push_back(v >> 8);
		out.push_back(v & 0xFF);
	}
	void u24(uint32_t v) {
		out.push_back(v & 0xFF);
		out.push_back((v >> 8) & 0xFF);
		out.push_back((v >> 16) & 0xFF);
	}
	void u32(uint32_t v) {
		uint8_t tmp[4];
		storeLE32(tmp, v);
		out.insert(out.end(), tmp, tmp + 4);
	}
	void i32(int32_t v) {
		u32(static_cast<uint32_t>(v));
	}
	void f32(float f) {
		uint32_t v;
		std::memcpy(&v, &f, sizeof(v));
		u32(v);
	}
	void bytes(const uint8_t *p, size_t n) {
		out.insert(out.end(), p, p + n);
	}
	void bytes(const std::vector<uint8_t> &v) {
		out.insert(out.end(), v.begin(), v.end());
	}
	void zeroes(size_t n) {
		out.insert(out.end(), n, 0);
	}
	void align(size_t a) {
		while (out.size() % a) out.push_back(0);
	}
	void patchU32(size_t at, uint32_t v) {
		storeLE32(out.data() + at, v);
	}
	void patchU16(size_t at, uint16_t v) {
		out[at]     = v & 0xFF;
		out[at + 1] = v >> 8;
	}
};
