/**
 *  Text.cpp
 *  SNRScripter
 *
 *  Shift-JIS variant used by the scenario and its string containers.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Formats/Text.hpp"
#include "Engine/Formats/SJISTables.hpp"
#include "Support/Unicode.hpp"

#include <algorithm>
#include <unordered_map>
#include <cstdio>

static bool isLeadByte(uint8_t c) {
	return (c >= 0x81 && c <= 0x9F) || (c >= 0xE0 && c <= 0xFC);
}

static char32_t decodeSingle(uint8_t c) {
	if (c < 0x20)
		return c;
	if (c < 0x80)
		return SJIS_ASCII_TABLE[c - 0x20];
	if (c >= 0xA0 && c < 0xE0)
		return SJIS_KATAKANA_TABLE[c - 0xA0];
	return 0;
}

static char32_t decodeDouble(uint8_t first, uint8_t second) {
	// A lead byte spans two JIS rows, so the column is in [0; 188)
	size_t column;
	if (second >= 0x40 && second <= 0x7E)
		column = second - 0x40;
	else if (second >= 0x80 && second <= 0xFC)
		column = second - 0x41;
	else
		return 0;

	size_t row;
	if (first >= 0x81 && first <= 0xA0)
		row = (first - 0x81) * 2;
	else if (first >= 0xE0 && first <= 0xFC)
		row = (first - 0xE0) * 2 + 62;
	else
		return 0;

	return SJIS_JIS_TABLE[row * 94 + column];
}

char32_t decodeSJISChar(uint16_t sjis) {
	if (sjis < 0x100)
		return decodeSingle(static_cast<uint8_t>(sjis));
	return decodeDouble(sjis >> 8, sjis & 0xFF);
}

uint16_t encodeSJISChar(char32_t cp) {
	if (cp < 0x20)
		return static_cast<uint16_t>(cp);
	if (cp >= 0x10000)
		return 0;

	auto begin = SJIS_REVERSE + SJIS_REVERSE_BUCKETS[cp >> 8];
	auto end   = SJIS_REVERSE + SJIS_REVERSE_BUCKETS[(cp >> 8) + 1];
	auto it    = std::lower_bound(begin, end, cp, [](const SJISReverseEntry &e, char32_t v) {
		   return e.codepoint < v;
	   });
	if (it == end || it->codepoint != cp)
		return 0;
	return it->sjis;
}

std::string decodeSJISString(const uint8_t *data, size_t len, size_t *consumed) {
	std::string result;
	result.reserve(len);

	size_t pos = 0;
	while (pos < len) {
		uint8_t c1 = data[pos++];
		if (c1 == 0)
			break;

		char32_t cp;
		if (isLeadByte(c1)) {
			if (pos >= len)
				throw ParseError(ParseError::Kind::TruncatedStream, "unexpected end of string when reading double-byte char");
			uint8_t c2 = data[pos++];
			cp         = decodeDouble(c1, c2);
			if (cp == 0) {
				char buf[64];
				std::snprintf(buf, sizeof(buf), "invalid double-byte char 0x%02x 0x%02x", c1, c2);
				throw ParseError(ParseError::Kind::InvalidByte, buf);
			}
		} else {
			cp = decodeSingle(c1);
			if (cp == 0) {
				char buf[64];
				std::snprintf(buf, sizeof(buf), "invalid single-byte char 0x%02x", c1);
				throw ParseError(ParseError::Kind::InvalidByte, buf);
			}
		}
		appendUTF8(result, cp);
	}

	if (consumed)
		*consumed = pos;
	return result;
}

static uint16_t encodeOrThrow(char32_t cp) {
	uint16_t code = encodeSJISChar(cp);
	if (code == 0 && cp != 0) {
		char buf[64];
		std::snprintf(buf, sizeof(buf), "no Shift-JIS encoding for U+%04X", static_cast<unsigned>(cp));
		throw ParseError(ParseError::Kind::UnmappableText, buf);
	}
	return code;
}

size_t measureSJISString(const std::string &utf8) {
	size_t total = 0;
	for (auto cp : decodeUTF8String(utf8)) total += encodeOrThrow(cp) >= 0x100 ? 2 : 1;
	return total;
}

void writeSJISString(const std::string &utf8, std::vector<uint8_t> &out) {
	for (auto cp : decodeUTF8String(utf8)) {
		uint16_t code = encodeOrThrow(cp);
		if (code >= 0x100)
			out.push_back(code >> 8);
		out.push_back(code & 0xFF);
	}
}

static const std::u32string FIXUP_ENCODED = U"｢｣ｧｨｩｪｫｬｭｮｱｲｳｴｵｶｷｸｹｺｻｼｽｾｿﾀﾁﾂﾃﾄﾅﾆﾇﾈﾉﾊﾋﾌﾍﾎﾏﾐﾑﾒﾓﾔﾕﾖﾗﾘﾙﾚﾛﾜｦﾝｰｯ､ﾟﾞ･?｡";
static const std::u32string FIXUP_DECODED = U"「」ぁぃぅぇぉゃゅょあいうえおかきくけこさしすせそたちつてとなにぬねのはひふへほまみむめもやゆよらりるれろわをんーっ、？！…　。";

static std::string applyFixup(const std::string &utf8, const std::u32string &from, const std::u32string &to) {
	std::u32string text = decodeUTF8String(utf8);
	for (auto &c : text) {
		auto idx = from.find(c);
		if (idx != std::u32string::npos)
			c = to[idx];
	}
	return encodeUTF8String(text);
}

std::string decodeStringFixup(const std::string &utf8) {
	return applyFixup(utf8, FIXUP_ENCODED, FIXUP_DECODED);
}

std::string encodeStringFixup(const std::string &utf8) {
	return applyFixup(utf8, FIXUP_DECODED, FIXUP_ENCODED);
}

static std::string readSized(ByteReader &r, size_t len, bool fixup) {
	if (len > r.remaining())
		throw ParseError(ParseError::Kind::TruncatedStream, "string runs past the end of data");
	auto s = decodeSJISString(r.current(), len);
	r.skip(len);
	return fixup ? decodeStringFixup(s) : s;
}

std::string readU8String(ByteReader &r, bool fixup) {
	size_t len = r.u8();
	return readSized(r, len, fixup);
}

std::string readU16String(ByteReader &r, bool fixup) {
	size_t len = r.u16();
	return readSized(r, len, fixup);
}

std::string readZeroString(ByteReader &r) {
	size_t consumed = 0;
	auto s          = decodeSJISString(r.current(), r.remaining(), &consumed);
	r.skip(consumed);
	return s;
}

static std::vector<uint8_t> encodeTerminated(const std::string &s, bool fixup) {
	std::vector<uint8_t> bytes;
	writeSJISString(fixup ? encodeStringFixup(s) : s, bytes);
	bytes.push_back(0);
	return bytes;
}

void writeU8String(ByteWriter &w, const std::string &s, bool fixup) {
	auto bytes = encodeTerminated(s, fixup);
	if (bytes.size() > 0xFF)
		throw ParseError(ParseError::Kind::BadLength, "string too long for a u8 length");
	w.u8(static_cast<uint8_t>(bytes.size()));
	w.bytes(bytes);
}

void writeU16String(ByteWriter &w, const std::string &s, bool fixup) {
	auto bytes = encodeTerminated(s, fixup);
	if (bytes.size() > 0xFFFF)
		throw ParseError(ParseError::Kind::BadLength, "string too long for a u16 length");
	w.u16(static_cast<uint16_t>(bytes.size()));
	w.bytes(bytes);
}

std::vector<std::string> readStringArray(ByteReader &r) {
	size_t size  = r.u16();
	size_t start = r.position();
	std::vector<std::string> result;
	while (true) {
		auto s = readZeroString(r);
		// The closing NUL reads as an empty string
		if (s.empty())
			break;
		result.push_back(std::move(s));
	}
	if (r.position() - start != size)
		throw ParseError(ParseError::Kind::BadLength, "string array size mismatch");
	return result;
}

void writeStringArray(ByteWriter &w, const std::vector<std::string> &strings) {
	std::vector<uint8_t> buffer;
	for (auto &s : strings) {
		writeSJISString(s, buffer);
		buffer.push_back(0);
	}
	buffer.push_back(0);
	if (buffer.size() > 0xFFFF)
		throw ParseError(ParseError::Kind::BadLength, "string array too large");
	w.u16(static_cast<uint16_t>(buffer.size()));
	w.bytes(buffer);
}
