/**
 *  Unicode.cpp
 *  SNRScripter
 *
 *  Contains code to convert between UTF-8 and UTF-32 code point strings.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Support/Unicode.hpp"

size_t decodeUTF8Symbol(const char *inBuf, size_t len, char32_t &codepoint) {
	uint32_t state = UTF8_ACCEPT;
	uint32_t cp    = 0;
	for (size_t i = 0; i < len; i++) {
		decodeUTF8(&state, &cp, static_cast<uint8_t>(inBuf[i]));
		if (state == UTF8_ACCEPT) {
			codepoint = cp;
			return i + 1;
		}
		if (state == UTF8_REJECT)
			return 0;
	}
	return 0;
}

std::u32string decodeUTF8String(const std::string &inBuf) {
	std::u32string result;
	result.reserve(inBuf.size());
	size_t pos = 0;
	while (pos < inBuf.size()) {
		char32_t cp = 0;
		size_t used = decodeUTF8Symbol(inBuf.data() + pos, inBuf.size() - pos, cp);
		if (used == 0) {
			result += U'�';
			pos++;
		} else {
			result += cp;
			pos += used;
		}
	}
	return result;
}

void appendUTF8(std::string &result, char32_t cp) {
	if (cp < 0x80) { // one octet
		result += static_cast<char>(cp);
	} else if (cp < 0x800) { // two octets
		result += static_cast<char>((cp >> 6) | 0xc0);
		result += static_cast<char>((cp & 0x3f) | 0x80);
	} else if (cp < 0x10000) { // three octets
		result += static_cast<char>((cp >> 12) | 0xe0);
		result += static_cast<char>(((cp >> 6) & 0x3f) | 0x80);
		result += static_cast<char>((cp & 0x3f) | 0x80);
	} else { // four octets
		result += static_cast<char>((cp >> 18) | 0xf0);
		result += static_cast<char>(((cp >> 12) & 0x3f) | 0x80);
		result += static_cast<char>(((cp >> 6) & 0x3f) | 0x80);
		result += static_cast<char>((cp & 0x3f) | 0x80);
	}
}

std::string encodeUTF8String(const std::u32string &inBuf) {
	std::string result;
	result.reserve(inBuf.size() * 3);
	for (auto cp : inBuf) appendUTF8(result, cp);
	return result;
}

// Bjoern Hoehrmann's DFA decoder table
const uint8_t utf8d[]{
	0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 00..1f
	0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 20..3f
	0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 40..5f
	0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 60..7f
	1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, // 80..9f
	7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, // a0..bf
	8, 8, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, // c0..df
	0xa, 0x3, 0x3, 0x3, 0x3, 0x3, 0x3, 0x3, 0x3, 0x3, 0x3, 0x3, 0x3, 0x4, 0x3, 0x3,                 // e0..ef
	0xb, 0x6, 0x6, 0x6, 0x5, 0x8, 0x8, 0x8, 0x8, 0x8, 0x8, 0x8, 0x8, 0x8, 0x8, 0x8,                 // f0..ff
	0x0, 0x1, 0x2, 0x3, 0x5, 0x8, 0x7, 0x1, 0x1, 0x1, 0x4, 0x6, 0x1, 0x1, 0x1, 0x1,                 // s0..s0
	1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 0, 1, 1, 1, 1, 1, 0, 1, 0, 1, 1, 1, 1, 1, 1, // s1..s2
	1, 2, 1, 1, 1, 1, 1, 2, 1, 2, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 2, 1, 1, 1, 1, 1, 1, 1, 1, // s3..s4
	1, 2, 1, 1, 1, 1, 1, 1, 1, 2, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 3, 1, 3, 1, 1, 1, 1, 1, 1, // s5..s6
	1, 3, 1, 1, 1, 1, 1, 3, 1, 3, 1, 1, 1, 1, 1, 1, 1, 3, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, // s7..s8
};
