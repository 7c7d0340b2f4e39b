/**
 *  Unicode.hpp
 *  SNRScripter
 *
 *  Contains code to convert between UTF-8 and UTF-32 code point strings.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"

#include <string>

#include <cstdint>

extern const uint8_t utf8d[];

const uint32_t UTF8_ACCEPT = 0;
const uint32_t UTF8_REJECT = 1;

inline uint32_t decodeUTF8(uint32_t *state, uint32_t *codep, uint8_t byte) {
	uint32_t type = utf8d[byte];
	*codep        = (*state != UTF8_ACCEPT) ? (byte & 0x3fu) | (*codep << 6) : (0xff >> type) & (byte);
	*state        = utf8d[256 + *state * 16 + type];
	return *state;
}

// Decodes one code point, returns the amount of consumed bytes or 0 on malformed input
size_t decodeUTF8Symbol(const char *inBuf, size_t len, char32_t &codepoint);

// Malformed sequences are replaced with U+FFFD
std::u32string decodeUTF8String(const std::string &inBuf);

void appendUTF8(std::string &outBuf, char32_t cp);
std::string encodeUTF8String(const std::u32string &inBuf);

inline bool isWhitespace(char32_t cp) {
	return cp == ' ' || cp == '\t' || cp == '\r' || cp == 0x3000;
}
