/**
 *  Text.hpp
 *  SNRScripter
 *
 *  Shift-JIS variant used by the scenario and its string containers.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Support/ByteStream.hpp"

#include <string>
#include <vector>
#include <cstdint>

// Decodes at most len bytes, stopping after the first NUL. Throws ParseError(InvalidByte).
std::string decodeSJISString(const uint8_t *data, size_t len, size_t *consumed = nullptr);

// Number of bytes writeSJISString will emit for a UTF-8 string (no terminator).
// Throws ParseError(UnmappableText) for characters without an encoding.
size_t measureSJISString(const std::string &utf8);
void writeSJISString(const std::string &utf8, std::vector<uint8_t> &out);

// Single character helpers, 0 means no mapping
char32_t decodeSJISChar(uint16_t sjis);
uint16_t encodeSJISChar(char32_t cp);

// Half-width katakana and similar shortened forms to their display form and back
std::string decodeStringFixup(const std::string &utf8);
std::string encodeStringFixup(const std::string &utf8);

// Length prefixed strings, the prefix counts the NUL terminator
std::string readU8String(ByteReader &r, bool fixup = false);
std::string readU16String(ByteReader &r, bool fixup = false);
std::string readZeroString(ByteReader &r);
void writeU8String(ByteWriter &w, const std::string &s, bool fixup = false);
void writeU16String(ByteWriter &w, const std::string &s, bool fixup = false);

// u16 byte size, NUL separated strings, an extra NUL at the end
std::vector<std::string> readStringArray(ByteReader &r);
void writeStringArray(ByteWriter &w, const std::vector<std::string> &strings);
