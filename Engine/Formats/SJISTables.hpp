/**
 *  SJISTables.hpp
 *  SNRScripter
 *
 *  Shift-JIS conversion tables, generated at build time by tools/gen_sjis_tables.py.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"

#include <cstdint>
#include <cstddef>

const size_t SJIS_JIS_TABLE_SIZE = 120 * 94;

struct SJISReverseEntry {
	char32_t codepoint;
	uint16_t sjis;
};

// 0x20..0x7F
extern const char32_t SJIS_ASCII_TABLE[0x60];
// 0xA0..0xDF, 0 marks an unmapped byte
extern const char32_t SJIS_KATAKANA_TABLE[0x40];
// Indexed by row * 94 + column, see Text.cpp
extern const char32_t SJIS_JIS_TABLE[SJIS_JIS_TABLE_SIZE];
// Bucket i holds the reverse entries with codepoint >> 8 == i
extern const uint16_t SJIS_REVERSE_BUCKETS[257];
extern const SJISReverseEntry SJIS_REVERSE[];
extern const size_t SJIS_REVERSE_COUNT;
