/**
 *  TextTests.cpp
 *  SNRScripter
 *
 *  Shift-JIS text and string containers.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Formats/Text.hpp"

#include <gtest/gtest.h>

TEST(SJIS, EncodesMixedWidthText) {
	EXPECT_EQ(measureSJISString(u8"Aあ"), 3u);
	std::vector<uint8_t> out;
	writeSJISString(u8"Aあ", out);
	EXPECT_EQ(out, (std::vector<uint8_t>{0x41, 0x82, 0xA0}));
	EXPECT_EQ(decodeSJISString(out.data(), out.size()), u8"Aあ");
}

TEST(SJIS, StopsAfterTheTerminator) {
	std::vector<uint8_t> data{0x41, 0x00, 0x42};
	size_t consumed = 0;
	EXPECT_EQ(decodeSJISString(data.data(), data.size(), &consumed), "A");
	EXPECT_EQ(consumed, 2u);
}

TEST(SJIS, SingleCharacters) {
	EXPECT_EQ(encodeSJISChar(U'あ'), 0x82A0);
	EXPECT_EQ(decodeSJISChar(0x82A0), U'あ');
	EXPECT_EQ(decodeSJISChar(0xB1), U'ｱ');
	EXPECT_EQ(encodeSJISChar(U'\n'), '\n');
	EXPECT_EQ(encodeSJISChar(0x1F600), 0);
}

TEST(SJIS, UnmappableTextThrows) {
	try {
		measureSJISString(u8"\U0001F600");
		FAIL() << "emoji encoded";
	} catch (const ParseError &e) {
		EXPECT_EQ(e.kind, ParseError::Kind::UnmappableText);
	}
	std::vector<uint8_t> out;
	EXPECT_THROW(writeSJISString(u8"a\U0001F600", out), ParseError);
}

TEST(SJIS, InvalidBytesThrow) {
	std::vector<uint8_t> halfChar{0x82};
	EXPECT_THROW(decodeSJISString(halfChar.data(), halfChar.size()), ParseError);
	std::vector<uint8_t> badTrail{0x82, 0x20};
	EXPECT_THROW(decodeSJISString(badTrail.data(), badTrail.size()), ParseError);
}

TEST(Fixup, HalfWidthFormsMapToDisplayText) {
	EXPECT_EQ(decodeStringFixup(u8"ｱｲ"), u8"あい");
	EXPECT_EQ(decodeStringFixup("?"), u8"？");
	EXPECT_EQ(encodeStringFixup(u8"あい？"), u8"ｱｲ?");
	EXPECT_EQ(decodeStringFixup("abc"), "abc");
}

TEST(Strings, LengthPrefixCountsTheTerminator) {
	ByteWriter w;
	writeU16String(w, u8"Aあ");
	writeU8String(w, u8"あい", true);
	auto bytes = w.take();
	EXPECT_EQ(loadLE16(bytes.data()), 4);
	EXPECT_EQ(bytes[6], 3);

	ByteReader r(bytes);
	EXPECT_EQ(readU16String(r), u8"Aあ");
	EXPECT_EQ(readU8String(r, true), u8"あい");
	EXPECT_TRUE(r.eof());
}

TEST(Strings, PrefixPastTheEndThrows) {
	std::vector<uint8_t> bytes{0x10, 0x00, 0x41, 0x00};
	ByteReader r(bytes);
	EXPECT_THROW(readU16String(r), ParseError);
}

TEST(Strings, ArraysEndWithAnEmptyString) {
	ByteWriter w;
	writeStringArray(w, {"Left", u8"右"});
	auto bytes = w.take();
	// "Left\0" + two bytes and a NUL + closing NUL
	EXPECT_EQ(loadLE16(bytes.data()), 5 + 3 + 1);

	ByteReader r(bytes);
	auto strings = readStringArray(r);
	EXPECT_EQ(strings, (std::vector<std::string>{"Left", u8"右"}));

	bytes[0]++;
	bytes.push_back(0);
	ByteReader bad(bytes);
	EXPECT_THROW(readStringArray(bad), ParseError);
}
