/**
 *  BitStreamTests.cpp
 *  SNRScripter
 *
 *  Byte and bit stream readers and writers.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Support/BitStream.hpp"
#include "Support/ByteStream.hpp"

#include <gtest/gtest.h>

TEST(BitReader, ReadsMostSignificantBitFirst) {
	std::vector<uint8_t> data{0xA5, 0x0F};
	BitReader r(data);
	EXPECT_EQ(r.read(1), 1u);
	EXPECT_EQ(r.read(3), 0x2u);
	EXPECT_EQ(r.read(4), 0x5u);
	EXPECT_EQ(r.read(8), 0x0Fu);
	EXPECT_EQ(r.position(), 16u);
}

TEST(BitReader, FieldsCrossByteBoundaries) {
	std::vector<uint8_t> data{0x12, 0x34, 0x56};
	BitReader r(data);
	EXPECT_EQ(r.read(4), 0x1u);
	EXPECT_EQ(r.read(12), 0x234u);
	EXPECT_EQ(r.read(8), 0x56u);
}

TEST(BitReader, AlignSkipsToTheNextByte) {
	std::vector<uint8_t> data{0xFF, 0x80};
	BitReader r(data);
	r.read(3);
	r.align();
	EXPECT_EQ(r.position(), 8u);
	EXPECT_TRUE(r.readBool());
	r.align();
	r.align();
	EXPECT_EQ(r.position(), 16u);
}

TEST(BitReader, ThrowsPastTheEnd) {
	std::vector<uint8_t> data{0x00};
	BitReader r(data);
	r.read(7);
	EXPECT_THROW(r.read(2), ParseError);
	EXPECT_THROW(r.read(33), ParseError);
}

TEST(BitWriter, MatchesReaderLayout) {
	BitWriter w;
	w.write(1, 1);
	w.write(0x2, 3);
	w.write(0x5, 4);
	w.writeBool(true);
	w.align();
	w.write(0xDEADBEEF, 32);
	auto bytes = w.take();

	ASSERT_EQ(bytes.size(), 6u);
	EXPECT_EQ(bytes[0], 0xA5);
	EXPECT_EQ(bytes[1], 0x80);
	EXPECT_EQ(bytes[2], 0xDE);
	EXPECT_EQ(bytes[5], 0xEF);
}

TEST(BitWriter, TakePadsThePartialByte) {
	BitWriter w;
	w.write(0x7, 3);
	auto bytes = w.take();
	ASSERT_EQ(bytes.size(), 1u);
	EXPECT_EQ(bytes[0], 0xE0);
}

TEST(ByteReader, ReadsLittleEndianFields) {
	std::vector<uint8_t> data{0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0xFF, 0xFF};
	ByteReader r(data);
	EXPECT_EQ(r.u16(), 0x0201);
	EXPECT_EQ(r.u32(), 0x06050403u);
	EXPECT_EQ(r.i16(), -1);
	EXPECT_TRUE(r.eof());
}

TEST(ByteReader, ThrowsOnTruncation) {
	std::vector<uint8_t> data{0x01, 0x02, 0x03};
	ByteReader r(data);
	r.u16();
	try {
		r.u32();
		FAIL() << "read past the end";
	} catch (const ParseError &e) {
		EXPECT_EQ(e.kind, ParseError::Kind::TruncatedStream);
	}
	EXPECT_EQ(r.position(), 2u);
	EXPECT_THROW(r.seek(4), ParseError);
}

TEST(ByteReader, StringsAndSubReaders) {
	std::vector<uint8_t> data{'a', 'b', 0, 'c', 0, 0, 0, 0x00, 0x07, 0x2A, 0x00};
	ByteReader r(data);
	EXPECT_EQ(r.cString(), "ab");
	EXPECT_EQ(r.fixedString(4), "c");
	auto sub = r.sub(2);
	EXPECT_EQ(sub.size(), 2u);
	EXPECT_EQ(sub.u8(), 0);
	EXPECT_EQ(r.u16(), 0x002A);
	EXPECT_THROW(sub.u16(), ParseError);
}

TEST(ByteWriter, PatchesInPlace) {
	ByteWriter w;
	w.u32(0);
	w.u16(0xBEEF);
	w.u24(0x123456);
	w.patchU32(0, 0xCAFEBABE);
	auto &b = w.buffer();
	ASSERT_EQ(b.size(), 9u);
	EXPECT_EQ(loadLE32(b.data()), 0xCAFEBABEu);
	EXPECT_EQ(loadLE16(b.data() + 4), 0xBEEF);
	ByteReader r(b, 6);
	EXPECT_EQ(r.u24(), 0x123456u);
}
