/**
 *  CodecTests.cpp
 *  SNRScripter
 *
 *  LZ77, number specs, registers, masks, fonts and system sounds.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Formats/Font.hpp"
#include "Engine/Formats/Instruction.hpp"
#include "Engine/Formats/Lz77.hpp"
#include "Engine/Formats/Mask.hpp"
#include "Engine/Formats/SysSe.hpp"
#include "tests/Builders.hpp"

#include <gtest/gtest.h>

TEST(Lz77, LiteralsOnly) {
	std::vector<uint8_t> input{0x00, 'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h'};
	std::vector<uint8_t> out;
	lz77Decompress(LZ77_PICTURE_OFFSET_BITS, input.data(), input.size(), out);
	EXPECT_EQ(std::string(out.begin(), out.end()), "abcdefgh");
}

TEST(Lz77, OverlappingBackReference) {
	// 'a', then a run of 5 copies at distance 1: length 5 is (5 - 3) << 12 | 0
	std::vector<uint8_t> input{0x02, 'a', 0x20, 0x00};
	std::vector<uint8_t> out;
	lz77Decompress(LZ77_PICTURE_OFFSET_BITS, input.data(), input.size(), out);
	EXPECT_EQ(std::string(out.begin(), out.end()), "aaaaaa");
}

TEST(Lz77, FontOffsetWidth) {
	// "ab" then 3 bytes from distance 2
	std::vector<uint8_t> input{0x04, 'a', 'b', 0x00, 0x01};
	std::vector<uint8_t> out;
	lz77Decompress(LZ77_FONT_OFFSET_BITS, input.data(), input.size(), out);
	EXPECT_EQ(std::string(out.begin(), out.end()), "ababa");
}

TEST(Lz77, ReferenceBeforeTheStartThrows) {
	std::vector<uint8_t> input{0x01, 0x00, 0x04};
	std::vector<uint8_t> out{'x'};
	// Earlier output of the caller is not part of the window
	EXPECT_THROW(lz77Decompress(LZ77_PICTURE_OFFSET_BITS, input.data(), input.size(), out), ParseError);
}

TEST(Lz77, TruncatedReferenceThrows) {
	std::vector<uint8_t> input{0x02, 'a', 0x20};
	std::vector<uint8_t> out;
	EXPECT_THROW(lz77Decompress(LZ77_PICTURE_OFFSET_BITS, input.data(), input.size(), out), ParseError);
}

namespace {
std::vector<uint8_t> encoded(const NumberSpec &spec) {
	ByteWriter w;
	spec.write(w);
	return w.take();
}

NumberSpec decoded(const std::vector<uint8_t> &bytes) {
	ByteReader r(bytes);
	auto spec = NumberSpec::read(r);
	EXPECT_TRUE(r.eof());
	return spec;
}
} // namespace

TEST(NumberSpec, ShortestForms) {
	EXPECT_EQ(encoded(NumberSpec::literal(5)).size(), 1u);
	EXPECT_EQ(encoded(NumberSpec::literal(-64)).size(), 1u);
	EXPECT_EQ(encoded(NumberSpec::literal(64)).size(), 2u);
	EXPECT_EQ(encoded(NumberSpec::literal(-0x800)).size(), 2u);
	EXPECT_EQ(encoded(NumberSpec::literal(0x800)).size(), 3u);
	EXPECT_EQ(encoded(NumberSpec::literal(0x7FFFFFF)).size(), 4u);
	EXPECT_EQ(encoded(NumberSpec::of(Register::regular(3))).size(), 1u);
}

TEST(NumberSpec, BoundaryValuesSurviveEncoding) {
	for (int32_t v : {0, 1, -1, 63, -64, 64, -65, 0x7FF, -0x800, 0x7FFFF, -0x80000, 0x7FFFFFF, -0x8000000}) {
		auto spec = NumberSpec::literal(v);
		EXPECT_EQ(decoded(encoded(spec)), spec) << v;
	}
	for (uint16_t index : {0, 15, 16, 0xFFF}) {
		auto spec = NumberSpec::of(Register::regular(index));
		EXPECT_EQ(decoded(encoded(spec)), spec) << index;
	}
	auto arg = NumberSpec::of(Register::argument(2));
	EXPECT_EQ(decoded(encoded(arg)), arg);
}

TEST(NumberSpec, ConstantsBeyond28BitsThrow) {
	ByteWriter w;
	EXPECT_THROW(NumberSpec::literal(0x8000000).write(w), ParseError);
}

TEST(Register, ParseAndPrint) {
	Register reg;
	ASSERT_EQ(Register::parse("$v12", reg), Register::ParseStatus::Ok);
	EXPECT_FALSE(reg.isArgument());
	EXPECT_EQ(reg.index(), 12);
	EXPECT_EQ(reg.toString(), "$v12");

	ASSERT_EQ(Register::parse("$a3", reg), Register::ParseStatus::Ok);
	EXPECT_TRUE(reg.isArgument());
	EXPECT_EQ(reg.raw(), Register::ARGUMENTS_START + 3);

	EXPECT_EQ(Register::parse("v12", reg), Register::ParseStatus::InvalidPrefix);
	EXPECT_EQ(Register::parse("$v", reg), Register::ParseStatus::InvalidIndex);
	EXPECT_EQ(Register::parse("$v4096", reg), Register::ParseStatus::InvalidIndex);
	EXPECT_EQ(Register::parse("$v1x", reg), Register::ParseStatus::InvalidIndex);
}

TEST(Register, RawRangeIsChecked) {
	EXPECT_THROW(Register::regular(0x1000), std::out_of_range);
	EXPECT_THROW(Register::fromRaw(0x2000), ParseError);
	EXPECT_TRUE(Register::fromRaw(0x1FFF).isArgument());
}

TEST(Mask, ReadsTexelsAndRegions) {
	TestData::MaskSpec spec;
	spec.id     = 9;
	spec.width  = 20;
	spec.height = 2;
	for (uint8_t i = 0; i < 40; i++) spec.texels.push_back(i);
	spec.regions[0].push_back({0, 0, 4, 4});
	spec.regions[2].push_back({4, 0, 8, 4});
	spec.regions[2].push_back({8, 0, 12, 4});

	auto bytes = TestData::mask(spec);
	auto m     = readMask(bytes.data(), bytes.size());
	EXPECT_EQ(m.id, 9u);
	EXPECT_EQ(m.width, 20u);
	ASSERT_EQ(m.texels.size(), 40u);
	EXPECT_EQ(m.texels[21], 21);
	EXPECT_EQ(m.rects.size(), 3u);

	EXPECT_EQ(m.range(MaskRegionType::Black).first, 0u);
	EXPECT_EQ(m.range(MaskRegionType::Black).count, 6u);
	EXPECT_EQ(m.range(MaskRegionType::White).count, 0u);
	EXPECT_EQ(m.range(MaskRegionType::Transparent).first, 6u);
	EXPECT_EQ(m.range(MaskRegionType::Transparent).count, 12u);
	EXPECT_FLOAT_EQ(m.vertices[4].texCoord.x, 4 / 20.0f);
}

TEST(Mask, RejectsWrongMagic) {
	auto bytes = TestData::mask({});
	bytes[0]   = 'X';
	EXPECT_THROW(readMask(bytes.data(), bytes.size()), ParseError);
}

TEST(Font, SharedGlyphsAreStoredOnce) {
	TestData::GlyphSpec fallback;
	TestData::GlyphSpec wide;
	wide.advance  = 30;
	wide.coverage = 0x80;
	auto bytes    = TestData::font(40, 10, fallback, {{U'あ', wide}});

	auto font = readFont(bytes.data(), bytes.size());
	EXPECT_EQ(font.ascent(), 40);
	EXPECT_EQ(font.descent(), 10);
	EXPECT_EQ(font.glyphCount(), 2u);
	EXPECT_EQ(font.glyphId(U'a'), font.glyphId(U'b'));
	EXPECT_NE(font.glyphId(U'a'), font.glyphId(U'あ'));
	EXPECT_EQ(font.glyphFor(U'あ').info().advanceWidth, 30);

	auto glyph = font.glyphFor(U'あ').decompress();
	EXPECT_EQ(glyph.mipWidth(0), 8u);
	EXPECT_EQ(glyph.mips[3].size(), 1u);
	EXPECT_EQ(glyph.mips[0][0], 0x80);
}

TEST(Font, SizeMismatchThrows) {
	auto bytes = TestData::font(40, 10, {});
	bytes.push_back(0);
	EXPECT_THROW(readFont(bytes.data(), bytes.size()), ParseError);
}

TEST(SysSe, SilentBlocksDecodeToSilence) {
	auto bytes = TestData::sysSeBank({{"click", TestData::adpcmSound(48000, 3)}, {"cancel", TestData::adpcmSound(44100, 1)}});
	auto bank  = readSysSe(bytes.data(), bytes.size());
	ASSERT_EQ(bank.size(), 2u);
	ASSERT_TRUE(bank.count("click"));
	EXPECT_EQ(bank["click"]->sampleRate, 48000u);

	SysSeDecoder decoder(bank["click"]);
	AudioBuffer samples;
	EXPECT_TRUE(decoder.readFrame(samples));
	EXPECT_EQ(samples.size(), 90u);
	for (auto &s : samples) EXPECT_EQ(s.left, 0.0f);
	EXPECT_FALSE(decoder.readFrame(samples));

	EXPECT_EQ(decoder.samplesSeek(0), 0u);
	EXPECT_EQ(decoder.currentSamplePosition(), 0u);
	EXPECT_THROW(decoder.samplesSeek(10), ParseError);
}

TEST(SysSe, AdpcmFilterPredictsFromHistory) {
	uint8_t block[ADPCM_BLOCK_BYTES]{};
	// Shift 4, filter 0 and a first residual of 1
	block[0] = 0x04;
	block[1] = 0x01;
	AdpcmHistory history;
	int16_t out[ADPCM_BLOCK_SAMPLES];
	decodeAdpcmBlock(history, block, out);
	EXPECT_EQ(out[0], 16);
	EXPECT_EQ(out[1], 0);
	EXPECT_EQ(history.sample1, 0);

	block[0] = 0x10; // filter 1 keeps 60/64 of the last sample
	block[1] = 0x00;
	history.sample1 = 640;
	decodeAdpcmBlock(history, block, out);
	EXPECT_EQ(out[0], 600);
}
