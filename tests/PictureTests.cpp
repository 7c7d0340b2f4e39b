/**
 *  PictureTests.cpp
 *  SNRScripter
 *
 *  Picture and bustup containers.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Formats/Bustup.hpp"
#include "Engine/Formats/Picture.hpp"
#include "tests/Builders.hpp"

#include <gtest/gtest.h>

using TestData::Rgba;

namespace {
const Rgba RED{255, 0, 0, 255};
const Rgba BLUE{0, 0, 255, 255};
const Rgba HALF_GREEN{0, 255, 0, 128};

class CountingBuilder : public PictureBuilder {
public:
	PictureInfo info;
	std::vector<uint32_t> offsets;
	std::vector<size_t> placements;

	void begin(const PictureInfo &i) override {
		info = i;
	}
	void addBlock(uint32_t dataOffset, const std::vector<ushort2> &positions, PictureBlock &&) override {
		offsets.push_back(dataOffset);
		placements.push_back(positions.size());
	}
};

Rgba pixel(const std::vector<uint8_t> &rgba, uint32_t width, uint32_t x, uint32_t y) {
	auto p = &rgba[(static_cast<size_t>(y) * width + x) * 4];
	return {p[0], p[1], p[2], p[3]};
}
} // namespace

TEST(Picture, SharedBlocksAreDecodedOnce) {
	TestData::PictureSpec spec;
	spec.width     = 8;
	spec.height    = 4;
	spec.pictureId = 77;
	spec.blocks.push_back(TestData::pictureBlock(4, 2, RED));
	spec.blocks.push_back(TestData::pictureBlock(4, 2, BLUE));
	spec.placements = {{0, 0, 0}, {4, 0, 0}, {0, 2, 1}, {4, 2, 0}};
	auto bytes      = TestData::picture(spec);

	CountingBuilder builder;
	readPicture(bytes.data(), bytes.size(), builder);
	EXPECT_EQ(builder.info.pictureId, 77u);
	EXPECT_EQ(builder.info.effectiveWidth, 8u);
	ASSERT_EQ(builder.offsets.size(), 2u);
	EXPECT_EQ(builder.placements[0], 3u);
	EXPECT_EQ(builder.placements[1], 1u);
}

TEST(Picture, MergedBuilderPlacesEveryReference) {
	TestData::PictureSpec spec;
	spec.width  = 8;
	spec.height = 4;
	spec.blocks.push_back(TestData::pictureBlock(4, 2, RED));
	spec.blocks.push_back(TestData::pictureBlock(4, 2, BLUE));
	spec.placements = {{0, 0, 0}, {4, 0, 0}, {0, 2, 1}, {4, 2, 0}};
	auto bytes      = TestData::picture(spec);

	MergedPictureBuilder merged;
	readPicture(bytes.data(), bytes.size(), merged);
	ASSERT_EQ(merged.rgba.size(), 8u * 4 * 4);
	EXPECT_EQ(pixel(merged.rgba, 8, 1, 1), RED);
	EXPECT_EQ(pixel(merged.rgba, 8, 7, 1), RED);
	EXPECT_EQ(pixel(merged.rgba, 8, 0, 3), BLUE);
	EXPECT_EQ(pixel(merged.rgba, 8, 5, 3), RED);
}

TEST(Picture, BlockOffsetsShiftTheTexels) {
	auto block = TestData::pictureBlock(2, 2, BLUE, 1, 1);
	auto b     = readPictureBlock(block.data(), block.size());
	EXPECT_EQ(b.offsetX, 1u);
	EXPECT_EQ(b.rgba.size(), 16u);

	std::vector<uint8_t> canvas(4 * 4 * 4, 0);
	blitPictureBlock(b, 2, 2, canvas, 4, 4, false);
	EXPECT_EQ(pixel(canvas, 4, 3, 3), BLUE);
	EXPECT_EQ(pixel(canvas, 4, 2, 2), (Rgba{0, 0, 0, 0}));
}

TEST(Picture, OverlayBlendsStraightAlpha) {
	auto block = TestData::pictureBlock(1, 1, HALF_GREEN);
	auto b     = readPictureBlock(block.data(), block.size());
	std::vector<uint8_t> canvas{255, 0, 0, 255};
	blitPictureBlock(b, 0, 0, canvas, 1, 1, true);
	EXPECT_NEAR(canvas[0], 127, 1);
	EXPECT_NEAR(canvas[1], 128, 1);
	EXPECT_EQ(canvas[3], 255);
}

TEST(Picture, EmptySpanIsAnEmptyBlock) {
	EXPECT_TRUE(readPictureBlock(nullptr, 0).empty());
}

TEST(Picture, HeaderErrors) {
	auto bytes = TestData::solidPicture(2, 2, RED);
	CountingBuilder builder;

	auto wrongSize = bytes;
	wrongSize.push_back(0);
	EXPECT_THROW(readPicture(wrongSize.data(), wrongSize.size(), builder), ParseError);

	auto wrongVersion = bytes;
	wrongVersion[4]   = 2;
	try {
		readPicture(wrongVersion.data(), wrongVersion.size(), builder);
		FAIL() << "version 2 accepted";
	} catch (const ParseError &e) {
		EXPECT_EQ(e.kind, ParseError::Kind::Unsupported);
	}

	auto badFlags = TestData::pictureBlock(1, 1, RED);
	badFlags[0]   = 0x7;
	EXPECT_THROW(readPictureBlock(badFlags.data(), badFlags.size()), ParseError);
}

namespace {
TestData::BustupSpec smile() {
	TestData::BustupSpec spec;
	spec.width    = 4;
	spec.height   = 4;
	spec.bustupId = 3;
	// The bustup cleanup keeps texels inside the rectangles, the far edges are exclusive
	std::vector<TestData::BlockRect> all{{0, 0, 4, 4}};
	spec.blocks.push_back(TestData::pictureBlock(4, 4, RED, 0, 0, all));
	spec.blocks.push_back(TestData::pictureBlock(4, 4, BLUE, 0, 0, all));
	spec.blocks.push_back(TestData::pictureBlock(4, 4, HALF_GREEN, 0, 0, all));
	spec.base = {0};

	TestData::BustupSpec::Expression happy;
	happy.name   = "happy";
	happy.face1  = 1;
	happy.mouths = {-1, 2, 2};
	happy.eyes   = {1};
	TestData::BustupSpec::Expression plain;
	plain.name = "plain";
	spec.expressions = {happy, plain};
	return spec;
}
} // namespace

TEST(Bustup, EachUniqueBlockIsDecodedOnce) {
	auto bytes = TestData::bustup(smile());

	size_t calls = 0;
	auto b       = readBustup<int>(bytes.data(), bytes.size(), [&calls](PictureBlock &&) {
		return static_cast<int>(calls++);
	});
	EXPECT_EQ(calls, 3u);
	EXPECT_EQ(b.bustupId, 3u);
	ASSERT_NE(b.expression("happy"), nullptr);
	auto &happy = *b.expression("happy");
	EXPECT_EQ(happy.face2, nullptr);
	ASSERT_EQ(happy.mouths.size(), 3u);
	EXPECT_EQ(happy.mouths[0], nullptr);
	EXPECT_EQ(happy.mouths[1], happy.mouths[2]);
	EXPECT_EQ(happy.eyes[0], happy.face1);
	EXPECT_EQ(b.expression("angry"), nullptr);
}

TEST(Bustup, SkeletonListsUniqueOffsets) {
	auto bytes    = TestData::bustup(smile());
	auto skeleton = readBustupSkeleton(bytes.data(), bytes.size());
	EXPECT_EQ(skeleton.expressions.size(), 2u);
	EXPECT_EQ(skeleton.expressions[0].first, "happy");
	auto unique = skeleton.uniqueBlocks();
	ASSERT_EQ(unique.size(), 3u);
	EXPECT_LT(unique[0].offset, unique[1].offset);
	EXPECT_LT(unique[1].offset, unique[2].offset);
}

TEST(Bustup, ComposesBaseAndExpression) {
	auto bytes = TestData::bustup(smile());
	auto b     = readBustupImage(bytes.data(), bytes.size());

	auto base = composeBustupBase(b);
	EXPECT_EQ(pixel(base, 4, 1, 1), RED);
	// Outside of the rectangle coverage
	EXPECT_EQ(pixel(base, 4, 3, 3), (Rgba{0, 0, 0, 0}));

	auto face = composeBustupExpression(b, "happy", 0, 5);
	EXPECT_EQ(pixel(face, 4, 1, 1), BLUE);

	auto open = composeBustupExpression(b, "happy", 1, 9);
	auto mix  = pixel(open, 4, 1, 1);
	EXPECT_NEAR(mix[1], 128, 1);
	EXPECT_EQ(mix[3], 255);

	EXPECT_EQ(composeBustupExpression(b, "missing", 0, 0), base);
}

TEST(Bustup, DuplicateExpressionNamesThrow) {
	auto spec = smile();
	spec.expressions[1].name = "happy";
	auto bytes               = TestData::bustup(spec);
	EXPECT_THROW(readBustupSkeleton(bytes.data(), bytes.size()), ParseError);
}
