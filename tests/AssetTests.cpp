/**
 *  AssetTests.cpp
 *  SNRScripter
 *
 *  Asynchronous asset loading and the shared asset cache.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Components/Assets.hpp"
#include "Engine/Readers/Rom.hpp"
#include "Support/Errors.hpp"
#include "tests/Builders.hpp"
#include "tests/TempDir.hpp"

#include <gtest/gtest.h>

using namespace TestData;

namespace {
// Pools are never started here, so loads finish inside load()
class AssetServerTest : public ::testing::Test {
protected:
	TempDir dir;
	AssetServer server;

	void SetUp() override {
		MaskSpec wipe;
		wipe.id     = 7;
		wipe.width  = 16;
		wipe.height = 16;
		wipe.texels.assign(16 * 16, 0x80);

		auto path = dir.write("data.rom", rom({{"picture/red.pic", solidPicture(4, 2, {0xFF, 0, 0, 0xFF})},
		                                        {"picture/broken.pic", {1, 2, 3}},
		                                        {"mask/wipe.msk", mask(wipe)},
		                                        {"sysse.bin", sysSeBank({{"click", adpcmSound(22050, 2)}})}}));
		auto reader = std::make_unique<RomReader>(path);
		ASSERT_EQ(reader->open(), 0);
		server.setReader(std::move(reader));
	}
};

AssetError::Kind failureOf(const std::function<void()> &f) {
	try {
		f();
	} catch (const AssetError &e) {
		return e.kind;
	}
	ADD_FAILURE() << "no AssetError";
	return AssetError::Kind::NotFound;
}
} // namespace

TEST_F(AssetServerTest, DecodesPictures) {
	auto future = server.load<PictureImage>("/picture/red.pic");
	ASSERT_TRUE(future->ready());
	auto picture = future->wait();
	ASSERT_NE(picture, nullptr);
	EXPECT_EQ(picture->info.effectiveWidth, 4u);
	EXPECT_EQ(picture->info.effectiveHeight, 2u);
	ASSERT_EQ(picture->rgba.size(), 4u * 2 * 4);
	EXPECT_EQ(picture->rgba[0], 0xFF);
	EXPECT_EQ(picture->rgba[1], 0);
	EXPECT_EQ(picture->rgba[3], 0xFF);
}

TEST_F(AssetServerTest, SharesLiveValues) {
	auto first  = server.loadSync<PictureImage>("/picture/red.pic");
	auto second = server.loadSync<PictureImage>("/picture/red.pic");
	EXPECT_EQ(first.get(), second.get());

	// Nobody holds the picture any more, so it is decoded again
	first.reset();
	second.reset();
	auto third = server.loadSync<PictureImage>("/picture/red.pic");
	ASSERT_NE(third, nullptr);
	EXPECT_EQ(third->info.effectiveWidth, 4u);
}

TEST_F(AssetServerTest, ReportsMissingAndBrokenAssets) {
	EXPECT_EQ(failureOf([this] { server.loadSync<PictureImage>("/picture/none.pic"); }), AssetError::Kind::NotFound);
	EXPECT_EQ(failureOf([this] { server.loadSync<PictureImage>("/picture/broken.pic"); }), AssetError::Kind::DecodeFailed);
	EXPECT_THROW(server.readBytes("/nothing"), AssetError);

	// A failed load leaves the key open for the next attempt
	EXPECT_EQ(failureOf([this] { server.loadSync<PictureImage>("/picture/broken.pic"); }), AssetError::Kind::DecodeFailed);
}

TEST_F(AssetServerTest, OtherAssetKinds) {
	auto wipe = server.loadSync<MaskTexture>("/mask/wipe.msk");
	EXPECT_EQ(wipe->id, 7u);
	EXPECT_EQ(wipe->width, 16u);
	EXPECT_EQ(wipe->texels.size(), 16u * 16);

	auto bank = server.loadSync<SysSe>("/sysse.bin");
	ASSERT_EQ(bank->size(), 1u);
	EXPECT_EQ(bank->begin()->first, "click");

	auto raw = server.loadSync<BinaryAsset>("/picture/broken.pic");
	EXPECT_EQ(raw->data, (std::vector<uint8_t>{1, 2, 3}));
}

TEST(AssetServer, NeedsAReader) {
	AssetServer server;
	EXPECT_FALSE(server.hasReader());
	EXPECT_THROW(server.io(), AssetError);
}

TEST(AssetCache, OneLoaderPerKey) {
	AssetCache<int> cache;
	auto first = cache.lookup("k");
	ASSERT_EQ(first.state, AssetCache<int>::State::LoadRequired);

	auto second = cache.lookup("k");
	ASSERT_EQ(second.state, AssetCache<int>::State::Loading);
	EXPECT_FALSE(second.loading.ready());

	auto value = std::make_shared<int>(5);
	first.token.finish(value);
	EXPECT_TRUE(second.loading.ready());
	EXPECT_EQ(second.loading.wait(), value);

	auto third = cache.lookup("k");
	EXPECT_EQ(third.state, AssetCache<int>::State::Loaded);
	EXPECT_EQ(*third.value, 5);
	EXPECT_EQ(cache.peek("k"), value);
}

TEST(AssetCache, CancelledLoadsReopenTheKey) {
	AssetCache<int> cache;
	auto first  = cache.lookup("k");
	auto second = cache.lookup("k");
	first.token.cancel();
	EXPECT_EQ(second.loading.wait(), nullptr);
	EXPECT_EQ(cache.size(), 0u);

	auto again = cache.lookup("k");
	EXPECT_EQ(again.state, AssetCache<int>::State::LoadRequired);
	again.token.finish(std::make_shared<int>(1));
}

TEST(AssetCache, PurgeDropsExpiredEntries) {
	AssetCache<int> cache;
	{
		auto lookup = cache.lookup("a");
		lookup.token.finish(std::make_shared<int>(1));
	}
	auto kept   = std::make_shared<int>(2);
	auto lookup = cache.lookup("b");
	lookup.token.finish(kept);

	EXPECT_EQ(cache.size(), 2u);
	EXPECT_EQ(cache.purge(), 1u);
	EXPECT_EQ(cache.peek("a"), nullptr);
	EXPECT_EQ(cache.peek("b"), kept);
}
