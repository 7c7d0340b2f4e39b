/**
 *  ReaderTests.cpp
 *  SNRScripter
 *
 *  Loose files, ROM2 archives and the layered lookup.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Readers/Direct.hpp"
#include "Engine/Readers/Layered.hpp"
#include "Engine/Readers/Rom.hpp"
#include "tests/Builders.hpp"
#include "tests/TempDir.hpp"

#include <gtest/gtest.h>

using namespace TestData;

namespace {
std::vector<uint8_t> bytes(const std::string &s) {
	return std::vector<uint8_t>(s.begin(), s.end());
}

std::vector<std::string> names(BaseReader &reader, bool directories = false) {
	std::vector<BaseReader::FileInfo> files;
	reader.listFiles(files);
	std::vector<std::string> out;
	for (auto &f : files)
		if (f.directory == directories)
			out.push_back(f.name);
	return out;
}
} // namespace

TEST(RomReader, ReadsNestedFiles) {
	TempDir dir;
	auto path = dir.write("data.rom", rom({{"main.snr", bytes("scenario")},
	                                        {"picture/bg/sky.pic", bytes("sky")},
	                                        {"picture/title.pic", bytes("title!")}}));

	RomReader reader(path);
	ASSERT_EQ(reader.open(), 0);
	EXPECT_EQ(reader.getNumFiles(), 3u);

	std::vector<uint8_t> buffer;
	ASSERT_TRUE(reader.getFile("/picture/bg/sky.pic", buffer));
	EXPECT_EQ(buffer, bytes("sky"));
	ASSERT_TRUE(reader.getFile("/main.snr", buffer));
	EXPECT_EQ(buffer, bytes("scenario"));

	EXPECT_TRUE(reader.hasFile("/picture/title.pic"));
	EXPECT_FALSE(reader.hasFile("/picture"));
	EXPECT_FALSE(reader.hasFile("/picture/missing.pic"));
	EXPECT_FALSE(reader.hasFile("main.snr"));
	EXPECT_FALSE(reader.getFile("/main.snr/inner", buffer));

	auto node = reader.findFile("/picture/title.pic");
	ASSERT_NE(node, nullptr);
	uint8_t part[3];
	ASSERT_TRUE(reader.readFile(*node, 2, 3, part));
	EXPECT_EQ(std::string(part, part + 3), "tle");
	EXPECT_FALSE(reader.readFile(*node, 4, 3, part));
}

TEST(RomReader, ListsDepthFirstInNameOrder) {
	TempDir dir;
	auto path = dir.write("data.rom", rom({{"b.txt", bytes("b")}, {"a/z.txt", bytes("z")}, {"a/y.txt", bytes("y")}}));

	RomReader reader(path);
	ASSERT_EQ(reader.open(), 0);
	EXPECT_EQ(names(reader), (std::vector<std::string>{"/a/y.txt", "/a/z.txt", "/b.txt"}));
	EXPECT_EQ(names(reader, true), (std::vector<std::string>{"/a"}));
}

TEST(RomReader, RejectsBrokenArchives) {
	TempDir dir;
	auto archive = rom({{"x", bytes("x")}});

	auto wrongMagic = archive;
	wrongMagic[0]   = 'X';
	RomReader magic(dir.write("magic.rom", wrongMagic));
	EXPECT_EQ(magic.open(), -1);

	auto wrongVersion = archive;
	wrongVersion[4]   = 2;
	RomReader version(dir.write("version.rom", wrongVersion));
	EXPECT_EQ(version.open(), -1);

	std::vector<uint8_t> cut(archive.begin(), archive.begin() + 40);
	RomReader truncated(dir.write("cut.rom", cut));
	EXPECT_EQ(truncated.open(), -1);
	EXPECT_EQ(truncated.getNumFiles(), 0u);

	RomReader missing(dir.path() + "absent.rom");
	EXPECT_EQ(missing.open(), -1);
}

TEST(DirectReader, ServesLooseFiles) {
	TempDir dir;
	dir.write("voice/01/line.nxa", bytes("voice"));
	dir.write("main.snr", bytes("snr"));

	DirectReader reader(dir.path());
	ASSERT_EQ(reader.open(nullptr), 0);
	std::vector<uint8_t> buffer;
	ASSERT_TRUE(reader.getFile("/voice/01/line.nxa", buffer));
	EXPECT_EQ(buffer, bytes("voice"));
	EXPECT_TRUE(reader.hasFile("/main.snr"));
	EXPECT_FALSE(reader.hasFile("/voice"));
	EXPECT_FALSE(reader.getFile("/nothing", buffer));
	EXPECT_EQ(reader.getNumFiles(), 2u);
	EXPECT_EQ(names(reader), (std::vector<std::string>{"/main.snr", "/voice/01/line.nxa"}));

	DirectReader absent(dir.path() + "nowhere");
	EXPECT_EQ(absent.open(nullptr), -1);
}

TEST(LayeredReader, EarlierReadersWin) {
	TempDir dir;
	dir.write("loose/picture/sky.pic", bytes("patched"));
	auto path = dir.write("data.rom", rom({{"picture/sky.pic", bytes("original")}, {"picture/sea.pic", bytes("sea")}}));

	LayeredReader reader;
	reader.addReader(std::make_unique<DirectReader>(dir.path() + "loose"));
	reader.addReader(std::make_unique<RomReader>(path));
	ASSERT_EQ(reader.open(), 0);
	EXPECT_EQ(reader.getNumReaders(), 2u);

	std::vector<uint8_t> buffer;
	ASSERT_TRUE(reader.getFile("/picture/sky.pic", buffer));
	EXPECT_EQ(buffer, bytes("patched"));
	ASSERT_TRUE(reader.getFile("/picture/sea.pic", buffer));
	EXPECT_EQ(buffer, bytes("sea"));
	EXPECT_FALSE(reader.hasFile("/picture/moon.pic"));

	// The shadowed archive entry is listed once
	EXPECT_EQ(reader.getNumFiles(), 2u);
	EXPECT_EQ(names(reader, true), (std::vector<std::string>{"/picture"}));
}
