/**
 *  SavedataTests.cpp
 *  SNRScripter
 *
 *  Save file packing and obfuscation.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Formats/Savedata.hpp"

#include <gtest/gtest.h>

namespace {
GameData slotAt(uint32_t position) {
	GameData g;
	g.dateTime.year   = 2024;
	g.dateTime.month  = 2;
	g.dateTime.day    = 29;
	g.dateTime.hour   = 23;
	g.dateTime.minute = 59;
	g.dateTime.second = 1;
	g.scenarioId      = 4;
	g.randomSeed      = 0xDEADBEEF;
	g.savePosition    = position;
	g.selectionData   = {1, 0, 2};
	return g;
}
} // namespace

TEST(Savedata, SurvivesTheObfuscatedEnvelope) {
	Savedata save;
	save.saveMenuPosition = 3;
	save.playSeconds      = 3600;
	save.persist.set(70, -5);
	save.vectors.seenMessages   = {0xFFFFFFFF, 1};
	save.vectors.chosenVariants = {0xF, 3};
	save.settings.bgmVolume     = 42;
	save.settings.showSongTitle = false;
	save.manualSlots[7].set(slotAt(0x1234));

	auto bytes = save.encode(saveGameKey());
	auto back  = Savedata::decode(bytes, saveGameKey());
	EXPECT_EQ(back, save);
	EXPECT_EQ(back.persist.get(70), -5);
	EXPECT_EQ(back.persist.raw().size(), 128u);
	EXPECT_FALSE(back.autoSave.has());
	ASSERT_TRUE(back.manualSlots[7].has());
	EXPECT_EQ(back.manualSlots[7].get().savePosition, 0x1234u);
}

TEST(Savedata, ZeroCounterIsAnEmptySave) {
	std::vector<uint8_t> plain{0x00};
	auto back = Savedata::decode(obfuscateSave(plain, saveGameKey()), saveGameKey());
	EXPECT_EQ(back, Savedata());
}

TEST(Savedata, InvalidSlotDateThrows) {
	Savedata save;
	auto bad           = slotAt(0);
	bad.dateTime.month = 2;
	bad.dateTime.day   = 30;
	save.autoSave.set(bad);

	BitWriter w;
	save.write(w);
	auto plain = w.take();
	BitReader r(plain);
	EXPECT_THROW(Savedata::read(r), ParseError);
}

TEST(Obfuscation, ChecksumMismatchThrows) {
	std::vector<uint8_t> plain{1, 2, 3, 4, 5, 6, 7};
	auto data = obfuscateSave(plain, 0x1234);
	EXPECT_EQ(data.size(), plain.size() + 4);
	EXPECT_EQ(deobfuscateSave(data, 0x1234), plain);

	auto corrupt = data;
	corrupt[2] ^= 0x40;
	EXPECT_THROW(deobfuscateSave(corrupt, 0x1234), ParseError);
	EXPECT_THROW(deobfuscateSave(data, 0x1235), ParseError);
	EXPECT_THROW(deobfuscateSave({1, 2}, 0x1234), ParseError);
}

TEST(Obfuscation, KeysComeFromTheSeedCrc) {
	// crc32("123456789")
	EXPECT_EQ(saveKeyFromSeed("123456789"), 0xCBF43926u);
	EXPECT_EQ(saveGameKey(), saveKeyFromSeed(u8"うみねこのなく頃に咲"));
}

TEST(PersistData, GrowsInBlocksOf64) {
	PersistData p;
	EXPECT_EQ(p.get(10), 0);
	EXPECT_TRUE(p.set(0, 7));
	EXPECT_EQ(p.raw().size(), 64u);
	EXPECT_TRUE(p.set(64, 1));
	EXPECT_EQ(p.raw().size(), 128u);
	EXPECT_FALSE(p.set(-1, 1));
	EXPECT_FALSE(p.set(3, 40000));
	EXPECT_EQ(p.get(-3), 0);
	EXPECT_EQ(p.get(0), 7);
}

TEST(Savedata, DescriptionListsOccupiedSlots) {
	Savedata save;
	save.manualSlots[12].set(slotAt(0x40));
	auto text = describeSavedata(save);
	EXPECT_NE(text.find("slot 12: 2024-02-29 23:59:01 scenario 4 position 0x40"), std::string::npos);
	EXPECT_EQ(text.find("auto:"), std::string::npos);
}
