/**
 *  Savedata.hpp
 *  SNRScripter
 *
 *  Bit-packed save file with its obfuscation envelope.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Support/BitStream.hpp"

#include <array>
#include <string>
#include <vector>
#include <cstdint>

const size_t SAVE_MANUAL_SLOTS = 100;

// crc32 of the game title, the key every shipped save is obfuscated with
uint32_t saveGameKey();
uint32_t saveKeyFromSeed(const std::string &seed);

// Both throw ParseError, deobfuscation also on a CRC mismatch
std::vector<uint8_t> obfuscateSave(const std::vector<uint8_t> &plain, uint32_t key);
std::vector<uint8_t> deobfuscateSave(const std::vector<uint8_t> &data, uint32_t key);

// Global progression variables, independent of the save slots
class PersistData {
	std::vector<int16_t> values;

public:
	PersistData() = default;
	explicit PersistData(std::vector<int16_t> &&v)
	    : values(std::move(v)) {}

	// Out of range indices read as 0
	int32_t get(int32_t index) const;
	// Grows the storage in steps of 64, false for a negative index or a value outside of int16
	bool set(int32_t index, int32_t value);

	const std::vector<int16_t> &raw() const {
		return values;
	}
	bool operator==(const PersistData &o) const {
		return values == o.values;
	}
};

struct SaveVectors {
	std::vector<uint32_t> seenMessages;
	std::vector<uint32_t> seenChoices;
	// 4-bit entries
	std::vector<uint8_t> chosenVariants;
	std::vector<uint32_t> unlockedCgs;
	std::vector<uint32_t> unlockedBgms;
	std::vector<uint32_t> unlockedTips;

	bool operator==(const SaveVectors &o) const {
		return seenMessages == o.seenMessages && seenChoices == o.seenChoices && chosenVariants == o.chosenVariants &&
		       unlockedCgs == o.unlockedCgs && unlockedBgms == o.unlockedBgms && unlockedTips == o.unlockedTips;
	}
};

struct SaveSettings {
	uint8_t bgmVolume{100};
	uint8_t seVolume{100};
	uint8_t voiceVolume{100};
	uint8_t systemVolume{100};
	bool voiceFocus{true};
	bool voicePanpot{true};
	bool flag6{false};
	uint8_t value7{0};
	uint8_t value8{0};
	uint8_t messageSpeed{50};
	uint8_t skipSpeed{50};
	bool disallowSkipUnread{false};
	bool flag12{false};
	uint8_t messageWindowAlpha{80};
	bool showRouteNavigation{true};
	bool flag15{false};
	bool showTouchEffect{true};
	bool showSceneTitle{true};
	bool showSongTitle{true};
	uint32_t value19{0};

	bool operator==(const SaveSettings &o) const;
};

struct SaveDateTime {
	uint16_t year{2000};
	uint8_t month{1};
	uint8_t day{1};
	uint8_t hour{0};
	uint8_t minute{0};
	uint8_t second{0};

	bool valid() const;
	bool operator==(const SaveDateTime &o) const {
		return year == o.year && month == o.month && day == o.day && hour == o.hour && minute == o.minute && second == o.second;
	}
};

// Minimal data needed to resume from a save
struct GameData {
	SaveDateTime dateTime;
	int32_t scenarioId{0};
	uint32_t randomSeed{0};
	uint32_t savePosition{0};
	std::vector<uint8_t> selectionData;

	bool operator==(const GameData &o) const {
		return dateTime == o.dateTime && scenarioId == o.scenarioId && randomSeed == o.randomSeed &&
		       savePosition == o.savePosition && selectionData == o.selectionData;
	}
};

struct Savedata {
	uint8_t saveMenuPosition{0};
	uint32_t playSeconds{0};
	PersistData persist;
	SaveVectors vectors;
	SaveSettings settings;
	cmp::optional<GameData> autoSave;
	std::array<cmp::optional<GameData>, SAVE_MANUAL_SLOTS> manualSlots;

	static Savedata read(BitReader &reader);
	void write(BitWriter &writer) const;

	static Savedata decode(const std::vector<uint8_t> &data, uint32_t key);
	std::vector<uint8_t> encode(uint32_t key) const;

	bool operator==(const Savedata &o) const;
	bool operator!=(const Savedata &o) const {
		return !(*this == o);
	}
};

// Human readable dump used by the diagnostics tool
std::string describeSavedata(const Savedata &save);
