/**
 *  Savedata.cpp
 *  SNRScripter
 *
 *  Bit-packed save file with its obfuscation envelope.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Formats/Savedata.hpp"
#include "Support/FileDefs.hpp"

#include <zlib.h>

#include <algorithm>
#include <limits>
#include <sstream>
#include <cstdio>
#include <cstring>

namespace {
uint32_t crc32Of(const uint8_t *data, size_t len) {
	uLong crc = crc32(0L, Z_NULL, 0);
	return static_cast<uint32_t>(crc32(crc, data, static_cast<uInt>(len)));
}

uint32_t crc32OfWord(uint32_t word) {
	uint8_t le[4];
	storeLE32(le, word);
	return crc32Of(le, sizeof(le));
}

// Runs over big-endian words, a partial last word is zero padded
template <typename Transform>
void transformWords(uint8_t *data, size_t len, uint32_t key, Transform transform) {
	for (size_t i = 0; i < len; i += 4) {
		uint8_t chunk[4]{};
		size_t n = std::min<size_t>(4, len - i);
		std::memcpy(chunk, data + i, n);
		uint32_t word = transform(loadBE32(chunk), key);
		storeBE32(chunk, word);
		std::memcpy(data + i, chunk, n);
	}
}

void decodeOnce(uint8_t *data, size_t len, uint32_t key) {
	transformWords(data, len, key, [](uint32_t word, uint32_t &k) {
		uint32_t out = word ^ k;
		k ^= crc32OfWord(word);
		return out;
	});
}

void encodeOnce(uint8_t *data, size_t len, uint32_t key) {
	transformWords(data, len, key, [](uint32_t word, uint32_t &k) {
		uint32_t out = word ^ k;
		k ^= crc32OfWord(out);
		return out;
	});
}

template <typename T>
std::vector<T> readVector(BitReader &r, unsigned countBits, unsigned elementBits) {
	uint32_t count = r.read(countBits);
	std::vector<T> v;
	v.reserve(count);
	for (uint32_t i = 0; i < count; i++) v.push_back(static_cast<T>(r.read(elementBits)));
	return v;
}

template <typename T>
void writeVector(BitWriter &w, const std::vector<T> &v, unsigned countBits, unsigned elementBits) {
	w.write(static_cast<uint32_t>(v.size()), countBits);
	for (auto &e : v) w.write(static_cast<uint32_t>(e), elementBits);
}

GameData readGameData(BitReader &r) {
	GameData g;
	g.dateTime.year   = r.read(12);
	g.dateTime.month  = r.read(4);
	g.dateTime.day    = r.read(5);
	g.dateTime.hour   = r.read(5);
	g.dateTime.minute = r.read(6);
	g.dateTime.second = r.read(6);
	if (!g.dateTime.valid())
		throw ParseError(ParseError::Kind::InvalidByte, "invalid save slot date");
	if (r.read(1) != 0)
		throw ParseError(ParseError::Kind::Unsupported, "save slot with an extra array");

	g.scenarioId    = static_cast<int32_t>(r.read(32));
	g.randomSeed    = r.read(32);
	g.savePosition  = r.read(32);
	g.selectionData = readVector<uint8_t>(r, 32, 8);
	return g;
}

void writeGameData(BitWriter &w, const GameData &g) {
	w.write(g.dateTime.year, 12);
	w.write(g.dateTime.month, 4);
	w.write(g.dateTime.day, 5);
	w.write(g.dateTime.hour, 5);
	w.write(g.dateTime.minute, 6);
	w.write(g.dateTime.second, 6);
	w.write(0, 1);
	w.write(static_cast<uint32_t>(g.scenarioId), 32);
	w.write(g.randomSeed, 32);
	w.write(g.savePosition, 32);
	writeVector(w, g.selectionData, 32, 8);
}

cmp::optional<GameData> readSlot(BitReader &r) {
	cmp::optional<GameData> slot;
	if (r.readBool())
		slot.set(readGameData(r));
	return slot;
}

void writeSlot(BitWriter &w, const cmp::optional<GameData> &slot) {
	w.writeBool(slot.has());
	if (slot.has())
		writeGameData(w, slot.get());
}
} // namespace

uint32_t saveKeyFromSeed(const std::string &seed) {
	return crc32Of(reinterpret_cast<const uint8_t *>(seed.data()), seed.size());
}

uint32_t saveGameKey() {
	static const uint32_t key = saveKeyFromSeed(u8"うみねこのなく頃に咲");
	return key;
}

std::vector<uint8_t> obfuscateSave(const std::vector<uint8_t> &plain, uint32_t key) {
	std::vector<uint8_t> data(plain);
	uint32_t crc = crc32Of(data.data(), data.size());
	encodeOnce(data.data(), data.size(), crc);
	uint8_t tail[4];
	storeLE32(tail, crc);
	data.insert(data.end(), tail, tail + 4);
	encodeOnce(data.data(), data.size(), key);
	return data;
}

std::vector<uint8_t> deobfuscateSave(const std::vector<uint8_t> &input, uint32_t key) {
	if (input.size() < 4)
		throw ParseError(ParseError::Kind::TruncatedStream, "save data is shorter than its checksum");

	std::vector<uint8_t> data(input);
	decodeOnce(data.data(), data.size(), key);

	size_t payload = data.size() - 4;
	uint32_t crc   = loadLE32(data.data() + payload);
	// The checksum doubles as the inner key
	decodeOnce(data.data(), payload, crc);
	if (crc32Of(data.data(), payload) != crc)
		throw ParseError(ParseError::Kind::BadLength, "save obfuscation CRC mismatch");

	data.resize(payload);
	return data;
}

int32_t PersistData::get(int32_t index) const {
	if (index < 0 || static_cast<size_t>(index) >= values.size())
		return 0;
	return values[index];
}

bool PersistData::set(int32_t index, int32_t value) {
	if (index < 0 || value < std::numeric_limits<int16_t>::min() || value > std::numeric_limits<int16_t>::max())
		return false;
	if (static_cast<size_t>(index) >= values.size())
		values.resize((static_cast<size_t>(index) / 64 + 1) * 64, 0);
	values[index] = static_cast<int16_t>(value);
	return true;
}

bool SaveSettings::operator==(const SaveSettings &o) const {
	return bgmVolume == o.bgmVolume && seVolume == o.seVolume && voiceVolume == o.voiceVolume &&
	       systemVolume == o.systemVolume && voiceFocus == o.voiceFocus && voicePanpot == o.voicePanpot &&
	       flag6 == o.flag6 && value7 == o.value7 && value8 == o.value8 && messageSpeed == o.messageSpeed &&
	       skipSpeed == o.skipSpeed && disallowSkipUnread == o.disallowSkipUnread && flag12 == o.flag12 &&
	       messageWindowAlpha == o.messageWindowAlpha && showRouteNavigation == o.showRouteNavigation &&
	       flag15 == o.flag15 && showTouchEffect == o.showTouchEffect && showSceneTitle == o.showSceneTitle &&
	       showSongTitle == o.showSongTitle && value19 == o.value19;
}

bool SaveDateTime::valid() const {
	static const uint8_t days[] = {31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month < 1 || month > 12 || day < 1 || hour > 23 || minute > 59 || second > 59)
		return false;
	if (day > days[month - 1])
		return false;
	bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
	return month != 2 || day < 29 || leap;
}

Savedata Savedata::read(BitReader &r) {
	Savedata save;

	uint32_t counter = r.read(8);
	if (counter == 0)
		return save;
	if (counter > 1)
		throw ParseError(ParseError::Kind::Unsupported, "save counter is " + std::to_string(counter));

	save.saveMenuPosition = r.read(7);
	save.playSeconds      = r.read(32);
	r.align();

	save.persist = PersistData(readVector<int16_t>(r, 16, 16));

	r.align();
	save.vectors.seenMessages   = readVector<uint32_t>(r, 16, 32);
	save.vectors.seenChoices    = readVector<uint32_t>(r, 16, 32);
	save.vectors.chosenVariants = readVector<uint8_t>(r, 16, 4);
	save.vectors.unlockedCgs    = readVector<uint32_t>(r, 16, 32);
	save.vectors.unlockedBgms   = readVector<uint32_t>(r, 16, 32);
	save.vectors.unlockedTips   = readVector<uint32_t>(r, 16, 32);

	auto &s               = save.settings;
	s.bgmVolume           = r.read(7);
	s.seVolume            = r.read(7);
	s.voiceVolume         = r.read(7);
	s.systemVolume        = r.read(7);
	s.voiceFocus          = r.readBool();
	s.voicePanpot         = r.readBool();
	s.flag6               = r.readBool();
	s.value7              = r.read(2);
	s.value8              = r.read(2);
	s.messageSpeed        = r.read(7);
	s.skipSpeed           = r.read(7);
	s.disallowSkipUnread  = r.readBool();
	s.flag12              = r.readBool();
	s.messageWindowAlpha  = r.read(7);
	s.showRouteNavigation = r.readBool();
	s.flag15              = r.readBool();
	s.showTouchEffect     = r.readBool();
	s.showSceneTitle      = r.readBool();
	s.showSongTitle       = r.readBool();
	s.value19             = r.read(32);

	save.autoSave = readSlot(r);
	for (auto &slot : save.manualSlots) slot = readSlot(r);

	return save;
}

void Savedata::write(BitWriter &w) const {
	w.write(1, 8);
	w.write(saveMenuPosition, 7);
	w.write(playSeconds, 32);
	w.align();

	writeVector(w, persist.raw(), 16, 16);

	w.align();
	writeVector(w, vectors.seenMessages, 16, 32);
	writeVector(w, vectors.seenChoices, 16, 32);
	writeVector(w, vectors.chosenVariants, 16, 4);
	writeVector(w, vectors.unlockedCgs, 16, 32);
	writeVector(w, vectors.unlockedBgms, 16, 32);
	writeVector(w, vectors.unlockedTips, 16, 32);

	auto &s = settings;
	w.write(s.bgmVolume, 7);
	w.write(s.seVolume, 7);
	w.write(s.voiceVolume, 7);
	w.write(s.systemVolume, 7);
	w.writeBool(s.voiceFocus);
	w.writeBool(s.voicePanpot);
	w.writeBool(s.flag6);
	w.write(s.value7, 2);
	w.write(s.value8, 2);
	w.write(s.messageSpeed, 7);
	w.write(s.skipSpeed, 7);
	w.writeBool(s.disallowSkipUnread);
	w.writeBool(s.flag12);
	w.write(s.messageWindowAlpha, 7);
	w.writeBool(s.showRouteNavigation);
	w.writeBool(s.flag15);
	w.writeBool(s.showTouchEffect);
	w.writeBool(s.showSceneTitle);
	w.writeBool(s.showSongTitle);
	w.write(s.value19, 32);

	writeSlot(w, autoSave);
	for (auto &slot : manualSlots) writeSlot(w, slot);
}

Savedata Savedata::decode(const std::vector<uint8_t> &data, uint32_t key) {
	auto plain = deobfuscateSave(data, key);
	BitReader reader(plain);
	return read(reader);
}

std::vector<uint8_t> Savedata::encode(uint32_t key) const {
	BitWriter writer;
	write(writer);
	return obfuscateSave(writer.take(), key);
}

bool Savedata::operator==(const Savedata &o) const {
	if (saveMenuPosition != o.saveMenuPosition || playSeconds != o.playSeconds || !(persist == o.persist) ||
	    !(vectors == o.vectors) || !(settings == o.settings) || autoSave != o.autoSave)
		return false;
	for (size_t i = 0; i < SAVE_MANUAL_SLOTS; i++)
		if (manualSlots[i] != o.manualSlots[i])
			return false;
	return true;
}

std::string describeSavedata(const Savedata &save) {
	std::ostringstream out;
	out << "menu position: " << static_cast<int>(save.saveMenuPosition) << "\n";
	out << "play time: " << save.playSeconds << "s\n";
	out << "persist values: " << save.persist.raw().size() << "\n";
	out << "seen messages words: " << save.vectors.seenMessages.size() << "\n";
	out << "unlocked cgs: " << save.vectors.unlockedCgs.size() << "\n";

	auto slot = [&out](const char *name, const GameData &g) {
		char date[32];
		std::snprintf(date, sizeof(date), "%04u-%02u-%02u %02u:%02u:%02u", g.dateTime.year, g.dateTime.month,
		              g.dateTime.day, g.dateTime.hour, g.dateTime.minute, g.dateTime.second);
		out << name << ": " << date << " scenario " << g.scenarioId << " position 0x" << std::hex << g.savePosition
		    << " seed 0x" << g.randomSeed << std::dec << " selections " << g.selectionData.size() << "\n";
	};

	if (save.autoSave.has())
		slot("auto", save.autoSave.get());
	for (size_t i = 0; i < SAVE_MANUAL_SLOTS; i++) {
		if (save.manualSlots[i].has()) {
			std::string name = "slot " + std::to_string(i);
			slot(name.c_str(), save.manualSlots[i].get());
		}
	}
	return out.str();
}
