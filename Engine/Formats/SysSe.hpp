/**
 *  SysSe.hpp
 *  SNRScripter
 *
 *  SYSE container of ADPCM encoded system sounds.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Formats/Audio.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

const size_t ADPCM_BLOCK_BYTES   = 16;
const size_t ADPCM_BLOCK_SAMPLES = 30;

// Prediction history of one channel
struct AdpcmHistory {
	int32_t sample1{0};
	int32_t sample2{0};
};

// Decodes one 16-byte block: a shift/filter header byte and 15 bytes of two 4-bit residuals each
void decodeAdpcmBlock(AdpcmHistory &history, const uint8_t *block, int16_t *out);

struct SysSeSound {
	uint16_t channelCount{1};
	uint32_t sampleRate{0};
	uint32_t sampleCount{0};
	std::vector<uint8_t> sampleData;
};

class SysSeDecoder : public AudioFrameSource {
	std::shared_ptr<const SysSeSound> sound;
	size_t blockOffset{0};
	uint32_t samplePosition{0};
	bool reachedEnd{false};
	AdpcmHistory left, right;

public:
	static const size_t BLOCKS_PER_FRAME = 80;

	explicit SysSeDecoder(std::shared_ptr<const SysSeSound> s)
	    : sound(std::move(s)) {}

	size_t maxFrameSize() const override {
		return BLOCKS_PER_FRAME * ADPCM_BLOCK_SAMPLES;
	}
	uint32_t sampleRate() const override {
		return sound->sampleRate;
	}
	uint32_t preSkip() const override {
		return 0;
	}
	uint32_t preRoll() const override {
		return 0;
	}
	bool readFrame(AudioBuffer &destination) override;
	// Only rewinding to the start is possible
	uint32_t samplesSeek(uint32_t position) override;
	uint32_t currentSamplePosition() const override {
		return samplePosition;
	}
};

using SysSe = std::map<std::string, std::shared_ptr<const SysSeSound>>;

SysSe readSysSe(const uint8_t *data, size_t len);
