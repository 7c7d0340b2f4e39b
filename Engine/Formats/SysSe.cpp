/**
 *  SysSe.cpp
 *  SNRScripter
 *
 *  SYSE container of ADPCM encoded system sounds.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Formats/SysSe.hpp"
#include "Support/ByteStream.hpp"

#include <algorithm>
#include <limits>

namespace {
const uint32_t SYSE_MAGIC = 0x45535953; // "SYSE"
const uint32_t ADP_MAGIC  = 0x31504441; // "ADP1"

struct Fir {
	int32_t ir1, ir2;
};

const Fir DECODER_FIR_TABLE[] = {{0, 0}, {60, 0}, {115, -52}, {98, -55}, {122, -60}};

inline int32_t signExtend4(uint8_t bits) {
	return static_cast<int32_t>(static_cast<uint32_t>(bits) << 28) >> 28;
}

inline float toFloat(int16_t sample) {
	return cmp::clamp(sample / static_cast<float>(std::numeric_limits<int16_t>::max()), -1.0f, 1.0f);
}

std::shared_ptr<const SysSeSound> readSound(const uint8_t *data, size_t len) {
	ByteReader r(data, len);
	if (r.u32() != ADP_MAGIC)
		throw ParseError(ParseError::Kind::InvalidMagic, "not an ADP1 sound");
	if (r.u32() != len)
		throw ParseError(ParseError::Kind::BadLength, "sound size mismatch");

	auto sound          = std::make_shared<SysSeSound>();
	sound->channelCount = r.u16();
	sound->sampleRate   = r.u16();
	sound->sampleCount  = r.u32();
	if (sound->channelCount != 1 && sound->channelCount != 2)
		throw ParseError(ParseError::Kind::Unsupported, "sound with " + std::to_string(sound->channelCount) + " channels");
	sound->sampleData.assign(r.current(), r.current() + r.remaining());
	return sound;
}
} // namespace

void decodeAdpcmBlock(AdpcmHistory &history, const uint8_t *block, int16_t *out) {
	uint8_t shift = block[0] & 0xF;
	size_t filter = (block[0] >> 4) & 0x7;
	if (filter >= sizeof(DECODER_FIR_TABLE) / sizeof(DECODER_FIR_TABLE[0]))
		throw ParseError(ParseError::Kind::InvalidByte, "adpcm filter index " + std::to_string(filter));
	const Fir &fir = DECODER_FIR_TABLE[filter];

	auto decode = [&](int32_t residual) {
		int32_t predicted = fir.ir1 * history.sample1 + fir.ir2 * history.sample2;
		predicted += 32;
		if (predicted < 0)
			predicted += 63;
		predicted >>= 6;

		int32_t sample = predicted + static_cast<int32_t>(static_cast<uint32_t>(residual) << shift);
		sample         = cmp::clamp<int32_t>(sample, std::numeric_limits<int16_t>::min(), std::numeric_limits<int16_t>::max());

		history.sample2 = history.sample1;
		history.sample1 = sample;
		return static_cast<int16_t>(sample);
	};

	for (size_t i = 1; i < ADPCM_BLOCK_BYTES; i++) {
		*out++ = decode(signExtend4(block[i] & 0xF));
		*out++ = decode(signExtend4(block[i] >> 4));
	}
}

bool SysSeDecoder::readFrame(AudioBuffer &destination) {
	if (reachedEnd)
		return false;

	const size_t stride = ADPCM_BLOCK_BYTES * sound->channelCount;
	bool written        = false;
	int16_t l[ADPCM_BLOCK_SAMPLES], r[ADPCM_BLOCK_SAMPLES];

	for (size_t b = 0; b < BLOCKS_PER_FRAME; b++) {
		if (blockOffset + stride > sound->sampleData.size()) {
			reachedEnd = true;
			break;
		}
		const uint8_t *block = sound->sampleData.data() + blockOffset;
		blockOffset += stride;
		written = true;

		decodeAdpcmBlock(left, block, l);
		if (sound->channelCount == 2)
			decodeAdpcmBlock(right, block + ADPCM_BLOCK_BYTES, r);
		else
			std::copy(l, l + ADPCM_BLOCK_SAMPLES, r);

		size_t count = ADPCM_BLOCK_SAMPLES;
		if (samplePosition + count > sound->sampleCount) {
			count      = sound->sampleCount - samplePosition;
			reachedEnd = true;
		}
		for (size_t i = 0; i < count; i++)
			destination.push_back({toFloat(l[i]), toFloat(r[i])});
		samplePosition += static_cast<uint32_t>(count);
		if (reachedEnd)
			break;
	}

	return written;
}

uint32_t SysSeDecoder::samplesSeek(uint32_t position) {
	if (position != 0)
		throw ParseError(ParseError::Kind::Unsupported, "system sounds can only be rewound");
	blockOffset    = 0;
	samplePosition = 0;
	reachedEnd     = false;
	left           = AdpcmHistory();
	right          = AdpcmHistory();
	return 0;
}

SysSe readSysSe(const uint8_t *data, size_t len) {
	ByteReader r(data, len);
	if (r.u32() != SYSE_MAGIC)
		throw ParseError(ParseError::Kind::InvalidMagic, "not a SYSE file");
	if (r.u32() != len)
		throw ParseError(ParseError::Kind::BadLength, "SYSE file size mismatch");

	uint32_t count = r.u32();
	SysSe sounds;
	for (uint32_t i = 0; i < count; i++) {
		std::string name = r.fixedString(16);
		uint32_t offset  = r.u32();
		uint32_t size    = r.u32();
		if (offset > len || size > len - offset)
			throw ParseError(ParseError::Kind::TruncatedStream, "sound " + name + " outside of the file");
		sounds[name] = readSound(data + offset, size);
	}
	return sounds;
}
