/**
 *  Audio.hpp
 *  SNRScripter
 *
 *  NXA1 opus container and the frame/sample source contracts.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"

#include <memory>
#include <vector>
#include <cstdint>

struct AudioInfo {
	uint32_t sampleRate{0};
	uint16_t channelCount{0};
	// Bytes per opus packet
	uint16_t frameSize{0};
	uint16_t frameSamples{0};
	uint16_t preSkip{0};
	uint32_t sampleCount{0};
	uint32_t loopStart{0};
	uint32_t loopEnd{0};
};

struct StereoSample {
	float left{0};
	float right{0};
};

using AudioBuffer = std::vector<StereoSample>;

// Fully loaded, not yet decoded audio
struct AudioFile {
	AudioInfo info;
	std::vector<uint8_t> frames;
};

std::shared_ptr<const AudioFile> readAudio(const uint8_t *data, size_t len);

// Walks the fixed-size packets of an AudioFile
class AudioFrameReader {
	std::shared_ptr<const AudioFile> file;
	size_t bytePosition{0};

public:
	explicit AudioFrameReader(std::shared_ptr<const AudioFile> f)
	    : file(std::move(f)) {}

	const AudioInfo &info() const {
		return file->info;
	}
	size_t framePosition() const {
		return bytePosition / file->info.frameSize;
	}
	void seekToFrame(size_t frame) {
		bytePosition = static_cast<size_t>(file->info.frameSize) * frame;
	}
	bool hasNextFrame() const {
		return bytePosition < file->frames.size();
	}
	// Returns nullptr at the end
	const uint8_t *nextFrame(size_t &size);
};

// Produces audio in decoder-sized frames
class AudioFrameSource {
public:
	virtual ~AudioFrameSource() = default;
	virtual size_t maxFrameSize() const = 0;
	virtual uint32_t sampleRate() const = 0;
	// Samples to drop at the start of the stream
	virtual uint32_t preSkip() const = 0;
	// Samples to decode and drop after a seek so that the decoder converges
	virtual uint32_t preRoll() const = 0;
	// Appends one decoded frame, false at the end of the stream
	virtual bool readFrame(AudioBuffer &destination) = 0;
	// Positions on the frame holding the raw sample position and returns the offset inside that frame
	virtual uint32_t samplesSeek(uint32_t samplePosition) = 0;
	// Raw position of the first sample of the next frame
	virtual uint32_t currentSamplePosition() const = 0;
};

// Sample-by-sample view of a frame source with pre-skip and pre-roll applied
class AudioSource {
	std::unique_ptr<AudioFrameSource> source;
	AudioBuffer buffer;
	uint32_t position{0};
	uint32_t skipLeft{0};

	uint32_t skipBuffered(uint32_t count);

public:
	explicit AudioSource(std::unique_ptr<AudioFrameSource> src);

	uint32_t sampleRate() const {
		return source->sampleRate();
	}
	// 0 is the first audible sample
	void samplesSeek(uint32_t samplePosition);
	bool readSample(StereoSample &sample);
	uint32_t currentSamplePosition() const;

	AudioFrameSource &inner() {
		return *source;
	}
};

const uint32_t OPUS_PRE_ROLL = 3840;
