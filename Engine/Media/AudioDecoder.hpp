/**
 *  AudioDecoder.hpp
 *  SNRScripter
 *
 *  FFmpeg backed decoding of the opus packets inside NXA files.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Formats/Audio.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/frame.h>
}

#include <memory>
#include <cstdint>

// Appends a decoded frame as stereo floats, mono is duplicated and extra channels are dropped
bool appendFrameSamples(const AVFrame *frame, int channels, AudioBuffer &destination);

class OpusFrameDecoder : public AudioFrameSource {
	AudioFrameReader reader;
	AVCodecContext *codecContext{nullptr};
	AVPacket *packet{nullptr};
	AVFrame *frame{nullptr};

public:
	// Throws AssetError::DecodeFailed when FFmpeg has no opus decoder
	explicit OpusFrameDecoder(std::shared_ptr<const AudioFile> file);
	~OpusFrameDecoder() override;
	OpusFrameDecoder(const OpusFrameDecoder &) = delete;
	OpusFrameDecoder &operator=(const OpusFrameDecoder &) = delete;

	const AudioInfo &info() const {
		return reader.info();
	}

	size_t maxFrameSize() const override {
		// 120 ms at 48 kHz is the longest opus packet
		return 5760;
	}
	uint32_t sampleRate() const override {
		return reader.info().sampleRate;
	}
	uint32_t preSkip() const override {
		return reader.info().preSkip;
	}
	uint32_t preRoll() const override {
		return OPUS_PRE_ROLL;
	}
	bool readFrame(AudioBuffer &destination) override;
	uint32_t samplesSeek(uint32_t samplePosition) override;
	uint32_t currentSamplePosition() const override {
		return static_cast<uint32_t>(reader.framePosition() * reader.info().frameSamples);
	}
};
