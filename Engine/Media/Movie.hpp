/**
 *  Movie.hpp
 *  SNRScripter
 *
 *  H.264/AAC movie decoding into NV12 frames and the player that paces them.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "External/LimitedQueue.hpp"
#include "Engine/Formats/Audio.hpp"
#include "Engine/Graphics/Common.hpp"
#include "Support/Clock.hpp"

#include <array>
#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>

struct AVFormatContext;
struct AVIOContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

struct FrameTiming {
	// Seconds from the start of the movie
	double startTime{0};
	double duration{0};
};

// Full resolution luma followed by interleaved half resolution chroma
struct Nv12Frame {
	int width{0};
	int height{0};
	std::vector<uint8_t> y;
	std::vector<uint8_t> uv;
};

struct MovieFrame {
	FrameTiming timing;
	Nv12Frame image;
};

const size_t MOVIE_FRAME_QUEUE_SIZE  = 60;
const size_t MOVIE_TIMING_QUEUE_SIZE = 10;

// Turns decoder timestamps into ordered start times and durations.
// Timestamps may arrive out of order, the queue holds a small window to sort them.
class FrameTimingQueue {
	std::deque<double> window;
	double fallbackDuration;
	bool flushing{false};

public:
	explicit FrameTimingQueue(double frameDuration = 1.0 / 30.0)
	    : fallbackDuration(frameDuration) {}

	// false when the window is full, pop first
	bool push(double timestamp);
	// The earliest timestamp once its successor is known, or any at the end
	bool pop(FrameTiming &timing);
	// No more timestamps will come
	void finish() {
		flushing = true;
	}
	bool full() const {
		return window.size() >= MOVIE_TIMING_QUEUE_SIZE;
	}
	size_t size() const {
		return window.size();
	}
};

// Demuxes an in-memory MP4 and decodes video to NV12 and audio to stereo floats
class VideoDecoder {
	struct MemoryInput {
		std::shared_ptr<const std::vector<uint8_t>> data;
		size_t position{0};
	};

	std::string label;
	MemoryInput input;
	AVIOContext *ioContext{nullptr};
	AVFormatContext *formatContext{nullptr};
	AVCodecContext *videoContext{nullptr};
	AVCodecContext *audioContext{nullptr};
	SwsContext *convertContext{nullptr};
	AVPacket *packet{nullptr};
	AVFrame *frame{nullptr};
	int videoStream{-1};
	int audioStream{-1};
	int audioChannels{0};
	double videoTimeBase{0};
	bool demuxFinished{false};
	bool videoFlushed{false};

	FrameTimingQueue timings;
	std::map<int64_t, Nv12Frame> decodedFrames;

	static int readPacket(void *opaque, uint8_t *buf, int size);
	static int64_t seek(void *opaque, int64_t offset, int whence);

	AVCodecContext *openDecoder(int stream);
	void receiveVideoFrames();
	void receiveAudioFrames(AudioBuffer *audio);
	bool convertFrame(Nv12Frame &out);
	void release();

public:
	// Throws AssetError::DecodeFailed when the container or a stream cannot be opened
	VideoDecoder(std::shared_ptr<const std::vector<uint8_t>> data, std::string name);
	~VideoDecoder();
	VideoDecoder(const VideoDecoder &) = delete;
	VideoDecoder &operator=(const VideoDecoder &) = delete;

	const std::string &name() const {
		return label;
	}
	void frameSize(int &width, int &height) const;
	bool hasAudio() const {
		return audioContext != nullptr;
	}
	uint32_t audioSampleRate() const;

	// Next frame in presentation order, audio decoded on the way is appended to audio when given.
	// false at the end of the movie.
	bool readFrame(MovieFrame &out, AudioBuffer *audio);
};

// Movie sound fed by the decoder, consumed by the mixer
class MovieAudioSource : public AudioFrameSource {
public:
	struct Queue {
		limited_queue<AudioBuffer, 64> buffers;
		std::atomic<bool> finished{false};
		uint32_t sampleRate{48000};
	};

private:
	std::shared_ptr<Queue> queue;
	uint32_t position{0};

public:
	explicit MovieAudioSource(std::shared_ptr<Queue> q)
	    : queue(std::move(q)) {}

	size_t maxFrameSize() const override {
		return 8192;
	}
	uint32_t sampleRate() const override {
		return queue->sampleRate;
	}
	uint32_t preSkip() const override {
		return 0;
	}
	uint32_t preRoll() const override {
		return 0;
	}
	bool readFrame(AudioBuffer &destination) override;
	// Movies are never seeked
	uint32_t samplesSeek(uint32_t samplePosition) override {
		return samplePosition;
	}
	uint32_t currentSamplePosition() const override {
		return position;
	}
};

// Paces decoded frames against a clock, the decoder runs on the IO pool
class VideoPlayer {
	struct Shared {
		std::unique_ptr<VideoDecoder> decoder;
		// Serialises pumping between the IO task and synchronous use
		std::mutex decoderMutex;
		limited_queue<MovieFrame, MOVIE_FRAME_QUEUE_SIZE> frames;
		std::shared_ptr<MovieAudioSource::Queue> audio;
		std::atomic<bool> shouldFinish{false};
		std::atomic<bool> decoderFinished{false};
		// Audio is only decoded once somebody listens
		std::atomic<bool> audioWanted{false};

		// Decodes until the frame queue is full or the movie ends, false once there is nothing left
		bool pump();
	};

	std::shared_ptr<Shared> shared;
	MovieFrame current;
	bool hasCurrent{false};
	uint64_t serial{0};
	double timer{0};
	std::function<double()> audioClock;
	int width{0};
	int height{0};

	void startDecoding();

public:
	explicit VideoPlayer(std::unique_ptr<VideoDecoder> decoder);
	// Tells the decoder task to stop, it drops its reference on the next check
	~VideoPlayer();
	VideoPlayer(const VideoPlayer &) = delete;
	VideoPlayer &operator=(const VideoPlayer &) = delete;

	bool hasAudio() const {
		return shared->audio != nullptr;
	}
	// The mixer side of the movie sound, nullptr without an audio stream
	std::unique_ptr<AudioFrameSource> audioSource();
	// Seconds of sound heard so far, replaces the internal timer
	void setAudioClock(std::function<double()> clock) {
		audioClock = std::move(clock);
	}

	// Advances the timer and picks the frame that should be visible
	void update(Ticks dt);
	double time() const;

	// nullptr until the first frame is due
	const MovieFrame *frame() const {
		return hasCurrent ? &current : nullptr;
	}
	// Grows every time the visible frame is replaced
	uint64_t frameSerial() const {
		return serial;
	}
	bool finished() const;
	void frameSize(int &w, int &h) const {
		w = width;
		h = height;
	}
};

// BT.709 limited range conversion used by the movie shaders, rows dot (y, u, v, 1)
std::array<Vec4, 3> movieColorTransform();
