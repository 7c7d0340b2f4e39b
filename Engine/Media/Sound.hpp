/**
 *  Sound.hpp
 *  SNRScripter
 *
 *  Sound source played by the mixer: resampling, tweened volume and pan,
 *  fade in and out, and the command ring the game thread talks through.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "External/LimitedQueue.hpp"
#include "Engine/Entities/Tweener.hpp"
#include "Engine/Formats/Audio.hpp"

#include <array>
#include <atomic>
#include <memory>
#include <cstdint>

// Bits of the status word BGMWAIT, SEWAIT and VOICEWAIT test against
namespace AudioWaitStatus {
enum : int32_t {
	PLAYING                 = 1,
	STOPPED                 = 2,
	VOLUME_TWEENER_IDLE     = 4,
	PANNING_TWEENER_IDLE    = 8,
	PLAY_SPEED_TWEENER_IDLE = 16
};
} // namespace AudioWaitStatus

struct SoundCommand {
	enum class Kind {
		SetVolume,
		SetPanning,
		SetPlaySpeed,
		Stop
	};

	Kind kind{Kind::Stop};
	float value{0};
	Tween tween;
};

const size_t SOUND_COMMAND_CAPACITY = 8;

// Linear interpolation over the last source samples
class Resampler {
	struct RecentSample {
		StereoSample sample;
		uint32_t index;
	};
	std::array<RecentSample, 4> samples;

public:
	explicit Resampler(uint32_t startIndex = 0);

	void push(const StereoSample &sample, uint32_t index);
	// fraction in [0, 1) between the two middle samples
	StereoSample get(float fraction) const;
	// Source sample the listener hears right now
	uint32_t currentIndex() const {
		return samples[1].index;
	}
	bool outputtingSilence() const;
};

struct SoundSettings {
	float volume{1};
	float pan{0};
	float playSpeed{1};
	Tween fadeIn;
	bool repeat{false};
	uint32_t loopStart{0};
	// In source samples, a repeating sound loops back at the end; zero means the end of the stream
	uint32_t startPosition{0};
	uint32_t endPosition{0};
};

// State visible to both sides, the game thread only pushes commands and reads atomics
struct SoundShared {
	limited_queue<SoundCommand, SOUND_COMMAND_CAPACITY> commands;
	std::atomic<int32_t> waitStatus{AudioWaitStatus::PLAYING};
	std::atomic<uint32_t> position{0};
	// Smoothed peak level for lip sync, in [0, 1]
	std::atomic<float> amplitude{0};
};

class Sound {
	enum class Playback {
		Playing,
		Stopping,
		Stopped
	};

	std::shared_ptr<SoundShared> shared;
	AudioSource source;
	Resampler resampler;
	double fractionalPosition{0};
	bool reachedEnd{false};
	bool repeat;
	uint32_t loopStart;
	uint32_t endPosition;
	Playback playback{Playback::Playing};
	float level{0};

	Tweener volume;
	Tweener panning;
	Tweener playSpeed;
	Tweener fade;

	void pushNextSample();
	int32_t status() const;

public:
	Sound(std::unique_ptr<AudioFrameSource> frames, const SoundSettings &settings, std::shared_ptr<SoundShared> state);

	// Applies pending commands and publishes the status, once per mixed chunk
	void startProcessing();
	// One output sample dt seconds after the previous one
	StereoSample process(double dt);
	// Stopped and the resampler history has drained
	bool finished() const;
};

// Game thread side of a playing sound
class SoundHandle {
	std::shared_ptr<SoundShared> shared;

	void send(const SoundCommand &command);

public:
	explicit SoundHandle(std::shared_ptr<SoundShared> state)
	    : shared(std::move(state)) {}

	void setVolume(float volume, const Tween &tween);
	void setPanning(float pan, const Tween &tween);
	void setPlaySpeed(float speed, const Tween &tween);
	void stop(const Tween &fadeOut);

	int32_t waitStatus() const {
		return shared->waitStatus.load(std::memory_order_seq_cst);
	}
	bool stopped() const {
		return waitStatus() & AudioWaitStatus::STOPPED;
	}
	uint32_t position() const {
		return shared->position.load(std::memory_order_seq_cst);
	}
	float amplitude() const {
		return shared->amplitude.load(std::memory_order_seq_cst);
	}
};

// Equal power pan law on an already scaled sample
StereoSample applyPan(const StereoSample &sample, float pan);
