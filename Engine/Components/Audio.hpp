/**
 *  Audio.hpp
 *  SNRScripter
 *
 *  SDL_mixer device, the software mixer running in its post-mix hook and the players on top.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Components/Base.hpp"
#include "Engine/Core/VmState.hpp"
#include "Engine/Formats/SysSe.hpp"
#include "Engine/Layers/MessageLayer.hpp"
#include "Engine/Media/Sound.hpp"
#include "Support/Clock.hpp"

#include <SDL2/SDL.h>
#include <SDL2/SDL_mixer.h>

#include <array>
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

class VideoPlayer;

const uint32_t AUDIO_OUTPUT_RATE = 48000;

// Sounds being mixed. add is called by the game thread, mix by the audio thread.
class AudioMixer {
	std::vector<std::unique_ptr<Sound>> sounds;
	std::vector<std::unique_ptr<Sound>> incoming;
	SDL_SpinLock incomingLock{0};
	std::atomic<uint32_t> rate{AUDIO_OUTPUT_RATE};
	std::atomic<size_t> active{0};

public:
	void setOutputRate(uint32_t r) {
		rate.store(r, std::memory_order_relaxed);
	}
	uint32_t outputRate() const {
		return rate.load(std::memory_order_relaxed);
	}

	SoundHandle play(std::unique_ptr<AudioFrameSource> source, const SoundSettings &settings);
	// Adds frames of interleaved stereo onto out
	void mix(float *out, size_t frames);
	// Sounds known to the audio thread, including those fading out
	size_t activeSounds() const {
		return active.load(std::memory_order_relaxed);
	}
};

class BgmPlayer {
	AudioMixer &mixer;
	cmp::optional<SoundHandle> current;
	std::string currentName;
	uint32_t currentRate{AUDIO_OUTPUT_RATE};

public:
	explicit BgmPlayer(AudioMixer &m)
	    : mixer(m) {}

	// The previous track fades out over the fade in of the new one
	void play(std::shared_ptr<const AudioFile> file, const std::string &displayName, bool repeat, float volume, const Tween &fadeIn);
	void stop(const Tween &fadeOut);
	void setVolume(float volume, const Tween &tween);
	// STOPPED when nothing plays
	int32_t waitStatus() const;
	// Seconds into the track
	float position() const;
	const std::string &name() const {
		return currentName;
	}
};

class SePlayer {
	AudioMixer &mixer;
	std::array<cmp::optional<SoundHandle>, SE_SLOT_COUNT> slots;

	cmp::optional<SoundHandle> *slot(int32_t index);

public:
	explicit SePlayer(AudioMixer &m)
	    : mixer(m) {}

	void play(int32_t index, std::shared_ptr<const AudioFile> file, bool repeat, float volume, float pan, float playSpeed, const Tween &fadeIn);
	void stop(int32_t index, const Tween &fadeOut);
	void stopAll(const Tween &fadeOut);
	void setVolume(int32_t index, float volume, const Tween &tween);
	void setPanning(int32_t index, float pan, const Tween &tween);
	// Slot -1 merges the statuses of every slot
	int32_t waitStatus(int32_t index) const;
};

class VoicePlayer : public VoiceOutput {
	AudioMixer &mixer;
	cmp::optional<SoundHandle> current;
	std::string currentFile;
	uint32_t currentRate{AUDIO_OUTPUT_RATE};
	float masterVolume{1};
	bool lipsync{false};

public:
	explicit VoicePlayer(AudioMixer &m)
	    : mixer(m) {}

	void setMasterVolume(float volume) {
		masterVolume = volume;
	}

	// Loads /voice/<filename>.nxa synchronously, a missing file is logged
	bool playVoice(const std::string &filename, uint32_t segmentStart, uint32_t segmentDuration, bool lipsync, float volume) override;
	bool play(std::shared_ptr<const AudioFile> file, uint32_t segmentStart, uint32_t segmentDuration, bool lipsync, float volume);
	void stopVoice() override;
	bool voicePlaying() const override;
	int32_t waitStatus() const;
	// Milliseconds into the file
	uint32_t positionMillis() const;
	const std::string &filename() const {
		return currentFile;
	}

	// Mouth opening in [0, 1], zero without lip sync
	float lipsyncLevel() const;
};

class SysSePlayer {
	AudioMixer &mixer;
	std::shared_ptr<const SysSe> bank;
	cmp::optional<SoundHandle> current;

public:
	explicit SysSePlayer(AudioMixer &m)
	    : mixer(m) {}

	void setBank(std::shared_ptr<const SysSe> b) {
		bank = std::move(b);
	}
	// Name of the nth sound of the bank, empty when out of range
	std::string nameOf(int32_t index) const;
	// false when the bank has no such sound
	bool play(const std::string &name, float volume);
	int32_t waitStatus() const;
};

class AudioController : public BaseController {
	AudioMixer mixer_;
	bool deviceOpen{false};
	bool headless{false};
	int bufferSize{2048};
	uint16_t deviceFormat{AUDIO_F32SYS};
	int deviceChannels{2};
	std::vector<float> scratch;
	double pendingFrames{0};

	static void mixCallback(void *udata, uint8_t *stream, int len);
	void mixInto(uint8_t *stream, int len);

protected:
	int ownInit() override;
	int ownDeinit() override;

public:
	float bgmVolume{1};
	float seVolume{1};
	float voiceVolume{1};

	BgmPlayer bgm{mixer_};
	SePlayer se{mixer_};
	VoicePlayer voice{mixer_};
	SysSePlayer sysSe{mixer_};

	AudioController()
	    : BaseController(this) {}

	// Must be called before init
	void setHeadless(bool value) {
		headless = value;
	}
	// Sample frames per device callback, powers of two only
	bool setBufferSize(int frames);

	AudioMixer &mixer() {
		return mixer_;
	}
	bool hasDevice() const {
		return deviceOpen;
	}

	// Without a device the mixer is run from here, so sounds still progress and finish
	void update(Ticks dt);
	// Routes the movie sound through the mixer and drives the movie clock from it
	void attachMovie(VideoPlayer &player, float volume);
};

extern AudioController audio;
