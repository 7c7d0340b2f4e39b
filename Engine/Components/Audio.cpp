/**
 *  Audio.cpp
 *  SNRScripter
 *
 *  SDL_mixer device, the software mixer running in its post-mix hook and the players on top.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Components/Audio.hpp"
#include "Engine/Components/Assets.hpp"
#include "Engine/Formats/Scenario.hpp"
#include "Engine/Media/AudioDecoder.hpp"
#include "Engine/Media/Movie.hpp"
#include "Support/Errors.hpp"
#include "Support/FileDefs.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iterator>

AudioController audio;

/* ---------------- AudioMixer ----------------- */

SoundHandle AudioMixer::play(std::unique_ptr<AudioFrameSource> source, const SoundSettings &settings) {
	auto shared = std::make_shared<SoundShared>();
	auto sound  = std::make_unique<Sound>(std::move(source), settings, shared);
	SDL_AtomicLock(&incomingLock);
	incoming.push_back(std::move(sound));
	SDL_AtomicUnlock(&incomingLock);
	return SoundHandle(shared);
}

void AudioMixer::mix(float *out, size_t frames) {
	SDL_AtomicLock(&incomingLock);
	for (auto &s : incoming)
		sounds.push_back(std::move(s));
	incoming.clear();
	SDL_AtomicUnlock(&incomingLock);

	double dt = 1.0 / outputRate();
	for (auto &sound : sounds) {
		sound->startProcessing();
		for (size_t i = 0; i < frames; i++) {
			auto sample = sound->process(dt);
			out[i * 2] += sample.left;
			out[i * 2 + 1] += sample.right;
		}
	}

	for (auto it = sounds.begin(); it != sounds.end();) {
		if ((*it)->finished()) {
			// Publish the final status before the sound goes away
			(*it)->startProcessing();
			it = sounds.erase(it);
		} else {
			++it;
		}
	}
	active.store(sounds.size(), std::memory_order_relaxed);
}

namespace {

std::unique_ptr<AudioFrameSource> openAudioFile(std::shared_ptr<const AudioFile> file) {
	return std::make_unique<OpusFrameDecoder>(std::move(file));
}

// Logs instead of throwing, the scenario carries on without the sound
bool makeSource(std::shared_ptr<const AudioFile> file, std::unique_ptr<AudioFrameSource> &source) {
	try {
		source = openAudioFile(std::move(file));
	} catch (AssetError &e) {
		sendToLog(LogLevel::Error, "%s\n", e.what());
		return false;
	}
	return true;
}

} // namespace

/* ---------------- BgmPlayer ----------------- */

void BgmPlayer::play(std::shared_ptr<const AudioFile> file, const std::string &displayName, bool repeat, float volume, const Tween &fadeIn) {
	if (!file)
		return;
	if (current.has()) {
		current.get().stop(fadeIn);
		current.unset();
	}

	auto &info = file->info;
	std::unique_ptr<AudioFrameSource> source;
	if (!makeSource(file, source))
		return;

	SoundSettings settings;
	settings.volume      = volume * audio.bgmVolume;
	settings.fadeIn      = fadeIn;
	settings.repeat      = repeat;
	settings.loopStart   = info.loopStart;
	settings.endPosition = repeat ? info.loopEnd : 0;

	sendToLog(LogLevel::Info, "Playing BGM %s\n", displayName.c_str());
	currentName = displayName;
	currentRate = info.sampleRate ? info.sampleRate : AUDIO_OUTPUT_RATE;
	current.set(mixer.play(std::move(source), settings));
}

void BgmPlayer::stop(const Tween &fadeOut) {
	if (!current.has()) {
		sendToLog(LogLevel::Warn, "Tried to stop BGM while none is playing\n");
		return;
	}
	current.get().stop(fadeOut);
	current.unset();
	currentName.clear();
}

void BgmPlayer::setVolume(float volume, const Tween &tween) {
	if (current.has())
		current.get().setVolume(volume * audio.bgmVolume, tween);
}

int32_t BgmPlayer::waitStatus() const {
	return current.has() ? current.get().waitStatus() : AudioWaitStatus::STOPPED;
}

float BgmPlayer::position() const {
	if (!current.has())
		return 0;
	return static_cast<float>(current.get().position()) / currentRate;
}

/* ---------------- SePlayer ----------------- */

cmp::optional<SoundHandle> *SePlayer::slot(int32_t index) {
	if (index < 0 || index >= SE_SLOT_COUNT) {
		sendToLog(LogLevel::Warn, "SE slot %d is out of range\n", index);
		return nullptr;
	}
	return &slots[index];
}

void SePlayer::play(int32_t index, std::shared_ptr<const AudioFile> file, bool repeat, float volume, float pan, float playSpeed, const Tween &fadeIn) {
	auto target = slot(index);
	if (!target || !file)
		return;
	if (target->has()) {
		target->get().stop(Tween::immediate());
		target->unset();
	}

	std::unique_ptr<AudioFrameSource> source;
	if (!makeSource(file, source))
		return;

	SoundSettings settings;
	settings.volume    = volume * audio.seVolume;
	settings.pan       = pan;
	settings.playSpeed = playSpeed;
	settings.fadeIn    = fadeIn;
	settings.repeat    = repeat;
	settings.loopStart = file->info.loopStart;
	target->set(mixer.play(std::move(source), settings));
}

void SePlayer::stop(int32_t index, const Tween &fadeOut) {
	auto target = slot(index);
	if (!target || !target->has())
		return;
	target->get().stop(fadeOut);
	target->unset();
}

void SePlayer::stopAll(const Tween &fadeOut) {
	for (auto &s : slots) {
		if (s.has()) {
			s.get().stop(fadeOut);
			s.unset();
		}
	}
}

void SePlayer::setVolume(int32_t index, float volume, const Tween &tween) {
	auto target = slot(index);
	if (target && target->has())
		target->get().setVolume(volume * audio.seVolume, tween);
}

void SePlayer::setPanning(int32_t index, float pan, const Tween &tween) {
	auto target = slot(index);
	if (target && target->has())
		target->get().setPanning(pan, tween);
}

int32_t SePlayer::waitStatus(int32_t index) const {
	if (index == -1) {
		int32_t merged = 0;
		for (auto &s : slots)
			merged |= s.has() ? s.get().waitStatus() : AudioWaitStatus::STOPPED;
		return merged;
	}
	if (index < 0 || index >= SE_SLOT_COUNT)
		return AudioWaitStatus::STOPPED;
	auto &s = slots[index];
	return s.has() ? s.get().waitStatus() : AudioWaitStatus::STOPPED;
}

/* ---------------- VoicePlayer ----------------- */

bool VoicePlayer::playVoice(const std::string &filename, uint32_t segmentStart, uint32_t segmentDuration, bool withLipsync, float volume) {
	std::shared_ptr<const AudioFile> file;
	try {
		file = assets.loadSync<AudioFile>(ScenarioInfo::voicePath(filename));
	} catch (std::runtime_error &e) {
		sendToLog(LogLevel::Error, "Voice %s: %s\n", filename.c_str(), e.what());
		return false;
	}
	if (!play(file, segmentStart, segmentDuration, withLipsync, volume))
		return false;
	currentFile = filename;
	return true;
}

bool VoicePlayer::play(std::shared_ptr<const AudioFile> file, uint32_t segmentStart, uint32_t segmentDuration, bool withLipsync, float volume) {
	stopVoice();
	if (!file)
		return false;

	uint32_t rate = file->info.sampleRate ? file->info.sampleRate : AUDIO_OUTPUT_RATE;
	std::unique_ptr<AudioFrameSource> source;
	if (!makeSource(file, source))
		return false;

	SoundSettings settings;
	settings.volume        = volume * masterVolume;
	settings.startPosition = static_cast<uint32_t>(static_cast<uint64_t>(segmentStart) * rate / 1000);
	if (segmentDuration > 0)
		settings.endPosition = settings.startPosition + static_cast<uint32_t>(static_cast<uint64_t>(segmentDuration) * rate / 1000);

	lipsync     = withLipsync;
	currentRate = rate;
	currentFile.clear();
	current.set(mixer.play(std::move(source), settings));
	return true;
}

void VoicePlayer::stopVoice() {
	if (current.has()) {
		current.get().stop(Tween::linear(Ticks::fromMillis(50)));
		current.unset();
	}
	lipsync = false;
}

bool VoicePlayer::voicePlaying() const {
	return current.has() && !current.get().stopped();
}

int32_t VoicePlayer::waitStatus() const {
	return current.has() ? current.get().waitStatus() : AudioWaitStatus::STOPPED;
}

uint32_t VoicePlayer::positionMillis() const {
	if (!current.has())
		return 0;
	return static_cast<uint32_t>(static_cast<uint64_t>(current.get().position()) * 1000 / currentRate);
}

float VoicePlayer::lipsyncLevel() const {
	if (!lipsync || !voicePlaying())
		return 0;
	// Speech peaks rarely go past half scale
	return cmp::clamp(current.get().amplitude() * 2.0f, 0.0f, 1.0f);
}

/* ---------------- SysSePlayer ----------------- */

std::string SysSePlayer::nameOf(int32_t index) const {
	if (!bank || index < 0 || static_cast<size_t>(index) >= bank->size())
		return {};
	auto it = bank->begin();
	std::advance(it, index);
	return it->first;
}

bool SysSePlayer::play(const std::string &name, float volume) {
	if (!bank) {
		sendToLog(LogLevel::Warn, "No system sound bank to play %s from\n", name.c_str());
		return false;
	}
	auto it = bank->find(name);
	if (it == bank->end()) {
		sendToLog(LogLevel::Warn, "Unknown system sound %s\n", name.c_str());
		return false;
	}
	if (current.has())
		current.get().stop(Tween::immediate());

	SoundSettings settings;
	settings.volume = volume * audio.seVolume;
	current.set(mixer.play(std::make_unique<SysSeDecoder>(it->second), settings));
	return true;
}

int32_t SysSePlayer::waitStatus() const {
	return current.has() ? current.get().waitStatus() : AudioWaitStatus::STOPPED;
}

/* ---------------- AudioController ----------------- */

bool AudioController::setBufferSize(int frames) {
	if (frames < 256 || frames > 16384 || (frames & (frames - 1)) != 0) {
		sendToLog(LogLevel::Error, "Invalid audio buffer size %d, keeping %d\n", frames, bufferSize);
		return false;
	}
	bufferSize = frames;
	return true;
}

int AudioController::ownInit() {
	if (headless) {
		sendToLog(LogLevel::Info, "Audio: no device, mixing in software at %u Hz\n", mixer_.outputRate());
		return 0;
	}

	if (SDL_InitSubSystem(SDL_INIT_AUDIO) < 0) {
		sendToLog(LogLevel::Error, "Couldn't initialise SDL audio: %s\n", SDL_GetError());
		return 0;
	}

	// Ask for float samples first, then take whatever the device defaults to
	if (Mix_OpenAudioDevice(AUDIO_OUTPUT_RATE, AUDIO_F32SYS, 2, bufferSize, nullptr, 0) < 0 &&
	    Mix_OpenAudio(AUDIO_OUTPUT_RATE, MIX_DEFAULT_FORMAT, 2, bufferSize) < 0) {
		sendToLog(LogLevel::Error, "Couldn't open audio device: %s\n", Mix_GetError());
		return 0;
	}

	int freq = 0, channels = 0;
	uint16_t format = 0;
	Mix_QuerySpec(&freq, &format, &channels);
	sendToLog(LogLevel::Info, "Audio: %d Hz %d bit %s %s\n",
	          freq, format & 0xFF, SDL_AUDIO_ISFLOAT(format) ? "float" : SDL_AUDIO_ISSIGNED(format) ? "sint" : "uint", channels > 1 ? "stereo" : "mono");

	if (format != AUDIO_F32SYS && format != AUDIO_S16SYS) {
		sendToLog(LogLevel::Error, "Unsupported audio sample format 0x%X\n", format);
		Mix_CloseAudio();
		return 0;
	}

	deviceFormat   = format;
	deviceChannels = channels;
	mixer_.setOutputRate(static_cast<uint32_t>(freq));
	deviceOpen = true;
	Mix_SetPostMix(mixCallback, this);
	return 0;
}

int AudioController::ownDeinit() {
	if (deviceOpen) {
		Mix_SetPostMix(nullptr, nullptr);
		Mix_CloseAudio();
		deviceOpen = false;
	}
	if (!headless)
		SDL_QuitSubSystem(SDL_INIT_AUDIO);
	return 0;
}

void AudioController::mixCallback(void *udata, uint8_t *stream, int len) {
	static_cast<AudioController *>(udata)->mixInto(stream, len);
}

void AudioController::mixInto(uint8_t *stream, int len) {
	size_t sampleBytes = deviceFormat == AUDIO_F32SYS ? sizeof(float) : sizeof(int16_t);
	size_t frames      = static_cast<size_t>(len) / (sampleBytes * deviceChannels);
	scratch.assign(frames * 2, 0.0f);
	mixer_.mix(scratch.data(), frames);

	for (size_t i = 0; i < frames; i++) {
		for (int c = 0; c < deviceChannels; c++) {
			// Channels past stereo stay as SDL_mixer left them
			if (c > 1)
				break;
			size_t at = i * deviceChannels + c;
			float add = scratch[i * 2 + c];
			if (deviceFormat == AUDIO_F32SYS) {
				float value;
				std::memcpy(&value, stream + at * sampleBytes, sizeof(value));
				value = cmp::clamp(value + add, -1.0f, 1.0f);
				std::memcpy(stream + at * sampleBytes, &value, sizeof(value));
			} else {
				int16_t value;
				std::memcpy(&value, stream + at * sampleBytes, sizeof(value));
				float mixed = cmp::clamp(value / 32768.0f + add, -1.0f, 1.0f);
				value       = static_cast<int16_t>(std::lround(mixed * 32767.0f));
				std::memcpy(stream + at * sampleBytes, &value, sizeof(value));
			}
		}
	}
}

void AudioController::update(Ticks dt) {
	if (deviceOpen)
		return;
	pendingFrames += dt.seconds() * mixer_.outputRate();
	auto frames = static_cast<size_t>(pendingFrames);
	if (frames == 0)
		return;
	pendingFrames -= frames;
	scratch.assign(frames * 2, 0.0f);
	mixer_.mix(scratch.data(), frames);
}

void AudioController::attachMovie(VideoPlayer &player, float volume) {
	auto source = player.audioSource();
	if (!source)
		return;
	uint32_t rate = source->sampleRate();

	SoundSettings settings;
	settings.volume = volume * bgmVolume;
	auto handle     = mixer_.play(std::move(source), settings);
	player.setAudioClock([handle, rate]() {
		return static_cast<double>(handle.position()) / rate;
	});
}
