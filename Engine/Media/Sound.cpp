/**
 *  Sound.cpp
 *  SNRScripter
 *
 *  Sound source played by the mixer: resampling, tweened volume and pan,
 *  fade in and out, and the command ring the game thread talks through.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Media/Sound.hpp"
#include "Support/Errors.hpp"
#include "Support/FileDefs.hpp"

#include <algorithm>
#include <cmath>

Resampler::Resampler(uint32_t startIndex) {
	for (auto &s : samples) s = RecentSample{StereoSample(), startIndex};
}

void Resampler::push(const StereoSample &sample, uint32_t index) {
	for (size_t i = 0; i + 1 < samples.size(); i++)
		samples[i] = samples[i + 1];
	samples.back() = RecentSample{sample, index};
}

StereoSample Resampler::get(float fraction) const {
	auto &a = samples[1].sample;
	auto &b = samples[2].sample;
	return {a.left + (b.left - a.left) * fraction, a.right + (b.right - a.right) * fraction};
}

bool Resampler::outputtingSilence() const {
	return std::all_of(samples.begin(), samples.end(), [](const RecentSample &s) {
		return s.sample.left == 0 && s.sample.right == 0;
	});
}

StereoSample applyPan(const StereoSample &sample, float pan) {
	if (pan == 0)
		return sample;
	// -1 is fully left, the law itself works on [0, 1]
	float x = (cmp::clamp(pan, -1.0f, 1.0f) + 1.0f) * 0.5f;
	const float sqrt2 = std::sqrt(2.0f);
	return {sample.left * std::sqrt(1.0f - x) * sqrt2, sample.right * std::sqrt(x) * sqrt2};
}

Sound::Sound(std::unique_ptr<AudioFrameSource> frames, const SoundSettings &settings, std::shared_ptr<SoundShared> state)
    : shared(std::move(state)),
      source(std::move(frames)),
      repeat(settings.repeat),
      loopStart(settings.loopStart),
      endPosition(settings.endPosition),
      volume(settings.volume),
      panning(settings.pan),
      playSpeed(settings.playSpeed),
      fade(0) {
	fade.enqueueNow(1, settings.fadeIn);
	if (settings.startPosition > 0)
		source.samplesSeek(settings.startPosition);
}

void Sound::pushNextSample() {
	StereoSample sample;
	bool pastEnd = endPosition > 0 && source.currentSamplePosition() >= endPosition;
	if (pastEnd || !source.readSample(sample)) {
		if (repeat && !reachedEnd) {
			source.samplesSeek(loopStart);
			if (!source.readSample(sample)) {
				// Nothing to loop over
				reachedEnd = true;
				sample     = StereoSample();
			}
		} else {
			reachedEnd = true;
			sample     = StereoSample();
		}
	}
	uint32_t next = source.currentSamplePosition();
	resampler.push(sample, next > 0 ? next - 1 : 0);
}

int32_t Sound::status() const {
	int32_t result = 0;
	if (playback == Playback::Stopped)
		result |= AudioWaitStatus::STOPPED;
	if (playback == Playback::Playing)
		result |= AudioWaitStatus::PLAYING;
	if (volume.isIdle())
		result |= AudioWaitStatus::VOLUME_TWEENER_IDLE;
	if (panning.isIdle())
		result |= AudioWaitStatus::PANNING_TWEENER_IDLE;
	if (playSpeed.isIdle())
		result |= AudioWaitStatus::PLAY_SPEED_TWEENER_IDLE;
	return result;
}

void Sound::startProcessing() {
	SoundCommand command;
	while (shared->commands.pop(command)) {
		// Audio changes never wait for earlier ones to finish
		switch (command.kind) {
			case SoundCommand::Kind::SetVolume:
				volume.enqueueNow(command.value, command.tween);
				break;
			case SoundCommand::Kind::SetPanning:
				panning.enqueueNow(command.value, command.tween);
				break;
			case SoundCommand::Kind::SetPlaySpeed:
				playSpeed.enqueueNow(command.value, command.tween);
				break;
			case SoundCommand::Kind::Stop:
				if (playback == Playback::Playing)
					playback = Playback::Stopping;
				fade.enqueueNow(0, command.tween);
				break;
		}
	}

	shared->waitStatus.store(status(), std::memory_order_seq_cst);
	shared->position.store(resampler.currentIndex(), std::memory_order_seq_cst);
	shared->amplitude.store(level, std::memory_order_seq_cst);
}

StereoSample Sound::process(double dt) {
	Ticks ticks = Ticks::fromSeconds(static_cast<float>(dt));
	volume.update(ticks);
	panning.update(ticks);
	playSpeed.update(ticks);
	fade.update(ticks);

	if (playback == Playback::Stopping && fade.isIdle())
		playback = Playback::Stopped;

	StereoSample out = resampler.get(static_cast<float>(fractionalPosition));
	fractionalPosition += dt * source.sampleRate() * std::max(0.0f, playSpeed.value());
	while (fractionalPosition >= 1.0) {
		fractionalPosition -= 1.0;
		pushNextSample();
	}

	if (reachedEnd)
		playback = Playback::Stopped;

	float gain = fade.value() * volume.value();
	out.left *= gain;
	out.right *= gain;
	out = applyPan(out, panning.value());

	float peak = std::max(std::fabs(out.left), std::fabs(out.right));
	level      = std::max(peak, level * 0.999f);

	return out;
}

bool Sound::finished() const {
	return playback == Playback::Stopped && resampler.outputtingSilence();
}

void SoundHandle::send(const SoundCommand &command) {
	if (!shared->commands.push(command)) {
		AudioError error;
		sendToLog(LogLevel::Warn, "%s, dropping the command\n", error.what());
	}
}

void SoundHandle::setVolume(float value, const Tween &tween) {
	send(SoundCommand{SoundCommand::Kind::SetVolume, value, tween});
}

void SoundHandle::setPanning(float pan, const Tween &tween) {
	send(SoundCommand{SoundCommand::Kind::SetPanning, pan, tween});
}

void SoundHandle::setPlaySpeed(float speed, const Tween &tween) {
	send(SoundCommand{SoundCommand::Kind::SetPlaySpeed, speed, tween});
}

void SoundHandle::stop(const Tween &fadeOut) {
	send(SoundCommand{SoundCommand::Kind::Stop, 0, fadeOut});
}
