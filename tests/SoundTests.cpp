/**
 *  SoundTests.cpp
 *  SNRScripter
 *
 *  Resampling, panning and sound playback state.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Media/Sound.hpp"

#include <gtest/gtest.h>

#include <cmath>

namespace {
const uint32_t RATE = 1024;
const double STEP   = 1.0 / RATE;

// Constant samples in frames of four
class ConstantFrames : public AudioFrameSource {
	float value;
	uint32_t frames;
	uint32_t next{0};

public:
	static const uint32_t FRAME = 4;

	ConstantFrames(float v, uint32_t frameCount)
	    : value(v), frames(frameCount) {}

	size_t maxFrameSize() const override {
		return FRAME;
	}
	uint32_t sampleRate() const override {
		return RATE;
	}
	uint32_t preSkip() const override {
		return 0;
	}
	uint32_t preRoll() const override {
		return 0;
	}
	bool readFrame(AudioBuffer &destination) override {
		if (next >= frames)
			return false;
		next++;
		destination.insert(destination.end(), FRAME, StereoSample{value, value});
		return true;
	}
	uint32_t samplesSeek(uint32_t samplePosition) override {
		next = samplePosition / FRAME;
		return samplePosition % FRAME;
	}
	uint32_t currentSamplePosition() const override {
		return next * FRAME;
	}
};

const uint32_t ConstantFrames::FRAME;

std::unique_ptr<Sound> constantSound(float value, uint32_t frameCount, const SoundSettings &settings,
                                     std::shared_ptr<SoundShared> &shared) {
	shared = std::make_shared<SoundShared>();
	return std::make_unique<Sound>(std::make_unique<ConstantFrames>(value, frameCount), settings, shared);
}
} // namespace

TEST(Resampler, InterpolatesTheMiddleSamples) {
	Resampler r;
	EXPECT_TRUE(r.outputtingSilence());
	for (uint32_t i = 0; i < 4; i++) r.push(StereoSample{static_cast<float>(i + 1), -static_cast<float>(i + 1)}, i);

	EXPECT_EQ(r.currentIndex(), 1u);
	auto s = r.get(0.25f);
	EXPECT_FLOAT_EQ(s.left, 2.25f);
	EXPECT_FLOAT_EQ(s.right, -2.25f);
	EXPECT_FALSE(r.outputtingSilence());

	for (uint32_t i = 4; i < 8; i++) r.push(StereoSample(), i);
	EXPECT_TRUE(r.outputtingSilence());
}

TEST(Pan, EqualPowerLaw) {
	StereoSample s{1, 1};
	auto centre = applyPan(s, 0);
	EXPECT_FLOAT_EQ(centre.left, 1);
	EXPECT_FLOAT_EQ(centre.right, 1);

	auto left = applyPan(s, -1);
	EXPECT_FLOAT_EQ(left.left, std::sqrt(2.0f));
	EXPECT_FLOAT_EQ(left.right, 0);

	auto right = applyPan(s, 5);
	EXPECT_FLOAT_EQ(right.left, 0);
	EXPECT_FLOAT_EQ(right.right, std::sqrt(2.0f));

	// Power is kept across the range
	auto half = applyPan(s, 0.5f);
	EXPECT_NEAR(half.left * half.left + half.right * half.right, 2.0f, 1e-5f);
}

TEST(Sound, PlaysAtVolumeUntilTheEnd) {
	SoundSettings settings;
	settings.volume = 0.5f;
	std::shared_ptr<SoundShared> shared;
	auto sound = constantSound(0.8f, 2, settings, shared);

	// The resampler history delays the output by three samples
	StereoSample out;
	for (int i = 0; i < 4; i++) {
		sound->startProcessing();
		out = sound->process(STEP);
	}
	EXPECT_FLOAT_EQ(out.left, 0.4f);
	EXPECT_FLOAT_EQ(out.right, 0.4f);

	SoundHandle handle(shared);
	sound->startProcessing();
	EXPECT_TRUE(handle.waitStatus() & AudioWaitStatus::PLAYING);
	EXPECT_TRUE(handle.waitStatus() & AudioWaitStatus::VOLUME_TWEENER_IDLE);
	EXPECT_GT(handle.amplitude(), 0.0f);

	for (int i = 0; i < 16 && !sound->finished(); i++) {
		sound->startProcessing();
		sound->process(STEP);
	}
	EXPECT_TRUE(sound->finished());
	sound->startProcessing();
	EXPECT_TRUE(handle.stopped());
	EXPECT_FALSE(handle.waitStatus() & AudioWaitStatus::PLAYING);
}

TEST(Sound, StopFadesOut) {
	SoundSettings settings;
	settings.repeat = true;
	std::shared_ptr<SoundShared> shared;
	auto sound = constantSound(1.0f, 4, settings, shared);
	SoundHandle handle(shared);

	for (int i = 0; i < 8; i++) {
		sound->startProcessing();
		sound->process(STEP);
	}
	handle.stop(Tween::linear(Ticks::fromSeconds(static_cast<float>(4 * STEP))));
	sound->startProcessing();
	EXPECT_FALSE(handle.stopped());

	auto fading = sound->process(STEP);
	EXPECT_LT(fading.left, 1.0f);
	EXPECT_GT(fading.left, 0.0f);

	for (int i = 0; i < 16; i++) {
		sound->startProcessing();
		sound->process(STEP);
	}
	sound->startProcessing();
	EXPECT_TRUE(handle.stopped());
	// The loop keeps feeding samples, they are faded to nothing
	EXPECT_FLOAT_EQ(sound->process(STEP).left, 0.0f);
}

TEST(Sound, RepeatingSoundsLoop) {
	SoundSettings settings;
	settings.repeat = true;
	std::shared_ptr<SoundShared> shared;
	auto sound = constantSound(0.25f, 1, settings, shared);
	SoundHandle handle(shared);

	for (int i = 0; i < 64; i++) {
		sound->startProcessing();
		EXPECT_FLOAT_EQ(sound->process(STEP).left, i < 3 ? 0.0f : 0.25f) << i;
	}
	sound->startProcessing();
	EXPECT_FALSE(handle.stopped());
	EXPECT_LT(handle.position(), ConstantFrames::FRAME);
}

TEST(Sound, VolumeCommandsTween) {
	std::shared_ptr<SoundShared> shared;
	auto sound = constantSound(1.0f, 64, SoundSettings(), shared);
	SoundHandle handle(shared);

	for (int i = 0; i < 4; i++) {
		sound->startProcessing();
		sound->process(STEP);
	}
	handle.setVolume(0, Tween::linear(Ticks::fromSeconds(static_cast<float>(10 * STEP))));
	sound->startProcessing();
	EXPECT_FALSE(handle.waitStatus() & AudioWaitStatus::VOLUME_TWEENER_IDLE);
	float previous = 1;
	for (int i = 0; i < 10; i++) {
		float v = sound->process(STEP).left;
		EXPECT_LE(v, previous);
		previous = v;
	}
	EXPECT_NEAR(previous, 0.0f, 1e-4f);
	sound->startProcessing();
	EXPECT_TRUE(handle.waitStatus() & AudioWaitStatus::VOLUME_TWEENER_IDLE);
}

TEST(SoundHandle, FullQueueDropsCommands) {
	auto shared = std::make_shared<SoundShared>();
	SoundHandle handle(shared);
	for (size_t i = 0; i < SOUND_COMMAND_CAPACITY + 3; i++) handle.setVolume(0.5f, Tween::immediate());

	SoundCommand command;
	size_t received = 0;
	while (shared->commands.pop(command)) received++;
	EXPECT_LE(received, SOUND_COMMAND_CAPACITY);
	EXPECT_GT(received, 0u);
}
