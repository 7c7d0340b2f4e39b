/**
 *  Wobbler.cpp
 *  SNRScripter
 *
 *  Periodic modulation driven by a pair of layer properties.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Entities/Wobbler.hpp"

#include <cmath>

namespace {
WobbleMode decodeMode(int32_t value) {
	if (value >= 0 && value <= static_cast<int32_t>(WobbleMode::InvSawtooth))
		return static_cast<WobbleMode>(value);
	sendToLog(LogLevel::Warn, "Unknown wobble mode %d, disabling\n", value);
	return WobbleMode::Disabled;
}

// Same LCG the VM steps, mixed once more so neighbouring cycles diverge
float randomCycleValue(uint32_t cycle, uint32_t seed) {
	uint32_t state = cycle * 0x343FD + 0x269EC3 + seed;
	state          = state * 0x343FD + 0x269EC3;
	state ^= state >> 15;
	float unit = static_cast<float>((state >> 8) & 0xFFFF) / 65535.0f;
	return unit * 2.0f - 1.0f;
}
} // namespace

void Wobbler::update(Ticks dt, int32_t modeValue, Ticks newPeriod) {
	WobbleMode newMode = decodeMode(modeValue);
	if (newMode != mode || !(newPeriod == period)) {
		mode   = newMode;
		period = newPeriod;
		time   = 0;
	}

	if (!isActive())
		return;

	time += dt.value / period.value;
	if (time >= 1000.0f)
		time = std::fmod(time, 1000.0f);
}

float Wobbler::value() const {
	float t         = time - std::floor(time);
	const float tau = 2.0f * static_cast<float>(M_PI);

	switch (mode) {
		case WobbleMode::Disabled:
			return 0;
		case WobbleMode::Random:
			return randomCycleValue(static_cast<uint32_t>(std::floor(time)), seed);
		case WobbleMode::Triangular:
			if (t < 0.25f)
				return 4.0f * t;
			if (t < 0.75f)
				return 2.0f - 4.0f * t;
			return 4.0f * t - 4.0f;
		case WobbleMode::Square:
			return t < 0.5f ? -1.0f : 1.0f;
		case WobbleMode::Sine:
			return std::sin(t * tau);
		case WobbleMode::Cosine:
			return std::cos(t * tau);
		case WobbleMode::AbsSine:
			return std::abs(std::sin(t * tau));
		case WobbleMode::Sawtooth:
			return t * 2.0f - 1.0f;
		case WobbleMode::InvSawtooth:
			return 1.0f - t * 2.0f;
	}
	return 0;
}
