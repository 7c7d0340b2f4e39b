/**
 *  Clock.hpp
 *  SNRScripter
 *
 *  Contains code to control clock ticks, fps and the 60 Hz game time unit.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Support/FileDefs.hpp"

#include <algorithm>
#include <stdexcept>
#include <cmath>
#include <cstdint>

// Game time measured in 1/60 s units. Fractional values are allowed.
struct Ticks {
	static constexpr float PER_SECOND = 60.0f;

	float value{0};

	constexpr Ticks() = default;
	constexpr explicit Ticks(float v)
	    : value(v) {}

	static Ticks fromSeconds(float s) {
		return Ticks(s * PER_SECOND);
	}
	static Ticks fromMillis(float ms) {
		return Ticks(ms * PER_SECOND / 1000.0f);
	}
	// Scenario-encoded durations are never negative, garbage is clamped to zero
	static Ticks fromI32(int32_t v) {
		if (v < 0) {
			sendToLog(LogLevel::Warn, "Negative tick amount %d, clamping to 0\n", v);
			v = 0;
		}
		return Ticks(static_cast<float>(v));
	}

	float seconds() const {
		return value / PER_SECOND;
	}
	bool zero() const {
		return value <= 0;
	}

	Ticks operator+(Ticks o) const {
		return Ticks(value + o.value);
	}
	Ticks operator-(Ticks o) const {
		return Ticks(value - o.value);
	}
	Ticks &operator+=(Ticks o) {
		value += o.value;
		return *this;
	}
	Ticks &operator-=(Ticks o) {
		value -= o.value;
		return *this;
	}
	Ticks operator*(float s) const {
		return Ticks(value * s);
	}
	bool operator<(Ticks o) const {
		return value < o.value;
	}
	bool operator<=(Ticks o) const {
		return value <= o.value;
	}
	bool operator>(Ticks o) const {
		return value > o.value;
	}
	bool operator>=(Ticks o) const {
		return value >= o.value;
	}
	bool operator==(Ticks o) const {
		return value == o.value;
	}
};

class Clock {
private:
	uint64_t currentTimepoint;
	uint64_t lapTime;
	uint64_t countdownTime;

public:
	Clock()
	    : currentTimepoint(0), lapTime(0), countdownTime(0) {}
	void reset() {
		*this = Clock();
	}

	void setCountdownNanos(uint64_t ns) {
		countdownTime = currentTimepoint + ns;
	}

	void tickNanos(uint64_t ns) {
		currentTimepoint += ns;
		lapTime += ns;
	}

	uint64_t timeNanos() const {
		return currentTimepoint;
	}

	uint64_t lapNanos() {
		auto r  = lapTime;
		lapTime = 0;
		return r;
	}

	uint64_t remainingNanos() const {
		if (currentTimepoint > countdownTime)
			return 0;
		return countdownTime - currentTimepoint;
	}

	// expired if it's within 0.1ms of ending
	bool expired() const {
		return remainingNanos() < 100000;
	}

	Ticks ticks() const {
		return Ticks::fromSeconds(static_cast<float>(currentTimepoint / 1e9));
	}
};

class FPSTimeGenerator {
private:
	long double ms{0};
	float fps;
	unsigned int multiplier{0};
	unsigned int acc{0};

public:
	FPSTimeGenerator(float _fps = 0)
	    : fps(_fps) {
		if (std::floor(fps) == 0)
			throw std::runtime_error("Received 0 as FPS value. Bad idea!");
		ms = 1000.0 / static_cast<long double>(fps);
	}
	uint64_t nanosPerFrame() const {
		return ms * 1000000;
	}
	unsigned int nextTime() {
		long double total = ms * ++multiplier;
		if (std::abs(std::round(total) - total) < 0.00001)
			total = std::round(total); // fix awkward rounding errors...
		unsigned int r = std::ceil(total) - acc;
		acc += r;
		return r;
	}
	void reset() {
		*this = FPSTimeGenerator(fps);
	}
};
