/**
 *  Wobbler.hpp
 *  SNRScripter
 *
 *  Periodic modulation driven by a pair of layer properties.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Support/Clock.hpp"

#include <cstdint>

enum class WobbleMode {
	Disabled    = 0,
	Random      = 1,
	Triangular  = 2,
	Square      = 3,
	Sine        = 4,
	Cosine      = 5,
	AbsSine     = 6,
	Sawtooth    = 7,
	InvSawtooth = 8
};

class Wobbler {
	WobbleMode mode{WobbleMode::Disabled};
	Ticks period;
	// Whole cycles in the integer part, wraps at 1000
	float time{0};
	uint32_t seed{0};

public:
	Wobbler() = default;
	explicit Wobbler(uint32_t randomSeed)
	    : seed(randomSeed) {}

	// Mode and period come straight from the property values
	void update(Ticks dt, int32_t modeValue, Ticks newPeriod);

	bool isActive() const {
		return mode != WobbleMode::Disabled && period.value > 0;
	}
	WobbleMode currentMode() const {
		return mode;
	}
	float phase() const {
		return time;
	}
	// In [-1, 1]
	float value() const;
};
