/**
 *  Tweener.hpp
 *  SNRScripter
 *
 *  Queued time-based interpolation of a single scalar.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Support/Clock.hpp"

#include <deque>
#include <cstdint>

enum class EasingType {
	Linear    = 0,
	SineIn    = 1,
	SineOut   = 2,
	SineInOut = 3,
	Jump      = 4,
	Power     = 5
};

struct Easing {
	EasingType type{EasingType::Linear};
	// Only used by Power, positive values ease in and negative ones ease out
	float power{0};

	// Decodes the low 6 bits of a LAYERCTRL flag word
	static Easing fromScenario(int32_t flags, int32_t powerParam);

	// x is in [0, 1]
	float apply(float x) const;
	bool operator==(const Easing &o) const {
		return type == o.type && power == o.power;
	}
};

struct Tween {
	Ticks duration;
	Easing easing;

	static Tween linear(Ticks t) {
		return Tween{t, {}};
	}
	static Tween immediate() {
		return Tween{Ticks(0), {}};
	}
	// Fraction of the way, duration of zero completes right away
	float value(Ticks time) const;
};

class Tweener {
	struct Pending {
		float target;
		Tween tween;
	};

	float current{0};
	bool tweening{false};
	float from{0};
	float to{0};
	Ticks time;
	Tween active;
	std::deque<Pending> queue;

	void start(float target, const Tween &tween, Ticks elapsed);

public:
	Tweener() = default;
	explicit Tweener(float value)
	    : current(value) {}

	// Runs after whatever was enqueued before
	void enqueue(float target, const Tween &tween);
	// Drops the queue and starts right from the current value
	void enqueueNow(float target, const Tween &tween);
	// Completes every queued tween
	void fastForward();
	// Drops the queue and jumps to the value
	void fastForwardTo(float target);

	void update(Ticks dt);

	float value() const {
		return current;
	}
	// Value the tweener comes to rest at
	float targetValue() const;
	bool isIdle() const {
		return !tweening && queue.empty();
	}
	size_t queued() const {
		return queue.size() + (tweening ? 1 : 0);
	}
};
