/**
 *  Tweener.cpp
 *  SNRScripter
 *
 *  Queued time-based interpolation of a single scalar.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Entities/Tweener.hpp"

#include <cmath>

Easing Easing::fromScenario(int32_t flags, int32_t powerParam) {
	Easing e;
	switch (flags & 0x3F) {
		case 0:
			e.type = EasingType::Linear;
			break;
		case 1:
			e.type = EasingType::SineIn;
			break;
		case 2:
			e.type = EasingType::SineOut;
			break;
		case 3:
			e.type = EasingType::SineInOut;
			break;
		case 4:
			e.type = EasingType::Jump;
			break;
		case 5:
			e.type  = EasingType::Power;
			e.power = static_cast<float>(powerParam);
			break;
		default:
			sendToLog(LogLevel::Warn, "Unknown easing function %d, using linear\n", flags & 0x3F);
			break;
	}
	return e;
}

float Easing::apply(float x) const {
	switch (type) {
		case EasingType::Linear:
			return x;
		case EasingType::SineIn:
			return 1.0f - std::cos(x * static_cast<float>(M_PI) / 2.0f);
		case EasingType::SineOut:
			return std::sin(x * static_cast<float>(M_PI) / 2.0f);
		case EasingType::SineInOut:
			return (1.0f - std::cos(static_cast<float>(M_PI) * x)) / 2.0f;
		case EasingType::Jump:
			return x < 1.0f ? 0.0f : 1.0f;
		case EasingType::Power:
			if (power > 0)
				return std::pow(x, power);
			if (power < 0)
				return 1.0f - std::pow(1.0f - x, -power);
			return x;
	}
	return x;
}

float Tween::value(Ticks time) const {
	if (duration.zero())
		return 1.0f;
	float x = cmp::clamp(time.value / duration.value, 0.0f, 1.0f);
	return easing.apply(x);
}

void Tweener::start(float target, const Tween &tween, Ticks elapsed) {
	tweening = true;
	from     = current;
	to       = target;
	active   = tween;
	time     = elapsed;
}

void Tweener::enqueue(float target, const Tween &tween) {
	if (!tweening)
		start(target, tween, Ticks());
	else
		queue.push_back({target, tween});
}

void Tweener::enqueueNow(float target, const Tween &tween) {
	fastForwardTo(current);
	enqueue(target, tween);
}

void Tweener::fastForward() {
	if (!tweening)
		return;
	current = queue.empty() ? to : queue.back().target;
	queue.clear();
	tweening = false;
}

void Tweener::fastForwardTo(float target) {
	queue.clear();
	tweening = false;
	current  = target;
}

void Tweener::update(Ticks dt) {
	if (!tweening)
		return;

	time += dt;
	// Several short tweens may complete within one tick
	while (tweening && time >= active.duration) {
		Ticks rest = time - active.duration;
		current    = to;
		tweening   = false;
		if (!queue.empty()) {
			Pending next = queue.front();
			queue.pop_front();
			start(next.target, next.tween, rest);
		}
	}

	if (tweening)
		current = from + (to - from) * active.value(time);
}

float Tweener::targetValue() const {
	if (!queue.empty())
		return queue.back().target;
	return tweening ? to : current;
}
