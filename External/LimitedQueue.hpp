/**
 *  LimitedQueue.hpp
 *  SNRScripter
 *
 *  Fixed capacity single producer single consumer queue for the tight audio and video paths.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <utility>

// One thread calls push, one other thread calls pop. Neither ever blocks.
template <typename T, size_t CAPACITY, size_t CACHE_LINE_SIZE = 64>
class limited_queue {
	static_assert(CAPACITY > 0, "limited_queue needs room for at least one element");

	// One extra slot tells a full queue from an empty one
	static constexpr size_t slots = CAPACITY + 1;

	std::array<T, slots> buffer{};
	alignas(CACHE_LINE_SIZE) std::atomic<size_t> head{0};
	alignas(CACHE_LINE_SIZE) std::atomic<size_t> tail{0};

	static FORCE_INLINE size_t next(size_t i) {
		return i + 1 == slots ? 0 : i + 1;
	}

public:
	limited_queue() = default;
	limited_queue(const limited_queue &) = delete;
	limited_queue &operator=(const limited_queue &) = delete;

	// false when full, the element is left untouched
	bool push(T &&element) {
		size_t t    = tail.load(std::memory_order_relaxed);
		size_t n    = next(t);
		if (n == head.load(std::memory_order_acquire))
			return false;
		buffer[t] = std::move(element);
		tail.store(n, std::memory_order_release);
		return true;
	}

	bool push(const T &element) {
		T copy = element;
		return push(std::move(copy));
	}

	bool pop(T &element) {
		size_t h = head.load(std::memory_order_relaxed);
		if (h == tail.load(std::memory_order_acquire))
			return false;
		element = std::move(buffer[h]);
		head.store(next(h), std::memory_order_release);
		return true;
	}

	// Only meaningful on the consumer side
	T *front() {
		size_t h = head.load(std::memory_order_relaxed);
		if (h == tail.load(std::memory_order_acquire))
			return nullptr;
		return &buffer[h];
	}

	bool empty() const {
		return head.load(std::memory_order_acquire) == tail.load(std::memory_order_acquire);
	}

	size_t size() const {
		size_t h = head.load(std::memory_order_acquire);
		size_t t = tail.load(std::memory_order_acquire);
		return t >= h ? t - h : t + slots - h;
	}

	static constexpr size_t capacity() {
		return CAPACITY;
	}
};
