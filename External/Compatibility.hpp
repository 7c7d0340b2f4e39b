/**
 *  Compatibility.hpp
 *  SNRScripter
 *
 *  Compatibility header included by all files.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#if !defined(MACOSX) && !defined(IOS) && !defined(LINUX) && !defined(WIN32) && !defined(DROID)
	#error "Unknown operating system configuration!"
#endif

// WinNT version fix
#if defined(WIN32) && !defined(_WIN32_WINNT)
	#define _WIN32_WINNT 0x0501
#endif

// Hide specific inline attributes
#ifndef FORCE_INLINE
	#define FORCE_INLINE __attribute__((always_inline)) inline
#endif

// route prediction
#ifndef LIKELY
	#define LIKELY(x)       __builtin_expect(!!(x), 1)
	#define UNLIKELY(x)     __builtin_expect(!!(x), 0)
#endif

// Mathematical constants
#ifndef HAS_MATH_CONSTANTS
	#ifndef _USE_MATH_DEFINES
		#define _USE_MATH_DEFINES
	#endif
	#include <cmath>
	#ifndef M_PI
		#define M_PI 3.14159265358979323846
	#endif
	#define HAS_MATH_CONSTANTS
#endif

// Small POD vector types used by the binary formats
#ifndef HAS_VECTOR_TYPES
	#include <cstddef>
	#include <cstdint>
	template <typename T, size_t Len>
	struct vec { };

	template <typename T, size_t Len>
	FORCE_INLINE bool operator!=(const vec<T, Len> &lhs, const vec<T, Len> &rhs) { return !(lhs == rhs); }

	template <typename T>
	struct vec<T, 2> {
		T x, y;
		bool operator==(const vec &rhs) const { return x == rhs.x && y == rhs.y; }
	};

	template <typename T>
	struct vec<T, 3> {
		T x, y, z;
		bool operator==(const vec &rhs) const { return x == rhs.x && y == rhs.y && z == rhs.z; }
	};
	template <typename T>
	struct vec<T, 4> {
		T x, y, z, u;
		bool operator==(const vec &rhs) const { return x == rhs.x && y == rhs.y && z == rhs.z && u == rhs.u; }
	};

	using uchar4 = vec<unsigned char, 4>;
	using short2 = vec<int16_t, 2>;
	using ushort2 = vec<uint16_t, 2>;
	using float2 = vec<float, 2>;
	using float3 = vec<float, 3>;
	using float4 = vec<float, 4>;

	#define HAS_VECTOR_TYPES
#endif

// Until we have C++17
#ifndef HAS_HANDYCPP
	#include <algorithm>
	#include <atomic>
	#include <memory>
	#include <stdexcept>
	#include <type_traits>

	namespace cmp {
		// Helper class for optional objects
		template <typename T>
		class optional {
			std::atomic<bool> has_ {false};
			std::unique_ptr<T> ptr {nullptr};
		public:
			bool has() const {
				return has_.load(std::memory_order_relaxed);
			}
			T &get() const {
				if (UNLIKELY(!has()))
					throw std::runtime_error("Failed to get optional item");
				return *ptr;
			}
			T get(const T &def) const {
				if (!has()) return def;
				return *ptr;
			}
			T &set(T &&t) {
				ptr = std::make_unique<T>(std::move(t));
				has_.store(true, std::memory_order_release);
				return *ptr;
			}
			T &set(const T &t) {
				ptr = std::make_unique<T>(t);
				has_.store(true, std::memory_order_release);
				return *ptr;
			}
			void unset() {
				has_.store(false, std::memory_order_release);
				ptr = nullptr;
			}
			optional() = default;
			optional(const T &t) {
				set(t);
			}
			optional(const optional &o) {
				*this = o;
			}
			optional &operator = (const optional &o) {
				if (o.has()) set(o.get());
				else unset();
				return *this;
			}
			bool operator == (const optional &o) const {
				if (has() != o.has()) return false;
				return !has() || get() == o.get();
			}
			bool operator != (const optional &o) const {
				return !(*this == o);
			}
		};

		template <typename T>
		FORCE_INLINE constexpr const T clamp(const T &v, const T &lo, const T &hi) {
			return std::max(lo, std::min(v, hi));
		}
	}
	#define HAS_HANDYCPP
#endif

// Byte order helpers
#ifndef HAS_HANDYC
	#include <cstdint>

	FORCE_INLINE uint32_t swap32(uint32_t v) {
		return __builtin_bswap32(v);
	}

	// Unaligned little and big endian loads, the formats are little-endian unless noted
	FORCE_INLINE uint16_t loadLE16(const uint8_t *p) {
		return static_cast<uint16_t>(p[0] | (p[1] << 8));
	}

	FORCE_INLINE uint32_t loadLE32(const uint8_t *p) {
		return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
		       (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
	}

	FORCE_INLINE uint16_t loadBE16(const uint8_t *p) {
		return static_cast<uint16_t>((p[0] << 8) | p[1]);
	}

	FORCE_INLINE uint32_t loadBE32(const uint8_t *p) {
		return swap32(loadLE32(p));
	}

	FORCE_INLINE void storeLE32(uint8_t *p, uint32_t v) {
		p[0] = v & 0xFF;
		p[1] = (v >> 8) & 0xFF;
		p[2] = (v >> 16) & 0xFF;
		p[3] = (v >> 24) & 0xFF;
	}

	FORCE_INLINE void storeBE32(uint8_t *p, uint32_t v) {
		storeLE32(p, swap32(v));
	}

	#define HAS_HANDYC
#endif
