/**
 *  Pool.hpp
 *  SNRScripter
 *
 *  Offscreen render targets reused across frames.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Graphics/Render.hpp"

#include <unordered_map>

struct PooledTarget;

class RenderTargetPool {
	RenderBackend &backend;
	std::unordered_map<TargetHandle, bool> pool; // boolean = is this target "checked-out"?

public:
	explicit RenderTargetPool(RenderBackend &b)
	    : backend(b) {}
	~RenderTargetPool();

	TargetHandle getTarget(int width, int height); // get a free target of this size or make one
	void giveTarget(const TargetHandle &target);   // return a target to the pool for reuse
	void addTargets(int n, int width, int height); // pre-create some targets to avoid delays later
	void clearUnused();
	size_t size() const {
		return pool.size();
	}
	size_t checkedOut() const;

	PooledTarget get(int width, int height);
};

struct PooledTarget {
	TargetHandle target;
	RenderTargetPool *pool{nullptr};
	PooledTarget() = default;
	PooledTarget(RenderTargetPool *_pool, int width, int height)
	    : pool(_pool) {
		target = pool->getTarget(width, height);
	}
	~PooledTarget() {
		if (target)
			pool->giveTarget(target);
	}
	// Can't copy pooled target containers
	PooledTarget(const PooledTarget &) = delete;
	PooledTarget &operator=(const PooledTarget &) = delete;
	// But you can move them
	PooledTarget(PooledTarget &&src) noexcept
	    : target(std::move(src.target)), pool(src.pool) {
		src.target = nullptr;
		src.pool   = nullptr;
	}
	PooledTarget &operator=(PooledTarget &&src) noexcept {
		if (target && pool)
			pool->giveTarget(target);
		target     = std::move(src.target);
		pool       = src.pool;
		src.target = nullptr;
		src.pool   = nullptr;
		return *this;
	}

	explicit operator bool() const {
		return target != nullptr;
	}
	void reset() {
		*this = PooledTarget();
	}
};
