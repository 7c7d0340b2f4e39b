/**
 *  Pool.cpp
 *  SNRScripter
 *
 *  Offscreen render targets reused across frames.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Graphics/Pool.hpp"
#include "Support/FileDefs.hpp"

#include <algorithm>

TargetHandle RenderTargetPool::getTarget(int width, int height) {
	// Look for an unused target of the same size
	auto i = std::find_if(pool.begin(), pool.end(), [width, height](const std::unordered_map<TargetHandle, bool>::value_type &e) {
		return !e.second && e.first->width == width && e.first->height == height;
	});
	// If we found one, return that, otherwise make a new one
	TargetHandle r = i != pool.end() ? i->first : backend.createTarget(width, height);
	pool[r]        = true;
	return r;
}

void RenderTargetPool::giveTarget(const TargetHandle &target) {
	auto it = pool.find(target);
	if (it == pool.end()) {
		sendToLog(LogLevel::Error, "RenderTargetPool was given a target it does not own\n");
		return;
	}
	it->second = false;
}

void RenderTargetPool::addTargets(int n, int width, int height) {
	for (int i = 0; i < n; i++)
		pool[backend.createTarget(width, height)] = false;
}

void RenderTargetPool::clearUnused() {
	for (auto it = pool.begin(); it != pool.end();) {
		if (!it->second)
			it = pool.erase(it);
		else
			++it;
	}
}

size_t RenderTargetPool::checkedOut() const {
	return std::count_if(pool.begin(), pool.end(), [](const std::unordered_map<TargetHandle, bool>::value_type &e) { return e.second; });
}

PooledTarget RenderTargetPool::get(int width, int height) {
	return PooledTarget(this, width, height);
}

RenderTargetPool::~RenderTargetPool() {
	for (auto &diver : pool) {
		if (diver.second)
			sendToLog(LogLevel::Error, "~RenderTargetPool@Target %dx%d is still checked out\n", diver.first->width, diver.first->height);
	}
}
