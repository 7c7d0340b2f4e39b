/**
 *  LayerGroup.cpp
 *  SNRScripter
 *
 *  Composite nodes between the root and the user layers: planes, the page and the screen.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Layers/LayerGroup.hpp"
#include "Support/FileDefs.hpp"

#include <algorithm>
#include <tuple>

/* ---------------- LayerGroup ----------------- */

void LayerGroup::add(int32_t layerbank, int32_t layerId, UserLayer &&layer) {
	auto it = banks.find(layerbank);
	if (it != banks.end())
		banks.erase(it);
	banks.emplace(layerbank, Entry{layerId, std::move(layer)});
}

void LayerGroup::remove(int32_t layerbank, Ticks delay) {
	auto it = banks.find(layerbank);
	if (it == banks.end())
		return;
	if (delay.zero()) {
		banks.erase(it);
		return;
	}
	it->second.removing = true;
	it->second.removeIn = delay;
}

void LayerGroup::clear() {
	banks.clear();
}

void LayerGroup::swap(int32_t layerbank1, int32_t layerbank2) {
	auto a = banks.find(layerbank1), b = banks.find(layerbank2);
	if (a != banks.end() && b != banks.end()) {
		std::swap(a->second.layerId, b->second.layerId);
	} else if (a != banks.end()) {
		banks.emplace(layerbank2, std::move(a->second));
		banks.erase(layerbank1);
	} else if (b != banks.end()) {
		banks.emplace(layerbank1, std::move(b->second));
		banks.erase(layerbank2);
	}
}

void LayerGroup::relabel(int32_t layerbank, int32_t layerId) {
	auto it = banks.find(layerbank);
	if (it != banks.end())
		it->second.layerId = layerId;
}

UserLayer *LayerGroup::get(int32_t layerbank) {
	auto it = banks.find(layerbank);
	return it == banks.end() ? nullptr : &it->second.layer;
}

const UserLayer *LayerGroup::get(int32_t layerbank) const {
	auto it = banks.find(layerbank);
	return it == banks.end() ? nullptr : &it->second.layer;
}

std::vector<int32_t> LayerGroup::order() const {
	std::vector<std::tuple<int32_t, int32_t, int32_t>> keys;
	keys.reserve(banks.size());
	for (auto &b : banks) {
		auto position = static_cast<int32_t>(b.second.layer.properties().get(LayerProperty::RenderPosition));
		keys.emplace_back(position, b.second.layerId, b.first);
	}
	std::sort(keys.begin(), keys.end());

	std::vector<int32_t> result;
	result.reserve(keys.size());
	for (auto &k : keys)
		result.push_back(std::get<2>(k));
	return result;
}

void LayerGroup::children(std::vector<Layer *> &out) {
	for (auto bank : order())
		out.push_back(&banks.at(bank).layer);
}

void LayerGroup::update(const UpdateContext &ctx) {
	Layer::update(ctx);
	for (auto it = banks.begin(); it != banks.end();) {
		auto &entry = it->second;
		entry.layer.update(ctx);
		if (entry.removing) {
			entry.removeIn -= ctx.delta;
			if (entry.removeIn.zero() || ctx.fastForwarding) {
				it = banks.erase(it);
				continue;
			}
		}
		++it;
	}
}

bool LayerGroup::isIdle() const {
	if (!props.isIdle())
		return false;
	for (auto &b : banks)
		if (!b.second.layer.properties().isIdle() || !b.second.layer.finished())
			return false;
	return true;
}

std::string LayerGroup::describe() const {
	std::string out;
	if (mask_)
		out += "  mask flags " + std::to_string(maskFlags_) + "\n";
	for (auto bank : order()) {
		auto &entry = banks.at(bank);
		out += "  [" + std::to_string(bank) + "] layer " + std::to_string(entry.layerId) + ": " + entry.layer.describe() + "\n";
	}
	return out;
}

/* ---------------- PageLayer ----------------- */

void PageLayer::children(std::vector<Layer *> &out) {
	for (auto &plane : planes)
		out.push_back(&plane);
}

void PageLayer::update(const UpdateContext &ctx) {
	Layer::update(ctx);
	for (auto &plane : planes)
		plane.update(ctx);
}

bool PageLayer::isIdle() const {
	return props.isIdle() && std::all_of(planes.begin(), planes.end(), [](const LayerGroup &p) { return p.isIdle(); });
}

/* ---------------- ScreenLayer ----------------- */

ScreenLayer::ScreenLayer(const ScreenLayer &o)
    : CompositeLayer(o), page_(o.page_), transitionPrepared(o.transitionPrepared) {
	if (o.previous)
		previous = std::make_unique<PageLayer>(*o.previous);
}

ScreenLayer &ScreenLayer::operator=(const ScreenLayer &o) {
	if (this == &o)
		return *this;
	CompositeLayer::operator=(o);
	page_              = o.page_;
	transitionPrepared = o.transitionPrepared;
	previous           = o.previous ? std::make_unique<PageLayer>(*o.previous) : nullptr;
	return *this;
}

void ScreenLayer::children(std::vector<Layer *> &out) {
	if (previous && transitionPrepared) {
		// The frozen page covers everything until the transition starts
		out.push_back(previous.get());
		return;
	}
	out.push_back(&page_);
	if (previous)
		out.push_back(previous.get());
}

void ScreenLayer::prepareTransition() {
	if (transitionPrepared)
		sendToLog(LogLevel::Warn, "A transition was prepared twice, keeping the first frozen page\n");
	else
		previous = std::make_unique<PageLayer>(page_);
	transitionPrepared = true;
}

void ScreenLayer::startTransition(Ticks duration) {
	if (!previous) {
		sendToLog(LogLevel::Warn, "Transition started without a frozen page\n");
		return;
	}
	transitionPrepared = false;
	auto &alpha        = previous->properties().tweener(LayerProperty::MulColorAlpha);
	alpha.enqueueNow(0, Tween::linear(duration));
	if (duration.zero())
		finishTransition();
}

void ScreenLayer::finishTransition() {
	previous.reset();
	transitionPrepared = false;
}

void ScreenLayer::update(const UpdateContext &ctx) {
	Layer::update(ctx);
	page_.update(ctx);
	if (!previous)
		return;
	// A frozen page does not animate
	if (transitionPrepared)
		return;
	if (ctx.fastForwarding)
		previous->properties().tweener(LayerProperty::MulColorAlpha).fastForward();
	previous->properties().update(ctx.delta);
	if (previous->properties().tweener(LayerProperty::MulColorAlpha).isIdle())
		finishTransition();
}

/* ---------------- RootLayerGroup ----------------- */

void RootLayerGroup::children(std::vector<Layer *> &out) {
	out.push_back(&screen_);
	out.push_back(&message_);
}

void RootLayerGroup::update(const UpdateContext &ctx) {
	Layer::update(ctx);
	screen_.update(ctx);
	message_.update(ctx);
}
