/**
 *  LayerGroup.hpp
 *  SNRScripter
 *
 *  Composite nodes between the root and the user layers: planes, the page and the screen.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Core/VmState.hpp"
#include "Engine/Layers/Layer.hpp"
#include "Engine/Layers/MessageLayer.hpp"
#include "Engine/Layers/UserLayer.hpp"

#include <array>
#include <map>
#include <memory>
#include <vector>
#include <cstdint>

// One plane: the user layers loaded into its layerbanks
class LayerGroup : public CompositeLayer {
	struct Entry {
		int32_t layerId;
		UserLayer layer;
		bool removing{false};
		Ticks removeIn;
	};
	std::map<int32_t, Entry> banks;
	std::shared_ptr<const MaskTexture> mask_;
	int32_t maskFlags_{0};

protected:
	// By render position, then by layer id
	void children(std::vector<Layer *> &out) override;

public:
	// Replaces the occupant of the layerbank
	void add(int32_t layerbank, int32_t layerId, UserLayer &&layer);
	// delay in ticks, zero removes right away
	void remove(int32_t layerbank, Ticks delay = Ticks());
	void clear();
	// Two layerbanks trade places, their layer ids go with the banks
	void swap(int32_t layerbank1, int32_t layerbank2);
	void relabel(int32_t layerbank, int32_t layerId);

	void setMask(std::shared_ptr<const MaskTexture> mask, int32_t flags) {
		mask_      = std::move(mask);
		maskFlags_ = flags;
	}
	void clearMask() {
		mask_.reset();
		maskFlags_ = 0;
	}
	const MaskTexture *mask() const {
		return mask_.get();
	}
	int32_t maskFlags() const {
		return maskFlags_;
	}

	UserLayer *get(int32_t layerbank);
	const UserLayer *get(int32_t layerbank) const;
	size_t size() const {
		return banks.size();
	}
	// Layerbanks in drawing order
	std::vector<int32_t> order() const;

	void update(const UpdateContext &ctx) override;
	// No property is animating and every movie has finished
	bool isIdle() const;
	std::string describe() const;
};

class PageLayer : public CompositeLayer {
	std::array<LayerGroup, PLANES_COUNT> planes;

protected:
	void children(std::vector<Layer *> &out) override;

public:
	LayerGroup &plane(int32_t index) {
		return planes.at(index);
	}
	const LayerGroup &plane(int32_t index) const {
		return planes.at(index);
	}
	void update(const UpdateContext &ctx) override;
	bool isIdle() const;
};

// Holds the page and, during a transition, a frozen clone of the previous one fading out above it
class ScreenLayer : public CompositeLayer {
	PageLayer page_;
	std::unique_ptr<PageLayer> previous;
	bool transitionPrepared{false};

protected:
	void children(std::vector<Layer *> &out) override;

public:
	ScreenLayer() = default;
	ScreenLayer(const ScreenLayer &o);
	ScreenLayer &operator=(const ScreenLayer &o);

	PageLayer &page() {
		return page_;
	}
	const PageLayer &page() const {
		return page_;
	}

	// Freezes the current page, later changes stay hidden until startTransition
	void prepareTransition();
	bool transitionPending() const {
		return transitionPrepared;
	}
	// Fades the frozen page out over duration
	void startTransition(Ticks duration);
	bool inTransition() const {
		return previous != nullptr;
	}
	void finishTransition();

	void update(const UpdateContext &ctx) override;
};

// Top of the scene graph: the screen with the message window over it
class RootLayerGroup : public CompositeLayer {
	ScreenLayer screen_;
	MessageLayer message_;

protected:
	void children(std::vector<Layer *> &out) override;

public:
	RootLayerGroup() = default;
	RootLayerGroup(const RootLayerGroup &) = delete;
	RootLayerGroup &operator=(const RootLayerGroup &) = delete;

	ScreenLayer &screen() {
		return screen_;
	}
	const ScreenLayer &screen() const {
		return screen_;
	}
	MessageLayer &message() {
		return message_;
	}
	const MessageLayer &message() const {
		return message_;
	}

	void update(const UpdateContext &ctx) override;
};
