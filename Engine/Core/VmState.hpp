/**
 *  VmState.hpp
 *  SNRScripter
 *
 *  Declarative game state mutated by commands before they touch the scene.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Entities/Properties.hpp"

#include <array>
#include <string>
#include <vector>
#include <cstdint>

const int32_t LAYERS_COUNT     = 0x100;
const int32_t LAYERBANKS_COUNT = 0x30;
const int32_t PLANES_COUNT     = 4;
const int32_t SE_SLOT_COUNT    = 32;
const int32_t PERSIST_COUNT    = 0x100;

enum class LayerType {
	Null      = 0,
	Tile      = 1,
	Picture   = 2,
	Bustup    = 3,
	Animation = 4,
	Effect    = 5,
	Movie     = 6,
	FocusLine = 7,
	Rain      = 8,
	Quiz      = 9
};

bool layerTypeFromNumber(int32_t value, LayerType &type);
const char *layerTypeName(LayerType type);

// Layer ids as scenarios name them, negative values address the fixed nodes
struct VLayerId {
	enum class Kind {
		Layer,
		RootLayerGroup,
		ScreenLayer,
		PageLayer,
		PlaneLayerGroup,
		Selected
	};

	Kind kind{Kind::Layer};
	int32_t layer{0};

	// Throws VmError::Corrupt for values out of [-5, LAYERS_COUNT)
	static VLayerId fromNumber(int32_t value);
	std::string toString() const;
};

// LAYERLOAD flags
namespace LayerLoad {
enum : int32_t {
	DONT_BLOCK_ANIMATIONS    = 1,
	KEEP_PREVIOUS_PROPERTIES = 2,
	AUTO_WIPE                = 4,
	SHARE_PROPS_DURING_WIPE  = 8
};
} // namespace LayerLoad

// LAYERCTRL flags
struct LayerCtrlFlags {
	int32_t raw{0};

	int32_t easing() const {
		return raw & 0x3F;
	}
	bool scaleTime() const {
		return raw & (1 << 6);
	}
	bool delta() const {
		return raw & (1 << 7);
	}
	bool ffToCurrent() const {
		return raw & (1 << 8);
	}
	bool ffToTarget() const {
		return raw & (1 << 9);
	}
	bool prohibitFastForward() const {
		return raw & (1 << 12);
	}
	bool ignoreWait() const {
		return raw & (1 << 16);
	}
	bool hasUnusedBits() const {
		return raw & static_cast<int32_t>(0xFFFEEC00);
	}
};

enum class MessageboxType {
	Neutral     = 0,
	WitchSpace  = 1,
	Ushiromiya  = 2,
	Transparent = 3,
	Novel       = 4,
	NoText      = 5
};

enum class MessageTextLayout {
	Left   = 0,
	Layout = 1,
	Center = 2,
	Right  = 3
};

struct MessageboxStyle {
	MessageboxType type{MessageboxType::Neutral};
	MessageTextLayout layout{MessageTextLayout::Left};

	// Low nibble is the box type, the next one the layout; unknown values fall back to defaults
	static MessageboxStyle fromNumber(int32_t value);
	bool operator==(const MessageboxStyle &o) const {
		return type == o.type && layout == o.layout;
	}
};

// 0..1000 scaled to [0, 1]
float volumeFromNumber(int32_t value);
// -1000..1000 scaled to [-1, 1]
float panFromNumber(int32_t value);

struct SaveInfo {
	std::array<std::string, 4> info;

	// Levels outside 0..3 are logged and ignored
	void set(int32_t level, const std::string &text);
};

struct MessageState {
	MessageboxStyle style;
	bool shown{false};
	bool hasText{false};
	std::string text;
};

class Persist {
	std::array<int32_t, PERSIST_COUNT> globals{};

public:
	// Out of range ids read 0 and ignore writes with a warning
	int32_t get(int32_t id) const;
	void set(int32_t id, int32_t value);
};

struct LayerOperationTarget {
	int32_t layer;
	int32_t layerbank;
};

using LayerOperationTargetList = std::vector<LayerOperationTarget>;

// Maps scenario layer ids onto the bounded layerbank slots of one plane
class LayerbankAllocator {
	std::array<int32_t, LAYERS_COUNT> layerToBank;
	std::array<int32_t, LAYERBANKS_COUNT> bankToLayer;

public:
	LayerbankAllocator();

	// -1 when the layer holds no layerbank
	int32_t layerbank(int32_t layer) const;
	int32_t layer(int32_t layerbank) const;
	// First unused slot; a layer that already has one keeps it; -1 when exhausted
	int32_t alloc(int32_t layer);
	void free(int32_t layer);
	void swap(int32_t layer1, int32_t layer2);
	void clear();
	size_t allocated() const;
	// Ascending layer order
	LayerOperationTargetList layersInRange(int32_t from, int32_t to) const;
};

struct LayerSelection {
	int32_t from{0};
	int32_t to{0};
};

struct LayerbankState {
	// Not set means the layer is unloaded and the rest is stale
	cmp::optional<LayerType> type;
	int32_t plane{0};
	int32_t layer{0};
	uint32_t loadCounter{0};
	std::array<int32_t, 8> params{};
	LayerPropertiesSnapshot properties;
};

struct PlaneState {
	LayerPropertiesSnapshot properties;
	LayerbankAllocator allocator;
	std::array<LayerbankState, LAYERBANKS_COUNT> layerbanks;
	int32_t maskId{-1};
	int32_t maskFlags{0};
};

struct LayersState {
	LayerPropertiesSnapshot rootLayerGroup;
	LayerPropertiesSnapshot screenLayer;
	LayerPropertiesSnapshot pageLayer;
	std::array<PlaneState, PLANES_COUNT> planes;
	LayerSelection selection;
	int32_t currentPlane{0};
	bool pageBackStarted{false};
	uint32_t loadWithInitCounter{0};
	uint32_t loadCounter{0};

	PlaneState &plane() {
		return planes[currentPlane];
	}
	const PlaneState &plane() const {
		return planes[currentPlane];
	}
	// Targets of a VLayerId on the current plane, empty for the fixed nodes
	LayerOperationTargetList targets(const VLayerId &id) const;
	// Properties of a fixed node, nullptr for Layer and Selected
	LayerPropertiesSnapshot *fixedNode(const VLayerId &id);
};

struct BgmState {
	int32_t bgmId{0};
	float volume{1};
};

struct SeState {
	int32_t seId{0};
	float volume{1};
	float pan{0};
	float playSpeed{1};
};

struct AudioState {
	cmp::optional<BgmState> bgm;
	std::array<cmp::optional<SeState>, SE_SLOT_COUNT> se;
};

struct VmState {
	SaveInfo saveInfo;
	MessageState message;
	Persist persist;
	LayersState layers;
	AudioState audio;
};
