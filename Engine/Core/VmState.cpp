/**
 *  VmState.cpp
 *  SNRScripter
 *
 *  Declarative game state mutated by commands before they touch the scene.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Core/VmState.hpp"
#include "Support/Errors.hpp"
#include "Support/FileDefs.hpp"

#include <algorithm>

bool layerTypeFromNumber(int32_t value, LayerType &type) {
	if (value < 0 || value > static_cast<int32_t>(LayerType::Quiz))
		return false;
	type = static_cast<LayerType>(value);
	return true;
}

const char *layerTypeName(LayerType type) {
	switch (type) {
		case LayerType::Null:
			return "Null";
		case LayerType::Tile:
			return "Tile";
		case LayerType::Picture:
			return "Picture";
		case LayerType::Bustup:
			return "Bustup";
		case LayerType::Animation:
			return "Animation";
		case LayerType::Effect:
			return "Effect";
		case LayerType::Movie:
			return "Movie";
		case LayerType::FocusLine:
			return "FocusLine";
		case LayerType::Rain:
			return "Rain";
		case LayerType::Quiz:
			return "Quiz";
	}
	return "Unknown";
}

VLayerId VLayerId::fromNumber(int32_t value) {
	VLayerId id;
	switch (value) {
		case -1:
			id.kind = Kind::RootLayerGroup;
			return id;
		case -2:
			id.kind = Kind::ScreenLayer;
			return id;
		case -3:
			id.kind = Kind::PageLayer;
			return id;
		case -4:
			id.kind = Kind::PlaneLayerGroup;
			return id;
		case -5:
			id.kind = Kind::Selected;
			return id;
		default:
			break;
	}
	if (value < 0 || value >= LAYERS_COUNT)
		throw VmError(VmError::Kind::Corrupt, 0, "layer id " + std::to_string(value) + " out of range");
	id.layer = value;
	return id;
}

std::string VLayerId::toString() const {
	switch (kind) {
		case Kind::Layer:
			return "layer " + std::to_string(layer);
		case Kind::RootLayerGroup:
			return "root";
		case Kind::ScreenLayer:
			return "screen";
		case Kind::PageLayer:
			return "page";
		case Kind::PlaneLayerGroup:
			return "plane";
		case Kind::Selected:
			return "selected";
	}
	return "?";
}

MessageboxStyle MessageboxStyle::fromNumber(int32_t value) {
	MessageboxStyle style;
	int32_t type   = value & 0xF;
	int32_t layout = (value >> 4) & 0xF;
	if (type <= static_cast<int32_t>(MessageboxType::NoText))
		style.type = static_cast<MessageboxType>(type);
	else
		sendToLog(LogLevel::Warn, "Unknown message box type %d\n", type);
	if (layout <= static_cast<int32_t>(MessageTextLayout::Right))
		style.layout = static_cast<MessageTextLayout>(layout);
	else
		sendToLog(LogLevel::Warn, "Unknown message text layout %d\n", layout);
	return style;
}

float volumeFromNumber(int32_t value) {
	return cmp::clamp(value / 1000.0f, 0.0f, 1.0f);
}

float panFromNumber(int32_t value) {
	return cmp::clamp(value / 1000.0f, -1.0f, 1.0f);
}

void SaveInfo::set(int32_t level, const std::string &text) {
	if (level < 0 || level >= static_cast<int32_t>(info.size())) {
		sendToLog(LogLevel::Warn, "SAVEINFO level %d out of range\n", level);
		return;
	}
	info[level] = text;
}

int32_t Persist::get(int32_t id) const {
	if (id < 0 || id >= PERSIST_COUNT) {
		sendToLog(LogLevel::Warn, "Persistent global %d out of range\n", id);
		return 0;
	}
	return globals[id];
}

void Persist::set(int32_t id, int32_t value) {
	if (id < 0 || id >= PERSIST_COUNT) {
		sendToLog(LogLevel::Warn, "Persistent global %d out of range\n", id);
		return;
	}
	globals[id] = value;
}

LayerbankAllocator::LayerbankAllocator() {
	clear();
}

void LayerbankAllocator::clear() {
	layerToBank.fill(-1);
	bankToLayer.fill(-1);
}

int32_t LayerbankAllocator::layerbank(int32_t layer) const {
	if (layer < 0 || layer >= LAYERS_COUNT)
		return -1;
	return layerToBank[layer];
}

int32_t LayerbankAllocator::layer(int32_t layerbank) const {
	if (layerbank < 0 || layerbank >= LAYERBANKS_COUNT)
		return -1;
	return bankToLayer[layerbank];
}

int32_t LayerbankAllocator::alloc(int32_t layer) {
	if (layer < 0 || layer >= LAYERS_COUNT)
		return -1;
	if (layerToBank[layer] >= 0)
		return layerToBank[layer];

	auto it = std::find(bankToLayer.begin(), bankToLayer.end(), -1);
	if (it == bankToLayer.end())
		return -1;

	int32_t bank       = static_cast<int32_t>(it - bankToLayer.begin());
	*it                = layer;
	layerToBank[layer] = bank;
	return bank;
}

void LayerbankAllocator::free(int32_t layer) {
	int32_t bank = layerbank(layer);
	if (bank < 0)
		return;
	layerToBank[layer] = -1;
	bankToLayer[bank]  = -1;
}

void LayerbankAllocator::swap(int32_t layer1, int32_t layer2) {
	if (layer1 == layer2 || layer1 < 0 || layer1 >= LAYERS_COUNT || layer2 < 0 || layer2 >= LAYERS_COUNT)
		return;

	std::swap(layerToBank[layer1], layerToBank[layer2]);
	if (layerToBank[layer1] >= 0)
		bankToLayer[layerToBank[layer1]] = layer1;
	if (layerToBank[layer2] >= 0)
		bankToLayer[layerToBank[layer2]] = layer2;
}

size_t LayerbankAllocator::allocated() const {
	return std::count_if(bankToLayer.begin(), bankToLayer.end(), [](int32_t l) { return l >= 0; });
}

LayerOperationTargetList LayerbankAllocator::layersInRange(int32_t from, int32_t to) const {
	LayerOperationTargetList result;
	from = std::max(from, 0);
	to   = std::min(to, LAYERS_COUNT - 1);
	for (int32_t l = from; l <= to; l++) {
		if (layerToBank[l] >= 0)
			result.push_back({l, layerToBank[l]});
	}
	return result;
}

LayerOperationTargetList LayersState::targets(const VLayerId &id) const {
	switch (id.kind) {
		case VLayerId::Kind::Layer:
			return plane().allocator.layersInRange(id.layer, id.layer);
		case VLayerId::Kind::Selected:
			return plane().allocator.layersInRange(selection.from, selection.to);
		default:
			return {};
	}
}

LayerPropertiesSnapshot *LayersState::fixedNode(const VLayerId &id) {
	switch (id.kind) {
		case VLayerId::Kind::RootLayerGroup:
			return &rootLayerGroup;
		case VLayerId::Kind::ScreenLayer:
			return &screenLayer;
		case VLayerId::Kind::PageLayer:
			return &pageLayer;
		case VLayerId::Kind::PlaneLayerGroup:
			return &plane().properties;
		default:
			return nullptr;
	}
}
