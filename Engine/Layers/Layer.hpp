/**
 *  Layer.hpp
 *  SNRScripter
 *
 *  Base classes for scene graph nodes.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Entities/Properties.hpp"
#include "Engine/Graphics/Pool.hpp"
#include "Engine/Graphics/Render.hpp"
#include "Support/Clock.hpp"

#include <vector>
#include <cstdint>

struct UpdateContext {
	Ticks delta;
	// Skip-mode, commands complete as soon as they are allowed to
	bool fastForwarding{false};
};

// Pass a leaf wants to draw in with the given parameters
enum class LayerDraw {
	Nothing,
	OpaquePass,
	TransparentPass
};

inline bool drawsIn(LayerDraw draw, PassKind kind) {
	return (draw == LayerDraw::OpaquePass && kind == PassKind::Opaque) ||
	       (draw == LayerDraw::TransparentPass && kind == PassKind::Transparent);
}

class Layer : public Drawable {
protected:
	LayerProperties props;
	// Set by preRender while the node composes through an offscreen target
	PooledTarget indirect;

	// Called with the composed transform and the parameters the content is drawn with
	virtual void preRenderContent(PreRenderContext & /*ctx*/, const TransformParams & /*transform*/, const DrawableParams & /*params*/) {}
	virtual void renderContent(RenderPass &pass, const TransformParams &transform, const DrawableParams &params, uint8_t stencilRef) const = 0;

	// Draws the offscreen result onto the pass as a single quad
	void renderIndirect(RenderPass &pass, const TransformParams &transform, uint8_t stencilRef) const;

public:
	Layer() = default;
	// Copies share nothing but GPU resources, offscreen targets are never shared
	Layer(const Layer &o)
	    : Drawable(), props(o.props) {}
	Layer &operator=(const Layer &o) {
		props = o.props;
		indirect.reset();
		return *this;
	}

	LayerProperties &properties() {
		return props;
	}
	const LayerProperties &properties() const {
		return props;
	}

	virtual void update(const UpdateContext &ctx) {
		props.update(ctx.delta);
	}

	// Clipping, a nontrivial fragment operation or blending need an offscreen pass
	bool needsSeparatePass() const;
	bool rendersIndirectly() const {
		return static_cast<bool>(indirect);
	}

	void preRender(PreRenderContext &ctx, const TransformParams &parent) override;
	void render(RenderPass &pass, const TransformParams &parent, uint8_t stencilRef) const override;
};

// Node drawing a list of child layers, back to front
class CompositeLayer : public Layer {
	// Children that were visible during pre-render, the render passes walk only these
	std::vector<const Layer *> active;

protected:
	// Every child in drawing order, the first one is furthest back
	virtual void children(std::vector<Layer *> &out) = 0;

	void preRenderContent(PreRenderContext &ctx, const TransformParams &transform, const DrawableParams &params) override;
	void renderContent(RenderPass &pass, const TransformParams &transform, const DrawableParams &params, uint8_t stencilRef) const override;

public:
	CompositeLayer() = default;
	CompositeLayer(const CompositeLayer &o)
	    : Layer(o) {}
	CompositeLayer &operator=(const CompositeLayer &o) {
		Layer::operator=(o);
		active.clear();
		return *this;
	}

	// Sum of the active children, one when drawn through an offscreen target
	uint8_t stencilBump() const override;
	size_t activeChildren() const {
		return active.size();
	}
};
