/**
 *  Layer.cpp
 *  SNRScripter
 *
 *  Base classes for scene graph nodes.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Layers/Layer.hpp"

namespace {

// Canvas position of a point that the transform puts into normalised device coordinates
Vec2 toCanvas(const Mat4 &transform, float x, float y) {
	Vec4 p = transform * Vec4(x, y, 0, 1);
	if (p.w() != 0)
		p /= p.w();
	return Vec2((p.x() + 1.0f) * 0.5f * VIRTUAL_CANVAS_WIDTH, (1.0f - p.y()) * 0.5f * VIRTUAL_CANVAS_HEIGHT);
}

} // namespace

bool Layer::needsSeparatePass() const {
	return props.isFragmentShaderNontrivial() || props.isBlendingNontrivial() ||
	       props.clipParams().mode != DrawableClipMode::None;
}

void Layer::preRender(PreRenderContext &ctx, const TransformParams &parent) {
	indirect.reset();
	if (!props.isVisible())
		return;

	TransformParams transform = props.transformParams().composeWith(parent, props.composeFlags());
	if (!needsSeparatePass()) {
		preRenderContent(ctx, transform, props.drawableParams());
		return;
	}

	// Content goes offscreen untinted, the composite quad applies the parameters
	DrawableParams plain;
	PreRenderContext nested = ctx.nested();
	preRenderContent(nested, transform, plain);

	indirect = ctx.pool.get(ctx.canvasWidth, ctx.canvasHeight);
	ctx.renderOffscreen(*indirect.target, [this, &transform, &plain](RenderPass &pass) {
		renderContent(pass, transform, plain, 1);
	});
}

void Layer::render(RenderPass &pass, const TransformParams &parent, uint8_t stencilRef) const {
	if (!props.isVisible())
		return;

	TransformParams transform = props.transformParams().composeWith(parent, props.composeFlags());
	if (indirect) {
		if (pass.kind == PassKind::Transparent)
			renderIndirect(pass, transform, stencilRef);
		return;
	}
	renderContent(pass, transform, props.drawableParams(), stencilRef);
}

void Layer::renderIndirect(RenderPass &pass, const TransformParams &transform, uint8_t stencilRef) const {
	const float w = VIRTUAL_CANVAS_WIDTH, h = VIRTUAL_CANVAS_HEIGHT;
	std::array<Vec2, 4> corners{{Vec2(0, 0), Vec2(w, 0), Vec2(0, h), Vec2(w, h)}};

	DrawableClipParams clip = props.clipParams();
	if (clip.mode != DrawableClipMode::None) {
		Mat4 clipTransform = clip.mode == DrawableClipMode::Clip ? transform.finalTransform() : Xform::centredProjection();
		float left = clip.area.x(), top = clip.area.y();
		float right = left + clip.area.z(), bottom = top + clip.area.w();
		corners = {{toCanvas(clipTransform, left, top), toCanvas(clipTransform, right, top),
		            toCanvas(clipTransform, left, bottom), toCanvas(clipTransform, right, bottom)}};
	}

	std::array<Vec2, 4> uv;
	for (size_t i = 0; i < corners.size(); i++)
		uv[i] = Vec2(corners[i].x() / w, corners[i].y() / h);

	DrawableParams params = props.drawableParams();

	ShaderArgs args;
	args.shader      = ShaderName::Layer;
	args.transform   = Xform::topLeftProjection();
	args.textures[0] = indirect.target->colorTexture();
	args.color       = params.colorMultiplier.premultiply();
	args.fragment    = simplifyFragmentShader(params.fragmentShader, params.shaderParam);
	args.param       = params.shaderParam;
	args.output      = LayerShaderOutputKind::LayerDiscard;

	auto vertices = pushPosTexQuad(pass.dynamicBuffer(), corners, uv);
	pass.run(RenderRequestBuilder()
	             .shader(args)
	             .depthStencilShorthand(stencilRef, false, false)
	             .colorBlend(colorBlendFromLayer(params.blendType, true))
	             .primitive(DrawPrimitive::TriangleStrip)
	             .vertices(VertexFormat::PosTex, vertices, 4)
	             .build());
}

void CompositeLayer::preRenderContent(PreRenderContext &ctx, const TransformParams &transform, const DrawableParams &) {
	active.clear();
	std::vector<Layer *> all;
	children(all);
	for (auto child : all) {
		if (!child->properties().isVisible())
			continue;
		child->preRender(ctx, transform);
		active.push_back(child);
	}
}

void CompositeLayer::renderContent(RenderPass &pass, const TransformParams &transform, const DrawableParams &, uint8_t stencilRef) const {
	std::vector<uint8_t> bumps;
	bumps.reserve(active.size());
	for (auto child : active)
		bumps.push_back(child->stencilBump());
	auto refs = allocateStencilRefs(stencilRef, bumps);

	if (pass.kind == PassKind::Opaque) {
		// Front to back so that the stencil rejects what is already covered
		for (size_t i = active.size(); i-- > 0;)
			active[i]->render(pass, transform, refs[i]);
	} else {
		for (size_t i = 0; i < active.size(); i++)
			active[i]->render(pass, transform, refs[i]);
	}
}

uint8_t CompositeLayer::stencilBump() const {
	if (indirect)
		return 1;
	uint32_t sum = 0;
	for (auto child : active)
		sum += child->stencilBump();
	return static_cast<uint8_t>(std::min<uint32_t>(sum, 0xFF));
}
