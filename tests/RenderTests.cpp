/**
 *  RenderTests.cpp
 *  SNRScripter
 *
 *  Frame driver, blending and the software backend.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Graphics/Render.hpp"
#include "Engine/Graphics/Software.hpp"
#include "Engine/Layers/UserLayer.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace {
const int TARGET_WIDTH  = 64;
const int TARGET_HEIGHT = 36;

Vec4 fullCanvas() {
	return Vec4(-VIRTUAL_CANVAS_WIDTH / 2, -VIRTUAL_CANVAS_HEIGHT / 2, VIRTUAL_CANVAS_WIDTH, VIRTUAL_CANVAS_HEIGHT);
}

UserLayer tile(const FloatColor4 &color, const Vec4 &rect) {
	TileLayerContent content;
	content.color = color;
	content.rect  = rect;
	return UserLayer(std::move(content));
}

FloatColor4 pixel(SoftwareBackend &backend, RenderTarget &target, int x, int y) {
	return backend.readPixels(target)[static_cast<size_t>(y) * target.width + x];
}

// Unorm vertex colors round to the nearest 1/255
const float UNORM_EPSILON = 1.0f / 255;
} // namespace

TEST(Render, TranslucentTileOverBlack) {
	SoftwareBackend backend;
	Renderer renderer(backend);
	auto target = backend.createTarget(TARGET_WIDTH, TARGET_HEIGHT);

	UserLayer layer = tile({1, 0, 0, 0.5f}, fullCanvas());
	renderer.renderFrame(layer, *target, FloatColor4::transparent());

	auto c = pixel(backend, *target, TARGET_WIDTH / 2, TARGET_HEIGHT / 2);
	EXPECT_NEAR(c.r, 0.5f, UNORM_EPSILON);
	EXPECT_NEAR(c.g, 0.0f, UNORM_EPSILON);
	EXPECT_NEAR(c.b, 0.0f, UNORM_EPSILON);
	EXPECT_NEAR(c.a, 0.5f, UNORM_EPSILON);

	auto &stats = renderer.stats();
	EXPECT_EQ(stats.opaqueDraws, 0u);
	EXPECT_EQ(stats.transparentDraws, 1u);
	EXPECT_EQ(stats.indirectPasses, 0u);
	EXPECT_EQ(stats.preRenderOpaqueNodes, 0u);
}

TEST(Render, OpaqueTileUsesTheOpaquePass) {
	SoftwareBackend backend;
	Renderer renderer(backend);
	auto target = backend.createTarget(TARGET_WIDTH, TARGET_HEIGHT);

	// Left half of the canvas only
	Vec4 rect(-VIRTUAL_CANVAS_WIDTH / 2, -VIRTUAL_CANVAS_HEIGHT / 2, VIRTUAL_CANVAS_WIDTH / 2, VIRTUAL_CANVAS_HEIGHT);
	UserLayer layer = tile({0, 1, 0, 1}, rect);
	renderer.renderFrame(layer, *target, FloatColor4{0, 0, 1, 1});

	auto left = pixel(backend, *target, 2, TARGET_HEIGHT / 2);
	EXPECT_NEAR(left.g, 1.0f, UNORM_EPSILON);
	EXPECT_NEAR(left.b, 0.0f, UNORM_EPSILON);
	auto right = pixel(backend, *target, TARGET_WIDTH - 3, TARGET_HEIGHT / 2);
	EXPECT_EQ(right, (FloatColor4{0, 0, 1, 1}));

	auto &stats = renderer.stats();
	EXPECT_EQ(stats.opaqueDraws, 1u);
	EXPECT_EQ(stats.transparentDraws, 0u);
	EXPECT_EQ(stats.preRenderOpaqueNodes, 1u);
}

TEST(Render, HiddenLayersDrawNothing) {
	SoftwareBackend backend;
	Renderer renderer(backend);
	auto target = backend.createTarget(TARGET_WIDTH, TARGET_HEIGHT);

	UserLayer layer = tile({1, 1, 1, 1}, fullCanvas());
	layer.properties().tweener(LayerProperty::ShowLayer).fastForwardTo(0);
	renderer.renderFrame(layer, *target, FloatColor4::transparent());

	EXPECT_EQ(renderer.stats().opaqueDraws + renderer.stats().transparentDraws, 0u);
	EXPECT_EQ(pixel(backend, *target, 0, 0), FloatColor4::transparent());

	UserLayer clear = tile({1, 1, 1, 0}, fullCanvas());
	renderer.renderFrame(clear, *target, FloatColor4::transparent());
	EXPECT_EQ(renderer.stats().transparentDraws, 0u);
}

TEST(Render, LayerAlphaComposesOffscreen) {
	SoftwareBackend backend;
	Renderer renderer(backend);
	auto target = backend.createTarget(TARGET_WIDTH, TARGET_HEIGHT);

	UserLayer layer = tile({1, 0, 0, 1}, fullCanvas());
	layer.properties().tweener(LayerProperty::MulColorAlpha).fastForwardTo(500);
	ASSERT_TRUE(layer.needsSeparatePass());
	renderer.renderFrame(layer, *target, FloatColor4::transparent());

	auto &stats = renderer.stats();
	EXPECT_EQ(stats.indirectPasses, 1u);
	// Only the composite quad lands on the frame
	EXPECT_EQ(stats.opaqueDraws, 0u);
	EXPECT_EQ(stats.transparentDraws, 1u);
	EXPECT_TRUE(layer.rendersIndirectly());

	auto c = pixel(backend, *target, TARGET_WIDTH / 2, TARGET_HEIGHT / 2);
	EXPECT_NEAR(c.r, 0.5f, 2 * UNORM_EPSILON);
	EXPECT_NEAR(c.a, 0.5f, 2 * UNORM_EPSILON);
	EXPECT_EQ(renderer.targetPool().checkedOut(), 1u);
}

TEST(Render, StencilReferencesFollowSiblingBumps) {
	EXPECT_EQ(allocateStencilRefs(1, {1, 1, 1}), (std::vector<uint8_t>{1, 2, 3}));
	EXPECT_EQ(allocateStencilRefs(4, {3, 1, 2}), (std::vector<uint8_t>{4, 7, 8}));
	EXPECT_TRUE(allocateStencilRefs(1, {}).empty());
	// Past 255 the remaining siblings share the last value
	EXPECT_EQ(allocateStencilRefs(254, {1, 1, 1}), (std::vector<uint8_t>{254, 255, 255}));
}

TEST(Render, BlendStates) {
	FloatColor4 src{0.5f, 0, 0, 0.5f}, dst{0, 0, 1, 1};
	auto out = blendPixel(blendState(ColorBlendType::LayerPremultiplied1), src, dst);
	EXPECT_FLOAT_EQ(out.r, 0.5f);
	EXPECT_FLOAT_EQ(out.b, 0.5f);
	EXPECT_FLOAT_EQ(out.a, 1.0f);

	EXPECT_EQ(blendPixel(blendState(ColorBlendType::Opaque), src, dst), src);
	EXPECT_EQ(blendPixel(blendState(ColorBlendType::NoColor), src, dst), dst);
	EXPECT_EQ(colorBlendFromLayer(LayerBlendType::Type2, false), ColorBlendType::Layer2);
}

TEST(DynamicBuffer, SlicesExpireWithTheirFrame) {
	DynamicBuffer buffer(64);
	std::vector<uint32_t> words{1, 2, 3};
	auto slice = buffer.allocate(words);
	EXPECT_EQ(slice.size, 12u);
	EXPECT_EQ(reinterpret_cast<const uint32_t *>(buffer.data(slice))[2], 3u);

	buffer.beginFrame();
	EXPECT_THROW(buffer.data(slice), std::logic_error);

	auto again = buffer.allocate(words);
	EXPECT_EQ(again.chunk, 0u);
	EXPECT_EQ(again.offset, 0u);
}

TEST(DynamicBuffer, OversizedDataGetsItsOwnChunk) {
	DynamicBuffer buffer(16);
	std::vector<uint8_t> small(12, 1), large(40, 2);
	auto a = buffer.allocate(small);
	auto b = buffer.allocate(large);
	EXPECT_NE(a.chunk, b.chunk);
	EXPECT_EQ(buffer.data(b)[39], 2);
	EXPECT_EQ(buffer.chunkCount(), 2u);
}

TEST(RenderRequestBuilder, RejectsIncompleteRequests) {
	DynamicBuffer buffer;
	ShaderArgs args;
	args.shader = ShaderName::Fill;

	EXPECT_THROW(RenderRequestBuilder().shader(args).build(), std::logic_error);

	auto quad = pushQuad(buffer, Vec4(0, 0, 1, 1), FloatColor4::white());
	EXPECT_THROW(RenderRequestBuilder().shader(args).vertices(VertexFormat::Pos, quad, 4).build(), std::logic_error);
	EXPECT_THROW(RenderRequestBuilder().shader(args).vertices(VertexFormat::PosCol, quad, 4).build(), std::logic_error);

	auto request = RenderRequestBuilder()
	                   .shader(args)
	                   .primitive(DrawPrimitive::TriangleStrip)
	                   .vertices(VertexFormat::PosCol, quad, 4)
	                   .build();
	EXPECT_EQ(request.elementCount(), 4u);

	ShaderArgs layer;
	layer.shader = ShaderName::Layer;
	auto texQuad = pushPosTexQuad(buffer, {{Vec2(0, 0), Vec2(1, 0), Vec2(0, 1), Vec2(1, 1)}},
	                              {{Vec2(0, 0), Vec2(1, 0), Vec2(0, 1), Vec2(1, 1)}});
	// No texture bound
	EXPECT_THROW(RenderRequestBuilder()
	                 .shader(layer)
	                 .primitive(DrawPrimitive::TriangleStrip)
	                 .vertices(VertexFormat::PosTex, texQuad, 4)
	                 .build(),
	             std::logic_error);
}

TEST(FragmentShader, IdentityParametersSimplify) {
	EXPECT_TRUE(isEquivalentToDefault(LayerFragmentShader::Mono, Vec4(1, 1, 1, 0)));
	EXPECT_FALSE(isEquivalentToDefault(LayerFragmentShader::Mono, Vec4(1, 1, 1, 0.5f)));
	EXPECT_TRUE(isEquivalentToDefault(LayerFragmentShader::Gamma, Vec4(1, 1, 1, 0)));
	EXPECT_FALSE(isEquivalentToDefault(LayerFragmentShader::Negative, Vec4::Zero()));
	EXPECT_EQ(simplifyFragmentShader(LayerFragmentShader::Fill, Vec4(1, 0, 0, 0)), LayerFragmentShader::Default);
}

TEST(FragmentShader, Operations) {
	FloatColor4 c{0.25f, 0.5f, 1, 0.75f};
	auto negative = evaluateFragmentShader(LayerFragmentShader::Negative, c, Vec4::Zero());
	EXPECT_FLOAT_EQ(negative.r, 0.75f);
	EXPECT_FLOAT_EQ(negative.b, 0);
	EXPECT_FLOAT_EQ(negative.a, 0.75f);

	auto fill = evaluateFragmentShader(LayerFragmentShader::Fill, c, Vec4(1, 0, 0, 1));
	EXPECT_EQ(fill, (FloatColor4{1, 0, 0, 0.75f}));

	// Mono with full strength makes every channel the luma
	auto mono = evaluateFragmentShader(LayerFragmentShader::Mono, c, Vec4(1, 1, 1, 1));
	EXPECT_FLOAT_EQ(mono.r, mono.g);
	EXPECT_FLOAT_EQ(mono.g, mono.b);

	auto clamped = evaluateFragmentShader(LayerFragmentShader::Fill2, c, Vec4(1, 1, 1, 0));
	EXPECT_EQ(clamped, (FloatColor4{1, 1, 1, 0.75f}));
}
