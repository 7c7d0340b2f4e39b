/**
 *  Common.cpp
 *  SNRScripter
 *
 *  Render model shared by every backend: colors, blending, depth/stencil and the shader set.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Graphics/Common.hpp"

#include <algorithm>
#include <stdexcept>
#include <cmath>

Mat4 Xform::translation(const Vec3 &v) {
	Eigen::Affine3f t(Eigen::Translation3f(v.x(), v.y(), v.z()));
	return t.matrix();
}

Mat4 Xform::scale(const Vec3 &v) {
	Eigen::Affine3f t(Eigen::Scaling(v.x(), v.y(), v.z()));
	return t.matrix();
}

Mat4 Xform::rotationZ(float radians) {
	Eigen::Affine3f t(Eigen::AngleAxisf(radians, Vec3::UnitZ()));
	return t.matrix();
}

Mat4 Xform::orthographic(float left, float right, float bottom, float top, float near, float far) {
	Mat4 m = Mat4::Identity();
	m(0, 0) = 2.0f / (right - left);
	m(1, 1) = 2.0f / (top - bottom);
	m(2, 2) = -2.0f / (far - near);
	m(0, 3) = -(right + left) / (right - left);
	m(1, 3) = -(top + bottom) / (top - bottom);
	m(2, 3) = -(far + near) / (far - near);
	return m;
}

Mat4 Xform::centredProjection() {
	return orthographic(-VIRTUAL_CANVAS_WIDTH / 2, VIRTUAL_CANVAS_WIDTH / 2, VIRTUAL_CANVAS_HEIGHT / 2, -VIRTUAL_CANVAS_HEIGHT / 2, -1, 1);
}

Mat4 Xform::topLeftProjection() {
	return orthographic(0, VIRTUAL_CANVAS_WIDTH, VIRTUAL_CANVAS_HEIGHT, 0, -1, 1);
}

FloatColor4 FloatColor4::from4bpp(int32_t value) {
	auto channel = [value](int shift) {
		return static_cast<float>((value >> shift) & 0xF) / 15.0f;
	};
	return {channel(8), channel(4), channel(0), channel(12)};
}

ColorBlendType colorBlendFromLayer(LayerBlendType type, bool premultiplied) {
	switch (type) {
		case LayerBlendType::Type1:
			return premultiplied ? ColorBlendType::LayerPremultiplied1 : ColorBlendType::Layer1;
		case LayerBlendType::Type2:
			return premultiplied ? ColorBlendType::LayerPremultiplied2 : ColorBlendType::Layer2;
		case LayerBlendType::Type3:
			return premultiplied ? ColorBlendType::LayerPremultiplied3 : ColorBlendType::Layer3;
	}
	return ColorBlendType::Layer1;
}

const char *colorBlendName(ColorBlendType type) {
	switch (type) {
		case ColorBlendType::NoColor:
			return "NoColor";
		case ColorBlendType::Opaque:
			return "Opaque";
		case ColorBlendType::Layer1:
			return "Layer1";
		case ColorBlendType::Layer2:
			return "Layer2";
		case ColorBlendType::Layer3:
			return "Layer3";
		case ColorBlendType::LayerPremultiplied1:
			return "LayerPremultiplied1";
		case ColorBlendType::LayerPremultiplied2:
			return "LayerPremultiplied2";
		case ColorBlendType::LayerPremultiplied3:
			return "LayerPremultiplied3";
	}
	return "Unknown";
}

namespace {
const BlendComponent LAYER_ALPHA{BlendFactor::OneMinusDstAlpha, BlendFactor::One, BlendOperation::Add};

// Indexed by ColorBlendType
const BlendState BLEND_STATES[] = {
    {false, {BlendFactor::One, BlendFactor::Zero, BlendOperation::Add}, {BlendFactor::One, BlendFactor::Zero, BlendOperation::Add}},
    {true, {BlendFactor::One, BlendFactor::Zero, BlendOperation::Add}, {BlendFactor::One, BlendFactor::Zero, BlendOperation::Add}},
    {true, {BlendFactor::SrcAlpha, BlendFactor::OneMinusSrcAlpha, BlendOperation::Add}, LAYER_ALPHA},
    {true, {BlendFactor::SrcAlpha, BlendFactor::One, BlendOperation::Add}, LAYER_ALPHA},
    {true, {BlendFactor::SrcAlpha, BlendFactor::One, BlendOperation::Subtract}, LAYER_ALPHA},
    {true, {BlendFactor::One, BlendFactor::OneMinusSrcAlpha, BlendOperation::Add}, LAYER_ALPHA},
    {true, {BlendFactor::One, BlendFactor::One, BlendOperation::Add}, LAYER_ALPHA},
    {true, {BlendFactor::One, BlendFactor::One, BlendOperation::ReverseSubtract}, LAYER_ALPHA}};

float factor(BlendFactor f, const FloatColor4 &src, const FloatColor4 &dst) {
	switch (f) {
		case BlendFactor::Zero:
			return 0;
		case BlendFactor::One:
			return 1;
		case BlendFactor::SrcAlpha:
			return src.a;
		case BlendFactor::OneMinusSrcAlpha:
			return 1 - src.a;
		case BlendFactor::OneMinusDstAlpha:
			return 1 - dst.a;
	}
	return 0;
}

float combine(BlendOperation op, float s, float d) {
	switch (op) {
		case BlendOperation::Add:
			return s + d;
		case BlendOperation::Subtract:
			return s - d;
		case BlendOperation::ReverseSubtract:
			return d - s;
	}
	return s + d;
}
} // namespace

const BlendState &blendState(ColorBlendType type) {
	return BLEND_STATES[static_cast<size_t>(type)];
}

FloatColor4 blendPixel(const BlendState &state, const FloatColor4 &src, const FloatColor4 &dst) {
	if (!state.writeColor)
		return dst;

	float cs = factor(state.color.src, src, dst);
	float cd = factor(state.color.dst, src, dst);
	float as = factor(state.alpha.src, src, dst);
	float ad = factor(state.alpha.dst, src, dst);

	// Unorm targets clamp on write
	auto c = [](float v) { return cmp::clamp(v, 0.0f, 1.0f); };
	return {c(combine(state.color.op, src.r * cs, dst.r * cd)),
	        c(combine(state.color.op, src.g * cs, dst.g * cd)),
	        c(combine(state.color.op, src.b * cs, dst.b * cd)),
	        c(combine(state.alpha.op, src.a * as, dst.a * ad))};
}

DepthStencilState DepthStencilState::shorthand(uint8_t stencilRef, bool allowEqualStencil, bool testDepth) {
	DepthStencilState state;
	if (testDepth)
		state.depth.function = CompareFunction::Less;
	state.stencil.function  = allowEqualStencil ? CompareFunction::GreaterOrEqual : CompareFunction::Greater;
	state.stencil.pass      = StencilOperation::Replace;
	state.stencil.reference = stencilRef;
	return state;
}

bool compare(CompareFunction f, uint32_t reference, uint32_t stored) {
	switch (f) {
		case CompareFunction::Never:
			return false;
		case CompareFunction::Less:
			return reference < stored;
		case CompareFunction::Equal:
			return reference == stored;
		case CompareFunction::LessOrEqual:
			return reference <= stored;
		case CompareFunction::Greater:
			return reference > stored;
		case CompareFunction::NotEqual:
			return reference != stored;
		case CompareFunction::GreaterOrEqual:
			return reference >= stored;
		case CompareFunction::Always:
			return true;
	}
	return true;
}

bool compareDepth(CompareFunction f, float incoming, float stored) {
	switch (f) {
		case CompareFunction::Never:
			return false;
		case CompareFunction::Less:
			return incoming < stored;
		case CompareFunction::Equal:
			return incoming == stored;
		case CompareFunction::LessOrEqual:
			return incoming <= stored;
		case CompareFunction::Greater:
			return incoming > stored;
		case CompareFunction::NotEqual:
			return incoming != stored;
		case CompareFunction::GreaterOrEqual:
			return incoming >= stored;
		case CompareFunction::Always:
			return true;
	}
	return true;
}

uint8_t applyStencilOperation(StencilOperation op, uint8_t stored, uint8_t reference) {
	switch (op) {
		case StencilOperation::Keep:
			return stored;
		case StencilOperation::Zero:
			return 0;
		case StencilOperation::Replace:
			return reference;
		case StencilOperation::Increment:
			return stored == 0xFF ? stored : stored + 1;
		case StencilOperation::Decrement:
			return stored == 0 ? stored : stored - 1;
		case StencilOperation::Invert:
			return static_cast<uint8_t>(~stored);
		case StencilOperation::IncrementWrap:
			return static_cast<uint8_t>(stored + 1);
		case StencilOperation::DecrementWrap:
			return static_cast<uint8_t>(stored - 1);
	}
	return stored;
}

bool isEquivalentToDefault(LayerFragmentShader shader, const Vec4 &param) {
	switch (shader) {
		case LayerFragmentShader::Default:
			return true;
		case LayerFragmentShader::Mono:
			return param == Vec4(1, 1, 1, 0);
		case LayerFragmentShader::Fill:
			return param.w() == 0;
		case LayerFragmentShader::Fill2:
			return param.head<3>() == Vec3::Zero();
		case LayerFragmentShader::Negative:
			return false;
		case LayerFragmentShader::Gamma:
			return param.head<3>() == Vec3::Ones();
	}
	return false;
}

LayerFragmentShader simplifyFragmentShader(LayerFragmentShader shader, const Vec4 &param) {
	return isEquivalentToDefault(shader, param) ? LayerFragmentShader::Default : shader;
}

FloatColor4 evaluateFragmentShader(LayerFragmentShader shader, const FloatColor4 &color, const Vec4 &param) {
	Vec4 c = color.vec();
	Vec3 rgb = c.head<3>();
	switch (shader) {
		case LayerFragmentShader::Default:
			break;
		case LayerFragmentShader::Mono: {
			float luma = rgb.dot(Vec3(0.299f, 0.587f, 0.114f));
			Vec3 mono  = Vec3::Constant(luma).cwiseProduct(param.head<3>());
			rgb        = rgb + (mono - rgb) * param.w();
			break;
		}
		case LayerFragmentShader::Fill:
			rgb = rgb + (param.head<3>() - rgb) * param.w();
			break;
		case LayerFragmentShader::Fill2:
			rgb = rgb + param.head<3>();
			break;
		case LayerFragmentShader::Negative:
			rgb = Vec3::Ones() - rgb;
			break;
		case LayerFragmentShader::Gamma:
			rgb = Vec3(std::pow(std::max(rgb.x(), 0.0f), param.x()),
			           std::pow(std::max(rgb.y(), 0.0f), param.y()),
			           std::pow(std::max(rgb.z(), 0.0f), param.z()));
			break;
	}
	rgb = rgb.cwiseMax(0.0f).cwiseMin(1.0f);
	return {rgb.x(), rgb.y(), rgb.z(), c.w()};
}

const char *fragmentShaderName(LayerFragmentShader shader) {
	switch (shader) {
		case LayerFragmentShader::Default:
			return "Default";
		case LayerFragmentShader::Mono:
			return "Mono";
		case LayerFragmentShader::Fill:
			return "Fill";
		case LayerFragmentShader::Fill2:
			return "Fill2";
		case LayerFragmentShader::Negative:
			return "Negative";
		case LayerFragmentShader::Gamma:
			return "Gamma";
	}
	return "Unknown";
}

namespace {
using T = std::array<const char *, 4>;

// Indexed by ShaderName
const ShaderDescriptor SHADERS[] = {
    {ShaderName::Clear, "clear", VertexFormat::Pos, T{}, 16, "constant color"},
    {ShaderName::Fill, "fill", VertexFormat::PosCol, T{}, 64, "vertex color"},
    {ShaderName::Sprite, "sprite", VertexFormat::PosColTex, T{"sprite"}, 64, "texel times vertex color"},
    {ShaderName::Font, "font", VertexFormat::Text, T{"glyph"}, 96, "coverage lerped between two colors"},
    {ShaderName::FontBorder, "font_border", VertexFormat::Text, T{"glyph"}, 224, "dilated coverage times color"},
    {ShaderName::Button, "button", VertexFormat::PosColTex, T{"texture"}, 96, "texel with flash"},
    {ShaderName::Blend, "blend", VertexFormat::Blend, T{"texture1", "texture2"}, 96, "two texels mixed"},
    {ShaderName::Window, "window", VertexFormat::Window, T{"texture"}, 80, "nine-slice texel"},
    {ShaderName::Layer, "layer", VertexFormat::PosTex, T{"texture"}, 112, "layer fragment operation"},
    {ShaderName::Mask, "mask", VertexFormat::Mask, T{"texture", "mask"}, 128, "layer operation cut by mask"},
    {ShaderName::Dissolve, "dissolve", VertexFormat::PosTex, T{"texture"}, 96, "dissolved texel"},
    {ShaderName::TapEffect, "tap_effect", VertexFormat::PosColTex, T{"texture"}, 80, "texel times color"},
    {ShaderName::Movie, "movie", VertexFormat::Movie, T{"luma", "chroma"}, 128, "YUV converted to RGB"},
    {ShaderName::MovieAlpha, "movie_alpha", VertexFormat::Movie, T{"luma", "chroma"}, 128, "YUV with luma-keyed alpha"},
    {ShaderName::WiperDefault, "wiper_default", VertexFormat::PosTex, T{"source", "target"}, 80, "crossfade"},
    {ShaderName::WiperMask, "wiper_mask", VertexFormat::Mask, T{"source", "target", "mask"}, 80, "mask driven crossfade"},
    {ShaderName::WiperWave, "wiper_wave", VertexFormat::PosTex, T{"source", "target"}, 96, "wave distorted crossfade"},
    {ShaderName::WiperRipple, "wiper_ripple", VertexFormat::PosTex, T{"source", "target"}, 96, "ripple distorted crossfade"},
    {ShaderName::WiperWhirl, "wiper_whirl", VertexFormat::PosTex, T{"source", "target"}, 96, "whirl distorted crossfade"},
    {ShaderName::WiperGlass, "wiper_glass", VertexFormat::PosTex, T{"source", "target", "mask"}, 96, "shattered crossfade"},
    {ShaderName::Mosaic, "mosaic", VertexFormat::PosTex, T{"texture"}, 80, "block sampled texel"},
    {ShaderName::Blur, "blur", VertexFormat::PosTex, T{"texture"}, 80, "box filtered texel"},
    {ShaderName::ZoomBlur, "zoom_blur", VertexFormat::PosTex, T{"texture"}, 80, "radially filtered texel"},
    {ShaderName::Raster, "raster", VertexFormat::PosTex, T{"texture"}, 96, "line displaced texel"},
    {ShaderName::Ripple, "ripple", VertexFormat::PosTex, T{"texture"}, 96, "radially displaced texel"},
    {ShaderName::Breakup, "breakup", VertexFormat::PosColTex, T{"texture"}, 80, "fragment pieces"},
    {ShaderName::Charicon0, "charicon0", VertexFormat::PosColTex, T{"texture"}, 80, "character icon"},
    {ShaderName::Charicon1, "charicon1", VertexFormat::PosColTex, T{"texture", "mask"}, 80, "masked character icon"},
    {ShaderName::Charicon2, "charicon2", VertexFormat::PosColTex, T{"texture"}, 96, "tinted character icon"},
    {ShaderName::Charicon3, "charicon3", VertexFormat::PosColTex, T{"texture", "mask"}, 96, "masked tinted character icon"}};

static_assert(sizeof(SHADERS) / sizeof(SHADERS[0]) == static_cast<size_t>(ShaderName::Total), "Shader table is out of sync");
} // namespace

const ShaderDescriptor &shaderDescriptor(ShaderName name) {
	if (name >= ShaderName::Total)
		throw std::out_of_range("Invalid shader name");
	return SHADERS[static_cast<size_t>(name)];
}

ShaderName wiperShader(WiperKind kind) {
	switch (kind) {
		case WiperKind::Default:
			return ShaderName::WiperDefault;
		case WiperKind::Mask:
			return ShaderName::WiperMask;
		case WiperKind::Wave:
			return ShaderName::WiperWave;
		case WiperKind::Ripple:
			return ShaderName::WiperRipple;
		case WiperKind::Whirl:
			return ShaderName::WiperWhirl;
		case WiperKind::Glass:
			return ShaderName::WiperGlass;
	}
	return ShaderName::WiperDefault;
}

size_t vertexStride(VertexFormat format) {
	switch (format) {
		case VertexFormat::Pos:
			return 3 * sizeof(float);
		case VertexFormat::PosCol:
			return 3 * sizeof(float) + 4;
		case VertexFormat::PosColTex:
			return 5 * sizeof(float) + 4;
		case VertexFormat::Text:
			return 5 * sizeof(float);
		case VertexFormat::Blend:
			return 7 * sizeof(float) + 4;
		case VertexFormat::Window:
			return 8 * sizeof(float);
		case VertexFormat::PosTex:
			return 5 * sizeof(float);
		case VertexFormat::Mask:
			return 4 * sizeof(float);
		case VertexFormat::Movie:
			return 5 * sizeof(float);
	}
	return 0;
}
