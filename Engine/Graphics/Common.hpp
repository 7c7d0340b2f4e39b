/**
 *  Common.hpp
 *  SNRScripter
 *
 *  Render model shared by every backend: colors, blending, depth/stencil and the shader set.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"

#include <Eigen/Core>
#include <Eigen/Geometry>

#include <array>
#include <cstdint>

using Mat4 = Eigen::Matrix4f;
using Vec2 = Eigen::Vector2f;
using Vec3 = Eigen::Vector3f;
using Vec4 = Eigen::Vector4f;

// The virtual canvas every scene coordinate refers to
const float VIRTUAL_CANVAS_WIDTH  = 1920.0f;
const float VIRTUAL_CANVAS_HEIGHT = 1080.0f;

namespace Xform {
Mat4 translation(const Vec3 &v);
Mat4 scale(const Vec3 &v);
Mat4 rotationZ(float radians);
// Right handed, OpenGL depth range
Mat4 orthographic(float left, float right, float bottom, float top, float near, float far);
// Canvas centred at the origin, Y pointing down
Mat4 centredProjection();
// Canvas origin in the top left corner, Y pointing down
Mat4 topLeftProjection();
} // namespace Xform

struct FloatColor4 {
	float r{0}, g{0}, b{0}, a{0};

	static FloatColor4 white() {
		return {1, 1, 1, 1};
	}
	static FloatColor4 transparent() {
		return {0, 0, 0, 0};
	}
	// 0xARGB with four bits per channel
	static FloatColor4 from4bpp(int32_t value);

	FloatColor4 premultiply() const {
		return {r * a, g * a, b * a, a};
	}
	FloatColor4 operator*(const FloatColor4 &o) const {
		return {r * o.r, g * o.g, b * o.b, a * o.a};
	}
	bool operator==(const FloatColor4 &o) const {
		return r == o.r && g == o.g && b == o.b && a == o.a;
	}
	bool operator!=(const FloatColor4 &o) const {
		return !(*this == o);
	}
	Vec4 vec() const {
		return Vec4(r, g, b, a);
	}
	static FloatColor4 fromVec(const Vec4 &v) {
		return {v.x(), v.y(), v.z(), v.w()};
	}
};

enum class PassKind {
	Opaque,
	Transparent
};

// Blend type a layer asks for, the renderer picks the matching ColorBlendType
enum class LayerBlendType {
	Type1,
	Type2,
	Type3
};

enum class ColorBlendType {
	NoColor,
	Opaque,
	Layer1,
	Layer2,
	Layer3,
	LayerPremultiplied1,
	LayerPremultiplied2,
	LayerPremultiplied3
};

ColorBlendType colorBlendFromLayer(LayerBlendType type, bool premultiplied);
const char *colorBlendName(ColorBlendType type);

enum class BlendFactor {
	Zero,
	One,
	SrcAlpha,
	OneMinusSrcAlpha,
	OneMinusDstAlpha
};

enum class BlendOperation {
	Add,
	Subtract,
	ReverseSubtract
};

struct BlendComponent {
	BlendFactor src;
	BlendFactor dst;
	BlendOperation op;
};

struct BlendState {
	// false leaves every color channel untouched
	bool writeColor;
	BlendComponent color;
	BlendComponent alpha;
};

const BlendState &blendState(ColorBlendType type);

// Applies a blend state to a single pixel, premultiplication is up to the caller
FloatColor4 blendPixel(const BlendState &state, const FloatColor4 &src, const FloatColor4 &dst);

enum class CompareFunction {
	Never,
	Less,
	Equal,
	LessOrEqual,
	Greater,
	NotEqual,
	GreaterOrEqual,
	Always
};

enum class StencilOperation {
	Keep,
	Zero,
	Replace,
	Increment,
	Decrement,
	Invert,
	IncrementWrap,
	DecrementWrap
};

struct DepthState {
	CompareFunction function{CompareFunction::Always};
	bool writeEnable{false};
};

struct StencilState {
	CompareFunction function{CompareFunction::Always};
	StencilOperation stencilFail{StencilOperation::Keep};
	StencilOperation depthFail{StencilOperation::Keep};
	StencilOperation pass{StencilOperation::Keep};
	uint8_t readMask{0xFF};
	uint8_t writeMask{0xFF};
	uint8_t reference{0};
};

struct DepthStencilState {
	DepthState depth;
	StencilState stencil;

	// Stencil Greater (or GreaterOrEqual) with Replace on pass, optional depth test without writes
	static DepthStencilState shorthand(uint8_t stencilRef, bool allowEqualStencil, bool testDepth);
};

// Reference compared against the stored value with the given function
bool compare(CompareFunction f, uint32_t reference, uint32_t stored);
bool compareDepth(CompareFunction f, float incoming, float stored);
uint8_t applyStencilOperation(StencilOperation op, uint8_t stored, uint8_t reference);

enum class CullFace {
	None,
	Back,
	Front
};

enum class DrawPrimitive {
	Triangles,
	TriangleStrip
};

enum class LayerFragmentShader {
	Default  = 0,
	Mono     = 1,
	Fill     = 2,
	Fill2    = 3,
	Negative = 4,
	Gamma    = 5
};

// The identity parameters of an operation produce exactly the Default output
bool isEquivalentToDefault(LayerFragmentShader shader, const Vec4 &param);
LayerFragmentShader simplifyFragmentShader(LayerFragmentShader shader, const Vec4 &param);
// CPU version of the fragment operation, matches the GLSL in Resources/Shaders/layer.frag
FloatColor4 evaluateFragmentShader(LayerFragmentShader shader, const FloatColor4 &color, const Vec4 &param);
const char *fragmentShaderName(LayerFragmentShader shader);

enum class LayerShaderOutputKind {
	Layer,
	LayerPremultiply,
	LayerDiscard
};

enum class WiperKind {
	Default,
	Mask,
	Wave,
	Ripple,
	Whirl,
	Glass
};

enum class ShaderName {
	Clear,
	Fill,
	Sprite,
	Font,
	FontBorder,
	Button,
	Blend,
	Window,
	Layer,
	Mask,
	Dissolve,
	TapEffect,
	Movie,
	MovieAlpha,
	WiperDefault,
	WiperMask,
	WiperWave,
	WiperRipple,
	WiperWhirl,
	WiperGlass,
	Mosaic,
	Blur,
	ZoomBlur,
	Raster,
	Ripple,
	Breakup,
	Charicon0,
	Charicon1,
	Charicon2,
	Charicon3,
	Total
};

enum class VertexFormat {
	Pos,
	PosCol,
	PosColTex,
	Text,
	Blend,
	Window,
	PosTex,
	Mask,
	Movie
};

struct ShaderDescriptor {
	ShaderName name;
	const char *id;
	VertexFormat vertexFormat;
	// Sampler names in binding order, nullptr terminated
	std::array<const char *, 4> textures;
	// Size of the parameter block in bytes
	uint32_t uniformSize;
	// What the fragment stage writes
	const char *output;
};

const ShaderDescriptor &shaderDescriptor(ShaderName name);
ShaderName wiperShader(WiperKind kind);
size_t vertexStride(VertexFormat format);
