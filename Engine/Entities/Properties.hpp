/**
 *  Properties.hpp
 *  SNRScripter
 *
 *  Animated scalar properties carried by every scene node.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Entities/Tweener.hpp"
#include "Engine/Entities/Wobbler.hpp"
#include "Engine/Graphics/Common.hpp"

#include <array>
#include <cstdint>

enum class LayerProperty : int32_t {
	TranslateX     = 0,
	TranslateY     = 1,
	TranslateZ     = 2,
	TranslateX2    = 3,
	TranslateY2    = 4,
	RenderPosition = 5,

	ScaleOriginX = 10,
	ScaleOriginY = 11,
	ScaleX       = 12,
	ScaleY       = 13,
	ScaleX2      = 14,
	ScaleY2      = 15,

	RotationOriginX = 16,
	RotationOriginY = 17,
	// In 1/1000 of a turn
	Rotation  = 18,
	Rotation2 = 19,

	ClipMode = 20,

	ShowLayer      = 22,
	BlendType      = 23,
	FragmentShader = 24,
	Flip           = 25,
	ComposeFlags   = 26,

	MulColorRed   = 28,
	MulColorGreen = 29,
	MulColorBlue  = 30,
	MulColorAlpha = 31,

	WobbleXMode      = 32,
	WobbleXPeriod    = 33,
	WobbleXAmplitude = 34,
	WobbleXBias      = 35,

	WobbleYMode      = 36,
	WobbleYPeriod    = 37,
	WobbleYAmplitude = 38,
	WobbleYBias      = 39,

	WobbleAlphaMode      = 40,
	WobbleAlphaPeriod    = 41,
	WobbleAlphaAmplitude = 42,
	WobbleAlphaBias      = 43,

	WobbleScaleXMode      = 44,
	WobbleScaleXPeriod    = 45,
	WobbleScaleXAmplitude = 46,
	WobbleScaleXBias      = 47,

	WobbleScaleYMode      = 48,
	WobbleScaleYPeriod    = 49,
	WobbleScaleYAmplitude = 50,
	WobbleScaleYBias      = 51,

	WobbleRotationMode      = 52,
	WobbleRotationPeriod    = 53,
	WobbleRotationAmplitude = 54,
	WobbleRotationBias      = 55,

	NegatedTranslationX = 60,
	NegatedTranslationY = 61,

	UnconditionallyInheritedTranslationX = 62,
	UnconditionallyInheritedTranslationY = 63,

	CameraPositionX = 64,
	CameraPositionY = 65,
	CameraPositionZ = 66,

	PixelizeSize = 70,

	ClipFromX = 79,
	ClipToX   = 80,
	ClipFromY = 81,
	ClipToY   = 85,

	ShaderParamX = 86,
	ShaderParamY = 87,
	ShaderParamZ = 88,
	ShaderParamW = 89
};

const int32_t LAYER_PROPERTIES_COUNT = 91;

inline bool isValidLayerProperty(int32_t index) {
	return index >= 0 && index < LAYER_PROPERTIES_COUNT;
}
int32_t layerPropertyInitialValue(int32_t index);
const char *layerPropertyName(int32_t index);

// Bits of the ComposeFlags property
namespace Compose {
enum : int32_t {
	IGNORE_CAMERA_POSITION = 1,
	DONT_INHERIT_TRANSFORM = 2,
	DONT_INHERIT_WOBBLE    = 4
};
} // namespace Compose

struct TransformParams {
	Mat4 transform{Mat4::Identity()};
	Vec3 cameraPosition{Vec3::Zero()};
	Vec2 unconditionallyInheritedTranslation{Vec2::Zero()};
	Vec2 wobbleTranslation{Vec2::Zero()};

	// Applies perspective from the camera and then the parent according to flags
	TransformParams composeWith(const TransformParams &parent, int32_t flags) const;
	// Projection of the centred canvas with the wobble applied last
	Mat4 finalTransform() const;
};

enum class DrawableClipMode {
	None,
	Clip,
	ClipIgnoreTransform
};

struct DrawableClipParams {
	DrawableClipMode mode{DrawableClipMode::None};
	// x, y, width, height
	Vec4 area{Vec4::Zero()};
};

struct DrawableParams {
	FloatColor4 colorMultiplier{FloatColor4::white()};
	LayerBlendType blendType{LayerBlendType::Type1};
	LayerFragmentShader fragmentShader{LayerFragmentShader::Default};
	Vec4 shaderParam{Vec4::Zero()};
};

// Target values only, kept by the VM state to rebuild the scene
class LayerPropertiesSnapshot {
	std::array<int32_t, LAYER_PROPERTIES_COUNT> values;

public:
	LayerPropertiesSnapshot() {
		init();
	}
	void init();
	int32_t get(LayerProperty p) const {
		return values[static_cast<size_t>(p)];
	}
	int32_t get(int32_t index) const {
		return values.at(index);
	}
	void set(int32_t index, int32_t value) {
		values.at(index) = value;
	}
	bool operator==(const LayerPropertiesSnapshot &o) const {
		return values == o.values;
	}
};

class LayerProperties {
	std::array<Tweener, LAYER_PROPERTIES_COUNT> tweeners;

	Wobbler wobblerX;
	Wobbler wobblerY;
	Wobbler wobblerAlpha;
	Wobbler wobblerScaleX;
	Wobbler wobblerScaleY;
	Wobbler wobblerRotation;

	float evaluateWobbler(const Wobbler &w, LayerProperty amplitude, LayerProperty bias, float scale, float fallback) const;
	float effectiveAlpha() const;
	Mat4 transform() const;

public:
	LayerProperties();

	// Every property back to its initial value, queued tweens dropped
	void init();
	void update(Ticks dt);

	float get(LayerProperty p) const {
		return tweeners[static_cast<size_t>(p)].value();
	}
	const Tweener &tweener(int32_t index) const {
		return tweeners.at(index);
	}
	Tweener &tweener(int32_t index) {
		return tweeners.at(index);
	}
	const Tweener &tweener(LayerProperty p) const {
		return tweeners[static_cast<size_t>(p)];
	}
	Tweener &tweener(LayerProperty p) {
		return tweeners[static_cast<size_t>(p)];
	}
	bool isIdle() const;

	// Fast-forwards every property to the snapshot values
	void restore(const LayerPropertiesSnapshot &snapshot);
	LayerPropertiesSnapshot snapshot() const;

	bool isVisible() const;
	FloatColor4 colorMultiplier() const;
	LayerBlendType blendType() const;
	LayerFragmentShader fragmentShader() const;
	Vec4 fragmentShaderParam() const;
	bool isFragmentShaderNontrivial() const;
	bool isBlendingNontrivial() const;
	DrawableParams drawableParams() const;
	DrawableClipParams clipParams() const;
	TransformParams transformParams() const;
	int32_t composeFlags() const;
};
