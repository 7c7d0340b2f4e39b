/**
 *  Properties.cpp
 *  SNRScripter
 *
 *  Animated scalar properties carried by every scene node.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Entities/Properties.hpp"

#include <algorithm>
#include <cmath>

int32_t layerPropertyInitialValue(int32_t index) {
	switch (index) {
		case 2:  // TranslateZ
		case 5:  // RenderPosition
		case 6:
		case 7:
		case 8:
		case 9:
		case 12: // ScaleX
		case 13: // ScaleY
		case 14: // ScaleX2
		case 15: // ScaleY2
		case 28: // MulColorRed
		case 29: // MulColorGreen
		case 30: // MulColorBlue
		case 31: // MulColorAlpha
		case 43: // WobbleAlphaBias
		case 47: // WobbleScaleXBias
		case 51: // WobbleScaleYBias
		case 57:
		case 73:
		case 75:
			return 1000;
		case 22: // ShowLayer
		case 27:
			return 1;
		default:
			return 0;
	}
}

const char *layerPropertyName(int32_t index) {
	switch (static_cast<LayerProperty>(index)) {
		case LayerProperty::TranslateX:
			return "TranslateX";
		case LayerProperty::TranslateY:
			return "TranslateY";
		case LayerProperty::TranslateZ:
			return "TranslateZ";
		case LayerProperty::TranslateX2:
			return "TranslateX2";
		case LayerProperty::TranslateY2:
			return "TranslateY2";
		case LayerProperty::RenderPosition:
			return "RenderPosition";
		case LayerProperty::ScaleOriginX:
			return "ScaleOriginX";
		case LayerProperty::ScaleOriginY:
			return "ScaleOriginY";
		case LayerProperty::ScaleX:
			return "ScaleX";
		case LayerProperty::ScaleY:
			return "ScaleY";
		case LayerProperty::ScaleX2:
			return "ScaleX2";
		case LayerProperty::ScaleY2:
			return "ScaleY2";
		case LayerProperty::RotationOriginX:
			return "RotationOriginX";
		case LayerProperty::RotationOriginY:
			return "RotationOriginY";
		case LayerProperty::Rotation:
			return "Rotation";
		case LayerProperty::Rotation2:
			return "Rotation2";
		case LayerProperty::ClipMode:
			return "ClipMode";
		case LayerProperty::ShowLayer:
			return "ShowLayer";
		case LayerProperty::BlendType:
			return "BlendType";
		case LayerProperty::FragmentShader:
			return "FragmentShader";
		case LayerProperty::Flip:
			return "Flip";
		case LayerProperty::ComposeFlags:
			return "ComposeFlags";
		case LayerProperty::MulColorRed:
			return "MulColorRed";
		case LayerProperty::MulColorGreen:
			return "MulColorGreen";
		case LayerProperty::MulColorBlue:
			return "MulColorBlue";
		case LayerProperty::MulColorAlpha:
			return "MulColorAlpha";
		case LayerProperty::WobbleXMode:
			return "WobbleXMode";
		case LayerProperty::WobbleXPeriod:
			return "WobbleXPeriod";
		case LayerProperty::WobbleXAmplitude:
			return "WobbleXAmplitude";
		case LayerProperty::WobbleXBias:
			return "WobbleXBias";
		case LayerProperty::WobbleYMode:
			return "WobbleYMode";
		case LayerProperty::WobbleYPeriod:
			return "WobbleYPeriod";
		case LayerProperty::WobbleYAmplitude:
			return "WobbleYAmplitude";
		case LayerProperty::WobbleYBias:
			return "WobbleYBias";
		case LayerProperty::WobbleAlphaMode:
			return "WobbleAlphaMode";
		case LayerProperty::WobbleAlphaPeriod:
			return "WobbleAlphaPeriod";
		case LayerProperty::WobbleAlphaAmplitude:
			return "WobbleAlphaAmplitude";
		case LayerProperty::WobbleAlphaBias:
			return "WobbleAlphaBias";
		case LayerProperty::WobbleScaleXMode:
			return "WobbleScaleXMode";
		case LayerProperty::WobbleScaleXPeriod:
			return "WobbleScaleXPeriod";
		case LayerProperty::WobbleScaleXAmplitude:
			return "WobbleScaleXAmplitude";
		case LayerProperty::WobbleScaleXBias:
			return "WobbleScaleXBias";
		case LayerProperty::WobbleScaleYMode:
			return "WobbleScaleYMode";
		case LayerProperty::WobbleScaleYPeriod:
			return "WobbleScaleYPeriod";
		case LayerProperty::WobbleScaleYAmplitude:
			return "WobbleScaleYAmplitude";
		case LayerProperty::WobbleScaleYBias:
			return "WobbleScaleYBias";
		case LayerProperty::WobbleRotationMode:
			return "WobbleRotationMode";
		case LayerProperty::WobbleRotationPeriod:
			return "WobbleRotationPeriod";
		case LayerProperty::WobbleRotationAmplitude:
			return "WobbleRotationAmplitude";
		case LayerProperty::WobbleRotationBias:
			return "WobbleRotationBias";
		case LayerProperty::NegatedTranslationX:
			return "NegatedTranslationX";
		case LayerProperty::NegatedTranslationY:
			return "NegatedTranslationY";
		case LayerProperty::UnconditionallyInheritedTranslationX:
			return "UnconditionallyInheritedTranslationX";
		case LayerProperty::UnconditionallyInheritedTranslationY:
			return "UnconditionallyInheritedTranslationY";
		case LayerProperty::CameraPositionX:
			return "CameraPositionX";
		case LayerProperty::CameraPositionY:
			return "CameraPositionY";
		case LayerProperty::CameraPositionZ:
			return "CameraPositionZ";
		case LayerProperty::PixelizeSize:
			return "PixelizeSize";
		case LayerProperty::ClipFromX:
			return "ClipFromX";
		case LayerProperty::ClipToX:
			return "ClipToX";
		case LayerProperty::ClipFromY:
			return "ClipFromY";
		case LayerProperty::ClipToY:
			return "ClipToY";
		case LayerProperty::ShaderParamX:
			return "ShaderParamX";
		case LayerProperty::ShaderParamY:
			return "ShaderParamY";
		case LayerProperty::ShaderParamZ:
			return "ShaderParamZ";
		case LayerProperty::ShaderParamW:
			return "ShaderParamW";
	}
	return isValidLayerProperty(index) ? "Unnamed" : "Invalid";
}

TransformParams TransformParams::composeWith(const TransformParams &parent, int32_t flags) const {
	TransformParams result = *this;

	Vec3 origin = (flags & Compose::IGNORE_CAMERA_POSITION) ? Vec3::Zero() : cameraPosition;

	// Perspective division by the distance to the camera
	float zdist = (result.transform(2, 3) - origin.z()) * 0.001f;
	float scale = 0;
	if (zdist > 0) {
		result.transform = Xform::translation(Vec3(-origin.x(), -origin.y(), 1)) * result.transform;
		scale            = 1.0f / zdist;
	}
	result.transform       = Xform::scale(Vec3(scale, scale, 1)) * result.transform;
	result.transform(2, 3) = 0;

	if (!(flags & Compose::DONT_INHERIT_TRANSFORM))
		result.transform = parent.transform * result.transform;
	if (!(flags & Compose::DONT_INHERIT_WOBBLE))
		result.transform = Xform::translation(Vec3(parent.wobbleTranslation.x(), parent.wobbleTranslation.y(), 0)) * result.transform;
	result.transform = Xform::translation(Vec3(unconditionallyInheritedTranslation.x(), unconditionallyInheritedTranslation.y(), 0)) * result.transform;

	return result;
}

Mat4 TransformParams::finalTransform() const {
	return Xform::centredProjection() * Xform::translation(Vec3(wobbleTranslation.x(), wobbleTranslation.y(), 0)) * transform;
}

void LayerPropertiesSnapshot::init() {
	for (int32_t i = 0; i < LAYER_PROPERTIES_COUNT; i++)
		values[i] = layerPropertyInitialValue(i);
}

LayerProperties::LayerProperties()
    : wobblerX(1), wobblerY(2), wobblerAlpha(3), wobblerScaleX(4), wobblerScaleY(5), wobblerRotation(6) {
	init();
}

void LayerProperties::init() {
	for (int32_t i = 0; i < LAYER_PROPERTIES_COUNT; i++)
		tweeners[i].fastForwardTo(static_cast<float>(layerPropertyInitialValue(i)));
}

void LayerProperties::update(Ticks dt) {
	for (auto &t : tweeners)
		t.update(dt);

	auto wobble = [this, dt](Wobbler &w, LayerProperty mode, LayerProperty period) {
		w.update(dt, static_cast<int32_t>(get(mode)), Ticks(get(period)));
	};
	wobble(wobblerX, LayerProperty::WobbleXMode, LayerProperty::WobbleXPeriod);
	wobble(wobblerY, LayerProperty::WobbleYMode, LayerProperty::WobbleYPeriod);
	wobble(wobblerAlpha, LayerProperty::WobbleAlphaMode, LayerProperty::WobbleAlphaPeriod);
	wobble(wobblerScaleX, LayerProperty::WobbleScaleXMode, LayerProperty::WobbleScaleXPeriod);
	wobble(wobblerScaleY, LayerProperty::WobbleScaleYMode, LayerProperty::WobbleScaleYPeriod);
	wobble(wobblerRotation, LayerProperty::WobbleRotationMode, LayerProperty::WobbleRotationPeriod);
}

bool LayerProperties::isIdle() const {
	return std::all_of(tweeners.begin(), tweeners.end(), [](const Tweener &t) { return t.isIdle(); });
}

void LayerProperties::restore(const LayerPropertiesSnapshot &snapshot) {
	for (int32_t i = 0; i < LAYER_PROPERTIES_COUNT; i++)
		tweeners[i].fastForwardTo(static_cast<float>(snapshot.get(i)));
}

LayerPropertiesSnapshot LayerProperties::snapshot() const {
	LayerPropertiesSnapshot s;
	for (int32_t i = 0; i < LAYER_PROPERTIES_COUNT; i++)
		s.set(i, static_cast<int32_t>(tweeners[i].targetValue()));
	return s;
}

float LayerProperties::evaluateWobbler(const Wobbler &w, LayerProperty amplitude, LayerProperty bias, float scale, float fallback) const {
	if (!w.isActive())
		return fallback;
	return (w.value() * get(amplitude) + get(bias)) * scale;
}

float LayerProperties::effectiveAlpha() const {
	float base = get(LayerProperty::MulColorAlpha) * 0.001f;
	return base * evaluateWobbler(wobblerAlpha, LayerProperty::WobbleAlphaAmplitude, LayerProperty::WobbleAlphaBias, 0.001f, 1.0f);
}

bool LayerProperties::isVisible() const {
	if (static_cast<int32_t>(get(LayerProperty::ShowLayer)) == 0 ||
	    static_cast<int32_t>(get(LayerProperty::ScaleX)) == 0 ||
	    static_cast<int32_t>(get(LayerProperty::ScaleY)) == 0)
		return false;
	return effectiveAlpha() > 0;
}

FloatColor4 LayerProperties::colorMultiplier() const {
	// Channels go through the clamp at half scale so that 0..2000 survives it
	auto half = [](float v) { return cmp::clamp(v * 0.0005f, 0.0f, 1.0f) * 2.0f; };
	return {half(get(LayerProperty::MulColorRed)),
	        half(get(LayerProperty::MulColorGreen)),
	        half(get(LayerProperty::MulColorBlue)),
	        cmp::clamp(effectiveAlpha(), 0.0f, 1.0f)};
}

LayerBlendType LayerProperties::blendType() const {
	switch (static_cast<int32_t>(get(LayerProperty::BlendType))) {
		case 1:
			return LayerBlendType::Type2;
		case 2:
			return LayerBlendType::Type3;
		default:
			return LayerBlendType::Type1;
	}
}

LayerFragmentShader LayerProperties::fragmentShader() const {
	int32_t value = static_cast<int32_t>(get(LayerProperty::FragmentShader));
	if (value < 0 || value > static_cast<int32_t>(LayerFragmentShader::Gamma))
		return LayerFragmentShader::Default;
	return static_cast<LayerFragmentShader>(value);
}

Vec4 LayerProperties::fragmentShaderParam() const {
	return Vec4(get(LayerProperty::ShaderParamX), get(LayerProperty::ShaderParamY),
	            get(LayerProperty::ShaderParamZ), get(LayerProperty::ShaderParamW)) *
	       0.001f;
}

bool LayerProperties::isFragmentShaderNontrivial() const {
	if (colorMultiplier() != FloatColor4::white())
		return true;
	return !isEquivalentToDefault(fragmentShader(), fragmentShaderParam());
}

bool LayerProperties::isBlendingNontrivial() const {
	// Ignores the alpha wobbler
	return get(LayerProperty::MulColorAlpha) * 0.001f < 1.0f || blendType() != LayerBlendType::Type1;
}

DrawableParams LayerProperties::drawableParams() const {
	DrawableParams p;
	p.colorMultiplier = colorMultiplier();
	p.blendType       = blendType();
	p.fragmentShader  = fragmentShader();
	p.shaderParam     = fragmentShaderParam();
	return p;
}

DrawableClipParams LayerProperties::clipParams() const {
	DrawableClipParams p;
	switch (static_cast<int32_t>(get(LayerProperty::ClipMode))) {
		case 1:
			p.mode = DrawableClipMode::Clip;
			break;
		case 2:
			p.mode = DrawableClipMode::ClipIgnoreTransform;
			break;
		default:
			p.mode = DrawableClipMode::None;
			break;
	}

	float fromX = get(LayerProperty::ClipFromX), toX = get(LayerProperty::ClipToX);
	float fromY = get(LayerProperty::ClipFromY), toY = get(LayerProperty::ClipToY);
	if (fromX > toX)
		std::swap(fromX, toX);
	if (fromY > toY)
		std::swap(fromY, toY);
	p.area = Vec4(fromX, fromY, toX - fromX, toY - fromY);
	return p;
}

Mat4 LayerProperties::transform() const {
	int32_t flip = static_cast<int32_t>(get(LayerProperty::Flip));
	Vec2 flipScale((flip & 1) ? -1.0f : 1.0f, (flip & 2) ? -1.0f : 1.0f);

	Vec3 scaleOrigin(get(LayerProperty::ScaleOriginX), get(LayerProperty::ScaleOriginY), 0);
	float scaleX = get(LayerProperty::ScaleX) * 0.001f * get(LayerProperty::ScaleX2) * 0.001f *
	               evaluateWobbler(wobblerScaleX, LayerProperty::WobbleScaleXAmplitude, LayerProperty::WobbleScaleXBias, 0.001f, 1.0f);
	float scaleY = get(LayerProperty::ScaleY) * 0.001f * get(LayerProperty::ScaleY2) * 0.001f *
	               evaluateWobbler(wobblerScaleY, LayerProperty::WobbleScaleYAmplitude, LayerProperty::WobbleScaleYBias, 0.001f, 1.0f);

	Vec3 rotationOrigin(get(LayerProperty::RotationOriginX), get(LayerProperty::RotationOriginY), 0);
	float turns = get(LayerProperty::Rotation) * 0.001f + get(LayerProperty::Rotation2) * 0.001f +
	              evaluateWobbler(wobblerRotation, LayerProperty::WobbleRotationAmplitude, LayerProperty::WobbleRotationBias, 0.001f, 0.0f);

	Vec3 translation(get(LayerProperty::TranslateX) + get(LayerProperty::TranslateX2) - get(LayerProperty::NegatedTranslationX),
	                 get(LayerProperty::TranslateY) + get(LayerProperty::TranslateY2) - get(LayerProperty::NegatedTranslationY),
	                 get(LayerProperty::TranslateZ));

	Mat4 result = Xform::translation(-scaleOrigin);
	result      = Xform::scale(Vec3(scaleX * flipScale.x(), scaleY * flipScale.y(), 1)) * result;
	result      = Xform::translation(scaleOrigin - rotationOrigin) * result;
	result      = Xform::rotationZ(turns * 2.0f * static_cast<float>(M_PI)) * result;
	result      = Xform::translation(translation + rotationOrigin) * result;
	return result;
}

TransformParams LayerProperties::transformParams() const {
	TransformParams p;
	p.transform      = transform();
	p.cameraPosition = Vec3(get(LayerProperty::CameraPositionX), get(LayerProperty::CameraPositionY), get(LayerProperty::CameraPositionZ));
	p.unconditionallyInheritedTranslation = Vec2(get(LayerProperty::UnconditionallyInheritedTranslationX),
	                                             get(LayerProperty::UnconditionallyInheritedTranslationY));
	p.wobbleTranslation = Vec2(evaluateWobbler(wobblerX, LayerProperty::WobbleXAmplitude, LayerProperty::WobbleXBias, 1.0f, 0.0f),
	                           evaluateWobbler(wobblerY, LayerProperty::WobbleYAmplitude, LayerProperty::WobbleYBias, 1.0f, 0.0f));
	return p;
}

int32_t LayerProperties::composeFlags() const {
	return static_cast<int32_t>(get(LayerProperty::ComposeFlags));
}
