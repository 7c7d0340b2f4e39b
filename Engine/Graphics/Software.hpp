/**
 *  Software.hpp
 *  SNRScripter
 *
 *  CPU rasteriser implementing the render backend contract,
 *  used for headless runs, snapshots and tests.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Graphics/Render.hpp"

#include <memory>
#include <vector>
#include <cstdint>

class SoftwareTexture : public GpuTexture {
public:
	// RGBA floats per texel, single channel textures repeat their value in every component
	std::vector<FloatColor4> texels;

	SoftwareTexture(int w, int h, TextureFormat f)
	    : GpuTexture(w, h, f), texels(static_cast<size_t>(w) * h) {}

	// Nearest texel, clamped to the edges
	FloatColor4 sample(float u, float v) const;
	FloatColor4 &at(int x, int y) {
		return texels[static_cast<size_t>(y) * width + x];
	}
};

class SoftwareTarget : public RenderTarget {
public:
	std::shared_ptr<SoftwareTexture> color;
	std::vector<float> depth;
	std::vector<uint8_t> stencil;

	SoftwareTarget(int w, int h)
	    : RenderTarget(w, h),
	      color(std::make_shared<SoftwareTexture>(w, h, TextureFormat::RGBA8)),
	      depth(static_cast<size_t>(w) * h, 1.0f),
	      stencil(static_cast<size_t>(w) * h, 0) {}

	TextureHandle colorTexture() override {
		return color;
	}
};

class SoftwareBackend : public RenderBackend {
public:
	struct Vertex {
		Vec4 position;
		FloatColor4 color{FloatColor4::white()};
		Vec2 uv{Vec2::Zero()};
		Vec2 uv2{Vec2::Zero()};
	};

	const char *name() const override {
		return "software";
	}
	TextureHandle createTexture(int width, int height, TextureFormat format, const uint8_t *data) override;
	void uploadTexture(GpuTexture &texture, const uint8_t *data) override;
	TargetHandle createTarget(int width, int height) override;
	void clear(RenderTarget &target, const FloatColor4 &color) override;
	void draw(RenderTarget &target, const RenderRequest &request, const DynamicBuffer &buffer) override;
	std::vector<FloatColor4> readPixels(RenderTarget &target) override;

	// Decodes the vertices of a request into clip space positions and attributes
	static std::vector<Vertex> decodeVertices(const RenderRequest &request, const DynamicBuffer &buffer);

private:
	void rasterise(SoftwareTarget &target, const RenderRequest &request, const Vertex &a, const Vertex &b, const Vertex &c);
	// false when the fragment is discarded
	bool shade(const RenderRequest &request, const Vertex &v, FloatColor4 &out) const;
	void writeFragment(SoftwareTarget &target, const RenderRequest &request, int x, int y, float z, const FloatColor4 &src);
};
