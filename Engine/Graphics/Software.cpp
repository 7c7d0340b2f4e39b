/**
 *  Software.cpp
 *  SNRScripter
 *
 *  CPU rasteriser implementing the render backend contract,
 *  used for headless runs, snapshots and tests.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Graphics/Software.hpp"
#include "Support/FileDefs.hpp"

#include <algorithm>
#include <stdexcept>
#include <cmath>
#include <cstring>

namespace {

template <typename T>
T readAt(const uint8_t *data, size_t offset) {
	T value;
	std::memcpy(&value, data + offset, sizeof(T));
	return value;
}

Vec4 position3(const float3 &p) {
	return Vec4(p.x, p.y, p.z, 1.0f);
}

SoftwareTexture *softwareTexture(const TextureHandle &handle) {
	if (!handle)
		return nullptr;
	auto texture = dynamic_cast<SoftwareTexture *>(handle.get());
	if (!texture)
		throw std::logic_error("Texture of another backend given to the software renderer");
	return texture;
}

FloatColor4 sampleSlot(const RenderRequest &request, size_t slot, const Vec2 &uv) {
	auto texture = softwareTexture(request.args.textures[slot]);
	if (!texture)
		return FloatColor4::white();
	return texture->sample(uv.x(), uv.y());
}

float mix(float a, float b, float t) {
	return a + (b - a) * t;
}

FloatColor4 mix(const FloatColor4 &a, const FloatColor4 &b, float t) {
	return {mix(a.r, b.r, t), mix(a.g, b.g, t), mix(a.b, b.b, t), mix(a.a, b.a, t)};
}

// Edge function, positive when p lies to the right of a->b in screen space
float edge(const Vec2 &a, const Vec2 &b, const Vec2 &p) {
	return (b.x() - a.x()) * (p.y() - a.y()) - (b.y() - a.y()) * (p.x() - a.x());
}

// Pixels exactly on an edge belong to one of the two triangles sharing it
bool ownsEdge(const Vec2 &a, const Vec2 &b) {
	float dx = b.x() - a.x(), dy = b.y() - a.y();
	return dy > 0 || (dy == 0 && dx < 0);
}

} // namespace

FloatColor4 SoftwareTexture::sample(float u, float v) const {
	if (width <= 0 || height <= 0)
		return FloatColor4::transparent();
	int x = cmp::clamp(static_cast<int>(std::floor(u * width)), 0, width - 1);
	int y = cmp::clamp(static_cast<int>(std::floor(v * height)), 0, height - 1);
	return texels[static_cast<size_t>(y) * width + x];
}

TextureHandle SoftwareBackend::createTexture(int width, int height, TextureFormat format, const uint8_t *data) {
	auto texture = std::make_shared<SoftwareTexture>(width, height, format);
	if (data)
		uploadTexture(*texture, data);
	return texture;
}

void SoftwareBackend::uploadTexture(GpuTexture &texture, const uint8_t *data) {
	auto &software = static_cast<SoftwareTexture &>(texture);
	size_t count   = static_cast<size_t>(software.width) * software.height;
	for (size_t i = 0; i < count; i++) {
		if (software.format == TextureFormat::RGBA8) {
			software.texels[i] = {data[i * 4] / 255.0f, data[i * 4 + 1] / 255.0f, data[i * 4 + 2] / 255.0f, data[i * 4 + 3] / 255.0f};
		} else {
			float v            = data[i] / 255.0f;
			software.texels[i] = {v, v, v, v};
		}
	}
}

TargetHandle SoftwareBackend::createTarget(int width, int height) {
	return std::make_shared<SoftwareTarget>(width, height);
}

void SoftwareBackend::clear(RenderTarget &target, const FloatColor4 &color) {
	auto &t = dynamic_cast<SoftwareTarget &>(target);
	std::fill(t.color->texels.begin(), t.color->texels.end(), color);
	std::fill(t.depth.begin(), t.depth.end(), 1.0f);
	std::fill(t.stencil.begin(), t.stencil.end(), 0);
}

std::vector<FloatColor4> SoftwareBackend::readPixels(RenderTarget &target) {
	auto &t = dynamic_cast<SoftwareTarget &>(target);
	return t.color->texels;
}

std::vector<SoftwareBackend::Vertex> SoftwareBackend::decodeVertices(const RenderRequest &request, const DynamicBuffer &buffer) {
	const uint8_t *data = buffer.data(request.vertices);
	size_t stride       = vertexStride(request.vertexFormat);
	std::vector<Vertex> vertices(request.vertexCount);

	for (uint32_t i = 0; i < request.vertexCount; i++) {
		size_t base = i * stride;
		Vertex &v   = vertices[i];
		switch (request.vertexFormat) {
			case VertexFormat::Pos:
				v.position = position3(readAt<PosVertex>(data, base).position);
				break;
			case VertexFormat::PosCol: {
				auto raw   = readAt<PosColVertex>(data, base);
				v.position = position3(raw.position);
				v.color    = fromUnorm(raw.color);
				break;
			}
			case VertexFormat::PosColTex: {
				auto raw   = readAt<PosColTexVertex>(data, base);
				v.position = position3(raw.position);
				v.color    = fromUnorm(raw.color);
				v.uv       = Vec2(raw.texturePosition.x, raw.texturePosition.y);
				break;
			}
			case VertexFormat::Text: {
				auto raw   = readAt<TextVertex>(data, base);
				v.position = Vec4(raw.position.x, raw.position.y, 0, 1);
				v.uv       = Vec2(raw.position.z, raw.position.u);
				break;
			}
			case VertexFormat::Blend: {
				auto raw   = readAt<BlendVertex>(data, base);
				v.position = position3(raw.position);
				v.color    = fromUnorm(raw.color);
				v.uv       = Vec2(raw.texturePositions.x, raw.texturePositions.y);
				v.uv2      = Vec2(raw.texturePositions.z, raw.texturePositions.u);
				break;
			}
			case VertexFormat::Window: {
				auto raw   = readAt<WindowVertex>(data, base);
				v.position = Vec4(raw.position.x, raw.position.y, 0, 1);
				v.uv       = Vec2(raw.texturePosition.x, raw.texturePosition.y);
				break;
			}
			case VertexFormat::PosTex: {
				auto raw   = readAt<PosTexVertex>(data, base);
				v.position = position3(raw.position);
				v.uv       = Vec2(raw.texturePosition.x, raw.texturePosition.y);
				break;
			}
			case VertexFormat::Mask: {
				auto raw   = readAt<MaskVertex>(data, base);
				v.position = Vec4(raw.position.x, raw.position.y, 0, 1);
				v.uv       = Vec2(raw.texCoord.x, raw.texCoord.y);
				break;
			}
			case VertexFormat::Movie: {
				auto raw   = readAt<MovieVertex>(data, base);
				v.position = position3(raw.position);
				v.uv       = Vec2(raw.texturePosition.x, raw.texturePosition.y);
				break;
			}
		}
		if (request.vertexFormat != VertexFormat::Blend)
			v.uv2 = v.uv;
		v.position = request.args.transform * v.position;
	}
	return vertices;
}

void SoftwareBackend::draw(RenderTarget &renderTarget, const RenderRequest &request, const DynamicBuffer &buffer) {
	auto &target  = dynamic_cast<SoftwareTarget &>(renderTarget);
	auto vertices = decodeVertices(request, buffer);

	std::vector<uint32_t> elements;
	if (request.indexed) {
		const uint8_t *data = buffer.data(request.indices);
		for (uint32_t i = 0; i < request.indexCount; i++) {
			auto index = readAt<uint16_t>(data, i * sizeof(uint16_t));
			if (index >= vertices.size()) {
				sendToLog(LogLevel::Error, "Vertex index %u out of range %zu\n", index, vertices.size());
				return;
			}
			elements.push_back(index);
		}
	} else {
		for (uint32_t i = 0; i < request.vertexCount; i++)
			elements.push_back(i);
	}

	if (request.primitive == DrawPrimitive::Triangles) {
		for (size_t i = 0; i + 2 < elements.size(); i += 3)
			rasterise(target, request, vertices[elements[i]], vertices[elements[i + 1]], vertices[elements[i + 2]]);
	} else {
		for (size_t i = 0; i + 2 < elements.size(); i++) {
			// Keep the winding of odd strip triangles consistent
			if (i % 2 == 0)
				rasterise(target, request, vertices[elements[i]], vertices[elements[i + 1]], vertices[elements[i + 2]]);
			else
				rasterise(target, request, vertices[elements[i + 1]], vertices[elements[i]], vertices[elements[i + 2]]);
		}
	}
}

void SoftwareBackend::rasterise(SoftwareTarget &target, const RenderRequest &request, const Vertex &a, const Vertex &b, const Vertex &c) {
	const Vertex *v[3] = {&a, &b, &c};
	Vec2 screen[3];
	float depth[3];
	for (int i = 0; i < 3; i++) {
		const Vec4 &p = v[i]->position;
		float w       = p.w() != 0 ? p.w() : 1.0f;
		// Y points up in normalised device coordinates and down in the target
		screen[i] = Vec2((p.x() / w + 1.0f) * 0.5f * target.width, (1.0f - p.y() / w) * 0.5f * target.height);
		depth[i]  = (p.z() / w + 1.0f) * 0.5f;
	}

	float area = edge(screen[0], screen[1], screen[2]);
	if (area == 0)
		return;
	// Counter-clockwise on screen means a negative area here
	bool front = area < 0;
	if ((request.cull == CullFace::Back && !front) || (request.cull == CullFace::Front && front))
		return;
	if (area < 0) {
		std::swap(v[1], v[2]);
		std::swap(screen[1], screen[2]);
		std::swap(depth[1], depth[2]);
		area = -area;
	}

	int minX = std::max(0, static_cast<int>(std::floor(std::min({screen[0].x(), screen[1].x(), screen[2].x()}))));
	int maxX = std::min(target.width - 1, static_cast<int>(std::ceil(std::max({screen[0].x(), screen[1].x(), screen[2].x()}))));
	int minY = std::max(0, static_cast<int>(std::floor(std::min({screen[0].y(), screen[1].y(), screen[2].y()}))));
	int maxY = std::min(target.height - 1, static_cast<int>(std::ceil(std::max({screen[0].y(), screen[1].y(), screen[2].y()}))));

	for (int y = minY; y <= maxY; y++) {
		for (int x = minX; x <= maxX; x++) {
			Vec2 p(x + 0.5f, y + 0.5f);
			float w0 = edge(screen[1], screen[2], p);
			float w1 = edge(screen[2], screen[0], p);
			float w2 = edge(screen[0], screen[1], p);
			if (w0 < 0 || w1 < 0 || w2 < 0)
				continue;
			if ((w0 == 0 && !ownsEdge(screen[1], screen[2])) ||
			    (w1 == 0 && !ownsEdge(screen[2], screen[0])) ||
			    (w2 == 0 && !ownsEdge(screen[0], screen[1])))
				continue;

			float l0 = w0 / area, l1 = w1 / area, l2 = w2 / area;
			Vertex f;
			f.color = {v[0]->color.r * l0 + v[1]->color.r * l1 + v[2]->color.r * l2,
			           v[0]->color.g * l0 + v[1]->color.g * l1 + v[2]->color.g * l2,
			           v[0]->color.b * l0 + v[1]->color.b * l1 + v[2]->color.b * l2,
			           v[0]->color.a * l0 + v[1]->color.a * l1 + v[2]->color.a * l2};
			f.uv  = v[0]->uv * l0 + v[1]->uv * l1 + v[2]->uv * l2;
			f.uv2 = v[0]->uv2 * l0 + v[1]->uv2 * l1 + v[2]->uv2 * l2;

			FloatColor4 src;
			if (!shade(request, f, src))
				continue;
			writeFragment(target, request, x, y, depth[0] * l0 + depth[1] * l1 + depth[2] * l2, src);
		}
	}
}

bool SoftwareBackend::shade(const RenderRequest &request, const Vertex &v, FloatColor4 &out) const {
	const ShaderArgs &args = request.args;

	switch (args.shader) {
		case ShaderName::Clear:
			out = args.color;
			break;
		case ShaderName::Fill:
			out = v.color;
			break;
		case ShaderName::Sprite:
		case ShaderName::Button:
		case ShaderName::TapEffect:
		case ShaderName::Breakup:
		case ShaderName::Charicon0:
		case ShaderName::Charicon2:
			out = sampleSlot(request, 0, v.uv) * v.color;
			break;
		case ShaderName::Charicon1:
		case ShaderName::Charicon3:
			out = sampleSlot(request, 0, v.uv) * v.color;
			out.a *= sampleSlot(request, 1, v.uv).r;
			break;
		case ShaderName::Font: {
			float coverage = sampleSlot(request, 0, v.uv).r;
			out            = mix(args.color2, args.color, coverage);
			out.a *= coverage;
			break;
		}
		case ShaderName::FontBorder: {
			auto texture   = softwareTexture(args.textures[0]);
			float coverage = 0;
			for (size_t i = 0; i < args.distances.size(); i += 2) {
				float du = texture ? args.distances[i] / texture->width : 0;
				float dv = texture ? args.distances[i + 1] / texture->height : 0;
				coverage = std::max({coverage, sampleSlot(request, 0, Vec2(v.uv.x() + du, v.uv.y() + dv)).r,
				                     sampleSlot(request, 0, Vec2(v.uv.x() - du, v.uv.y() - dv)).r});
			}
			out = args.color;
			out.a *= coverage;
			break;
		}
		case ShaderName::Blend:
			out = mix(sampleSlot(request, 0, v.uv), sampleSlot(request, 1, v.uv2), args.param.x()) * v.color;
			break;
		case ShaderName::Window:
			out = sampleSlot(request, 0, v.uv) * args.color;
			break;
		case ShaderName::Layer:
		case ShaderName::Mask: {
			out = evaluateFragmentShader(args.fragment, sampleSlot(request, 0, v.uv), args.param) * args.color;
			if (args.shader == ShaderName::Mask)
				out = out * FloatColor4{1, 1, 1, sampleSlot(request, 1, v.uv).r};
			if (args.output == LayerShaderOutputKind::LayerPremultiply)
				out = out.premultiply();
			else if (args.output == LayerShaderOutputKind::LayerDiscard && out.a <= 0)
				return false;
			break;
		}
		case ShaderName::Dissolve:
			out = sampleSlot(request, 0, v.uv) * args.color;
			out.a *= cmp::clamp(args.param.x(), 0.0f, 1.0f);
			break;
		case ShaderName::Movie:
		case ShaderName::MovieAlpha: {
			Vec4 yuv(sampleSlot(request, 0, v.uv).r, sampleSlot(request, 1, v.uv).r, sampleSlot(request, 1, v.uv).g, 1.0f);
			Vec3 rgb(args.colorTransform[0].dot(yuv), args.colorTransform[1].dot(yuv), args.colorTransform[2].dot(yuv));
			rgb += args.colorBias.head<3>();
			float alpha = args.shader == ShaderName::MovieAlpha ? yuv.x() : 1.0f;
			out         = FloatColor4{cmp::clamp(rgb.x(), 0.0f, 1.0f), cmp::clamp(rgb.y(), 0.0f, 1.0f), cmp::clamp(rgb.z(), 0.0f, 1.0f), alpha} * args.color;
			break;
		}
		case ShaderName::WiperMask: {
			float progress = args.param.x();
			float fuzz     = std::max(args.param.y(), 1.0f / 255.0f);
			float level    = sampleSlot(request, 2, v.uv).r;
			float t        = cmp::clamp((progress * (1.0f + fuzz) - level) / fuzz, 0.0f, 1.0f);
			out            = mix(sampleSlot(request, 0, v.uv), sampleSlot(request, 1, v.uv), t);
			break;
		}
		// The distortions are left to the GPU programs, the software path crossfades
		case ShaderName::WiperDefault:
		case ShaderName::WiperWave:
		case ShaderName::WiperRipple:
		case ShaderName::WiperWhirl:
		case ShaderName::WiperGlass:
			out = mix(sampleSlot(request, 0, v.uv), sampleSlot(request, 1, v.uv), cmp::clamp(args.param.x(), 0.0f, 1.0f));
			break;
		case ShaderName::Mosaic: {
			auto texture = softwareTexture(args.textures[0]);
			float block  = std::max(args.param.x(), 1.0f);
			Vec2 uv      = v.uv;
			if (texture) {
				uv.x() = (std::floor(uv.x() * texture->width / block) + 0.5f) * block / texture->width;
				uv.y() = (std::floor(uv.y() * texture->height / block) + 0.5f) * block / texture->height;
			}
			out = sampleSlot(request, 0, uv);
			break;
		}
		case ShaderName::Blur: {
			auto texture = softwareTexture(args.textures[0]);
			int radius   = static_cast<int>(std::max(args.param.x(), 0.0f));
			if (!texture || radius == 0) {
				out = sampleSlot(request, 0, v.uv);
				break;
			}
			FloatColor4 sum;
			int n = 0;
			for (int dy = -radius; dy <= radius; dy++) {
				for (int dx = -radius; dx <= radius; dx++) {
					auto s = texture->sample(v.uv.x() + static_cast<float>(dx) / texture->width, v.uv.y() + static_cast<float>(dy) / texture->height);
					sum    = {sum.r + s.r, sum.g + s.g, sum.b + s.b, sum.a + s.a};
					n++;
				}
			}
			out = {sum.r / n, sum.g / n, sum.b / n, sum.a / n};
			break;
		}
		case ShaderName::ZoomBlur:
		case ShaderName::Raster:
		case ShaderName::Ripple:
			out = sampleSlot(request, 0, v.uv);
			break;
		case ShaderName::Total:
			throw std::logic_error("Invalid shader in render request");
	}
	return true;
}

void SoftwareBackend::writeFragment(SoftwareTarget &target, const RenderRequest &request, int x, int y, float z, const FloatColor4 &src) {
	size_t index                = static_cast<size_t>(y) * target.width + x;
	const DepthState &depth     = request.depthStencil.depth;
	const StencilState &stencil = request.depthStencil.stencil;

	uint8_t stored = target.stencil[index];
	auto writeStencil = [&](StencilOperation op) {
		uint8_t value          = applyStencilOperation(op, stored, stencil.reference);
		target.stencil[index] = (stored & ~stencil.writeMask) | (value & stencil.writeMask);
	};

	if (!compare(stencil.function, stencil.reference & stencil.readMask, stored & stencil.readMask)) {
		writeStencil(stencil.stencilFail);
		return;
	}
	if (!compareDepth(depth.function, z, target.depth[index])) {
		writeStencil(stencil.depthFail);
		return;
	}
	writeStencil(stencil.pass);
	if (depth.writeEnable)
		target.depth[index] = z;

	const BlendState &blend = blendState(request.blend);
	if (!blend.writeColor)
		return;
	FloatColor4 &dst = target.color->texels[index];
	dst              = blendPixel(blend, src, dst);
}
