/**
 *  Render.cpp
 *  SNRScripter
 *
 *  Backend-independent draw requests, the per-frame dynamic buffer
 *  and the two-pass frame driver.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Graphics/Render.hpp"
#include "Engine/Graphics/Pool.hpp"
#include "Support/FileDefs.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <cstring>

uchar4 toUnorm(const FloatColor4 &c) {
	auto conv = [](float v) {
		return static_cast<unsigned char>(cmp::clamp(v, 0.0f, 1.0f) * 255.0f + 0.5f);
	};
	return {conv(c.r), conv(c.g), conv(c.b), conv(c.a)};
}

FloatColor4 fromUnorm(const uchar4 &c) {
	return {c.x / 255.0f, c.y / 255.0f, c.z / 255.0f, c.u / 255.0f};
}

DynamicBuffer::DynamicBuffer(size_t chunkSize, size_t align)
    : defaultChunkSize(chunkSize), alignment(align) {
	if (alignment == 0 || (alignment & (alignment - 1)) != 0)
		throw std::invalid_argument("DynamicBuffer alignment must be a power of two");
}

void DynamicBuffer::beginFrame() {
	currentFrame++;
	currentChunk = 0;
	cursor       = 0;
}

DynamicBuffer::Slice DynamicBuffer::allocate(const void *data, size_t size) {
	size_t offset = (cursor + alignment - 1) & ~(alignment - 1);

	if (currentChunk >= chunks.size() || offset + size > chunks[currentChunk].size()) {
		// Move on to the next chunk, the first allocation of a frame may still use chunk 0
		if (currentChunk < chunks.size() && cursor > 0)
			currentChunk++;
		while (currentChunk < chunks.size() && chunks[currentChunk].size() < size)
			currentChunk++;
		if (currentChunk >= chunks.size()) {
			// Oversized data gets a chunk of its own
			chunks.emplace_back(std::max(size, defaultChunkSize));
			currentChunk = static_cast<uint32_t>(chunks.size() - 1);
		}
		offset = 0;
	}

	if (size > 0 && data)
		std::memcpy(chunks[currentChunk].data() + offset, data, size);
	cursor = offset + size;

	Slice slice;
	slice.frame  = currentFrame;
	slice.chunk  = currentChunk;
	slice.offset = offset;
	slice.size   = size;
	return slice;
}

const uint8_t *DynamicBuffer::data(const Slice &slice) const {
	if (slice.frame != currentFrame)
		throw std::logic_error("Dynamic buffer slice of frame " + std::to_string(slice.frame) +
		                       " used in frame " + std::to_string(currentFrame));
	if (slice.chunk >= chunks.size() || slice.offset + slice.size > chunks[slice.chunk].size())
		throw std::logic_error("Dynamic buffer slice is out of bounds");
	return chunks[slice.chunk].data() + slice.offset;
}

RenderRequestBuilder &RenderRequestBuilder::vertices(VertexFormat format, const DynamicBuffer::Slice &slice, uint32_t count) {
	request.vertexFormat = format;
	request.vertices     = slice;
	request.vertexCount  = count;
	hasVertices          = true;
	return *this;
}

RenderRequestBuilder &RenderRequestBuilder::indices(const DynamicBuffer::Slice &slice, uint32_t count) {
	request.indexed    = true;
	request.indices    = slice;
	request.indexCount = count;
	return *this;
}

RenderRequest RenderRequestBuilder::build() const {
	auto &descriptor = shaderDescriptor(request.args.shader);

	if (!hasVertices)
		throw std::logic_error(std::string("No vertices for ") + descriptor.id);
	if (descriptor.vertexFormat != request.vertexFormat)
		throw std::logic_error(std::string("Vertex format mismatch for ") + descriptor.id);
	if (request.vertices.size < static_cast<size_t>(request.vertexCount) * vertexStride(request.vertexFormat))
		throw std::logic_error(std::string("Vertex slice too small for ") + descriptor.id);
	if (request.indexed && request.indices.size < request.indexCount * sizeof(uint16_t))
		throw std::logic_error(std::string("Index slice too small for ") + descriptor.id);

	for (size_t i = 0; i < descriptor.textures.size() && descriptor.textures[i]; i++) {
		if (i >= request.args.textures.size() || !request.args.textures[i])
			throw std::logic_error(std::string("Missing texture ") + descriptor.textures[i] + " for " + descriptor.id);
	}

	uint32_t count = request.elementCount();
	if (count == 0)
		throw std::logic_error(std::string("Empty draw for ") + descriptor.id);
	if (request.primitive == DrawPrimitive::Triangles && count % 3 != 0)
		throw std::logic_error(std::string("Triangle list of ") + std::to_string(count) + " elements for " + descriptor.id);
	if (request.primitive == DrawPrimitive::TriangleStrip && count < 3)
		throw std::logic_error(std::string("Degenerate triangle strip for ") + descriptor.id);

	return request;
}

void RenderPass::run(const RenderRequest &request) {
	if (stats) {
		if (kind == PassKind::Opaque)
			stats->opaqueDraws++;
		else
			stats->transparentDraws++;
	}
	backend.draw(target, request, buffer);
}

void PreRenderContext::renderOffscreen(RenderTarget &target, const std::function<void(RenderPass &)> &draw) {
	backend.clear(target, FloatColor4::transparent());
	{
		RenderPass pass(backend, target, buffer, nullptr, PassKind::Opaque);
		draw(pass);
	}
	{
		RenderPass pass(backend, target, buffer, nullptr, PassKind::Transparent);
		draw(pass);
	}
	if (stats)
		stats->indirectPasses++;
}

std::vector<uint8_t> allocateStencilRefs(uint8_t parentRef, const std::vector<uint8_t> &bumps) {
	std::vector<uint8_t> refs;
	refs.reserve(bumps.size());
	int next = parentRef;
	for (auto bump : bumps) {
		if (next > 0xFF) {
			sendToLog(LogLevel::Warn, "Ran out of stencil values, %zu siblings share the last one\n", bumps.size() - refs.size());
			next = 0xFF;
		}
		refs.push_back(static_cast<uint8_t>(next));
		next += bump;
	}
	return refs;
}

DynamicBuffer::Slice pushQuad(DynamicBuffer &buffer, const Vec4 &rect, const FloatColor4 &color) {
	float left = rect.x(), top = rect.y(), right = rect.x() + rect.z(), bottom = rect.y() + rect.w();
	uchar4 c   = toUnorm(color);
	PosColVertex vertices[4]{
	    {{left, top, 0}, c},
	    {{right, top, 0}, c},
	    {{left, bottom, 0}, c},
	    {{right, bottom, 0}, c}};
	return buffer.allocate(vertices, sizeof(vertices));
}

DynamicBuffer::Slice pushTexturedQuad(DynamicBuffer &buffer, const Vec4 &rect, const FloatColor4 &color, const Vec4 &uv) {
	float left = rect.x(), top = rect.y(), right = rect.x() + rect.z(), bottom = rect.y() + rect.w();
	uchar4 c   = toUnorm(color);
	PosColTexVertex vertices[4]{
	    {{left, top, 0}, c, {uv.x(), uv.y()}},
	    {{right, top, 0}, c, {uv.z(), uv.y()}},
	    {{left, bottom, 0}, c, {uv.x(), uv.w()}},
	    {{right, bottom, 0}, c, {uv.z(), uv.w()}}};
	return buffer.allocate(vertices, sizeof(vertices));
}

DynamicBuffer::Slice pushPosTexQuad(DynamicBuffer &buffer, const std::array<Vec2, 4> &corners, const std::array<Vec2, 4> &uv) {
	PosTexVertex vertices[4];
	for (size_t i = 0; i < 4; i++) {
		vertices[i].position        = {corners[i].x(), corners[i].y(), 0};
		vertices[i].texturePosition = {uv[i].x(), uv[i].y()};
	}
	return buffer.allocate(vertices, sizeof(vertices));
}

Renderer::Renderer(RenderBackend &backend, size_t chunkSize)
    : backend_(backend), buffer(chunkSize), pool(std::make_unique<RenderTargetPool>(backend)) {}

Renderer::~Renderer() = default;

void Renderer::renderFrame(Drawable &root, RenderTarget &target, const FloatColor4 &clearColor) {
	buffer.beginFrame();
	lastStats = RenderStats();

	TransformParams identity;
	PreRenderContext ctx{backend_, buffer, *pool, &lastStats, target.width, target.height};
	root.preRender(ctx, identity);

	backend_.clear(target, clearColor);
	{
		RenderPass pass(backend_, target, buffer, &lastStats, PassKind::Opaque);
		root.render(pass, identity, 1);
	}
	{
		RenderPass pass(backend_, target, buffer, &lastStats, PassKind::Transparent);
		root.render(pass, identity, 1);
	}
}
