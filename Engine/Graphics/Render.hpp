/**
 *  Render.hpp
 *  SNRScripter
 *
 *  Backend-independent draw requests, the per-frame dynamic buffer
 *  and the two-pass frame driver.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Graphics/Common.hpp"
#include "Engine/Entities/Properties.hpp"
#include "Engine/Formats/Mask.hpp"

#include <array>
#include <functional>
#include <memory>
#include <vector>
#include <cstdint>

struct PosVertex {
	float3 position;
};

struct PosColVertex {
	float3 position;
	uchar4 color;
};

struct PosColTexVertex {
	float3 position;
	uchar4 color;
	float2 texturePosition;
};

// Glyph quad corner: xy position, zw atlas coordinates, plus the fade-in time
struct TextVertex {
	float4 position;
	float time;
};

struct BlendVertex {
	float3 position;
	uchar4 color;
	// xy samples the first texture, zu the second one
	float4 texturePositions;
};

struct WindowVertex {
	float4 position;
	float4 texturePosition;
};

struct PosTexVertex {
	float3 position;
	float2 texturePosition;
};

struct MovieVertex {
	float3 position;
	float2 texturePosition;
};

static_assert(sizeof(PosVertex) == 12, "Unexpected vertex layout");
static_assert(sizeof(PosColVertex) == 16, "Unexpected vertex layout");
static_assert(sizeof(PosColTexVertex) == 24, "Unexpected vertex layout");
static_assert(sizeof(TextVertex) == 20, "Unexpected vertex layout");
static_assert(sizeof(BlendVertex) == 32, "Unexpected vertex layout");
static_assert(sizeof(WindowVertex) == 32, "Unexpected vertex layout");
static_assert(sizeof(PosTexVertex) == 20, "Unexpected vertex layout");
static_assert(sizeof(MaskVertex) == 16, "Unexpected vertex layout");
static_assert(sizeof(MovieVertex) == 20, "Unexpected vertex layout");

// Packs a color into the normalised byte vector vertices carry
uchar4 toUnorm(const FloatColor4 &c);
FloatColor4 fromUnorm(const uchar4 &c);

enum class TextureFormat {
	RGBA8,
	R8
};

inline size_t bytesPerTexel(TextureFormat format) {
	return format == TextureFormat::RGBA8 ? 4 : 1;
}

// Backend owned texture, shared by every layer that draws it
class GpuTexture {
public:
	const int width;
	const int height;
	const TextureFormat format;

	GpuTexture(int w, int h, TextureFormat f)
	    : width(w), height(h), format(f) {}
	virtual ~GpuTexture() = default;

	GpuTexture(const GpuTexture &) = delete;
	GpuTexture &operator=(const GpuTexture &) = delete;
};

using TextureHandle = std::shared_ptr<GpuTexture>;

// Color texture with an attached depth/stencil buffer
class RenderTarget {
public:
	const int width;
	const int height;

	RenderTarget(int w, int h)
	    : width(w), height(h) {}
	virtual ~RenderTarget() = default;

	// The color attachment, usable as a texture once drawing into it has finished
	virtual TextureHandle colorTexture() = 0;

	RenderTarget(const RenderTarget &) = delete;
	RenderTarget &operator=(const RenderTarget &) = delete;
};

using TargetHandle = std::shared_ptr<RenderTarget>;

// Uniforms and bindings of one draw, the shader decides which of them it reads
struct ShaderArgs {
	ShaderName shader{ShaderName::Clear};
	Mat4 transform{Mat4::Identity()};
	FloatColor4 color{FloatColor4::white()};
	FloatColor4 color2{FloatColor4::transparent()};
	std::array<TextureHandle, 3> textures;
	Vec4 param{Vec4::Zero()};

	// Layer and Mask
	LayerFragmentShader fragment{LayerFragmentShader::Default};
	LayerShaderOutputKind output{LayerShaderOutputKind::Layer};

	// FontBorder dilation offsets
	std::array<float, 8> distances{};

	// Movie and MovieAlpha
	Vec4 colorBias{Vec4::Zero()};
	std::array<Vec4, 3> colorTransform{{Vec4::Zero(), Vec4::Zero(), Vec4::Zero()}};
};

// Transient per-frame storage for vertex and index data
class DynamicBuffer {
public:
	static const size_t DEFAULT_CHUNK_SIZE = 1024 * 1024;

	// Only valid during the frame it was allocated in
	struct Slice {
		uint64_t frame{0};
		uint32_t chunk{0};
		size_t offset{0};
		size_t size{0};
	};

	explicit DynamicBuffer(size_t chunkSize = DEFAULT_CHUNK_SIZE, size_t alignment = 4);

	// Invalidates every slice handed out so far and rewinds to the first chunk
	void beginFrame();
	uint64_t frame() const {
		return currentFrame;
	}

	Slice allocate(const void *data, size_t size);

	template <typename T>
	Slice allocate(const std::vector<T> &items) {
		return allocate(items.data(), items.size() * sizeof(T));
	}

	// Throws std::logic_error for a slice of another frame
	const uint8_t *data(const Slice &slice) const;

	size_t chunkCount() const {
		return chunks.size();
	}
	size_t chunkSize() const {
		return defaultChunkSize;
	}

private:
	std::vector<std::vector<uint8_t>> chunks;
	size_t defaultChunkSize;
	size_t alignment;
	uint64_t currentFrame{1};
	uint32_t currentChunk{0};
	size_t cursor{0};
};

struct RenderRequest {
	ShaderArgs args;
	DrawPrimitive primitive{DrawPrimitive::Triangles};
	DepthStencilState depthStencil;
	ColorBlendType blend{ColorBlendType::Opaque};
	CullFace cull{CullFace::None};
	VertexFormat vertexFormat{VertexFormat::Pos};
	DynamicBuffer::Slice vertices;
	uint32_t vertexCount{0};
	bool indexed{false};
	// 16-bit indices
	DynamicBuffer::Slice indices;
	uint32_t indexCount{0};

	uint32_t elementCount() const {
		return indexed ? indexCount : vertexCount;
	}
};

// Collects the pieces of a request and checks them against the shader descriptor
class RenderRequestBuilder {
	RenderRequest request;
	bool hasVertices{false};

public:
	RenderRequestBuilder &shader(const ShaderArgs &args) {
		request.args = args;
		return *this;
	}
	RenderRequestBuilder &primitive(DrawPrimitive p) {
		request.primitive = p;
		return *this;
	}
	RenderRequestBuilder &depthStencil(const DepthStencilState &state) {
		request.depthStencil = state;
		return *this;
	}
	RenderRequestBuilder &depthStencilShorthand(uint8_t stencilRef, bool allowEqualStencil, bool testDepth) {
		request.depthStencil = DepthStencilState::shorthand(stencilRef, allowEqualStencil, testDepth);
		return *this;
	}
	RenderRequestBuilder &colorBlend(ColorBlendType type) {
		request.blend = type;
		return *this;
	}
	RenderRequestBuilder &cull(CullFace face) {
		request.cull = face;
		return *this;
	}
	RenderRequestBuilder &vertices(VertexFormat format, const DynamicBuffer::Slice &slice, uint32_t count);
	RenderRequestBuilder &indices(const DynamicBuffer::Slice &slice, uint32_t count);

	// Throws std::logic_error when the request cannot be drawn as described
	RenderRequest build() const;
};

class RenderBackend {
public:
	virtual ~RenderBackend() = default;

	virtual const char *name() const = 0;
	// data may be nullptr for an uninitialised texture, rows are tightly packed
	virtual TextureHandle createTexture(int width, int height, TextureFormat format, const uint8_t *data) = 0;
	// Replaces every texel, data has the size and format the texture was created with
	virtual void uploadTexture(GpuTexture &texture, const uint8_t *data) = 0;
	virtual TargetHandle createTarget(int width, int height) = 0;
	// Also resets depth to 1 and stencil to 0
	virtual void clear(RenderTarget &target, const FloatColor4 &color) = 0;
	virtual void draw(RenderTarget &target, const RenderRequest &request, const DynamicBuffer &buffer) = 0;
	// Top row first
	virtual std::vector<FloatColor4> readPixels(RenderTarget &target) = 0;
};

struct RenderStats {
	uint32_t opaqueDraws{0};
	uint32_t transparentDraws{0};
	uint32_t indirectPasses{0};
	// Nodes that announced an opaque draw while pre-rendering
	uint32_t preRenderOpaqueNodes{0};
};

class RenderTargetPool;

class RenderPass {
	RenderBackend &backend;
	RenderTarget &target;
	DynamicBuffer &buffer;
	// nullptr for nested offscreen passes
	RenderStats *stats;

public:
	const PassKind kind;

	RenderPass(RenderBackend &b, RenderTarget &t, DynamicBuffer &d, RenderStats *s, PassKind k)
	    : backend(b), target(t), buffer(d), stats(s), kind(k) {}

	void run(const RenderRequest &request);

	DynamicBuffer &dynamicBuffer() {
		return buffer;
	}
	RenderBackend &renderBackend() {
		return backend;
	}
	int width() const {
		return target.width;
	}
	int height() const {
		return target.height;
	}
};

struct PreRenderContext {
	RenderBackend &backend;
	DynamicBuffer &buffer;
	RenderTargetPool &pool;
	// nullptr while pre-rendering a subtree that is drawn offscreen
	RenderStats *stats;
	int canvasWidth;
	int canvasHeight;

	// Clears the target and runs both passes of draw into it
	void renderOffscreen(RenderTarget &target, const std::function<void(RenderPass &)> &draw);
	// Same context for a subtree that lands in an offscreen target
	PreRenderContext nested() const {
		return PreRenderContext{backend, buffer, pool, nullptr, canvasWidth, canvasHeight};
	}
};

// Anything the renderer can walk: pre-render once, then render in both passes
class Drawable {
public:
	virtual ~Drawable() = default;

	virtual void preRender(PreRenderContext &ctx, const TransformParams &parent) = 0;
	virtual void render(RenderPass &pass, const TransformParams &parent, uint8_t stencilRef) const = 0;
	// Stencil values the node and its subtree consume
	virtual uint8_t stencilBump() const {
		return 1;
	}
};

// References for siblings drawn under parentRef, each one past the bumps of the earlier ones
std::vector<uint8_t> allocateStencilRefs(uint8_t parentRef, const std::vector<uint8_t> &bumps);

// Quad helpers, corners in the order of a triangle strip
DynamicBuffer::Slice pushQuad(DynamicBuffer &buffer, const Vec4 &rect, const FloatColor4 &color);
DynamicBuffer::Slice pushTexturedQuad(DynamicBuffer &buffer, const Vec4 &rect, const FloatColor4 &color, const Vec4 &uv);
DynamicBuffer::Slice pushPosTexQuad(DynamicBuffer &buffer, const std::array<Vec2, 4> &corners, const std::array<Vec2, 4> &uv);

class Renderer {
	RenderBackend &backend_;
	DynamicBuffer buffer;
	std::unique_ptr<RenderTargetPool> pool;
	RenderStats lastStats;

public:
	explicit Renderer(RenderBackend &backend, size_t chunkSize = DynamicBuffer::DEFAULT_CHUNK_SIZE);
	~Renderer();

	// Pre-render, clear, then the opaque and the transparent pass with the root at reference 1
	void renderFrame(Drawable &root, RenderTarget &target, const FloatColor4 &clearColor);

	const RenderStats &stats() const {
		return lastStats;
	}
	RenderBackend &backend() {
		return backend_;
	}
	DynamicBuffer &dynamicBuffer() {
		return buffer;
	}
	RenderTargetPool &targetPool() {
		return *pool;
	}
};
