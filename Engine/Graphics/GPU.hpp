/**
 *  GPU.hpp
 *  SNRScripter
 *
 *  SDL_gpu render backend: window, shader programs, textures and targets.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Graphics/Common.hpp"
#include "Engine/Graphics/Render.hpp"
#include "Engine/Components/Base.hpp"

#include <SDL2/SDL.h>
#include <SDL2/SDL_gpu.h>

#include <array>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <cstdint>

class GPUTexture : public GpuTexture {
public:
	GPU_Image *image;

	GPUTexture(GPU_Image *img, TextureFormat f)
	    : GpuTexture(img->w, img->h, f), image(img) {}
	~GPUTexture() override {
		GPU_FreeImage(image);
	}
};

class GPUTarget : public RenderTarget {
public:
	// nullptr for the window
	std::shared_ptr<GPUTexture> color;
	GPU_Target *target;
	// Renderbuffer holding depth and stencil of offscreen targets
	uint32_t depthStencil{0};

	GPUTarget(GPU_Target *t, std::shared_ptr<GPUTexture> c)
	    : RenderTarget(t->w, t->h), color(std::move(c)), target(t) {}
	~GPUTarget() override;

	// Offscreen targets are drawn upside down so that their rows match uploaded textures
	bool offscreen() const {
		return color != nullptr;
	}
	TextureHandle colorTexture() override {
		return color;
	}
};

// Locations of one linked program, -1 for what the program does not use
struct GPUProgram {
	uint32_t handle{0};
	int transform{-1};
	int color{-1};
	int color2{-1};
	int param{-1};
	int distances{-1};
	int colorBias{-1};
	int colorTransform{-1};
	int fragment{-1};
	int output{-1};
	int texSize0{-1};
	std::array<int, 4> samplers{{-1, -1, -1, -1}};
	// a_position, a_color, a_texcoord, a_texcoord2
	std::array<int, 4> attributes{{-1, -1, -1, -1}};
};

class GPUController : public BaseController, public RenderBackend {
	std::unordered_map<std::string, uint32_t> shaders;
	std::array<GPUProgram, static_cast<size_t>(ShaderName::Total)> programs;
	std::shared_ptr<GPUTarget> screen;
	// Streaming buffers for vertices and indices
	uint32_t vertexBuffer{0};
	uint32_t indexBuffer{0};

	bool createShadersFromResources();
	void createShader(const char *filename);
	bool linkProgram(ShaderName name);
	GPU_ShaderEnum getShaderTypeByExtension(const char *filename);

protected:
	int ownInit() override;
	int ownDeinit() override;

public:
	// Upper texture dimension limit (in pixels)
	int max_texture{0};

	struct GPURendererInfo {
		const char *name{nullptr};
		GPU_RendererID (GPUController::*makeRendererId)(){nullptr};
		void (GPUController::*initRendererFlags)(){nullptr};
		void (GPUController::*syncRendererState)(){nullptr};
		int (GPUController::*getMaxTextureSize)(){nullptr};
		bool (GPUController::*attachDepthStencil)(GPUTarget &target){nullptr};
		void (GPUController::*releaseDepthStencil)(uint32_t handle){nullptr};
		void (GPUController::*clearTarget)(GPUTarget &target, const FloatColor4 &color){nullptr};
		void (GPUController::*submitDraw)(GPUTarget &target, const RenderRequest &request, const DynamicBuffer &buffer, const GPUProgram &program){nullptr};
		void (GPUController::*readTarget)(GPUTarget &target, std::vector<FloatColor4> &out){nullptr};
	};

	GPU_RendererID makeRendererIdGL2();
	void initRendererFlagsGL2();
	void syncRendererStateGL2();
	int getMaxTextureSizeGL2();
	bool attachDepthStencilGL2(GPUTarget &target);
	void releaseDepthStencilGL2(uint32_t handle);
	void clearTargetGL2(GPUTarget &target, const FloatColor4 &color);
	void submitDrawGL2(GPUTarget &target, const RenderRequest &request, const DynamicBuffer &buffer, const GPUProgram &program);
	void readTargetGL2(GPUTarget &target, std::vector<FloatColor4> &out);

	GPURendererInfo renderers[1]{
	    {"GL2",
	     &GPUController::makeRendererIdGL2,
	     &GPUController::initRendererFlagsGL2,
	     &GPUController::syncRendererStateGL2,
	     &GPUController::getMaxTextureSizeGL2,
	     &GPUController::attachDepthStencilGL2,
	     &GPUController::releaseDepthStencilGL2,
	     &GPUController::clearTargetGL2,
	     &GPUController::submitDrawGL2,
	     &GPUController::readTargetGL2}};

	GPURendererInfo *current_renderer{nullptr};

	// Opens the window, returns false when no renderer could be initialised
	bool rendererInit(uint16_t w, uint16_t h, bool fullscreen);
	bool rendererInitWithInfo(GPURendererInfo &info, uint16_t w, uint16_t h, bool fullscreen);

	RenderTarget &screenTarget() {
		return *screen;
	}
	void present();

	const char *name() const override {
		return current_renderer ? current_renderer->name : "gpu";
	}
	TextureHandle createTexture(int width, int height, TextureFormat format, const uint8_t *data) override;
	void uploadTexture(GpuTexture &texture, const uint8_t *data) override;
	TargetHandle createTarget(int width, int height) override;
	void clear(RenderTarget &target, const FloatColor4 &color) override;
	void draw(RenderTarget &target, const RenderRequest &request, const DynamicBuffer &buffer) override;
	std::vector<FloatColor4> readPixels(RenderTarget &target) override;

	GPUController()
	    : BaseController(this) {}
};

extern GPUController gpu;
