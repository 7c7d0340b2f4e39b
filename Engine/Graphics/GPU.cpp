/**
 *  GPU.cpp
 *  SNRScripter
 *
 *  SDL_gpu render backend: window, shader programs, textures and targets.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Graphics/GPU.hpp"
#include "Resources/Support/Resources.hpp"
#include "Support/FileDefs.hpp"

#include <stdexcept>
#include <string>

GPUController gpu;

namespace {
const char *const DEFAULT_VERTEX_SHADER = "default.vert";
const char *const ATTRIBUTE_NAMES[]     = {"a_position", "a_color", "a_texcoord", "a_texcoord2"};
} // namespace

GPUTarget::~GPUTarget() {
	if (depthStencil && gpu.current_renderer)
		(gpu.*gpu.current_renderer->releaseDepthStencil)(depthStencil);
	// The window target belongs to SDL_gpu
	if (color)
		GPU_FreeTarget(target);
}

int GPUController::ownInit() {
	GPU_SetPreInitFlags(GPU_DEFAULT_INIT_FLAGS | GPU_INIT_DISABLE_VSYNC);
	return 0;
}

int GPUController::ownDeinit() {
	screen.reset();
	for (auto &program : programs) {
		if (program.handle)
			GPU_FreeShaderProgram(program.handle);
		program = GPUProgram();
	}
	for (auto &shader : shaders)
		GPU_FreeShader(shader.second);
	shaders.clear();
	if (current_renderer)
		GPU_Quit();
	current_renderer = nullptr;
	return 0;
}

bool GPUController::rendererInitWithInfo(GPURendererInfo &info, uint16_t w, uint16_t h, bool fullscreen) {
	current_renderer = &info;
	sendToLog(LogLevel::Info, "Trying to initialise %s renderer\n", current_renderer->name);

	// The window needs a stencil buffer for the layer clipping
	SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 24);
	SDL_GL_SetAttribute(SDL_GL_STENCIL_SIZE, 8);

	auto renderer_id = (this->*current_renderer->makeRendererId)();
	auto target      = GPU_InitRendererByID(renderer_id, w, h, SDL_WINDOW_OPENGL);

	if (!target) {
		current_renderer = nullptr;
		return false;
	}

	(this->*current_renderer->initRendererFlags)();

	if (fullscreen && !GPU_SetFullscreen(true, true))
		sendToLog(LogLevel::Warn, "Failed to switch to fullscreen mode\n");

	if (!createShadersFromResources()) {
		GPU_Quit();
		current_renderer = nullptr;
		return false;
	}

	max_texture = (this->*current_renderer->getMaxTextureSize)();
	sendToLog(LogLevel::Info, "Maximum texture size is %d\n", max_texture);

	screen = std::make_shared<GPUTarget>(target, nullptr);
	return true;
}

bool GPUController::rendererInit(uint16_t w, uint16_t h, bool fullscreen) {
	for (auto &renderer : renderers) {
		if (rendererInitWithInfo(renderer, w, h, fullscreen))
			return true;
	}

	sendToLog(LogLevel::Error, "Couldn't init OpenGL with %dx%d resolution: %s\n", w, h, SDL_GetError());
	return false;
}

void GPUController::present() {
	GPU_Flip(screen->target);
}

bool GPUController::createShadersFromResources() {
	createShader(DEFAULT_VERTEX_SHADER);
	if (shaders.count(DEFAULT_VERTEX_SHADER) == 0) {
		sendToLog(LogLevel::Error, "Default vertex shader compilation failed\n");
		return false;
	}

	bool ok = true;
	for (size_t i = 0; i < programs.size(); i++)
		ok &= linkProgram(static_cast<ShaderName>(i));
	return ok;
}

void GPUController::createShader(const char *filename) {
	if (shaders.count(filename) > 0)
		return;

	GPU_ShaderEnum shaderType;
	try {
		shaderType = getShaderTypeByExtension(filename);
	} catch (std::invalid_argument &) {
		sendToLog(LogLevel::Error, "Cannot tell the shader type of %s\n", filename);
		return;
	}

	const InternalResource *r = getResource(filename);
	if (!r || r->size == 0) {
		sendToLog(LogLevel::Error, "Shader %s is not embedded\n", filename);
		return;
	}

	sendToLog(LogLevel::Info, "Compiling shader: %s\n", filename);
	uint32_t shader = GPU_CompileShader(shaderType, reinterpret_cast<const char *>(r->buffer));
	if (shader == 0) {
		sendToLog(LogLevel::Error, "Shader compilation failed. Error follows\n");
		sendToLog(LogLevel::Error, "----------------------------------------\n");
		sendToLog(LogLevel::Error, "%s\n", GPU_GetShaderMessage());
		sendToLog(LogLevel::Error, "----------------------------------------\n");
		return;
	}
	shaders[filename] = shader;
}

bool GPUController::linkProgram(ShaderName name) {
	auto &descriptor = shaderDescriptor(name);
	std::string frag = std::string(descriptor.id) + ".frag";
	createShader(frag.c_str());
	if (shaders.count(frag) == 0)
		return false;

	uint32_t prog = GPU_LinkShaders(shaders[frag], shaders[DEFAULT_VERTEX_SHADER]);
	if (prog == 0) {
		sendToLog(LogLevel::Error, "Shader linking failed for %s. Error follows\n", descriptor.id);
		sendToLog(LogLevel::Error, "----------------------------------------\n");
		sendToLog(LogLevel::Error, "%s\n", GPU_GetShaderMessage());
		sendToLog(LogLevel::Error, "----------------------------------------\n");
		return false;
	}

	GPUProgram &p    = programs[static_cast<size_t>(name)];
	p.handle         = prog;
	p.transform      = GPU_GetUniformLocation(prog, "u_transform");
	p.color          = GPU_GetUniformLocation(prog, "u_color");
	p.color2         = GPU_GetUniformLocation(prog, "u_color2");
	p.param          = GPU_GetUniformLocation(prog, "u_param");
	p.distances      = GPU_GetUniformLocation(prog, "u_distances");
	p.colorBias      = GPU_GetUniformLocation(prog, "u_colorBias");
	p.colorTransform = GPU_GetUniformLocation(prog, "u_colorTransform");
	p.fragment       = GPU_GetUniformLocation(prog, "u_fragment");
	p.output         = GPU_GetUniformLocation(prog, "u_output");
	p.texSize0       = GPU_GetUniformLocation(prog, "u_texSize0");
	for (size_t i = 0; i < p.samplers.size(); i++) {
		if (descriptor.textures[i])
			p.samplers[i] = GPU_GetUniformLocation(prog, descriptor.textures[i]);
	}
	for (size_t i = 0; i < p.attributes.size(); i++)
		p.attributes[i] = GPU_GetAttributeLocation(prog, ATTRIBUTE_NAMES[i]);
	return true;
}

GPU_ShaderEnum GPUController::getShaderTypeByExtension(const char *filename) {
	std::string myString(filename);
	size_t pos     = myString.find_last_of('.');
	auto extension = myString.substr(pos + 1);

	if (extension == "frag")
		return GPU_FRAGMENT_SHADER;
	if (extension == "vert")
		return GPU_VERTEX_SHADER;
	throw std::invalid_argument("Not a shader");
}

TextureHandle GPUController::createTexture(int width, int height, TextureFormat format, const uint8_t *data) {
	GPU_Image *image = GPU_CreateImage(width, height, format == TextureFormat::RGBA8 ? GPU_FORMAT_RGBA : GPU_FORMAT_LUMINANCE);
	if (!image) {
		sendToLog(LogLevel::Error, "Failed to create a %dx%d texture\n", width, height);
		return nullptr;
	}
	GPU_SetSnapMode(image, GPU_SNAP_NONE);
	GPU_SetWrapMode(image, GPU_WRAP_NONE, GPU_WRAP_NONE);
	GPU_SetImageFilter(image, GPU_FILTER_LINEAR);

	auto texture = std::make_shared<GPUTexture>(image, format);
	if (data)
		uploadTexture(*texture, data);
	return texture;
}

void GPUController::uploadTexture(GpuTexture &texture, const uint8_t *data) {
	auto &t = dynamic_cast<GPUTexture &>(texture);
	GPU_UpdateImageBytes(t.image, nullptr, data, static_cast<int>(t.width * bytesPerTexel(t.format)));
}

TargetHandle GPUController::createTarget(int width, int height) {
	auto color = std::dynamic_pointer_cast<GPUTexture>(createTexture(width, height, TextureFormat::RGBA8, nullptr));
	if (!color)
		return nullptr;

	GPU_Target *t = GPU_LoadTarget(color->image);
	if (!t) {
		sendToLog(LogLevel::Error, "Failed to create a %dx%d render target\n", width, height);
		return nullptr;
	}

	auto target = std::make_shared<GPUTarget>(t, color);
	if (!(this->*current_renderer->attachDepthStencil)(*target))
		sendToLog(LogLevel::Warn, "Render target %dx%d has no stencil buffer, clipping will be wrong\n", width, height);
	return target;
}

void GPUController::clear(RenderTarget &target, const FloatColor4 &color) {
	(this->*current_renderer->clearTarget)(dynamic_cast<GPUTarget &>(target), color);
}

void GPUController::draw(RenderTarget &target, const RenderRequest &request, const DynamicBuffer &buffer) {
	const GPUProgram &program = programs[static_cast<size_t>(request.args.shader)];
	if (!program.handle) {
		sendToLog(LogLevel::Error, "Shader %s is not available\n", shaderDescriptor(request.args.shader).id);
		return;
	}
	(this->*current_renderer->submitDraw)(dynamic_cast<GPUTarget &>(target), request, buffer, program);
}

std::vector<FloatColor4> GPUController::readPixels(RenderTarget &target) {
	std::vector<FloatColor4> out;
	(this->*current_renderer->readTarget)(dynamic_cast<GPUTarget &>(target), out);
	return out;
}
