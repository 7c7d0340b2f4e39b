/**
 *  GL2.cpp
 *  SNRScripter
 *
 *  Contains driver-specific SDL_gpu/GL instructions.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#if defined(MACOSX) || defined(LINUX) || defined(WIN32)

#if !defined(SDL_GPU_USE_EPOXY)
#define SDL_GPU_USE_EPOXY 1
#endif

#include "Engine/Graphics/GPU.hpp"
#include "Support/FileDefs.hpp"

#include <SDL2/SDL_gpu_OpenGL_2.h>

#include <algorithm>
#include <cstddef>

namespace {

struct AttributeLayout {
	int size;
	GLenum type;
	GLboolean normalised;
	// -1 when the format lacks the attribute
	int offset;
};

// a_position, a_color, a_texcoord, a_texcoord2 of every vertex format
std::array<AttributeLayout, 4> layoutOf(VertexFormat format) {
	const AttributeLayout none{0, GL_FLOAT, GL_FALSE, -1};
	auto floats = [](int size, size_t offset) {
		return AttributeLayout{size, GL_FLOAT, GL_FALSE, static_cast<int>(offset)};
	};
	auto colors = [](size_t offset) {
		return AttributeLayout{4, GL_UNSIGNED_BYTE, GL_TRUE, static_cast<int>(offset)};
	};

	switch (format) {
		case VertexFormat::Pos:
			return {{floats(3, 0), none, none, none}};
		case VertexFormat::PosCol:
			return {{floats(3, 0), colors(offsetof(PosColVertex, color)), none, none}};
		case VertexFormat::PosColTex: {
			auto uv = floats(2, offsetof(PosColTexVertex, texturePosition));
			return {{floats(3, 0), colors(offsetof(PosColTexVertex, color)), uv, uv}};
		}
		case VertexFormat::Text: {
			auto uv = floats(2, 2 * sizeof(float));
			return {{floats(2, 0), none, uv, uv}};
		}
		case VertexFormat::Blend:
			return {{floats(3, 0), colors(offsetof(BlendVertex, color)),
			         floats(2, offsetof(BlendVertex, texturePositions)),
			         floats(2, offsetof(BlendVertex, texturePositions) + 2 * sizeof(float))}};
		case VertexFormat::Window: {
			auto uv = floats(2, offsetof(WindowVertex, texturePosition));
			return {{floats(2, 0), none, uv, uv}};
		}
		case VertexFormat::PosTex: {
			auto uv = floats(2, offsetof(PosTexVertex, texturePosition));
			return {{floats(3, 0), none, uv, uv}};
		}
		case VertexFormat::Mask: {
			auto uv = floats(2, offsetof(MaskVertex, texCoord));
			return {{floats(2, 0), none, uv, uv}};
		}
		case VertexFormat::Movie: {
			auto uv = floats(2, offsetof(MovieVertex, texturePosition));
			return {{floats(3, 0), none, uv, uv}};
		}
	}
	return {{none, none, none, none}};
}

GLenum glCompare(CompareFunction f) {
	switch (f) {
		case CompareFunction::Never: return GL_NEVER;
		case CompareFunction::Less: return GL_LESS;
		case CompareFunction::Equal: return GL_EQUAL;
		case CompareFunction::LessOrEqual: return GL_LEQUAL;
		case CompareFunction::Greater: return GL_GREATER;
		case CompareFunction::NotEqual: return GL_NOTEQUAL;
		case CompareFunction::GreaterOrEqual: return GL_GEQUAL;
		case CompareFunction::Always: return GL_ALWAYS;
	}
	return GL_ALWAYS;
}

GLenum glStencilOperation(StencilOperation op) {
	switch (op) {
		case StencilOperation::Keep: return GL_KEEP;
		case StencilOperation::Zero: return GL_ZERO;
		case StencilOperation::Replace: return GL_REPLACE;
		case StencilOperation::Increment: return GL_INCR;
		case StencilOperation::Decrement: return GL_DECR;
		case StencilOperation::Invert: return GL_INVERT;
		case StencilOperation::IncrementWrap: return GL_INCR_WRAP;
		case StencilOperation::DecrementWrap: return GL_DECR_WRAP;
	}
	return GL_KEEP;
}

GLenum glBlendFactor(BlendFactor f) {
	switch (f) {
		case BlendFactor::Zero: return GL_ZERO;
		case BlendFactor::One: return GL_ONE;
		case BlendFactor::SrcAlpha: return GL_SRC_ALPHA;
		case BlendFactor::OneMinusSrcAlpha: return GL_ONE_MINUS_SRC_ALPHA;
		case BlendFactor::OneMinusDstAlpha: return GL_ONE_MINUS_DST_ALPHA;
	}
	return GL_ONE;
}

GLenum glBlendOperation(BlendOperation op) {
	switch (op) {
		case BlendOperation::Add: return GL_FUNC_ADD;
		case BlendOperation::Subtract: return GL_FUNC_SUBTRACT;
		case BlendOperation::ReverseSubtract: return GL_FUNC_REVERSE_SUBTRACT;
	}
	return GL_FUNC_ADD;
}

GLuint framebufferOf(GPUTarget &target) {
	return static_cast<GPU_TARGET_DATA *>(target.target->data)->handle;
}

void bindTarget(GPUTarget &target) {
	// SDL_gpu batches blits, they have to land before we touch the framebuffer
	GPU_FlushBlitBuffer();
	glBindFramebuffer(GL_FRAMEBUFFER, framebufferOf(target));
	glViewport(0, 0, target.width, target.height);
}

} // namespace

GPU_RendererID GPUController::makeRendererIdGL2() {
	return GPU_MakeRendererID("OpenGL 2", GPU_RENDERER_OPENGL_2, 2, 1);
}

void GPUController::initRendererFlagsGL2() {
	glGenBuffers(1, &vertexBuffer);
	glGenBuffers(1, &indexBuffer);
}

void GPUController::syncRendererStateGL2() {
	glFinish();
}

int GPUController::getMaxTextureSizeGL2() {
	int size;
	glGetIntegerv(GL_MAX_TEXTURE_SIZE, &size);
	return size;
}

bool GPUController::attachDepthStencilGL2(GPUTarget &target) {
	GPU_FlushBlitBuffer();
	GLuint rb = 0;
	glGenRenderbuffers(1, &rb);
	glBindRenderbuffer(GL_RENDERBUFFER, rb);
	glRenderbufferStorage(GL_RENDERBUFFER, GL_DEPTH24_STENCIL8, target.width, target.height);
	glBindFramebuffer(GL_FRAMEBUFFER, framebufferOf(target));
	glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT, GL_RENDERBUFFER, rb);
	glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_STENCIL_ATTACHMENT, GL_RENDERBUFFER, rb);
	bool complete = glCheckFramebufferStatus(GL_FRAMEBUFFER) == GL_FRAMEBUFFER_COMPLETE;
	GPU_ResetRendererState();

	if (!complete) {
		glDeleteRenderbuffers(1, &rb);
		return false;
	}
	target.depthStencil = rb;
	return true;
}

void GPUController::releaseDepthStencilGL2(uint32_t handle) {
	GLuint rb = handle;
	glDeleteRenderbuffers(1, &rb);
}

void GPUController::clearTargetGL2(GPUTarget &target, const FloatColor4 &color) {
	bindTarget(target);
	glColorMask(GL_TRUE, GL_TRUE, GL_TRUE, GL_TRUE);
	glDepthMask(GL_TRUE);
	glStencilMask(0xFF);
	glClearColor(color.r, color.g, color.b, color.a);
	glClearDepth(1.0);
	glClearStencil(0);
	glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT | GL_STENCIL_BUFFER_BIT);
	GPU_ResetRendererState();
}

void GPUController::submitDrawGL2(GPUTarget &target, const RenderRequest &request, const DynamicBuffer &buffer, const GPUProgram &program) {
	const ShaderArgs &args = request.args;
	bindTarget(target);
	glUseProgram(program.handle);

	Mat4 transform = args.transform;
	if (target.offscreen())
		transform = Xform::scale(Vec3(1, -1, 1)) * transform;
	GPU_SetUniformMatrixfv(program.transform, 1, 4, 4, false, transform.data());
	GPU_SetUniformfv(program.color, 4, 1, const_cast<float *>(&args.color.r));
	GPU_SetUniformfv(program.color2, 4, 1, const_cast<float *>(&args.color2.r));
	GPU_SetUniformfv(program.param, 4, 1, const_cast<float *>(args.param.data()));
	GPU_SetUniformfv(program.distances, 2, 4, const_cast<float *>(args.distances.data()));
	GPU_SetUniformfv(program.colorBias, 4, 1, const_cast<float *>(args.colorBias.data()));
	std::array<float, 12> colorTransform;
	for (size_t i = 0; i < args.colorTransform.size(); i++)
		std::copy(args.colorTransform[i].data(), args.colorTransform[i].data() + 4, colorTransform.begin() + i * 4);
	GPU_SetUniformfv(program.colorTransform, 4, 3, colorTransform.data());
	GPU_SetUniformi(program.fragment, static_cast<int>(args.fragment));
	GPU_SetUniformi(program.output, static_cast<int>(args.output));

	for (size_t i = 0; i < args.textures.size(); i++) {
		auto texture = std::dynamic_pointer_cast<GPUTexture>(args.textures[i]);
		if (!texture || program.samplers[i] < 0)
			continue;
		glActiveTexture(GL_TEXTURE0 + static_cast<GLenum>(i));
		glBindTexture(GL_TEXTURE_2D, static_cast<GLuint>(GPU_GetTextureHandle(texture->image)));
		GPU_SetUniformi(program.samplers[i], static_cast<int>(i));
		if (i == 0) {
			float size[2]{static_cast<float>(texture->width), static_cast<float>(texture->height)};
			GPU_SetUniformfv(program.texSize0, 2, 1, size);
		}
	}
	glActiveTexture(GL_TEXTURE0);

	auto &blend = blendState(request.blend);
	glColorMask(blend.writeColor, blend.writeColor, blend.writeColor, blend.writeColor);
	glEnable(GL_BLEND);
	glBlendFuncSeparate(glBlendFactor(blend.color.src), glBlendFactor(blend.color.dst),
	                    glBlendFactor(blend.alpha.src), glBlendFactor(blend.alpha.dst));
	glBlendEquationSeparate(glBlendOperation(blend.color.op), glBlendOperation(blend.alpha.op));

	auto &depth   = request.depthStencil.depth;
	auto &stencil = request.depthStencil.stencil;
	glEnable(GL_DEPTH_TEST);
	glDepthFunc(glCompare(depth.function));
	glDepthMask(depth.writeEnable);
	glEnable(GL_STENCIL_TEST);
	glStencilFunc(glCompare(stencil.function), stencil.reference, stencil.readMask);
	glStencilOp(glStencilOperation(stencil.stencilFail), glStencilOperation(stencil.depthFail), glStencilOperation(stencil.pass));
	glStencilMask(stencil.writeMask);

	if (request.cull == CullFace::None) {
		glDisable(GL_CULL_FACE);
	} else {
		// The vertical flip of offscreen targets reverses the winding
		bool back = (request.cull == CullFace::Back) != target.offscreen();
		glEnable(GL_CULL_FACE);
		glFrontFace(GL_CCW);
		glCullFace(back ? GL_BACK : GL_FRONT);
	}

	glBindBuffer(GL_ARRAY_BUFFER, vertexBuffer);
	glBufferData(GL_ARRAY_BUFFER, request.vertices.size, buffer.data(request.vertices), GL_STREAM_DRAW);

	auto layout   = layoutOf(request.vertexFormat);
	GLsizei stride = static_cast<GLsizei>(vertexStride(request.vertexFormat));
	for (size_t i = 0; i < layout.size(); i++) {
		int location = program.attributes[i];
		if (location < 0)
			continue;
		if (layout[i].offset < 0) {
			glDisableVertexAttribArray(location);
			// Missing colors are white, missing coordinates zero
			if (i == 1)
				glVertexAttrib4f(location, 1, 1, 1, 1);
			else
				glVertexAttrib4f(location, 0, 0, 0, 1);
			continue;
		}
		glEnableVertexAttribArray(location);
		glVertexAttribPointer(location, layout[i].size, layout[i].type, layout[i].normalised, stride,
		                      reinterpret_cast<const void *>(static_cast<uintptr_t>(layout[i].offset)));
	}

	GLenum mode = request.primitive == DrawPrimitive::Triangles ? GL_TRIANGLES : GL_TRIANGLE_STRIP;
	if (request.indexed) {
		glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, indexBuffer);
		glBufferData(GL_ELEMENT_ARRAY_BUFFER, request.indices.size, buffer.data(request.indices), GL_STREAM_DRAW);
		glDrawElements(mode, static_cast<GLsizei>(request.indexCount), GL_UNSIGNED_SHORT, nullptr);
		glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, 0);
	} else {
		glDrawArrays(mode, 0, static_cast<GLsizei>(request.vertexCount));
	}

	for (auto location : program.attributes) {
		if (location >= 0)
			glDisableVertexAttribArray(location);
	}
	glBindBuffer(GL_ARRAY_BUFFER, 0);
	glDisable(GL_STENCIL_TEST);
	glDisable(GL_DEPTH_TEST);
	glDisable(GL_CULL_FACE);
	glColorMask(GL_TRUE, GL_TRUE, GL_TRUE, GL_TRUE);
	glDepthMask(GL_TRUE);
	glStencilMask(0xFF);
	glUseProgram(0);
	GPU_ResetRendererState();
}

void GPUController::readTargetGL2(GPUTarget &target, std::vector<FloatColor4> &out) {
	bindTarget(target);
	std::vector<uint8_t> raw(static_cast<size_t>(target.width) * target.height * 4);
	glPixelStorei(GL_PACK_ALIGNMENT, 1);
	glReadPixels(0, 0, target.width, target.height, GL_RGBA, GL_UNSIGNED_BYTE, raw.data());
	GPU_ResetRendererState();

	out.resize(static_cast<size_t>(target.width) * target.height);
	for (int y = 0; y < target.height; y++) {
		// GL returns the bottom row first, offscreen targets are stored flipped already
		int srcRow = target.offscreen() ? y : target.height - 1 - y;
		for (int x = 0; x < target.width; x++) {
			const uint8_t *p = &raw[(static_cast<size_t>(srcRow) * target.width + x) * 4];
			out[static_cast<size_t>(y) * target.width + x] = fromUnorm(uchar4{p[0], p[1], p[2], p[3]});
		}
	}
}

#endif
