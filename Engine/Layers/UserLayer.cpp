/**
 *  UserLayer.cpp
 *  SNRScripter
 *
 *  Layers created by LAYERLOAD: tiles, pictures, bustups and movies.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Layers/UserLayer.hpp"
#include "Support/Errors.hpp"
#include "Support/FileDefs.hpp"

#include <algorithm>
#include <cstdio>

namespace {

LayerDraw textureLayerPass(bool opaque, const DrawableParams &params) {
	if (params.colorMultiplier.a <= 0)
		return LayerDraw::Nothing;
	if (opaque && params.blendType == LayerBlendType::Type1 && params.colorMultiplier.a >= 1)
		return LayerDraw::OpaquePass;
	return LayerDraw::TransparentPass;
}

// Straight alpha texture at (x, y) in canvas units around the centre
void drawTextureLayer(RenderPass &pass, const TransformParams &transform, const DrawableParams &params, uint8_t stencilRef,
                      const TextureHandle &texture, float x, float y) {
	float w = static_cast<float>(texture->width), h = static_cast<float>(texture->height);
	std::array<Vec2, 4> corners{{Vec2(x, y), Vec2(x + w, y), Vec2(x, y + h), Vec2(x + w, y + h)}};
	std::array<Vec2, 4> uv{{Vec2(0, 0), Vec2(1, 0), Vec2(0, 1), Vec2(1, 1)}};

	ShaderArgs args;
	args.shader      = ShaderName::Layer;
	args.transform   = transform.finalTransform();
	args.textures[0] = texture;
	args.color       = params.colorMultiplier;
	args.fragment    = simplifyFragmentShader(params.fragmentShader, params.shaderParam);
	args.param       = params.shaderParam;
	args.output      = LayerShaderOutputKind::LayerPremultiply;

	ColorBlendType blend = pass.kind == PassKind::Opaque ? ColorBlendType::Opaque : colorBlendFromLayer(params.blendType, true);
	pass.run(RenderRequestBuilder()
	             .shader(args)
	             .depthStencilShorthand(stencilRef, false, false)
	             .colorBlend(blend)
	             .primitive(DrawPrimitive::TriangleStrip)
	             .vertices(VertexFormat::PosTex, pushPosTexQuad(pass.dynamicBuffer(), corners, uv), 4)
	             .build());
}

bool fullyOpaque(const std::vector<uint8_t> &rgba) {
	for (size_t i = 3; i < rgba.size(); i += 4)
		if (rgba[i] != 0xFF)
			return false;
	return !rgba.empty();
}

} // namespace

/* ---------------- Tile ----------------- */

LayerDraw TileLayerContent::pass(const DrawableParams &params) const {
	FloatColor4 tinted = params.colorMultiplier * color;
	if (tinted.a <= 0)
		return LayerDraw::Nothing;
	if (params.blendType == LayerBlendType::Type1 && tinted.a >= 1)
		return LayerDraw::OpaquePass;
	return LayerDraw::TransparentPass;
}

void TileLayerContent::draw(RenderPass &pass, const TransformParams &transform, const DrawableParams &params, uint8_t stencilRef) const {
	FloatColor4 tinted = (params.colorMultiplier * color).premultiply();

	ShaderArgs args;
	args.shader    = ShaderName::Fill;
	args.transform = transform.finalTransform();

	ColorBlendType blend = pass.kind == PassKind::Opaque ? ColorBlendType::Opaque : colorBlendFromLayer(params.blendType, true);
	pass.run(RenderRequestBuilder()
	             .shader(args)
	             .depthStencilShorthand(stencilRef, false, false)
	             .colorBlend(blend)
	             .primitive(DrawPrimitive::TriangleStrip)
	             .vertices(VertexFormat::PosCol, pushQuad(pass.dynamicBuffer(), rect, tinted), 4)
	             .build());
}

std::string TileLayerContent::describe() const {
	char buf[160];
	std::snprintf(buf, sizeof(buf), "tile (%.2f %.2f %.2f %.2f) at %.0f,%.0f %.0fx%.0f",
	              color.r, color.g, color.b, color.a, rect.x(), rect.y(), rect.z(), rect.w());
	return buf;
}

/* ---------------- Picture ----------------- */

LayerDraw PictureLayerContent::pass(const DrawableParams &params) const {
	return textureLayerPass(opaque, params);
}

void PictureLayerContent::prepare(PreRenderContext &ctx) {
	if (texture)
		return;
	auto &info = picture->info;
	texture    = ctx.backend.createTexture(info.effectiveWidth, info.effectiveHeight, TextureFormat::RGBA8, picture->rgba.data());
}

void PictureLayerContent::draw(RenderPass &pass, const TransformParams &transform, const DrawableParams &params, uint8_t stencilRef) const {
	if (!texture)
		return;
	drawTextureLayer(pass, transform, params, stencilRef, texture,
	                 static_cast<float>(-picture->info.originX), static_cast<float>(-picture->info.originY));
}

std::string PictureLayerContent::describe() const {
	return "picture " + name;
}

/* ---------------- Bustup ----------------- */

LayerDraw BustupLayerContent::pass(const DrawableParams &params) const {
	// Expressions are drawn over the base, the outline always has soft edges
	return textureLayerPass(false, params);
}

void BustupLayerContent::prepare(PreRenderContext &ctx) {
	if (texture && uploadedMouth == mouth)
		return;
	auto canvas = composeBustupExpression(*bustup, emotion, mouth);
	auto &info  = bustup->info;
	if (texture && texture->width == static_cast<int>(info.effectiveWidth) && texture->height == static_cast<int>(info.effectiveHeight))
		ctx.backend.uploadTexture(*texture, canvas.data());
	else
		texture = ctx.backend.createTexture(info.effectiveWidth, info.effectiveHeight, TextureFormat::RGBA8, canvas.data());
	uploadedMouth = mouth;
}

void BustupLayerContent::draw(RenderPass &pass, const TransformParams &transform, const DrawableParams &params, uint8_t stencilRef) const {
	if (!texture)
		return;
	drawTextureLayer(pass, transform, params, stencilRef, texture,
	                 static_cast<float>(-bustup->info.originX), static_cast<float>(-bustup->info.originY));
}

std::string BustupLayerContent::describe() const {
	return "bustup " + name + " (" + emotion + ")";
}

/* ---------------- Movie ----------------- */

LayerDraw MovieLayerContent::pass(const DrawableParams &params) const {
	if (params.colorMultiplier.a <= 0 || !player->frame())
		return LayerDraw::Nothing;
	if (transparent || params.blendType != LayerBlendType::Type1 || params.colorMultiplier.a < 1)
		return LayerDraw::TransparentPass;
	return LayerDraw::OpaquePass;
}

void MovieLayerContent::update(const UpdateContext &ctx) {
	player->update(ctx.delta);
}

void MovieLayerContent::prepare(PreRenderContext &ctx) {
	const MovieFrame *frame = player->frame();
	if (!frame || uploadedSerial == player->frameSerial())
		return;

	auto &image = frame->image;
	int cw = (image.width + 1) / 2, ch = (image.height + 1) / 2;

	// Chroma pairs go to the red and green channels
	chromaTexels.resize(static_cast<size_t>(cw) * ch * 4);
	for (size_t i = 0, n = static_cast<size_t>(cw) * ch; i < n; i++) {
		chromaTexels[i * 4]     = image.uv[i * 2];
		chromaTexels[i * 4 + 1] = image.uv[i * 2 + 1];
		chromaTexels[i * 4 + 2] = 0;
		chromaTexels[i * 4 + 3] = 0xFF;
	}

	if (luma && luma->width == image.width && luma->height == image.height) {
		ctx.backend.uploadTexture(*luma, image.y.data());
		ctx.backend.uploadTexture(*chroma, chromaTexels.data());
	} else {
		luma   = ctx.backend.createTexture(image.width, image.height, TextureFormat::R8, image.y.data());
		chroma = ctx.backend.createTexture(cw, ch, TextureFormat::RGBA8, chromaTexels.data());
	}
	uploadedSerial = player->frameSerial();
}

void MovieLayerContent::draw(RenderPass &pass, const TransformParams &transform, const DrawableParams &params, uint8_t stencilRef) const {
	if (!luma)
		return;

	const float left = -VIRTUAL_CANVAS_WIDTH / 2.0f, top = -VIRTUAL_CANVAS_HEIGHT / 2.0f;
	const float right = left + VIRTUAL_CANVAS_WIDTH, bottom = top + VIRTUAL_CANVAS_HEIGHT;
	MovieVertex vertices[4]{
	    {{left, top, 0}, {0, 0}},
	    {{right, top, 0}, {1, 0}},
	    {{left, bottom, 0}, {0, 1}},
	    {{right, bottom, 0}, {1, 1}}};

	ShaderArgs args;
	args.shader         = transparent ? ShaderName::MovieAlpha : ShaderName::Movie;
	args.transform      = transform.finalTransform();
	args.textures[0]    = luma;
	args.textures[1]    = chroma;
	args.color          = params.colorMultiplier;
	args.colorTransform = movieColorTransform();

	ColorBlendType blend = pass.kind == PassKind::Opaque ? ColorBlendType::Opaque : colorBlendFromLayer(params.blendType, false);
	pass.run(RenderRequestBuilder()
	             .shader(args)
	             .depthStencilShorthand(stencilRef, false, false)
	             .colorBlend(blend)
	             .primitive(DrawPrimitive::TriangleStrip)
	             .vertices(VertexFormat::Movie, pass.dynamicBuffer().allocate(vertices, sizeof(vertices)), 4)
	             .build());
}

std::string MovieLayerContent::describe() const {
	return "movie " + name;
}

/* ---------------- UserLayer ----------------- */

UserLayer::UserLayer() {
	construct(content.null, NullLayerContent());
}

UserLayer::UserLayer(TileLayerContent &&c)
    : kind_(Kind::Tile) {
	construct(content.tile, std::move(c));
}

UserLayer::UserLayer(PictureLayerContent &&c)
    : kind_(Kind::Picture) {
	construct(content.picture, std::move(c));
}

UserLayer::UserLayer(BustupLayerContent &&c)
    : kind_(Kind::Bustup) {
	construct(content.bustup, std::move(c));
}

UserLayer::UserLayer(MovieLayerContent &&c)
    : kind_(Kind::Movie) {
	construct(content.movie, std::move(c));
}

UserLayer::UserLayer(const UserLayer &o)
    : Layer(o) {
	copyContent(o);
}

UserLayer &UserLayer::operator=(const UserLayer &o) {
	if (this == &o)
		return *this;
	Layer::operator=(o);
	destroyContent();
	copyContent(o);
	return *this;
}

UserLayer::~UserLayer() {
	destroyContent();
}

void UserLayer::copyContent(const UserLayer &o) {
	kind_ = o.kind_;
	switch (kind_) {
		case Kind::Null:
			new (&content.null) NullLayerContent(o.content.null);
			break;
		case Kind::Tile:
			new (&content.tile) TileLayerContent(o.content.tile);
			break;
		case Kind::Picture:
			new (&content.picture) PictureLayerContent(o.content.picture);
			break;
		case Kind::Bustup:
			new (&content.bustup) BustupLayerContent(o.content.bustup);
			break;
		case Kind::Movie:
			new (&content.movie) MovieLayerContent(o.content.movie);
			break;
	}
}

void UserLayer::destroyContent() {
	switch (kind_) {
		case Kind::Null:
			content.null.~NullLayerContent();
			break;
		case Kind::Tile:
			content.tile.~TileLayerContent();
			break;
		case Kind::Picture:
			content.picture.~PictureLayerContent();
			break;
		case Kind::Bustup:
			content.bustup.~BustupLayerContent();
			break;
		case Kind::Movie:
			content.movie.~MovieLayerContent();
			break;
	}
}

std::string UserLayer::describe() const {
	std::string out;
	visit([&out](const auto &c) { out = c.describe(); });
	return out;
}

void UserLayer::update(const UpdateContext &ctx) {
	Layer::update(ctx);
	visit([&ctx](auto &c) { c.update(ctx); });
}

void UserLayer::preRenderContent(PreRenderContext &ctx, const TransformParams &, const DrawableParams &params) {
	LayerDraw draw = LayerDraw::Nothing;
	visit([&](auto &c) {
		c.prepare(ctx);
		draw = c.pass(params);
	});
	if (ctx.stats && draw == LayerDraw::OpaquePass)
		ctx.stats->preRenderOpaqueNodes++;
}

void UserLayer::renderContent(RenderPass &pass, const TransformParams &transform, const DrawableParams &params, uint8_t stencilRef) const {
	visit([&](const auto &c) {
		if (drawsIn(c.pass(params), pass.kind))
			c.draw(pass, transform, params, stencilRef);
	});
}

void UserLayer::setLipSync(float level) {
	if (kind_ != Kind::Bustup)
		return;
	auto &bustup = content.bustup;
	auto expr    = bustup.bustup->expression(bustup.emotion);
	if (!expr || expr->mouths.empty())
		return;
	size_t frames = expr->mouths.size();
	bustup.mouth  = std::min(frames - 1, static_cast<size_t>(cmp::clamp(level, 0.0f, 1.0f) * frames));
}

bool UserLayer::finished() const {
	return kind_ != Kind::Movie || content.movie.player->finished();
}

const char *userLayerKindName(UserLayer::Kind kind) {
	switch (kind) {
		case UserLayer::Kind::Null:
			return "null";
		case UserLayer::Kind::Tile:
			return "tile";
		case UserLayer::Kind::Picture:
			return "picture";
		case UserLayer::Kind::Bustup:
			return "bustup";
		case UserLayer::Kind::Movie:
			return "movie";
	}
	return "unknown";
}

/* ---------------- UserLayerLoad ----------------- */

UserLayerLoad::UserLayerLoad(const ScenarioInfo &info, LayerType t, const std::array<int32_t, 8> &p)
    : type(t), params(p) {
	switch (type) {
		case LayerType::Picture:
			path = info.picturePath(params[0]);
			if (params[0] >= 0 && static_cast<size_t>(params[0]) < info.pictures.size())
				name = info.pictures[params[0]].name;
			picture = assets.load<PictureImage>(path);
			break;
		case LayerType::Bustup:
			path = info.bustupPath(params[0]);
			if (params[0] >= 0 && static_cast<size_t>(params[0]) < info.bustups.size()) {
				name    = info.bustups[params[0]].name;
				emotion = info.bustups[params[0]].emotion;
			}
			bustup = assets.load<BustupImage>(path);
			break;
		case LayerType::Movie:
			path = info.moviePath(params[0]);
			if (params[0] >= 0 && static_cast<size_t>(params[0]) < info.movies.size()) {
				name             = info.movies[params[0]].name;
				movieTransparent = info.movies[params[0]].flags & 1;
			}
			movie = assets.load<BinaryAsset>(path);
			break;
		default:
			break;
	}
}

bool UserLayerLoad::ready() const {
	return (!picture || picture->ready()) && (!bustup || bustup->ready()) && (!movie || movie->ready());
}

UserLayer UserLayerLoad::build() {
	switch (type) {
		case LayerType::Null:
			return UserLayer();
		case LayerType::Tile: {
			TileLayerContent tile;
			tile.color = FloatColor4::from4bpp(params[0]);
			tile.rect  = Vec4(static_cast<float>(params[1]), static_cast<float>(params[2]),
                             static_cast<float>(params[3]), static_cast<float>(params[4]));
			return UserLayer(std::move(tile));
		}
		case LayerType::Picture: {
			PictureLayerContent c;
			c.picture = picture->wait();
			c.name    = name;
			c.opaque  = fullyOpaque(c.picture->rgba);
			return UserLayer(std::move(c));
		}
		case LayerType::Bustup: {
			BustupLayerContent c;
			c.bustup  = bustup->wait();
			c.name    = name;
			c.emotion = emotion;
			if (!c.bustup->expression(emotion))
				sendToLog(LogLevel::Warn, "Bustup %s has no expression %s, showing the base\n", name.c_str(), emotion.c_str());
			return UserLayer(std::move(c));
		}
		case LayerType::Movie: {
			auto asset = movie->wait();
			// Aliases the asset so the decoder keeps it alive
			std::shared_ptr<const std::vector<uint8_t>> bytes(asset, &asset->data);
			MovieLayerContent c;
			c.player      = std::make_shared<VideoPlayer>(std::make_unique<VideoDecoder>(bytes, path));
			c.name        = name;
			c.transparent = movieTransparent;
			c.volume      = volumeFromNumber(params[1]);
			return UserLayer(std::move(c));
		}
		case LayerType::Rain:
			sendToLog(LogLevel::Warn, "Rain layers are not supported, loading a null layer\n");
			return UserLayer();
		default:
			sendToLog(LogLevel::Warn, "Layer type %s is not supported, loading a null layer\n", layerTypeName(type));
			return UserLayer();
	}
}

UserLayer UserLayerLoad::finish() {
	try {
		return build();
	} catch (const AssetError &e) {
		sendToLog(LogLevel::Error, "Failed to load a %s layer: %s\n", layerTypeName(type), e.what());
		return UserLayer();
	}
}
