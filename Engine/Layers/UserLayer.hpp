/**
 *  UserLayer.hpp
 *  SNRScripter
 *
 *  Layers created by LAYERLOAD: tiles, pictures, bustups and movies.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Components/Assets.hpp"
#include "Engine/Core/VmState.hpp"
#include "Engine/Layers/Layer.hpp"
#include "Engine/Media/Movie.hpp"

#include <array>
#include <memory>
#include <new>
#include <string>
#include <utility>
#include <vector>
#include <cstdint>

struct NullLayerContent {
	LayerDraw pass(const DrawableParams &) const {
		return LayerDraw::Nothing;
	}
	void prepare(PreRenderContext &) {}
	void draw(RenderPass &, const TransformParams &, const DrawableParams &, uint8_t) const {}
	void update(const UpdateContext &) {}
	std::string describe() const {
		return "null";
	}
};

struct TileLayerContent {
	FloatColor4 color;
	// x, y, width, height around the canvas centre
	Vec4 rect{Vec4::Zero()};

	LayerDraw pass(const DrawableParams &params) const;
	void prepare(PreRenderContext &) {}
	void draw(RenderPass &pass, const TransformParams &transform, const DrawableParams &params, uint8_t stencilRef) const;
	void update(const UpdateContext &) {}
	std::string describe() const;
};

struct PictureLayerContent {
	std::shared_ptr<const PictureImage> picture;
	std::string name;
	// Every texel has full alpha
	bool opaque{false};
	// Shared between render clones
	TextureHandle texture;

	LayerDraw pass(const DrawableParams &params) const;
	void prepare(PreRenderContext &ctx);
	void draw(RenderPass &pass, const TransformParams &transform, const DrawableParams &params, uint8_t stencilRef) const;
	void update(const UpdateContext &) {}
	std::string describe() const;
};

struct BustupLayerContent {
	std::shared_ptr<const BustupImage> bustup;
	std::string name;
	std::string emotion;
	size_t mouth{0};
	size_t uploadedMouth{SIZE_MAX};
	TextureHandle texture;

	LayerDraw pass(const DrawableParams &params) const;
	void prepare(PreRenderContext &ctx);
	void draw(RenderPass &pass, const TransformParams &transform, const DrawableParams &params, uint8_t stencilRef) const;
	void update(const UpdateContext &) {}
	std::string describe() const;
};

struct MovieLayerContent {
	// Render clones keep watching the same playback
	std::shared_ptr<VideoPlayer> player;
	std::string name;
	// Luma keyed alpha
	bool transparent{false};
	float volume{1};
	uint64_t uploadedSerial{0};
	TextureHandle luma;
	TextureHandle chroma;
	std::vector<uint8_t> chromaTexels;

	LayerDraw pass(const DrawableParams &params) const;
	void prepare(PreRenderContext &ctx);
	void draw(RenderPass &pass, const TransformParams &transform, const DrawableParams &params, uint8_t stencilRef) const;
	void update(const UpdateContext &ctx);
	std::string describe() const;
};

// Leaf of the scene graph, one of the content kinds above
class UserLayer : public Layer {
public:
	enum class Kind {
		Null,
		Tile,
		Picture,
		Bustup,
		Movie
	};

private:
	Kind kind_{Kind::Null};
	union Content {
		NullLayerContent null;
		TileLayerContent tile;
		PictureLayerContent picture;
		BustupLayerContent bustup;
		MovieLayerContent movie;

		Content() {}
		~Content() {}
	} content;

	template <typename T>
	void construct(T &slot, T &&value) {
		new (&slot) T(std::move(value));
	}
	void copyContent(const UserLayer &o);
	void destroyContent();

	template <typename F>
	void visit(F &&f) {
		switch (kind_) {
			case Kind::Null:
				f(content.null);
				break;
			case Kind::Tile:
				f(content.tile);
				break;
			case Kind::Picture:
				f(content.picture);
				break;
			case Kind::Bustup:
				f(content.bustup);
				break;
			case Kind::Movie:
				f(content.movie);
				break;
		}
	}
	template <typename F>
	void visit(F &&f) const {
		switch (kind_) {
			case Kind::Null:
				f(content.null);
				break;
			case Kind::Tile:
				f(content.tile);
				break;
			case Kind::Picture:
				f(content.picture);
				break;
			case Kind::Bustup:
				f(content.bustup);
				break;
			case Kind::Movie:
				f(content.movie);
				break;
		}
	}

protected:
	void preRenderContent(PreRenderContext &ctx, const TransformParams &transform, const DrawableParams &params) override;
	void renderContent(RenderPass &pass, const TransformParams &transform, const DrawableParams &params, uint8_t stencilRef) const override;

public:
	UserLayer();
	explicit UserLayer(TileLayerContent &&c);
	explicit UserLayer(PictureLayerContent &&c);
	explicit UserLayer(BustupLayerContent &&c);
	explicit UserLayer(MovieLayerContent &&c);
	// A render clone: properties and playback positions are copied, textures and players shared
	UserLayer(const UserLayer &o);
	UserLayer &operator=(const UserLayer &o);
	~UserLayer() override;

	Kind kind() const {
		return kind_;
	}
	std::string describe() const;

	void update(const UpdateContext &ctx) override;

	// Picks a mouth frame of a bustup from a voice level in [0, 1]
	void setLipSync(float level);
	// Movies report the end of playback, everything else is always finished
	bool finished() const;
	VideoPlayer *moviePlayer() {
		return kind_ == Kind::Movie ? content.movie.player.get() : nullptr;
	}
};

const char *userLayerKindName(UserLayer::Kind kind);

// Asset loads for a LAYERLOAD in flight, polled by the command every tick
class UserLayerLoad {
	LayerType type;
	std::array<int32_t, 8> params;
	std::string path;
	std::string name;
	std::string emotion;
	bool movieTransparent{false};

	AssetFuture<PictureImage> picture;
	AssetFuture<BustupImage> bustup;
	AssetFuture<BinaryAsset> movie;

	UserLayer build();

public:
	UserLayerLoad(const ScenarioInfo &info, LayerType type, const std::array<int32_t, 8> &params);

	bool ready() const;
	// Waits for the assets, a missing or broken asset is logged and gives a null layer
	UserLayer finish();
};
