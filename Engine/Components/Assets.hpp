/**
 *  Assets.hpp
 *  SNRScripter
 *
 *  Asset server: reads bytes on the IO pool, decodes them on the compute pool
 *  and deduplicates live results.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Components/Base.hpp"
#include "Engine/Components/Async.hpp"
#include "Engine/Formats/Audio.hpp"
#include "Engine/Formats/Bustup.hpp"
#include "Engine/Formats/Font.hpp"
#include "Engine/Formats/Mask.hpp"
#include "Engine/Formats/Picture.hpp"
#include "Engine/Formats/Scenario.hpp"
#include "Engine/Formats/SysSe.hpp"
#include "Engine/Readers/Base.hpp"
#include "Support/Cache.hpp"

#include <memory>
#include <string>
#include <vector>
#include <cstdint>

// Decoded picture, every block composited at its placements
struct PictureImage {
	PictureInfo info;
	std::vector<uint8_t> rgba;
};

using BustupImage = Bustup<PictureBlock>;

// Raw bytes without any decoding, used for movies
struct BinaryAsset {
	std::vector<uint8_t> data;
};

// Decoder failures are rethrown as AssetError::DecodeFailed
template <typename T>
std::shared_ptr<const T> decodeAsset(const std::string &path, std::vector<uint8_t> &&data);

template <>
std::shared_ptr<const PictureImage> decodeAsset<PictureImage>(const std::string &path, std::vector<uint8_t> &&data);
template <>
std::shared_ptr<const BustupImage> decodeAsset<BustupImage>(const std::string &path, std::vector<uint8_t> &&data);
template <>
std::shared_ptr<const MaskTexture> decodeAsset<MaskTexture>(const std::string &path, std::vector<uint8_t> &&data);
template <>
std::shared_ptr<const Font> decodeAsset<Font>(const std::string &path, std::vector<uint8_t> &&data);
template <>
std::shared_ptr<const AudioFile> decodeAsset<AudioFile>(const std::string &path, std::vector<uint8_t> &&data);
template <>
std::shared_ptr<const SysSe> decodeAsset<SysSe>(const std::string &path, std::vector<uint8_t> &&data);
template <>
std::shared_ptr<const Scenario> decodeAsset<Scenario>(const std::string &path, std::vector<uint8_t> &&data);
template <>
std::shared_ptr<const BinaryAsset> decodeAsset<BinaryAsset>(const std::string &path, std::vector<uint8_t> &&data);

template <typename T>
using AssetFuture = std::shared_ptr<AsyncResult<std::shared_ptr<const T>>>;

class AssetServer : public BaseController {
	std::unique_ptr<BaseReader> reader;

	AssetCache<const PictureImage> pictures;
	AssetCache<const BustupImage> bustups;
	AssetCache<const MaskTexture> masks;
	AssetCache<const Font> fonts;
	AssetCache<const AudioFile> audio;
	AssetCache<const SysSe> sysSe;
	AssetCache<const Scenario> scenarios;
	AssetCache<const BinaryAsset> binaries;

	template <typename T>
	AssetCache<const T> &cache();

protected:
	int ownInit() override;
	int ownDeinit() override;

public:
	AssetServer()
	    : BaseController(this) {}

	void setReader(std::unique_ptr<BaseReader> r) {
		reader = std::move(r);
	}
	bool hasReader() const {
		return reader != nullptr;
	}
	BaseReader &io() {
		if (!reader)
			throw AssetError(AssetError::Kind::NotFound, "<no asset reader>");
		return *reader;
	}

	// Throws AssetError::NotFound
	std::vector<uint8_t> readBytes(const std::string &path);

	// Resolves once the asset is decoded, errors are AssetError
	template <typename T>
	AssetFuture<T> load(const std::string &path);

	// Blocks the calling thread once
	template <typename T>
	std::shared_ptr<const T> loadSync(const std::string &path) {
		return load<T>(path)->wait();
	}
};

extern AssetServer assets;

template <>
inline AssetCache<const PictureImage> &AssetServer::cache<PictureImage>() {
	return pictures;
}
template <>
inline AssetCache<const BustupImage> &AssetServer::cache<BustupImage>() {
	return bustups;
}
template <>
inline AssetCache<const MaskTexture> &AssetServer::cache<MaskTexture>() {
	return masks;
}
template <>
inline AssetCache<const Font> &AssetServer::cache<Font>() {
	return fonts;
}
template <>
inline AssetCache<const AudioFile> &AssetServer::cache<AudioFile>() {
	return audio;
}
template <>
inline AssetCache<const SysSe> &AssetServer::cache<SysSe>() {
	return sysSe;
}
template <>
inline AssetCache<const Scenario> &AssetServer::cache<Scenario>() {
	return scenarios;
}
template <>
inline AssetCache<const BinaryAsset> &AssetServer::cache<BinaryAsset>() {
	return binaries;
}

template <typename T>
AssetFuture<T> AssetServer::load(const std::string &path) {
	auto result = std::make_shared<AsyncResult<std::shared_ptr<const T>>>();
	auto lookup = cache<T>().lookup(path);

	using State = typename AssetCache<const T>::State;
	if (lookup.state == State::Loaded) {
		result->set(std::move(lookup.value));
		return result;
	}

	if (lookup.state == State::Loading) {
		auto loading = lookup.loading;
		async.queue(std::make_unique<FunctionInstruction>(&async, AsyncPool::IO, [this, result, loading, path]() {
			auto value = loading.wait();
			if (value) {
				result->set(std::move(value));
				return;
			}
			// The concurrent load failed, fetch its error ourselves
			try {
				result->set(decodeAsset<T>(path, readBytes(path)));
			} catch (std::exception &) {
				result->fail(std::current_exception());
			}
		}));
		return result;
	}

	// std::function wants copyable callables
	auto token = std::make_shared<typename AssetCache<const T>::LoaderToken>(std::move(lookup.token));
	async.queue(std::make_unique<FunctionInstruction>(&async, AsyncPool::IO, [this, result, token, path]() {
		auto bytes = std::make_shared<std::vector<uint8_t>>();
		try {
			*bytes = readBytes(path);
		} catch (std::exception &) {
			token->cancel();
			result->fail(std::current_exception());
			return;
		}
		async.queue(std::make_unique<FunctionInstruction>(&async, AsyncPool::Compute, [result, token, bytes, path]() {
			try {
				auto value = decodeAsset<T>(path, std::move(*bytes));
				token->finish(value);
				result->set(std::move(value));
			} catch (std::exception &) {
				token->cancel();
				result->fail(std::current_exception());
			}
		}));
	}));
	return result;
}
