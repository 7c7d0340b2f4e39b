/**
 *  Assets.cpp
 *  SNRScripter
 *
 *  Asset server: reads bytes on the IO pool, decodes them on the compute pool
 *  and deduplicates live results.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Components/Assets.hpp"
#include "Support/Errors.hpp"
#include "Support/FileDefs.hpp"

AssetServer assets;

int AssetServer::ownInit() {
	if (!reader) {
		sendToLog(LogLevel::Error, "[Error] AssetServer has no reader to load from\n");
		return -1;
	}
	sendToLog(LogLevel::Info, "[Info] Loading assets from %s (%zu files)\n", reader->getArchiveName(), reader->getNumFiles());
	return 0;
}

int AssetServer::ownDeinit() {
	if (reader) {
		reader->close();
		reader = nullptr;
	}
	return 0;
}

std::vector<uint8_t> AssetServer::readBytes(const std::string &path) {
	std::vector<uint8_t> buffer;
	if (!io().getFile(path.c_str(), buffer))
		throw AssetError(AssetError::Kind::NotFound, path);
	return buffer;
}

namespace {
template <typename F>
auto wrapDecode(const std::string &path, F &&decode) -> decltype(decode()) {
	try {
		return decode();
	} catch (ParseError &e) {
		throw AssetError(AssetError::Kind::DecodeFailed, path, e.what());
	} catch (std::out_of_range &e) {
		throw AssetError(AssetError::Kind::DecodeFailed, path, e.what());
	}
}
} // namespace

template <>
std::shared_ptr<const PictureImage> decodeAsset<PictureImage>(const std::string &path, std::vector<uint8_t> &&data) {
	return wrapDecode(path, [&data]() {
		MergedPictureBuilder builder;
		readPicture(data.data(), data.size(), builder);
		auto image  = std::make_shared<PictureImage>();
		image->info = builder.info;
		image->rgba = std::move(builder.rgba);
		return std::shared_ptr<const PictureImage>(std::move(image));
	});
}

template <>
std::shared_ptr<const BustupImage> decodeAsset<BustupImage>(const std::string &path, std::vector<uint8_t> &&data) {
	return wrapDecode(path, [&data]() {
		return std::shared_ptr<const BustupImage>(std::make_shared<BustupImage>(readBustupImage(data.data(), data.size())));
	});
}

template <>
std::shared_ptr<const MaskTexture> decodeAsset<MaskTexture>(const std::string &path, std::vector<uint8_t> &&data) {
	return wrapDecode(path, [&data]() {
		return std::shared_ptr<const MaskTexture>(std::make_shared<MaskTexture>(readMask(data.data(), data.size())));
	});
}

template <>
std::shared_ptr<const Font> decodeAsset<Font>(const std::string &path, std::vector<uint8_t> &&data) {
	return wrapDecode(path, [&data]() {
		return std::shared_ptr<const Font>(std::make_shared<Font>(readFont(data.data(), data.size())));
	});
}

template <>
std::shared_ptr<const AudioFile> decodeAsset<AudioFile>(const std::string &path, std::vector<uint8_t> &&data) {
	return wrapDecode(path, [&data]() {
		return readAudio(data.data(), data.size());
	});
}

template <>
std::shared_ptr<const SysSe> decodeAsset<SysSe>(const std::string &path, std::vector<uint8_t> &&data) {
	return wrapDecode(path, [&data]() {
		return std::shared_ptr<const SysSe>(std::make_shared<SysSe>(readSysSe(data.data(), data.size())));
	});
}

template <>
std::shared_ptr<const Scenario> decodeAsset<Scenario>(const std::string &path, std::vector<uint8_t> &&data) {
	return wrapDecode(path, [&data]() {
		return std::shared_ptr<const Scenario>(std::make_shared<Scenario>(std::move(data)));
	});
}

template <>
std::shared_ptr<const BinaryAsset> decodeAsset<BinaryAsset>(const std::string &, std::vector<uint8_t> &&data) {
	auto binary  = std::make_shared<BinaryAsset>();
	binary->data = std::move(data);
	return binary;
}
