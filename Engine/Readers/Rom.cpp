/**
 *  Rom.cpp
 *  SNRScripter
 *
 *  ROM2 archive reader.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Readers/Rom.hpp"
#include "Support/Errors.hpp"
#include "Support/FileIO.hpp"

#include <algorithm>
#include <string>

namespace {
const uint32_t ROM_MAGIC             = 0x324D4F52; // "ROM2"
const size_t ROM_HEADER_SIZE         = 32;
const uint64_t DIRECTORY_MULTIPLIER  = 16;
const size_t MAX_DIRECTORY_DEPTH     = 64;
const uint32_t DIRECTORY_FLAG        = 0x80000000;
} // namespace

RomReader::~RomReader() {
	close();
}

uint32_t RomReader::readU32(uint64_t offset) const {
	uint8_t buf[4];
	if (offset + sizeof(buf) > archiveSize || !FileIO::readRange(fp, offset, sizeof(buf), buf))
		throw ParseError(ParseError::Kind::TruncatedStream, "rom index read at " + std::to_string(offset));
	return loadLE32(buf);
}

std::string RomReader::readName(uint64_t offset) const {
	std::string name;
	char buf[64];
	while (offset < archiveSize) {
		size_t chunk = static_cast<size_t>(std::min<uint64_t>(sizeof(buf), archiveSize - offset));
		if (!FileIO::readRange(fp, offset, chunk, reinterpret_cast<uint8_t *>(buf)))
			break;
		for (size_t i = 0; i < chunk; i++) {
			if (buf[i] == '\0')
				return name;
			name += buf[i];
		}
		offset += chunk;
	}
	throw ParseError(ParseError::Kind::TruncatedStream, "unterminated rom entry name");
}

void RomReader::readDirectory(size_t node, uint64_t dirOffset, size_t depth) {
	if (depth > MAX_DIRECTORY_DEPTH)
		throw ParseError(ParseError::Kind::BadLength, "rom directory tree is too deep");

	uint32_t count = readU32(dirOffset);
	for (uint32_t i = 0; i < count; i++) {
		uint64_t entry      = dirOffset + 4 + i * 12ULL;
		uint32_t nameOffset = readU32(entry);
		uint32_t dataOffset = readU32(entry + 4);
		uint32_t dataSize   = readU32(entry + 8);

		Node child;
		child.name      = readName(dirOffset + (nameOffset & ~DIRECTORY_FLAG));
		child.directory = (nameOffset & DIRECTORY_FLAG) != 0;
		if (child.name == "." || child.name == "..")
			continue;

		if (child.directory) {
			child.offset = indexOffset + dataOffset * DIRECTORY_MULTIPLIER;
		} else {
			child.offset = dataOffset * dataMultiplier;
			child.size   = dataSize;
			if (child.offset + child.size > archiveSize)
				throw ParseError(ParseError::Kind::TruncatedStream, "rom file " + child.name + " is outside of the archive");
			fileCount++;
		}

		size_t id = nodes.size();
		nodes[node].children[child.name] = id;
		nodes.push_back(std::move(child));
		if (nodes[id].directory)
			readDirectory(id, nodes[id].offset, depth + 1);
	}
}

int RomReader::open(const char *name) {
	if (name)
		archivePath = name;
	close();

	fp = FileIO::openFile(archivePath, "rb");
	if (!fp) {
		sendToLog(LogLevel::Error, "Couldn't open archive %s\n", archivePath.c_str());
		return -1;
	}

	size_t len = 0;
	FileIO::accessFile(archivePath, FileType::File, &len);
	archiveSize = len;

	try {
		if (readU32(0) != ROM_MAGIC)
			throw ParseError(ParseError::Kind::InvalidMagic, "not a ROM2 archive");
		uint32_t version = readU32(4);
		if (version != VERSION)
			throw ParseError(ParseError::Kind::Unsupported, "rom version " + std::to_string(version));
		dataMultiplier = readU32(12);
		indexOffset    = ROM_HEADER_SIZE;

		nodes.emplace_back();
		nodes[0].directory = true;
		nodes[0].offset    = indexOffset;
		readDirectory(0, indexOffset, 0);
	} catch (const ParseError &e) {
		sendToLog(LogLevel::Error, "Archive %s is broken: %s\n", archivePath.c_str(), e.what());
		close();
		return -1;
	}

	return 0;
}

int RomReader::close() {
	if (fp) {
		std::fclose(fp);
		fp = nullptr;
	}
	nodes.clear();
	fileCount = 0;
	return 0;
}

const RomReader::Node *RomReader::findFile(const std::string &path) const {
	if (nodes.empty() || path.empty() || path[0] != '/')
		return nullptr;

	size_t current = 0;
	size_t start   = 1;
	while (true) {
		size_t end       = path.find('/', start);
		std::string part = path.substr(start, end == std::string::npos ? std::string::npos : end - start);

		auto it = nodes[current].children.find(part);
		if (it == nodes[current].children.end())
			return nullptr;
		current = it->second;

		if (end == std::string::npos)
			return nodes[current].directory ? nullptr : &nodes[current];
		if (!nodes[current].directory)
			return nullptr;
		start = end + 1;
	}
}

bool RomReader::readFile(const Node &file, uint64_t position, size_t len, uint8_t *dst) const {
	if (position > file.size || len > file.size - position)
		return false;
	return FileIO::readRange(fp, file.offset + position, len, dst);
}

bool RomReader::getFile(const char *file_name, std::vector<uint8_t> &buffer) {
	auto file = findFile(file_name);
	if (!file)
		return false;

	buffer.resize(file->size);
	if (!readFile(*file, 0, file->size, buffer.data())) {
		sendToLog(LogLevel::Error, "Failed to read %s from %s\n", file_name, archivePath.c_str());
		return false;
	}
	return true;
}

bool RomReader::hasFile(const char *file_name) {
	return findFile(file_name) != nullptr;
}

void RomReader::traverse(size_t node, const std::string &prefix, std::vector<FileInfo> &out) const {
	for (auto &child : nodes[node].children) {
		const Node &entry = nodes[child.second];
		FileInfo info;
		info.name      = prefix + "/" + entry.name;
		info.directory = entry.directory;
		info.offset    = entry.directory ? 0 : entry.offset;
		info.length    = entry.size;
		out.push_back(info);
		if (entry.directory)
			traverse(child.second, info.name, out);
	}
}

void RomReader::listFiles(std::vector<FileInfo> &out) {
	if (!nodes.empty())
		traverse(0, "", out);
}
