/**
 *  Rom.hpp
 *  SNRScripter
 *
 *  ROM2 archive reader.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Readers/Base.hpp"

#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include <cstdio>

// The whole directory tree is read into memory on open, file bodies are read with
// positional reads so several threads may fetch files at once.
class RomReader : public BaseReader {
public:
	static const uint32_t VERSION = 0x10001;

	struct Node {
		std::string name;
		bool directory{false};
		uint64_t offset{0};
		uint32_t size{0};
		// Sorted by name
		std::map<std::string, size_t> children;
	};

	explicit RomReader(std::string path = {})
	    : archivePath(std::move(path)) {}
	~RomReader() override;

	int open(const char *name = nullptr) override;
	int close() override;

	const char *getArchiveName() const override {
		return archivePath.c_str();
	}
	size_t getNumFiles() override {
		return fileCount;
	}

	bool getFile(const char *file_name, std::vector<uint8_t> &buffer) override;
	bool hasFile(const char *file_name) override;
	void listFiles(std::vector<FileInfo> &out) override;

	// Paths must start with a slash, nullptr when the path does not name a file
	const Node *findFile(const std::string &path) const;
	bool readFile(const Node &file, uint64_t position, size_t len, uint8_t *dst) const;

private:
	std::string archivePath;
	FILE *fp{nullptr};
	uint64_t archiveSize{0};
	uint64_t indexOffset{0};
	uint64_t dataMultiplier{0};
	size_t fileCount{0};
	std::vector<Node> nodes;

	uint32_t readU32(uint64_t offset) const;
	std::string readName(uint64_t offset) const;
	void readDirectory(size_t node, uint64_t dirOffset, size_t depth);
	void traverse(size_t node, const std::string &prefix, std::vector<FileInfo> &out) const;
};
