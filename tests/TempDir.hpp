/**
 *  TempDir.hpp
 *  SNRScripter
 *
 *  Scratch game directories for reader and engine tests.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Support/FileIO.hpp"

#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>
#include <cstdlib>

namespace TestData {

// Removed together with its contents when it goes out of scope
class TempDir {
	std::string root;

	static void removeTree(const std::string &path) {
		for (auto &entry : FileIO::scanDir(path)) {
			std::string child = path + entry;
			if (FileIO::accessFile(child, FileType::Directory))
				removeTree(child + DELIMITER);
			else
				FileIO::removeFile(child);
		}
		FileIO::removeFile(path);
	}

public:
	TempDir() {
		char pattern[] = "/tmp/snrscripter-XXXXXX";
		if (!mkdtemp(pattern))
			throw std::runtime_error("mkdtemp failed");
		root = pattern;
		FileIO::terminatePath(root);
	}
	~TempDir() {
		removeTree(root);
	}
	TempDir(const TempDir &) = delete;
	TempDir &operator=(const TempDir &) = delete;

	// With a trailing delimiter
	const std::string &path() const {
		return root;
	}

	// relative uses forward slashes, missing directories are created
	std::string write(const std::string &relative, const std::vector<uint8_t> &data) const {
		std::string full = root + relative;
		translatePathSlashes(full);
		FileIO::makeDir(FileIO::extractDirpath(full), true);
		if (!FileIO::writeFile(full, data.data(), data.size()))
			throw std::runtime_error("cannot write " + full);
		return full;
	}
	std::string write(const std::string &relative, const std::string &text) const {
		return write(relative, std::vector<uint8_t>(text.begin(), text.end()));
	}
};

} // namespace TestData
