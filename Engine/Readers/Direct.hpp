/**
 *  Direct.hpp
 *  SNRScripter
 *
 *  Direct filesystem game resources reader.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Readers/Base.hpp"

#include <string>
#include <vector>

class DirectReader : public BaseReader {
public:
	explicit DirectReader(std::string rootPath);

	int open(const char *name) override;
	int close() override;

	const char *getArchiveName() const override;
	size_t getNumFiles() override;

	bool getFile(const char *file_name, std::vector<uint8_t> &buffer) override;
	bool hasFile(const char *file_name) override;
	void listFiles(std::vector<FileInfo> &out) override;

protected:
	std::string root;

	std::string hostPath(const char *path) const;
	void scanTree(const std::string &prefix, std::vector<FileInfo> &out);
};
