/**
 *  Base.hpp
 *  SNRScripter
 *
 *  Base class of game resources reader.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Support/FileDefs.hpp"

#include <vector>
#include <string>
#include <cstdint>
#include <cstdio>

// Paths are absolute inside the game root and use forward slashes, e.g. /picture/bg001.pic.
// Implementations must allow getFile calls from several threads at once.
class BaseReader {
public:
	struct FileInfo {
		std::string name;
		uint64_t offset{0};
		size_t length{0};
		bool directory{false};
	};

	BaseReader()                   = default;
	BaseReader(const BaseReader &) = delete;
	BaseReader &operator=(const BaseReader &) = delete;
	virtual ~BaseReader()                     = default;

	virtual int open(const char *name = nullptr) = 0;
	virtual int close()                          = 0;

	virtual const char *getArchiveName() const = 0;
	virtual size_t getNumFiles()               = 0;

	virtual bool getFile(const char *file_name, std::vector<uint8_t> &buffer) = 0;
	virtual bool hasFile(const char *file_name)                               = 0;
	// Depth-first listing of every entry, directories included
	virtual void listFiles(std::vector<FileInfo> &out) = 0;
};
