/**
 *  Layered.hpp
 *  SNRScripter
 *
 *  Ordered list of readers, the first one holding a file wins.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Engine/Readers/Base.hpp"

#include <memory>
#include <string>
#include <vector>

class LayeredReader : public BaseReader {
	std::vector<std::unique_ptr<BaseReader>> readers;

public:
	void addReader(std::unique_ptr<BaseReader> reader) {
		readers.push_back(std::move(reader));
	}
	size_t getNumReaders() const {
		return readers.size();
	}

	int open(const char *name = nullptr) override;
	int close() override;

	const char *getArchiveName() const override {
		return "layered";
	}
	size_t getNumFiles() override;

	bool getFile(const char *file_name, std::vector<uint8_t> &buffer) override;
	bool hasFile(const char *file_name) override;
	// Entries shadowed by an earlier reader are omitted
	void listFiles(std::vector<FileInfo> &out) override;
};
