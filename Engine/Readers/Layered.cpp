/**
 *  Layered.cpp
 *  SNRScripter
 *
 *  Ordered list of readers, the first one holding a file wins.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Readers/Layered.hpp"

#include <unordered_set>

int LayeredReader::open(const char * /*name*/) {
	for (auto &reader : readers) {
		if (reader->open() < 0)
			return -1;
	}
	return 0;
}

int LayeredReader::close() {
	for (auto &reader : readers) reader->close();
	return 0;
}

size_t LayeredReader::getNumFiles() {
	std::vector<FileInfo> files;
	listFiles(files);
	size_t count = 0;
	for (auto &f : files)
		if (!f.directory)
			count++;
	return count;
}

bool LayeredReader::getFile(const char *file_name, std::vector<uint8_t> &buffer) {
	for (auto &reader : readers) {
		if (reader->hasFile(file_name))
			return reader->getFile(file_name, buffer);
	}
	return false;
}

bool LayeredReader::hasFile(const char *file_name) {
	for (auto &reader : readers) {
		if (reader->hasFile(file_name))
			return true;
	}
	return false;
}

void LayeredReader::listFiles(std::vector<FileInfo> &out) {
	std::unordered_set<std::string> seen;
	for (auto &reader : readers) {
		std::vector<FileInfo> files;
		reader->listFiles(files);
		for (auto &f : files) {
			if (seen.insert(f.name).second)
				out.push_back(std::move(f));
		}
	}
}
