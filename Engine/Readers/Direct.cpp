/**
 *  Direct.cpp
 *  SNRScripter
 *
 *  Direct filesystem game resources reader.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Readers/Direct.hpp"
#include "Support/FileIO.hpp"

#include <algorithm>
#include <string>

DirectReader::DirectReader(std::string rootPath)
    : root(std::move(rootPath)) {
	FileIO::terminatePath(root);
}

std::string DirectReader::hostPath(const char *path) const {
	std::string fpath(path);
	if (!fpath.empty() && fpath[0] == '/')
		fpath.erase(0, 1);
#ifdef WIN32
	std::replace(fpath.begin(), fpath.end(), '/', DELIMITER);
#endif
	return root + fpath;
}

int DirectReader::open(const char *name) {
	if (name)
		root = name;
	FileIO::terminatePath(root);

	if (!FileIO::accessFile(root, FileType::Directory)) {
		sendToLog(LogLevel::Error, "Game directory %s does not exist\n", root.c_str());
		return -1;
	}
	return 0;
}

int DirectReader::close() {
	return 0;
}

const char *DirectReader::getArchiveName() const {
	return "direct";
}

size_t DirectReader::getNumFiles() {
	std::vector<FileInfo> files;
	listFiles(files);
	return std::count_if(files.begin(), files.end(), [](const FileInfo &f) { return !f.directory; });
}

bool DirectReader::getFile(const char *file_name, std::vector<uint8_t> &buffer) {
	std::string path = hostPath(file_name);
	size_t len       = 0;
	FILE *fp         = FileIO::openFile(path, "rb");
	if (!fp)
		return false;
	return FileIO::readFile(fp, len, buffer, true);
}

bool DirectReader::hasFile(const char *file_name) {
	return FileIO::accessFile(hostPath(file_name), FileType::File);
}

void DirectReader::scanTree(const std::string &prefix, std::vector<FileInfo> &out) {
	auto entries = FileIO::scanDir(root + prefix);
	std::sort(entries.begin(), entries.end());

	for (auto &entry : entries) {
		std::string rel = prefix + entry;
		size_t len      = 0;
		FileInfo info;
		info.name      = "/" + rel;
		info.directory = FileIO::accessFile(root + rel, FileType::Directory, &len);
		info.length    = info.directory ? 0 : len;
		translatePathSlashes(info.name);
		out.push_back(info);
		if (info.directory)
			scanTree(rel + DELIMITER, out);
	}
}

void DirectReader::listFiles(std::vector<FileInfo> &out) {
	scanTree("", out);
}
