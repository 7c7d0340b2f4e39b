/**
 *  FileIO.hpp
 *  SNRScripter
 *
 *  Contains code to access the filesystem and the logging sink.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"
#include "Support/FileDefs.hpp"

#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <climits>

namespace FileIO {
enum class LogMode {
	Unspecified,
	Console,
	File
};

void init(const char *provider, const char *appname);
bool initialised();
LogMode getLogMode();
void setLogMode(LogMode mode);
void log(LogLevel level, const char *format, va_list args);

// Returns a directory path (with a trailing delimiter) of a file path
std::string extractDirpath(const std::string &path);
void terminatePath(std::string &path);

// An empty path selects ~/.appname/
bool setStorageDir(const std::string &preferred = {});
const char *getHomeDir();
const char *getStorageDir();

bool accessFile(const std::string &path, FileType type = FileType::Any, size_t *len = nullptr);
int seekFile(FILE *fp, size_t off, int m);
FILE *openFile(const std::string &path, const char *mode);
bool readFile(FILE *fp, size_t &len, std::vector<uint8_t> &buffer, bool autoclose = false);
// Positional read that does not touch the shared file offset
bool readRange(FILE *fp, uint64_t off, size_t len, uint8_t *dst);
bool writeFile(FILE *fp, const uint8_t *buffer, size_t len, bool autoclose = false);
bool makeDir(const std::string &path, bool recursive = false);
std::vector<std::string> scanDir(const std::string &path, FileType type = FileType::Any);
bool removeFile(const std::string &path);
bool fileHandleReopen(const std::string &dst, FILE *src, const char *mode = "w");

inline bool readFile(const std::string &path, size_t &len, std::vector<uint8_t> &buffer) {
	return readFile(openFile(path, "rb"), len, buffer, true);
}
inline bool writeFile(const std::string &path, const uint8_t *buffer, size_t len) {
	return writeFile(openFile(path, "wb"), buffer, len, true);
}
inline bool writeFile(const std::string &path, const std::string &text) {
	return writeFile(openFile(path, "wb"), reinterpret_cast<const uint8_t *>(text.data()), text.size(), true);
}
} // namespace FileIO
