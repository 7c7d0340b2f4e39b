/**
 *  FileDefs.hpp
 *  SNRScripter
 *
 *  Contains code for basic filesystem definitions.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"

#ifdef LINUX
#include <linux/limits.h>
#endif

#include <algorithm>
#include <string>
#include <cstddef>

enum class FileType {
	Any,
	File,
	Directory
};

// Logging API
enum class LogLevel {
	Info,
	Warn,
	Error
};

void sendToLog(LogLevel level, const char *fmt, ...) __attribute__((format(printf, 2, 3)));

#ifdef WIN32
const char DELIMITER          = '\\';
const char CURRENT_REL_PATH[] = ".\\";
#else
const char DELIMITER          = '/';
const char CURRENT_REL_PATH[] = "./";
#endif

#ifdef WIN32
inline void translatePathSlashes(std::string &) {}
#else
// Asset paths inside archives always use forward slashes
inline void translatePathSlashes(std::string &path) {
	std::replace(path.begin(), path.end(), '\\', '/');
}
#endif
