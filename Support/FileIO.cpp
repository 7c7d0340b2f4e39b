/**
 *  FileIO.cpp
 *  SNRScripter
 *
 *  Contains code to access the filesystem and the logging sink.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Support/FileIO.hpp"

#include <sys/stat.h>
#include <dirent.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

static const char *providerName;
static const char *applicationName;

void sendToLog(LogLevel level, const char *fmt, ...) {
	va_list args;
	va_start(args, fmt);
	FileIO::log(level, fmt, args);
	va_end(args);
}

bool FileIO::initialised() {
	return providerName && applicationName;
}

void FileIO::init(const char *provider, const char *application) {
	providerName    = provider;
	applicationName = application;
}

std::string FileIO::extractDirpath(const std::string &path) {
	if (path.empty())
		throw std::runtime_error("Invalid file path");

	auto pos = path.find_last_of("\\/");
	if (pos == std::string::npos)
		return CURRENT_REL_PATH;

	return path.substr(0, pos + 1);
}

void FileIO::terminatePath(std::string &path) {
	if (path.empty())
		path = CURRENT_REL_PATH;
	else if (path.back() != '/' && path.back() != '\\')
		path += DELIMITER;
}

const char *FileIO::getHomeDir() {
	static std::string homeDir;
	static bool obtained = false;
	if (!obtained) {
		// HOME is preferred over getpwuid so that the user can override it for a session.
		const char *home = std::getenv("HOME");
		if (home)
			homeDir = home;
		terminatePath(homeDir);
		obtained = true;
	}
	return homeDir.c_str();
}

static std::string storageDir;

bool FileIO::setStorageDir(const std::string &preferred) {
	if (!preferred.empty()) {
		storageDir = preferred;
		terminatePath(storageDir);
		return true;
	}
	// On Linux (and similar *nixen) save to ~/.appname/
	if (applicationName)
		storageDir = std::string(getHomeDir()) + "." + applicationName + DELIMITER;

	if (storageDir.empty()) {
		sendToLog(LogLevel::Error, "StorageDir: Falling back to current dir!\n");
		storageDir = CURRENT_REL_PATH;
	}
	return true;
}

const char *FileIO::getStorageDir() {
	if (storageDir.empty())
		throw std::runtime_error("Undefined storage directory");
	return storageDir.c_str();
}

int FileIO::seekFile(FILE *fp, size_t off, int m) {
	return fseeko(fp, off, m);
}

bool FileIO::accessFile(const std::string &path, FileType type, size_t *len) {
	struct stat buf;
	if (stat(path.c_str(), &buf))
		return false;

	if (len)
		*len = static_cast<size_t>(buf.st_size);

	if (type == FileType::Any)
		return true;
	if (type == FileType::File && (buf.st_mode & S_IFDIR) == 0)
		return true;
	if (type == FileType::Directory && (buf.st_mode & S_IFDIR) != 0)
		return true;
	return false;
}

FILE *FileIO::openFile(const std::string &path, const char *mode) {
	return std::fopen(path.c_str(), mode);
}

bool FileIO::readFile(FILE *fp, size_t &len, std::vector<uint8_t> &buffer, bool autoclose) {
	if (!fp)
		return false;

	struct stat st;
	if (fstat(fileno(fp), &st)) {
		if (autoclose)
			std::fclose(fp);
		throw std::runtime_error("Error obtaining file size");
	}
	len = static_cast<size_t>(st.st_size);

	buffer.resize(len);
	if (len > 0) {
		seekFile(fp, 0, SEEK_SET);
		if (std::fread(buffer.data(), len, 1, fp) != 1) {
			if (autoclose)
				std::fclose(fp);
			throw std::runtime_error("Error reading file");
		}
	}

	if (autoclose)
		std::fclose(fp);

	return true;
}

bool FileIO::readRange(FILE *fp, uint64_t off, size_t len, uint8_t *dst) {
	if (!fp)
		return false;

	int fd      = fileno(fp);
	size_t done = 0;
	while (done < len) {
		ssize_t r = pread(fd, dst + done, len - done, static_cast<off_t>(off + done));
		if (r < 0) {
			if (errno == EINTR)
				continue;
			sendToLog(LogLevel::Error, "pread failed at %llu: %s\n", static_cast<unsigned long long>(off + done), std::strerror(errno));
			return false;
		}
		if (r == 0)
			return false;
		done += static_cast<size_t>(r);
	}
	return true;
}

bool FileIO::writeFile(FILE *fp, const uint8_t *buffer, size_t len, bool autoclose) {
	if (!fp)
		return false;

	if (buffer && len > 0) {
		seekFile(fp, 0, SEEK_SET);
		if (std::fwrite(buffer, len, 1, fp) != 1) {
			if (autoclose)
				std::fclose(fp);
			throw std::runtime_error("Error writing to file");
		}
	}

	if (autoclose)
		std::fclose(fp);

	return true;
}

bool FileIO::makeDir(const std::string &path, bool recursive) {
	auto make = [](const std::string &path) {
		return mkdir(path.c_str(), 0755) == 0 || errno == EEXIST;
	};

	if (recursive) {
		size_t current_pos = 0;

		while ((current_pos = path.find_first_of("\\/", current_pos)) != std::string::npos) {
			if (current_pos > 0) {
				std::string subdir(path.begin(), path.begin() + current_pos);
				if (!accessFile(subdir, FileType::Directory) && !make(subdir))
					return false;
			}
			current_pos++;
		}
	}

	return make(path);
}

std::vector<std::string> FileIO::scanDir(const std::string &path, FileType type) {
	std::vector<std::string> files;

	DIR *dir = opendir(path.c_str());
	if (dir) {
		dirent *entry = nullptr;
		while ((entry = readdir(dir))) {
			if (std::strcmp(entry->d_name, ".") && std::strcmp(entry->d_name, "..") &&
			    (type == FileType::Any || accessFile(path + DELIMITER + entry->d_name, type)))
				files.emplace_back(entry->d_name);
		}
		closedir(dir);
	}

	return files;
}

bool FileIO::removeFile(const std::string &path) {
	if (std::remove(path.c_str()) != 0) {
		sendToLog(LogLevel::Warn, "remove %s failed with %d\n", path.c_str(), errno);
		return false;
	}
	return true;
}

bool FileIO::fileHandleReopen(const std::string &dst, FILE *src, const char *mode) {
	FILE *fp = std::freopen(dst.c_str(), mode, src);

	if (!fp) {
		const char *name = "file";
		if (src == stdout)
			name = "stdout";
		else if (src == stderr)
			name = "stderr";
		sendToLog(LogLevel::Error, "Warning: cannot reopen %s\n", name);
	}
	return fp;
}

static FileIO::LogMode logMode = FileIO::LogMode::Unspecified;

FileIO::LogMode FileIO::getLogMode() {
	return logMode;
}

void FileIO::setLogMode(FileIO::LogMode mode) {
	logMode = mode;
}

void FileIO::log(LogLevel level, const char *fmt, va_list args) {
	switch (level) {
		case LogLevel::Info:
			std::vfprintf(stdout, fmt, args);
			break;
		case LogLevel::Warn:
		case LogLevel::Error:
			std::vfprintf(stderr, fmt, args);
			break;
	}

	if (logMode == LogMode::File) {
		std::fflush(stdout);
		std::fflush(stderr);
	}
}
