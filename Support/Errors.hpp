/**
 *  Errors.hpp
 *  SNRScripter
 *
 *  Exception types thrown by decoders, the virtual machine and the asset layer.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"

#include <stdexcept>
#include <string>
#include <cstdint>
#include <cstdio>

class IoError : public std::runtime_error {
public:
	explicit IoError(const std::string &what)
	    : std::runtime_error(what) {}
};

class ParseError : public std::runtime_error {
public:
	enum class Kind {
		InvalidMagic,
		TruncatedStream,
		UnmappableText,
		InvalidByte,
		BadLength,
		Unsupported
	};

	const Kind kind;

	ParseError(Kind k, const std::string &what)
	    : std::runtime_error(std::string(kindName(k)) + ": " + what), kind(k) {}

	static const char *kindName(Kind k) {
		switch (k) {
			case Kind::InvalidMagic:
				return "invalid magic";
			case Kind::TruncatedStream:
				return "truncated stream";
			case Kind::UnmappableText:
				return "unmappable text";
			case Kind::InvalidByte:
				return "invalid byte";
			case Kind::BadLength:
				return "bad length";
			case Kind::Unsupported:
				return "unsupported";
		}
		return "unknown";
	}
};

class VmError : public std::runtime_error {
public:
	enum class Kind {
		Corrupt,
		Overflow
	};

	const Kind kind;
	const uint32_t pc;

	VmError(Kind k, uint32_t at, const std::string &what)
	    : std::runtime_error(what), kind(k), pc(at) {}
};

class AssetError : public std::runtime_error {
public:
	enum class Kind {
		NotFound,
		DecodeFailed
	};

	const Kind kind;
	const std::string path;

	AssetError(Kind k, const std::string &p, const std::string &inner = {})
	    : std::runtime_error(k == Kind::NotFound ? "asset not found: " + p : "failed to decode " + p + ": " + inner),
	      kind(k), path(p) {}
};

class AudioError : public std::runtime_error {
public:
	AudioError()
	    : std::runtime_error("audio command queue is full") {}
};

// Process exit codes used by ctrl.quit
enum ExitCode {
	ExitSuccess       = 0,
	ExitIoError       = 1,
	ExitParseError    = 2,
	ExitCorruptScript = 3
};
