/**
 *  Base.hpp
 *  SNRScripter
 *
 *  Controller lifetime: every engine service is a controller that registers
 *  itself on init and is torn down in reverse order on exit.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"

#include <vector>
#include <typeinfo>

#include <cstddef>

class BaseController;

class ControllerCollection {
	// Most recently initialised first
	std::vector<BaseController *> controllers;
	bool quitting{false};

public:
	// Deinitialises every registered controller. Loader installs an atexit hook calling this.
	void deinit();
	void add(BaseController *c);
	void remove(BaseController *c);

	size_t size() const {
		return controllers.size();
	}

	// Prints the message (if any) to stderr, then exits with the code.
	// Registered controllers are shut down by the atexit hook.
	[[noreturn]] void quit(int code, const char *message = nullptr, ...) __attribute__((format(printf, 3, 4)));
};

extern ControllerCollection ctrl;

class BaseController {
	friend class ControllerCollection;
	const std::type_info &type;
	int counter{0};
	bool is_initialised{false};
	bool is_deinitialising{false};

protected:
	// Called by init() and deinit(), non-zero on failure
	virtual int ownInit()   = 0;
	virtual int ownDeinit() = 0;

public:
	int init();
	int deinit();

	// Returns false once deinit() has started
	bool initialised() const {
		return is_initialised;
	}

	bool deinitialising() const {
		return is_deinitialising;
	}

	const char *name() const {
		return type.name();
	}

	template <typename T>
	explicit BaseController(T * /*inst*/)
	    : type(typeid(T)) {}
	virtual ~BaseController();

	BaseController(const BaseController &) = delete;
	BaseController &operator=(const BaseController &) = delete;
};
