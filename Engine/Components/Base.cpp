/**
 *  Base.cpp
 *  SNRScripter
 *
 *  Controller lifetime: every engine service is a controller that registers
 *  itself on init and is torn down in reverse order on exit.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Components/Base.hpp"
#include "Support/FileIO.hpp"

#include <algorithm>

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

ControllerCollection ctrl;

void ControllerCollection::add(BaseController *c) {
	if (std::find(controllers.begin(), controllers.end(), c) == controllers.end())
		controllers.insert(controllers.begin(), c);
}

void ControllerCollection::remove(BaseController *c) {
	controllers.erase(std::remove(controllers.begin(), controllers.end(), c), controllers.end());
}

void ControllerCollection::deinit() {
	// deinit() unregisters, so work on a copy
	auto pending = controllers;
	for (auto c : pending) {
		if (c->deinit() != 0)
			sendToLog(LogLevel::Error, "Failed to deinitialise %s\n", c->name());
	}
	controllers.clear();
}

void ControllerCollection::quit(int code, const char *message, ...) {
	if (message) {
		va_list args;
		va_start(args, message);
		std::vfprintf(stderr, message, args);
		va_end(args);
		std::fprintf(stderr, "\n");
	}

	// A controller failing during shutdown must not recurse into another exit
	if (quitting)
		std::_Exit(code);
	quitting = true;

	std::fflush(stdout);
	std::exit(code);
}

int BaseController::init() {
	counter++;
	if (counter != 1) {
		sendToLog(LogLevel::Error, "%s is initialised for time %d\n", name(), counter);
		return -1;
	}

	is_deinitialising = false;
	int r             = ownInit();
	if (r == 0) {
		is_initialised = true;
		ctrl.add(this);
	} else {
		sendToLog(LogLevel::Error, "Failed to initialise %s (%d)\n", name(), r);
		counter--;
	}
	return r;
}

int BaseController::deinit() {
	if (counter != 1) {
		sendToLog(LogLevel::Warn, "%s is deinitialised while initialised %d times\n", name(), counter);
		return 0;
	}

	counter--;
	is_initialised    = false;
	is_deinitialising = true;
	ctrl.remove(this);
	return ownDeinit();
}

BaseController::~BaseController() {
	// Runs during static destruction, when the log may already be gone
	if (counter != 0)
		std::fprintf(stderr, "[Warn] %s is destroyed before deinitialisation\n", name());
}
