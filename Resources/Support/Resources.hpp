/**
 *  Resources.hpp
 *  SNRScripter
 *
 *  Files embedded into the executable at build time.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"

#include <cstdint>
#include <cstddef>

struct InternalResource {
	const char *filename;
	const uint8_t *buffer;
	size_t size;
};

// nullptr when nothing was embedded under that name
const InternalResource *getResource(const char *filename);
// Terminated by an entry with a null buffer
const InternalResource *getResourceList();
