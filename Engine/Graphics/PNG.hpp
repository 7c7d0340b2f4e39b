/**
 *  PNG.hpp
 *  SNRScripter
 *
 *  Thread safe libpng wrapper for RGBA8 images kept in memory.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#include "External/Compatibility.hpp"

#include <png.h>

#include <string>
#include <vector>
#include <cstdint>

struct PNGImage {
	uint32_t width{0};
	uint32_t height{0};
	// Tightly packed RGBA8
	std::vector<uint8_t> rgba;
};

class PNGCodec {
public:
	static bool isPng(const uint8_t *data, size_t len);
	// false with the reason logged when libpng fails
	static bool encode(const PNGImage &image, std::vector<uint8_t> &out);
	// Any PNG color type is expanded to RGBA8
	static bool decode(const uint8_t *data, size_t len, PNGImage &image);
	static bool save(const std::string &path, const PNGImage &image);

private:
	static void png_write_data(png_structp ctx, png_bytep area, png_size_t size);
	static void png_flush_data(png_structp ctx);
	static void png_error_fn(png_structp ctx, png_const_charp message);
	static void png_warning_fn(png_structp ctx, png_const_charp message);
};
