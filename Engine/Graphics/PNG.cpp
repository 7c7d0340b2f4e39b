/**
 *  PNG.cpp
 *  SNRScripter
 *
 *  Thread safe libpng wrapper for RGBA8 images kept in memory.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#include "Engine/Graphics/PNG.hpp"
#include "Support/FileIO.hpp"

#include <cstring>

bool PNGCodec::isPng(const uint8_t *data, size_t len) {
	return len >= 8 && !png_sig_cmp(data, 0, 8);
}

void PNGCodec::png_write_data(png_structp ctx, png_bytep area, png_size_t size) {
	auto out = static_cast<std::vector<uint8_t> *>(png_get_io_ptr(ctx));
	out->insert(out->end(), area, area + size);
}

void PNGCodec::png_flush_data(png_structp /*ctx*/) {}

void PNGCodec::png_error_fn(png_structp ctx, png_const_charp message) {
	sendToLog(LogLevel::Error, "libpng: %s\n", message);
	png_longjmp(ctx, 1);
}

void PNGCodec::png_warning_fn(png_structp /*ctx*/, png_const_charp message) {
	sendToLog(LogLevel::Warn, "libpng: %s\n", message);
}

bool PNGCodec::encode(const PNGImage &image, std::vector<uint8_t> &out) {
	if (image.rgba.size() != static_cast<size_t>(image.width) * image.height * 4 || image.width == 0 || image.height == 0) {
		sendToLog(LogLevel::Error, "Refusing to encode a %ux%u image with %zu bytes\n", image.width, image.height, image.rgba.size());
		return false;
	}

	png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
	if (!png_ptr) {
		sendToLog(LogLevel::Error, "Couldn't allocate memory for PNG file or incompatible PNG library\n");
		return false;
	}
	png_infop info_ptr = png_create_info_struct(png_ptr);
	if (!info_ptr) {
		png_destroy_write_struct(&png_ptr, nullptr);
		sendToLog(LogLevel::Error, "Couldn't create image information for PNG file\n");
		return false;
	}

	std::vector<png_bytep> rows(image.height);
	for (uint32_t row = 0; row < image.height; row++)
		rows[row] = const_cast<png_bytep>(image.rgba.data() + static_cast<size_t>(row) * image.width * 4);

	out.clear();
	if (setjmp(png_jmpbuf(png_ptr))) {
		png_destroy_write_struct(&png_ptr, &info_ptr);
		out.clear();
		return false;
	}

	png_set_write_fn(png_ptr, &out, png_write_data, png_flush_data);
	png_set_IHDR(png_ptr, info_ptr, image.width, image.height, 8, PNG_COLOR_TYPE_RGB_ALPHA,
	             PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
	png_write_info(png_ptr, info_ptr);
	png_write_image(png_ptr, rows.data());
	png_write_end(png_ptr, nullptr);

	png_destroy_write_struct(&png_ptr, &info_ptr);
	return true;
}

bool PNGCodec::decode(const uint8_t *data, size_t len, PNGImage &image) {
	if (!isPng(data, len)) {
		sendToLog(LogLevel::Error, "Not a PNG file\n");
		return false;
	}

	// The simplified API does the expansion and reports errors without longjmp
	png_image png;
	std::memset(&png, 0, sizeof(png));
	png.version = PNG_IMAGE_VERSION;
	if (!png_image_begin_read_from_memory(&png, data, len)) {
		sendToLog(LogLevel::Error, "libpng: %s\n", png.message);
		return false;
	}

	png.format = PNG_FORMAT_RGBA;
	image.width  = png.width;
	image.height = png.height;
	image.rgba.assign(PNG_IMAGE_SIZE(png), 0);
	if (!png_image_finish_read(&png, nullptr, image.rgba.data(), 0, nullptr)) {
		sendToLog(LogLevel::Error, "libpng: %s\n", png.message);
		png_image_free(&png);
		image = PNGImage();
		return false;
	}
	return true;
}

bool PNGCodec::save(const std::string &path, const PNGImage &image) {
	std::vector<uint8_t> data;
	if (!encode(image, data))
		return false;
	if (!FileIO::writeFile(path, data.data(), data.size())) {
		sendToLog(LogLevel::Error, "Failed to write %s\n", path.c_str());
		return false;
	}
	return true;
}
