/**
 * @file frame_dump.cpp
 * @brief libpng frame snapshots
 */

#include "frame_dump.hpp"
#include <png.h>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>

namespace dotvid {

bool write_frame_png(
    const std::string& path,
    const std::vector<uint8_t>& pixels,
    const FrameGeometry& geometry,
    uint32_t channels)
{
    if ((channels != 3 && channels != 4) || pixels.size() < geometry.pixel_bytes(channels)) {
        std::cerr << "Cannot dump frame: unexpected pixel layout" << std::endl;
        return false;
    }

    FILE* fp = fopen(path.c_str(), "wb");
    if (!fp) {
        std::cerr << "Failed to open PNG for writing: " << path << std::endl;
        return false;
    }

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        fclose(fp);
        return false;
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        fclose(fp);
        return false;
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        fclose(fp);
        std::cerr << "Failed to write PNG: " << path << std::endl;
        return false;
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info, geometry.width, geometry.height, 8,
                 PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    // RGBA rows: let libpng strip the unused alpha byte
    if (channels == 4) {
        png_set_filler(png, 0, PNG_FILLER_AFTER);
    }

    const size_t stride = static_cast<size_t>(geometry.width) * channels;
    std::vector<png_bytep> row_pointers(geometry.height);
    for (uint32_t y = 0; y < geometry.height; ++y) {
        row_pointers[y] = const_cast<png_bytep>(pixels.data() + y * stride);
    }

    png_write_image(png, row_pointers.data());
    png_write_end(png, nullptr);

    png_destroy_write_struct(&png, &info);
    fclose(fp);

    return true;
}

bool read_frame_png(
    const std::string& path,
    std::vector<uint8_t>& pixels,
    uint32_t& width,
    uint32_t& height)
{
    FILE* fp = fopen(path.c_str(), "rb");
    if (!fp) {
        std::cerr << "Failed to open PNG: " << path << std::endl;
        return false;
    }

    png_structp png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        fclose(fp);
        return false;
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_read_struct(&png, nullptr, nullptr);
        fclose(fp);
        return false;
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_read_struct(&png, &info, nullptr);
        fclose(fp);
        std::cerr << "Failed to read PNG: " << path << std::endl;
        return false;
    }

    png_init_io(png, fp);
    png_read_info(png, info);

    width = png_get_image_width(png, info);
    height = png_get_image_height(png, info);
    const int bit_depth = png_get_bit_depth(png, info);
    const int color_type = png_get_color_type(png, info);

    // Frames are always 8-bit colour
    if (bit_depth != 8 || (color_type != PNG_COLOR_TYPE_RGB && color_type != PNG_COLOR_TYPE_RGB_ALPHA)) {
        std::cerr << "PNG must be 8-bit RGB or RGBA: " << path << std::endl;
        png_destroy_read_struct(&png, &info, nullptr);
        fclose(fp);
        return false;
    }

    if (color_type == PNG_COLOR_TYPE_RGB_ALPHA) {
        png_set_strip_alpha(png);
    }
    png_read_update_info(png, info);

    const size_t stride = static_cast<size_t>(width) * 3;
    pixels.resize(stride * height);
    std::vector<png_bytep> row_pointers(height);
    for (uint32_t y = 0; y < height; ++y) {
        row_pointers[y] = pixels.data() + y * stride;
    }

    png_read_image(png, row_pointers.data());
    png_read_end(png, nullptr);

    png_destroy_read_struct(&png, &info, nullptr);
    fclose(fp);

    return true;
}

std::string frame_dump_path(const std::string& dir, uint64_t index)
{
    std::ostringstream filename;
    filename << "frame_" << std::setw(6) << std::setfill('0') << index << ".png";
    return dir + "/" + filename.str();
}

bool ensure_directory(const std::string& dir)
{
    struct stat st;
    if (stat(dir.c_str(), &st) == 0) {
        if (!S_ISDIR(st.st_mode)) {
            std::cerr << "Not a directory: " << dir << std::endl;
            return false;
        }
        return true;
    }

    if (mkdir(dir.c_str(), 0755) != 0) {
        std::cerr << "Failed to create directory: " << dir << std::endl;
        return false;
    }
    return true;
}

} // namespace dotvid
