// image.h
// MIT License (c) 2026 Pedro

#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

#include "geometry.h"

namespace mockforge::core {

constexpr int NUM_CHANNELS = 4;
constexpr size_t CHANNEL_R = 0;
constexpr size_t CHANNEL_G = 1;
constexpr size_t CHANNEL_B = 2;
constexpr size_t CHANNEL_A = 3;
constexpr int MAX_CHANNEL_VALUE = 255;

using Color = std::array<unsigned char, 4>;

// 8-bit RGBA raster, rows top to bottom. Pixels are always stored with four
// channels; has_alpha records whether the alpha channel carries information.
struct Image {
    int width = 0;
    int height = 0;
    bool has_alpha = true;
    std::vector<unsigned char> pixels;

    bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }
    Size size() const { return {.width = width, .height = height}; }

    unsigned char* pixel(int x, int y) {
        return pixels.data() + ((static_cast<size_t>(y) * static_cast<size_t>(width)) + static_cast<size_t>(x)) * NUM_CHANNELS;
    }
    const unsigned char* pixel(int x, int y) const {
        return pixels.data() + ((static_cast<size_t>(y) * static_cast<size_t>(width)) + static_cast<size_t>(x)) * NUM_CHANNELS;
    }
};

enum class ChannelMode { Rgba, Rgb };

struct LoadFailure {
    std::string path;
    std::string reason;
};

using LoadResult = std::variant<Image, LoadFailure>;

// Never throws. Missing files, undecodable data and zero-sized images are
// reported as LoadFailure. Rgba mode adds an opaque alpha channel when the
// source has none; Rgb mode discards alpha.
LoadResult load_image(const std::filesystem::path& path, ChannelMode mode = ChannelMode::Rgba);

Image make_canvas(int width, int height, const Color& color);
Image make_checkerboard(int width, int height, int cell, const Color& first, const Color& second);

// Returns an empty image when the source or either target dimension is empty.
Image resize_image(const Image& src, int width, int height);

// Porter-Duff "over" of src onto dst with src's top-left at (x, y).
// Pixels outside dst are clipped; fully transparent source pixels leave dst untouched.
void composite_over(Image& dst, const Image& src, int x, int y);

// Multiplies every alpha value by percent/100 (integer arithmetic).
Image scale_alpha(const Image& src, int percent);


// PNG for ".png", JPEG for ".jpg"/".jpeg". The file is written to a temporary
// sibling and renamed, so a failed save never leaves a partial file behind.
bool save_image(const Image& image, const std::filesystem::path& path, std::string& error);

bool is_supported_image_extension(const std::filesystem::path& path);

// Regular files with a supported image extension directly inside folder, sorted by name.
std::vector<std::filesystem::path> list_product_images(const std::filesystem::path& folder);

} // namespace mockforge::core
