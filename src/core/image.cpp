// image.cpp
// MIT License (c) 2026 Pedro

#include "image.h"

#include "cli_parse.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <memory>
#include <system_error>

#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image.h>
#include <stb_image_write.h>

namespace fs = std::filesystem;

namespace mockforge::core {

namespace {

constexpr int k_max_image_dimension = 100000;
constexpr int k_jpeg_quality = 95;

struct Contribution {
    int first = 0;
    std::vector<float> weights;
};

// Area averaging when shrinking, linear interpolation when enlarging.
std::vector<Contribution> compute_contributions(int src_len, int dst_len) {
    std::vector<Contribution> out(static_cast<size_t>(dst_len));
    const double ratio = static_cast<double>(src_len) / static_cast<double>(dst_len);
    for (int d = 0; d < dst_len; ++d) {
        Contribution& c = out[static_cast<size_t>(d)];
        if (ratio > 1.0) {
            const double start = d * ratio;
            const double end = std::min(static_cast<double>(src_len), start + ratio);
            const int first = std::clamp(static_cast<int>(std::floor(start)), 0, src_len - 1);
            const int last = std::clamp(static_cast<int>(std::ceil(end)) - 1, first, src_len - 1);
            c.first = first;
            for (int s = first; s <= last; ++s) {
                const double overlap = std::min(end, s + 1.0) - std::max(start, static_cast<double>(s));
                c.weights.push_back(static_cast<float>(std::max(0.0, overlap)));
            }
        } else {
            const double center = ((d + 0.5) * ratio) - 0.5;
            const int i0 = static_cast<int>(std::floor(center));
            const double frac = center - i0;
            const int a = std::clamp(i0, 0, src_len - 1);
            const int b = std::clamp(i0 + 1, 0, src_len - 1);
            c.first = a;
            if (a == b) {
                c.weights.push_back(1.0F);
            } else {
                c.weights.push_back(static_cast<float>(1.0 - frac));
                c.weights.push_back(static_cast<float>(frac));
            }
        }

        float total = 0.0F;
        for (float w : c.weights) {
            total += w;
        }
        if (total <= 0.0F) {
            c.weights.assign(1, 1.0F);
        } else {
            for (float& w : c.weights) {
                w /= total;
            }
        }
    }
    return out;
}

unsigned char to_channel(float value) {
    return static_cast<unsigned char>(std::clamp(std::lround(value), 0L, static_cast<long>(MAX_CHANNEL_VALUE)));
}

bool write_file_atomically(const fs::path& path, const unsigned char* data, size_t size, std::string& error) {
    fs::path tmp_path = path;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            error = "failed to open '" + tmp_path.string() + "' for writing";
            return false;
        }
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!out) {
            error = "failed to write '" + tmp_path.string() + "'";
            out.close();
            std::error_code ignore;
            fs::remove(tmp_path, ignore);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        error = "failed to move '" + tmp_path.string() + "' into place: " + ec.message();
        std::error_code ignore;
        fs::remove(tmp_path, ignore);
        return false;
    }
    return true;
}

} // namespace

LoadResult load_image(const fs::path& path, ChannelMode mode) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return LoadFailure{.path = path.string(), .reason = "file not found"};
    }

    int width = 0;
    int height = 0;
    int channels_in_file = 0;
    unsigned char* data = stbi_load(path.string().c_str(), &width, &height, &channels_in_file, NUM_CHANNELS);
    if (data == nullptr) {
        const char* reason = stbi_failure_reason();
        return LoadFailure{.path = path.string(), .reason = reason != nullptr ? reason : "decode failed"};
    }
    std::unique_ptr<unsigned char, void (*)(void*)> owned(data, stbi_image_free);

    if (width <= 0 || height <= 0) {
        return LoadFailure{.path = path.string(), .reason = "image has zero width or height"};
    }
    if (width > k_max_image_dimension || height > k_max_image_dimension) {
        return LoadFailure{.path = path.string(), .reason = "image dimensions are too large"};
    }

    Image image;
    image.width = width;
    image.height = height;
    image.pixels.assign(owned.get(), owned.get() + (static_cast<size_t>(width) * static_cast<size_t>(height) * NUM_CHANNELS));
    if (mode == ChannelMode::Rgb) {
        for (size_t i = CHANNEL_A; i < image.pixels.size(); i += NUM_CHANNELS) {
            image.pixels[i] = MAX_CHANNEL_VALUE;
        }
        image.has_alpha = false;
    } else {
        image.has_alpha = true;
    }
    return image;
}

Image make_canvas(int width, int height, const Color& color) {
    Image canvas;
    if (width <= 0 || height <= 0) {
        return canvas;
    }
    canvas.width = width;
    canvas.height = height;
    canvas.pixels.resize(static_cast<size_t>(width) * static_cast<size_t>(height) * NUM_CHANNELS);
    for (size_t i = 0; i < canvas.pixels.size(); i += NUM_CHANNELS) {
        std::memcpy(&canvas.pixels[i], color.data(), NUM_CHANNELS);
    }
    return canvas;
}

Image make_checkerboard(int width, int height, int cell, const Color& first, const Color& second) {
    Image board = make_canvas(width, height, first);
    if (board.empty() || cell <= 0) {
        return board;
    }
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            if (((x / cell) + (y / cell)) % 2 != 0) {
                std::memcpy(board.pixel(x, y), second.data(), NUM_CHANNELS);
            }
        }
    }
    return board;
}

Image resize_image(const Image& src, int width, int height) {
    Image out;
    if (src.empty() || width <= 0 || height <= 0) {
        return out;
    }
    if (width == src.width && height == src.height) {
        return src;
    }

    const std::vector<Contribution> columns = compute_contributions(src.width, width);
    const std::vector<Contribution> rows = compute_contributions(src.height, height);

    // Horizontal pass into premultiplied floats.
    std::vector<float> horizontal(static_cast<size_t>(width) * static_cast<size_t>(src.height) * NUM_CHANNELS);
    for (int y = 0; y < src.height; ++y) {
        for (int x = 0; x < width; ++x) {
            const Contribution& c = columns[static_cast<size_t>(x)];
            float acc[NUM_CHANNELS] = {0.0F, 0.0F, 0.0F, 0.0F};
            for (size_t k = 0; k < c.weights.size(); ++k) {
                const unsigned char* p = src.pixel(c.first + static_cast<int>(k), y);
                const float alpha = p[CHANNEL_A] / static_cast<float>(MAX_CHANNEL_VALUE);
                const float w = c.weights[k];
                acc[CHANNEL_R] += p[CHANNEL_R] * alpha * w;
                acc[CHANNEL_G] += p[CHANNEL_G] * alpha * w;
                acc[CHANNEL_B] += p[CHANNEL_B] * alpha * w;
                acc[CHANNEL_A] += p[CHANNEL_A] * w;
            }
            float* dst = &horizontal[((static_cast<size_t>(y) * static_cast<size_t>(width)) + static_cast<size_t>(x)) * NUM_CHANNELS];
            std::copy(std::begin(acc), std::end(acc), dst);
        }
    }

    out.width = width;
    out.height = height;
    out.has_alpha = src.has_alpha;
    out.pixels.resize(static_cast<size_t>(width) * static_cast<size_t>(height) * NUM_CHANNELS);
    for (int y = 0; y < height; ++y) {
        const Contribution& c = rows[static_cast<size_t>(y)];
        for (int x = 0; x < width; ++x) {
            float acc[NUM_CHANNELS] = {0.0F, 0.0F, 0.0F, 0.0F};
            for (size_t k = 0; k < c.weights.size(); ++k) {
                const int sy = c.first + static_cast<int>(k);
                const float* p = &horizontal[((static_cast<size_t>(sy) * static_cast<size_t>(width)) + static_cast<size_t>(x)) * NUM_CHANNELS];
                const float w = c.weights[k];
                for (int ch = 0; ch < NUM_CHANNELS; ++ch) {
                    acc[ch] += p[ch] * w;
                }
            }
            unsigned char* dst = out.pixel(x, y);
            const float alpha = acc[CHANNEL_A] / static_cast<float>(MAX_CHANNEL_VALUE);
            if (alpha > 0.0F) {
                dst[CHANNEL_R] = to_channel(acc[CHANNEL_R] / alpha);
                dst[CHANNEL_G] = to_channel(acc[CHANNEL_G] / alpha);
                dst[CHANNEL_B] = to_channel(acc[CHANNEL_B] / alpha);
            } else {
                dst[CHANNEL_R] = 0;
                dst[CHANNEL_G] = 0;
                dst[CHANNEL_B] = 0;
            }
            dst[CHANNEL_A] = to_channel(acc[CHANNEL_A]);
        }
    }
    return out;
}

void composite_over(Image& dst, const Image& src, int x, int y) {
    if (dst.empty() || src.empty()) {
        return;
    }
    const int start_x = std::max(0, -x);
    const int start_y = std::max(0, -y);
    const int end_x = std::min(src.width, dst.width - x);
    const int end_y = std::min(src.height, dst.height - y);
    for (int sy = start_y; sy < end_y; ++sy) {
        for (int sx = start_x; sx < end_x; ++sx) {
            const unsigned char* s = src.pixel(sx, sy);
            const int sa = s[CHANNEL_A];
            if (sa == 0) {
                continue;
            }
            unsigned char* d = dst.pixel(x + sx, y + sy);
            if (sa == MAX_CHANNEL_VALUE) {
                std::memcpy(d, s, NUM_CHANNELS);
                continue;
            }
            const int da = d[CHANNEL_A];
            const int inv = MAX_CHANNEL_VALUE - sa;
            const int out_a = (sa * MAX_CHANNEL_VALUE) + (da * inv);
            for (size_t ch = CHANNEL_R; ch <= CHANNEL_B; ++ch) {
                const int value = ((s[ch] * sa * MAX_CHANNEL_VALUE) + (d[ch] * da * inv) + (out_a / 2)) / out_a;
                d[ch] = static_cast<unsigned char>(value);
            }
            d[CHANNEL_A] = static_cast<unsigned char>((out_a + (MAX_CHANNEL_VALUE / 2)) / MAX_CHANNEL_VALUE);
        }
    }
}

Image scale_alpha(const Image& src, int percent) {
    Image out = src;
    const int clamped = std::clamp(percent, 0, 100);
    for (size_t i = CHANNEL_A; i < out.pixels.size(); i += NUM_CHANNELS) {
        out.pixels[i] = static_cast<unsigned char>((out.pixels[i] * clamped) / 100);
    }
    return out;
}

bool save_image(const Image& image, const fs::path& path, std::string& error) {
    if (image.empty()) {
        error = "refusing to save an empty image to '" + path.string() + "'";
        return false;
    }

    std::string ext = to_lower_copy(path.extension().string());
    std::vector<unsigned char> encoded;
    if (ext == ".jpg" || ext == ".jpeg") {
        auto append = [](void* context, void* data, int size) {
            auto* out = static_cast<std::vector<unsigned char>*>(context);
            const auto* bytes = static_cast<const unsigned char*>(data);
            out->insert(out->end(), bytes, bytes + size);
        };
        if (stbi_write_jpg_to_func(append, &encoded, image.width, image.height, NUM_CHANNELS,
                                   image.pixels.data(), k_jpeg_quality) == 0) {
            error = "failed to encode JPEG for '" + path.string() + "'";
            return false;
        }
    } else if (ext == ".png") {
        int png_size = 0;
        unsigned char* png_raw = stbi_write_png_to_mem(image.pixels.data(), image.width * NUM_CHANNELS,
                                                       image.width, image.height, NUM_CHANNELS, &png_size);
        if (png_raw == nullptr) {
            error = "failed to encode PNG for '" + path.string() + "'";
            return false;
        }
        std::unique_ptr<unsigned char, void (*)(void*)> png_buffer(png_raw, std::free);
        encoded.assign(png_buffer.get(), png_buffer.get() + png_size);
    } else {
        error = "unsupported output extension '" + ext + "'";
        return false;
    }

    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            error = "failed to create directory '" + path.parent_path().string() + "': " + ec.message();
            return false;
        }
    }
    return write_file_atomically(path, encoded.data(), encoded.size(), error);
}

bool is_supported_image_extension(const fs::path& path) {
    const std::string ext = to_lower_copy(path.extension().string());
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" ||
           ext == ".tga" || ext == ".gif" || ext == ".psd";
}

std::vector<fs::path> list_product_images(const fs::path& folder) {
    std::vector<fs::path> out;
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        return out;
    }
    for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec) || !is_supported_image_extension(entry.path())) {
            continue;
        }
        out.push_back(entry.path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace mockforge::core
