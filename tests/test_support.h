// test_support.h
// MIT License (c) 2026 Pedro

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "core/image.h"

namespace mockforge::test {

inline std::filesystem::path find_test_font() {
    const std::vector<std::string> font_paths = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
    };
    for (const std::string& path : font_paths) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) {
            return path;
        }
    }
    return {};
}

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline core::Image solid(int width, int height, const core::Color& color) {
    return core::make_canvas(width, height, color);
}

// Overwrites the pixels of rect, clipped to the image.
inline void fill_rect(core::Image& dst, const core::Rect& rect, const core::Color& color) {
    for (int y = std::max(0, rect.y1); y < std::min(dst.height, rect.y2); ++y) {
        for (int x = std::max(0, rect.x1); x < std::min(dst.width, rect.x2); ++x) {
            std::copy(color.begin(), color.end(), dst.pixel(x, y));
        }
    }
}

inline void write_png(const core::Image& image, const std::filesystem::path& path) {
    std::string error;
    if (!core::save_image(image, path, error)) {
        throw std::runtime_error(error);
    }
}

} // namespace mockforge::test
