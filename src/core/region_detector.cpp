// region_detector.cpp
// MIT License (c) 2026 Pedro

#include "region_detector.h"

#include <algorithm>

namespace mockforge::core {

namespace {

inline bool pixel_is_foreground(const Image& image, int x, int y, int threshold) {
    const unsigned char* p = image.pixel(x, y);
    return p[CHANNEL_R] > threshold || p[CHANNEL_G] > threshold ||
           p[CHANNEL_B] > threshold || p[CHANNEL_A] > threshold;
}

} // namespace

std::optional<Rect> compute_foreground_bounds(const Image& image, int threshold) {
    if (image.empty()) {
        return std::nullopt;
    }
    const int w = image.width;
    const int h = image.height;

    int min_y = -1;
    int top_hit_x = -1;
    for (int y = 0; y < h && top_hit_x < 0; ++y) {
        for (int x = 0; x < w; ++x) {
            if (pixel_is_foreground(image, x, y, threshold)) {
                min_y = y;
                top_hit_x = x;
                break;
            }
        }
    }
    if (top_hit_x < 0) {
        return std::nullopt;
    }

    int max_y = min_y;
    int bottom_hit_x = top_hit_x;
    for (int y = h - 1; y > min_y; --y) {
        bool found = false;
        for (int x = w - 1; x >= 0; --x) {
            if (pixel_is_foreground(image, x, y, threshold)) {
                max_y = y;
                bottom_hit_x = x;
                found = true;
                break;
            }
        }
        if (found) {
            break;
        }
    }

    // Columns left of the first hits on the top and bottom rows are the only
    // candidates for a smaller min_x; symmetric for max_x.
    const int left_search_end = std::min(top_hit_x, bottom_hit_x);
    int min_x = left_search_end;
    for (int x = 0; x < left_search_end; ++x) {
        bool found = false;
        for (int y = min_y; y <= max_y; ++y) {
            if (pixel_is_foreground(image, x, y, threshold)) {
                found = true;
                break;
            }
        }
        if (found) {
            min_x = x;
            break;
        }
    }

    const int right_search_start = std::max(top_hit_x, bottom_hit_x);
    int max_x = right_search_start;
    for (int x = w - 1; x > right_search_start; --x) {
        bool found = false;
        for (int y = min_y; y <= max_y; ++y) {
            if (pixel_is_foreground(image, x, y, threshold)) {
                found = true;
                break;
            }
        }
        if (found) {
            max_x = x;
            break;
        }
    }

    return Rect{.x1 = min_x, .y1 = min_y, .x2 = max_x + 1, .y2 = max_y + 1};
}

std::optional<Rect> detect_text_region(const Image& overlay, int threshold, int inner_padding) {
    if (!overlay.has_alpha) {
        return std::nullopt;
    }
    std::optional<Rect> bounds = compute_foreground_bounds(overlay, threshold);
    if (!bounds) {
        return std::nullopt;
    }
    Rect padded{
        .x1 = bounds->x1 + inner_padding,
        .y1 = bounds->y1 + inner_padding,
        .x2 = bounds->x2 - inner_padding,
        .y2 = bounds->y2 - inner_padding,
    };
    if (!padded.valid()) {
        return std::nullopt;
    }
    return padded;
}

} // namespace mockforge::core
