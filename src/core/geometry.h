// geometry.h
// MIT License (c) 2026 Pedro

#pragma once

namespace mockforge::core {

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const = default;
};

// Half-open box: x2 and y2 are one past the last covered pixel.
struct Rect {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    int width() const { return x2 - x1; }
    int height() const { return y2 - y1; }
    bool valid() const { return x1 < x2 && y1 < y2; }

    bool operator==(const Rect& other) const = default;
};

inline Rect rect_from_xywh(int x, int y, int w, int h) {
    return {.x1 = x, .y1 = y, .x2 = x + w, .y2 = y + h};
}

} // namespace mockforge::core
