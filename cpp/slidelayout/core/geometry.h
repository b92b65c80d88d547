#pragma once

#include <algorithm>
#include <vector>

namespace slidelayout {

// Axis-aligned rectangle in slide units, y grows downwards.
struct Bounds {
    float left{0.0f};
    float top{0.0f};
    float width{0.0f};
    float height{0.0f};

    float right() const { return left + width; }
    float bottom() const { return top + height; }
    float centerX() const { return left + width / 2.0f; }
    float centerY() const { return top + height / 2.0f; }

    // Half-open: [left, right) x [top, bottom)
    bool containsPoint(float x, float y) const {
        return x >= left && x < right() && y >= top && y < bottom();
    }

    bool operator==(const Bounds& other) const {
        return left == other.left && top == other.top && width == other.width && height == other.height;
    }
    bool operator!=(const Bounds& other) const { return !(*this == other); }
};

inline Bounds boundsFromEdges(float minX, float minY, float maxX, float maxY) {
    return Bounds{minX, minY, maxX - minX, maxY - minY};
}

inline Bounds unionBounds(const Bounds& a, const Bounds& b) {
    return boundsFromEdges(
        std::min(a.left, b.left),
        std::min(a.top, b.top),
        std::max(a.right(), b.right()),
        std::max(a.bottom(), b.bottom()));
}

inline Bounds unionBounds(const std::vector<Bounds>& items) {
    if (items.empty()) return Bounds{};
    Bounds result = items.front();
    for (std::size_t i = 1; i < items.size(); ++i) {
        result = unionBounds(result, items[i]);
    }
    return result;
}

} // namespace slidelayout
