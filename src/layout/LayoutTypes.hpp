#pragma once

#include <cstddef>
#include <limits>
#include <optional>

namespace lintel {

/// Width/height pair reported by children and by a layout's measure pass
struct Size {
    float width = 0.0f;
    float height = 0.0f;

    constexpr Size() = default;
    constexpr Size(float w, float h) : width(w), height(h) {}

    bool operator==(const Size& other) const { return width == other.width && height == other.height; }
    bool operator!=(const Size& other) const { return !(*this == other); }
};

/// The space a parent offers during measurement.
/// A missing component means "unconstrained" on that axis.
struct ProposedSize {
    std::optional<float> width;
    std::optional<float> height;

    static ProposedSize unspecified() { return {}; }
    static ProposedSize fixedWidth(float w) { return {w, std::nullopt}; }
    static ProposedSize exactly(float w, float h) { return {w, h}; }

    /// Width used for overflow comparisons (unconstrained = +infinity)
    float widthOrInfinity() const {
        return width ? *width : std::numeric_limits<float>::infinity();
    }
};

/// Concrete rectangle assigned by the parent at placement time
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float x, float y, float w, float h)
        : x(x), y(y), width(w), height(h) {}

    float minX() const { return x; }
    float midX() const { return x + width * 0.5f; }
    float maxX() const { return x + width; }
    float minY() const { return y; }
    float midY() const { return y + height * 0.5f; }
    float maxY() const { return y + height; }
};

/// Position and size assigned to one child. Origin is the top-left corner.
struct Placement {
    size_t index = 0;
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    bool operator==(const Placement& other) const {
        return index == other.index && x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }
    bool operator!=(const Placement& other) const { return !(*this == other); }

    Rect toRect() const { return Rect(x, y, width, height); }
};

} // namespace lintel
