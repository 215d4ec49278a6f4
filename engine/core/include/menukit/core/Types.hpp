#pragma once

#include <cstdint>

namespace menukit::core {

struct Point {
    std::int32_t x{};
    std::int32_t y{};

    constexpr bool operator==(const Point& other) const noexcept {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Point& other) const noexcept {
        return !(*this == other);
    }
};

struct Size {
    std::int32_t w{};
    std::int32_t h{};

    constexpr bool operator==(const Size& other) const noexcept {
        return w == other.w && h == other.h;
    }

    constexpr bool operator!=(const Size& other) const noexcept {
        return !(*this == other);
    }
};

struct Rect {
    std::int32_t x{};
    std::int32_t y{};
    std::int32_t w{};
    std::int32_t h{};

    constexpr std::int32_t right() const noexcept { return x + w; }
    constexpr std::int32_t bottom() const noexcept { return y + h; }
    constexpr Point topleft() const noexcept { return Point{x, y}; }
    constexpr Size size() const noexcept { return Size{w, h}; }
};

// Both corners are part of the rectangle.
constexpr bool Inside(const Rect& rect, const Point& point) noexcept {
    return rect.x <= point.x && point.x <= rect.right() && rect.y <= point.y &&
           point.y <= rect.bottom();
}

struct Color {
    std::uint8_t r{255};
    std::uint8_t g{255};
    std::uint8_t b{255};
    std::uint8_t a{255};

    constexpr bool operator==(const Color& other) const noexcept {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    constexpr bool operator!=(const Color& other) const noexcept {
        return !(*this == other);
    }
};

// Discrete 2-D hat direction, each component in {-1, 0, 1}.
struct HatValue {
    std::int8_t x{};
    std::int8_t y{};

    constexpr bool neutral() const noexcept { return x == 0 && y == 0; }

    constexpr bool operator==(const HatValue& other) const noexcept {
        return x == other.x && y == other.y;
    }
};

}  // namespace menukit::core
