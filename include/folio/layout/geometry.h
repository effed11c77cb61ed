#pragma once
#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

namespace folio::layout {

constexpr float kInfinity = std::numeric_limits<float>::infinity();

// Tolerance for length comparisons. Layout sums many floats, so exact
// comparisons would make page breaks depend on rounding noise.
constexpr float kLengthEpsilon = 1e-4f;

// Whether `needed` fits into `available`.
inline bool fits(float available, float needed) { return needed - available < kLengthEpsilon; }
inline bool approx_eq(float a, float b) { return std::abs(a - b) < kLengthEpsilon; }

enum class Axis { X, Y };

inline Axis other_axis(Axis axis) { return axis == Axis::X ? Axis::Y : Axis::X; }

template <typename T>
struct Axes {
    T x{};
    T y{};

    Axes() = default;
    Axes(T x_value, T y_value) : x(x_value), y(y_value) {}

    static Axes splat(T value) { return Axes(value, value); }

    T get(Axis axis) const { return axis == Axis::X ? x : y; }
    T& get_mut(Axis axis) { return axis == Axis::X ? x : y; }
    void set(Axis axis, T value) { get_mut(axis) = value; }

    bool operator==(const Axes& other) const = default;
};

struct Size {
    float width = 0, height = 0;

    Size() = default;
    Size(float w, float h) : width(w), height(h) {}

    float get(Axis axis) const { return axis == Axis::X ? width : height; }
    float& get_mut(Axis axis) { return axis == Axis::X ? width : height; }
    void set(Axis axis, float value) { get_mut(axis) = value; }

    bool is_finite() const { return std::isfinite(width) && std::isfinite(height); }
    Axes<bool> finite_axes() const { return {std::isfinite(width), std::isfinite(height)}; }

    Size min(const Size& other) const {
        return {std::min(width, other.width), std::min(height, other.height)};
    }
    // Pick per axis: `other` where the flag is set, this size otherwise.
    Size select(const Axes<bool>& flags, const Size& other) const {
        return {flags.x ? other.width : width, flags.y ? other.height : height};
    }

    Size operator+(const Size& o) const { return {width + o.width, height + o.height}; }
    Size operator-(const Size& o) const { return {width - o.width, height - o.height}; }
    bool operator==(const Size& o) const = default;
};

struct Point {
    float x = 0, y = 0;

    Point() = default;
    Point(float px, float py) : x(px), y(py) {}

    static Point with_x(float x) { return {x, 0}; }
    static Point with_y(float y) { return {0, y}; }

    Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    bool operator==(const Point& o) const = default;
};

struct EdgeSizes {
    float top = 0, right = 0, bottom = 0, left = 0;

    Size sum_by_axis() const { return {left + right, top + bottom}; }
    bool operator==(const EdgeSizes& o) const = default;
};

// Writing or stacking direction.
enum class Dir { LTR, RTL, TTB, BTT };

inline Axis dir_axis(Dir dir) { return (dir == Dir::LTR || dir == Dir::RTL) ? Axis::X : Axis::Y; }
inline bool dir_is_positive(Dir dir) { return dir == Dir::LTR || dir == Dir::TTB; }

// An alignment resolved to the physical coordinate system: Start is left/top.
enum class FixedAlignment { Start = 0, Center = 1, End = 2 };

inline float align_position(FixedAlignment align, float extent) {
    switch (align) {
        case FixedAlignment::Start: return 0;
        case FixedAlignment::Center: return extent / 2;
        case FixedAlignment::End: return extent;
    }
    return 0;
}

inline FixedAlignment align_max(FixedAlignment a, FixedAlignment b) { return a < b ? b : a; }
inline FixedAlignment align_min(FixedAlignment a, FixedAlignment b) { return a < b ? a : b; }

// The physical alignment of a direction's start side.
inline FixedAlignment dir_start(Dir dir) {
    return dir_is_positive(dir) ? FixedAlignment::Start : FixedAlignment::End;
}

enum class HAlign { Start, Left, Center, Right, End };
enum class VAlign { Top, Horizon, Bottom };

// A logical alignment as written in styles. Unset components fall back to
// start/top when resolved.
struct Alignment {
    std::optional<HAlign> x;
    std::optional<VAlign> y;

    Alignment() = default;
    Alignment(std::optional<HAlign> h, std::optional<VAlign> v) : x(h), y(v) {}

    FixedAlignment fix_x(Dir text_dir) const;
    FixedAlignment fix_y() const;
    Axes<FixedAlignment> resolve(Dir text_dir) const { return {fix_x(text_dir), fix_y()}; }

    bool operator==(const Alignment& o) const = default;
};

// A length made of an absolute part, a font-relative part and a part relative
// to the containing size.
struct Rel {
    float abs = 0;
    float em = 0;
    float ratio = 0;

    static Rel pt(float value) { return {value, 0, 0}; }
    static Rel ems(float value) { return {0, value, 0}; }
    static Rel percent(float value) { return {0, 0, value / 100.0f}; }

    float resolve(float font_size, float base) const {
        float result = abs + em * font_size;
        if (ratio != 0) result += ratio * base;
        return result;
    }
    bool is_zero() const { return abs == 0 && em == 0 && ratio == 0; }
    bool operator==(const Rel& o) const = default;
};

// A fractional unit of remaining space.
struct Fr {
    float value = 0;

    Fr() = default;
    explicit Fr(float v) : value(v) {}

    // This fraction's share of `remaining` when `total` fractions compete.
    float share(Fr total, float remaining) const {
        if (total.value <= 0) return 0;
        float ratio = value / total.value;
        if (!std::isfinite(ratio) || !std::isfinite(remaining)) return 0;
        return ratio * remaining;
    }

    Fr& operator+=(Fr other) {
        value += other.value;
        return *this;
    }
    bool operator==(const Fr& o) const = default;
};

struct Spacing {
    enum class Kind { Rel, Fr };
    Kind kind = Kind::Rel;
    Rel rel;
    Fr fr;

    static Spacing absolute(float pt) { return {Kind::Rel, Rel::pt(pt), Fr()}; }
    static Spacing relative(Rel value) { return {Kind::Rel, value, Fr()}; }
    static Spacing fractional(float value) { return {Kind::Fr, Rel(), Fr(value)}; }

    bool is_fractional() const { return kind == Kind::Fr; }
    bool operator==(const Spacing& o) const = default;
};

} // namespace folio::layout
