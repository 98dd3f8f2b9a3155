#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>
#include <variant>

namespace marquee {

// ============================================================================
// Basic type aliases
// ============================================================================

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

// ============================================================================
// Result - value or error, returned across every fallible boundary
//
//   Result<RasterImage, std::string> r = decode(...);
//   if (!r) return make_error(std::move(r).error());
// ============================================================================

template<typename E>
struct Error {
    E value;

    explicit Error(E e) : value(std::move(e)) {}
};

template<typename E>
[[nodiscard]] Error<std::decay_t<E>> make_error(E&& e) {
    return Error<std::decay_t<E>>(std::forward<E>(e));
}

template<typename T, typename E>
class Result {
public:
    using ValueType = T;
    using ErrorType = E;

    // Implicit from anything convertible to T, except another Result
    template<typename U = T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Result> &&
                                         std::is_constructible_v<T, U&&>>>
    Result(U&& value) : m_data(std::in_place_index<0>, std::forward<U>(value)) {}

    Result(Error<E> error) : m_data(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_data.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_data.index() == 1; }
    [[nodiscard]] explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] T& value() & { return std::get<0>(m_data); }
    [[nodiscard]] const T& value() const& { return std::get<0>(m_data); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_data)); }

    [[nodiscard]] E& error() & { return std::get<1>(m_data).value; }
    [[nodiscard]] const E& error() const& { return std::get<1>(m_data).value; }
    [[nodiscard]] E&& error() && { return std::move(std::get<1>(m_data).value); }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(m_data) : std::move(fallback);
    }

    [[nodiscard]] T value_or(T fallback) && {
        return is_ok() ? std::get<0>(std::move(m_data)) : std::move(fallback);
    }

private:
    std::variant<T, Error<E>> m_data;
};

// ============================================================================
// Geometry (pixel space, y down)
// ============================================================================

template<typename T>
struct Point {
    T x{};
    T y{};

    constexpr Point() = default;
    constexpr Point(T x_, T y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& other) const { return {x + other.x, y + other.y}; }
    constexpr Point operator-(const Point& other) const { return {x - other.x, y - other.y}; }

    constexpr bool operator==(const Point& other) const = default;
};

template<typename T>
struct Size {
    T width{};
    T height{};

    constexpr Size() = default;
    constexpr Size(T w, T h) : width(w), height(h) {}

    [[nodiscard]] constexpr bool is_empty() const { return width <= T{} || height <= T{}; }

    constexpr bool operator==(const Size& other) const = default;
};

template<typename T>
struct Rect {
    T x{};
    T y{};
    T width{};
    T height{};

    constexpr Rect() = default;
    constexpr Rect(T x_, T y_, T w, T h) : x(x_), y(y_), width(w), height(h) {}
    constexpr Rect(Point<T> origin, Size<T> size)
        : x(origin.x), y(origin.y), width(size.width), height(size.height) {}

    [[nodiscard]] constexpr T left() const { return x; }
    [[nodiscard]] constexpr T top() const { return y; }
    [[nodiscard]] constexpr T right() const { return x + width; }
    [[nodiscard]] constexpr T bottom() const { return y + height; }
    [[nodiscard]] constexpr Size<T> size() const { return {width, height}; }

    [[nodiscard]] constexpr bool is_empty() const { return width <= T{} || height <= T{}; }

    // Empty rect when the two do not overlap
    [[nodiscard]] constexpr Rect intersection(const Rect& other) const {
        const T l = std::max(left(), other.left());
        const T t = std::max(top(), other.top());
        const T r = std::min(right(), other.right());
        const T b = std::min(bottom(), other.bottom());
        if (r <= l || b <= t) {
            return {};
        }
        return {l, t, r - l, b - t};
    }

    constexpr bool operator==(const Rect& other) const = default;
};

using PointI = Point<i32>;
using SizeI = Size<i32>;
using RectI = Rect<i32>;

// ============================================================================
// Color - 8-bit RGBA, straight (non-premultiplied) alpha
// ============================================================================

struct Color {
    u8 r{0};
    u8 g{0};
    u8 b{0};
    u8 a{255};

    constexpr Color() = default;
    constexpr Color(u8 r_, u8 g_, u8 b_, u8 a_ = 255) : r(r_), g(g_), b(b_), a(a_) {}

    [[nodiscard]] constexpr Color with_alpha(u8 alpha) const { return {r, g, b, alpha}; }
    [[nodiscard]] constexpr bool same_rgb(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }

    constexpr bool operator==(const Color& other) const = default;

    static constexpr Color black() { return {0, 0, 0}; }
    static constexpr Color white() { return {255, 255, 255}; }
    static constexpr Color transparent() { return {0, 0, 0, 0}; }
};

} // namespace marquee
