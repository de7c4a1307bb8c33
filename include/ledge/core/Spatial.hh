#pragma once

#include <cmath>

namespace ledge {

// Compile-time tags keeping positions and velocities apart. Mixing them in
// arithmetic fails to compile; convert explicitly with as<>().
namespace Space {
struct World {};
struct Velocity {};
} // namespace Space

/**
 * @brief 2D vector in the XY plane, +x right, +y up.
 *
 * @tparam T Component type
 * @tparam SpaceTag Space::World or Space::Velocity
 */
template <typename T, typename SpaceTag = Space::World> struct Vector2 {
    T x = T(0);
    T y = T(0);

    constexpr Vector2() = default;
    constexpr Vector2(T px, T py) : x(px), y(py) {}

    constexpr Vector2 operator+(const Vector2& rhs) const { return {x + rhs.x, y + rhs.y}; }
    constexpr Vector2 operator-(const Vector2& rhs) const { return {x - rhs.x, y - rhs.y}; }
    constexpr Vector2 operator*(T s) const { return {x * s, y * s}; }

    template <typename Other> Vector2 operator+(const Vector2<T, Other>&) const = delete;
    template <typename Other> Vector2 operator-(const Vector2<T, Other>&) const = delete;

    constexpr bool operator==(const Vector2& rhs) const { return x == rhs.x && y == rhs.y; }

    constexpr T dot(const Vector2& rhs) const { return x * rhs.x + y * rhs.y; }
    constexpr T lengthSquared() const { return dot(*this); }
    T length() const { return std::sqrt(lengthSquared()); }

    // Reinterpret in another space (e.g. a direction as a velocity)
    template <typename Target> constexpr Vector2<T, Target> as() const { return {x, y}; }
};

using Vec2f = Vector2<float, Space::World>;
using Velocity2f = Vector2<float, Space::Velocity>;

// -1, 0 or +1
template <typename T> constexpr int signOf(T value) {
    return (T(0) < value) - (value < T(0));
}

} // namespace ledge
