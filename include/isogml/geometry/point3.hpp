#pragma once

#include "../core/dynamic_ref.hpp"
#include "../core/types.hpp"
#include <cmath>
#include <datapod/datapod.hpp>

namespace isogml::geometry {

    // ─── Point3 ──────────────────────────────────────────────────────────────────
    // Offset in a vehicle frame, metres, ENU sign convention (+x forward, +y left,
    // +z up). An axis with a DynamicRef is read per sample; its constant is ignored
    // until resolved. Arithmetic uses the constants only.
    struct Point3 {
        f64 x = 0.0;
        f64 y = 0.0;
        f64 z = 0.0;
        dp::Optional<DynamicRef> dyn_x;
        dp::Optional<DynamicRef> dyn_y;
        dp::Optional<DynamicRef> dyn_z;

        Point3() = default;
        Point3(f64 x_, f64 y_, f64 z_) : x(x_), y(y_), z(z_) {}

        bool is_dynamic() const noexcept { return dyn_x.has_value() || dyn_y.has_value() || dyn_z.has_value(); }

        // Neither dynamic nor a non-zero constant on any axis
        bool is_default() const noexcept { return !is_dynamic() && x == 0.0 && y == 0.0 && z == 0.0; }

        Point3 operator+(const Point3 &o) const noexcept { return Point3(x + o.x, y + o.y, z + o.z); }
        Point3 operator-(const Point3 &o) const noexcept { return Point3(x - o.x, y - o.y, z - o.z); }

        f64 dot(const Point3 &o) const noexcept { return x * o.x + y * o.y + z * o.z; }

        // Rotation about the vertical axis by `angle` radians (counter-clockwise)
        Point3 rotated(f64 angle) const noexcept {
            f64 c = std::cos(angle);
            f64 s = std::sin(angle);
            return Point3(x * c - y * s, x * s + y * c, z);
        }

        // Constants only; dynamic refs are not part of the value
        bool same_value(const Point3 &o) const noexcept { return x == o.x && y == o.y && z == o.z; }

        bool operator==(const Point3 &o) const noexcept {
            return same_value(o) && same_ref(dyn_x, o.dyn_x) && same_ref(dyn_y, o.dyn_y) && same_ref(dyn_z, o.dyn_z);
        }

      private:
        static bool same_ref(const dp::Optional<DynamicRef> &a, const dp::Optional<DynamicRef> &b) noexcept {
            if (a.has_value() != b.has_value())
                return false;
            return !a.has_value() || *a == *b;
        }
    };

    inline Point3 unit_vector(f64 angle) noexcept { return Point3(std::cos(angle), std::sin(angle), 0.0); }

} // namespace isogml::geometry
