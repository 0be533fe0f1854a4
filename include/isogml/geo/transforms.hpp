#pragma once

#include "../core/types.hpp"
#include <cmath>
#include <concord/concord.hpp>
#include <datapod/datapod.hpp>
#include <numbers>

namespace isogml::geo {

    // ─── WGS-84 ellipsoid ────────────────────────────────────────────────────────
    namespace wgs84 {
        inline constexpr f64 A = 6378137.0;      // semi-major axis (m)
        inline constexpr f64 B = 6356752.314245; // semi-minor axis (m)
        inline constexpr f64 F = (A - B) / A;    // flattening
        inline constexpr f64 E_SQ = F * (2.0 - F);
    } // namespace wgs84

    // ─── Coordinate value types ──────────────────────────────────────────────────
    // Geodetic positions use dp::Geo (latitude/longitude in degrees, altitude in m).
    struct Ecef {
        f64 x = 0.0;
        f64 y = 0.0;
        f64 z = 0.0;
    };

    struct Enu {
        f64 east = 0.0;
        f64 north = 0.0;
        f64 up = 0.0;
    };

    inline constexpr f64 deg_to_rad(f64 deg) noexcept { return deg * std::numbers::pi / 180.0; }
    inline constexpr f64 rad_to_deg(f64 rad) noexcept { return rad * 180.0 / std::numbers::pi; }

    inline concord::earth::WGS to_wgs(const dp::Geo &p) { return concord::earth::WGS(p.latitude, p.longitude, p.altitude); }

    // ─── Geodetic <-> ECEF ───────────────────────────────────────────────────────
    inline Ecef geodetic_to_ecef(const dp::Geo &p) {
        auto e = concord::earth::to_ecf(to_wgs(p));
        return Ecef{e.x, e.y, e.z};
    }

    // Bowring's closed-form inverse; concord offers no ECEF -> WGS path
    inline dp::Geo ecef_to_geodetic(const Ecef &e) noexcept {
        f64 eps = wgs84::E_SQ / (1.0 - wgs84::E_SQ);
        f64 p = std::sqrt(e.x * e.x + e.y * e.y);
        f64 q = std::atan2(e.z * wgs84::A, p * wgs84::B);
        f64 sin_q = std::sin(q);
        f64 cos_q = std::cos(q);
        f64 sin_q3 = sin_q * sin_q * sin_q;
        f64 cos_q3 = cos_q * cos_q * cos_q;

        f64 lat = std::atan2(e.z + eps * wgs84::B * sin_q3, p - wgs84::E_SQ * wgs84::A * cos_q3);
        f64 lon = std::atan2(e.y, e.x);
        f64 sin_lat = std::sin(lat);
        f64 v = wgs84::A / std::sqrt(1.0 - wgs84::E_SQ * sin_lat * sin_lat);
        f64 h = p / std::cos(lat) - v;

        return dp::Geo{rad_to_deg(lat), rad_to_deg(lon), h};
    }

    // ─── ECEF <-> local ENU at origin ────────────────────────────────────────────
    // Rotation about the origin's ECEF position. Used for points that only exist in
    // ECEF (simulated element positions on their way back to WGS).
    inline Enu ecef_to_enu(const Ecef &e, const dp::Geo &origin) {
        f64 lat = deg_to_rad(origin.latitude);
        f64 lon = deg_to_rad(origin.longitude);
        f64 sin_lat = std::sin(lat);
        f64 cos_lat = std::cos(lat);
        f64 sin_lon = std::sin(lon);
        f64 cos_lon = std::cos(lon);

        Ecef o = geodetic_to_ecef(origin);
        f64 dx = e.x - o.x;
        f64 dy = e.y - o.y;
        f64 dz = e.z - o.z;

        return Enu{-sin_lon * dx + cos_lon * dy,
                   -cos_lon * sin_lat * dx - sin_lat * sin_lon * dy + cos_lat * dz,
                   cos_lat * cos_lon * dx + cos_lat * sin_lon * dy + sin_lat * dz};
    }

    inline Ecef enu_to_ecef(const Enu &l, const dp::Geo &origin) {
        f64 lat = deg_to_rad(origin.latitude);
        f64 lon = deg_to_rad(origin.longitude);
        f64 sin_lat = std::sin(lat);
        f64 cos_lat = std::cos(lat);
        f64 sin_lon = std::sin(lon);
        f64 cos_lon = std::cos(lon);

        Ecef o = geodetic_to_ecef(origin);
        f64 dx = -sin_lon * l.east - cos_lon * sin_lat * l.north + cos_lat * cos_lon * l.up;
        f64 dy = cos_lon * l.east - sin_lat * sin_lon * l.north + cos_lat * sin_lon * l.up;
        f64 dz = cos_lat * l.north + sin_lat * l.up;

        return Ecef{dx + o.x, dy + o.y, dz + o.z};
    }

    // ─── Geodetic <-> ENU ────────────────────────────────────────────────────────
    inline Enu geodetic_to_enu(const concord::earth::WGS &p, const dp::Geo &origin) {
        auto l = concord::frame::to_enu(origin, p);
        return Enu{l.east(), l.north(), l.up()};
    }

    inline Enu geodetic_to_enu(const dp::Geo &p, const dp::Geo &origin) { return geodetic_to_enu(to_wgs(p), origin); }

    inline dp::Geo enu_to_geodetic(const Enu &l, const dp::Geo &origin) {
        return ecef_to_geodetic(enu_to_ecef(l, origin));
    }

} // namespace isogml::geo
