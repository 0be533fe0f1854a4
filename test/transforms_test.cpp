#include <doctest/doctest.h>
#include <isogml/geo/transforms.hpp>

using namespace isogml;
using namespace isogml::geo;

TEST_CASE("Geodetic to ECEF reference points") {
    SUBCASE("equator, prime meridian") {
        auto e = geodetic_to_ecef(dp::Geo{0.0, 0.0, 0.0});
        CHECK(e.x == doctest::Approx(wgs84::A));
        CHECK(e.y == doctest::Approx(0.0));
        CHECK(e.z == doctest::Approx(0.0));
    }

    SUBCASE("north pole") {
        auto e = geodetic_to_ecef(dp::Geo{90.0, 0.0, 0.0});
        CHECK(e.x == doctest::Approx(0.0).epsilon(1e-6));
        CHECK(e.z == doctest::Approx(wgs84::B).epsilon(1e-9));
    }
}

TEST_CASE("ECEF round trip") {
    dp::Geo p{52.0123456, 5.6543210, 12.345};
    auto back = ecef_to_geodetic(geodetic_to_ecef(p));
    CHECK(back.latitude == doctest::Approx(p.latitude).epsilon(1e-10));
    CHECK(back.longitude == doctest::Approx(p.longitude).epsilon(1e-10));
    CHECK(back.altitude == doctest::Approx(p.altitude).epsilon(1e-6));
}

TEST_CASE("ENU at the origin") {
    dp::Geo origin{48.1234, 11.5678, 450.0};
    auto l = geodetic_to_enu(origin, origin);
    CHECK(l.east == doctest::Approx(0.0));
    CHECK(l.north == doctest::Approx(0.0));
    CHECK(l.up == doctest::Approx(0.0));
}

TEST_CASE("ENU axes point east and north") {
    dp::Geo origin{48.0, 11.0, 500.0};

    auto north = geodetic_to_enu(dp::Geo{48.0001, 11.0, 500.0}, origin);
    CHECK(north.north == doctest::Approx(11.12).epsilon(0.01));
    CHECK(std::abs(north.east) < 1e-6);

    auto east = geodetic_to_enu(dp::Geo{48.0, 11.0001, 500.0}, origin);
    CHECK(east.east == doctest::Approx(7.45).epsilon(0.01));
    CHECK(std::abs(east.north) < 1e-3);
}

TEST_CASE("ENU round trip within a field") {
    dp::Geo origin{52.0, 5.0, 10.0};
    Enu l{123.456, -78.9, 1.5};
    auto g = enu_to_geodetic(l, origin);
    auto back = geodetic_to_enu(g, origin);
    CHECK(back.east == doctest::Approx(l.east).epsilon(1e-6));
    CHECK(back.north == doctest::Approx(l.north).epsilon(1e-6));
    CHECK(back.up == doctest::Approx(l.up).epsilon(1e-5));
}

TEST_CASE("ENU from concord matches the ECEF rotation") {
    dp::Geo origin{48.1234, 11.5678, 450.0};
    dp::Geo p{48.1245, 11.5701, 452.0};

    auto direct = geodetic_to_enu(p, origin);
    auto rotated = ecef_to_enu(geodetic_to_ecef(p), origin);
    CHECK(direct.east == doctest::Approx(rotated.east).epsilon(1e-6));
    CHECK(direct.north == doctest::Approx(rotated.north).epsilon(1e-6));
    CHECK(direct.up == doctest::Approx(rotated.up).epsilon(1e-3));

    SUBCASE("WGS and dp::Geo inputs agree") {
        auto wgs = geodetic_to_enu(concord::earth::WGS(p.latitude, p.longitude, p.altitude), origin);
        CHECK(wgs.east == doctest::Approx(direct.east));
        CHECK(wgs.north == doctest::Approx(direct.north));
        CHECK(wgs.up == doctest::Approx(direct.up));
    }

    SUBCASE("concord ECEF inverts through the closed form") {
        auto back = ecef_to_geodetic(geodetic_to_ecef(p));
        CHECK(back.latitude == doctest::Approx(p.latitude).epsilon(1e-10));
        CHECK(back.longitude == doctest::Approx(p.longitude).epsilon(1e-10));
        CHECK(back.altitude == doctest::Approx(p.altitude).epsilon(1e-4));
    }
}
