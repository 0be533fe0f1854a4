#include <doctest/doctest.h>
#include <isogml/core/constants.hpp>
#include <isogml/core/dynamic_ref.hpp>
#include <isogml/core/error.hpp>

using namespace isogml;

TEST_CASE("Error factories carry their code") {
    CHECK(Error::io("x").code == ErrorCode::IoError);
    CHECK(Error::schema_mismatch().code == ErrorCode::SchemaMismatch);
    CHECK(Error::format().code == ErrorCode::FormatError);
    CHECK(Error::geometry().code == ErrorCode::GeometryResolution);
    CHECK(Error::binary_format().code == ErrorCode::BinaryFormat);
    CHECK(Error::invalid_argument().code == ErrorCode::InvalidArgument);

    SUBCASE("message is kept") {
        auto e = Error::io("missing TLG00001.BIN");
        CHECK(e.message == "missing TLG00001.BIN");
    }

    SUBCASE("not_unique names the match count") {
        auto e = Error::not_unique("device DVC-1", 2);
        CHECK(e.code == ErrorCode::SchemaMismatch);
        CHECK(e.message == "device DVC-1: expected exactly one match, found 2");
    }
}

TEST_CASE("Result wraps value or error") {
    Result<i32> ok = Result<i32>::ok(42);
    CHECK(ok.is_ok());
    CHECK(ok.value() == 42);

    Result<i32> bad = Result<i32>::err(Error::format("bad"));
    CHECK_FALSE(bad.is_ok());
    CHECK(bad.error().code == ErrorCode::FormatError);
}

TEST_CASE("Geometry DDIs") {
    CHECK(ddi::DEVICE_ELEMENT_OFFSET_X == 0x0086);
    CHECK(ddi::DEVICE_ELEMENT_OFFSET_Y == 0x0087);
    CHECK(ddi::DEVICE_ELEMENT_OFFSET_Z == 0x0088);
    CHECK(ddi::YAW_ANGLE == 0x0090);
    CHECK(static_cast<u8>(DeviceElementType::NavigationReference) == 7);
}

TEST_CASE("DynamicRef equality") {
    DynamicRef a{"DET-1", 134};
    DynamicRef b{"DET-1", 134};
    DynamicRef c{"DET-1", 135};
    DynamicRef d{"DET-2", 134};
    CHECK(a == b);
    CHECK(a != c);
    CHECK(a != d);
}
