#pragma once

#include "types.hpp"

namespace isogml {

    // ─── ISO 11783-11 DDIs used for geometry ─────────────────────────────────────
    namespace ddi {
        inline constexpr DDI DEVICE_ELEMENT_OFFSET_X = 134; // 0x0086, mm, +x forward
        inline constexpr DDI DEVICE_ELEMENT_OFFSET_Y = 135; // 0x0087, mm, +y right
        inline constexpr DDI DEVICE_ELEMENT_OFFSET_Z = 136; // 0x0088, mm, +z down
        inline constexpr DDI YAW_ANGLE = 144;               // 0x0090
    } // namespace ddi

    // ─── Device element types (DET attribute B) ──────────────────────────────────
    enum class DeviceElementType : u8 {
        Device = 1,
        Function = 2,
        Bin = 3,
        Section = 4,
        Unit = 5,
        Connector = 6,
        NavigationReference = 7
    };

    // ─── Fixed-point scales of the time-log position record ─────────────────────
    inline constexpr f64 LAT_LON_RESOLUTION = 1e-7; // degrees per LSB
    inline constexpr f64 HEIGHT_RESOLUTION = 1e-3;  // metres per LSB
    inline constexpr f64 MM_TO_M = 1e-3;

    // ─── Header channel names ────────────────────────────────────────────────────
    namespace channel {
        inline constexpr const char *TIME_START_TOFD = "TimeStartTOFD";
        inline constexpr const char *TIME_START_DATE = "TimeStartDATE";
        inline constexpr const char *POSITION_NORTH = "PositionNorth";
        inline constexpr const char *POSITION_EAST = "PositionEast";
        inline constexpr const char *POSITION_UP = "PositionUp";
        inline constexpr const char *POSITION_STATUS = "PositionStatus";
        inline constexpr const char *PDOP = "PDOP";
        inline constexpr const char *HDOP = "HDOP";
        inline constexpr const char *NUMBER_OF_SATELLITES = "NumberOfSatellites";
        inline constexpr const char *GPS_UTC_TIME = "GpsUtcTime";
        inline constexpr const char *GPS_UTC_DATE = "GpsUtcDate";
    } // namespace channel

    // Element id of the geometry bucket that collects unattributed channels
    inline constexpr const char *ORIGINAL_ELEMENT = "original";

} // namespace isogml
