#include <isogml/sim/trajectory.hpp>
#include <echo/echo.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>

using namespace isogml;
using namespace isogml::sim;

int main() {
    echo::info("=== Towed Implement Trajectory Demo ===");

    // Simulated field reference point
    dp::Geo field_origin{48.1234, 11.5678, 450.0};
    echo::info("Reference: lat=", field_origin.latitude, " lon=", field_origin.longitude);

    // Antenna trace: 40 m north, then a right-hand half circle of 12 m radius
    timelog::ChannelSet header;
    header.add(timelog::Column::header(channel::POSITION_NORTH, timelog::ScalarKind::Int32));
    header.add(timelog::Column::header(channel::POSITION_EAST, timelog::ScalarKind::Int32));
    header.add(timelog::Column::header(channel::POSITION_UP, timelog::ScalarKind::Int32));
    auto* north = header.find(channel::POSITION_NORTH)->as_i32();
    auto* east = header.find(channel::POSITION_EAST)->as_i32();
    auto* up = header.find(channel::POSITION_UP)->as_i32();

    constexpr i32 STRAIGHT = 40;
    constexpr i32 ARC = 40;
    constexpr f64 RADIUS = 12.0;
    auto push = [&](f64 e, f64 n) {
        auto g = geo::enu_to_geodetic(geo::Enu{e, n, 0.0}, field_origin);
        north->push_back(static_cast<i32>(std::lround(g.latitude / LAT_LON_RESOLUTION)));
        east->push_back(static_cast<i32>(std::lround(g.longitude / LAT_LON_RESOLUTION)));
        up->push_back(static_cast<i32>(std::lround(g.altitude / HEIGHT_RESOLUTION)));
    };
    for (i32 i = 0; i < STRAIGHT; ++i)
        push(0.0, i * 1.0);
    for (i32 i = 1; i <= ARC; ++i) {
        f64 a = std::numbers::pi * i / ARC;
        push(RADIUS - RADIUS * std::cos(a), STRAIGHT - 1.0 + RADIUS * std::sin(a));
    }
    echo::info("Generated ", header.rows(), " antenna fixes");

    // Antenna 1.5 m ahead of the rear axle, hitch 1.2 m behind it, 5 m drawbar
    geometry::GeometryRecord trailer;
    trailer.element = "DET-1";
    trailer.description = "Trailer";
    trailer.connection = geometry::ConnectionType::Towed;
    trailer.tractor_navigation_point = geometry::Point3(1.5, 0.0, 0.0);
    trailer.tractor_connector_point = geometry::Point3(-1.2, 0.0, 0.0);
    trailer.implement_connector_point = geometry::Point3(5.0, 0.0, 0.0);

    // Same point rigidly mounted, for comparison
    geometry::GeometryRecord rigid = trailer;
    rigid.description = "Rigid";
    rigid.connection = geometry::ConnectionType::Mounted;

    dp::Vector<geometry::GeometryRecord> records = {trailer, rigid, geometry::original_record()};

    TrajectorySimulator simulator(SimulationOptions{}.set_cartesian(true));
    if (!simulator.simulate(header, records)) {
        echo::error("Simulation failed");
        return 1;
    }

    echo::info("\n--- Local ENU positions (mm) ---");
    const auto& tn = *records[0].header_channels.find(channel::POSITION_NORTH)->as_i32();
    const auto& te = *records[0].header_channels.find(channel::POSITION_EAST)->as_i32();
    const auto& rn = *records[1].header_channels.find(channel::POSITION_NORTH)->as_i32();
    const auto& re = *records[1].header_channels.find(channel::POSITION_EAST)->as_i32();
    for (usize i = 0; i < tn.size(); i += 10) {
        echo::info("  [", i, "] heading=", simulator.headings()[i], " trailer E=", te[i], " N=", tn[i],
                   "  rigid E=", re[i], " N=", rn[i]);
    }

    // Off-tracking: how far the trailer cuts inside the rigid point in the turn
    echo::info("\n--- Off-tracking ---");
    f64 max_offtrack = 0.0;
    for (usize i = STRAIGHT; i < tn.size(); ++i) {
        f64 dx = (te[i] - re[i]) * 1e-3;
        f64 dy = (tn[i] - rn[i]) * 1e-3;
        max_offtrack = std::max(max_offtrack, std::sqrt(dx * dx + dy * dy));
    }
    echo::info("Max trailer deviation from rigid point: ", max_offtrack, " m");

    echo::info("\nDone.");
    return 0;
}
