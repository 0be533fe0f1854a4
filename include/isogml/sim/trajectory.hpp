#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include "../geo/transforms.hpp"
#include "../geometry/point3.hpp"
#include "../geometry/record.hpp"
#include "../timelog/channel.hpp"
#include "heading.hpp"
#include <cmath>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <numbers>

namespace isogml::sim {

    // ─── Simulation options ──────────────────────────────────────────────────────
    struct SimulationOptions {
        bool cartesian = false; // emit local ENU millimetres instead of geodetic fixed point
        // Heading from a measured yaw channel. Not supported yet: the logged yaw
        // does not match the track heading in unit or sign, so the track is used.
        bool use_measured_yaw = false;

        SimulationOptions &set_cartesian(bool v) {
            cartesian = v;
            return *this;
        }
        SimulationOptions &set_use_measured_yaw(bool v) {
            use_measured_yaw = v;
            return *this;
        }
    };

    namespace detail {

        using geometry::Point3;

        // One axis read per sample from a process-data column (mm, ISO sign)
        struct AxisSource {
            const dp::Vector<i32> *values = nullptr;
            f64 sign = 1.0;
        };

        struct PointSource {
            Point3 constant;
            AxisSource x;
            AxisSource y;
            AxisSource z;

            Point3 at(usize i) const noexcept {
                Point3 p(constant.x, constant.y, constant.z);
                if (x.values)
                    p.x = sample(x, i);
                if (y.values)
                    p.y = sample(y, i);
                if (z.values)
                    p.z = sample(z, i);
                return p;
            }

          private:
            static f64 sample(const AxisSource &a, usize i) noexcept {
                if (i >= a.values->size())
                    return 0.0;
                return static_cast<f64>((*a.values)[i]) * MM_TO_M * a.sign;
            }
        };

        inline AxisSource bind_axis(const dp::Optional<DynamicRef> &ref, f64 sign, const timelog::ChannelSet &data,
                                    const XmlId &record) {
            AxisSource a;
            a.sign = sign;
            if (!ref.has_value())
                return a;
            auto matches = data.find(*ref);
            if (matches.size() != 1) {
                echo::category("isogml.sim")
                    .warn("record ", record, ": offset channel ", ref->element, "/", ref->code, " matched ",
                          matches.size(), " channels, axis set to 0");
                a.values = nullptr;
                return a;
            }
            a.values = matches.front()->as_i32();
            return a;
        }

        inline PointSource bind_point(const Point3 &p, const timelog::ChannelSet &data, const XmlId &record) {
            PointSource s;
            s.constant = Point3(p.dyn_x ? 0.0 : p.x, p.dyn_y ? 0.0 : p.y, p.dyn_z ? 0.0 : p.z);
            s.x = bind_axis(p.dyn_x, 1.0, data, record);
            s.y = bind_axis(p.dyn_y, -1.0, data, record);
            s.z = bind_axis(p.dyn_z, -1.0, data, record);
            return s;
        }

        inline bool is_raw_position(const dp::String &name) {
            return name == channel::POSITION_NORTH || name == channel::POSITION_EAST || name == channel::POSITION_UP;
        }

    } // namespace detail

    // ─── Trajectory simulator ────────────────────────────────────────────────────
    // Replaces the antenna trace with the trace of each record's instrumented
    // point, using the estimated tractor heading and a kinematic hitch model for
    // towed implements.
    class TrajectorySimulator {
        SimulationOptions options_;
        dp::Vector<f64> headings_;

      public:
        explicit TrajectorySimulator(SimulationOptions options = {}) : options_(options) {}

        const dp::Vector<f64> &headings() const noexcept { return headings_; }

        bool simulate(const timelog::ChannelSet &header, dp::Vector<geometry::GeometryRecord> &records) {
            const auto *north_col = header.find(channel::POSITION_NORTH);
            const auto *east_col = header.find(channel::POSITION_EAST);
            const auto *up_col = header.find(channel::POSITION_UP);
            const auto *north = north_col ? north_col->as_i32() : nullptr;
            const auto *east = east_col ? east_col->as_i32() : nullptr;
            const auto *up = up_col ? up_col->as_i32() : nullptr;
            if (!north || !east) {
                echo::category("isogml.sim").warn("time-log has no position channels, nothing to simulate");
                return false;
            }
            if (options_.use_measured_yaw) {
                echo::category("isogml.sim").warn("measured yaw is not supported, estimating heading from track");
            }

            const usize n = std::min(north->size(), east->size());
            auto fix_at = [&](usize i) {
                f64 h = (up && i < up->size()) ? static_cast<f64>((*up)[i]) * HEIGHT_RESOLUTION : 0.0;
                return dp::Geo{static_cast<f64>((*north)[i]) * LAT_LON_RESOLUTION,
                               static_cast<f64>((*east)[i]) * LAT_LON_RESOLUTION, h};
            };

            // Step 1: fixes in a local tangent plane at the first fix
            dp::Vector<geo::Enu> fixes;
            fixes.reserve(n);
            dp::Geo origin = n > 0 ? fix_at(0) : dp::Geo{0.0, 0.0, 0.0};
            for (usize i = 0; i < n; ++i)
                fixes.push_back(geo::geodetic_to_enu(fix_at(i), origin));

            // Step 2: tractor heading
            headings_ = estimate_headings(fixes);

            // Step 3: per-record kinematic chain
            for (auto &record : records)
                simulate_record(header, fixes, origin, record);

            echo::category("isogml.sim").info("simulated ", records.size(), " points over ", n, " samples");
            return true;
        }

      private:
        void simulate_record(const timelog::ChannelSet &header, const dp::Vector<geo::Enu> &fixes,
                             const dp::Geo &origin, geometry::GeometryRecord &record) const {
            using geometry::Point3;
            constexpr f64 pi = std::numbers::pi;

            const auto &data = record.data_channels;
            auto navigation = detail::bind_point(record.tractor_navigation_point, data, record.element);
            auto tractor_connector = detail::bind_point(record.tractor_connector_point, data, record.element);
            auto implement_connector = detail::bind_point(record.implement_connector_point, data, record.element);
            auto element = detail::bind_point(record.implement_element_point, data, record.element);

            auto out_north = timelog::Column::header(channel::POSITION_NORTH, timelog::ScalarKind::Int32);
            auto out_east = timelog::Column::header(channel::POSITION_EAST, timelog::ScalarKind::Int32);
            auto out_up = timelog::Column::header(channel::POSITION_UP, timelog::ScalarKind::Int32);
            auto *north = out_north.as_i32();
            auto *east = out_east.as_i32();
            auto *up = out_up.as_i32();

            f64 implement_heading = 0.0;
            dp::Optional<Point3> previous_hitch;

            for (usize i = 0; i < fixes.size(); ++i) {
                f64 tractor_heading = headings_[i];
                Point3 p(fixes[i].east, fixes[i].north, fixes[i].up);

                // antenna -> tractor reference -> hitch
                p = p - navigation.at(i).rotated(tractor_heading);
                p = p + tractor_connector.at(i).rotated(tractor_heading);

                Point3 ic = implement_connector.at(i);
                if (record.connection == geometry::ConnectionType::Mounted) {
                    implement_heading = tractor_heading;
                } else if (previous_hitch.has_value() && ic.x > 0.0) {
                    // Non-holonomic trailer: only hitch motion across the drawbar turns it
                    Point3 velocity = p - *previous_hitch;
                    implement_heading += velocity.dot(geometry::unit_vector(implement_heading + pi / 2.0)) / ic.x;
                    implement_heading = wrap_angle(implement_heading);
                } else {
                    implement_heading = tractor_heading;
                }
                previous_hitch = p;

                // hitch -> implement reference -> instrumented point
                p = p - ic.rotated(implement_heading);
                p = p + element.at(i).rotated(implement_heading);

                if (options_.cartesian) {
                    north->push_back(static_cast<i32>(p.y * 1000.0));
                    east->push_back(static_cast<i32>(p.x * 1000.0));
                    up->push_back(static_cast<i32>(p.z * 1000.0));
                } else {
                    dp::Geo g = geo::enu_to_geodetic(geo::Enu{p.x, p.y, p.z}, origin);
                    north->push_back(static_cast<i32>(g.latitude / LAT_LON_RESOLUTION));
                    east->push_back(static_cast<i32>(g.longitude / LAT_LON_RESOLUTION));
                    up->push_back(static_cast<i32>(g.altitude / HEIGHT_RESOLUTION));
                }
            }

            record.header_channels.clear();
            record.header_channels.add(std::move(out_north));
            record.header_channels.add(std::move(out_east));
            record.header_channels.add(std::move(out_up));
            for (const auto &column : header.columns()) {
                if (!detail::is_raw_position(column.name())) {
                    auto copy = column;
                    copy.truncate(fixes.size());
                    record.header_channels.add(std::move(copy));
                }
            }
        }
    };

} // namespace isogml::sim
