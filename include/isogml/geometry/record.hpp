#pragma once

#include "../core/constants.hpp"
#include "../core/dynamic_ref.hpp"
#include "../core/types.hpp"
#include "../timelog/channel.hpp"
#include "point3.hpp"
#include <datapod/datapod.hpp>

namespace isogml::geometry {

    // ─── Hitch kind ──────────────────────────────────────────────────────────────
    // Mounted implements share the tractor heading; towed ones follow the hitch.
    enum class ConnectionType : u8 { Mounted, Towed };

    inline const char *to_string(ConnectionType t) noexcept { return t == ConnectionType::Towed ? "Towed" : "Mounted"; }

    // ─── Geometry record ─────────────────────────────────────────────────────────
    // Kinematic relationship between the GNSS antenna and one instrumented point.
    // Points are in the tractor frame (navigation, tractor connector) or the
    // implement frame (implement connector, element).
    struct GeometryRecord {
        XmlId element;
        dp::String description;
        ConnectionType connection = ConnectionType::Mounted;

        Point3 tractor_navigation_point;
        Point3 tractor_connector_point;
        Point3 implement_connector_point;
        Point3 implement_element_point;

        // Measured heading channel, extracted but not used by the simulator
        dp::Optional<DynamicRef> yaw_reference;

        timelog::ChannelSet header_channels;
        timelog::ChannelSet data_channels;

        bool is_original() const noexcept { return element == ORIGINAL_ELEMENT; }

        // True when any point axis is read from `ref`
        bool references(const DynamicRef &ref) const noexcept {
            for (const auto *p : {&tractor_navigation_point, &tractor_connector_point, &implement_connector_point,
                                  &implement_element_point}) {
                for (const auto *d : {&p->dyn_x, &p->dyn_y, &p->dyn_z}) {
                    if (d->has_value() && **d == ref)
                        return true;
                }
            }
            return false;
        }

        void clear_channels() {
            header_channels.clear();
            data_channels.clear();
        }
    };

    // Default bucket for unattributed channels and fallback trajectory source
    inline GeometryRecord original_record() {
        GeometryRecord r;
        r.element = ORIGINAL_ELEMENT;
        r.description = ORIGINAL_ELEMENT;
        r.connection = ConnectionType::Mounted;
        return r;
    }

} // namespace isogml::geometry
