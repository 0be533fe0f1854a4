#pragma once

#include "../core/types.hpp"
#include "device_description.hpp"
#include <datapod/datapod.hpp>

namespace isogml::task {

    // ─── Task (TSK) ──────────────────────────────────────────────────────────────
    struct Task {
        XmlId id;
        dp::String designator;
        dp::String farm;  // FRM B via TSK D
        dp::String field; // PFD C via TSK E
        dp::Vector<XmlId> device_refs; // DAN C
        dp::Vector<Connection> connections;
        dp::Vector<dp::String> timelogs; // TLG A, file base names
    };

    // ─── Loaded task file with merged external fragments ─────────────────────────
    struct TaskDocument {
        dp::String directory; // where TLG and XFR files live
        DeviceDescription devices;
        dp::Vector<Task> tasks;
    };

} // namespace isogml::task
