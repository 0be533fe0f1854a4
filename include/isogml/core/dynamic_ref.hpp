#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>

namespace isogml {

    // ─── Dynamic process-data reference ──────────────────────────────────────────
    // Identifies a logged value by (device element, DDI). Used as the identity of
    // decoded process-data columns and by geometry axes read per sample.
    struct DynamicRef {
        XmlId element;
        DDI code = 0;

        bool operator==(const DynamicRef &other) const noexcept {
            return element == other.element && code == other.code;
        }
        bool operator!=(const DynamicRef &other) const noexcept { return !(*this == other); }
    };

} // namespace isogml
