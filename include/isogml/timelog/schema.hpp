#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <utility>

namespace isogml::timelog {

    // ─── Position record template (PTN) ──────────────────────────────────────────
    // Attribute letters A-I declared with an empty value are logged per record,
    // in declaration order.
    struct PositionTemplate {
        dp::Vector<char> slots;

        PositionTemplate &add_slot(char letter) {
            slots.push_back(letter);
            return *this;
        }
    };

    // ─── Data logged value (DLV) ─────────────────────────────────────────────────
    struct LoggedValue {
        dp::String ddi_text;  // attribute A as written
        dp::String literal;   // attribute B, the initial value
        XmlId element;        // attribute C, DeviceElementIdRef
    };

    // ─── Time-log header (TIM document) ──────────────────────────────────────────
    struct TimelogSchema {
        bool time_start_declared = false; // TIM A present and empty
        dp::Vector<PositionTemplate> positions;
        dp::Vector<LoggedValue> values;

        TimelogSchema &set_time_start(bool v) {
            time_start_declared = v;
            return *this;
        }
        TimelogSchema &add_position(PositionTemplate v) {
            positions.push_back(std::move(v));
            return *this;
        }
        TimelogSchema &add_value(LoggedValue v) {
            values.push_back(std::move(v));
            return *this;
        }
    };

} // namespace isogml::timelog
