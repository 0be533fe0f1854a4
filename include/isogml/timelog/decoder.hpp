#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../task/device_description.hpp"
#include "../task/loader.hpp"
#include "../util/byte_reader.hpp"
#include "../util/parse.hpp"
#include "channel.hpp"
#include "schema.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace isogml::timelog {

    // ─── Decoded time-log ────────────────────────────────────────────────────────
    struct TimelogChannels {
        ChannelSet header; // position record and time stamps
        ChannelSet data;   // one Int32 column per distinct (element, DDI)
        usize records = 0; // delta blocks consumed
    };

    // ─── Time stamp formatting ───────────────────────────────────────────────────

    // Days since 1980-01-01 as YYYY-MM-DD
    inline dp::String format_date(u16 days) {
        using namespace std::chrono;
        year_month_day ymd{sys_days{year{1980} / January / 1} + std::chrono::days{days}};
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                      static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
        return dp::String(buf);
    }

    // Milliseconds of day as HH:MM:SS, with .fff when not on a whole second
    inline dp::String format_time_of_day(u32 ms) {
        u32 hours = (ms / 3600000u) % 24u;
        u32 minutes = (ms / 60000u) % 60u;
        u32 seconds = (ms / 1000u) % 60u;
        u32 millis = ms % 1000u;
        char buf[24];
        if (millis != 0) {
            std::snprintf(buf, sizeof(buf), "%02u:%02u:%02u.%03u", hours, minutes, seconds, millis);
        } else {
            std::snprintf(buf, sizeof(buf), "%02u:%02u:%02u", hours, minutes, seconds);
        }
        return dp::String(buf);
    }

    namespace detail {

        inline void add_position_slot(ChannelSet &header, char slot) {
            switch (slot) {
            case 'A':
                header.add(Column::header(channel::POSITION_NORTH, ScalarKind::Int32));
                break;
            case 'B':
                header.add(Column::header(channel::POSITION_EAST, ScalarKind::Int32));
                break;
            case 'C':
                header.add(Column::header(channel::POSITION_UP, ScalarKind::Int32));
                break;
            case 'D':
                header.add(Column::header(channel::POSITION_STATUS, ScalarKind::Byte));
                break;
            case 'E':
                header.add(Column::header(channel::PDOP, ScalarKind::UInt16));
                break;
            case 'F':
                header.add(Column::header(channel::HDOP, ScalarKind::UInt16));
                break;
            case 'G':
                header.add(Column::header(channel::NUMBER_OF_SATELLITES, ScalarKind::Byte));
                break;
            case 'H':
                header.add(Column::header(channel::GPS_UTC_TIME, ScalarKind::String));
                break;
            case 'I':
                header.add(Column::header(channel::GPS_UTC_DATE, ScalarKind::String));
                break;
            default:
                echo::category("isogml.timelog").warn("unknown PTN attribute ", slot, " ignored");
                break;
            }
        }

        // deviceDesignator_elementDesignator_processDataDesignator
        inline Result<dp::String> display_name(const task::DeviceDescription &graph, const LoggedValue &dlv, DDI ddi) {
            auto element = graph.find_element(dlv.element);
            if (!element.is_ok())
                return Result<dp::String>::err(element.error());

            auto pd = graph.process_data_for(element.value(), ddi);
            if (!pd.is_ok())
                return Result<dp::String>::err(pd.error());
            if (pd.value() == nullptr) {
                return Result<dp::String>::err(
                    Error::schema_mismatch("no process data " + dlv.ddi_text + " on " + dlv.element));
            }

            const auto &ref = element.value();
            return Result<dp::String>::ok(ref.device->designator + "_" + ref.element->designator + "_" +
                                          pd.value()->designator);
        }

        inline bool is_date_channel(const dp::String &name) {
            return name == channel::TIME_START_DATE || name == channel::GPS_UTC_DATE;
        }

        inline bool is_time_channel(const dp::String &name) {
            return name == channel::TIME_START_TOFD || name == channel::GPS_UTC_TIME;
        }

        // Reads one header value; false on a short read
        inline bool read_header_value(ByteReader &reader, Column &column) {
            if (is_date_channel(column.name())) {
                auto v = reader.read_u16();
                if (!v.has_value())
                    return false;
                return column.push(format_date(*v)).is_ok();
            }
            if (is_time_channel(column.name())) {
                auto v = reader.read_u32();
                if (!v.has_value())
                    return false;
                return column.push(format_time_of_day(*v)).is_ok();
            }

            switch (column.kind()) {
            case ScalarKind::Byte: {
                auto v = reader.read_u8();
                return v.has_value() && column.push(*v).is_ok();
            }
            case ScalarKind::Int16: {
                auto v = reader.read_i16();
                return v.has_value() && column.push(*v).is_ok();
            }
            case ScalarKind::Int32: {
                auto v = reader.read_i32();
                return v.has_value() && column.push(*v).is_ok();
            }
            case ScalarKind::UInt16: {
                auto v = reader.read_u16();
                return v.has_value() && column.push(*v).is_ok();
            }
            case ScalarKind::UInt32: {
                auto v = reader.read_u32();
                return v.has_value() && column.push(*v).is_ok();
            }
            case ScalarKind::UInt64: {
                auto v = reader.read_u64();
                return v.has_value() && column.push(*v).is_ok();
            }
            case ScalarKind::String:
                echo::category("isogml.timelog").warn("string channel ", column.name(), " has no binary encoding");
                return false;
            }
            return false;
        }

        // Delta block: N, then N x (u8 channel index, i32 value). Values not listed
        // carry forward from the previous row.
        inline Result<bool> read_delta_block(ByteReader &reader, ChannelSet &data) {
            dp::Vector<i32> last(data.count(), 0);
            for (usize i = 0; i < data.count(); ++i) {
                const auto *values = data.columns()[i].as_i32();
                if (values && !values->empty())
                    last[i] = values->back();
            }

            auto count = reader.read_u8();
            if (!count.has_value())
                return Result<bool>::ok(false);

            for (u8 n = 0; n < *count; ++n) {
                auto index = reader.read_u8();
                auto value = reader.read_i32();
                if (!index.has_value() || !value.has_value())
                    return Result<bool>::ok(false);
                if (*index >= last.size()) {
                    return Result<bool>::err(Error::binary_format(
                        "delta index " + dp::String(std::to_string(*index)) + " exceeds " +
                        dp::String(std::to_string(last.size())) + " data channels"));
                }
                last[*index] = *value;
            }

            for (usize i = 0; i < data.count(); ++i)
                data.columns()[i].as_i32()->push_back(last[i]);
            return Result<bool>::ok(true);
        }

    } // namespace detail

    // ─── Channel layout from the TIM header ──────────────────────────────────────
    inline TimelogChannels build_channels(const TimelogSchema &schema, const task::DeviceDescription &graph) {
        TimelogChannels out;

        if (schema.time_start_declared) {
            out.header.add(Column::header(channel::TIME_START_TOFD, ScalarKind::String));
            out.header.add(Column::header(channel::TIME_START_DATE, ScalarKind::String));
        }

        for (const auto &pos : schema.positions) {
            for (char slot : pos.slots)
                detail::add_position_slot(out.header, slot);
        }

        for (const auto &dlv : schema.values) {
            auto ddi = parse_ddi(dlv.ddi_text);
            if (!ddi.is_ok()) {
                echo::category("isogml.timelog").warn("DLV on ", dlv.element, ": ", ddi.error().message);
            }
            DynamicRef ref{dlv.element, ddi.is_ok() ? ddi.value() : DDI{0xFFFF}};
            if (out.data.index_of(ref).has_value())
                continue;

            dp::String name;
            auto named = detail::display_name(graph, dlv, ref.code);
            if (named.is_ok()) {
                name = named.value();
            } else {
                echo::category("isogml.timelog")
                    .warn("process data description not found (", named.error().message, "), using raw identifiers");
                name = dlv.element + "_" + dlv.ddi_text;
            }

            // Placeholder row: seeds carry-forward, removed after decoding
            auto seed = parse_i32(dlv.literal);
            if (!seed.is_ok()) {
                echo::category("isogml.timelog").debug("DLV ", name, " initial value: ", seed.error().message);
            }
            auto &column = out.data.add(Column::process_data(std::move(name), std::move(ref)));
            column.as_i32()->push_back(seed.is_ok() ? seed.value() : 0);
        }
        return out;
    }

    // ─── Binary decode ───────────────────────────────────────────────────────────
    inline Result<TimelogChannels> decode(const TimelogSchema &schema, const task::DeviceDescription &graph,
                                          const dp::Vector<u8> &bytes) {
        TimelogChannels out = build_channels(schema, graph);
        auto &header = out.header.columns();
        ByteReader reader(bytes);

        usize cursor = 0;
        bool complete = true;
        while (!reader.exhausted()) {
            if (cursor == header.size()) {
                cursor = 0;
                if (header.empty()) {
                    return Result<TimelogChannels>::err(Error::binary_format("no header channels for data"));
                }

                auto delta = detail::read_delta_block(reader, out.data);
                if (!delta.is_ok())
                    return Result<TimelogChannels>::err(delta.error());
                if (!delta.value()) {
                    complete = false;
                    break;
                }
                ++out.records;
                if (reader.exhausted())
                    break;
            }

            if (!detail::read_header_value(reader, header[cursor])) {
                complete = false;
                break;
            }
            ++cursor;
        }

        for (auto &c : out.data.columns())
            c.erase_front();

        // A header row without its delta block has no data row; drop it
        usize partial = 0;
        for (auto &c : header) {
            partial = std::max(partial, c.size() - std::min(c.size(), out.records));
            c.truncate(out.records);
        }
        if (!complete || partial > 0) {
            echo::category("isogml.timelog").warn("truncated trailing record dropped after ", out.records, " records");
        }

        echo::category("isogml.timelog")
            .debug("decoded ", out.records, " records, ", header.size(), " header / ", out.data.count(),
                   " data channels");
        return Result<TimelogChannels>::ok(std::move(out));
    }

    inline Result<TimelogChannels> decode_file(const dp::String &schema_path, const dp::String &binary_path,
                                               const task::DeviceDescription &graph) {
        auto schema = task::load_timelog_schema(schema_path);
        if (!schema.is_ok())
            return Result<TimelogChannels>::err(schema.error());

        auto bytes = task::read_binary_file(binary_path);
        if (!bytes.is_ok())
            return Result<TimelogChannels>::err(bytes.error());

        return decode(schema.value(), graph, bytes.value());
    }

} // namespace isogml::timelog
