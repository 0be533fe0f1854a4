#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include "../timelog/channel.hpp"
#include <cctype>
#include <cstring>
#include <datapod/datapod.hpp>

namespace isogml::output {

    // ─── Output format ───────────────────────────────────────────────────────────
    enum class Format : u8 { Gml, Csv };

    inline const char *to_string(Format f) noexcept { return f == Format::Csv ? "CSV" : "GML"; }

    inline const char *extension(Format f) noexcept { return f == Format::Csv ? ".CSV" : ".GML"; }

    // ─── XML / column name sanitizing ────────────────────────────────────────────
    // Space, '&', '(', ')' and '+' become '_'; a leading digit gets an 'X' prefix.
    inline dp::String sanitize_name(const dp::String &name) {
        dp::String out;
        out.reserve(name.size() + 1);
        for (char c : name) {
            switch (c) {
            case ' ':
            case '&':
            case '(':
            case ')':
            case '+':
                out += '_';
                break;
            default:
                out += c;
            }
        }
        if (!out.empty() && std::isdigit(static_cast<unsigned char>(out[0])))
            out = "X" + out;
        return out;
    }

    // Drops characters that are not allowed in a file name and trailing dots
    inline dp::String sanitize_file_name(const dp::String &name) {
        static constexpr const char *INVALID = "<>:\"/\\|?*";
        dp::String out;
        out.reserve(name.size());
        for (char c : name) {
            if (static_cast<unsigned char>(c) < 0x20 || std::strchr(INVALID, c) != nullptr)
                continue;
            out += c;
        }
        while (!out.empty() && out.back() == '.')
            out.pop_back();
        return out;
    }

    // ─── Output base name ────────────────────────────────────────────────────────
    // farm_field_task[_description]_DATE_TIME with ':' in the time as '.'. The time
    // stamp is taken from the first TimeStartDATE / TimeStartTOFD sample.
    inline dp::String output_base_name(const dp::String &farm, const dp::String &field, const dp::String &task,
                                       const dp::String &description, const timelog::ChannelSet &header) {
        dp::String name = farm + "_" + field + "_" + task + "_";
        if (!description.empty())
            name += description + "_";

        const auto *date = header.find(channel::TIME_START_DATE);
        if (date && !date->empty())
            name += date->value_string(0);

        const auto *tofd = header.find(channel::TIME_START_TOFD);
        if (tofd && !tofd->empty()) {
            dp::String time = tofd->value_string(0);
            for (auto &c : time) {
                if (c == ':')
                    c = '.';
            }
            name += "_" + time;
        }
        return sanitize_file_name(name);
    }

    // Base name, time-log file name and the format extension
    inline dp::String output_file_name(const dp::String &base, const dp::String &timelog, Format format) {
        return sanitize_file_name(base + "_" + timelog) + extension(format);
    }

} // namespace isogml::output
