#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include <charconv>
#include <datapod/datapod.hpp>
#include <limits>

namespace isogml {
    namespace util {

        // ─── Attribute literal parsing ───────────────────────────────────────────────
        // ISOXML numbers are plain decimal; DDIs are written as 4 hex digits ("0086").

        inline Result<i64> parse_integer(const dp::String &text, int base = 10) {
            const char *first = text.c_str();
            const char *last = first + text.size();
            if (first != last && *first == '+' && base == 10)
                ++first;
            i64 value = 0;
            auto [ptr, ec] = std::from_chars(first, last, value, base);
            if (ec != std::errc{} || ptr != last || first == last) {
                return Result<i64>::err(Error::format("not a number: '" + text + "'"));
            }
            return Result<i64>::ok(value);
        }

        inline Result<i32> parse_i32(const dp::String &text) {
            auto r = parse_integer(text);
            if (!r.is_ok())
                return Result<i32>::err(r.error());
            if (r.value() < std::numeric_limits<i32>::min() || r.value() > std::numeric_limits<i32>::max()) {
                return Result<i32>::err(Error::format("out of range for int32: '" + text + "'"));
            }
            return Result<i32>::ok(static_cast<i32>(r.value()));
        }

        inline Result<DDI> parse_ddi(const dp::String &text) {
            auto r = parse_integer(text, 16);
            if (!r.is_ok())
                return Result<DDI>::err(r.error());
            if (r.value() < 0 || r.value() > 0xFFFF) {
                return Result<DDI>::err(Error::format("DDI out of range: '" + text + "'"));
            }
            return Result<DDI>::ok(static_cast<DDI>(r.value()));
        }

    } // namespace util
    using namespace util;
} // namespace isogml
