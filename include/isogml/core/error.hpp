#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace isogml {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    enum class ErrorCode : u32 {
        Ok = 0,
        IoError,            // missing or unreadable file
        SchemaMismatch,     // expected unique cross-reference not found
        FormatError,        // malformed literal in a declared value
        GeometryResolution, // device graph does not satisfy a resolution assumption
        BinaryFormat,       // time-log binary cannot be decoded
        InvalidArgument,
    };

    // ─── Error type ──────────────────────────────────────────────────────────────
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        static Error io(dp::String msg = "") noexcept { return Error(ErrorCode::IoError, std::move(msg)); }
        static Error schema_mismatch(dp::String msg = "") noexcept {
            return Error(ErrorCode::SchemaMismatch, std::move(msg));
        }
        static Error format(dp::String msg = "") noexcept { return Error(ErrorCode::FormatError, std::move(msg)); }
        static Error geometry(dp::String msg = "") noexcept {
            return Error(ErrorCode::GeometryResolution, std::move(msg));
        }
        static Error binary_format(dp::String msg = "") noexcept {
            return Error(ErrorCode::BinaryFormat, std::move(msg));
        }
        static Error invalid_argument(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidArgument, std::move(msg));
        }
        static Error not_unique(const dp::String &what, usize matches) noexcept {
            return Error(ErrorCode::SchemaMismatch,
                         what + ": expected exactly one match, found " + dp::String(std::to_string(matches)));
        }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

} // namespace isogml
