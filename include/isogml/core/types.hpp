#pragma once

#include <datapod/datapod.hpp>

namespace isogml {

    // ─── Numeric type aliases ────────────────────────────────────────────────────
    using dp::f32;
    using dp::f64;
    using dp::i16;
    using dp::i32;
    using dp::i64;
    using dp::i8;
    using dp::isize;
    using dp::u16;
    using dp::u32;
    using dp::u64;
    using dp::u8;
    using dp::usize;

    // ─── Byte type alias ────────────────────────────────────────────────────────
    using dp::byte;

    // ─── Domain-specific types ───────────────────────────────────────────────────
    using DDI = u16;           // ISO 11783-11 data dictionary identifier
    using ObjectID = u16;      // DDOP object id (DET C, DOR A, DPD A, DPT A)
    using ElementNumber = u16; // DET E
    using XmlId = dp::String;  // ISOXML string identifier, e.g. "DET-3"

} // namespace isogml
