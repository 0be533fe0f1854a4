#pragma once

#include "../core/types.hpp"
#include <type_traits>

namespace isogml {
    namespace util {

        // ─── Little-endian field helpers ─────────────────────────────────────────────
        namespace bitfield {

            template <typename T>
            concept UnsignedInt = std::is_unsigned_v<T>;

            inline u16 unpack_u16_le(const u8 *data) noexcept {
                return static_cast<u16>(data[0]) | (static_cast<u16>(data[1]) << 8);
            }

            inline u32 unpack_u32_le(const u8 *data) noexcept {
                return static_cast<u32>(data[0]) | (static_cast<u32>(data[1]) << 8) |
                       (static_cast<u32>(data[2]) << 16) | (static_cast<u32>(data[3]) << 24);
            }

            inline u64 unpack_u64_le(const u8 *data) noexcept {
                u64 result = 0;
                for (usize i = 0; i < 8; ++i) {
                    result |= static_cast<u64>(data[i]) << (i * 8);
                }
                return result;
            }

            // Two's complement reinterpretation of an unsigned field
            template <UnsignedInt T> constexpr std::make_signed_t<T> as_signed(T value) noexcept {
                return static_cast<std::make_signed_t<T>>(value);
            }

            inline void pack_u16_le(u8 *data, u16 value) noexcept {
                data[0] = static_cast<u8>(value & 0xFF);
                data[1] = static_cast<u8>((value >> 8) & 0xFF);
            }

            inline void pack_u32_le(u8 *data, u32 value) noexcept {
                data[0] = static_cast<u8>(value & 0xFF);
                data[1] = static_cast<u8>((value >> 8) & 0xFF);
                data[2] = static_cast<u8>((value >> 16) & 0xFF);
                data[3] = static_cast<u8>((value >> 24) & 0xFF);
            }

        } // namespace bitfield
    } // namespace util
    using namespace util;
} // namespace isogml
