#pragma once

#include "../core/types.hpp"
#include "bitfield.hpp"
#include <datapod/datapod.hpp>

namespace isogml {
    namespace util {

        // ─── Sequential little-endian reader over a byte buffer ─────────────────────
        // Each read either consumes the full width or nothing; a short read returns
        // nullopt and leaves the cursor in place.
        class ByteReader {
            const u8 *data_ = nullptr;
            usize size_ = 0;
            usize pos_ = 0;

          public:
            constexpr ByteReader() = default;
            constexpr ByteReader(const u8 *data, usize size) : data_(data), size_(size) {}
            ByteReader(const dp::Vector<u8> &vec) : data_(vec.data()), size_(vec.size()) {}

            constexpr usize size() const noexcept { return size_; }
            constexpr usize position() const noexcept { return pos_; }
            constexpr usize remaining() const noexcept { return size_ - pos_; }
            constexpr bool exhausted() const noexcept { return pos_ >= size_; }

            dp::Optional<u8> read_u8() noexcept {
                if (remaining() < 1)
                    return dp::nullopt;
                return data_[pos_++];
            }

            dp::Optional<u16> read_u16() noexcept {
                if (remaining() < 2)
                    return dp::nullopt;
                u16 v = bitfield::unpack_u16_le(data_ + pos_);
                pos_ += 2;
                return v;
            }

            dp::Optional<u32> read_u32() noexcept {
                if (remaining() < 4)
                    return dp::nullopt;
                u32 v = bitfield::unpack_u32_le(data_ + pos_);
                pos_ += 4;
                return v;
            }

            dp::Optional<u64> read_u64() noexcept {
                if (remaining() < 8)
                    return dp::nullopt;
                u64 v = bitfield::unpack_u64_le(data_ + pos_);
                pos_ += 8;
                return v;
            }

            dp::Optional<i16> read_i16() noexcept {
                auto v = read_u16();
                if (!v.has_value())
                    return dp::nullopt;
                return bitfield::as_signed(*v);
            }

            dp::Optional<i32> read_i32() noexcept {
                auto v = read_u32();
                if (!v.has_value())
                    return dp::nullopt;
                return bitfield::as_signed(*v);
            }
        };

    } // namespace util
    using namespace util;
} // namespace isogml
