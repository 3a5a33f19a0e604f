#pragma once

#include <vector>

#include "nodus/core/errors.hpp"
#include "nodus/core/types.hpp"
#include "nodus/core/value.hpp"

namespace nodus::storage {
    using u8 = nodus::core::u8;
    using u32 = nodus::core::u32;
    using u64 = nodus::core::u64;

    constexpr u32 kMaxValueDepth = 32;

    // Wire tags. A Uuid16 value never appears on the wire as itself: it is
    // written as a Uid with the wrapper flag and turned back into a Uuid16 on
    // read, through the id wrapper registry.
    enum class WireTag : u8 {
        None = 0,
        Bool = 1,
        I64 = 2,
        F64 = 3,
        String = 4,
        Bytes = 5,
        Uid = 6,
        Pointer = 8,
        List = 9,
        Instance = 10,
    };

    inline constexpr u8 kUidFlagWrapper = 0x01;

    // Layout (big-endian):
    //   tag(u8) then
    //   Bool      u8
    //   I64/F64   u64 (F64 as IEEE-754 bits)
    //   String    len(u32) bytes
    //   Bytes     len(u32) bytes
    //   Uid       flags(u8) value(16)
    //   Pointer   value(16) location(len u32 + bytes) type_hint(len u32 + bytes)
    //   List      count(u32) values...
    //   Instance  type(len u32 + bytes) count(u32) values...

    // Appends the encoding of 'v' to 'out'.
    [[nodiscard]] nodus::core::Status layout_encode_value(const nodus::core::Value& v, std::vector<u8>* out) noexcept;

    // Decodes one value from the front of 'in'; '*consumed' receives its length.
    // Truncated or malformed input is Corrupt.
    [[nodiscard]] nodus::core::Status layout_decode_value(nodus::core::BufferView in,
        nodus::core::Value* out,
        u32* consumed) noexcept;

} // namespace nodus::storage
