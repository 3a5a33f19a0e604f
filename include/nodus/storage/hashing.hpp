#pragma once

#include <string>

#include "nodus/core/errors.hpp"
#include "nodus/core/types.hpp"

namespace nodus::storage {
    [[nodiscard]] constexpr bool digest_is_zero(const nodus::core::Hash256& h) noexcept {
        for (nodus::core::u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    // BLAKE3, 32-byte output.
    [[nodiscard]] nodus::core::Status digest_compute(nodus::core::BufferView data, nodus::core::Hash256* out) noexcept;

    [[nodiscard]] std::string digest_to_hex(const nodus::core::Hash256& h);

} // namespace nodus::storage
