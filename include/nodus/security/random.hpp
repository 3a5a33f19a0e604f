#pragma once

#include "nodus/core/errors.hpp"
#include "nodus/core/types.hpp"

namespace nodus::security {
    using u8 = nodus::core::u8;
    using u32 = nodus::core::u32;

    // Fills 'out' from the OS-backed CSPRNG (libsodium, or OpenSSL when built
    // without it). Does not block once the backend is initialised.
    [[nodiscard]] nodus::core::Status random_bytes(nodus::core::BufferMut out) noexcept;

    // Name of the backend compiled in ("libsodium" or "openssl").
    [[nodiscard]] const char* random_backend_name() noexcept;
} // namespace nodus::security
