#include "nodus/security/random.hpp"

#if defined(NODUS_HAVE_LIBSODIUM)
#include <sodium.h>
#elif defined(NODUS_HAVE_OPENSSL)
#include <openssl/rand.h>
#else
#error "nodus needs libsodium or OpenSSL for identifier entropy"
#endif

namespace nodus::security {
    namespace {
#if defined(NODUS_HAVE_LIBSODIUM)
        nodus::core::Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return nodus::core::make_status(nodus::core::StatusDomain::External, nodus::core::StatusCode::Unavailable);
            }
            return nodus::core::ok_status();
        }
#endif
    } // namespace

    nodus::core::Status random_bytes(nodus::core::BufferMut out) noexcept {
        if (out.len > 0 && out.data == nullptr) {
            return nodus::core::make_status(nodus::core::StatusDomain::External, nodus::core::StatusCode::Invalid);
        }
        if (out.len == 0) {
            return nodus::core::ok_status();
        }

#if defined(NODUS_HAVE_LIBSODIUM)
        const nodus::core::Status init = ensure_sodium();
        if (!nodus::core::is_ok(init)) {
            return init;
        }
        randombytes_buf(out.data, static_cast<size_t>(out.len));
        return nodus::core::ok_status();
#else
        if (RAND_bytes(out.data, static_cast<int>(out.len)) != 1) {
            return nodus::core::make_status(nodus::core::StatusDomain::External, nodus::core::StatusCode::Unavailable);
        }
        return nodus::core::ok_status();
#endif
    }

    const char* random_backend_name() noexcept {
#if defined(NODUS_HAVE_LIBSODIUM)
        return "libsodium";
#else
        return "openssl";
#endif
    }
} // namespace nodus::security
