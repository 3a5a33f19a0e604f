#include "nodus/storage/hashing.hpp"

#include <cstddef>

#include <blake3.h>

namespace nodus::storage {
    nodus::core::Status digest_compute(nodus::core::BufferView data, nodus::core::Hash256* out) noexcept {
        if (out == nullptr) {
            return nodus::core::make_status(nodus::core::StatusDomain::Store, nodus::core::StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr) {
            return nodus::core::make_status(nodus::core::StatusDomain::Store, nodus::core::StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);
        if (data.len > 0) {
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }
        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return nodus::core::ok_status();
    }

    std::string digest_to_hex(const nodus::core::Hash256& h) {
        static const char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(h.b.size() * 2);
        for (nodus::core::u8 b : h.b) {
            out.push_back(hex[(b >> 4) & 0xF]);
            out.push_back(hex[b & 0xF]);
        }
        return out;
    }
} // namespace nodus::storage
