#include "nodus/core/uid.hpp"

#include <cstring>

#include "nodus/core/endian.hpp"
#include "nodus/security/random.hpp"

namespace nodus::core {
    namespace {
        int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        bool is_hyphen_position(u32 i) noexcept {
            return i == 8 || i == 13 || i == 18 || i == 23;
        }
    } // namespace

    bool Uid::is_nil() const noexcept {
        for (u8 b : value_.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    u64 Uid::high() const noexcept {
        return get_u64_be(value_.b.data());
    }

    u64 Uid::low() const noexcept {
        return get_u64_be(value_.b.data() + 8);
    }

    std::size_t Uid::hash() const noexcept {
        // Both halves are random, folding keeps all 128 bits in play.
        const u64 h = high();
        const u64 l = low();
        return static_cast<std::size_t>(h ^ (l + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2)));
    }

    Status uid_generate(Uid* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Identity, StatusCode::Invalid);
        }

        Uuid16 v{};
        const Status s = nodus::security::random_bytes({v.b.data(), kUidBytes});
        if (!is_ok(s)) {
            return s;
        }

        // RFC 4122 version 4, variant 10xx.
        v.b[6] = static_cast<u8>((v.b[6] & 0x0fu) | 0x40u);
        v.b[8] = static_cast<u8>((v.b[8] & 0x3fu) | 0x80u);

        *out = Uid{v};
        return ok_status();
    }

    u32 uid_serialize(const Uid& id, BufferMut out) noexcept {
        if (out.data == nullptr || out.len < kUidBytes) {
            return 0;
        }
        std::memcpy(out.data, id.value().b.data(), kUidBytes);
        return kUidBytes;
    }

    Status uid_deserialize(BufferView in, bool as_wrapper, DecodedId* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Identity, StatusCode::Invalid);
        }
        if (in.data == nullptr || in.len != kUidBytes) {
            return make_status(StatusDomain::Identity, StatusCode::InvalidIdentifier, in.len);
        }

        Uuid16 v{};
        std::memcpy(v.b.data(), in.data, kUidBytes);

        DecodedId d{};
        if (as_wrapper) {
            d.kind = DecodedId::Kind::Raw;
            d.raw = v;
        } else {
            d.kind = DecodedId::Kind::Domain;
            d.uid = Uid{v};
        }
        *out = d;
        return ok_status();
    }

    u32 uid_to_chars(const Uid& id, char* out, u32 out_len) noexcept {
        static const char hex[] = "0123456789abcdef";
        if (out == nullptr || out_len < kUidStringChars + 1) {
            return 0;
        }

        u32 pos = 0;
        for (u32 i = 0; i < kUidBytes; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out[pos++] = '-';
            }
            const u8 b = id.value().b[i];
            out[pos++] = hex[(b >> 4) & 0xF];
            out[pos++] = hex[b & 0xF];
        }
        out[pos] = '\0';
        return pos;
    }

    std::string uid_to_string(const Uid& id) {
        char buf[kUidStringChars + 1];
        const u32 n = uid_to_chars(id, buf, sizeof(buf));
        return std::string(buf, n);
    }

    std::string uid_repr(const Uid& id) {
        return "<UID:" + uid_to_string(id) + ">";
    }

    Status uid_parse(const char* text, Uid* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Identity, StatusCode::Invalid);
        }
        if (text == nullptr) {
            return make_status(StatusDomain::Identity, StatusCode::InvalidIdentifier);
        }

        const std::size_t len = std::strlen(text);
        const bool hyphenated = len == kUidStringChars;
        if (!hyphenated && len != kUidBytes * 2) {
            return make_status(StatusDomain::Identity, StatusCode::InvalidIdentifier, static_cast<u32>(len));
        }

        Uuid16 v{};
        u32 nibble = 0;
        for (u32 i = 0; i < static_cast<u32>(len); ++i) {
            const char c = text[i];
            if (hyphenated && is_hyphen_position(i)) {
                if (c != '-') {
                    return make_status(StatusDomain::Identity, StatusCode::InvalidIdentifier, i);
                }
                continue;
            }
            const int x = hex_value(c);
            if (x < 0) {
                return make_status(StatusDomain::Identity, StatusCode::InvalidIdentifier, i);
            }
            u8& b = v.b[nibble / 2];
            b = static_cast<u8>((nibble % 2 == 0) ? (x << 4) : (b | x));
            ++nibble;
        }

        *out = Uid{v};
        return ok_status();
    }
} // namespace nodus::core
