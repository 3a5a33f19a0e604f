#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <type_traits>

#include "nodus/core/errors.hpp"
#include "nodus/core/types.hpp"

namespace nodus::core {

    // Raw 16-byte unique id as produced by id libraries (RFC 4122 byte order).
    struct Uuid16 {
        std::array<u8, 16> b{};
        friend constexpr bool operator==(const Uuid16&, const Uuid16&) noexcept = default;
        friend constexpr auto operator<=>(const Uuid16&, const Uuid16&) noexcept = default;
    };
    static_assert(sizeof(Uuid16) == 16);

    // Identifier of every addressable object a node owns.
    //
    // The 128-bit value is fixed at construction. 'as_wrapper' marks a UID that
    // carries a foreign Uuid16 on the wire; it takes no part in equality,
    // ordering or hashing.
    class Uid {
    public:
        // The nil UID (all zero bits).
        constexpr Uid() noexcept = default;

        constexpr explicit Uid(const Uuid16& value, bool as_wrapper = false) noexcept
            : value_(value), as_wrapper_(as_wrapper) {}

        [[nodiscard]] constexpr const Uuid16& value() const noexcept { return value_; }
        [[nodiscard]] constexpr bool as_wrapper() const noexcept { return as_wrapper_; }

        [[nodiscard]] constexpr Uid wrapped() const noexcept { return Uid{value_, true}; }

        [[nodiscard]] bool is_nil() const noexcept;

        // Big-endian halves of the 128-bit value.
        [[nodiscard]] u64 high() const noexcept;
        [[nodiscard]] u64 low() const noexcept;

        [[nodiscard]] std::size_t hash() const noexcept;

        friend constexpr bool operator==(const Uid& a, const Uid& b) noexcept {
            return a.value_ == b.value_;
        }

        friend constexpr auto operator<=>(const Uid& a, const Uid& b) noexcept {
            return a.value_ <=> b.value_;
        }

    private:
        Uuid16 value_{};
        bool as_wrapper_{false};
    };

    inline constexpr u32 kUidBytes = 16;
    // 8-4-4-4-12 hex digits with hyphens.
    inline constexpr u32 kUidStringChars = 36;

    // Fresh random UID in the version-4 layout.
    [[nodiscard]] Status uid_generate(Uid* out) noexcept;

    // Writes the 16-byte wire form. Returns bytes written (0 on failure).
    [[nodiscard]] u32 uid_serialize(const Uid& id, BufferMut out) noexcept;

    // Result of reading identifier bytes: either a domain UID or, when the
    // sender flagged the id as a wrapper, the raw foreign value.
    struct DecodedId {
        enum class Kind : u8 {
            Domain = 0,
            Raw = 1,
        };

        Kind kind{Kind::Domain};
        Uid uid{};
        Uuid16 raw{};
    };

    // Anything other than exactly 16 bytes is InvalidIdentifier.
    [[nodiscard]] Status uid_deserialize(BufferView in, bool as_wrapper, DecodedId* out) noexcept;

    // Writes kUidStringChars characters plus a NUL. Returns chars written (0 on failure).
    [[nodiscard]] u32 uid_to_chars(const Uid& id, char* out, u32 out_len) noexcept;
    [[nodiscard]] std::string uid_to_string(const Uid& id);

    // "<UID:xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx>"
    [[nodiscard]] std::string uid_repr(const Uid& id);

    // Accepts the hyphenated form or 32 bare hex digits, either case.
    [[nodiscard]] Status uid_parse(const char* text, Uid* out) noexcept;

    static_assert(std::is_trivially_copyable_v<Uid>);
    static_assert(std::is_trivially_copyable_v<DecodedId>);

} // namespace nodus::core

template <>
struct std::hash<nodus::core::Uid> {
    std::size_t operator()(const nodus::core::Uid& id) const noexcept {
        return id.hash();
    }
};
