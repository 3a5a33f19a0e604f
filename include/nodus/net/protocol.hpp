#pragma once

#include <vector>

#include "nodus/core/errors.hpp"
#include "nodus/core/types.hpp"
#include "nodus/net/message.hpp"

namespace nodus::net {
    using BufferView = nodus::core::BufferView;

    inline constexpr u16 kProtocolVersion = 1;

    // Message envelope (big-endian):
    // 0..1 version(u16), 2..3 kind(u16), 4..7 body_len(u32), then body.
    inline constexpr u32 kMessageHeaderBytes = 8;

    // Response envelope (big-endian):
    // 0..1 version(u16), 2..3 kind(u16), 4..5 code(u16), 6..7 domain(u16),
    // 8..11 aux(u32), 12..15 body_len(u32), then one encoded value.
    inline constexpr u32 kResponseHeaderBytes = 16;

    // Bit 0 of the flags byte in RunClassMethod / RunFunctionOrConstructor bodies.
    inline constexpr u8 kCallFlagResultId = 0x01;

    enum class ProtocolParseResult : u8 {
        Ok = 0,
        NeedMore,
        Invalid,
        UnknownKind,
    };

    [[nodiscard]] nodus::core::Status protocol_encode_message(const Message& msg, std::vector<u8>* out) noexcept;
    [[nodiscard]] ProtocolParseResult protocol_decode_message(BufferView in, Message* out, u32* consumed) noexcept;

    [[nodiscard]] nodus::core::Status protocol_encode_response(const Response& r, std::vector<u8>* out) noexcept;
    [[nodiscard]] ProtocolParseResult protocol_decode_response(BufferView in, Response* out, u32* consumed) noexcept;

    // Ok -> ok, UnknownKind -> Net/UnknownKind, anything else -> Net/Invalid.
    [[nodiscard]] nodus::core::Status protocol_result_status(ProtocolParseResult r) noexcept;

} // namespace nodus::net
