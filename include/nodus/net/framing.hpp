#pragma once

#include <type_traits>
#include <vector>

#include "nodus/core/errors.hpp"
#include "nodus/core/types.hpp"

namespace nodus::net {
    using u8 = nodus::core::u8;
    using u16 = nodus::core::u16;
    using u32 = nodus::core::u32;
    using BufferView = nodus::core::BufferView;
    using BufferMut = nodus::core::BufferMut;

    enum class FrameType : u16 {
        Request = 1,    // payload is a message envelope
        Response = 2,   // payload is a response envelope
    };

    [[nodiscard]] const char* frame_type_name(FrameType t) noexcept;

    struct FrameHeader {
        u16 version{1};
        FrameType type{FrameType::Request};
        u16 flags{0};
        u32 payload_len{0};
        u32 request_id{0};   // echoed by the response to the request it answers
    };

    // Layout (big-endian / network order):
    // 0..1 version(u16), 2..3 type(u16), 4..5 flags(u16), 6..7 reserved(u16=0),
    // 8..11 payload_len(u32), 12..15 request_id(u32).
    inline constexpr u32 kFrameHeaderBytes = 16;
    inline constexpr u32 kMaxFramePayload = 64u * 1024u * 1024u;

    enum class FrameParseResult : u8 {
        Ok = 0,
        NeedMore,
        Invalid,
    };

    [[nodiscard]] constexpr bool frame_header_valid(const FrameHeader& h, u32 max_payload) noexcept {
        return h.version == 1 && h.payload_len <= max_payload;
    }

    // Returns bytes written (0 on failure).
    [[nodiscard]] u32 frame_write_header(const FrameHeader& h, BufferMut out) noexcept;

    // Parses a header from the first bytes of 'in' (does not consume).
    [[nodiscard]] FrameParseResult frame_read_header(BufferView in, FrameHeader* out) noexcept;

    // 'frame' starts with kFrameHeaderBytes of scratch followed by the payload;
    // fills in the header. Net/Invalid if the payload exceeds kMaxFramePayload.
    [[nodiscard]] nodus::core::Status frame_seal(FrameType type, u32 request_id, std::vector<u8>* frame) noexcept;

    // Splits one complete frame. The payload must fill the rest of 'frame'
    // exactly; anything else is Net/Invalid.
    [[nodiscard]] nodus::core::Status frame_open(BufferView frame, FrameHeader* header, BufferView* payload) noexcept;

    static_assert(std::is_trivially_copyable_v<FrameHeader>);
    static_assert(std::is_standard_layout_v<FrameHeader>);

} // namespace nodus::net
