#include "nodus/net/framing.hpp"

#include "nodus/core/endian.hpp"

namespace nodus::net {
    using nodus::core::get_u16_be;
    using nodus::core::get_u32_be;
    using nodus::core::make_status;
    using nodus::core::put_u16_be;
    using nodus::core::put_u32_be;
    using nodus::core::Status;
    using nodus::core::StatusCode;
    using nodus::core::StatusDomain;

    static bool frame_type_valid_u16(u16 v) noexcept {
        return v == static_cast<u16>(FrameType::Request) || v == static_cast<u16>(FrameType::Response);
    }

    const char* frame_type_name(FrameType t) noexcept {
        switch (t) {
        case FrameType::Request: return "Request";
        case FrameType::Response: return "Response";
        }
        return "Unknown";
    }

    u32 frame_write_header(const FrameHeader& h, BufferMut out) noexcept {
        if (out.data == nullptr || out.len < kFrameHeaderBytes) {
            return 0;
        }

        u8* p = out.data;
        put_u16_be(p, h.version);
        put_u16_be(p + 2, static_cast<u16>(h.type));
        put_u16_be(p + 4, h.flags);
        put_u16_be(p + 6, 0);
        put_u32_be(p + 8, h.payload_len);
        put_u32_be(p + 12, h.request_id);
        return kFrameHeaderBytes;
    }

    FrameParseResult frame_read_header(BufferView in, FrameHeader* out) noexcept {
        if (out == nullptr) return FrameParseResult::Invalid;
        if (in.data == nullptr || in.len < kFrameHeaderBytes) return FrameParseResult::NeedMore;

        const u8* p = in.data;
        if (get_u16_be(p + 6) != 0) return FrameParseResult::Invalid;

        const u16 type_u16 = get_u16_be(p + 2);
        if (!frame_type_valid_u16(type_u16)) return FrameParseResult::Invalid;

        FrameHeader h{};
        h.version = get_u16_be(p);
        h.type = static_cast<FrameType>(type_u16);
        h.flags = get_u16_be(p + 4);
        h.payload_len = get_u32_be(p + 8);
        h.request_id = get_u32_be(p + 12);
        if (!frame_header_valid(h, kMaxFramePayload)) return FrameParseResult::Invalid;

        *out = h;
        return FrameParseResult::Ok;
    }

    Status frame_seal(FrameType type, u32 request_id, std::vector<u8>* frame) noexcept {
        if (frame == nullptr || frame->size() < kFrameHeaderBytes) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        const std::size_t payload = frame->size() - kFrameHeaderBytes;
        if (payload > kMaxFramePayload) {
            return make_status(StatusDomain::Net, StatusCode::Invalid, static_cast<u32>(payload));
        }

        FrameHeader h{};
        h.type = type;
        h.payload_len = static_cast<u32>(payload);
        h.request_id = request_id;
        if (frame_write_header(h, BufferMut{frame->data(), kFrameHeaderBytes}) != kFrameHeaderBytes) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        return nodus::core::ok_status();
    }

    Status frame_open(BufferView frame, FrameHeader* header, BufferView* payload) noexcept {
        if (header == nullptr || payload == nullptr) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        FrameHeader h{};
        if (frame_read_header(frame, &h) != FrameParseResult::Ok) {
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }
        if (frame.len - kFrameHeaderBytes != h.payload_len) {
            return make_status(StatusDomain::Net, StatusCode::Invalid, frame.len);
        }
        *header = h;
        *payload = BufferView{frame.data + kFrameHeaderBytes, h.payload_len};
        return nodus::core::ok_status();
    }
} // namespace nodus::net
