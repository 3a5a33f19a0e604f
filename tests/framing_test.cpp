#include <array>
#include <vector>

#include <gtest/gtest.h>

#include "nodus/net/framing.hpp"

using namespace nodus::net;

namespace {
    std::array<u8, kFrameHeaderBytes> written(const FrameHeader& h) {
        std::array<u8, kFrameHeaderBytes> buf{};
        EXPECT_EQ(frame_write_header(h, {buf.data(), kFrameHeaderBytes}), kFrameHeaderBytes);
        return buf;
    }
} // namespace

TEST(NetFraming, HeaderRoundTrip) {
    FrameHeader in{};
    in.type = FrameType::Response;
    in.flags = 0x1234;
    in.payload_len = 0x00010203;
    in.request_id = 0xaabbccdd;

    const auto buf = written(in);
    EXPECT_EQ(buf[8], 0x00);
    EXPECT_EQ(buf[9], 0x01);
    EXPECT_EQ(buf[15], 0xdd);

    FrameHeader out{};
    ASSERT_EQ(frame_read_header({buf.data(), kFrameHeaderBytes}, &out), FrameParseResult::Ok);
    EXPECT_EQ(out.version, 1);
    EXPECT_EQ(out.type, FrameType::Response);
    EXPECT_EQ(out.flags, in.flags);
    EXPECT_EQ(out.payload_len, in.payload_len);
    EXPECT_EQ(out.request_id, in.request_id);
}

TEST(NetFraming, NeedMoreWhenShort) {
    std::array<u8, kFrameHeaderBytes - 1> buf{};
    FrameHeader out{};
    EXPECT_EQ(frame_read_header({buf.data(), static_cast<u32>(buf.size())}, &out), FrameParseResult::NeedMore);
}

TEST(NetFraming, WriteRejectsShortBuffer) {
    std::array<u8, kFrameHeaderBytes - 1> buf{};
    EXPECT_EQ(frame_write_header(FrameHeader{}, {buf.data(), static_cast<u32>(buf.size())}), 0u);
}

TEST(NetFraming, InvalidWhenReservedNonZero) {
    auto buf = written(FrameHeader{});
    buf[6] = 0x12;
    FrameHeader out{};
    EXPECT_EQ(frame_read_header({buf.data(), kFrameHeaderBytes}, &out), FrameParseResult::Invalid);
}

TEST(NetFraming, InvalidWhenUnknownType) {
    auto buf = written(FrameHeader{});
    buf[2] = 0;
    buf[3] = 3;
    FrameHeader out{};
    EXPECT_EQ(frame_read_header({buf.data(), kFrameHeaderBytes}, &out), FrameParseResult::Invalid);
}

TEST(NetFraming, InvalidWhenVersionNotOne) {
    auto buf = written(FrameHeader{});
    buf[1] = 2;
    FrameHeader out{};
    EXPECT_EQ(frame_read_header({buf.data(), kFrameHeaderBytes}, &out), FrameParseResult::Invalid);
}

TEST(NetFraming, InvalidWhenPayloadTooLarge) {
    FrameHeader h{};
    h.payload_len = kMaxFramePayload + 1;
    const auto buf = written(h);
    FrameHeader out{};
    EXPECT_EQ(frame_read_header({buf.data(), kFrameHeaderBytes}, &out), FrameParseResult::Invalid);
    EXPECT_FALSE(frame_header_valid(h, kMaxFramePayload));
}

TEST(NetFraming, SealThenOpen) {
    std::vector<u8> frame(kFrameHeaderBytes);
    frame.push_back(0x01);
    frame.push_back(0x02);
    frame.push_back(0x03);
    ASSERT_TRUE(nodus::core::is_ok(frame_seal(FrameType::Request, 42, &frame)));

    FrameHeader h{};
    BufferView payload{};
    ASSERT_TRUE(nodus::core::is_ok(frame_open({frame.data(), static_cast<u32>(frame.size())}, &h, &payload)));
    EXPECT_EQ(h.type, FrameType::Request);
    EXPECT_EQ(h.request_id, 42u);
    EXPECT_EQ(h.payload_len, 3u);
    ASSERT_EQ(payload.len, 3u);
    EXPECT_EQ(payload.data, frame.data() + kFrameHeaderBytes);
    EXPECT_EQ(payload.data[2], 0x03);
}

TEST(NetFraming, SealRejectsMissingHeaderSpace) {
    std::vector<u8> frame(kFrameHeaderBytes - 1);
    const nodus::core::Status s = frame_seal(FrameType::Response, 1, &frame);
    EXPECT_EQ(s.code, nodus::core::StatusCode::Invalid);
    EXPECT_EQ(s.domain, nodus::core::StatusDomain::Net);
}

TEST(NetFraming, OpenRequiresExactPayload) {
    std::vector<u8> frame(kFrameHeaderBytes + 4);
    ASSERT_TRUE(nodus::core::is_ok(frame_seal(FrameType::Response, 9, &frame)));

    FrameHeader h{};
    BufferView payload{};
    // Trailing byte.
    frame.push_back(0);
    EXPECT_EQ(frame_open({frame.data(), static_cast<u32>(frame.size())}, &h, &payload).code,
              nodus::core::StatusCode::Invalid);
    // Truncated payload.
    EXPECT_EQ(frame_open({frame.data(), static_cast<u32>(frame.size() - 2)}, &h, &payload).code,
              nodus::core::StatusCode::Invalid);
    // Truncated header.
    EXPECT_EQ(frame_open({frame.data(), kFrameHeaderBytes - 1}, &h, &payload).code,
              nodus::core::StatusCode::Invalid);
}

TEST(NetFraming, TypeNames) {
    EXPECT_STREQ(frame_type_name(FrameType::Request), "Request");
    EXPECT_STREQ(frame_type_name(FrameType::Response), "Response");
}
