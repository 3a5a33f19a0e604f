#include <vector>

#include <gtest/gtest.h>

#include "nodus/core/endian.hpp"
#include "nodus/core/id_wrappers.hpp"
#include "nodus/net/protocol.hpp"

using namespace nodus::net;
using nodus::core::is_ok;
using nodus::core::Pointer;
using nodus::core::StatusCode;
using nodus::core::StatusDomain;
using nodus::core::Uid;
using nodus::core::Uuid16;
using nodus::core::Value;

class NetProtocolTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(is_ok(nodus::core::id_wrappers_register_defaults())); }

    static Uid uid_of(u8 seed) {
        Uuid16 v{};
        v.b.fill(seed);
        return Uid{v};
    }

    static Message through_wire(const Message& in) {
        std::vector<u8> buf;
        EXPECT_TRUE(is_ok(protocol_encode_message(in, &buf)));
        Message out;
        u32 consumed = 0;
        EXPECT_EQ(protocol_decode_message({buf.data(), static_cast<u32>(buf.size())}, &out, &consumed),
                  ProtocolParseResult::Ok);
        EXPECT_EQ(consumed, buf.size());
        return out;
    }
};

TEST_F(NetProtocolTest, EnvelopeHeaderLayout) {
    std::vector<u8> buf;
    ASSERT_TRUE(is_ok(protocol_encode_message(GetObject{uid_of(7)}, &buf)));
    ASSERT_EQ(buf.size(), kMessageHeaderBytes + nodus::core::kUidBytes);
    EXPECT_EQ(nodus::core::get_u16_be(buf.data()), kProtocolVersion);
    EXPECT_EQ(nodus::core::get_u16_be(buf.data() + 2), static_cast<u16>(MsgKind::GetObject));
    EXPECT_EQ(nodus::core::get_u32_be(buf.data() + 4), nodus::core::kUidBytes);
    EXPECT_EQ(buf[kMessageHeaderBytes], 7);
}

TEST_F(NetProtocolTest, CallMessagesKeepArgsAndResultId) {
    RunClassMethod m;
    m.uid = uid_of(1);
    m.method_name = "add";
    m.args = {Value(5), Value(Pointer{uid_of(2), "node-a", "int"}), Value(Uuid16{})};
    m.result_id = uid_of(3);

    const Message out = through_wire(m);
    const auto* got = std::get_if<RunClassMethod>(&out);
    ASSERT_NE(got, nullptr);
    EXPECT_EQ(got->uid, m.uid);
    EXPECT_EQ(got->method_name, "add");
    EXPECT_EQ(got->args, m.args);
    ASSERT_TRUE(got->result_id.has_value());
    EXPECT_EQ(*got->result_id, *m.result_id);

    RunFunctionOrConstructor f;
    f.path = "arith.Accumulator";
    const Message fout = through_wire(f);
    const auto* gotf = std::get_if<RunFunctionOrConstructor>(&fout);
    ASSERT_NE(gotf, nullptr);
    EXPECT_EQ(gotf->path, "arith.Accumulator");
    EXPECT_TRUE(gotf->args.empty());
    EXPECT_FALSE(gotf->result_id.has_value());
}

TEST_F(NetProtocolTest, SaveObjectCarriesValue) {
    const Message out = through_wire(SaveObject{uid_of(9), Value(nodus::core::List{1, "two"})});
    const auto* got = std::get_if<SaveObject>(&out);
    ASSERT_NE(got, nullptr);
    EXPECT_EQ(got->uid, uid_of(9));
    EXPECT_EQ(got->object, Value(nodus::core::List{1, "two"}));
}

TEST_F(NetProtocolTest, UnknownKindIsReported) {
    std::vector<u8> buf;
    ASSERT_TRUE(is_ok(protocol_encode_message(DeleteObject{uid_of(1)}, &buf)));
    nodus::core::put_u16_be(buf.data() + 2, 99);

    Message out;
    u32 consumed = 0;
    const ProtocolParseResult r = protocol_decode_message({buf.data(), static_cast<u32>(buf.size())}, &out, &consumed);
    EXPECT_EQ(r, ProtocolParseResult::UnknownKind);

    const nodus::core::Status s = protocol_result_status(r);
    EXPECT_EQ(s.code, StatusCode::UnknownKind);
    EXPECT_EQ(s.domain, StatusDomain::Net);
}

TEST_F(NetProtocolTest, TruncatedIsNeedMoreAndTrailingIsInvalid) {
    std::vector<u8> buf;
    ASSERT_TRUE(is_ok(protocol_encode_message(GetObject{uid_of(1)}, &buf)));

    Message out;
    u32 consumed = 0;
    EXPECT_EQ(protocol_decode_message({buf.data(), static_cast<u32>(buf.size() - 1)}, &out, &consumed),
              ProtocolParseResult::NeedMore);
    EXPECT_EQ(protocol_decode_message({buf.data(), 4}, &out, &consumed), ProtocolParseResult::NeedMore);

    // body_len claims one more byte than GetObject uses.
    buf.push_back(0);
    nodus::core::put_u32_be(buf.data() + 4, nodus::core::kUidBytes + 1);
    EXPECT_EQ(protocol_decode_message({buf.data(), static_cast<u32>(buf.size())}, &out, &consumed),
              ProtocolParseResult::Invalid);
}

TEST_F(NetProtocolTest, BadVersionIsInvalid) {
    std::vector<u8> buf;
    ASSERT_TRUE(is_ok(protocol_encode_message(GetObject{uid_of(1)}, &buf)));
    nodus::core::put_u16_be(buf.data(), 2);
    Message out;
    u32 consumed = 0;
    EXPECT_EQ(protocol_decode_message({buf.data(), static_cast<u32>(buf.size())}, &out, &consumed),
              ProtocolParseResult::Invalid);
}

TEST_F(NetProtocolTest, ResponseRoundTripKeepsStatus) {
    Response in = response_failure(MsgKind::GetObject,
        nodus::core::make_status(StatusDomain::Store, StatusCode::NotFound, 17));
    std::vector<u8> buf;
    ASSERT_TRUE(is_ok(protocol_encode_response(in, &buf)));

    Response out;
    u32 consumed = 0;
    ASSERT_EQ(protocol_decode_response({buf.data(), static_cast<u32>(buf.size())}, &out, &consumed),
              ProtocolParseResult::Ok);
    EXPECT_EQ(consumed, buf.size());
    EXPECT_EQ(out.kind, MsgKind::GetObject);
    EXPECT_EQ(out.status.code, StatusCode::NotFound);
    EXPECT_EQ(out.status.domain, StatusDomain::Store);
    EXPECT_EQ(out.status.aux, 17u);
    EXPECT_TRUE(out.payload.is_none());

    in = response_value(MsgKind::RunFunctionOrConstructor, Value(Pointer{uid_of(4), "node-a", "int"}));
    buf.clear();
    ASSERT_TRUE(is_ok(protocol_encode_response(in, &buf)));
    ASSERT_EQ(protocol_decode_response({buf.data(), static_cast<u32>(buf.size())}, &out, &consumed),
              ProtocolParseResult::Ok);
    EXPECT_TRUE(out.ok());
    EXPECT_EQ(out.payload, in.payload);
}

TEST_F(NetProtocolTest, PointerHelpersTargetPointee) {
    const Pointer p{uid_of(5), "node-b", "arith.Accumulator"};

    const Message get = pointer_get_message(p);
    ASSERT_EQ(msg_kind(get), MsgKind::GetObject);
    EXPECT_EQ(std::get<GetObject>(get).uid, p.id);

    const Message del = pointer_delete_message(p);
    ASSERT_EQ(msg_kind(del), MsgKind::DeleteObject);
    EXPECT_EQ(std::get<DeleteObject>(del).uid, p.id);

    const Message call = pointer_method_message(p, "total", {}, uid_of(6));
    ASSERT_EQ(msg_kind(call), MsgKind::RunClassMethod);
    const auto& m = std::get<RunClassMethod>(call);
    EXPECT_EQ(m.uid, p.id);
    EXPECT_EQ(m.method_name, "total");
    EXPECT_EQ(m.result_id, std::optional<Uid>(uid_of(6)));
}
