#include <vector>

#include <gtest/gtest.h>

#include "nodus/core/id_wrappers.hpp"
#include "nodus/storage/layout.hpp"

using namespace nodus::core;
using nodus::storage::layout_decode_value;
using nodus::storage::layout_encode_value;
using nodus::storage::WireTag;

class StorageLayoutTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(is_ok(id_wrappers_register_defaults())); }

    static Value round_trip(const Value& in) {
        std::vector<u8> buf;
        EXPECT_TRUE(is_ok(layout_encode_value(in, &buf)));
        Value out;
        u32 consumed = 0;
        EXPECT_TRUE(is_ok(layout_decode_value({buf.data(), static_cast<u32>(buf.size())}, &out, &consumed)));
        EXPECT_EQ(consumed, buf.size());
        return out;
    }
};

TEST_F(StorageLayoutTest, NestedValueSurvives) {
    Uuid16 raw{};
    raw.b[3] = 9;
    const Value in = List{
        Value{}, true, -5, 2.25, "text", Bytes{{0, 1, 2}},
        Uid{raw}, Pointer{Uid{raw}, "node-a", "int"},
        Instance{"arith.Accumulator", {Value(List{1, "x"})}},
    };
    EXPECT_EQ(round_trip(in), in);
}

TEST_F(StorageLayoutTest, I64IsBigEndian) {
    std::vector<u8> buf;
    ASSERT_TRUE(is_ok(layout_encode_value(Value(i64{0x0102030405060708}), &buf)));
    const std::vector<u8> expected = {static_cast<u8>(WireTag::I64), 1, 2, 3, 4, 5, 6, 7, 8};
    EXPECT_EQ(buf, expected);
}

TEST_F(StorageLayoutTest, Uuid16TravelsAsWrappedUid) {
    Uuid16 raw{};
    for (u32 i = 0; i < kUidBytes; ++i) {
        raw.b[i] = static_cast<u8>(0xf0 + i);
    }
    std::vector<u8> buf;
    ASSERT_TRUE(is_ok(layout_encode_value(Value(raw), &buf)));
    ASSERT_EQ(buf.size(), 2u + kUidBytes);
    EXPECT_EQ(buf[0], static_cast<u8>(WireTag::Uid));
    EXPECT_EQ(buf[1], nodus::storage::kUidFlagWrapper);

    Value out;
    u32 consumed = 0;
    ASSERT_TRUE(is_ok(layout_decode_value({buf.data(), static_cast<u32>(buf.size())}, &out, &consumed)));
    ASSERT_NE(out.get_if<Uuid16>(), nullptr);
    EXPECT_EQ(*out.get_if<Uuid16>(), raw);
}

TEST_F(StorageLayoutTest, Uuid16WithoutAdapterIsUnsupported) {
    id_wrappers_clear();
    std::vector<u8> buf{0xaa};
    const Status s = layout_encode_value(Value(List{1, Uuid16{}}), &buf);
    EXPECT_EQ(s.code, StatusCode::Unsupported);
    EXPECT_EQ(s.domain, StatusDomain::Store);
    // Partial output is rolled back.
    EXPECT_EQ(buf, std::vector<u8>{0xaa});
    ASSERT_TRUE(is_ok(id_wrappers_register_defaults()));
}

TEST_F(StorageLayoutTest, TruncatedInputIsCorrupt) {
    std::vector<u8> buf;
    ASSERT_TRUE(is_ok(layout_encode_value(Value("hello"), &buf)));
    buf.pop_back();

    Value out;
    u32 consumed = 0;
    const Status s = layout_decode_value({buf.data(), static_cast<u32>(buf.size())}, &out, &consumed);
    EXPECT_EQ(s.code, StatusCode::Corrupt);
}

TEST_F(StorageLayoutTest, UnknownTagIsCorrupt) {
    const u8 buf[] = {0x7f};
    Value out;
    u32 consumed = 0;
    EXPECT_EQ(layout_decode_value({buf, 1}, &out, &consumed).code, StatusCode::Corrupt);
}

TEST_F(StorageLayoutTest, DepthLimitEnforced) {
    Value deep = 1;
    for (u32 i = 0; i < nodus::storage::kMaxValueDepth + 1; ++i) {
        deep = Value(List{deep});
    }
    std::vector<u8> buf;
    EXPECT_EQ(layout_encode_value(deep, &buf).code, StatusCode::Unsupported);
    EXPECT_TRUE(buf.empty());
}
