#include <gtest/gtest.h>

#include "nodus/core/value.hpp"

using namespace nodus::core;

namespace {
    Uid sample_uid(u8 seed) {
        Uuid16 v{};
        for (u32 i = 0; i < kUidBytes; ++i) {
            v.b[i] = static_cast<u8>(seed + i);
        }
        return Uid{v};
    }
} // namespace

TEST(CoreValue, TagsFollowAlternatives) {
    EXPECT_EQ(Value{}.tag(), ValueTag::None);
    EXPECT_EQ(Value(true).tag(), ValueTag::Bool);
    EXPECT_EQ(Value(7).tag(), ValueTag::I64);
    EXPECT_EQ(Value(1.5).tag(), ValueTag::F64);
    EXPECT_EQ(Value("s").tag(), ValueTag::String);
    EXPECT_EQ(Value(Bytes{{1, 2}}).tag(), ValueTag::Bytes);
    EXPECT_EQ(Value(sample_uid(1)).tag(), ValueTag::Uid);
    EXPECT_EQ(Value(Uuid16{}).tag(), ValueTag::Uuid16);
    EXPECT_EQ(Value(Pointer{sample_uid(1), "node-a", ""}).tag(), ValueTag::Pointer);
    EXPECT_EQ(Value(List{1, 2}).tag(), ValueTag::List);
    EXPECT_EQ(Value(Instance{"fw.C", {}}).tag(), ValueTag::Instance);
}

TEST(CoreValue, StructuralEquality) {
    const Value a = List{1, "two", List{3.0, true}};
    const Value b = List{1, "two", List{3.0, true}};
    const Value c = List{1, "two", List{3.0, false}};
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);

    EXPECT_FALSE(Value(1) == Value(1.0));
    EXPECT_EQ(Value(Instance{"fw.C", {1}}), Value(Instance{"fw.C", {1}}));
    EXPECT_FALSE(Value(Instance{"fw.C", {1}}) == Value(Instance{"fw.D", {1}}));
}

TEST(CoreValue, PointerIdentityIgnoresTypeHint) {
    const Pointer a{sample_uid(3), "node-a", "int"};
    const Pointer b{sample_uid(3), "node-a", ""};
    const Pointer c{sample_uid(3), "node-b", "int"};
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
    EXPECT_TRUE(pointer_is_local(a, "node-a"));
    EXPECT_FALSE(pointer_is_local(c, "node-a"));
}

TEST(CoreValue, TypeNames) {
    EXPECT_EQ(value_type_name(Value{}), "none");
    EXPECT_EQ(value_type_name(Value(3)), "int");
    EXPECT_EQ(value_type_name(Value(3.0)), "float");
    EXPECT_EQ(value_type_name(Value("x")), "str");
    EXPECT_EQ(value_type_name(Value(sample_uid(0))), "UID");
    EXPECT_EQ(value_type_name(Value(Instance{"arith.Accumulator", {}})), "arith.Accumulator");
}

TEST(CoreValue, Repr) {
    EXPECT_EQ(value_repr(Value{}), "none");
    EXPECT_EQ(value_repr(Value(42)), "42");
    EXPECT_EQ(value_repr(Value(false)), "false");
    EXPECT_EQ(value_repr(Value("hi")), "\"hi\"");
    EXPECT_EQ(value_repr(Value(Bytes{{0xde, 0xad}})), "b'dead'");
    EXPECT_EQ(value_repr(Value(List{1, 2})), "[1, 2]");
    EXPECT_EQ(value_repr(Value(Instance{"fw.C", {5}})), "fw.C(5)");

    const Uid id = sample_uid(0);
    EXPECT_EQ(value_repr(Value(Pointer{id, "node-a", ""})), "<Pointer:node-a/" + uid_to_string(id) + ">");
}
