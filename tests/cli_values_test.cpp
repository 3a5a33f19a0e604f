#include <string>

#include <gtest/gtest.h>

#include "nodus/cli/values.hpp"
#include "nodus/core/uid.hpp"

using namespace nodus::cli;
using nodus::core::Pointer;
using nodus::core::Status;
using nodus::core::StatusCode;
using nodus::core::StatusDomain;
using nodus::core::Uid;
using nodus::core::Value;

namespace {
    Value parse(const char* tok) {
        Value v;
        EXPECT_EQ(parse_value_token(tok, "node-a", &v).code, StatusCode::Ok) << tok;
        return v;
    }
} // namespace

TEST(CliValues, ScalarTokens) {
    EXPECT_EQ(parse("42"), Value(42));
    EXPECT_EQ(parse("-7"), Value(-7));
    EXPECT_EQ(parse("2.5"), Value(2.5));
    EXPECT_EQ(parse("1e3"), Value(1000.0));
    EXPECT_EQ(parse("true"), Value(true));
    EXPECT_EQ(parse("false"), Value(false));
    EXPECT_TRUE(parse("none").is_none());
}

TEST(CliValues, EverythingElseIsAString) {
    EXPECT_EQ(parse("hello"), Value("hello"));
    EXPECT_EQ(parse("1.2.3"), Value("1.2.3"));
    EXPECT_EQ(parse("-"), Value("-"));
    EXPECT_EQ(parse("None"), Value("None"));
    EXPECT_EQ(parse(""), Value(""));
}

TEST(CliValues, AtUidBecomesLocalPointer) {
    Uid id{};
    ASSERT_TRUE(nodus::core::is_ok(nodus::core::uid_generate(&id)));
    const std::string tok = "@" + nodus::core::uid_to_string(id);

    const Value v = parse(tok.c_str());
    const Pointer* p = v.get_if<Pointer>();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->id, id);
    EXPECT_EQ(p->location, "node-a");
}

TEST(CliValues, MalformedUidIsInvalidIdentifier) {
    Value v;
    const Status s = parse_value_token("@not-a-uid", "node-a", &v);
    EXPECT_EQ(s.code, StatusCode::InvalidIdentifier);
    EXPECT_EQ(s.domain, StatusDomain::Identity);
}

TEST(CliValues, ArgsReportFailingIndex) {
    const char* argv[] = {"1", "two", "@zz"};
    nodus::net::ArgList out;
    const Status s = parse_value_args({argv, 3}, "node-a", &out);
    EXPECT_EQ(s.code, StatusCode::InvalidIdentifier);
    EXPECT_EQ(s.aux, 2u);

    ASSERT_EQ(parse_value_args({argv, 2}, "node-a", &out).code, StatusCode::Ok);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], Value(1));
    EXPECT_EQ(out[1], Value("two"));
}
