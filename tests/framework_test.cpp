#include <gtest/gtest.h>

#include "nodus/node/framework.hpp"

using namespace nodus::node;
using nodus::core::Status;
using nodus::core::StatusCode;
using nodus::core::Value;

namespace {
    Framework framework_named(const char* name) {
        Framework fw;
        fw.name = name;
        fw.attrs.emplace("linalg.norm", make_function_node([](const ArgList&, Value* out) -> Status {
            *out = Value(1.0);
            return nodus::core::ok_status();
        }));
        fw.attrs.emplace("Point", make_class_node(
            [](const ArgList& args, nodus::core::List* fields) -> Status {
                *fields = args;
                return nodus::core::ok_status();
            },
            {}));
        return fw;
    }
} // namespace

TEST(NodeFramework, ResolvesNestedAttributePaths) {
    FrameworkRegistry reg;
    ASSERT_TRUE(nodus::core::is_ok(reg.add(framework_named("num"))));

    const AstNode* node = nullptr;
    ASSERT_TRUE(nodus::core::is_ok(reg.resolve("num.linalg.norm", &node)));
    EXPECT_EQ(node->kind, AstNodeKind::Function);

    ASSERT_TRUE(nodus::core::is_ok(reg.resolve("num.Point", &node)));
    EXPECT_EQ(node->kind, AstNodeKind::Class);
}

TEST(NodeFramework, UnresolvablePathsAreNotFound) {
    FrameworkRegistry reg;
    ASSERT_TRUE(nodus::core::is_ok(reg.add(framework_named("num"))));

    const AstNode* node = nullptr;
    for (const char* path : {"num", "num.", ".norm", "other.linalg.norm", "num.linalg", "num.missing"}) {
        EXPECT_EQ(reg.resolve(path, &node).code, StatusCode::NotFound) << path;
    }
}

TEST(NodeFramework, DuplicateNameRejected) {
    FrameworkRegistry reg;
    ASSERT_TRUE(nodus::core::is_ok(reg.add(framework_named("num"))));
    const Status s = reg.add(framework_named("num"));
    EXPECT_EQ(s.code, StatusCode::DuplicateFramework);
    EXPECT_EQ(s.domain, nodus::core::StatusDomain::Worker);
    EXPECT_EQ(reg.size(), 1u);
}

TEST(NodeFramework, NamesMustBeNonEmptyWithoutDots) {
    FrameworkRegistry reg;
    EXPECT_EQ(reg.add(framework_named("")).code, StatusCode::Invalid);
    EXPECT_EQ(reg.add(framework_named("a.b")).code, StatusCode::Invalid);
}

TEST(NodeFramework, NamesAreSorted) {
    FrameworkRegistry reg;
    ASSERT_TRUE(nodus::core::is_ok(reg.add(framework_named("zeta"))));
    ASSERT_TRUE(nodus::core::is_ok(reg.add(framework_named("alpha"))));
    EXPECT_EQ(reg.names(), (std::vector<std::string>{"alpha", "zeta"}));
    EXPECT_NE(reg.find("alpha"), nullptr);
    EXPECT_EQ(reg.find("beta"), nullptr);
}
