#include <gtest/gtest.h>

#include "nodus/core/id_wrappers.hpp"

using namespace nodus::core;

namespace {
    Uid wrap_plain(const Uuid16& raw) noexcept {
        return Uid{raw, true};
    }

    Uuid16 unwrap_plain(const Uid& id) noexcept {
        return id.value();
    }
} // namespace

// The registry is process-wide; every test leaves the defaults registered.
class IdWrapperRegistryTest : public ::testing::Test {
protected:
    void SetUp() override { id_wrappers_clear(); }
    void TearDown() override {
        id_wrappers_clear();
        ASSERT_TRUE(is_ok(id_wrappers_register_defaults()));
    }
};

TEST_F(IdWrapperRegistryTest, EmptyRegistryFindsNothing) {
    IdWrapperAdapter a{};
    const Status s = id_wrapper_find(ForeignIdType::Uuid16, &a);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(s.domain, StatusDomain::Identity);
}

TEST_F(IdWrapperRegistryTest, DefaultsRegisterUuid16AndAreIdempotent) {
    ASSERT_TRUE(is_ok(id_wrappers_register_defaults()));
    ASSERT_TRUE(is_ok(id_wrappers_register_defaults()));

    IdWrapperAdapter a{};
    ASSERT_TRUE(is_ok(id_wrapper_find(ForeignIdType::Uuid16, &a)));
    EXPECT_EQ(a.type, ForeignIdType::Uuid16);
    EXPECT_STREQ(a.name, "uuid16");

    Uuid16 raw{};
    raw.b[0] = 0xab;
    raw.b[15] = 0xcd;
    const Uid wrapped = a.wrap(raw);
    EXPECT_TRUE(wrapped.as_wrapper());
    EXPECT_EQ(wrapped.value(), raw);
    EXPECT_EQ(a.unwrap(wrapped), raw);
}

TEST_F(IdWrapperRegistryTest, DuplicateRegistrationConflicts) {
    const IdWrapperAdapter a{ForeignIdType::Uuid16, "plain", &wrap_plain, &unwrap_plain};
    ASSERT_TRUE(is_ok(id_wrapper_register(a)));

    const Status s = id_wrapper_register(a);
    EXPECT_EQ(s.code, StatusCode::Conflict);
    EXPECT_EQ(s.domain, StatusDomain::Identity);
}

TEST_F(IdWrapperRegistryTest, IncompleteAdapterIsInvalid) {
    IdWrapperAdapter a{ForeignIdType::Uuid16, "half", &wrap_plain, nullptr};
    EXPECT_EQ(id_wrapper_register(a).code, StatusCode::Invalid);

    a = IdWrapperAdapter{ForeignIdType::None, "none", &wrap_plain, &unwrap_plain};
    EXPECT_EQ(id_wrapper_register(a).code, StatusCode::Invalid);
}
