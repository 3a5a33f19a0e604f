#include <array>
#include <cstring>

#include <gtest/gtest.h>

#include "nodus/security/random.hpp"

TEST(SecurityRandom, FillsBuffer) {
    std::array<nodus::core::u8, 64> a{};
    std::array<nodus::core::u8, 64> b{};
    ASSERT_TRUE(nodus::core::is_ok(nodus::security::random_bytes({a.data(), 64})));
    ASSERT_TRUE(nodus::core::is_ok(nodus::security::random_bytes({b.data(), 64})));
    EXPECT_NE(std::memcmp(a.data(), b.data(), a.size()), 0);
}

TEST(SecurityRandom, BackendIsNamed) {
    const char* name = nodus::security::random_backend_name();
    ASSERT_NE(name, nullptr);
    EXPECT_TRUE(std::strcmp(name, "libsodium") == 0 || std::strcmp(name, "openssl") == 0);
}

TEST(SecurityRandom, NullBufferIsInvalid) {
    EXPECT_EQ(nodus::security::random_bytes({nullptr, 8}).code, nodus::core::StatusCode::Invalid);
}
