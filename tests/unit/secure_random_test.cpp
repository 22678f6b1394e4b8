#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <regex>
#include <set>
#include <span>
#include <string>

#include "cipherbook/security/SecureRandom.hpp"

TEST(SecureRandom, FillsAndVaries)
{
    constexpr std::size_t kBytes{ 64U };
    std::array<std::uint8_t, kBytes> a{};
    std::array<std::uint8_t, kBytes> b{};

    ASSERT_TRUE(cipherbook::security::secureRandomFill(std::span{ a }));
    ASSERT_TRUE(cipherbook::security::secureRandomFill(std::span{ b }));
    EXPECT_NE(a, b);

    EXPECT_TRUE(cipherbook::security::secureRandomFill(std::span<std::uint8_t>{}));
}

TEST(SecureRandom, UuidIsVersion4Canonical)
{
    const std::regex pattern{ "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$" };

    std::set<std::string> seen;
    constexpr int kSamples{ 32 };
    for (int i{}; i < kSamples; ++i)
    {
        const auto uuid{ cipherbook::security::secureRandomUuid() };
        ASSERT_TRUE(uuid.has_value());
        EXPECT_TRUE(std::regex_match(*uuid, pattern)) << *uuid;
        seen.insert(*uuid);
    }
    EXPECT_EQ(seen.size(), static_cast<std::size_t>(kSamples));
}
