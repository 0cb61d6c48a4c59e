// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "../src/utils/OptionsValidator.h"
#include <gtest/gtest.h>
#include <limits>

using namespace AgileKeychain;

/**
 * @brief Defaults pass through untouched
 */
TEST(OptionsValidatorTest, DefaultsAreInRange) {
    KeychainOptions defaults;
    auto validated = OptionsValidator::validate(defaults);

    EXPECT_EQ(validated.profile, "default");
    EXPECT_EQ(validated.max_document_size, defaults.max_document_size);
    EXPECT_EQ(validated.max_pbkdf2_iterations, defaults.max_pbkdf2_iterations);
}

TEST(OptionsValidatorTest, DocumentSizeClamped) {
    KeychainOptions options;

    options.max_document_size = 0;
    EXPECT_EQ(OptionsValidator::validate(options).max_document_size,
              OptionsValidator::MIN_DOCUMENT_SIZE);

    options.max_document_size = std::numeric_limits<std::size_t>::max();
    EXPECT_EQ(OptionsValidator::validate(options).max_document_size,
              OptionsValidator::MAX_DOCUMENT_SIZE);

    options.max_document_size = 64 * 1024;
    EXPECT_EQ(OptionsValidator::validate(options).max_document_size, 64u * 1024);
}

TEST(OptionsValidatorTest, IterationCeilingClamped) {
    KeychainOptions options;

    options.max_pbkdf2_iterations = 0;
    EXPECT_EQ(OptionsValidator::validate(options).max_pbkdf2_iterations,
              OptionsValidator::MIN_PBKDF2_ITERATIONS_CEILING);

    options.max_pbkdf2_iterations = std::numeric_limits<uint32_t>::max();
    EXPECT_EQ(OptionsValidator::validate(options).max_pbkdf2_iterations,
              OptionsValidator::MAX_PBKDF2_ITERATIONS_CEILING);

    // 1Password's own default must always be allowed
    options.max_pbkdf2_iterations = 1000;
    EXPECT_EQ(OptionsValidator::validate(options).max_pbkdf2_iterations, 1000u);
}

TEST(OptionsValidatorTest, SafeProfileNames) {
    EXPECT_TRUE(OptionsValidator::is_safe_profile_name("default"));
    EXPECT_TRUE(OptionsValidator::is_safe_profile_name("work profile"));
    EXPECT_TRUE(OptionsValidator::is_safe_profile_name("a.b"));
}

TEST(OptionsValidatorTest, UnsafeProfileNames) {
    using namespace std::string_view_literals;
    EXPECT_FALSE(OptionsValidator::is_safe_profile_name(""));
    EXPECT_FALSE(OptionsValidator::is_safe_profile_name("."));
    EXPECT_FALSE(OptionsValidator::is_safe_profile_name(".."));
    EXPECT_FALSE(OptionsValidator::is_safe_profile_name(".hidden"));
    EXPECT_FALSE(OptionsValidator::is_safe_profile_name("../default"));
    EXPECT_FALSE(OptionsValidator::is_safe_profile_name("a/b"));
    EXPECT_FALSE(OptionsValidator::is_safe_profile_name("a\\b"));
    EXPECT_FALSE(OptionsValidator::is_safe_profile_name("def\0ault"sv));
}

TEST(OptionsValidatorTest, UnsafeProfileReplaced) {
    KeychainOptions options;
    options.profile = "/etc";

    auto validated = OptionsValidator::validate(options);

    EXPECT_EQ(validated.profile, OptionsValidator::DEFAULT_PROFILE);
}

TEST(OptionsValidatorTest, CustomProfileKept) {
    KeychainOptions options;
    options.profile = "work";

    EXPECT_EQ(OptionsValidator::validate(options).profile, "work");
}
