// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file test_key_recovery.cc
 * @brief Unit tests for unwrapping and validating keychain keys
 */

#include <gtest/gtest.h>
#include "../src/core/KeyRecovery.h"
#include "../src/core/crypto/LegacyCrypto.h"
#include "../src/utils/Log.h"
#include "KeychainFixture.h"
#include <algorithm>

using namespace AgileKeychain;
using KeychainFixture::bytes;

// ============================================================================
// Test Fixture
// ============================================================================

class KeyRecoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        raw_key = KeychainFixture::random_bytes(KeychainFixture::RAW_KEY_SIZE);
        record = KeychainFixture::make_record("BE4CC37CD7C044E79B5CC1CC19A82A13", "SL5", raw_key);
        passphrase = bytes(KeychainFixture::PASSPHRASE);
    }

    // Decode a base64 member, let @p edit change the bytes, re-encode
    template<typename Edit>
    static std::string rewrite(const std::string& base64, Edit edit) {
        auto decoded = LegacyCrypto::decode_base64(base64);
        EXPECT_TRUE(decoded.has_value());
        edit(*decoded);
        return KeychainFixture::to_base64(*decoded);
    }

    static bool same_bytes(const RecoveredKey& key, const std::vector<uint8_t>& expected) {
        return std::ranges::equal(key.key(), expected);
    }

    std::vector<uint8_t> raw_key;
    KeyRecord record;
    std::vector<uint8_t> passphrase;
};

// ============================================================================
// Single record
// ============================================================================

TEST_F(KeyRecoveryTest, RecoverKeyWithCorrectPassphrase) {
    auto result = KeyRecovery::recover_key(record, passphrase);

    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->identifier(), record.identifier);
    EXPECT_EQ(result->size(), KeychainFixture::RAW_KEY_SIZE);
    EXPECT_TRUE(same_bytes(*result, raw_key));
}

TEST_F(KeyRecoveryTest, RecoverKeyWithWrongPassphrase) {
    auto result = KeyRecovery::recover_key(record, bytes("2Password"));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CryptoError::ValidationMismatch);
    EXPECT_EQ(result.error().identifier, record.identifier);
}

TEST_F(KeyRecoveryTest, WrongPassphraseNeverValidates) {
    // Whatever the unwrapped garbage looks like, the outcome is the same
    for (int i = 0; i < 8; ++i) {
        auto key = KeychainFixture::random_bytes(KeychainFixture::RAW_KEY_SIZE);
        auto rec = KeychainFixture::make_record("ID" + std::to_string(i), "SL3", key);

        auto result = KeyRecovery::recover_key(rec, bytes("not the passphrase"));

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error(), CryptoError::ValidationMismatch) << "record " << i;
    }
}

TEST_F(KeyRecoveryTest, EmptyPassphraseIsJustAnotherWrongPassphrase) {
    auto result = KeyRecovery::recover_key(record, {});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CryptoError::ValidationMismatch);
}

TEST_F(KeyRecoveryTest, RecoverKeyStripsOneTrailingNul) {
    record.data += '\0';
    record.validation += '\0';

    auto result = KeyRecovery::recover_key(record, passphrase);

    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_TRUE(same_bytes(*result, raw_key));
}

TEST_F(KeyRecoveryTest, RecoverKeyStripsOnlyOneNul) {
    record.data += std::string(2, '\0');

    auto result = KeyRecovery::recover_key(record, passphrase);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), FormatError::InvalidBase64);
}

TEST_F(KeyRecoveryTest, RecoverKeyRejectsTrailingJunk) {
    // Only NUL is special; other junk is a decoding error
    record.validation += "!";

    auto result = KeyRecovery::recover_key(record, passphrase);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), FormatError::InvalidBase64);
    EXPECT_EQ(result.error().identifier, record.identifier);
}

TEST_F(KeyRecoveryTest, RecoverKeyRejectsDashSuffix) {
    record.data += "-@@@@ *** junk";

    auto result = KeyRecovery::recover_key(record, passphrase);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), FormatError::InvalidBase64);
    EXPECT_EQ(result.error().identifier, record.identifier);
}

TEST_F(KeyRecoveryTest, DataWithoutSaltHeader) {
    record.data = KeychainFixture::to_base64(KeychainFixture::random_bytes(1056));

    auto result = KeyRecovery::recover_key(record, passphrase);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), FormatError::MissingSaltHeader);
}

TEST_F(KeyRecoveryTest, ValidationWithoutSaltHeader) {
    record.validation = rewrite(record.validation, [](std::vector<uint8_t>& blob) {
        std::fill_n(blob.begin(), 8, 0);
    });

    auto result = KeyRecovery::recover_key(record, passphrase);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), FormatError::MissingSaltHeader);
}

TEST_F(KeyRecoveryTest, MisalignedWrappedKeyFailsDecryption) {
    record.data = rewrite(record.data, [](std::vector<uint8_t>& blob) {
        blob.pop_back();
    });

    auto result = KeyRecovery::recover_key(record, passphrase);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CryptoError::KeyDecryptionFailed);
    EXPECT_EQ(result.error().identifier, record.identifier);
}

TEST_F(KeyRecoveryTest, TruncatedValidationReportsBlockLength) {
    record.validation = rewrite(record.validation, [](std::vector<uint8_t>& blob) {
        blob.resize(blob.size() - 5);
    });

    auto result = KeyRecovery::recover_key(record, passphrase);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), FormatError::InvalidBlockLength);
}

TEST_F(KeyRecoveryTest, CorruptedWrappedKeyFailsValidation) {
    // Flip a bit in the first ciphertext block; the padding still decodes
    record.data = rewrite(record.data, [](std::vector<uint8_t>& blob) {
        blob[16 + 3] ^= 0x01;
    });

    auto result = KeyRecovery::recover_key(record, passphrase);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CryptoError::ValidationMismatch);
}

TEST_F(KeyRecoveryTest, ValidationForAnotherKeyFails) {
    auto other_key = KeychainFixture::random_bytes(KeychainFixture::RAW_KEY_SIZE);
    record.validation = KeychainFixture::to_base64(KeychainFixture::make_validation(other_key));

    auto result = KeyRecovery::recover_key(record, passphrase);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CryptoError::ValidationMismatch);
}

TEST_F(KeyRecoveryTest, IterationCountMustMatch) {
    record.iterations = KeychainFixture::ITERATIONS + 1;

    auto result = KeyRecovery::recover_key(record, passphrase);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CryptoError::ValidationMismatch);
}

TEST_F(KeyRecoveryTest, ZeroIterationsFailsDerivation) {
    record.iterations = 0;

    auto result = KeyRecovery::recover_key(record, passphrase);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CryptoError::KeyDerivationFailed);
}

TEST_F(KeyRecoveryTest, StripTrailingNul) {
    using namespace std::string_view_literals;
    EXPECT_EQ(KeyRecovery::strip_trailing_nul("abc\0"sv), "abc");
    EXPECT_EQ(KeyRecovery::strip_trailing_nul("abc\0\0"sv), "abc\0"sv);
    EXPECT_EQ(KeyRecovery::strip_trailing_nul("abc"), "abc");
    EXPECT_EQ(KeyRecovery::strip_trailing_nul(""), "");
}

// ============================================================================
// Batch recovery
// ============================================================================

TEST_F(KeyRecoveryTest, RecoverKeysReturnsEveryKey) {
    auto sl3_key = KeychainFixture::random_bytes(KeychainFixture::RAW_KEY_SIZE);
    std::vector<KeyRecord> records{
        KeychainFixture::make_record("SL3-KEY", "SL3", sl3_key),
        record,
    };

    auto result = KeyRecovery::recover_keys(records, passphrase);

    ASSERT_TRUE(result.has_value()) << result.error();
    ASSERT_EQ(result->size(), 2u);
    EXPECT_TRUE(same_bytes(result->at("SL3-KEY"), sl3_key));
    EXPECT_TRUE(same_bytes(result->at(record.identifier), raw_key));
}

TEST_F(KeyRecoveryTest, RecoverKeysEmptyListIsEmptyMap) {
    auto result = KeyRecovery::recover_keys({}, passphrase);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST_F(KeyRecoveryTest, RecoverKeysFailsWholeBatch) {
    auto good = KeychainFixture::make_record("GOOD", "SL3",
        KeychainFixture::random_bytes(KeychainFixture::RAW_KEY_SIZE));
    auto bad = record;
    bad.identifier = "BAD";
    bad.validation = KeychainFixture::to_base64(KeychainFixture::make_validation(
        KeychainFixture::random_bytes(KeychainFixture::RAW_KEY_SIZE)));

    std::vector<KeyRecord> records{good, bad};
    int calls = 0;

    auto result = KeyRecovery::recover_keys(records, passphrase,
        [&calls](const RecoveredKey&) { ++calls; });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CryptoError::ValidationMismatch);
    EXPECT_EQ(result.error().identifier, "BAD");
    EXPECT_EQ(calls, 0);
}

TEST_F(KeyRecoveryTest, RecoverKeysWrongPassphraseNamesFirstRecord) {
    std::vector<KeyRecord> records{
        record,
        KeychainFixture::make_record("SECOND", "SL3",
            KeychainFixture::random_bytes(KeychainFixture::RAW_KEY_SIZE)),
    };

    auto result = KeyRecovery::recover_keys(records, bytes("wrong"));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), CryptoError::ValidationMismatch);
    EXPECT_EQ(result.error().identifier, record.identifier);
}

TEST_F(KeyRecoveryTest, ObserverSeesKeysInRecordOrder) {
    std::vector<KeyRecord> records{
        KeychainFixture::make_record("ZZZ", "SL3",
            KeychainFixture::random_bytes(KeychainFixture::RAW_KEY_SIZE)),
        KeychainFixture::make_record("AAA", "SL5",
            KeychainFixture::random_bytes(KeychainFixture::RAW_KEY_SIZE)),
    };
    std::vector<std::string> seen;

    auto result = KeyRecovery::recover_keys(records, passphrase,
        [&seen](const RecoveredKey& key) { seen.push_back(key.identifier()); });

    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(seen, (std::vector<std::string>{"ZZZ", "AAA"}));
}

TEST_F(KeyRecoveryTest, RepeatedIdentifierKeepsLastRecord) {
    auto replacement_key = KeychainFixture::random_bytes(KeychainFixture::RAW_KEY_SIZE);
    auto replacement = KeychainFixture::make_record(record.identifier, "SL5", replacement_key);
    std::vector<KeyRecord> records{record, replacement};
    int calls = 0;

    auto result = KeyRecovery::recover_keys(records, passphrase,
        [&calls](const RecoveredKey&) { ++calls; });

    ASSERT_TRUE(result.has_value()) << result.error();
    ASSERT_EQ(result->size(), 1u);
    EXPECT_TRUE(same_bytes(result->at(record.identifier), replacement_key));
    EXPECT_EQ(calls, 1);
}

TEST_F(KeyRecoveryTest, FailedBatchWarnsOnce) {
    record.validation += "-";
    std::vector<KeyRecord> records{record};

    Log::set_level(Log::Level::Warning);
    ::testing::internal::CaptureStderr();
    auto result = KeyRecovery::recover_keys(records, passphrase);
    const std::string output = ::testing::internal::GetCapturedStderr();
    Log::set_level(Log::Level::Info);

    ASSERT_FALSE(result.has_value());
    size_t warnings = 0;
    for (size_t pos = output.find("WARN "); pos != std::string::npos;
         pos = output.find("WARN ", pos + 1)) {
        ++warnings;
    }
    EXPECT_EQ(warnings, 1u) << output;
}
