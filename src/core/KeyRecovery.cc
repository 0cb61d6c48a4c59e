// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "KeyRecovery.h"
#include "crypto/LegacyCrypto.h"
#include "../utils/Log.h"
#include <openssl/crypto.h>
#include <vector>

namespace AgileKeychain {

std::string_view KeyRecovery::strip_trailing_nul(std::string_view text) noexcept {
    if (!text.empty() && text.back() == '\0') {
        text.remove_suffix(1);
    }
    return text;
}

KeychainResult<RecoveredKey>
KeyRecovery::recover_key(const KeyRecord& record, std::span<const uint8_t> passphrase) {
    const std::string& id = record.identifier;

    auto data = LegacyCrypto::decode_base64(strip_trailing_nul(record.data));
    if (!data) {
        Log::debug("KeyRecovery: key {} has undecodable data", id);
        return std::unexpected(data.error().with_identifier(id));
    }
    auto validation = LegacyCrypto::decode_base64(strip_trailing_nul(record.validation));
    if (!validation) {
        Log::debug("KeyRecovery: key {} has undecodable validation", id);
        return std::unexpected(validation.error().with_identifier(id));
    }

    // ------------------------------------------------------------------
    // Unwrap the candidate with the passphrase-derived KEK
    // ------------------------------------------------------------------
    auto wrapped = LegacyCrypto::extract_salted_blob(*data);
    if (!wrapped) {
        return std::unexpected(wrapped.error().with_identifier(id));
    }

    auto derived = LegacyCrypto::derive_pbkdf2_key(passphrase, wrapped->salt, record.iterations);
    if (!derived) {
        return std::unexpected(derived.error().with_identifier(id));
    }
    SecureBuffer<std::array<uint8_t, LegacyCrypto::PBKDF2_OUTPUT_SIZE>> derived_bytes(*derived);
    secure_clear(*derived);
    const auto kek = LegacyCrypto::split_key_iv(derived_bytes.get());

    auto padded_key = LegacyCrypto::aes128_cbc_decrypt(wrapped->ciphertext, kek.key, kek.iv);
    if (!padded_key) {
        Log::debug("KeyRecovery: key {} could not be decrypted: {}", id, padded_key.error().kind());
        return std::unexpected(KeychainError(CryptoError::KeyDecryptionFailed).with_identifier(id));
    }

    // Bad padding here is what a wrong passphrase looks like
    auto candidate = LegacyCrypto::pkcs7_unpad(*padded_key);
    if (!candidate) {
        Log::debug("KeyRecovery: key {} unwrapped to invalid padding", id);
        return std::unexpected(KeychainError(CryptoError::ValidationMismatch).with_identifier(id));
    }

    // ------------------------------------------------------------------
    // Validate: the candidate must decrypt its own validation blob
    // ------------------------------------------------------------------
    auto check = LegacyCrypto::extract_salted_blob(*validation);
    if (!check) {
        return std::unexpected(check.error().with_identifier(id));
    }

    auto check_key = LegacyCrypto::derive_legacy_key_iv(*candidate, check->salt);
    if (!check_key) {
        return std::unexpected(check_key.error().with_identifier(id));
    }

    auto padded_check = LegacyCrypto::aes128_cbc_decrypt(check->ciphertext,
                                                         check_key->key, check_key->iv);
    if (!padded_check) {
        Log::debug("KeyRecovery: validation blob of key {} undecryptable: {}",
                   id, padded_check.error().kind());
        return std::unexpected(padded_check.error().with_identifier(id));
    }

    auto check_plain = LegacyCrypto::pkcs7_unpad(*padded_check);
    if (!check_plain ||
        check_plain->size() != candidate->size() ||
        CRYPTO_memcmp(check_plain->data(), candidate->data(), candidate->size()) != 0) {
        Log::debug("KeyRecovery: key {} failed validation", id);
        return std::unexpected(KeychainError(CryptoError::ValidationMismatch).with_identifier(id));
    }

    Log::debug("KeyRecovery: key {} ({}) validated, {} bytes", id, record.level, candidate->size());
    return RecoveredKey(id, std::move(*candidate));
}

KeychainResult<RecoveredKeyMap>
KeyRecovery::recover_keys(std::span<const KeyRecord> records,
                          std::span<const uint8_t> passphrase,
                          const KeyRecoveredCallback& on_recovered) {
    RecoveredKeyMap keys;
    std::vector<std::string> order;
    order.reserve(records.size());

    for (const auto& record : records) {
        auto key = recover_key(record, passphrase);
        if (!key) {
            Log::warning("KeyRecovery: aborting, {}", key.error().message());
            return std::unexpected(key.error());
        }
        if (!keys.contains(record.identifier)) {
            order.push_back(record.identifier);
        }
        keys.insert_or_assign(record.identifier, std::move(*key));
    }

    Log::info("KeyRecovery: recovered {} key(s)", keys.size());

    if (on_recovered) {
        for (const auto& id : order) {
            on_recovered(keys.at(id));
        }
    }
    return keys;
}

}  // namespace AgileKeychain
