// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file KeyRecovery.h
 * @brief Unwrap and validate the keychain's encryption keys
 *
 * Each record of encryptionKeys.js wraps one raw key twice:
 * - `data`: the key encrypted under PBKDF2-SHA1(passphrase, salt, iterations)
 * - `validation`: the key encrypted under EVP_BytesToKey(MD5, key, salt)
 *
 * A candidate key is accepted only when decrypting `validation` with a key
 * derived from the candidate itself reproduces the candidate. The format has
 * no MAC, so this is the only integrity check available, and it cannot tell a
 * wrong passphrase from a corrupted record.
 */

#ifndef AGILEKEYCHAIN_KEY_RECOVERY_H
#define AGILEKEYCHAIN_KEY_RECOVERY_H

#include "KeychainError.h"
#include "../utils/SecureMemory.h"
#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>

namespace AgileKeychain {

/**
 * @brief One entry of the key-metadata document's "list" array
 */
struct KeyRecord {
    std::string identifier;     ///< Unique per keychain, e.g. "BE4CC37CD7C044E79B5CC1CC19A82A13"
    std::string level;          ///< Security level tag, "SL3" or "SL5"
    uint32_t iterations = 0;    ///< PBKDF2 rounds for unwrapping @c data
    std::string data;           ///< Base64 of the salted, wrapped key
    std::string validation;     ///< Base64 of the salted validation blob
};

class KeyRecovery;

/**
 * @brief A key that passed validation
 *
 * Only KeyRecovery can construct one, so holding a RecoveredKey means the
 * validation check succeeded. Key bytes are wiped when the object dies.
 */
class RecoveredKey {
public:
    [[nodiscard]] const std::string& identifier() const noexcept { return m_identifier; }
    [[nodiscard]] std::span<const uint8_t> key() const noexcept { return m_key; }
    [[nodiscard]] size_t size() const noexcept { return m_key.size(); }

private:
    friend class KeyRecovery;

    RecoveredKey(std::string identifier, SecureVector<uint8_t> key)
        : m_identifier(std::move(identifier)), m_key(std::move(key)) {}

    std::string m_identifier;
    SecureVector<uint8_t> m_key;
};

/** @brief Validated keys by identifier */
using RecoveredKeyMap = std::map<std::string, RecoveredKey, std::less<>>;

/** @brief Invoked once per validated key after the whole batch succeeded */
using KeyRecoveredCallback = std::function<void(const RecoveredKey&)>;

/**
 * @brief Stateless key recovery pipeline
 *
 * @section usage Usage Example
 * @code
 * auto keys = KeyRecovery::recover_keys(
 *     key_list.records, passphrase_bytes,
 *     [](const RecoveredKey& key) {
 *         std::cout << "unlocked " << key.identifier() << "\n";
 *     });
 * if (!keys) {
 *     std::cerr << keys.error() << "\n";
 * }
 * @endcode
 */
class KeyRecovery {
public:
    /**
     * @brief Unwrap and validate a single record
     *
     * @param record Decoded key record
     * @param passphrase Master passphrase bytes
     * @return The validated key, or an error tagged with the record identifier:
     *         - FormatError::InvalidBase64 / MissingSaltHeader: bad record text
     *         - FormatError::InvalidBlockLength: truncated validation blob
     *         - CryptoError::KeyDecryptionFailed: wrapped key undecryptable
     *         - CryptoError::ValidationMismatch: wrong passphrase or corruption
     */
    [[nodiscard]] static KeychainResult<RecoveredKey>
    recover_key(const KeyRecord& record, std::span<const uint8_t> passphrase);

    /**
     * @brief Recover every key, or none
     *
     * Stops at the first record that fails; no partial key set is returned and
     * @p on_recovered is not called. On success @p on_recovered (if set) sees
     * each key in record order. A repeated identifier keeps the last record.
     */
    [[nodiscard]] static KeychainResult<RecoveredKeyMap>
    recover_keys(std::span<const KeyRecord> records,
                 std::span<const uint8_t> passphrase,
                 const KeyRecoveredCallback& on_recovered = nullptr);

    /**
     * @brief Drop one trailing NUL left behind by the writing application
     */
    [[nodiscard]] static std::string_view strip_trailing_nul(std::string_view text) noexcept;

    KeyRecovery() = delete;
    ~KeyRecovery() = delete;
    KeyRecovery(const KeyRecovery&) = delete;
    KeyRecovery& operator=(const KeyRecovery&) = delete;
};

}  // namespace AgileKeychain

#endif  // AGILEKEYCHAIN_KEY_RECOVERY_H
