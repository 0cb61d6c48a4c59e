// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#ifndef AGILEKEYCHAIN_LEGACY_CRYPTO_H
#define AGILEKEYCHAIN_LEGACY_CRYPTO_H

#include "../KeychainError.h"
#include "../../utils/SecureMemory.h"
#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace AgileKeychain {

/**
 * @brief Crypto primitives of the Agile Keychain on-disk format
 *
 * The keychain stores key material the way `openssl enc -aes-128-cbc -salt`
 * does:
 *
 * ```
 * "Salted__" (8) | salt (8) | AES-128-CBC ciphertext, PKCS#7 padded
 * ```
 *
 * Two different KDFs are in play and both must be reproduced bit-exactly:
 * - PBKDF2-HMAC-SHA1 (32 bytes: 16-byte key then 16-byte IV) unwraps a key
 *   with the master passphrase.
 * - OpenSSL's legacy EVP_BytesToKey with MD5 and one iteration, which for
 *   AES-128 is two chained MD5 rounds, decrypts the validation blob.
 *
 * This class is stateless and thread-safe. All methods are static.
 *
 * @section usage Usage Example
 * @code
 * auto blob = LegacyCrypto::extract_salted_blob(decoded_data);
 * auto derived = LegacyCrypto::derive_pbkdf2_key(passphrase, blob->salt, 1000);
 * auto plain = LegacyCrypto::aes128_cbc_decrypt(
 *     blob->ciphertext,
 *     std::span(derived->data(), 16),
 *     std::span(derived->data() + 16, 16));
 * auto key = LegacyCrypto::pkcs7_unpad(*plain);
 * @endcode
 */
class LegacyCrypto {
public:
    static constexpr std::string_view SALT_MAGIC = "Salted__";
    static constexpr size_t SALT_MAGIC_SIZE = 8;
    static constexpr size_t SALT_SIZE = 8;
    static constexpr size_t KEY_SIZE = 16;      ///< AES-128
    static constexpr size_t IV_SIZE = 16;
    static constexpr size_t BLOCK_SIZE = 16;
    static constexpr size_t PBKDF2_OUTPUT_SIZE = KEY_SIZE + IV_SIZE;

    /**
     * @brief Salt and ciphertext split out of an OpenSSL salted blob
     */
    struct SaltedBlob {
        std::array<uint8_t, SALT_SIZE> salt;
        std::vector<uint8_t> ciphertext;
    };

    /**
     * @brief AES-128 key and IV pair, wiped on destruction
     */
    struct KeyIv {
        std::array<uint8_t, KEY_SIZE> key{};
        std::array<uint8_t, IV_SIZE> iv{};

        ~KeyIv() {
            secure_clear(key);
            secure_clear(iv);
        }
    };

    /**
     * @brief Split "Salted__" | salt | ciphertext
     *
     * @param bytes Base64-decoded blob
     * @return Salt and remaining ciphertext (possibly empty), or
     *         FormatError::MissingSaltHeader if the input is shorter than 16
     *         bytes or the magic is absent
     *
     * @note There is no fallback to an all-zero salt for unsalted blobs.
     */
    [[nodiscard]] static KeychainResult<SaltedBlob>
    extract_salted_blob(std::span<const uint8_t> bytes);

    /**
     * @brief OpenSSL EVP_BytesToKey(MD5, count=1) for a 16-byte key and IV
     *
     * key = MD5(secret | salt), iv = MD5(key | secret | salt).
     *
     * @return Key and IV, or CryptoError::KeyDerivationFailed if the MD5
     *         digest is unavailable (e.g. a FIPS-only provider)
     */
    [[nodiscard]] static KeychainResult<KeyIv>
    derive_legacy_key_iv(std::span<const uint8_t> secret,
                         std::span<const uint8_t, SALT_SIZE> salt);

    /**
     * @brief PBKDF2-HMAC-SHA1 producing 32 bytes
     *
     * Bytes 0-15 are the key-encrypting key, bytes 16-31 the IV.
     *
     * @param passphrase Raw passphrase bytes
     * @param salt Salt (8 bytes for every keychain record)
     * @param iterations Round count, must be non-zero
     * @return Derived bytes, or CryptoError::KeyDerivationFailed
     */
    [[nodiscard]] static KeychainResult<std::array<uint8_t, PBKDF2_OUTPUT_SIZE>>
    derive_pbkdf2_key(std::span<const uint8_t> passphrase,
                      std::span<const uint8_t> salt,
                      uint32_t iterations);

    /**
     * @brief Split PBKDF2 output into key (first half) and IV (second half)
     */
    [[nodiscard]] static KeyIv
    split_key_iv(const std::array<uint8_t, PBKDF2_OUTPUT_SIZE>& derived);

    /**
     * @brief Raw AES-128-CBC decryption, padding left in place
     *
     * @return Plaintext of the same length as the ciphertext, or
     *         FormatError::InvalidBlockLength for empty or non-block-aligned
     *         input, or CryptoError::CipherFailed for a bad key/IV size
     */
    [[nodiscard]] static KeychainResult<SecureVector<uint8_t>>
    aes128_cbc_decrypt(std::span<const uint8_t> ciphertext,
                       std::span<const uint8_t> key,
                       std::span<const uint8_t> iv);

    /**
     * @brief Strip PKCS#7 padding
     *
     * The pad run is compared without early exit, so the time taken depends
     * only on the pad length.
     *
     * @return Data without its padding, or FormatError::InvalidPadding when the
     *         pad byte is zero, exceeds the data or block size, or the pad run
     *         is inconsistent
     */
    [[nodiscard]] static KeychainResult<SecureVector<uint8_t>>
    pkcs7_unpad(std::span<const uint8_t> data, size_t block_size = BLOCK_SIZE);

    /**
     * @brief Strict base64 decoding (line breaks and spaces tolerated)
     *
     * @return Decoded bytes, or FormatError::InvalidBase64
     */
    [[nodiscard]] static KeychainResult<std::vector<uint8_t>>
    decode_base64(std::string_view text);

    // LegacyCrypto is a utility class - no instances needed
    LegacyCrypto() = delete;
    ~LegacyCrypto() = delete;
    LegacyCrypto(const LegacyCrypto&) = delete;
    LegacyCrypto& operator=(const LegacyCrypto&) = delete;
    LegacyCrypto(LegacyCrypto&&) = delete;
    LegacyCrypto& operator=(LegacyCrypto&&) = delete;
};

}  // namespace AgileKeychain

#endif  // AGILEKEYCHAIN_LEGACY_CRYPTO_H
