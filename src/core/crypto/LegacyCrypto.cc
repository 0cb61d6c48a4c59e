// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "LegacyCrypto.h"
#include "../../utils/Log.h"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <algorithm>
#include <cstring>
#include <initializer_list>
#include <limits>

namespace AgileKeychain {

namespace {

// One MD5 pass over the concatenation of the given parts
bool md5_concat(EVP_MD_CTX* ctx,
                std::initializer_list<std::span<const uint8_t>> parts,
                std::span<uint8_t, 16> out) {
    if (EVP_DigestInit_ex(ctx, EVP_md5(), nullptr) != 1) {
        return false;
    }
    for (const auto& part : parts) {
        if (EVP_DigestUpdate(ctx, part.data(), part.size()) != 1) {
            return false;
        }
    }
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, out.data(), &len) != 1) {
        return false;
    }
    return len == out.size();
}

}  // namespace

KeychainResult<LegacyCrypto::SaltedBlob>
LegacyCrypto::extract_salted_blob(std::span<const uint8_t> bytes) {
    if (bytes.size() < SALT_MAGIC_SIZE + SALT_SIZE) {
        Log::debug("LegacyCrypto: blob too short for salt header ({} bytes)", bytes.size());
        return std::unexpected(FormatError::MissingSaltHeader);
    }

    if (std::memcmp(bytes.data(), SALT_MAGIC.data(), SALT_MAGIC_SIZE) != 0) {
        Log::debug("LegacyCrypto: blob does not start with \"Salted__\"");
        return std::unexpected(FormatError::MissingSaltHeader);
    }

    SaltedBlob blob;
    auto salt = bytes.subspan(SALT_MAGIC_SIZE, SALT_SIZE);
    std::copy(salt.begin(), salt.end(), blob.salt.begin());

    auto ciphertext = bytes.subspan(SALT_MAGIC_SIZE + SALT_SIZE);
    blob.ciphertext.assign(ciphertext.begin(), ciphertext.end());
    return blob;
}

KeychainResult<LegacyCrypto::KeyIv>
LegacyCrypto::derive_legacy_key_iv(std::span<const uint8_t> secret,
                                   std::span<const uint8_t, SALT_SIZE> salt) {
    EVPDigestContextPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        Log::error("LegacyCrypto: Failed to create digest context");
        return std::unexpected(CryptoError::KeyDerivationFailed);
    }

    KeyIv result;

    // D1 = MD5(secret | salt)
    if (!md5_concat(ctx.get(), {secret, salt}, result.key)) {
        Log::error("LegacyCrypto: MD5 round 1 failed (MD5 unavailable?)");
        return std::unexpected(CryptoError::KeyDerivationFailed);
    }

    // D2 = MD5(D1 | secret | salt)
    if (!md5_concat(ctx.get(), {result.key, secret, salt}, result.iv)) {
        Log::error("LegacyCrypto: MD5 round 2 failed");
        return std::unexpected(CryptoError::KeyDerivationFailed);
    }

    return result;
}

KeychainResult<std::array<uint8_t, LegacyCrypto::PBKDF2_OUTPUT_SIZE>>
LegacyCrypto::derive_pbkdf2_key(std::span<const uint8_t> passphrase,
                                std::span<const uint8_t> salt,
                                uint32_t iterations) {
    if (iterations == 0 ||
        iterations > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
        Log::warning("LegacyCrypto: Refusing PBKDF2 with {} iterations", iterations);
        return std::unexpected(CryptoError::KeyDerivationFailed);
    }

    std::array<uint8_t, PBKDF2_OUTPUT_SIZE> derived;

    int result = PKCS5_PBKDF2_HMAC(
        reinterpret_cast<const char*>(passphrase.data()),
        static_cast<int>(passphrase.size()),
        salt.data(),
        static_cast<int>(salt.size()),
        static_cast<int>(iterations),
        EVP_sha1(),
        static_cast<int>(derived.size()),
        derived.data()
    );

    if (result != 1) {
        secure_clear(derived);
        Log::error("LegacyCrypto: PBKDF2-HMAC-SHA1 failed");
        return std::unexpected(CryptoError::KeyDerivationFailed);
    }

    return derived;
}

LegacyCrypto::KeyIv
LegacyCrypto::split_key_iv(const std::array<uint8_t, PBKDF2_OUTPUT_SIZE>& derived) {
    KeyIv result;
    std::copy_n(derived.begin(), KEY_SIZE, result.key.begin());
    std::copy_n(derived.begin() + KEY_SIZE, IV_SIZE, result.iv.begin());
    return result;
}

KeychainResult<SecureVector<uint8_t>>
LegacyCrypto::aes128_cbc_decrypt(std::span<const uint8_t> ciphertext,
                                 std::span<const uint8_t> key,
                                 std::span<const uint8_t> iv) {
    if (ciphertext.empty() || ciphertext.size() % BLOCK_SIZE != 0) {
        Log::debug("LegacyCrypto: ciphertext length {} is not a multiple of {}",
                   ciphertext.size(), BLOCK_SIZE);
        return std::unexpected(FormatError::InvalidBlockLength);
    }
    if (key.size() != KEY_SIZE || iv.size() != IV_SIZE) {
        Log::error("LegacyCrypto: bad AES-128 key/IV size ({}/{})", key.size(), iv.size());
        return std::unexpected(CryptoError::CipherFailed);
    }

    EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        Log::error("LegacyCrypto: Failed to create cipher context");
        return std::unexpected(CryptoError::CipherFailed);
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, key.data(), iv.data()) != 1) {
        Log::error("LegacyCrypto: EVP_DecryptInit_ex failed");
        return std::unexpected(CryptoError::CipherFailed);
    }

    // Padding is checked separately by pkcs7_unpad()
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    SecureVector<uint8_t> plaintext(ciphertext.size() + BLOCK_SIZE);
    int len = 0;
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                          ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
        Log::error("LegacyCrypto: EVP_DecryptUpdate failed");
        return std::unexpected(CryptoError::CipherFailed);
    }
    int plaintext_len = len;

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintext_len, &len) != 1) {
        Log::error("LegacyCrypto: EVP_DecryptFinal_ex failed");
        return std::unexpected(CryptoError::CipherFailed);
    }
    plaintext_len += len;

    plaintext.resize(static_cast<size_t>(plaintext_len));
    return plaintext;
}

KeychainResult<SecureVector<uint8_t>>
LegacyCrypto::pkcs7_unpad(std::span<const uint8_t> data, size_t block_size) {
    if (data.empty() || block_size == 0 || block_size > 255) {
        return std::unexpected(FormatError::InvalidPadding);
    }

    const size_t pad = data.back();
    if (pad == 0 || pad > data.size() || pad > block_size) {
        return std::unexpected(FormatError::InvalidPadding);
    }

    uint8_t diff = 0;
    for (size_t i = data.size() - pad; i < data.size(); ++i) {
        diff |= static_cast<uint8_t>(data[i] ^ pad);
    }
    if (diff != 0) {
        return std::unexpected(FormatError::InvalidPadding);
    }

    return SecureVector<uint8_t>(data.begin(), data.end() - static_cast<std::ptrdiff_t>(pad));
}

KeychainResult<std::vector<uint8_t>>
LegacyCrypto::decode_base64(std::string_view text) {
    if (text.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return std::unexpected(FormatError::InvalidBase64);
    }

    // EVP_DecodeUpdate stops at '-' and drops the rest of the input, so the
    // alphabet is checked here. Only whitespace and '=' may follow padding.
    bool in_padding = false;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            continue;
        }
        if (c == '=') {
            in_padding = true;
            continue;
        }
        const bool in_alphabet = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                 (c >= '0' && c <= '9') || c == '+' || c == '/';
        if (in_padding || !in_alphabet) {
            Log::debug("LegacyCrypto: base64 text has an invalid character (0x{:02x})",
                       static_cast<unsigned char>(c));
            return std::unexpected(FormatError::InvalidBase64);
        }
    }

    EVPEncodeContextPtr ctx(EVP_ENCODE_CTX_new());
    if (!ctx) {
        Log::error("LegacyCrypto: Failed to create base64 context");
        return std::unexpected(FormatError::InvalidBase64);
    }
    EVP_DecodeInit(ctx.get());

    // Decoded output never exceeds 3/4 of the input
    std::vector<uint8_t> out(text.size() / 4 * 3 + 3);
    int len = 0;
    if (EVP_DecodeUpdate(ctx.get(), out.data(), &len,
                         reinterpret_cast<const unsigned char*>(text.data()),
                         static_cast<int>(text.size())) < 0) {
        return std::unexpected(FormatError::InvalidBase64);
    }
    int total = len;

    if (EVP_DecodeFinal(ctx.get(), out.data() + total, &len) != 1) {
        return std::unexpected(FormatError::InvalidBase64);
    }
    total += len;

    out.resize(static_cast<size_t>(total));
    return out;
}

}  // namespace AgileKeychain
