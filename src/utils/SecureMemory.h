// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file SecureMemory.h
 * @brief Zeroizing containers and OpenSSL RAII handles
 *
 * Passphrases, candidate keys, key-encrypting keys and IVs pass through
 * these types so that they are wiped with OPENSSL_cleanse() when released.
 */

#ifndef AGILEKEYCHAIN_SECURE_MEMORY_H
#define AGILEKEYCHAIN_SECURE_MEMORY_H

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace AgileKeychain {

/**
 * @brief Frees an EVP_CIPHER_CTX (nullptr-safe)
 */
struct EVPCipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};

/**
 * @brief Frees an EVP_MD_CTX (nullptr-safe)
 */
struct EVPDigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

/**
 * @brief Frees an EVP_ENCODE_CTX (nullptr-safe)
 */
struct EVPEncodeContextDeleter {
    void operator()(EVP_ENCODE_CTX* ctx) const {
        if (ctx) {
            EVP_ENCODE_CTX_free(ctx);
        }
    }
};

/** @brief Owning handle for AES decryption contexts */
using EVPCipherContextPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherContextDeleter>;

/** @brief Owning handle for MD5 digest contexts */
using EVPDigestContextPtr = std::unique_ptr<EVP_MD_CTX, EVPDigestContextDeleter>;

/** @brief Owning handle for base64 decoding contexts */
using EVPEncodeContextPtr = std::unique_ptr<EVP_ENCODE_CTX, EVPEncodeContextDeleter>;

/**
 * @brief Allocator that wipes memory before handing it back
 *
 * @code
 * SecureVector<uint8_t> candidate_key(plaintext.begin(), plaintext.end());
 * // wiped when candidate_key is destroyed or reallocated
 * @endcode
 */
template<typename T>
class SecureAllocator : public std::allocator<T> {
public:
    template<typename U>
    struct rebind {
        using other = SecureAllocator<U>;
    };

    SecureAllocator() noexcept = default;

    template<typename U>
    SecureAllocator(const SecureAllocator<U>&) noexcept {}

    void deallocate(T* p, std::size_t n) {
        if (p) {
            OPENSSL_cleanse(p, n * sizeof(T));
            std::allocator<T>::deallocate(p, n);
        }
    }
};

/**
 * @brief std::vector that zeroizes its storage on release
 */
template<typename T>
using SecureVector = std::vector<T, SecureAllocator<T>>;

/**
 * @brief Move-only holder for a fixed-size secret, wiped on destruction
 *
 * @code
 * SecureBuffer<std::array<uint8_t, 32>> derived(
 *     LegacyCrypto::derive_pbkdf2_key(passphrase, salt, iterations).value());
 * @endcode
 */
template<typename T>
class SecureBuffer {
public:
    explicit SecureBuffer(const T& data) : data_(data) {}
    SecureBuffer() = default;

    ~SecureBuffer() {
        secure_clear();
    }

    SecureBuffer(const SecureBuffer&) = delete;
    SecureBuffer& operator=(const SecureBuffer&) = delete;

    SecureBuffer(SecureBuffer&& other) noexcept : data_(std::move(other.data_)) {
        other.secure_clear();
    }

    SecureBuffer& operator=(SecureBuffer&& other) noexcept {
        if (this != &other) {
            secure_clear();
            data_ = std::move(other.data_);
            other.secure_clear();
        }
        return *this;
    }

    [[nodiscard]] const T& get() const { return data_; }
    [[nodiscard]] T& get() { return data_; }

    void secure_clear() {
        if constexpr (requires { data_.data(); data_.size(); }) {
            OPENSSL_cleanse(data_.data(), data_.size());
        }
    }

private:
    T data_;
};

/**
 * @brief Wipe a std::array in a way the compiler cannot elide
 */
template<size_t N>
inline void secure_clear(std::array<uint8_t, N>& arr) {
    OPENSSL_cleanse(arr.data(), arr.size());
}

/**
 * @brief Wipe and empty a std::string (raw documents, base64 key text)
 */
inline void secure_clear(std::string& str) {
    if (!str.empty()) {
        OPENSSL_cleanse(str.data(), str.size());
        str.clear();
    }
}

} // namespace AgileKeychain

#endif // AGILEKEYCHAIN_SECURE_MEMORY_H
