// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng
//
// KeychainError.h - Error types for keychain decoding and key recovery
// C++23 std::expected-based error handling

#ifndef AGILEKEYCHAIN_KEYCHAIN_ERROR_H
#define AGILEKEYCHAIN_KEYCHAIN_ERROR_H

#include <cstddef>
#include <expected>
#include <format>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace AgileKeychain {

// Structural problems with the on-disk data
enum class FormatError {
    MissingSaltHeader,      // blob does not start with "Salted__" + 8-byte salt
    InvalidBlockLength,     // ciphertext empty or not a multiple of the AES block
    InvalidPadding,         // PKCS#7 pad byte or pad run inconsistent
    InvalidBase64,
    MalformedEntry,         // entry index element with wrong arity or type
    MalformedDocument       // document not JSON, or wrong top-level shape
};

// Cryptographic failures
enum class CryptoError {
    KeyDerivationFailed,
    CipherFailed,           // OpenSSL refused the operation (bad key/IV size)
    KeyDecryptionFailed,    // wrapped key could not be decrypted
    ValidationMismatch      // wrong passphrase or corrupted key record
};

// Filesystem problems at the keychain handle
enum class IoError {
    DirectoryNotFound,
    FileNotFound,
    FileReadFailed,
    FileTooLarge
};

inline constexpr std::string_view to_string(FormatError error) noexcept {
    switch (error) {
        case FormatError::MissingSaltHeader:
            return "Missing \"Salted__\" header";
        case FormatError::InvalidBlockLength:
            return "Ciphertext length is not a positive multiple of the block size";
        case FormatError::InvalidPadding:
            return "Invalid PKCS#7 padding";
        case FormatError::InvalidBase64:
            return "Invalid base64 data";
        case FormatError::MalformedEntry:
            return "Malformed entry in entry index";
        case FormatError::MalformedDocument:
            return "Malformed keychain document";
    }
    return "Unknown format error";
}

inline constexpr std::string_view to_string(CryptoError error) noexcept {
    switch (error) {
        case CryptoError::KeyDerivationFailed:
            return "Key derivation failed";
        case CryptoError::CipherFailed:
            return "Cipher operation failed";
        case CryptoError::KeyDecryptionFailed:
            return "Failed to decrypt wrapped key";
        case CryptoError::ValidationMismatch:
            return "Key validation failed (wrong passphrase or corrupted key)";
    }
    return "Unknown crypto error";
}

inline constexpr std::string_view to_string(IoError error) noexcept {
    switch (error) {
        case IoError::DirectoryNotFound:
            return "Keychain directory not found";
        case IoError::FileNotFound:
            return "File not found";
        case IoError::FileReadFailed:
            return "Failed to read file";
        case IoError::FileTooLarge:
            return "File exceeds the maximum document size";
    }
    return "Unknown I/O error";
}

using ErrorCode = std::variant<FormatError, CryptoError, IoError>;

/**
 * @brief Error value carried by KeychainResult
 *
 * Holds the error kind plus, where known, the key identifier or the index of
 * the offending array element. Compares equal to its bare enum value so
 * callers can write `if (result.error() == CryptoError::ValidationMismatch)`.
 */
struct KeychainError {
    ErrorCode code;
    std::string identifier;             ///< Key record identifier, empty if n/a
    std::optional<std::size_t> index;   ///< Entry or record index, if n/a unset

    KeychainError(FormatError e) : code(e) {}
    KeychainError(CryptoError e) : code(e) {}
    KeychainError(IoError e) : code(e) {}

    [[nodiscard]] KeychainError with_identifier(std::string id) const {
        KeychainError copy = *this;
        copy.identifier = std::move(id);
        return copy;
    }

    [[nodiscard]] KeychainError at_index(std::size_t i) const {
        KeychainError copy = *this;
        copy.index = i;
        return copy;
    }

    [[nodiscard]] std::string_view kind() const noexcept {
        return std::visit([](auto e) { return to_string(e); }, code);
    }

    [[nodiscard]] std::string message() const {
        std::string msg(kind());
        if (!identifier.empty()) {
            msg += std::format(" (key {})", identifier);
        }
        if (index) {
            msg += std::format(" (index {})", *index);
        }
        return msg;
    }

    friend bool operator==(const KeychainError& lhs, FormatError rhs) noexcept {
        const auto* e = std::get_if<FormatError>(&lhs.code);
        return e && *e == rhs;
    }

    friend bool operator==(const KeychainError& lhs, CryptoError rhs) noexcept {
        const auto* e = std::get_if<CryptoError>(&lhs.code);
        return e && *e == rhs;
    }

    friend bool operator==(const KeychainError& lhs, IoError rhs) noexcept {
        const auto* e = std::get_if<IoError>(&lhs.code);
        return e && *e == rhs;
    }

    friend std::ostream& operator<<(std::ostream& os, const KeychainError& error) {
        return os << error.message();
    }
};

// Helper type alias
template<typename T = void>
using KeychainResult = std::expected<T, KeychainError>;

} // namespace AgileKeychain

#endif // AGILEKEYCHAIN_KEYCHAIN_ERROR_H
