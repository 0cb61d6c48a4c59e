// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#ifndef AGILEKEYCHAIN_KEYCHAIN_OPTIONS_H
#define AGILEKEYCHAIN_KEYCHAIN_OPTIONS_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace AgileKeychain {

/**
 * @brief Tunables for opening a keychain
 *
 * Values are clamped by OptionsValidator before use, so a caller passing
 * out-of-range numbers gets the nearest safe value rather than an error.
 */
struct KeychainOptions {
    /// Profile directory under data/ ("default" for every keychain seen so far)
    std::string profile = "default";

    /// Largest encryptionKeys.js / contents.js accepted, in bytes
    std::size_t max_document_size = 16 * 1024 * 1024;

    /// Records asking for more PBKDF2 rounds than this are rejected
    uint32_t max_pbkdf2_iterations = 1'000'000;
};

}  // namespace AgileKeychain

#endif  // AGILEKEYCHAIN_KEYCHAIN_OPTIONS_H
