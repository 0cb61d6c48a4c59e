// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file Keychain.h
 * @brief Read-only handle on a 1Password .agilekeychain directory
 */

#ifndef AGILEKEYCHAIN_KEYCHAIN_H
#define AGILEKEYCHAIN_KEYCHAIN_H

#include "KeychainError.h"
#include "KeychainOptions.h"
#include "KeyRecovery.h"
#include "format/KeychainFormat.h"
#include <filesystem>
#include <string>
#include <vector>
#include <glibmm/ustring.h>

namespace AgileKeychain {

/**
 * @brief Read-only view of an Agile Keychain
 *
 * Layout on disk:
 * ```
 * 1Password.agilekeychain/
 *   data/default/encryptionKeys.js   key list (KeychainFormat::parse_key_list)
 *   data/default/contents.js         entry index (KeychainFormat::parse_entries)
 *   data/default/<uuid>.1password    item payloads (not read here)
 * ```
 *
 * The handle only remembers the path and options. Every load re-reads the
 * documents from disk, and recovered keys are handed to the caller, never
 * kept by the handle.
 *
 * Thread-safety: a Keychain is immutable after open(), so concurrent loads on
 * the same handle are safe.
 *
 * @section usage Usage Example
 * @code
 * auto keychain = Keychain::open("/home/me/Dropbox/1Password.agilekeychain");
 * if (!keychain) {
 *     return;
 * }
 *
 * auto entries = keychain->load_entries();
 * auto keys = keychain->unlock(passphrase);
 * if (!keys && keys.error() == CryptoError::ValidationMismatch) {
 *     // wrong passphrase (or damaged key record)
 * }
 * @endcode
 */
class Keychain {
public:
    static constexpr const char* DATA_DIR = "data";
    static constexpr const char* KEYS_FILE = "encryptionKeys.js";
    static constexpr const char* CONTENTS_FILE = "contents.js";

    /**
     * @brief Open a keychain directory
     *
     * Only checks that @p path names an existing directory. Missing profile
     * files are reported by the load functions.
     *
     * @param path Path of the .agilekeychain directory
     * @param options Tunables, clamped by OptionsValidator
     * @return Handle, or IoError::DirectoryNotFound
     */
    [[nodiscard]] static KeychainResult<Keychain>
    open(const std::filesystem::path& path, const KeychainOptions& options = {});

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }
    [[nodiscard]] const KeychainOptions& options() const noexcept { return m_options; }

    /**
     * @brief data/<profile> under the keychain root
     */
    [[nodiscard]] std::filesystem::path profile_dir() const;

    /**
     * @brief Read and decode contents.js
     */
    [[nodiscard]] KeychainResult<std::vector<EntryRecord>> load_entries() const;

    /**
     * @brief Read and decode encryptionKeys.js
     */
    [[nodiscard]] KeychainResult<KeyList> load_key_list() const;

    /**
     * @brief Recover and validate every key with @p passphrase
     *
     * @param passphrase Master passphrase (UTF-8 bytes are used verbatim)
     * @param on_recovered Called per key once the whole set validated
     * @return All keys by identifier, or the first failure
     */
    [[nodiscard]] KeychainResult<RecoveredKeyMap>
    unlock(const Glib::ustring& passphrase,
           const KeyRecoveredCallback& on_recovered = nullptr) const;

private:
    Keychain(std::filesystem::path path, KeychainOptions options)
        : m_path(std::move(path)), m_options(std::move(options)) {}

    [[nodiscard]] KeychainResult<std::string> read_document(const char* name) const;

    std::filesystem::path m_path;
    KeychainOptions m_options;
};

}  // namespace AgileKeychain

#endif  // AGILEKEYCHAIN_KEYCHAIN_H
