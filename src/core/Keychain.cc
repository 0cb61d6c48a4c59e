// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "Keychain.h"
#include "../utils/Log.h"
#include "../utils/OptionsValidator.h"
#include "../utils/SecureMemory.h"

#include <fstream>
#include <system_error>

namespace AgileKeychain {

KeychainResult<Keychain>
Keychain::open(const std::filesystem::path& path, const KeychainOptions& options) {
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        Log::warning("Keychain: {} is not a directory", path.string());
        return std::unexpected(IoError::DirectoryNotFound);
    }

    KeychainOptions validated = OptionsValidator::validate(options);
    if (validated.profile != options.profile) {
        Log::warning("Keychain: profile name '{}' rejected, using '{}'",
                     options.profile, validated.profile);
    }

    Log::info("Keychain: opened {}", path.string());
    return Keychain(path, std::move(validated));
}

std::filesystem::path Keychain::profile_dir() const {
    return m_path / DATA_DIR / m_options.profile;
}

KeychainResult<std::string> Keychain::read_document(const char* name) const {
    const auto file_path = profile_dir() / name;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        Log::warning("Keychain: {} not found", file_path.string());
        return std::unexpected(IoError::FileNotFound);
    }

    const auto size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        Log::error("Keychain: cannot stat {}: {}", file_path.string(), ec.message());
        return std::unexpected(IoError::FileReadFailed);
    }
    if (size > m_options.max_document_size) {
        Log::warning("Keychain: {} is {} bytes (limit {})",
                     file_path.string(), size, m_options.max_document_size);
        return std::unexpected(IoError::FileTooLarge);
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        Log::error("Keychain: failed to open {}", file_path.string());
        return std::unexpected(IoError::FileReadFailed);
    }

    std::string content(static_cast<size_t>(size), '\0');
    file.read(content.data(), static_cast<std::streamsize>(size));
    if (file.gcount() != static_cast<std::streamsize>(size)) {
        Log::error("Keychain: short read on {}", file_path.string());
        return std::unexpected(IoError::FileReadFailed);
    }

    return content;
}

KeychainResult<std::vector<EntryRecord>> Keychain::load_entries() const {
    auto raw = read_document(CONTENTS_FILE);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    return KeychainFormat::parse_entries(*raw);
}

KeychainResult<KeyList> Keychain::load_key_list() const {
    auto raw = read_document(KEYS_FILE);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    auto key_list = KeychainFormat::parse_key_list(*raw, m_options);
    secure_clear(*raw);
    return key_list;
}

KeychainResult<RecoveredKeyMap>
Keychain::unlock(const Glib::ustring& passphrase,
                 const KeyRecoveredCallback& on_recovered) const {
    auto key_list = load_key_list();
    if (!key_list) {
        return std::unexpected(key_list.error());
    }

    std::span<const uint8_t> passphrase_bytes(
        reinterpret_cast<const uint8_t*>(passphrase.data()), passphrase.bytes());

    auto keys = KeyRecovery::recover_keys(key_list->records, passphrase_bytes, on_recovered);

    // Base64 key text is no longer needed
    for (auto& record : key_list->records) {
        secure_clear(record.data);
        secure_clear(record.validation);
    }
    return keys;
}

}  // namespace AgileKeychain
