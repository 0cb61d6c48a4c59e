// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file KeychainFormat.h
 * @brief Decoders for the two plaintext documents of a profile
 *
 * A keychain profile directory (`<name>.agilekeychain/data/default/`) holds:
 *
 * ### encryptionKeys.js
 * ```
 * {"SL3": "<identifier>", "SL5": "<identifier>",
 *  "list": [{"data": "<base64>", "validation": "<base64>",
 *            "level": "SL5", "identifier": "<identifier>",
 *            "iterations": 1000}, ...]}
 * ```
 * Member names are matched exactly first and then ignoring case, so both
 * `list` and `List` are accepted.
 *
 * ### contents.js
 * ```
 * [["<uuid>", "webforms.WebForm", "Title", "example.com", 1290546080, "", 0, "N"], ...]
 * ```
 *
 * Both decoders are all-or-nothing: the first bad element fails the whole
 * document and nothing is returned.
 */

#ifndef AGILEKEYCHAIN_KEYCHAIN_FORMAT_H
#define AGILEKEYCHAIN_KEYCHAIN_FORMAT_H

#include "../KeychainError.h"
#include "../KeychainOptions.h"
#include "../KeyRecovery.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace AgileKeychain {

/**
 * @struct KeyList
 * @brief Decoded encryptionKeys.js
 */
struct KeyList {
    std::string sl3;                    ///< Identifier of the SL3 key (may be empty)
    std::string sl5;                    ///< Identifier of the SL5 key (may be empty)
    std::vector<KeyRecord> records;     ///< Records in document order

    /**
     * @brief Identifier registered for a security level
     * @param level "SL3" or "SL5" (case-insensitive)
     * @return The identifier, or nullopt if the level is unknown or unset
     */
    [[nodiscard]] std::optional<std::string> identifier_for_level(std::string_view level) const;
};

/**
 * @struct EntryRecord
 * @brief One line of contents.js
 *
 * The last three columns are kept as-is without interpretation.
 */
struct EntryRecord {
    std::string id;             ///< Item UUID, names the <id>.1password file
    std::string entry_type;     ///< e.g. "webforms.WebForm", "passwords.Password"
    std::string title;
    std::string site;           ///< Location / domain, may be empty
    int64_t date = 0;           ///< Last update, unix seconds
    std::string unknown1;
    int64_t unknown2 = 0;
    std::string unknown3;

    bool operator==(const EntryRecord&) const = default;
};

/**
 * @class KeychainFormat
 * @brief Static decoders for the keychain's JSON documents
 */
class KeychainFormat {
public:
    /// Number of columns in every contents.js row
    static constexpr size_t ENTRY_COLUMNS = 8;

    /**
     * @brief Decode encryptionKeys.js
     *
     * @param raw_json Document text
     * @param options Supplies the PBKDF2 iteration ceiling
     * @return KeyList, or FormatError::MalformedDocument (with the record
     *         index when a single record is at fault)
     */
    [[nodiscard]] static KeychainResult<KeyList>
    parse_key_list(std::string_view raw_json, const KeychainOptions& options = {});

    /**
     * @brief Decode contents.js
     *
     * Every row must be exactly
     * `[string, string, string, string, number, string, number, string]`.
     *
     * @return Rows in document order, or
     *         - FormatError::MalformedDocument: not JSON or not an array
     *         - FormatError::MalformedEntry: bad row, index set to its position
     */
    [[nodiscard]] static KeychainResult<std::vector<EntryRecord>>
    parse_entries(std::string_view raw_json);

    KeychainFormat() = delete;
    ~KeychainFormat() = delete;
    KeychainFormat(const KeychainFormat&) = delete;
    KeychainFormat& operator=(const KeychainFormat&) = delete;
};

}  // namespace AgileKeychain

#endif  // AGILEKEYCHAIN_KEYCHAIN_FORMAT_H
