// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "KeychainFormat.h"
#include "../../utils/Log.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace AgileKeychain {

using json = nlohmann::json;

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::ranges::equal(a, b, [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

// Exact member name first, then the first case-insensitive match
const json* find_member(const json& object, std::string_view name) {
    if (auto it = object.find(std::string(name)); it != object.end()) {
        return &*it;
    }
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (iequals(it.key(), name)) {
            return &it.value();
        }
    }
    return nullptr;
}

// Integers, and floats with no fractional part, that fit in int64_t
std::optional<int64_t> as_integer(const json& value) {
    if (value.is_number_unsigned()) {
        auto v = value.get<uint64_t>();
        if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(v);
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_number_float()) {
        double v = value.get<double>();
        if (!std::isfinite(v) || std::trunc(v) != v ||
            v < -9.2e18 || v > 9.2e18) {
            return std::nullopt;
        }
        return static_cast<int64_t>(v);
    }
    return std::nullopt;
}

bool read_string(const json& object, std::string_view name, std::string& out) {
    const json* member = find_member(object, name);
    if (!member || !member->is_string()) {
        return false;
    }
    out = member->get<std::string>();
    return true;
}

KeychainResult<KeyRecord> decode_key_record(const json& item, size_t index,
                                            uint32_t max_iterations) {
    auto malformed = [index]() {
        return std::unexpected(KeychainError(FormatError::MalformedDocument).at_index(index));
    };

    if (!item.is_object()) {
        Log::warning("KeychainFormat: key record {} is not an object", index);
        return malformed();
    }

    KeyRecord record;
    if (!read_string(item, "Identifier", record.identifier) ||
        !read_string(item, "Level", record.level) ||
        !read_string(item, "Data", record.data) ||
        !read_string(item, "Validation", record.validation)) {
        Log::warning("KeychainFormat: key record {} is missing a string field", index);
        return malformed();
    }

    const json* iterations = find_member(item, "Iterations");
    auto count = iterations ? as_integer(*iterations) : std::nullopt;
    if (!count || *count <= 0) {
        Log::warning("KeychainFormat: key record {} has no positive iteration count", index);
        return malformed();
    }
    if (*count > static_cast<int64_t>(max_iterations)) {
        Log::warning("KeychainFormat: key record {} asks for {} iterations (limit {})",
                     index, *count, max_iterations);
        return malformed();
    }
    record.iterations = static_cast<uint32_t>(*count);

    return record;
}

}  // namespace

std::optional<std::string> KeyList::identifier_for_level(std::string_view level) const {
    const std::string* id = nullptr;
    if (iequals(level, "SL3")) {
        id = &sl3;
    } else if (iequals(level, "SL5")) {
        id = &sl5;
    }
    if (!id || id->empty()) {
        return std::nullopt;
    }
    return *id;
}

KeychainResult<KeyList>
KeychainFormat::parse_key_list(std::string_view raw_json, const KeychainOptions& options) {
    json document = json::parse(raw_json, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        Log::warning("KeychainFormat: key list is not a JSON object");
        return std::unexpected(FormatError::MalformedDocument);
    }

    KeyList result;
    for (auto [name, target] : {std::pair{"SL3", &result.sl3}, std::pair{"SL5", &result.sl5}}) {
        const json* member = find_member(document, name);
        if (!member || member->is_null()) {
            continue;
        }
        if (!member->is_string()) {
            Log::warning("KeychainFormat: {} is not a string", name);
            return std::unexpected(FormatError::MalformedDocument);
        }
        *target = member->get<std::string>();
    }

    const json* list = find_member(document, "List");
    if (!list || !list->is_array()) {
        Log::warning("KeychainFormat: key list has no \"list\" array");
        return std::unexpected(FormatError::MalformedDocument);
    }

    result.records.reserve(list->size());
    for (size_t i = 0; i < list->size(); ++i) {
        auto record = decode_key_record((*list)[i], i, options.max_pbkdf2_iterations);
        if (!record) {
            return std::unexpected(record.error());
        }
        result.records.push_back(std::move(*record));
    }

    Log::debug("KeychainFormat: decoded {} key record(s)", result.records.size());
    return result;
}

KeychainResult<std::vector<EntryRecord>>
KeychainFormat::parse_entries(std::string_view raw_json) {
    json document = json::parse(raw_json, nullptr, false);
    if (document.is_discarded() || !document.is_array()) {
        Log::warning("KeychainFormat: entry index is not a JSON array");
        return std::unexpected(FormatError::MalformedDocument);
    }

    std::vector<EntryRecord> entries;
    entries.reserve(document.size());

    for (size_t i = 0; i < document.size(); ++i) {
        const json& row = document[i];
        auto malformed = [i]() {
            Log::warning("KeychainFormat: entry {} is malformed", i);
            return std::unexpected(KeychainError(FormatError::MalformedEntry).at_index(i));
        };

        if (!row.is_array() || row.size() != ENTRY_COLUMNS) {
            return malformed();
        }

        // Columns 4 and 6 are numbers, the rest strings
        for (size_t col = 0; col < ENTRY_COLUMNS; ++col) {
            bool numeric = (col == 4 || col == 6);
            if (numeric ? !as_integer(row[col]).has_value() : !row[col].is_string()) {
                return malformed();
            }
        }

        entries.push_back(EntryRecord{
            .id = row[0].get<std::string>(),
            .entry_type = row[1].get<std::string>(),
            .title = row[2].get<std::string>(),
            .site = row[3].get<std::string>(),
            .date = *as_integer(row[4]),
            .unknown1 = row[5].get<std::string>(),
            .unknown2 = *as_integer(row[6]),
            .unknown3 = row[7].get<std::string>(),
        });
    }

    Log::debug("KeychainFormat: decoded {} entr{}", entries.size(),
               entries.size() == 1 ? "y" : "ies");
    return entries;
}

}  // namespace AgileKeychain
