// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#ifndef AGILEKEYCHAIN_OPTIONS_VALIDATOR_H
#define AGILEKEYCHAIN_OPTIONS_VALIDATOR_H

#include "../core/KeychainOptions.h"
#include <algorithm>
#include <string_view>

namespace AgileKeychain {

/**
 * @brief Clamps KeychainOptions into safe ranges
 *
 * A profile name that could escape the data/ directory is replaced with the
 * default profile. Numeric limits are clamped, never rejected.
 *
 * @note This is a static utility class and cannot be instantiated.
 */
class OptionsValidator final {
public:
    static inline constexpr std::size_t MIN_DOCUMENT_SIZE{4 * 1024};            // 4 KiB
    static inline constexpr std::size_t MAX_DOCUMENT_SIZE{256 * 1024 * 1024};   // 256 MiB

    static inline constexpr uint32_t MIN_PBKDF2_ITERATIONS_CEILING{1000};
    static inline constexpr uint32_t MAX_PBKDF2_ITERATIONS_CEILING{10'000'000};

    static inline constexpr std::string_view DEFAULT_PROFILE{"default"};

    /**
     * @brief Get a copy of @p options with every field in range
     */
    [[nodiscard]] static KeychainOptions validate(const KeychainOptions& options) {
        KeychainOptions result = options;
        if (!is_safe_profile_name(result.profile)) {
            result.profile = std::string(DEFAULT_PROFILE);
        }
        result.max_document_size = std::clamp(options.max_document_size,
                                              MIN_DOCUMENT_SIZE, MAX_DOCUMENT_SIZE);
        result.max_pbkdf2_iterations = std::clamp(options.max_pbkdf2_iterations,
                                                  MIN_PBKDF2_ITERATIONS_CEILING,
                                                  MAX_PBKDF2_ITERATIONS_CEILING);
        return result;
    }

    /**
     * @brief Profile names are single path components without dots at the front
     */
    [[nodiscard]] static bool is_safe_profile_name(std::string_view name) noexcept {
        if (name.empty() || name.front() == '.') {
            return false;
        }
        return std::ranges::none_of(name, [](char c) {
            return c == '/' || c == '\\' || c == '\0';
        });
    }

private:
    OptionsValidator() = delete;
    ~OptionsValidator() = delete;
    OptionsValidator(const OptionsValidator&) = delete;
    OptionsValidator& operator=(const OptionsValidator&) = delete;
    OptionsValidator(OptionsValidator&&) = delete;
    OptionsValidator& operator=(OptionsValidator&&) = delete;
};

}  // namespace AgileKeychain

#endif  // AGILEKEYCHAIN_OPTIONS_VALIDATOR_H
