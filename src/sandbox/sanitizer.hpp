/*
 * sanitizer.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

/**
 * @file sanitizer.hpp
 * @brief Pattern-based pre-filter for untrusted guest code
 * @date 2024
 * @version 1.0.0
 *
 * The sanitizer is textual: it matches a fixed denylist of constructs and
 * replaces each match with an unbound name, so only the match itself is
 * neutralised and reaching it raises NameError. It is a best-effort
 * filter and can be bypassed (string building, aliasing, encodings); the
 * isolated process is what actually contains guest code.
 */

#ifndef WARDEN_SANDBOX_SANITIZER_HPP
#define WARDEN_SANDBOX_SANITIZER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::sandbox {

/**
 * @brief One construct removed from the input
 */
struct Removal {
    std::string category;                ///< Denylist category
    std::string match;                   ///< Text that was removed
    std::string reason;                  ///< Why the construct is denied
    int line{0};                         ///< 1-based line of the match
    std::optional<std::string> context;  ///< Full text of that line
};

/**
 * @brief Sanitized code plus what was removed
 */
struct SanitizeReport {
    std::string code;
    std::vector<Removal> removals;

    [[nodiscard]] bool modified() const noexcept { return !removals.empty(); }

    /**
     * @brief One human-readable warning per removal
     */
    [[nodiscard]] std::vector<std::string> warnings() const;
};

/**
 * @brief Denylist filter applied before dispatch
 */
class Sanitizer {
public:
    /// Replacement for every removed construct; a trailing '(' or '.' of
    /// the match is kept after it so the surrounding line still parses
    static constexpr std::string_view MARKER = "__REMOVED_FOR_SECURITY__";

    /**
     * @brief Strip every denylisted construct
     *
     * Deterministic and idempotent: sanitize(sanitize(x)) == sanitize(x).
     * Never throws; if the input cannot be scanned it is replaced by the
     * marker as a whole.
     */
    [[nodiscard]] static std::string sanitize(std::string_view code) noexcept;

    /**
     * @brief Same filtering, reporting each removal
     */
    [[nodiscard]] static SanitizeReport sanitizeWithReport(std::string_view code);

    /**
     * @brief Categories of the denylist, in matching order
     */
    [[nodiscard]] static std::vector<std::string> categories();
};

}  // namespace warden::sandbox

#endif  // WARDEN_SANDBOX_SANITIZER_HPP
