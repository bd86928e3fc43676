/**
 * @file validator.h
 * @brief Identifier validation and auto-detection
 *
 * Checks run in a fixed order: normalization, length, character classes
 * and literals, checksums, then field values (dates, ranges, choices).
 * The first failing check determines the rejection reason.
 */

#pragma once

#include "idforge/core/registry.h"
#include "idforge/core/types.h"
#include <memory>
#include <optional>
#include <string>

namespace idforge::core {

/**
 * @brief Stateless validator over a shared registry
 *
 * Usage:
 * @code
 *   Validator validator(FormatRegistry::createDefault());
 *   auto r = validator.validate("DE89 3704 0044 0532 0130 00", Category::IBAN, "DE");
 *   auto any = validator.validate("4111111111111111");  // auto-detect
 * @endcode
 */
class Validator {
public:
    /**
     * @brief Constructor
     * @throws std::invalid_argument if registry is null
     */
    explicit Validator(std::shared_ptr<const FormatRegistry> registry);

    /**
     * @brief Validate an input string
     *
     * With both category and code the input is checked against that
     * format, then against its holder variants ("US-EIN" for "US"); when
     * none is valid the reason reported by the exact format is returned. With only one
     * of them, or neither, every matching format is tried in registry
     * order and the first valid one wins (NO_MATCH otherwise).
     *
     * @param input Raw or display-formatted candidate
     * @param category Restrict to one category
     * @param code Restrict to one country or scheme code
     */
    ValidationResult validate(const std::string& input,
                              std::optional<Category> category = std::nullopt,
                              const std::optional<std::string>& code = std::nullopt) const;

    /// @brief Validate against one format
    ValidationResult validateAgainst(const FormatSpec& spec, const std::string& input) const;

private:
    ValidationResult checkCanonical(const FormatSpec& spec, const std::string& raw) const;

    std::shared_ptr<const FormatRegistry> registry_;
};

} // namespace idforge::core
