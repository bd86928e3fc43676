/**
 * @file types.h
 * @brief Common types for the idforge core library
 *
 * Shared enums, value objects and result structs used by the checksum
 * library, format registry, generator and validator.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <json/json.h>

namespace idforge::core {

/// @brief Identifier category. Declaration order is the registry iteration order.
enum class Category {
    IBAN,
    PERSONAL_ID,
    CREDIT_CARD,
    BANK_ACCOUNT,
    SWIFT_BIC,
    COMPANY_ID,
    DRIVERS_LICENSE,
    PASSPORT,
    TAX_ID,
    VAT,
    LEI
};

/// @brief Recoverable error / rejection reasons
enum class ErrorKind {
    NONE,
    UNKNOWN_FORMAT,            ///< (category, code) is not registered
    UNSATISFIABLE_CONSTRAINT,  ///< Constraints admit no legal value for some field
    LENGTH_MISMATCH,           ///< Normalized length outside the layout bounds
    INVALID_CHARACTER_SET,     ///< Character outside a field's class, or literal mismatch
    INVALID_FIELD_VALUE,       ///< Characters in class but value not allowed (month 13, unknown prefix)
    CHECKSUM_MISMATCH,         ///< Recomputed checksum differs
    NO_MATCH                   ///< Auto-detection found no matching format
};

enum class Sex {
    MALE,
    FEMALE
};

/// @brief Who the identifier is issued to (tax and company identifiers)
enum class HolderType {
    ANY,
    INDIVIDUAL,
    COMPANY
};

/// @brief Calendar date embedded in person-coded identifiers
struct BirthDate {
    int year = 0;
    int month = 0;
    int day = 0;

    /// @brief ISO 8601 representation (YYYY-MM-DD)
    std::string toIsoString() const;

    bool operator==(const BirthDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
};

/// @brief Generation-time constraints (never persisted)
struct Constraints {
    std::optional<Sex> sex;
    std::optional<int> yearFrom;    ///< Inclusive lower bound of the birth year
    std::optional<int> yearTo;      ///< Inclusive upper bound of the birth year
    std::optional<uint64_t> seed;   ///< Reproducible output when set
    std::optional<HolderType> holder;  ///< Individual or company variant
};

/// @brief Output of the generator
struct GeneratedRecord {
    Category category = Category::IBAN;
    std::string code;       ///< Country code or scheme name
    std::string name;       ///< Identifier name, e.g. "PESEL"
    std::string raw;        ///< Canonical unspaced form
    std::string formatted;  ///< Display form
    std::optional<BirthDate> birthDate;
    std::optional<int> birthYear;   ///< Set whenever the layout encodes a year
    std::optional<int> birthMonth;  ///< Set whenever it encodes year and month
    std::optional<Sex> sex;
    HolderType holder = HolderType::ANY;
    std::optional<uint64_t> seed;

    Json::Value toJson() const;
};

/// @brief Generator outcome: a record or a typed error
struct GenerateResult {
    bool success = false;
    GeneratedRecord record;
    ErrorKind error = ErrorKind::NONE;
    std::string message;

    static GenerateResult ok(GeneratedRecord record);
    static GenerateResult failure(ErrorKind kind, std::string message);
};

/// @brief Validator outcome
struct ValidationResult {
    bool valid = false;
    Category category = Category::IBAN;  ///< Matched category (valid only)
    std::string code;                    ///< Matched code (valid only)
    ErrorKind reason = ErrorKind::NONE;  ///< Rejection reason (invalid only)
    std::string message;
    std::optional<BirthDate> birthDate;  ///< Decoded from person-coded formats
    std::optional<int> birthYear;        ///< Also for layouts without a full date
    std::optional<int> birthMonth;
    std::optional<Sex> sex;

    static ValidationResult accepted(Category category, std::string code);
    static ValidationResult rejected(ErrorKind reason, std::string message);

    Json::Value toJson() const;
};

/// @brief Convert Category to its stable string key
inline std::string categoryToString(Category c) {
    switch (c) {
        case Category::IBAN:            return "iban";
        case Category::PERSONAL_ID:     return "personal_id";
        case Category::CREDIT_CARD:     return "credit_card";
        case Category::BANK_ACCOUNT:    return "bank_account";
        case Category::SWIFT_BIC:       return "swift";
        case Category::COMPANY_ID:      return "company_id";
        case Category::DRIVERS_LICENSE: return "drivers_license";
        case Category::PASSPORT:        return "passport";
        case Category::TAX_ID:          return "tax_id";
        case Category::VAT:             return "vat";
        case Category::LEI:             return "lei";
    }
    return "unknown";
}

/// @brief Parse a category key; accepts the keys produced by categoryToString
std::optional<Category> categoryFromString(const std::string& s);

/// @brief Convert ErrorKind to string
inline std::string errorKindToString(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE:                     return "NONE";
        case ErrorKind::UNKNOWN_FORMAT:           return "UNKNOWN_FORMAT";
        case ErrorKind::UNSATISFIABLE_CONSTRAINT: return "UNSATISFIABLE_CONSTRAINT";
        case ErrorKind::LENGTH_MISMATCH:          return "LENGTH_MISMATCH";
        case ErrorKind::INVALID_CHARACTER_SET:    return "INVALID_CHARACTER_SET";
        case ErrorKind::INVALID_FIELD_VALUE:      return "INVALID_FIELD_VALUE";
        case ErrorKind::CHECKSUM_MISMATCH:        return "CHECKSUM_MISMATCH";
        case ErrorKind::NO_MATCH:                 return "NO_MATCH";
    }
    return "UNKNOWN";
}

inline std::string sexToString(Sex s) {
    return s == Sex::MALE ? "male" : "female";
}

inline std::string holderTypeToString(HolderType h) {
    switch (h) {
        case HolderType::ANY:        return "any";
        case HolderType::INDIVIDUAL: return "individual";
        case HolderType::COMPANY:    return "company";
    }
    return "any";
}

/// @brief All categories in registry order
inline constexpr Category kAllCategories[] = {
    Category::IBAN, Category::PERSONAL_ID, Category::CREDIT_CARD,
    Category::BANK_ACCOUNT, Category::SWIFT_BIC, Category::COMPANY_ID,
    Category::DRIVERS_LICENSE, Category::PASSPORT, Category::TAX_ID,
    Category::VAT, Category::LEI
};

} // namespace idforge::core
