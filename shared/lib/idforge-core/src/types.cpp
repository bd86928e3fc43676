/**
 * @file types.cpp
 * @brief Value objects and their JSON views
 */

#include "idforge/core/types.h"
#include <cstdio>

namespace idforge::core {

std::string BirthDate::toIsoString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

std::optional<Category> categoryFromString(const std::string& s) {
    for (Category c : kAllCategories) {
        if (categoryToString(c) == s) {
            return c;
        }
    }
    return std::nullopt;
}

// =============================================================================
// GeneratedRecord
// =============================================================================

Json::Value GeneratedRecord::toJson() const {
    Json::Value json;
    json["category"] = categoryToString(category);
    json["code"] = code;
    json["name"] = name;
    json["raw"] = raw;
    json["formatted"] = formatted;
    json["holder"] = holderTypeToString(holder);

    // Person metadata (person-coded formats only)
    if (birthDate.has_value()) {
        json["birthDate"] = birthDate->toIsoString();
    }
    if (birthYear.has_value()) {
        json["birthYear"] = *birthYear;
    }
    if (birthMonth.has_value()) {
        json["birthMonth"] = *birthMonth;
    }
    if (sex.has_value()) {
        json["sex"] = sexToString(*sex);
    }
    if (seed.has_value()) {
        json["seed"] = static_cast<Json::UInt64>(*seed);
    }
    return json;
}

// =============================================================================
// GenerateResult
// =============================================================================

GenerateResult GenerateResult::ok(GeneratedRecord record) {
    GenerateResult r;
    r.success = true;
    r.record = std::move(record);
    return r;
}

GenerateResult GenerateResult::failure(ErrorKind kind, std::string message) {
    GenerateResult r;
    r.error = kind;
    r.message = std::move(message);
    return r;
}

// =============================================================================
// ValidationResult
// =============================================================================

ValidationResult ValidationResult::accepted(Category category, std::string code) {
    ValidationResult r;
    r.valid = true;
    r.category = category;
    r.code = std::move(code);
    return r;
}

ValidationResult ValidationResult::rejected(ErrorKind reason, std::string message) {
    ValidationResult r;
    r.reason = reason;
    r.message = std::move(message);
    return r;
}

Json::Value ValidationResult::toJson() const {
    Json::Value json;
    json["valid"] = valid;
    if (valid) {
        json["category"] = categoryToString(category);
        json["code"] = code;
        if (birthDate.has_value()) {
            json["birthDate"] = birthDate->toIsoString();
        }
        if (birthYear.has_value()) {
            json["birthYear"] = *birthYear;
        }
        if (birthMonth.has_value()) {
            json["birthMonth"] = *birthMonth;
        }
        if (sex.has_value()) {
            json["sex"] = sexToString(*sex);
        }
    } else {
        json["reason"] = errorKindToString(reason);
        json["message"] = message;
    }
    return json;
}

} // namespace idforge::core
