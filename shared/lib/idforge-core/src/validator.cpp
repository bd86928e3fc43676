/**
 * @file validator.cpp
 * @brief Layout-driven validation and auto-detection
 */

#include "idforge/core/validator.h"
#include "checksum_scope.h"
#include "person_codec.h"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace idforge::core {

namespace {

std::string fieldName(const Token& t, size_t index) {
    return t.label.empty() ? "field " + std::to_string(index + 1) : t.label;
}

/**
 * @brief Cut a canonical string into per-token texts
 * @return false if the variable-width token cannot take the remaining length
 */
bool splitTokens(const FormatSpec& spec, const std::string& raw, std::vector<std::string>& texts) {
    int fixed = 0;
    for (const auto& t : spec.layout) {
        if (!t.isVariable()) fixed += t.width();
    }
    const int variableWidth = static_cast<int>(raw.size()) - fixed;

    texts.clear();
    texts.reserve(spec.layout.size());
    size_t pos = 0;
    for (const auto& t : spec.layout) {
        int width = t.width();
        if (t.isVariable()) {
            width = variableWidth;
            if (t.emptyOrFull && width != 0 && width != t.maxWidth) return false;
            if (!t.emptyOrFull && (width < t.minWidth || width > t.maxWidth)) return false;
        }
        if (width < 0 || pos + static_cast<size_t>(width) > raw.size()) return false;
        texts.push_back(raw.substr(pos, static_cast<size_t>(width)));
        pos += static_cast<size_t>(width);
    }
    return pos == raw.size();
}

bool parseValue(const std::string& text, long long& value) {
    if (text.empty() || text.size() > 18) return false;
    value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    return true;
}

} // anonymous namespace

Validator::Validator(std::shared_ptr<const FormatRegistry> registry)
    : registry_(std::move(registry)) {
    if (!registry_) {
        throw std::invalid_argument("Validator: registry cannot be null");
    }
}

ValidationResult Validator::validate(const std::string& input,
                                     std::optional<Category> category,
                                     const std::optional<std::string>& code) const {
    const bool anyCode = !code || code->empty() || *code == "*";

    if (category && !anyCode) {
        const FormatSpec* spec = registry_->find(*category, *code);
        std::optional<ValidationResult> first;
        if (spec) {
            ValidationResult r = validateAgainst(*spec, input);
            if (r.valid) return r;
            first = std::move(r);
        }
        // Holder variants of the code, e.g. US-EIN for US
        for (const FormatSpec* variant : registry_->family(*category, *code)) {
            if (variant == spec) continue;
            ValidationResult r = validateAgainst(*variant, input);
            if (r.valid) {
                spdlog::debug("[Validator] {} matched variant {}", *code, variant->key());
                return r;
            }
            if (!first) first = std::move(r);
        }
        if (!first) {
            return ValidationResult::rejected(ErrorKind::UNKNOWN_FORMAT,
                "unknown format " + categoryToString(*category) + "/" + *code);
        }
        return *first;
    }

    // Auto-detection: first valid format in registry order
    size_t candidates = 0;
    for (const FormatSpec* spec : registry_->all()) {
        if (category && spec->category != *category) continue;
        if (!anyCode && spec->code != *code) continue;
        ++candidates;
        ValidationResult r = validateAgainst(*spec, input);
        if (r.valid) {
            spdlog::debug("[Validator] Detected {} after {} candidates", spec->key(), candidates);
            return r;
        }
    }

    if (candidates == 0) {
        return ValidationResult::rejected(ErrorKind::UNKNOWN_FORMAT,
            "no registered format for code " + (anyCode ? std::string("*") : *code));
    }
    return ValidationResult::rejected(ErrorKind::NO_MATCH,
        "none of " + std::to_string(candidates) + " candidate formats matches");
}

ValidationResult Validator::validateAgainst(const FormatSpec& spec, const std::string& input) const {
    return checkCanonical(spec, spec.normalize(input));
}

ValidationResult Validator::checkCanonical(const FormatSpec& spec, const std::string& raw) const {
    const std::string key = spec.key();
    const int length = static_cast<int>(raw.size());

    // 1. Length
    if (length < spec.minLength || length > spec.maxLength) {
        std::string expected = spec.minLength == spec.maxLength
            ? std::to_string(spec.minLength)
            : std::to_string(spec.minLength) + "-" + std::to_string(spec.maxLength);
        return ValidationResult::rejected(ErrorKind::LENGTH_MISMATCH,
            key + ": length " + std::to_string(length) + ", expected " + expected);
    }
    std::vector<std::string> texts;
    if (!splitTokens(spec, raw, texts)) {
        return ValidationResult::rejected(ErrorKind::LENGTH_MISMATCH,
            key + ": length " + std::to_string(length) + " does not fit the layout");
    }

    // 2. Character classes and literals
    for (size_t i = 0; i < spec.layout.size(); ++i) {
        const Token& t = spec.layout[i];
        const std::string& text = texts[i];
        if (t.kind == TokenKind::LITERAL) {
            if (text != t.text) {
                return ValidationResult::rejected(ErrorKind::INVALID_CHARACTER_SET,
                    key + ": expected '" + t.text + "' at " + fieldName(t, i) + ", found '" + text + "'");
            }
            continue;
        }
        const std::string charset = t.charset();
        auto bad = std::find_if(text.begin(), text.end(),
            [&charset](char c) { return charset.find(c) == std::string::npos; });
        if (bad != text.end()) {
            return ValidationResult::rejected(ErrorKind::INVALID_CHARACTER_SET,
                key + ": character '" + std::string(1, *bad) + "' not allowed in " + fieldName(t, i));
        }
    }

    // 3. Checksums
    for (size_t slot : spec.checksumOrder) {
        const Token& t = spec.layout[slot];
        const ChecksumAlgorithm& algo = registry_->algorithmFor(t);
        const std::string payload = detail::checksumPayload(spec, slot, texts);
        if (!algo.verify(payload, texts[slot])) {
            return ValidationResult::rejected(ErrorKind::CHECKSUM_MISMATCH,
                key + ": " + algo.name() + " check '" + texts[slot] + "' does not match");
        }
    }

    // 4. Field values
    detail::PersonDecoder person;
    std::string error;
    for (size_t i = 0; i < spec.layout.size(); ++i) {
        const Token& t = spec.layout[i];
        const std::string& text = texts[i];

        if (t.kind == TokenKind::FIELD) {
            if (t.minValue && !text.empty()) {
                long long value = 0;
                if (!parseValue(text, value) || value < *t.minValue || value > *t.maxValue) {
                    return ValidationResult::rejected(ErrorKind::INVALID_FIELD_VALUE,
                        key + ": " + fieldName(t, i) + " value " + text + " out of range");
                }
            }
            if (std::find(t.excluded.begin(), t.excluded.end(), text) != t.excluded.end()) {
                return ValidationResult::rejected(ErrorKind::INVALID_FIELD_VALUE,
                    key + ": " + fieldName(t, i) + " value " + text + " is not allowed");
            }
        } else if (t.kind == TokenKind::CHOICE) {
            if (std::find(t.choices.begin(), t.choices.end(), text) == t.choices.end()) {
                return ValidationResult::rejected(ErrorKind::INVALID_FIELD_VALUE,
                    key + ": unknown " + fieldName(t, i) + " '" + text + "'");
            }
        } else if (t.isPersonCoded()) {
            if (!person.feed(t, text, error)) {
                return ValidationResult::rejected(ErrorKind::INVALID_FIELD_VALUE, key + ": " + error);
            }
        }
    }
    if (!person.resolve(error)) {
        return ValidationResult::rejected(ErrorKind::INVALID_FIELD_VALUE, key + ": " + error);
    }

    ValidationResult result = ValidationResult::accepted(spec.category, spec.code);
    result.birthDate = person.birthDate();
    result.birthYear = person.birthYear();
    result.birthMonth = person.birthMonth();
    if (spec.hasSexCode()) {
        result.sex = person.sex();
    }
    return result;
}

} // namespace idforge::core
