/**
 * @file generator.cpp
 * @brief Constrained random generation with self-validation
 */

#include "idforge/core/generator.h"
#include "checksum_scope.h"
#include "person_codec.h"
#include "config/config_manager.h"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace idforge::core {

namespace {

std::string padNumber(long long value, int width) {
    std::string s = std::to_string(value);
    if (static_cast<int>(s.size()) < width) {
        s.insert(0, static_cast<size_t>(width) - s.size(), '0');
    }
    return s;
}

std::optional<std::string> drawField(const Token& t, RandomSource& rng) {
    int width = t.emptyOrFull
        ? (rng.coin() ? t.maxWidth : 0)
        : static_cast<int>(rng.uniform(t.minWidth, t.maxWidth));

    std::string text;
    if (t.minValue && t.maxValue) {
        text = padNumber(rng.uniform(*t.minValue, *t.maxValue), width);
    } else {
        text.reserve(static_cast<size_t>(width));
        for (int i = 0; i < width; ++i) {
            text += rng.pick(t.alphabet);
        }
    }
    if (std::find(t.excluded.begin(), t.excluded.end(), text) != t.excluded.end()) {
        return std::nullopt;
    }
    return text;
}

} // anonymous namespace

// =============================================================================
// GeneratorSettings
// =============================================================================

GeneratorSettings GeneratorSettings::fromConfig() {
    auto& config = common::ConfigManager::getInstance();
    GeneratorSettings defaults;
    GeneratorSettings s;

    s.maxAttempts = config.getInt(common::ConfigManager::MAX_ATTEMPTS, defaults.maxAttempts);
    if (s.maxAttempts < 1) {
        spdlog::warn("[GeneratorSettings] {}={} is not positive, using {}",
                     common::ConfigManager::MAX_ATTEMPTS, s.maxAttempts, defaults.maxAttempts);
        s.maxAttempts = defaults.maxAttempts;
    }

    s.minBirthYear = config.getInt(common::ConfigManager::MIN_BIRTH_YEAR, defaults.minBirthYear);
    s.maxBirthYear = config.getInt(common::ConfigManager::MAX_BIRTH_YEAR, defaults.maxBirthYear);
    if (s.minBirthYear > s.maxBirthYear) {
        spdlog::warn("[GeneratorSettings] Birth year window {}-{} is inverted, using {}-{}",
                     s.minBirthYear, s.maxBirthYear, defaults.minBirthYear, defaults.maxBirthYear);
        s.minBirthYear = defaults.minBirthYear;
        s.maxBirthYear = defaults.maxBirthYear;
    }
    return s;
}

// =============================================================================
// Generator
// =============================================================================

Generator::Generator(std::shared_ptr<const FormatRegistry> registry, GeneratorSettings settings)
    : registry_(std::move(registry)), settings_(settings), validator_(registry_) {
    if (!registry_) {
        throw std::invalid_argument("Generator: registry cannot be null");
    }
}

GenerateResult Generator::generate(Category category, const std::string& code,
                                   const Constraints& constraints) const {
    const uint64_t seed = constraints.seed ? *constraints.seed : RandomSource::entropySeed();
    RandomSource rng(seed);

    const bool anyCode = code.empty() || code == "*";
    const FormatSpec* spec = nullptr;
    if (constraints.holder && *constraints.holder != HolderType::ANY) {
        // Pick among the holder variants of the code (or the whole category)
        std::vector<const FormatSpec*> candidates = anyCode
            ? registry_->ofCategory(category) : registry_->family(category, code);
        if (candidates.empty()) {
            return GenerateResult::failure(ErrorKind::UNKNOWN_FORMAT,
                "unknown format " + categoryToString(category) + "/" + code);
        }
        const HolderType holder = *constraints.holder;
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
            [holder](const FormatSpec* s) { return !s->acceptsHolder(holder); }),
            candidates.end());
        if (candidates.empty()) {
            return GenerateResult::failure(ErrorKind::UNSATISFIABLE_CONSTRAINT,
                "no " + holderTypeToString(holder) + " format for " +
                categoryToString(category) + "/" + (anyCode ? "*" : code));
        }
        spec = candidates[rng.index(candidates.size())];
    } else if (anyCode) {
        CodeRange codes = registry_->list(category);
        if (codes.empty()) {
            return GenerateResult::failure(ErrorKind::UNKNOWN_FORMAT,
                "no formats registered for " + categoryToString(category));
        }
        auto it = codes.begin();
        std::advance(it, static_cast<std::ptrdiff_t>(rng.index(codes.size())));
        spec = registry_->find(category, *it);
    } else {
        spec = registry_->find(category, code);
    }
    if (!spec) {
        return GenerateResult::failure(ErrorKind::UNKNOWN_FORMAT,
            "unknown format " + categoryToString(category) + "/" + code);
    }
    return generate(*spec, constraints, rng);
}

GenerateResult Generator::generate(const FormatSpec& spec, const Constraints& constraints,
                                   RandomSource& rng) const {
    const std::string key = spec.key();

    if (constraints.holder && !spec.acceptsHolder(*constraints.holder)) {
        return GenerateResult::failure(ErrorKind::UNSATISFIABLE_CONSTRAINT,
            key + " is not issued to " + holderTypeToString(*constraints.holder) + " holders");
    }

    if (constraints.yearFrom && constraints.yearTo && *constraints.yearFrom > *constraints.yearTo) {
        return GenerateResult::failure(ErrorKind::UNSATISFIABLE_CONSTRAINT,
            "birth year range " + std::to_string(*constraints.yearFrom) + "-" +
            std::to_string(*constraints.yearTo) + " is inverted");
    }

    // Birth years: requested bounds (or the default window), within what the layout encodes
    const bool personCoded = spec.hasPersonData();
    detail::YearSpan years;
    if (personCoded) {
        const detail::YearSpan representable = detail::representableYears(spec);
        detail::YearSpan wanted{settings_.minBirthYear, settings_.maxBirthYear};
        if (constraints.yearFrom || constraints.yearTo) {
            wanted.from = constraints.yearFrom.value_or(representable.from);
            wanted.to = constraints.yearTo.value_or(representable.to);
        }
        years = representable.intersect(wanted);
        if (years.empty()) {
            return GenerateResult::failure(ErrorKind::UNSATISFIABLE_CONSTRAINT,
                key + " cannot encode birth years " + std::to_string(wanted.from) + "-" +
                std::to_string(wanted.to) + " (supported " + std::to_string(representable.from) +
                "-" + std::to_string(representable.to) + ")");
        }
    }

    std::vector<std::string> texts(spec.layout.size());
    for (int attempt = 1; attempt <= settings_.maxAttempts; ++attempt) {
        detail::Person person;
        if (personCoded) {
            person.date.year = static_cast<int>(rng.uniform(years.from, years.to));
            person.date.month = static_cast<int>(rng.uniform(1, 12));
            person.date.day = static_cast<int>(
                rng.uniform(1, detail::daysInMonth(person.date.year, person.date.month)));
            if (constraints.sex && spec.hasSexCode()) {
                person.sex = *constraints.sex;
            } else {
                person.sex = rng.coin() ? Sex::MALE : Sex::FEMALE;
            }
        }

        // Non-checksum tokens
        std::string redraw;
        for (size_t i = 0; i < spec.layout.size() && redraw.empty(); ++i) {
            const Token& t = spec.layout[i];
            std::optional<std::string> text;
            switch (t.kind) {
                case TokenKind::LITERAL:
                    text = t.text;
                    break;
                case TokenKind::FIELD:
                    text = drawField(t, rng);
                    break;
                case TokenKind::CHOICE:
                    text = t.choices[rng.index(t.choices.size())];
                    break;
                case TokenKind::DATE:
                case TokenKind::CENTURY:
                case TokenKind::SEX:
                    text = detail::renderPersonToken(t, person, rng);
                    break;
                case TokenKind::CHECKSUM:
                    text = std::string();
                    break;
            }
            if (!text) {
                redraw = "token " + std::to_string(i);
            } else {
                texts[i] = std::move(*text);
            }
        }

        // Checksum slots in dependency order
        for (size_t k = 0; k < spec.checksumOrder.size() && redraw.empty(); ++k) {
            const size_t slot = spec.checksumOrder[k];
            const ChecksumAlgorithm& algo = registry_->algorithmFor(spec.layout[slot]);
            auto check = algo.compute(detail::checksumPayload(spec, slot, texts));
            if (!check) {
                redraw = algo.name() + " has no check value";
            } else {
                texts[slot] = std::move(*check);
            }
        }

        if (!redraw.empty()) {
            spdlog::debug("[Generator] {} attempt {} redrawn: {}", key, attempt, redraw);
            continue;
        }

        std::string raw;
        for (const auto& text : texts) raw += text;

        ValidationResult self = validator_.validateAgainst(spec, raw);
        if (!self.valid) {
            spdlog::error("[Generator] {} produced '{}' which fails validation: {}",
                          key, raw, self.message);
            return GenerateResult::failure(self.reason,
                "internal error: generated value failed validation (" + self.message + ")");
        }

        GeneratedRecord record;
        record.category = spec.category;
        record.code = spec.code;
        record.name = spec.name;
        record.raw = raw;
        record.formatted = spec.format(raw);
        record.birthDate = self.birthDate;
        record.birthYear = self.birthYear;
        record.birthMonth = self.birthMonth;
        record.sex = self.sex;
        record.holder = spec.holder;
        record.seed = rng.seed();
        return GenerateResult::ok(std::move(record));
    }

    spdlog::warn("[Generator] {}: no valid value after {} attempts", key, settings_.maxAttempts);
    return GenerateResult::failure(ErrorKind::UNSATISFIABLE_CONSTRAINT,
        key + ": no valid value after " + std::to_string(settings_.maxAttempts) + " attempts");
}

} // namespace idforge::core
