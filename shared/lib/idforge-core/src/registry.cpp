/**
 * @file registry.cpp
 * @brief FormatRegistry construction, verification and lookup
 */

#include "idforge/core/registry.h"
#include "checksum_scope.h"
#include "registry_data.h"
#include "exception/exceptions.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace idforge::core {

namespace {

bool specLess(const FormatSpec& a, const FormatSpec& b) {
    if (a.category != b.category) return a.category < b.category;
    return a.code < b.code;
}

bool isDigits(const std::string& s) {
    return !s.empty() && s.find_first_not_of(layout::kDigitChars) == std::string::npos;
}

bool validDatePattern(const std::string& pattern, MonthCoding month) {
    size_t i = 0;
    while (i < pattern.size()) {
        char ch = pattern[i];
        size_t run = 1;
        while (i + run < pattern.size() && pattern[i + run] == ch) ++run;
        switch (ch) {
            case 'Y':
                if (run < 2 || run > 4) return false;
                break;
            case 'M':
                if (run == 1 && month != MonthCoding::ITALIAN_LETTER) return false;
                if (run == 2 && month == MonthCoding::ITALIAN_LETTER) return false;
                if (run > 2) return false;
                break;
            case 'D':
                if (run != 2) return false;
                break;
            default:
                return false;
        }
        i += run;
    }
    return !pattern.empty();
}

} // anonymous namespace

FormatRegistry::FormatRegistry(ChecksumLibrary algorithms, std::vector<FormatSpec> specs)
    : algorithms_(std::move(algorithms)), specs_(std::move(specs)) {
    std::sort(specs_.begin(), specs_.end(), specLess);

    for (size_t i = 1; i < specs_.size(); ++i) {
        if (!specLess(specs_[i - 1], specs_[i])) {
            throw common::RegistryException("duplicate format " + specs_[i].key());
        }
    }

    for (auto& spec : specs_) {
        verify(spec);
    }

    ordered_.reserve(specs_.size());
    for (const auto& spec : specs_) {
        ordered_.push_back(&spec);
    }

    spdlog::debug("[FormatRegistry] {} formats, {} checksum algorithms",
                  specs_.size(), algorithms_.size());
}

void FormatRegistry::verify(FormatSpec& spec) const {
    const std::string key = spec.key();
    auto fail = [&key](const std::string& what) {
        throw common::RegistryException(key + ": " + what);
    };

    if (spec.code.empty()) fail("empty code");
    if (spec.layout.empty()) fail("empty layout");

    int fixed = 0;
    int variableMin = 0;
    int variableMax = 0;
    int variableCount = 0;

    for (size_t i = 0; i < spec.layout.size(); ++i) {
        Token& t = spec.layout[i];
        const std::string where = "token " + std::to_string(i) + ": ";

        switch (t.kind) {
            case TokenKind::LITERAL:
                if (t.text.empty()) fail(where + "empty literal");
                break;

            case TokenKind::FIELD:
                if (t.alphabet.empty()) fail(where + "empty alphabet");
                if (t.maxWidth <= 0 || t.minWidth < 0 || t.minWidth > t.maxWidth) {
                    fail(where + "invalid width bounds");
                }
                if (t.emptyOrFull && t.minWidth != t.maxWidth) {
                    fail(where + "empty-or-full field needs a fixed width");
                }
                if (t.minValue || t.maxValue) {
                    if (!t.minValue || !t.maxValue || *t.minValue > *t.maxValue) {
                        fail(where + "invalid value range");
                    }
                    if (t.isVariable() || !isDigits(t.alphabet) || t.maxWidth > 18) {
                        fail(where + "value range needs a fixed-width digit field");
                    }
                    long long limit = 1;
                    for (int w = 0; w < t.maxWidth; ++w) limit *= 10;
                    if (*t.minValue < 0 || *t.maxValue >= limit) {
                        fail(where + "value range exceeds the field width");
                    }
                }
                break;

            case TokenKind::CHOICE:
                if (t.choices.empty()) fail(where + "empty choice list");
                for (const auto& c : t.choices) {
                    if (c.empty() || c.size() != t.choices.front().size()) {
                        fail(where + "choices must share one non-zero width");
                    }
                }
                break;

            case TokenKind::DATE:
                if (!validDatePattern(t.date.pattern, t.date.month)) {
                    fail(where + "invalid date pattern '" + t.date.pattern + "'");
                }
                break;

            case TokenKind::CENTURY:
                break;

            case TokenKind::SEX:
                if (t.sex != SexCoding::ONE_TWO && t.sex != SexCoding::LETTER_HM) {
                    if (t.sexWidth < 1 || t.sexWidth > 9) fail(where + "invalid sex code width");
                    long long limit = 1;
                    for (int w = 0; w < t.sexWidth; ++w) limit *= 10;
                    long long lo = t.minValue.value_or(0);
                    long long hi = t.maxValue.value_or(limit - 1);
                    if (lo < 0 || hi >= limit || hi - lo < 1) {
                        fail(where + "sex code range cannot encode both sexes");
                    }
                    if ((t.sex == SexCoding::LOW_FEMALE || t.sex == SexCoding::LOW_MALE) &&
                        (lo >= limit / 2 || hi < limit / 2)) {
                        fail(where + "sex code range must straddle the midpoint");
                    }
                }
                break;

            case TokenKind::CHECKSUM: {
                const ChecksumAlgorithm* algo = algorithms_.find(t.algorithm);
                if (!algo) fail(where + "unknown checksum algorithm '" + t.algorithm + "'");
                t.checkWidth = algo->width();
                t.checkAlphabet = algo->alphabet();
                if (t.checkWidth == 0 && algo->kind() != ChecksumKind::NONE) {
                    fail(where + "zero-width checksum slot");
                }
                if (t.scope == ChecksumScope::SPAN) {
                    int end = t.scopeEnd < 0 ? static_cast<int>(i) : t.scopeEnd;
                    if (t.scopeStart < 0 || t.scopeStart > end ||
                        end > static_cast<int>(spec.layout.size()) ||
                        (t.scopeStart <= static_cast<int>(i) && static_cast<int>(i) < end)) {
                        fail(where + "invalid checksum scope");
                    }
                }
                break;
            }
        }

        if (t.isVariable()) {
            ++variableCount;
            variableMin = t.emptyOrFull ? 0 : t.minWidth;
            variableMax = t.maxWidth;
        } else {
            fixed += t.width();
        }
    }

    if (variableCount > 1) fail("more than one variable-width token");
    spec.minLength = fixed + variableMin;
    spec.maxLength = fixed + variableMax;
    if (spec.maxLength == 0) fail("layout has zero length");

    // Display characters must never collide with token characters
    if (!spec.display.groups.empty() && spec.display.separators.empty()) {
        fail("grouped display without separators");
    }
    std::string cosmetic = spec.display.strip;
    if (!spec.display.groups.empty()) {
        for (const auto& sep : spec.display.separators) cosmetic += sep;
    }
    for (const auto& t : spec.layout) {
        std::string charset = t.charset();
        for (char c : cosmetic) {
            if (charset.find(c) != std::string::npos) {
                fail(std::string("display character '") + c + "' collides with a token character");
            }
        }
    }

    // Checksum slots: a span never covers an all-others slot; order by dependency
    std::vector<size_t> slots;
    for (size_t i = 0; i < spec.layout.size(); ++i) {
        if (spec.layout[i].kind == TokenKind::CHECKSUM) slots.push_back(i);
    }
    for (size_t s : slots) {
        if (spec.layout[s].scope != ChecksumScope::SPAN) continue;
        for (size_t covered : detail::scopeOf(spec, s)) {
            const Token& c = spec.layout[covered];
            if (c.kind == TokenKind::CHECKSUM && c.scope == ChecksumScope::ALL_OTHERS) {
                fail("checksum span covers an all-others slot");
            }
        }
    }

    spec.checksumOrder.clear();
    std::vector<bool> done(spec.layout.size(), false);
    while (spec.checksumOrder.size() < slots.size()) {
        bool progressed = false;
        for (size_t s : slots) {
            if (done[s]) continue;
            bool ready = true;
            for (size_t covered : detail::scopeOf(spec, s)) {
                const Token& c = spec.layout[covered];
                if (c.kind == TokenKind::CHECKSUM && c.checked && !done[covered]) {
                    ready = false;
                    break;
                }
            }
            if (ready) {
                done[s] = true;
                spec.checksumOrder.push_back(s);
                progressed = true;
            }
        }
        if (!progressed) fail("cyclic checksum dependencies");
    }
}

std::shared_ptr<const FormatRegistry> FormatRegistry::createDefault() {
    static const std::shared_ptr<const FormatRegistry> instance = [] {
        std::vector<FormatSpec> specs;
        detail::addIbanFormats(specs);
        detail::addPersonalIdFormats(specs);
        detail::addCreditCardFormats(specs);
        detail::addBankAccountFormats(specs);
        detail::addSwiftFormats(specs);
        detail::addCompanyIdFormats(specs);
        detail::addDriversLicenseFormats(specs);
        detail::addPassportFormats(specs);
        detail::addTaxIdFormats(specs);
        detail::addVatFormats(specs);
        detail::addLeiFormats(specs);
        auto registry = std::make_shared<const FormatRegistry>(ChecksumLibrary::standard(),
                                                               std::move(specs));
        spdlog::info("[FormatRegistry] Default registry built: {} formats", registry->size());
        return registry;
    }();
    return instance;
}

const FormatSpec* FormatRegistry::find(Category category, const std::string& code) const {
    FormatSpec key;
    key.category = category;
    key.code = code;
    auto it = std::lower_bound(specs_.begin(), specs_.end(), key, specLess);
    if (it != specs_.end() && it->category == category && it->code == code) {
        return &*it;
    }
    return nullptr;
}

const FormatSpec& FormatRegistry::lookup(Category category, const std::string& code) const {
    const FormatSpec* spec = find(category, code);
    if (!spec) {
        throw common::UnknownFormatException(categoryToString(category) + "/" + code);
    }
    return *spec;
}

CodeRange FormatRegistry::list(Category category) const {
    auto first = std::partition_point(ordered_.begin(), ordered_.end(),
        [category](const FormatSpec* s) { return s->category < category; });
    auto last = std::partition_point(first, ordered_.end(),
        [category](const FormatSpec* s) { return s->category == category; });
    const FormatSpec* const* base = ordered_.data();
    return CodeRange(base + (first - ordered_.begin()), base + (last - ordered_.begin()));
}

std::vector<const FormatSpec*> FormatRegistry::ofCategory(Category category) const {
    std::vector<const FormatSpec*> out;
    auto first = std::partition_point(ordered_.begin(), ordered_.end(),
        [category](const FormatSpec* s) { return s->category < category; });
    for (auto it = first; it != ordered_.end() && (*it)->category == category; ++it) {
        out.push_back(*it);
    }
    return out;
}

std::vector<const FormatSpec*> FormatRegistry::family(Category category,
                                                      const std::string& code) const {
    std::vector<const FormatSpec*> out;
    const std::string stem = code + "-";
    for (const FormatSpec* s : ofCategory(category)) {
        if (s->code == code || s->code.compare(0, stem.size(), stem) == 0) {
            out.push_back(s);
        }
    }
    return out;
}

const ChecksumAlgorithm& FormatRegistry::algorithmFor(const Token& slot) const {
    const ChecksumAlgorithm* algo = algorithms_.find(slot.algorithm);
    if (!algo) {
        throw common::RegistryException("unresolved checksum algorithm '" + slot.algorithm + "'");
    }
    return *algo;
}

} // namespace idforge::core
