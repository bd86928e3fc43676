/**
 * @file format_spec.h
 * @brief Declarative identifier layouts
 *
 * A FormatSpec describes one identifier scheme (category + code) as an
 * ordered list of tokens. Generator and validator interpret the same
 * layout, so a scheme is defined once and both directions stay in sync.
 */

#pragma once

#include "idforge/core/types.h"
#include <optional>
#include <string>
#include <vector>

namespace idforge::core {

enum class TokenKind {
    LITERAL,   ///< Fixed text
    FIELD,     ///< Characters drawn from an alphabet
    CHOICE,    ///< One of a fixed set of equal-width strings
    DATE,      ///< Birth date rendered by a pattern
    CENTURY,   ///< Code carrying the century (and often the sex)
    SEX,       ///< Digits or letter carrying the sex
    CHECKSUM   ///< Slot filled by a named checksum algorithm
};

/// @brief Month encodings used by person-coded identifiers
enum class MonthCoding {
    PLAIN,           ///< 01-12
    PESEL,           ///< +80 (1800s), +0, +20, +40, +60 (2200s)
    BULGARIAN,       ///< +20 (1800s), +0 (1900s), +40 (2000s)
    CZECH_FEMALE,    ///< +50 for women (+20 extension accepted)
    ITALIAN_LETTER   ///< Single letter from "ABCDEHLMPRST"
};

/// @brief Day encodings
enum class DayCoding {
    PLAIN,           ///< 01-31
    FEMALE_PLUS_40   ///< +40 for women (Italy, Indonesia)
};

/**
 * @brief Date token codec
 *
 * The pattern is made of runs: YYYY, YYY (last three digits, JMBG), YY,
 * MM, M (Italian month letter) and DD. Two-digit years without a century
 * token resolve into [pivotFrom, pivotFrom + 99].
 */
struct DateCodec {
    std::string pattern = "YYMMDD";
    MonthCoding month = MonthCoding::PLAIN;
    DayCoding day = DayCoding::PLAIN;
    int pivotFrom = 1920;
};

/// @brief Century code schemes
enum class CenturyCode {
    ESTONIAN,              ///< 1-6: 1800s/1900s/2000s, odd male (EE, LT, KZ)
    ROMANIAN,              ///< 1/2 1900s, 3/4 1800s, 5/6 2000s, odd male
    KOREAN,                ///< 9/0 1800s, 1/2 1900s, 3/4 2000s, odd male
    FINNISH_SIGN,          ///< '+' 1800s, '-' 1900s, 'A' 2000s (YXWVU / BCDEF accepted)
    ICELANDIC,             ///< 8 1800s, 9 1900s, 0 2000s
    NORWEGIAN_INDIVIDUAL,  ///< Three-digit individual number ranges, odd male
    DANISH,                ///< First serial digit combined with the year
    LATVIAN,               ///< 0 1800s, 1 1900s, 2 2000s
    MEXICAN,               ///< Digit 1900s, letter 2000s
    SINGAPORE,             ///< S 1900s, T 2000s
    VIETNAMESE,            ///< 0/1 1900s, 2/3 2000s, even male
    EGYPTIAN               ///< 2 1900s, 3 2000s
};

/// @brief Sex code schemes
enum class SexCoding {
    PARITY_ODD_MALE,   ///< Last digit odd for men
    PARITY_EVEN_MALE,  ///< Last digit even for men (Bulgaria)
    LOW_FEMALE,        ///< Lower half of the range for women (South Africa)
    LOW_MALE,          ///< Lower half of the range for men (JMBG)
    ONE_TWO,           ///< '1' men, '2' women
    LETTER_HM          ///< 'H' (hombre) or 'M' (mujer)
};

/// @brief Which tokens a checksum slot covers
enum class ChecksumScope {
    SPAN,       ///< Tokens [scopeStart, scopeEnd); scopeEnd < 0 means up to the slot
    ALL_OTHERS  ///< Every token except the slot itself (IBAN style)
};

/**
 * @brief One layout token
 *
 * Only the members relevant to the token's kind are meaningful.
 */
struct Token {
    TokenKind kind = TokenKind::LITERAL;
    std::string label;                    ///< Field name for messages

    // LITERAL
    std::string text;

    // FIELD
    std::string alphabet;
    int minWidth = 0;
    int maxWidth = 0;
    bool emptyOrFull = false;             ///< Width is 0 or maxWidth (BIC branch)
    std::optional<long long> minValue;    ///< Numeric range (fixed-width digit fields)
    std::optional<long long> maxValue;
    std::vector<std::string> excluded;    ///< Forbidden values

    // CHOICE
    std::vector<std::string> choices;

    // DATE / CENTURY / SEX
    DateCodec date;
    CenturyCode century = CenturyCode::ESTONIAN;
    SexCoding sex = SexCoding::PARITY_ODD_MALE;
    int sexWidth = 1;

    // CHECKSUM
    std::string algorithm;
    ChecksumScope scope = ChecksumScope::SPAN;
    int scopeStart = 0;
    int scopeEnd = -1;
    int checkWidth = 0;                   ///< Resolved from the algorithm by the registry
    std::string checkAlphabet;            ///< Resolved from the algorithm by the registry

    bool checked = true;                  ///< Part of checksum payloads

    /// @brief True if the width depends on the input
    bool isVariable() const {
        return kind == TokenKind::FIELD && (emptyOrFull || minWidth != maxWidth);
    }

    /// @brief Width of a fixed-width token (maxWidth for variable fields)
    int width() const;

    /// @brief Characters the token may contain
    std::string charset() const;

    /// @brief True for DATE, CENTURY and SEX tokens
    bool isPersonCoded() const {
        return kind == TokenKind::DATE || kind == TokenKind::CENTURY || kind == TokenKind::SEX;
    }
};

/// @brief Display grouping and normalization
struct DisplayRule {
    std::vector<int> groups;              ///< Group sizes; empty means no grouping
    bool repeatLast = false;              ///< Repeat the last size until the end
    bool fromRight = false;               ///< Group from the right end
    std::vector<std::string> separators{" "};  ///< Per gap; the last one repeats
    std::string strip;                    ///< Extra characters dropped by normalize()
};

/**
 * @brief One identifier scheme
 */
struct FormatSpec {
    Category category = Category::IBAN;
    std::string code;
    std::string name;
    std::vector<Token> layout;
    DisplayRule display;
    HolderType holder = HolderType::ANY;

    // Derived by the registry
    int minLength = 0;
    int maxLength = 0;
    std::vector<size_t> checksumOrder;    ///< Slot indices in computation order

    /// @brief "category/code"
    std::string key() const { return categoryToString(category) + "/" + code; }

    /// Formats marked ANY serve either kind of holder
    bool acceptsHolder(HolderType h) const {
        return h == HolderType::ANY || holder == HolderType::ANY || holder == h;
    }

    bool hasPersonData() const;
    bool hasSexCode() const;

    /// @brief Display form of a canonical string
    std::string format(const std::string& raw) const;

    /// @brief Drop whitespace and display characters, uppercase
    std::string normalize(const std::string& input) const;
};

/**
 * @brief Token builders used by the format tables
 */
namespace layout {

extern const std::string kDigitChars;
extern const std::string kUpperChars;
extern const std::string kAlnumChars;

Token lit(const std::string& text);
/// Literal excluded from checksum payloads (VAT country prefixes)
Token prefix(const std::string& text);
Token digits(int width);
Token digits(int minWidth, int maxWidth);
Token digitRange(int width, long long minValue, long long maxValue);
Token letters(int width);
Token alnum(int width);
Token chars(const std::string& alphabet, int width);
Token chars(const std::string& alphabet, int minWidth, int maxWidth);
Token optionalChars(const std::string& alphabet, int width);
Token oneOf(std::vector<std::string> choices);
Token date(const std::string& pattern,
           MonthCoding month = MonthCoding::PLAIN,
           DayCoding day = DayCoding::PLAIN);
Token century(CenturyCode code);
Token sex(SexCoding coding, int width = 1, long long minValue = -1, long long maxValue = -1);

/// Slot over every preceding token
Token check(const std::string& algorithm);
/// Slot over tokens [start, slot)
Token checkFrom(const std::string& algorithm, int start);
/// Slot over tokens [start, end)
Token checkSpan(const std::string& algorithm, int start, int end);
/// Slot over every other token
Token checkAll(const std::string& algorithm);

/// Mark a token as excluded from checksum payloads
Token unchecked(Token token);
/// Attach a label
Token named(Token token, const std::string& label);
/// Resolve two-digit years of a date token into [from, from + 99]
Token pivot(Token token, int from);
/// Forbid values of a field
Token excluding(Token token, std::vector<std::string> values);

/**
 * @brief Parse ISO 13616 BBAN notation ("8!n10!n", "4!a6!n8!n", "2!c22!n")
 *
 * n = digits, a = upper-case letters, c = upper-case alphanumerics; "!"
 * marks a fixed length (all registry entries are fixed length).
 * @throws common::RegistryException on malformed notation
 */
std::vector<Token> parseBban(const std::string& notation);

DisplayRule groupsOf(int size, const std::string& separator = " ");
DisplayRule grouped(std::vector<int> sizes, std::vector<std::string> separators = {" "});

} // namespace layout

} // namespace idforge::core
