/**
 * @file person_codec.cpp
 * @brief Birth date, century and sex token codec
 */

#include "person_codec.h"
#include <algorithm>

namespace idforge::core::detail {

namespace {

const std::string kItalianMonths = "ABCDEHLMPRST";

constexpr int kEarliestYear = 1800;
constexpr int kLatestYear = 2099;

std::string pad(long long value, int width) {
    std::string s = std::to_string(value);
    if (static_cast<int>(s.size()) < width) {
        s.insert(0, static_cast<size_t>(width) - s.size(), '0');
    }
    return s;
}

bool parseDigits(const std::string& text, int& value) {
    if (text.empty()) return false;
    value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    return true;
}

long long powerOfTen(int width) {
    long long p = 1;
    for (int i = 0; i < width; ++i) p *= 10;
    return p;
}

/// Uniform value in [lo, hi] whose last digit has the given parity
std::optional<long long> pickParity(long long lo, long long hi, int parity, RandomSource& rng) {
    long long first = (lo % 2 == parity) ? lo : lo + 1;
    if (first > hi) {
        return std::nullopt;
    }
    long long count = (hi - first) / 2 + 1;
    return first + 2 * rng.uniform(0, count - 1);
}

YearSpan centurySpan(CenturyCode code) {
    switch (code) {
        case CenturyCode::NORWEGIAN_INDIVIDUAL: return {1855, 2039};
        case CenturyCode::DANISH:               return {1858, 2036};
        case CenturyCode::MEXICAN:
        case CenturyCode::SINGAPORE:
        case CenturyCode::VIETNAMESE:
        case CenturyCode::EGYPTIAN:             return {1900, kLatestYear};
        default:                                return {kEarliestYear, kLatestYear};
    }
}

/// Month offset of the PESEL / EGN schemes, -1 if the century has none
int monthOffset(MonthCoding coding, int year) {
    int century = year / 100;
    if (coding == MonthCoding::PESEL) {
        switch (century) {
            case 18: return 80;
            case 19: return 0;
            case 20: return 20;
            case 21: return 40;
            case 22: return 60;
            default: return -1;
        }
    }
    if (coding == MonthCoding::BULGARIAN) {
        switch (century) {
            case 18: return 20;
            case 19: return 0;
            case 20: return 40;
            default: return -1;
        }
    }
    return 0;
}

std::optional<std::string> renderDate(const DateCodec& codec, const Person& person) {
    const auto& p = codec.pattern;
    const bool female = person.sex == Sex::FEMALE;
    std::string out;

    size_t i = 0;
    while (i < p.size()) {
        char ch = p[i];
        size_t run = 1;
        while (i + run < p.size() && p[i + run] == ch) ++run;

        if (ch == 'Y') {
            if (run == 4) out += pad(person.date.year, 4);
            else if (run == 3) out += pad(person.date.year % 1000, 3);
            else if (run == 2) out += pad(person.date.year % 100, 2);
            else return std::nullopt;
        } else if (ch == 'M' && run == 1) {
            if (codec.month != MonthCoding::ITALIAN_LETTER) return std::nullopt;
            out += kItalianMonths[person.date.month - 1];
        } else if (ch == 'M' && run == 2) {
            int month = person.date.month;
            if (codec.month == MonthCoding::PESEL || codec.month == MonthCoding::BULGARIAN) {
                int offset = monthOffset(codec.month, person.date.year);
                if (offset < 0) return std::nullopt;
                month += offset;
            } else if (codec.month == MonthCoding::CZECH_FEMALE && female) {
                month += 50;
            }
            out += pad(month, 2);
        } else if (ch == 'D' && run == 2) {
            int day = person.date.day;
            if (codec.day == DayCoding::FEMALE_PLUS_40 && female) day += 40;
            out += pad(day, 2);
        } else {
            return std::nullopt;
        }
        i += run;
    }
    return out;
}

std::optional<std::string> renderCentury(CenturyCode code, const Person& person, RandomSource& rng) {
    const int year = person.date.year;
    const int century = year / 100;
    const bool male = person.sex == Sex::MALE;
    if (year < centurySpan(code).from || year > centurySpan(code).to) {
        return std::nullopt;
    }

    switch (code) {
        case CenturyCode::ESTONIAN:
            return std::to_string((century - 18) * 2 + (male ? 1 : 2));
        case CenturyCode::ROMANIAN: {
            int base = century == 19 ? 1 : century == 18 ? 3 : 5;
            return std::to_string(base + (male ? 0 : 1));
        }
        case CenturyCode::KOREAN:
            if (century == 18) return std::string(male ? "9" : "0");
            return std::to_string((century - 19) * 2 + (male ? 1 : 2));
        case CenturyCode::FINNISH_SIGN:
            return std::string(century == 18 ? "+" : century == 19 ? "-" : "A");
        case CenturyCode::ICELANDIC:
            return std::string(century == 18 ? "8" : century == 19 ? "9" : "0");
        case CenturyCode::NORWEGIAN_INDIVIDUAL: {
            long long lo = 500, hi = 749;
            if (year >= 1900 && year <= 1999) {
                lo = 0;
                hi = 499;
            } else if (year >= 2000) {
                lo = 500;
                hi = 999;
            }
            auto n = pickParity(lo, hi, male ? 1 : 0, rng);
            if (!n) return std::nullopt;
            return pad(*n, 3);
        }
        case CenturyCode::DANISH: {
            std::string digits;
            if (year < 1900) digits = "5678";
            else if (year <= 1936) digits = "0123";
            else if (year <= 1999) digits = "012349";
            else digits = "456789";
            return std::string(1, rng.pick(digits));
        }
        case CenturyCode::LATVIAN:
            return std::to_string(century - 18);
        case CenturyCode::MEXICAN:
            return std::string(1, century == 19 ? rng.pick(layout::kDigitChars)
                                                 : rng.pick(layout::kUpperChars));
        case CenturyCode::SINGAPORE:
            return std::string(century == 19 ? "S" : "T");
        case CenturyCode::VIETNAMESE:
            return std::to_string((century - 19) * 2 + (male ? 0 : 1));
        case CenturyCode::EGYPTIAN:
            return std::string(century == 19 ? "2" : "3");
    }
    return std::nullopt;
}

std::optional<std::string> renderSex(const Token& token, const Person& person, RandomSource& rng) {
    const bool male = person.sex == Sex::MALE;
    if (token.sex == SexCoding::ONE_TWO) {
        return std::string(male ? "1" : "2");
    }
    if (token.sex == SexCoding::LETTER_HM) {
        return std::string(male ? "H" : "M");
    }

    const long long full = powerOfTen(token.sexWidth);
    long long lo = token.minValue.value_or(0);
    long long hi = token.maxValue.value_or(full - 1);
    std::optional<long long> value;

    switch (token.sex) {
        case SexCoding::PARITY_ODD_MALE:
            value = pickParity(lo, hi, male ? 1 : 0, rng);
            break;
        case SexCoding::PARITY_EVEN_MALE:
            value = pickParity(lo, hi, male ? 0 : 1, rng);
            break;
        case SexCoding::LOW_FEMALE:
        case SexCoding::LOW_MALE: {
            const long long half = full / 2;
            const bool low = (token.sex == SexCoding::LOW_FEMALE) ? !male : male;
            long long from = low ? lo : std::max(lo, half);
            long long to = low ? std::min(hi, half - 1) : hi;
            if (from <= to) value = rng.uniform(from, to);
            break;
        }
        default:
            break;
    }
    if (!value) {
        return std::nullopt;
    }
    return pad(*value, token.sexWidth);
}

} // anonymous namespace

int daysInMonth(int year, int month) {
    static const int days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return days[month - 1];
}

YearSpan representableYears(const FormatSpec& spec) {
    YearSpan span{kEarliestYear, kLatestYear};
    bool hasCentury = false;
    for (const auto& t : spec.layout) {
        if (t.kind == TokenKind::CENTURY) {
            hasCentury = true;
            span = span.intersect(centurySpan(t.century));
        }
    }
    for (const auto& t : spec.layout) {
        if (t.kind != TokenKind::DATE) continue;
        size_t yearDigits = 0;
        for (char c : t.date.pattern) {
            if (c == 'Y') ++yearDigits;
        }
        bool centuryInMonth = t.date.month == MonthCoding::PESEL ||
                              t.date.month == MonthCoding::BULGARIAN;
        if (yearDigits == 2 && !centuryInMonth && !hasCentury) {
            span = span.intersect({t.date.pivotFrom, t.date.pivotFrom + 99});
        }
    }
    return span;
}

std::optional<std::string> renderPersonToken(const Token& token, const Person& person,
                                             RandomSource& rng) {
    switch (token.kind) {
        case TokenKind::DATE:    return renderDate(token.date, person);
        case TokenKind::CENTURY: return renderCentury(token.century, person, rng);
        case TokenKind::SEX:     return renderSex(token, person, rng);
        default:                 return std::nullopt;
    }
}

// =============================================================================
// PersonDecoder
// =============================================================================

void PersonDecoder::setSex(Sex s) {
    if (!sex_) sex_ = s;
}

bool PersonDecoder::feed(const Token& token, const std::string& text, std::string& error) {
    switch (token.kind) {
        case TokenKind::DATE:    return feedDate(token.date, text, error);
        case TokenKind::CENTURY: return feedCentury(token.century, text, error);
        case TokenKind::SEX:     return feedSex(token, text, error);
        default:                 return true;
    }
}

bool PersonDecoder::feedDate(const DateCodec& codec, const std::string& text, std::string& error) {
    const auto& p = codec.pattern;
    pivotFrom_ = codec.pivotFrom;

    size_t i = 0;
    while (i < p.size()) {
        char ch = p[i];
        size_t run = 1;
        while (i + run < p.size() && p[i + run] == ch) ++run;
        std::string part = text.substr(i, run);
        int value = 0;

        if (ch == 'M' && run == 1) {
            auto pos = kItalianMonths.find(part[0]);
            if (pos == std::string::npos) {
                error = "invalid month letter '" + part + "'";
                return false;
            }
            month_ = static_cast<int>(pos) + 1;
            i += run;
            continue;
        }

        if (!parseDigits(part, value)) {
            error = "date part '" + part + "' is not numeric";
            return false;
        }

        if (ch == 'Y') {
            if (run == 4) fullYear_ = value;
            else if (run == 3) fullYear_ = value >= 800 ? 1000 + value : 2000 + value;
            else twoDigitYear_ = value;
        } else if (ch == 'M') {
            int month = value;
            switch (codec.month) {
                case MonthCoding::PESEL: {
                    static const int bases[5] = {1900, 2000, 2100, 2200, 1800};
                    int block = month / 20;
                    if (block > 4) {
                        error = "invalid month " + part;
                        return false;
                    }
                    centuryBase_ = bases[block];
                    month -= block * 20;
                    break;
                }
                case MonthCoding::BULGARIAN:
                    if (month > 40) {
                        centuryBase_ = 2000;
                        month -= 40;
                    } else if (month > 20) {
                        centuryBase_ = 1800;
                        month -= 20;
                    } else {
                        centuryBase_ = 1900;
                    }
                    break;
                case MonthCoding::CZECH_FEMALE:
                    if (month > 50) {
                        setSex(Sex::FEMALE);
                        month -= 50;
                    } else {
                        setSex(Sex::MALE);
                    }
                    if (month > 20) month -= 20;
                    break;
                default:
                    break;
            }
            if (month < 1 || month > 12) {
                error = "invalid month " + part;
                return false;
            }
            month_ = month;
        } else if (ch == 'D') {
            int day = value;
            if (codec.day == DayCoding::FEMALE_PLUS_40) {
                if (day > 40) {
                    setSex(Sex::FEMALE);
                    day -= 40;
                } else {
                    setSex(Sex::MALE);
                }
            }
            if (day < 1 || day > 31) {
                error = "invalid day " + part;
                return false;
            }
            day_ = day;
        }
        i += run;
    }
    return true;
}

bool PersonDecoder::feedCentury(CenturyCode code, const std::string& text, std::string& error) {
    const char c = text.empty() ? '\0' : text[0];
    const int digit = (c >= '0' && c <= '9') ? c - '0' : -1;

    switch (code) {
        case CenturyCode::ESTONIAN:
            if (digit < 1 || digit > 8) break;
            centuryBase_ = 1800 + ((digit - 1) / 2) * 100;
            setSex(digit % 2 == 1 ? Sex::MALE : Sex::FEMALE);
            return true;
        case CenturyCode::ROMANIAN:
            if (digit < 1 || digit > 6) break;
            centuryBase_ = digit <= 2 ? 1900 : digit <= 4 ? 1800 : 2000;
            setSex(digit % 2 == 1 ? Sex::MALE : Sex::FEMALE);
            return true;
        case CenturyCode::KOREAN:
            if (digit < 0) break;
            if (digit == 9 || digit == 0) centuryBase_ = 1800;
            else if (digit == 1 || digit == 2 || digit == 5 || digit == 6) centuryBase_ = 1900;
            else centuryBase_ = 2000;
            setSex(digit % 2 == 1 ? Sex::MALE : Sex::FEMALE);
            return true;
        case CenturyCode::FINNISH_SIGN:
            if (c == '+') centuryBase_ = 1800;
            else if (std::string("-YXWVU").find(c) != std::string::npos) centuryBase_ = 1900;
            else if (c >= 'A' && c <= 'F') centuryBase_ = 2000;
            else break;
            return true;
        case CenturyCode::ICELANDIC:
            if (digit == 8) centuryBase_ = 1800;
            else if (digit == 9) centuryBase_ = 1900;
            else if (digit == 0) centuryBase_ = 2000;
            else break;
            return true;
        case CenturyCode::NORWEGIAN_INDIVIDUAL: {
            int n = 0;
            if (!parseDigits(text, n)) break;
            norwegianIndividual_ = n;
            setSex(n % 2 == 1 ? Sex::MALE : Sex::FEMALE);
            return true;
        }
        case CenturyCode::DANISH:
            if (digit < 0) break;
            danishDigit_ = digit;
            return true;
        case CenturyCode::LATVIAN:
            if (digit < 0 || digit > 2) break;
            centuryBase_ = 1800 + digit * 100;
            return true;
        case CenturyCode::MEXICAN:
            if (digit >= 0) centuryBase_ = 1900;
            else if (c >= 'A' && c <= 'Z') centuryBase_ = 2000;
            else break;
            return true;
        case CenturyCode::SINGAPORE:
            if (c == 'S') centuryBase_ = 1900;
            else if (c == 'T') centuryBase_ = 2000;
            else break;
            return true;
        case CenturyCode::VIETNAMESE:
            if (digit < 0 || digit > 5) break;
            centuryBase_ = 1900 + (digit / 2) * 100;
            setSex(digit % 2 == 0 ? Sex::MALE : Sex::FEMALE);
            return true;
        case CenturyCode::EGYPTIAN:
            if (digit == 2) centuryBase_ = 1900;
            else if (digit == 3) centuryBase_ = 2000;
            else break;
            return true;
    }
    error = "invalid century code '" + text + "'";
    return false;
}

bool PersonDecoder::feedSex(const Token& token, const std::string& text, std::string& error) {
    if (token.sex == SexCoding::ONE_TWO || token.sex == SexCoding::LETTER_HM) {
        const std::string maleCode = token.sex == SexCoding::ONE_TWO ? "1" : "H";
        const std::string femaleCode = token.sex == SexCoding::ONE_TWO ? "2" : "M";
        if (text == maleCode) {
            setSex(Sex::MALE);
        } else if (text == femaleCode) {
            setSex(Sex::FEMALE);
        } else {
            error = "invalid sex code '" + text + "'";
            return false;
        }
        return true;
    }

    int value = 0;
    if (!parseDigits(text, value)) {
        error = "sex code '" + text + "' is not numeric";
        return false;
    }
    if ((token.minValue && value < *token.minValue) || (token.maxValue && value > *token.maxValue)) {
        error = "serial number " + text + " out of range";
        return false;
    }

    const long long half = powerOfTen(token.sexWidth) / 2;
    switch (token.sex) {
        case SexCoding::PARITY_ODD_MALE:
            setSex(value % 2 == 1 ? Sex::MALE : Sex::FEMALE);
            break;
        case SexCoding::PARITY_EVEN_MALE:
            setSex(value % 2 == 0 ? Sex::MALE : Sex::FEMALE);
            break;
        case SexCoding::LOW_FEMALE:
            setSex(value < half ? Sex::FEMALE : Sex::MALE);
            break;
        case SexCoding::LOW_MALE:
            setSex(value < half ? Sex::MALE : Sex::FEMALE);
            break;
        default:
            break;
    }
    return true;
}

bool PersonDecoder::resolve(std::string& error) {
    std::optional<int> year = fullYear_;

    if (!year && twoDigitYear_) {
        const int yy = *twoDigitYear_;
        if (centuryBase_) {
            year = *centuryBase_ + yy;
        } else if (norwegianIndividual_) {
            const int n = *norwegianIndividual_;
            if (n <= 499) year = 1900 + yy;
            else if (n <= 749 && yy >= 54) year = 1800 + yy;
            else if (yy <= 39) year = 2000 + yy;
            else if (n >= 900) year = 1900 + yy;
            else {
                error = "individual number " + std::to_string(n) + " does not fit the birth year";
                return false;
            }
        } else if (danishDigit_) {
            const int d = *danishDigit_;
            if (d <= 3) year = 1900 + yy;
            else if (d == 4 || d == 9) year = (yy <= 36 ? 2000 : 1900) + yy;
            else year = (yy <= 57 ? 2000 : 1800) + yy;
        } else {
            const int base = pivotFrom_;
            year = base + ((yy - base % 100) % 100 + 100) % 100;
        }
    }

    birthYear_ = year;
    if (year) {
        birthMonth_ = month_;
    }
    if (!year || !month_ || !day_) {
        return true;
    }
    if (*day_ > daysInMonth(*year, *month_)) {
        error = "day " + std::to_string(*day_) + " does not exist in " +
                std::to_string(*year) + "-" + pad(*month_, 2);
        return false;
    }
    birthDate_ = BirthDate{*year, *month_, *day_};
    return true;
}

} // namespace idforge::core::detail
