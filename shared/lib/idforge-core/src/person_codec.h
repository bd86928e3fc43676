/**
 * @file person_codec.h
 * @brief Birth date, century and sex tokens (internal)
 */

#pragma once

#include "idforge/core/format_spec.h"
#include "idforge/core/random_source.h"
#include <optional>
#include <string>

namespace idforge::core::detail {

/// @brief The person a generated identifier describes
struct Person {
    BirthDate date;
    Sex sex = Sex::MALE;
};

/// @brief Inclusive year interval
struct YearSpan {
    int from = 0;
    int to = -1;

    bool empty() const { return from > to; }
    YearSpan intersect(const YearSpan& other) const {
        return {from > other.from ? from : other.from, to < other.to ? to : other.to};
    }
};

/// @brief Years every person-coded token of the format can encode
YearSpan representableYears(const FormatSpec& spec);

int daysInMonth(int year, int month);

/**
 * @brief Render a DATE, CENTURY or SEX token for a person
 * @return Token text, or std::nullopt if the person is not representable
 */
std::optional<std::string> renderPersonToken(const Token& token, const Person& person,
                                             RandomSource& rng);

/**
 * @brief Collects what the person-coded tokens of one input reveal
 *
 * Tokens are fed in layout order; resolve() combines them once all are in,
 * since some century codes need the two-digit year and vice versa.
 */
class PersonDecoder {
public:
    /// @return false with a message if the text is not a legal token value
    bool feed(const Token& token, const std::string& text, std::string& error);

    /// @return false with a message if the parts form no calendar date
    bool resolve(std::string& error);

    const std::optional<BirthDate>& birthDate() const { return birthDate_; }
    /// Year and month, also when the layout encodes no full date
    const std::optional<int>& birthYear() const { return birthYear_; }
    const std::optional<int>& birthMonth() const { return birthMonth_; }
    const std::optional<Sex>& sex() const { return sex_; }

private:
    bool feedDate(const DateCodec& codec, const std::string& text, std::string& error);
    bool feedCentury(CenturyCode code, const std::string& text, std::string& error);
    bool feedSex(const Token& token, const std::string& text, std::string& error);
    void setSex(Sex s);

    std::optional<int> fullYear_;
    std::optional<int> twoDigitYear_;
    std::optional<int> centuryBase_;
    std::optional<int> month_;
    std::optional<int> day_;
    int pivotFrom_ = 1920;
    std::optional<int> norwegianIndividual_;
    std::optional<int> danishDigit_;
    std::optional<Sex> sex_;
    std::optional<BirthDate> birthDate_;
    std::optional<int> birthYear_;
    std::optional<int> birthMonth_;
};

} // namespace idforge::core::detail
