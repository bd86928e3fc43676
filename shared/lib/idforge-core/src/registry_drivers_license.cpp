/**
 * @file registry_drivers_license.cpp
 * @brief Driver's license numbers (US states keyed "US-XX", plus national schemes)
 */

#include "registry_data.h"

namespace idforge::core::detail {

using namespace layout;

namespace {

struct StateLayout {
    const char* state;
    const char* name;
    std::vector<Token> tokens;
};

std::vector<Token> letterDigits(int letterCount, int digitCount) {
    return {letters(letterCount), digits(digitCount)};
}

} // anonymous namespace

void addDriversLicenseFormats(std::vector<FormatSpec>& out) {
    const std::vector<StateLayout> states = {
        {"AK", "Alaska", {digits(1, 7)}},
        {"AL", "Alabama", {digits(7)}},
        {"AR", "Arkansas", {digits(4, 9)}},
        {"AZ", "Arizona", letterDigits(1, 8)},
        {"CA", "California", letterDigits(1, 7)},
        {"CO", "Colorado", {digits(9)}},
        {"CT", "Connecticut", {digitRange(9, 10000000, 249999999)}},
        {"DC", "District of Columbia", {digits(7)}},
        {"DE", "Delaware", {digits(1, 7)}},
        {"FL", "Florida", letterDigits(1, 12)},
        {"GA", "Georgia", {digits(7, 9)}},
        {"HI", "Hawaii", {lit("H"), digits(8)}},
        {"IA", "Iowa", {digits(3), letters(2), digits(4)}},
        {"ID", "Idaho", {letters(2), digits(6), letters(1)}},
        {"IL", "Illinois", letterDigits(1, 11)},
        {"IN", "Indiana", {digits(10)}},
        {"KS", "Kansas", {lit("K"), digits(8)}},
        {"KY", "Kentucky", letterDigits(1, 8)},
        {"LA", "Louisiana", {lit("00"), digits(7)}},
        {"MA", "Massachusetts", {lit("S"), digits(8)}},
        {"MD", "Maryland", letterDigits(1, 12)},
        {"ME", "Maine", {digits(7)}},
        {"MI", "Michigan", letterDigits(1, 12)},
        {"MN", "Minnesota", letterDigits(1, 12)},
        {"MO", "Missouri", {letters(1), digits(5, 9)}},
        {"MS", "Mississippi", {digits(9)}},
        {"MT", "Montana", {digits(13)}},
        {"NC", "North Carolina", {digits(1, 12)}},
        {"ND", "North Dakota", letterDigits(3, 6)},
        {"NE", "Nebraska", {letters(1), digits(6, 8)}},
        {"NH", "New Hampshire", {digits(2), letters(3), digits(5)}},
        {"NJ", "New Jersey", letterDigits(1, 14)},
        {"NM", "New Mexico", {digits(9)}},
        {"NV", "Nevada", {digits(10)}},
        {"NY", "New York", {digits(9)}},
        {"OH", "Ohio", letterDigits(2, 6)},
        {"OK", "Oklahoma", letterDigits(1, 9)},
        {"OR", "Oregon", {digits(1, 9)}},
        {"PA", "Pennsylvania", {digits(8)}},
        {"RI", "Rhode Island", {digits(7)}},
        {"SC", "South Carolina", {digits(5, 11)}},
        {"SD", "South Dakota", {digits(6, 10)}},
        {"TN", "Tennessee", {digits(7, 9)}},
        {"TX", "Texas", {digits(8)}},
        {"UT", "Utah", {digits(4, 10)}},
        {"VA", "Virginia", letterDigits(1, 8)},
        {"VT", "Vermont", {digits(8)}},
        {"WA", "Washington", {lit("WDL"), alnum(9)}},
        {"WI", "Wisconsin", letterDigits(1, 13)},
        {"WV", "West Virginia", letterDigits(1, 6)},
        {"WY", "Wyoming", {digits(9)}},
    };
    for (const auto& s : states) {
        out.push_back(makeSpec(Category::DRIVERS_LICENSE, std::string("US-") + s.state,
                               std::string(s.name) + " driver license", s.tokens, {},
                               HolderType::INDIVIDUAL));
    }

    auto add = [&out](const std::string& code, const std::string& name,
                      std::vector<Token> tokens, DisplayRule display = {}) {
        out.push_back(makeSpec(Category::DRIVERS_LICENSE, code, name, std::move(tokens),
                               std::move(display), HolderType::INDIVIDUAL));
    };

    // National licences reusing the personal identifier
    add("CN", "Driving licence",
        {named(chars("12345678", 1), "region"), digits(5), date("YYYYMMDD"), digits(2),
         sex(SexCoding::PARITY_ODD_MALE), check("iso7064-mod11-2")});
    add("ES", "Permiso de conducir", {digits(8), check("es-dni")});

    add("IN", "Driving licence",
        {named(oneOf({"AP", "AS", "BR", "CG", "DL", "GA", "GJ", "HP", "HR", "JH", "JK", "KA",
                      "KL", "MH", "MP", "OD", "PB", "RJ", "TN", "TS", "UK", "UP", "WB"}),
               "state"),
         named(digits(2), "rto"), named(digitRange(4, 1990, 2024), "year"), digits(7)},
        grouped({2, 2}, {"-", " "}));
    add("KR", "Driver's license",
        {named(digitRange(2, 11, 28), "region"), digits(2), digits(6), digits(2)},
        grouped({2, 2, 6}, {"-"}));
    add("NL", "Rijbewijsnummer", {digits(10)});
}

} // namespace idforge::core::detail
