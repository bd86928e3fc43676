/**
 * @file registry_passport.cpp
 * @brief Passport document numbers
 *
 * Document numbers as printed on the data page; the MRZ check digit is not
 * part of the printed number.
 */

#include "registry_data.h"

namespace idforge::core::detail {

using namespace layout;

namespace {

/// German and Austrian document number alphabet (no vowels, no ambiguous letters)
const char* const kGermanDocumentChars = "CFGHJKLMNPRTVWXYZ0123456789";

} // anonymous namespace

void addPassportFormats(std::vector<FormatSpec>& out) {
    auto add = [&out](const std::string& code, std::vector<Token> tokens) {
        out.push_back(makeSpec(Category::PASSPORT, code, "Passport", std::move(tokens), {},
                               HolderType::INDIVIDUAL));
    };

    add("AT", {letters(1), digits(7)});
    add("AU", {oneOf({"N", "P", "R"}), letters(1), digits(7)});
    add("BE", {letters(2), digits(6)});
    add("BG", {digits(9)});
    add("BR", {letters(2), digits(6)});
    add("CA", {letters(2), digits(6)});
    add("CH", {letters(1), digits(7)});
    add("CN", {lit("E"), digits(8)});
    add("CZ", {digits(8)});
    add("DE", {chars("CFGHJK", 1), chars(kGermanDocumentChars, 8)});
    add("DK", {digits(9)});
    add("ES", {letters(3), digits(6)});
    add("FI", {letters(2), digits(7)});
    add("FR", {digits(2), letters(2), digits(5)});
    add("GB", {digits(9)});
    add("GR", {letters(2), digits(7)});
    add("HU", {letters(2), digits(6, 7)});
    add("IE", {chars(kAlnumChars, 2), digits(7)});
    add("IN", {letters(1), digits(7)});
    add("IT", {letters(2), digits(7)});
    add("JP", {letters(2), digits(7)});
    add("KR", {oneOf({"M", "S", "R", "G", "D"}), digits(8)});
    add("MX", {letters(1), digits(8)});
    add("NL", {letters(2), chars("ABCDEFGHIJKLMNPQRSTUVWXYZ0123456789", 6), digits(1)});
    add("NO", {digits(8)});
    add("NZ", {letters(2), digits(6)});
    add("PL", {letters(2), digits(7)});
    add("PT", {letters(1), digits(6)});
    add("RO", {digits(8, 9)});
    add("RU", {digits(9)});
    add("SE", {digits(8)});
    add("SK", {letters(2), digits(7)});
    add("TR", {letters(1), digits(8)});
    add("US", {letters(1), digits(8)});
    add("ZA", {letters(1), digits(8)});
}

} // namespace idforge::core::detail
