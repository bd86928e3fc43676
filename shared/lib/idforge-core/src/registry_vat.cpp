/**
 * @file registry_vat.cpp
 * @brief VAT identification numbers of the EU member states and the UK
 *
 * Numbers carry their VIES prefix (Greece uses "EL"); the prefix is never
 * part of a check digit payload.
 */

#include "registry_data.h"

namespace idforge::core::detail {

using namespace layout;

void addVatFormats(std::vector<FormatSpec>& out) {
    auto add = [&out](const std::string& code, const std::string& vatPrefix,
                      std::vector<Token> tokens) {
        tokens.insert(tokens.begin(), named(prefix(vatPrefix), "country"));
        out.push_back(makeSpec(Category::VAT, code, "VAT number", std::move(tokens), {},
                               HolderType::COMPANY));
    };

    // Scopes start at 1: token 0 is the country prefix
    add("AT", "AT", {lit("U"), digits(7), checkFrom("at-uid", 2)});
    add("BE", "BE", {oneOf({"0", "1"}), digits(7), checkFrom("be-enterprise", 1)});
    add("BG", "BG", {digits(8), checkFrom("mod11-two-stage-8", 1)});
    add("CY", "CY", {oneOf({"0", "1", "3", "4", "5", "9"}), digits(7),
                     checkFrom("italian-fiscal-code", 1)});
    add("CZ", "CZ", {digits(7), checkFrom("cz-ico", 1)});
    add("DE", "DE", {chars("123456789", 1), digits(7), checkFrom("iso7064-mod11-10", 1)});
    add("DK", "DK", {chars("123456789", 1), digits(6), checkFrom("dk-cvr", 1)});
    add("EE", "EE", {lit("10"), digits(6), checkFrom("ee-kmkr", 1)});
    add("ES", "ES", {unchecked(named(oneOf({"A", "B", "E", "H"}), "entity")),
                     digits(7), checkFrom("luhn", 2)});
    add("FI", "FI", {digits(7), checkFrom("fi-ytunnus", 1)});
    add("FR", "FR", {checkSpan("fr-tva-key", 2, 4), digits(8), checkFrom("luhn", 2)});
    add("GB", "GB", {chars("123456789", 1), digits(6), checkFrom("gb-vat", 1)});
    add("GR", "EL", {digits(8), checkFrom("gr-afm", 1)});
    add("HR", "HR", {digits(10), checkFrom("iso7064-mod11-10", 1)});
    add("HU", "HU", {chars("123456789", 1), digits(6), checkFrom("hu-9731", 1)});
    add("IE", "IE", {chars("123456789", 1), digits(6), checkFrom("ie-ppsn", 1)});
    add("IT", "IT", {digits(7), named(oneOf(numberedCodes(1, 100, 3)), "office"),
                     checkFrom("luhn", 1)});
    add("LT", "LT", {digits(7), lit("1"), checkFrom("mod11-two-stage-8", 1)});
    add("LU", "LU", {chars("123456789", 1), digits(5), checkFrom("lu-tva", 1)});
    add("LV", "LV", {chars("456789", 1), digits(9), checkFrom("lv-pvn", 1)});
    add("MT", "MT", {chars("123456789", 1), digits(5), checkFrom("mt-vat", 1)});
    add("NL", "NL", {digits(8), checkFrom("nl-elfproef", 1), lit("B"),
                     named(digitRange(2, 1, 99), "branch")});
    add("PL", "PL", {digits(9), checkFrom("pl-nip", 1)});
    add("PT", "PT", {chars("123456789", 1), digits(7), checkFrom("pt-nif", 1)});
    add("RO", "RO", {chars("123456789", 1), digits(1, 8), checkFrom("ro-cui", 1)});
    add("SE", "SE", {chars("123456789", 1), digits(8), checkFrom("luhn", 1), lit("01")});
    add("SI", "SI", {chars("123456789", 1), digits(6), checkFrom("si-ddv", 1)});
    add("SK", "SK", {chars("123456789", 1), digits(8), checkFrom("sk-dph", 1)});
}

} // namespace idforge::core::detail
