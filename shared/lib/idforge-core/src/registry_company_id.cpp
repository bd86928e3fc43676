/**
 * @file registry_company_id.cpp
 * @brief Company registration numbers
 */

#include "registry_data.h"

namespace idforge::core::detail {

using namespace layout;

void addCompanyIdFormats(std::vector<FormatSpec>& out) {
    auto add = [&out](const std::string& code, const std::string& name,
                      std::vector<Token> tokens, DisplayRule display = {}) {
        out.push_back(makeSpec(Category::COMPANY_ID, code, name, std::move(tokens),
                               std::move(display), HolderType::COMPANY));
    };

    // --- Europe ---
    add("AT", "Firmenbuchnummer", {digits(6), chars("ABDFGHIKMPSTVWXYZ", 1)});
    add("BE", "Ondernemingsnummer", {oneOf({"0", "1"}), digits(7), check("be-enterprise")},
        grouped({4, 3, 3}, {"."}));
    add("BG", "EIK", {digits(8), check("mod11-two-stage-8")});
    add("CH", "UID", {prefix("CHE"), digits(8), check("ch-uid")},
        grouped({3, 3, 3, 3}, {"-", ".", "."}));
    add("CZ", "ICO", {digits(7), check("cz-ico")});
    add("DE", "Handelsregisternummer", {oneOf({"HRA", "HRB"}), digits(4, 6)});
    add("DK", "CVR-nummer", {chars("123456789", 1), digits(6), check("dk-cvr")});
    add("EE", "Registrikood", {oneOf({"1", "7", "8", "9"}), digits(6), check("ee-isikukood")});
    add("ES", "CIF",
        {unchecked(named(oneOf({"A", "B", "E", "H"}), "entity")), named(digitRange(2, 1, 99), "province"),
         digits(5), check("luhn")});
    add("FI", "Y-tunnus", {digits(7), check("fi-ytunnus")}, grouped({7}, {"-"}));
    add("FR", "SIREN", {digits(8), check("luhn")}, grouped({3, 3, 3}, {" "}));
    add("GB", "Company registration number", {oneOf({"00", "01", "02", "03", "04", "05", "06",
                                                     "07", "08", "09", "SC", "NI", "OC"}),
                                              digits(6)});
    add("GR", "GEMI", {digits(12)});
    add("HR", "OIB", {digits(10), check("iso7064-mod11-10")});
    add("HU", "Cegjegyzekszam",
        {named(digitRange(2, 1, 20), "court"), named(digitRange(2, 1, 23), "form"), digits(6)},
        grouped({2, 2}, {"-"}));
    add("IE", "CRO number", {digits(6)});
    std::vector<std::string> italianOffices = numberedCodes(1, 100, 3);
    for (const char* extra : {"120", "121", "888", "999"}) italianOffices.push_back(extra);
    add("IT", "Partita IVA",
        {digits(7), named(oneOf(italianOffices), "office"),
         check("luhn")});
    add("LT", "Imones kodas", {oneOf({"1", "3"}), digits(7), check("mod11-two-stage-8")});
    add("LU", "RCS number", {lit("B"), digits(1, 6)});
    add("LV", "Registracijas numurs", {oneOf({"4", "5"}), digits(9), check("lv-pvn")});
    add("NL", "KvK-nummer", {digits(8)});
    add("NO", "Organisasjonsnummer", {oneOf({"8", "9"}), digits(7), check("mod11-32765432")},
        grouped({3, 3, 3}, {" "}));
    add("PL", "REGON", {digits(8), check("pl-regon")});
    add("PT", "NIPC", {oneOf({"5", "6"}), digits(7), check("pt-nif")});
    add("RO", "CUI", {chars("123456789", 1), digits(1, 8), check("ro-cui")});
    add("RU", "OGRN",
        {oneOf({"1", "5"}), named(digits(2), "year"), named(digits(2), "region"), digits(7),
         check("ru-ogrn")});
    add("SE", "Organisationsnummer",
        {oneOf({"2", "5", "7", "8", "9"}), digits(1), chars("23456789", 1), digits(6), check("luhn")},
        grouped({6}, {"-"}));
    add("SK", "ICO", {digits(7), check("cz-ico")});

    // --- Americas ---
    add("BR", "CNPJ",
        {digits(8), named(lit("0001"), "branch"), check("br-cnpj-1"), check("br-cnpj-2")},
        grouped({2, 3, 3, 4}, {".", ".", "/", "-"}));
    add("CA", "Business Number", {digits(8), check("luhn")});
    add("US", "EIN",
        {named(oneOf({"01", "02", "03", "04", "05", "06", "10", "11", "12", "13", "14", "15",
                      "16", "20", "21", "22", "23", "24", "25", "26", "27", "30", "31", "32",
                      "33", "34", "35", "36", "37", "38", "39", "40", "41", "42", "43", "44",
                      "45", "46", "47", "48", "50", "51", "52", "53", "54", "55", "56", "57",
                      "58", "59", "60", "61", "62", "63", "64", "65", "66", "67", "68", "71",
                      "72", "73", "74", "75", "76", "77", "80", "81", "82", "83", "84", "85",
                      "86", "87", "88", "90", "91", "92", "93", "94", "95", "98", "99"}),
               "campus"),
         digits(7)},
        grouped({2}, {"-"}));

    // --- Asia, Oceania and Africa ---
    add("AU", "ABN", {checkSpan("abn-mod89", 1, 2), digits(9)}, grouped({2, 3, 3}, {" "}));
    add("CN", "Unified Social Credit Code",
        {oneOf({"1", "5", "9"}), oneOf({"1", "2", "3"}), named(digits(6), "region"),
         named(chars("0123456789ABCDEFGHJKLMNPQRTUWXY", 9), "organization"), check("cn-uscc")});
    add("IL", "Company number", {lit("51"), digits(6), check("luhn")});
    add("IN", "Corporate Identity Number",
        {oneOf({"L", "U"}), named(digits(5), "industry"),
         named(oneOf({"AP", "AS", "BR", "CH", "CT", "DL", "GA", "GJ", "HP", "HR", "JH", "JK",
                      "KA", "KL", "MH", "MP", "OR", "PB", "RJ", "TN", "TG", "UP", "UR", "WB"}),
               "state"),
         named(digitRange(4, 1950, 2024), "year"), oneOf({"PLC", "PTC", "GOI", "NPL", "OPC"}),
         digits(6)});
    add("JP", "Corporate Number", {checkSpan("jp-corporate", 1, 2), digits(12)});
    add("NZ", "NZBN", {lit("94"), digits(10), check("gs1-mod10")});
    add("ZA", "Company registration number",
        {named(digitRange(4, 1950, 2024), "year"), digits(6),
         named(oneOf({"06", "07", "08", "09", "10", "21", "23", "24", "25", "26"}), "type")},
        grouped({4, 6}, {"/"}));
}

} // namespace idforge::core::detail
