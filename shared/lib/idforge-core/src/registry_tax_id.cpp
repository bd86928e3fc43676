/**
 * @file registry_tax_id.cpp
 * @brief Taxpayer identification numbers
 *
 * A country's primary number uses the country code; the numbers other
 * holders file under are suffixed ("US-EIN", "IT-PIVA"). Where the tax
 * authority uses the personal identification number or the business
 * register number, the layout is taken from that table.
 */

#include "registry_data.h"
#include "exception/exceptions.h"
#include <algorithm>

namespace idforge::core::detail {

using namespace layout;

namespace {

/// Tax ID code and the code of the format it reuses
struct SharedNumber {
    const char* code;
    const char* source;
};

/// Individuals file under their personal identification number
const SharedNumber kPersonalNumbers[] = {
    {"BG", "BG"}, {"CA", "CA"}, {"CN", "CN"}, {"CO-CC", "CO"}, {"CZ", "CZ"}, {"DK", "DK"},
    {"DO-CEDULA", "DO"}, {"EC-CEDULA", "EC"}, {"EE", "EE"}, {"ES-DNI", "ES"}, {"FI", "FI"},
    {"GB-NINO", "GB"}, {"IL", "IL"}, {"IS", "IS"}, {"JP", "JP"}, {"KR", "KR"}, {"KZ", "KZ"},
    {"LT", "LT"}, {"LU", "LU"}, {"LV", "LV"}, {"MD", "MD"}, {"MT", "MT"}, {"NL-BSN", "NL"},
    {"NO", "NO"}, {"PE-DNI", "PE"}, {"PL-PESEL", "PL"}, {"RO", "RO"}, {"SE", "SE"},
    {"SG", "SG"}, {"SK", "SK"}, {"SV", "SV"}, {"TH", "TH"}, {"TR", "TR"}, {"UA", "UA"},
    {"US-SSN", "US"},
};

/// Companies file under their business register number
const SharedNumber kRegisterNumbers[] = {
    {"AU-ABN", "AU"}, {"BE-ENT", "BE"}, {"BG-EIK", "BG"}, {"BR-CNPJ", "BR"}, {"CA-BN", "CA"},
    {"CH-UID", "CH"}, {"CN-USCC", "CN"}, {"CZ-ICO", "CZ"}, {"DK-CVR", "DK"}, {"EE-REG", "EE"},
    {"ES-CIF", "ES"}, {"FI-YTUNNUS", "FI"}, {"FR-SIREN", "FR"}, {"IL-CO", "IL"},
    {"IT-PIVA", "IT"}, {"JP-CORP", "JP"}, {"LT-JAR", "LT"}, {"NO-ORG", "NO"},
    {"PT-NIPC", "PT"}, {"RO-CUI", "RO"}, {"SE-ORG", "SE"}, {"US-EIN", "US"},
};

void addShared(std::vector<FormatSpec>& out, const std::vector<FormatSpec>& from,
               const SharedNumber& entry, HolderType holder) {
    auto it = std::find_if(from.begin(), from.end(),
        [&entry](const FormatSpec& s) { return s.code == entry.source; });
    if (it == from.end()) {
        throw common::RegistryException(std::string("tax_id/") + entry.code +
                                        ": no source format '" + entry.source + "'");
    }
    out.push_back(makeSpec(Category::TAX_ID, entry.code, it->name, it->layout, it->display,
                           holder));
}

DisplayRule checkDash() {
    DisplayRule rule = grouped({1}, {"-"});
    rule.fromRight = true;
    return rule;
}

} // anonymous namespace

void addTaxIdFormats(std::vector<FormatSpec>& out) {
    auto add = [&out](const std::string& code, const std::string& name, HolderType holder,
                      std::vector<Token> tokens, DisplayRule display = {}) {
        out.push_back(makeSpec(Category::TAX_ID, code, name, std::move(tokens),
                               std::move(display), holder));
    };
    const HolderType person = HolderType::INDIVIDUAL;
    const HolderType company = HolderType::COMPANY;
    const HolderType any = HolderType::ANY;

    {
        std::vector<FormatSpec> personal;
        addPersonalIdFormats(personal);
        for (const auto& entry : kPersonalNumbers) addShared(out, personal, entry, person);

        std::vector<FormatSpec> registers;
        addCompanyIdFormats(registers);
        for (const auto& entry : kRegisterNumbers) addShared(out, registers, entry, company);
    }

    // --- Europe ---
    add("AT", "Steuernummer", any, {named(digitRange(2, 3, 98), "office"), digits(6), check("luhn")},
        grouped({2, 3}, {"-", "/"}));
    add("BE", "Numero national", person,
        {pivot(date("YYMMDD"), 1900), sex(SexCoding::PARITY_ODD_MALE, 3, 1, 998), check("be-nrn")},
        grouped({2, 2, 2, 3, 2}, {".", ".", "-", "."}));
    add("BY", "UNP", any, {chars("1234567", 1), digits(7), check("by-unp")});
    add("CY", "TIC", any, {oneOf({"0", "1", "3", "4", "5", "9"}), digits(7),
                           check("italian-fiscal-code")});
    add("DE", "Steuerliche Identifikationsnummer", person,
        {chars("123456789", 1), digits(9), check("iso7064-mod11-10")},
        grouped({2, 3, 3}, {" "}));
    // ELSTER form: state, office, 0, district and serial
    add("DE-STNR", "Steuernummer", any,
        {named(oneOf({"10", "11", "21", "22", "23", "24", "26", "27", "28", "30", "31", "32",
                      "40", "41", "51", "52", "53", "54", "55", "56", "57", "58", "59", "91",
                      "92", "93"}),
               "state"),
         digits(2), lit("0"), digits(8)});
    add("ES", "NIE", person, {oneOf({"X", "Y", "Z"}), digits(7), check("es-nie")});
    add("FR", "Numero fiscal", person, {chars("0123", 1), digits(9), check("fr-spi")},
        grouped({2, 2, 3, 3}, {" "}));
    add("GB", "Unique Taxpayer Reference", any, {checkSpan("gb-utr", 1, 2), digits(9)});
    add("GE", "Taxpayer identification number", any, {digits(9)});
    add("GR", "AFM", any, {digits(8), check("gr-afm")});
    add("HR", "OIB", any, {digits(10), check("iso7064-mod11-10")});
    add("HU", "Adoazonosito jel", person, {lit("8"), digits(5), digits(3), check("hu-adoazonosito")});
    add("HU-ADOSZAM", "Adoszam", company,
        {digits(7), check("hu-9731"), named(chars("12345", 1), "vat"),
         named(digitRange(2, 2, 44), "county")},
        grouped({8, 1}, {"-"}));
    add("IE", "PPSN", person, {digits(7), check("ie-ppsn")});
    add("IT", "Codice fiscale", person,
        {named(letters(3), "surname"), named(letters(3), "name"),
         date("YYMDD", MonthCoding::ITALIAN_LETTER, DayCoding::FEMALE_PLUS_40),
         named(letters(1), "municipality"), digits(3), check("italian-fiscal-code")});
    add("MD-IDNO", "IDNO", company, {lit("1"), digits(11), check("md-idnp")});
    add("NL", "RSIN", any, {digits(8), check("nl-elfproef")});
    add("PL", "NIP", any, {digits(9), check("pl-nip")}, grouped({3, 3, 2}, {"-"}));
    add("PT", "NIF", person, {oneOf({"1", "2", "3"}), digits(7), check("pt-nif")},
        grouped({3, 3}, {" "}));
    add("RU", "INN", person, {digits(10), check("ru-inn-11"), check("ru-inn-12")});
    add("RU-INN10", "INN", company, {digits(9), check("ru-inn-10")});
    add("SI", "Davcna stevilka", any, {chars("123456789", 1), digits(6), check("si-ddv")});
    add("SK-DIC", "DIC", company, {chars("123456789", 1), digits(8), check("sk-dph")});

    // --- Americas ---
    add("AR", "CUIT", any,
        {named(oneOf({"20", "23", "24", "27", "30", "33", "34"}), "type"), digits(8),
         check("ar-cuit")},
        grouped({2, 8}, {"-"}));
    add("AR-CUIL", "CUIL", person,
        {named(oneOf({"20", "23", "24", "27"}), "type"), digits(8), check("ar-cuit")},
        grouped({2, 8}, {"-"}));
    add("BO", "NIT", any, {chars(kDigitChars, 7, 10)});
    add("BR", "CPF", person, {digits(9), check("br-cpf-1"), check("br-cpf-2")},
        grouped({3, 3, 3, 2}, {".", ".", "-"}));
    {
        DisplayRule rut = grouped({1, 3, 3}, {"-", "."});
        rut.fromRight = true;
        add("CL", "RUT", any, {chars(kDigitChars, 7, 8), check("cl-rut")}, rut);
    }
    add("CO", "NIT", company, {chars("89", 1), digits(8), check("co-nit")},
        grouped({9}, {"-"}));
    add("DO", "RNC", company, {chars("145", 1), digits(7), check("do-rnc")},
        grouped({1, 2, 5}, {"-"}));
    add("EC", "RUC", any,
        {named(digitRange(2, 1, 24), "province"), chars("012345", 1), digits(6), check("luhn"),
         lit("001")});
    add("GT", "NIT", any, {chars("123456789", 1), digits(5, 7), check("gt-nit")}, checkDash());
    add("MX", "RFC", person,
        {letters(1), chars("AEIOUX", 1), letters(2), date("YYMMDD"), chars(kAlnumChars, 3)});
    add("MX-PM", "RFC (persona moral)", company,
        {letters(3), named(digits(2), "year"), named(digitRange(2, 1, 12), "month"),
         named(digitRange(2, 1, 28), "day"), chars(kAlnumChars, 3)});
    add("PE", "RUC", any, {oneOf({"10", "20"}), digits(8), check("pe-ruc")});
    add("PY", "RUC", any, {chars(kDigitChars, 6, 8), check("py-ruc")}, checkDash());
    add("US", "ITIN", person,
        {lit("9"), digits(2),
         named(oneOf({"70", "71", "72", "73", "74", "75", "76", "77", "78", "79", "80", "81",
                      "82", "83", "84", "85", "86", "87", "88", "90", "91", "92", "94", "95",
                      "96", "97", "98", "99"}),
               "group"),
         digits(4)},
        grouped({3, 2}, {"-"}));
    add("UY", "RUT", company,
        {named(digitRange(2, 1, 21), "registry"), digits(6), lit("001"), check("uy-rut")},
        grouped({2, 6, 3}, {"-"}));
    add("VE", "RIF", any, {named(oneOf({"V", "E", "J", "P", "G"}), "type"), digits(9)},
        grouped({1, 8}, {"-"}));

    // --- Asia, Oceania and Africa ---
    add("AE", "Tax Registration Number", company, {lit("100"), digits(12)});
    add("AU", "Tax File Number", any, {digits(8), check("au-tfn")}, grouped({3, 3}, {" "}));
    add("AZ", "VOEN", any, {digits(9), named(oneOf({"1", "2"}), "holder")});
    add("EG", "Tax registration number", any, {digits(9)}, grouped({3, 3}, {"-"}));
    add("ID", "NPWP", any,
        {digits(8), check("luhn"), named(digits(3), "office"), named(digits(3), "branch")},
        grouped({2, 3, 3, 1, 3}, {".", ".", ".", "-", "."}));
    add("IN", "PAN", any,
        {letters(3), named(oneOf({"P", "C", "H", "F", "A", "T", "B", "L", "J", "G"}), "holder"),
         letters(1), digits(4), letters(1)});
    add("IN-TAN", "TAN", any, {letters(4), digits(5), letters(1)});
    add("KE", "KRA PIN", any, {named(oneOf({"A", "P"}), "type"), digits(9), letters(1)});
    add("KZ-BIN", "BIN", company,
        {named(digits(2), "year"), named(digitRange(2, 1, 12), "month"),
         named(chars("456", 1), "type"), named(chars("0123", 1), "division"), digits(5),
         check("kz-iin")});
    add("NG", "TIN", any, {digits(8), digits(4)}, grouped({8}, {"-"}));
    add("NZ", "IRD number", any, {digitRange(8, 1000000, 14999999), check("nz-ird")},
        grouped({3, 3}, {"-"}));
    add("PH", "TIN", any, {digits(9), named(digits(3), "branch")}, grouped({3, 3, 3}, {"-"}));
    add("PK", "NTN", any, {digits(7), digits(1)}, grouped({7}, {"-"}));
    add("SA", "VAT registration number", company, {lit("3"), digits(13), lit("3")});
    add("SG-UEN", "UEN", company, {digits(8), letters(1)});
    add("TW", "Unified Business Number", company, {digits(7), check("tw-ubn")});
    add("VN", "Ma so thue", company, {digits(9), check("vn-mst")});
    add("ZA", "Income tax reference", any, {chars("01239", 1), digits(8), check("luhn")});
}

} // namespace idforge::core::detail
