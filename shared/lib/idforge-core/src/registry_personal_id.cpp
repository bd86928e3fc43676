/**
 * @file registry_personal_id.cpp
 * @brief National personal identification numbers
 */

#include "registry_data.h"
#include <algorithm>

namespace idforge::core::detail {

using namespace layout;

namespace {

/// National Insurance number prefixes still issued by HMRC
std::vector<std::string> ninoPrefixes() {
    const std::string firstForbidden = "DFIQUV";
    const std::string secondForbidden = "DFIOQUV";
    const std::vector<std::string> reserved = {"BG", "GB", "KN", "NK", "NT", "TN", "ZZ"};
    std::vector<std::string> prefixes;
    for (char a : kUpperChars) {
        if (firstForbidden.find(a) != std::string::npos) continue;
        for (char b : kUpperChars) {
            if (secondForbidden.find(b) != std::string::npos) continue;
            std::string p{a, b};
            if (std::find(reserved.begin(), reserved.end(), p) != reserved.end()) continue;
            prefixes.push_back(p);
        }
    }
    return prefixes;
}

/// Former-Yugoslav JMBG / EMSO: DDMMYYY, region, serial (000-499 male), check
std::vector<Token> jmbg(Token region) {
    return {date("DDMMYYY"), named(std::move(region), "region"),
            sex(SexCoding::LOW_MALE, 3), check("si-emso")};
}

} // anonymous namespace

void addPersonalIdFormats(std::vector<FormatSpec>& out) {
    auto add = [&out](const std::string& code, const std::string& name,
                      std::vector<Token> tokens, DisplayRule display = {}) {
        out.push_back(makeSpec(Category::PERSONAL_ID, code, name, std::move(tokens),
                               std::move(display), HolderType::INDIVIDUAL));
    };
    const auto dash = [](int head) { return grouped({head}, {"-"}); };

    // --- Europe ---
    add("AT", "Sozialversicherungsnummer",
        {chars("123456789", 1), digits(2), checkAll("at-svnr"), date("DDMMYY")},
        grouped({4}, {" "}));
    add("BA", "JMBG", jmbg(digitRange(2, 10, 19)));
    add("BE", "Rijksregisternummer",
        {pivot(date("YYMMDD"), 1900), sex(SexCoding::PARITY_ODD_MALE, 3, 1, 998), check("be-nrn")},
        grouped({2, 2, 2, 3, 2}, {".", ".", "-", "."}));
    add("BY", "Identification number",
        {century(CenturyCode::ESTONIAN), date("DDMMYY"), named(chars("ABCHKEM", 1), "region"),
         digits(3), named(oneOf({"PB", "BA", "BI"}), "issuer"), digits(1)});
    add("BG", "EGN",
        {date("YYMMDD", MonthCoding::BULGARIAN), digits(2), sex(SexCoding::PARITY_EVEN_MALE),
         check("bg-egn")});
    add("CH", "AHV-Nummer", {lit("756"), digits(9), check("gs1-mod10")},
        grouped({3, 4, 4, 2}, {"."}));
    add("CZ", "Rodne cislo",
        {pivot(date("YYMMDD", MonthCoding::CZECH_FEMALE), 1954), digits(3), check("cz-rodne-cislo")},
        grouped({6}, {"/"}));
    add("DE", "Personalausweisnummer",
        {chars("CFGHJKLMNPRTVWXYZ", 1), chars("CFGHJKLMNPRTVWXYZ0123456789", 8), check("mrz-731")});
    add("DK", "CPR-nummer",
        {date("DDMMYY"), century(CenturyCode::DANISH), digits(2), sex(SexCoding::PARITY_ODD_MALE)},
        dash(6));
    add("EE", "Isikukood",
        {century(CenturyCode::ESTONIAN), date("YYMMDD"), digits(3), check("ee-isikukood")});
    add("ES", "DNI", {digits(8), check("es-dni")});
    add("FI", "Henkilotunnus",
        {date("DDMMYY"), unchecked(century(CenturyCode::FINNISH_SIGN)),
         sex(SexCoding::PARITY_ODD_MALE, 3, 2, 899), check("fi-hetu")});
    add("FR", "Numero de securite sociale",
        {sex(SexCoding::ONE_TWO), date("YYMM"), named(digitRange(2, 1, 95), "department"),
         named(digitRange(3, 1, 990), "commune"), digitRange(3, 1, 999), check("fr-nir")},
        grouped({1, 2, 2, 2, 3, 3}, {" "}));
    add("GB", "National Insurance number",
        {oneOf(ninoPrefixes()), digits(6), oneOf({"A", "B", "C", "D"})},
        grouped({2, 2, 2, 2}, {" "}));
    add("GR", "AMKA",
        {date("DDMMYY"), digits(3), sex(SexCoding::PARITY_ODD_MALE), check("luhn")});
    add("HR", "OIB", {digits(10), check("iso7064-mod11-10")});
    add("HU", "TAJ szam", {digits(8), check("hu-taj")}, grouped({3, 3}, {" "}));
    add("IE", "PPS Number", {digits(7), check("ie-ppsn")});
    add("IS", "Kennitala",
        {date("DDMMYY"), digitRange(2, 20, 99), check("mod11-32765432"),
         century(CenturyCode::ICELANDIC)},
        dash(6));
    add("IT", "Codice fiscale",
        {named(letters(3), "surname"), named(letters(3), "name"),
         date("YYMDD", MonthCoding::ITALIAN_LETTER, DayCoding::FEMALE_PLUS_40),
         named(letters(1), "municipality"), digits(3), check("italian-fiscal-code")});
    add("LT", "Asmens kodas",
        {century(CenturyCode::ESTONIAN), date("YYMMDD"), digits(3), check("ee-isikukood")});
    add("LU", "Numero d'identification",
        {date("YYYYMMDD"), digits(3), check("luhn"), checkSpan("verhoeff", 0, 2)},
        grouped({4, 4, 5}, {" "}));
    add("LV", "Personas kods",
        {date("DDMMYY"), century(CenturyCode::LATVIAN), digits(3), check("lv-personas-kods")},
        dash(6));
    add("MD", "IDNP", {lit("2"), digits(11), check("md-idnp")});
    add("ME", "JMBG", jmbg(digitRange(2, 21, 29)));
    add("MK", "EMBG", jmbg(digitRange(2, 41, 49)));
    add("MT", "Identity card number", {digits(7), chars("MGAPLHBZ", 1)});
    add("NL", "BSN", {digits(8), check("nl-elfproef")});
    add("NO", "Fodselsnummer",
        {date("DDMMYY"), century(CenturyCode::NORWEGIAN_INDIVIDUAL), check("no-fnr-k1"),
         check("no-fnr-k2")},
        grouped({6}, {" "}));
    add("PL", "PESEL",
        {date("YYMMDD", MonthCoding::PESEL), digits(3), sex(SexCoding::PARITY_ODD_MALE),
         check("pesel")});
    add("PT", "Numero de Identificacao Civil", {digits(8), check("pt-nif")});
    std::vector<std::string> romanianCounties = numberedCodes(1, 46, 2);
    romanianCounties.push_back("51");  // Bucharest sectors 1 and 2 (former codes)
    romanianCounties.push_back("52");
    add("RO", "CNP",
        {century(CenturyCode::ROMANIAN), date("YYMMDD"),
         named(oneOf(romanianCounties), "county"), digits(3), check("ro-cnp")});
    add("RS", "JMBG", jmbg(digitRange(2, 70, 79)));
    add("RU", "SNILS", {digits(9), check("ru-snils")}, grouped({3, 3, 3}, {"-", "-", " "}));
    add("SE", "Personnummer",
        {date("YYMMDD"), digits(2), sex(SexCoding::PARITY_ODD_MALE), check("luhn")},
        dash(6));
    add("SI", "EMSO", jmbg(lit("50")));
    add("SK", "Rodne cislo",
        {pivot(date("YYMMDD", MonthCoding::CZECH_FEMALE), 1954), digits(3), check("cz-rodne-cislo")},
        grouped({6}, {"/"}));
    add("UA", "RNOKPP", {digits(8), sex(SexCoding::PARITY_ODD_MALE), check("ua-rnokpp")});
    add("XK", "Numri personal", {chars("123456789", 1), digits(9)});

    // --- Americas ---
    add("AR", "DNI", {digitRange(8, 10000000, 99999999)}, grouped({2, 3, 3}, {"."}));
    add("BO", "Cedula de identidad", {chars(kDigitChars, 5, 8)});
    add("BR", "CPF", {digits(9), check("br-cpf-1"), check("br-cpf-2")},
        grouped({3, 3, 3, 2}, {".", ".", "-"}));
    add("CA", "Social Insurance Number", {digits(8), check("luhn")}, grouped({3, 3, 3}, {" "}));
    {
        DisplayRule rut = grouped({1, 3, 3}, {"-", "."});
        rut.fromRight = true;
        add("CL", "RUN", {chars(kDigitChars, 7, 8), check("cl-rut")}, rut);
    }
    add("CO", "Cedula de ciudadania", {chars(kDigitChars, 6, 10)});
    add("CR", "Cedula de identidad", {chars("123456789", 1), digits(4), digits(4)},
        grouped({1, 4}, {"-"}));
    add("CU", "Carne de identidad",
        {date("YYMMDD"), digits(3), sex(SexCoding::PARITY_EVEN_MALE), digits(1)});
    add("DO", "Cedula de identidad", {digits(3), digits(7), check("luhn")},
        grouped({3, 7}, {"-"}));
    add("EC", "Cedula de identidad",
        {named(digitRange(2, 1, 24), "province"), chars("012345", 1), digits(6), check("luhn")});
    add("GT", "Codigo Unico de Identificacion",
        {digits(8), check("gt-cui"), named(digitRange(2, 1, 22), "department"),
         named(digitRange(2, 1, 30), "municipality")},
        grouped({4, 5}, {" "}));
    add("HN", "Documento Nacional de Identificacion",
        {named(digitRange(2, 1, 18), "department"), named(digitRange(2, 1, 28), "municipality"),
         date("YYYY"), digits(5)},
        grouped({4, 4}, {"-"}));
    add("JM", "Taxpayer Registration Number", {lit("1"), digits(8)}, grouped({3, 3}, {"-"}));
    add("MX", "CURP",
        {letters(1), chars("AEIOUX", 1), letters(2), date("YYMMDD"), sex(SexCoding::LETTER_HM),
         named(oneOf({"AS", "BC", "BS", "CC", "CL", "CM", "CS", "CH", "DF", "DG", "GT",
                      "GR", "HG", "JC", "MC", "MN", "MS", "NT", "NL", "OC", "PL", "QT",
                      "QR", "SP", "SL", "SR", "TC", "TS", "TL", "VZ", "YN", "ZS", "NE"}),
               "state"),
         chars("BCDFGHJKLMNPQRSTVWXYZ", 3), century(CenturyCode::MEXICAN), check("mx-curp")});
    // Check letter: the thirteen digits modulo 23
    add("NI", "Cedula de identidad",
        {named(digitRange(3, 1, 999), "municipality"), date("DDMMYY"), digits(4), check("ni-cedula")},
        grouped({3, 6}, {"-"}));
    add("PA", "Cedula de identidad personal",
        {named(digitRange(2, 1, 13), "province"), digits(4), digits(5)}, grouped({2, 4}, {"-"}));
    add("PE", "DNI", {digits(8)});
    add("PY", "Cedula de identidad", {chars(kDigitChars, 5, 7)});
    add("SV", "DUI", {digits(8), check("sv-dui")}, dash(8));
    add("US", "Social Security Number",
        {named(excluding(digitRange(3, 1, 899), {"666"}), "area"),
         named(digitRange(2, 1, 99), "group"), named(digitRange(4, 1, 9999), "serial")},
        grouped({3, 2}, {"-"}));
    add("UY", "Cedula de identidad", {digits(7), check("uy-ci")},
        grouped({1, 3, 3}, {".", ".", "-"}));
    add("VE", "Cedula de identidad", {oneOf({"V", "E"}), chars(kDigitChars, 7, 8)});

    // --- Asia and Oceania ---
    add("AE", "Emirates ID", {lit("784"), date("YYYY"), digits(7), check("luhn")},
        grouped({3, 4, 7}, {"-"}));
    add("AM", "Social card number", {digits(10)});
    add("AU", "Medicare number",
        {chars("23456", 1), digits(7), check("au-medicare"), chars("123456789", 1)},
        grouped({4, 5}, {" "}));
    add("AZ", "FIN", {alnum(7)});
    add("BD", "National ID", {digits(10)});
    add("BH", "CPR number", {date("YYMM"), digits(4), digits(1)});
    add("CN", "Resident Identity Card",
        {named(chars("12345678", 1), "region"), digits(5), date("YYYYMMDD"), digits(2),
         sex(SexCoding::PARITY_ODD_MALE), check("iso7064-mod11-2")});
    add("GE", "Personal number", {digits(11)});
    DisplayRule hkid;
    hkid.strip = "()";  // printed as A123456(3)
    add("HK", "HKID", {letters(1), digits(6), check("hk-hkid")}, hkid);
    add("ID", "NIK",
        {named(digits(6), "region"), date("DDMMYY", MonthCoding::PLAIN, DayCoding::FEMALE_PLUS_40),
         digitRange(4, 1, 9999)});
    add("IL", "Teudat Zehut", {digits(8), check("luhn")});
    add("IN", "Aadhaar", {chars("23456789", 1), digits(10), check("verhoeff")}, groupsOf(4));
    add("IR", "Kart-e Melli", {digits(9), check("ir-melli")}, grouped({3, 6}, {"-"}));
    add("JP", "My Number", {digits(11), check("jp-my-number")}, groupsOf(4));
    add("KR", "Resident registration number",
        {date("YYMMDD"), century(CenturyCode::KOREAN), digits(5), check("kr-rrn")}, dash(6));
    add("KW", "Civil ID",
        {century(CenturyCode::EGYPTIAN), date("YYMMDD"), digits(4), check("kw-civil-id")});
    add("KZ", "IIN",
        {date("YYMMDD"), century(CenturyCode::ESTONIAN), digits(4), check("kz-iin")});
    // Day of the year, plus 500 for women
    add("LK", "National Identity Card",
        {date("YYYY"), sex(SexCoding::LOW_MALE, 3, 1, 866), digits(5)});
    add("MY", "MyKad",
        {date("YYMMDD"), named(digitRange(2, 1, 16), "state"), digits(3),
         sex(SexCoding::PARITY_ODD_MALE)},
        grouped({6, 2}, {"-"}));
    add("PH", "PhilSys Card Number", {digits(12)}, groupsOf(4, "-"));
    add("PK", "CNIC", {digitRange(5, 10000, 99999), digits(6), sex(SexCoding::PARITY_ODD_MALE)},
        grouped({5, 7}, {"-"}));
    add("QA", "Qatar ID",
        {century(CenturyCode::EGYPTIAN), date("YY"), named(digits(3), "nationality"), digits(5)});
    add("SA", "National ID", {named(oneOf({"1", "2"}), "status"), digits(8), check("luhn")});
    add("SG", "NRIC", {century(CenturyCode::SINGAPORE), digits(7), check("sg-nric")});
    add("TH", "Thai national ID", {chars("12345678", 1), digits(11), check("th-id")},
        grouped({1, 4, 5, 2}, {"-"}));
    add("TR", "T.C. Kimlik No",
        {chars("123456789", 1), digits(8), check("tr-tckn-1"), check("tr-tckn-2")});
    add("TW", "National ID",
        {chars("ABCDEFGHJKLMNPQRSTUVXYWZIO", 1), sex(SexCoding::ONE_TWO), digits(7), check("tw-id")});
    add("UZ", "PINFL",
        {century(CenturyCode::ESTONIAN), date("DDMMYY"), named(digits(3), "district"), digits(3),
         check("uz-pinfl")});
    add("VN", "Can cuoc cong dan",
        {named(digits(3), "province"), century(CenturyCode::VIETNAMESE), date("YY"), digits(6)});

    // --- Africa ---
    add("EG", "National ID",
        {century(CenturyCode::EGYPTIAN), date("YYMMDD"), named(digitRange(2, 1, 35), "governorate"),
         digits(3), sex(SexCoding::PARITY_ODD_MALE), digits(1)});
    add("GH", "Ghana Card", {lit("GHA"), digits(9), digits(1)}, grouped({3, 9}, {"-"}));
    add("KE", "National ID card number", {chars(kDigitChars, 7, 8)});
    add("MA", "CNIE", {chars(kUpperChars, 1, 2), digits(6)});
    add("NG", "NIN", {digits(11)});
    add("TN", "Carte d'identite nationale", {digits(8)});
    add("UG", "National Identification Number",
        {lit("C"), named(oneOf({"M", "F"}), "sex"), date("YY"), digits(5), alnum(5)});
    add("ZA", "South African ID",
        {date("YYMMDD"), sex(SexCoding::LOW_FEMALE, 4), named(oneOf({"0", "1"}), "citizenship"),
         oneOf({"8", "9"}), check("luhn")});
    add("ZW", "National registration number",
        {named(digits(2), "office"), digits(6), letters(1), named(digits(2), "district")},
        grouped({2, 6, 1}, {"-", " ", " "}));
}

} // namespace idforge::core::detail
