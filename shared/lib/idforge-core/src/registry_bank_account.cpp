/**
 * @file registry_bank_account.cpp
 * @brief Domestic bank account numbers
 *
 * Every IBAN country contributes its BBAN (with national check digits);
 * countries without IBAN get their domestic routing + account layouts.
 * Germany and Brazil use their domestic layout in place of the BBAN.
 */

#include "registry_data.h"
#include <set>

namespace idforge::core::detail {

using namespace layout;

void addBankAccountFormats(std::vector<FormatSpec>& out) {
    std::vector<FormatSpec> domestic;
    auto add = [&domestic](const std::string& code, const std::string& name,
                           std::vector<Token> tokens, DisplayRule display = {}) {
        domestic.push_back(makeSpec(Category::BANK_ACCOUNT, code, name, std::move(tokens),
                                    std::move(display)));
    };

    // Bankleitzahl + Kontonummer, check method 00
    add("DE", "Bankleitzahl und Kontonummer",
        {named(digits(8), "blz"), named(digits(9), "account"), checkFrom("de-kontonr-00", 1)},
        grouped({8}, {" "}));

    // --- Routing + account schemes ---
    add("AR", "CBU",
        {named(digits(7), "bank"), check("ar-cbu-1"), named(digits(13), "account"),
         checkSpan("ar-cbu-2", 2, 3)},
        grouped({8}, {" "}));
    add("AU", "BSB and account number",
        {named(chars("01234567", 1), "bsb"), digits(5), named(digits(6, 10), "account")},
        grouped({3, 3}, {"-", " "}));
    add("BD", "Routing and account number",
        {named(digits(9), "routing"), named(digits(13), "account")}, grouped({9}, {" "}));
    add("BO", "Numero de cuenta", {digits(10, 14)});
    add("BR", "Agencia e conta",
        {named(digits(3), "bank"), named(digits(4), "agency"), named(digits(5, 12), "account"),
         digits(1)},
        grouped({3, 4}, {" "}));
    add("CA", "Institution, transit and account",
        {named(digits(3), "institution"), named(digits(5), "transit"),
         named(digits(7, 12), "account")},
        grouped({3, 5}, {" "}));
    add("CL", "Numero de cuenta", {digits(8, 12)});
    add("CN", "UnionPay debit account", {lit("62"), digits(16), check("luhn")}, groupsOf(4));
    add("CO", "Numero de cuenta", {digits(10, 11)});
    add("EC", "Numero de cuenta", {digits(10)});
    add("GH", "Account number", {digits(13)});
    add("HK", "Bank, branch and account",
        {named(digits(3), "bank"), named(digits(3), "branch"), named(digits(6, 9), "account")},
        grouped({3, 3}, {"-"}));
    add("ID", "Nomor rekening", {digits(10, 16)});
    add("IN", "IFSC and account number",
        {named(letters(4), "bank"), lit("0"), named(alnum(6), "branch"),
         named(digits(9, 18), "account")},
        grouped({11}, {" "}));
    add("JM", "Branch and account number",
        {named(digits(5), "branch"), named(digits(6, 10), "account")}, grouped({5}, {"-"}));
    add("JP", "Bank, branch and account",
        {named(digits(4), "bank"), named(digits(3), "branch"), named(digits(7), "account")},
        grouped({4, 3}, {" "}));
    add("KE", "Account number", {digits(10, 14)});
    add("KR", "Account number", {digits(11, 14)});
    add("LK", "Account number", {digits(10, 12)});
    add("MX", "CLABE",
        {named(digits(3), "bank"), named(digits(3), "plaza"), named(digits(11), "account"),
         check("mx-clabe")},
        grouped({3, 3, 11}, {" "}));
    add("MY", "Account number", {digits(10, 16)});
    // Check digit over bank code and serial
    add("NG", "NUBAN",
        {named(digits(3), "bank"), named(digits(9), "serial"), check("ng-nuban")},
        grouped({3}, {" "}));
    add("NP", "Account number", {digits(14, 20)});
    add("NZ", "Bank account number",
        {named(digits(2), "bank"), named(digits(4), "branch"), named(digits(7), "account"),
         named(digits(3), "suffix")},
        grouped({2, 4, 7}, {"-"}));
    add("PE", "CCI", {named(digits(3), "bank"), named(digits(3), "office"), digits(14)},
        grouped({3, 3, 12}, {"-"}));
    add("PH", "Account number", {digits(10, 16)});
    add("PY", "Numero de cuenta", {digits(10)});
    add("SG", "Bank and account number",
        {named(digits(3), "bank"), named(digits(7, 11), "account")}, grouped({3}, {"-"}));
    add("TH", "Account number", {digits(3), digits(1), digits(5), digits(1)},
        grouped({3, 1, 5}, {"-"}));
    add("TT", "Account number", {digits(7, 12)});
    add("TW", "Bank and account number",
        {named(digits(3), "bank"), named(digits(10, 14), "account")}, grouped({3}, {"-"}));
    add("TZ", "Account number", {digits(10, 13)});
    add("UG", "Account number", {digits(10, 14)});
    add("US", "ABA routing and account number",
        {named(oneOf({"01", "02", "03", "04", "05", "06", "07", "08", "09", "10", "11", "12",
                      "21", "22", "23", "24", "25", "26", "27", "28", "29", "30", "31", "32"}),
               "district"),
         digits(6), check("aba-routing"), named(digits(4, 17), "account")},
        grouped({9}, {" "}));
    add("UY", "Numero de cuenta", {digits(9, 14)});
    add("VE", "Codigo Cuenta Cliente",
        {named(digits(4), "bank"), named(digits(4), "office"), named(digits(2), "control"),
         named(digits(10), "account")},
        grouped({4, 4, 2}, {"-"}));
    add("VN", "Account number", {digits(9, 15)});
    add("ZA", "Branch and account number",
        {named(digits(6), "branch"), named(digits(9, 11), "account")}, grouped({6}, {" "}));
    add("ZM", "Account number", {digits(10, 14)});

    // A domestic layout replaces the BBAN of the same country
    std::set<std::string> codes;
    for (auto& spec : domestic) {
        codes.insert(spec.code);
        out.push_back(std::move(spec));
    }
    for (const auto& entry : bbanTable()) {
        if (codes.count(entry.country) == 0) {
            out.push_back(makeSpec(Category::BANK_ACCOUNT, entry.country, "BBAN",
                                   bbanTokens(entry, 0)));
        }
    }
}

} // namespace idforge::core::detail
