/**
 * @file registry_iban.cpp
 * @brief IBAN formats and the shared BBAN table
 *
 * Layouts follow the ISO 13616 registry, the partner (experimental)
 * list and the French and Finnish territories that reuse their parent
 * country's BBAN.
 */

#include "registry_data.h"
#include "exception/exceptions.h"
#include <algorithm>
#include <map>

namespace idforge::core::detail {

using namespace layout;

namespace {

/// National check digit inside a BBAN: token @c slot covers BBAN tokens [start, end)
struct NationalRule {
    size_t slot;
    const char* algorithm;
    int start;
    int end;
};

const std::map<std::string, std::vector<NationalRule>>& nationalRules() {
    static const std::map<std::string, std::vector<NationalRule>> rules = {
        {"be", {{2, "be-bban", 0, 2}}},
        {"fr", {{3, "fr-rib", 0, 3}}},
        {"es", {{2, "es-ccc-1", 0, 2}, {3, "es-ccc-2", 4, 5}}},
        {"it", {{0, "italian-fiscal-code", 1, 4}}},
        {"no", {{2, "no-kontonr", 0, 2}}},
        {"fi", {{2, "luhn", 0, 2}}},
        {"pt", {{3, "iso7064-mod97-10", 0, 3}}},
        {"yu", {{2, "iso7064-mod97-10", 0, 2}}},
        {"hr", {{1, "iso7064-mod11-10", 0, 1}, {3, "iso7064-mod11-10", 2, 3}}},
        {"pl", {{1, "pl-bank", 0, 1}}},
        {"hu", {{2, "hu-9731", 0, 2}, {4, "hu-9731", 3, 4}}},
        {"cz", {{2, "cz-prefix", 1, 2}, {4, "cz-account", 3, 4}}},
    };
    return rules;
}

} // anonymous namespace

const std::vector<BbanEntry>& bbanTable() {
    static const std::vector<BbanEntry> table = {
        {"AD", "4!n4!n12!c", nullptr},
        {"AE", "3!n16!n", nullptr},
        {"AL", "8!n16!c", nullptr},
        {"AO", "21!n", nullptr},
        {"AT", "5!n11!n", nullptr},
        {"AX", "6!n7!n1!n", "fi"},
        {"AZ", "4!a20!c", nullptr},
        {"BA", "3!n3!n8!n2!n", nullptr},
        {"BE", "3!n7!n2!n", "be"},
        {"BF", "2!c22!n", nullptr},
        {"BG", "4!a4!n2!n8!c", nullptr},
        {"BH", "4!a14!c", nullptr},
        {"BI", "5!n5!n11!n2!n", nullptr},
        {"BJ", "2!c22!n", nullptr},
        {"BL", "5!n5!n11!c2!n", "fr"},
        {"BR", "8!n5!n10!n1!a1!c", nullptr},
        {"BY", "4!c4!n16!c", nullptr},
        {"CF", "23!n", nullptr},
        {"CG", "23!n", nullptr},
        {"CH", "5!n12!c", nullptr},
        {"CI", "1!a23!n", nullptr},
        {"CM", "23!n", nullptr},
        {"CR", "4!n14!n", nullptr},
        {"CV", "21!n", nullptr},
        {"CY", "3!n5!n16!c", nullptr},
        {"CZ", "4!n5!n1!n9!n1!n", "cz"},
        {"DE", "8!n10!n", nullptr},
        {"DJ", "5!n5!n11!n2!n", nullptr},
        {"DK", "4!n9!n1!n", nullptr},
        {"DO", "4!c20!n", nullptr},
        {"DZ", "22!n", nullptr},
        {"EE", "2!n2!n11!n1!n", nullptr},
        {"EG", "4!n4!n17!n", nullptr},
        {"ES", "4!n4!n1!n1!n10!n", "es"},
        {"FI", "6!n7!n1!n", "fi"},
        {"FK", "2!a12!n", nullptr},
        {"FO", "4!n9!n1!n", nullptr},
        {"FR", "5!n5!n11!c2!n", "fr"},
        {"GA", "23!n", nullptr},
        {"GB", "4!a6!n8!n", nullptr},
        {"GE", "2!a16!n", nullptr},
        {"GF", "5!n5!n11!c2!n", "fr"},
        {"GI", "4!a15!c", nullptr},
        {"GL", "4!n9!n1!n", nullptr},
        {"GP", "5!n5!n11!c2!n", "fr"},
        {"GQ", "23!n", nullptr},
        {"GR", "3!n4!n16!c", nullptr},
        {"GT", "4!c20!c", nullptr},
        {"GW", "2!c19!n", nullptr},
        {"HN", "4!a20!n", nullptr},
        {"HR", "6!n1!n9!n1!n", "hr"},
        {"HU", "3!n4!n1!n15!n1!n", "hu"},
        {"IE", "4!a6!n8!n", nullptr},
        {"IL", "3!n3!n13!n", nullptr},
        {"IQ", "4!a3!n12!n", nullptr},
        {"IR", "22!n", nullptr},
        {"IS", "4!n2!n6!n10!n", nullptr},
        {"IT", "1!a5!n5!n12!c", "it"},
        {"JO", "4!a4!n18!c", nullptr},
        {"KM", "23!n", nullptr},
        {"KW", "4!a22!c", nullptr},
        {"KZ", "3!n13!c", nullptr},
        {"LB", "4!n20!c", nullptr},
        {"LC", "4!a24!c", nullptr},
        {"LI", "5!n12!c", nullptr},
        {"LT", "5!n11!n", nullptr},
        {"LU", "3!n13!c", nullptr},
        {"LV", "4!a13!c", nullptr},
        {"LY", "3!n3!n15!n", nullptr},
        {"MA", "24!n", nullptr},
        {"MC", "5!n5!n11!c2!n", "fr"},
        {"MD", "2!c18!c", nullptr},
        {"ME", "3!n13!n2!n", "yu"},
        {"MF", "5!n5!n11!c2!n", "fr"},
        {"MG", "23!n", nullptr},
        {"MK", "3!n10!c2!n", "yu"},
        {"ML", "1!a23!n", nullptr},
        {"MN", "4!n12!n", nullptr},
        {"MQ", "5!n5!n11!c2!n", "fr"},
        {"MR", "5!n5!n11!n2!n", nullptr},
        {"MT", "4!a5!n18!c", nullptr},
        {"MU", "4!a2!n2!n12!n3!n3!a", nullptr},
        {"MZ", "21!n", nullptr},
        {"NC", "5!n5!n11!c2!n", "fr"},
        {"NE", "2!a22!n", nullptr},
        {"NI", "4!a20!n", nullptr},
        {"NL", "4!a10!n", nullptr},
        {"NO", "4!n6!n1!n", "no"},
        {"OM", "3!n16!c", nullptr},
        {"PF", "5!n5!n11!c2!n", "fr"},
        {"PK", "4!a16!c", nullptr},
        {"PL", "7!n1!n16!n", "pl"},
        {"PM", "5!n5!n11!c2!n", "fr"},
        {"PS", "4!a21!c", nullptr},
        {"PT", "4!n4!n11!n2!n", "pt"},
        {"QA", "4!a21!c", nullptr},
        {"RE", "5!n5!n11!c2!n", "fr"},
        {"RO", "4!a16!c", nullptr},
        {"RS", "3!n13!n2!n", "yu"},
        {"RU", "9!n5!n15!c", nullptr},
        {"SA", "2!n18!c", nullptr},
        {"SC", "4!a2!n2!n16!n3!a", nullptr},
        {"SD", "2!n12!n", nullptr},
        {"SE", "3!n16!n1!n", nullptr},
        {"SI", "5!n8!n2!n", "yu"},
        {"SK", "4!n5!n1!n9!n1!n", "cz"},
        {"SM", "1!a5!n5!n12!c", "it"},
        {"SN", "1!a23!n", nullptr},
        {"SO", "4!n3!n12!n", nullptr},
        {"ST", "4!n4!n11!n2!n", nullptr},
        {"SV", "4!a20!n", nullptr},
        {"TD", "23!n", nullptr},
        {"TF", "5!n5!n11!c2!n", "fr"},
        {"TG", "2!a22!n", nullptr},
        {"TL", "3!n14!n2!n", nullptr},
        {"TN", "2!n3!n13!n2!n", nullptr},
        {"TR", "5!n1!n16!c", nullptr},
        {"UA", "6!n19!c", nullptr},
        {"VA", "3!n15!n", nullptr},
        {"VG", "4!a16!n", nullptr},
        {"WF", "5!n5!n11!c2!n", "fr"},
        {"XK", "4!n10!n2!n", nullptr},
        {"YE", "4!a4!n18!c", nullptr},
        {"YT", "5!n5!n11!c2!n", "fr"},
    };
    return table;
}

std::vector<Token> bbanTokens(const BbanEntry& entry, int offset) {
    std::vector<Token> tokens = parseBban(entry.notation);
    if (!entry.nationalCheck) {
        return tokens;
    }

    auto it = nationalRules().find(entry.nationalCheck);
    if (it == nationalRules().end()) {
        throw common::RegistryException(std::string("unknown national check '") +
                                        entry.nationalCheck + "' for " + entry.country);
    }
    for (const auto& rule : it->second) {
        if (rule.slot >= tokens.size()) {
            throw common::RegistryException(std::string("national check slot out of range for ") +
                                            entry.country);
        }
        tokens[rule.slot] = checkSpan(rule.algorithm, offset + rule.start, offset + rule.end);
    }
    return tokens;
}

std::vector<std::string> numberedCodes(int from, int to, int width) {
    std::vector<std::string> codes;
    for (int i = from; i <= to; ++i) {
        std::string s = std::to_string(i);
        if (static_cast<int>(s.size()) < width) {
            s.insert(0, static_cast<size_t>(width) - s.size(), '0');
        }
        codes.push_back(s);
    }
    return codes;
}

FormatSpec makeSpec(Category category, const std::string& code, const std::string& name,
                    std::vector<Token> tokens, DisplayRule display, HolderType holder) {
    // Structural-only layouts carry an explicit pass-through slot
    const bool hasCheck = std::any_of(tokens.begin(), tokens.end(),
        [](const Token& t) { return t.kind == TokenKind::CHECKSUM; });
    if (!hasCheck) {
        tokens.push_back(layout::check("none"));
    }

    FormatSpec spec;
    spec.category = category;
    spec.code = code;
    spec.name = name;
    spec.layout = std::move(tokens);
    spec.display = std::move(display);
    spec.holder = holder;
    return spec;
}

void addIbanFormats(std::vector<FormatSpec>& out) {
    for (const auto& entry : bbanTable()) {
        // Country code, check digits over everything else, then the BBAN
        std::vector<Token> tokens = {named(lit(entry.country), "country"),
                                     named(checkAll("iban-mod97"), "check")};
        for (auto& t : bbanTokens(entry, 2)) {
            tokens.push_back(std::move(t));
        }
        out.push_back(makeSpec(Category::IBAN, entry.country, "IBAN", std::move(tokens),
                               groupsOf(4)));
    }
}

} // namespace idforge::core::detail
