/**
 * @file registry_swift.cpp
 * @brief SWIFT/BIC codes (ISO 9362)
 */

#include "registry_data.h"

namespace idforge::core::detail {

using namespace layout;

namespace {

/// Countries outside the IBAN table with active SWIFT membership
const char* const kNonIbanCountries[] = {
    "AR", "AU", "CA", "CL", "CN", "CO", "HK", "ID", "IN", "JP", "KR", "MX",
    "MY", "NG", "NZ", "PE", "PH", "SG", "TH", "TW", "US", "VN", "ZA",
};

std::vector<Token> bic(const std::string& country) {
    // Location: second character '0' denotes a test BIC, so it is excluded
    return {named(letters(4), "institution"), named(lit(country), "country"),
            named(alnum(1), "location"), chars("ABCDEFGHIJKLMNOPQRSTUVWXYZ123456789", 1),
            named(optionalChars(kAlnumChars, 3), "branch")};
}

} // anonymous namespace

void addSwiftFormats(std::vector<FormatSpec>& out) {
    for (const auto& entry : bbanTable()) {
        out.push_back(makeSpec(Category::SWIFT_BIC, entry.country, "SWIFT/BIC", bic(entry.country)));
    }
    for (const char* country : kNonIbanCountries) {
        out.push_back(makeSpec(Category::SWIFT_BIC, country, "SWIFT/BIC", bic(country)));
    }
}

} // namespace idforge::core::detail
