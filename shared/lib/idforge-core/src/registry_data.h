/**
 * @file registry_data.h
 * @brief Built-in format tables (internal)
 *
 * One translation unit per category; each appends its specs.
 */

#pragma once

#include "idforge/core/format_spec.h"
#include <string>
#include <vector>

namespace idforge::core::detail {

void addIbanFormats(std::vector<FormatSpec>& out);
void addPersonalIdFormats(std::vector<FormatSpec>& out);
void addCreditCardFormats(std::vector<FormatSpec>& out);
void addBankAccountFormats(std::vector<FormatSpec>& out);
void addSwiftFormats(std::vector<FormatSpec>& out);
void addCompanyIdFormats(std::vector<FormatSpec>& out);
void addDriversLicenseFormats(std::vector<FormatSpec>& out);
void addPassportFormats(std::vector<FormatSpec>& out);
void addTaxIdFormats(std::vector<FormatSpec>& out);
void addVatFormats(std::vector<FormatSpec>& out);
void addLeiFormats(std::vector<FormatSpec>& out);

/// @brief BBAN definition shared by the IBAN and bank account tables
struct BbanEntry {
    const char* country;
    const char* notation;   ///< ISO 13616 notation
    const char* nationalCheck;  ///< National check scheme key, or nullptr
};

/// @brief Every country with an IBAN layout (registry, partner and territory codes)
const std::vector<BbanEntry>& bbanTable();

/**
 * @brief BBAN tokens of one country, with its national check digits
 *
 * Token indices inside the returned layout start at @p offset (the
 * position of the first BBAN token in the enclosing layout), so national
 * check spans stay correct when the BBAN is embedded in an IBAN.
 */
std::vector<Token> bbanTokens(const BbanEntry& entry, int offset);

/// @brief Zero-padded decimal codes from..to ("01", "02", ...)
std::vector<std::string> numberedCodes(int from, int to, int width);

/**
 * @brief Build a spec
 *
 * A layout without check characters gets a trailing "none" slot, so every
 * built-in format names the algorithm that guards it.
 */
FormatSpec makeSpec(Category category, const std::string& code, const std::string& name,
                    std::vector<Token> tokens, DisplayRule display = {},
                    HolderType holder = HolderType::ANY);

} // namespace idforge::core::detail
