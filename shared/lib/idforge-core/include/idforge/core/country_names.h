/**
 * @file country_names.h
 * @brief ISO 3166-1 English short names of the supported countries
 */

#pragma once

#include <optional>
#include <string>

namespace idforge::core {

/**
 * @brief English short name of a country code
 *
 * Accepts alpha-2 codes and the "US-XX" subdivision keys of driver's
 * licenses (resolved to their country).
 * @return Name, or std::nullopt for scheme codes ("visa", "LEI")
 */
std::optional<std::string> countryName(const std::string& code);

} // namespace idforge::core
