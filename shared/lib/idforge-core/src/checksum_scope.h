/**
 * @file checksum_scope.h
 * @brief Tokens covered by a checksum slot (internal)
 *
 * Shared by the registry (dependency ordering), the generator and the
 * validator, so the three always agree on what a check digit covers.
 */

#pragma once

#include "idforge/core/format_spec.h"
#include <string>
#include <vector>

namespace idforge::core::detail {

/// @brief Token indices inside the scope of a checksum slot (the slot excluded)
std::vector<size_t> scopeOf(const FormatSpec& spec, size_t slot);

/**
 * @brief Checksum input of a slot
 * @param texts Rendered text of every token, in layout order
 * @return Concatenation of the checked tokens in the slot's scope
 */
std::string checksumPayload(const FormatSpec& spec, size_t slot,
                            const std::vector<std::string>& texts);

} // namespace idforge::core::detail
