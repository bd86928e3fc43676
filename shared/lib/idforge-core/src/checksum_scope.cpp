/**
 * @file checksum_scope.cpp
 * @brief Checksum slot scopes and payload assembly
 */

#include "checksum_scope.h"

namespace idforge::core::detail {

std::vector<size_t> scopeOf(const FormatSpec& spec, size_t slot) {
    const Token& t = spec.layout[slot];
    std::vector<size_t> covered;
    if (t.scope == ChecksumScope::ALL_OTHERS) {
        for (size_t i = 0; i < spec.layout.size(); ++i) {
            if (i != slot) covered.push_back(i);
        }
    } else {
        size_t end = t.scopeEnd < 0 ? slot : static_cast<size_t>(t.scopeEnd);
        for (size_t i = static_cast<size_t>(t.scopeStart); i < end; ++i) {
            if (i != slot) covered.push_back(i);
        }
    }
    return covered;
}

std::string checksumPayload(const FormatSpec& spec, size_t slot,
                            const std::vector<std::string>& texts) {
    std::string payload;
    for (size_t i : scopeOf(spec, slot)) {
        if (spec.layout[i].checked) {
            payload += texts[i];
        }
    }
    return payload;
}

} // namespace idforge::core::detail
