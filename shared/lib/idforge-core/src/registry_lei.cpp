/**
 * @file registry_lei.cpp
 * @brief Legal Entity Identifier (ISO 17442)
 */

#include "registry_data.h"

namespace idforge::core::detail {

using namespace layout;

void addLeiFormats(std::vector<FormatSpec>& out) {
    out.push_back(makeSpec(Category::LEI, "LEI", "Legal Entity Identifier",
                           {named(alnum(4), "lou"), named(lit("00"), "reserved"),
                            named(alnum(12), "entity"), check("iso7064-mod97-10")},
                           {}, HolderType::COMPANY));
}

} // namespace idforge::core::detail
