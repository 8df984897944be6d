#pragma once

#include <string>

#include "catalog/Models.hpp"

namespace catalog {

// Splits "<base_name>;<short_footprint>[:comment]".
// Throws std::invalid_argument unless there is exactly one ';' and at most one ':'.
PartName parse_part_name(const std::string& name);

}  // namespace catalog
