#include "catalog/Models.hpp"

namespace catalog {

std::string to_string(const ActualPartKey& key) {
    return "'" + key.manufacturer_name + "' '" + key.manufacturer_part_name + "'";
}

const PartName& part_name(const SchematicPart& part) {
    return std::visit([](const auto& p) -> const PartName& { return p.name; }, part);
}

const char* part_kind_str(const SchematicPart& part) {
    switch (part.index()) {
        case 0: return "choice";
        case 1: return "alias";
        case 2: return "fractional";
        default: return "unknown";
    }
}

}  // namespace catalog
