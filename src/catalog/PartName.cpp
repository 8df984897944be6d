#include "catalog/PartName.hpp"

#include <algorithm>
#include <stdexcept>

namespace catalog {

PartName parse_part_name(const std::string& name) {
    const auto colons = std::count(name.begin(), name.end(), ':');
    if (colons > 1) {
        throw std::invalid_argument("too many colons (':') in schematic part name '" + name + "'");
    }

    PartName pn;
    pn.full = name;

    std::string head = name;
    const size_t colon = name.find(':');
    if (colon != std::string::npos) {
        head = name.substr(0, colon);
        pn.comment = name.substr(colon + 1);
    }

    const auto semis = std::count(head.begin(), head.end(), ';');
    if (semis != 1) {
        throw std::invalid_argument("schematic part name '" + name +
                                    "' must contain exactly one ';' separator");
    }

    const size_t semi = head.find(';');
    pn.base_name = head.substr(0, semi);
    pn.short_footprint = head.substr(semi + 1);
    return pn;
}

}  // namespace catalog
