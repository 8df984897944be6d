#include "catalog/Diagnostic.hpp"

#include <iostream>
#include <utility>

namespace catalog {

void DiagnosticLog::warn(const std::string& source, const std::string& code,
                         const std::string& message, const std::string& part_name) {
    std::cerr << source << ": " << message << "\n";

    Diagnostic d;
    d.code = code;
    d.message = message;
    d.part_name = part_name;
    entries.push_back(std::move(d));
}

int DiagnosticLog::count(const std::string& code) const {
    int c = 0;
    for (const auto& d : entries) if (d.code == code) ++c;
    return c;
}

}  // namespace catalog
