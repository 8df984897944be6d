#pragma once

#include <string>
#include <vector>

namespace catalog {

// Non-fatal condition collected during a run. Codes:
//   duplicate_registration, duplicate_actual_part, unresolved_schematic_part,
//   quote_provider_failure, unfulfillable
struct Diagnostic {
    std::string code;
    std::string message;
    std::string part_name;
};

struct DiagnosticLog {
    std::vector<Diagnostic> entries;

    // Records the entry and echoes it to std::cerr as "<source>: <message>".
    void warn(const std::string& source, const std::string& code,
              const std::string& message, const std::string& part_name = "");

    int count(const std::string& code) const;
    bool empty() const { return entries.empty(); }
};

}  // namespace catalog
