#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "catalog/Diagnostic.hpp"
#include "catalog/Models.hpp"

namespace catalog {

// Registration input for a choice part. Inline quotes on the actual parts are
// kept; quotes fetched later are appended with PartCatalog::add_quotes().
struct ChoicePartDef {
    std::string name;
    std::string footprint;
    std::string description;
    Placement placement;
    std::vector<ActualPart> actual_parts;
};

struct AliasPartDef {
    std::string name;
    std::vector<AliasTarget> targets;
    std::string footprint;
    Placement placement;
};

struct FractionalPartDef {
    std::string name;
    std::string footprint;
    std::string choice_part_name;
    int numerator = 1;
    int denominator = 1;
    std::string description;
};

class PartCatalog {
public:
    // Each returns the id stored under the name. A duplicate name is a warning
    // and returns the id of the first registration. A malformed name throws
    // std::invalid_argument.
    PartId register_choice_part(ChoicePartDef def);
    PartId register_alias_part(AliasPartDef def);
    PartId register_fractional_part(FractionalPartDef def);

    std::optional<PartId> lookup(const std::string& name) const;

    const SchematicPart& part(PartId id) const { return m_parts.at(id); }
    size_t part_count() const { return m_parts.size(); }

    // Collect the distinct actual parts of every choice part (registration
    // order). A repeated key is a warning; the first instance is kept and the
    // later one discarded. Safe to call again after more registrations.
    void deduplicate_actual_parts();

    const ActualPart& actual_part(ActualPartId id) const { return m_actual_parts.at(id); }
    size_t actual_part_count() const { return m_actual_parts.size(); }
    std::optional<ActualPartId> find_actual_part(const ActualPartKey& key) const;

    // Append quotes to an actual part; vendor keys already present are skipped.
    // Returns the number appended.
    int add_quotes(ActualPartId id, const std::vector<VendorQuote>& quotes);

    const DiagnosticLog& diagnostics() const { return m_diag; }
    DiagnosticLog& diagnostics() { return m_diag; }

private:
    PartId insert(SchematicPart part);

    std::vector<SchematicPart> m_parts;
    std::unordered_map<std::string, PartId> m_by_name;

    std::vector<ActualPart> m_actual_parts;
    std::map<ActualPartKey, ActualPartId> m_actual_by_key;

    // actual parts declared by choice parts that have not been deduplicated yet
    std::vector<std::pair<PartId, std::vector<ActualPart>>> m_pending;

    DiagnosticLog m_diag;
};

}  // namespace catalog
