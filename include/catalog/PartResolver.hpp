#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "catalog/Diagnostic.hpp"
#include "catalog/PartCatalog.hpp"

namespace catalog {

// Fractional parts drawing on one choice part disagree about the denominator.
class FractionalDenominatorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One board-part instance that resolved to a choice part.
struct PartDraw {
    size_t board_part = 0;                 // caller's board-part handle
    int board_count = 0;                   // boards built
    std::optional<PartId> fractional;      // fractional part it came through, if any
};

struct ChoiceUsage {
    std::vector<PartDraw> draws;
    std::vector<PartId> fractional_parts;  // registered by resolve(), no duplicates
};

// Flattens alias / fractional parts into choice parts. Holds the per-run
// back references (board parts and fractional parts per choice part) that are
// needed for quantity accounting; the catalog itself is never modified.
class PartResolver {
public:
    explicit PartResolver(const PartCatalog& catalog) : m_catalog(catalog) {}

    // ChoicePart => [self]; AliasPart => targets expanded count times, in order;
    // FractionalPart => [its choice part] and registers itself on that choice part.
    // Unknown targets are warned about and skipped. Throws std::runtime_error on
    // an alias cycle or a fractional part whose base is not a choice part.
    std::vector<PartId> resolve(PartId part);

    // resolve() plus one draw per resolved choice part for quantity accounting.
    std::vector<PartId> resolve_board_part(size_t board_part, int board_count, PartId part);

    // Units to buy; throws FractionalDenominatorError on mixed denominators.
    int required_quantity(PartId choice_part) const;

    const ChoiceUsage* usage(PartId choice_part) const;

    int unresolved_count() const { return m_diag.count("unresolved_schematic_part"); }
    const DiagnosticLog& diagnostics() const { return m_diag; }

private:
    struct Resolved {
        PartId choice;
        std::optional<PartId> fractional;
    };

    void resolve_into(PartId part, std::vector<PartId>& stack, std::vector<Resolved>& out);

    const PartCatalog& m_catalog;
    std::map<PartId, ChoiceUsage> m_usage;
    DiagnosticLog m_diag;
};

}  // namespace catalog
