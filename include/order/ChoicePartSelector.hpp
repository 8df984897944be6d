#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "catalog/PartCatalog.hpp"

namespace order {

using VendorSet = std::set<std::string>;

struct PartDemand {
    catalog::PartId choice_part = 0;
    int required_quantity = 0;
};

// Best (actual part, vendor quote, price break) for one choice part. Derived
// data: recomputed whenever the exclusion set or quotes change.
struct SelectionResult {
    catalog::PartId choice_part = 0;
    catalog::ActualPartId actual_part = 0;

    size_t actual_part_index = 0;   // position in the choice part's actual part list
    size_t vendor_quote_index = 0;  // position in the actual part's quote list
    size_t price_break_index = 0;

    std::string vendor_name;
    std::string vendor_part_name;

    int order_quantity = 0;
    double unit_price = 0.0;
    double total_cost = 0.0;
};

// Minimizes (total_cost, order_quantity, actual_part_index, vendor_quote_index,
// price_break_index) over triples whose vendor is not excluded and whose stock
// covers order_quantity = max(required_quantity, min_quantity).
// Empty => unfulfillable under these constraints.
std::optional<SelectionResult> select_choice_part(
    const catalog::PartCatalog& catalog,
    catalog::PartId choice_part,
    int required_quantity,
    const VendorSet& excluded
);

// Every vendor quoting any of the choice parts and not excluded, sorted by name.
std::vector<std::string> available_vendor_names(
    const catalog::PartCatalog& catalog,
    const std::vector<PartDemand>& demands,
    const VendorSet& excluded
);

}  // namespace order
