#include "order/ChoicePartSelector.hpp"

#include <algorithm>
#include <tuple>

namespace order {

static bool better(const SelectionResult& a, const SelectionResult& b) {
    return std::tie(a.total_cost, a.order_quantity, a.actual_part_index, a.vendor_quote_index, a.price_break_index) <
           std::tie(b.total_cost, b.order_quantity, b.actual_part_index, b.vendor_quote_index, b.price_break_index);
}

std::optional<SelectionResult> select_choice_part(
    const catalog::PartCatalog& catalog,
    catalog::PartId choice_part,
    int required_quantity,
    const VendorSet& excluded
) {
    const auto& cp = std::get<catalog::ChoicePart>(catalog.part(choice_part));

    std::optional<SelectionResult> best;

    for (size_t ai = 0; ai < cp.actual_part_ids.size(); ++ai) {
        const catalog::ActualPartId ap_id = cp.actual_part_ids[ai];
        const catalog::ActualPart& ap = catalog.actual_part(ap_id);

        for (size_t vi = 0; vi < ap.quotes.size(); ++vi) {
            const catalog::VendorQuote& q = ap.quotes[vi];
            if (excluded.count(q.vendor_name) != 0) continue;

            for (size_t pi = 0; pi < q.price_breaks.size(); ++pi) {
                const catalog::PriceBreak& pb = q.price_breaks[pi];

                const int order_quantity = std::max(required_quantity, pb.min_quantity);
                if (q.available_quantity < order_quantity) continue;

                SelectionResult cand;
                cand.choice_part = choice_part;
                cand.actual_part = ap_id;
                cand.actual_part_index = ai;
                cand.vendor_quote_index = vi;
                cand.price_break_index = pi;
                cand.vendor_name = q.vendor_name;
                cand.vendor_part_name = q.vendor_part_name;
                cand.order_quantity = order_quantity;
                cand.unit_price = pb.unit_price;
                cand.total_cost = order_quantity * pb.unit_price;

                if (!best || better(cand, *best)) best = std::move(cand);
            }
        }
    }

    return best;
}

std::vector<std::string> available_vendor_names(
    const catalog::PartCatalog& catalog,
    const std::vector<PartDemand>& demands,
    const VendorSet& excluded
) {
    VendorSet names;
    for (const auto& d : demands) {
        const auto& cp = std::get<catalog::ChoicePart>(catalog.part(d.choice_part));
        for (catalog::ActualPartId id : cp.actual_part_ids) {
            for (const auto& q : catalog.actual_part(id).quotes) {
                if (excluded.count(q.vendor_name) == 0) names.insert(q.vendor_name);
            }
        }
    }
    return std::vector<std::string>(names.begin(), names.end());
}

}  // namespace order
