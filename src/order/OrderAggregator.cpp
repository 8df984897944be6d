#include "order/OrderAggregator.hpp"

#include "catalog/PartResolver.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

namespace order {

static const char* kSource = "OrderAggregator";

OrderAggregator::OrderAggregator(catalog::PartCatalog& catalog,
                                 quotes::QuoteCache& cache,
                                 quotes::QuoteProvider& provider,
                                 VendorPolicy policy)
    : catalog_(catalog), cache_(cache), provider_(provider), policy_(std::move(policy)) {}

BoardId OrderAggregator::add_board(const std::string& name, const std::string& revision, int count) {
    if (count < 0) throw std::invalid_argument("board '" + name + "' has a negative count");

    Board b;
    b.name = name;
    b.revision = revision;
    b.count = count;
    boards_.push_back(std::move(b));
    return boards_.size() - 1;
}

BoardPartId OrderAggregator::add_board_part(BoardId board, const std::string& reference,
                                            const std::string& schematic_name, const std::string& comment) {
    if (board >= boards_.size()) throw std::out_of_range("unknown board id " + std::to_string(board));

    BoardPart bp;
    bp.board = board;
    bp.reference = reference;
    bp.schematic_name = schematic_name;
    bp.comment = comment;
    board_parts_.push_back(std::move(bp));

    const BoardPartId id = board_parts_.size() - 1;
    boards_[board].board_parts.push_back(id);
    return id;
}

void OrderAggregator::fetch_quotes(catalog::ActualPartId id, OrderResult& res, catalog::DiagnosticLog& diag) {
    const catalog::ActualPart& ap = catalog_.actual_part(id);

    if (auto cached = cache_.get(ap.key)) {
        res.cache_hits++;
        catalog_.add_quotes(id, *cached);
        return;
    }

    std::vector<catalog::VendorQuote> fetched;
    try {
        fetched = provider_.fetch(ap);
    } catch (const std::exception& e) {
        res.fetch_failures++;
        diag.warn(kSource, "quote_provider_failure",
                  "quote lookup for " + catalog::to_string(ap.key) + " failed: " + e.what());
        return;
    }
    res.fetches++;

    if (fetched.empty()) return;

    for (auto& q : fetched) q.actual_part_key = ap.key;
    cache_.put(ap.key, fetched);
    cache_.save();
    catalog_.add_quotes(id, fetched);
}

OrderResult OrderAggregator::process() {
    OrderResult res;
    catalog::DiagnosticLog diag;

    catalog_.deduplicate_actual_parts();
    catalog::PartResolver resolver(catalog_);

    // 1) board parts => choice parts
    std::set<catalog::PartId> choices;
    for (BoardPartId i = 0; i < board_parts_.size(); ++i) {
        const BoardPart& bp = board_parts_[i];
        const Board& b = boards_[bp.board];

        const auto id = catalog_.lookup(bp.schematic_name);
        if (!id) {
            res.error_count++;
            diag.warn(kSource, "unresolved_schematic_part",
                      "board '" + b.name + "' part " + bp.reference + ": '" + bp.schematic_name +
                          "' is not in the catalog",
                      bp.schematic_name);
            continue;
        }

        for (catalog::PartId c : resolver.resolve_board_part(i, b.count, *id)) choices.insert(c);
    }
    res.error_count += resolver.unresolved_count();

    // 2) demands in name order
    std::vector<PartDemand> demands;
    demands.reserve(choices.size());
    for (catalog::PartId c : choices) {
        demands.push_back(PartDemand{c, resolver.required_quantity(c)});
    }
    std::sort(demands.begin(), demands.end(), [&](const PartDemand& a, const PartDemand& b) {
        return catalog::part_name(catalog_.part(a.choice_part)).full <
               catalog::part_name(catalog_.part(b.choice_part)).full;
    });

    // 3) quotes, at most one lookup per actual part
    std::set<catalog::ActualPartId> looked_up;
    for (const auto& d : demands) {
        const auto& cp = std::get<catalog::ChoicePart>(catalog_.part(d.choice_part));
        for (catalog::ActualPartId ap : cp.actual_part_ids) {
            if (!looked_up.insert(ap).second) continue;
            fetch_quotes(ap, res, diag);
        }
    }

    // 4) vendor set
    VendorSetOptimizer optimizer(catalog_, policy_);
    VendorReduction reduction = optimizer.optimize(demands, excluded_);
    res.excluded_vendors = std::move(reduction.excluded);
    res.vendor_messages = std::move(reduction.messages);

    // 5) final selection
    std::map<std::string, VendorSubtotal> subtotals;
    for (const auto& d : demands) {
        OrderLine line;
        line.choice_part = d.choice_part;
        line.name = catalog::part_name(catalog_.part(d.choice_part)).full;
        line.required_quantity = d.required_quantity;
        line.selection = select_choice_part(catalog_, d.choice_part, d.required_quantity, res.excluded_vendors);

        if (line.selection) {
            res.total_cost += line.selection->total_cost;
            auto& st = subtotals[line.selection->vendor_name];
            st.vendor_name = line.selection->vendor_name;
            st.line_count++;
            st.total_cost += line.selection->total_cost;
        } else {
            res.missing_parts_count++;
            diag.warn(kSource, "unfulfillable",
                      "no vendor can supply " + std::to_string(d.required_quantity) + " of '" + line.name + "'",
                      line.name);
        }
        res.lines.push_back(std::move(line));
    }
    for (auto& kv : subtotals) res.vendor_subtotals.push_back(std::move(kv.second));

    const auto& cat_entries = catalog_.diagnostics().entries;
    res.diagnostics.insert(res.diagnostics.end(), cat_entries.begin(), cat_entries.end());
    const auto& res_entries = resolver.diagnostics().entries;
    res.diagnostics.insert(res.diagnostics.end(), res_entries.begin(), res_entries.end());
    res.diagnostics.insert(res.diagnostics.end(), diag.entries.begin(), diag.entries.end());

    return res;
}

}  // namespace order
