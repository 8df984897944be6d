#pragma once

#include <optional>
#include <string>
#include <vector>

#include "catalog/Diagnostic.hpp"
#include "catalog/PartCatalog.hpp"
#include "order/ChoicePartSelector.hpp"
#include "order/VendorSetOptimizer.hpp"
#include "quotes/QuoteCache.hpp"
#include "quotes/QuoteProvider.hpp"

namespace order {

using BoardId = size_t;
using BoardPartId = size_t;

struct Board {
    std::string name;
    std::string revision;
    int count = 1;                         // boards to build
    std::vector<BoardPartId> board_parts;
};

struct BoardPart {
    BoardId board = 0;
    std::string reference;       // "R123"
    std::string schematic_name;  // "10K;1608"
    std::string comment;

    bool install() const { return comment != "DNI"; }
};

struct OrderLine {
    catalog::PartId choice_part = 0;
    std::string name;
    int required_quantity = 0;
    std::optional<SelectionResult> selection;  // empty => unfulfillable
};

struct VendorSubtotal {
    std::string vendor_name;
    int line_count = 0;
    double total_cost = 0.0;
};

struct OrderResult {
    std::vector<OrderLine> lines;                 // one per choice part, sorted by name
    VendorSet excluded_vendors;
    std::vector<std::string> vendor_messages;
    std::vector<VendorSubtotal> vendor_subtotals; // sorted by vendor name

    double total_cost = 0.0;
    int missing_parts_count = 0;
    int error_count = 0;                          // unresolved schematic parts

    int cache_hits = 0;
    int fetches = 0;
    int fetch_failures = 0;

    std::vector<catalog::Diagnostic> diagnostics;
};

// Top-level run: boards => choice parts => quotes => vendor set => selections.
// The catalog gains fetched quotes; the cache is written through after every
// successful fetch.
class OrderAggregator {
public:
    OrderAggregator(catalog::PartCatalog& catalog,
                    quotes::QuoteCache& cache,
                    quotes::QuoteProvider& provider,
                    VendorPolicy policy = {});

    // throws std::invalid_argument for count < 0
    BoardId add_board(const std::string& name, const std::string& revision, int count);

    BoardPartId add_board_part(BoardId board, const std::string& reference,
                               const std::string& schematic_name, const std::string& comment = "");

    // excluded before the vendor passes run
    void exclude_vendor(const std::string& vendor_name) { excluded_.insert(vendor_name); }

    // Fatal errors (FractionalDenominatorError, alias cycles, cache write
    // failures) propagate; everything else lands in the result counters.
    OrderResult process();

    const Board& board(BoardId id) const { return boards_.at(id); }
    size_t board_count() const { return boards_.size(); }
    const BoardPart& board_part(BoardPartId id) const { return board_parts_.at(id); }
    size_t board_part_count() const { return board_parts_.size(); }

private:
    void fetch_quotes(catalog::ActualPartId id, OrderResult& res, catalog::DiagnosticLog& diag);

    catalog::PartCatalog& catalog_;
    quotes::QuoteCache& cache_;
    quotes::QuoteProvider& provider_;
    VendorPolicy policy_;

    std::vector<Board> boards_;
    std::vector<BoardPart> board_parts_;
    VendorSet excluded_;
};

}  // namespace order
