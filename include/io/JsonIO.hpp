#pragma once

#include <string>
#include <vector>

#include "catalog/PartCatalog.hpp"
#include "order/OrderAggregator.hpp"
#include "order/VendorSetOptimizer.hpp"
#include "quotes/MockQuoteProvider.hpp"

namespace io {

// Registers every part in a catalog file and returns how many were read.
//   {"choice_parts": [{"name": "10K;1608", "footprint": "...", "description": "...",
//                      "placement": {"rotation": 0, "pick_dx": 0, "pick_dy": 0,
//                                    "part_height": 0, "feeder_name": ""},
//                      "actual_parts": [{"manufacturer_name": "...", "manufacturer_part_name": "...",
//                                        "quotes": [{"vendor_name": "...", "vendor_part_name": "...",
//                                                    "available_quantity": 100,
//                                                    "price_breaks": "1/0.10 10/0.05"}]}]}],
//    "alias_parts": [{"name": "...", "targets": ["A;B", {"count": 2, "name": "C;D"}]}],
//    "fractional_parts": [{"name": "...", "choice_part_name": "...",
//                          "numerator": 1, "denominator": 40}]}
// Throws std::runtime_error on a malformed document and std::invalid_argument
// on malformed part names or price text.
int load_catalog(const std::string& path, catalog::PartCatalog& catalog);

struct BoardPartEntry {
    std::string reference;
    std::string schematic_name;
    std::string comment;
};

struct BoardEntry {
    std::string name;
    std::string revision;
    int count = 1;
    std::vector<BoardPartEntry> parts;
};

struct OrderFile {
    std::vector<BoardEntry> boards;
    std::vector<std::string> excluded_vendors;
};

//   {"boards": [{"name": "...", "revision": "A", "count": 2,
//                "parts": [{"reference": "R1", "name": "10K;1608", "comment": ""}]}],
//    "excluded_vendors": ["..."]}
OrderFile load_order(const std::string& path);

// boards, board parts and pre-excluded vendors
void populate_aggregator(const OrderFile& file, order::OrderAggregator& aggregator);

// Any field present in the file replaces the one in base.
//   {"shipping_threshold": 15.0, "vendor_minimums": {"Verical": 100.0},
//    "vendor_priorities": {"Mouser": 1003}, "first_auto_priority": 10,
//    "never_exclude_vendor": "Digi-Key", "allowed_vendors": [], "excluded_vendors": []}
order::VendorPolicy load_vendor_policy(const std::string& path, order::VendorPolicy base = {});

// {"USD": 1.0, "EUR": 1.08}; USD is always present
quotes::ExchangeRates load_exchange_rates(const std::string& path);

}  // namespace io
