#pragma once

#include "quotes/QuoteProvider.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace quotes {

// Fixed exchange-rate snapshot: units of USD per unit of currency.
struct ExchangeRates {
    std::map<std::string, double> to_usd = {{"USD", 1.0}};

    // throws std::runtime_error for an unknown currency
    double rate(const std::string& currency) const;
};

// Serves canned quotes from <root>/<file_safe_name(key)>.json:
//   {"currency": "EUR",
//    "quotes": [{"vendor_name": "...", "vendor_part_name": "...",
//                "available_quantity": 100,
//                "price_breaks": [{"min_quantity": 1, "unit_price": 0.1}]}]}
// A missing file means no quotes; a malformed one throws.
class MockQuoteProvider final : public QuoteProvider {
    std::filesystem::path root_;
    ExchangeRates rates_;
    std::int64_t now_ = 0;

public:
    explicit MockQuoteProvider(const std::string& root_dir, ExchangeRates rates = {});

    std::vector<catalog::VendorQuote> fetch(const catalog::ActualPart& actual_part) override;

    // fetched_at stamped on returned quotes; 0 => wall clock
    void set_now(std::int64_t now) { now_ = now; }

    std::filesystem::path path_for(const catalog::ActualPartKey& key) const;
};

} // namespace quotes
