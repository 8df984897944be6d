#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "catalog/Models.hpp"

namespace quotes {

// drop newlines, strip distributor-listing suffixes (" •", " ECIA (NEDA) Member", " CEDA member"), trim
std::string normalize_vendor_name(const std::string& name);

// normalize vendor name + sort price breaks by (min_quantity, unit_price)
void normalize_quote(catalog::VendorQuote& quote);

// "1/0.10 10/0.05" => {{1, 0.10}, {10, 0.05}}; throws std::invalid_argument on a bad pair
std::vector<catalog::PriceBreak> parse_price_breaks(const std::string& text);

// "<manufacturer>__<part number>", other bytes escaped as %XX; distinct keys give distinct names
std::string file_safe_name(const catalog::ActualPartKey& key);

// 12.5 => "12.50"
std::string format_money(double amount);

// wall clock, seconds since the epoch
std::int64_t epoch_seconds_now();

}
