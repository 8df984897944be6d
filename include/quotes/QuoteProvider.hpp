#pragma once
#include <string>
#include <vector>

#include "catalog/Models.hpp"

namespace quotes {

// Source of current pricing and availability for one manufacturer part
// (distributor scraping, a web API, canned files...). Failures are reported by
// throwing; the caller treats them as "no quotes". Must be safe to retry.
class QuoteProvider {
public:
    virtual ~QuoteProvider() = default;

    virtual std::vector<catalog::VendorQuote> fetch(const catalog::ActualPart& actual_part) = 0;
};

class NullQuoteProvider final : public QuoteProvider {
public:
    std::vector<catalog::VendorQuote> fetch(const catalog::ActualPart&) override { return {}; }
};

} // namespace quotes
