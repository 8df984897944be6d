#include "commands/CacheDump.hpp"
#include "quotes/QuoteCache.hpp"
#include "quotes/QuoteUtil.hpp"

#include <cstdint>
#include <iostream>
#include <limits>

static void printBreaks(const std::vector<catalog::PriceBreak>& breaks) {
    std::cout << "      breaks: ";
    for (size_t i = 0; i < breaks.size(); ++i) {
        std::cout << breaks[i].min_quantity << "/" << breaks[i].unit_price;
        if (i + 1 < breaks.size()) std::cout << " ";
    }
    std::cout << "\n";
}

int cacheDump(const std::string& cachePath) {
    quotes::QuoteCacheConfig cfg;
    cfg.path = cachePath;
    // dump shows everything on disk, stale or not
    cfg.ttl_seconds = std::numeric_limits<std::int64_t>::max() / 2;

    quotes::QuoteCache cache(cfg);
    try {
        cache.load(quotes::epoch_seconds_now());
    } catch (const std::exception& e) {
        std::cerr << "[error] failed to load quote cache: " << e.what() << "\n";
        return 1;
    }

    for (const auto& key : cache.keys()) {
        std::cout << "[ActualPart] " << catalog::to_string(key) << "\n";
        const auto quotes = cache.get(key);
        if (!quotes) continue;
        for (const auto& q : *quotes) {
            std::cout << "  - " << q.vendor_name << ": " << q.vendor_part_name
                      << " (stock " << q.available_quantity << ", fetched " << q.fetched_at << ")\n";
            printBreaks(q.price_breaks);
        }
        std::cout << "\n";
    }

    std::cout << "ENTRIES: " << cache.size() << "\n";
    return 0;
}
