#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "catalog/Models.hpp"
#include "catalog/PartCatalog.hpp"
#include "quotes/QuoteProvider.hpp"

namespace fixtures {

inline catalog::VendorQuote make_quote(const std::string& vendor, const std::string& vendor_part,
                                       int stock, std::vector<catalog::PriceBreak> breaks,
                                       std::int64_t fetched_at = 0) {
    catalog::VendorQuote q;
    q.vendor_name = vendor;
    q.vendor_part_name = vendor_part;
    q.available_quantity = stock;
    q.price_breaks = std::move(breaks);
    q.fetched_at = fetched_at;
    return q;
}

inline catalog::ActualPart make_actual(const std::string& manufacturer, const std::string& part_number,
                                       std::vector<catalog::VendorQuote> quotes = {}) {
    catalog::ActualPart ap;
    ap.key.manufacturer_name = manufacturer;
    ap.key.manufacturer_part_name = part_number;
    ap.quotes = std::move(quotes);
    return ap;
}

inline catalog::PartId add_choice(catalog::PartCatalog& catalog, const std::string& name,
                                  std::vector<catalog::ActualPart> actual_parts) {
    catalog::ChoicePartDef def;
    def.name = name;
    def.actual_parts = std::move(actual_parts);
    return catalog.register_choice_part(std::move(def));
}

// Canned answers per actual part; records every call.
class ScriptedQuoteProvider final : public quotes::QuoteProvider {
public:
    std::map<catalog::ActualPartKey, std::vector<catalog::VendorQuote>> responses;
    std::set<catalog::ActualPartKey> failing;
    std::map<catalog::ActualPartKey, int> calls;

    std::vector<catalog::VendorQuote> fetch(const catalog::ActualPart& actual_part) override {
        calls[actual_part.key]++;
        if (failing.count(actual_part.key) != 0) {
            throw std::runtime_error("vendor site unreachable");
        }
        auto it = responses.find(actual_part.key);
        if (it == responses.end()) return {};
        return it->second;
    }

    int total_calls() const {
        int n = 0;
        for (const auto& kv : calls) n += kv.second;
        return n;
    }
};

// Fresh, empty directory under the system temp dir.
inline std::filesystem::path make_temp_dir(const std::string& name) {
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / ("bom_tests_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

}  // namespace fixtures
