#include "quotes/MockQuoteProvider.hpp"
#include "quotes/QuoteUtil.hpp"
#include "io/JsonUtil.hpp"
#include "nlohmann/json.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace quotes {

double ExchangeRates::rate(const std::string& currency) const {
    auto it = to_usd.find(currency);
    if (it == to_usd.end()) {
        throw std::runtime_error("unrecognized currency '" + currency + "'");
    }
    return it->second;
}

MockQuoteProvider::MockQuoteProvider(const std::string& root_dir, ExchangeRates rates)
    : root_(root_dir), rates_(std::move(rates)) {}

fs::path MockQuoteProvider::path_for(const catalog::ActualPartKey& key) const {
    return root_ / (file_safe_name(key) + ".json");
}

std::vector<catalog::VendorQuote> MockQuoteProvider::fetch(const catalog::ActualPart& actual_part) {
    std::vector<catalog::VendorQuote> out;

    const fs::path p = path_for(actual_part.key);
    std::ifstream f(p);
    if (!f) return out;

    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("failed to parse " + p.string() + ": " + e.what());
    }

    if (!j.is_object() || !j.contains("quotes") || !j["quotes"].is_array()) {
        throw std::runtime_error(p.string() + ": expected an object with a \"quotes\" array");
    }

    const double rate = rates_.rate(j.value("currency", std::string("USD")));
    const std::int64_t stamp = (now_ != 0) ? now_ : epoch_seconds_now();

    const json& arr = j["quotes"];
    for (size_t i = 0; i < arr.size(); ++i) {
        const json& qj = arr.at(i);
        if (!qj.is_object()) continue;

        std::ostringstream oss;
        oss << p.string() << ": quotes[" << i << "]";
        const std::string where = oss.str();

        catalog::VendorQuote q;
        q.actual_part_key = actual_part.key;
        q.vendor_name = qj.value("vendor_name", "");
        q.vendor_part_name = qj.value("vendor_part_name", "");
        q.available_quantity = io::optional_count(qj, "available_quantity", 0, where);
        q.fetched_at = stamp;

        if (qj.contains("price_breaks") && qj["price_breaks"].is_array()) {
            const json& breaks = qj["price_breaks"];
            for (size_t k = 0; k < breaks.size(); ++k) {
                const json& pbj = breaks.at(k);
                if (!pbj.is_object()) continue;

                std::ostringstream pss;
                pss << where << ".price_breaks[" << k << "]";

                catalog::PriceBreak pb;
                pb.min_quantity = io::optional_count(pbj, "min_quantity", 0, pss.str());
                pb.unit_price = io::optional_double(pbj, "unit_price", 0.0, pss.str()) * rate;
                q.price_breaks.push_back(pb);
            }
        }

        normalize_quote(q);
        if (q.vendor_name.empty() || q.price_breaks.empty()) continue;

        out.push_back(std::move(q));
    }

    return out;
}

} // namespace quotes
