#include "quotes/QuoteCache.hpp"

#include "io/JsonUtil.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace quotes {

static json quote_to_json(const catalog::VendorQuote& q) {
    json breaks = json::array();
    for (const auto& pb : q.price_breaks) {
        breaks.push_back({{"min_quantity", pb.min_quantity}, {"unit_price", pb.unit_price}});
    }
    return {
        {"vendor_name", q.vendor_name},
        {"vendor_part_name", q.vendor_part_name},
        {"available_quantity", q.available_quantity},
        {"fetched_at", q.fetched_at},
        {"price_breaks", breaks},
    };
}

static catalog::VendorQuote parse_quote(const json& j, const catalog::ActualPartKey& key,
                                        const std::string& where) {
    catalog::VendorQuote q;
    q.actual_part_key = key;
    io::require_object(j, where);
    q.vendor_name = io::require_string(j, "vendor_name", where);
    q.vendor_part_name = io::require_string(j, "vendor_part_name", where);
    q.available_quantity = io::require_count(j, "available_quantity", where);
    q.fetched_at = io::require_int64(j, "fetched_at", where);

    const json& breaks = io::require_array_field(j, "price_breaks", where);
    for (size_t i = 0; i < breaks.size(); ++i) {
        std::ostringstream oss;
        oss << where << ".price_breaks[" << i << "]";
        const json& pbj = breaks.at(i);

        catalog::PriceBreak pb;
        pb.min_quantity = io::require_count(pbj, "min_quantity", oss.str());
        pb.unit_price = io::require_number(pbj, "unit_price", oss.str());
        q.price_breaks.push_back(pb);
    }
    return q;
}

json QuoteCache::to_json() const {
    json entries = json::array();
    for (const auto& kv : m_entries) {
        json quotes = json::array();
        for (const auto& q : kv.second) quotes.push_back(quote_to_json(q));

        entries.push_back({
            {"manufacturer_name", kv.first.manufacturer_name},
            {"manufacturer_part_name", kv.first.manufacturer_part_name},
            {"quotes", quotes},
        });
    }

    json j;
    j["version"] = kVersion;
    j["entries"] = entries;
    return j;
}

void QuoteCache::from_json(const json& j) {
    if (!j.is_object()) throw std::runtime_error("quote cache root must be an object");

    const std::int64_t version = io::require_int64(j, "version", "root");
    if (version != kVersion) {
        throw std::runtime_error("unsupported quote cache version " + std::to_string(version));
    }

    std::map<catalog::ActualPartKey, std::vector<catalog::VendorQuote>> entries;

    const json& arr = io::require_array_field(j, "entries", "root");
    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream oss;
        oss << "root.entries[" << i << "]";
        const std::string where = oss.str();
        const json& ej = arr.at(i);

        catalog::ActualPartKey key;
        key.manufacturer_name = io::require_string(ej, "manufacturer_name", where);
        key.manufacturer_part_name = io::require_string(ej, "manufacturer_part_name", where);

        const json& quotes = io::require_array_field(ej, "quotes", where);
        auto& list = entries[key];
        for (size_t k = 0; k < quotes.size(); ++k) {
            std::ostringstream qss;
            qss << where << ".quotes[" << k << "]";
            list.push_back(parse_quote(quotes.at(k), key, qss.str()));
        }
    }

    m_entries = std::move(entries);
}

void QuoteCache::load(std::int64_t now) {
    m_entries.clear();
    if (m_cfg.path.empty()) return;

    std::ifstream in(m_cfg.path);
    if (!in) return;

    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("failed to parse quote cache " + m_cfg.path + ": " + e.what());
    }

    from_json(j);
    evict_stale(now);
}

void QuoteCache::save() const {
    if (m_cfg.path.empty()) return;

    const fs::path out_path(m_cfg.path);
    if (out_path.has_parent_path()) fs::create_directories(out_path.parent_path());

    const fs::path tmp_path = out_path.string() + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to open output file: " + tmp_path.string());
        out << to_json().dump(2) << "\n";
        if (!out) throw std::runtime_error("Failed to write quote cache: " + tmp_path.string());
    }
    fs::rename(tmp_path, out_path);
}

std::optional<std::vector<catalog::VendorQuote>> QuoteCache::get(const catalog::ActualPartKey& key) const {
    auto it = m_entries.find(key);
    if (it == m_entries.end()) return std::nullopt;
    return it->second;
}

void QuoteCache::put(const catalog::ActualPartKey& key, std::vector<catalog::VendorQuote> quotes) {
    if (quotes.empty()) {
        m_entries.erase(key);
        return;
    }
    for (auto& q : quotes) q.actual_part_key = key;
    m_entries[key] = std::move(quotes);
}

int QuoteCache::evict_stale(std::int64_t now) {
    const std::int64_t oldest = now - m_cfg.ttl_seconds;

    int dropped = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        auto& quotes = it->second;
        const size_t before = quotes.size();
        quotes.erase(std::remove_if(quotes.begin(), quotes.end(),
                                    [&](const catalog::VendorQuote& q) { return q.fetched_at < oldest; }),
                     quotes.end());
        dropped += static_cast<int>(before - quotes.size());

        if (quotes.empty()) it = m_entries.erase(it);
        else ++it;
    }
    return dropped;
}

std::vector<catalog::ActualPartKey> QuoteCache::keys() const {
    std::vector<catalog::ActualPartKey> out;
    out.reserve(m_entries.size());
    for (const auto& kv : m_entries) out.push_back(kv.first);
    return out;
}

}  // namespace quotes
