#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "catalog/Models.hpp"
#include "nlohmann/json.hpp"

namespace quotes {

struct QuoteCacheConfig {
    std::string path;                               // empty => in-memory only
    std::int64_t ttl_seconds = 2 * 24 * 60 * 60;    // quotes older than this are dropped on load
};

// Persistent ActualPart key => vendor quotes. JSON on disk:
//   {"version": 1, "entries": [{"manufacturer_name", "manufacturer_part_name",
//     "quotes": [{"vendor_name", "vendor_part_name", "available_quantity",
//                 "fetched_at", "price_breaks": [{"min_quantity", "unit_price"}]}]}]}
class QuoteCache {
public:
    static constexpr int kVersion = 1;

    QuoteCache() = default;
    explicit QuoteCache(QuoteCacheConfig cfg) : m_cfg(std::move(cfg)) {}

    // Replace contents with the file at cfg.path (missing file => empty cache)
    // and evict stale quotes. Throws std::runtime_error on a malformed file.
    void load(std::int64_t now);

    // Persist every entry to cfg.path; no-op for an in-memory cache.
    void save() const;

    std::optional<std::vector<catalog::VendorQuote>> get(const catalog::ActualPartKey& key) const;

    // An empty list removes the key.
    void put(const catalog::ActualPartKey& key, std::vector<catalog::VendorQuote> quotes);

    // Drop quotes with fetched_at < now - ttl and keys left empty. Returns quotes dropped.
    int evict_stale(std::int64_t now);

    size_t size() const { return m_entries.size(); }
    std::vector<catalog::ActualPartKey> keys() const;
    const QuoteCacheConfig& config() const { return m_cfg; }

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);

private:
    QuoteCacheConfig m_cfg;
    std::map<catalog::ActualPartKey, std::vector<catalog::VendorQuote>> m_entries;
};

}  // namespace quotes
