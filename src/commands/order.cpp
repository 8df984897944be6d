#include "commands/order.hpp"

#include "catalog/PartCatalog.hpp"
#include "io/JsonIO.hpp"
#include "order/OrderAggregator.hpp"
#include "order/OrderArtifact.hpp"
#include "order/VendorSetOptimizer.hpp"
#include "quotes/MockQuoteProvider.hpp"
#include "quotes/QuoteCache.hpp"
#include "quotes/QuoteProvider.hpp"
#include "quotes/QuoteUtil.hpp"

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid integer for " + key + ": " + s);
    }
}

static double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        return std::stod(s);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid number for " + key + ": " + s);
    }
}

int cmd_order(int argc, char** argv) {
    try {
        const std::string catalog_path = get_arg(argc, argv, "--catalog", "");
        const std::string order_path = get_arg(argc, argv, "--order", "");
        const std::string policy_path = get_arg(argc, argv, "--policy", "");
        const std::string cache_path = get_arg(argc, argv, "--cache", "out/quote_cache.json");
        const std::string quotes_mock = get_arg(argc, argv, "--quotes_mock", "");
        const std::string rates_path = get_arg(argc, argv, "--rates", "");
        const fs::path outdir = get_arg(argc, argv, "--outdir", "out");
        const bool no_cache = has_flag(argc, argv, "--no_cache");

        if (catalog_path.empty()) throw std::runtime_error("--catalog is required");
        if (order_path.empty()) throw std::runtime_error("--order is required");

        order::VendorPolicy policy;
        if (!policy_path.empty()) policy = io::load_vendor_policy(policy_path, policy);
        policy.shipping_threshold = get_arg_double(argc, argv, "--shipping_threshold", policy.shipping_threshold);
        policy.never_exclude_vendor = get_arg(argc, argv, "--never_exclude", policy.never_exclude_vendor);

        quotes::QuoteCacheConfig cache_cfg;
        if (!no_cache) cache_cfg.path = cache_path;
        const int ttl_hours = get_arg_int(argc, argv, "--cache_ttl_hours", 48);
        if (ttl_hours < 0) throw std::runtime_error("--cache_ttl_hours must not be negative");
        cache_cfg.ttl_seconds = static_cast<std::int64_t>(ttl_hours) * 60 * 60;

        quotes::QuoteCache cache(cache_cfg);
        cache.load(quotes::epoch_seconds_now());

        std::unique_ptr<quotes::QuoteProvider> provider;
        if (!quotes_mock.empty()) {
            quotes::ExchangeRates rates;
            if (!rates_path.empty()) rates = io::load_exchange_rates(rates_path);
            provider = std::make_unique<quotes::MockQuoteProvider>(quotes_mock, rates);
        } else {
            provider = std::make_unique<quotes::NullQuoteProvider>();
        }

        catalog::PartCatalog catalog;
        const int part_count = io::load_catalog(catalog_path, catalog);

        const io::OrderFile order_file = io::load_order(order_path);

        order::OrderAggregator aggregator(catalog, cache, *provider, policy);
        io::populate_aggregator(order_file, aggregator);

        const order::OrderResult res = aggregator.process();

        order::OrderArtifact artifact;
        artifact.catalog_path = catalog_path;
        artifact.order_path = order_path;
        artifact.policy = policy;
        artifact.result = res;
        artifact.catalog = &catalog;

        const fs::path order_json = outdir / "order.json";
        const fs::path report_path = outdir / "vendor_reduction_report.txt";
        artifact.write_to(order_json);
        artifact.write_vendor_reduction_report(report_path);

        std::cout << std::fixed << std::setprecision(2);
        std::cout << "CATALOG: " << catalog_path << " (" << part_count << " parts)\n";
        std::cout << "ORDER: " << order_path << " (" << aggregator.board_count() << " boards, "
                  << aggregator.board_part_count() << " board parts)\n";
        std::cout << "CACHE: " << (cache_cfg.path.empty() ? "(memory)" : cache_cfg.path) << "\n";
        std::cout << "QUOTES: " << (quotes_mock.empty() ? "(none)" : quotes_mock) << "\n";
        std::cout << "OUT_ORDER: " << order_json.string() << "\n";
        std::cout << "OUT_REPORT: " << report_path.string() << "\n";
        std::cout << "LINES: " << res.lines.size() << "\n";
        std::cout << "MISSING_PARTS: " << res.missing_parts_count << "\n";
        std::cout << "ERRORS: " << res.error_count << "\n";
        std::cout << "CACHE_HITS: " << res.cache_hits << "\n";
        std::cout << "FETCHES: " << res.fetches << "\n";
        std::cout << "FETCH_FAILURES: " << res.fetch_failures << "\n";
        std::cout << "EXCLUDED_VENDORS: " << res.excluded_vendors.size() << "\n";
        for (const auto& v : res.vendor_subtotals) {
            std::cout << "VENDOR: " << v.vendor_name << " " << v.line_count << " lines $" << v.total_cost << "\n";
        }
        std::cout << "TOTAL_COST: $" << res.total_cost << "\n";

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "order failed: " << e.what() << "\n";
        return 1;
    }
}
