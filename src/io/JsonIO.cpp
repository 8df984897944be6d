#include "io/JsonIO.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "io/JsonUtil.hpp"
#include "quotes/QuoteUtil.hpp"

using json = nlohmann::json;

namespace io {

static catalog::Placement parsePlacement(const json& j, const std::string& where) {
    catalog::Placement p;
    if (!j.contains("placement")) return p;

    const json& pj = j.at("placement");
    const std::string pw = where + ".placement";
    require_object(pj, pw);

    p.rotation    = optional_double(pj, "rotation", 0.0, pw);
    p.pick_dx     = optional_double(pj, "pick_dx", 0.0, pw);
    p.pick_dy     = optional_double(pj, "pick_dy", 0.0, pw);
    p.part_height = optional_double(pj, "part_height", 0.0, pw);
    p.feeder_name = optional_string(pj, "feeder_name", pw);
    return p;
}

static catalog::VendorQuote parseQuote(const json& j, const catalog::ActualPartKey& key, const std::string& where) {
    require_object(j, where);

    catalog::VendorQuote q;
    q.actual_part_key = key;
    q.vendor_name = require_string(j, "vendor_name", where);
    q.vendor_part_name = require_string(j, "vendor_part_name", where);
    q.available_quantity = optional_count(j, "available_quantity", 0, where);
    q.price_breaks = quotes::parse_price_breaks(require_string(j, "price_breaks", where));

    quotes::normalize_quote(q);
    return q;
}

static catalog::ActualPart parseActualPart(const json& j, const std::string& where) {
    require_object(j, where);

    catalog::ActualPart ap;
    ap.key.manufacturer_name = require_string(j, "manufacturer_name", where);
    ap.key.manufacturer_part_name = require_string(j, "manufacturer_part_name", where);

    if (j.contains("quotes")) {
        const json& qs = j.at("quotes");
        require_array(qs, where + ".quotes");
        for (size_t i = 0; i < qs.size(); ++i) {
            std::ostringstream oss;
            oss << where << ".quotes[" << i << "]";
            ap.quotes.push_back(parseQuote(qs.at(i), ap.key, oss.str()));
        }
    }
    return ap;
}

static catalog::ChoicePartDef parseChoicePart(const json& j, const std::string& where) {
    require_object(j, where);

    catalog::ChoicePartDef def;
    def.name        = require_string(j, "name", where);
    def.footprint   = optional_string(j, "footprint", where);
    def.description = optional_string(j, "description", where);
    def.placement   = parsePlacement(j, where);

    if (!j.contains("actual_parts")) {
        throw std::runtime_error(where + " missing required field: actual_parts");
    }
    const json& aps = j.at("actual_parts");
    require_array(aps, where + ".actual_parts");
    for (size_t i = 0; i < aps.size(); ++i) {
        std::ostringstream oss;
        oss << where << ".actual_parts[" << i << "]";
        def.actual_parts.push_back(parseActualPart(aps.at(i), oss.str()));
    }
    return def;
}

static catalog::AliasPartDef parseAliasPart(const json& j, const std::string& where) {
    require_object(j, where);

    catalog::AliasPartDef def;
    def.name      = require_string(j, "name", where);
    def.footprint = optional_string(j, "footprint", where);
    def.placement = parsePlacement(j, where);

    if (!j.contains("targets")) {
        throw std::runtime_error(where + " missing required field: targets");
    }
    const json& ts = j.at("targets");
    require_array(ts, where + ".targets");
    for (size_t i = 0; i < ts.size(); ++i) {
        std::ostringstream oss;
        oss << where << ".targets[" << i << "]";
        const json& tj = ts.at(i);

        catalog::AliasTarget t;
        if (tj.is_string()) {
            t.name = tj.get<std::string>();
        } else {
            require_object(tj, oss.str());
            t.name = require_string(tj, "name", oss.str());
            t.count = optional_int(tj, "count", 1, oss.str());
        }
        def.targets.push_back(t);
    }
    return def;
}

static catalog::FractionalPartDef parseFractionalPart(const json& j, const std::string& where) {
    require_object(j, where);

    catalog::FractionalPartDef def;
    def.name             = require_string(j, "name", where);
    def.choice_part_name = require_string(j, "choice_part_name", where);
    def.footprint        = optional_string(j, "footprint", where);
    def.description      = optional_string(j, "description", where);
    def.numerator        = optional_int(j, "numerator", 1, where);
    def.denominator      = optional_int(j, "denominator", 1, where);
    return def;
}

int load_catalog(const std::string& path, catalog::PartCatalog& catalog) {
    const json j = read_json_file(path, "catalog");

    int count = 0;

    if (j.contains("choice_parts")) {
        const json& arr = j.at("choice_parts");
        require_array(arr, "root.choice_parts");
        for (size_t i = 0; i < arr.size(); ++i) {
            std::ostringstream oss;
            oss << "root.choice_parts[" << i << "]";
            catalog.register_choice_part(parseChoicePart(arr.at(i), oss.str()));
            ++count;
        }
    }

    if (j.contains("alias_parts")) {
        const json& arr = j.at("alias_parts");
        require_array(arr, "root.alias_parts");
        for (size_t i = 0; i < arr.size(); ++i) {
            std::ostringstream oss;
            oss << "root.alias_parts[" << i << "]";
            catalog.register_alias_part(parseAliasPart(arr.at(i), oss.str()));
            ++count;
        }
    }

    if (j.contains("fractional_parts")) {
        const json& arr = j.at("fractional_parts");
        require_array(arr, "root.fractional_parts");
        for (size_t i = 0; i < arr.size(); ++i) {
            std::ostringstream oss;
            oss << "root.fractional_parts[" << i << "]";
            catalog.register_fractional_part(parseFractionalPart(arr.at(i), oss.str()));
            ++count;
        }
    }

    return count;
}

static BoardEntry parseBoard(const json& j, const std::string& where) {
    require_object(j, where);

    BoardEntry b;
    b.name     = require_string(j, "name", where);
    b.revision = optional_string(j, "revision", where);
    b.count    = optional_count(j, "count", 1, where);

    if (!j.contains("parts")) {
        throw std::runtime_error(where + " missing required field: parts");
    }
    const json& parts = j.at("parts");
    require_array(parts, where + ".parts");
    for (size_t i = 0; i < parts.size(); ++i) {
        std::ostringstream oss;
        oss << where << ".parts[" << i << "]";
        const std::string pw = oss.str();
        const json& pj = parts.at(i);
        require_object(pj, pw);

        BoardPartEntry bp;
        bp.reference      = require_string(pj, "reference", pw);
        bp.schematic_name = require_string(pj, "name", pw);
        bp.comment        = optional_string(pj, "comment", pw);
        b.parts.push_back(bp);
    }
    return b;
}

OrderFile load_order(const std::string& path) {
    const json j = read_json_file(path, "order");

    OrderFile of;

    if (!j.contains("boards")) {
        throw std::runtime_error("root missing required field: boards");
    }
    const json& boards = j.at("boards");
    require_array(boards, "root.boards");
    for (size_t i = 0; i < boards.size(); ++i) {
        std::ostringstream oss;
        oss << "root.boards[" << i << "]";
        of.boards.push_back(parseBoard(boards.at(i), oss.str()));
    }

    of.excluded_vendors = optional_string_array(j, "excluded_vendors", "root");
    return of;
}

void populate_aggregator(const OrderFile& file, order::OrderAggregator& aggregator) {
    for (const auto& b : file.boards) {
        const order::BoardId id = aggregator.add_board(b.name, b.revision, b.count);
        for (const auto& bp : b.parts) {
            aggregator.add_board_part(id, bp.reference, bp.schematic_name, bp.comment);
        }
    }
    for (const auto& v : file.excluded_vendors) aggregator.exclude_vendor(v);
}

order::VendorPolicy load_vendor_policy(const std::string& path, order::VendorPolicy base) {
    const json j = read_json_file(path, "vendor policy");

    order::VendorPolicy p = std::move(base);

    p.shipping_threshold = optional_double(j, "shipping_threshold", p.shipping_threshold, "root");
    p.first_auto_priority = optional_int(j, "first_auto_priority", p.first_auto_priority, "root");
    if (j.contains("never_exclude_vendor")) {
        p.never_exclude_vendor = require_string(j, "never_exclude_vendor", "root");
    }

    if (j.contains("vendor_minimums")) {
        const json& m = j.at("vendor_minimums");
        require_object(m, "root.vendor_minimums");
        p.vendor_minimums.clear();
        for (auto it = m.begin(); it != m.end(); ++it) {
            p.vendor_minimums[it.key()] = require_number(m, it.key().c_str(), "root.vendor_minimums");
        }
    }

    if (j.contains("vendor_priorities")) {
        const json& m = j.at("vendor_priorities");
        require_object(m, "root.vendor_priorities");
        p.vendor_priorities.clear();
        for (auto it = m.begin(); it != m.end(); ++it) {
            p.vendor_priorities[it.key()] = require_int(m, it.key().c_str(), "root.vendor_priorities");
        }
    }

    if (j.contains("allowed_vendors")) {
        const auto v = optional_string_array(j, "allowed_vendors", "root");
        p.allowed_vendors = order::VendorSet(v.begin(), v.end());
    }
    if (j.contains("excluded_vendors")) {
        const auto v = optional_string_array(j, "excluded_vendors", "root");
        p.excluded_vendors = order::VendorSet(v.begin(), v.end());
    }

    return p;
}

quotes::ExchangeRates load_exchange_rates(const std::string& path) {
    const json j = read_json_file(path, "exchange rate");

    quotes::ExchangeRates rates;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_number() || it.value().get<double>() <= 0.0) {
            throw std::runtime_error("root." + it.key() + " must be a positive number");
        }
        rates.to_usd[it.key()] = it.value().get<double>();
    }
    return rates;
}

}  // namespace io
