#include "order/OrderArtifact.hpp"

#include "quotes/QuoteUtil.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace order {

static nlohmann::json selection_to_json(const SelectionResult& s, const catalog::PartCatalog* catalog) {
    nlohmann::json j;

    if (catalog) {
        const auto& key = catalog->actual_part(s.actual_part).key;
        j["manufacturer_name"] = key.manufacturer_name;
        j["manufacturer_part_name"] = key.manufacturer_part_name;
    }
    j["vendor_name"] = s.vendor_name;
    j["vendor_part_name"] = s.vendor_part_name;
    j["price_break_index"] = s.price_break_index;
    j["order_quantity"] = s.order_quantity;
    j["unit_price"] = s.unit_price;
    j["total_cost"] = s.total_cost;

    return j;
}

static nlohmann::json diagnostic_to_json(const catalog::Diagnostic& d) {
    nlohmann::json j = {{"code", d.code}, {"message", d.message}};
    if (!d.part_name.empty()) j["part_name"] = d.part_name;
    return j;
}

static void write_text(const std::filesystem::path& out_path, const std::string& text) {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << text;
}

nlohmann::json OrderArtifact::to_json() const {
    nlohmann::json j;

    j["catalog_path"] = catalog_path;
    j["order_path"] = order_path;

    j["vendor_policy"] = {
        {"shipping_threshold", policy.shipping_threshold},
        {"vendor_minimums", policy.vendor_minimums},
        {"never_exclude_vendor", policy.never_exclude_vendor},
        {"allowed_vendors", policy.allowed_vendors},
        {"excluded_vendors", policy.excluded_vendors},
    };

    nlohmann::json lines = nlohmann::json::array();
    for (const auto& l : result.lines) {
        nlohmann::json lj;
        lj["name"] = l.name;
        lj["required_quantity"] = l.required_quantity;
        if (l.selection) lj["selection"] = selection_to_json(*l.selection, catalog);
        else lj["selection"] = nullptr;
        lines.push_back(lj);
    }
    j["lines"] = lines;

    nlohmann::json vendors = nlohmann::json::array();
    for (const auto& v : result.vendor_subtotals) {
        vendors.push_back({
            {"vendor_name", v.vendor_name},
            {"line_count", v.line_count},
            {"total_cost", v.total_cost}
        });
    }
    j["vendors"] = vendors;

    j["excluded_vendors"] = result.excluded_vendors;
    j["vendor_messages"] = result.vendor_messages;

    j["summary"] = {
        {"total_cost", result.total_cost},
        {"missing_parts_count", result.missing_parts_count},
        {"error_count", result.error_count},
        {"cache_hits", result.cache_hits},
        {"fetches", result.fetches},
        {"fetch_failures", result.fetch_failures},
    };

    nlohmann::json diags = nlohmann::json::array();
    for (const auto& d : result.diagnostics) diags.push_back(diagnostic_to_json(d));
    j["diagnostics"] = diags;

    return j;
}

void OrderArtifact::write_to(const std::filesystem::path& out_path) const {
    write_text(out_path, to_json().dump(2) + "\n");
}

std::string OrderArtifact::vendor_reduction_report() const {
    std::ostringstream oss;
    for (const auto& m : result.vendor_messages) oss << m << "\n";

    oss << "Final selected vendors:\n";
    for (const auto& v : result.vendor_subtotals) {
        oss << "    " << v.vendor_name << " (" << v.line_count << " lines, $"
            << quotes::format_money(v.total_cost) << ")\n";
    }
    oss << "Total price: $" << quotes::format_money(result.total_cost) << "\n";
    return oss.str();
}

void OrderArtifact::write_vendor_reduction_report(const std::filesystem::path& out_path) const {
    write_text(out_path, vendor_reduction_report());
}

}  // namespace order
