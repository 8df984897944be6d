#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "catalog/PartCatalog.hpp"
#include "nlohmann/json.hpp"
#include "order/OrderAggregator.hpp"
#include "order/VendorSetOptimizer.hpp"

namespace order {

struct OrderArtifact {
    std::string catalog_path;
    std::string order_path;

    VendorPolicy policy;
    OrderResult result;

    // needed to name the chosen actual parts
    const catalog::PartCatalog* catalog = nullptr;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;

    // one exclusion message per line, then the vendors still in use
    std::string vendor_reduction_report() const;
    void write_vendor_reduction_report(const std::filesystem::path& out_path) const;
};

}  // namespace order
