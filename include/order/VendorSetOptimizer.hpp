#pragma once

#include <map>
#include <string>
#include <vector>

#include "catalog/PartCatalog.hpp"
#include "order/ChoicePartSelector.hpp"

namespace order {

struct VendorPolicy {
    // savings below this are not worth another shipment
    double shipping_threshold = 15.0;

    std::map<std::string, double> vendor_minimums = {
        {"Verical", 100.0},
        {"Chip1Stop", 100.0},
    };

    // Lower sorts first when trial exclusions tie on (missing, cost).
    // 0-9: vendors with large minimums or trans-oceanic shipping.
    std::map<std::string, int> vendor_priorities = {
        {"Verical", 0},
        {"Chip1Stop", 1},
        {"Farnell element14", 2},
        {"element14 Asia-Pacific", 2},
        {"Heilind Electronics - Asia", 2},
        {"Mouser", 1003},
        {"Digi-Key", 1004},
    };
    int first_auto_priority = 10;

    // never removed by the shipping-cost pass; empty => none
    std::string never_exclude_vendor = "Digi-Key";

    VendorSet allowed_vendors;   // non-empty => every other vendor is excluded
    VendorSet excluded_vendors;  // excluded before any pass runs
};

struct Evaluation {
    int missing_parts = 0;
    double total_cost = 0.0;
};

// Outcome of excluding one more vendor; sorts so the most attractive
// exclusion comes first.
struct TrialExclusion {
    int missing_parts = 0;
    double total_cost = 0.0;
    int vendor_priority = 0;
    std::string vendor_name;
};

bool operator<(const TrialExclusion& a, const TrialExclusion& b);

struct VendorReduction {
    VendorSet excluded;
    std::vector<std::string> messages;  // one line per exclusion, in order
};

// Greedy vendor-set reduction. Owns the run's priority table: vendors without
// a configured priority get first_auto_priority, +1, ... in the order they
// are first trialled.
class VendorSetOptimizer {
public:
    VendorSetOptimizer(const catalog::PartCatalog& catalog, VendorPolicy policy);

    // (missing parts, summed selection cost) under an exclusion set
    Evaluation evaluate(const std::vector<PartDemand>& demands, const VendorSet& excluded) const;

    int vendor_priority(const std::string& vendor_name);

    // policy.excluded_vendors, then the allow-list, then the minimum-order pass,
    // then (only without an allow-list) the shipping-cost pass.
    VendorReduction optimize(const std::vector<PartDemand>& demands, VendorSet initial = {});

    void exclude_unlisted_vendors(const std::vector<PartDemand>& demands, VendorReduction& r) const;
    void exclude_vendors_with_high_minimums(const std::vector<PartDemand>& demands, VendorReduction& r) const;

    // Never raises missing parts above the value at the start of the pass and
    // never leaves fewer than one vendor in use.
    void exclude_vendors_to_reduce_shipping_costs(const std::vector<PartDemand>& demands, VendorReduction& r);

    const VendorPolicy& policy() const { return m_policy; }

private:
    const catalog::PartCatalog& m_catalog;
    VendorPolicy m_policy;
    std::map<std::string, int> m_priorities;
    int m_next_priority = 0;
};

}  // namespace order
