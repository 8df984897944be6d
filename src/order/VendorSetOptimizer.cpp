#include "order/VendorSetOptimizer.hpp"

#include "quotes/QuoteUtil.hpp"

#include <algorithm>
#include <tuple>
#include <utility>

namespace order {

bool operator<(const TrialExclusion& a, const TrialExclusion& b) {
    return std::tie(a.missing_parts, a.total_cost, a.vendor_priority, a.vendor_name) <
           std::tie(b.missing_parts, b.total_cost, b.vendor_priority, b.vendor_name);
}

VendorSetOptimizer::VendorSetOptimizer(const catalog::PartCatalog& catalog, VendorPolicy policy)
    : m_catalog(catalog), m_policy(std::move(policy)) {
    m_priorities = m_policy.vendor_priorities;
    m_next_priority = m_policy.first_auto_priority;
}

Evaluation VendorSetOptimizer::evaluate(const std::vector<PartDemand>& demands, const VendorSet& excluded) const {
    Evaluation ev;
    for (const auto& d : demands) {
        auto sel = select_choice_part(m_catalog, d.choice_part, d.required_quantity, excluded);
        if (sel) ev.total_cost += sel->total_cost;
        else ev.missing_parts++;
    }
    return ev;
}

int VendorSetOptimizer::vendor_priority(const std::string& vendor_name) {
    auto it = m_priorities.find(vendor_name);
    if (it != m_priorities.end()) return it->second;

    const int p = m_next_priority++;
    m_priorities.emplace(vendor_name, p);
    return p;
}

void VendorSetOptimizer::exclude_unlisted_vendors(const std::vector<PartDemand>& demands, VendorReduction& r) const {
    if (m_policy.allowed_vendors.empty()) return;

    for (const auto& name : available_vendor_names(m_catalog, demands, r.excluded)) {
        if (m_policy.allowed_vendors.count(name) != 0) continue;
        r.excluded.insert(name);
        r.messages.push_back("Excluding '" + name + "': not in allowed vendor list");
    }
}

void VendorSetOptimizer::exclude_vendors_with_high_minimums(const std::vector<PartDemand>& demands,
                                                            VendorReduction& r) const {
    const auto in_use = available_vendor_names(m_catalog, demands, r.excluded);

    for (const auto& kv : m_policy.vendor_minimums) {
        const std::string& vendor = kv.first;
        const double minimum = kv.second;
        if (!std::binary_search(in_use.begin(), in_use.end(), vendor)) continue;

        double vendor_total = 0.0;
        for (const auto& d : demands) {
            auto sel = select_choice_part(m_catalog, d.choice_part, d.required_quantity, r.excluded);
            if (sel && sel->vendor_name == vendor) vendor_total += sel->total_cost;
        }

        if (vendor_total < minimum) {
            r.excluded.insert(vendor);
            r.messages.push_back("Excluding '" + vendor + "': needed order " +
                                 quotes::format_money(vendor_total) + " < minimum order " +
                                 quotes::format_money(minimum));
        }
    }
}

void VendorSetOptimizer::exclude_vendors_to_reduce_shipping_costs(const std::vector<PartDemand>& demands,
                                                                  VendorReduction& r) {
    const int start_missing = evaluate(demands, r.excluded).missing_parts;

    for (;;) {
        const Evaluation base = evaluate(demands, r.excluded);
        if (base.missing_parts > start_missing) break;

        const auto vendors = available_vendor_names(m_catalog, demands, r.excluded);
        if (vendors.size() <= 1) break;

        std::vector<TrialExclusion> trials;
        trials.reserve(vendors.size());
        for (const auto& name : vendors) {
            VendorSet trial_excluded = r.excluded;
            trial_excluded.insert(name);
            const Evaluation ev = evaluate(demands, trial_excluded);

            TrialExclusion t;
            t.missing_parts = ev.missing_parts;
            t.total_cost = ev.total_cost;
            t.vendor_priority = vendor_priority(name);
            t.vendor_name = name;
            trials.push_back(std::move(t));
        }
        std::sort(trials.begin(), trials.end());

        // Drop vendors whose removal costs nothing. Trials were computed one
        // vendor at a time, so every drop after the first is re-checked
        // against the exclusions already made in this round.
        size_t first = 0;
        while (trials.size() - first >= 2) {
            const TrialExclusion& t = trials[first];
            if (t.missing_parts > start_missing || t.total_cost - base.total_cost != 0.0) break;

            if (first > 0) {
                VendorSet check = r.excluded;
                check.insert(t.vendor_name);
                const Evaluation ev = evaluate(demands, check);
                if (ev.missing_parts > start_missing || ev.total_cost - base.total_cost != 0.0) break;
            }

            r.excluded.insert(t.vendor_name);
            r.messages.push_back("Excluding '" + t.vendor_name + "': saves nothing");
            ++first;
        }
        if (first > 0) continue;

        const TrialExclusion& lowest = trials.front();
        const double savings = lowest.total_cost - base.total_cost;

        if (lowest.missing_parts <= start_missing &&
            savings < m_policy.shipping_threshold &&
            trials.size() >= 2 &&
            lowest.vendor_name != m_policy.never_exclude_vendor) {
            r.excluded.insert(lowest.vendor_name);
            r.messages.push_back("Excluding '" + lowest.vendor_name + "': only saves " +
                                 quotes::format_money(savings));
        } else {
            break;
        }
    }
}

VendorReduction VendorSetOptimizer::optimize(const std::vector<PartDemand>& demands, VendorSet initial) {
    VendorReduction r;
    r.excluded = std::move(initial);
    r.excluded.insert(m_policy.excluded_vendors.begin(), m_policy.excluded_vendors.end());

    exclude_unlisted_vendors(demands, r);
    exclude_vendors_with_high_minimums(demands, r);
    if (m_policy.allowed_vendors.empty()) {
        exclude_vendors_to_reduce_shipping_costs(demands, r);
    }
    return r;
}

}  // namespace order
