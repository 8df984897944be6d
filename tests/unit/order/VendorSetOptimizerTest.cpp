#include "order/VendorSetOptimizer.hpp"

#include "support/Fixtures.hpp"

#include <gtest/gtest.h>

using fixtures::add_choice;
using fixtures::make_actual;
using fixtures::make_quote;

namespace
{
    // One choice part per entry, each offered by the given (vendor, unit price) list.
    struct Offer
    {
        std::string vendor;
        double price;
    };

    std::vector<order::PartDemand> build(catalog::PartCatalog& catalog,
                                         const std::vector<std::vector<Offer>>& parts)
    {
        std::vector<order::PartDemand> demands;
        for (size_t i = 0; i < parts.size(); ++i)
        {
            std::vector<catalog::VendorQuote> quotes;
            for (const auto& o : parts[i])
            {
                quotes.push_back(make_quote(o.vendor, o.vendor + "-" + std::to_string(i), 100, {{1, o.price}}));
            }
            const std::string n = std::to_string(i);
            demands.push_back({add_choice(catalog, "P" + n + ";X", {make_actual("M", "MPN" + n, quotes)}), 1});
        }
        catalog.deduplicate_actual_parts();
        return demands;
    }

    order::VendorPolicy no_minimums()
    {
        order::VendorPolicy policy;
        policy.vendor_minimums.clear();
        return policy;
    }
}

TEST(VendorSetOptimizerTest, EqualOffersCollapseToOneVendor)
{
    catalog::PartCatalog catalog;
    const auto demands = build(catalog, {{{"VendorA", 50.0}, {"VendorB", 50.0}}});

    order::VendorSetOptimizer optimizer(catalog, no_minimums());
    const order::VendorReduction r = optimizer.optimize(demands);

    EXPECT_EQ(order::VendorSet{"VendorA"}, r.excluded);
    ASSERT_EQ(1U, r.messages.size());
    EXPECT_EQ("Excluding 'VendorA': saves nothing", r.messages[0]);

    const auto sel = order::select_choice_part(catalog, demands[0].choice_part, 1, r.excluded);
    ASSERT_TRUE(sel.has_value());
    EXPECT_EQ("VendorB", sel->vendor_name);
    EXPECT_DOUBLE_EQ(50.0, sel->total_cost);
}

TEST(VendorSetOptimizerTest, LastVendorIsNeverExcluded)
{
    catalog::PartCatalog catalog;
    const auto demands = build(catalog, {{{"VendorA", 1.0}}, {{"VendorA", 2.0}}});

    order::VendorSetOptimizer optimizer(catalog, no_minimums());
    const order::VendorReduction r = optimizer.optimize(demands);

    EXPECT_TRUE(r.excluded.empty());
    EXPECT_TRUE(r.messages.empty());
}

TEST(VendorSetOptimizerTest, KeepsVendorWorthTheShipping)
{
    catalog::PartCatalog catalog;
    const auto demands = build(catalog, {
        {{"VendorA", 10.0}, {"VendorB", 40.0}},
        {{"VendorA", 40.0}, {"VendorB", 10.0}},
    });

    order::VendorSetOptimizer optimizer(catalog, no_minimums());
    const order::VendorReduction r = optimizer.optimize(demands);

    EXPECT_TRUE(r.excluded.empty());
    EXPECT_DOUBLE_EQ(20.0, optimizer.evaluate(demands, r.excluded).total_cost);
}

TEST(VendorSetOptimizerTest, DropsVendorSavingLessThanShipping)
{
    catalog::PartCatalog catalog;
    const auto demands = build(catalog, {
        {{"VendorA", 10.0}, {"VendorB", 12.0}},
        {{"VendorA", 40.0}, {"VendorB", 10.0}},
    });

    order::VendorSetOptimizer optimizer(catalog, no_minimums());
    const order::Evaluation unconstrained = optimizer.evaluate(demands, {});
    const order::VendorReduction r = optimizer.optimize(demands);

    EXPECT_EQ(order::VendorSet{"VendorA"}, r.excluded);
    ASSERT_EQ(1U, r.messages.size());
    EXPECT_EQ("Excluding 'VendorA': only saves 2.00", r.messages[0]);

    const order::Evaluation after = optimizer.evaluate(demands, r.excluded);
    EXPECT_EQ(0, after.missing_parts);
    EXPECT_DOUBLE_EQ(22.0, after.total_cost);
    EXPECT_GE(after.total_cost, unconstrained.total_cost);
}

TEST(VendorSetOptimizerTest, ThresholdIsConfigurable)
{
    catalog::PartCatalog catalog;
    const auto demands = build(catalog, {
        {{"VendorA", 10.0}, {"VendorB", 12.0}},
        {{"VendorA", 40.0}, {"VendorB", 10.0}},
    });

    order::VendorPolicy policy = no_minimums();
    policy.shipping_threshold = 1.0;
    order::VendorSetOptimizer optimizer(catalog, policy);

    EXPECT_TRUE(optimizer.optimize(demands).excluded.empty());
}

TEST(VendorSetOptimizerTest, NeverExcludeVendorSurvivesSmallSavings)
{
    catalog::PartCatalog catalog;
    const auto demands = build(catalog, {
        {{"Digi-Key", 10.0}, {"VendorB", 12.0}},
        {{"Digi-Key", 40.0}, {"VendorB", 10.0}},
    });

    order::VendorSetOptimizer optimizer(catalog, no_minimums());
    EXPECT_TRUE(optimizer.optimize(demands).excluded.empty());
}

TEST(VendorSetOptimizerTest, NeverRaisesMissingParts)
{
    catalog::PartCatalog catalog;
    // Dropping either VendorA or VendorB alone costs nothing; dropping both
    // leaves P0 unfulfillable.
    const auto demands = build(catalog, {
        {{"VendorA", 5.0}, {"VendorB", 5.0}},
        {{"VendorC", 5.0}},
    });

    order::VendorSetOptimizer optimizer(catalog, no_minimums());
    const order::VendorReduction r = optimizer.optimize(demands);

    EXPECT_EQ(order::VendorSet{"VendorA"}, r.excluded);
    const order::Evaluation after = optimizer.evaluate(demands, r.excluded);
    EXPECT_EQ(0, after.missing_parts);
    EXPECT_DOUBLE_EQ(10.0, after.total_cost);
}

TEST(VendorSetOptimizerTest, ExcludesVendorBelowMinimumOrder)
{
    catalog::PartCatalog catalog;
    const auto demands = build(catalog, {{{"Verical", 40.0}, {"Mouser", 45.0}}});

    order::VendorSetOptimizer optimizer(catalog, order::VendorPolicy{});
    const order::VendorReduction r = optimizer.optimize(demands);

    EXPECT_EQ(order::VendorSet{"Verical"}, r.excluded);
    ASSERT_EQ(1U, r.messages.size());
    EXPECT_EQ("Excluding 'Verical': needed order 40.00 < minimum order 100.00", r.messages[0]);
}

TEST(VendorSetOptimizerTest, KeepsVendorMeetingMinimumOrder)
{
    catalog::PartCatalog catalog;
    const auto demands = build(catalog, {
        {{"Verical", 60.0}, {"Mouser", 90.0}},
        {{"Verical", 60.0}, {"Mouser", 90.0}},
    });

    order::VendorPolicy policy;
    order::VendorSetOptimizer optimizer(catalog, policy);
    order::VendorReduction r;
    optimizer.exclude_vendors_with_high_minimums(demands, r);

    EXPECT_TRUE(r.excluded.empty());
}

TEST(VendorSetOptimizerTest, AllowListExcludesEveryOtherVendor)
{
    catalog::PartCatalog catalog;
    const auto demands = build(catalog, {
        {{"VendorA", 10.0}, {"VendorB", 12.0}},
        {{"VendorA", 10.0}, {"VendorC", 99.0}},
    });

    order::VendorPolicy policy = no_minimums();
    policy.allowed_vendors = {"VendorB", "VendorC"};
    order::VendorSetOptimizer optimizer(catalog, policy);
    const order::VendorReduction r = optimizer.optimize(demands);

    // the shipping pass does not run with an allow-list
    EXPECT_EQ(order::VendorSet{"VendorA"}, r.excluded);
    ASSERT_EQ(1U, r.messages.size());
    EXPECT_EQ("Excluding 'VendorA': not in allowed vendor list", r.messages[0]);
}

TEST(VendorSetOptimizerTest, StartsFromPolicyAndCallerExclusions)
{
    catalog::PartCatalog catalog;
    const auto demands = build(catalog, {
        {{"VendorA", 10.0}, {"VendorB", 40.0}, {"VendorC", 5.0}},
        {{"VendorA", 40.0}, {"VendorB", 10.0}, {"VendorD", 5.0}},
    });

    order::VendorPolicy policy = no_minimums();
    policy.excluded_vendors = {"VendorC"};
    order::VendorSetOptimizer optimizer(catalog, policy);
    const order::VendorReduction r = optimizer.optimize(demands, {"VendorD"});

    const order::VendorSet expected{"VendorC", "VendorD"};
    EXPECT_EQ(expected, r.excluded);
}

TEST(VendorSetOptimizerTest, AssignsPrioritiesToUnknownVendorsInOrderSeen)
{
    catalog::PartCatalog catalog;
    order::VendorSetOptimizer optimizer(catalog, order::VendorPolicy{});

    EXPECT_EQ(0, optimizer.vendor_priority("Verical"));
    EXPECT_EQ(1004, optimizer.vendor_priority("Digi-Key"));
    EXPECT_EQ(10, optimizer.vendor_priority("Arrow"));
    EXPECT_EQ(11, optimizer.vendor_priority("Avnet"));
    EXPECT_EQ(10, optimizer.vendor_priority("Arrow"));
}

TEST(VendorSetOptimizerTest, TrialOrderingUsesPriorityThenName)
{
    order::TrialExclusion a{0, 5.0, 1003, "Mouser"};
    order::TrialExclusion b{0, 5.0, 2, "Farnell element14"};
    order::TrialExclusion c{0, 5.0, 2, "Heilind Electronics - Asia"};
    order::TrialExclusion d{1, 1.0, 0, "Verical"};

    EXPECT_TRUE(b < c);
    EXPECT_TRUE(c < a);
    EXPECT_TRUE(a < d);
}
