#include "order/OrderArtifact.hpp"

#include "support/Fixtures.hpp"

#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

using fixtures::add_choice;
using fixtures::make_actual;
using fixtures::make_quote;

namespace
{
    order::OrderArtifact run_sample(catalog::PartCatalog& catalog)
    {
        add_choice(catalog, "10K;1608", {make_actual("Yageo", "RC0603", {
            make_quote("VendorA", "A1", 100, {{1, 50.0}}),
            make_quote("VendorB", "B1", 100, {{1, 50.0}}),
        })});
        add_choice(catalog, "100n;1608", {make_actual("Murata", "GRM188")});

        quotes::NullQuoteProvider provider;
        quotes::QuoteCache cache;
        order::VendorPolicy policy;
        policy.vendor_minimums.clear();

        order::OrderAggregator aggregator(catalog, cache, provider, policy);
        const order::BoardId b = aggregator.add_board("main", "A", 1);
        aggregator.add_board_part(b, "R1", "10K;1608");
        aggregator.add_board_part(b, "C1", "100n;1608");

        order::OrderArtifact artifact;
        artifact.catalog_path = "catalog.json";
        artifact.order_path = "order.json";
        artifact.policy = policy;
        artifact.result = aggregator.process();
        artifact.catalog = &catalog;
        return artifact;
    }
}

TEST(OrderArtifactTest, JsonCarriesLinesAndSummary)
{
    catalog::PartCatalog catalog;
    const order::OrderArtifact artifact = run_sample(catalog);
    const nlohmann::json j = artifact.to_json();

    ASSERT_EQ(2U, j.at("lines").size());
    const auto& unfilled = j.at("lines").at(0);
    EXPECT_EQ("100n;1608", unfilled.at("name").get<std::string>());
    EXPECT_TRUE(unfilled.at("selection").is_null());

    const auto& filled = j.at("lines").at(1).at("selection");
    EXPECT_EQ("Yageo", filled.at("manufacturer_name").get<std::string>());
    EXPECT_EQ("VendorB", filled.at("vendor_name").get<std::string>());
    EXPECT_EQ(1, filled.at("order_quantity").get<int>());

    EXPECT_EQ(1, j.at("summary").at("missing_parts_count").get<int>());
    EXPECT_DOUBLE_EQ(50.0, j.at("summary").at("total_cost").get<double>());
    EXPECT_EQ(1U, j.at("excluded_vendors").size());
    EXPECT_DOUBLE_EQ(15.0, j.at("vendor_policy").at("shipping_threshold").get<double>());
}

TEST(OrderArtifactTest, ReportListsExclusionsAndFinalVendors)
{
    catalog::PartCatalog catalog;
    const order::OrderArtifact artifact = run_sample(catalog);

    const std::string report = artifact.vendor_reduction_report();
    EXPECT_NE(std::string::npos, report.find("Excluding 'VendorA': saves nothing\n"));
    EXPECT_NE(std::string::npos, report.find("    VendorB (1 lines, $50.00)\n"));
    EXPECT_NE(std::string::npos, report.find("Total price: $50.00\n"));
}

TEST(OrderArtifactTest, WritesBothFiles)
{
    catalog::PartCatalog catalog;
    const order::OrderArtifact artifact = run_sample(catalog);

    const auto dir = fixtures::make_temp_dir("order_artifact");
    artifact.write_to(dir / "out" / "order.json");
    artifact.write_vendor_reduction_report(dir / "out" / "vendor_reduction_report.txt");

    std::ifstream in(dir / "out" / "order.json");
    ASSERT_TRUE(in.good());
    nlohmann::json j;
    in >> j;
    EXPECT_EQ("catalog.json", j.at("catalog_path").get<std::string>());

    std::ifstream report(dir / "out" / "vendor_reduction_report.txt");
    std::stringstream text;
    text << report.rdbuf();
    EXPECT_EQ(artifact.vendor_reduction_report(), text.str());
}
