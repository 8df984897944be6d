#include "quotes/QuoteUtil.hpp"

#include "support/Fixtures.hpp"

#include <stdexcept>

#include <gtest/gtest.h>

TEST(QuoteUtilTest, VendorNameDropsListingSuffixes)
{
    EXPECT_EQ("Digi-Key", quotes::normalize_vendor_name("Digi-Key \xE2\x80\xA2"));
    EXPECT_EQ("Heilind Electronics", quotes::normalize_vendor_name("Heilind Electronics ECIA (NEDA) Member"));
    EXPECT_EQ("Future Electronics", quotes::normalize_vendor_name("Future Electronics CEDA member"));
}

TEST(QuoteUtilTest, VendorNameDropsNewlinesAndTrims)
{
    EXPECT_EQ("Mouser", quotes::normalize_vendor_name("\t Mou\nser  "));
    EXPECT_EQ("", quotes::normalize_vendor_name(" \n\t"));
}

TEST(QuoteUtilTest, NormalizeQuoteSortsPriceBreaks)
{
    catalog::VendorQuote q = fixtures::make_quote("Arrow \xE2\x80\xA2", "A1", 10,
                                                  {{100, 0.02}, {1, 0.10}, {10, 0.06}, {10, 0.05}});
    quotes::normalize_quote(q);

    EXPECT_EQ("Arrow", q.vendor_name);
    ASSERT_EQ(4U, q.price_breaks.size());
    EXPECT_EQ(1, q.price_breaks[0].min_quantity);
    EXPECT_EQ(10, q.price_breaks[1].min_quantity);
    EXPECT_DOUBLE_EQ(0.05, q.price_breaks[1].unit_price);
    EXPECT_DOUBLE_EQ(0.06, q.price_breaks[2].unit_price);
    EXPECT_EQ(100, q.price_breaks[3].min_quantity);
}

TEST(QuoteUtilTest, ParsesPriceBreakText)
{
    const auto breaks = quotes::parse_price_breaks("1/0.10  10/0.05\t100/.02");
    ASSERT_EQ(3U, breaks.size());
    EXPECT_EQ(1, breaks[0].min_quantity);
    EXPECT_DOUBLE_EQ(0.10, breaks[0].unit_price);
    EXPECT_EQ(100, breaks[2].min_quantity);
    EXPECT_DOUBLE_EQ(0.02, breaks[2].unit_price);

    EXPECT_TRUE(quotes::parse_price_breaks("").empty());
}

TEST(QuoteUtilTest, RejectsMalformedPriceBreakText)
{
    EXPECT_THROW(quotes::parse_price_breaks("10"), std::invalid_argument);
    EXPECT_THROW(quotes::parse_price_breaks("10/0.1/2"), std::invalid_argument);
    EXPECT_THROW(quotes::parse_price_breaks("ten/0.1"), std::invalid_argument);
    EXPECT_THROW(quotes::parse_price_breaks("10/cheap"), std::invalid_argument);
    EXPECT_THROW(quotes::parse_price_breaks("-1/0.1"), std::invalid_argument);
}

TEST(QuoteUtilTest, FileSafeNameEscapesPunctuation)
{
    const catalog::ActualPartKey key{"Texas Instruments", "LM358/DR"};
    EXPECT_EQ("Texas%20Instruments__LM358%2FDR", quotes::file_safe_name(key));
}

TEST(QuoteUtilTest, FileSafeNameKeepsDistinctKeysApart)
{
    const catalog::ActualPartKey spaced{"A B", "X"};
    const catalog::ActualPartKey underscored{"A_B", "X"};
    EXPECT_NE(quotes::file_safe_name(spaced), quotes::file_safe_name(underscored));

    // the separator cannot be forged from inside a field
    const catalog::ActualPartKey split{"A", "_B"};
    const catalog::ActualPartKey joined{"A_", "B"};
    EXPECT_NE(quotes::file_safe_name(split), quotes::file_safe_name(joined));
}

TEST(QuoteUtilTest, FormatMoneyUsesTwoDecimals)
{
    EXPECT_EQ("12.50", quotes::format_money(12.5));
    EXPECT_EQ("0.00", quotes::format_money(0.0));
    EXPECT_EQ("2.35", quotes::format_money(2.345001));
}
