#include "minimod/errors.hpp"
#include "minimod/signal_table.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

using minimod::ConfigurationError;
using minimod::InterpolationKind;
using minimod::SignalTable;

namespace {

SignalTable
parse(const std::string &text) {
    std::istringstream in(text);
    return SignalTable::parse_csv(in);
}

} // namespace

TEST(SignalTableTest, ParsesReferenceTable) {
    SignalTable const table = minimod::test_support::reference_table();
    EXPECT_EQ(table.index_name(), "time");
    EXPECT_EQ(table.size(), 24u);
    EXPECT_EQ(table.column_names(), (std::vector<std::string>{ "glucose", "insulin" }));
    EXPECT_DOUBLE_EQ(table.index().front(), 0.0);
    EXPECT_DOUBLE_EQ(table.index().back(), 182.0);

    // First row supplies the baselines
    EXPECT_DOUBLE_EQ(table.first("glucose"), 92.0);
    EXPECT_DOUBLE_EQ(table.first("insulin"), 11.0);
    EXPECT_DOUBLE_EQ(table.column("insulin")[2], 130.0);
    EXPECT_THROW(table.column("lactate"), std::out_of_range);
}

TEST(SignalTableTest, ReadsDataFile) {
    SignalTable const file_table = SignalTable::read_csv(std::string(MINIMOD_DATA_DIR) + "/glucose_insulin.csv");
    SignalTable const embedded = minimod::test_support::reference_table();
    EXPECT_EQ(file_table.index(), embedded.index());
    EXPECT_EQ(file_table.column("glucose"), embedded.column("glucose"));
    EXPECT_EQ(file_table.column("insulin"), embedded.column("insulin"));
}

TEST(SignalTableTest, MissingFileThrows) {
    EXPECT_THROW(SignalTable::read_csv("/nonexistent/glucose.csv"), std::runtime_error);
}

TEST(SignalTableTest, ToleratesWhitespaceAndBlankLines) {
    SignalTable const table = parse("\n time , a \n0, 1.5\n\n 1 ,2e1\r\n");
    EXPECT_EQ(table.index_name(), "time");
    ASSERT_EQ(table.size(), 2u);
    EXPECT_DOUBLE_EQ(table.column("a")[1], 20.0);
}

TEST(SignalTableTest, RejectsMalformedInput) {
    EXPECT_THROW(parse(""), ConfigurationError);
    EXPECT_THROW(parse("time\n0\n"), ConfigurationError);             // no signal column
    EXPECT_THROW(parse("time,a,a\n0,1,2\n"), ConfigurationError);     // duplicate column
    EXPECT_THROW(parse("time,a\n0,1\n1\n"), ConfigurationError);      // ragged row
    EXPECT_THROW(parse("time,a\n0,1\n1,abc\n"), ConfigurationError);  // non-numeric
    EXPECT_THROW(parse("time,a\n0,1\n0,2\n"), ConfigurationError);    // repeated time
    EXPECT_THROW(parse("time,a\n"), ConfigurationError);              // no rows
}

TEST(SignalTableTest, InterpolatesColumns) {
    SignalTable const table = minimod::test_support::reference_table();

    auto linear = table.interpolate("insulin");
    EXPECT_DOUBLE_EQ(linear->t_min(), 0.0);
    EXPECT_DOUBLE_EQ(linear->t_max(), 182.0);
    EXPECT_DOUBLE_EQ(linear->evaluate(3.0), 78.0);
    EXPECT_DOUBLE_EQ(linear->evaluate(182.0), 7.0);

    auto pchip = table.interpolate("insulin", InterpolationKind::Pchip);
    EXPECT_NEAR(pchip->evaluate(4.0), 130.0, 1e-9);
    // Shape preserving: no overshoot above the local maximum
    EXPECT_LE(pchip->evaluate(3.0), 130.0);
    EXPECT_GE(pchip->evaluate(3.0), 26.0);

    EXPECT_THROW(table.interpolate("lactate"), std::out_of_range);
}
