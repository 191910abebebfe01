#include <gtest/gtest.h>
#include <lotbook/core/errors.hpp>
#include <lotbook/ingest/csv_reader.hpp>
#include <lotbook/ingest/header_map.hpp>
#include <lotbook/ingest/transaction_normalizer.hpp>
#include <lotbook/utils/logger.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using lotbook::core::Date;
using lotbook::core::EventKind;
using lotbook::ingest::Field;
using lotbook::ingest::HeaderMap;

namespace {

const std::vector<std::string> kHeader = {
    "Type", "Date", "Sym", "Shr", "Price", "Dist", "DistPS", "ROCAmt", "RocPct", "Inc", "TrID"
};

} // namespace

// Test header resolution with synonyms and case differences
TEST(HeaderMapTest, Synonyms) {
    HeaderMap columns({" event ", "TradeDate", "TICKER", "Quantity", "px", "DivAmt", "ROC%"});

    EXPECT_EQ(columns.find(Field::TYPE), 0u);
    EXPECT_EQ(columns.find(Field::DATE), 1u);
    EXPECT_EQ(columns.find(Field::SYMBOL), 2u);
    EXPECT_EQ(columns.find(Field::SHARES), 3u);
    EXPECT_EQ(columns.find(Field::PRICE), 4u);
    EXPECT_EQ(columns.find(Field::DISTRIBUTION), 5u);
    EXPECT_EQ(columns.find(Field::ROC_PERCENT), 6u);
    EXPECT_FALSE(columns.has(Field::LOT_OVERRIDE));
}

TEST(HeaderMapTest, IncomePerShareColumn) {
    HeaderMap columns({"Type", "DivPS", "IncomePerShare", "Inc"});
    EXPECT_EQ(columns.find(Field::DISTRIBUTION_PER_SHARE), 1u);
    EXPECT_EQ(columns.find(Field::INCOME_PER_SHARE), 2u);
    EXPECT_EQ(columns.find(Field::TAXABLE), 3u);

    EXPECT_EQ(HeaderMap({"incps"}).find(Field::INCOME_PER_SHARE), 0u);
    EXPECT_EQ(lotbook::ingest::field_name(Field::INCOME_PER_SHARE), "IncPS");
}

TEST(HeaderMapTest, CellAccess) {
    HeaderMap columns(kHeader);
    std::vector<std::string> short_row = {"Buy", "2024-01-01", "ABC"};

    EXPECT_EQ(columns.cell(short_row, Field::SYMBOL), "ABC");
    EXPECT_EQ(columns.cell(short_row, Field::PRICE), "");
    EXPECT_EQ(HeaderMap({"Sym"}).cell(short_row, Field::TAXABLE), "");
}

TEST(HeaderMapTest, RequireNamesMissingField) {
    HeaderMap columns({"Type", "Date", "Sym", "Price"});

    try {
        columns.require(lotbook::ingest::TransactionNormalizer::required_fields());
        FAIL() << "expected MissingColumnError";
    } catch (const lotbook::core::MissingColumnError& e) {
        EXPECT_EQ(e.field(), "Shr");
        EXPECT_NE(std::string(e.what()).find("Type, Date, Sym, Price"), std::string::npos);
    }
}

// Test fixture for normalizer tests
class NormalizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        lotbook::utils::Logger::set_sink(&log_output);
        table.header = kHeader;
    }

    void TearDown() override {
        lotbook::utils::Logger::set_sink(nullptr);
    }

    lotbook::ingest::NormalizedLog run() {
        return normalizer.normalize(table);
    }

    std::ostringstream log_output;
    lotbook::core::RawTable table;
    lotbook::ingest::TransactionNormalizer normalizer;
};

TEST_F(NormalizerTest, ParsesTradesAndDividends) {
    table.rows = {
        {"Buy", "1/1/2024", " abc ", "100", "$10.00", "", "", "", "", "", ""},
        {"Sell", "2024-02-01", "ABC", "40", "12", "", "", "", "", "", "ABC_240101_A"},
        {"Dividend", "2024-01-15", "ABC", "", "", "1,000.00", "", "", "40%", "", ""},
        {"Dividend", "2024-01-22", "ABC", "", "", "", "0.25", "5", "", "", ""},
    };

    auto log = run();
    ASSERT_EQ(log.events.size(), 4u);
    EXPECT_TRUE(log.skipped.empty());

    const auto& buy = log.events[0];
    EXPECT_EQ(buy.row, 1u);
    EXPECT_EQ(buy.kind, EventKind::BUY);
    EXPECT_EQ(buy.date, Date(2024, 1, 1));
    EXPECT_EQ(buy.symbol, "ABC");
    EXPECT_DOUBLE_EQ(buy.shares, 100.0);
    EXPECT_DOUBLE_EQ(buy.price, 10.0);
    EXPECT_FALSE(buy.lot_id_override.has_value());

    const auto& sell = log.events[1];
    EXPECT_EQ(sell.kind, EventKind::SELL);
    ASSERT_TRUE(sell.lot_id_override.has_value());
    EXPECT_EQ(*sell.lot_id_override, "ABC_240101_A");

    const auto& dividend = log.events[2];
    EXPECT_EQ(dividend.kind, EventKind::DIVIDEND);
    ASSERT_TRUE(dividend.dividend_total.has_value());
    EXPECT_DOUBLE_EQ(*dividend.dividend_total, 1000.0);
    ASSERT_TRUE(dividend.roc_percent.has_value());
    EXPECT_DOUBLE_EQ(*dividend.roc_percent, 0.4);
    EXPECT_FALSE(dividend.roc_amount.has_value());
    EXPECT_FALSE(dividend.taxable_amount.has_value());

    const auto& per_share = log.events[3];
    EXPECT_FALSE(per_share.dividend_total.has_value());
    EXPECT_DOUBLE_EQ(*per_share.dividend_per_share, 0.25);
    EXPECT_DOUBLE_EQ(*per_share.roc_amount, 5.0);
}

TEST_F(NormalizerTest, SkipsMalformedRowsAndContinues) {
    table.rows = {
        {"Buy", "", "ABC", "100", "10", "", "", "", "", "", ""},
        {"Buy", "2024-01-01", "ABC", "0", "10", "", "", "", "", "", ""},
        {"Split", "2024-01-01", "ABC", "2", "0", "", "", "", "", "", ""},
        {"Dividend", "2024-01-15", "ABC", "", "", "", "", "", "", "", ""},
        {"Dividend", "2024-01-15", "ABC", "", "", "50", "", "60", "", "", ""},
        {"Dividend", "2024-01-15", "ABC", "", "", "50", "", "", "140%", "", ""},
        {"Dividend", "2024-01-15", "ABC", "", "", "(5.00)", "", "", "", "", ""},
        {"Buy", "2024-01-01", "ABC", "10", "abc", "", "", "", "", "", ""},
        {"", "", "", "", "", "", "", "", "", "", ""},
        {"Buy", "2024-01-02", "ABC", "10", "11", "", "", "", "", "", ""},
    };

    auto log = run();
    ASSERT_EQ(log.events.size(), 1u);
    EXPECT_EQ(log.events[0].row, 10u);
    EXPECT_EQ(log.blank_rows, 1u);

    ASSERT_EQ(log.skipped.size(), 8u);
    EXPECT_EQ(log.skipped[0].row, 1u);
    EXPECT_EQ(log.skipped[0].rule, "Date");
    EXPECT_EQ(log.skipped[1].rule, "Shr");
    EXPECT_EQ(log.skipped[2].rule, "Type");
    EXPECT_EQ(log.skipped[3].rule, "Dist");
    EXPECT_EQ(log.skipped[4].rule, "ROCAmt");
    EXPECT_EQ(log.skipped[5].rule, "RocPct");
    EXPECT_EQ(log.skipped[6].rule, "Dist");
    EXPECT_EQ(log.skipped[7].rule, "Price");

    // Each skip is logged as a warning naming the row
    EXPECT_NE(log_output.str().find("[WARN] Skipping transaction Row 1"), std::string::npos);
}

// A dividend may be stated as taxable income per share plus a ROC percent
TEST_F(NormalizerTest, IncomePerShareDividend) {
    table.header = {"Type", "Date", "Sym", "Shr", "Price", "RocPct", "IncPS"};
    table.rows = {
        {"Dividend", "2024-01-15", "ABC", "", "", "40%", "0.60"},
        {"Dividend", "2024-01-22", "ABC", "", "", "", "0.25"},
        {"Dividend", "2024-01-29", "ABC", "", "", "100%", "0.60"},
        {"Dividend", "2024-02-05", "ABC", "", "", "", "-1"},
    };

    auto log = run();
    ASSERT_EQ(log.events.size(), 2u);
    ASSERT_TRUE(log.events[0].income_per_share.has_value());
    EXPECT_DOUBLE_EQ(*log.events[0].income_per_share, 0.6);
    EXPECT_DOUBLE_EQ(*log.events[0].roc_percent, 0.4);
    EXPECT_FALSE(log.events[0].dividend_total.has_value());
    EXPECT_FALSE(log.events[0].dividend_per_share.has_value());
    EXPECT_FALSE(log.events[1].roc_percent.has_value());

    ASSERT_EQ(log.skipped.size(), 2u);
    EXPECT_EQ(log.skipped[0].row, 3u);
    EXPECT_EQ(log.skipped[0].rule, "RocPct");
    EXPECT_EQ(log.skipped[1].row, 4u);
    EXPECT_EQ(log.skipped[1].rule, "IncPS");
}

TEST_F(NormalizerTest, MissingRequiredColumnAborts) {
    table.header = {"Type", "Date", "Sym", "Shr"};
    table.rows = {{"Buy", "2024-01-01", "ABC", "1"}};

    EXPECT_THROW(run(), lotbook::core::MissingColumnError);
}

// Test CSV reading
TEST(CsvReaderTest, SplitLine) {
    auto fields = lotbook::ingest::CsvReader::split_line("a,\"b,c\",\"say \"\"hi\"\"\",");
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0], "a");
    EXPECT_EQ(fields[1], "b,c");
    EXPECT_EQ(fields[2], "say \"hi\"");
    EXPECT_EQ(fields[3], "");
}

TEST(CsvReaderTest, ReadStream) {
    std::istringstream input(
        "\xEF\xBB\xBFType,Date,Sym\r\n"
        "Buy,2024-01-01,ABC\r\n"
        "\r\n"
        "Sell,2024-01-02,\"multi\nline\"\r\n");

    auto table = lotbook::ingest::CsvReader::read_stream(input);
    ASSERT_EQ(table.header.size(), 3u);
    EXPECT_EQ(table.header[0], "Type");

    // Blank line keeps its slot so row numbers match the file
    ASSERT_EQ(table.size(), 3u);
    EXPECT_EQ(table.rows[0][2], "ABC");
    EXPECT_EQ(table.rows[2][2], "multi\nline");
}

TEST(CsvReaderTest, MissingFileThrows) {
    EXPECT_THROW(lotbook::ingest::CsvReader::read_file("/nonexistent/lotbook/transactions.csv"),
                 std::runtime_error);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
