#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "harness/ledger_builder.hpp"
#include "ingest/ledger_reader.hpp"

namespace {

using test::make_date;
using test::to_amount;

class LedgerReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("ledger_reader_tests_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& contents) {
        const auto path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << contents;
        return path;
    }

    std::filesystem::path dir_;
};

TEST_F(LedgerReaderTest, ReadsRowsInOrder) {
    std::istringstream in("2020-12-04,Tecnologia,16.00,Bitbucket\n"
                          "2020-12-04,Jurídico,60.00,LinkSquares\n"
                          "2020-12-05,Tecnologia,50.00,AWS\n");
    core::Ledger ledger;
    ingest::LedgerReadError error{};
    ingest::ParseStats stats{};
    ASSERT_TRUE(ingest::read_ledger(in, ingest::LedgerReadOptions{}, ledger, error, &stats)) << error.message;

    ASSERT_EQ(ledger.size(), 3u);
    EXPECT_EQ(ledger[0].counterpart, "Bitbucket");
    EXPECT_EQ(ledger[1].department, "Jurídico");
    EXPECT_EQ(ledger[2].date, make_date(2020, 12, 5));
    EXPECT_EQ(ledger[2].value, to_amount(50));
    for (const auto& tx : ledger) {
        EXPECT_EQ(tx.status, core::TxStatus::Missing);
    }
    EXPECT_EQ(stats.parsed, 3u);
    EXPECT_EQ(stats.failed, 0u);
}

TEST_F(LedgerReaderTest, SkipsBlankLinesAndCrlf) {
    std::istringstream in("2020-12-04,Tecnologia,16.00,Bitbucket\r\n"
                          "\r\n"
                          "   \n"
                          "2020-12-05,Tecnologia,50.00,AWS\r\n");
    core::Ledger ledger;
    ingest::LedgerReadError error{};
    ingest::ParseStats stats{};
    ASSERT_TRUE(ingest::read_ledger(in, ingest::LedgerReadOptions{}, ledger, error, &stats)) << error.message;
    ASSERT_EQ(ledger.size(), 2u);
    EXPECT_EQ(ledger[0].counterpart, "Bitbucket");
    EXPECT_EQ(ledger[1].counterpart, "AWS");
    EXPECT_EQ(stats.blank_lines, 2u);
}

TEST_F(LedgerReaderTest, EmptyInputIsEmptyLedger) {
    std::istringstream in("");
    core::Ledger ledger = test::LedgerBuilder{}.add().build();
    ingest::LedgerReadError error{};
    ASSERT_TRUE(ingest::read_ledger(in, ingest::LedgerReadOptions{}, ledger, error));
    EXPECT_TRUE(ledger.empty());
}

TEST_F(LedgerReaderTest, ReportsFirstBadRow) {
    std::istringstream in("2020-12-04,Tecnologia,16.00,Bitbucket\n"
                          "\n"
                          "2020-12-05,Tecnologia,fifty,AWS\n"
                          "2020-02-30,Tecnologia,50.00,AWS\n");
    core::Ledger ledger;
    ingest::LedgerReadError error{};
    ingest::ParseStats stats{};
    EXPECT_FALSE(ingest::read_ledger(in, ingest::LedgerReadOptions{}, ledger, error, &stats));
    EXPECT_EQ(error.line, 3u);
    EXPECT_EQ(error.result, ingest::ParseResult::InvalidAmount);
    EXPECT_NE(error.message.find("line 3"), std::string::npos);
    EXPECT_TRUE(ledger.empty());
    EXPECT_EQ(stats.parsed, 1u);
    EXPECT_EQ(stats.failed, 1u);
}

TEST_F(LedgerReaderTest, CustomDelimiter) {
    std::istringstream in("2020-12-04;Tecnologia;16.00;Bitbucket\n");
    core::Ledger ledger;
    ingest::LedgerReadError error{};
    ingest::LedgerReadOptions options{};
    options.delimiter = ';';
    ASSERT_TRUE(ingest::read_ledger(in, options, ledger, error)) << error.message;
    ASSERT_EQ(ledger.size(), 1u);
    EXPECT_EQ(ledger[0].department, "Tecnologia");

    std::istringstream comma("2020-12-04;Tecnologia;16.00;Bitbucket\n");
    EXPECT_FALSE(ingest::read_ledger(comma, ingest::LedgerReadOptions{}, ledger, error));
    EXPECT_EQ(error.result, ingest::ParseResult::FieldCount);
}

TEST_F(LedgerReaderTest, ReadsFileWithoutTrailingNewline) {
    const auto path = write_file("a.csv", "2020-12-04,Tecnologia,16.00,Bitbucket\n2020-12-05,Tecnologia,50.00,AWS");
    core::Ledger ledger;
    ingest::LedgerReadError error{};
    ASSERT_TRUE(ingest::read_ledger(path, ingest::LedgerReadOptions{}, ledger, error)) << error.message;
    ASSERT_EQ(ledger.size(), 2u);
    EXPECT_EQ(ledger[1].counterpart, "AWS");
}

TEST_F(LedgerReaderTest, MissingFileIsIoError) {
    core::Ledger ledger;
    ingest::LedgerReadError error{};
    EXPECT_FALSE(ingest::read_ledger(dir_ / "absent.csv", ingest::LedgerReadOptions{}, ledger, error));
    EXPECT_EQ(error.line, 0u);
    EXPECT_NE(error.message.find("absent.csv"), std::string::npos);
}

TEST_F(LedgerReaderTest, FileErrorNamesPath) {
    const auto path = write_file("bad.csv", "2020-12-04,Tecnologia,16.00\n");
    core::Ledger ledger;
    ingest::LedgerReadError error{};
    EXPECT_FALSE(ingest::read_ledger(path, ingest::LedgerReadOptions{}, ledger, error));
    EXPECT_EQ(error.line, 1u);
    EXPECT_EQ(error.result, ingest::ParseResult::FieldCount);
    EXPECT_NE(error.message.find("bad.csv"), std::string::npos);
}

} // namespace
