#include <gtest/gtest.h>
#include "divsim/data_loader.hpp"
#include "divsim/constants.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using namespace divsim;
using namespace divsim::constants;

// ─── parse_csv_string ─────────────────────────────────────────────────────────

TEST(EnvLoaderParseCsv, EmptyStringGivesNullopt) {
    EXPECT_FALSE(EnvironmentLoader::parse_csv_string("").has_value());
}

TEST(EnvLoaderParseCsv, HeaderOnlyGivesNullopt) {
    EXPECT_FALSE(EnvironmentLoader::parse_csv_string("time,temperature\n").has_value());
}

TEST(EnvLoaderParseCsv, ValidRowsAreParsed) {
    auto table = EnvironmentLoader::parse_csv_string(
        "time,temperature\n"
        "0.0,14.2\n"
        "0.5,14.6\n"
        "1.0,15.0\n");
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->size(), 3u);
    EXPECT_NEAR(table->at(0.25), 14.4, FLOAT_EPSILON);
}

TEST(EnvLoaderParseCsv, MalformedRowSkipped) {
    auto table = EnvironmentLoader::parse_csv_string(
        "time,temperature\n"
        "bad,row\n"
        "1.0,2.0,3.0\n"
        "2.0x,5.0\n"
        "2.0,5.0\n");
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->size(), 1u);
    EXPECT_DOUBLE_EQ(table->start_time(), 2.0);
}

TEST(EnvLoaderParseCsv, NaNRowSkipped) {
    auto table = EnvironmentLoader::parse_csv_string(
        "time,co2\n"
        "0.0,nan\n"
        "1.0,280.0\n");
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->size(), 1u);
}

TEST(EnvLoaderParseCsv, CommentsAndCarriageReturnsIgnored) {
    auto table = EnvironmentLoader::parse_csv_string(
        "# exported series\r\n"
        "time,value\r\n"
        "# a comment row\r\n"
        "0.0, 1.0\r\n"
        "2.0 ,3.0\r\n");
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->size(), 2u);
    EXPECT_NEAR(table->at(1.0), 2.0, FLOAT_EPSILON);
}

TEST(EnvLoaderParseCsv, UnorderedRowsAreSorted) {
    auto table = EnvironmentLoader::parse_csv_string(
        "time,value\n"
        "10.0,3.0\n"
        "0.0,1.0\n"
        "5.0,2.0\n");
    ASSERT_TRUE(table.has_value());
    ASSERT_EQ(table->size(), 3u);
    EXPECT_DOUBLE_EQ(table->times()[0], 0.0);
    EXPECT_DOUBLE_EQ(table->times()[1], 5.0);
    EXPECT_DOUBLE_EQ(table->times()[2], 10.0);
    EXPECT_DOUBLE_EQ(table->values()[2], 3.0);
}

TEST(EnvLoaderParseCsv, DuplicateTimeGivesNullopt) {
    EXPECT_FALSE(EnvironmentLoader::parse_csv_string(
        "time,value\n"
        "1.0,3.0\n"
        "1.0,4.0\n").has_value());
}

// ─── load_csv ─────────────────────────────────────────────────────────────────

TEST(EnvLoaderLoadCsv, MissingFileGivesNullopt) {
    EXPECT_FALSE(EnvironmentLoader::load_csv("/nonexistent/divsim/env.csv").has_value());
}

TEST(EnvLoaderLoadCsv, FileOnDiskIsParsed) {
    const auto path = std::filesystem::temp_directory_path() / "divsim_test_env.csv";
    {
        std::ofstream out(path);
        out << "time,temperature\n0,10\n4,18\n";
    }

    auto table = EnvironmentLoader::load_csv(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->size(), 2u);
    EXPECT_NEAR(table->at(1.0), 12.0, FLOAT_EPSILON);
}
