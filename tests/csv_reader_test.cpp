#include <gtest/gtest.h>
#include <sstream>
#include "hypoforge/dataset/csv_reader.hpp"
#include "hypoforge/errors.hpp"

using namespace hypoforge;

namespace {
Dataset parse(const std::string& text, char delimiter = ',') {
    std::istringstream in(text);
    return csv::parse_delimited(in, delimiter);
}
}

// ==========================================
// Tokenizer
// ==========================================

TEST(CsvRecordTest, QuotedFieldsKeepDelimitersAndNewlines) {
    std::istringstream in("a,\"b,c\",\"line1\nline2\",\"say \"\"hi\"\"\"\nnext\n");
    std::vector<std::string> fields;
    ASSERT_TRUE(csv::read_record(in, ',', fields));
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[1], "b,c");
    EXPECT_EQ(fields[2], "line1\nline2");
    EXPECT_EQ(fields[3], "say \"hi\"");
    ASSERT_TRUE(csv::read_record(in, ',', fields));
    EXPECT_EQ(fields[0], "next");
    EXPECT_FALSE(csv::read_record(in, ',', fields));
}

TEST(CsvRecordTest, UnquotedFieldsAreTrimmed) {
    std::istringstream in("  x \t,y\r\n");
    std::vector<std::string> fields;
    ASSERT_TRUE(csv::read_record(in, ',', fields));
    EXPECT_EQ(fields[0], "x");
    EXPECT_EQ(fields[1], "y");
}

// ==========================================
// Token classification
// ==========================================

TEST(CsvTokenTest, MissingTokens) {
    for (const char* token : {"", " ", "NA", "n/a", "NULL", "None", "nan"}) {
        EXPECT_TRUE(csv::is_missing_token(token)) << token;
    }
    EXPECT_FALSE(csv::is_missing_token("0"));
    EXPECT_FALSE(csv::is_missing_token("nancy"));
}

TEST(CsvTokenTest, Numbers) {
    double v = 0;
    bool integral = false;
    EXPECT_TRUE(csv::parse_number("42", v, integral));
    EXPECT_DOUBLE_EQ(v, 42.0);
    EXPECT_TRUE(integral);
    EXPECT_TRUE(csv::parse_number("-3.5e2", v, integral));
    EXPECT_DOUBLE_EQ(v, -350.0);
    EXPECT_FALSE(integral);
    EXPECT_FALSE(csv::parse_number("12abc", v, integral));
    EXPECT_FALSE(csv::parse_number("inf", v, integral));
    EXPECT_FALSE(csv::parse_number("-", v, integral));
}

TEST(CsvTokenTest, Timestamps) {
    int64_t t = 0;
    EXPECT_TRUE(csv::parse_timestamp("1970-01-02", t));
    EXPECT_EQ(t, 86400);
    EXPECT_TRUE(csv::parse_timestamp("2024-02-29T12:30:00Z", t));
    EXPECT_EQ(format_epoch_seconds(t), "2024-02-29 12:30:00");
    EXPECT_FALSE(csv::parse_timestamp("2023-02-29", t));
    EXPECT_FALSE(csv::parse_timestamp("2024-13-01", t));
    EXPECT_FALSE(csv::parse_timestamp("yesterday", t));
}

TEST(CsvHeaderTest, BlankAndDuplicateNames) {
    auto names = csv::normalize_header({"a", "", "a", "a"});
    ASSERT_EQ(names.size(), 4u);
    EXPECT_EQ(names[0], "a");
    EXPECT_EQ(names[1], "Unnamed: 1");
    EXPECT_EQ(names[2], "a.1");
    EXPECT_EQ(names[3], "a.2");
}

// ==========================================
// Table parsing
// ==========================================

TEST(CsvParseTest, InfersColumnKinds) {
    auto d = parse(
        "id,price,city,when,blend\n"
        "1,9.5,Paris,2024-01-01,3\n"
        "2,NA,Rome,2024-01-02,2024-05-05\n"
        "3,7.25,Paris,,x\n");
    ASSERT_EQ(d.row_count(), 3u);
    ASSERT_EQ(d.column_count(), 5u);

    EXPECT_EQ(d.column(0).kind, ColumnKind::Numeric);
    EXPECT_TRUE(d.column(0).integral);
    EXPECT_EQ(d.column(1).kind, ColumnKind::Numeric);
    EXPECT_FALSE(d.column(1).integral);
    EXPECT_TRUE(d.column(1).is_missing(1));
    EXPECT_EQ(d.column(2).kind, ColumnKind::Textual);
    EXPECT_EQ(d.column(3).kind, ColumnKind::Temporal);
    EXPECT_TRUE(d.column(3).is_missing(2));
    EXPECT_EQ(d.column(4).kind, ColumnKind::Textual);
}

TEST(CsvParseTest, NumbersAndDatesTogetherAreMixed) {
    auto d = parse("v\n1\n2024-01-01\n");
    EXPECT_EQ(d.column(0).kind, ColumnKind::Mixed);
}

TEST(CsvParseTest, ShortRowsArePaddedWithMissing) {
    auto d = parse("a,b\n1\n2,3\n");
    ASSERT_EQ(d.row_count(), 2u);
    EXPECT_TRUE(d.column(1).is_missing(0));
    EXPECT_FALSE(d.column(1).is_missing(1));
}

TEST(CsvParseTest, SkipsBomAndBlankLines) {
    auto d = parse("\xEF\xBB\xBFname\n\nalice\n\nbob\n");
    EXPECT_EQ(d.column(0).name, "name");
    EXPECT_EQ(d.row_count(), 2u);
}

TEST(CsvParseTest, TabDelimited) {
    auto d = parse("a\tb\n1\tx\n", '\t');
    ASSERT_EQ(d.column_count(), 2u);
    EXPECT_EQ(d.column(1).name, "b");
}

TEST(CsvParseTest, HeaderOnlyGivesZeroRows) {
    auto d = parse("a,b\n");
    EXPECT_EQ(d.row_count(), 0u);
    EXPECT_EQ(d.column_count(), 2u);
}

TEST(CsvParseTest, EmptyInputIsRejected) {
    EXPECT_THROW(parse(""), BadInputError);
    EXPECT_THROW(parse("\n\n"), BadInputError);
}

TEST(CsvParseTest, WideRowIsRejected) {
    try {
        parse("a,b\n1,2,3\n");
        FAIL() << "expected BadInputError";
    } catch (const BadInputError& e) {
        EXPECT_NE(std::string(e.what()).find("Expected 2 fields in line 2, saw 3"), std::string::npos);
    }
}
