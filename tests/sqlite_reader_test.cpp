#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sqlite3.h>
#include "hypoforge/dataset/sqlite_reader.hpp"
#include "hypoforge/errors.hpp"
#include "hypoforge/uuid.hpp"

using namespace hypoforge;
namespace fs = std::filesystem;

class SqliteReaderTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("hypoforge-sqlite-" + generate_uuid());
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path make_db(const std::string& name, const std::string& sql) {
        const fs::path path = dir / name;
        sqlite3* db = nullptr;
        EXPECT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
        char* err = nullptr;
        EXPECT_EQ(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err), SQLITE_OK) << (err ? err : "");
        sqlite3_free(err);
        sqlite3_close(db);
        return path;
    }
};

TEST_F(SqliteReaderTest, ReadsFirstTableWithKinds) {
    auto path = make_db("shop.db",
        "CREATE TABLE orders (id INTEGER, amount REAL, customer TEXT, note);"
        "INSERT INTO orders VALUES (1, 9.5, 'ann', 'x');"
        "INSERT INTO orders VALUES (2, NULL, 'bob', 7);"
        "INSERT INTO orders VALUES (3, 4.0, NULL, X'0aff');");

    Dataset d = sqlite::read_first_table(path);
    ASSERT_EQ(d.row_count(), 3u);
    ASSERT_EQ(d.column_count(), 4u);

    EXPECT_EQ(d.column(0).name, "id");
    EXPECT_EQ(d.column(0).kind, ColumnKind::Numeric);
    EXPECT_TRUE(d.column(0).integral);

    EXPECT_EQ(d.column(1).kind, ColumnKind::Numeric);
    EXPECT_FALSE(d.column(1).integral);
    EXPECT_TRUE(d.column(1).is_missing(1));

    EXPECT_EQ(d.column(2).kind, ColumnKind::Textual);
    EXPECT_TRUE(d.column(2).is_missing(2));

    EXPECT_EQ(d.column(3).kind, ColumnKind::Mixed);
    const auto& notes = std::get<std::vector<std::string>>(d.column(3).values);
    EXPECT_EQ(notes[1], "7");
    EXPECT_EQ(notes[2], "x'0aff'");
}

TEST_F(SqliteReaderTest, OnlyFirstTableIsLoaded) {
    auto path = make_db("two.sqlite",
        "CREATE TABLE first (a INTEGER);"
        "CREATE TABLE second (b TEXT, c TEXT);"
        "INSERT INTO first VALUES (1);"
        "INSERT INTO second VALUES ('x', 'y');");

    auto tables = sqlite::list_tables(path);
    ASSERT_EQ(tables.size(), 2u);
    EXPECT_EQ(tables[0], "first");

    Dataset d = sqlite::read_first_table(path);
    EXPECT_EQ(d.column_count(), 1u);
    EXPECT_EQ(d.column(0).name, "a");
}

TEST_F(SqliteReaderTest, QuotedTableName) {
    auto path = make_db("odd.db",
        "CREATE TABLE \"my \"\"odd\"\" table\" (v INTEGER);"
        "INSERT INTO \"my \"\"odd\"\" table\" VALUES (5);");
    Dataset d = sqlite::read_first_table(path);
    EXPECT_EQ(d.row_count(), 1u);
}

TEST_F(SqliteReaderTest, EmptyCatalogIsRejected) {
    auto path = make_db("empty.db", "PRAGMA user_version = 1;");
    try {
        sqlite::read_first_table(path);
        FAIL() << "expected BadInputError";
    } catch (const BadInputError& e) {
        EXPECT_STREQ(e.what(), "No tables found in database");
    }
}

TEST_F(SqliteReaderTest, NotADatabaseIsRejected) {
    const fs::path path = dir / "fake.db";
    std::ofstream(path) << "this is plain text, not sqlite, padded out to look like a header.....";
    EXPECT_THROW(sqlite::read_first_table(path), BadInputError);
}
