#include "hypoforge/dataset/sqlite_reader.hpp"
#include "hypoforge/errors.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace hypoforge::sqlite {

namespace {

class Connection {
public:
    explicit Connection(const std::filesystem::path& path) {
        const int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READONLY, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
            sqlite3_close(db_);
            db_ = nullptr;
            throw BadInputError("Cannot open database " + path.string() + ": " + msg);
        }
    }
    ~Connection() { if (db_) sqlite3_close(db_); }
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    sqlite3* get() const { return db_; }

private:
    sqlite3* db_ = nullptr;
};

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw BadInputError(std::string("Error reading database: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { if (stmt_) sqlite3_finalize(stmt_); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

std::string quote_identifier(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

std::string hex_blob(const void* data, int size) {
    static const char* kHex = "0123456789abcdef";
    const auto* bytes = static_cast<const unsigned char*>(data);
    std::string out = "x'";
    for (int i = 0; i < size; ++i) {
        out += kHex[bytes[i] >> 4];
        out += kHex[bytes[i] & 0x0F];
    }
    return out + "'";
}

struct CellBuffer {
    std::vector<double> numbers;
    std::vector<std::string> text;
    MissingMask missing;
    bool saw_integer = false;
    bool saw_float = false;
    bool saw_text = false;
    bool saw_blob = false;
};

std::vector<std::string> catalog(sqlite3* db) {
    Statement stmt(db, "SELECT name FROM sqlite_master WHERE type='table'");
    std::vector<std::string> tables;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        const auto* name = sqlite3_column_text(stmt.get(), 0);
        tables.emplace_back(name ? reinterpret_cast<const char*>(name) : "");
    }
    if (rc != SQLITE_DONE) {
        throw BadInputError(std::string("Error reading database catalog: ") + sqlite3_errmsg(db));
    }
    return tables;
}

} // namespace

std::vector<std::string> list_tables(const std::filesystem::path& path) {
    Connection conn(path);
    return catalog(conn.get());
}

Dataset read_first_table(const std::filesystem::path& path) {
    Connection conn(path);
    const auto tables = catalog(conn.get());
    if (tables.empty()) {
        throw BadInputError("No tables found in database");
    }
    const std::string& table = tables.front();
    if (tables.size() > 1) {
        spdlog::info("Database {} holds {} tables, loading '{}' only", path.string(), tables.size(), table);
    }

    Statement stmt(conn.get(), "SELECT * FROM " + quote_identifier(table));
    const int ncols = sqlite3_column_count(stmt.get());
    std::vector<std::string> names;
    std::vector<CellBuffer> buffers(static_cast<size_t>(ncols));
    for (int c = 0; c < ncols; ++c) {
        const char* name = sqlite3_column_name(stmt.get(), c);
        names.emplace_back(name ? name : "");
    }

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        for (int c = 0; c < ncols; ++c) {
            auto& buf = buffers[static_cast<size_t>(c)];
            double number = 0.0;
            std::string text;
            uint8_t is_null = 0;
            switch (sqlite3_column_type(stmt.get(), c)) {
                case SQLITE_INTEGER: {
                    const sqlite3_int64 v = sqlite3_column_int64(stmt.get(), c);
                    number = static_cast<double>(v);
                    text = std::to_string(v);
                    buf.saw_integer = true;
                    break;
                }
                case SQLITE_FLOAT: {
                    number = sqlite3_column_double(stmt.get(), c);
                    const auto* t = sqlite3_column_text(stmt.get(), c);
                    text = t ? reinterpret_cast<const char*>(t) : "";
                    buf.saw_float = true;
                    break;
                }
                case SQLITE_TEXT: {
                    const auto* t = sqlite3_column_text(stmt.get(), c);
                    text.assign(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(stmt.get(), c)));
                    buf.saw_text = true;
                    break;
                }
                case SQLITE_BLOB:
                    text = hex_blob(sqlite3_column_blob(stmt.get(), c), sqlite3_column_bytes(stmt.get(), c));
                    buf.saw_blob = true;
                    break;
                default:
                    is_null = 1;
                    break;
            }
            buf.numbers.push_back(number);
            buf.text.push_back(std::move(text));
            buf.missing.push_back(is_null);
        }
    }
    if (rc != SQLITE_DONE) {
        throw BadInputError(std::string("Error reading table '") + table + "': " + sqlite3_errmsg(conn.get()));
    }

    std::vector<Column> columns;
    columns.reserve(buffers.size());
    for (size_t c = 0; c < buffers.size(); ++c) {
        auto& buf = buffers[c];
        const bool numeric_only = !buf.saw_text && !buf.saw_blob;
        if (numeric_only) {
            columns.push_back(Column::numeric(names[c], std::move(buf.numbers), std::move(buf.missing),
                                              buf.saw_integer && !buf.saw_float));
        } else if (buf.saw_text && !buf.saw_integer && !buf.saw_float && !buf.saw_blob) {
            columns.push_back(Column::textual(names[c], std::move(buf.text), std::move(buf.missing)));
        } else {
            columns.push_back(Column::mixed(names[c], std::move(buf.text), std::move(buf.missing)));
        }
    }
    return Dataset(std::move(columns));
}

} // namespace hypoforge::sqlite
