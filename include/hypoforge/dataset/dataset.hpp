#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace hypoforge {

// Column classification, computed once when a dataset is built.
enum class ColumnKind { Numeric, Textual, Temporal, Mixed };

const char* column_kind_name(ColumnKind kind);
ColumnKind column_kind_from_name(const std::string& name);

// Numeric -> double, Temporal -> epoch seconds, Textual/Mixed -> string.
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>, std::vector<int64_t>>;
using MissingMask = std::vector<uint8_t>;

struct Column {
    std::string name;
    ColumnKind kind = ColumnKind::Textual;
    bool integral = false;   // numeric values originated as integers
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;

    size_t size() const { return missing.size(); }
    bool is_missing(size_t row) const { return missing[row] != 0; }
    size_t present_count() const;

    static Column numeric(std::string name, std::vector<double> values, MissingMask missing, bool integral = false);
    static Column textual(std::string name, std::vector<std::string> values, MissingMask missing);
    static Column temporal(std::string name, std::vector<int64_t> values, MissingMask missing);
    static Column mixed(std::string name, std::vector<std::string> values, MissingMask missing);

    bool operator==(const Column& other) const;
};

class Dataset {
public:
    Dataset() = default;

    // Throws BadInputError when columns are not row-aligned.
    explicit Dataset(std::vector<Column> columns);

    size_t row_count() const { return row_count_; }
    size_t column_count() const { return columns_.size(); }

    const std::vector<Column>& columns() const { return columns_; }
    const Column& column(size_t index) const { return columns_.at(index); }

    // Index of the named column or -1 when absent.
    int find_column(const std::string& name) const;

    bool operator==(const Dataset& other) const;

    // Self-describing columnar snapshot (hypoforge.columnar v1).
    nlohmann::json to_snapshot_json() const;
    static Dataset from_snapshot_json(const nlohmann::json& j);

    void write_snapshot(const std::filesystem::path& path) const;
    static Dataset read_snapshot(const std::filesystem::path& path);

private:
    std::vector<Column> columns_;
    size_t row_count_ = 0;
};

// "YYYY-MM-DD HH:MM:SS" in UTC.
std::string format_epoch_seconds(int64_t epoch_seconds);

} // namespace hypoforge
