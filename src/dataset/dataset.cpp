#include "hypoforge/dataset/dataset.hpp"
#include "hypoforge/errors.hpp"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace hypoforge {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
constexpr const char* kSnapshotFormat = "hypoforge.columnar";
constexpr int kSnapshotVersion = 1;
}

const char* column_kind_name(ColumnKind kind) {
    switch (kind) {
        case ColumnKind::Numeric: return "numeric";
        case ColumnKind::Textual: return "textual";
        case ColumnKind::Temporal: return "temporal";
        case ColumnKind::Mixed: return "mixed";
    }
    return "mixed";
}

ColumnKind column_kind_from_name(const std::string& name) {
    if (name == "numeric") return ColumnKind::Numeric;
    if (name == "textual") return ColumnKind::Textual;
    if (name == "temporal") return ColumnKind::Temporal;
    if (name == "mixed") return ColumnKind::Mixed;
    throw BadInputError("Unknown column kind in snapshot: " + name);
}

size_t Column::present_count() const {
    return static_cast<size_t>(std::count(missing.begin(), missing.end(), uint8_t{0}));
}

Column Column::numeric(std::string name, std::vector<double> values, MissingMask missing, bool integral) {
    Column c;
    c.name = std::move(name);
    c.kind = ColumnKind::Numeric;
    c.integral = integral;
    for (size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) missing[i] = 1;
        if (missing[i]) values[i] = 0.0;
    }
    c.values = std::move(values);
    c.missing = std::move(missing);
    return c;
}

Column Column::textual(std::string name, std::vector<std::string> values, MissingMask missing) {
    Column c;
    c.name = std::move(name);
    c.kind = ColumnKind::Textual;
    for (size_t i = 0; i < values.size(); ++i) {
        if (missing[i]) values[i].clear();
    }
    c.values = std::move(values);
    c.missing = std::move(missing);
    return c;
}

Column Column::temporal(std::string name, std::vector<int64_t> values, MissingMask missing) {
    Column c;
    c.name = std::move(name);
    c.kind = ColumnKind::Temporal;
    for (size_t i = 0; i < values.size(); ++i) {
        if (missing[i]) values[i] = 0;
    }
    c.values = std::move(values);
    c.missing = std::move(missing);
    return c;
}

Column Column::mixed(std::string name, std::vector<std::string> values, MissingMask missing) {
    Column c = textual(std::move(name), std::move(values), std::move(missing));
    c.kind = ColumnKind::Mixed;
    return c;
}

bool Column::operator==(const Column& other) const {
    return name == other.name && kind == other.kind && integral == other.integral &&
           missing == other.missing && values == other.values;
}

Dataset::Dataset(std::vector<Column> columns) : columns_(std::move(columns)) {
    row_count_ = columns_.empty() ? 0 : columns_.front().size();
    for (const auto& c : columns_) {
        const size_t n = std::visit([](const auto& v) { return v.size(); }, c.values);
        if (c.size() != row_count_ || n != row_count_) {
            throw BadInputError("Column '" + c.name + "' is not aligned with the other columns");
        }
    }
}

int Dataset::find_column(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

bool Dataset::operator==(const Dataset& other) const {
    return row_count_ == other.row_count_ && columns_ == other.columns_;
}

json Dataset::to_snapshot_json() const {
    json cols = json::array();
    for (const auto& c : columns_) {
        json values = json::array();
        for (size_t row = 0; row < c.size(); ++row) {
            if (c.is_missing(row)) {
                values.push_back(nullptr);
                continue;
            }
            std::visit([&](const auto& v) { values.push_back(v[row]); }, c.values);
        }
        cols.push_back({
            {"name", c.name},
            {"kind", column_kind_name(c.kind)},
            {"integral", c.integral},
            {"values", std::move(values)}
        });
    }
    return json{
        {"format", kSnapshotFormat},
        {"version", kSnapshotVersion},
        {"row_count", row_count_},
        {"columns", std::move(cols)}
    };
}

Dataset Dataset::from_snapshot_json(const json& j) {
    try {
        if (j.value("format", "") != kSnapshotFormat || j.value("version", 0) != kSnapshotVersion) {
            throw BadInputError("Unrecognized snapshot format");
        }
        const size_t rows = j.at("row_count").get<size_t>();

        std::vector<Column> columns;
        for (const auto& jc : j.at("columns")) {
            const std::string name = jc.at("name").get<std::string>();
            const ColumnKind kind = column_kind_from_name(jc.at("kind").get<std::string>());
            const auto& values = jc.at("values");
            if (values.size() != rows) {
                throw BadInputError("Snapshot column '" + name + "' has a wrong length");
            }

            MissingMask missing(rows, 0);
            for (size_t r = 0; r < rows; ++r) missing[r] = values[r].is_null() ? 1 : 0;

            switch (kind) {
                case ColumnKind::Numeric: {
                    std::vector<double> v(rows, 0.0);
                    for (size_t r = 0; r < rows; ++r) if (!missing[r]) v[r] = values[r].get<double>();
                    columns.push_back(Column::numeric(name, std::move(v), std::move(missing), jc.value("integral", false)));
                    break;
                }
                case ColumnKind::Temporal: {
                    std::vector<int64_t> v(rows, 0);
                    for (size_t r = 0; r < rows; ++r) if (!missing[r]) v[r] = values[r].get<int64_t>();
                    columns.push_back(Column::temporal(name, std::move(v), std::move(missing)));
                    break;
                }
                case ColumnKind::Textual:
                case ColumnKind::Mixed: {
                    std::vector<std::string> v(rows);
                    for (size_t r = 0; r < rows; ++r) if (!missing[r]) v[r] = values[r].get<std::string>();
                    columns.push_back(kind == ColumnKind::Mixed
                        ? Column::mixed(name, std::move(v), std::move(missing))
                        : Column::textual(name, std::move(v), std::move(missing)));
                    break;
                }
            }
        }
        Dataset d(std::move(columns));
        d.row_count_ = rows;
        return d;
    } catch (const json::exception& e) {
        throw BadInputError(std::string("Corrupt snapshot: ") + e.what());
    }
}

void Dataset::write_snapshot(const fs::path& path) const {
    std::string text;
    try {
        text = to_snapshot_json().dump();
    } catch (const json::type_error& e) {
        // Text cells must survive the snapshot byte for byte.
        throw BadInputError(std::string("Dataset text is not valid UTF-8: ") + e.what());
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw PermissionDeniedError("Cannot write snapshot: " + path.string());
    }
    out << text;
    out.flush();
    if (!out) {
        throw PermissionDeniedError("Failed writing snapshot: " + path.string());
    }
}

Dataset Dataset::read_snapshot(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw NotFoundError("Snapshot not found: " + path.string());
    }
    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw BadInputError("Corrupt snapshot " + path.string() + ": " + e.what());
    }
    return from_snapshot_json(j);
}

std::string format_epoch_seconds(int64_t epoch_seconds) {
    const std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

} // namespace hypoforge
