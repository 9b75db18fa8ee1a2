#include "hypoforge/dataset/description.hpp"
#include <algorithm>
#include <cstdio>
#include <unordered_map>
#include <unordered_set>

namespace hypoforge {

namespace {

std::string fixed2(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

size_t unique_count(const Column& column) {
    const auto& values = std::get<std::vector<std::string>>(column.values);
    std::unordered_set<std::string> seen;
    for (size_t r = 0; r < values.size(); ++r) {
        if (!column.is_missing(r)) seen.insert(values[r]);
    }
    return seen.size();
}

std::string describe_numeric(const Column& column) {
    const auto& values = std::get<std::vector<double>>(column.values);
    double sum = 0.0;
    double lo = 0.0, hi = 0.0;
    size_t n = 0;
    for (size_t r = 0; r < values.size(); ++r) {
        if (column.is_missing(r)) continue;
        const double v = values[r];
        if (n == 0) {
            lo = hi = v;
        } else {
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
        sum += v;
        ++n;
    }
    return "numeric. mean: " + fixed2(sum / static_cast<double>(n)) +
           " min: " + fixed2(lo) + " max: " + fixed2(hi);
}

std::string describe_temporal(const Column& column) {
    const auto& values = std::get<std::vector<int64_t>>(column.values);
    bool first = true;
    int64_t lo = 0, hi = 0;
    for (size_t r = 0; r < values.size(); ++r) {
        if (column.is_missing(r)) continue;
        if (first) {
            lo = hi = values[r];
            first = false;
        } else {
            lo = std::min(lo, values[r]);
            hi = std::max(hi, values[r]);
        }
    }
    return "date. min: " + format_epoch_seconds(lo) + " max: " + format_epoch_seconds(hi);
}

std::string describe_textual(const Column& column) {
    std::string examples;
    for (const auto& [value, count] : top_values(column, 3)) {
        if (!examples.empty()) examples += ", ";
        examples += value + " (" + std::to_string(count) + ")";
    }
    return "string. " + std::to_string(unique_count(column)) + " unique values. E.g. " + examples;
}

} // namespace

std::vector<std::pair<std::string, size_t>> top_values(const Column& column, size_t limit) {
    const auto& values = std::get<std::vector<std::string>>(column.values);
    std::vector<std::pair<std::string, size_t>> counts;
    std::unordered_map<std::string, size_t> index;
    for (size_t r = 0; r < values.size(); ++r) {
        if (column.is_missing(r)) continue;
        auto it = index.find(values[r]);
        if (it == index.end()) {
            index.emplace(values[r], counts.size());
            counts.emplace_back(values[r], 1);
        } else {
            ++counts[it->second].second;
        }
    }
    std::stable_sort(counts.begin(), counts.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (counts.size() > limit) counts.resize(limit);
    return counts;
}

std::string describe_column(const Column& column) {
    if (column.present_count() == 0) return "";

    std::string desc;
    switch (column.kind) {
        case ColumnKind::Numeric: desc = describe_numeric(column); break;
        case ColumnKind::Temporal: desc = describe_temporal(column); break;
        case ColumnKind::Textual: desc = describe_textual(column); break;
        case ColumnKind::Mixed:
            desc = "mixed type with " + std::to_string(unique_count(column)) + " unique values";
            break;
    }
    return "- " + column.name + ": " + desc;
}

std::string describe(const Dataset& dataset) {
    std::string lines;
    for (const auto& column : dataset.columns()) {
        std::string line = describe_column(column);
        if (line.empty()) continue;
        if (!lines.empty()) lines += "\n";
        lines += line;
    }
    return "The Pandas DataFrame df has " + std::to_string(dataset.row_count()) + " rows and " +
           std::to_string(dataset.column_count()) + " columns:\n" + lines;
}

} // namespace hypoforge
