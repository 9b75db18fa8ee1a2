#pragma once

#include <string>
#include <utility>
#include <vector>
#include "hypoforge/dataset/dataset.hpp"

namespace hypoforge {

// Plain-text summary of a dataset, used for display and as completion context.
// Columns without any present value are left out.
std::string describe(const Dataset& dataset);

// One "- name: ..." line, or an empty string for an all-missing column.
std::string describe_column(const Column& column);

// Most frequent present values, ties in first-appearance order.
std::vector<std::pair<std::string, size_t>> top_values(const Column& column, size_t limit);

} // namespace hypoforge
