#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "hypoforge/dataset/dataset.hpp"

namespace hypoforge::sqlite {

// Table names from sqlite_master, in catalog order.
std::vector<std::string> list_tables(const std::filesystem::path& path);

// Loads the first table in catalog order in full. Any further tables are
// ignored. Throws BadInputError when the catalog is empty or the file is not
// a readable database.
Dataset read_first_table(const std::filesystem::path& path);

} // namespace hypoforge::sqlite
