#include "hypoforge/dataset/csv_reader.hpp"
#include "hypoforge/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <unordered_map>

namespace hypoforge::csv {

namespace {

std::string trim(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parse_fixed_int(const std::string& s, size_t offset, size_t len, int& out) {
    if (offset + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        const unsigned char ch = static_cast<unsigned char>(s[offset + i]);
        if (ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<int>(ch - '0');
    }
    out = value;
    return true;
}

bool is_leap_year(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return year % 4 == 0;
}

int days_in_month(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return is_leap_year(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

int64_t days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool parse_time_of_day(std::string part, int& hour, int& minute, int& second) {
    hour = minute = second = 0;
    if (part.empty()) return true;
    if (part.back() == 'Z') part.pop_back();
    const size_t frac = part.find('.');
    if (frac != std::string::npos) {
        const std::string digits = part.substr(frac + 1);
        if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        part.resize(frac);
    }
    if (part.size() == 5) {
        if (!parse_fixed_int(part, 0, 2, hour) || part[2] != ':' || !parse_fixed_int(part, 3, 2, minute)) return false;
    } else if (part.size() == 8) {
        if (!parse_fixed_int(part, 0, 2, hour) || part[2] != ':' ||
            !parse_fixed_int(part, 3, 2, minute) || part[5] != ':' ||
            !parse_fixed_int(part, 6, 2, second)) {
            return false;
        }
    } else {
        return false;
    }
    return hour < 24 && minute < 60 && second < 61;
}

// Treats a lone empty field as a blank line.
bool is_blank_record(const std::vector<std::string>& fields) {
    return fields.size() == 1 && fields.front().empty();
}

Column infer_column(std::string name, const std::vector<std::string>& tokens) {
    const size_t rows = tokens.size();
    MissingMask missing(rows, 0);
    std::vector<double> numbers(rows, 0.0);
    std::vector<int64_t> stamps(rows, 0);

    bool all_numeric = true;
    bool all_integral = true;
    bool all_temporal = true;
    bool all_num_or_time = true;

    for (size_t r = 0; r < rows; ++r) {
        if (is_missing_token(tokens[r])) {
            missing[r] = 1;
            continue;
        }
        bool integral = false;
        const bool num = parse_number(tokens[r], numbers[r], integral);
        const bool time = !num && parse_timestamp(tokens[r], stamps[r]);
        all_numeric = all_numeric && num;
        all_integral = all_integral && num && integral;
        all_temporal = all_temporal && time;
        all_num_or_time = all_num_or_time && (num || time);
    }

    if (all_numeric) {
        return Column::numeric(std::move(name), std::move(numbers), std::move(missing), all_integral);
    }
    if (all_temporal) {
        return Column::temporal(std::move(name), std::move(stamps), std::move(missing));
    }
    std::vector<std::string> text(tokens.begin(), tokens.end());
    if (all_num_or_time) {
        return Column::mixed(std::move(name), std::move(text), std::move(missing));
    }
    return Column::textual(std::move(name), std::move(text), std::move(missing));
}

} // namespace

void skip_bom(std::istream& is) {
    char bom[3] = {0, 0, 0};
    is.read(bom, 3);
    const bool has_bom = is.gcount() == 3 &&
        static_cast<unsigned char>(bom[0]) == 0xEF &&
        static_cast<unsigned char>(bom[1]) == 0xBB &&
        static_cast<unsigned char>(bom[2]) == 0xBF;
    if (!has_bom) {
        is.clear();
        is.seekg(0);
    }
}

bool read_record(std::istream& is, char delimiter, std::vector<std::string>& fields) {
    fields.clear();
    if (is.peek() == std::char_traits<char>::eof()) return false;

    std::string val;
    bool in_quotes = false;
    bool quoted = false;
    auto push_field = [&]() {
        fields.push_back(quoted ? val : trim(val));
        val.clear();
        quoted = false;
    };

    char c;
    while (is.get(c)) {
        if (in_quotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    val += '"';
                } else {
                    in_quotes = false;
                }
            } else {
                val += c;
            }
            continue;
        }

        if (c == '"' && !quoted && trim(val).empty()) {
            in_quotes = true;
            quoted = true;
            val.clear();
        } else if (c == delimiter) {
            push_field();
        } else if (c == '\r') {
            if (is.peek() == '\n') is.get();
            push_field();
            return true;
        } else if (c == '\n') {
            push_field();
            return true;
        } else {
            val += c;
        }
    }
    push_field();
    return true;
}

bool is_missing_token(const std::string& token) {
    const std::string s = to_lower(trim(token));
    return s.empty() || s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan";
}

bool parse_number(const std::string& token, double& out, bool& integral) {
    const std::string s = trim(token);
    if (s.empty()) return false;

    bool digits = false;
    bool plain_integer = true;
    for (size_t i = 0; i < s.size(); ++i) {
        const char ch = s[i];
        if (ch >= '0' && ch <= '9') {
            digits = true;
        } else if ((ch == '+' || ch == '-') && (i == 0 || s[i - 1] == 'e' || s[i - 1] == 'E')) {
            if (i != 0) plain_integer = false;
        } else if (ch == '.' || ch == 'e' || ch == 'E') {
            plain_integer = false;
        } else {
            return false;
        }
    }
    if (!digits) return false;

    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || errno == ERANGE || !std::isfinite(value)) return false;

    out = value;
    integral = plain_integer;
    return true;
}

bool parse_timestamp(const std::string& token, int64_t& epoch_seconds) {
    const std::string s = trim(token);
    if (s.size() < 10) return false;

    int year = 0, month = 0, day = 0;
    const char sep = s[4];
    if ((sep != '-' && sep != '/') || s[7] != sep) return false;
    if (!parse_fixed_int(s, 0, 4, year) || !parse_fixed_int(s, 5, 2, month) || !parse_fixed_int(s, 8, 2, day)) {
        return false;
    }
    if (day < 1 || day > days_in_month(year, month)) return false;

    int hour = 0, minute = 0, second = 0;
    if (s.size() > 10) {
        if (s[10] != ' ' && s[10] != 'T') return false;
        if (!parse_time_of_day(s.substr(11), hour, minute, second)) return false;
    }

    const int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    epoch_seconds = days * 86400 + hour * 3600 + minute * 60 + second;
    return true;
}

std::vector<std::string> normalize_header(const std::vector<std::string>& header) {
    std::vector<std::string> out;
    out.reserve(header.size());
    std::unordered_map<std::string, int> seen;
    for (size_t i = 0; i < header.size(); ++i) {
        std::string name = header[i].empty() ? "Unnamed: " + std::to_string(i) : header[i];
        const int count = seen[name]++;
        if (count > 0) {
            std::string candidate = name + "." + std::to_string(count);
            while (seen.count(candidate)) candidate += "_";
            seen[candidate] = 1;
            name = candidate;
        }
        out.push_back(std::move(name));
    }
    return out;
}

Dataset parse_delimited(std::istream& is, char delimiter) {
    skip_bom(is);

    std::vector<std::string> fields;
    std::vector<std::string> header;
    while (read_record(is, delimiter, fields)) {
        if (!is_blank_record(fields)) {
            header = fields;
            break;
        }
    }
    if (header.empty()) {
        throw BadInputError("The file is empty or contains no valid data");
    }
    header = normalize_header(header);

    std::vector<std::vector<std::string>> cells(header.size());
    size_t line = 1;
    while (read_record(is, delimiter, fields)) {
        ++line;
        if (is_blank_record(fields)) continue;
        if (fields.size() > header.size()) {
            throw BadInputError("Error parsing file: Expected " + std::to_string(header.size()) +
                                " fields in line " + std::to_string(line) + ", saw " +
                                std::to_string(fields.size()));
        }
        fields.resize(header.size());
        for (size_t c = 0; c < header.size(); ++c) {
            cells[c].push_back(std::move(fields[c]));
        }
    }

    std::vector<Column> columns;
    columns.reserve(header.size());
    for (size_t c = 0; c < header.size(); ++c) {
        columns.push_back(infer_column(header[c], cells[c]));
    }
    return Dataset(std::move(columns));
}

Dataset read_delimited(const std::filesystem::path& path, char delimiter) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw PermissionDeniedError("Permission denied accessing file: " + path.string());
    }
    return parse_delimited(in, delimiter);
}

} // namespace hypoforge::csv
