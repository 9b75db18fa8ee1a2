#include "hypoforge/sandbox/code_extractor.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace hypoforge {

namespace {

std::string trim(const std::string& s) {
    const size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    const size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

bool is_fence(const std::string& line) {
    return line.rfind("```", 0) == 0;
}

bool opens_python_block(const std::string& fence_line) {
    std::string tag = trim(fence_line.substr(3));
    std::transform(tag.begin(), tag.end(), tag.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return tag.empty() || tag == "python" || tag == "py" || tag == "python3";
}

} // namespace

std::string extract_code_block(const std::string& text) {
    std::istringstream in(text);
    std::string raw;
    std::string last;

    bool inside = false;
    bool wanted = false;
    std::vector<std::string> body;

    while (std::getline(in, raw)) {
        if (!raw.empty() && raw.back() == '\r') raw.pop_back();
        const std::string line = trim(raw);

        if (!inside) {
            if (is_fence(line)) {
                inside = true;
                wanted = opens_python_block(line);
                body.clear();
            }
            continue;
        }

        if (is_fence(line)) {
            if (wanted) {
                auto first = std::find_if(body.begin(), body.end(),
                                          [](const std::string& l) { return !trim(l).empty(); });
                std::string code;
                for (auto it = first; it != body.end(); ++it) {
                    if (it != first) code += '\n';
                    code += *it;
                }
                last = std::move(code);
            }
            inside = false;
            continue;
        }
        body.push_back(raw);
    }
    return last;
}

} // namespace hypoforge
