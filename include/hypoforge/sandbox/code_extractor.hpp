#pragma once

#include <string>

namespace hypoforge {

// Returns the body of the last fenced Python block in text. A block opens with
// a line "```python", "```py" or a bare "```" and closes at the next line that
// starts with "```"; blocks tagged with another language and unterminated
// blocks are ignored. Leading blank lines of the body are dropped. Returns an
// empty string when no block is found.
std::string extract_code_block(const std::string& text);

} // namespace hypoforge
