#pragma once

#include <cf/value.h>
#include <string>

namespace cf {

// Strict JSON (plus // and /* */ comments) to Value. Objects keep document
// key order; integers that do not fit in int64 become doubles. Throws
// std::runtime_error with line, column and a caret excerpt on bad input.
Value parse_json(const std::string& text);

}  // namespace cf
