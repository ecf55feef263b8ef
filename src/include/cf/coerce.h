#pragma once

#include <cf/errors.h>
#include <cf/types.h>
#include <cf/value.h>

namespace cf {

class ValidationPlan;

struct Coerced {
    Value value;
    ErrorList errors;

    bool ok() const noexcept { return errors.empty(); }
};

// Converts `raw` toward `type`. Never throws for bad data: every problem is
// returned as a FieldError under `path`. Lists and maps report every bad
// element. Model types are validated with the plan `scope` resolves for them.
// `raw` must be present; absent values are handled by the engine.
Coerced coerce(const Value& raw, const Type& type, const FieldPath& path, const ValidationPlan& scope);

// Closed set of accepted boolean spellings, compared case-insensitively.
bool parse_bool_token(const std::string& text, bool& out);

}  // namespace cf
