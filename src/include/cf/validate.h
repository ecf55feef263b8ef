#pragma once

#include <memory>

#include <cf/plan.h>
#include <cf/record.h>
#include <cf/schema.h>
#include <cf/value.h>

namespace cf {

// Validate `raw` against a compiled plan. Bad data never throws; every
// problem found is reported in the result.
ValidationResult validate(const ValidationPlan& plan, const Value& raw);

// Compiles `schema` on first use (throws CompileError for a broken schema).
ValidationResult validate(const std::shared_ptr<const Schema>& schema, const Value& raw);

// Validate and return the record, throwing std::logic_error with the
// formatted error report when the input is invalid.
Record validate_or_throw(const std::shared_ptr<const Schema>& schema, const Value& raw);

}  // namespace cf
