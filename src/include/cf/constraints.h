#pragma once

#include <memory>
#include <regex>
#include <string>
#include <vector>

#include <cf/errors.h>
#include <cf/types.h>
#include <cf/value.h>

namespace cf {

struct Constraint {
    enum Kind { GreaterThan, GreaterEqual, LessThan, LessEqual, MultipleOf, MinLength, MaxLength, Pattern };

    Kind kind = GreaterEqual;
    // numeric or temporal bound, or the multiple_of divisor
    Value bound;
    int64_t length = 0;
    std::string pattern;

    // "greater_than_equal", "too_short", "pattern_mismatch", ...
    std::string code() const;
    // "ge 0", "max_length 10", "pattern ^[a-z]+$"
    std::string describe() const;
};

// Ordered constraint set; violations are reported in this order.
class Constraints {
  public:
    Constraints& gt(Value bound) { return add(Constraint::GreaterThan, std::move(bound)); }
    Constraints& ge(Value bound) { return add(Constraint::GreaterEqual, std::move(bound)); }
    Constraints& lt(Value bound) { return add(Constraint::LessThan, std::move(bound)); }
    Constraints& le(Value bound) { return add(Constraint::LessEqual, std::move(bound)); }
    Constraints& multiple_of(Value divisor) { return add(Constraint::MultipleOf, std::move(divisor)); }

    Constraints& min_length(int64_t n) {
        Constraint c;
        c.kind = Constraint::MinLength;
        c.length = n;
        m_items.push_back(c);
        return *this;
    }

    Constraints& max_length(int64_t n) {
        Constraint c;
        c.kind = Constraint::MaxLength;
        c.length = n;
        m_items.push_back(c);
        return *this;
    }

    Constraints& pattern(const std::string& regex) {
        Constraint c;
        c.kind = Constraint::Pattern;
        c.pattern = regex;
        m_items.push_back(c);
        return *this;
    }

    const std::vector<Constraint>& items() const noexcept { return m_items; }
    bool empty() const noexcept { return m_items.empty(); }

  private:
    Constraints& add(Constraint::Kind kind, Value bound) {
        Constraint c;
        c.kind = kind;
        c.bound = std::move(bound);
        m_items.push_back(c);
        return *this;
    }

    std::vector<Constraint> m_items;
};

// A constraint ready to evaluate; the pattern is compiled once.
struct CompiledConstraint {
    Constraint spec;
    std::shared_ptr<const std::regex> regex;
};

// Throws std::regex_error for invalid patterns and std::invalid_argument for
// bounds that cannot be used (non-numeric divisor, negative length, ...).
CompiledConstraint compile_constraint(const Constraint& c);

// Whether `c` can ever apply to values of the declared type.
bool constraint_applies(const Constraint& c, const Type& type);

// Checks every constraint against an already coerced value and returns all
// violations in declaration order. Constraints that do not apply to the
// value's kind are skipped. A pattern is only matched against strings of at
// most 2048 bytes; longer strings fail with code "pattern_input_too_long".
ErrorList check_constraints(const Value& value, const std::vector<CompiledConstraint>& constraints,
                            const FieldPath& path);

// Number of UTF-8 code points in `s`
int64_t utf8_length(const std::string& s);

}  // namespace cf
