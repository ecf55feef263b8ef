#include <cf/constraints.h>

#include <cmath>
#include <sstream>

namespace cf {

namespace {

// Tolerance for multiple_of on binary floating point values, relative to the divisor.
constexpr double kMultipleOfEpsilon = 1e-9;

// std::regex_match recurses once per input character; longer strings are
// reported as violations instead of being matched.
constexpr size_t kMaxPatternInput = 2048;

// 2^63, the first double above the int64 range
constexpr double kInt64Limit = 9223372036854775808.0;

bool is_temporal(const Value& v) { return v.isDate() || v.isTime() || v.isDateTime(); }

// Exact three-way compare of an integer against a double.
int compare_int_double(int64_t i, double d) {
    if (d >= kInt64Limit) return -1;
    if (d < -kInt64Limit) return 1;
    double f = std::floor(d);
    auto fi = static_cast<int64_t>(f);
    if (i < fi) return -1;
    if (i > fi) return 1;
    return d == f ? 0 : -1;
}

// Three-way compare of two comparable values: numbers with numbers, and
// temporal values of the same kind. Returns false when not comparable.
bool compare(const Value& a, const Value& b, int& out) {
    if (a.isNumber() && b.isNumber()) {
        if (a.isInt() && b.isInt()) {
            out = a.asInt() < b.asInt() ? -1 : (a.asInt() > b.asInt() ? 1 : 0);
        } else if (a.isInt() && !std::isnan(b.asDouble())) {
            out = compare_int_double(a.asInt(), b.asDouble());
        } else if (b.isInt() && !std::isnan(a.asDouble())) {
            out = -compare_int_double(b.asInt(), a.asDouble());
        } else {
            double x = a.asDouble(), y = b.asDouble();
            out = x < y ? -1 : (x > y ? 1 : 0);
        }
        return true;
    }
    if (a.type() != b.type()) return false;
    int64_t x = 0, y = 0;
    if (a.isDate()) {
        x = a.asDate().days_since_epoch();
        y = b.asDate().days_since_epoch();
    } else if (a.isTime()) {
        x = a.asTime().microseconds_since_midnight();
        y = b.asTime().microseconds_since_midnight();
    } else if (a.isDateTime()) {
        x = a.asDateTime().epoch_microseconds();
        y = b.asDateTime().epoch_microseconds();
    } else {
        return false;
    }
    out = x < y ? -1 : (x > y ? 1 : 0);
    return true;
}

bool is_multiple(const Value& v, const Value& divisor) {
    if (v.isInt() && divisor.isInt()) {
        // INT64_MIN % -1 overflows
        if (divisor.asInt() == 1 || divisor.asInt() == -1) return true;
        return v.asInt() % divisor.asInt() == 0;
    }
    double m = std::fabs(divisor.asDouble());
    double r = std::fabs(std::fmod(v.asDouble(), m));
    double tol = kMultipleOfEpsilon * m;
    return r <= tol || std::fabs(m - r) <= tol;
}

bool has_length(const Value& v) { return v.isString() || v.isArray() || v.isObject(); }

int64_t length_of(const Value& v) {
    if (v.isString()) return utf8_length(v.asString());
    return v.size();
}

std::string unit_of(const Value& v) {
    if (v.isString()) return "characters";
    return "items";
}

std::string bound_text(const Value& b) { return b.to_string(); }

}  // namespace

int64_t utf8_length(const std::string& s) {
    int64_t n = 0;
    for (unsigned char c : s)
        if ((c & 0xC0) != 0x80) ++n;
    return n;
}

std::string Constraint::code() const {
    switch (kind) {
        case GreaterThan:
            return "greater_than";
        case GreaterEqual:
            return "greater_than_equal";
        case LessThan:
            return "less_than";
        case LessEqual:
            return "less_than_equal";
        case MultipleOf:
            return "multiple_of";
        case MinLength:
            return "too_short";
        case MaxLength:
            return "too_long";
        case Pattern:
            return "pattern_mismatch";
    }
    return "constraint";
}

std::string Constraint::describe() const {
    switch (kind) {
        case GreaterThan:
            return "gt " + bound_text(bound);
        case GreaterEqual:
            return "ge " + bound_text(bound);
        case LessThan:
            return "lt " + bound_text(bound);
        case LessEqual:
            return "le " + bound_text(bound);
        case MultipleOf:
            return "multiple_of " + bound_text(bound);
        case MinLength:
            return "min_length " + std::to_string(length);
        case MaxLength:
            return "max_length " + std::to_string(length);
        case Pattern:
            return "pattern " + pattern;
    }
    return "constraint";
}

CompiledConstraint compile_constraint(const Constraint& c) {
    CompiledConstraint out;
    out.spec = c;
    switch (c.kind) {
        case Constraint::GreaterThan:
        case Constraint::GreaterEqual:
        case Constraint::LessThan:
        case Constraint::LessEqual:
            if (!c.bound.isNumber() && !is_temporal(c.bound))
                throw std::invalid_argument(c.describe() + ": bound must be a number, date, time or datetime");
            break;
        case Constraint::MultipleOf:
            if (!c.bound.isNumber()) throw std::invalid_argument(c.describe() + ": divisor must be a number");
            if (c.bound.asDouble() == 0.0) throw std::invalid_argument("multiple_of divisor must not be zero");
            break;
        case Constraint::MinLength:
        case Constraint::MaxLength:
            if (c.length < 0) throw std::invalid_argument(c.describe() + ": length must not be negative");
            break;
        case Constraint::Pattern:
            out.regex = std::make_shared<const std::regex>(c.pattern, std::regex::ECMAScript);
            break;
    }
    return out;
}

bool constraint_applies(const Constraint& c, const Type& declared) {
    const Type& t = declared.unwrapped();
    // the value kind is only known at runtime
    if (t.kind() == Type::Any || t.kind() == Type::Union || t.kind() == Type::Literal) return true;

    switch (c.kind) {
        case Constraint::GreaterThan:
        case Constraint::GreaterEqual:
        case Constraint::LessThan:
        case Constraint::LessEqual:
            if (c.bound.isNumber()) return t.kind() == Type::Integer || t.kind() == Type::Number;
            if (c.bound.isDate()) return t.kind() == Type::Date;
            if (c.bound.isTime()) return t.kind() == Type::Time;
            if (c.bound.isDateTime()) return t.kind() == Type::DateTime;
            return false;
        case Constraint::MultipleOf:
            return t.kind() == Type::Integer || t.kind() == Type::Number;
        case Constraint::MinLength:
        case Constraint::MaxLength:
            return t.kind() == Type::String || t.kind() == Type::List || t.kind() == Type::Map;
        case Constraint::Pattern:
            return t.kind() == Type::String;
    }
    return false;
}

ErrorList check_constraints(const Value& value, const std::vector<CompiledConstraint>& constraints,
                            const FieldPath& path) {
    ErrorList errors;
    auto violation = [&](const Constraint& c, const std::string& message) {
        FieldError e;
        e.path = path;
        e.kind = ErrorKind::CONSTRAINT_VIOLATION;
        e.code = c.code();
        e.message = message;
        e.input = value;
        errors.push_back(std::move(e));
    };

    for (auto const& cc : constraints) {
        const Constraint& c = cc.spec;
        switch (c.kind) {
            case Constraint::GreaterThan:
            case Constraint::GreaterEqual:
            case Constraint::LessThan:
            case Constraint::LessEqual: {
                int cmp = 0;
                if (!compare(value, c.bound, cmp)) break;
                bool ok = true;
                std::string relation;
                if (c.kind == Constraint::GreaterThan) {
                    ok = cmp > 0;
                    relation = "greater than ";
                } else if (c.kind == Constraint::GreaterEqual) {
                    ok = cmp >= 0;
                    relation = "greater than or equal to ";
                } else if (c.kind == Constraint::LessThan) {
                    ok = cmp < 0;
                    relation = "less than ";
                } else {
                    ok = cmp <= 0;
                    relation = "less than or equal to ";
                }
                if (!ok) violation(c, "ensure this value is " + relation + bound_text(c.bound));
                break;
            }
            case Constraint::MultipleOf:
                if (!value.isNumber()) break;
                if (!is_multiple(value, c.bound))
                    violation(c, "ensure this value is a multiple of " + bound_text(c.bound));
                break;
            case Constraint::MinLength:
                if (!has_length(value)) break;
                if (length_of(value) < c.length)
                    violation(c, "ensure this value has at least " + std::to_string(c.length) + " " +
                                         unit_of(value));
                break;
            case Constraint::MaxLength:
                if (!has_length(value)) break;
                if (length_of(value) > c.length)
                    violation(c, "ensure this value has at most " + std::to_string(c.length) + " " +
                                         unit_of(value));
                break;
            case Constraint::Pattern:
                if (!value.isString() || !cc.regex) break;
                if (value.asString().size() > kMaxPatternInput) {
                    FieldError e;
                    e.path = path;
                    e.kind = ErrorKind::CONSTRAINT_VIOLATION;
                    e.code = "pattern_input_too_long";
                    e.message = "string is too long to match against pattern '" + c.pattern + "' (at most " +
                                std::to_string(kMaxPatternInput) + " bytes)";
                    e.input = value;
                    errors.push_back(std::move(e));
                    break;
                }
                if (!std::regex_match(value.asString(), *cc.regex))
                    violation(c, "string does not match pattern '" + c.pattern + "'");
                break;
        }
    }
    return errors;
}

}  // namespace cf
