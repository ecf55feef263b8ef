#include <cf/coerce.h>
#include <cf/plan.h>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <map>
#include <regex>

namespace cf {

namespace {

std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

std::string lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

Coerced fail(const Value& raw, const FieldPath& path, const std::string& code, const std::string& message) {
    Coerced out;
    FieldError e;
    e.path = path;
    e.kind = ErrorKind::TYPE_ERROR;
    e.code = code;
    e.message = message;
    e.input = raw;
    out.errors.push_back(std::move(e));
    return out;
}

Coerced ok(Value v) {
    Coerced out;
    out.value = std::move(v);
    return out;
}

bool parse_int_text(const std::string& text, int64_t& out) {
    static const std::regex int_rx("[+-]?[0-9]+");
    std::string t = trim(text);
    if (!std::regex_match(t, int_rx)) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(t.c_str(), &end, 10);
    if (errno == ERANGE || end != t.c_str() + t.size()) return false;
    out = static_cast<int64_t>(v);
    return true;
}

bool parse_number_text(const std::string& text, double& out) {
    static const std::regex num_rx("[+-]?([0-9]+(\\.[0-9]*)?|\\.[0-9]+)([eE][+-]?[0-9]+)?");
    std::string t = trim(text);
    if (!std::regex_match(t, num_rx)) return false;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (errno == ERANGE || !std::isfinite(v) || end != t.c_str() + t.size()) return false;
    out = v;
    return true;
}

Coerced to_boolean(const Value& raw, const FieldPath& path) {
    if (raw.isBool()) return ok(raw);
    if (raw.isInt() && (raw.asInt() == 0 || raw.asInt() == 1)) return ok(Value(raw.asInt() == 1));
    if (raw.isString()) {
        bool b = false;
        if (parse_bool_token(raw.asString(), b)) return ok(Value(b));
        return fail(raw, path, "bool_parsing", "value could not be parsed to a boolean");
    }
    return fail(raw, path, "bool_type", "value is not a valid boolean, got " + raw.typeString());
}

Coerced to_integer(const Value& raw, const FieldPath& path) {
    if (raw.isInt()) return ok(raw);
    if (raw.isDouble()) {
        double d = raw.asDouble();
        // 2^63 is exactly representable; anything at or beyond it overflows int64
        if (std::isfinite(d) && d == std::floor(d) && d >= -9223372036854775808.0 && d < 9223372036854775808.0)
            return ok(Value(static_cast<int64_t>(d)));
        return fail(raw, path, "int_from_float", "value is not a valid integer, got a number with a fractional part");
    }
    if (raw.isString()) {
        int64_t v = 0;
        if (parse_int_text(raw.asString(), v)) return ok(Value(v));
        return fail(raw, path, "int_parsing", "value could not be parsed to an integer");
    }
    return fail(raw, path, "int_type", "value is not a valid integer, got " + raw.typeString());
}

Coerced to_number(const Value& raw, const FieldPath& path) {
    if (raw.isDouble()) return ok(raw);
    if (raw.isInt()) return ok(Value(static_cast<double>(raw.asInt())));
    if (raw.isString()) {
        double v = 0.0;
        if (parse_number_text(raw.asString(), v)) return ok(Value(v));
        return fail(raw, path, "float_parsing", "value could not be parsed to a number");
    }
    return fail(raw, path, "float_type", "value is not a valid number, got " + raw.typeString());
}

Coerced to_string_value(const Value& raw, const FieldPath& path) {
    if (raw.isString()) return ok(raw);
    return fail(raw, path, "string_type", "value is not a valid string, got " + raw.typeString());
}

Coerced to_date(const Value& raw, const FieldPath& path) {
    if (raw.isDate()) return ok(raw);
    if (raw.isString()) {
        if (auto d = parse_iso_date(trim(raw.asString()))) return ok(Value(*d));
        return fail(raw, path, "date_parsing", "value is not a valid date, expected YYYY-MM-DD");
    }
    return fail(raw, path, "date_type", "value is not a valid date, got " + raw.typeString());
}

Coerced to_time(const Value& raw, const FieldPath& path) {
    if (raw.isTime()) return ok(raw);
    if (raw.isString()) {
        if (auto t = parse_iso_time(trim(raw.asString()))) return ok(Value(*t));
        return fail(raw, path, "time_parsing", "value is not a valid time, expected HH:MM[:SS[.ffffff]][offset]");
    }
    return fail(raw, path, "time_type", "value is not a valid time, got " + raw.typeString());
}

Coerced to_datetime(const Value& raw, const FieldPath& path) {
    if (raw.isDateTime()) return ok(raw);
    if (raw.isString()) {
        if (auto ts = parse_iso_datetime(trim(raw.asString()))) return ok(Value(*ts));
        return fail(raw, path, "datetime_parsing",
                    "value is not a valid datetime, expected YYYY-MM-DDTHH:MM[:SS[.ffffff]][offset]");
    }
    return fail(raw, path, "datetime_type", "value is not a valid datetime, got " + raw.typeString());
}

// Coerces toward the primitive kind of `literal` without reporting errors.
bool coerce_like(const Value& raw, const Value& literal, Value& out) {
    FieldPath none;
    Coerced c;
    switch (literal.type()) {
        case Value::Null:
            if (!raw.isNull()) return false;
            out = raw;
            return true;
        case Value::Boolean:
            c = to_boolean(raw, none);
            break;
        case Value::Integer:
            c = to_integer(raw, none);
            break;
        case Value::Double:
            c = to_number(raw, none);
            break;
        case Value::String:
            c = to_string_value(raw, none);
            break;
        case Value::Date:
            c = to_date(raw, none);
            break;
        case Value::Time:
            c = to_time(raw, none);
            break;
        case Value::DateTime:
            c = to_datetime(raw, none);
            break;
        default:
            return false;
    }
    if (!c.ok()) return false;
    out = std::move(c.value);
    return true;
}

Coerced to_literal(const Value& raw, const Type& type, const FieldPath& path) {
    for (auto const& lit : type.literals()) {
        Value candidate;
        if (coerce_like(raw, lit, candidate) && candidate == lit) return ok(lit);
    }
    std::string allowed;
    for (size_t i = 0; i < type.literals().size(); ++i) {
        if (i) allowed += ", ";
        allowed += type.literals()[i].dump();
    }
    return fail(raw, path, "literal_error", "unexpected value; permitted: " + allowed);
}

}  // namespace

bool parse_bool_token(const std::string& text, bool& out) {
    std::string t = lower(trim(text));
    if (t == "true" || t == "1" || t == "yes" || t == "on") {
        out = true;
        return true;
    }
    if (t == "false" || t == "0" || t == "no" || t == "off") {
        out = false;
        return true;
    }
    return false;
}

Coerced coerce(const Value& raw, const Type& type, const FieldPath& path, const ValidationPlan& scope) {
    switch (type.kind()) {
        case Type::Any:
            return ok(raw);
        case Type::Boolean:
            return to_boolean(raw, path);
        case Type::Integer:
            return to_integer(raw, path);
        case Type::Number:
            return to_number(raw, path);
        case Type::String:
            return to_string_value(raw, path);
        case Type::Date:
            return to_date(raw, path);
        case Type::Time:
            return to_time(raw, path);
        case Type::DateTime:
            return to_datetime(raw, path);
        case Type::Literal:
            return to_literal(raw, type, path);
        case Type::Optional:
            if (raw.isNull()) return ok(Value());
            return coerce(raw, type.elementType(), path, scope);
        case Type::List: {
            if (!raw.isArray())
                return fail(raw, path, "list_type", "value is not a valid list, got " + raw.typeString());
            Coerced out;
            std::vector<Value> items;
            const auto& elements = raw.asArray();
            items.reserve(elements.size());
            for (size_t i = 0; i < elements.size(); ++i) {
                Coerced el = coerce(elements[i], type.elementType(), path.index(static_cast<int>(i)), scope);
                if (el.ok())
                    items.push_back(std::move(el.value));
                else
                    out.errors.insert(out.errors.end(), el.errors.begin(), el.errors.end());
            }
            if (out.ok()) out.value = Value(std::move(items));
            return out;
        }
        case Type::Map: {
            if (!raw.isObject())
                return fail(raw, path, "dict_type", "value is not a valid mapping, got " + raw.typeString());
            Coerced out;
            Value mapped = Value::object();
            std::map<std::string, std::string> canonical;  // canonical key -> first input key
            for (auto const& kv : raw.items()) {
                FieldPath at = path.key(kv.first);
                Coerced k = coerce(Value(kv.first), type.keyType(), at, scope);
                for (auto& e : k.errors) e.code = "map_key_" + e.code;
                out.errors.insert(out.errors.end(), k.errors.begin(), k.errors.end());
                std::string key;
                bool key_ok = k.ok();
                if (key_ok) {
                    key = k.value.to_string();
                    auto first = canonical.emplace(key, kv.first);
                    if (!first.second) {
                        Coerced dup = fail(Value(kv.first), at, "map_key_duplicate",
                                           "key is the same as '" + first.first->second + "' after conversion to " +
                                               type.keyType().name());
                        out.errors.insert(out.errors.end(), dup.errors.begin(), dup.errors.end());
                        key_ok = false;
                    }
                }
                Coerced v = coerce(kv.second, type.valueType(), at, scope);
                out.errors.insert(out.errors.end(), v.errors.begin(), v.errors.end());
                if (key_ok && v.ok()) mapped.set(key, std::move(v.value));
            }
            if (out.ok()) out.value = std::move(mapped);
            return out;
        }
        case Type::Union: {
            for (auto const& alt : type.alternatives()) {
                Coerced attempt = coerce(raw, alt, path, scope);
                if (attempt.ok()) return attempt;
            }
            return fail(raw, path, "union_mismatch", "value does not match any of: " + type.name());
        }
        case Type::Model:
        case Type::Self:
            return scope.planFor(type).validateAt(raw, path);
    }
    return fail(raw, path, "unknown_type", "unsupported type");
}

}  // namespace cf
