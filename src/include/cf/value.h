#pragma once

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <initializer_list>
#include <iomanip>
#include <limits>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cf {

struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    std::string to_string() const;
    int64_t days_since_epoch() const;

    bool operator==(const CalendarDate& rhs) const {
        return year == rhs.year && month == rhs.month && day == rhs.day;
    }
    bool operator!=(const CalendarDate& rhs) const { return !(*this == rhs); }
    bool operator<(const CalendarDate& rhs) const { return days_since_epoch() < rhs.days_since_epoch(); }
    bool operator>(const CalendarDate& rhs) const { return rhs < *this; }
};

struct ClockTime {
    int hour = 0;
    int minute = 0;
    int second = 0;
    int microsecond = 0;
    // UTC offset, only meaningful when has_offset is set
    bool has_offset = false;
    int offset_minutes = 0;

    std::string to_string() const;
    int64_t microseconds_since_midnight() const;

    bool operator==(const ClockTime& rhs) const {
        return hour == rhs.hour && minute == rhs.minute && second == rhs.second &&
               microsecond == rhs.microsecond && has_offset == rhs.has_offset &&
               offset_minutes == rhs.offset_minutes;
    }
    bool operator!=(const ClockTime& rhs) const { return !(*this == rhs); }
    bool operator<(const ClockTime& rhs) const {
        return microseconds_since_midnight() < rhs.microseconds_since_midnight();
    }
};

struct Timestamp {
    CalendarDate date;
    ClockTime time;

    std::string to_string() const;
    // Microseconds since 1970-01-01T00:00:00, shifted to UTC when an offset is present.
    int64_t epoch_microseconds() const;

    bool operator==(const Timestamp& rhs) const { return date == rhs.date && time == rhs.time; }
    bool operator!=(const Timestamp& rhs) const { return !(*this == rhs); }
    bool operator<(const Timestamp& rhs) const { return epoch_microseconds() < rhs.epoch_microseconds(); }
    bool operator>(const Timestamp& rhs) const { return rhs < *this; }
};

// ISO-8601 readers. Return std::nullopt when the text is not a valid
// calendar date / time of day / date-time.
std::optional<CalendarDate> parse_iso_date(const std::string& text);
std::optional<ClockTime> parse_iso_time(const std::string& text);
std::optional<Timestamp> parse_iso_datetime(const std::string& text);

// Shortest decimal text that reads back as exactly `d`
inline std::string format_double(double d) {
    std::ostringstream ss;
    ss << std::setprecision(15) << d;
    if (std::strtod(ss.str().c_str(), nullptr) != d) {
        ss.str(std::string());
        ss << std::setprecision(std::numeric_limits<double>::max_digits10) << d;
    }
    return ss.str();
}

struct ValueScalarImpl {
    bool m_bool = false;
    double m_double = 0.0;
    int64_t m_int = 0;
    std::string m_string = "";
    CalendarDate m_date;
    ClockTime m_time;
};

class Value {
  public:
    enum TYPE { Null, Boolean, Integer, Double, String, Date, Time, DateTime, Array, Object };

  private:
    TYPE my_type = Null;
    ValueScalarImpl scalar;

    std::vector<Value> m_array;
    // insertion ordered key/value pairs
    std::vector<std::pair<std::string, Value> > m_object;

    const Value* find(const std::string& k) const {
        for (auto const& p : m_object)
            if (p.first == k) return &p.second;
        return nullptr;
    }
    Value* find(const std::string& k) {
        for (auto& p : m_object)
            if (p.first == k) return &p.second;
        return nullptr;
    }

    [[noreturn]] void throw_missing_key(const std::string& k) const {
        std::ostringstream ss;
        ss << "Could not find key <" << k << "> available options are: ";
        bool first = true;
        for (auto const& p : m_object) {
            if (!first) ss << ",";
            first = false;
            ss << '"' << p.first << '"';
        }
        throw std::out_of_range(ss.str());
    }

  public:
    Value() = default;

    Value(const std::string& s) {
        my_type = TYPE::String;
        scalar.m_string = s;
    }

    Value(std::string&& s) {
        my_type = TYPE::String;
        scalar.m_string = std::move(s);
    }

    Value(const char* s) : Value(std::string(s)) {}

    Value(int64_t n) {
        my_type = TYPE::Integer;
        scalar.m_int = n;
    }

    Value(int n) : Value(int64_t(n)) {}

    Value(double x) {
        my_type = TYPE::Double;
        scalar.m_double = x;
    }

    Value(bool b) {
        my_type = TYPE::Boolean;
        scalar.m_bool = b;
    }

    Value(const CalendarDate& d) {
        my_type = TYPE::Date;
        scalar.m_date = d;
    }

    Value(const ClockTime& t) {
        my_type = TYPE::Time;
        scalar.m_time = t;
    }

    Value(const Timestamp& ts) {
        my_type = TYPE::DateTime;
        scalar.m_date = ts.date;
        scalar.m_time = ts.time;
    }

    Value(std::vector<Value> v) {
        my_type = TYPE::Array;
        m_array = std::move(v);
    }

    // Construct an object from initializer list of (key, value) pairs
    Value(std::initializer_list<std::pair<std::string, Value> > init) {
        my_type = TYPE::Object;
        for (auto const& p : init) set(p.first, p.second);
    }

    static Value null() { return Value(); }

    static Value object() {
        Value v;
        v.my_type = TYPE::Object;
        return v;
    }

    static Value array(std::initializer_list<Value> init = {}) {
        return Value(std::vector<Value>(init));
    }

    bool operator==(const Value& rhs) const {
        if (my_type != rhs.my_type) return false;
        switch (my_type) {
            case TYPE::Null:
                return true;
            case TYPE::Boolean:
                return scalar.m_bool == rhs.scalar.m_bool;
            case TYPE::Integer:
                return scalar.m_int == rhs.scalar.m_int;
            case TYPE::Double:
                return scalar.m_double == rhs.scalar.m_double;
            case TYPE::String:
                return scalar.m_string == rhs.scalar.m_string;
            case TYPE::Date:
                return scalar.m_date == rhs.scalar.m_date;
            case TYPE::Time:
                return scalar.m_time == rhs.scalar.m_time;
            case TYPE::DateTime:
                return scalar.m_date == rhs.scalar.m_date && scalar.m_time == rhs.scalar.m_time;
            case TYPE::Array:
                return m_array == rhs.m_array;
            case TYPE::Object: {
                // key order does not take part in equality
                if (m_object.size() != rhs.m_object.size()) return false;
                for (auto const& p : m_object) {
                    const Value* other = rhs.find(p.first);
                    if (other == nullptr || *other != p.second) return false;
                }
                return true;
            }
        }
        return false;
    }

    bool operator!=(const Value& rhs) const { return not(*this == rhs); }

    TYPE type() const { return my_type; }

    // Lower-case kind name used in diagnostics ("integer", "object", ...)
    std::string typeString() const {
        switch (my_type) {
            case TYPE::Null:
                return "null";
            case TYPE::Boolean:
                return "boolean";
            case TYPE::Integer:
                return "integer";
            case TYPE::Double:
                return "number";
            case TYPE::String:
                return "string";
            case TYPE::Date:
                return "date";
            case TYPE::Time:
                return "time";
            case TYPE::DateTime:
                return "datetime";
            case TYPE::Array:
                return "array";
            case TYPE::Object:
                return "object";
        }
        throw std::logic_error("Not a valid type");
    }

    bool isNull() const { return my_type == TYPE::Null; }
    bool isBool() const { return my_type == TYPE::Boolean; }
    bool isInt() const { return my_type == TYPE::Integer; }
    bool isDouble() const { return my_type == TYPE::Double; }
    bool isNumber() const { return isInt() || isDouble(); }
    bool isString() const { return my_type == TYPE::String; }
    bool isDate() const { return my_type == TYPE::Date; }
    bool isTime() const { return my_type == TYPE::Time; }
    bool isDateTime() const { return my_type == TYPE::DateTime; }
    bool isArray() const { return my_type == TYPE::Array; }
    bool isObject() const { return my_type == TYPE::Object; }

    bool asBool() const {
        if (my_type == TYPE::Boolean) return scalar.m_bool;
        throw std::runtime_error("not a bool");
    }

    int64_t asInt() const {
        if (my_type == TYPE::Integer) return scalar.m_int;
        throw std::runtime_error("not an int");
    }

    double asDouble() const {
        if (my_type == TYPE::Double) return scalar.m_double;
        if (my_type == TYPE::Integer) return static_cast<double>(scalar.m_int);
        throw std::runtime_error("not a double");
    }

    const std::string& asString() const {
        if (my_type == TYPE::String) return scalar.m_string;
        throw std::runtime_error("not a string");
    }

    CalendarDate asDate() const {
        if (my_type == TYPE::Date || my_type == TYPE::DateTime) return scalar.m_date;
        throw std::runtime_error("not a date");
    }

    ClockTime asTime() const {
        if (my_type == TYPE::Time || my_type == TYPE::DateTime) return scalar.m_time;
        throw std::runtime_error("not a time");
    }

    Timestamp asDateTime() const {
        if (my_type == TYPE::DateTime) return Timestamp{scalar.m_date, scalar.m_time};
        throw std::runtime_error("not a datetime");
    }

    const std::vector<Value>& asArray() const {
        if (my_type == TYPE::Array) return m_array;
        throw std::runtime_error("not an array");
    }

    int size() const noexcept {
        switch (my_type) {
            case TYPE::Array:
                return static_cast<int>(m_array.size());
            case TYPE::Object:
                return static_cast<int>(m_object.size());
            default:
                return 0;
        }
    }

    bool empty() const noexcept { return size() == 0; }

    // array access
    const Value& operator[](int index) const { return at(index); }
    Value& operator[](int index) { return at(index); }

    const Value& at(int index) const {
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        if (index < 0 || index >= static_cast<int>(m_array.size()))
            throw std::out_of_range("index " + std::to_string(index) + " out of range");
        return m_array[static_cast<size_t>(index)];
    }

    Value& at(int index) {
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        if (index < 0 || index >= static_cast<int>(m_array.size()))
            throw std::out_of_range("index " + std::to_string(index) + " out of range");
        return m_array[static_cast<size_t>(index)];
    }

    Value& push_back(Value v) {
        if (my_type == TYPE::Null) my_type = TYPE::Array;
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        m_array.push_back(std::move(v));
        return m_array.back();
    }

    // object access
    int count(const std::string& key) const {
        if (my_type != TYPE::Object) return 0;
        return find(key) != nullptr ? 1 : 0;
    }

    bool has(const std::string& key) const noexcept { return my_type == TYPE::Object && find(key) != nullptr; }
    bool contains(const std::string& k) const noexcept { return has(k); }

    const Value& at(const std::string& k) const {
        const Value* v = my_type == TYPE::Object ? find(k) : nullptr;
        if (v == nullptr) throw_missing_key(k);
        return *v;
    }

    Value& at(const std::string& k) {
        Value* v = my_type == TYPE::Object ? find(k) : nullptr;
        if (v == nullptr) throw_missing_key(k);
        return *v;
    }

    const Value& operator[](const std::string& k) const { return at(k); }

    // Mutable key access converts a non-object into an empty object first.
    Value& operator[](const std::string& k) {
        if (my_type != TYPE::Object) {
            clear();
            my_type = TYPE::Object;
        }
        if (Value* v = find(k)) return *v;
        m_object.emplace_back(k, Value());
        return m_object.back().second;
    }

    Value& set(const std::string& k, Value v) {
        Value& slot = (*this)[k];
        slot = std::move(v);
        return slot;
    }

    Value& erase(const std::string& k) {
        if (my_type == TYPE::Object) {
            for (auto it = m_object.begin(); it != m_object.end(); ++it) {
                if (it->first == k) {
                    m_object.erase(it);
                    break;
                }
            }
        }
        return *this;
    }

    void clear() noexcept {
        m_object.clear();
        m_array.clear();
        scalar = ValueScalarImpl();
        my_type = TYPE::Null;
    }

    std::vector<std::string> keys() const {
        std::vector<std::string> out;
        if (my_type != TYPE::Object) return out;
        out.reserve(m_object.size());
        for (auto const& p : m_object) out.push_back(p.first);
        return out;
    }

    const std::vector<std::pair<std::string, Value> >& items() const {
        if (my_type != TYPE::Object) {
            throw std::logic_error("Cannot get items of non-object type");
        }
        return m_object;
    }

    std::string dump(int indent = 0) const;

    std::string to_string() const {
        switch (my_type) {
            case TYPE::Null:
                return "null";
            case TYPE::Boolean:
                return scalar.m_bool ? "true" : "false";
            case TYPE::Integer:
                return std::to_string(scalar.m_int);
            case TYPE::Double:
                return format_double(scalar.m_double);
            case TYPE::String:
                return scalar.m_string;
            case TYPE::Date:
                return scalar.m_date.to_string();
            case TYPE::Time:
                return scalar.m_time.to_string();
            case TYPE::DateTime:
                return Timestamp{scalar.m_date, scalar.m_time}.to_string();
            default:
                break;
        }
        return dump();
    }
};

// Helper function to escape JSON strings
inline std::string escape_json_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 2);
    result.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            default:
                result.push_back(c);
                break;
        }
    }
    result.push_back('"');
    return result;
}

inline std::string Value::dump(int indent) const {
    std::ostringstream out;

    std::function<void(const Value&, int)> dumpValue;
    dumpValue = [&](const Value& val, int level) {
        switch (val.my_type) {
            case TYPE::Null:
                out << "null";
                return;
            case TYPE::Boolean:
                out << (val.scalar.m_bool ? "true" : "false");
                return;
            case TYPE::Integer:
                out << val.scalar.m_int;
                return;
            case TYPE::Double:
                out << format_double(val.scalar.m_double);
                return;
            case TYPE::String:
                out << escape_json_string(val.scalar.m_string);
                return;
            case TYPE::Date:
            case TYPE::Time:
            case TYPE::DateTime:
                out << escape_json_string(val.to_string());
                return;
            case TYPE::Array: {
                if (val.m_array.empty()) {
                    out << "[]";
                    return;
                }
                if (indent == 0) {
                    out << '[';
                    for (size_t i = 0; i < val.m_array.size(); ++i) {
                        if (i) out << ",";
                        dumpValue(val.m_array[i], level);
                    }
                    out << ']';
                    return;
                }
                out << "[\n";
                for (size_t i = 0; i < val.m_array.size(); ++i) {
                    out << std::string(static_cast<size_t>(level + indent), ' ');
                    dumpValue(val.m_array[i], level + indent);
                    out << (i + 1 < val.m_array.size() ? ",\n" : "\n");
                }
                out << std::string(static_cast<size_t>(level), ' ') << "]";
                return;
            }
            case TYPE::Object: {
                if (val.m_object.empty()) {
                    out << "{}";
                    return;
                }
                if (indent == 0) {
                    out << '{';
                    bool first = true;
                    for (auto const& p : val.m_object) {
                        if (!first) out << ",";
                        first = false;
                        out << escape_json_string(p.first) << ":";
                        dumpValue(p.second, level);
                    }
                    out << '}';
                    return;
                }
                out << "{\n";
                for (size_t i = 0; i < val.m_object.size(); ++i) {
                    out << std::string(static_cast<size_t>(level + indent), ' ')
                        << escape_json_string(val.m_object[i].first) << ": ";
                    dumpValue(val.m_object[i].second, level + indent);
                    out << (i + 1 < val.m_object.size() ? ",\n" : "\n");
                }
                out << std::string(static_cast<size_t>(level), ' ') << "}";
                return;
            }
        }
    };

    dumpValue(*this, 0);
    return out.str();
}

inline std::ostream& operator<<(std::ostream& os, const Value& v) {
    os << v.dump();
    return os;
}

}  // namespace cf
