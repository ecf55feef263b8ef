#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <cf/value.h>

namespace cf {

enum class ErrorKind {
    MISSING_REQUIRED,
    TYPE_ERROR,
    CONSTRAINT_VIOLATION,
    CUSTOM_REJECTION,
    MODEL_REJECTION,
    EXTRA_FORBIDDEN
};

// snake_case name of an error kind ("missing_required", "type_error", ...)
std::string kind_name(ErrorKind kind);

// Location of a value inside a record: field names, list indices and map keys.
class FieldPath {
  public:
    struct Segment {
        enum Kind { Name, Index, Key };
        Kind kind = Name;
        std::string name;
        int index = 0;

        bool operator==(const Segment& rhs) const {
            return kind == rhs.kind && name == rhs.name && index == rhs.index;
        }
    };

    FieldPath() = default;
    explicit FieldPath(const std::string& field) { m_segments.push_back(Segment{Segment::Name, field, 0}); }

    FieldPath child(const std::string& field) const;
    FieldPath index(int i) const;
    FieldPath key(const std::string& k) const;

    bool empty() const noexcept { return m_segments.empty(); }
    const std::vector<Segment>& segments() const noexcept { return m_segments; }

    // "items[1].price", "scores[\"alice\"]"; empty for the root
    std::string dotted() const;
    // dotted(), or "__root__" for the root
    std::string to_string() const;
    // ["items", 1, "price"]
    Value to_value() const;

    bool operator==(const FieldPath& rhs) const { return m_segments == rhs.m_segments; }
    bool operator!=(const FieldPath& rhs) const { return !(*this == rhs); }

  private:
    std::vector<Segment> m_segments;
};

struct FieldError {
    FieldPath path;
    ErrorKind kind = ErrorKind::TYPE_ERROR;
    // finer grained reason, e.g. "greater_than_equal" or "int_parsing"
    std::string code;
    std::string message;
    // offending input; absent for missing values
    std::optional<Value> input;

    std::string location() const { return path.to_string(); }
};

using ErrorList = std::vector<FieldError>;

// A schema definition problem: duplicate fields, dependency cycles, bad
// patterns. Raised while compiling, never while validating data.
class CompileError : public std::logic_error {
  public:
    CompileError(const std::string& schema, const std::string& what)
        : std::logic_error("schema '" + schema + "': " + what), m_schema(schema) {}

    const std::string& schema() const noexcept { return m_schema; }

  private:
    std::string m_schema;
};

}  // namespace cf
