#pragma once

#include <string>
#include <vector>

#include <cf/errors.h>
#include <cf/value.h>

namespace cf {

// Immutable, fully validated record: field name -> typed value, in field
// declaration order followed by any allowed extra keys.
class Record {
  public:
    Record() : m_fields(Value::object()) {}
    explicit Record(Value fields);

    bool has(const std::string& field) const { return m_fields.has(field); }
    const Value& at(const std::string& field) const { return m_fields.at(field); }
    const Value& operator[](const std::string& field) const { return at(field); }

    std::vector<std::string> keys() const { return m_fields.keys(); }
    int size() const noexcept { return m_fields.size(); }

    bool getBool(const std::string& field) const { return at(field).asBool(); }
    int64_t getInt(const std::string& field) const { return at(field).asInt(); }
    double getDouble(const std::string& field) const { return at(field).asDouble(); }
    std::string getString(const std::string& field) const { return at(field).asString(); }

    // Object view of the record; copy it to get a mutable mapping.
    const Value& asValue() const noexcept { return m_fields; }
    std::string dump(int indent = 0) const { return m_fields.dump(indent); }

    bool operator==(const Record& rhs) const { return m_fields == rhs.m_fields; }
    bool operator!=(const Record& rhs) const { return !(*this == rhs); }

  private:
    Value m_fields;
};

// Either a Record or a non-empty ErrorList, never both.
class ValidationResult {
  public:
    static ValidationResult success(std::string schema, Record record);
    static ValidationResult failure(std::string schema, ErrorList errors);

    bool is_valid() const noexcept { return m_errors.empty(); }
    explicit operator bool() const noexcept { return is_valid(); }

    // Throws std::logic_error carrying the formatted errors when invalid.
    const Record& record() const;
    const ErrorList& errors() const noexcept { return m_errors; }
    size_t error_count() const noexcept { return m_errors.size(); }
    const std::string& schemaName() const noexcept { return m_schema; }

    // Human readable multi-line summary, empty when valid
    std::string format() const;
    // Array of {loc, kind, code, msg, input} objects
    Value errorsAsValue() const;

  private:
    ValidationResult() = default;

    std::string m_schema;
    Record m_record;
    ErrorList m_errors;
};

}  // namespace cf
