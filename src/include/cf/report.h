#pragma once

#include <string>
#include <vector>

#include <cf/errors.h>
#include <cf/value.h>

namespace cf {

// Errors of one model validation grouped by origin. flatten() yields the
// stable report order: declared fields (each in its own error order, nested
// errors depth first), then forbidden extra keys. Model validator errors
// never join these; after-model validators only run on a clean tree.
class ErrorTree {
  public:
    explicit ErrorTree(size_t field_count) : m_fields(field_count) {}

    void addField(size_t declaration_index, const ErrorList& errors);
    void addExtra(FieldError error);

    bool empty() const;
    ErrorList flatten() const;

  private:
    std::vector<ErrorList> m_fields;
    ErrorList m_extras;
};

// Short single-line rendering of an offending input (at most 80 characters)
std::string value_preview(const Value& v, size_t maxlen = 80);

// "2 validation errors for User\nage\n  ensure this value ... (kind=...; code=...; input=...)"
std::string format_errors(const std::string& schema, const ErrorList& errors);

// [{"loc": ["items", 1, "price"], "kind": "...", "code": "...", "msg": "...", "input": ...}, ...]
Value errors_to_value(const ErrorList& errors);

}  // namespace cf
