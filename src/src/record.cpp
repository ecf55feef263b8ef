#include <cf/record.h>
#include <cf/report.h>

namespace cf {

Record::Record(Value fields) : m_fields(std::move(fields)) {
    if (!m_fields.isObject()) throw std::invalid_argument("record fields must be an object, got " + m_fields.typeString());
}

ValidationResult ValidationResult::success(std::string schema, Record record) {
    ValidationResult r;
    r.m_schema = std::move(schema);
    r.m_record = std::move(record);
    return r;
}

ValidationResult ValidationResult::failure(std::string schema, ErrorList errors) {
    if (errors.empty()) throw std::logic_error("a failed validation needs at least one error");
    ValidationResult r;
    r.m_schema = std::move(schema);
    r.m_errors = std::move(errors);
    return r;
}

const Record& ValidationResult::record() const {
    if (!is_valid()) throw std::logic_error(format());
    return m_record;
}

std::string ValidationResult::format() const { return format_errors(m_schema, m_errors); }

Value ValidationResult::errorsAsValue() const { return errors_to_value(m_errors); }

}  // namespace cf
