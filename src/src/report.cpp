#include <cf/report.h>

#include <sstream>

namespace cf {

void ErrorTree::addField(size_t declaration_index, const ErrorList& errors) {
    ErrorList& slot = m_fields.at(declaration_index);
    slot.insert(slot.end(), errors.begin(), errors.end());
}

void ErrorTree::addExtra(FieldError error) { m_extras.push_back(std::move(error)); }

bool ErrorTree::empty() const {
    if (!m_extras.empty()) return false;
    for (auto const& f : m_fields)
        if (!f.empty()) return false;
    return true;
}

ErrorList ErrorTree::flatten() const {
    ErrorList out;
    for (auto const& f : m_fields) out.insert(out.end(), f.begin(), f.end());
    out.insert(out.end(), m_extras.begin(), m_extras.end());
    return out;
}

std::string value_preview(const Value& v, size_t maxlen) {
    std::string s = v.dump();
    if (s.size() > maxlen) s = s.substr(0, maxlen - 3) + "...";
    return s;
}

std::string format_errors(const std::string& schema, const ErrorList& errors) {
    if (errors.empty()) return std::string();
    std::ostringstream ss;
    ss << errors.size() << " validation error" << (errors.size() == 1 ? "" : "s") << " for " << schema;
    for (auto const& e : errors) {
        ss << "\n" << e.location() << "\n  " << e.message << " (kind=" << kind_name(e.kind);
        if (!e.code.empty()) ss << "; code=" << e.code;
        if (e.input) ss << "; input=" << value_preview(*e.input);
        ss << ")";
    }
    return ss.str();
}

Value errors_to_value(const ErrorList& errors) {
    std::vector<Value> out;
    out.reserve(errors.size());
    for (auto const& e : errors) {
        Value entry = Value::object();
        entry.set("loc", e.path.to_value());
        entry.set("kind", kind_name(e.kind));
        entry.set("code", e.code);
        entry.set("msg", e.message);
        if (e.input) entry.set("input", *e.input);
        out.push_back(std::move(entry));
    }
    return Value(std::move(out));
}

}  // namespace cf
