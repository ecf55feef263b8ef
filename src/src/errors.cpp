#include <cf/errors.h>

namespace cf {

std::string kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MISSING_REQUIRED:
            return "missing_required";
        case ErrorKind::TYPE_ERROR:
            return "type_error";
        case ErrorKind::CONSTRAINT_VIOLATION:
            return "constraint_violation";
        case ErrorKind::CUSTOM_REJECTION:
            return "custom_rejection";
        case ErrorKind::MODEL_REJECTION:
            return "model_rejection";
        case ErrorKind::EXTRA_FORBIDDEN:
            return "extra_forbidden";
    }
    throw std::logic_error("unknown error kind");
}

FieldPath FieldPath::child(const std::string& field) const {
    FieldPath p = *this;
    p.m_segments.push_back(Segment{Segment::Name, field, 0});
    return p;
}

FieldPath FieldPath::index(int i) const {
    FieldPath p = *this;
    p.m_segments.push_back(Segment{Segment::Index, std::string(), i});
    return p;
}

FieldPath FieldPath::key(const std::string& k) const {
    FieldPath p = *this;
    p.m_segments.push_back(Segment{Segment::Key, k, 0});
    return p;
}

std::string FieldPath::dotted() const {
    std::string out;
    for (auto const& seg : m_segments) {
        switch (seg.kind) {
            case Segment::Name:
                if (!out.empty()) out.push_back('.');
                out += seg.name;
                break;
            case Segment::Index:
                out += "[" + std::to_string(seg.index) + "]";
                break;
            case Segment::Key:
                out += "[" + escape_json_string(seg.name) + "]";
                break;
        }
    }
    return out;
}

std::string FieldPath::to_string() const {
    if (m_segments.empty()) return "__root__";
    return dotted();
}

Value FieldPath::to_value() const {
    std::vector<Value> loc;
    for (auto const& seg : m_segments) {
        if (seg.kind == Segment::Index)
            loc.emplace_back(seg.index);
        else
            loc.emplace_back(seg.name);
    }
    return Value(std::move(loc));
}

}  // namespace cf
