#include <cf/schema.h>

#include <stdexcept>

namespace cf {

std::string extra_policy_name(ExtraPolicy p) {
    switch (p) {
        case ExtraPolicy::Ignore:
            return "ignore";
        case ExtraPolicy::Forbid:
            return "forbid";
        case ExtraPolicy::Allow:
            return "allow";
    }
    return "unknown";
}

Value Default::produce(const Siblings& siblings) const {
    switch (m_kind) {
        case None:
            break;
        case Static:
            return m_value;
        case Factory:
            return m_factory();
        case Dependent:
            return m_dependent(siblings);
    }
    throw std::logic_error("field has no default");
}

Schema& Schema::extends(std::shared_ptr<const Schema> parent) {
    if (!parent) throw std::invalid_argument("schema '" + m_name + "' extends a null schema");
    m_parents.push_back(std::move(parent));
    return *this;
}

Schema& Schema::field(FieldSpec spec) {
    m_fields.push_back(std::move(spec));
    return *this;
}

Schema& Schema::validator(const std::string& field, FieldValidator v) {
    m_field_validators.emplace_back(field, std::move(v));
    return *this;
}

Schema& Schema::validator(const std::vector<std::string>& fields, FieldValidator v) {
    for (auto const& f : fields) m_field_validators.emplace_back(f, v);
    return *this;
}

Schema& Schema::modelValidator(ModelValidator v) {
    m_model_validators.push_back(std::move(v));
    return *this;
}

Schema& Schema::config(SchemaConfig c) {
    m_extra = c.extra;
    m_populate_by_name = c.populate_by_name;
    return *this;
}

Schema& Schema::extra(ExtraPolicy policy) {
    m_extra = policy;
    return *this;
}

Schema& Schema::populateByName(bool enabled) {
    m_populate_by_name = enabled;
    return *this;
}

}  // namespace cf
