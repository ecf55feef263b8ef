#include <cf/types.h>
#include <cf/schema.h>

namespace cf {

Type Type::literal(std::vector<Value> values) {
    if (values.empty()) throw std::invalid_argument("literal type needs at least one value");
    for (auto const& v : values) {
        if (v.isArray() || v.isObject())
            throw std::invalid_argument("literal values must be primitives, got " + v.typeString());
    }
    Type t(Literal);
    t.m_literals = std::move(values);
    return t;
}

Type Type::list(const Type& element) {
    Type t(List);
    t.m_children.push_back(element);
    return t;
}

Type Type::map(const Type& key, const Type& value) {
    Type t(Map);
    t.m_children.push_back(key);
    t.m_children.push_back(value);
    return t;
}

Type Type::union_of(std::vector<Type> alternatives) {
    if (alternatives.empty()) throw std::invalid_argument("union type needs at least one alternative");
    Type t(Union);
    t.m_children = std::move(alternatives);
    return t;
}

Type Type::optional(const Type& inner) {
    if (inner.isOptional()) return inner;
    Type t(Optional);
    t.m_children.push_back(inner);
    return t;
}

Type Type::model(std::shared_ptr<const Schema> schema) {
    if (!schema) throw std::invalid_argument("model type needs a schema");
    Type t(Model);
    t.m_schema = std::move(schema);
    return t;
}

const Type& Type::elementType() const {
    if ((m_kind == List || m_kind == Optional) && !m_children.empty()) return m_children[0];
    throw std::logic_error("type '" + name() + "' has no element type");
}

const Type& Type::keyType() const {
    if (m_kind == Map) return m_children[0];
    throw std::logic_error("type '" + name() + "' has no key type");
}

const Type& Type::valueType() const {
    if (m_kind == Map) return m_children[1];
    throw std::logic_error("type '" + name() + "' has no value type");
}

std::string Type::name() const {
    switch (m_kind) {
        case Any:
            return "any";
        case Boolean:
            return "boolean";
        case Integer:
            return "integer";
        case Number:
            return "number";
        case String:
            return "string";
        case Date:
            return "date";
        case Time:
            return "time";
        case DateTime:
            return "datetime";
        case Literal: {
            std::string out = "literal(";
            for (size_t i = 0; i < m_literals.size(); ++i) {
                if (i) out += ", ";
                out += m_literals[i].dump();
            }
            return out + ")";
        }
        case List:
            return "list<" + m_children[0].name() + ">";
        case Map:
            return "map<" + m_children[0].name() + ", " + m_children[1].name() + ">";
        case Union: {
            std::string out;
            for (size_t i = 0; i < m_children.size(); ++i) {
                if (i) out += " | ";
                out += m_children[i].name();
            }
            return out;
        }
        case Optional:
            return "optional<" + m_children[0].name() + ">";
        case Model:
            return m_schema->name();
        case Self:
            return "self";
    }
    return "unknown";
}

}  // namespace cf
