#pragma once

#include <memory>
#include <string>
#include <vector>

#include <cf/value.h>

namespace cf {

class Schema;

// Declared target type of a field. Types compose: list(optional(model(x))).
class Type {
  public:
    enum Kind {
        Any,
        Boolean,
        Integer,
        Number,
        String,
        Date,
        Time,
        DateTime,
        Literal,
        List,
        Map,
        Union,
        Optional,
        Model,
        Self
    };

    Type() = default;

    static Type any() { return Type(Any); }
    static Type boolean() { return Type(Boolean); }
    static Type integer() { return Type(Integer); }
    static Type number() { return Type(Number); }
    static Type string() { return Type(String); }
    static Type date() { return Type(Date); }
    static Type time() { return Type(Time); }
    static Type datetime() { return Type(DateTime); }

    // One of a closed set of primitive values.
    static Type literal(std::vector<Value> values);
    static Type list(const Type& element);
    static Type map(const Type& key, const Type& value);
    // Alternatives are tried left to right.
    static Type union_of(std::vector<Type> alternatives);
    static Type optional(const Type& inner);
    static Type model(std::shared_ptr<const Schema> schema);
    // The schema whose field carries this type; used for recursive models.
    static Type self() { return Type(Self); }

    Kind kind() const noexcept { return m_kind; }

    const std::vector<Value>& literals() const noexcept { return m_literals; }
    // List element or Optional inner type
    const Type& elementType() const;
    const Type& keyType() const;
    const Type& valueType() const;
    const std::vector<Type>& alternatives() const noexcept { return m_children; }
    const std::shared_ptr<const Schema>& schema() const noexcept { return m_schema; }

    bool isOptional() const noexcept { return m_kind == Optional; }
    // Optional(T) -> T, anything else unchanged
    const Type& unwrapped() const { return m_kind == Optional ? elementType() : *this; }

    // "integer", "list<string>", "integer | string", "optional<date>"
    std::string name() const;

  private:
    explicit Type(Kind k) : m_kind(k) {}

    Kind m_kind = Any;
    std::vector<Value> m_literals;
    std::vector<Type> m_children;
    std::shared_ptr<const Schema> m_schema;
};

}  // namespace cf
