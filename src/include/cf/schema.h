#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <cf/constraints.h>
#include <cf/types.h>
#include <cf/value.h>

namespace cf {

// Read-only view of the sibling fields that already finished validating.
class Siblings {
  public:
    explicit Siblings(const Value& done) : m_done(&done) {}

    bool has(const std::string& field) const { return m_done->has(field); }
    // Throws std::out_of_range when the sibling is not (yet) available.
    const Value& at(const std::string& field) const { return m_done->at(field); }
    const Value& operator[](const std::string& field) const { return at(field); }

  private:
    const Value* m_done;
};

// Outcome of a custom validator: keep the value, replace it, or reject it.
class Verdict {
  public:
    static Verdict accept() { return Verdict(Accept); }

    static Verdict replace(Value v) {
        Verdict out(Replace);
        out.m_value = std::move(v);
        return out;
    }

    static Verdict reject(std::string message) {
        Verdict out(Reject);
        out.m_message = std::move(message);
        return out;
    }

    bool accepted() const noexcept { return m_state != Reject; }
    bool rejected() const noexcept { return m_state == Reject; }
    bool replaces() const noexcept { return m_state == Replace; }
    const Value& value() const noexcept { return m_value; }
    const std::string& message() const noexcept { return m_message; }

  private:
    enum State { Accept, Replace, Reject };
    explicit Verdict(State s) : m_state(s) {}

    State m_state;
    Value m_value;
    std::string m_message;
};

enum class HookMode { Before, After };

using FieldCheck = std::function<Verdict(const Value& value, const Siblings& siblings)>;

// Custom per-field validator. Before-validators see the raw input,
// after-validators the coerced, constraint-checked value. `reads` lists the
// sibling fields the validator looks at; they are validated first.
struct FieldValidator {
    std::string name;
    HookMode mode = HookMode::After;
    std::vector<std::string> reads;
    FieldCheck check;
};

inline FieldValidator before(std::string name, FieldCheck check, std::vector<std::string> reads = {}) {
    return FieldValidator{std::move(name), HookMode::Before, std::move(reads), std::move(check)};
}

inline FieldValidator after(std::string name, FieldCheck check, std::vector<std::string> reads = {}) {
    return FieldValidator{std::move(name), HookMode::After, std::move(reads), std::move(check)};
}

// Whole-model validator. Before-validators receive the raw input mapping and
// may reshape it; after-validators receive the fully validated draft record.
struct ModelValidator {
    std::string name;
    HookMode mode = HookMode::After;
    std::function<Verdict(const Value& data)> check;
};

inline ModelValidator model_before(std::string name, std::function<Verdict(const Value&)> check) {
    return ModelValidator{std::move(name), HookMode::Before, std::move(check)};
}

inline ModelValidator model_after(std::string name, std::function<Verdict(const Value&)> check) {
    return ModelValidator{std::move(name), HookMode::After, std::move(check)};
}

// How a missing field gets its value.
class Default {
  public:
    enum Kind { None, Static, Factory, Dependent };

    static Default none() { return Default(None); }

    // Copied for every record that uses it.
    static Default value(Value v) {
        Default d(Static);
        d.m_value = std::move(v);
        return d;
    }

    // Invoked for every record that uses it.
    static Default factory(std::function<Value()> make) {
        Default d(Factory);
        d.m_factory = std::move(make);
        return d;
    }

    // Computed from sibling fields, which are validated first.
    static Default dependent(std::vector<std::string> reads, std::function<Value(const Siblings&)> make) {
        Default d(Dependent);
        d.m_reads = std::move(reads);
        d.m_dependent = std::move(make);
        return d;
    }

    Kind kind() const noexcept { return m_kind; }
    bool present() const noexcept { return m_kind != None; }
    const std::vector<std::string>& reads() const noexcept { return m_reads; }
    const Value& staticValue() const noexcept { return m_value; }

    Value produce(const Siblings& siblings) const;

  private:
    explicit Default(Kind k) : m_kind(k) {}

    Kind m_kind;
    Value m_value;
    std::function<Value()> m_factory;
    std::vector<std::string> m_reads;
    std::function<Value(const Siblings&)> m_dependent;
};

class FieldSpec {
  public:
    FieldSpec(std::string name, Type type) : m_name(std::move(name)), m_type(std::move(type)) {}

    // External input key; the record keeps the internal name.
    FieldSpec& alias(std::string key) {
        m_alias = std::move(key);
        return *this;
    }
    FieldSpec& constraints(Constraints c) {
        m_constraints = std::move(c);
        return *this;
    }
    FieldSpec& defaultTo(Default d) {
        m_default = std::move(d);
        return *this;
    }
    FieldSpec& defaultTo(Value v) {
        m_default = Default::value(std::move(v));
        return *this;
    }
    FieldSpec& check(FieldValidator v) {
        m_validators.push_back(std::move(v));
        return *this;
    }

    const std::string& name() const noexcept { return m_name; }
    const Type& type() const noexcept { return m_type; }
    const std::string& alias() const noexcept { return m_alias; }
    const Constraints& constraints() const noexcept { return m_constraints; }
    const Default& defaultPolicy() const noexcept { return m_default; }
    const std::vector<FieldValidator>& validators() const noexcept { return m_validators; }

    // No default and not optional
    bool required() const noexcept { return !m_default.present() && !m_type.isOptional(); }

  private:
    std::string m_name;
    Type m_type;
    std::string m_alias;
    Constraints m_constraints;
    Default m_default = Default::none();
    std::vector<FieldValidator> m_validators;
};

enum class ExtraPolicy { Ignore, Forbid, Allow };

std::string extra_policy_name(ExtraPolicy p);

struct SchemaConfig {
    ExtraPolicy extra = ExtraPolicy::Ignore;
    // Accept the internal name of an aliased field when the alias key is absent.
    bool populate_by_name = false;
};

// Declarative record description. Schemas are built once, shared through
// std::shared_ptr<const Schema> and compiled into a ValidationPlan.
class Schema {
  public:
    explicit Schema(std::string name) : m_name(std::move(name)) {}

    Schema& extends(std::shared_ptr<const Schema> parent);
    Schema& field(FieldSpec spec);
    // Attach a validator to a declared or inherited field.
    Schema& validator(const std::string& field, FieldValidator v);
    Schema& validator(const std::vector<std::string>& fields, FieldValidator v);
    Schema& modelValidator(ModelValidator v);
    Schema& config(SchemaConfig c);
    Schema& extra(ExtraPolicy policy);
    Schema& populateByName(bool enabled);

    const std::string& name() const noexcept { return m_name; }
    const std::vector<std::shared_ptr<const Schema> >& parents() const noexcept { return m_parents; }
    const std::vector<FieldSpec>& fields() const noexcept { return m_fields; }
    const std::vector<std::pair<std::string, FieldValidator> >& fieldValidators() const noexcept {
        return m_field_validators;
    }
    const std::vector<ModelValidator>& modelValidators() const noexcept { return m_model_validators; }
    // Settings this schema configures itself; unset ones are inherited.
    const std::optional<ExtraPolicy>& ownExtra() const noexcept { return m_extra; }
    const std::optional<bool>& ownPopulateByName() const noexcept { return m_populate_by_name; }

  private:
    std::string m_name;
    std::vector<std::shared_ptr<const Schema> > m_parents;
    std::vector<FieldSpec> m_fields;
    std::vector<std::pair<std::string, FieldValidator> > m_field_validators;
    std::vector<ModelValidator> m_model_validators;
    std::optional<ExtraPolicy> m_extra;
    std::optional<bool> m_populate_by_name;
};

inline std::shared_ptr<const Schema> make_schema(Schema schema) {
    return std::make_shared<const Schema>(std::move(schema));
}

}  // namespace cf
