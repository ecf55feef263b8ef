#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <cf/coerce.h>
#include <cf/constraints.h>
#include <cf/record.h>
#include <cf/schema.h>

namespace cf {

// One field's compiled execution step.
struct FieldStep {
    std::string name;
    // empty when the field has no alias
    std::string alias;
    Type type;
    std::vector<CompiledConstraint> constraints;
    Default default_policy = Default::none();
    bool required = true;
    std::vector<FieldValidator> before;
    std::vector<FieldValidator> after;
    // every sibling read by this field's validators or default
    std::vector<std::string> depends_on;
};

// Immutable artifact compiled from a Schema. Safe to share between threads;
// validate() never mutates it.
class ValidationPlan {
  public:
    const std::string& schemaName() const noexcept { return m_schema_name; }
    const SchemaConfig& config() const noexcept { return m_config; }

    // Fields in merged declaration order
    const std::vector<FieldStep>& fields() const noexcept { return m_fields; }
    // Indices into fields() in dependency order
    const std::vector<size_t>& executionOrder() const noexcept { return m_order; }
    std::vector<std::string> executionOrderNames() const;

    const std::vector<ModelValidator>& beforeModel() const noexcept { return m_before_model; }
    const std::vector<ModelValidator>& afterModel() const noexcept { return m_after_model; }

    const FieldStep* findField(const std::string& name) const;

    // Plan used for a Model or Self type appearing in this plan's fields.
    const ValidationPlan& planFor(const Type& type) const;

    ValidationResult validate(const Value& raw) const;

    // Validation of a nested occurrence of this model at `at`; errors carry
    // `at` as their prefix. Used by the coercer for model types.
    Coerced validateAt(const Value& raw, const FieldPath& at) const;

  private:
    friend class PlanCompiler;
    ValidationPlan() = default;

    std::string m_schema_name;
    SchemaConfig m_config;
    std::vector<FieldStep> m_fields;
    std::vector<size_t> m_order;
    std::vector<ModelValidator> m_before_model;
    std::vector<ModelValidator> m_after_model;
    std::map<const Schema*, std::shared_ptr<const ValidationPlan> > m_nested;
};

// Process-wide cache of compiled plans, keyed by schema instance. Schemas are
// held weakly: once a schema is released its entry is stale and is purged on
// the next insert.
class PlanCache {
  public:
    std::shared_ptr<const ValidationPlan> find(const Schema* schema) const;
    // Stores `plan` unless another thread stored one first; returns the stored plan.
    std::shared_ptr<const ValidationPlan> insert(const std::shared_ptr<const Schema>& schema,
                                                 std::shared_ptr<const ValidationPlan> plan);
    // Number of entries whose schema is still alive
    size_t size() const;
    void clear();

    static PlanCache& global();

  private:
    struct Entry {
        std::weak_ptr<const Schema> schema;
        std::shared_ptr<const ValidationPlan> plan;
    };

    mutable std::mutex m_mutex;
    std::map<const Schema*, Entry> m_plans;
};

// Builds ValidationPlans. Throws CompileError for schema definition problems.
class PlanCompiler {
  public:
    // With a cache, nested models (and the result) are looked up and stored
    // there; without one everything is compiled fresh.
    explicit PlanCompiler(PlanCache* cache = nullptr) : m_cache(cache) {}

    std::shared_ptr<const ValidationPlan> compile(const std::shared_ptr<const Schema>& schema);

  private:
    std::shared_ptr<const ValidationPlan> build(const std::shared_ptr<const Schema>& schema);
    void resolveNested(const Type& type, ValidationPlan& plan);

    PlanCache* m_cache;
    std::vector<const Schema*> m_in_progress;
    std::map<const Schema*, std::shared_ptr<const ValidationPlan> > m_local;
};

// Compiles once per schema instance and reuses the cached plan afterwards.
std::shared_ptr<const ValidationPlan> compile(const std::shared_ptr<const Schema>& schema);

}  // namespace cf
