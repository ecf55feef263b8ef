#pragma once

#include <optional>
#include <set>
#include <string>

#include <cf/plan.h>

namespace cf {
namespace detail {

enum class FieldState { Pending, PreHooksRun, Coerced, ConstraintsChecked, CustomValidated, Done, Failed };

const char* state_name(FieldState s);

struct FieldRun {
    FieldState state = FieldState::Pending;
    Value value;
    ErrorList errors;
};

// Runs one field through pre-hooks, coercion, constraints and post-hooks.
// Never throws for bad data or failing validators.
class FieldPipeline {
  public:
    FieldPipeline(const ValidationPlan& plan, const FieldStep& step, const FieldPath& base)
        : m_plan(plan), m_step(step), m_path(base.child(step.name)) {}

    // `raw` is absent when the input has no key for this field. `done` holds
    // the sibling values that reached Done, `failed` the names that Failed.
    FieldRun run(const std::optional<Value>& raw, const Value& done, const std::set<std::string>& failed) const;

  private:
    void transition(FieldRun& run, FieldState next) const;
    void reject(FieldRun& run, const FieldValidator& v, const std::string& message, const Value& input) const;
    bool readsFailed(const FieldValidator& v, const std::set<std::string>& failed) const;

    const ValidationPlan& m_plan;
    const FieldStep& m_step;
    FieldPath m_path;
};

}  // namespace detail
}  // namespace cf
