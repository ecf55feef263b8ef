#include "pipeline.h"

#include <iostream>

#include "debug.h"

namespace cf {
namespace detail {

const char* state_name(FieldState s) {
    switch (s) {
        case FieldState::Pending:
            return "Pending";
        case FieldState::PreHooksRun:
            return "PreHooksRun";
        case FieldState::Coerced:
            return "Coerced";
        case FieldState::ConstraintsChecked:
            return "ConstraintsChecked";
        case FieldState::CustomValidated:
            return "CustomValidated";
        case FieldState::Done:
            return "Done";
        case FieldState::Failed:
            return "Failed";
    }
    return "?";
}

void FieldPipeline::transition(FieldRun& run, FieldState next) const {
    if (debug_enabled()) {
        std::cerr << "pipeline: " << m_plan.schemaName() << "." << m_path.dotted() << " " << state_name(run.state)
                  << " -> " << state_name(next) << "\n";
    }
    run.state = next;
}

void FieldPipeline::reject(FieldRun& run, const FieldValidator& v, const std::string& message,
                           const Value& input) const {
    FieldError e;
    e.path = m_path;
    e.kind = ErrorKind::CUSTOM_REJECTION;
    e.code = v.name;
    e.message = message;
    e.input = input;
    run.errors.push_back(std::move(e));
    transition(run, FieldState::Failed);
}

bool FieldPipeline::readsFailed(const FieldValidator& v, const std::set<std::string>& failed) const {
    for (auto const& r : v.reads)
        if (failed.count(r)) return true;
    return false;
}

FieldRun FieldPipeline::run(const std::optional<Value>& raw, const Value& done,
                            const std::set<std::string>& failed) const {
    FieldRun run;
    Siblings siblings(done);

    if (!raw) {
        if (m_step.default_policy.present()) {
            for (auto const& r : m_step.default_policy.reads()) {
                if (failed.count(r)) {
                    // the sibling's own error already fails the record
                    transition(run, FieldState::Failed);
                    return run;
                }
            }
            try {
                run.value = m_step.default_policy.produce(siblings);
            } catch (const std::exception& ex) {
                FieldError e;
                e.path = m_path;
                e.kind = ErrorKind::CUSTOM_REJECTION;
                e.code = "default_factory";
                e.message = std::string("default could not be produced: ") + ex.what();
                run.errors.push_back(std::move(e));
                transition(run, FieldState::Failed);
                return run;
            }
            transition(run, FieldState::Done);
            return run;
        }
        if (!m_step.required) {
            // optional without a default
            run.value = Value();
            transition(run, FieldState::Done);
            return run;
        }
        FieldError e;
        e.path = m_path;
        e.kind = ErrorKind::MISSING_REQUIRED;
        e.code = "missing";
        e.message = "field required";
        run.errors.push_back(std::move(e));
        transition(run, FieldState::Failed);
        return run;
    }

    Value current = *raw;
    for (auto const& v : m_step.before) {
        if (readsFailed(v, failed)) continue;
        Verdict verdict = Verdict::accept();
        try {
            verdict = v.check(current, siblings);
        } catch (const std::exception& ex) {
            verdict = Verdict::reject(ex.what());
        }
        if (verdict.rejected()) {
            reject(run, v, verdict.message(), current);
            return run;
        }
        if (verdict.replaces()) current = verdict.value();
    }
    transition(run, FieldState::PreHooksRun);

    Coerced coerced = coerce(current, m_step.type, m_path, m_plan);
    if (!coerced.ok()) {
        run.errors = std::move(coerced.errors);
        transition(run, FieldState::Failed);
        return run;
    }
    transition(run, FieldState::Coerced);

    // null in an optional field has nothing to constrain
    if (!coerced.value.isNull()) {
        ErrorList violations = check_constraints(coerced.value, m_step.constraints, m_path);
        if (!violations.empty()) {
            run.errors = std::move(violations);
            transition(run, FieldState::Failed);
            return run;
        }
    }
    transition(run, FieldState::ConstraintsChecked);

    current = std::move(coerced.value);
    for (auto const& v : m_step.after) {
        if (readsFailed(v, failed)) continue;
        Verdict verdict = Verdict::accept();
        try {
            verdict = v.check(current, siblings);
        } catch (const std::exception& ex) {
            verdict = Verdict::reject(ex.what());
        }
        if (verdict.rejected()) {
            reject(run, v, verdict.message(), current);
            return run;
        }
        if (verdict.replaces()) current = verdict.value();
    }
    transition(run, FieldState::CustomValidated);

    run.value = std::move(current);
    transition(run, FieldState::Done);
    return run;
}

}  // namespace detail
}  // namespace cf
