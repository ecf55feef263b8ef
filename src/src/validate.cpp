#include <cf/validate.h>

#include <iostream>
#include <set>

#include <cf/report.h>
#include <cf/suggest.h>

#include "debug.h"
#include "pipeline.h"

namespace cf {

namespace {

FieldError model_error(const FieldPath& at, const ModelValidator& v, const std::string& message, const Value& input) {
    FieldError e;
    e.path = at;
    e.kind = ErrorKind::MODEL_REJECTION;
    e.code = v.name;
    e.message = message;
    e.input = input;
    return e;
}

// Runs `v` on `data`. Returns false and fills `error` on rejection.
bool run_model_validator(const ModelValidator& v, Value& data, const FieldPath& at, FieldError& error) {
    Verdict verdict = Verdict::accept();
    try {
        verdict = v.check(data);
    } catch (const std::exception& ex) {
        verdict = Verdict::reject(ex.what());
    }
    if (verdict.rejected()) {
        error = model_error(at, v, verdict.message(), data);
        return false;
    }
    if (verdict.replaces()) {
        if (!verdict.value().isObject()) {
            error = model_error(at, v,
                                "model validator must return a mapping, got " + verdict.value().typeString(), data);
            return false;
        }
        data = verdict.value();
    }
    return true;
}

// Input keys the plan accepts, for the unknown-key hint
std::vector<std::string> accepted_keys(const ValidationPlan& plan) {
    std::vector<std::string> keys;
    for (auto const& f : plan.fields()) {
        if (f.alias.empty()) {
            keys.push_back(f.name);
        } else {
            keys.push_back(f.alias);
            if (plan.config().populate_by_name) keys.push_back(f.name);
        }
    }
    return keys;
}

}  // namespace

ValidationResult ValidationPlan::validate(const Value& raw) const {
    Coerced out = validateAt(raw, FieldPath());
    if (!out.ok()) return ValidationResult::failure(m_schema_name, std::move(out.errors));
    return ValidationResult::success(m_schema_name, Record(std::move(out.value)));
}

Coerced ValidationPlan::validateAt(const Value& raw, const FieldPath& at) const {
    const bool debug = detail::debug_enabled();
    Coerced out;

    if (!raw.isObject()) {
        FieldError e;
        e.path = at;
        e.kind = ErrorKind::TYPE_ERROR;
        e.code = "model_type";
        e.message = "value is not a valid mapping for " + m_schema_name;
        e.input = raw;
        out.errors.push_back(std::move(e));
        return out;
    }

    Value input = raw;
    for (auto const& v : m_before_model) {
        FieldError error;
        if (!run_model_validator(v, input, at, error)) {
            if (debug) std::cerr << "validate: " << m_schema_name << " rejected by model validator '" << v.name << "'\n";
            out.errors.push_back(std::move(error));
            return out;
        }
    }

    ErrorTree tree(m_fields.size());
    std::vector<std::optional<Value> > values(m_fields.size());
    std::set<std::string> consumed;
    std::set<std::string> failed;
    Value done = Value::object();

    for (size_t index : m_order) {
        const FieldStep& step = m_fields[index];
        std::optional<Value> supplied;
        if (step.alias.empty()) {
            if (input.has(step.name)) supplied = input.at(step.name);
            consumed.insert(step.name);
        } else {
            if (input.has(step.alias)) supplied = input.at(step.alias);
            consumed.insert(step.alias);
            if (m_config.populate_by_name) {
                if (!supplied && input.has(step.name)) supplied = input.at(step.name);
                consumed.insert(step.name);
            }
        }

        detail::FieldPipeline pipeline(*this, step, at);
        detail::FieldRun run = pipeline.run(supplied, done, failed);
        if (run.state == detail::FieldState::Done) {
            done.set(step.name, run.value);
            values[index] = std::move(run.value);
        } else {
            failed.insert(step.name);
            tree.addField(index, run.errors);
        }
    }

    std::vector<std::pair<std::string, Value> > extras;
    for (auto const& item : input.items()) {
        if (consumed.count(item.first)) continue;
        switch (m_config.extra) {
            case ExtraPolicy::Ignore:
                break;
            case ExtraPolicy::Forbid: {
                FieldError e;
                e.path = at.child(item.first);
                e.kind = ErrorKind::EXTRA_FORBIDDEN;
                e.code = "extra_forbidden";
                e.message = suggest::unknown_key_message(item.first, accepted_keys(*this));
                e.input = item.second;
                tree.addExtra(std::move(e));
                break;
            }
            case ExtraPolicy::Allow:
                // a declared field keeps its own slot
                if (!findField(item.first)) extras.push_back(item);
                break;
        }
    }

    if (!tree.empty()) {
        out.errors = tree.flatten();
        if (debug) {
            std::cerr << "validate: " << m_schema_name << " at " << at.to_string() << " failed with "
                      << out.errors.size() << " error(s)\n";
        }
        return out;
    }

    Value record = Value::object();
    for (size_t i = 0; i < m_fields.size(); ++i) record.set(m_fields[i].name, values[i].value());
    for (auto& e : extras) record.set(e.first, std::move(e.second));

    for (auto const& v : m_after_model) {
        FieldError error;
        if (!run_model_validator(v, record, at, error)) {
            if (debug) std::cerr << "validate: " << m_schema_name << " rejected by model validator '" << v.name << "'\n";
            out.errors.push_back(std::move(error));
            return out;
        }
    }

    if (debug) std::cerr << "validate: " << m_schema_name << " at " << at.to_string() << " ok\n";
    out.value = std::move(record);
    return out;
}

ValidationResult validate(const ValidationPlan& plan, const Value& raw) { return plan.validate(raw); }

ValidationResult validate(const std::shared_ptr<const Schema>& schema, const Value& raw) {
    return compile(schema)->validate(raw);
}

Record validate_or_throw(const std::shared_ptr<const Schema>& schema, const Value& raw) {
    ValidationResult result = validate(schema, raw);
    return result.record();
}

}  // namespace cf
