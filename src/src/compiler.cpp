#include <cf/plan.h>

#include <algorithm>
#include <iostream>
#include <regex>
#include <set>

#include "debug.h"

namespace cf {

namespace {

struct MergedField {
    FieldSpec spec;
    std::vector<FieldValidator> validators;
};

struct MergedSchema {
    std::vector<MergedField> fields;
    std::vector<ModelValidator> model_validators;
    SchemaConfig config;
};

MergedField* find_merged(MergedSchema& m, const std::string& name) {
    for (auto& f : m.fields)
        if (f.spec.name() == name) return &f;
    return nullptr;
}

// Ancestors first (depth first, parents in listed order), each schema once.
void linearize(const Schema& s, std::vector<const Schema*>& out, std::set<const Schema*>& seen) {
    if (seen.count(&s)) return;
    seen.insert(&s);
    for (auto const& p : s.parents()) linearize(*p, out, seen);
    out.push_back(&s);
}

void apply_declarations(const Schema& s, MergedSchema& merged) {
    std::set<std::string> own;
    for (auto const& spec : s.fields()) {
        if (spec.name().empty()) throw CompileError(s.name(), "field with an empty name");
        if (!own.insert(spec.name()).second)
            throw CompileError(s.name(), "duplicate field '" + spec.name() + "'");
        if (MergedField* existing = find_merged(merged, spec.name())) {
            // redeclared: the child's full pipeline replaces the inherited one
            existing->spec = spec;
            existing->validators = spec.validators();
        } else {
            merged.fields.push_back(MergedField{spec, spec.validators()});
        }
    }
    for (auto const& fv : s.fieldValidators()) {
        MergedField* target = find_merged(merged, fv.first);
        if (target == nullptr)
            throw CompileError(s.name(),
                               "validator '" + fv.second.name + "' targets unknown field '" + fv.first + "'");
        target->validators.push_back(fv.second);
    }
    for (auto const& mv : s.modelValidators()) merged.model_validators.push_back(mv);
    if (s.ownExtra()) merged.config.extra = *s.ownExtra();
    if (s.ownPopulateByName()) merged.config.populate_by_name = *s.ownPopulateByName();
}

MergedSchema merge(const Schema& schema) {
    std::vector<const Schema*> chain;
    std::set<const Schema*> seen;
    linearize(schema, chain, seen);
    MergedSchema merged;
    for (const Schema* s : chain) apply_declarations(*s, merged);
    return merged;
}

void check_validator(const Schema& schema, const std::string& field, const FieldValidator& v) {
    if (!v.check)
        throw CompileError(schema.name(), "validator '" + v.name + "' on field '" + field + "' has no function");
}

void add_dependency(std::vector<std::string>& deps, const std::string& dep) {
    if (std::find(deps.begin(), deps.end(), dep) == deps.end()) deps.push_back(dep);
}

std::vector<CompiledConstraint> compile_constraints(const Schema& schema, const FieldSpec& spec) {
    std::vector<CompiledConstraint> out;
    for (auto const& c : spec.constraints().items()) {
        if (!constraint_applies(c, spec.type()))
            throw CompileError(schema.name(), "constraint '" + c.describe() + "' cannot apply to field '" +
                                                      spec.name() + "' of type " + spec.type().name());
        try {
            out.push_back(compile_constraint(c));
        } catch (const std::regex_error& e) {
            throw CompileError(schema.name(), "invalid pattern '" + c.pattern + "' on field '" + spec.name() +
                                                      "': " + e.what());
        } catch (const std::invalid_argument& e) {
            throw CompileError(schema.name(), "field '" + spec.name() + "': " + e.what());
        }
    }
    return out;
}

// Kahn's algorithm; among ready fields the earliest declared goes first.
std::vector<size_t> topological_order(const Schema& schema, const std::vector<FieldStep>& steps) {
    const size_t n = steps.size();
    std::map<std::string, size_t> index;
    for (size_t i = 0; i < n; ++i) index[steps[i].name] = i;

    std::vector<std::vector<size_t> > dependents(n);
    std::vector<size_t> pending(n, 0);
    for (size_t i = 0; i < n; ++i) {
        for (auto const& dep : steps[i].depends_on) {
            size_t d = index.at(dep);
            dependents[d].push_back(i);
            ++pending[i];
        }
    }

    std::set<size_t> ready;
    for (size_t i = 0; i < n; ++i)
        if (pending[i] == 0) ready.insert(i);

    std::vector<size_t> order;
    while (!ready.empty()) {
        size_t next = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(next);
        for (size_t d : dependents[next])
            if (--pending[d] == 0) ready.insert(d);
    }
    if (order.size() == n) return order;

    // walk unresolved dependencies until a field repeats to name the cycle
    size_t start = 0;
    while (pending[start] == 0) ++start;
    std::vector<size_t> walk;
    size_t cur = start;
    while (std::find(walk.begin(), walk.end(), cur) == walk.end()) {
        walk.push_back(cur);
        for (auto const& dep : steps[cur].depends_on) {
            size_t d = index.at(dep);
            if (pending[d] != 0) {
                cur = d;
                break;
            }
        }
    }
    auto first = std::find(walk.begin(), walk.end(), cur);
    std::string cycle;
    for (auto it = first; it != walk.end(); ++it) cycle += steps[*it].name + " -> ";
    cycle += steps[cur].name;
    throw CompileError(schema.name(), "validator dependency cycle: " + cycle);
}

}  // namespace

std::shared_ptr<const ValidationPlan> PlanCache::find(const Schema* schema) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_plans.find(schema);
    // an expired entry belongs to a released schema that happened to live at this address
    if (it == m_plans.end() || it->second.schema.expired()) return nullptr;
    return it->second.plan;
}

std::shared_ptr<const ValidationPlan> PlanCache::insert(const std::shared_ptr<const Schema>& schema,
                                                        std::shared_ptr<const ValidationPlan> plan) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_plans.begin(); it != m_plans.end();) {
        if (it->second.schema.expired())
            it = m_plans.erase(it);
        else
            ++it;
    }
    auto inserted = m_plans.emplace(schema.get(), Entry{schema, std::move(plan)});
    return inserted.first->second.plan;
}

size_t PlanCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t n = 0;
    for (auto const& kv : m_plans)
        if (!kv.second.schema.expired()) ++n;
    return n;
}

void PlanCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_plans.clear();
}

PlanCache& PlanCache::global() {
    static PlanCache cache;
    return cache;
}

std::shared_ptr<const ValidationPlan> PlanCompiler::compile(const std::shared_ptr<const Schema>& schema) {
    if (!schema) throw std::invalid_argument("cannot compile a null schema");
    if (m_cache) {
        if (auto cached = m_cache->find(schema.get())) return cached;
    }
    auto local = m_local.find(schema.get());
    if (local != m_local.end()) return local->second;

    if (std::find(m_in_progress.begin(), m_in_progress.end(), schema.get()) != m_in_progress.end()) {
        std::string chain;
        for (const Schema* s : m_in_progress) chain += s->name() + " -> ";
        chain += schema->name();
        throw CompileError(schema->name(), "recursive model reference " + chain + "; use Type::self() for self references");
    }

    m_in_progress.push_back(schema.get());
    std::shared_ptr<const ValidationPlan> plan;
    try {
        plan = build(schema);
    } catch (...) {
        m_in_progress.pop_back();
        throw;
    }
    m_in_progress.pop_back();

    if (m_cache) plan = m_cache->insert(schema, plan);
    m_local[schema.get()] = plan;
    return plan;
}

void PlanCompiler::resolveNested(const Type& type, ValidationPlan& plan) {
    switch (type.kind()) {
        case Type::Model:
            if (!plan.m_nested.count(type.schema().get()))
                plan.m_nested[type.schema().get()] = compile(type.schema());
            break;
        case Type::List:
        case Type::Optional:
            resolveNested(type.elementType(), plan);
            break;
        case Type::Map:
            resolveNested(type.keyType(), plan);
            resolveNested(type.valueType(), plan);
            break;
        case Type::Union:
            for (auto const& alt : type.alternatives()) resolveNested(alt, plan);
            break;
        default:
            break;
    }
}

std::shared_ptr<const ValidationPlan> PlanCompiler::build(const std::shared_ptr<const Schema>& schema) {
    MergedSchema merged = merge(*schema);

    std::shared_ptr<ValidationPlan> plan(new ValidationPlan());
    plan->m_schema_name = schema->name();
    plan->m_config = merged.config;

    std::set<std::string> names;
    for (auto const& f : merged.fields) names.insert(f.spec.name());

    std::map<std::string, std::string> external_keys;  // key -> field owning it
    for (size_t i = 0; i < merged.fields.size(); ++i) {
        const MergedField& mf = merged.fields[i];
        const FieldSpec& spec = mf.spec;

        FieldStep step;
        step.name = spec.name();
        step.alias = spec.alias() == spec.name() ? std::string() : spec.alias();
        step.type = spec.type();
        step.constraints = compile_constraints(*schema, spec);
        step.default_policy = spec.defaultPolicy();
        step.required = spec.required();

        const std::string& key = step.alias.empty() ? step.name : step.alias;
        auto clash = external_keys.find(key);
        if (clash != external_keys.end())
            throw CompileError(schema->name(), "input key '" + key + "' used by both '" + clash->second + "' and '" +
                                                       step.name + "'");
        external_keys[key] = step.name;

        for (auto const& v : mf.validators) {
            check_validator(*schema, step.name, v);
            for (auto const& r : v.reads) {
                if (r == step.name)
                    throw CompileError(schema->name(), "validator '" + v.name + "' of field '" + step.name +
                                                               "' reads its own field");
                if (!names.count(r))
                    throw CompileError(schema->name(), "validator '" + v.name + "' of field '" + step.name +
                                                               "' reads unknown field '" + r + "'");
                add_dependency(step.depends_on, r);
            }
            if (v.mode == HookMode::Before)
                step.before.push_back(v);
            else
                step.after.push_back(v);
        }
        for (auto const& r : step.default_policy.reads()) {
            if (r == step.name)
                throw CompileError(schema->name(), "default of field '" + step.name + "' reads its own field");
            if (!names.count(r))
                throw CompileError(schema->name(), "default of field '" + step.name + "' reads unknown field '" +
                                                           r + "'");
            add_dependency(step.depends_on, r);
        }
        plan->m_fields.push_back(std::move(step));
    }

    // aliases must not shadow another field's internal name when names are accepted
    if (merged.config.populate_by_name) {
        for (auto const& step : plan->m_fields) {
            if (step.alias.empty()) continue;
            auto owner = external_keys.find(step.name);
            if (owner != external_keys.end() && owner->second != step.name)
                throw CompileError(schema->name(), "field name '" + step.name + "' is also the alias of '" +
                                                           owner->second + "'");
        }
    }

    plan->m_order = topological_order(*schema, plan->m_fields);

    for (auto const& mv : merged.model_validators) {
        if (!mv.check) throw CompileError(schema->name(), "model validator '" + mv.name + "' has no function");
        if (mv.mode == HookMode::Before)
            plan->m_before_model.push_back(mv);
        else
            plan->m_after_model.push_back(mv);
    }

    for (auto const& step : plan->m_fields) resolveNested(step.type, *plan);

    if (detail::debug_enabled()) {
        std::cerr << "compile: schema='" << plan->m_schema_name << "' extra=" << extra_policy_name(plan->m_config.extra)
                  << " order={";
        bool first = true;
        for (size_t i : plan->m_order) {
            if (!first) std::cerr << ",";
            first = false;
            std::cerr << plan->m_fields[i].name;
        }
        std::cerr << "}\n";
    }
    return plan;
}

std::vector<std::string> ValidationPlan::executionOrderNames() const {
    std::vector<std::string> out;
    out.reserve(m_order.size());
    for (size_t i : m_order) out.push_back(m_fields[i].name);
    return out;
}

const FieldStep* ValidationPlan::findField(const std::string& name) const {
    for (auto const& f : m_fields)
        if (f.name == name) return &f;
    return nullptr;
}

const ValidationPlan& ValidationPlan::planFor(const Type& type) const {
    if (type.kind() == Type::Self) return *this;
    if (type.kind() != Type::Model) throw std::logic_error("type '" + type.name() + "' is not a model type");
    auto it = m_nested.find(type.schema().get());
    if (it == m_nested.end())
        throw std::logic_error("model '" + type.name() + "' was not compiled into plan '" + m_schema_name + "'");
    return *it->second;
}

std::shared_ptr<const ValidationPlan> compile(const std::shared_ptr<const Schema>& schema) {
    PlanCompiler compiler(&PlanCache::global());
    return compiler.compile(schema);
}

}  // namespace cf
