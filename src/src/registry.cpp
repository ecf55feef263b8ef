#include <cf/registry.h>

#include <iostream>
#include <stdexcept>

#include <cf/declaration.h>
#include <cf/suggest.h>

#include "debug.h"

namespace cf {

std::shared_ptr<const ValidationPlan> SchemaRegistry::add(std::shared_ptr<const Schema> schema) {
    if (!schema) throw std::invalid_argument("cannot register a null schema");
    const std::string& name = schema->name();
    if (has(name)) throw CompileError(name, "a schema with this name is already registered");

    auto plan = compile(schema);
    m_entries[name] = Entry{schema, plan};
    m_names.push_back(name);
    if (detail::debug_enabled()) std::cerr << "registry: added '" << name << "'\n";
    return plan;
}

std::shared_ptr<const ValidationPlan> SchemaRegistry::load(const Value& document) {
    return add(schema_from_value(document, this));
}

const SchemaRegistry::Entry& SchemaRegistry::entry(const std::string& name) const {
    auto it = m_entries.find(name);
    if (it == m_entries.end()) {
        std::string message = "no schema named '" + name + "'";
        std::string close = suggest::closest_key(name, m_names);
        if (!close.empty()) message += "; did you mean '" + close + "'?";
        if (!m_names.empty()) {
            message += " (registered:";
            for (auto const& n : m_names) message += " " + n;
            message += ")";
        }
        throw std::out_of_range(message);
    }
    return it->second;
}

std::shared_ptr<const Schema> SchemaRegistry::schema(const std::string& name) const { return entry(name).schema; }

std::shared_ptr<const ValidationPlan> SchemaRegistry::plan(const std::string& name) const { return entry(name).plan; }

ValidationResult SchemaRegistry::validate(const std::string& name, const Value& raw) const {
    return entry(name).plan->validate(raw);
}

}  // namespace cf
