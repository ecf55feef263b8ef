#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <cf/plan.h>
#include <cf/record.h>
#include <cf/schema.h>
#include <cf/value.h>

namespace cf {

// Named schemas and their compiled plans. Populate it up front; lookups and
// validation are then safe from any number of threads.
class SchemaRegistry {
  public:
    // Compiles eagerly; throws CompileError for a broken schema or a name
    // that is already registered.
    std::shared_ptr<const ValidationPlan> add(std::shared_ptr<const Schema> schema);

    // Builds a schema from a declarative document (see schema_from_value)
    // and registers it.
    std::shared_ptr<const ValidationPlan> load(const Value& document);

    bool has(const std::string& name) const { return m_entries.count(name) != 0; }
    // Throw std::out_of_range naming the registered schemas.
    std::shared_ptr<const Schema> schema(const std::string& name) const;
    std::shared_ptr<const ValidationPlan> plan(const std::string& name) const;

    ValidationResult validate(const std::string& name, const Value& raw) const;

    // Registration order
    const std::vector<std::string>& names() const noexcept { return m_names; }
    size_t size() const noexcept { return m_names.size(); }

  private:
    struct Entry {
        std::shared_ptr<const Schema> schema;
        std::shared_ptr<const ValidationPlan> plan;
    };
    const Entry& entry(const std::string& name) const;

    std::map<std::string, Entry> m_entries;
    std::vector<std::string> m_names;
};

}  // namespace cf
