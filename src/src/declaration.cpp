#include <cf/declaration.h>

#include <map>
#include <set>

#include <cf/errors.h>
#include <cf/registry.h>
#include <cf/suggest.h>

namespace cf {

namespace {

const std::vector<std::string> model_keywords = {"title",      "description", "type",  "properties",
                                                 "required",   "definitions", "extra", "populate_by_name",
                                                 "additionalProperties"};

const std::vector<std::string> property_keywords = {
    "title",   "description",      "type",    "format",           "enum",       "const",      "items",
    "anyOf",   "$ref",             "default", "alias",            "minimum",    "maximum",    "exclusiveMinimum",
    "exclusiveMaximum", "multipleOf", "minLength", "maxLength", "minItems", "maxItems", "pattern",
    "properties", "required", "additionalProperties", "extra", "populate_by_name"};

// only meaningful on a property, not on an element or alternative type
const std::vector<std::string> property_only_keywords = {
    "default", "alias", "minimum", "maximum", "exclusiveMinimum", "exclusiveMaximum", "multipleOf",
    "minLength", "maxLength", "minItems", "maxItems", "pattern"};

const std::string definitions_prefix = "#/definitions/";

class Loader {
  public:
    Loader(const Value& document, const SchemaRegistry* registry) : m_registry(registry) {
        if (document.has("definitions")) {
            const Value& defs = document.at("definitions");
            if (!defs.isObject()) throw CompileError(title_of(document), "'definitions' must be an object");
            m_definitions = defs;
        }
    }

    std::shared_ptr<const Schema> model(const Value& node, const std::string& name) {
        checkKeywords(node, model_keywords, name, "");
        if (node.has("type") && !(node.at("type").isString() && node.at("type").asString() == "object"))
            throw CompileError(name, "a model document must have type 'object'");

        std::set<std::string> required;
        if (node.has("required")) {
            const Value& req = node.at("required");
            if (!req.isArray()) throw CompileError(name, "'required' must be an array of property names");
            for (auto const& r : req.asArray()) {
                if (!r.isString()) throw CompileError(name, "'required' must be an array of property names");
                required.insert(r.asString());
            }
        }

        Schema schema(name);
        m_building.push_back(name);
        if (node.has("properties")) {
            const Value& props = node.at("properties");
            if (!props.isObject()) throw CompileError(name, "'properties' must be an object");
            for (auto const& p : props.items()) {
                if (!p.second.isObject())
                    throw CompileError(name, "property '" + p.first + "' must be described by an object");
                schema.field(field(p.first, p.second, required.count(p.first) != 0, name));
            }
        }
        for (auto const& r : required) {
            if (!node.has("properties") || !node.at("properties").has(r))
                throw CompileError(name, "required property '" + r + "' is not declared");
        }
        m_building.pop_back();

        applyModelConfig(node, schema, name);
        return make_schema(std::move(schema));
    }

  private:
    static std::string title_of(const Value& node) {
        if (node.has("title") && node.at("title").isString()) return node.at("title").asString();
        return "<anonymous>";
    }

    static void checkKeywords(const Value& node, const std::vector<std::string>& known, const std::string& schema,
                              const std::string& where) {
        for (auto const& key : node.keys()) {
            bool ok = false;
            for (auto const& k : known)
                if (k == key) ok = true;
            if (ok) continue;
            std::string message = where + "unknown keyword '" + key + "'";
            std::string close = suggest::closest_key(key, known);
            if (!close.empty()) message += "; did you mean '" + close + "'?";
            throw CompileError(schema, message);
        }
    }

    // Element, alternative and map value types carry no constraints of their own.
    static void checkNestedType(const Value& node, const std::string& schema, const std::string& where) {
        checkKeywords(node, property_keywords, schema, where);
        for (auto const& k : property_only_keywords) {
            if (node.has(k)) throw CompileError(schema, where + "'" + k + "' is only supported on a property");
        }
    }

    static void applyModelConfig(const Value& node, Schema& schema, const std::string& name) {
        if (node.has("extra")) {
            const Value& e = node.at("extra");
            std::string policy = e.isString() ? e.asString() : "";
            if (policy == "ignore")
                schema.extra(ExtraPolicy::Ignore);
            else if (policy == "forbid")
                schema.extra(ExtraPolicy::Forbid);
            else if (policy == "allow")
                schema.extra(ExtraPolicy::Allow);
            else
                throw CompileError(name, "'extra' must be one of ignore, forbid, allow");
        }
        if (node.has("additionalProperties")) {
            const Value& a = node.at("additionalProperties");
            if (!a.isBool())
                throw CompileError(name, "model-level 'additionalProperties' must be a boolean");
            if (node.has("extra")) throw CompileError(name, "'additionalProperties' and 'extra' are exclusive");
            schema.extra(a.asBool() ? ExtraPolicy::Allow : ExtraPolicy::Forbid);
        }
        if (node.has("populate_by_name")) {
            const Value& p = node.at("populate_by_name");
            if (!p.isBool()) throw CompileError(name, "'populate_by_name' must be a boolean");
            schema.populateByName(p.asBool());
        }
    }

    FieldSpec field(const std::string& prop, const Value& node, bool required, const std::string& schema) {
        const std::string where = "property '" + prop + "': ";
        checkKeywords(node, property_keywords, schema, where);

        Type type = typeOf(node, prop, schema, where);
        Constraints constraints = constraintsOf(node, type, schema, where);

        bool has_default = node.has("default");
        if (!required && !has_default) type = Type::optional(type);
        FieldSpec spec(prop, type);
        spec.constraints(std::move(constraints));
        if (has_default) spec.defaultTo(node.at("default"));
        if (node.has("alias")) {
            const Value& alias = node.at("alias");
            if (!alias.isString() || alias.asString().empty())
                throw CompileError(schema, where + "'alias' must be a non-empty string");
            spec.alias(alias.asString());
        }
        return spec;
    }

    Type typeOf(const Value& node, const std::string& prop, const std::string& schema, const std::string& where) {
        if (node.has("$ref")) {
            const Value& ref = node.at("$ref");
            if (!ref.isString()) throw CompileError(schema, where + "'$ref' must be a string");
            return reference(ref.asString(), schema, where);
        }
        if (node.has("const")) return Type::literal({node.at("const")});
        if (node.has("enum")) {
            const Value& e = node.at("enum");
            if (!e.isArray() || e.empty()) throw CompileError(schema, where + "'enum' must be a non-empty array");
            return Type::literal(e.asArray());
        }
        if (node.has("anyOf")) {
            const Value& any = node.at("anyOf");
            if (!any.isArray() || any.empty()) throw CompileError(schema, where + "'anyOf' must be a non-empty array");
            std::vector<Type> alternatives;
            bool nullable = false;
            for (auto const& alt : any.asArray()) {
                if (!alt.isObject()) throw CompileError(schema, where + "'anyOf' entries must be objects");
                if (alt.size() == 1 && alt.has("type") && alt.at("type").isString() &&
                    alt.at("type").asString() == "null") {
                    nullable = true;
                    continue;
                }
                checkNestedType(alt, schema, where + "anyOf: ");
                alternatives.push_back(typeOf(alt, prop, schema, where));
            }
            if (alternatives.empty()) throw CompileError(schema, where + "'anyOf' needs a non-null alternative");
            Type t = alternatives.size() == 1 ? alternatives.front() : Type::union_of(std::move(alternatives));
            return nullable ? Type::optional(t) : t;
        }
        if (!node.has("type")) return Type::any();

        const Value& declared = node.at("type");
        std::vector<std::string> names;
        if (declared.isString()) {
            names.push_back(declared.asString());
        } else if (declared.isArray()) {
            for (auto const& n : declared.asArray()) {
                if (!n.isString()) throw CompileError(schema, where + "'type' entries must be strings");
                names.push_back(n.asString());
            }
        } else {
            throw CompileError(schema, where + "'type' must be a string or an array of strings");
        }

        bool nullable = false;
        std::vector<Type> alternatives;
        for (auto const& n : names) {
            if (n == "null")
                nullable = true;
            else
                alternatives.push_back(primitive(n, node, prop, schema, where));
        }
        if (alternatives.empty()) throw CompileError(schema, where + "type 'null' needs another type beside it");
        Type t = alternatives.size() == 1 ? alternatives.front() : Type::union_of(std::move(alternatives));
        return nullable ? Type::optional(t) : t;
    }

    Type primitive(const std::string& name, const Value& node, const std::string& prop, const std::string& schema,
                   const std::string& where) {
        if (name == "boolean") return Type::boolean();
        if (name == "integer") return Type::integer();
        if (name == "number") return Type::number();
        if (name == "string") {
            if (!node.has("format")) return Type::string();
            const Value& f = node.at("format");
            std::string format = f.isString() ? f.asString() : "";
            if (format == "date") return Type::date();
            if (format == "time") return Type::time();
            if (format == "date-time") return Type::datetime();
            throw CompileError(schema, where + "unsupported format '" + f.to_string() +
                                           "' (expected date, time or date-time)");
        }
        if (name == "array") {
            if (!node.has("items")) return Type::list(Type::any());
            const Value& items = node.at("items");
            if (!items.isObject()) throw CompileError(schema, where + "'items' must be an object");
            checkNestedType(items, schema, where + "items: ");
            return Type::list(typeOf(items, prop, schema, where + "items: "));
        }
        if (name == "object") {
            if (node.has("properties")) {
                std::string nested = node.has("title") && node.at("title").isString() ? node.at("title").asString()
                                                                                      : schema + "." + prop;
                Value model_node = Value::object();
                for (auto const& item : node.items()) {
                    for (auto const& k : model_keywords)
                        if (k == item.first) model_node.set(item.first, item.second);
                }
                return Type::model(model(model_node, nested));
            }
            Type value_type = Type::any();
            if (node.has("additionalProperties")) {
                const Value& ap = node.at("additionalProperties");
                if (!ap.isObject()) throw CompileError(schema, where + "'additionalProperties' must be an object");
                checkNestedType(ap, schema, where + "additionalProperties: ");
                value_type = typeOf(ap, prop, schema, where + "additionalProperties: ");
            }
            return Type::map(Type::string(), value_type);
        }
        throw CompileError(schema, where + "unknown type '" + name + "'");
    }

    Type reference(const std::string& ref, const std::string& schema, const std::string& where) {
        if (ref.compare(0, definitions_prefix.size(), definitions_prefix) == 0) {
            std::string name = ref.substr(definitions_prefix.size());
            if (!m_definitions.has(name)) throw CompileError(schema, where + "unresolved reference '" + ref + "'");
            if (!m_building.empty() && m_building.back() == name) return Type::self();
            for (auto const& b : m_building) {
                if (b == name)
                    throw CompileError(schema, where + "definition '" + name +
                                                   "' refers back to itself through another model");
            }
            auto it = m_built.find(name);
            if (it != m_built.end()) return Type::model(it->second);
            const Value& def = m_definitions.at(name);
            if (!def.isObject()) throw CompileError(schema, where + "definition '" + name + "' must be an object");
            auto built = model(def, name);
            m_built[name] = built;
            return Type::model(built);
        }
        if (m_registry && m_registry->has(ref)) return Type::model(m_registry->schema(ref));
        throw CompileError(schema, where + "unresolved reference '" + ref + "'");
    }

    Constraints constraintsOf(const Value& node, const Type& type, const std::string& schema,
                              const std::string& where) {
        Constraints c;
        auto bound = [&](const char* keyword) {
            const Value& b = node.at(keyword);
            Type::Kind kind = type.unwrapped().kind();
            if (b.isString() && (kind == Type::Date || kind == Type::Time || kind == Type::DateTime)) {
                if (kind == Type::Date) {
                    if (auto d = parse_iso_date(b.asString())) return Value(*d);
                } else if (kind == Type::Time) {
                    if (auto t = parse_iso_time(b.asString())) return Value(*t);
                } else if (auto ts = parse_iso_datetime(b.asString())) {
                    return Value(*ts);
                }
                throw CompileError(schema, where + "'" + keyword + "' is not a valid " + type.unwrapped().name());
            }
            if (!b.isNumber()) throw CompileError(schema, where + "'" + keyword + "' must be a number");
            return b;
        };
        auto length = [&](const char* keyword) {
            const Value& n = node.at(keyword);
            if (!n.isInt() || n.asInt() < 0)
                throw CompileError(schema, where + "'" + keyword + "' must be a non-negative integer");
            return n.asInt();
        };

        if (node.has("exclusiveMinimum")) c.gt(bound("exclusiveMinimum"));
        if (node.has("minimum")) c.ge(bound("minimum"));
        if (node.has("exclusiveMaximum")) c.lt(bound("exclusiveMaximum"));
        if (node.has("maximum")) c.le(bound("maximum"));
        if (node.has("multipleOf")) c.multiple_of(bound("multipleOf"));
        if (node.has("minLength")) c.min_length(length("minLength"));
        if (node.has("minItems")) c.min_length(length("minItems"));
        if (node.has("maxLength")) c.max_length(length("maxLength"));
        if (node.has("maxItems")) c.max_length(length("maxItems"));
        if (node.has("pattern")) {
            const Value& p = node.at("pattern");
            if (!p.isString()) throw CompileError(schema, where + "'pattern' must be a string");
            c.pattern(p.asString());
        }
        return c;
    }

    const SchemaRegistry* m_registry;
    Value m_definitions = Value::object();
    std::vector<std::string> m_building;
    std::map<std::string, std::shared_ptr<const Schema> > m_built;
};

}  // namespace

std::shared_ptr<const Schema> schema_from_value(const Value& document, const SchemaRegistry* registry) {
    if (!document.isObject()) throw CompileError("<anonymous>", "a schema document must be an object");
    if (!document.has("title") || !document.at("title").isString() || document.at("title").asString().empty())
        throw CompileError("<anonymous>", "a schema document needs a non-empty 'title'");
    Loader loader(document, registry);
    return loader.model(document, document.at("title").asString());
}

}  // namespace cf
