#pragma once

#include <memory>

#include <cf/schema.h>
#include <cf/value.h>

namespace cf {

class SchemaRegistry;

// Builds a Schema from a JSON-Schema-like document:
//
//   {"title": "User", "extra": "forbid",
//    "properties": {"id": {"type": "integer", "minimum": 1},
//                   "email": {"type": "string", "alias": "emailAddress"},
//                   "tags": {"type": "array", "items": {"type": "string"}, "default": []}},
//    "required": ["id", "email"]}
//
// Properties keep document order. A property that is neither required nor
// has a default is optional. "$ref" resolves "#/definitions/<name>" inside
// the document (a definition may refer to itself) or, failing that, a schema
// registered in `registry`. Unknown keywords throw CompileError.
std::shared_ptr<const Schema> schema_from_value(const Value& document, const SchemaRegistry* registry = nullptr);

}  // namespace cf
