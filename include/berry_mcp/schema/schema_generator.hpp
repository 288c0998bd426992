#pragma once

#include <berry_mcp/schema/type_shape.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace berry_mcp {

// ---------------------------------------------------------------------------
// ParamSpec: one declared tool parameter.
//
// A parameter with a default is optional on the wire; the default is
// published in its property schema. Injected parameters (ToolContext) are
// supplied by the server and never appear in the schema.
// ---------------------------------------------------------------------------
struct ParamSpec {
    std::string name;
    ShapePtr shape;
    std::string description;
    std::optional<nlohmann::json> default_value;
    bool injected = false;
};

// Schema for a single shape. Never throws: a record whose introspection
// fails degrades to a named generic object, an unknown type to a string.
[[nodiscard]] nlohmann::json ShapeToSchema(const TypeShape& shape);
[[nodiscard]] nlohmann::json ShapeToSchema(const ShapePtr& shape);

// {"type":"object","properties":{...},"required":[...]}. `required` lists
// the parameters without a default, in declaration order, and is always
// present.
[[nodiscard]] nlohmann::json GenerateSchema(const std::vector<ParamSpec>& params);

} // namespace berry_mcp
