#include <berry_mcp/schema/schema_generator.hpp>

#include <berry_mcp/core/log.hpp>

#include <exception>

namespace berry_mcp {

namespace {

const char* PrimitiveTypeName(PrimitiveKind kind) {
    switch (kind) {
        case PrimitiveKind::String:  return "string";
        case PrimitiveKind::Integer: return "integer";
        case PrimitiveKind::Number:  return "number";
        case PrimitiveKind::Boolean: return "boolean";
    }
    return "string";
}

nlohmann::json GenericObject(const std::string& name) {
    return {{"type", "object"}, {"description", name + " object"}};
}

struct SchemaVisitor {
    nlohmann::json operator()(const PrimitiveShape& s) const {
        return {{"type", PrimitiveTypeName(s.kind)}};
    }

    nlohmann::json operator()(const OptionalShape& s) const {
        return ShapeToSchema(s.inner);
    }

    nlohmann::json operator()(const SequenceShape& s) const {
        return {{"type", "array"}, {"items", ShapeToSchema(s.element)}};
    }

    nlohmann::json operator()(const MappingShape& s) const {
        return {{"type", "object"},
                {"additionalProperties", ShapeToSchema(s.value)}};
    }

    nlohmann::json operator()(const UnionShape& s) const {
        if (s.members.empty()) return {{"type", "string"}};
        if (s.members.size() == 1) return ShapeToSchema(s.members.front());
        auto any_of = nlohmann::json::array();
        for (const auto& member : s.members) {
            any_of.push_back(ShapeToSchema(member));
        }
        return {{"anyOf", any_of}};
    }

    nlohmann::json operator()(const EnumShape& s) const {
        return {{"type", "string"}, {"enum", s.values}};
    }

    nlohmann::json operator()(const RecordShape& s) const {
        if (!s.introspect) return GenericObject(s.name);
        try {
            auto schema = s.introspect();
            if (schema.is_object()) return schema;
            LogWarn("schema", "Schema of '" + s.name + "' is not an object");
        } catch (const std::exception& e) {
            LogWarn("schema", "Schema introspection of '" + s.name +
                                  "' failed: " + e.what());
        }
        return GenericObject(s.name);
    }

    nlohmann::json operator()(const UnknownShape&) const {
        return {{"type", "string"}};
    }
};

} // anonymous namespace

nlohmann::json ShapeToSchema(const TypeShape& shape) {
    return std::visit(SchemaVisitor{}, shape.node);
}

nlohmann::json ShapeToSchema(const ShapePtr& shape) {
    if (!shape) return {{"type", "string"}};
    return ShapeToSchema(*shape);
}

nlohmann::json GenerateSchema(const std::vector<ParamSpec>& params) {
    auto properties = nlohmann::json::object();
    auto required = nlohmann::json::array();

    for (const auto& param : params) {
        if (param.injected) continue;

        auto property = ShapeToSchema(param.shape);
        if (!param.description.empty()) {
            property["description"] = param.description;
        }
        if (param.default_value.has_value()) {
            property["default"] = *param.default_value;
        } else {
            required.push_back(param.name);
        }
        properties[param.name] = std::move(property);
    }

    return {{"type", "object"},
            {"properties", std::move(properties)},
            {"required", std::move(required)}};
}

} // namespace berry_mcp
