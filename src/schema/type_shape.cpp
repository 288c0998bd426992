#include <berry_mcp/schema/type_shape.hpp>

namespace berry_mcp {

namespace {

ShapePtr Wrap(TypeShape shape) {
    return std::make_shared<const TypeShape>(std::move(shape));
}

} // anonymous namespace

ShapePtr MakePrimitive(PrimitiveKind kind) {
    return Wrap(TypeShape{PrimitiveShape{kind}});
}

ShapePtr MakeOptional(ShapePtr inner) {
    return Wrap(TypeShape{OptionalShape{std::move(inner)}});
}

ShapePtr MakeSequence(ShapePtr element) {
    return Wrap(TypeShape{SequenceShape{std::move(element)}});
}

ShapePtr MakeMapping(ShapePtr value) {
    return Wrap(TypeShape{MappingShape{std::move(value)}});
}

ShapePtr MakeUnion(std::vector<ShapePtr> members) {
    return Wrap(TypeShape{UnionShape{std::move(members)}});
}

ShapePtr MakeEnum(std::string name, std::vector<std::string> values) {
    return Wrap(TypeShape{EnumShape{std::move(name), std::move(values)}});
}

ShapePtr MakeRecord(std::string name, std::function<nlohmann::json()> introspect) {
    return Wrap(TypeShape{RecordShape{std::move(name), std::move(introspect)}});
}

ShapePtr MakeUnknown() {
    return Wrap(TypeShape{UnknownShape{}});
}

} // namespace berry_mcp
