#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace berry_mcp {

// ---------------------------------------------------------------------------
// TypeShape: closed description of a parameter type, the input of the
// schema generator. Shapes are immutable and shared.
// ---------------------------------------------------------------------------
struct TypeShape;
using ShapePtr = std::shared_ptr<const TypeShape>;

enum class PrimitiveKind {
    String,
    Integer,
    Number,
    Boolean,
};

struct PrimitiveShape {
    PrimitiveKind kind = PrimitiveKind::String;
};

// T or null. Collapses to the inner schema.
struct OptionalShape {
    ShapePtr inner;
};

struct SequenceShape {
    ShapePtr element;
};

// String-keyed map with homogeneous values.
struct MappingShape {
    ShapePtr value;
};

// Non-null alternatives only; a single member collapses.
struct UnionShape {
    std::vector<ShapePtr> members;
};

struct EnumShape {
    std::string name;
    std::vector<std::string> values;
};

// A structured type that can describe itself. `introspect` returns the
// record's own schema and may throw.
struct RecordShape {
    std::string name;
    std::function<nlohmann::json()> introspect;
};

struct UnknownShape {};

struct TypeShape {
    std::variant<PrimitiveShape, OptionalShape, SequenceShape, MappingShape,
                 UnionShape, EnumShape, RecordShape, UnknownShape>
        node;
};

// -- Builders -----------------------------------------------------------------

ShapePtr MakePrimitive(PrimitiveKind kind);
ShapePtr MakeOptional(ShapePtr inner);
ShapePtr MakeSequence(ShapePtr element);
ShapePtr MakeMapping(ShapePtr value);
ShapePtr MakeUnion(std::vector<ShapePtr> members);
ShapePtr MakeEnum(std::string name, std::vector<std::string> values);
ShapePtr MakeRecord(std::string name, std::function<nlohmann::json()> introspect);
ShapePtr MakeUnknown();

// ---------------------------------------------------------------------------
// EnumTraits<E>: specialise to expose an enum as a string enum:
//
//   template <> struct EnumTraits<Mode> {
//       static constexpr const char* kName = "Mode";
//       static std::vector<std::pair<Mode, std::string>> Members() {
//           return {{Mode::Upper, "upper"}, {Mode::Lower, "lower"}};
//       }
//   };
// ---------------------------------------------------------------------------
template <typename E>
struct EnumTraits {};

// ---------------------------------------------------------------------------
// SchemaTraits<T>: specialise for a record type that describes itself.
// Name() labels the degraded schema; Schema() may throw. Values are
// converted with nlohmann's to_json/from_json for T.
// ---------------------------------------------------------------------------
template <typename T>
struct SchemaTraits {};

namespace detail {

template <typename T, typename = void>
struct HasEnumTraits : std::false_type {};
template <typename T>
struct HasEnumTraits<T, std::void_t<decltype(EnumTraits<T>::Members())>>
    : std::true_type {};

template <typename T, typename = void>
struct HasSchemaTraits : std::false_type {};
template <typename T>
struct HasSchemaTraits<T, std::void_t<decltype(SchemaTraits<T>::Schema())>>
    : std::true_type {};

template <typename T>
struct SequenceOf { static constexpr bool value = false; };
template <typename T, typename A>
struct SequenceOf<std::vector<T, A>> {
    static constexpr bool value = true;
    using Element = T;
};
template <typename T, typename A>
struct SequenceOf<std::list<T, A>> {
    static constexpr bool value = true;
    using Element = T;
};
template <typename T, typename C, typename A>
struct SequenceOf<std::set<T, C, A>> {
    static constexpr bool value = true;
    using Element = T;
};

template <typename T>
struct MappingOf { static constexpr bool value = false; };
template <typename V, typename C, typename A>
struct MappingOf<std::map<std::string, V, C, A>> {
    static constexpr bool value = true;
    using Value = V;
};
template <typename V, typename H, typename Eq, typename A>
struct MappingOf<std::unordered_map<std::string, V, H, Eq, A>> {
    static constexpr bool value = true;
    using Value = V;
};

template <typename T>
struct OptionalOf { static constexpr bool value = false; };
template <typename T>
struct OptionalOf<std::optional<T>> {
    static constexpr bool value = true;
    using Inner = T;
};

template <typename T>
struct VariantOf { static constexpr bool value = false; };
template <typename... Ts>
struct VariantOf<std::variant<Ts...>> { static constexpr bool value = true; };

template <typename T>
inline constexpr bool kIsString =
    std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view> ||
    std::is_same_v<T, const char*> || std::is_same_v<T, char*>;

} // namespace detail

template <typename T>
ShapePtr ShapeOf();

namespace detail {

template <typename T>
void AppendVariantMember(std::vector<ShapePtr>& members) {
    if constexpr (!std::is_same_v<T, std::monostate>) {
        members.push_back(ShapeOf<T>());
    }
}

template <typename T>
struct VariantMembers;
template <typename... Ts>
struct VariantMembers<std::variant<Ts...>> {
    static std::vector<ShapePtr> Get() {
        std::vector<ShapePtr> members;
        (AppendVariantMember<Ts>(members), ...);
        return members;
    }
};

} // namespace detail

// Enum <-> wire string through EnumTraits<E>.
template <typename E>
std::string EnumToString(E value) {
    for (const auto& [member, text] : EnumTraits<E>::Members()) {
        if (member == value) return text;
    }
    return std::to_string(static_cast<long long>(value));
}

template <typename E>
std::optional<E> EnumFromString(std::string_view text) {
    for (const auto& [member, name] : EnumTraits<E>::Members()) {
        if (name == text) return member;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ShapeOf<T>(): derive the TypeShape of a C++ parameter type.
// ---------------------------------------------------------------------------
template <typename T>
ShapePtr ShapeOf() {
    using U = std::remove_cv_t<std::remove_reference_t<T>>;

    if constexpr (std::is_same_v<U, bool>) {
        return MakePrimitive(PrimitiveKind::Boolean);
    } else if constexpr (detail::HasEnumTraits<U>::value) {
        std::vector<std::string> values;
        for (const auto& member : EnumTraits<U>::Members()) {
            values.push_back(member.second);
        }
        return MakeEnum(EnumTraits<U>::kName, std::move(values));
    } else if constexpr (std::is_integral_v<U>) {
        return MakePrimitive(PrimitiveKind::Integer);
    } else if constexpr (std::is_floating_point_v<U>) {
        return MakePrimitive(PrimitiveKind::Number);
    } else if constexpr (detail::kIsString<U>) {
        return MakePrimitive(PrimitiveKind::String);
    } else if constexpr (detail::OptionalOf<U>::value) {
        return MakeOptional(ShapeOf<typename detail::OptionalOf<U>::Inner>());
    } else if constexpr (detail::VariantOf<U>::value) {
        return MakeUnion(detail::VariantMembers<U>::Get());
    } else if constexpr (detail::MappingOf<U>::value) {
        return MakeMapping(ShapeOf<typename detail::MappingOf<U>::Value>());
    } else if constexpr (detail::SequenceOf<U>::value) {
        return MakeSequence(ShapeOf<typename detail::SequenceOf<U>::Element>());
    } else if constexpr (detail::HasSchemaTraits<U>::value) {
        return MakeRecord(SchemaTraits<U>::Name(), [] { return SchemaTraits<U>::Schema(); });
    } else {
        return MakeUnknown();
    }
}

} // namespace berry_mcp
