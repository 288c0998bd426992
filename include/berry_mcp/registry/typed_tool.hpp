#pragma once

#include <berry_mcp/registry/tool_registry.hpp>
#include <berry_mcp/schema/schema_generator.hpp>
#include <berry_mcp/schema/type_shape.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <future>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace berry_mcp {

// ---------------------------------------------------------------------------
// Arg: name, description and optional default of one typed parameter.
//
//   RegisterFunction(registry, "add", "Add two integers",
//                    {Arg("a"), Arg("b").Default(3)},
//                    [](int a, int b) { return a + b; });
// ---------------------------------------------------------------------------
class Arg {
public:
    explicit Arg(std::string name) : name_(std::move(name)) {}

    Arg& Describe(std::string description) {
        description_ = std::move(description);
        return *this;
    }

    template <typename T>
    Arg& Default(const T& value) {
        if constexpr (detail::HasEnumTraits<T>::value) {
            default_ = EnumToString(value);
        } else {
            default_ = nlohmann::json(value);
        }
        return *this;
    }

    [[nodiscard]] const std::string& Name() const noexcept { return name_; }
    [[nodiscard]] const std::string& Description() const noexcept { return description_; }
    [[nodiscard]] const std::optional<nlohmann::json>& DefaultValue() const noexcept {
        return default_;
    }

private:
    std::string name_;
    std::string description_;
    std::optional<nlohmann::json> default_;
};

// ---------------------------------------------------------------------------
// FunctionTraits<F>: return and parameter types of a callable.
// ---------------------------------------------------------------------------
template <typename F>
struct FunctionTraits : FunctionTraits<decltype(&F::operator())> {};

template <typename R, typename... A>
struct FunctionTraits<R(A...)> {
    using Return = R;
    using Args = std::tuple<A...>;
    static constexpr std::size_t kArity = sizeof...(A);
};

template <typename R, typename... A>
struct FunctionTraits<R (*)(A...)> : FunctionTraits<R(A...)> {};

template <typename C, typename R, typename... A>
struct FunctionTraits<R (C::*)(A...)> : FunctionTraits<R(A...)> {};

template <typename C, typename R, typename... A>
struct FunctionTraits<R (C::*)(A...) const> : FunctionTraits<R(A...)> {};

namespace detail {

template <typename T>
inline constexpr bool kIsContext =
    std::is_same_v<std::remove_cv_t<std::remove_reference_t<T>>, ToolContext>;

template <typename T>
struct FutureOf { static constexpr bool value = false; };
template <typename T>
struct FutureOf<std::future<T>> {
    static constexpr bool value = true;
    using Value = T;
};

inline std::invalid_argument TypeMismatch(const std::string& name,
                                          const char* expected,
                                          const nlohmann::json& value) {
    return std::invalid_argument("Invalid type for argument '" + name + "': expected " +
                                 expected + ", got " + value.type_name());
}

inline std::invalid_argument OutOfRange(const std::string& name, const nlohmann::json& value) {
    return std::invalid_argument("Value out of range for argument '" + name + "': " +
                                 value.dump());
}

// Integers must fit T exactly; a float is accepted only when it is integral.
template <typename T>
T DecodeInteger(const nlohmann::json& value, const std::string& name) {
    using Limits = std::numeric_limits<T>;

    if (value.is_number_unsigned()) {
        auto u = value.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(Limits::max())) throw OutOfRange(name, value);
        return static_cast<T>(u);
    }
    if (value.is_number_integer()) {
        auto i = value.get<std::int64_t>();
        if constexpr (std::is_unsigned_v<T>) {
            if (i < 0 ||
                static_cast<std::uint64_t>(i) > static_cast<std::uint64_t>(Limits::max())) {
                throw OutOfRange(name, value);
            }
        } else {
            if (i < static_cast<std::int64_t>(Limits::min()) ||
                i > static_cast<std::int64_t>(Limits::max())) {
                throw OutOfRange(name, value);
            }
        }
        return static_cast<T>(i);
    }
    if (value.is_number_float()) {
        auto d = value.get<double>();
        if (!std::isfinite(d) || std::trunc(d) != d) throw TypeMismatch(name, "integer", value);
        // min and max + 1 are powers of two, so both bounds are exact doubles.
        const double lower = static_cast<double>(Limits::min());
        const double upper = static_cast<double>(Limits::max()) + 1.0;
        if (d < lower || d >= upper) throw OutOfRange(name, value);
        return static_cast<T>(d);
    }
    throw TypeMismatch(name, "integer", value);
}

template <typename T>
T DecodeValue(const nlohmann::json& value, const std::string& name) {
    static_assert(!std::is_same_v<T, std::string_view> && !std::is_pointer_v<T>,
                  "tool parameters must own their data; use std::string");

    if constexpr (HasEnumTraits<T>::value) {
        if (!value.is_string()) throw TypeMismatch(name, "string", value);
        auto decoded = EnumFromString<T>(value.get<std::string>());
        if (!decoded) {
            throw std::invalid_argument("Invalid value for argument '" + name +
                                        "': " + value.dump());
        }
        return *decoded;
    } else if constexpr (std::is_same_v<T, bool>) {
        if (!value.is_boolean()) throw TypeMismatch(name, "boolean", value);
        return value.get<bool>();
    } else if constexpr (std::is_integral_v<T>) {
        return DecodeInteger<T>(value, name);
    } else if constexpr (std::is_floating_point_v<T>) {
        if (!value.is_number()) throw TypeMismatch(name, "number", value);
        if constexpr (sizeof(T) < sizeof(double)) {
            auto d = value.get<double>();
            if (std::isfinite(d) && std::fabs(d) > std::numeric_limits<T>::max()) {
                throw OutOfRange(name, value);
            }
        }
        return value.get<T>();
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (!value.is_string()) throw TypeMismatch(name, "string", value);
        return value.get<std::string>();
    } else if constexpr (OptionalOf<T>::value) {
        if (value.is_null()) return T{};
        return T{DecodeValue<typename OptionalOf<T>::Inner>(value, name)};
    } else {
        try {
            return value.get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw std::invalid_argument("Invalid value for argument '" + name +
                                        "': " + e.what());
        }
    }
}

template <typename A>
decltype(auto) DecodeParam(const nlohmann::json& arguments, ToolContext& context,
                           const ParamSpec& spec) {
    if constexpr (kIsContext<A>) {
        return (context);
    } else {
        using T = std::remove_cv_t<std::remove_reference_t<A>>;
        auto it = arguments.find(spec.name);
        if (it != arguments.end()) return DecodeValue<T>(*it, spec.name);
        if (spec.default_value.has_value()) {
            return DecodeValue<T>(*spec.default_value, spec.name);
        }
        throw std::invalid_argument("Missing required argument: " + spec.name);
    }
}

template <typename R>
nlohmann::json EncodeResult(R&& value) {
    using U = std::remove_cv_t<std::remove_reference_t<R>>;
    if constexpr (HasEnumTraits<U>::value) {
        return EnumToString(value);
    } else {
        return nlohmann::json(std::forward<R>(value));
    }
}

template <typename A>
using StoredParam = std::conditional_t<kIsContext<A>, ToolContext&,
                                       std::remove_cv_t<std::remove_reference_t<A>>>;

template <typename Fn, typename ArgsTuple, std::size_t... I>
decltype(auto) InvokeDecoded(Fn& fn, const nlohmann::json& arguments,
                             ToolContext& context,
                             const std::vector<ParamSpec>& specs,
                             std::index_sequence<I...>) {
    // Brace initialisation decodes left to right.
    std::tuple<StoredParam<std::tuple_element_t<I, ArgsTuple>>...> values{
        DecodeParam<std::tuple_element_t<I, ArgsTuple>>(arguments, context, specs[I])...};
    return std::apply(fn, std::move(values));
}

template <typename T>
struct TypeTag {
    using type = T;
};

template <typename ArgsTuple, std::size_t... I>
std::vector<ParamSpec> BuildParamSpecs(const std::string& tool,
                                       const std::vector<Arg>& args,
                                       std::index_sequence<I...>) {
    constexpr std::size_t kNamed =
        (std::size_t{0} + ... + (kIsContext<std::tuple_element_t<I, ArgsTuple>> ? 0 : 1));
    if (args.size() != kNamed) {
        throw std::invalid_argument("Tool '" + tool + "' names " +
                                    std::to_string(args.size()) + " arguments but takes " +
                                    std::to_string(kNamed));
    }

    std::vector<ParamSpec> specs;
    std::size_t next = 0;
    auto add = [&](auto tag, bool injected) {
        using A = typename decltype(tag)::type;
        ParamSpec spec;
        if (injected) {
            spec.name = "context";
            spec.injected = true;
        } else {
            const auto& arg = args[next++];
            spec.name = arg.Name();
            spec.shape = ShapeOf<A>();
            spec.description = arg.Description();
            spec.default_value = arg.DefaultValue();
        }
        specs.push_back(std::move(spec));
    };
    (add(TypeTag<std::tuple_element_t<I, ArgsTuple>>{},
         kIsContext<std::tuple_element_t<I, ArgsTuple>>),
     ...);
    return specs;
}

} // namespace detail

// ---------------------------------------------------------------------------
// RegisterFunction: register a typed C++ callable as a tool.
//
// The schema comes from the parameter types; `args` names the parameters in
// order, skipping a `ToolContext&` parameter, which is injected per call.
// Arguments are decoded from the JSON object (std::invalid_argument on a
// missing or mistyped argument) and the return value is encoded to JSON.
// A callable returning std::future<R> registers as an async tool; the
// ToolContext it receives stays valid until that future is ready.
// Throws std::invalid_argument when `args` does not match the signature.
// ---------------------------------------------------------------------------
template <typename Fn>
void RegisterFunction(ToolRegistry& registry,
                      const std::string& name,
                      const std::string& description,
                      const std::vector<Arg>& args,
                      Fn fn) {
    using Traits = FunctionTraits<std::decay_t<Fn>>;
    using ArgsTuple = typename Traits::Args;
    using Return = typename Traits::Return;
    using Indices = std::make_index_sequence<Traits::kArity>;

    auto specs = detail::BuildParamSpecs<ArgsTuple>(name, args, Indices{});

    if constexpr (detail::FutureOf<Return>::value) {
        using Value = typename detail::FutureOf<Return>::Value;
        registry.RegisterAsync(
            name, description, specs,
            [fn, specs](const nlohmann::json& arguments,
                        ToolContext& context) mutable -> std::future<nlohmann::json> {
                Return pending = detail::InvokeDecoded<Fn, ArgsTuple>(
                    fn, arguments, context, specs, Indices{});
                return std::async(std::launch::deferred,
                                  [pending = std::move(pending)]() mutable {
                                      if constexpr (std::is_void_v<Value>) {
                                          pending.get();
                                          return nlohmann::json(nullptr);
                                      } else {
                                          return detail::EncodeResult(pending.get());
                                      }
                                  });
            });
    } else {
        registry.Register(
            name, description, specs,
            [fn, specs](const nlohmann::json& arguments,
                        ToolContext& context) mutable -> nlohmann::json {
                if constexpr (std::is_void_v<Return>) {
                    detail::InvokeDecoded<Fn, ArgsTuple>(fn, arguments, context, specs,
                                                         Indices{});
                    return nlohmann::json(nullptr);
                } else {
                    return detail::EncodeResult(detail::InvokeDecoded<Fn, ArgsTuple>(
                        fn, arguments, context, specs, Indices{}));
                }
            });
    }
}

} // namespace berry_mcp
