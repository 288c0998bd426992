#include <catch2/catch_test_macros.hpp>

#include <berry_mcp/registry/typed_tool.hpp>
#include <berry_mcp/server/tool_context.hpp>

#include <cstdint>
#include <future>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace berry_mcp;

namespace typed_test {

enum class Unit { Celsius, Fahrenheit };

} // namespace typed_test

namespace berry_mcp {

template <>
struct EnumTraits<typed_test::Unit> {
    static constexpr const char* kName = "Unit";
    static std::vector<std::pair<typed_test::Unit, std::string>> Members() {
        return {{typed_test::Unit::Celsius, "celsius"},
                {typed_test::Unit::Fahrenheit, "fahrenheit"}};
    }
};

} // namespace berry_mcp

using typed_test::Unit;

namespace {

int Multiply(int a, int b) {
    return a * b;
}

nlohmann::json Call(const ToolRegistry& registry, const std::string& name,
                    const nlohmann::json& arguments) {
    const auto* tool = registry.Find(name);
    REQUIRE(tool != nullptr);
    ToolContext context(1, std::nullopt, {});
    if (tool->is_async) return tool->async_callable(arguments, context).get();
    return tool->callable(arguments, context);
}

} // namespace

// ===========================================================================
// Schema derivation
// ===========================================================================

TEST_CASE("RegisterFunction: schema from parameter types", "[registry][typed]") {
    ToolRegistry registry;
    RegisterFunction(registry, "add", "Add two integers",
                     {Arg("a").Describe("left"), Arg("b").Default(3)},
                     [](int a, int b) { return a + b; });

    const auto& schema = registry.Find("add")->input_schema;
    CHECK(schema["properties"]["a"] ==
          nlohmann::json{{"type", "integer"}, {"description", "left"}});
    CHECK(schema["properties"]["b"] == nlohmann::json{{"type", "integer"}, {"default", 3}});
    CHECK(schema["required"] == nlohmann::json::array({"a"}));
}

TEST_CASE("RegisterFunction: ToolContext is injected, not published", "[registry][typed]") {
    ToolRegistry registry;
    RegisterFunction(registry, "ctx", "Uses context", {Arg("text")},
                     [](ToolContext& context, const std::string& text) {
                         return text + ":" + context.RequestId().dump();
                     });

    const auto& schema = registry.Find("ctx")->input_schema;
    CHECK(schema["properties"].size() == 1);
    CHECK(schema["required"] == nlohmann::json::array({"text"}));
    CHECK(Call(registry, "ctx", {{"text", "id"}}) == "id:1");
}

TEST_CASE("RegisterFunction: enum parameters use their names", "[registry][typed]") {
    ToolRegistry registry;
    RegisterFunction(registry, "convert", "Convert a temperature",
                     {Arg("value"), Arg("to").Default(Unit::Fahrenheit)},
                     [](double value, Unit to) {
                         return to == Unit::Fahrenheit ? value * 9 / 5 + 32 : value;
                     });

    const auto& schema = registry.Find("convert")->input_schema;
    CHECK(schema["properties"]["to"]["enum"] ==
          nlohmann::json::array({"celsius", "fahrenheit"}));
    CHECK(schema["properties"]["to"]["default"] == "fahrenheit");

    CHECK(Call(registry, "convert", {{"value", 100}}) == 212.0);
    CHECK(Call(registry, "convert", {{"value", 100}, {"to", "celsius"}}) == 100.0);
    CHECK_THROWS_AS(Call(registry, "convert", {{"value", 1}, {"to", "kelvin"}}),
                    std::invalid_argument);
}

TEST_CASE("RegisterFunction: free functions work too", "[registry][typed]") {
    ToolRegistry registry;
    RegisterFunction(registry, "multiply", "Multiply", {Arg("a"), Arg("b")}, &Multiply);
    CHECK(Call(registry, "multiply", {{"a", 6}, {"b", 7}}) == 42);
}

TEST_CASE("RegisterFunction: wrong number of names is rejected", "[registry][typed]") {
    ToolRegistry registry;
    CHECK_THROWS_AS(RegisterFunction(registry, "bad", "", {Arg("only")},
                                     [](int a, int b) { return a + b; }),
                    std::invalid_argument);
    CHECK_FALSE(registry.HasTool("bad"));
}

// ===========================================================================
// Argument decoding
// ===========================================================================

TEST_CASE("RegisterFunction: missing required argument", "[registry][typed]") {
    ToolRegistry registry;
    RegisterFunction(registry, "add", "", {Arg("a"), Arg("b")},
                     [](int a, int b) { return a + b; });
    try {
        Call(registry, "add", {{"a", 1}});
        FAIL("expected std::invalid_argument");
    } catch (const std::invalid_argument& e) {
        CHECK(std::string(e.what()) == "Missing required argument: b");
    }
}

TEST_CASE("RegisterFunction: wrong argument type names the argument", "[registry][typed]") {
    ToolRegistry registry;
    RegisterFunction(registry, "add", "", {Arg("a"), Arg("b")},
                     [](int a, int b) { return a + b; });
    try {
        Call(registry, "add", {{"a", 1}, {"b", "two"}});
        FAIL("expected std::invalid_argument");
    } catch (const std::invalid_argument& e) {
        CHECK(std::string(e.what()).find("'b'") != std::string::npos);
    }
}

TEST_CASE("RegisterFunction: whole-valued floats are accepted as integers", "[registry][typed]") {
    ToolRegistry registry;
    RegisterFunction(registry, "twice", "", {Arg("n")}, [](int n) { return n * 2; });
    CHECK(Call(registry, "twice", {{"n", 4.0}}) == 8);
    CHECK_THROWS_AS(Call(registry, "twice", {{"n", 4.5}}), std::invalid_argument);
}

TEST_CASE("RegisterFunction: integers outside the parameter type are rejected",
          "[registry][typed]") {
    ToolRegistry registry;
    RegisterFunction(registry, "add", "", {Arg("a"), Arg("b")},
                     [](int a, int b) { return a + b; });
    RegisterFunction(registry, "small", "", {Arg("n")},
                     [](std::int8_t n) { return static_cast<int>(n); });
    RegisterFunction(registry, "count", "", {Arg("n")},
                     [](unsigned n) { return n; });
    RegisterFunction(registry, "wide", "", {Arg("n")},
                     [](std::int64_t n) { return n; });

    try {
        Call(registry, "add", {{"a", 5000000000LL}, {"b", 1}});
        FAIL("expected std::invalid_argument");
    } catch (const std::invalid_argument& e) {
        CHECK(std::string(e.what()) == "Value out of range for argument 'a': 5000000000");
    }
    CHECK_THROWS_AS(Call(registry, "add", {{"a", 1}, {"b", -2147483649LL}}),
                    std::invalid_argument);
    CHECK(Call(registry, "add", {{"a", 2147483647}, {"b", 0}}) == 2147483647);
    CHECK(Call(registry, "add", {{"a", -2147483647 - 1}, {"b", 0}}) == -2147483648LL);

    CHECK(Call(registry, "small", {{"n", -128}}) == -128);
    CHECK_THROWS_AS(Call(registry, "small", {{"n", 128}}), std::invalid_argument);

    CHECK(Call(registry, "count", {{"n", 4294967295u}}) == 4294967295u);
    CHECK_THROWS_AS(Call(registry, "count", {{"n", -1}}), std::invalid_argument);
    CHECK_THROWS_AS(Call(registry, "count", {{"n", 4294967296ULL}}), std::invalid_argument);

    CHECK_THROWS_AS(Call(registry, "wide", {{"n", 18446744073709551615ULL}}),
                    std::invalid_argument);

    // Parsed text takes the unsigned and signed integer paths of the decoder.
    CHECK_THROWS_AS(Call(registry, "add", nlohmann::json::parse(R"({"a": 5000000000, "b": 1})")),
                    std::invalid_argument);
    CHECK_THROWS_AS(Call(registry, "count", nlohmann::json::parse(R"({"n": -3})")),
                    std::invalid_argument);
}

TEST_CASE("RegisterFunction: out-of-range floats are rejected for integers",
          "[registry][typed]") {
    ToolRegistry registry;
    RegisterFunction(registry, "twice", "", {Arg("n")}, [](int n) { return n * 2; });
    RegisterFunction(registry, "wide", "", {Arg("n")}, [](std::int64_t n) { return n; });
    RegisterFunction(registry, "ratio", "", {Arg("x")}, [](float x) { return x; });

    try {
        Call(registry, "twice", {{"n", 1e30}});
        FAIL("expected std::invalid_argument");
    } catch (const std::invalid_argument& e) {
        CHECK(std::string(e.what()).find("out of range for argument 'n'") != std::string::npos);
    }
    CHECK_THROWS_AS(Call(registry, "twice", {{"n", 2147483648.0}}), std::invalid_argument);
    CHECK(Call(registry, "twice", {{"n", -1073741824.0}}) == -2147483648LL);
    CHECK_THROWS_AS(Call(registry, "wide", {{"n", 9223372036854775808.0}}),
                    std::invalid_argument);
    CHECK(Call(registry, "wide", {{"n", -9223372036854775808.0}}) ==
          std::numeric_limits<std::int64_t>::min());

    CHECK_THROWS_AS(Call(registry, "ratio", {{"x", 1e300}}), std::invalid_argument);
    CHECK(Call(registry, "ratio", {{"x", 0.5}}) == 0.5);
}

TEST_CASE("RegisterFunction: containers and optionals", "[registry][typed]") {
    ToolRegistry registry;
    RegisterFunction(registry, "join", "", {Arg("parts"), Arg("sep").Default(nullptr)},
                     [](const std::vector<std::string>& parts, std::optional<std::string> sep) {
                         std::string out;
                         for (std::size_t i = 0; i < parts.size(); ++i) {
                             if (i > 0) out += sep.value_or(",");
                             out += parts[i];
                         }
                         return out;
                     });

    CHECK(Call(registry, "join", {{"parts", {"a", "b"}}}) == "a,b");
    CHECK(Call(registry, "join", {{"parts", {"a", "b"}}, {"sep", "-"}}) == "a-b");
    CHECK(registry.Find("join")->input_schema["required"] == nlohmann::json::array({"parts"}));
}

TEST_CASE("RegisterFunction: void return becomes null", "[registry][typed]") {
    ToolRegistry registry;
    int calls = 0;
    RegisterFunction(registry, "touch", "", {}, [&calls]() { ++calls; });
    CHECK(Call(registry, "touch", nlohmann::json::object()).is_null());
    CHECK(calls == 1);
}

TEST_CASE("RegisterFunction: map results encode as objects", "[registry][typed]") {
    ToolRegistry registry;
    RegisterFunction(registry, "stats", "", {},
                     []() { return std::map<std::string, int>{{"a", 1}, {"b", 2}}; });
    CHECK(Call(registry, "stats", nlohmann::json::object()) ==
          nlohmann::json{{"a", 1}, {"b", 2}});
}

// ===========================================================================
// Async
// ===========================================================================

TEST_CASE("RegisterFunction: future return registers an async tool", "[registry][typed]") {
    ToolRegistry registry;
    RegisterFunction(registry, "slow_square", "", {Arg("n")},
                     [](int n) -> std::future<int> {
                         return std::async(std::launch::async, [n] { return n * n; });
                     });

    const auto* tool = registry.Find("slow_square");
    REQUIRE(tool != nullptr);
    CHECK(tool->is_async);
    CHECK(Call(registry, "slow_square", {{"n", 9}}) == 81);
}

TEST_CASE("RegisterFunction: async exceptions surface from the future", "[registry][typed]") {
    ToolRegistry registry;
    RegisterFunction(registry, "fails_later", "", {},
                     []() -> std::future<std::string> {
                         return std::async(std::launch::async, []() -> std::string {
                             throw std::runtime_error("late failure");
                         });
                     });
    CHECK_THROWS_AS(Call(registry, "fails_later", nlohmann::json::object()),
                    std::runtime_error);
}
