#pragma once

#include <berry_mcp/registry/tool_catalog.hpp>
#include <berry_mcp/registry/tool_registry.hpp>
#include <berry_mcp/schema/type_shape.hpp>

#include <string>
#include <utility>
#include <vector>

namespace berry_mcp {

enum class CaseMode {
    Upper,
    Lower,
    Title,
};

template <>
struct EnumTraits<CaseMode> {
    static constexpr const char* kName = "CaseMode";
    static std::vector<std::pair<CaseMode, std::string>> Members() {
        return {{CaseMode::Upper, "upper"},
                {CaseMode::Lower, "lower"},
                {CaseMode::Title, "title"}};
    }
};

std::string TransformCase(const std::string& text, CaseMode mode);

// math: add, divide, sum
void RegisterMathTools(ToolRegistry& registry);

// text: echo, word_count, transform_case
void RegisterTextTools(ToolRegistry& registry);

// system: server_time, countdown, confirm_action
void RegisterSystemTools(ToolRegistry& registry);

// Catalog of the modules above, in that order.
ToolCatalog MakeBuiltinCatalog();

} // namespace berry_mcp
