#pragma once

#include <berry_mcp/schema/schema_generator.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <string>
#include <vector>

namespace berry_mcp {

class ToolContext;

// Synchronous tool body: arguments object in, JSON value out. Throws to
// report a tool failure.
using ToolCallable =
    std::function<nlohmann::json(const nlohmann::json& arguments, ToolContext& context)>;

// Asynchronous tool body: returns immediately, the future carries the value
// or the exception.
using AsyncToolCallable = std::function<std::future<nlohmann::json>(
    const nlohmann::json& arguments, ToolContext& context)>;

// ---------------------------------------------------------------------------
// ToolDescriptor: a registered tool. Immutable once stored.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
    ToolCallable callable;
    AsyncToolCallable async_callable;
    bool is_async = false;

    // {"name", "description", "inputSchema"} as listed by tools/list.
    [[nodiscard]] nlohmann::json ToListEntry() const;
};

// ---------------------------------------------------------------------------
// ToolRegistry: name -> descriptor table, listed in registration order.
//
// Re-registering a name replaces the descriptor in place (last registration
// wins, list position kept) and logs a warning. Mutate during startup only;
// lookups are not synchronised against concurrent registration.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(ToolDescriptor descriptor);

    void Register(const std::string& name,
                  const std::string& description,
                  const std::vector<ParamSpec>& params,
                  ToolCallable callable);

    void RegisterAsync(const std::string& name,
                       const std::string& description,
                       const std::vector<ParamSpec>& params,
                       AsyncToolCallable callable);

    // nullptr when absent.
    [[nodiscard]] const ToolDescriptor* Find(const std::string& name) const;

    [[nodiscard]] bool HasTool(const std::string& name) const;

    [[nodiscard]] const std::vector<ToolDescriptor>& Tools() const noexcept {
        return tools_;
    }

    [[nodiscard]] std::vector<std::string> Names() const;

    [[nodiscard]] std::size_t Size() const noexcept { return tools_.size(); }

private:
    std::vector<ToolDescriptor> tools_;
    std::map<std::string, std::size_t> index_;
};

} // namespace berry_mcp
