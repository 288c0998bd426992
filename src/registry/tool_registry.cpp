#include <berry_mcp/registry/tool_registry.hpp>

#include <berry_mcp/core/log.hpp>

namespace berry_mcp {

nlohmann::json ToolDescriptor::ToListEntry() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema}
    };
}

void ToolRegistry::Register(ToolDescriptor descriptor) {
    auto it = index_.find(descriptor.name);
    if (it != index_.end()) {
        LogWarn("registry", "Tool '" + descriptor.name +
                                "' registered twice, replacing previous definition");
        tools_[it->second] = std::move(descriptor);
        return;
    }
    LogInfo("registry", "Registered tool: " + descriptor.name);
    index_[descriptor.name] = tools_.size();
    tools_.push_back(std::move(descriptor));
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const std::vector<ParamSpec>& params,
                            ToolCallable callable) {
    ToolDescriptor descriptor;
    descriptor.name = name;
    descriptor.description = description;
    descriptor.input_schema = GenerateSchema(params);
    descriptor.callable = std::move(callable);
    descriptor.is_async = false;
    Register(std::move(descriptor));
}

void ToolRegistry::RegisterAsync(const std::string& name,
                                 const std::string& description,
                                 const std::vector<ParamSpec>& params,
                                 AsyncToolCallable callable) {
    ToolDescriptor descriptor;
    descriptor.name = name;
    descriptor.description = description;
    descriptor.input_schema = GenerateSchema(params);
    descriptor.async_callable = std::move(callable);
    descriptor.is_async = true;
    Register(std::move(descriptor));
}

const ToolDescriptor* ToolRegistry::Find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &tools_[it->second];
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return index_.count(name) > 0;
}

std::vector<std::string> ToolRegistry::Names() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& tool : tools_) {
        names.push_back(tool.name);
    }
    return names;
}

} // namespace berry_mcp
