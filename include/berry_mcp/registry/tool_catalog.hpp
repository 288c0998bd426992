#pragma once

#include <berry_mcp/registry/tool_registry.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace berry_mcp {

// Adds one module's tools to a registry. May throw.
using ToolRegistrar = std::function<void(ToolRegistry&)>;

// ---------------------------------------------------------------------------
// ToolCatalog: the fixed table of tool modules known at build time,
// in the order they were added.
// ---------------------------------------------------------------------------
class ToolCatalog {
public:
    struct Module {
        std::string name;
        std::string description;
        ToolRegistrar registrar;
    };

    // Adding a module under an existing name replaces it.
    void Add(std::string name, std::string description, ToolRegistrar registrar);

    [[nodiscard]] const Module* Find(const std::string& name) const;

    [[nodiscard]] const std::vector<Module>& Modules() const noexcept {
        return modules_;
    }

    [[nodiscard]] std::vector<std::string> Names() const;

private:
    std::vector<Module> modules_;
};

// Register the named modules (every module when `names` is empty). Unknown
// names and registrars that throw are logged and skipped. Returns the
// number of modules loaded.
std::size_t AutoDiscover(ToolRegistry& registry,
                         const ToolCatalog& catalog,
                         const std::vector<std::string>& names = {});

} // namespace berry_mcp
