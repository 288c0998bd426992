#include <berry_mcp/registry/tool_catalog.hpp>

#include <berry_mcp/core/ids.hpp>
#include <berry_mcp/core/log.hpp>

#include <exception>

namespace berry_mcp {

void ToolCatalog::Add(std::string name, std::string description,
                      ToolRegistrar registrar) {
    for (auto& module : modules_) {
        if (module.name == name) {
            module.description = std::move(description);
            module.registrar = std::move(registrar);
            return;
        }
    }
    modules_.push_back({std::move(name), std::move(description), std::move(registrar)});
}

const ToolCatalog::Module* ToolCatalog::Find(const std::string& name) const {
    for (const auto& module : modules_) {
        if (module.name == name) return &module;
    }
    return nullptr;
}

std::vector<std::string> ToolCatalog::Names() const {
    std::vector<std::string> names;
    names.reserve(modules_.size());
    for (const auto& module : modules_) {
        names.push_back(module.name);
    }
    return names;
}

namespace {

bool LoadModule(ToolRegistry& registry, const ToolCatalog::Module& module) {
    if (!module.registrar) {
        LogWarn("catalog", "Module '" + module.name + "' has no registrar");
        return false;
    }
    auto before = registry.Size();
    try {
        module.registrar(registry);
    } catch (const std::exception& e) {
        LogWarn("catalog", "Could not load module '" + module.name + "': " +
                               ExceptionTypeName(e) + ": " + e.what());
        return false;
    } catch (...) {
        LogWarn("catalog", "Could not load module '" + module.name + "': unknown exception");
        return false;
    }
    LogInfo("catalog", "Loaded module '" + module.name + "' (" +
                           std::to_string(registry.Size() - before) + " new tools)");
    return true;
}

} // anonymous namespace

std::size_t AutoDiscover(ToolRegistry& registry,
                         const ToolCatalog& catalog,
                         const std::vector<std::string>& names) {
    std::size_t loaded = 0;
    if (names.empty()) {
        for (const auto& module : catalog.Modules()) {
            if (LoadModule(registry, module)) ++loaded;
        }
        return loaded;
    }

    for (const auto& name : names) {
        const auto* module = catalog.Find(name);
        if (module == nullptr) {
            LogWarn("catalog", "Unknown tool module: " + name);
            continue;
        }
        if (LoadModule(registry, *module)) ++loaded;
    }
    return loaded;
}

} // namespace berry_mcp
