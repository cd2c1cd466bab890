#include "tools/tool_registry.hpp"

#include <algorithm>
#include <sstream>

#include "utils/logging.hpp"

namespace interjudge::tools {

void ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    auto name = tool->Name();
    tools_.emplace(std::move(name), std::move(tool));
}

Tool* ToolRegistry::Get(const std::string& name) {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool ToolRegistry::Has(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

std::vector<ToolDefinition> ToolRegistry::GetDefinitions() const {
    std::vector<ToolDefinition> defs;
    for (const auto& [name, tool] : tools_) {
        ToolDefinition def{};
        def.name = name;
        def.description = tool->Description();
        def.parameters_json = tool->ParametersJson();
        defs.push_back(def);
    }
    std::sort(defs.begin(), defs.end(), [](const ToolDefinition& a, const ToolDefinition& b) {
        return a.name < b.name;
    });
    return defs;
}

std::string ToolRegistry::Execute(
    const std::string& name,
    const std::unordered_map<std::string, std::string>& params) {
    auto tool = Get(name);
    if (!tool) {
        return "Error: Tool '" + name + "' not found";
    }
    std::ostringstream start;
    start << "start name=" << name;
    if (!params.empty()) {
        start << " params={";
        bool first = true;
        for (const auto& [key, value] : params) {
            if (!first) {
                start << ", ";
            }
            start << key << "(" << value.size() << " bytes)";
            first = false;
        }
        start << "}";
    }
    utils::LogInfo("tool", start.str());
    const auto result = tool->Execute(params);
    utils::LogInfo("tool", "end name=" + name + " size=" + std::to_string(result.size()));
    return result;
}

std::string ToolRegistry::ExecuteCall(const nlohmann::json& call) {
    if (!call.is_object() || !call.contains("name") || !call["name"].is_string()) {
        return "Error: tool call must be an object with a string 'name'";
    }
    std::unordered_map<std::string, std::string> params;
    if (call.contains("arguments") && call["arguments"].is_object()) {
        for (const auto& item : call["arguments"].items()) {
            if (item.value().is_string()) {
                params[item.key()] = item.value().get<std::string>();
            } else {
                params[item.key()] = item.value().dump();
            }
        }
    }
    return Execute(call["name"].get<std::string>(), params);
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace interjudge::tools
