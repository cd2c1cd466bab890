#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "nlohmann/json.hpp"

#include "tools/tool.hpp"

namespace interjudge::tools {

struct ToolDefinition {
    std::string name;
    std::string description;
    std::string parameters_json;
};

class ToolRegistry {
public:
    void Register(std::unique_ptr<Tool> tool);
    Tool* Get(const std::string& name);
    bool Has(const std::string& name) const;
    std::vector<ToolDefinition> GetDefinitions() const;
    std::string Execute(const std::string& name,
                        const std::unordered_map<std::string, std::string>& params);

    // {"name": "...", "arguments": {...}}. Non-string argument values are
    // passed on in their JSON text form.
    std::string ExecuteCall(const nlohmann::json& call);

    std::vector<std::string> List() const;

private:
    std::unordered_map<std::string, std::unique_ptr<Tool>> tools_;
};

}  // namespace interjudge::tools
