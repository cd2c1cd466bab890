#pragma once

#include <string>
#include <unordered_map>

namespace interjudge::tools {

// A named operation a code-generation agent can call by function name with
// string-valued arguments. Results are plain text meant to be fed back to it.
class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    virtual std::string ParametersJson() const = 0;
    virtual std::string Execute(const std::unordered_map<std::string, std::string>& params) = 0;
};

}  // namespace interjudge::tools
