#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// Input schema and description of one front-end tool.
struct HandlerSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

// Result of one front-end tool call: MCP content blocks plus the error flag.
struct HandlerResult {
    bool is_error = false;
    nlohmann::json content;
};

using Handler = std::function<HandlerResult(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// HandlerRegistry: the tools the fleet itself exposes over MCP.
//
// Listed in registration order. Execute() never throws: a handler that
// throws yields an error result.
// ---------------------------------------------------------------------------
class HandlerRegistry {
public:
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  Handler handler);

    [[nodiscard]] const std::vector<HandlerSchema>& Schemas() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool Has(const std::string& name) const;

    [[nodiscard]] HandlerResult Execute(const std::string& name,
                                        const nlohmann::json& arguments) const;

private:
    std::vector<HandlerSchema> schemas_;
    std::map<std::string, Handler> handlers_;
};

} // namespace mcp_fleet
