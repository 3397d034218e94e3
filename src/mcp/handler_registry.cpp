#include <mcp_fleet/mcp/handler_registry.hpp>

#include <mcp_fleet/core/log.hpp>

namespace mcp_fleet {

namespace {

HandlerResult TextError(const std::string& text) {
    return HandlerResult{
        true,
        nlohmann::json::array({{{"type", "text"}, {"text", text}}})};
}

} // anonymous namespace

void HandlerRegistry::Register(const std::string& name,
                               const std::string& description,
                               const nlohmann::json& input_schema,
                               Handler handler) {
    if (handlers_.count(name) == 0) {
        schemas_.push_back({name, description, input_schema});
    }
    handlers_[name] = std::move(handler);
}

bool HandlerRegistry::Has(const std::string& name) const {
    return handlers_.count(name) > 0;
}

HandlerResult HandlerRegistry::Execute(const std::string& name,
                                       const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return TextError("Unknown tool: " + name);
    }

    try {
        return it->second(arguments);
    } catch (const std::exception& e) {
        LogError("mcp", "Handler '" + name + "' threw: " + e.what());
        return TextError(std::string("Tool error: ") + e.what());
    }
}

} // namespace mcp_fleet
