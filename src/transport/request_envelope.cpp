#include <mcp_fleet/transport/request_envelope.hpp>

namespace mcp_fleet {

const char* RequestOriginName(RequestOrigin origin) {
    switch (origin) {
        case RequestOrigin::Mcp:      return "mcp";
        case RequestOrigin::Cli:      return "cli";
        case RequestOrigin::Api:      return "api";
        case RequestOrigin::Health:   return "health";
        case RequestOrigin::Internal: return "internal";
    }
    return "internal";
}

} // namespace mcp_fleet
