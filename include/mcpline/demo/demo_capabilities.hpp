#pragma once

#include <mcpline/http/http_endpoint.hpp>
#include <mcpline/server/mcp_server.hpp>

#include <atomic>
#include <cstdint>
#include <memory>

namespace mcpline {

// Per-call state of the demo host. The counter is shared by every engine the
// process creates, so it is atomic; the caller is per request.
struct DemoContext {
    std::shared_ptr<std::atomic<std::int64_t>> counter =
        std::make_shared<std::atomic<std::int64_t>>(0);
    Identity caller;
};

// Register the demo tools (echo, counter_get, counter_increment,
// counter_reset, whoami), the server://info resource and the greeting prompt.
Result<void, Error> RegisterDemoCapabilities(McpServer<DemoContext>& server);

} // namespace mcpline
