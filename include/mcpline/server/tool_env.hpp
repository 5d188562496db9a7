#pragma once

#include <mcpline/core/log.hpp>
#include <mcpline/core/result.hpp>
#include <mcpline/server/capability.hpp>
#include <mcpline/transport/transport_handle.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcpline {

// ---------------------------------------------------------------------------
// ToolEnv — what a tool may touch while it runs.
//
// Built by the engine for one tools/call and dropped when the tool returns.
// Every write goes through the same transport as the eventual response and
// completes before Execute() returns.
// ---------------------------------------------------------------------------
class ToolEnv {
public:
    ToolEnv(std::shared_ptr<TransportHandle> transport, const ResourceRegistry& resources);

    Result<void, Error> SendNotification(const std::string& method,
                                         std::optional<nlohmann::json> params = std::nullopt);

    // notifications/message {level, data}.
    Result<void, Error> Log(LogLevel level, const std::string& message);

    // notifications/progress {progressToken, progress, total?}. The token is
    // the one the caller sent in _meta.progressToken (integer or string).
    Result<void, Error> SendProgress(const nlohmann::json& token, double progress,
                                     std::optional<double> total = std::nullopt);

    [[nodiscard]] std::vector<std::string> ListResourceKeys() const;
    [[nodiscard]] const IResource* GetResource(const std::string& uri) const;

private:
    std::shared_ptr<TransportHandle> transport_;
    const ResourceRegistry& resources_;
};

} // namespace mcpline
