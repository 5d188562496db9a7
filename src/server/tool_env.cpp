#include <mcpline/server/tool_env.hpp>

namespace mcpline {

ToolEnv::ToolEnv(std::shared_ptr<TransportHandle> transport,
                 const ResourceRegistry& resources)
    : transport_(std::move(transport)), resources_(resources) {}

Result<void, Error> ToolEnv::SendNotification(const std::string& method,
                                              std::optional<nlohmann::json> params) {
    if (!transport_) {
        return Result<void, Error>::Err(
            Error::Internal("No active transport for notification: " + method));
    }
    return transport_->Write(MakeNotification(method, std::move(params)));
}

Result<void, Error> ToolEnv::Log(LogLevel level, const std::string& message) {
    return SendNotification("notifications/message",
                            nlohmann::json{{"level", ProtocolLevelName(level)},
                                           {"data", message}});
}

Result<void, Error> ToolEnv::SendProgress(const nlohmann::json& token, double progress,
                                          std::optional<double> total) {
    nlohmann::json params = {{"progressToken", token}, {"progress", progress}};
    if (total.has_value()) {
        params["total"] = *total;
    }
    return SendNotification("notifications/progress", std::move(params));
}

std::vector<std::string> ToolEnv::ListResourceKeys() const {
    std::vector<std::string> keys;
    keys.reserve(resources_.size());
    for (const auto& [uri, resource] : resources_) {
        keys.push_back(uri);
    }
    return keys;
}

const IResource* ToolEnv::GetResource(const std::string& uri) const {
    auto it = resources_.find(uri);
    if (it == resources_.end()) {
        return nullptr;
    }
    return it->second.get();
}

} // namespace mcpline
