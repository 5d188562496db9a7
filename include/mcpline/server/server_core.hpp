#pragma once

#include <mcpline/config/app_config.hpp>
#include <mcpline/core/result.hpp>
#include <mcpline/protocol/message.hpp>
#include <mcpline/protocol/types.hpp>
#include <mcpline/server/capability.hpp>
#include <mcpline/server/tool_env.hpp>
#include <mcpline/transport/i_transport.hpp>
#include <mcpline/transport/transport_handle.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcpline {

// ---------------------------------------------------------------------------
// ServerCore — the dispatch engine, minus anything that depends on the
// host's Context type.
//
// Owns the resource and prompt registries and routes every inbound message
// through a fixed method table:
//   - initialize, ping
//   - tools/list, tools/call
//   - resources/list, resources/read
//   - prompts/list, prompts/get
// Notifications never produce output; inbound responses are dropped.
//
// The tool registry is typed on Context and lives in McpServer<Context>,
// which reaches back in through the protected hooks below. One instance
// handles one message at a time.
// ---------------------------------------------------------------------------
class ServerCore {
public:
    explicit ServerCore(ServerConfig config = {});
    virtual ~ServerCore() = default;

    ServerCore(const ServerCore&) = delete;
    ServerCore& operator=(const ServerCore&) = delete;

    // Fails with ErrorKind::DuplicateEntry if the URI is already taken; the
    // existing entry is kept.
    Result<void, Error> AddResource(std::unique_ptr<IResource> resource);

    // Fails with ErrorKind::DuplicateEntry if the name is already taken.
    Result<void, Error> AddPrompt(std::unique_ptr<IPrompt> prompt);

    [[nodiscard]] const ServerConfig& Config() const noexcept { return config_; }
    [[nodiscard]] const ResourceRegistry& Resources() const noexcept { return resources_; }
    [[nodiscard]] std::size_t PromptCount() const noexcept { return prompts_.size(); }
    [[nodiscard]] bool IsInitialized() const noexcept { return initialized_; }

    // Snapshot taken at the first initialize; all false before that.
    [[nodiscard]] const ServerCapabilities& Capabilities() const noexcept {
        return capabilities_;
    }

protected:
    // -- Tool registry hooks ------------------------------------------------

    [[nodiscard]] virtual bool HasTools() const = 0;
    [[nodiscard]] virtual bool HasTool(const std::string& name) const = 0;
    [[nodiscard]] virtual std::vector<ToolDescriptor> ToolDescriptors() const = 0;
    virtual Result<CallToolResult, Error> CallTool(const std::string& name,
                                                   const nlohmann::json& arguments,
                                                   ToolEnv& env) = 0;

    // -- Drivers ------------------------------------------------------------

    // Read, dispatch and answer until the transport reports closed.
    Result<void, Error> Serve(std::shared_ptr<ITransport> transport);

    // Read, dispatch and answer exactly one message.
    Result<void, Error> ServeOnce(std::shared_ptr<ITransport> transport);

    // Dispatch one already-decoded message. Tools run against whatever
    // transport is currently bound (none outside Serve/ServeOnce).
    std::optional<Message> Handle(const Message& message);

private:
    std::optional<Message> HandleRequest(const Request& request);
    void HandleNotification(const Notification& notification);

    Result<nlohmann::json, Error> Route(const Request& request);

    Result<nlohmann::json, Error> HandleInitialize(const std::optional<nlohmann::json>& params);
    Result<nlohmann::json, Error> HandleToolsList(const std::optional<nlohmann::json>& params);
    Result<nlohmann::json, Error> HandleToolsCall(const std::optional<nlohmann::json>& params);
    Result<nlohmann::json, Error> HandleResourcesList(const std::optional<nlohmann::json>& params);
    Result<nlohmann::json, Error> HandleResourcesRead(const std::optional<nlohmann::json>& params);
    Result<nlohmann::json, Error> HandlePromptsList(const std::optional<nlohmann::json>& params);
    Result<nlohmann::json, Error> HandlePromptsGet(const std::optional<nlohmann::json>& params);

    // Answers a payload the transport could not decode. The id is unknown,
    // so the response carries null.
    Result<void, Error> AnswerDecodeFailure(const Error& error);

    ServerConfig config_;
    ResourceRegistry resources_;
    PromptRegistry prompts_;
    std::shared_ptr<TransportHandle> transport_;
    ServerCapabilities capabilities_;
    bool initialized_ = false;
};

} // namespace mcpline
