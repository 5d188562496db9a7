#pragma once

#include <mcpline/server/capability.hpp>
#include <mcpline/server/server_core.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcpline {

// Context for hosts that have no per-call state to pass.
struct NoContext {};

// ---------------------------------------------------------------------------
// McpServer — the dispatch engine, typed on the host's per-call Context.
//
// Usage (persistent stream):
//   McpServer<> server(config);
//   server.AddTool("echo", "Echo input", schema, handler);
//   NoContext ctx;
//   server.RunLoop(std::make_shared<StreamTransport>(), ctx);
//
// Usage (one buffered exchange):
//   auto transport = std::make_shared<BufferedTransport>(body);
//   server.DispatchOnce(transport, ctx);
//   auto out = transport->TakeLastMessage();
// ---------------------------------------------------------------------------
template <typename Context = NoContext>
class McpServer : public ServerCore {
public:
    using Tool = ITool<Context>;
    using ToolHandler = typename FunctionTool<Context>::Handler;

    explicit McpServer(ServerConfig config = {}) : ServerCore(std::move(config)) {}

    // Fails with ErrorKind::DuplicateEntry if the name is already taken; the
    // existing tool is kept.
    Result<void, Error> AddTool(std::unique_ptr<Tool> tool) {
        if (!tool) {
            return Result<void, Error>::Err(Error::Internal("Cannot register a null tool"));
        }
        auto name = tool->Name();
        if (tools_.count(name) > 0) {
            return Result<void, Error>::Err(
                Error{ErrorKind::DuplicateEntry, "Duplicate tool: " + name, std::nullopt});
        }
        tools_.emplace(std::move(name), std::move(tool));
        return Result<void, Error>::Ok();
    }

    Result<void, Error> AddTool(std::string name, std::string description,
                                nlohmann::json input_schema, ToolHandler handler) {
        return AddTool(std::make_unique<FunctionTool<Context>>(
            std::move(name), std::move(description), std::move(input_schema),
            std::move(handler)));
    }

    [[nodiscard]] std::size_t ToolCount() const noexcept { return tools_.size(); }

    // Serve until the transport reports closed. Only read failures other than
    // closed, and write failures, end the loop with an error.
    Result<void, Error> RunLoop(std::shared_ptr<ITransport> transport, Context& context) {
        ContextScope scope(*this, context);
        return Serve(std::move(transport));
    }

    // Serve exactly one inbound message. Output stays in the transport.
    Result<void, Error> DispatchOnce(std::shared_ptr<ITransport> transport, Context& context) {
        ContextScope scope(*this, context);
        return ServeOnce(std::move(transport));
    }

    // Dispatch one decoded message with no transport bound. Tool
    // notifications fail with ErrorKind::Internal in this mode.
    std::optional<Message> HandleMessage(const Message& message, Context& context) {
        ContextScope scope(*this, context);
        return Handle(message);
    }

protected:
    [[nodiscard]] bool HasTools() const override { return !tools_.empty(); }

    [[nodiscard]] bool HasTool(const std::string& name) const override {
        return tools_.count(name) > 0;
    }

    [[nodiscard]] std::vector<ToolDescriptor> ToolDescriptors() const override {
        std::vector<ToolDescriptor> descriptors;
        descriptors.reserve(tools_.size());
        for (const auto& entry : tools_) {
            descriptors.push_back(entry.second->ToDescriptor());
        }
        return descriptors;
    }

    Result<CallToolResult, Error> CallTool(const std::string& name,
                                           const nlohmann::json& arguments,
                                           ToolEnv& env) override {
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            return Result<CallToolResult, Error>::Err(Error::ToolFailed("Unknown tool: " + name));
        }
        if (context_ == nullptr) {
            return Result<CallToolResult, Error>::Err(
                Error::Internal("No call context bound for tool: " + name));
        }
        return it->second->Execute(arguments, *context_, env);
    }

private:
    // Binds the caller's context for the duration of one driver call.
    class ContextScope {
    public:
        ContextScope(McpServer& server, Context& context)
            : server_(server), previous_(server.context_) {
            server_.context_ = &context;
        }
        ~ContextScope() { server_.context_ = previous_; }

        ContextScope(const ContextScope&) = delete;
        ContextScope& operator=(const ContextScope&) = delete;

    private:
        McpServer& server_;
        Context* previous_;
    };

    std::map<std::string, std::unique_ptr<Tool>> tools_;
    Context* context_ = nullptr;
};

} // namespace mcpline
