#pragma once

#include <mcpline/core/result.hpp>
#include <mcpline/protocol/types.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcpline {

class ToolEnv;

// ---------------------------------------------------------------------------
// ITool — a named operation the host exposes through tools/call.
//
// Context is whatever per-call state the host threads through the engine
// (caller identity, shared counters, ...). The engine never inspects it.
// ---------------------------------------------------------------------------
template <typename Context>
class ITool {
public:
    virtual ~ITool() = default;

    [[nodiscard]] virtual std::string Name() const = 0;
    [[nodiscard]] virtual std::string Description() const = 0;

    // JSON Schema object describing `arguments`.
    [[nodiscard]] virtual nlohmann::json InputSchema() const = 0;

    [[nodiscard]] virtual std::optional<ToolAnnotations> Annotations() const {
        return std::nullopt;
    }

    // A tool can fail two ways:
    //   - return an Error: the caller receives a JSON-RPC error response;
    //   - return CallToolResult::Failure(...): the caller receives a normal
    //     result with isError set and the explanation as content.
    // Use the second for failures the model should read and react to.
    //
    // Notifications written through `env` reach the caller before the
    // response to this call.
    virtual Result<CallToolResult, Error> Execute(const nlohmann::json& arguments,
                                                  Context& context,
                                                  ToolEnv& env) const = 0;

    [[nodiscard]] ToolDescriptor ToDescriptor() const {
        return ToolDescriptor{Name(), Description(), InputSchema(), Annotations()};
    }
};

// Adapts a callable to ITool, for tools that need no state of their own.
template <typename Context>
class FunctionTool : public ITool<Context> {
public:
    using Handler = std::function<Result<CallToolResult, Error>(
        const nlohmann::json& arguments, Context& context, ToolEnv& env)>;

    FunctionTool(std::string name, std::string description,
                 nlohmann::json input_schema, Handler handler,
                 std::optional<ToolAnnotations> annotations = std::nullopt)
        : name_(std::move(name)),
          description_(std::move(description)),
          input_schema_(std::move(input_schema)),
          handler_(std::move(handler)),
          annotations_(std::move(annotations)) {}

    [[nodiscard]] std::string Name() const override { return name_; }
    [[nodiscard]] std::string Description() const override { return description_; }
    [[nodiscard]] nlohmann::json InputSchema() const override { return input_schema_; }
    [[nodiscard]] std::optional<ToolAnnotations> Annotations() const override {
        return annotations_;
    }

    Result<CallToolResult, Error> Execute(const nlohmann::json& arguments,
                                          Context& context,
                                          ToolEnv& env) const override {
        return handler_(arguments, context, env);
    }

private:
    std::string name_;
    std::string description_;
    nlohmann::json input_schema_;
    Handler handler_;
    std::optional<ToolAnnotations> annotations_;
};

// ---------------------------------------------------------------------------
// IResource — a readable entity addressed by URI.
// ---------------------------------------------------------------------------
class IResource {
public:
    virtual ~IResource() = default;

    [[nodiscard]] virtual std::string Uri() const = 0;
    [[nodiscard]] virtual std::string Name() const = 0;
    [[nodiscard]] virtual std::optional<std::string> Description() const {
        return std::nullopt;
    }
    [[nodiscard]] virtual std::optional<std::string> MimeType() const {
        return std::nullopt;
    }

    virtual Result<std::vector<ResourceContent>, Error> Contents() const = 0;

    [[nodiscard]] ResourceDescriptor ToDescriptor() const {
        return ResourceDescriptor{Uri(), Name(), Description(), MimeType()};
    }
};

using ResourceRegistry = std::map<std::string, std::unique_ptr<IResource>>;

// ---------------------------------------------------------------------------
// IPrompt — a message template filled from string arguments.
// ---------------------------------------------------------------------------
class IPrompt {
public:
    virtual ~IPrompt() = default;

    [[nodiscard]] virtual std::string Name() const = 0;
    [[nodiscard]] virtual std::optional<std::string> Description() const {
        return std::nullopt;
    }
    [[nodiscard]] virtual std::vector<PromptArgument> Arguments() const { return {}; }

    virtual Result<std::vector<PromptMessage>, Error> GetMessages(
        const std::map<std::string, std::string>& arguments) const = 0;

    [[nodiscard]] PromptDescriptor ToDescriptor() const {
        return PromptDescriptor{Name(), Description(), Arguments()};
    }
};

using PromptRegistry = std::map<std::string, std::unique_ptr<IPrompt>>;

} // namespace mcpline
