#include <mcpline/demo/demo_capabilities.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace mcpline {

namespace {

// ---------------------------------------------------------------------------
// Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json IntProp(const std::string& desc) {
    return {{"type", "integer"}, {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required = nlohmann::json::array()) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

// ---------------------------------------------------------------------------
// echo
// ---------------------------------------------------------------------------
class EchoTool : public ITool<DemoContext> {
public:
    std::string Name() const override { return "echo"; }
    std::string Description() const override { return "Echo back the input message"; }
    nlohmann::json InputSchema() const override {
        return MakeSchema({{"message", StringProp("The message to echo back")}},
                          {"message"});
    }
    std::optional<ToolAnnotations> Annotations() const override {
        ToolAnnotations annotations;
        annotations.read_only_hint = true;
        annotations.idempotent_hint = true;
        return annotations;
    }

    Result<CallToolResult, Error> Execute(const nlohmann::json& arguments,
                                          DemoContext& /*context*/,
                                          ToolEnv& env) const override {
        auto it = arguments.find("message");
        if (it == arguments.end() || !it->is_string()) {
            return Result<CallToolResult, Error>::Err(
                Error::InvalidParams("Missing 'message' parameter"));
        }
        auto message = it->get<std::string>();

        auto logged = env.Log(LogLevel::Info, "Echoing: " + message);
        if (logged.IsErr()) {
            return Result<CallToolResult, Error>::Err(std::move(logged).Error());
        }
        return Result<CallToolResult, Error>::Ok(CallToolResult::Text("Echo: " + message));
    }
};

// ---------------------------------------------------------------------------
// counter_*
// ---------------------------------------------------------------------------
Result<CallToolResult, Error> CounterGet(const nlohmann::json& /*arguments*/,
                                         DemoContext& context, ToolEnv& /*env*/) {
    return Result<CallToolResult, Error>::Ok(
        CallToolResult::Text("Counter value: " + std::to_string(context.counter->load())));
}

Result<CallToolResult, Error> CounterIncrement(const nlohmann::json& arguments,
                                               DemoContext& context, ToolEnv& env) {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();

    std::int64_t amount = 1;
    auto it = arguments.find("amount");
    if (it != arguments.end() && it->is_number_integer()) {
        if (it->is_number_unsigned() &&
            it->get<std::uint64_t>() > static_cast<std::uint64_t>(kMax)) {
            return Result<CallToolResult, Error>::Err(
                Error::InvalidParams("'amount' is out of range"));
        }
        amount = it->get<std::int64_t>();
    }

    auto current = context.counter->load();
    std::int64_t value = 0;
    do {
        if ((amount > 0 && current > kMax - amount) || (amount < 0 && current < kMin - amount)) {
            return Result<CallToolResult, Error>::Err(Error::InvalidParams(
                "Incrementing " + std::to_string(current) + " by " + std::to_string(amount) +
                " would overflow the counter"));
        }
        value = current + amount;
    } while (!context.counter->compare_exchange_weak(current, value));

    auto logged = env.Log(LogLevel::Debug, "Counter incremented by " + std::to_string(amount) +
                                               " to " + std::to_string(value));
    if (logged.IsErr()) {
        return Result<CallToolResult, Error>::Err(std::move(logged).Error());
    }
    return Result<CallToolResult, Error>::Ok(
        CallToolResult::Text("Counter incremented to: " + std::to_string(value)));
}

Result<CallToolResult, Error> CounterReset(const nlohmann::json& /*arguments*/,
                                           DemoContext& context, ToolEnv& /*env*/) {
    auto previous = context.counter->exchange(0);
    return Result<CallToolResult, Error>::Ok(
        CallToolResult::Text("Counter reset from " + std::to_string(previous) + " to 0"));
}

// ---------------------------------------------------------------------------
// whoami
// ---------------------------------------------------------------------------
Result<CallToolResult, Error> WhoAmI(const nlohmann::json& /*arguments*/,
                                     DemoContext& context, ToolEnv& /*env*/) {
    const auto& caller = context.caller;
    if (caller.subject.empty()) {
        return Result<CallToolResult, Error>::Ok(
            CallToolResult::Failure("No caller identity on this transport"));
    }
    nlohmann::json info = {
        {"subject", caller.subject},
        {"scopes", caller.scopes},
        {"claims", caller.claims},
    };
    if (caller.tenant.has_value()) {
        info["tenant"] = *caller.tenant;
    }
    return Result<CallToolResult, Error>::Ok(CallToolResult::Text(info.dump()));
}

// ---------------------------------------------------------------------------
// server://info
// ---------------------------------------------------------------------------
class ServerInfoResource : public IResource {
public:
    explicit ServerInfoResource(ServerConfig config) : config_(std::move(config)) {}

    std::string Uri() const override { return "server://info"; }
    std::string Name() const override { return "Server info"; }
    std::optional<std::string> Description() const override {
        return "Name, version and protocol revision of this server";
    }
    std::optional<std::string> MimeType() const override { return "application/json"; }

    Result<std::vector<ResourceContent>, Error> Contents() const override {
        nlohmann::json info = {
            {"name", config_.name},
            {"version", config_.version},
            {"protocolVersion", kProtocolVersion},
            {"pageSize", config_.page_size},
        };
        return Result<std::vector<ResourceContent>, Error>::Ok(
            {ResourceContent::Text(Uri(), info.dump(), MimeType())});
    }

private:
    ServerConfig config_;
};

// ---------------------------------------------------------------------------
// greeting
// ---------------------------------------------------------------------------
class GreetingPrompt : public IPrompt {
public:
    std::string Name() const override { return "greeting"; }
    std::optional<std::string> Description() const override {
        return "Ask the assistant to greet someone";
    }
    std::vector<PromptArgument> Arguments() const override {
        return {
            PromptArgument{"name", "Who to greet", true},
            PromptArgument{"style", "Tone of the greeting (default: friendly)", false},
        };
    }

    Result<std::vector<PromptMessage>, Error> GetMessages(
        const std::map<std::string, std::string>& arguments) const override {
        auto name = arguments.find("name");
        if (name == arguments.end() || name->second.empty()) {
            return Result<std::vector<PromptMessage>, Error>::Err(
                Error::InvalidParams("Missing required argument: name"));
        }
        std::string style = "friendly";
        if (auto it = arguments.find("style"); it != arguments.end() && !it->second.empty()) {
            style = it->second;
        }
        return Result<std::vector<PromptMessage>, Error>::Ok({
            PromptMessage{Role::User,
                          Content::Text("Write a " + style + " greeting for " +
                                        name->second + ".")},
        });
    }
};

} // anonymous namespace

Result<void, Error> RegisterDemoCapabilities(McpServer<DemoContext>& server) {
    std::vector<Result<void, Error>> steps;
    steps.push_back(server.AddTool(std::make_unique<EchoTool>()));
    steps.push_back(server.AddTool(
        "counter_get", "Get the current counter value", MakeSchema(nlohmann::json::object()),
        CounterGet));
    steps.push_back(server.AddTool(
        "counter_increment", "Increment the counter and return the new value",
        MakeSchema({{"amount", IntProp("Amount to increment by (default: 1)")}}),
        CounterIncrement));
    steps.push_back(server.AddTool(
        "counter_reset", "Reset the counter to zero", MakeSchema(nlohmann::json::object()),
        CounterReset));
    steps.push_back(server.AddTool(
        "whoami", "Describe the authenticated caller", MakeSchema(nlohmann::json::object()),
        WhoAmI));
    steps.push_back(server.AddResource(std::make_unique<ServerInfoResource>(server.Config())));
    steps.push_back(server.AddPrompt(std::make_unique<GreetingPrompt>()));

    for (auto& step : steps) {
        if (step.IsErr()) {
            return step;
        }
    }
    return Result<void, Error>::Ok();
}

} // namespace mcpline
