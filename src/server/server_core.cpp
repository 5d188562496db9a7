#include <mcpline/server/server_core.hpp>

#include <mcpline/core/log.hpp>
#include <mcpline/pagination/pagination.hpp>

#include <algorithm>
#include <exception>
#include <map>
#include <utility>

namespace mcpline {

namespace {

constexpr const char* kComponent = "server";

using JsonResult = Result<nlohmann::json, Error>;

JsonResult InvalidParams(const std::string& message) {
    return JsonResult::Err(Error::InvalidParams(message));
}

// Params for a method that requires them: an object, present.
Result<const nlohmann::json*, Error> RequireObjectParams(
    const std::optional<nlohmann::json>& params, const std::string& method) {
    if (!params.has_value() || !params->is_object()) {
        return Result<const nlohmann::json*, Error>::Err(
            Error::InvalidParams("Missing or invalid params for " + method));
    }
    return Result<const nlohmann::json*, Error>::Ok(&*params);
}

Result<std::string, Error> RequireString(const nlohmann::json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        return Result<std::string, Error>::Err(
            Error::InvalidParams(std::string("Missing or invalid '") + key + "' parameter"));
    }
    return Result<std::string, Error>::Ok(it->get<std::string>());
}

// List params are optional; a cursor that is not a string counts as absent.
Result<std::optional<std::string>, Error> ListCursor(
    const std::optional<nlohmann::json>& params) {
    using CursorResult = Result<std::optional<std::string>, Error>;
    if (!params.has_value() || params->is_null()) {
        return CursorResult::Ok(std::nullopt);
    }
    if (!params->is_object()) {
        return CursorResult::Err(Error::InvalidParams("List params must be an object"));
    }
    auto it = params->find("cursor");
    if (it == params->end() || !it->is_string()) {
        return CursorResult::Ok(std::nullopt);
    }
    return CursorResult::Ok(it->get<std::string>());
}

template <typename Descriptor>
nlohmann::json PageToJson(const char* key, const Page<Descriptor>& page) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : page.items) {
        items.push_back(item.ToJson());
    }
    nlohmann::json result = {{key, items}};
    if (page.next_cursor.has_value()) {
        result["nextCursor"] = *page.next_cursor;
    }
    return result;
}

} // anonymous namespace

ServerCore::ServerCore(ServerConfig config) : config_(std::move(config)) {}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------
Result<void, Error> ServerCore::AddResource(std::unique_ptr<IResource> resource) {
    if (!resource) {
        return Result<void, Error>::Err(Error::Internal("Cannot register a null resource"));
    }
    auto uri = resource->Uri();
    if (resources_.count(uri) > 0) {
        return Result<void, Error>::Err(
            Error{ErrorKind::DuplicateEntry, "Duplicate resource: " + uri, std::nullopt});
    }
    resources_.emplace(std::move(uri), std::move(resource));
    return Result<void, Error>::Ok();
}

Result<void, Error> ServerCore::AddPrompt(std::unique_ptr<IPrompt> prompt) {
    if (!prompt) {
        return Result<void, Error>::Err(Error::Internal("Cannot register a null prompt"));
    }
    auto name = prompt->Name();
    if (prompts_.count(name) > 0) {
        return Result<void, Error>::Err(
            Error{ErrorKind::DuplicateEntry, "Duplicate prompt: " + name, std::nullopt});
    }
    prompts_.emplace(std::move(name), std::move(prompt));
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Drivers
// ---------------------------------------------------------------------------
Result<void, Error> ServerCore::Serve(std::shared_ptr<ITransport> transport) {
    transport_ = std::make_shared<TransportHandle>(std::move(transport));
    LogInfo(kComponent, "Session started: " + config_.name + " " + config_.version);

    while (true) {
        auto message = transport_->Read();
        if (message.IsErr()) {
            const auto& error = message.Error();
            if (error.kind == ErrorKind::TransportClosed) {
                break;
            }
            if (error.kind == ErrorKind::Parse || error.kind == ErrorKind::InvalidMessage) {
                auto answered = AnswerDecodeFailure(error);
                if (answered.IsErr()) {
                    LogError(kComponent, "Write failed: " + answered.Error().ToString());
                    transport_->Close();
                    transport_.reset();
                    return answered;
                }
                continue;
            }
            LogError(kComponent, "Read failed: " + error.ToString());
            transport_->Close();
            transport_.reset();
            return Result<void, Error>::Err(error);
        }

        auto response = Handle(message.Value());
        if (response.has_value()) {
            auto written = transport_->Write(*response);
            if (written.IsErr()) {
                LogError(kComponent, "Write failed: " + written.Error().ToString());
                transport_->Close();
                transport_.reset();
                return written;
            }
        }
    }

    transport_->Close();
    transport_.reset();
    LogInfo(kComponent, "Session closed");
    return Result<void, Error>::Ok();
}

Result<void, Error> ServerCore::ServeOnce(std::shared_ptr<ITransport> transport) {
    transport_ = std::make_shared<TransportHandle>(std::move(transport));

    auto finish = [this](Result<void, Error> outcome) {
        transport_.reset();
        return outcome;
    };

    auto message = transport_->Read();
    if (message.IsErr()) {
        const auto& error = message.Error();
        if (error.kind == ErrorKind::Parse || error.kind == ErrorKind::InvalidMessage) {
            return finish(AnswerDecodeFailure(error));
        }
        LogError(kComponent, "Read failed: " + error.ToString());
        return finish(Result<void, Error>::Err(error));
    }

    auto response = Handle(message.Value());
    if (response.has_value()) {
        return finish(transport_->Write(*response));
    }
    return finish(Result<void, Error>::Ok());
}

Result<void, Error> ServerCore::AnswerDecodeFailure(const Error& error) {
    LogWarn(kComponent, "Undecodable message: " + error.message);
    return transport_->Write(MakeErrorResponse(std::nullopt, RpcError::FromError(error)));
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------
std::optional<Message> ServerCore::Handle(const Message& message) {
    if (const auto* request = std::get_if<Request>(&message)) {
        return HandleRequest(*request);
    }
    if (const auto* notification = std::get_if<Notification>(&message)) {
        HandleNotification(*notification);
        return std::nullopt;
    }
    LogDebug(kComponent, "Ignoring inbound response");
    return std::nullopt;
}

std::optional<Message> ServerCore::HandleRequest(const Request& request) {
    LogDebug(kComponent, "Dispatching " + request.method + " (id " + request.id.ToString() + ")");

    JsonResult result = [&]() -> JsonResult {
        if (config_.strict_initialization && !initialized_ &&
            request.method != "initialize" && request.method != "ping") {
            return JsonResult::Err(Error::InvalidMessage("Server not initialized"));
        }
        try {
            return Route(request);
        } catch (const nlohmann::json::exception& e) {
            return JsonResult::Err(Error::InvalidParams(e.what()));
        }
    }();

    if (result.IsErr()) {
        const auto& error = result.Error();
        LogWarn(kComponent, request.method + " failed: " + error.ToString());
        return MakeErrorResponse(request.id, RpcError::FromError(error));
    }
    return MakeResponse(request.id, std::move(result).Value());
}

void ServerCore::HandleNotification(const Notification& notification) {
    if (notification.method == "notifications/initialized") {
        LogDebug(kComponent, "Client finished initialization");
    } else if (notification.method == "notifications/cancelled") {
        LogDebug(kComponent, "Cancellation received; in-flight calls run to completion");
    } else {
        LogDebug(kComponent, "Ignoring notification " + notification.method);
    }
}

JsonResult ServerCore::Route(const Request& request) {
    const auto& method = request.method;
    const auto& params = request.params;

    if (method == "initialize") {
        return HandleInitialize(params);
    } else if (method == "ping") {
        return JsonResult::Ok(nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(params);
    } else if (method == "tools/call") {
        return HandleToolsCall(params);
    } else if (method == "resources/list") {
        return HandleResourcesList(params);
    } else if (method == "resources/read") {
        return HandleResourcesRead(params);
    } else if (method == "prompts/list") {
        return HandlePromptsList(params);
    } else if (method == "prompts/get") {
        return HandlePromptsGet(params);
    }
    return JsonResult::Err(Error::MethodNotFound(method));
}

// ---------------------------------------------------------------------------
// initialize
// ---------------------------------------------------------------------------
JsonResult ServerCore::HandleInitialize(const std::optional<nlohmann::json>& params) {
    if (params.has_value() && !params->is_null() && !params->is_object()) {
        return InvalidParams("initialize params must be an object");
    }

    if (params.has_value() && params->is_object()) {
        auto client = params->find("clientInfo");
        if (client != params->end() && client->is_object()) {
            auto name = client->find("name");
            auto version = client->find("version");
            if ((name != client->end() && !name->is_string()) ||
                (version != client->end() && !version->is_string())) {
                return InvalidParams("clientInfo name and version must be strings");
            }
            LogInfo(kComponent,
                    "Client: " + (name != client->end() ? name->get<std::string>() : "unknown") +
                        " " + (version != client->end() ? version->get<std::string>() : ""));
        }
    }

    if (!initialized_) {
        capabilities_ = ServerCapabilities{HasTools(), !resources_.empty(), !prompts_.empty()};
        initialized_ = true;
    }

    nlohmann::json result = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", capabilities_.ToJson()},
        {"serverInfo", Implementation{config_.name, config_.version}.ToJson()},
    };
    if (config_.instructions.has_value()) {
        result["instructions"] = *config_.instructions;
    }
    return JsonResult::Ok(std::move(result));
}

// ---------------------------------------------------------------------------
// tools
// ---------------------------------------------------------------------------
JsonResult ServerCore::HandleToolsList(const std::optional<nlohmann::json>& params) {
    auto cursor = ListCursor(params);
    if (cursor.IsErr()) {
        return JsonResult::Err(std::move(cursor).Error());
    }

    auto tools = ToolDescriptors();
    std::sort(tools.begin(), tools.end(),
              [](const ToolDescriptor& a, const ToolDescriptor& b) { return a.name < b.name; });

    auto page = Paginate(tools, PageState::FromCursor(cursor.Value(), config_.page_size));
    return JsonResult::Ok(PageToJson("tools", page));
}

JsonResult ServerCore::HandleToolsCall(const std::optional<nlohmann::json>& params) {
    auto object = RequireObjectParams(params, "tools/call");
    if (object.IsErr()) {
        return JsonResult::Err(std::move(object).Error());
    }
    const auto& p = *object.Value();

    auto name = RequireString(p, "name");
    if (name.IsErr()) {
        return JsonResult::Err(std::move(name).Error());
    }

    nlohmann::json arguments = nlohmann::json::object();
    auto args_it = p.find("arguments");
    if (args_it != p.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            return InvalidParams("'arguments' must be an object");
        }
        arguments = *args_it;
    }

    const auto& tool_name = name.Value();
    if (!HasTool(tool_name)) {
        return JsonResult::Err(Error::ToolFailed("Unknown tool: " + tool_name));
    }

    ToolEnv env(transport_, resources_);
    try {
        auto result = CallTool(tool_name, arguments, env);
        if (result.IsErr()) {
            return JsonResult::Err(std::move(result).Error());
        }
        return JsonResult::Ok(result.Value().ToJson());
    } catch (const std::exception& e) {
        LogError(kComponent, "Tool " + tool_name + " threw: " + e.what());
        return JsonResult::Err(
            Error::Internal("Tool " + tool_name + " failed: " + e.what()));
    }
}

// ---------------------------------------------------------------------------
// resources
// ---------------------------------------------------------------------------
JsonResult ServerCore::HandleResourcesList(const std::optional<nlohmann::json>& params) {
    auto cursor = ListCursor(params);
    if (cursor.IsErr()) {
        return JsonResult::Err(std::move(cursor).Error());
    }

    std::vector<ResourceDescriptor> resources;
    resources.reserve(resources_.size());
    for (const auto& entry : resources_) {
        resources.push_back(entry.second->ToDescriptor());
    }

    auto page = Paginate(resources, PageState::FromCursor(cursor.Value(), config_.page_size));
    return JsonResult::Ok(PageToJson("resources", page));
}

JsonResult ServerCore::HandleResourcesRead(const std::optional<nlohmann::json>& params) {
    auto object = RequireObjectParams(params, "resources/read");
    if (object.IsErr()) {
        return JsonResult::Err(std::move(object).Error());
    }
    auto uri = RequireString(*object.Value(), "uri");
    if (uri.IsErr()) {
        return JsonResult::Err(std::move(uri).Error());
    }

    auto it = resources_.find(uri.Value());
    if (it == resources_.end()) {
        return JsonResult::Err(Error::ResourceNotFound(uri.Value()));
    }

    try {
        auto contents = it->second->Contents();
        if (contents.IsErr()) {
            return JsonResult::Err(std::move(contents).Error());
        }
        nlohmann::json items = nlohmann::json::array();
        for (const auto& content : contents.Value()) {
            items.push_back(content.ToJson());
        }
        return JsonResult::Ok(nlohmann::json{{"contents", items}});
    } catch (const std::exception& e) {
        return JsonResult::Err(
            Error::Internal("Resource " + uri.Value() + " failed: " + e.what()));
    }
}

// ---------------------------------------------------------------------------
// prompts
// ---------------------------------------------------------------------------
JsonResult ServerCore::HandlePromptsList(const std::optional<nlohmann::json>& params) {
    auto cursor = ListCursor(params);
    if (cursor.IsErr()) {
        return JsonResult::Err(std::move(cursor).Error());
    }

    std::vector<PromptDescriptor> prompts;
    prompts.reserve(prompts_.size());
    for (const auto& entry : prompts_) {
        prompts.push_back(entry.second->ToDescriptor());
    }

    auto page = Paginate(prompts, PageState::FromCursor(cursor.Value(), config_.page_size));
    return JsonResult::Ok(PageToJson("prompts", page));
}

JsonResult ServerCore::HandlePromptsGet(const std::optional<nlohmann::json>& params) {
    auto object = RequireObjectParams(params, "prompts/get");
    if (object.IsErr()) {
        return JsonResult::Err(std::move(object).Error());
    }
    const auto& p = *object.Value();

    auto name = RequireString(p, "name");
    if (name.IsErr()) {
        return JsonResult::Err(std::move(name).Error());
    }

    std::map<std::string, std::string> arguments;
    auto args_it = p.find("arguments");
    if (args_it != p.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            return InvalidParams("'arguments' must be an object");
        }
        for (auto arg = args_it->begin(); arg != args_it->end(); ++arg) {
            if (!arg.value().is_string()) {
                return InvalidParams("Prompt argument '" + arg.key() + "' must be a string");
            }
            arguments.emplace(arg.key(), arg.value().get<std::string>());
        }
    }

    auto it = prompts_.find(name.Value());
    if (it == prompts_.end()) {
        return JsonResult::Err(Error::PromptNotFound(name.Value()));
    }

    try {
        auto messages = it->second->GetMessages(arguments);
        if (messages.IsErr()) {
            return JsonResult::Err(std::move(messages).Error());
        }
        nlohmann::json items = nlohmann::json::array();
        for (const auto& message : messages.Value()) {
            items.push_back(message.ToJson());
        }
        nlohmann::json result = {{"messages", items}};
        if (auto description = it->second->Description()) {
            result["description"] = *description;
        }
        return JsonResult::Ok(std::move(result));
    } catch (const std::exception& e) {
        return JsonResult::Err(
            Error::Internal("Prompt " + name.Value() + " failed: " + e.what()));
    }
}

} // namespace mcpline
