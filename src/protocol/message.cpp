#include <mcpline/protocol/message.hpp>

#include <cstdint>
#include <limits>
#include <type_traits>

namespace mcpline {

// ---------------------------------------------------------------------------
// RequestId
// ---------------------------------------------------------------------------
nlohmann::json RequestId::ToJson() const {
    if (IsNumber()) {
        return Number();
    }
    return String();
}

std::string RequestId::ToString() const {
    if (IsNumber()) {
        return std::to_string(Number());
    }
    return String();
}

Result<RequestId, Error> RequestId::FromJson(const nlohmann::json& j) {
    if (j.is_number_unsigned() &&
        j.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return Result<RequestId, Error>::Err(
            Error::InvalidMessage("Request id is out of range"));
    }
    if (j.is_number_integer()) {
        return Result<RequestId, Error>::Ok(RequestId(j.get<std::int64_t>()));
    }
    if (j.is_string()) {
        return Result<RequestId, Error>::Ok(RequestId(j.get<std::string>()));
    }
    return Result<RequestId, Error>::Err(
        Error::InvalidMessage("Request id must be an integer or a string"));
}

std::size_t RequestId::Hash() const {
    // Mix the alternative index in so 1 and "1" land in different buckets.
    std::size_t seed = value_.index();
    std::size_t h = IsNumber() ? std::hash<std::int64_t>{}(Number())
                               : std::hash<std::string>{}(String());
    return h ^ (seed + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
}

// ---------------------------------------------------------------------------
// RpcError
// ---------------------------------------------------------------------------
nlohmann::json RpcError::ToJson() const {
    nlohmann::json j = {{"code", code}, {"message", message}};
    if (data.has_value()) {
        j["data"] = *data;
    }
    return j;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
Message MakeRequest(RequestId id, std::string method,
                    std::optional<nlohmann::json> params) {
    return Request{std::move(id), std::move(method), std::move(params)};
}

Message MakeNotification(std::string method,
                         std::optional<nlohmann::json> params) {
    return Notification{std::move(method), std::move(params)};
}

Message MakeResponse(RequestId id, nlohmann::json result) {
    return Response{std::move(id), std::move(result), std::nullopt};
}

Message MakeErrorResponse(std::optional<RequestId> id, RpcError error) {
    return Response{std::move(id), std::nullopt, std::move(error)};
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------
nlohmann::json MessageToJson(const Message& message) {
    nlohmann::json j;
    j["jsonrpc"] = kJsonRpcVersion;

    std::visit([&j](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Request>) {
            j["id"] = m.id.ToJson();
            j["method"] = m.method;
            if (m.params.has_value()) {
                j["params"] = *m.params;
            }
        } else if constexpr (std::is_same_v<T, Notification>) {
            j["method"] = m.method;
            if (m.params.has_value()) {
                j["params"] = *m.params;
            }
        } else {
            j["id"] = m.id.has_value() ? m.id->ToJson() : nlohmann::json(nullptr);
            if (m.error.has_value()) {
                j["error"] = m.error->ToJson();
            } else {
                j["result"] = m.result.value_or(nlohmann::json::object());
            }
        }
    }, message);

    return j;
}

std::string EncodeMessage(const Message& message) {
    return MessageToJson(message).dump(-1, ' ', false,
                                       nlohmann::json::error_handler_t::replace);
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------
namespace {

Result<Message, Error> Invalid(const std::string& message) {
    return Result<Message, Error>::Err(Error::InvalidMessage(message));
}

std::optional<nlohmann::json> OptionalMember(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        return std::nullopt;
    }
    return *it;
}

Result<RpcError, Error> ParseRpcError(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("code") || !j["code"].is_number_integer()) {
        return Result<RpcError, Error>::Err(
            Error::InvalidMessage("Error object must carry an integer code"));
    }
    RpcError error;
    error.code = j["code"].get<int>();
    if (j.contains("message") && j["message"].is_string()) {
        error.message = j["message"].get<std::string>();
    }
    error.data = OptionalMember(j, "data");
    return Result<RpcError, Error>::Ok(std::move(error));
}

} // anonymous namespace

Result<Message, Error> MessageFromJson(const nlohmann::json& j) {
    if (j.is_array()) {
        return Invalid("Batch messages are not supported");
    }
    if (!j.is_object()) {
        return Invalid("Message must be a JSON object");
    }

    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string() ||
        version->get<std::string>() != kJsonRpcVersion) {
        return Invalid("Missing or invalid jsonrpc version (must be \"2.0\")");
    }

    const bool has_method = j.contains("method");
    const bool has_id = j.contains("id");
    const bool has_result = j.contains("result");
    const bool has_error = j.contains("error");

    if (has_method) {
        if (!j["method"].is_string()) {
            return Invalid("Method must be a string");
        }
        if (has_result || has_error) {
            return Invalid("Message carries both a method and a result or error");
        }
        auto method = j["method"].get<std::string>();
        auto params = OptionalMember(j, "params");

        if (!has_id) {
            return Result<Message, Error>::Ok(
                Notification{std::move(method), std::move(params)});
        }
        auto id = RequestId::FromJson(j["id"]);
        if (id.IsErr()) {
            return Result<Message, Error>::Err(std::move(id).Error());
        }
        return Result<Message, Error>::Ok(
            Request{std::move(id).Value(), std::move(method), std::move(params)});
    }

    if (!has_id) {
        return Invalid("Message has neither a method nor an id");
    }
    if (has_result == has_error) {
        return Invalid("Response must carry exactly one of result or error");
    }

    Response response;
    if (!j["id"].is_null()) {
        auto id = RequestId::FromJson(j["id"]);
        if (id.IsErr()) {
            return Result<Message, Error>::Err(std::move(id).Error());
        }
        response.id = std::move(id).Value();
    }
    if (has_result) {
        response.result = j["result"];
    } else {
        auto error = ParseRpcError(j["error"]);
        if (error.IsErr()) {
            return Result<Message, Error>::Err(std::move(error).Error());
        }
        response.error = std::move(error).Value();
    }
    return Result<Message, Error>::Ok(std::move(response));
}

Result<Message, Error> DecodeMessage(std::string_view text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Result<Message, Error>::Err(
            Error::Parse(std::string("Parse error: ") + e.what()));
    }
    return MessageFromJson(j);
}

std::string MethodOf(const Message& message) {
    if (const auto* request = std::get_if<Request>(&message)) {
        return request->method;
    }
    if (const auto* notification = std::get_if<Notification>(&message)) {
        return notification->method;
    }
    return {};
}

} // namespace mcpline
