#pragma once

#include <mcpline/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace mcpline {

constexpr const char* kJsonRpcVersion = "2.0";

// ---------------------------------------------------------------------------
// RequestId — integer or string. The two representations are distinct:
// RequestId(1) != RequestId("1"), and they hash differently.
// ---------------------------------------------------------------------------
class RequestId {
public:
    RequestId(std::int64_t number) : value_(number) {}  // NOLINT(google-explicit-constructor)
    RequestId(int number) : value_(static_cast<std::int64_t>(number)) {}  // NOLINT
    RequestId(std::string text) : value_(std::move(text)) {}  // NOLINT
    RequestId(const char* text) : value_(std::string(text)) {}  // NOLINT

    [[nodiscard]] bool IsNumber() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool IsString() const noexcept { return value_.index() == 1; }

    [[nodiscard]] std::int64_t Number() const { return std::get<0>(value_); }
    [[nodiscard]] const std::string& String() const { return std::get<1>(value_); }

    [[nodiscard]] nlohmann::json ToJson() const;
    [[nodiscard]] std::string ToString() const;

    // Accepts JSON integers and strings only.
    static Result<RequestId, Error> FromJson(const nlohmann::json& j);

    bool operator==(const RequestId& other) const { return value_ == other.value_; }
    bool operator!=(const RequestId& other) const { return value_ != other.value_; }

    [[nodiscard]] std::size_t Hash() const;

private:
    std::variant<std::int64_t, std::string> value_;
};

// ---------------------------------------------------------------------------
// RpcError — the error envelope carried by an error response.
// ---------------------------------------------------------------------------
struct RpcError {
    int code = rpc_code::kInternalError;
    std::string message;
    std::optional<nlohmann::json> data;

    static RpcError FromError(const Error& error) {
        return RpcError{error.RpcCode(), error.message, error.data};
    }

    [[nodiscard]] nlohmann::json ToJson() const;

    bool operator==(const RpcError& other) const {
        return code == other.code && message == other.message && data == other.data;
    }
};

struct Request {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;
};

struct Notification {
    std::string method;
    std::optional<nlohmann::json> params;
};

// Exactly one of result/error is set. A missing id is encoded as null and is
// only produced for errors answering a message whose id was unreadable.
struct Response {
    std::optional<RequestId> id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    [[nodiscard]] bool IsError() const noexcept { return error.has_value(); }
};

using Message = std::variant<Request, Notification, Response>;

// -- Construction ------------------------------------------------------------

Message MakeRequest(RequestId id, std::string method,
                    std::optional<nlohmann::json> params = std::nullopt);
Message MakeNotification(std::string method,
                         std::optional<nlohmann::json> params = std::nullopt);
Message MakeResponse(RequestId id, nlohmann::json result);
Message MakeErrorResponse(std::optional<RequestId> id, RpcError error);

// -- Wire codec --------------------------------------------------------------

nlohmann::json MessageToJson(const Message& message);

// Single-line JSON text, no trailing newline.
std::string EncodeMessage(const Message& message);

// Classifies one inbound payload. Non-JSON input is ErrorKind::Parse;
// JSON that matches none (or more than one) of the three message shapes is
// ErrorKind::InvalidMessage.
Result<Message, Error> DecodeMessage(std::string_view text);
Result<Message, Error> MessageFromJson(const nlohmann::json& j);

// Method name for requests and notifications, empty for responses.
std::string MethodOf(const Message& message);

} // namespace mcpline

namespace std {

template <>
struct hash<mcpline::RequestId> {
    size_t operator()(const mcpline::RequestId& id) const { return id.Hash(); }
};

} // namespace std
