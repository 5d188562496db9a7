#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

namespace mcpline {

// ---------------------------------------------------------------------------
// Result<T, E> — a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

    // fn: T -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using ReturnType = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
        }
        return ReturnType::Err(std::get<1>(std::move(storage_)));
    }

    // fn: T -> U
    template <typename Fn>
    auto Map(Fn&& fn) && -> Result<std::invoke_result_t<Fn, T&&>, E> {
        using U = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(std::move(storage_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(storage_)));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E> — specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// JSON-RPC error codes. The standard protocol codes occupy -32700..-32600;
// domain codes are allocated downwards from -32000.
// ---------------------------------------------------------------------------
namespace rpc_code {

constexpr int kParseError       = -32700;
constexpr int kInvalidRequest   = -32600;
constexpr int kMethodNotFound   = -32601;
constexpr int kInvalidParams    = -32602;
constexpr int kInternalError    = -32603;
constexpr int kToolError        = -32000;
constexpr int kResourceNotFound = -32001;
constexpr int kPromptNotFound   = -32002;
constexpr int kAuthError        = -32003;

} // namespace rpc_code

// ---------------------------------------------------------------------------
// ErrorKind — classifies errors for protocol mapping and logging.
// ---------------------------------------------------------------------------
enum class ErrorKind {
    TransportClosed,
    Io,
    Parse,
    InvalidMessage,
    MethodNotFound,
    InvalidParams,
    Internal,
    DuplicateEntry,
    ToolError,
    ResourceNotFound,
    PromptNotFound,
    Auth,
    Config,
};

// ---------------------------------------------------------------------------
// Error — structured error type shared by the transports, the dispatch
// engine and host-supplied capabilities.
// ---------------------------------------------------------------------------
struct Error {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    std::optional<nlohmann::json> data;

    static Error TransportClosed() {
        return Error{ErrorKind::TransportClosed, "Transport closed", std::nullopt};
    }
    static Error Io(std::string message) {
        return Error{ErrorKind::Io, std::move(message), std::nullopt};
    }
    static Error Parse(std::string message) {
        return Error{ErrorKind::Parse, std::move(message), std::nullopt};
    }
    static Error InvalidMessage(std::string message) {
        return Error{ErrorKind::InvalidMessage, std::move(message), std::nullopt};
    }
    static Error MethodNotFound(const std::string& method) {
        return Error{ErrorKind::MethodNotFound, "Method not found: " + method, std::nullopt};
    }
    static Error InvalidParams(std::string message) {
        return Error{ErrorKind::InvalidParams, std::move(message), std::nullopt};
    }
    static Error Internal(std::string message) {
        return Error{ErrorKind::Internal, std::move(message), std::nullopt};
    }
    static Error ToolFailed(std::string message) {
        return Error{ErrorKind::ToolError, std::move(message), std::nullopt};
    }
    static Error ResourceNotFound(const std::string& uri) {
        return Error{ErrorKind::ResourceNotFound, "Resource not found: " + uri, std::nullopt};
    }
    static Error PromptNotFound(const std::string& name) {
        return Error{ErrorKind::PromptNotFound, "Prompt not found: " + name, std::nullopt};
    }
    static Error Auth(const std::string& message) {
        return Error{ErrorKind::Auth, "Auth error: " + message, std::nullopt};
    }

    // JSON-RPC code this error is reported with. Closed, I/O, duplicate
    // registration and configuration failures have no protocol code of their
    // own and surface as internal errors.
    [[nodiscard]] int RpcCode() const;

    [[nodiscard]] std::string KindName() const;

    [[nodiscard]] std::string ToString() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return kind == other.kind && message == other.message && data == other.data;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace mcpline
