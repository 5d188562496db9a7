#include <mcpline/core/result.hpp>

namespace mcpline {

int Error::RpcCode() const {
    switch (kind) {
        case ErrorKind::Parse:            return rpc_code::kParseError;
        case ErrorKind::InvalidMessage:   return rpc_code::kInvalidRequest;
        case ErrorKind::MethodNotFound:   return rpc_code::kMethodNotFound;
        case ErrorKind::InvalidParams:    return rpc_code::kInvalidParams;
        case ErrorKind::ToolError:        return rpc_code::kToolError;
        case ErrorKind::ResourceNotFound: return rpc_code::kResourceNotFound;
        case ErrorKind::PromptNotFound:   return rpc_code::kPromptNotFound;
        case ErrorKind::Auth:             return rpc_code::kAuthError;
        case ErrorKind::TransportClosed:
        case ErrorKind::Io:
        case ErrorKind::Internal:
        case ErrorKind::DuplicateEntry:
        case ErrorKind::Config:           return rpc_code::kInternalError;
    }
    return rpc_code::kInternalError;
}

std::string Error::KindName() const {
    switch (kind) {
        case ErrorKind::TransportClosed:  return "transport_closed";
        case ErrorKind::Io:               return "io";
        case ErrorKind::Parse:            return "parse";
        case ErrorKind::InvalidMessage:   return "invalid_message";
        case ErrorKind::MethodNotFound:   return "method_not_found";
        case ErrorKind::InvalidParams:    return "invalid_params";
        case ErrorKind::Internal:         return "internal";
        case ErrorKind::DuplicateEntry:   return "duplicate_entry";
        case ErrorKind::ToolError:        return "tool_error";
        case ErrorKind::ResourceNotFound: return "resource_not_found";
        case ErrorKind::PromptNotFound:   return "prompt_not_found";
        case ErrorKind::Auth:             return "auth";
        case ErrorKind::Config:           return "config";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::string out = "[" + KindName() + "] " + message;
    if (data.has_value()) {
        out += " (data: " + data->dump() + ")";
    }
    return out;
}

} // namespace mcpline
