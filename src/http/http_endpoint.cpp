#include <mcpline/http/http_endpoint.hpp>

#include <algorithm>
#include <cctype>

namespace mcpline {

std::optional<std::string> HttpRequest::Header(std::string_view name) const {
    auto it = headers.find(http_detail::LowerCase(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

namespace http_detail {

namespace {

HttpResponse PlainStatus(int status, std::string body) {
    return HttpResponse{status, std::move(body), "text/plain"};
}

HttpResponse RpcErrorBody(int status, const Error& error) {
    auto message = MakeErrorResponse(std::nullopt, RpcError::FromError(error));
    return HttpResponse{status, EncodeMessage(message), kContentTypeJson};
}

} // anonymous namespace

std::string LowerCase(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::optional<HttpResponse> CheckRoute(const HttpConfig& config, const HttpRequest& request) {
    if (request.path != config.path) {
        return PlainStatus(404, "Not Found");
    }
    if (request.method != "POST") {
        return PlainStatus(405, "Method Not Allowed");
    }
    if (!request.body.has_value()) {
        return PlainStatus(400, "Unreadable request body");
    }
    return std::nullopt;
}

HttpResponse Unauthorized(const Error& error) {
    if (error.kind == ErrorKind::Auth) {
        return RpcErrorBody(401, error);
    }
    return RpcErrorBody(401, Error::Auth(error.message));
}

HttpResponse InternalFailure(const Error& error) {
    return RpcErrorBody(500, Error::Internal(error.message));
}

HttpResponse CollectResponse(BufferedTransport& transport) {
    if (transport.HasMultipleMessages()) {
        return HttpResponse{200, transport.TakeEventStream(), kContentTypeEventStream};
    }
    return HttpResponse{200, transport.TakeLastMessage().value_or("{}"), kContentTypeJson};
}

} // namespace http_detail

IdentityResolver StaticBearerResolver(std::string token) {
    return [token = std::move(token)](const HttpRequest& request) -> Result<Identity, Error> {
        if (token.empty()) {
            return Result<Identity, Error>::Ok(
                Identity{"anonymous", std::nullopt, {}, nlohmann::json::object()});
        }
        auto header = request.Header("Authorization");
        if (!header.has_value()) {
            return Result<Identity, Error>::Err(Error::Auth("Missing Authorization header"));
        }
        const std::string prefix = "Bearer ";
        if (header->compare(0, prefix.size(), prefix) != 0 ||
            header->substr(prefix.size()) != token) {
            return Result<Identity, Error>::Err(Error::Auth("Invalid bearer token"));
        }
        return Result<Identity, Error>::Ok(
            Identity{"api-key", std::nullopt, {}, nlohmann::json::object()});
    };
}

} // namespace mcpline
