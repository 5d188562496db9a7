#pragma once

#include <mcpline/config/app_config.hpp>
#include <mcpline/core/log.hpp>
#include <mcpline/core/result.hpp>
#include <mcpline/server/mcp_server.hpp>
#include <mcpline/transport/buffered_transport.hpp>

#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcpline {

constexpr const char* kContentTypeJson = "application/json";
constexpr const char* kContentTypeEventStream = "text/event-stream";

// Header names are stored lower-cased.
using HttpHeaders = std::map<std::string, std::string>;

struct HttpRequest {
    std::string method;
    std::string path;
    std::optional<std::string> body; // nullopt when the body could not be read
    HttpHeaders headers;

    // Case-insensitive lookup.
    [[nodiscard]] std::optional<std::string> Header(std::string_view name) const;
};

struct HttpResponse {
    int status = 200;
    std::string body;
    std::string content_type = kContentTypeJson;
};

// Pre-validated caller description. The engine never checks it.
struct Identity {
    std::string subject;
    std::optional<std::string> tenant;
    std::vector<std::string> scopes;
    nlohmann::json claims = nlohmann::json::object();
};

// Host-supplied identity check. Any error rejects the request with 401.
using IdentityResolver = std::function<Result<Identity, Error>(const HttpRequest&)>;

namespace http_detail {

std::string LowerCase(std::string_view text);

// 404 / 405 / 400 before any dispatch happens, or nullopt to proceed.
std::optional<HttpResponse> CheckRoute(const HttpConfig& config, const HttpRequest& request);

// 401 with a JSON-RPC auth error (null id) as the body.
HttpResponse Unauthorized(const Error& error);

// 500 with a JSON-RPC internal error (null id) as the body.
HttpResponse InternalFailure(const Error& error);

// 200: event stream when more than one message was written, otherwise the
// single message (or "{}" when nothing was written).
HttpResponse CollectResponse(BufferedTransport& transport);

} // namespace http_detail

// ---------------------------------------------------------------------------
// StreamableHttpEndpoint — one POST body in, one HTTP response out.
//
// Each call builds a fresh McpServer, lets the host populate it through the
// setup function, creates the per-call Context from the caller's identity
// and dispatches the body over a BufferedTransport. Nothing survives between
// calls except what the host's setup or context factory shares explicitly.
// ---------------------------------------------------------------------------
template <typename Context = NoContext>
class StreamableHttpEndpoint {
public:
    using Server = McpServer<Context>;
    using Setup = std::function<Result<void, Error>(Server&)>;
    using ContextFactory = std::function<Context(const Identity&)>;

    StreamableHttpEndpoint(HttpConfig http, ServerConfig server, Setup setup,
                           ContextFactory context_factory,
                           IdentityResolver resolver = nullptr)
        : http_(std::move(http)),
          server_config_(std::move(server)),
          setup_(std::move(setup)),
          context_factory_(std::move(context_factory)),
          resolver_(std::move(resolver)) {}

    [[nodiscard]] const HttpConfig& Config() const noexcept { return http_; }

    HttpResponse Handle(const HttpRequest& request) const {
        if (auto early = http_detail::CheckRoute(http_, request)) {
            LogDebug("http", request.method + " " + request.path + " -> " +
                                 std::to_string(early->status));
            return *early;
        }

        Identity identity;
        if (resolver_) {
            auto resolved = resolver_(request);
            if (resolved.IsErr()) {
                LogInfo("http", "Rejected caller: " + resolved.Error().message);
                return http_detail::Unauthorized(resolved.Error());
            }
            identity = std::move(resolved).Value();
        }

        if (!context_factory_) {
            return http_detail::InternalFailure(Error::Internal("No context factory configured"));
        }

        try {
            Server server(server_config_);
            if (setup_) {
                auto ready = setup_(server);
                if (ready.IsErr()) {
                    LogError("http", "Server setup failed: " + ready.Error().ToString());
                    return http_detail::InternalFailure(ready.Error());
                }
            }

            Context context = context_factory_(identity);
            auto transport = std::make_shared<BufferedTransport>(*request.body);
            auto dispatched = server.DispatchOnce(transport, context);
            if (dispatched.IsErr()) {
                LogError("http", "Dispatch failed: " + dispatched.Error().ToString());
                return http_detail::InternalFailure(dispatched.Error());
            }
            return http_detail::CollectResponse(*transport);
        } catch (const std::exception& e) {
            LogError("http", std::string("Request failed: ") + e.what());
            return http_detail::InternalFailure(Error::Internal(e.what()));
        }
    }

private:
    HttpConfig http_;
    ServerConfig server_config_;
    Setup setup_;
    ContextFactory context_factory_;
    IdentityResolver resolver_;
};

// Identity resolver for a single static bearer token. An empty token
// accepts every caller.
IdentityResolver StaticBearerResolver(std::string token);

} // namespace mcpline
