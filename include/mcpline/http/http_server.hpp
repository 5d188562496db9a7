#pragma once

#include <mcpline/config/app_config.hpp>
#include <mcpline/core/result.hpp>
#include <mcpline/http/http_endpoint.hpp>

#include <functional>
#include <memory>

namespace mcpline {

// ---------------------------------------------------------------------------
// HttpServer — the socket side of the HTTP binding.
//
// Accepts every method on every path and hands the decoded request to the
// handler; routing and status selection belong to the handler. Uses pimpl to
// keep httplib out of the public header.
// ---------------------------------------------------------------------------
class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    HttpServer(HttpConfig config, Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    template <typename Context>
    static std::unique_ptr<HttpServer> ForEndpoint(StreamableHttpEndpoint<Context> endpoint) {
        auto config = endpoint.Config();
        auto shared = std::make_shared<StreamableHttpEndpoint<Context>>(std::move(endpoint));
        return std::make_unique<HttpServer>(
            std::move(config),
            [shared](const HttpRequest& request) { return shared->Handle(request); });
    }

    // Blocks until Stop() is called or binding fails.
    Result<void, Error> Listen();
    void Stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpline
