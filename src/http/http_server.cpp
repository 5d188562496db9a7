#include <mcpline/http/http_server.hpp>

#include <mcpline/core/log.hpp>

#include <httplib.h>

namespace mcpline {

namespace {

HttpRequest ToHttpRequest(const httplib::Request& req) {
    HttpRequest request;
    request.method = req.method;
    request.path = req.path;
    if (!req.body.empty()) {
        request.body = req.body;
    }
    for (const auto& [key, value] : req.headers) {
        request.headers[http_detail::LowerCase(key)] = value;
    }
    return request;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl — pimpl body holding the httplib::Server.
// ---------------------------------------------------------------------------
struct HttpServer::Impl {
    HttpConfig config;
    Handler handler;
    httplib::Server server;

    Impl(HttpConfig cfg, Handler h) : config(std::move(cfg)), handler(std::move(h)) {
        auto forward = [this](const httplib::Request& req, httplib::Response& res) {
            auto response = handler(ToHttpRequest(req));
            res.status = response.status;
            res.set_content(response.body, response.content_type.c_str());
        };
        server.Get(".*", forward);
        server.Post(".*", forward);
        server.Put(".*", forward);
        server.Patch(".*", forward);
        server.Delete(".*", forward);
        server.Options(".*", forward);

        server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
            LogInfo("http", req.method + " " + req.path + " " + std::to_string(res.status));
        });
    }
};

HttpServer::HttpServer(HttpConfig config, Handler handler)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(handler))) {}

HttpServer::~HttpServer() = default;

Result<void, Error> HttpServer::Listen() {
    const auto& config = impl_->config;
    LogInfo("http", "Listening on http://" + config.host + ":" +
                        std::to_string(config.port) + config.path);
    if (!impl_->server.listen(config.host, config.port)) {
        return Result<void, Error>::Err(
            Error::Io("Cannot listen on " + config.host + ":" + std::to_string(config.port)));
    }
    return Result<void, Error>::Ok();
}

void HttpServer::Stop() {
    impl_->server.stop();
}

} // namespace mcpline
