#include <mcpline/config/config_loader.hpp>
#include <mcpline/core/log.hpp>
#include <mcpline/core/version.hpp>
#include <mcpline/demo/demo_capabilities.hpp>
#include <mcpline/http/http_endpoint.hpp>
#include <mcpline/http/http_server.hpp>
#include <mcpline/server/mcp_server.hpp>
#include <mcpline/transport/stream_transport.hpp>

#include <atomic>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess   = 0;
constexpr int kExitConfig    = 2;
constexpr int kExitTransport = 3;

mcpline::HttpServer* g_http_server = nullptr;

void HandleSignal(int /*signal*/) {
    if (g_http_server != nullptr) {
        g_http_server->Stop();
    }
}

bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version" || arg == "-V") {
            std::cout << "mcpline " << mcpline::kVersion << "\n";
            return true;
        }
    }
    return false;
}

// -v / -vv are handled here rather than by argparse; everything else is
// forwarded to LoadFromCli.
struct Verbosity {
    std::optional<mcpline::LogLevel> level;
    std::vector<const char*> rest;
};

Verbosity ExtractVerbosity(int argc, const char* const* argv) {
    Verbosity result;
    result.rest.push_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "-vv") {
            result.level = mcpline::LogLevel::Debug;
        } else if (arg == "-v") {
            if (!result.level.has_value()) {
                result.level = mcpline::LogLevel::Info;
            }
        } else {
            result.rest.push_back(argv[i]);
        }
    }
    return result;
}

mcpline::Result<mcpline::AppConfig, mcpline::Error> ResolveConfig(int argc,
                                                                  const char* const* argv) {
    using namespace mcpline;
    using ConfigResult = Result<AppConfig, Error>;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return cli;
    }

    AppConfig config = cli.Value();
    if (cli.Value().config_file.has_value()) {
        auto yaml = LoadFromYaml(*cli.Value().config_file);
        if (yaml.IsErr()) {
            return yaml;
        }
        config = MergeConfigs(yaml.Value(), cli.Value());
    }

    auto resolved = ResolveApiKeyEnv(std::move(config));
    if (resolved.IsErr()) {
        return resolved;
    }
    auto valid = ValidateConfig(resolved.Value());
    if (valid.IsErr()) {
        return ConfigResult::Err(std::move(valid).Error());
    }
    return resolved;
}

mcpline::Result<void, mcpline::Error> InitLogging(const mcpline::AppConfig& config,
                                                  std::optional<mcpline::LogLevel> verbosity) {
    using namespace mcpline;

    auto level = ParseLogLevel(config.log_level);
    if (level.IsErr()) {
        return Result<void, Error>::Err(std::move(level).Error());
    }
    auto min_level = verbosity.value_or(level.Value());

    if (config.log_file.has_value()) {
        auto sink = FileSink::Open(*config.log_file, config.log_json);
        if (sink.IsErr()) {
            return Result<void, Error>::Err(std::move(sink).Error());
        }
        InitGlobalLogger(std::move(sink).Value(), min_level);
    } else if (config.log_json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), min_level);
    } else {
        InitGlobalLogger(std::make_unique<ConsoleSink>(), min_level);
    }
    return Result<void, Error>::Ok();
}

int RunStdio(const mcpline::AppConfig& config) {
    using namespace mcpline;

    McpServer<DemoContext> server(config.server);
    auto registered = RegisterDemoCapabilities(server);
    if (registered.IsErr()) {
        LogError("main", registered.Error().ToString());
        return kExitConfig;
    }

    DemoContext context;
    context.caller.subject = "stdio";
    auto result = server.RunLoop(std::make_shared<StreamTransport>(), context);
    if (result.IsErr()) {
        LogError("main", "Session ended with error: " + result.Error().ToString());
        return kExitTransport;
    }
    return kExitSuccess;
}

int RunHttp(const mcpline::AppConfig& config) {
    using namespace mcpline;

    auto counter = std::make_shared<std::atomic<std::int64_t>>(0);

    IdentityResolver resolver;
    if (config.http.api_key.has_value()) {
        resolver = StaticBearerResolver(*config.http.api_key);
    }

    StreamableHttpEndpoint<DemoContext> endpoint(
        config.http, config.server,
        [](McpServer<DemoContext>& server) { return RegisterDemoCapabilities(server); },
        [counter](const Identity& caller) { return DemoContext{counter, caller}; },
        std::move(resolver));

    auto http_server = HttpServer::ForEndpoint(std::move(endpoint));
    g_http_server = http_server.get();
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    auto result = http_server->Listen();
    g_http_server = nullptr;
    if (result.IsErr()) {
        LogError("main", result.Error().ToString());
        return kExitTransport;
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace mcpline;

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    auto verbosity = ExtractVerbosity(argc, argv);
    auto config = ResolveConfig(static_cast<int>(verbosity.rest.size()),
                                verbosity.rest.data());
    if (config.IsErr()) {
        std::cerr << "mcpline: " << config.Error().message << "\n";
        return kExitConfig;
    }

    auto logging = InitLogging(config.Value(), verbosity.level);
    if (logging.IsErr()) {
        std::cerr << "mcpline: " << logging.Error().message << "\n";
        return kExitConfig;
    }

    if (config.Value().transport == "http") {
        return RunHttp(config.Value());
    }
    return RunStdio(config.Value());
}
