#include <mcpline/config/config_loader.hpp>

#include <mcpline/core/log.hpp>
#include <mcpline/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace mcpline {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{ErrorKind::Config, message, std::nullopt};
}

Result<std::size_t, Error> ToPageSize(long long value) {
    if (value < 1) {
        return Result<std::size_t, Error>::Err(
            MakeConfigError("page_size must be at least 1, got " + std::to_string(value)));
    }
    return Result<std::size_t, Error>::Ok(static_cast<std::size_t>(value));
}

Result<uint16_t, Error> ToPort(long long value) {
    if (value < 1 || value > 65535) {
        return Result<uint16_t, Error>::Err(
            MakeConfigError("port must be between 1 and 65535, got " + std::to_string(value)));
    }
    return Result<uint16_t, Error>::Ok(static_cast<uint16_t>(value));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;

    try {
        YAML::Node root = YAML::LoadFile(std::string(file_path));

        // -- Server --
        if (root["server"]) {
            const auto& server = root["server"];
            if (server["name"]) {
                config.server.name = server["name"].as<std::string>();
            }
            if (server["version"]) {
                config.server.version = server["version"].as<std::string>();
            }
            if (server["instructions"]) {
                config.server.instructions = server["instructions"].as<std::string>();
            }
            if (server["page_size"]) {
                auto page_size = ToPageSize(server["page_size"].as<long long>());
                if (page_size.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(page_size).Error());
                }
                config.server.page_size = page_size.Value();
            }
            if (server["strict_initialization"]) {
                config.server.strict_initialization =
                    server["strict_initialization"].as<bool>();
            }
        }

        // -- HTTP --
        if (root["http"]) {
            const auto& http = root["http"];
            if (http["host"]) {
                config.http.host = http["host"].as<std::string>();
            }
            if (http["port"]) {
                auto port = ToPort(http["port"].as<long long>());
                if (port.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(port).Error());
                }
                config.http.port = port.Value();
            }
            if (http["path"]) {
                config.http.path = http["path"].as<std::string>();
            }
            if (http["api_key"]) {
                config.http.api_key = http["api_key"].as<std::string>();
            }
            if (http["api_key_env"]) {
                config.http.api_key_env = http["api_key_env"].as<std::string>();
            }
        }

        // -- Options --
        if (root["transport"]) {
            config.transport = root["transport"].as<std::string>();
        }
        if (root["log_level"]) {
            config.log_level = root["log_level"].as<std::string>();
        }
        if (root["log_json"]) {
            config.log_json = root["log_json"].as<bool>();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcpline", kVersion);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--transport")
        .help("Transport: stdio or http");

    // Server flags
    program.add_argument("--name")
        .help("Server name reported on initialize");
    program.add_argument("--instructions")
        .help("Usage instructions reported on initialize");
    program.add_argument("--page-size")
        .help("Items per list page")
        .scan<'i', int>();
    program.add_argument("--strict-init")
        .help("Reject requests sent before initialize")
        .default_value(false)
        .implicit_value(true);

    // HTTP flags
    program.add_argument("--host")
        .help("HTTP bind address");
    program.add_argument("--port")
        .help("HTTP port")
        .scan<'i', int>();
    program.add_argument("--path")
        .help("HTTP endpoint path");
    program.add_argument("--api-key")
        .help("Bearer token required from HTTP callers");
    program.add_argument("--api-key-env")
        .help("Environment variable containing the bearer token");

    // Logging
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-json")
        .help("Log JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    } catch (const std::invalid_argument& e) {
        // Numeric flags that fail to scan.
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--transport")) {
        config.transport = *val;
    }

    // Server
    if (auto val = program.present("--name")) {
        config.server.name = *val;
    }
    if (auto val = program.present("--instructions")) {
        config.server.instructions = *val;
    }
    if (auto val = program.present<int>("--page-size")) {
        auto page_size = ToPageSize(*val);
        if (page_size.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(page_size).Error());
        }
        config.server.page_size = page_size.Value();
    }
    if (program.get<bool>("--strict-init")) {
        config.server.strict_initialization = true;
    }

    // HTTP
    if (auto val = program.present("--host")) {
        config.http.host = *val;
    }
    if (auto val = program.present<int>("--port")) {
        auto port = ToPort(*val);
        if (port.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(port).Error());
        }
        config.http.port = port.Value();
    }
    if (auto val = program.present("--path")) {
        config.http.path = *val;
    }
    if (auto val = program.present("--api-key")) {
        config.http.api_key = *val;
    }
    if (auto val = program.present("--api-key-env")) {
        config.http.api_key_env = *val;
    }

    // Logging
    if (auto val = program.present("--log-level")) {
        config.log_level = *val;
    }
    if (program.get<bool>("--log-json")) {
        config.log_json = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = yaml_base;

    // Server overrides
    if (cli_overrides.server.name != defaults.server.name) {
        merged.server.name = cli_overrides.server.name;
    }
    if (cli_overrides.server.version != defaults.server.version) {
        merged.server.version = cli_overrides.server.version;
    }
    if (cli_overrides.server.instructions.has_value()) {
        merged.server.instructions = cli_overrides.server.instructions;
    }
    if (cli_overrides.server.page_size != defaults.server.page_size) {
        merged.server.page_size = cli_overrides.server.page_size;
    }
    if (cli_overrides.server.strict_initialization) {
        merged.server.strict_initialization = true;
    }

    // HTTP overrides
    if (cli_overrides.http.host != defaults.http.host) {
        merged.http.host = cli_overrides.http.host;
    }
    if (cli_overrides.http.port != defaults.http.port) {
        merged.http.port = cli_overrides.http.port;
    }
    if (cli_overrides.http.path != defaults.http.path) {
        merged.http.path = cli_overrides.http.path;
    }
    if (cli_overrides.http.api_key.has_value()) {
        merged.http.api_key = cli_overrides.http.api_key;
    }
    if (cli_overrides.http.api_key_env.has_value()) {
        merged.http.api_key_env = cli_overrides.http.api_key_env;
    }

    // Options
    if (cli_overrides.transport != defaults.transport) {
        merged.transport = cli_overrides.transport;
    }
    if (cli_overrides.log_level != defaults.log_level) {
        merged.log_level = cli_overrides.log_level;
    }
    if (cli_overrides.log_json) {
        merged.log_json = true;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveApiKeyEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveApiKeyEnv(AppConfig config) {
    if (!config.http.api_key.has_value() && config.http.api_key_env.has_value()) {
        const auto& env_var = *config.http.api_key_env;
        const char* env_val = std::getenv(env_var.c_str());
        if (env_val == nullptr) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Environment variable '" + env_var +
                                "' not set (specified by api_key_env)"));
        }
        config.http.api_key = env_val;
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.name.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: server.name"));
    }
    if (config.server.page_size == 0) {
        return Result<void, Error>::Err(MakeConfigError("page_size must be at least 1, got 0"));
    }
    if (config.transport != "stdio" && config.transport != "http") {
        return Result<void, Error>::Err(
            MakeConfigError("Unknown transport '" + config.transport +
                            "' (expected stdio or http)"));
    }
    if (config.http.port == 0) {
        return Result<void, Error>::Err(MakeConfigError("Invalid port: 0"));
    }
    if (config.http.path.empty() || config.http.path.front() != '/') {
        return Result<void, Error>::Err(
            MakeConfigError("HTTP path must start with '/', got '" + config.http.path + "'"));
    }
    if (config.http.api_key.has_value() && config.http.api_key->empty()) {
        return Result<void, Error>::Err(MakeConfigError("api_key must not be empty"));
    }
    auto level = ParseLogLevel(config.log_level);
    if (level.IsErr()) {
        return Result<void, Error>::Err(std::move(level).Error());
    }
    return Result<void, Error>::Ok();
}

} // namespace mcpline
