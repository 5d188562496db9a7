#pragma once

#include <mcpline/core/version.hpp>
#include <mcpline/pagination/pagination.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace mcpline {

struct ServerConfig {
    std::string name = "mcpline";
    std::string version = kVersion;
    std::optional<std::string> instructions;
    std::size_t page_size = kDefaultPageSize;
    bool strict_initialization = false; // reject requests before initialize
};

struct HttpConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 3000;
    std::string path = "/mcp";
    std::optional<std::string> api_key;
    std::optional<std::string> api_key_env; // env var name to read api_key from
};

struct AppConfig {
    ServerConfig server;
    HttpConfig http;
    std::string transport = "stdio"; // "stdio" or "http"
    std::string log_level = "warn";
    bool log_json = false;
    std::optional<std::string> log_file;
    std::optional<std::string> config_file; // set from -c/--config only
};

} // namespace mcpline
