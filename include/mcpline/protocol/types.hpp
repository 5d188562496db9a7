#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcpline {

// MCP revision this server speaks. Returned from initialize regardless of the
// version the client asks for.
constexpr const char* kProtocolVersion = "2025-03-26";

// ---------------------------------------------------------------------------
// Content — one item of tool output or prompt message content.
// ---------------------------------------------------------------------------
enum class ContentType {
    Text,
    Image,
    Resource,
};

struct Content {
    ContentType type = ContentType::Text;
    std::string text;                      // Text, and Resource when embedded
    std::string data;                      // Image (base64)
    std::optional<std::string> mime_type;  // Image (required), Resource
    std::string uri;                       // Resource

    static Content Text(std::string text);
    static Content Image(std::string base64_data, std::string mime_type);
    static Content EmbeddedResource(std::string uri, std::optional<std::string> text,
                                    std::optional<std::string> mime_type = std::nullopt);

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// CallToolResult — the payload of a successful tools/call response.
//
// is_error marks a business-level failure reported inside a successful
// protocol response. It is unrelated to a JSON-RPC error response.
// ---------------------------------------------------------------------------
struct CallToolResult {
    std::vector<Content> content;
    bool is_error = false;

    static CallToolResult Text(std::string text);
    static CallToolResult Failure(std::string message);

    [[nodiscard]] nlohmann::json ToJson() const;
};

// Behaviour hints for clients; every field is optional.
struct ToolAnnotations {
    std::optional<std::string> title;
    std::optional<bool> read_only_hint;
    std::optional<bool> destructive_hint;
    std::optional<bool> idempotent_hint;
    std::optional<bool> open_world_hint;

    [[nodiscard]] nlohmann::json ToJson() const;
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
    std::optional<ToolAnnotations> annotations;

    [[nodiscard]] nlohmann::json ToJson() const;
};

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;

    [[nodiscard]] nlohmann::json ToJson() const;
};

// Either text or blob (base64) is set.
struct ResourceContent {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;

    static ResourceContent Text(std::string uri, std::string text,
                                std::optional<std::string> mime_type = std::nullopt);
    static ResourceContent Blob(std::string uri, std::string base64_blob,
                                std::optional<std::string> mime_type = std::nullopt);

    [[nodiscard]] nlohmann::json ToJson() const;
};

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;

    [[nodiscard]] nlohmann::json ToJson() const;
};

struct PromptDescriptor {
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;

    [[nodiscard]] nlohmann::json ToJson() const;
};

enum class Role {
    User,
    Assistant,
};

const char* RoleName(Role role);

struct PromptMessage {
    Role role = Role::User;
    Content content;

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// ServerCapabilities — which registries were non-empty at initialize time.
// ---------------------------------------------------------------------------
struct ServerCapabilities {
    bool tools = false;
    bool resources = false;
    bool prompts = false;

    [[nodiscard]] nlohmann::json ToJson() const;
};

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] nlohmann::json ToJson() const;
};

} // namespace mcpline
