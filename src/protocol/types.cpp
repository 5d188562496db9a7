#include <mcpline/protocol/types.hpp>

namespace mcpline {

// ---------------------------------------------------------------------------
// Content
// ---------------------------------------------------------------------------
Content Content::Text(std::string text) {
    Content c;
    c.type = ContentType::Text;
    c.text = std::move(text);
    return c;
}

Content Content::Image(std::string base64_data, std::string mime_type) {
    Content c;
    c.type = ContentType::Image;
    c.data = std::move(base64_data);
    c.mime_type = std::move(mime_type);
    return c;
}

Content Content::EmbeddedResource(std::string uri, std::optional<std::string> text,
                                  std::optional<std::string> mime_type) {
    Content c;
    c.type = ContentType::Resource;
    c.uri = std::move(uri);
    c.text = text.value_or("");
    c.mime_type = std::move(mime_type);
    return c;
}

nlohmann::json Content::ToJson() const {
    switch (type) {
        case ContentType::Text:
            return {{"type", "text"}, {"text", text}};
        case ContentType::Image:
            return {{"type", "image"},
                    {"data", data},
                    {"mimeType", mime_type.value_or("application/octet-stream")}};
        case ContentType::Resource: {
            nlohmann::json resource = {{"uri", uri}};
            if (mime_type.has_value()) {
                resource["mimeType"] = *mime_type;
            }
            if (!text.empty()) {
                resource["text"] = text;
            }
            return {{"type", "resource"}, {"resource", resource}};
        }
    }
    return {{"type", "text"}, {"text", text}};
}

// ---------------------------------------------------------------------------
// CallToolResult
// ---------------------------------------------------------------------------
CallToolResult CallToolResult::Text(std::string text) {
    return CallToolResult{{Content::Text(std::move(text))}, false};
}

CallToolResult CallToolResult::Failure(std::string message) {
    return CallToolResult{{Content::Text(std::move(message))}, true};
}

nlohmann::json CallToolResult::ToJson() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& c : content) {
        items.push_back(c.ToJson());
    }
    nlohmann::json j = {{"content", items}};
    if (is_error) {
        j["isError"] = true;
    }
    return j;
}

// ---------------------------------------------------------------------------
// Tools
// ---------------------------------------------------------------------------
nlohmann::json ToolAnnotations::ToJson() const {
    nlohmann::json j = nlohmann::json::object();
    if (title) j["title"] = *title;
    if (read_only_hint) j["readOnlyHint"] = *read_only_hint;
    if (destructive_hint) j["destructiveHint"] = *destructive_hint;
    if (idempotent_hint) j["idempotentHint"] = *idempotent_hint;
    if (open_world_hint) j["openWorldHint"] = *open_world_hint;
    return j;
}

nlohmann::json ToolDescriptor::ToJson() const {
    nlohmann::json j = {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema.is_null() ? nlohmann::json::object() : input_schema},
    };
    if (annotations.has_value()) {
        j["annotations"] = annotations->ToJson();
    }
    return j;
}

// ---------------------------------------------------------------------------
// Resources
// ---------------------------------------------------------------------------
nlohmann::json ResourceDescriptor::ToJson() const {
    nlohmann::json j = {{"uri", uri}, {"name", name}};
    if (description.has_value()) {
        j["description"] = *description;
    }
    if (mime_type.has_value()) {
        j["mimeType"] = *mime_type;
    }
    return j;
}

ResourceContent ResourceContent::Text(std::string uri, std::string text,
                                      std::optional<std::string> mime_type) {
    return ResourceContent{std::move(uri), std::move(mime_type), std::move(text), std::nullopt};
}

ResourceContent ResourceContent::Blob(std::string uri, std::string base64_blob,
                                      std::optional<std::string> mime_type) {
    return ResourceContent{std::move(uri), std::move(mime_type), std::nullopt,
                           std::move(base64_blob)};
}

nlohmann::json ResourceContent::ToJson() const {
    nlohmann::json j = {{"uri", uri}};
    if (mime_type.has_value()) {
        j["mimeType"] = *mime_type;
    }
    if (blob.has_value()) {
        j["blob"] = *blob;
    } else {
        j["text"] = text.value_or("");
    }
    return j;
}

// ---------------------------------------------------------------------------
// Prompts
// ---------------------------------------------------------------------------
nlohmann::json PromptArgument::ToJson() const {
    nlohmann::json j = {{"name", name}, {"required", required}};
    if (description.has_value()) {
        j["description"] = *description;
    }
    return j;
}

nlohmann::json PromptDescriptor::ToJson() const {
    nlohmann::json j = {{"name", name}};
    if (description.has_value()) {
        j["description"] = *description;
    }
    if (!arguments.empty()) {
        nlohmann::json args = nlohmann::json::array();
        for (const auto& a : arguments) {
            args.push_back(a.ToJson());
        }
        j["arguments"] = args;
    }
    return j;
}

const char* RoleName(Role role) {
    switch (role) {
        case Role::User:      return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

nlohmann::json PromptMessage::ToJson() const {
    return {{"role", RoleName(role)}, {"content", content.ToJson()}};
}

// ---------------------------------------------------------------------------
// Session setup
// ---------------------------------------------------------------------------
nlohmann::json ServerCapabilities::ToJson() const {
    nlohmann::json j = nlohmann::json::object();
    if (tools) j["tools"] = nlohmann::json::object();
    if (resources) j["resources"] = nlohmann::json::object();
    if (prompts) j["prompts"] = nlohmann::json::object();
    return j;
}

nlohmann::json Implementation::ToJson() const {
    return {{"name", name}, {"version", version}};
}

} // namespace mcpline
