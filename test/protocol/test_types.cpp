#include <catch2/catch_test_macros.hpp>

#include <mcpline/protocol/types.hpp>

using namespace mcpline;

// ===========================================================================
// Content
// ===========================================================================

TEST_CASE("Content: text item", "[types]") {
    auto j = Content::Text("hello").ToJson();
    CHECK(j == nlohmann::json{{"type", "text"}, {"text", "hello"}});
}

TEST_CASE("Content: image item carries data and mime type", "[types]") {
    auto j = Content::Image("aGVsbG8=", "image/png").ToJson();
    CHECK(j["type"] == "image");
    CHECK(j["data"] == "aGVsbG8=");
    CHECK(j["mimeType"] == "image/png");
}

TEST_CASE("Content: embedded resource nests uri and text", "[types]") {
    auto j = Content::EmbeddedResource("file:///a.txt", std::string("body"), "text/plain")
                 .ToJson();
    CHECK(j["type"] == "resource");
    CHECK(j["resource"]["uri"] == "file:///a.txt");
    CHECK(j["resource"]["text"] == "body");
    CHECK(j["resource"]["mimeType"] == "text/plain");
}

// ===========================================================================
// CallToolResult
// ===========================================================================

TEST_CASE("CallToolResult: success omits isError", "[types]") {
    auto j = CallToolResult::Text("Echo: hi").ToJson();
    REQUIRE(j["content"].is_array());
    REQUIRE(j["content"].size() == 1);
    CHECK(j["content"][0]["text"] == "Echo: hi");
    CHECK_FALSE(j.contains("isError"));
}

TEST_CASE("CallToolResult: failure sets isError", "[types]") {
    auto j = CallToolResult::Failure("no such row").ToJson();
    CHECK(j["isError"] == true);
    CHECK(j["content"][0]["text"] == "no such row");
}

TEST_CASE("CallToolResult: empty content is an empty array", "[types]") {
    CallToolResult result;
    auto j = result.ToJson();
    CHECK(j["content"].is_array());
    CHECK(j["content"].empty());
}

// ===========================================================================
// Descriptors
// ===========================================================================

TEST_CASE("ToolDescriptor: wire field names", "[types]") {
    ToolDescriptor descriptor{"echo", "Echo input",
                              {{"type", "object"}, {"properties", nlohmann::json::object()}},
                              std::nullopt};
    auto j = descriptor.ToJson();
    CHECK(j["name"] == "echo");
    CHECK(j["description"] == "Echo input");
    CHECK(j["inputSchema"]["type"] == "object");
    CHECK_FALSE(j.contains("annotations"));
}

TEST_CASE("ToolDescriptor: null schema becomes an empty object", "[types]") {
    ToolDescriptor descriptor{"noop", "", nullptr, std::nullopt};
    CHECK(descriptor.ToJson()["inputSchema"] == nlohmann::json::object());
}

TEST_CASE("ToolDescriptor: only set annotation hints are emitted", "[types]") {
    ToolAnnotations annotations;
    annotations.read_only_hint = true;
    annotations.destructive_hint = false;

    ToolDescriptor descriptor{"get", "Read", nlohmann::json::object(), annotations};
    auto j = descriptor.ToJson()["annotations"];
    CHECK(j["readOnlyHint"] == true);
    CHECK(j["destructiveHint"] == false);
    CHECK_FALSE(j.contains("idempotentHint"));
    CHECK_FALSE(j.contains("title"));
}

TEST_CASE("ResourceDescriptor: optional fields are omitted", "[types]") {
    ResourceDescriptor bare{"mem://a", "A", std::nullopt, std::nullopt};
    auto j = bare.ToJson();
    CHECK(j == nlohmann::json{{"uri", "mem://a"}, {"name", "A"}});

    ResourceDescriptor full{"mem://b", "B", std::string("The B"), std::string("text/plain")};
    j = full.ToJson();
    CHECK(j["description"] == "The B");
    CHECK(j["mimeType"] == "text/plain");
}

TEST_CASE("ResourceContent: text and blob variants", "[types]") {
    auto text = ResourceContent::Text("mem://a", "hello", "text/plain").ToJson();
    CHECK(text["text"] == "hello");
    CHECK(text["mimeType"] == "text/plain");
    CHECK_FALSE(text.contains("blob"));

    auto blob = ResourceContent::Blob("mem://b", "AAEC").ToJson();
    CHECK(blob["blob"] == "AAEC");
    CHECK_FALSE(blob.contains("text"));
    CHECK_FALSE(blob.contains("mimeType"));
}

TEST_CASE("PromptDescriptor: arguments omitted when there are none", "[types]") {
    PromptDescriptor bare{"summarize", std::nullopt, {}};
    CHECK_FALSE(bare.ToJson().contains("arguments"));

    PromptDescriptor with_args{"greeting", std::string("Greet"),
                               {PromptArgument{"name", std::string("Who"), true}}};
    auto j = with_args.ToJson();
    REQUIRE(j["arguments"].size() == 1);
    CHECK(j["arguments"][0]["name"] == "name");
    CHECK(j["arguments"][0]["required"] == true);
    CHECK(j["arguments"][0]["description"] == "Who");
}

TEST_CASE("PromptMessage: role and content", "[types]") {
    PromptMessage message{Role::Assistant, Content::Text("Hi")};
    auto j = message.ToJson();
    CHECK(j["role"] == "assistant");
    CHECK(j["content"]["text"] == "Hi");
    CHECK(std::string(RoleName(Role::User)) == "user");
}

// ===========================================================================
// Session setup
// ===========================================================================

TEST_CASE("ServerCapabilities: only non-empty registries are advertised", "[types]") {
    CHECK(ServerCapabilities{}.ToJson() == nlohmann::json::object());

    ServerCapabilities caps{true, false, true};
    auto j = caps.ToJson();
    CHECK(j["tools"] == nlohmann::json::object());
    CHECK(j["prompts"] == nlohmann::json::object());
    CHECK_FALSE(j.contains("resources"));
}

TEST_CASE("Implementation: name and version", "[types]") {
    CHECK(Implementation{"mcpline", "0.1.0"}.ToJson() ==
          nlohmann::json{{"name", "mcpline"}, {"version", "0.1.0"}});
}
