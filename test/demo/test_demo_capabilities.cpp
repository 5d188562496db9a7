#include <catch2/catch_test_macros.hpp>

#include <mcpline/demo/demo_capabilities.hpp>

#include "mocks/mock_transport.hpp"

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace mcpline;
using mcpline::testing::MockTransport;

namespace {

// Run one request through a transport-backed loop and return everything the
// server wrote, notifications included.
std::vector<nlohmann::json> Run(McpServer<DemoContext>& server, DemoContext& ctx,
                                const std::string& method, nlohmann::json params) {
    auto mock = std::make_shared<MockTransport>();
    mock->EnqueueMessage(MakeRequest(1, method, std::move(params)));
    auto result = server.RunLoop(mock, ctx);
    REQUIRE(result.IsOk());
    return mock->Written();
}

nlohmann::json CallTool(McpServer<DemoContext>& server, DemoContext& ctx,
                        const std::string& name,
                        nlohmann::json arguments = nlohmann::json::object()) {
    auto written = Run(server, ctx, "tools/call",
                       nlohmann::json{{"name", name}, {"arguments", std::move(arguments)}});
    REQUIRE_FALSE(written.empty());
    return written.back();
}

std::string ResultText(const nlohmann::json& response) {
    return response["result"]["content"][0]["text"].get<std::string>();
}

} // anonymous namespace

TEST_CASE("Demo: registers every capability", "[demo]") {
    McpServer<DemoContext> server;
    REQUIRE(RegisterDemoCapabilities(server).IsOk());

    CHECK(server.ToolCount() == 5);
    CHECK(server.Resources().count("server://info") == 1);
    CHECK(server.PromptCount() == 1);
}

TEST_CASE("Demo: registering twice reports the duplicate", "[demo]") {
    McpServer<DemoContext> server;
    REQUIRE(RegisterDemoCapabilities(server).IsOk());

    auto again = RegisterDemoCapabilities(server);
    REQUIRE(again.IsErr());
    CHECK(again.Error().kind == ErrorKind::DuplicateEntry);
}

TEST_CASE("Demo: echo logs to the client and echoes", "[demo]") {
    McpServer<DemoContext> server;
    REQUIRE(RegisterDemoCapabilities(server).IsOk());
    DemoContext ctx;

    auto written = Run(server, ctx, "tools/call",
                       {{"name", "echo"}, {"arguments", {{"message", "hi"}}}});
    REQUIRE(written.size() == 2);
    CHECK(written[0]["method"] == "notifications/message");
    CHECK(written[0]["params"]["data"] == "Echoing: hi");
    CHECK(ResultText(written[1]) == "Echo: hi");
    CHECK_FALSE(written[1]["result"].contains("isError"));
}

TEST_CASE("Demo: echo without a message is invalid params", "[demo]") {
    McpServer<DemoContext> server;
    REQUIRE(RegisterDemoCapabilities(server).IsOk());
    DemoContext ctx;

    auto response = CallTool(server, ctx, "echo");
    CHECK(response["error"]["code"] == -32602);
    CHECK(response["error"]["message"] == "Missing 'message' parameter");
}

TEST_CASE("Demo: echo advertises read-only annotations", "[demo]") {
    McpServer<DemoContext> server;
    REQUIRE(RegisterDemoCapabilities(server).IsOk());
    DemoContext ctx;

    auto tools = Run(server, ctx, "tools/list", nlohmann::json::object())
                     .back()["result"]["tools"];
    REQUIRE(tools.size() == 5);
    CHECK(tools[0]["name"] == "counter_get");
    const auto& echo = tools[3];
    REQUIRE(echo["name"] == "echo");
    CHECK(echo["annotations"]["readOnlyHint"] == true);
    CHECK(echo["inputSchema"]["required"][0] == "message");
}

TEST_CASE("Demo: counter tools share state through the context", "[demo]") {
    McpServer<DemoContext> server;
    REQUIRE(RegisterDemoCapabilities(server).IsOk());
    DemoContext ctx;

    CHECK(ResultText(CallTool(server, ctx, "counter_get")) == "Counter value: 0");
    CHECK(ResultText(CallTool(server, ctx, "counter_increment")) == "Counter incremented to: 1");
    CHECK(ResultText(CallTool(server, ctx, "counter_increment", {{"amount", 5}})) ==
          "Counter incremented to: 6");
    CHECK(ResultText(CallTool(server, ctx, "counter_get")) == "Counter value: 6");
    CHECK(ResultText(CallTool(server, ctx, "counter_reset")) == "Counter reset from 6 to 0");
    CHECK(ctx.counter->load() == 0);
}

TEST_CASE("Demo: counter_increment rejects overflowing amounts", "[demo]") {
    McpServer<DemoContext> server;
    REQUIRE(RegisterDemoCapabilities(server).IsOk());
    DemoContext ctx;

    SECTION("past the maximum") {
        ctx.counter->store(1);
        auto response = CallTool(server, ctx, "counter_increment",
                                 {{"amount", std::numeric_limits<std::int64_t>::max()}});
        CHECK(response["error"]["code"] == -32602);
        CHECK(ctx.counter->load() == 1);
    }
    SECTION("past the minimum") {
        ctx.counter->store(-1);
        auto response = CallTool(server, ctx, "counter_increment",
                                 {{"amount", std::numeric_limits<std::int64_t>::min()}});
        CHECK(response["error"]["code"] == -32602);
        CHECK(ctx.counter->load() == -1);
    }
    SECTION("unsigned amount beyond int64") {
        auto response = CallTool(server, ctx, "counter_increment",
                                 {{"amount", std::numeric_limits<std::uint64_t>::max()}});
        CHECK(response["error"]["code"] == -32602);
        CHECK(ctx.counter->load() == 0);
    }
    SECTION("reaching the maximum exactly is fine") {
        ctx.counter->store(std::numeric_limits<std::int64_t>::max() - 2);
        auto response = CallTool(server, ctx, "counter_increment", {{"amount", 2}});
        CHECK(ResultText(response) == "Counter incremented to: " +
                                          std::to_string(std::numeric_limits<std::int64_t>::max()));
    }
}

TEST_CASE("Demo: counter is shared between engines", "[demo]") {
    auto counter = std::make_shared<std::atomic<std::int64_t>>(0);

    for (int i = 0; i < 3; ++i) {
        McpServer<DemoContext> server;
        REQUIRE(RegisterDemoCapabilities(server).IsOk());
        DemoContext ctx{counter, Identity{}};
        CallTool(server, ctx, "counter_increment");
    }
    CHECK(counter->load() == 3);
}

TEST_CASE("Demo: whoami reports the caller", "[demo]") {
    McpServer<DemoContext> server;
    REQUIRE(RegisterDemoCapabilities(server).IsOk());

    SECTION("no identity is a business failure") {
        DemoContext ctx;
        auto response = CallTool(server, ctx, "whoami");
        CHECK(response["result"]["isError"] == true);
        CHECK(ResultText(response) == "No caller identity on this transport");
    }
    SECTION("identity fields are returned") {
        DemoContext ctx;
        ctx.caller.subject = "alice";
        ctx.caller.tenant = "acme";
        ctx.caller.scopes = {"read"};
        auto info = nlohmann::json::parse(ResultText(CallTool(server, ctx, "whoami")));
        CHECK(info["subject"] == "alice");
        CHECK(info["tenant"] == "acme");
        CHECK(info["scopes"] == nlohmann::json::array({"read"}));
    }
}

TEST_CASE("Demo: server info resource", "[demo]") {
    ServerConfig config;
    config.name = "info-test";
    config.page_size = 7;
    McpServer<DemoContext> server(config);
    REQUIRE(RegisterDemoCapabilities(server).IsOk());
    DemoContext ctx;

    auto response = Run(server, ctx, "resources/read", {{"uri", "server://info"}}).back();
    const auto& content = response["result"]["contents"][0];
    CHECK(content["mimeType"] == "application/json");
    auto info = nlohmann::json::parse(content["text"].get<std::string>());
    CHECK(info["name"] == "info-test");
    CHECK(info["protocolVersion"] == kProtocolVersion);
    CHECK(info["pageSize"] == 7);
}

TEST_CASE("Demo: greeting prompt", "[demo]") {
    McpServer<DemoContext> server;
    REQUIRE(RegisterDemoCapabilities(server).IsOk());
    DemoContext ctx;

    SECTION("default style") {
        auto response = Run(server, ctx, "prompts/get",
                            {{"name", "greeting"}, {"arguments", {{"name", "Bob"}}}})
                            .back();
        CHECK(response["result"]["messages"][0]["content"]["text"] ==
              "Write a friendly greeting for Bob.");
    }
    SECTION("explicit style") {
        auto response =
            Run(server, ctx, "prompts/get",
                {{"name", "greeting"}, {"arguments", {{"name", "Bob"}, {"style", "formal"}}}})
                .back();
        CHECK(response["result"]["messages"][0]["content"]["text"] ==
              "Write a formal greeting for Bob.");
    }
    SECTION("missing name") {
        auto response = Run(server, ctx, "prompts/get", {{"name", "greeting"}}).back();
        CHECK(response["error"]["code"] == -32602);
        CHECK(response["error"]["message"] == "Missing required argument: name");
    }
}
