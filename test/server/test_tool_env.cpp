#include <catch2/catch_test_macros.hpp>

#include <mcpline/server/tool_env.hpp>

#include "mocks/mock_transport.hpp"

#include <memory>
#include <string>

using namespace mcpline;
using mcpline::testing::MockTransport;

namespace {

class TextResource : public IResource {
public:
    explicit TextResource(std::string uri) : uri_(std::move(uri)) {}

    std::string Uri() const override { return uri_; }
    std::string Name() const override { return uri_; }

    Result<std::vector<ResourceContent>, Error> Contents() const override {
        return Result<std::vector<ResourceContent>, Error>::Ok(
            std::vector<ResourceContent>{ResourceContent::Text(uri_, "body")});
    }

private:
    std::string uri_;
};

} // anonymous namespace

TEST_CASE("ToolEnv: log writes a message notification", "[tool_env]") {
    auto mock = std::make_shared<MockTransport>();
    ResourceRegistry resources;
    ToolEnv env(std::make_shared<TransportHandle>(mock), resources);

    REQUIRE(env.Log(LogLevel::Warn, "careful").IsOk());
    REQUIRE(mock->WrittenCount() == 1);
    const auto& j = mock->Written()[0];
    CHECK(j["method"] == "notifications/message");
    CHECK(j["params"]["level"] == "warning");
    CHECK(j["params"]["data"] == "careful");
    CHECK_FALSE(j.contains("id"));
}

TEST_CASE("ToolEnv: progress carries token and optional total", "[tool_env]") {
    auto mock = std::make_shared<MockTransport>();
    ResourceRegistry resources;
    ToolEnv env(std::make_shared<TransportHandle>(mock), resources);

    REQUIRE(env.SendProgress("tok-1", 0.5, 1.0).IsOk());
    REQUIRE(env.SendProgress(42, 3).IsOk());
    REQUIRE(mock->WrittenCount() == 2);

    const auto& first = mock->Written()[0]["params"];
    CHECK(first["progressToken"] == "tok-1");
    CHECK(first["progress"] == 0.5);
    CHECK(first["total"] == 1.0);

    const auto& second = mock->Written()[1]["params"];
    CHECK(second["progressToken"] == 42);
    CHECK(second["progress"] == 3.0);
    CHECK_FALSE(second.contains("total"));
}

TEST_CASE("ToolEnv: custom notification", "[tool_env]") {
    auto mock = std::make_shared<MockTransport>();
    ResourceRegistry resources;
    ToolEnv env(std::make_shared<TransportHandle>(mock), resources);

    REQUIRE(env.SendNotification("notifications/resources/list_changed").IsOk());
    CHECK(mock->Written()[0]["method"] == "notifications/resources/list_changed");
    CHECK_FALSE(mock->Written()[0].contains("params"));
}

TEST_CASE("ToolEnv: no transport is an internal error", "[tool_env]") {
    ResourceRegistry resources;
    ToolEnv env(nullptr, resources);

    auto result = env.Log(LogLevel::Info, "lost");
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Internal);
    CHECK(result.Error().message ==
          "No active transport for notification: notifications/message");
}

TEST_CASE("ToolEnv: write failures are returned to the tool", "[tool_env]") {
    auto mock = std::make_shared<MockTransport>();
    mock->FailWrites(Error::Io("broken pipe"));
    ResourceRegistry resources;
    ToolEnv env(std::make_shared<TransportHandle>(mock), resources);

    auto result = env.SendProgress(1, 1.0);
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Io);
}

TEST_CASE("ToolEnv: resource lookup", "[tool_env]") {
    ResourceRegistry resources;
    resources.emplace("mem://b", std::make_unique<TextResource>("mem://b"));
    resources.emplace("mem://a", std::make_unique<TextResource>("mem://a"));
    ToolEnv env(nullptr, resources);

    CHECK(env.ListResourceKeys() == std::vector<std::string>{"mem://a", "mem://b"});

    const IResource* found = env.GetResource("mem://a");
    REQUIRE(found != nullptr);
    auto contents = found->Contents();
    REQUIRE(contents.IsOk());
    CHECK(contents.Value()[0].text == std::optional<std::string>("body"));

    CHECK(env.GetResource("mem://zzz") == nullptr);
}
