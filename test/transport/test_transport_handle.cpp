#include <catch2/catch_test_macros.hpp>

#include <mcpline/transport/transport_handle.hpp>

#include "mocks/mock_transport.hpp"

#include <memory>
#include <thread>
#include <vector>

using namespace mcpline;
using mcpline::testing::MockTransport;

TEST_CASE("TransportHandle: forwards to the wrapped transport", "[transport]") {
    auto mock = std::make_shared<MockTransport>();
    mock->EnqueueLine(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    TransportHandle handle(mock);

    auto read = handle.Read();
    REQUIRE(read.IsOk());
    CHECK(std::get<Request>(read.Value()).method == "ping");

    REQUIRE(handle.Write(MakeResponse(1, nlohmann::json::object())).IsOk());
    CHECK(mock->WrittenCount() == 1);

    handle.Close();
    CHECK(mock->CloseCalls() == 1);
    CHECK(handle.Transport() == mock);
}

TEST_CASE("TransportHandle: propagates transport errors", "[transport]") {
    auto mock = std::make_shared<MockTransport>();
    mock->FailWrites(Error::Io("pipe closed"));
    TransportHandle handle(mock);

    auto write = handle.Write(MakeNotification("x"));
    REQUIRE(write.IsErr());
    CHECK(write.Error().kind == ErrorKind::Io);

    auto read = handle.Read();
    REQUIRE(read.IsErr());
    CHECK(read.Error().kind == ErrorKind::TransportClosed);
}

TEST_CASE("TransportHandle: concurrent writers are serialized", "[transport]") {
    auto mock = std::make_shared<MockTransport>();
    TransportHandle handle(mock);

    constexpr int kThreads = 4;
    constexpr int kWritesPerThread = 100;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&handle, t] {
            for (int i = 0; i < kWritesPerThread; ++i) {
                auto result = handle.Write(MakeResponse(t * kWritesPerThread + i,
                                                        nlohmann::json::object()));
                (void)result;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(mock->WrittenCount() == static_cast<std::size_t>(kThreads * kWritesPerThread));
}
