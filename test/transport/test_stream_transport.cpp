#include <catch2/catch_test_macros.hpp>

#include <mcpline/transport/stream_transport.hpp>

#include <sstream>
#include <string>

using namespace mcpline;

TEST_CASE("StreamTransport: reads one message per line", "[transport]") {
    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n");
    std::ostringstream out;
    StreamTransport transport(in, out);

    auto first = transport.Read();
    REQUIRE(first.IsOk());
    CHECK(std::holds_alternative<Request>(first.Value()));

    auto second = transport.Read();
    REQUIRE(second.IsOk());
    CHECK(std::holds_alternative<Notification>(second.Value()));

    auto end = transport.Read();
    REQUIRE(end.IsErr());
    CHECK(end.Error().kind == ErrorKind::TransportClosed);
}

TEST_CASE("StreamTransport: blank lines and carriage returns are skipped", "[transport]") {
    std::istringstream in("\n   \n\t\n{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}\r\n");
    std::ostringstream out;
    StreamTransport transport(in, out);

    auto message = transport.Read();
    REQUIRE(message.IsOk());
    CHECK(std::get<Request>(message.Value()).id == RequestId(2));
}

TEST_CASE("StreamTransport: bad line is reported and reading continues", "[transport]") {
    std::istringstream in("not json\n{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"ping\"}\n");
    std::ostringstream out;
    StreamTransport transport(in, out);

    auto bad = transport.Read();
    REQUIRE(bad.IsErr());
    CHECK(bad.Error().kind == ErrorKind::Parse);

    auto good = transport.Read();
    REQUIRE(good.IsOk());
    CHECK(std::get<Request>(good.Value()).id == RequestId(3));
}

TEST_CASE("StreamTransport: empty input is closed", "[transport]") {
    std::istringstream in("");
    std::ostringstream out;
    StreamTransport transport(in, out);

    auto result = transport.Read();
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::TransportClosed);
}

TEST_CASE("StreamTransport: broken input stream is an I/O error", "[transport]") {
    std::istringstream in("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n");
    in.setstate(std::ios::badbit);
    std::ostringstream out;
    StreamTransport transport(in, out);

    auto result = transport.Read();
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Io);
}

TEST_CASE("StreamTransport: writes newline-terminated single-line JSON", "[transport]") {
    std::istringstream in;
    std::ostringstream out;
    StreamTransport transport(in, out);

    REQUIRE(transport.Write(MakeResponse(1, {{"text", "line1\nline2"}})).IsOk());
    REQUIRE(transport.Write(MakeNotification("notifications/progress")).IsOk());

    auto text = out.str();
    auto first_newline = text.find('\n');
    REQUIRE(first_newline != std::string::npos);
    auto first = nlohmann::json::parse(text.substr(0, first_newline));
    CHECK(first["result"]["text"] == "line1\nline2");

    auto rest = text.substr(first_newline + 1);
    REQUIRE_FALSE(rest.empty());
    CHECK(rest.back() == '\n');
    CHECK(rest.find('\n') == rest.size() - 1);
}

TEST_CASE("StreamTransport: failed write is an I/O error", "[transport]") {
    std::istringstream in;
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StreamTransport transport(in, out);

    auto result = transport.Write(MakeResponse(1, nlohmann::json::object()));
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Io);
}

TEST_CASE("StreamTransport: closed transport refuses reads and writes", "[transport]") {
    std::istringstream in("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n");
    std::ostringstream out;
    StreamTransport transport(in, out);
    transport.Close();
    transport.Close();

    CHECK(transport.Read().Error().kind == ErrorKind::TransportClosed);
    CHECK(transport.Write(MakeNotification("x")).Error().kind == ErrorKind::TransportClosed);
    CHECK(out.str().empty());
}
