#pragma once

#include <mcpline/transport/i_transport.hpp>

#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace mcpline {
namespace testing {

// ---------------------------------------------------------------------------
// MockTransport — hand-written scripted transport for offline unit testing.
//
// Usage:
//   auto mock = std::make_shared<MockTransport>();
//   mock->EnqueueLine(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
//   server.RunLoop(mock, ctx);
//   CHECK(mock->WrittenCount() == 1);
//
// Reads are consumed FIFO. Once the queue is empty Read() reports
// TransportClosed, which ends a run loop cleanly.
// ---------------------------------------------------------------------------
class MockTransport : public ITransport {
public:
    // -- Script inbound traffic ---------------------------------------------

    void EnqueueLine(const std::string& line) {
        reads_.push_back(DecodeMessage(line));
    }

    void EnqueueMessage(const Message& message) {
        reads_.push_back(Result<Message, Error>::Ok(message));
    }

    void EnqueueError(Error error) {
        reads_.push_back(Result<Message, Error>::Err(std::move(error)));
    }

    // Every Write() from now on fails with the given error.
    void FailWrites(Error error) { write_error_ = std::move(error); }

    // -- ITransport ---------------------------------------------------------

    Result<Message, Error> Read() override {
        ++read_calls_;
        if (reads_.empty()) {
            return Result<Message, Error>::Err(Error::TransportClosed());
        }
        auto next = std::move(reads_.front());
        reads_.pop_front();
        return next;
    }

    Result<void, Error> Write(const Message& message) override {
        if (write_error_.has_value()) {
            return Result<void, Error>::Err(*write_error_);
        }
        written_.push_back(MessageToJson(message));
        return Result<void, Error>::Ok();
    }

    void Close() override { ++close_calls_; }

    // -- Inspection ---------------------------------------------------------

    [[nodiscard]] const std::vector<nlohmann::json>& Written() const { return written_; }
    [[nodiscard]] std::size_t WrittenCount() const { return written_.size(); }
    [[nodiscard]] int ReadCalls() const { return read_calls_; }
    [[nodiscard]] int CloseCalls() const { return close_calls_; }

private:
    std::deque<Result<Message, Error>> reads_;
    std::vector<nlohmann::json> written_;
    std::optional<Error> write_error_;
    int read_calls_ = 0;
    int close_calls_ = 0;
};

} // namespace testing
} // namespace mcpline
