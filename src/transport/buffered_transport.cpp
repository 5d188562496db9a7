#include <mcpline/transport/buffered_transport.hpp>

namespace mcpline {

BufferedTransport::BufferedTransport(std::string body) : body_(std::move(body)) {}

Result<Message, Error> BufferedTransport::Read() {
    if (closed_ || !body_.has_value()) {
        return Result<Message, Error>::Err(Error::TransportClosed());
    }
    std::string body = std::move(*body_);
    body_.reset();
    return DecodeMessage(body);
}

Result<void, Error> BufferedTransport::Write(const Message& message) {
    if (closed_) {
        return Result<void, Error>::Err(Error::TransportClosed());
    }
    messages_.push_back(EncodeMessage(message));
    return Result<void, Error>::Ok();
}

void BufferedTransport::Close() {
    closed_ = true;
    body_.reset();
}

std::string BufferedTransport::TakeEventStream() {
    std::string stream;
    for (const auto& message : messages_) {
        stream += "data: ";
        stream += message;
        stream += "\n\n";
    }
    messages_.clear();
    return stream;
}

std::optional<std::string> BufferedTransport::TakeLastMessage() {
    if (messages_.empty()) {
        return std::nullopt;
    }
    std::string last = std::move(messages_.back());
    messages_.clear();
    return last;
}

} // namespace mcpline
