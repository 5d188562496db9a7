#pragma once

#include <mcpline/transport/i_transport.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mcpline {

// ---------------------------------------------------------------------------
// BufferedTransport — one inbound body in, every outbound message kept in
// memory until the owner extracts it.
//
// Used once per external request. The first Read() decodes the body; every
// later Read() is TransportClosed. Write() appends the encoded message in
// call order, so notifications emitted during a tool call precede the
// response that follows them.
// ---------------------------------------------------------------------------
class BufferedTransport : public ITransport {
public:
    explicit BufferedTransport(std::string body);

    Result<Message, Error> Read() override;
    Result<void, Error> Write(const Message& message) override;
    void Close() override;

    // -- Extraction (owner only, after dispatch) ----------------------------

    [[nodiscard]] bool HasMultipleMessages() const { return messages_.size() > 1; }
    [[nodiscard]] std::size_t MessageCount() const { return messages_.size(); }
    [[nodiscard]] const std::vector<std::string>& Messages() const { return messages_; }

    // "data: <json>\n\n" per message, concatenated. Clears the buffer.
    std::string TakeEventStream();

    // The last buffered message, if any. Clears the buffer.
    std::optional<std::string> TakeLastMessage();

private:
    std::optional<std::string> body_;
    std::vector<std::string> messages_;
    bool closed_ = false;
};

} // namespace mcpline
