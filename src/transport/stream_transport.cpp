#include <mcpline/transport/stream_transport.hpp>

#include <string>

namespace mcpline {

StreamTransport::StreamTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

Result<Message, Error> StreamTransport::Read() {
    if (closed_) {
        return Result<Message, Error>::Err(Error::TransportClosed());
    }

    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        return DecodeMessage(line);
    }

    if (in_.bad()) {
        return Result<Message, Error>::Err(Error::Io("Failed to read from input stream"));
    }
    return Result<Message, Error>::Err(Error::TransportClosed());
}

Result<void, Error> StreamTransport::Write(const Message& message) {
    if (closed_) {
        return Result<void, Error>::Err(Error::TransportClosed());
    }
    out_ << EncodeMessage(message) << '\n';
    out_.flush();
    if (!out_) {
        return Result<void, Error>::Err(Error::Io("Failed to write to output stream"));
    }
    return Result<void, Error>::Ok();
}

void StreamTransport::Close() {
    if (!closed_) {
        out_.flush();
        closed_ = true;
    }
}

} // namespace mcpline
