#pragma once

#include <mcpline/transport/i_transport.hpp>

#include <iostream>
#include <istream>
#include <ostream>

namespace mcpline {

// Newline-delimited JSON over a long-lived pair of streams (stdin/stdout by
// default). The streams are borrowed and must outlive the transport.
class StreamTransport : public ITransport {
public:
    explicit StreamTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    Result<Message, Error> Read() override;
    Result<void, Error> Write(const Message& message) override;
    void Close() override;

private:
    std::istream& in_;
    std::ostream& out_;
    bool closed_ = false;
};

} // namespace mcpline
