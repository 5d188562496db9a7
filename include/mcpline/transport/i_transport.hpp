#pragma once

#include <mcpline/core/result.hpp>
#include <mcpline/protocol/message.hpp>

namespace mcpline {

// ---------------------------------------------------------------------------
// ITransport — read one message / write one message.
//
// Read() returns ErrorKind::TransportClosed once no more input exists. A
// payload that cannot be decoded is reported as ErrorKind::Parse or
// ErrorKind::InvalidMessage; the transport itself stays usable afterwards.
// ---------------------------------------------------------------------------
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual Result<Message, Error> Read() = 0;
    virtual Result<void, Error> Write(const Message& message) = 0;
    virtual void Close() = 0;
};

} // namespace mcpline
