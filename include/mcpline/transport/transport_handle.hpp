#pragma once

#include <mcpline/transport/i_transport.hpp>

#include <memory>
#include <mutex>

namespace mcpline {

// ---------------------------------------------------------------------------
// TransportHandle — the one transport shared by the engine and the tool
// environment during a dispatch.
//
// Each operation locks for exactly its own duration; the lock is never held
// while a tool runs, so a tool may write through the handle freely.
// ---------------------------------------------------------------------------
class TransportHandle {
public:
    explicit TransportHandle(std::shared_ptr<ITransport> transport);

    Result<Message, Error> Read();
    Result<void, Error> Write(const Message& message);
    void Close();

    [[nodiscard]] std::shared_ptr<ITransport> Transport() const { return transport_; }

private:
    std::shared_ptr<ITransport> transport_;
    std::mutex mutex_;
};

} // namespace mcpline
