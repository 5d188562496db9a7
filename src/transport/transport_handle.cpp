#include <mcpline/transport/transport_handle.hpp>

#include <system_error>

namespace mcpline {

TransportHandle::TransportHandle(std::shared_ptr<ITransport> transport)
    : transport_(std::move(transport)) {}

Result<Message, Error> TransportHandle::Read() {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        return transport_->Read();
    } catch (const std::system_error& e) {
        return Result<Message, Error>::Err(
            Error::Internal(std::string("Transport lock failed: ") + e.what()));
    }
}

Result<void, Error> TransportHandle::Write(const Message& message) {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        return transport_->Write(message);
    } catch (const std::system_error& e) {
        return Result<void, Error>::Err(
            Error::Internal(std::string("Transport lock failed: ") + e.what()));
    }
}

void TransportHandle::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    transport_->Close();
}

} // namespace mcpline
