#pragma once
#include "greetmcp/transport/transport.hpp"

#include <functional>
#include <mutex>

namespace greetmcp::transport
{

/// Writes each message straight to one HTTP response body as an SSE frame.
/// Used as the request stream of a POST; a failed write fails the transport.
class StreamWriterTransport : public Transport
{
  public:
    using Writer = std::function<bool(const std::string&)>;

    explicit StreamWriterTransport(Writer writer) : writer_(std::move(writer)) {}

    size_t written() const
    {
        std::lock_guard<std::mutex> lock(m_);
        return written_;
    }

  protected:
    void deliver(const Json& message) override
    {
        std::lock_guard<std::mutex> lock(m_);
        if (!writer_ || !writer_(format_sse_event(message)))
            throw TransportError("response stream write failed");
        ++written_;
    }

  private:
    mutable std::mutex m_;
    Writer writer_;
    size_t written_{0};
};

} // namespace greetmcp::transport
