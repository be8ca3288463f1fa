#pragma once
#include "greetmcp/transport/transport.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <optional>

namespace greetmcp::transport
{

/**
 * A session's standalone server-to-client stream.
 *
 * Messages are queued (bounded; the oldest is dropped when full) until a GET
 * subscriber drains them with stream(), or a test pulls them with next().
 * At most one stream() runs at a time. If the subscriber disconnects the
 * undelivered message stays queued for the next subscriber.
 */
class EventStreamTransport : public Transport
{
  public:
    /// Writes raw SSE bytes to the client; returns false when the connection is gone.
    using Writer = std::function<bool(const std::string&)>;

    static constexpr size_t DEFAULT_MAX_QUEUE_SIZE = 1000;

    explicit EventStreamTransport(size_t max_queue_size = DEFAULT_MAX_QUEUE_SIZE);

    /// Pop the oldest queued message, waiting up to `timeout`.
    std::optional<Json> next(std::chrono::milliseconds timeout);

    size_t pending() const;
    size_t dropped() const;
    bool has_subscriber() const;

    /**
     * Serve queued and future messages to `writer` as SSE frames.
     *
     * Blocks until the transport closes or a write fails. Emits an SSE comment
     * heartbeat when idle for `heartbeat_interval`.
     *
     * @throws StreamConflictError if another stream() is already running
     */
    void stream(const Writer& writer,
                std::chrono::milliseconds heartbeat_interval = std::chrono::seconds(15));

  protected:
    void deliver(const Json& message) override;
    void on_closed() override;

  private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<Json> queue_;
    size_t max_queue_size_;
    size_t dropped_{0};
    bool subscribed_{false};
    bool closing_{false};
};

} // namespace greetmcp::transport
