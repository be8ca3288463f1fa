#pragma once
#include "greetmcp/types.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace greetmcp::transport
{

/// Move-only handle for a registered transport hook; unregisters on destruction.
class Subscription
{
  public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}

    Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_))
    {
        other.cancel_ = nullptr;
    }
    Subscription& operator=(Subscription&& other) noexcept
    {
        if (this != &other)
        {
            cancel();
            cancel_ = std::move(other.cancel_);
            other.cancel_ = nullptr;
        }
        return *this;
    }
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    ~Subscription()
    {
        cancel();
    }

    void cancel()
    {
        if (!cancel_)
            return;
        auto fn = std::move(cancel_);
        cancel_ = nullptr;
        fn();
    }

    bool active() const
    {
        return static_cast<bool>(cancel_);
    }

  private:
    std::function<void()> cancel_;
};

/**
 * Outbound message channel to one client.
 *
 * - send() after close() or fail() throws DeliveryFailedError.
 * - close() and fail() are idempotent; whichever comes first wins and the
 *   registered hooks fire exactly once (error hooks, then close hooks, on fail()).
 * - Hooks run on the thread that closed the transport, outside any transport lock.
 *
 * Thread-safe.
 */
class Transport
{
  public:
    using CloseHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const std::string&)>;

    Transport();
    virtual ~Transport() = default;

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    void send(const Json& message);
    void close();
    void fail(const std::string& reason);

    bool closed() const
    {
        return closed_.load();
    }

    Subscription on_close(CloseHandler handler);
    Subscription on_error(ErrorHandler handler);

  protected:
    /// Deliver one message; throw TransportError when the underlying channel is broken.
    virtual void deliver(const Json& message) = 0;
    /// Runs once, right after the transport is marked closed and before hooks fire.
    virtual void on_closed() {}

  private:
    struct Hooks
    {
        std::mutex m;
        uint64_t next_id{0};
        std::map<uint64_t, CloseHandler> close;
        std::map<uint64_t, ErrorHandler> error;
    };

    void fire_close_hooks();

    std::shared_ptr<Hooks> hooks_;
    std::atomic<bool> closed_{false};
};

/// One SSE frame carrying a JSON-RPC message: `event: message\ndata: <json>\n\n`
std::string format_sse_event(const Json& message);

} // namespace greetmcp::transport
