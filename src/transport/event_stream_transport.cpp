#include "greetmcp/transport/event_stream_transport.hpp"

#include "greetmcp/exceptions.hpp"

namespace greetmcp::transport
{

EventStreamTransport::EventStreamTransport(size_t max_queue_size)
    : max_queue_size_(max_queue_size == 0 ? 1 : max_queue_size)
{
}

void EventStreamTransport::deliver(const Json& message)
{
    {
        std::lock_guard<std::mutex> lock(m_);
        if (closing_)
            throw TransportError("event stream closed");

        // Drop oldest event when queue is full
        if (queue_.size() >= max_queue_size_)
        {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(message);
    }
    cv_.notify_all();
}

void EventStreamTransport::on_closed()
{
    {
        std::lock_guard<std::mutex> lock(m_);
        closing_ = true;
    }
    cv_.notify_all();
}

std::optional<Json> EventStreamTransport::next(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_);
    cv_.wait_for(lock, timeout, [&] { return !queue_.empty() || closing_; });
    if (queue_.empty())
        return std::nullopt;
    Json message = std::move(queue_.front());
    queue_.pop_front();
    return message;
}

size_t EventStreamTransport::pending() const
{
    std::lock_guard<std::mutex> lock(m_);
    return queue_.size();
}

size_t EventStreamTransport::dropped() const
{
    std::lock_guard<std::mutex> lock(m_);
    return dropped_;
}

bool EventStreamTransport::has_subscriber() const
{
    std::lock_guard<std::mutex> lock(m_);
    return subscribed_;
}

void EventStreamTransport::stream(const Writer& writer,
                                  std::chrono::milliseconds heartbeat_interval)
{
    std::unique_lock<std::mutex> lock(m_);
    if (subscribed_)
        throw StreamConflictError("session already has an open event stream");
    subscribed_ = true;

    struct Release
    {
        EventStreamTransport& self;
        ~Release()
        {
            std::lock_guard<std::mutex> l(self.m_);
            self.subscribed_ = false;
        }
    };
    lock.unlock();
    Release release{*this};

    // Initial comment so the client sees the stream open immediately
    if (!writer(": stream open\n\n"))
        return;

    int heartbeat_counter = 0;
    lock.lock();
    while (true)
    {
        bool woke = cv_.wait_for(lock, heartbeat_interval,
                                 [&] { return !queue_.empty() || closing_; });

        if (!woke)
        {
            lock.unlock();
            std::string hb = ": heartbeat " + std::to_string(++heartbeat_counter) + "\n\n";
            if (!writer(hb))
                return;
            lock.lock();
            continue;
        }

        if (queue_.empty())
        {
            // closed and drained
            lock.unlock();
            return;
        }

        Json message = std::move(queue_.front());
        queue_.pop_front();

        // Release lock while writing to avoid blocking senders
        lock.unlock();
        if (!writer(format_sse_event(message)))
        {
            // Client went away; keep the message for the next subscriber
            std::lock_guard<std::mutex> relock(m_);
            if (!closing_)
                queue_.push_front(std::move(message));
            return;
        }
        lock.lock();
    }
}

} // namespace greetmcp::transport
