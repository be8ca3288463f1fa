#include "greetmcp/transport/transport.hpp"

#include "greetmcp/exceptions.hpp"

#include <vector>

namespace greetmcp::transport
{

Transport::Transport() : hooks_(std::make_shared<Hooks>()) {}

void Transport::send(const Json& message)
{
    if (closed_)
        throw DeliveryFailedError("transport is closed");

    try
    {
        deliver(message);
    }
    catch (const TransportError& e)
    {
        fail(e.what());
        throw DeliveryFailedError(std::string("delivery failed: ") + e.what());
    }
}

void Transport::close()
{
    if (closed_.exchange(true))
        return;
    on_closed();
    fire_close_hooks();
}

void Transport::fail(const std::string& reason)
{
    if (closed_.exchange(true))
        return;
    on_closed();

    std::vector<ErrorHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(hooks_->m);
        for (const auto& [id, handler] : hooks_->error)
            handlers.push_back(handler);
    }
    for (const auto& handler : handlers)
        handler(reason);

    fire_close_hooks();
}

void Transport::fire_close_hooks()
{
    std::vector<CloseHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(hooks_->m);
        for (const auto& [id, handler] : hooks_->close)
            handlers.push_back(handler);
    }
    for (const auto& handler : handlers)
        handler();
}

Subscription Transport::on_close(CloseHandler handler)
{
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(hooks_->m);
        id = hooks_->next_id++;
        hooks_->close[id] = std::move(handler);
    }
    std::weak_ptr<Hooks> weak = hooks_;
    return Subscription(
        [weak, id]()
        {
            if (auto hooks = weak.lock())
            {
                std::lock_guard<std::mutex> lock(hooks->m);
                hooks->close.erase(id);
            }
        });
}

Subscription Transport::on_error(ErrorHandler handler)
{
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(hooks_->m);
        id = hooks_->next_id++;
        hooks_->error[id] = std::move(handler);
    }
    std::weak_ptr<Hooks> weak = hooks_;
    return Subscription(
        [weak, id]()
        {
            if (auto hooks = weak.lock())
            {
                std::lock_guard<std::mutex> lock(hooks->m);
                hooks->error.erase(id);
            }
        });
}

std::string format_sse_event(const Json& message)
{
    return "event: message\ndata: " + message.dump() + "\n\n";
}

} // namespace greetmcp::transport
