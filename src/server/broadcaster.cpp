#include "greetmcp/server/broadcaster.hpp"

#include "greetmcp/exceptions.hpp"
#include "greetmcp/util/json.hpp"

#include <spdlog/spdlog.h>

namespace greetmcp::server
{

size_t NotificationBroadcaster::broadcast_to_all(const Json& notification) const
{
    size_t delivered = 0;
    sessions_.for_each(
        [&](const std::shared_ptr<Session>& session)
        {
            try
            {
                session->send(notification);
                ++delivered;
            }
            catch (const DeliveryFailedError& e)
            {
                spdlog::warn("broadcast to session {} dropped: {}", session->session_id(),
                             e.what());
            }
        });
    spdlog::debug("broadcast {} delivered to {} session(s)", notification.value("method", ""),
                  delivered);
    return delivered;
}

void NotificationBroadcaster::send_to_one(Session& session, const Json& notification) const
{
    session.send(notification);
}

void NotificationBroadcaster::send_to_one(Session& session, const Json& notification,
                                          const Json& related_request_id) const
{
    session.send(notification, related_request_id);
}

size_t NotificationBroadcaster::broadcast_tools_changed(uint64_t version) const
{
    const Json notification = jsonrpc::notification("notifications/tools/list_changed");

    size_t delivered = 0;
    sessions_.for_each(
        [&](const std::shared_ptr<Session>& session)
        {
            if (!session->mark_tools_notified(version))
                return;
            try
            {
                session->send(notification);
                ++delivered;
            }
            catch (const DeliveryFailedError& e)
            {
                spdlog::warn("tools/list_changed to session {} dropped: {}",
                             session->session_id(), e.what());
            }
        });
    spdlog::debug("tool registry v{}: list_changed sent to {} session(s)", version, delivered);
    return delivered;
}

} // namespace greetmcp::server
