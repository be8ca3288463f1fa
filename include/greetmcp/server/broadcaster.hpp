#pragma once
#include "greetmcp/server/session_table.hpp"
#include "greetmcp/types.hpp"

#include <cstdint>
#include <memory>

namespace greetmcp::server
{

/// Pushes notifications to one session or to every live session.
class NotificationBroadcaster
{
  public:
    explicit NotificationBroadcaster(const SessionTable& sessions) : sessions_(sessions) {}

    /// Deliver to every session live at call time. A failing session is logged and
    /// skipped. Returns the number of sessions that accepted the notification.
    size_t broadcast_to_all(const Json& notification) const;

    /// Deliver to exactly one session. Throws DeliveryFailedError.
    void send_to_one(Session& session, const Json& notification) const;

    /// As above, routed to the response stream of `related_request_id` when bound.
    void send_to_one(Session& session, const Json& notification,
                     const Json& related_request_id) const;

    /// notifications/tools/list_changed to each session not yet told about `version`.
    size_t broadcast_tools_changed(uint64_t version) const;

  private:
    const SessionTable& sessions_;
};

} // namespace greetmcp::server
