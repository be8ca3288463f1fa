#pragma once
#include "greetmcp/server/broadcaster.hpp"
#include "greetmcp/server/session.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace greetmcp::server
{

/// One in-flight tools/call: its session, tool, request id and the interim
/// notifications already sent, in emission order.
class PendingCall
{
  public:
    PendingCall(std::shared_ptr<Session> session, std::string tool_name, Json request_id,
                const NotificationBroadcaster& broadcaster)
        : session_(std::move(session)), tool_name_(std::move(tool_name)),
          request_id_(std::move(request_id)), broadcaster_(broadcaster)
    {
    }

    /// Send an interim notification to the caller. Throws DeliveryFailedError.
    void notify(const Json& notification);

    const std::shared_ptr<Session>& session() const
    {
        return session_;
    }
    const std::string& tool_name() const
    {
        return tool_name_;
    }
    const Json& request_id() const
    {
        return request_id_;
    }
    std::vector<Json> sent() const;

  private:
    std::shared_ptr<Session> session_;
    std::string tool_name_;
    Json request_id_;
    const NotificationBroadcaster& broadcaster_;

    mutable std::mutex m_;
    std::vector<Json> sent_;
};

} // namespace greetmcp::server
