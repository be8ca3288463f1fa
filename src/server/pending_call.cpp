#include "greetmcp/server/pending_call.hpp"

namespace greetmcp::server
{

void PendingCall::notify(const Json& notification)
{
    // Held across the send so notifications of one call cannot overtake each other
    std::lock_guard<std::mutex> lock(m_);
    broadcaster_.send_to_one(*session_, notification, request_id_);
    sent_.push_back(notification);
}

std::vector<Json> PendingCall::sent() const
{
    std::lock_guard<std::mutex> lock(m_);
    return sent_;
}

} // namespace greetmcp::server
