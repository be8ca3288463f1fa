#include "greetmcp/server/context.hpp"

#include "greetmcp/exceptions.hpp"
#include "greetmcp/util/json.hpp"

#include <thread>

namespace greetmcp::server
{

void Context::send_notification(const std::string& method, const Json& params) const
{
    if (!sink_)
        throw DeliveryFailedError("no notification channel for session " + session_id_);
    sink_(jsonrpc::notification(method, params));
}

void Context::log(LogLevel level, const Json& data, const std::string& logger) const
{
    if (level < min_log_level_)
        return;

    Json params = {{"level", to_string(level)}, {"data", data}};
    if (!logger.empty())
        params["logger"] = logger;
    send_notification("notifications/message", params);
}

void Context::pace(std::chrono::milliseconds delay) const
{
    if (delay.count() <= 0)
        return;
    if (!pacer_)
    {
        std::this_thread::sleep_for(delay);
        return;
    }
    if (!pacer_(delay))
        throw DeliveryFailedError("session " + session_id_ + " closed during tool call");
}

} // namespace greetmcp::server
