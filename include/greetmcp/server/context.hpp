#pragma once
#include "greetmcp/types.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace greetmcp::server
{

/**
 * Per-invocation handle given to a tool.
 *
 * Lets a tool push interim notifications to the session that called it and pace
 * itself between steps. Notifications go through the call's ordered outbound
 * channel, so they reach the caller in emission order and before the final
 * response.
 */
class Context
{
  public:
    /// Delivers one JSON-RPC notification; throws DeliveryFailedError when the caller is gone.
    using NotificationSink = std::function<void(const Json&)>;
    /// Waits up to the given duration; returns false if the caller went away meanwhile.
    using Pacer = std::function<bool(std::chrono::milliseconds)>;

    Context(std::string session_id, Json request_id, LogLevel min_log_level,
            NotificationSink sink, Pacer pacer = nullptr)
        : session_id_(std::move(session_id)), request_id_(std::move(request_id)),
          min_log_level_(min_log_level), sink_(std::move(sink)), pacer_(std::move(pacer))
    {
    }

    const std::string& session_id() const
    {
        return session_id_;
    }
    const Json& request_id() const
    {
        return request_id_;
    }

    void send_notification(const std::string& method, const Json& params) const;

    /// notifications/message, dropped when below the session's logging/setLevel threshold.
    void log(LogLevel level, const Json& data, const std::string& logger = "") const;

    void info(const Json& data) const
    {
        log(LogLevel::Info, data);
    }

    /// Sleep between steps. Throws DeliveryFailedError if the session closes while waiting.
    void pace(std::chrono::milliseconds delay) const;

  private:
    std::string session_id_;
    Json request_id_;
    LogLevel min_log_level_;
    NotificationSink sink_;
    Pacer pacer_;
};

} // namespace greetmcp::server
