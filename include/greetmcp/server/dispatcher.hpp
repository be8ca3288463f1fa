#pragma once
#include "greetmcp/server/broadcaster.hpp"
#include "greetmcp/server/session_table.hpp"
#include "greetmcp/tools/registry.hpp"
#include "greetmcp/transport/event_stream_transport.hpp"
#include "greetmcp/types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace greetmcp::server
{

/// Outcome class of one dispatched request; the HTTP layer maps it to a status code.
enum class ReplyStatus
{
    Ok,            ///< 200
    Accepted,      ///< 202, no body
    BadRequest,    ///< 400
    Conflict,      ///< 409
    Unavailable,   ///< 503
    InternalError  ///< 500
};

struct Reply
{
    ReplyStatus status{ReplyStatus::Ok};
    /// Echoed in the Mcp-Session-Id response header when not empty
    std::string session_id;
    /// JSON-RPC response or error; null when there is no body
    Json body;
};

/**
 * Routes the three verbs of the MCP endpoint to sessions and handlers.
 *
 * - handle_post(): initialize (no session id) or any request/notification of an
 *   existing session.
 * - handle_subscribe(): the session's standalone event stream (GET).
 * - handle_delete(): session termination (DELETE).
 *
 * Protocol failures never escape: they come back as a Reply carrying a JSON-RPC
 * error body. Internal faults are logged and reported with a generic message.
 */
class Dispatcher
{
  public:
    using StreamWriter = transport::EventStreamTransport::Writer;

    struct Options
    {
        std::string server_name{"greetmcp"};
        std::string server_version{"1.0.0"};
        size_t max_queue_size{transport::EventStreamTransport::DEFAULT_MAX_QUEUE_SIZE};
        std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(15)};
    };

    Dispatcher(SessionTable& sessions, const tools::ToolRegistry& registry,
               const NotificationBroadcaster& broadcaster, Options options);
    Dispatcher(SessionTable& sessions, const tools::ToolRegistry& registry,
               const NotificationBroadcaster& broadcaster);

    /// Closes every remaining session.
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * Handle one POSTed JSON-RPC message.
     *
     * @param response_stream optional stream for this request's interim
     *        notifications (the POST's SSE body); when null they go to the
     *        session's standalone stream
     */
    Reply handle_post(const Json& message, const std::optional<std::string>& session_id,
                      std::shared_ptr<transport::Transport> response_stream = nullptr);

    /// Validate a GET before the response is committed: Ok, BadRequest or Conflict.
    Reply check_subscribe(const std::optional<std::string>& session_id) const;

    /// Serve the session's event stream through `writer`; returns when the stream ends.
    Reply handle_subscribe(const std::optional<std::string>& session_id,
                           const StreamWriter& writer);

    /// Terminate a session. Repeating it for an already terminated id is a no-op.
    Reply handle_delete(const std::optional<std::string>& session_id);

    /// Ok when the id names a live session, else BadRequest.
    Reply check_session(const std::optional<std::string>& session_id) const;

    /// The live, initialized session for `session_id`; throws InvalidSessionError.
    std::shared_ptr<Session> resolve(const std::optional<std::string>& session_id) const;

    /// True for messages whose reply may be preceded by interim notifications.
    static bool may_stream(const Json& message);

    /// Close every live session (server shutdown).
    void close_all();

    const Options& options() const
    {
        return options_;
    }

  private:
    Reply initialize(const Json& message);
    Json handle_request(const std::shared_ptr<Session>& session, const Json& message,
                        const std::shared_ptr<transport::Transport>& response_stream);
    void handle_notification(Session& session, const Json& message);
    Json call_tool(const std::shared_ptr<Session>& session, const Json& id, const Json& params,
                   const std::shared_ptr<transport::Transport>& response_stream);
    Json set_log_level(Session& session, const Json& id, const Json& params);

    void attach_close_hooks(const std::shared_ptr<Session>& session);
    void on_transport_closed(const std::weak_ptr<Session>& weak, const std::string& reason);

    static std::string negotiate_protocol_version(const std::string& requested);
    static Reply invalid_session_reply();
    static Reply internal_error_reply(const Json& id, const std::string& session_id);

    SessionTable& sessions_;
    const tools::ToolRegistry& registry_;
    const NotificationBroadcaster& broadcaster_;
    Options options_;
};

} // namespace greetmcp::server
