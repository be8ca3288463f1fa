#include "greetmcp/server/dispatcher.hpp"

#include "greetmcp/exceptions.hpp"
#include "greetmcp/server/context.hpp"
#include "greetmcp/server/pending_call.hpp"
#include "greetmcp/util/json.hpp"

#include <spdlog/spdlog.h>

namespace greetmcp::server
{

namespace
{
const char* const SUPPORTED_PROTOCOL_VERSIONS[] = {"2025-03-26", "2025-06-18", "2024-11-05"};

const char* const INVALID_SESSION_MESSAGE = "Bad Request: invalid session ID or method.";
const char* const INTERNAL_ERROR_MESSAGE = "Internal server error";

bool has_session_id(const std::optional<std::string>& session_id)
{
    return session_id.has_value() && !session_id->empty();
}
} // namespace

Dispatcher::Dispatcher(SessionTable& sessions, const tools::ToolRegistry& registry,
                       const NotificationBroadcaster& broadcaster, Options options)
    : sessions_(sessions), registry_(registry), broadcaster_(broadcaster),
      options_(std::move(options))
{
}

Dispatcher::Dispatcher(SessionTable& sessions, const tools::ToolRegistry& registry,
                       const NotificationBroadcaster& broadcaster)
    : Dispatcher(sessions, registry, broadcaster, Options{})
{
}

Dispatcher::~Dispatcher()
{
    close_all();
}

bool Dispatcher::may_stream(const Json& message)
{
    return jsonrpc::is_request(message) && message["method"].is_string() &&
           message["method"].get<std::string>() == "tools/call";
}

std::string Dispatcher::negotiate_protocol_version(const std::string& requested)
{
    for (const char* version : SUPPORTED_PROTOCOL_VERSIONS)
        if (requested == version)
            return requested;
    return LATEST_PROTOCOL_VERSION;
}

Reply Dispatcher::invalid_session_reply()
{
    return Reply{ReplyStatus::BadRequest, "",
                 jsonrpc::error(Json(), jsonrpc::SERVER_ERROR, INVALID_SESSION_MESSAGE)};
}

Reply Dispatcher::internal_error_reply(const Json& id, const std::string& session_id)
{
    return Reply{ReplyStatus::InternalError, session_id,
                 jsonrpc::error(id, jsonrpc::INTERNAL_ERROR, INTERNAL_ERROR_MESSAGE)};
}

std::shared_ptr<Session> Dispatcher::resolve(const std::optional<std::string>& session_id) const
{
    if (!has_session_id(session_id))
        throw InvalidSessionError("missing session id");

    auto session = sessions_.lookup(*session_id);
    if (!session || !session->is_active())
        throw InvalidSessionError("unknown session id: " + *session_id);
    return session;
}

Reply Dispatcher::check_session(const std::optional<std::string>& session_id) const
{
    try
    {
        auto session = resolve(session_id);
        return Reply{ReplyStatus::Ok, session->session_id(), Json()};
    }
    catch (const InvalidSessionError& e)
    {
        spdlog::debug("rejecting request: {}", e.what());
        return invalid_session_reply();
    }
}

// ============================================================================
// POST
// ============================================================================

Reply Dispatcher::handle_post(const Json& message, const std::optional<std::string>& session_id,
                              std::shared_ptr<transport::Transport> response_stream)
{
    const Json id = jsonrpc::id_of(message);
    try
    {
        if (!message.is_object())
            return Reply{ReplyStatus::BadRequest, "",
                         jsonrpc::error(Json(), jsonrpc::INVALID_REQUEST, "Invalid Request")};

        if (!has_session_id(session_id))
        {
            if (jsonrpc::is_initialize_request(message))
                return initialize(message);
            throw InvalidSessionError("request without session id is not initialize");
        }

        auto session = resolve(session_id);

        if (jsonrpc::is_request(message))
        {
            spdlog::debug("session {} request: {}", session->session_id(), message.dump());
            return Reply{ReplyStatus::Ok, session->session_id(),
                         handle_request(session, message, response_stream)};
        }
        if (jsonrpc::is_notification(message))
        {
            handle_notification(*session, message);
            return Reply{ReplyStatus::Accepted, session->session_id(), Json()};
        }
        if (jsonrpc::is_response(message))
        {
            // No server-initiated requests are issued, so client responses are only acknowledged
            spdlog::debug("session {} ignoring client response id={}", session->session_id(),
                          id.dump());
            return Reply{ReplyStatus::Accepted, session->session_id(), Json()};
        }
        return Reply{ReplyStatus::BadRequest, session->session_id(),
                     jsonrpc::error(id, jsonrpc::INVALID_REQUEST, "Invalid Request")};
    }
    catch (const InvalidSessionError& e)
    {
        spdlog::debug("rejecting POST: {}", e.what());
        return invalid_session_reply();
    }
    catch (const SessionLimitError& e)
    {
        spdlog::warn("rejecting initialize: {}", e.what());
        return Reply{ReplyStatus::Unavailable, "",
                     jsonrpc::error(id, jsonrpc::SERVER_ERROR, e.what())};
    }
    catch (const std::exception& e)
    {
        spdlog::error("Error handling MCP request: {}", e.what());
        return internal_error_reply(id, has_session_id(session_id) ? *session_id : "");
    }
}

Reply Dispatcher::initialize(const Json& message)
{
    auto stream = std::make_shared<transport::EventStreamTransport>(options_.max_queue_size);

    // Registered under its id before any response leaves, so no later request can
    // arrive for an id the table does not know yet.
    auto session = sessions_.create(stream);
    attach_close_hooks(session);

    try
    {
        const Json params = message.value("params", Json::object());
        if (!params.is_object())
            throw ValidationError("initialize params must be an object");

        Implementation client;
        if (params.contains("clientInfo"))
        {
            const Json& info = params["clientInfo"];
            if (!info.is_object())
                throw ValidationError("clientInfo must be an object");
            for (const char* key : {"name", "version"})
                if (info.contains(key) && !info[key].is_string())
                    throw ValidationError(std::string("clientInfo.") + key + " must be a string");
            client = info.get<Implementation>();
        }
        Json capabilities = params.value("capabilities", Json::object());
        if (!capabilities.is_object())
            throw ValidationError("capabilities must be an object");
        std::string requested = params.contains("protocolVersion") &&
                                        params["protocolVersion"].is_string()
                                    ? params["protocolVersion"].get<std::string>()
                                    : std::string();
        std::string negotiated = negotiate_protocol_version(requested);

        session->set_handshake(negotiated, client, std::move(capabilities));

        Json result = {
            {"protocolVersion", negotiated},
            {"capabilities",
             {{"tools", Json{{"listChanged", true}}}, {"logging", Json::object()}}},
            {"serverInfo", {{"name", options_.server_name}, {"version", options_.server_version}}},
        };

        // A DELETE may have closed the session before the handshake finished
        if (!session->activate())
            throw InvalidSessionError("session " + session->session_id() +
                                      " closed during initialize");
        spdlog::info("Session initialized with ID: {} (client {} {}, protocol {})",
                     session->session_id(), client.name, client.version, negotiated);

        return Reply{ReplyStatus::Ok, session->session_id(),
                     jsonrpc::result(message["id"], std::move(result))};
    }
    catch (const ValidationError& e)
    {
        spdlog::debug("rejecting initialize: {}", e.what());
        stream->close();
        return Reply{ReplyStatus::BadRequest, "",
                     jsonrpc::error(message["id"], jsonrpc::INVALID_PARAMS, e.what())};
    }
    catch (const InvalidSessionError& e)
    {
        spdlog::info("initialize abandoned: {}", e.what());
        stream->close();
        throw;
    }
    catch (const std::exception& e)
    {
        spdlog::error("initialize failed for session {}: {}", session->session_id(), e.what());
        stream->close();
        throw;
    }
}

Json Dispatcher::handle_request(const std::shared_ptr<Session>& session, const Json& message,
                                const std::shared_ptr<transport::Transport>& response_stream)
{
    const Json& id = message["id"];
    const Json params = message.value("params", Json::object());
    const std::string method = message["method"].is_string() ? message["method"].get<std::string>()
                                                             : std::string();
    try
    {
        if (method == "initialize")
            return jsonrpc::error(id, jsonrpc::INVALID_REQUEST,
                                  "Invalid Request: Server already initialized");

        if (method == "ping")
            return jsonrpc::result(id, Json::object());

        if (method == "tools/list")
        {
            return jsonrpc::result(id, registry_.snapshot()->to_list_result());
        }

        if (method == "tools/call")
            return call_tool(session, id, params, response_stream);

        if (method == "logging/setLevel")
            return set_log_level(*session, id, params);

        return jsonrpc::error(id, jsonrpc::METHOD_NOT_FOUND, "Method not found: " + method);
    }
    catch (const ValidationError& e)
    {
        spdlog::debug("session {} {} invalid params: {}", session->session_id(), method, e.what());
        return jsonrpc::error(id, jsonrpc::INVALID_PARAMS, e.what());
    }
    catch (const NotFoundError& e)
    {
        spdlog::debug("session {} {} not found: {}", session->session_id(), method, e.what());
        return jsonrpc::error(id, jsonrpc::METHOD_NOT_FOUND, e.what());
    }
    catch (const DeliveryFailedError& e)
    {
        spdlog::warn("session {} {} aborted, caller unreachable: {}", session->session_id(),
                     method, e.what());
        return jsonrpc::error(id, jsonrpc::INTERNAL_ERROR, INTERNAL_ERROR_MESSAGE);
    }
}

void Dispatcher::handle_notification(Session& session, const Json& message)
{
    const std::string method = message["method"].is_string() ? message["method"].get<std::string>()
                                                             : std::string();
    if (method == "notifications/initialized")
    {
        session.mark_client_initialized();
        spdlog::debug("session {} client initialized", session.session_id());
        return;
    }
    if (method == "notifications/cancelled")
    {
        // Tool calls only stop when the transport closes
        spdlog::debug("session {} cancel request ignored: {}", session.session_id(),
                      message.value("params", Json::object()).dump());
        return;
    }
    spdlog::debug("session {} unhandled notification {}", session.session_id(), method);
}

Json Dispatcher::call_tool(const std::shared_ptr<Session>& session, const Json& id,
                           const Json& params,
                           const std::shared_ptr<transport::Transport>& response_stream)
{
    if (!params.is_object() || !params.contains("arguments") || params["arguments"].is_null())
        throw MissingArgumentError("arguments undefined");
    if (!params.contains("name") || !params["name"].is_string() ||
        params["name"].get<std::string>().empty())
        throw MissingArgumentError("tool name undefined");

    const std::string tool_name = params["name"].get<std::string>();

    // The snapshot keeps the tool alive even if the registry rotates mid-call
    auto snapshot = registry_.snapshot();
    const tools::Tool* tool = snapshot->find(tool_name);
    if (!tool)
        throw UnknownToolError("Tool not found: " + tool_name);

    auto call_lock = session->begin_call();

    std::optional<Session::RequestStreamBinding> binding;
    if (response_stream)
        binding.emplace(session->bind_request_stream(id, response_stream));

    spdlog::info("session {} calling tool {}", session->session_id(), tool_name);

    PendingCall call(session, tool_name, id, broadcaster_);
    std::weak_ptr<Session> weak = session;
    Context ctx(
        session->session_id(), id, session->log_level(),
        [&call](const Json& notification) { call.notify(notification); },
        [weak](std::chrono::milliseconds delay)
        {
            auto s = weak.lock();
            return s && s->wait_open_for(delay);
        });

    Json result = tool->invoke(params["arguments"], ctx);

    spdlog::debug("session {} tool {} finished after {} notification(s)", session->session_id(),
                  tool_name, call.sent().size());
    return jsonrpc::result(id, std::move(result));
}

Json Dispatcher::set_log_level(Session& session, const Json& id, const Json& params)
{
    if (!params.contains("level") || !params["level"].is_string())
        throw ValidationError("level undefined");
    auto level = log_level_from_string(params["level"].get<std::string>());
    if (!level)
        throw ValidationError("unknown log level: " + params["level"].get<std::string>());

    session.set_log_level(*level);
    spdlog::debug("session {} log level set to {}", session.session_id(), to_string(*level));
    return jsonrpc::result(id, Json::object());
}

// ============================================================================
// GET / DELETE
// ============================================================================

Reply Dispatcher::check_subscribe(const std::optional<std::string>& session_id) const
{
    Reply reply = check_session(session_id);
    if (reply.status != ReplyStatus::Ok)
        return reply;

    auto session = sessions_.lookup(reply.session_id);
    if (session && session->transport()->has_subscriber())
        return Reply{ReplyStatus::Conflict, reply.session_id,
                     jsonrpc::error(Json(), jsonrpc::SERVER_ERROR,
                                    "Conflict: Only one SSE stream is allowed per session")};
    return reply;
}

Reply Dispatcher::handle_subscribe(const std::optional<std::string>& session_id,
                                   const StreamWriter& writer)
{
    std::shared_ptr<Session> session;
    try
    {
        session = resolve(session_id);
    }
    catch (const InvalidSessionError& e)
    {
        spdlog::debug("rejecting GET: {}", e.what());
        return invalid_session_reply();
    }

    spdlog::info("Establishing SSE stream for session {}", session->session_id());
    try
    {
        session->transport()->stream(writer, options_.heartbeat_interval);
    }
    catch (const StreamConflictError& e)
    {
        spdlog::warn("session {}: {}", session->session_id(), e.what());
        return Reply{ReplyStatus::Conflict, session->session_id(),
                     jsonrpc::error(Json(), jsonrpc::SERVER_ERROR,
                                    "Conflict: Only one SSE stream is allowed per session")};
    }
    spdlog::info("SSE stream for session {} ended", session->session_id());
    return Reply{ReplyStatus::Ok, session->session_id(), Json()};
}

Reply Dispatcher::handle_delete(const std::optional<std::string>& session_id)
{
    if (has_session_id(session_id))
    {
        if (auto session = sessions_.lookup(*session_id))
        {
            spdlog::info("Received session termination request for session {}", *session_id);
            session->transport()->close();
            return Reply{ReplyStatus::Ok, "", Json()};
        }
        if (sessions_.was_removed(*session_id))
        {
            spdlog::debug("session {} already terminated", *session_id);
            return Reply{ReplyStatus::Ok, "", Json()};
        }
    }
    spdlog::debug("rejecting DELETE: invalid or missing session id");
    return invalid_session_reply();
}

// ============================================================================
// Lifecycle
// ============================================================================

void Dispatcher::attach_close_hooks(const std::shared_ptr<Session>& session)
{
    std::weak_ptr<Session> weak = session;
    const auto& stream = session->transport();
    session->hold(stream->on_close([this, weak]() { on_transport_closed(weak, "closed"); }));
    session->hold(stream->on_error([this, weak](const std::string& reason)
                                   { on_transport_closed(weak, reason); }));
    // Closed before the hooks were in place; nothing else will report it
    if (stream->closed())
        on_transport_closed(weak, "closed");
}

void Dispatcher::on_transport_closed(const std::weak_ptr<Session>& weak, const std::string& reason)
{
    auto session = weak.lock();
    if (!session)
        return;
    if (!session->mark_closed())
        return;
    sessions_.remove(session->session_id());
    spdlog::info("Transport {} for session {}, removed from session table", reason,
                 session->session_id());
}

void Dispatcher::close_all()
{
    auto live = sessions_.snapshot();
    if (live.empty())
        return;
    spdlog::info("closing {} session(s)", live.size());
    for (const auto& session : live)
        session->transport()->close();

    // Sessions whose close hook did not run (still Initializing) are dropped here
    for (const auto& session : sessions_.clear())
        session->mark_closed();
}

} // namespace greetmcp::server
