#include "greetmcp/server/streamable_http_server.hpp"

#include "greetmcp/exceptions.hpp"
#include "greetmcp/transport/stream_writer_transport.hpp"
#include "greetmcp/util/json.hpp"

#include <chrono>
#include <spdlog/spdlog.h>

namespace greetmcp::server
{

StreamableHttpServer::StreamableHttpServer(Dispatcher& dispatcher, Options options)
    : dispatcher_(dispatcher), options_(std::move(options)), port_(options_.port)
{
}

StreamableHttpServer::~StreamableHttpServer()
{
    stop();
}

std::optional<std::string> StreamableHttpServer::session_id_of(const httplib::Request& req)
{
    if (!req.has_header(SESSION_ID_HEADER))
        return std::nullopt;
    return req.get_header_value(SESSION_ID_HEADER);
}

bool StreamableHttpServer::accepts_event_stream(const httplib::Request& req)
{
    return req.get_header_value("Accept").find("text/event-stream") != std::string::npos;
}

int StreamableHttpServer::http_status(ReplyStatus status)
{
    switch (status)
    {
    case ReplyStatus::Ok:
        return 200;
    case ReplyStatus::Accepted:
        return 202;
    case ReplyStatus::BadRequest:
        return 400;
    case ReplyStatus::Conflict:
        return 409;
    case ReplyStatus::Unavailable:
        return 503;
    case ReplyStatus::InternalError:
        return 500;
    }
    return 500;
}

void StreamableHttpServer::write_reply(httplib::Response& res, const Reply& reply)
{
    res.status = http_status(reply.status);
    if (!reply.session_id.empty())
        res.set_header(SESSION_ID_HEADER, reply.session_id);
    if (!reply.body.is_null())
        res.set_content(reply.body.dump(), "application/json");
}

void StreamableHttpServer::set_stream_headers(httplib::Response& res)
{
    // Note: Don't set Transfer-Encoding manually - set_chunked_content_provider handles it
    res.set_header("Cache-Control", "no-cache, no-transform");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");
}

// ============================================================================
// Verbs
// ============================================================================

void StreamableHttpServer::handle_post(const httplib::Request& req, httplib::Response& res)
{
    Json message;
    try
    {
        message = util::json::parse(req.body);
    }
    catch (const Json::parse_error& e)
    {
        spdlog::debug("rejecting POST with malformed body: {}", e.what());
        res.status = 400;
        res.set_content(jsonrpc::error(Json(), jsonrpc::PARSE_ERROR, "Parse error").dump(),
                        "application/json");
        return;
    }

    auto session_id = session_id_of(req);

    if (!Dispatcher::may_stream(message) || !accepts_event_stream(req))
    {
        write_reply(res, dispatcher_.handle_post(message, session_id));
        return;
    }

    // Session errors must be reported before the 200 of the stream is committed
    Reply check = dispatcher_.check_session(session_id);
    if (check.status != ReplyStatus::Ok)
    {
        write_reply(res, check);
        return;
    }

    res.status = 200;
    res.set_header(SESSION_ID_HEADER, check.session_id);
    set_stream_headers(res);
    res.set_chunked_content_provider(
        "text/event-stream",
        [this, message, session_id](size_t /*offset*/, httplib::DataSink& sink)
        {
            auto stream = std::make_shared<transport::StreamWriterTransport>(
                [&sink](const std::string& frame)
                { return sink.write(frame.data(), frame.size()); });

            Reply reply = dispatcher_.handle_post(message, session_id, stream);
            try
            {
                if (!reply.body.is_null())
                    stream->send(reply.body);
            }
            catch (const DeliveryFailedError& e)
            {
                spdlog::warn("response for session {} not delivered: {}", *session_id,
                             e.what());
                stream->close();
                return false;
            }
            stream->close();
            sink.done();
            return true;
        });
}

void StreamableHttpServer::handle_get(const httplib::Request& req, httplib::Response& res)
{
    auto session_id = session_id_of(req);

    Reply check = dispatcher_.check_subscribe(session_id);
    if (check.status != ReplyStatus::Ok)
    {
        write_reply(res, check);
        return;
    }

    res.status = 200;
    res.set_header(SESSION_ID_HEADER, check.session_id);
    set_stream_headers(res);
    res.set_chunked_content_provider(
        "text/event-stream",
        [this, session_id](size_t /*offset*/, httplib::DataSink& sink)
        {
            bool connected = true;
            dispatcher_.handle_subscribe(session_id,
                                         [&sink, &connected](const std::string& frame)
                                         {
                                             connected = sink.write(frame.data(), frame.size());
                                             return connected;
                                         });
            if (!connected)
                return false; // client went away
            sink.done();
            return true;
        });
}

void StreamableHttpServer::handle_delete(const httplib::Request& req, httplib::Response& res)
{
    write_reply(res, dispatcher_.handle_delete(session_id_of(req)));
}

// ============================================================================
// Lifecycle
// ============================================================================

void StreamableHttpServer::install_routes()
{
    svr_->Post(options_.mcp_path, [this](const httplib::Request& req, httplib::Response& res)
               { handle_post(req, res); });
    svr_->Get(options_.mcp_path, [this](const httplib::Request& req, httplib::Response& res)
              { handle_get(req, res); });
    svr_->Delete(options_.mcp_path, [this](const httplib::Request& req, httplib::Response& res)
                 { handle_delete(req, res); });
}

bool StreamableHttpServer::start()
{
    if (running_)
        return false;

    svr_ = std::make_unique<httplib::Server>();

    // Security: payload and timeout limits to prevent DoS
    svr_->set_payload_max_length(options_.payload_max_bytes);
    svr_->set_read_timeout(options_.read_timeout_s, 0);
    svr_->set_write_timeout(options_.write_timeout_s, 0);

    // Each open GET or streamed POST occupies one worker for its whole lifetime
    const size_t workers = static_cast<size_t>(options_.worker_threads);
    svr_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

    install_routes();

    if (options_.port == 0)
    {
        port_ = svr_->bind_to_any_port(options_.host);
        if (port_ < 0)
            throw TransportError("cannot bind " + options_.host + " to any port");
    }
    else if (!svr_->bind_to_port(options_.host, options_.port))
    {
        throw TransportError("cannot bind " + options_.host + ":" +
                             std::to_string(options_.port));
    }

    running_ = true;
    thread_ = std::thread(
        [this]()
        {
            svr_->listen_after_bind();
            running_ = false;
        });

    // Wait until the accept loop is up so callers can connect right away
    for (int attempt = 0; attempt < 200 && running_ && !svr_->is_running(); ++attempt)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

    spdlog::info("MCP Streamable HTTP Server listening on http://{}:{}{}", options_.host, port_,
                 options_.mcp_path);
    return true;
}

void StreamableHttpServer::stop()
{
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
    running_ = false;
}

} // namespace greetmcp::server
