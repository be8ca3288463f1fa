#pragma once
#include "greetmcp/server/dispatcher.hpp"
#include "greetmcp/types.hpp"

#include <atomic>
#include <httplib.h>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace greetmcp::server
{

/**
 * Streamable HTTP front end of the MCP endpoint.
 *
 * One path (default: /mcp), three verbs, session id in the Mcp-Session-Id header:
 * - POST: a JSON-RPC message. The reply is a JSON body, or, for tools/call from a
 *   client that accepts text/event-stream, an SSE stream carrying the call's
 *   interim notifications followed by its response.
 * - GET: the session's standalone SSE stream; stays open until the session ends
 *   or the client disconnects.
 * - DELETE: terminates the session.
 *
 * Usage:
 *   StreamableHttpServer server(dispatcher, options);
 *   server.start();  // Non-blocking - runs in background thread
 *   // ... server runs ...
 *   server.stop();   // Graceful shutdown
 *
 * Reference: https://spec.modelcontextprotocol.io/specification/2025-03-26/basic/transports/
 */
class StreamableHttpServer
{
  public:
    struct Options
    {
        std::string host{"0.0.0.0"};
        int port{3000};
        std::string mcp_path{"/mcp"};
        int worker_threads{8};
        size_t payload_max_bytes{10 * 1024 * 1024};
        int read_timeout_s{30};
        int write_timeout_s{30};
    };

    StreamableHttpServer(Dispatcher& dispatcher, Options options);

    ~StreamableHttpServer();

    StreamableHttpServer(const StreamableHttpServer&) = delete;
    StreamableHttpServer& operator=(const StreamableHttpServer&) = delete;

    /**
     * Bind and start serving in a background thread (non-blocking).
     *
     * @return false if already running
     * @throws TransportError if the address cannot be bound
     */
    bool start();

    /**
     * Stop the server and join the background thread.
     * Safe to call multiple times.
     */
    void stop();

    bool running() const
    {
        return running_.load();
    }

    /// The bound port (the OS-assigned one when Options::port is 0).
    int port() const
    {
        return port_;
    }

    const std::string& host() const
    {
        return options_.host;
    }

    const std::string& mcp_path() const
    {
        return options_.mcp_path;
    }

  private:
    void install_routes();
    void handle_post(const httplib::Request& req, httplib::Response& res);
    void handle_get(const httplib::Request& req, httplib::Response& res);
    void handle_delete(const httplib::Request& req, httplib::Response& res);

    static std::optional<std::string> session_id_of(const httplib::Request& req);
    static bool accepts_event_stream(const httplib::Request& req);
    static int http_status(ReplyStatus status);
    static void write_reply(httplib::Response& res, const Reply& reply);
    static void set_stream_headers(httplib::Response& res);

    Dispatcher& dispatcher_;
    Options options_;
    int port_;

    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace greetmcp::server
