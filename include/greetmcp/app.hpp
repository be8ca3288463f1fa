#pragma once
#include "greetmcp/server/broadcaster.hpp"
#include "greetmcp/server/dispatcher.hpp"
#include "greetmcp/server/registry_rotator.hpp"
#include "greetmcp/server/session_table.hpp"
#include "greetmcp/server/streamable_http_server.hpp"
#include "greetmcp/settings.hpp"
#include "greetmcp/tools/registry.hpp"

#include <memory>

namespace greetmcp
{

/**
 * The greeting MCP server, fully wired.
 *
 * Owns the tool registry, session table, broadcaster, dispatcher, rotator and HTTP
 * front end built from one Settings value.
 *
 * Usage:
 *   App app(Settings::from_env());
 *   app.start();   // HTTP server and rotator run in background threads
 *   // ...
 *   app.stop();
 */
class App
{
  public:
    explicit App(Settings settings);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Start the HTTP server, then the rotator. Throws TransportError if the port is taken.
    void start();

    /// Stop rotating, close every session, then stop the HTTP server. Idempotent.
    void stop();

    bool running() const;

    /// Bound HTTP port (useful when Settings::port is 0).
    int port() const
    {
        return http_.port();
    }

    const Settings& settings() const
    {
        return settings_;
    }
    tools::ToolRegistry& registry()
    {
        return registry_;
    }
    server::SessionTable& sessions()
    {
        return sessions_;
    }
    server::RegistryRotator& rotator()
    {
        return rotator_;
    }
    server::Dispatcher& dispatcher()
    {
        return dispatcher_;
    }

  private:
    static server::Dispatcher::Options dispatcher_options(const Settings& settings);
    static server::StreamableHttpServer::Options http_options(const Settings& settings);

    Settings settings_;
    tools::ToolRegistry registry_;
    server::SessionTable sessions_;
    server::NotificationBroadcaster broadcaster_;
    server::Dispatcher dispatcher_;
    server::RegistryRotator rotator_;
    server::StreamableHttpServer http_;
};

} // namespace greetmcp
