#include "greetmcp/app.hpp"

#include "greetmcp/tools/greetings.hpp"

#include <spdlog/spdlog.h>

namespace greetmcp
{

namespace
{
Settings validated(Settings settings)
{
    settings.validate();
    return settings;
}

std::vector<tools::Tool> next_tool_set(std::chrono::milliseconds step_delay)
{
    return tools::make_greeting_tools(tools::next_single_greet_name(), step_delay);
}
} // namespace

server::Dispatcher::Options App::dispatcher_options(const Settings& settings)
{
    server::Dispatcher::Options opts;
    opts.server_name = settings.server_name;
    opts.server_version = settings.server_version;
    opts.max_queue_size = settings.max_queue_size;
    opts.heartbeat_interval = std::chrono::milliseconds(settings.heartbeat_interval_ms);
    return opts;
}

server::StreamableHttpServer::Options App::http_options(const Settings& settings)
{
    server::StreamableHttpServer::Options opts;
    opts.host = settings.host;
    opts.port = settings.port;
    opts.mcp_path = settings.mcp_path;
    opts.worker_threads = settings.worker_threads;
    opts.payload_max_bytes = settings.payload_max_bytes;
    opts.read_timeout_s = settings.read_timeout_s;
    opts.write_timeout_s = settings.write_timeout_s;
    return opts;
}

App::App(Settings settings)
    : settings_(validated(std::move(settings))),
      registry_(next_tool_set(std::chrono::milliseconds(settings_.greet_step_delay_ms))),
      sessions_(settings_.max_sessions), broadcaster_(sessions_),
      dispatcher_(sessions_, registry_, broadcaster_, dispatcher_options(settings_)),
      rotator_(registry_, broadcaster_,
               [delay = std::chrono::milliseconds(settings_.greet_step_delay_ms)]()
               { return next_tool_set(delay); },
               std::chrono::milliseconds(settings_.rotation_interval_ms)),
      http_(dispatcher_, http_options(settings_))
{
}

App::~App()
{
    stop();
}

void App::start()
{
    http_.start();
    rotator_.start();
    spdlog::info("{} {} ready", settings_.server_name, settings_.server_version);
}

void App::stop()
{
    rotator_.stop();
    // Closing the sessions ends their open GET streams so the HTTP workers can drain
    dispatcher_.close_all();
    http_.stop();
}

bool App::running() const
{
    return http_.running();
}

} // namespace greetmcp
