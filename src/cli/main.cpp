#include "greetmcp/app.hpp"
#include "greetmcp/exceptions.hpp"
#include "greetmcp/logging.hpp"
#include "greetmcp/settings.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace
{

std::atomic<bool> g_stop_requested{false};

void on_signal(int)
{
    g_stop_requested = true;
}

static int usage(int exit_code = 1)
{
    std::cout << "greetmcp - greeting MCP server over Streamable HTTP\n";
    std::cout << "Usage:\n";
    std::cout << "  greetmcp [options]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --config <path>                JSON configuration file\n";
    std::cout << "  --host <addr>                  Bind address (default 0.0.0.0)\n";
    std::cout << "  --port <n>                     Listen port (default 3000)\n";
    std::cout << "  --mcp-path <path>              MCP endpoint path (default /mcp)\n";
    std::cout << "  --log-level <level>            TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL, OFF\n";
    std::cout << "  --rotation-interval-ms <n>     Tool rotation period (default 5000)\n";
    std::cout << "  --help                         Show this help\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  GREETMCP_* variables override the configuration file; flags override both.\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] != flag)
            continue;
        if (i + 1 >= args.size())
            throw greetmcp::ConfigError(flag + " requires a value");
        std::string value = args[i + 1];
        args.erase(args.begin() + static_cast<long long>(i),
                   args.begin() + static_cast<long long>(i) + 2);
        return value;
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static int parse_int(const std::string& flag, const std::string& s)
{
    size_t pos = 0;
    int v = 0;
    try
    {
        v = std::stoi(s, &pos, 10);
    }
    catch (const std::logic_error&)
    {
        throw greetmcp::ConfigError(flag + ": not an integer: " + s);
    }
    if (pos != s.size())
        throw greetmcp::ConfigError(flag + ": not an integer: " + s);
    return v;
}

/// defaults < config file < environment < flags
static greetmcp::Settings load_settings(std::vector<std::string>& args)
{
    greetmcp::Settings settings;
    if (auto path = consume_flag_value(args, "--config"))
        settings = greetmcp::Settings::from_file(*path, settings);
    settings = greetmcp::Settings::from_env(settings);

    if (auto host = consume_flag_value(args, "--host"))
        settings.host = *host;
    if (auto port = consume_flag_value(args, "--port"))
        settings.port = parse_int("--port", *port);
    if (auto path = consume_flag_value(args, "--mcp-path"))
        settings.mcp_path = *path;
    if (auto level = consume_flag_value(args, "--log-level"))
        settings.log_level = *level;
    if (auto interval = consume_flag_value(args, "--rotation-interval-ms"))
        settings.rotation_interval_ms = parse_int("--rotation-interval-ms", *interval);

    if (!args.empty())
        throw greetmcp::ConfigError("unknown argument: " + args.front());

    settings.validate();
    return settings;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    if (consume_flag(args, "--help") || consume_flag(args, "-h"))
        return usage(0);

    greetmcp::Settings settings;
    try
    {
        settings = load_settings(args);
        greetmcp::init_logging(settings);
    }
    catch (const greetmcp::ConfigError& e)
    {
        std::cerr << "greetmcp: " << e.what() << "\n";
        return usage(2);
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try
    {
        greetmcp::App app(settings);
        app.start();

        while (!g_stop_requested && app.running())
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

        spdlog::info("Shutting down server...");
        app.stop();
    }
    catch (const std::exception& e)
    {
        spdlog::critical("fatal: {}", e.what());
        return 1;
    }
    return 0;
}
