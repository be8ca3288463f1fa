#include "greetmcp/settings.hpp"

#include "greetmcp/exceptions.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace greetmcp
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static int getenv_int(const char* key, int defv)
{
    const char* v = std::getenv(key);
    if (!v)
        return defv;
    try
    {
        size_t pos = 0;
        int parsed = std::stoi(v, &pos);
        if (pos != std::string(v).size())
            throw ConfigError(std::string(key) + ": not an integer: " + v);
        return parsed;
    }
    catch (const std::logic_error&)
    {
        throw ConfigError(std::string(key) + ": not an integer: " + v);
    }
}

Settings Settings::from_env(Settings base)
{
    Settings s = std::move(base);
    auto lvl = getenv_str("GREETMCP_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;
    s.host = getenv_str("GREETMCP_HOST", s.host);
    s.port = getenv_int("GREETMCP_PORT", s.port);
    s.mcp_path = getenv_str("GREETMCP_MCP_PATH", s.mcp_path);
    s.worker_threads = getenv_int("GREETMCP_WORKER_THREADS", s.worker_threads);
    s.server_name = getenv_str("GREETMCP_SERVER_NAME", s.server_name);
    s.max_sessions = static_cast<size_t>(
        getenv_int("GREETMCP_MAX_SESSIONS", static_cast<int>(s.max_sessions)));
    s.heartbeat_interval_ms = getenv_int("GREETMCP_HEARTBEAT_INTERVAL_MS", s.heartbeat_interval_ms);
    s.rotation_interval_ms = getenv_int("GREETMCP_ROTATION_INTERVAL_MS", s.rotation_interval_ms);
    s.greet_step_delay_ms = getenv_int("GREETMCP_GREET_STEP_DELAY_MS", s.greet_step_delay_ms);
    return s;
}

Settings Settings::from_json(const Json& j, Settings base)
{
    if (!j.is_object())
        throw ConfigError("configuration must be a JSON object");

    Settings s = std::move(base);
    try
    {
        if (j.contains("log_level"))
            s.log_level = j.at("log_level").get<std::string>();
        if (j.contains("host"))
            s.host = j.at("host").get<std::string>();
        if (j.contains("port"))
            s.port = j.at("port").get<int>();
        if (j.contains("mcp_path"))
            s.mcp_path = j.at("mcp_path").get<std::string>();
        if (j.contains("worker_threads"))
            s.worker_threads = j.at("worker_threads").get<int>();
        if (j.contains("payload_max_bytes"))
            s.payload_max_bytes = j.at("payload_max_bytes").get<size_t>();
        if (j.contains("read_timeout_s"))
            s.read_timeout_s = j.at("read_timeout_s").get<int>();
        if (j.contains("write_timeout_s"))
            s.write_timeout_s = j.at("write_timeout_s").get<int>();
        if (j.contains("server_name"))
            s.server_name = j.at("server_name").get<std::string>();
        if (j.contains("server_version"))
            s.server_version = j.at("server_version").get<std::string>();
        if (j.contains("max_sessions"))
            s.max_sessions = j.at("max_sessions").get<size_t>();
        if (j.contains("max_queue_size"))
            s.max_queue_size = j.at("max_queue_size").get<size_t>();
        if (j.contains("heartbeat_interval_ms"))
            s.heartbeat_interval_ms = j.at("heartbeat_interval_ms").get<int>();
        if (j.contains("rotation_interval_ms"))
            s.rotation_interval_ms = j.at("rotation_interval_ms").get<int>();
        if (j.contains("greet_step_delay_ms"))
            s.greet_step_delay_ms = j.at("greet_step_delay_ms").get<int>();
    }
    catch (const Json::exception& e)
    {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }
    return s;
}

Settings Settings::from_file(const std::string& path, Settings base)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigError("cannot open configuration file: " + path);

    std::stringstream buffer;
    buffer << in.rdbuf();
    Json j;
    try
    {
        j = Json::parse(buffer.str());
    }
    catch (const Json::parse_error& e)
    {
        throw ConfigError("malformed configuration file " + path + ": " + e.what());
    }
    return from_json(j, std::move(base));
}

void Settings::validate() const
{
    if (port < 0 || port > 65535)
        throw ConfigError("port out of range: " + std::to_string(port));
    if (mcp_path.empty() || mcp_path[0] != '/')
        throw ConfigError("mcp_path must start with '/': " + mcp_path);
    if (worker_threads < 1)
        throw ConfigError("worker_threads must be at least 1");
    if (max_sessions == 0)
        throw ConfigError("max_sessions must be at least 1");
    if (max_queue_size == 0)
        throw ConfigError("max_queue_size must be at least 1");
    if (rotation_interval_ms <= 0)
        throw ConfigError("rotation_interval_ms must be positive");
    if (greet_step_delay_ms < 0)
        throw ConfigError("greet_step_delay_ms must not be negative");
    if (heartbeat_interval_ms <= 0)
        throw ConfigError("heartbeat_interval_ms must be positive");
}

} // namespace greetmcp
