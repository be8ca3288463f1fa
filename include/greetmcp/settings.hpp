#pragma once
#include "greetmcp/types.hpp"

#include <cstddef>
#include <string>

namespace greetmcp
{

struct Settings
{
    Settings() noexcept;

    std::string log_level{"INFO"};

    // HTTP endpoint
    std::string host{"0.0.0.0"};
    int port{3000};
    std::string mcp_path{"/mcp"};
    int worker_threads{8};
    size_t payload_max_bytes{10 * 1024 * 1024};
    int read_timeout_s{30};
    int write_timeout_s{30};

    // Server identity reported in initialize
    std::string server_name{"arjun-mcp-server"};
    std::string server_version{"1.0.0"};

    // Sessions and streams
    size_t max_sessions{1000};
    size_t max_queue_size{1000};
    int heartbeat_interval_ms{15000};

    // Tools
    int rotation_interval_ms{5000};
    int greet_step_delay_ms{1000};

    /// Overlay GREETMCP_* environment variables onto `base`.
    static Settings from_env(Settings base = Settings{});
    /// Overlay keys present in `j` onto `base`.
    static Settings from_json(const Json& j, Settings base = Settings{});
    /// Read a JSON config file. Throws ConfigError if unreadable or malformed.
    static Settings from_file(const std::string& path, Settings base = Settings{});

    /// Throws ConfigError on out-of-range values.
    void validate() const;
};

inline Settings::Settings() noexcept = default;

} // namespace greetmcp
