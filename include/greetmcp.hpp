#pragma once

/// @file greetmcp.hpp
/// @brief Main header for greetmcp - includes the server components
///
/// Usage:
/// @code
/// #include <greetmcp.hpp>
///
/// int main() {
///     greetmcp::Settings settings = greetmcp::Settings::from_env();
///     greetmcp::init_logging(settings);
///     greetmcp::App app(settings);
///     app.start();
///     // ...
///     app.stop();
/// }
/// @endcode

// Core types and exceptions
#include "greetmcp/types.hpp"
#include "greetmcp/exceptions.hpp"
#include "greetmcp/settings.hpp"
#include "greetmcp/logging.hpp"

// Tools
#include "greetmcp/tools/tool.hpp"
#include "greetmcp/tools/registry.hpp"
#include "greetmcp/tools/greetings.hpp"

// Transports
#include "greetmcp/transport/transport.hpp"
#include "greetmcp/transport/event_stream_transport.hpp"
#include "greetmcp/transport/stream_writer_transport.hpp"

// Server
#include "greetmcp/server/context.hpp"
#include "greetmcp/server/session.hpp"
#include "greetmcp/server/session_table.hpp"
#include "greetmcp/server/broadcaster.hpp"
#include "greetmcp/server/dispatcher.hpp"
#include "greetmcp/server/registry_rotator.hpp"
#include "greetmcp/server/streamable_http_server.hpp"

// Application
#include "greetmcp/app.hpp"
