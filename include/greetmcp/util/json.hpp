#pragma once
#include "greetmcp/types.hpp"

#include <string>

namespace greetmcp::util::json
{

inline Json parse(const std::string& s)
{
    return Json::parse(s);
}

} // namespace greetmcp::util::json

namespace greetmcp::jsonrpc
{

// Standard JSON-RPC 2.0 error codes plus the generic application error code
inline constexpr int PARSE_ERROR = -32700;
inline constexpr int INVALID_REQUEST = -32600;
inline constexpr int METHOD_NOT_FOUND = -32601;
inline constexpr int INVALID_PARAMS = -32602;
inline constexpr int INTERNAL_ERROR = -32603;
inline constexpr int SERVER_ERROR = -32000;

inline Json result(const Json& id, Json result)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

inline Json error(const Json& id, int code, const std::string& message)
{
    return Json{{"jsonrpc", "2.0"},
                {"id", id.is_null() ? Json() : id},
                {"error", Json{{"code", code}, {"message", message}}}};
}

inline Json notification(const std::string& method, const Json& params = Json())
{
    Json msg = {{"jsonrpc", "2.0"}, {"method", method}};
    if (!params.is_null())
        msg["params"] = params;
    return msg;
}

/// Request: has id and method
inline bool is_request(const Json& msg)
{
    return msg.is_object() && msg.contains("id") && msg.contains("method");
}

/// Notification: has method, no id
inline bool is_notification(const Json& msg)
{
    return msg.is_object() && msg.contains("method") && !msg.contains("id");
}

/// Response: has id, no method
inline bool is_response(const Json& msg)
{
    return msg.is_object() && msg.contains("id") && !msg.contains("method");
}

inline bool is_initialize_request(const Json& msg)
{
    return is_request(msg) && msg["method"].is_string() &&
           msg["method"].get<std::string>() == "initialize";
}

inline Json id_of(const Json& msg)
{
    if (msg.is_object() && msg.contains("id"))
        return msg["id"];
    return Json();
}

} // namespace greetmcp::jsonrpc
