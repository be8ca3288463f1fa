#pragma once
#include <string>

namespace greetmcp::util
{

/// 128-bit random identifier as 32 lowercase hex characters.
std::string generate_session_id();

/// Random RFC 4122 version 4 UUID string (8-4-4-4-12 hex groups).
std::string generate_uuid();

} // namespace greetmcp::util
