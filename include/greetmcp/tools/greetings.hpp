#pragma once
#include "greetmcp/tools/tool.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace greetmcp::tools
{

/// Wire name of the multi-step greeting tool. Existing clients call it by this spelling.
inline constexpr const char* MULTI_GREET_TOOL_NAME = "multi-great";

/// Prefix of the single-response greeting tool; a fresh suffix is added per rotation.
inline constexpr const char* SINGLE_GREET_TOOL_PREFIX = "single-greeting-";

/// `single-greeting-<uuid>`
std::string next_single_greet_name();

/// Returns "Hey <name>! Welcome to itsuki's world!" as one text content item.
/// Throws MissingArgumentError if `name` is absent.
Tool make_single_greet_tool(std::string tool_name);

/// Sends "First greet to <name>" and "Second greet to <name>" as info log
/// notifications, each followed by `step_delay`, then returns "Hope you enjoy your day!".
Tool make_multi_greet_tool(std::chrono::milliseconds step_delay);

/// The full tool set published by one registry rotation.
std::vector<Tool> make_greeting_tools(std::string single_greet_name,
                                      std::chrono::milliseconds step_delay);

} // namespace greetmcp::tools
