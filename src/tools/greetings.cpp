#include "greetmcp/tools/greetings.hpp"

#include "greetmcp/exceptions.hpp"
#include "greetmcp/server/context.hpp"
#include "greetmcp/util/ids.hpp"

namespace greetmcp::tools
{

namespace
{
Json name_schema()
{
    return Json{{"type", "object"},
                {"properties",
                 {{"name", {{"type", "string"}, {"description", "name to greet"}}}}},
                {"required", Json::array({"name"})}};
}

std::string require_name(const Json& args)
{
    if (!args.is_object() || !args.contains("name") || args["name"].is_null())
        throw MissingArgumentError("Name to greet undefined.");
    const auto& name = args["name"];
    if (name.is_string())
        return name.get<std::string>();
    return name.dump();
}

Json text_result(const std::string& text)
{
    return Json{{"content", Json::array({Json{{"type", "text"}, {"text", text}}})}};
}
} // namespace

std::string next_single_greet_name()
{
    return SINGLE_GREET_TOOL_PREFIX + util::generate_uuid();
}

Tool make_single_greet_tool(std::string tool_name)
{
    return Tool(std::move(tool_name), "Greet the user once.", name_schema(),
                [](const Json& args, server::Context&)
                { return text_result("Hey " + require_name(args) + "! Welcome to itsuki's world!"); });
}

Tool make_multi_greet_tool(std::chrono::milliseconds step_delay)
{
    return Tool(MULTI_GREET_TOOL_NAME, "Greet the user multiple times with delay in between.",
                name_schema(),
                [step_delay](const Json& args, server::Context& ctx)
                {
                    const std::string name = require_name(args);

                    ctx.info("First greet to " + name);
                    ctx.pace(step_delay);

                    ctx.info("Second greet to " + name);
                    ctx.pace(step_delay);

                    return text_result("Hope you enjoy your day!");
                });
}

std::vector<Tool> make_greeting_tools(std::string single_greet_name,
                                      std::chrono::milliseconds step_delay)
{
    std::vector<Tool> tools;
    tools.push_back(make_single_greet_tool(std::move(single_greet_name)));
    tools.push_back(make_multi_greet_tool(step_delay));
    return tools;
}

} // namespace greetmcp::tools
