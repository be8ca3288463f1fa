#pragma once
#include "greetmcp/types.hpp"

#include <functional>
#include <string>

namespace greetmcp::server
{
class Context;
}

namespace greetmcp::tools
{

/// An invocable tool: name, human description, JSON input schema and the callable.
///
/// The callable receives the call's `arguments` object and the invocation Context,
/// through which a multi-step tool pushes interim notifications to its caller.
/// It returns the CallToolResult object (`{"content": [...]}`).
class Tool
{
  public:
    using Fn = std::function<Json(const Json&, server::Context&)>;

    Tool(std::string name, std::string description, Json input_schema, Fn fn)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), fn_(std::move(fn))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const Json& input_schema() const
    {
        return input_schema_;
    }
    Json invoke(const Json& input, server::Context& ctx) const
    {
        return fn_(input, ctx);
    }

    /// `{name, description, inputSchema}` entry of a tools/list result
    Json descriptor() const
    {
        return Json{{"name", name_}, {"description", description_}, {"inputSchema", input_schema_}};
    }

  private:
    std::string name_;
    std::string description_;
    Json input_schema_;
    Fn fn_;
};

} // namespace greetmcp::tools
