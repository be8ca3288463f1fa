#include "greetmcp/tools/registry.hpp"

#include "greetmcp/exceptions.hpp"

#include <unordered_set>

namespace greetmcp::tools
{

const Tool* ToolSnapshot::find(const std::string& name) const
{
    for (const auto& tool : tools_)
        if (tool.name() == name)
            return &tool;
    return nullptr;
}

std::vector<std::string> ToolSnapshot::list_names() const
{
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& tool : tools_)
        names.push_back(tool.name());
    return names;
}

Json ToolSnapshot::to_list_result() const
{
    Json tools_array = Json::array();
    for (const auto& tool : tools_)
        tools_array.push_back(tool.descriptor());
    return Json{{"tools", tools_array}};
}

ToolRegistry::ToolRegistry()
    : current_(std::make_shared<const ToolSnapshot>(0, std::vector<Tool>{}))
{
}

ToolRegistry::ToolRegistry(std::vector<Tool> initial)
{
    check_unique_names(initial);
    current_ = std::make_shared<const ToolSnapshot>(1, std::move(initial));
}

std::shared_ptr<const ToolSnapshot> ToolRegistry::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

uint64_t ToolRegistry::version() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return current_->version();
}

uint64_t ToolRegistry::replace(std::vector<Tool> tools)
{
    check_unique_names(tools);

    // The old snapshot is released after the lock; readers may still hold it.
    std::shared_ptr<const ToolSnapshot> previous;
    uint64_t version = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        version = current_->version() + 1;
        auto next = std::make_shared<const ToolSnapshot>(version, std::move(tools));
        previous = std::move(current_);
        current_ = std::move(next);
    }
    return version;
}

void ToolRegistry::check_unique_names(const std::vector<Tool>& tools)
{
    std::unordered_set<std::string> seen;
    for (const auto& tool : tools)
        if (!seen.insert(tool.name()).second)
            throw ValidationError("duplicate tool name: " + tool.name());
}

} // namespace greetmcp::tools
