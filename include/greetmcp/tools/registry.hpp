#pragma once
#include "greetmcp/tools/tool.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace greetmcp::tools
{

/// Immutable view of the tool set at one registry version.
class ToolSnapshot
{
  public:
    ToolSnapshot(uint64_t version, std::vector<Tool> tools)
        : version_(version), tools_(std::move(tools))
    {
    }

    uint64_t version() const
    {
        return version_;
    }
    const std::vector<Tool>& tools() const
    {
        return tools_;
    }

    /// Tool with the given name, or nullptr.
    const Tool* find(const std::string& name) const;

    std::vector<std::string> list_names() const;

    /// tools/list result body: `{"tools": [{name, description, inputSchema}, ...]}`
    Json to_list_result() const;

  private:
    uint64_t version_;
    std::vector<Tool> tools_;
};

/**
 * Versioned, atomically replaceable tool set.
 *
 * Readers take a shared_ptr to the current immutable snapshot and keep using it for
 * as long as they need, so a reader never observes a partially replaced list.
 * replace() only holds the lock for the pointer swap.
 *
 * Thread-safe.
 */
class ToolRegistry
{
  public:
    /// Starts at version 0 with an empty tool set.
    ToolRegistry();
    explicit ToolRegistry(std::vector<Tool> initial);

    std::shared_ptr<const ToolSnapshot> snapshot() const;

    uint64_t version() const;

    /// Install `tools` as the new snapshot. Throws ValidationError on duplicate names.
    /// @return the new version
    uint64_t replace(std::vector<Tool> tools);

  private:
    static void check_unique_names(const std::vector<Tool>& tools);

    mutable std::mutex mutex_;
    std::shared_ptr<const ToolSnapshot> current_;
};

} // namespace greetmcp::tools
