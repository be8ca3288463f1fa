#pragma once
#include "greetmcp/server/broadcaster.hpp"
#include "greetmcp/tools/registry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace greetmcp::server
{

/**
 * Periodically replaces the registry's tool set and tells every session about it.
 *
 * Each tick builds a fresh tool set with the factory, installs it, then sends
 * notifications/tools/list_changed to each live session once for the new version.
 * A factory or replace() failure is logged and the previous tool set stays.
 *
 * Usage:
 *   RegistryRotator rotator(registry, broadcaster, factory, std::chrono::seconds(5));
 *   rotator.start();  // background thread
 *   rotator.stop();   // wakes and joins it
 */
class RegistryRotator
{
  public:
    using Factory = std::function<std::vector<tools::Tool>()>;

    RegistryRotator(tools::ToolRegistry& registry, const NotificationBroadcaster& broadcaster,
                    Factory factory, std::chrono::milliseconds interval);

    ~RegistryRotator();

    RegistryRotator(const RegistryRotator&) = delete;
    RegistryRotator& operator=(const RegistryRotator&) = delete;

    /// Returns false if already running.
    bool start();

    /// Safe to call multiple times.
    void stop();

    bool running() const
    {
        return running_.load();
    }

    /// Rotate once on the calling thread. Returns the new registry version.
    uint64_t rotate_now();

    std::chrono::milliseconds interval() const
    {
        return interval_;
    }

  private:
    void run();

    tools::ToolRegistry& registry_;
    const NotificationBroadcaster& broadcaster_;
    Factory factory_;
    std::chrono::milliseconds interval_;

    std::mutex rotate_m_;

    std::mutex m_;
    std::condition_variable cv_;
    bool stop_requested_{false};
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace greetmcp::server
