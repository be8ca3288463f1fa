#include "greetmcp/server/registry_rotator.hpp"

#include "greetmcp/exceptions.hpp"

#include <spdlog/spdlog.h>

namespace greetmcp::server
{

RegistryRotator::RegistryRotator(tools::ToolRegistry& registry,
                                 const NotificationBroadcaster& broadcaster, Factory factory,
                                 std::chrono::milliseconds interval)
    : registry_(registry), broadcaster_(broadcaster), factory_(std::move(factory)),
      interval_(interval)
{
    if (!factory_)
        throw ValidationError("registry rotator needs a tool factory");
    if (interval_.count() <= 0)
        throw ValidationError("registry rotation interval must be positive");
}

RegistryRotator::~RegistryRotator()
{
    stop();
}

bool RegistryRotator::start()
{
    if (running_.exchange(true))
        return false;

    {
        std::lock_guard<std::mutex> lock(m_);
        stop_requested_ = false;
    }
    thread_ = std::thread([this]() { run(); });
    spdlog::info("tool rotation every {} ms", interval_.count());
    return true;
}

void RegistryRotator::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable())
        thread_.join();
    running_ = false;
}

uint64_t RegistryRotator::rotate_now()
{
    // Concurrent rotations would interleave replace() and broadcast out of order
    std::lock_guard<std::mutex> lock(rotate_m_);

    uint64_t version = registry_.replace(factory_());
    auto snapshot = registry_.snapshot();
    if (snapshot->version() == version)
    {
        auto names = snapshot->list_names();
        std::string joined;
        for (const auto& name : names)
            joined += (joined.empty() ? "" : ", ") + name;
        spdlog::info("tool registry v{}: [{}]", version, joined);
    }

    broadcaster_.broadcast_tools_changed(version);
    return version;
}

void RegistryRotator::run()
{
    std::unique_lock<std::mutex> lock(m_);
    while (!stop_requested_)
    {
        if (cv_.wait_for(lock, interval_, [this]() { return stop_requested_; }))
            break;

        lock.unlock();
        try
        {
            rotate_now();
        }
        catch (const std::exception& e)
        {
            spdlog::error("tool rotation failed, keeping previous tool set: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace greetmcp::server
