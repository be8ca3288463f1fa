#include "greetmcp/server/session_table.hpp"

#include "greetmcp/exceptions.hpp"
#include "greetmcp/util/ids.hpp"

#include <mutex>

namespace greetmcp::server
{

SessionTable::SessionTable(size_t max_sessions, IdGenerator id_generator)
    : max_sessions_(max_sessions), id_generator_(std::move(id_generator))
{
    if (!id_generator_)
        id_generator_ = [] { return util::generate_session_id(); };
}

std::shared_ptr<Session>
SessionTable::create(std::shared_ptr<transport::EventStreamTransport> transport)
{
    auto session_id = id_generator_();
    auto session = std::make_shared<Session>(session_id, std::move(transport));

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (sessions_.size() >= max_sessions_)
        throw SessionLimitError("Maximum sessions reached");
    if (sessions_.count(session_id) != 0 || tombstones_.count(session_id) != 0)
        throw DuplicateSessionError("session id collision: " + session_id);
    sessions_.emplace(session_id, session);
    return session;
}

std::shared_ptr<Session> SessionTable::lookup(const std::string& session_id) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end())
        return nullptr;
    return it->second;
}

bool SessionTable::remove(const std::string& session_id)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (sessions_.erase(session_id) == 0)
        return false;
    remember_removed(session_id);
    return true;
}

bool SessionTable::was_removed(const std::string& session_id) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tombstones_.count(session_id) != 0;
}

void SessionTable::remember_removed(const std::string& session_id)
{
    if (!tombstones_.insert(session_id).second)
        return;
    tombstone_order_.push_back(session_id);
    if (tombstone_order_.size() > MAX_TOMBSTONES)
    {
        tombstones_.erase(tombstone_order_.front());
        tombstone_order_.pop_front();
    }
}

std::vector<std::shared_ptr<Session>> SessionTable::snapshot() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<Session>> out;
    out.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_)
        out.push_back(session);
    return out;
}

std::vector<std::shared_ptr<Session>> SessionTable::clear()
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<Session>> out;
    out.reserve(sessions_.size());
    for (auto& [id, session] : sessions_)
    {
        remember_removed(id);
        out.push_back(std::move(session));
    }
    sessions_.clear();
    return out;
}

void SessionTable::for_each(const std::function<void(const std::shared_ptr<Session>&)>& fn) const
{
    // fn runs without the lock so it may block or call back into the table
    for (const auto& session : snapshot())
        fn(session);
}

size_t SessionTable::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace greetmcp::server
