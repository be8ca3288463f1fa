#pragma once
#include "greetmcp/server/session.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace greetmcp::server
{

/**
 * Owns the live sessions, keyed by session id.
 *
 * create() and remove() take the table exclusively; lookup(), for_each() and
 * size() share it, so lookups never observe a half-inserted entry. Removed ids are
 * remembered in a bounded tombstone list to tell "already terminated" apart from
 * "never issued".
 */
class SessionTable
{
  public:
    using IdGenerator = std::function<std::string()>;

    static constexpr size_t DEFAULT_MAX_SESSIONS = 1000;
    static constexpr size_t MAX_TOMBSTONES = 4096;

    explicit SessionTable(size_t max_sessions = DEFAULT_MAX_SESSIONS,
                          IdGenerator id_generator = nullptr);

    /**
     * Allocate an id and insert a new Initializing session bound to `transport`.
     *
     * @throws DuplicateSessionError if the generated id is already live
     * @throws SessionLimitError if max_sessions sessions are live
     */
    std::shared_ptr<Session> create(std::shared_ptr<transport::EventStreamTransport> transport);

    /// The live session with this id, or nullptr.
    std::shared_ptr<Session> lookup(const std::string& session_id) const;

    /// Idempotent. Returns true if an entry was removed.
    bool remove(const std::string& session_id);

    /// True if `session_id` was live once and has since been removed.
    bool was_removed(const std::string& session_id) const;

    /// Apply `fn` to a snapshot of the sessions present when the call started.
    void for_each(const std::function<void(const std::shared_ptr<Session>&)>& fn) const;

    std::vector<std::shared_ptr<Session>> snapshot() const;

    /// Remove every session (shutdown). Returns the removed sessions.
    std::vector<std::shared_ptr<Session>> clear();

    size_t size() const;

  private:
    void remember_removed(const std::string& session_id);

    size_t max_sessions_;
    IdGenerator id_generator_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    std::unordered_set<std::string> tombstones_;
    std::deque<std::string> tombstone_order_;
};

} // namespace greetmcp::server
