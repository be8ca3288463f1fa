#pragma once
#include "greetmcp/transport/event_stream_transport.hpp"
#include "greetmcp/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace greetmcp::server
{

enum class SessionState
{
    Initializing,
    Active,
    Closed
};

std::string to_string(SessionState state);

/**
 * One client's protocol state.
 *
 * State machine: Initializing -> Active -> Closed, or Initializing -> Closed when
 * the handshake fails. Closed is terminal; mark_closed() reports true only for the
 * first transition so callers can run cleanup exactly once.
 *
 * Outbound messages are serialized by a per-session send lock. A message related
 * to a request goes to that request's bound response stream when one is open,
 * otherwise to the session's standalone event stream.
 *
 * Thread-safe: All methods can be called from multiple threads.
 */
class Session
{
  public:
    Session(std::string session_id, std::shared_ptr<transport::EventStreamTransport> transport);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Get the session ID
    const std::string& session_id() const
    {
        return session_id_;
    }

    const std::shared_ptr<transport::EventStreamTransport>& transport() const
    {
        return transport_;
    }

    SessionState state() const;
    bool is_active() const
    {
        return state() == SessionState::Active;
    }
    bool is_closed() const
    {
        return state() == SessionState::Closed;
    }

    /// Initializing -> Active. Returns false when the session is not Initializing.
    bool activate();

    /// Move to Closed. Returns true only for the first transition.
    bool mark_closed();

    /// Wait up to `timeout`; returns false as soon as the session is Closed.
    bool wait_open_for(std::chrono::milliseconds timeout) const;

    // ========================================================================
    // Handshake data
    // ========================================================================

    void set_handshake(std::string protocol_version, Implementation client_info,
                       Json capabilities);
    std::string protocol_version() const;
    Implementation client_info() const;
    Json client_capabilities() const;

    /// notifications/initialized received
    void mark_client_initialized();
    bool client_initialized() const;

    void set_log_level(LogLevel level);
    LogLevel log_level() const;

    /// Records that list_changed for registry `version` is being sent to this session.
    /// Returns true if `version` is newer than anything recorded before.
    bool mark_tools_notified(uint64_t version);
    uint64_t tools_version() const;

    // ========================================================================
    // Outbound delivery
    // ========================================================================

    /// Deliver on the standalone stream. Throws DeliveryFailedError when Closed.
    void send(const Json& message);

    /// Deliver on the response stream of `related_request_id` if bound, else standalone.
    void send(const Json& message, const Json& related_request_id);

    /// Keeps a request's response stream bound to the session while alive.
    class RequestStreamBinding
    {
      public:
        RequestStreamBinding(Session& session, std::string key)
            : session_(&session), key_(std::move(key))
        {
        }
        RequestStreamBinding(RequestStreamBinding&& other) noexcept
            : session_(other.session_), key_(std::move(other.key_))
        {
            other.session_ = nullptr;
        }
        RequestStreamBinding(const RequestStreamBinding&) = delete;
        RequestStreamBinding& operator=(const RequestStreamBinding&) = delete;
        RequestStreamBinding& operator=(RequestStreamBinding&&) = delete;
        ~RequestStreamBinding();

      private:
        Session* session_;
        std::string key_;
    };

    RequestStreamBinding bind_request_stream(const Json& request_id,
                                             std::shared_ptr<transport::Transport> stream);

    /// Tool calls on one session run one at a time; hold the returned lock for the call.
    std::unique_lock<std::mutex> begin_call();

    /// Keep a transport hook registered for the session's lifetime.
    void hold(transport::Subscription subscription);

  private:
    static std::string stream_key(const Json& request_id);
    void deliver_locked(transport::Transport& target, const Json& message);

    std::string session_id_;
    std::shared_ptr<transport::EventStreamTransport> transport_;

    mutable std::mutex state_m_;
    mutable std::condition_variable state_cv_;
    SessionState state_{SessionState::Initializing};
    std::string protocol_version_;
    Implementation client_info_;
    Json client_capabilities_ = Json::object();
    bool client_initialized_{false};
    LogLevel log_level_{LogLevel::Debug};
    uint64_t tools_version_{0};

    std::mutex send_m_;
    std::mutex streams_m_;
    std::unordered_map<std::string, std::shared_ptr<transport::Transport>> request_streams_;

    std::mutex call_m_;

    std::mutex subs_m_;
    std::vector<transport::Subscription> subscriptions_;
};

} // namespace greetmcp::server
