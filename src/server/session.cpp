#include "greetmcp/server/session.hpp"

#include "greetmcp/exceptions.hpp"

namespace greetmcp::server
{

std::string to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::Initializing:
        return "initializing";
    case SessionState::Active:
        return "active";
    case SessionState::Closed:
        return "closed";
    }
    return "closed";
}

Session::Session(std::string session_id,
                 std::shared_ptr<transport::EventStreamTransport> transport)
    : session_id_(std::move(session_id)), transport_(std::move(transport))
{
}

SessionState Session::state() const
{
    std::lock_guard<std::mutex> lock(state_m_);
    return state_;
}

bool Session::activate()
{
    std::lock_guard<std::mutex> lock(state_m_);
    if (state_ != SessionState::Initializing)
        return false;
    state_ = SessionState::Active;
    return true;
}

bool Session::mark_closed()
{
    {
        std::lock_guard<std::mutex> lock(state_m_);
        if (state_ == SessionState::Closed)
            return false;
        state_ = SessionState::Closed;
    }
    state_cv_.notify_all();
    return true;
}

bool Session::wait_open_for(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(state_m_);
    state_cv_.wait_for(lock, timeout, [&] { return state_ == SessionState::Closed; });
    return state_ != SessionState::Closed;
}

void Session::set_handshake(std::string protocol_version, Implementation client_info,
                            Json capabilities)
{
    std::lock_guard<std::mutex> lock(state_m_);
    protocol_version_ = std::move(protocol_version);
    client_info_ = std::move(client_info);
    client_capabilities_ = std::move(capabilities);
}

std::string Session::protocol_version() const
{
    std::lock_guard<std::mutex> lock(state_m_);
    return protocol_version_;
}

Implementation Session::client_info() const
{
    std::lock_guard<std::mutex> lock(state_m_);
    return client_info_;
}

Json Session::client_capabilities() const
{
    std::lock_guard<std::mutex> lock(state_m_);
    return client_capabilities_;
}

void Session::mark_client_initialized()
{
    std::lock_guard<std::mutex> lock(state_m_);
    client_initialized_ = true;
}

bool Session::client_initialized() const
{
    std::lock_guard<std::mutex> lock(state_m_);
    return client_initialized_;
}

void Session::set_log_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(state_m_);
    log_level_ = level;
}

LogLevel Session::log_level() const
{
    std::lock_guard<std::mutex> lock(state_m_);
    return log_level_;
}

bool Session::mark_tools_notified(uint64_t version)
{
    std::lock_guard<std::mutex> lock(state_m_);
    if (version <= tools_version_)
        return false;
    tools_version_ = version;
    return true;
}

uint64_t Session::tools_version() const
{
    std::lock_guard<std::mutex> lock(state_m_);
    return tools_version_;
}

void Session::deliver_locked(transport::Transport& target, const Json& message)
{
    if (is_closed())
        throw DeliveryFailedError("session " + session_id_ + " is closed");
    target.send(message);
}

void Session::send(const Json& message)
{
    std::lock_guard<std::mutex> lock(send_m_);
    deliver_locked(*transport_, message);
}

void Session::send(const Json& message, const Json& related_request_id)
{
    std::shared_ptr<transport::Transport> stream;
    if (!related_request_id.is_null())
    {
        std::lock_guard<std::mutex> lock(streams_m_);
        auto it = request_streams_.find(stream_key(related_request_id));
        if (it != request_streams_.end())
            stream = it->second;
    }

    std::lock_guard<std::mutex> lock(send_m_);
    deliver_locked(stream ? *stream : *transport_, message);
}

std::string Session::stream_key(const Json& request_id)
{
    return request_id.dump();
}

Session::RequestStreamBinding
Session::bind_request_stream(const Json& request_id, std::shared_ptr<transport::Transport> stream)
{
    auto key = stream_key(request_id);
    {
        std::lock_guard<std::mutex> lock(streams_m_);
        request_streams_[key] = std::move(stream);
    }
    return RequestStreamBinding(*this, std::move(key));
}

Session::RequestStreamBinding::~RequestStreamBinding()
{
    if (!session_)
        return;
    std::lock_guard<std::mutex> lock(session_->streams_m_);
    session_->request_streams_.erase(key_);
}

std::unique_lock<std::mutex> Session::begin_call()
{
    return std::unique_lock<std::mutex>(call_m_);
}

void Session::hold(transport::Subscription subscription)
{
    std::lock_guard<std::mutex> lock(subs_m_);
    subscriptions_.push_back(std::move(subscription));
}

} // namespace greetmcp::server
