#pragma once
#include "oshub/types.hpp"

#include <functional>

namespace oshub::mcp
{

enum class SessionState
{
    Uninitialized,
    Initialized
};

/**
 * Handshake state of one client session.
 *
 * The only transition is Uninitialized -> Initialized, taken when
 * initialize() succeeds. Nothing moves a session back.
 */
class Session
{
  public:
    /// Liveness check run by initialize(); signals failure by throwing.
    using Probe = std::function<void()>;

    Session(ServerInfo server_info, Capabilities capabilities)
        : server_info_(std::move(server_info)), capabilities_(capabilities)
    {
    }

    SessionState state() const
    {
        return state_;
    }
    bool initialized() const
    {
        return state_ == SessionState::Initialized;
    }
    const ServerInfo& server_info() const
    {
        return server_info_;
    }
    const Capabilities& capabilities() const
    {
        return capabilities_;
    }

    /// Run `probe`; mark the session initialized if it returns normally.
    /// A throwing probe leaves the state untouched and the exception propagates.
    void initialize(const Probe& probe)
    {
        if (probe)
            probe();
        state_ = SessionState::Initialized;
    }

  private:
    ServerInfo server_info_;
    Capabilities capabilities_;
    SessionState state_{SessionState::Uninitialized};
};

} // namespace oshub::mcp
