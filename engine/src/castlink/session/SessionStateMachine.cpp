#include <castlink/session/SessionStateMachine.hpp>

#include <castlink/core/Logger.hpp>

namespace castlink::session
{

const char *toString(SessionState s) noexcept
{
    switch (s)
    {
    case SessionState::Idle:
        return "Idle";
    case SessionState::Discovering:
        return "Discovering";
    case SessionState::ConnectingUDC:
        return "ConnectingUDC";
    case SessionState::AwaitingCommissioning:
        return "AwaitingCommissioning";
    case SessionState::Commissioned:
        return "Commissioned";
    case SessionState::Failed:
        return "Failed";
    case SessionState::Closed:
        return "Closed";
    }
    return "Unknown";
}

namespace
{
constexpr std::size_t idx(SessionState s) noexcept
{
    return static_cast<std::size_t>(s);
}
} // namespace

SessionStateMachine::SessionStateMachine()
{
    using S = SessionState;

    setAllowedTransitions(S::Idle, stateBit(S::Discovering) | stateBit(S::ConnectingUDC) |
                                       stateBit(S::AwaitingCommissioning));
    setAllowedTransitions(S::Discovering,
                          stateBit(S::ConnectingUDC) | stateBit(S::AwaitingCommissioning));
    setAllowedTransitions(S::ConnectingUDC, stateBit(S::Idle) | stateBit(S::AwaitingCommissioning));
    setAllowedTransitions(S::AwaitingCommissioning, stateBit(S::Commissioned));
    setAllowedTransitions(S::Commissioned, 0);
    setAllowedTransitions(S::Failed, stateBit(S::Idle));
    setAllowedTransitions(S::Closed, stateBit(S::Idle));

    // Failed / Closed 는 어디서든 도달 가능
    for (std::size_t i = 0; i < kSessionStateCount; ++i)
    {
        const auto from = static_cast<S>(i);
        std::uint32_t mask = allowed_[i] | stateBit(S::Failed) | stateBit(S::Closed);
        mask &= ~stateBit(from);
        allowed_[i] = mask;
    }
}

void SessionStateMachine::setAllowedTransitions(SessionState from, std::uint32_t toMask) noexcept
{
    allowed_[idx(from)] = toMask & kAnyStateMask;
}

std::uint32_t SessionStateMachine::allowedFrom(SessionState from) const noexcept
{
    return allowed_[idx(from)];
}

bool SessionStateMachine::canTransition(SessionState to) const noexcept
{
    return (allowed_[idx(state_)] & stateBit(to)) != 0;
}

bool SessionStateMachine::transition(SessionState to, std::string_view reason)
{
    if (!canTransition(to))
    {
        CASTLINK_LOG_WARN("SessionFsm", "TransitionRejected", "from={} to={} reason={}",
                          toString(state_), toString(to), reason);
        return false;
    }

    CASTLINK_LOG_INFO("SessionFsm", "Transition", "from={} to={} reason={}", toString(state_),
                      toString(to), reason);
    state_ = to;
    ++transitions_;
    return true;
}

} // namespace castlink::session
