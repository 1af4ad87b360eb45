#pragma once

#include <castlink/session/SessionState.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace castlink::session
{

/// 커미셔닝 세션 상태 전이 테이블입니다.
///
/// from 상태마다 허용되는 to 상태의 비트 마스크를 둡니다.
///
///   Idle                  -> Discovering | ConnectingUDC | AwaitingCommissioning
///   Discovering           -> ConnectingUDC | AwaitingCommissioning
///   ConnectingUDC         -> Idle | AwaitingCommissioning
///   AwaitingCommissioning -> Commissioned
///   Failed / Closed       -> Idle            (reinitialize 전용)
///   (모든 상태)            -> Failed | Closed  (자기 자신 제외)
class SessionStateMachine
{
  public:
    SessionStateMachine();

    [[nodiscard]] SessionState state() const noexcept { return state_; }
    [[nodiscard]] bool is(SessionState s) const noexcept { return state_ == s; }
    [[nodiscard]] bool isAnyOf(std::uint32_t mask) const noexcept
    {
        return (mask & stateBit(state_)) != 0;
    }

    [[nodiscard]] bool canTransition(SessionState to) const noexcept;

    /// 허용되지 않은 전이는 상태를 바꾸지 않고 false
    bool transition(SessionState to, std::string_view reason);

    void setAllowedTransitions(SessionState from, std::uint32_t toMask) noexcept;
    [[nodiscard]] std::uint32_t allowedFrom(SessionState from) const noexcept;

    /// 전이 횟수 (디버깅/테스트용)
    [[nodiscard]] std::uint64_t transitionCount() const noexcept { return transitions_; }

  private:
    std::array<std::uint32_t, kSessionStateCount> allowed_{};
    SessionState state_{SessionState::Idle};
    std::uint64_t transitions_{0};
};

} // namespace castlink::session
