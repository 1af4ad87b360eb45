#include "../support/Check.hpp"

#include <castlink/session/SessionStateMachine.hpp>

#include <string_view>

using namespace castlink::session;
using S = SessionState;

namespace
{

void test_commissioning_happy_path()
{
    SessionStateMachine fsm;
    CHECK(fsm.is(S::Idle));
    CHECK(fsm.transition(S::Discovering, "browse"));
    CHECK(fsm.transition(S::ConnectingUDC, "udc"));
    CHECK(fsm.transition(S::AwaitingCommissioning, "window"));
    CHECK(fsm.transition(S::Commissioned, "complete"));
    CHECK(fsm.is(S::Commissioned));
    CHECK(fsm.transitionCount() == 4);
}

void test_rejected_transition_keeps_state()
{
    SessionStateMachine fsm;
    CHECK(!fsm.transition(S::Commissioned, "skip"));
    CHECK(fsm.is(S::Idle));
    CHECK(fsm.transitionCount() == 0);

    CHECK(fsm.transition(S::AwaitingCommissioning, "window"));
    CHECK(!fsm.transition(S::Idle, "back"));
    CHECK(fsm.is(S::AwaitingCommissioning));
}

/// Failed / Closed 는 어느 상태에서든 도달 가능하고 Idle 로만 돌아갑니다.
void test_terminal_states()
{
    SessionStateMachine fsm;
    CHECK(fsm.transition(S::Closed, "close"));
    CHECK(!fsm.canTransition(S::Closed));
    CHECK(fsm.canTransition(S::Failed));
    CHECK(!fsm.canTransition(S::Discovering));
    CHECK(fsm.transition(S::Idle, "reinit"));

    CHECK(fsm.transition(S::AwaitingCommissioning, "window"));
    CHECK(fsm.transition(S::Commissioned, "complete"));
    CHECK(fsm.transition(S::Failed, "lost"));
    CHECK(!fsm.canTransition(S::Commissioned));
    CHECK(fsm.transition(S::Idle, "reinit"));
}

void test_udc_can_return_to_idle()
{
    SessionStateMachine fsm;
    CHECK(fsm.transition(S::ConnectingUDC, "udc"));
    CHECK(fsm.transition(S::Idle, "udc done"));
    CHECK(fsm.isAnyOf(stateBit(S::Idle) | stateBit(S::Discovering)));
    CHECK(!fsm.isAnyOf(stateBit(S::Commissioned)));
}

void test_custom_transition_table()
{
    SessionStateMachine fsm;
    CHECK((fsm.allowedFrom(S::Commissioned) & stateBit(S::Idle)) == 0);

    fsm.setAllowedTransitions(S::Idle, stateBit(S::Failed));
    CHECK(!fsm.canTransition(S::Discovering));
    CHECK(fsm.allowedFrom(S::Idle) == stateBit(S::Failed));
}

void test_to_string()
{
    CHECK(std::string_view(toString(S::AwaitingCommissioning)) == "AwaitingCommissioning");
    CHECK(std::string_view(toString(S::Closed)) == "Closed");
}

} // namespace

int main()
{
    test_commissioning_happy_path();
    test_rejected_transition_keeps_state();
    test_terminal_states();
    test_udc_can_return_to_idle();
    test_custom_transition_table();
    test_to_string();
    return castlink::test::finish("session.state_machine");
}
