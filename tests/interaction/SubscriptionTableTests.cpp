#include "../support/Check.hpp"

#include <castlink/core/DispatchQueue.hpp>
#include <castlink/core/ExecutionContext.hpp>
#include <castlink/interaction/SubscriptionTable.hpp>
#include <castlink/monitoring/Metrics.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace castlink;
using namespace std::chrono_literals;
using interaction::SubscriptionState;
using interaction::SubscriptionTable;

namespace
{

constexpr std::uint32_t kCluster = 0x0008;
constexpr std::uint32_t kAttribute = 0x0000;

struct Fixture
{
    explicit Fixture(SubscriptionTable::Limits limits = {1000ms, 2})
        : dq(std::make_shared<core::DispatchQueue>(10ms, 256, "dq")),
          ctx(core::CallContext::on(std::make_shared<core::InlineExecutor>())),
          table(*dq, metrics, limits)
    {
        dq->bindToCurrentThread();
    }

    /// report payload 는 u8 1개. 그 외 길이는 디코드 실패
    bool add(interaction::SubscriptionId id, std::uint16_t minS = 0, std::uint16_t maxS = 2,
             std::chrono::milliseconds establishTimeout = 500ms)
    {
        return table.add(
            id, interaction::AttributePath{1, kCluster, kAttribute}, minS, maxS, establishTimeout,
            [this](const protocol::MessageView &payload)
            {
                if (payload.size() != 1)
                    return false;
                reports.push_back(payload.bytes()[0]);
                return true;
            },
            core::Continuation<Error>(ctx, [this](Error e) { failures.push_back(std::move(e)); }),
            core::Continuation<>(ctx,
                                 [this]()
                                 {
                                     ++established;
                                     reportsAtEstablish = reports.size();
                                 }));
    }

    void report(interaction::SubscriptionId id, std::uint8_t value,
                std::uint32_t attribute = kAttribute)
    {
        bytes = {value};
        protocol::ReportDataFrame f{id, kCluster, attribute, protocol::MessageView(bytes)};
        CHECK(table.onReport(f));
    }

    void establish(interaction::SubscriptionId id, std::uint16_t maxS = 2)
    {
        CHECK(table.onSubscribeResponse(protocol::SubscribeResponseFrame{id, maxS}));
    }

    std::shared_ptr<core::DispatchQueue> dq;
    monitoring::EngineMetrics metrics;
    core::CallContext ctx;
    SubscriptionTable table;

    std::vector<std::uint8_t> bytes;
    std::vector<int> reports;
    std::vector<Error> failures;
    int established{0};
    std::size_t reportsAtEstablish{0};
};

void test_establish_then_reports()
{
    Fixture f;
    CHECK(f.add(1));
    CHECK(f.table.stateOf(1) == SubscriptionState::Requested);

    f.establish(1);
    CHECK(f.established == 1);
    CHECK(f.table.stateOf(1) == SubscriptionState::Established);

    f.report(1, 10);
    f.report(1, 11);
    CHECK((f.reports == std::vector<int>{10, 11}));

    const auto snap = f.metrics.snapshot();
    CHECK(snap.subscriptionsEstablishedTotal == 1);
    CHECK(snap.subscriptionsActive == 1);
    CHECK(snap.reportsDeliveredTotal == 2);
}

/// 확립 전에 온 report 는 onEstablished 직후 순서대로 전달되고, 한도를 넘으면 버립니다.
void test_primed_reports_follow_established()
{
    Fixture f;
    CHECK(f.add(2));
    f.report(2, 1);
    f.report(2, 2);
    f.report(2, 3); // 한도(2) 초과
    CHECK(f.reports.empty());

    f.establish(2);
    CHECK(f.established == 1);
    CHECK(f.reportsAtEstablish == 0);
    CHECK((f.reports == std::vector<int>{1, 2}));
}

void test_establish_timeout()
{
    Fixture f;
    CHECK(f.add(3, 0, 2, 100ms));
    f.dq->advanceBy(120ms);
    CHECK(f.failures.size() == 1);
    CHECK(f.failures[0] == ErrorCode::Timeout);
    CHECK(!f.table.contains(3));

    // 종료 뒤의 프레임은 무시
    CHECK(!f.table.onSubscribeResponse(protocol::SubscribeResponseFrame{3, 2}));
    CHECK(f.established == 0);
    CHECK(f.metrics.snapshot().subscriptionsActive == 0);
}

/// max interval + margin 동안 report 가 없으면 Timeout. report 가 오면 다시 무장합니다.
void test_liveness()
{
    Fixture f;
    CHECK(f.add(4));
    f.establish(4, 1); // 1s + 1s margin

    f.dq->advanceBy(1500ms);
    f.report(4, 9);
    f.dq->advanceBy(1500ms);
    CHECK(f.failures.empty());
    CHECK(f.table.contains(4));

    f.dq->advanceBy(600ms);
    CHECK(f.failures.size() == 1);
    CHECK(f.failures[0] == ErrorCode::Timeout);
    CHECK(!f.table.contains(4));
}

void test_liveness_disabled()
{
    Fixture f(SubscriptionTable::Limits{0ms, 8});
    CHECK(f.add(5));
    f.establish(5, 1);
    f.dq->advanceBy(10s);
    CHECK(f.failures.empty());
    CHECK(f.table.contains(5));
}

void test_decode_error_keeps_subscription()
{
    Fixture f;
    CHECK(f.add(6));
    f.establish(6);

    f.bytes = {1, 2};
    CHECK(f.table.onReport(protocol::ReportDataFrame{6, kCluster, kAttribute,
                                                     protocol::MessageView(f.bytes)}));
    CHECK(f.failures.size() == 1);
    CHECK(f.failures[0] == ErrorCode::DecodeError);
    CHECK(f.table.stateOf(6) == SubscriptionState::Established);

    f.report(6, 3, 0x0099);
    CHECK(f.failures.size() == 2);
    CHECK(f.failures[1] == ErrorCode::DecodeError);

    f.report(6, 4);
    CHECK((f.reports == std::vector<int>{4}));
}

void test_rejected_by_status()
{
    Fixture f;
    CHECK(f.add(7));
    protocol::StatusResponseFrame ok;
    ok.correlationId = 7;
    CHECK(f.table.onStatusResponse(ok));
    CHECK(f.table.contains(7));

    protocol::StatusResponseFrame st;
    st.correlationId = 7;
    st.status = static_cast<std::uint8_t>(protocol::InteractionStatus::UnsupportedAttribute);
    CHECK(f.table.onStatusResponse(st));
    CHECK(f.failures.size() == 1);
    CHECK(f.failures[0] == ErrorCode::Rejected);
    CHECK(f.failures[0].peerStatus() == 0x86);
    CHECK(!f.table.contains(7));
}

void test_remove_is_silent()
{
    Fixture f;
    CHECK(f.add(8));
    f.establish(8);
    CHECK(f.table.remove(8));
    CHECK(!f.table.remove(8));
    CHECK(f.failures.empty());

    // 남은 타이머가 있어도 콜백은 없다
    f.dq->advanceBy(10s);
    CHECK(f.failures.empty());
    CHECK(!f.table.onReport(
        protocol::ReportDataFrame{8, kCluster, kAttribute, protocol::MessageView{}}));
}

void test_terminate_all()
{
    Fixture f;
    CHECK(f.add(9));
    CHECK(f.add(10));
    f.establish(10);

    CHECK(f.table.terminateAll(Error(ErrorCode::SessionClosed, "gone")) == 2);
    CHECK(f.failures.size() == 2);
    CHECK(f.failures[0] == ErrorCode::SessionClosed);
    CHECK(f.failures[1] == ErrorCode::SessionClosed);
    CHECK(f.table.activeCount() == 0);

    f.dq->advanceBy(10s);
    CHECK(f.failures.size() == 2);
}

void test_add_validation()
{
    Fixture f;
    CHECK(!f.add(interaction::kInvalidCorrelationId));
    CHECK(f.add(11));
    CHECK(!f.add(11));
    CHECK(!f.add(12, 5, 1));
    CHECK(f.table.activeCount() == 1);
}

} // namespace

int main()
{
    test_establish_then_reports();
    test_primed_reports_follow_established();
    test_establish_timeout();
    test_liveness();
    test_liveness_disabled();
    test_decode_error_keeps_subscription();
    test_rejected_by_status();
    test_remove_is_silent();
    test_terminate_all();
    test_add_validation();
    return castlink::test::finish("interaction.subscription_table");
}
