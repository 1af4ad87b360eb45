#include "../support/Check.hpp"

#include <castlink/discovery/PeerRegistry.hpp>

#include <stdexcept>
#include <string>

using namespace castlink::discovery;

namespace
{

PeerRecord peer(const std::string &name)
{
    PeerRecord r;
    r.instanceName = name;
    r.hostName = name + ".local";
    r.deviceName = "TV " + name;
    r.port = 5540;
    r.addresses.push_back("10.0.0.2");
    return r;
}

void test_append_preserves_arrival_order()
{
    PeerRegistry reg(4);
    const auto gen = reg.reset();
    CHECK(reg.append(gen, peer("A")) == AppendResult::Added);
    CHECK(reg.append(gen, peer("B")) == AppendResult::Added);
    CHECK(reg.size() == 2);
    CHECK(reg.find(0) != nullptr && reg.find(0)->instanceName == "A");
    CHECK(reg.find(1) != nullptr && reg.find(1)->instanceName == "B");
    CHECK(reg.find(2) == nullptr);
}

void test_duplicate_instance_is_dropped()
{
    PeerRegistry reg(4);
    const auto gen = reg.reset();
    CHECK(reg.append(gen, peer("A")) == AppendResult::Added);

    auto again = peer("A");
    again.deviceName = "renamed";
    CHECK(reg.append(gen, again) == AppendResult::Duplicate);
    CHECK(reg.size() == 1);
    CHECK(reg.find(0)->deviceName == "TV A");
}

void test_capacity_is_bounded()
{
    PeerRegistry reg(2);
    const auto gen = reg.reset();
    CHECK(reg.append(gen, peer("A")) == AppendResult::Added);
    CHECK(reg.append(gen, peer("B")) == AppendResult::Added);
    CHECK(reg.append(gen, peer("C")) == AppendResult::Full);
    CHECK(reg.size() == 2);
    CHECK(reg.maxPeers() == 2);
}

/// reset 이후 이전 run 의 광고는 버려집니다.
void test_stale_generation_is_dropped()
{
    PeerRegistry reg(4);
    const auto first = reg.reset();
    CHECK(reg.append(first, peer("A")) == AppendResult::Added);

    const auto second = reg.reset();
    CHECK(second != first);
    CHECK(reg.empty());
    CHECK(reg.generation() == second);

    CHECK(reg.append(first, peer("B")) == AppendResult::Stale);
    CHECK(reg.empty());

    // 새 run 에서는 같은 이름도 다시 들어올 수 있다
    CHECK(reg.append(second, peer("A")) == AppendResult::Added);
}

void test_empty_instance_name_is_invalid()
{
    PeerRegistry reg(4);
    const auto gen = reg.reset();
    CHECK(reg.append(gen, peer("")) == AppendResult::Invalid);
    CHECK(reg.empty());
}

void test_zero_capacity_throws()
{
    bool threw = false;
    try
    {
        PeerRegistry reg(0);
    }
    catch (const std::invalid_argument &)
    {
        threw = true;
    }
    CHECK(threw);
}

} // namespace

int main()
{
    test_append_preserves_arrival_order();
    test_duplicate_instance_is_dropped();
    test_capacity_is_bounded();
    test_stale_generation_is_dropped();
    test_empty_instance_name_is_invalid();
    test_zero_capacity_throws();
    return castlink::test::finish("discovery.peer_registry");
}
