#pragma once

#include <castlink/discovery/PeerRecord.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <unordered_set>
#include <string>
#include <vector>

namespace castlink::discovery
{

enum class AppendResult : std::uint8_t
{
    Added = 0,
    Duplicate, // 같은 run 에서 같은 instanceName 재광고
    Full,      // maxPeers 초과
    Stale,     // 이전 run 의 늦게 도착한 레코드
    Invalid,   // instanceName 없음
};

[[nodiscard]] const char *toString(AppendResult r) noexcept;

/// 현재 탐색 run 에서 발견된 피어 목록 (도착 순서 = index)
///
/// - reset() 때마다 generation 이 바뀌고, 이전 generation 으로 들어오는 레코드는 버립니다.
/// - DispatchQueue owner 스레드 전용
class PeerRegistry
{
  public:
    explicit PeerRegistry(std::size_t maxPeers);

    /// 목록을 비우고 새 run 을 시작합니다.
    /// @return 새 generation
    std::uint64_t reset();

    AppendResult append(std::uint64_t generation, PeerRecord record);

    /// 범위를 벗어나면 nullptr
    [[nodiscard]] const PeerRecord *find(std::size_t index) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] bool empty() const noexcept { return records_.empty(); }
    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }
    [[nodiscard]] std::size_t maxPeers() const noexcept { return maxPeers_; }

  private:
    std::size_t maxPeers_;
    std::uint64_t generation_{0};
    std::vector<PeerRecord> records_;
    std::unordered_set<std::string> names_;
};

} // namespace castlink::discovery
