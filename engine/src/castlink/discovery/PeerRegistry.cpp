#include <castlink/discovery/PeerRegistry.hpp>

#include <castlink/core/Logger.hpp>

#include <stdexcept>
#include <utility>

namespace castlink::discovery
{

const char *toString(AppendResult r) noexcept
{
    switch (r)
    {
    case AppendResult::Added:
        return "Added";
    case AppendResult::Duplicate:
        return "Duplicate";
    case AppendResult::Full:
        return "Full";
    case AppendResult::Stale:
        return "Stale";
    case AppendResult::Invalid:
        return "Invalid";
    }
    return "Unknown";
}

PeerRegistry::PeerRegistry(std::size_t maxPeers) : maxPeers_(maxPeers)
{
    if (maxPeers_ == 0)
        throw std::invalid_argument("PeerRegistry maxPeers must be > 0");
    records_.reserve(maxPeers_);
}

std::uint64_t PeerRegistry::reset()
{
    const std::size_t dropped = records_.size();
    records_.clear();
    names_.clear();
    ++generation_;

    CASTLINK_LOG_DEBUG("PeerRegistry", "Reset", "generation={} dropped={}", generation_, dropped);
    return generation_;
}

AppendResult PeerRegistry::append(std::uint64_t generation, PeerRecord record)
{
    if (generation != generation_)
    {
        CASTLINK_LOG_DEBUG("PeerRegistry", "DropStale", "instance='{}' gen={} current={}",
                           record.instanceName, generation, generation_);
        return AppendResult::Stale;
    }

    if (record.instanceName.empty())
    {
        CASTLINK_LOG_WARN("PeerRegistry", "DropInvalid", "reason=EmptyInstanceName host='{}'",
                          record.hostName);
        return AppendResult::Invalid;
    }

    if (names_.count(record.instanceName) != 0)
    {
        CASTLINK_LOG_TRACE("PeerRegistry", "DropDuplicate", "instance='{}'", record.instanceName);
        return AppendResult::Duplicate;
    }

    if (records_.size() >= maxPeers_)
    {
        CASTLINK_LOG_WARN("PeerRegistry", "DropFull", "instance='{}' max_peers={}",
                          record.instanceName, maxPeers_);
        return AppendResult::Full;
    }

    CASTLINK_LOG_INFO("PeerRegistry", "PeerAdded",
                      "index={} instance='{}' device='{}' vid=0x{:04x} pid=0x{:04x} port={}",
                      records_.size(), record.instanceName, record.deviceName, record.vendorId,
                      record.productId, record.port);

    names_.insert(record.instanceName);
    records_.push_back(std::move(record));
    return AppendResult::Added;
}

const PeerRecord *PeerRegistry::find(std::size_t index) const noexcept
{
    if (index >= records_.size())
        return nullptr;
    return &records_[index];
}

} // namespace castlink::discovery
