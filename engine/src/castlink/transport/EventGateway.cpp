#include <castlink/transport/EventGateway.hpp>

#include <castlink/core/Logger.hpp>

#include <stdexcept>
#include <utility>

namespace castlink::transport
{

EventGateway::EventGateway(std::shared_ptr<core::IExecutionContext> target)
    : target_(std::move(target))
{
    if (!target_)
        throw std::invalid_argument("EventGateway: target context is null");
}

bool EventGateway::post(Task task)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_)
        return false;

    if (!target_->post(std::move(task)))
    {
        CASTLINK_LOG_DEBUG("EventGateway", "PostRejected", "ctx={}", target_->name());
        return false;
    }
    return true;
}

void EventGateway::close() noexcept
{
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
}

bool EventGateway::isClosed() const noexcept
{
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
}

} // namespace castlink::transport
