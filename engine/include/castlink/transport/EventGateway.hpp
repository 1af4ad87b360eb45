#pragma once

#include <castlink/core/ExecutionContext.hpp>
#include <castlink/util/NonCopyable.hpp>

#include <memory>
#include <mutex>

namespace castlink::transport
{

/// 전송 스레드 -> DispatchQueue 로 이벤트를 넘기는 닫을 수 있는 관문입니다.
///
/// - 전송 콜백은 엔진 객체를 직접 잡지 않고 이 관문을 weak_ptr 로 잡습니다.
/// - close() 이후의 post 는 모두 버려지고 false 를 반환합니다.
///   close() 가 반환되면 진행 중이던 post 도 끝나 있습니다. (엔진 해체 순서 보장)
class EventGateway final : private castlink::util::NonMovable
{
  public:
    using Task = core::IExecutionContext::Task;

    explicit EventGateway(std::shared_ptr<core::IExecutionContext> target);

    bool post(Task task);

    void close() noexcept;
    [[nodiscard]] bool isClosed() const noexcept;

  private:
    mutable std::mutex mu_;
    std::shared_ptr<core::IExecutionContext> target_;
    bool closed_{false};
};

} // namespace castlink::transport
