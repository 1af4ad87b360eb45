#pragma once

#include <castlink/protocol/MessageView.hpp>

#include <cstdint>
#include <functional>
#include <unordered_map>
#include <utility>

namespace castlink::protocol
{

/// opcode -> 핸들러 라우팅 테이블입니다.
/// - 세션 전송에서 올라온 인터랙션 프레임을 응답/리포트 처리기로 보냅니다.
/// - DispatchQueue owner 스레드 전용 (내부 잠금 없음)
class Dispatcher
{
  public:
    using OpCode = std::uint16_t;
    using Handler = std::function<void(const MessageView &body)>;

    /// @return false if opcode already exists or handler invalid
    bool registerHandler(OpCode opcode, Handler handler)
    {
        if (!handler)
            return false;
        auto [it, inserted] = handlers_.emplace(opcode, std::move(handler));
        return inserted;
    }

    bool unregisterHandler(OpCode opcode) noexcept { return handlers_.erase(opcode) > 0; }

    void clear() noexcept { handlers_.clear(); }

    [[nodiscard]] std::size_t handlerCount() const noexcept { return handlers_.size(); }

    /// @return true if handled, false if unknown opcode
    bool dispatch(OpCode opcode, const MessageView &body) const
    {
        auto it = handlers_.find(opcode);
        if (it == handlers_.end())
            return false;
        it->second(body);
        return true;
    }

  private:
    std::unordered_map<OpCode, Handler> handlers_;
};

} // namespace castlink::protocol
