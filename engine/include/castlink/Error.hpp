#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace castlink
{

/// 엔진이 호출자에게 돌려주는 오류 분류입니다.
///
/// - 요청 전송 전(동기) 검증 오류: NotConnected, InvalidArgument, InvalidState, NotFound
///   -> request-sent 채널로만 전달
/// - 전송 이후 오류: SendFailure(전송 완료 통지), Timeout, DecodeError, SessionClosed,
///   CommissioningFailed, Rejected -> 결과(failure) 채널로만 전달
enum class ErrorCode : std::uint8_t
{
    None = 0,
    NotConnected,
    InvalidArgument,
    InvalidState,
    NotFound,
    SendFailure,
    Timeout,
    DecodeError,
    SessionClosed,
    CommissioningFailed,
    Rejected,
};

[[nodiscard]] const char *toString(ErrorCode code) noexcept;

class Error
{
  public:
    Error() = default;

    Error(ErrorCode code, std::string message = {}, std::uint8_t peerStatus = 0)
        : code_(code), message_(std::move(message)), peerStatus_(peerStatus)
    {
    }

    [[nodiscard]] static Error success() { return Error{}; }

    [[nodiscard]] bool ok() const noexcept { return code_ == ErrorCode::None; }
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string &message() const noexcept { return message_; }

    /// Rejected 일 때 상대(커미셔너)가 돌려준 상태 코드
    [[nodiscard]] std::uint8_t peerStatus() const noexcept { return peerStatus_; }

    /// "Timeout(command 0x0506/0x0000)" 형태
    [[nodiscard]] std::string toString() const;

    friend bool operator==(const Error &e, ErrorCode c) noexcept { return e.code_ == c; }

  private:
    ErrorCode code_{ErrorCode::None};
    std::string message_;
    std::uint8_t peerStatus_{0};
};

} // namespace castlink
