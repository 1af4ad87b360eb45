#include <castlink/Error.hpp>

#include <format>

namespace castlink
{

const char *toString(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::None:
        return "None";
    case ErrorCode::NotConnected:
        return "NotConnected";
    case ErrorCode::InvalidArgument:
        return "InvalidArgument";
    case ErrorCode::InvalidState:
        return "InvalidState";
    case ErrorCode::NotFound:
        return "NotFound";
    case ErrorCode::SendFailure:
        return "SendFailure";
    case ErrorCode::Timeout:
        return "Timeout";
    case ErrorCode::DecodeError:
        return "DecodeError";
    case ErrorCode::SessionClosed:
        return "SessionClosed";
    case ErrorCode::CommissioningFailed:
        return "CommissioningFailed";
    case ErrorCode::Rejected:
        return "Rejected";
    }
    return "Unknown";
}

std::string Error::toString() const
{
    if (code_ == ErrorCode::Rejected)
        return std::format("{}(status=0x{:02x}{}{})", castlink::toString(code_), peerStatus_,
                           message_.empty() ? "" : " ", message_);
    if (message_.empty())
        return castlink::toString(code_);
    return std::format("{}({})", castlink::toString(code_), message_);
}

} // namespace castlink
