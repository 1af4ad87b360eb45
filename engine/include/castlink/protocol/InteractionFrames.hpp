#pragma once

#include <castlink/protocol/MessageView.hpp>
#include <castlink/protocol/PacketReader.hpp>
#include <castlink/protocol/PacketWriter.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace castlink::protocol
{

// =============================================================================
// Interaction frame wire format (secure session payload)
//
//   [Opcode:u16_be] + [Body...]
//
// Body 의 첫 필드는 항상 correlationId(u32_be) 입니다.
// 세션 전송 계층이 프레이밍/암호화를 담당하므로 길이 필드는 두지 않습니다.
// =============================================================================
inline constexpr std::size_t kOpcodeFieldBytes = 2;

inline constexpr std::uint16_t kOpInvokeRequest = 0x0101;
inline constexpr std::uint16_t kOpInvokeResponse = 0x0102;
inline constexpr std::uint16_t kOpStatusResponse = 0x0103;
inline constexpr std::uint16_t kOpSubscribeRequest = 0x0201;
inline constexpr std::uint16_t kOpSubscribeResponse = 0x0202;
inline constexpr std::uint16_t kOpReportData = 0x0203;
inline constexpr std::uint16_t kOpSubscriptionCancel = 0x0204;

/// StatusResponse.status 값
enum class InteractionStatus : std::uint8_t
{
    Success = 0x00,
    Failure = 0x01,
    InvalidCommand = 0x85,
    UnsupportedAttribute = 0x86,
    ConstraintError = 0x87,
    UnsupportedCluster = 0xC3,
    Busy = 0x9C,
};

// -----------------------------------------------------------------------------
// Client -> Commissioner
// -----------------------------------------------------------------------------
struct InvokeRequestFrame
{
    static constexpr std::uint16_t kOpcode = kOpInvokeRequest;

    std::uint32_t correlationId{0};
    std::uint16_t endpoint{0};
    std::uint32_t clusterId{0};
    std::uint32_t commandId{0};
    MessageView payload{}; // 커맨드별 인코딩 (write 시 외부 버퍼, read 시 원본 버퍼를 가리킴)

    bool read(PacketReader &r)
    {
        return r.readU32Be(correlationId) && r.readU16Be(endpoint) && r.readU32Be(clusterId) &&
               r.readU32Be(commandId) && r.readRest(payload);
    }

    void write(PacketWriter &w) const
    {
        w.writeU32Be(correlationId);
        w.writeU16Be(endpoint);
        w.writeU32Be(clusterId);
        w.writeU32Be(commandId);
        w.writeBytes(payload);
    }
};

struct SubscribeRequestFrame
{
    static constexpr std::uint16_t kOpcode = kOpSubscribeRequest;
    static constexpr std::size_t kBodyBytes = 4 + 2 + 4 + 4 + 2 + 2;

    std::uint32_t correlationId{0};
    std::uint16_t endpoint{0};
    std::uint32_t clusterId{0};
    std::uint32_t attributeId{0};
    std::uint16_t minIntervalS{0};
    std::uint16_t maxIntervalS{0};

    bool read(PacketReader &r)
    {
        if (r.remaining() < kBodyBytes)
            return false;
        return r.readU32Be(correlationId) && r.readU16Be(endpoint) && r.readU32Be(clusterId) &&
               r.readU32Be(attributeId) && r.readU16Be(minIntervalS) && r.readU16Be(maxIntervalS);
    }

    void write(PacketWriter &w) const
    {
        w.writeU32Be(correlationId);
        w.writeU16Be(endpoint);
        w.writeU32Be(clusterId);
        w.writeU32Be(attributeId);
        w.writeU16Be(minIntervalS);
        w.writeU16Be(maxIntervalS);
    }
};

struct SubscriptionCancelFrame
{
    static constexpr std::uint16_t kOpcode = kOpSubscriptionCancel;

    std::uint32_t correlationId{0};

    bool read(PacketReader &r) { return r.readU32Be(correlationId); }
    void write(PacketWriter &w) const { w.writeU32Be(correlationId); }
};

// -----------------------------------------------------------------------------
// Commissioner -> Client
// -----------------------------------------------------------------------------
struct InvokeResponseFrame
{
    static constexpr std::uint16_t kOpcode = kOpInvokeResponse;

    std::uint32_t correlationId{0};
    MessageView payload{};

    bool read(PacketReader &r) { return r.readU32Be(correlationId) && r.readRest(payload); }

    void write(PacketWriter &w) const
    {
        w.writeU32Be(correlationId);
        w.writeBytes(payload);
    }
};

struct StatusResponseFrame
{
    static constexpr std::uint16_t kOpcode = kOpStatusResponse;

    std::uint32_t correlationId{0};
    std::uint8_t status{0};
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept
    {
        return status == static_cast<std::uint8_t>(InteractionStatus::Success);
    }

    bool read(PacketReader &r)
    {
        return r.readU32Be(correlationId) && r.readU8(status) && r.readStringU16(message);
    }

    void write(PacketWriter &w) const
    {
        w.writeU32Be(correlationId);
        w.writeU8(status);
        // 상태 메시지는 진단용: 너무 길면 비운다.
        if (!w.writeStringU16Checked(message, 1024))
            w.writeU16Be(0);
    }
};

struct SubscribeResponseFrame
{
    static constexpr std::uint16_t kOpcode = kOpSubscribeResponse;

    std::uint32_t correlationId{0};
    std::uint16_t maxIntervalS{0}; // 상대가 확정한 max interval

    bool read(PacketReader &r) { return r.readU32Be(correlationId) && r.readU16Be(maxIntervalS); }

    void write(PacketWriter &w) const
    {
        w.writeU32Be(correlationId);
        w.writeU16Be(maxIntervalS);
    }
};

struct ReportDataFrame
{
    static constexpr std::uint16_t kOpcode = kOpReportData;

    std::uint32_t correlationId{0};
    std::uint32_t clusterId{0};
    std::uint32_t attributeId{0};
    MessageView payload{};

    bool read(PacketReader &r)
    {
        return r.readU32Be(correlationId) && r.readU32Be(clusterId) && r.readU32Be(attributeId) &&
               r.readRest(payload);
    }

    void write(PacketWriter &w) const
    {
        w.writeU32Be(correlationId);
        w.writeU32Be(clusterId);
        w.writeU32Be(attributeId);
        w.writeBytes(payload);
    }
};

// -----------------------------------------------------------------------------
// Framing helpers
// -----------------------------------------------------------------------------
template <typename Frame> [[nodiscard]] std::vector<std::uint8_t> encodeFrame(const Frame &frame)
{
    PacketWriter w;
    w.writeU16Be(Frame::kOpcode);
    frame.write(w);
    return w.take();
}

/// frame -> (opcode, body). opcode 필드가 모자라면 false.
inline bool splitFrame(const MessageView &frame, std::uint16_t &opcode, MessageView &body) noexcept
{
    PacketReader r(frame);
    if (!r.readU16Be(opcode))
        return false;
    return r.readRest(body);
}

/// body -> Frame (strict: 남는 바이트가 있으면 실패)
template <typename Frame> bool decodeBody(const MessageView &body, Frame &out)
{
    PacketReader r(body);
    return out.read(r) && r.expectEnd();
}

} // namespace castlink::protocol
