#include "../support/Check.hpp"

#include <castlink/protocol/Dispatcher.hpp>
#include <castlink/protocol/InteractionFrames.hpp>

#include <cstdint>
#include <string>
#include <vector>

using namespace castlink::protocol;

namespace
{

template <typename Frame> bool split(const std::vector<std::uint8_t> &bytes, Frame &out)
{
    std::uint16_t opcode = 0;
    MessageView body;
    if (!splitFrame(MessageView(bytes), opcode, body) || opcode != Frame::kOpcode)
        return false;
    return decodeBody(body, out);
}

/// [opcode:u16be][correlationId:u32be]... 레이아웃
void test_invoke_request_layout()
{
    PacketWriter payload;
    payload.writeU8(0x7F);

    InvokeRequestFrame f;
    f.correlationId = 0x01020304;
    f.endpoint = 1;
    f.clusterId = 0x0506;
    f.commandId = 0x0B;
    f.payload = payload.view();

    const auto bytes = encodeFrame(f);
    CHECK(bytes.size() == 2 + 4 + 2 + 4 + 4 + 1);
    CHECK(bytes[0] == 0x01 && bytes[1] == 0x01);
    CHECK(bytes[2] == 0x01 && bytes[5] == 0x04);

    InvokeRequestFrame back;
    CHECK(split(bytes, back));
    CHECK(back.correlationId == 0x01020304);
    CHECK(back.endpoint == 1);
    CHECK(back.clusterId == 0x0506);
    CHECK(back.commandId == 0x0B);
    CHECK(back.payload.size() == 1 && back.payload.bytes()[0] == 0x7F);
}

void test_status_response_message()
{
    StatusResponseFrame f;
    f.correlationId = 9;
    f.status = static_cast<std::uint8_t>(InteractionStatus::UnsupportedCluster);
    f.message = "cluster 0x1234";

    StatusResponseFrame back;
    CHECK(split(encodeFrame(f), back));
    CHECK(back.correlationId == 9);
    CHECK(!back.isSuccess());
    CHECK(back.status == 0xC3);
    CHECK(back.message == "cluster 0x1234");
}

/// 너무 긴 진단 메시지는 비워서 보냅니다.
void test_status_response_drops_oversized_message()
{
    StatusResponseFrame f;
    f.correlationId = 1;
    f.message = std::string(2000, 'x');

    StatusResponseFrame back;
    CHECK(split(encodeFrame(f), back));
    CHECK(back.isSuccess());
    CHECK(back.message.empty());
}

void test_subscribe_request_requires_full_body()
{
    SubscribeRequestFrame f;
    f.correlationId = 7;
    f.endpoint = 1;
    f.clusterId = 0x0008;
    f.attributeId = 0;
    f.minIntervalS = 1;
    f.maxIntervalS = 10;
    auto bytes = encodeFrame(f);

    SubscribeRequestFrame back;
    CHECK(split(bytes, back));
    CHECK(back.minIntervalS == 1 && back.maxIntervalS == 10);

    bytes.pop_back();
    CHECK(!split(bytes, back));
}

void test_report_and_subscribe_response()
{
    PacketWriter value;
    value.writeU8(1);
    value.writeU8(5);

    ReportDataFrame r;
    r.correlationId = 3;
    r.clusterId = 0x0008;
    r.attributeId = 0;
    r.payload = value.view();

    ReportDataFrame rb;
    const auto rbytes = encodeFrame(r);
    CHECK(split(rbytes, rb));
    CHECK(rb.correlationId == 3 && rb.clusterId == 0x0008);
    CHECK(rb.payload.size() == 2);

    SubscribeResponseFrame s;
    s.correlationId = 3;
    s.maxIntervalS = 12;
    SubscribeResponseFrame sb;
    CHECK(split(encodeFrame(s), sb));
    CHECK(sb.maxIntervalS == 12);
}

/// 고정 길이 body 뒤에 남는 바이트가 있으면 strict decode 가 실패합니다.
void test_decode_is_strict()
{
    auto bytes = encodeFrame(SubscriptionCancelFrame{42});
    SubscriptionCancelFrame back;
    CHECK(split(bytes, back));
    CHECK(back.correlationId == 42);

    bytes.push_back(0);
    CHECK(!split(bytes, back));
}

void test_split_rejects_short_frame()
{
    const std::vector<std::uint8_t> one{0x01};
    std::uint16_t opcode = 0;
    MessageView body;
    CHECK(!splitFrame(MessageView(one), opcode, body));
}

void test_dispatcher_routes_by_opcode()
{
    Dispatcher d;
    int invoke = 0;
    int status = 0;
    CHECK(d.registerHandler(kOpInvokeResponse, [&](const MessageView &) { ++invoke; }));
    CHECK(d.registerHandler(kOpStatusResponse, [&](const MessageView &) { ++status; }));
    CHECK(!d.registerHandler(kOpStatusResponse, [&](const MessageView &) {}));
    CHECK(!d.registerHandler(kOpReportData, {}));
    CHECK(d.handlerCount() == 2);

    CHECK(d.dispatch(kOpInvokeResponse, MessageView{}));
    CHECK(d.dispatch(kOpStatusResponse, MessageView{}));
    CHECK(!d.dispatch(kOpReportData, MessageView{}));
    CHECK(invoke == 1 && status == 1);

    CHECK(d.unregisterHandler(kOpInvokeResponse));
    CHECK(!d.dispatch(kOpInvokeResponse, MessageView{}));
}

} // namespace

int main()
{
    test_invoke_request_layout();
    test_status_response_message();
    test_status_response_drops_oversized_message();
    test_subscribe_request_requires_full_body();
    test_report_and_subscribe_response();
    test_decode_is_strict();
    test_split_rejects_short_frame();
    test_dispatcher_routes_by_opcode();
    return castlink::test::finish("protocol.interaction_frames");
}
