#include "../support/Check.hpp"

#include <castlink/protocol/MessageView.hpp>
#include <castlink/protocol/PacketReader.hpp>
#include <castlink/protocol/PacketWriter.hpp>

#include <cstdint>
#include <string>
#include <string_view>

using castlink::protocol::MessageView;
using castlink::protocol::PacketReader;
using castlink::protocol::PacketWriter;

namespace
{

void test_integers_are_big_endian()
{
    PacketWriter w;
    w.writeU16Be(0x0102);
    w.writeU32Be(0x03040506);
    w.writeU64Be(0x0708090A0B0C0D0EULL);

    const MessageView v = w.view();
    CHECK(v.size() == 14);
    const auto *p = v.bytes();
    CHECK(p[0] == 0x01 && p[1] == 0x02);
    CHECK(p[2] == 0x03 && p[5] == 0x06);
    CHECK(p[6] == 0x07 && p[13] == 0x0E);

    PacketReader r(v);
    std::uint16_t a = 0;
    std::uint32_t b = 0;
    std::uint64_t c = 0;
    CHECK(r.readU16Be(a) && a == 0x0102);
    CHECK(r.readU32Be(b) && b == 0x03040506);
    CHECK(r.readU64Be(c) && c == 0x0708090A0B0C0D0EULL);
    CHECK(r.expectEnd());
}

void test_float_and_bool()
{
    PacketWriter w;
    w.writeF32Be(1.5f);
    w.writeBool(true);

    PacketReader r(w.view());
    float f = 0.0f;
    bool b = false;
    CHECK(r.readF32Be(f) && f == 1.5f);
    CHECK(r.readBool(b) && b);
    CHECK(r.expectEnd());
}

/// bool 은 0/1 만 허용합니다.
void test_bool_rejects_other_values()
{
    PacketWriter w;
    w.writeU8(2);
    PacketReader r(w.view());
    bool b = false;
    CHECK(!r.readBool(b));
}

void test_string_u16_roundtrip()
{
    PacketWriter w;
    CHECK(w.writeStringU16Checked("Living Room"));

    PacketReader r(w.view());
    std::string s;
    CHECK(r.readStringU16(s));
    CHECK(s == "Living Room");
    CHECK(r.expectEnd());
}

/// 길이 필드보다 데이터가 모자라면 실패하고 읽기 위치는 그대로입니다.
void test_truncated_string_restores_position()
{
    PacketWriter w;
    w.writeU16Be(10);
    w.writeU8('a');

    PacketReader r(w.view());
    std::string_view s;
    CHECK(!r.readStringU16(s));
    CHECK(r.remaining() == 3);
}

void test_expect_end_catches_leftover()
{
    PacketWriter w;
    w.writeU16Be(1);
    w.writeU8(0xFF);

    PacketReader r(w.view());
    std::uint16_t x = 0;
    CHECK(r.readU16Be(x));
    CHECK(!r.expectEnd());
}

void test_short_reads_fail()
{
    PacketWriter w;
    w.writeU8(1);
    PacketReader r(w.view());
    std::uint32_t x = 0;
    CHECK(!r.readU32Be(x));

    PacketReader empty(MessageView{});
    std::uint8_t b = 0;
    CHECK(!empty.readU8(b));
    CHECK(empty.expectEnd());
}

void test_checked_string_fail_is_noop()
{
    PacketWriter w;
    w.writeU8(0xAA);
    const std::size_t before = w.size();
    const std::string big(200, 'x');
    CHECK(!w.writeStringU16Checked(big, 100));
    CHECK(w.size() == before);
}

void test_read_rest_takes_tail()
{
    PacketWriter w;
    w.writeU8(9);
    w.writeU8(1);
    w.writeU8(2);

    PacketReader r(w.view());
    std::uint8_t head = 0;
    MessageView tail;
    CHECK(r.readU8(head) && head == 9);
    CHECK(r.readRest(tail));
    CHECK(tail.size() == 2 && tail.bytes()[0] == 1);
    CHECK(r.expectEnd());
}

void test_take_moves_buffer()
{
    PacketWriter w;
    w.writeU16Be(0xBEEF);
    const auto bytes = w.take();
    CHECK(bytes.size() == 2);
    CHECK(w.size() == 0);

    const MessageView v(bytes);
    CHECK(v.toBytes() == bytes);
}

} // namespace

int main()
{
    test_integers_are_big_endian();
    test_float_and_bool();
    test_bool_rejects_other_values();
    test_string_u16_roundtrip();
    test_truncated_string_restores_position();
    test_expect_end_catches_leftover();
    test_short_reads_fail();
    test_checked_string_fail_is_noop();
    test_read_rest_takes_tail();
    test_take_moves_buffer();
    return castlink::test::finish("protocol.packet_codec");
}
