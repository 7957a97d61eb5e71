#include "protocol/wire_codec.h"
#include "mock_broker.h"
#include <cassert>
#include <cstring>
#include <iostream>
#include <type_traits>
#include <vector>
using namespace tap;
using namespace tap::protocol;
using tap::testing::Bytes;
using tap::testing::concat;
using tap::testing::message_frame;
using tap::testing::offsets_body;

void test_binary_reader_writer() {
    std::cout << "test_binary_reader_writer... ";
    uint8_t buf[64]; BinaryWriter w(buf);
    w.write_int16(-7); w.write_int32(567890); w.write_int64(1234567890123LL); w.write_string("log");
    BinaryReader r(buf, w.position());
    assert(r.read_int16() == -7); assert(r.read_int32() == 567890);
    assert(r.read_uint64() == 1234567890123ULL); assert(r.read_string() == "log");
    assert(!r.has_remaining(1));
    std::cout << "PASS\n";
}

void test_fetch_request_layout() {
    std::cout << "test_fetch_request_layout... ";
    Bytes req = WireEncoder::fetch_request("events", 3, 0x0102030405060708ULL, 65536);
    const uint8_t expected[] = {
        0, 0, 0, 26,                // size after this field
        0, 1,                       // FETCH
        0, 6, 'e', 'v', 'e', 'n', 't', 's',
        0, 0, 0, 3,                 // partition
        1, 2, 3, 4, 5, 6, 7, 8,     // offset
        0, 1, 0, 0,                 // max fetch size
    };
    assert(req.size() == sizeof(expected));
    assert(std::memcmp(req.data(), expected, sizeof(expected)) == 0);
    assert(req.size() == WireEncoder::request_size("events"));
    std::cout << "PASS\n";
}

void test_offsets_request_layout() {
    std::cout << "test_offsets_request_layout... ";
    Bytes req = WireEncoder::offsets_request("t", 0, kEarliestTime, 5);
    BinaryReader r(req.data(), req.size());
    assert(r.read_int32() == static_cast<int32_t>(req.size() - 4));
    assert(r.read_int16() == static_cast<int16_t>(RequestType::Offsets));
    assert(r.read_string() == "t");
    assert(r.read_int32() == 0);
    assert(static_cast<int64_t>(r.read_uint64()) == -2);
    assert(r.read_int32() == 5);
    assert(!r.has_remaining(1));

    Bytes latest = WireEncoder::offsets_request("t", 0, kLatestTime, 1);
    for (size_t i = 13; i < 21; ++i) assert(latest[i] == 0xFF); // time marker bytes
    std::cout << "PASS\n";
}

void test_encode_into_small_buffer() {
    std::cout << "test_encode_into_small_buffer... ";
    uint8_t buf[8];
    assert(WireEncoder::encode_fetch_request(buf, sizeof(buf), "topic", 0, 0, 100) == 0);
    std::cout << "PASS\n";
}

void test_decode_message() {
    std::cout << "test_decode_message... ";
    Bytes frame = message_frame(0xDEADBEEF, "hello world");
    auto msg = WireDecoder::decode_message(frame.data(), frame.size());
    assert(msg);
    assert(msg->checksum() == 0xDEADBEEF);
    assert(msg->total_length() == 4 + 11);
    assert(msg->frame_size() == frame.size());
    assert(msg->payload_view() == "hello world");
    assert(msg->offset() == 0);

    // Trailing bytes beyond the frame are not part of it
    Bytes two = concat({frame, message_frame(1, "x")});
    auto first = WireDecoder::decode_message(two.data(), two.size());
    assert(first && first->payload_view() == "hello world");
    std::cout << "PASS\n";
}

void test_decode_empty_payload() {
    std::cout << "test_decode_empty_payload... ";
    Bytes frame = message_frame(7, "");
    auto msg = WireDecoder::decode_message(frame.data(), frame.size());
    assert(msg && msg->total_length() == 4 && msg->payload_size() == 0);
    assert(msg->payload().empty());
    std::cout << "PASS\n";
}

void test_decode_rejects_malformed() {
    std::cout << "test_decode_rejects_malformed... ";
    Bytes frame = message_frame(42, "payload");
    // Shorter than the length field
    assert(!WireDecoder::decode_message(frame.data(), 3));
    // Declared length runs past the buffer
    assert(!WireDecoder::decode_message(frame.data(), frame.size() - 1));
    // Length field too small to hold the checksum
    Bytes tiny = {0, 0, 0, 2, 0xAA, 0xBB};
    assert(!WireDecoder::decode_message(tiny.data(), tiny.size()));
    std::cout << "PASS\n";
}

void test_scan_assigns_absolute_offsets() {
    std::cout << "test_scan_assigns_absolute_offsets... ";
    Bytes a = message_frame(1, "alpha"), b = message_frame(2, "bravo!"), c = message_frame(3, "c");
    Bytes payload = concat({a, b, c});
    std::vector<uint64_t> offsets;
    std::vector<std::string> bodies;
    auto res = WireDecoder::scan_messages(payload.data(), payload.size(), 1000,
        [&](const Message& m) { offsets.push_back(m.offset()); bodies.emplace_back(m.payload_view()); return true; });
    assert(res.complete);
    assert(res.count == 3);
    assert(res.consumed == payload.size());
    assert((offsets == std::vector<uint64_t>{1000, 1000 + a.size(), 1000 + a.size() + b.size()}));
    assert((bodies == std::vector<std::string>{"alpha", "bravo!", "c"}));
    std::cout << "PASS\n";
}

void test_scan_stops_at_truncated_frame() {
    std::cout << "test_scan_stops_at_truncated_frame... ";
    Bytes good = message_frame(9, "complete");
    Bytes cut = message_frame(9, "truncated-tail");
    cut.resize(cut.size() - 5);
    Bytes payload = concat({good, cut});
    int calls = 0;
    auto res = WireDecoder::scan_messages(payload.data(), payload.size(), 0,
        [&](const Message&) { ++calls; return true; });
    assert(!res.complete);
    assert(res.count == 1 && calls == 1);
    assert(res.consumed == good.size());
    std::cout << "PASS\n";
}

void test_scan_ignores_short_tail() {
    std::cout << "test_scan_ignores_short_tail... ";
    // Fewer than 4 trailing bytes cannot start a frame
    Bytes payload = concat({message_frame(1, "m"), Bytes{0, 0}});
    auto res = WireDecoder::scan_messages(payload.data(), payload.size(), 0, [](const Message&) { return true; });
    assert(res.complete && res.count == 1);
    assert(res.consumed == payload.size() - 2);
    std::cout << "PASS\n";
}

void test_scan_ends_at_declined_message() {
    std::cout << "test_scan_ends_at_declined_message... ";
    Bytes a = message_frame(1, "taken"), b = message_frame(2, "refused"), c = message_frame(3, "never seen");
    Bytes payload = concat({a, b, c});
    std::vector<std::string> seen;
    auto res = WireDecoder::scan_messages(payload.data(), payload.size(), 40, [&](const Message& m) {
        seen.emplace_back(m.payload_view());
        return m.payload_view() != "refused";
    });
    assert(res.complete && res.stopped);
    assert(res.count == 1);
    assert(res.consumed == a.size());
    assert((seen == std::vector<std::string>{"taken", "refused"}));
    std::cout << "PASS\n";
}

void test_message_only_built_by_decoder() {
    std::cout << "test_message_only_built_by_decoder... ";
    static_assert(!std::is_constructible_v<Message, uint32_t, const uint8_t*, uint32_t>);
    // The shortest frame the decoder accepts still has a well-formed payload.
    Bytes frame = {0, 0, 0, 4, 0, 0, 0, 9};
    auto msg = WireDecoder::decode_message(frame.data(), frame.size());
    assert(msg && msg->checksum() == 9);
    assert(msg->payload_size() == 0 && msg->payload().empty());
    std::cout << "PASS\n";
}

void test_decode_offsets() {
    std::cout << "test_decode_offsets... ";
    Bytes body = offsets_body(3, {900, 500, 100});
    auto two = WireDecoder::decode_offsets(body.data(), body.size(), 2);
    assert((two == std::vector<uint64_t>{900, 500}));
    auto all = WireDecoder::decode_offsets(body.data(), body.size(), 10);
    assert((all == std::vector<uint64_t>{900, 500, 100}));

    // Count field larger than what the buffer carries
    Bytes short_body = offsets_body(5, {42});
    auto partial = WireDecoder::decode_offsets(short_body.data(), short_body.size(), 10);
    assert((partial == std::vector<uint64_t>{42}));

    // No room for the count
    assert(WireDecoder::decode_offsets(body.data(), 3, 10).empty());
    std::cout << "PASS\n";
}

void test_owned_copy_survives_buffer_reuse() {
    std::cout << "test_owned_copy_survives_buffer_reuse... ";
    Bytes frame = message_frame(5, "keep me");
    auto msg = WireDecoder::decode_message(frame.data(), frame.size());
    assert(msg);
    OwnedMessage owned = msg->at_offset(77).to_owned();
    std::memset(frame.data(), 0, frame.size());
    assert(owned.offset == 77);
    assert(owned.checksum == 5);
    assert(owned.total_length == 11);
    assert(owned.payload_view() == "keep me");
    std::cout << "PASS\n";
}

int main() {
    std::cout << "═══════════════════════════════════════\n  TapMQ Wire Codec Tests\n═══════════════════════════════════════\n\n";
    test_binary_reader_writer();
    test_fetch_request_layout();
    test_offsets_request_layout();
    test_encode_into_small_buffer();
    test_decode_message();
    test_decode_empty_payload();
    test_decode_rejects_malformed();
    test_scan_assigns_absolute_offsets();
    test_scan_stops_at_truncated_frame();
    test_scan_ignores_short_tail();
    test_scan_ends_at_declined_message();
    test_message_only_built_by_decoder();
    test_decode_offsets();
    test_owned_copy_survives_buffer_reuse();
    std::cout << "\nAll tests passed! ✅\n"; return 0;
}
