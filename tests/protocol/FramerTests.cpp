#include <coinchase/core/Error.hpp>
#include <coinchase/protocol/DelimiterFramer.hpp>
#include <coinchase/protocol/InboundCodec.hpp>
#include <coinchase/protocol/InboundStream.hpp>

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <span>
#include <string>
#include <variant>
#include <vector>

using coinchase::core::Errc;
using coinchase::game::AttackEvent;
using coinchase::game::InboundEvent;
using coinchase::game::Position;
using coinchase::game::StatusEvent;
using coinchase::protocol::InboundStream;

namespace {

std::vector<std::byte> frameOf(const InboundEvent &ev) {
    std::vector<std::byte> out;
    if (!coinchase::protocol::encodeInbound(ev, out)) {
        std::cerr << "[helper] encodeInbound failed\n";
    }
    return out;
}

std::vector<std::byte> sampleStream() {
    std::vector<std::byte> all;
    for (const InboundEvent &ev :
         {InboundEvent{StatusEvent{"alice", Position{3, 4}}},
          InboundEvent{AttackEvent{"bob", Position{1, 2}, Position{2, 2}}},
          InboundEvent{StatusEvent{"carol", Position{-7, 9}}}}) {
        const auto f = frameOf(ev);
        all.insert(all.end(), f.begin(), f.end());
    }
    return all;
}

bool checkSample(const std::vector<InboundEvent> &got, const char *tag) {
    if (got.size() != 3) {
        std::cerr << "[" << tag << "] events=" << got.size() << " expected=3\n";
        return false;
    }
    const auto *s0 = std::get_if<StatusEvent>(&got[0]);
    const auto *a1 = std::get_if<AttackEvent>(&got[1]);
    const auto *s2 = std::get_if<StatusEvent>(&got[2]);
    if (!s0 || s0->userId != "alice" || !(s0->position == Position{3, 4})) {
        std::cerr << "[" << tag << "] first event mismatch\n";
        return false;
    }
    if (!a1 || a1->userId != "bob" || !(a1->userPosition == Position{1, 2}) ||
        !(a1->attackPosition == Position{2, 2})) {
        std::cerr << "[" << tag << "] second event mismatch\n";
        return false;
    }
    if (!s2 || s2->userId != "carol" || !(s2->position == Position{-7, 9})) {
        std::cerr << "[" << tag << "] third event mismatch\n";
        return false;
    }
    return true;
}

bool test_every_split_point() {
    const auto bytes = sampleStream();
    const std::span<const std::byte> all(bytes);

    for (std::size_t cut = 1; cut < bytes.size(); ++cut) {
        InboundStream stream(64);
        std::vector<InboundEvent> got;
        const auto sink = [&got](InboundEvent &&ev) { got.push_back(std::move(ev)); };

        if (stream.feed(all.first(cut), sink) || stream.feed(all.subspan(cut), sink)) {
            std::cerr << "[split] unexpected error at cut=" << cut << "\n";
            return false;
        }
        if (!checkSample(got, "split")) {
            std::cerr << "[split] cut=" << cut << "\n";
            return false;
        }
        if (stream.pendingBytes() != 0) {
            std::cerr << "[split] leftover bytes at cut=" << cut << "\n";
            return false;
        }
    }
    return true;
}

bool test_byte_by_byte_with_wrap() {
    // 작은 링에서 여러 번 돌려 wrap-around 를 지나가게 한다
    InboundStream stream(32);
    std::vector<InboundEvent> got;
    const auto sink = [&got](InboundEvent &&ev) { got.push_back(std::move(ev)); };

    const auto bytes = sampleStream();
    for (int round = 0; round < 4; ++round) {
        got.clear();
        for (const std::byte b : bytes) {
            if (stream.feed(std::span<const std::byte>(&b, 1), sink)) {
                std::cerr << "[bytewise] unexpected error round=" << round << "\n";
                return false;
            }
        }
        if (!checkSample(got, "bytewise")) {
            return false;
        }
    }
    return stream.framesDecoded() == 12;
}

bool test_delimiter_valued_payloads() {
    const std::string uuid = "9b2e4f1a-7c3d-4e8b-a0f6-5d1c2b3a4e5f"; // 36 바이트
    const std::vector<InboundEvent> events{
        StatusEvent{"alice", Position{36, 4}},
        StatusEvent{uuid, Position{1, 2}},
        AttackEvent{"bob", Position{35, 36}, Position{36, 36}},
        StatusEvent{"a$b}c", Position{125, 36}},
    };

    std::vector<std::byte> bytes;
    for (const auto &ev : events) {
        const auto f = frameOf(ev);
        // 구분자는 프레임 끝에만 있어야 한다
        if (f.empty() || std::count(f.begin(), f.end(), std::byte{'$'}) != 1 ||
            f.back() != std::byte{'$'}) {
            std::cerr << "[escape] raw delimiter inside an encoded frame\n";
            return false;
        }
        bytes.insert(bytes.end(), f.begin(), f.end());
    }

    InboundStream stream(64);
    std::vector<InboundEvent> got;
    for (const std::byte b : bytes) {
        if (auto ec = stream.feed(std::span<const std::byte>(&b, 1),
                                  [&got](InboundEvent &&ev) { got.push_back(std::move(ev)); })) {
            std::cerr << "[escape] ec=" << ec.message() << " after events=" << got.size() << "\n";
            return false;
        }
    }
    if (got.size() != events.size()) {
        std::cerr << "[escape] events=" << got.size() << "\n";
        return false;
    }

    const auto *s0 = std::get_if<StatusEvent>(&got[0]);
    const auto *s1 = std::get_if<StatusEvent>(&got[1]);
    const auto *a2 = std::get_if<AttackEvent>(&got[2]);
    const auto *s3 = std::get_if<StatusEvent>(&got[3]);
    if (!s0 || !(s0->position == Position{36, 4}) || !s1 || s1->userId != uuid || !a2 ||
        !(a2->userPosition == Position{35, 36}) || !(a2->attackPosition == Position{36, 36}) ||
        !s3 || s3->userId != "a$b}c" || !(s3->position == Position{125, 36})) {
        std::cerr << "[escape] decoded fields mismatch\n";
        return false;
    }
    return true;
}

bool test_bad_escape_sequences() {
    // 끝에 매달린 escape, escape 뒤의 허용되지 않는 값
    const std::vector<std::vector<std::byte>> bad{
        {std::byte{0}, std::byte{0x7D}, std::byte{'$'}},
        {std::byte{0}, std::byte{0x7D}, std::byte{0x41}, std::byte{'$'}},
    };
    for (const auto &frame : bad) {
        InboundStream stream(64);
        std::size_t events = 0;
        if (stream.feed(frame, [&events](InboundEvent &&) { ++events; }) !=
                Errc::ProtocolViolation ||
            events != 0) {
            std::cerr << "[bad_escape] malformed escape should be a violation\n";
            return false;
        }
    }
    return true;
}

bool test_no_delimiter_within_chunk() {
    InboundStream stream(64);
    std::vector<InboundEvent> got;
    const std::vector<std::byte> junk(64, std::byte{'A'});

    const auto ec = stream.feed(junk, [&got](InboundEvent &&ev) { got.push_back(std::move(ev)); });
    if (ec != Errc::ProtocolViolation || !got.empty()) {
        std::cerr << "[oversize] ec=" << ec.message() << " events=" << got.size() << "\n";
        return false;
    }
    return true;
}

bool test_frame_body_too_long() {
    coinchase::protocol::DelimiterFramer framer(64);
    coinchase::buffer::RingBuffer rb(256);

    std::vector<std::byte> longFrame(70, std::byte{'B'});
    longFrame.push_back(std::byte{'$'});
    (void)rb.write(longFrame);

    coinchase::protocol::MessageView mv;
    if (framer.tryFrame(rb, mv) != coinchase::protocol::FrameResult::Invalid || !mv.empty()) {
        std::cerr << "[too_long] expected Invalid\n";
        return false;
    }

    // 경계값: 본문 63 바이트는 통과
    rb.clear();
    std::vector<std::byte> edge(63, std::byte{'C'});
    edge.push_back(std::byte{'$'});
    (void)rb.write(edge);
    if (framer.tryFrame(rb, mv) != coinchase::protocol::FrameResult::Framed || mv.size() != 63) {
        std::cerr << "[too_long] 63-byte frame should be framed, size=" << mv.size() << "\n";
        return false;
    }
    return rb.empty();
}

bool test_violation_keeps_earlier_frames() {
    InboundStream stream(64);
    std::vector<InboundEvent> got;

    auto bytes = frameOf(StatusEvent{"dave", Position{5, 5}});
    // 알 수 없는 type tag 7
    bytes.push_back(std::byte{7});
    bytes.push_back(std::byte{'x'});
    bytes.push_back(std::byte{'$'});
    // 위반 뒤의 프레임은 디코드되지 않아야 한다
    const auto tail = frameOf(StatusEvent{"erin", Position{1, 1}});
    bytes.insert(bytes.end(), tail.begin(), tail.end());

    const auto ec = stream.feed(bytes, [&got](InboundEvent &&ev) { got.push_back(std::move(ev)); });
    if (ec != Errc::ProtocolViolation) {
        std::cerr << "[unknown_tag] expected ProtocolViolation\n";
        return false;
    }
    if (got.size() != 1 || std::get<StatusEvent>(got[0]).userId != "dave") {
        std::cerr << "[unknown_tag] events=" << got.size() << "\n";
        return false;
    }
    return true;
}

bool test_empty_and_garbage_frames() {
    {
        InboundStream stream(64);
        const std::vector<std::byte> empty{std::byte{'$'}};
        if (stream.feed(empty, [](InboundEvent &&) {}) != Errc::ProtocolViolation) {
            std::cerr << "[empty] empty frame should be a violation\n";
            return false;
        }
    }
    {
        InboundStream stream(64);
        // type 0 + 끝나지 않은 varint tag
        const std::vector<std::byte> garbage{std::byte{0}, std::byte{0xFF}, std::byte{0xFF},
                                             std::byte{'$'}};
        if (stream.feed(garbage, [](InboundEvent &&) {}) != Errc::ProtocolViolation) {
            std::cerr << "[garbage] undecodable payload should be a violation\n";
            return false;
        }
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_every_split_point();
    ok = ok && test_byte_by_byte_with_wrap();
    ok = ok && test_delimiter_valued_payloads();
    ok = ok && test_bad_escape_sequences();
    ok = ok && test_no_delimiter_within_chunk();
    ok = ok && test_frame_body_too_long();
    ok = ok && test_violation_keeps_earlier_frames();
    ok = ok && test_empty_and_garbage_frames();

    if (!ok) {
        std::cerr << "Framer tests FAILED\n";
        return 1;
    }

    std::cout << "Framer tests PASSED\n";
    return 0;
}
