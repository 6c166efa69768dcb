#include <doctest/doctest.h>
#include "xmmrpc/dispatcher.hpp"
#include "fake_transport.hpp"

#include <atomic>
#include <thread>

using namespace xmmrpc;
using namespace xmmrpc_test;

// The pool is left stopped in most cases, so completion callbacks run inline
// inside handle_frame() and the assertions need no waiting.
namespace {

struct Rig {
    FakeTransport transport;
    CallbackPool pool;
    Dispatcher dispatcher{transport, pool};
};

Frame inbound(uint32_t code, uint32_t tag, const Bytes& body) {
    Frame f;
    f.command_code = code;
    f.channel_tag = tag;
    f.body = body;
    f.total_length = f.redundant_length = static_cast<uint32_t>(body.size() + 16);
    return f;
}

Frame last_written(const FakeTransport& t) {
    Frame f;
    std::string err;
    auto w = t.writes();
    REQUIRE(!w.empty());
    REQUIRE(parse_frame(w.back(), f, err));
    return f;
}

} // namespace

TEST_CASE("first frame acknowledges, second completes with the echo stripped") {
    Rig rig;
    int calls = 0;
    uint32_t got_code = 0;
    Bytes got_body;

    uint8_t tid = 0;
    std::string err;
    REQUIRE(rig.dispatcher.call_async(0x42, {}, [&](uint32_t code, const Bytes& body) {
        ++calls;
        got_code = code;
        got_body = body;
    }, tid, err));
    CHECK(tid == 1);

    const Frame sent = last_written(rig.transport);
    CHECK(sent.channel_tag == 0x11000101u);
    CHECK(sent.command_code == 0x42u);
    CHECK(sent.total_length == 22u);

    const uint32_t tag = channel_tag_for(tid);
    rig.dispatcher.handle_frame(inbound(0x42, tag, bytes_of("ack")));
    CHECK(calls == 0);
    CHECK(rig.dispatcher.is_pending(tid));
    CHECK(rig.dispatcher.is_acknowledged(tid));

    rig.dispatcher.handle_frame(inbound(0x43, tag, completion_body(tag, "done")));
    CHECK(calls == 1);
    CHECK(got_code == 0x43u);
    CHECK(got_body == bytes_of("done"));
    CHECK_FALSE(rig.dispatcher.is_pending(tid));
    CHECK(rig.dispatcher.pending_count() == 0);
}

TEST_CASE("a third frame for the same id is an unexpected transaction") {
    LogCapture logs;
    Rig rig;
    int calls = 0;
    uint8_t tid = 0;
    std::string err;
    REQUIRE(rig.dispatcher.call_async(0x10, {}, [&calls](uint32_t, const Bytes&) { ++calls; }, tid, err));

    const uint32_t tag = channel_tag_for(tid);
    rig.dispatcher.handle_frame(inbound(0x10, tag, {}));
    rig.dispatcher.handle_frame(inbound(0x10, tag, completion_body(tag, "x")));
    rig.dispatcher.handle_frame(inbound(0x10, tag, completion_body(tag, "y")));
    CHECK(calls == 1);
    CHECK(logs.contains("event=unexpected_tx tag=0x11000101"));
}

TEST_CASE("unknown ids and foreign tags leave state alone") {
    LogCapture logs;
    Rig rig;
    uint8_t tid = 0;
    std::string err;
    REQUIRE(rig.dispatcher.call_async(0x10, {}, [](uint32_t, const Bytes&) {}, tid, err));

    rig.dispatcher.handle_frame(inbound(0x10, channel_tag_for(9), bytes_of("zz")));
    CHECK(rig.dispatcher.pending_count() == 1);
    CHECK_FALSE(rig.dispatcher.is_acknowledged(tid));
    CHECK(logs.contains("event=unexpected_tx tag=0x11000109"));

    rig.dispatcher.handle_frame(inbound(0x10, 0x22000101u, {}));
    CHECK(rig.dispatcher.pending_count() == 1);
    CHECK(logs.contains("event=unexpected_tx tag=0x22000101"));
}

TEST_CASE("a frame for an unknown id does not answer a waiting sync call") {
    LogCapture logs;
    Rig rig;
    Response resp;
    std::string err;
    std::atomic<bool> returned{false};
    bool ok = false;

    std::thread caller([&] {
        ok = rig.dispatcher.call_sync(0x31, {}, resp, err);
        returned = true;
    });
    REQUIRE(wait_until([&rig] { return rig.transport.write_count() == 1; }));

    rig.dispatcher.handle_frame(inbound(0x31, channel_tag_for(9), bytes_of("wrong")));
    CHECK(logs.contains("event=unexpected_tx tag=0x11000109"));
    CHECK_FALSE(wait_until([&returned] { return returned.load(); }, 50));

    rig.dispatcher.handle_frame(inbound(0x31, CHANNEL_BASE, bytes_of("right")));
    caller.join();

    REQUIRE(ok);
    CHECK(resp.code == 0x31u);
    CHECK(resp.body == bytes_of("right"));
}

TEST_CASE("short completion body delivers an empty body") {
    Rig rig;
    Bytes got{1};
    uint8_t tid = 0;
    std::string err;
    REQUIRE(rig.dispatcher.call_async(0x10, {}, [&got](uint32_t, const Bytes& b) { got = b; }, tid, err));

    const uint32_t tag = channel_tag_for(tid);
    rig.dispatcher.handle_frame(inbound(0x10, tag, {}));
    rig.dispatcher.handle_frame(inbound(0x10, tag, Bytes{0x02, 0x04}));
    CHECK(got.empty());
}

TEST_CASE("completion callbacks run on the pool when it is running") {
    Rig rig;
    rig.pool.start(1);
    std::atomic<int> calls{0};
    std::atomic<bool> other_thread{false};
    const auto caller = std::this_thread::get_id();

    uint8_t tid = 0;
    std::string err;
    REQUIRE(rig.dispatcher.call_async(0x10, {}, [&](uint32_t, const Bytes&) {
        other_thread = (std::this_thread::get_id() != caller);
        ++calls;
    }, tid, err));

    const uint32_t tag = channel_tag_for(tid);
    rig.dispatcher.handle_frame(inbound(0x10, tag, {}));
    rig.dispatcher.handle_frame(inbound(0x10, tag, completion_body(tag, "")));
    CHECK(wait_until([&calls] { return calls.load() == 1; }));
    CHECK(other_thread.load());
    rig.pool.stop();
}

TEST_CASE("sync call uses the bare channel tag and returns the answer") {
    Rig rig;
    Response resp;
    std::string err;
    bool ok = false;

    std::thread caller([&] { ok = rig.dispatcher.call_sync(0x99, bytes_of("hi"), resp, err); });
    REQUIRE(wait_until([&rig] { return rig.transport.write_count() == 1; }));

    const Frame sent = last_written(rig.transport);
    CHECK(sent.channel_tag == CHANNEL_BASE);
    CHECK(sent.total_length == 18u);
    CHECK(sent.body == bytes_of("hi"));

    rig.dispatcher.handle_frame(inbound(0x99, CHANNEL_BASE, bytes_of("xy")));
    caller.join();

    REQUIRE(ok);
    CHECK(resp.code == 0x99u);
    CHECK(resp.body == bytes_of("xy"));
}

TEST_CASE("sync response without a waiter is dropped") {
    LogCapture logs;
    Rig rig;
    rig.dispatcher.handle_frame(inbound(0x99, CHANNEL_BASE, {}));
    CHECK(logs.contains("event=stray_sync_response"));
}

TEST_CASE("concurrent sync callers are served one at a time") {
    Rig rig;
    // Answer every sync request with its own code, as firmware does. The
    // waiter is registered before the write, so answering inline is fine.
    rig.transport.on_write = [&rig](const Bytes& raw) {
        Frame f;
        std::string e;
        if (parse_frame(raw, f, e) && f.channel_tag == CHANNEL_BASE)
            rig.dispatcher.handle_frame(inbound(f.command_code, CHANNEL_BASE, f.body));
    };

    constexpr int kThreads = 4;
    std::atomic<int> matched{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&rig, &matched, i] {
            for (int n = 0; n < 10; ++n) {
                const uint32_t code = static_cast<uint32_t>(0x100 + i);
                Response r;
                std::string e;
                if (rig.dispatcher.call_sync(code, {}, r, e) && r.code == code) ++matched;
            }
        });
    }
    for (auto& t : threads) t.join();
    CHECK(matched.load() == kThreads * 10);
}

TEST_CASE("call_async_blocking waits for the completion") {
    Rig rig;
    Response resp;
    std::string err;
    bool ok = false;

    std::thread caller([&] { ok = rig.dispatcher.call_async_blocking(0x55, {}, resp, err); });
    REQUIRE(wait_until([&rig] { return rig.transport.write_count() == 1; }));

    const uint32_t tag = last_written(rig.transport).channel_tag;
    rig.dispatcher.handle_frame(inbound(0x55, tag, bytes_of("ack")));
    rig.dispatcher.handle_frame(inbound(0x56, tag, completion_body(tag, "result")));
    caller.join();

    REQUIRE(ok);
    CHECK(resp.code == 0x56u);
    CHECK(resp.body == bytes_of("result"));
}

TEST_CASE("cancel_all releases blocked callers and refuses new calls") {
    Rig rig;
    std::string sync_err, async_err;
    bool sync_ok = true, async_ok = true;
    Response r1, r2;

    std::thread a([&] { sync_ok = rig.dispatcher.call_sync(0x1, {}, r1, sync_err); });
    std::thread b([&] { async_ok = rig.dispatcher.call_async_blocking(0x2, {}, r2, async_err); });
    REQUIRE(wait_until([&rig] { return rig.transport.write_count() == 2; }));

    rig.dispatcher.cancel_all("stopped");
    a.join();
    b.join();

    CHECK_FALSE(sync_ok);
    CHECK(sync_err == "cancelled:stopped");
    CHECK_FALSE(async_ok);
    CHECK(async_err == "cancelled:stopped");
    CHECK(rig.dispatcher.pending_count() == 0);

    uint8_t tid = 0;
    std::string err;
    CHECK_FALSE(rig.dispatcher.call_async(0x3, {}, [](uint32_t, const Bytes&) {}, tid, err));
    CHECK(err == "cancelled:stopped");
}

TEST_CASE("write failure removes the pending call") {
    Rig rig;
    rig.transport.fail_writes = true;
    uint8_t tid = 0;
    std::string err;
    CHECK_FALSE(rig.dispatcher.call_async(0x10, {}, [](uint32_t, const Bytes&) {}, tid, err));
    CHECK(err == "write_failed:EIO");
    CHECK(rig.dispatcher.pending_count() == 0);

    Response r;
    CHECK_FALSE(rig.dispatcher.call_sync(0x10, {}, r, err));
    CHECK(err == "write_failed:EIO");
}

TEST_CASE("all ids pending reports ids_exhausted, a freed id is reused") {
    Rig rig;
    std::string err;
    uint8_t tid = 0;
    for (int i = 0; i < 255; ++i)
        REQUIRE(rig.dispatcher.call_async(0x10, {}, [](uint32_t, const Bytes&) {}, tid, err));
    CHECK(rig.dispatcher.pending_count() == 255);

    CHECK_FALSE(rig.dispatcher.call_async(0x10, {}, [](uint32_t, const Bytes&) {}, tid, err));
    CHECK(err == "ids_exhausted");
    CHECK(rig.transport.write_count() == 255);

    const uint32_t tag = channel_tag_for(3);
    rig.dispatcher.handle_frame(inbound(0x10, tag, {}));
    rig.dispatcher.handle_frame(inbound(0x10, tag, completion_body(tag, "")));

    REQUIRE(rig.dispatcher.call_async(0x10, {}, [](uint32_t, const Bytes&) {}, tid, err));
    CHECK(tid == 3);
}

TEST_CASE("unsolicited frames reach the observer and change nothing else") {
    LogCapture logs;
    Rig rig;
    uint32_t seen_code = 0;
    Bytes seen_body;
    rig.dispatcher.set_unsolicited_handler([&](uint32_t code, const Bytes& body) {
        seen_code = code;
        seen_body = body;
    });

    rig.dispatcher.handle_frame(inbound(0x777, 0, bytes_of("ring")));
    CHECK(seen_code == 0x777u);
    CHECK(seen_body == bytes_of("ring"));
    CHECK(rig.dispatcher.pending_count() == 0);
    CHECK(logs.contains("event=unsolicited code=0x00000777"));
}

TEST_CASE("length mismatch is logged and the frame still routed") {
    LogCapture logs;
    Rig rig;
    int unsolicited = 0;
    rig.dispatcher.set_unsolicited_handler([&unsolicited](uint32_t, const Bytes&) { ++unsolicited; });

    Frame f = inbound(0x1, 0, {});
    f.total_length = 99;
    f.length_mismatch = true;
    rig.dispatcher.handle_frame(f);
    CHECK(logs.contains("event=length_mismatch total=99 redundant=16"));
    CHECK(unsolicited == 1);
}
