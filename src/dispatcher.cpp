// ============================================================================
// dispatcher.cpp: implementation for dispatcher.hpp
// For the lane/lifecycle overview see the header. Tests: tests/test_dispatcher.cpp.
// ============================================================================

#include "xmmrpc/dispatcher.hpp"
#include "xmmrpc/log.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace xmmrpc {

namespace {

// Shared between a blocking caller and the callback/cancel hook it registered.
struct BlockingState {
    std::mutex mtx;
    std::condition_variable cv;
    bool done{false};
    bool ok{false};
    Response response;
    std::string err;
};

std::string tx_detail(uint8_t tid, uint32_t code) {
    return "tag=" + hex32(channel_tag_for(tid)) + " code=" + hex32(code);
}

} // namespace

Dispatcher::Dispatcher(transport::ITransport& transport, CallbackPool& pool)
: transport_(transport), pool_(pool) {}

// ---------------------------------------------------------------------------
// Outbound
// ---------------------------------------------------------------------------

bool Dispatcher::send(uint32_t command_code, uint8_t tid, const wire::Bytes& body, std::string& err) {
    const wire::Bytes frame = build_frame(command_code, tid, body);

    size_t written = 0;
    std::string werr;
    if (!transport_.write(frame.data(), frame.size(), written, werr)) {
        err = werr.rfind("write_failed", 0) == 0 ? werr : "write_failed:" + werr;
        log_event(LogLevel::Error, "write_failed", tx_detail(tid, command_code) + " reason=" + werr);
        return false;
    }
    if (written < frame.size()) {
        // Not retried; the firmware decides what a truncated request means.
        log_event(LogLevel::Warn, "short_write",
                  tx_detail(tid, command_code) + " wrote=" + std::to_string(written) +
                  " len=" + std::to_string(frame.size()));
    }
    log_event(LogLevel::Debug, "sent", tx_detail(tid, command_code) + " len=" + std::to_string(frame.size()));
    return true;
}

bool Dispatcher::call_sync(uint32_t command_code, const wire::Bytes& body, Response& out, std::string& err) {
    std::lock_guard<std::mutex> lane(sync_lane_mtx_);

    SyncWaiter waiter;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (cancelled_) { err = "cancelled:" + cancel_reason_; return false; }
        sync_waiter_ = &waiter;
    }

    if (!send(command_code, 0, body, err)) {
        std::lock_guard<std::mutex> lock(mtx_);
        sync_waiter_ = nullptr;
        return false;
    }

    std::unique_lock<std::mutex> lock(mtx_);
    sync_cv_.wait(lock, [&waiter] { return waiter.done; });
    sync_waiter_ = nullptr;

    if (!waiter.ok) { err = waiter.err; return false; }
    out = std::move(waiter.response);
    return true;
}

bool Dispatcher::start_call(uint32_t command_code, const wire::Bytes& body, Callback callback,
                            CancelHook on_cancel, uint8_t& tid, std::string& err) {
    uint8_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (cancelled_) { err = "cancelled:" + cancel_reason_; return false; }

        auto next = tids_.allocate([this](uint8_t candidate) {
            return pending_.find(candidate) != pending_.end();
        });
        if (!next) {
            err = "ids_exhausted";
            log_event(LogLevel::Warn, "ids_exhausted", "pending=" + std::to_string(pending_.size()));
            return false;
        }
        id = *next;

        PendingCall pc;
        pc.tid = id;
        pc.command_code = command_code;
        pc.callback = std::move(callback);
        pc.on_cancel = std::move(on_cancel);
        pending_.insert(PendingTable::value_type(id, std::move(pc)));
    }

    if (!send(command_code, id, body, err)) {
        std::lock_guard<std::mutex> lock(mtx_);
        pending_.erase(id);
        return false;
    }

    tid = id;
    return true;
}

bool Dispatcher::call_async(uint32_t command_code, const wire::Bytes& body, Callback callback,
                            uint8_t& tid, std::string& err) {
    return start_call(command_code, body, std::move(callback), CancelHook{}, tid, err);
}

bool Dispatcher::call_async_blocking(uint32_t command_code, const wire::Bytes& body,
                                     Response& out, std::string& err) {
    auto state = std::make_shared<BlockingState>();

    Callback done = [state](uint32_t code, const wire::Bytes& payload) {
        std::lock_guard<std::mutex> lock(state->mtx);
        state->response.code = code;
        state->response.body = payload;
        state->ok = true;
        state->done = true;
        state->cv.notify_all();
    };
    CancelHook cancelled = [state](const std::string& reason) {
        std::lock_guard<std::mutex> lock(state->mtx);
        state->err = reason;
        state->ok = false;
        state->done = true;
        state->cv.notify_all();
    };

    uint8_t tid = 0;
    if (!start_call(command_code, body, std::move(done), std::move(cancelled), tid, err))
        return false;

    std::unique_lock<std::mutex> lock(state->mtx);
    state->cv.wait(lock, [&state] { return state->done; });

    if (!state->ok) { err = state->err; return false; }
    out = std::move(state->response);
    return true;
}

// ---------------------------------------------------------------------------
// Inbound
// ---------------------------------------------------------------------------

void Dispatcher::handle_frame(const Frame& frame) {
    if (frame.length_mismatch) {
        log_event(LogLevel::Warn, "length_mismatch",
                  "total=" + std::to_string(frame.total_length) +
                  " redundant=" + std::to_string(frame.redundant_length));
    }

    const uint32_t tag = frame.channel_tag;
    if (tag == 0) {
        deliver_unsolicited(frame);
    } else if (tag == CHANNEL_BASE) {
        deliver_sync(frame);
    } else if ((tag & CHANNEL_MASK) == CHANNEL_BASE) {
        advance_transaction(frame);
    } else {
        log_event(LogLevel::Warn, "unexpected_tx", "tag=" + hex32(tag) + " code=" + hex32(frame.command_code));
    }
}

void Dispatcher::deliver_unsolicited(const Frame& frame) {
    log_event(LogLevel::Info, "unsolicited",
              "code=" + hex32(frame.command_code) + " body=" + to_hex(frame.body.data(), frame.body.size()));

    UnsolicitedHandler handler;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        handler = unsolicited_;
    }
    if (!handler) return;

    const uint32_t code = frame.command_code;
    wire::Bytes body = frame.body;
    if (!pool_.post([handler, code, body] { handler(code, body); }))
        handler(code, body);
}

void Dispatcher::deliver_sync(const Frame& frame) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!sync_waiter_ || sync_waiter_->done) {
        log_event(LogLevel::Warn, "stray_sync_response", "code=" + hex32(frame.command_code));
        return;
    }
    log_event(LogLevel::Debug, "sync_response",
              "code=" + hex32(frame.command_code) + " body=" + to_hex(frame.body.data(), frame.body.size()));
    sync_waiter_->response.code = frame.command_code;
    sync_waiter_->response.body = frame.body;
    sync_waiter_->ok = true;
    sync_waiter_->done = true;
    sync_cv_.notify_all();
}

void Dispatcher::advance_transaction(const Frame& frame) {
    const uint8_t tid = frame.tid();
    Callback callback;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = pending_.find(tid);
        if (it == pending_.end()) {
            log_event(LogLevel::Warn, "unexpected_tx", tx_detail(tid, frame.command_code));
            return;
        }

        PendingCall& pc = it->second;
        if (!pc.acknowledged) {
            pc.acknowledged = true;
            pc.ack_code = frame.command_code;
            pc.ack_body = frame.body;
            log_event(LogLevel::Debug, "tx_acknowledged", tx_detail(tid, frame.command_code));
            return;
        }

        callback = std::move(pc.callback);
        pending_.erase(it);
    }

    log_event(LogLevel::Debug, "tx_completed", tx_detail(tid, frame.command_code));
    if (!callback) return;

    const uint32_t code = frame.command_code;
    wire::Bytes body;
    if (frame.body.size() > COMPLETION_ECHO_BYTES)
        body.assign(frame.body.begin() + COMPLETION_ECHO_BYTES, frame.body.end());

    if (!pool_.post([callback, code, body] { callback(code, body); })) {
        // No workers (pool stopped or never started): run here so a blocking
        // caller is not left waiting forever.
        log_event(LogLevel::Debug, "callback_inline", tx_detail(tid, code));
        callback(code, body);
    }
}

// ---------------------------------------------------------------------------
// Control
// ---------------------------------------------------------------------------

void Dispatcher::cancel_all(const std::string& reason) {
    std::vector<CancelHook> hooks;
    size_t dropped = 0;
    const std::string err = "cancelled:" + reason;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        cancelled_ = true;
        cancel_reason_ = reason;

        if (sync_waiter_ && !sync_waiter_->done) {
            sync_waiter_->ok = false;
            sync_waiter_->err = err;
            sync_waiter_->done = true;
        }

        for (auto& entry : pending_) {
            if (entry.second.on_cancel) hooks.push_back(std::move(entry.second.on_cancel));
            else ++dropped;
        }
        pending_.clear();
    }
    sync_cv_.notify_all();

    for (auto& hook : hooks) hook(err);

    log_event(LogLevel::Info, "cancelled",
              "reason=" + reason + " waiters=" + std::to_string(hooks.size()) +
              " dropped_callbacks=" + std::to_string(dropped));
}

void Dispatcher::set_unsolicited_handler(UnsolicitedHandler handler) {
    std::lock_guard<std::mutex> lock(mtx_);
    unsolicited_ = std::move(handler);
}

bool Dispatcher::is_pending(uint8_t tid) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return pending_.find(tid) != pending_.end();
}

bool Dispatcher::is_acknowledged(uint8_t tid) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = pending_.find(tid);
    return it != pending_.end() && it->second.acknowledged;
}

size_t Dispatcher::pending_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return pending_.size();
}

} // namespace xmmrpc
