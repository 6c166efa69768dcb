#pragma once
/**
 * @page xr-dispatcher xmmrpc Transaction Dispatcher
 * @file dispatcher.hpp
 * @brief Transaction ids, pending calls, and the ack/complete state machine.
 *
 * @details
 * PURPOSE
 * -------
 * The modem answers RPC calls on two lanes that share one device:
 *
 *  - Synchronous lane: the request carries no transaction id (channel tag
 *    CHANNEL_BASE). The firmware answers once, on CHANNEL_BASE.
 *  - Transaction lane: the request carries id 1..255 (CHANNEL_BASE | id). The
 *    firmware answers twice with the same tag: first an acknowledgment, later
 *    the completion whose body starts with the echoed int(tag).
 *
 * The dispatcher owns everything needed to pair those answers with callers:
 * the id allocator, the pending-call table, and the waiter for the sync lane.
 * It writes requests to the transport itself; inbound frames are handed to it
 * by the reader loop through handle_frame().
 *
 * CALL STYLES
 * -----------
 *  - call_sync()            tid 0; blocks until the sync-lane answer arrives.
 *                           Callers are serialized here, so any thread may use it.
 *  - call_async()           allocates a tid, returns at once; the callback runs
 *                           on the CallbackPool after the completion frame.
 *  - call_async_blocking()  call_async() plus a per-call wait; safe concurrently.
 *
 * TRANSACTION LIFECYCLE
 * ---------------------
 * @code
 *   call_async ──► PendingCall{acknowledged=false}
 *   frame #1 (tag=base|id) ──► acknowledged=true, ack payload stored, no callback
 *   frame #2 (tag=base|id) ──► callback(code, body[6:]) queued, PendingCall erased
 *   frame #3 / unknown id  ──► "unexpected_tx" logged, dropped
 * @endcode
 *
 * ERRORS
 * ------
 * Calls return false with a stable token in @p err:
 *   "ids_exhausted"       all 255 ids pending
 *   "write_failed:<why>"  transport write error (the pending call is removed)
 *   "cancelled:<reason>"  cancel_all() ran before the answer arrived
 *
 * THREADING
 * ---------
 * One mutex guards the table and the sync waiter. Callbacks and cancel hooks
 * never run under it.
 */

#include "xmmrpc/callback_pool.hpp"
#include "xmmrpc/frame.hpp"
#include "xmmrpc/tid_allocator.hpp"
#include "xmmrpc/transport/transport_base.hpp"
#include "xmmrpc/wire_codec.hpp"

#include "etl/flat_map.h"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace xmmrpc {

/// Result of a blocking call.
struct Response {
    uint32_t code{0};
    wire::Bytes body;
};

/// Completion callback: command code and completion body without the echoed tag.
using Callback = std::function<void(uint32_t code, const wire::Bytes& body)>;

/// Invoked instead of the callback when the call is cancelled.
using CancelHook = std::function<void(const std::string& reason)>;

/// Observer for frames the firmware pushes on its own (tag 0).
using UnsolicitedHandler = std::function<void(uint32_t code, const wire::Bytes& body)>;

struct PendingCall {
    uint8_t tid{0};
    uint32_t command_code{0};
    Callback callback;
    CancelHook on_cancel;
    bool acknowledged{false};
    uint32_t ack_code{0};
    wire::Bytes ack_body;
};

class Dispatcher {
public:
    Dispatcher(transport::ITransport& transport, CallbackPool& pool);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Send on the sync lane and wait for its answer.
    bool call_sync(uint32_t command_code, const wire::Bytes& body, Response& out, std::string& err);

    /// Register a transaction and send it. @p tid receives the allocated id.
    bool call_async(uint32_t command_code, const wire::Bytes& body, Callback callback,
                    uint8_t& tid, std::string& err);

    /// call_async() and wait for the completion.
    bool call_async_blocking(uint32_t command_code, const wire::Bytes& body,
                             Response& out, std::string& err);

    /// Route one parsed inbound frame. Called by the reader loop.
    void handle_frame(const Frame& frame);

    /**
     * @brief Fail every waiter and drop every pending call.
     *
     * Blocked callers return "cancelled:<reason>"; plain async callbacks are
     * dropped. Later calls are refused with the same error.
     */
    void cancel_all(const std::string& reason);

    void set_unsolicited_handler(UnsolicitedHandler handler);

    bool is_pending(uint8_t tid) const;
    bool is_acknowledged(uint8_t tid) const;
    size_t pending_count() const;

private:
    using PendingTable = etl::flat_map<uint8_t, PendingCall, TidAllocator::LAST>;

    struct SyncWaiter {
        bool done{false};
        bool ok{false};
        Response response;
        std::string err;
    };

    bool start_call(uint32_t command_code, const wire::Bytes& body, Callback callback,
                    CancelHook on_cancel, uint8_t& tid, std::string& err);
    bool send(uint32_t command_code, uint8_t tid, const wire::Bytes& body, std::string& err);
    void deliver_sync(const Frame& frame);
    void advance_transaction(const Frame& frame);
    void deliver_unsolicited(const Frame& frame);

    transport::ITransport& transport_;
    CallbackPool& pool_;

    mutable std::mutex mtx_;
    PendingTable pending_;
    TidAllocator tids_;
    UnsolicitedHandler unsolicited_;

    std::mutex sync_lane_mtx_;               ///< one sync call on the wire at a time
    std::condition_variable sync_cv_;
    SyncWaiter* sync_waiter_{nullptr};

    bool cancelled_{false};
    std::string cancel_reason_;
};

} // namespace xmmrpc
