#pragma once
/**
 * @page xr-client xmmrpc Client
 * @file client.hpp
 * @brief Reader loop plus dispatcher over one transport: the object callers hold.
 *
 * @details
 * PURPOSE
 * -------
 * Client wires the pieces together for the lifetime of one device session:
 *
 *   transport.read() ──► FrameAssembler ──► parse_frame() ──► Dispatcher::handle_frame()
 *
 * The reader runs on its own thread. Completion callbacks run on the
 * CallbackPool so a slow callback never stalls the reader.
 *
 * LIFECYCLE
 * ---------
 *  - start()  launch callback workers and the reader thread.
 *  - stop()   interrupt the blocked read, join the reader, cancel every waiter
 *             ("cancelled:stopped"), drain and join the callback pool.
 *  - The transport interrupt is a latch, so a stopped client is not restarted;
 *    open a new transport and build a new Client.
 *  - On end-of-stream or a read error the reader exits, usable() turns false
 *    and every waiter is cancelled with "cancelled:transport_down".
 *
 * EXAMPLE
 * -------
 * @code
 *   xmmrpc::transport::DeviceTransport dev;
 *   std::string err;
 *   if (!dev.open("/dev/xmm0/rpc", err)) { ... }
 *
 *   xmmrpc::Client client(dev, {});
 *   client.start(err);
 *
 *   xmmrpc::Response r;
 *   if (client.call_async_blocking(code, xmmrpc::make_net_attach(), r, err)) {
 *       // r.code, r.body
 *   }
 *   client.stop();
 * @endcode
 */

#include "xmmrpc/callback_pool.hpp"
#include "xmmrpc/dispatcher.hpp"
#include "xmmrpc/frame_assembler.hpp"
#include "xmmrpc/transport/transport_base.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>
#include <utility>

namespace xmmrpc {

struct ClientConfig {
    size_t   read_chunk_bytes{32768};
    uint32_t max_frame_bytes{DEFAULT_MAX_FRAME_BYTES};
    size_t   callback_workers{2};
};

class Client {
public:
    Client(transport::ITransport& transport, ClientConfig cfg);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /// Launch workers. Fails with "already_started" or "client_stopped".
    bool start(std::string& err);

    /// Idempotent. Safe from any thread except a completion callback.
    void stop();

    bool running() const { return running_.load(); }

    /// False once the transport has failed.
    bool usable() const { return usable_.load(); }

    bool call_sync(uint32_t command_code, const wire::Bytes& body, Response& out, std::string& err);
    bool call_async(uint32_t command_code, const wire::Bytes& body, Callback callback,
                    uint8_t& tid, std::string& err);
    bool call_async_blocking(uint32_t command_code, const wire::Bytes& body,
                             Response& out, std::string& err);

    void set_unsolicited_handler(UnsolicitedHandler handler) {
        dispatcher_.set_unsolicited_handler(std::move(handler));
    }

    Dispatcher& dispatcher() { return dispatcher_; }

private:
    bool check_callable(std::string& err) const;
    void reader_main();

    transport::ITransport& transport_;
    ClientConfig cfg_;

    CallbackPool pool_;
    Dispatcher dispatcher_;
    FrameAssembler assembler_;

    std::thread reader_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> usable_{true};
};

} // namespace xmmrpc
