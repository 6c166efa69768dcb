// ============================================================================
// client.cpp: implementation for client.hpp
// ============================================================================

#include "xmmrpc/client.hpp"
#include "xmmrpc/frame.hpp"
#include "xmmrpc/log.hpp"

#include <vector>

namespace xmmrpc {

Client::Client(transport::ITransport& transport, ClientConfig cfg)
: transport_(transport),
  cfg_(cfg),
  dispatcher_(transport, pool_),
  assembler_(cfg.max_frame_bytes) {
    if (cfg_.read_chunk_bytes == 0) cfg_.read_chunk_bytes = 32768;
}

Client::~Client() { stop(); }

bool Client::start(std::string& err) {
    if (stopped_.load()) { err = "client_stopped"; return false; }
    if (running_.exchange(true)) { err = "already_started"; return false; }

    pool_.start(cfg_.callback_workers);
    reader_ = std::thread(&Client::reader_main, this);

    log_event(LogLevel::Info, "client_started",
              std::string("transport=") + transport_.name() +
              " workers=" + std::to_string(cfg_.callback_workers));
    return true;
}

void Client::stop() {
    if (!running_.load() || stopping_.exchange(true)) return;

    transport_.interrupt_pending_read();
    if (reader_.joinable()) reader_.join();

    dispatcher_.cancel_all("stopped");
    pool_.stop();

    stopped_ = true;
    running_ = false;
    log_event(LogLevel::Info, "client_stopped");
}

bool Client::check_callable(std::string& err) const {
    if (!running_.load() || stopping_.load()) { err = "not_running"; return false; }
    if (!usable_.load()) { err = "cancelled:transport_down"; return false; }
    return true;
}

bool Client::call_sync(uint32_t command_code, const wire::Bytes& body, Response& out, std::string& err) {
    if (!check_callable(err)) return false;
    return dispatcher_.call_sync(command_code, body, out, err);
}

bool Client::call_async(uint32_t command_code, const wire::Bytes& body, Callback callback,
                        uint8_t& tid, std::string& err) {
    if (!check_callable(err)) return false;
    return dispatcher_.call_async(command_code, body, std::move(callback), tid, err);
}

bool Client::call_async_blocking(uint32_t command_code, const wire::Bytes& body,
                                 Response& out, std::string& err) {
    if (!check_callable(err)) return false;
    return dispatcher_.call_async_blocking(command_code, body, out, err);
}

// ---------------------------------------------------------------------------
// Reader loop
// ---------------------------------------------------------------------------

void Client::reader_main() {
    std::vector<uint8_t> chunk(cfg_.read_chunk_bytes);
    std::vector<wire::Bytes> frames;

    for (;;) {
        size_t got = 0;
        std::string err;
        const transport::ReadResult rr = transport_.read(chunk.data(), chunk.size(), got, err);

        if (rr == transport::ReadResult::Cancelled) {
            if (!stopping_.load()) {
                // Someone else interrupted the transport; nothing more will arrive.
                log_event(LogLevel::Warn, "read_cancelled");
                usable_ = false;
                dispatcher_.cancel_all("transport_down");
            }
            return;
        }
        if (rr == transport::ReadResult::Closed || rr == transport::ReadResult::Error) {
            log_event(LogLevel::Error, "transport_down",
                      rr == transport::ReadResult::Closed ? std::string("reason=closed")
                                                          : "reason=" + err);
            usable_ = false;
            dispatcher_.cancel_all("transport_down");
            return;
        }

        frames.clear();
        std::string ferr;
        if (!assembler_.feed(chunk.data(), got, frames, ferr))
            log_event(LogLevel::Warn, "framing_error", "reason=" + ferr);

        for (const auto& raw : frames) {
            Frame frame;
            std::string perr;
            if (!parse_frame(raw, frame, perr)) {
                log_event(LogLevel::Warn, "bad_frame",
                          "reason=" + perr + " bytes=" + to_hex(raw.data(), raw.size()));
                continue;
            }
            dispatcher_.handle_frame(frame);
        }
    }
}

} // namespace xmmrpc
