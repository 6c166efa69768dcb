#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal duplex byte-stream interface the RPC client runs on.
 *
 * Header-only on purpose; implementations live beside it.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace xmmrpc::transport {

enum class ReadResult : uint8_t { Ok = 0, Closed = 1, Cancelled = 2, Error = 3 };

/**
 * @brief Transport trait the reader loop and dispatcher rely on.
 *
 * Contract:
 *  - write(data,len) pushes bytes out in one call. A short write is reported
 *    through @p written and is not retried here. Returns false on error.
 *  - read(buf,cap) blocks until bytes arrive, the stream closes, an error
 *    occurs, or interrupt_pending_read() is called.
 *  - interrupt_pending_read() makes a blocked (or the next) read return
 *    Cancelled. It is a shutdown latch: once called, reads keep returning
 *    Cancelled.
 *  - Writes may come from several caller threads at once; implementations
 *    serialize them.
 */
class ITransport {
public:
    virtual ~ITransport() = default;
    virtual bool        write(const uint8_t* data, std::size_t len, std::size_t& written, std::string& err) = 0;
    virtual ReadResult  read(uint8_t* out, std::size_t cap, std::size_t& out_len, std::string& err) = 0;
    virtual void        interrupt_pending_read() = 0;
    virtual const char* name() const = 0;
};

} // namespace xmmrpc::transport
