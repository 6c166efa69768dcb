#pragma once
/**
 * @file frame_assembler.hpp
 * @brief Length-prefixed reassembly of RPC frames from a raw byte stream.
 *
 * @details
 * The RPC device usually hands back exactly one frame per read(2), but nothing
 * guarantees it: a large reply can arrive in pieces and two small ones can arrive
 * glued together. The assembler keeps the bytes between reads and releases a
 * frame only once its 4-byte little-endian length prefix is satisfied.
 *
 * Decoding rules:
 *   - A frame is FRAME_PREFIX_BYTES + total_length bytes.
 *   - total_length below the fixed header (16) or above max_frame_bytes is a
 *     framing error. Everything buffered is dropped, since there is no sentinel
 *     to resynchronize on, and feed() reports the error.
 *   - Complete frames are appended to @p frames in arrival order.
 *
 * @code
 *   xmmrpc::FrameAssembler asmb;
 *   std::vector<xmmrpc::wire::Bytes> frames;
 *   std::string err;
 *   if (!asmb.feed(buf, n, frames, err)) log_event(LogLevel::Warn, "framing_error", err);
 *   for (auto& f : frames) handle(f);
 * @endcode
 */

#include "xmmrpc/wire_codec.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace xmmrpc {

static constexpr uint32_t DEFAULT_MAX_FRAME_BYTES = 1024u * 1024u;

class FrameAssembler {
public:
    explicit FrameAssembler(uint32_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES)
    : max_frame_bytes_(max_frame_bytes) {}

    /**
     * @brief Append @p len bytes and move every complete frame into @p frames.
     * @return false on a framing error (buffer dropped, @p err set). Frames
     *         completed before the error are still delivered.
     */
    bool feed(const uint8_t* data, size_t len, std::vector<wire::Bytes>& frames, std::string& err);

    /// Drop any partial frame.
    void reset() { buf_.clear(); }

    /// Bytes waiting for the rest of their frame.
    size_t buffered() const { return buf_.size(); }

private:
    uint32_t max_frame_bytes_;
    wire::Bytes buf_;
};

} // namespace xmmrpc
