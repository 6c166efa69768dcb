// ============================================================================
// frame_assembler.cpp: implementation for frame_assembler.hpp
// ============================================================================

#include "xmmrpc/frame_assembler.hpp"
#include "xmmrpc/frame.hpp"   // FRAME_PREFIX_BYTES, read_length_prefix

namespace xmmrpc {

bool FrameAssembler::feed(const uint8_t* data, size_t len,
                          std::vector<wire::Bytes>& frames, std::string& err) {
    buf_.insert(buf_.end(), data, data + len);

    size_t off = 0;
    while (buf_.size() - off >= FRAME_PREFIX_BYTES) {
        const uint32_t total = read_length_prefix(buf_.data() + off);

        if (total < FRAME_HEADER_BYTES - FRAME_PREFIX_BYTES || total > max_frame_bytes_) {
            err = "bad_frame_length:" + std::to_string(total);
            buf_.clear();
            return false;
        }

        const size_t need = FRAME_PREFIX_BYTES + static_cast<size_t>(total);
        if (buf_.size() - off < need) break;          // wait for the rest

        frames.emplace_back(buf_.begin() + off, buf_.begin() + off + need);
        off += need;
    }

    buf_.erase(buf_.begin(), buf_.begin() + off);
    return true;
}

} // namespace xmmrpc
