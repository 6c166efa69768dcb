// ============================================================================
// frame.cpp: implementation for frame.hpp
// ============================================================================

#include "xmmrpc/frame.hpp"

namespace xmmrpc {

static inline void put_u32_le(wire::Bytes& b, uint32_t v) {
    b.push_back(static_cast<uint8_t>(v & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

static inline void put_u32_be(wire::Bytes& b, uint32_t v) {
    b.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    b.push_back(static_cast<uint8_t>(v & 0xFF));
}

uint32_t read_length_prefix(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0])) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

wire::Bytes build_header(uint32_t command_code, uint8_t tid, size_t body_len) {
    const uint32_t tag = channel_tag_for(tid);
    uint32_t total = static_cast<uint32_t>(body_len + FRAME_HEADER_BYTES - FRAME_PREFIX_BYTES);
    if (tid) total += wire::INT32_FIELD_BYTES;

    wire::Bytes h;
    h.reserve(FRAME_HEADER_TID_BYTES);
    put_u32_le(h, total);
    wire::put_int(h, total);
    wire::put_int(h, command_code);
    put_u32_be(h, tag);
    if (tid) wire::put_int(h, tag);
    return h;
}

wire::Bytes build_frame(uint32_t command_code, uint8_t tid, const wire::Bytes& body) {
    wire::Bytes f = build_header(command_code, tid, body.size());
    f.insert(f.end(), body.begin(), body.end());
    return f;
}

bool parse_frame(const uint8_t* data, size_t len, Frame& out, std::string& err) {
    if (len < FRAME_HEADER_BYTES) { err = "short_frame:" + std::to_string(len); return false; }

    Frame f;
    f.total_length = read_length_prefix(data);

    size_t pos = FRAME_PREFIX_BYTES;
    if (!wire::take_int(data, len, pos, f.redundant_length, err)) return false;
    if (!wire::take_int(data, len, pos, f.command_code, err)) return false;
    if (pos + 4 > len) { err = "truncated"; return false; }

    f.channel_tag = (static_cast<uint32_t>(data[pos]) << 24) |
                    (static_cast<uint32_t>(data[pos + 1]) << 16) |
                    (static_cast<uint32_t>(data[pos + 2]) << 8) |
                    (static_cast<uint32_t>(data[pos + 3]));
    pos += 4;

    f.length_mismatch = (f.total_length != f.redundant_length);
    f.body.assign(data + pos, data + len);

    // Peek at the echoed tag without consuming it; completion handling strips it.
    if ((f.channel_tag & CHANNEL_MASK) == CHANNEL_BASE && f.tid() != 0) {
        size_t peek = 0;
        uint32_t echoed = 0;
        std::string ignored;
        if (wire::take_int(f.body.data(), f.body.size(), peek, echoed, ignored))
            f.embedded_tid = echoed;
    }

    out = std::move(f);
    return true;
}

bool parse_frame(const wire::Bytes& data, Frame& out, std::string& err) {
    return parse_frame(data.data(), data.size(), out, err);
}

} // namespace xmmrpc
