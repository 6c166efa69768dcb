#pragma once
/**
 * @file frame.hpp
 * @brief RPC frame envelope: build outbound frames, parse inbound ones.
 *
 * @details
 * Wire layout (all integers are wire::put_int 32-bit fields unless noted):
 *
 * @code
 *   [total_length  u32 little-endian]      raw, not a generic integer
 *   [int(total_length)]                    redundant copy
 *   [int(command_code)]
 *   [channel_tag   u32 big-endian]         raw
 *   [int(channel_tag)]                     only when a transaction id is set
 *   [body ...]
 * @endcode
 *
 * total_length counts every byte after the leading 4-byte length field:
 * len(body) + 16, plus 6 with a transaction id.
 *
 * The channel tag is CHANNEL_BASE with the transaction id in its low byte.
 * Inbound tags classify the frame:
 *   0                      unsolicited push from the firmware
 *   CHANNEL_BASE           response on the synchronous lane
 *   CHANNEL_BASE | id      ack or completion of transaction `id`
 */

#include "xmmrpc/wire_codec.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace xmmrpc {

static constexpr uint32_t CHANNEL_BASE = 0x11000100u;
static constexpr uint32_t CHANNEL_MASK = 0xFFFFFF00u;

/// Bytes before the body of a frame without / with an embedded transaction id.
static constexpr size_t FRAME_HEADER_BYTES     = 20;
static constexpr size_t FRAME_HEADER_TID_BYTES = 26;

/// Leading little-endian length field, not counted in total_length.
static constexpr size_t FRAME_PREFIX_BYTES = 4;

/// Completion bodies start with the echoed int(channel_tag).
static constexpr size_t COMPLETION_ECHO_BYTES = wire::INT32_FIELD_BYTES;

struct Frame {
    uint32_t total_length{0};
    uint32_t redundant_length{0};
    uint32_t command_code{0};
    uint32_t channel_tag{0};
    std::optional<uint32_t> embedded_tid;   ///< peeked from the body, body is not stripped
    wire::Bytes body;
    bool length_mismatch{false};            ///< total_length != redundant_length

    uint8_t tid() const { return static_cast<uint8_t>(channel_tag & 0xFF); }
};

inline uint32_t channel_tag_for(uint8_t tid) { return CHANNEL_BASE | tid; }

/// Header bytes for a body of @p body_len bytes.
wire::Bytes build_header(uint32_t command_code, uint8_t tid, size_t body_len);

/// Header + body, ready for ITransport::write.
wire::Bytes build_frame(uint32_t command_code, uint8_t tid, const wire::Bytes& body);

/**
 * @brief Parse one complete frame.
 *
 * A mismatch between the two length fields sets Frame::length_mismatch and still
 * succeeds. Fails ("short_frame", "bad_tag:..", "truncated") when the fixed header
 * cannot be read.
 */
bool parse_frame(const uint8_t* data, size_t len, Frame& out, std::string& err);

bool parse_frame(const wire::Bytes& data, Frame& out, std::string& err);

/// Read the little-endian length prefix at @p p (4 bytes).
uint32_t read_length_prefix(const uint8_t* p);

} // namespace xmmrpc
