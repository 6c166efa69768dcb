#pragma once
/**
 * @page xr-wire-codec xmmrpc Wire Codec
 * @file wire_codec.hpp
 * @brief Format-string driven encoder/decoder for the modem RPC field encoding.
 *
 * @details
 * PURPOSE
 * -------
 * Every RPC body exchanged with the modem firmware is a flat sequence of typed
 * fields. The firmware borrows the look of ASN.1 BER without following it: integers
 * are tagged primitives, strings are fixed-capacity buffers that always travel at
 * full size with a header saying how much of them is meaningful.
 *
 * This header turns a short format string plus a list of values into those bytes
 * (pack) and back (unpack). It knows nothing about frames, transactions or devices.
 *
 * FIELD ENCODINGS
 * ---------------
 * Generic integer (all scalars):
 *   [0x02][len][len bytes, big-endian]
 *   pack emits len=1/2/4 for B/H/L. unpack accepts any len and shifts the bytes in.
 *
 * Array field (strings and element arrays):
 *   [type][occupied count][int(slot bytes)][int(padding bytes)][payload][zero padding]
 *     type            0x55 / 0x56 / 0x57 for element width 1 / 2 / 4
 *     occupied count  one byte when < 128, else 0x80+n followed by n bytes LSB first
 *     slot bytes      capacity * width
 *     padding bytes   slot bytes - occupied * width
 *
 * FORMAT LANGUAGE
 * ---------------
 *   B H L        8/16/32-bit integer (pack); generic integer (unpack)
 *   n            generic integer (unpack only)
 *   s<cap>       byte array with capacity cap (value: Bytes)
 *   s            byte array, capacity not needed (unpack only)
 *   S<t><cap>    element array, t in B/H/L (value: Elements, one entry per element)
 *
 * Example:
 * @code
 *   xmmrpc::wire::Bytes body;
 *   std::string err;
 *   if (!xmmrpc::wire::pack("BLs24", {0u, 6u, xmmrpc::wire::Bytes{'a','b'}}, body, err)) {
 *       // err == "over_capacity:24", "too_few_args", ...
 *   }
 * @endcode
 *
 * ERRORS
 * ------
 * pack/unpack return false and set @p err to a stable token
 * (e.g. "bad_tag:0x31", "truncated", "over_capacity:260", "too_many_args").
 * The output argument is only assigned on success.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace xmmrpc {
namespace wire {

using Bytes    = std::vector<uint8_t>;
using Elements = std::vector<uint32_t>;

/// One field value: scalar integer, raw byte array, or element array.
using Value = std::variant<uint32_t, Bytes, Elements>;

static constexpr uint8_t INT_TAG       = 0x02;
static constexpr uint8_t ARRAY_TAG_U8  = 0x55;
static constexpr uint8_t ARRAY_TAG_U16 = 0x56;
static constexpr uint8_t ARRAY_TAG_U32 = 0x57;

/// Size of a packed 32-bit generic integer: tag + len + 4 value bytes.
static constexpr size_t INT32_FIELD_BYTES = 6;

/// Largest array slot (capacity * element width) pack() will lay out.
static constexpr uint32_t MAX_ARRAY_SLOT_BYTES = 16u * 1024u * 1024u;

/**
 * @brief Encode @p args according to @p fmt.
 * @return true on success; false with @p err set. @p out is untouched on failure.
 */
bool pack(const std::string& fmt, const std::vector<Value>& args, Bytes& out, std::string& err);

/**
 * @brief Decode @p len bytes at @p data according to @p fmt.
 *
 * Scalars come back as uint32_t, `s` arrays as Bytes (occupied bytes only),
 * `S<t>` arrays as Elements. Bytes after the last field are ignored.
 */
bool unpack(const std::string& fmt, const uint8_t* data, size_t len,
            std::vector<Value>& out, std::string& err);

bool unpack(const std::string& fmt, const Bytes& data, std::vector<Value>& out, std::string& err);

/// Append a generic integer of @p width (1, 2 or 4) bytes.
void put_int(Bytes& b, uint32_t v, uint8_t width = 4);

/**
 * @brief Read one generic integer starting at @p pos; advances @p pos on success.
 *
 * Lengths above 4 are accepted while the extra leading bytes are zero.
 */
bool take_int(const uint8_t* data, size_t len, size_t& pos, uint32_t& out, std::string& err);

/// Element width for an array type tag, 0 if the tag is not an array tag.
size_t element_width_for_tag(uint8_t tag);

} // namespace wire
} // namespace xmmrpc
