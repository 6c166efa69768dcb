// ============================================================================
// wire_codec.cpp: implementation for wire_codec.hpp
// For the field layouts see the header. Tests live in tests/test_wire_codec.cpp.
// ============================================================================

#include "xmmrpc/wire_codec.hpp"
#include "xmmrpc/log.hpp"   // to_hex for error details

#include <cctype>

namespace xmmrpc {
namespace wire {

// ---------------------------------------------------------------------------
// Format scanning helpers
// ---------------------------------------------------------------------------

// Width of a scalar format character, 0 if it is not one.
static size_t scalar_width(char c) {
    switch (c) {
        case 'B': return 1;
        case 'H': return 2;
        case 'L': return 4;
        default:  return 0;
    }
}

// Consume a run of decimal digits at fmt[i]. Returns false when there are none
// or the number does not fit a u32.
static bool take_decimal(const std::string& fmt, size_t& i, uint32_t& out) {
    size_t start = i;
    uint64_t v = 0;
    while (i < fmt.size() && std::isdigit(static_cast<unsigned char>(fmt[i]))) {
        v = v * 10 + static_cast<uint64_t>(fmt[i] - '0');
        if (v > 0xFFFFFFFFull) return false;
        ++i;
    }
    if (i == start) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

static uint8_t tag_for_width(size_t width) {
    if (width == 2) return ARRAY_TAG_U16;
    if (width == 4) return ARRAY_TAG_U32;
    return ARRAY_TAG_U8;
}

size_t element_width_for_tag(uint8_t tag) {
    switch (tag) {
        case ARRAY_TAG_U8:  return 1;
        case ARRAY_TAG_U16: return 2;
        case ARRAY_TAG_U32: return 4;
        default:            return 0;
    }
}

static uint32_t width_max(size_t width) {
    if (width == 1) return 0xFFu;
    if (width == 2) return 0xFFFFu;
    return 0xFFFFFFFFu;
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

void put_int(Bytes& b, uint32_t v, uint8_t width) {
    b.push_back(INT_TAG);
    b.push_back(width);
    for (int i = width - 1; i >= 0; --i)
        b.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

// Occupied count: short form below 128, else 0x80+n and n bytes LSB first.
static void put_count(Bytes& b, uint32_t count) {
    if (count < 128) {
        b.push_back(static_cast<uint8_t>(count));
        return;
    }
    uint8_t tail[4];
    uint8_t n = 0;
    for (uint32_t remain = count; remain > 0; remain >>= 8)
        tail[n++] = static_cast<uint8_t>(remain & 0xFF);
    b.push_back(static_cast<uint8_t>(0x80 + n));
    b.insert(b.end(), tail, tail + n);
}

// Shared tail of both array shapes once the payload bytes are laid out.
// Slot and padding are checked before any padding is allocated.
static bool put_array(Bytes& b, size_t width, uint32_t capacity,
                      uint32_t occupied, const Bytes& payload, std::string& err) {
    const uint64_t slot = static_cast<uint64_t>(capacity) * width;
    if (slot > MAX_ARRAY_SLOT_BYTES) {
        err = "over_capacity:" + std::to_string(capacity);
        return false;
    }
    const uint64_t padding = slot - static_cast<uint64_t>(occupied) * width;

    b.push_back(tag_for_width(width));
    put_count(b, occupied);
    put_int(b, static_cast<uint32_t>(slot));
    put_int(b, static_cast<uint32_t>(padding));
    b.insert(b.end(), payload.begin(), payload.end());
    b.insert(b.end(), static_cast<size_t>(padding), uint8_t{0});
    return true;
}

bool pack(const std::string& fmt, const std::vector<Value>& args, Bytes& out, std::string& err) {
    Bytes b;
    b.reserve(64);
    size_t arg = 0;
    size_t i = 0;

    while (i < fmt.size()) {
        const char ch = fmt[i++];

        if (arg >= args.size()) { err = "too_few_args"; return false; }
        const Value& v = args[arg++];

        if (size_t w = scalar_width(ch)) {
            const uint32_t* x = std::get_if<uint32_t>(&v);
            if (!x) { err = std::string("bad_value:") + ch; return false; }
            if (*x > width_max(w)) { err = std::string("out_of_range:") + ch; return false; }
            put_int(b, *x, static_cast<uint8_t>(w));
            continue;
        }

        if (ch == 's') {
            uint32_t capacity = 0;
            if (!take_decimal(fmt, i, capacity)) { err = "missing_capacity:s"; return false; }
            const Bytes* x = std::get_if<Bytes>(&v);
            if (!x) { err = "bad_value:s"; return false; }
            if (x->size() > capacity) { err = "over_capacity:" + std::to_string(capacity); return false; }
            if (!put_array(b, 1, capacity, static_cast<uint32_t>(x->size()), *x, err)) return false;
            continue;
        }

        if (ch == 'S') {
            if (i >= fmt.size() || !scalar_width(fmt[i])) { err = "bad_element_type:S"; return false; }
            const size_t w = scalar_width(fmt[i++]);
            uint32_t capacity = 0;
            if (!take_decimal(fmt, i, capacity)) { err = "missing_capacity:S"; return false; }
            const Elements* x = std::get_if<Elements>(&v);
            if (!x) { err = "bad_value:S"; return false; }
            if (x->size() > capacity) { err = "over_capacity:" + std::to_string(capacity); return false; }

            // Elements travel in the firmware's native (little-endian) order.
            Bytes payload;
            payload.reserve(x->size() * w);
            for (uint32_t e : *x) {
                if (e > width_max(w)) { err = "out_of_range:S"; return false; }
                for (size_t k = 0; k < w; ++k)
                    payload.push_back(static_cast<uint8_t>((e >> (8 * k)) & 0xFF));
            }
            if (!put_array(b, w, capacity, static_cast<uint32_t>(x->size()), payload, err)) return false;
            continue;
        }

        err = std::string("unknown_format:") + ch;
        return false;
    }

    if (arg != args.size()) { err = "too_many_args"; return false; }

    out = std::move(b);
    return true;
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------

bool take_int(const uint8_t* data, size_t len, size_t& pos, uint32_t& out, std::string& err) {
    if (pos + 2 > len) { err = "truncated"; return false; }
    if (data[pos] != INT_TAG) {
        err = "bad_tag:0x" + to_hex(&data[pos], 1);
        return false;
    }
    const size_t l = data[pos + 1];
    if (pos + 2 + l > len) { err = "truncated"; return false; }

    uint64_t v = 0;
    for (size_t k = 0; k < l; ++k) {
        v = (v << 8) | data[pos + 2 + k];
        if (v > 0xFFFFFFFFull) { err = "int_overflow"; return false; }
    }
    pos += 2 + l;
    out = static_cast<uint32_t>(v);
    return true;
}

// Occupied count in either form. Extended form: low nibble = number of bytes, LSB first.
static bool take_count(const uint8_t* data, size_t len, size_t& pos, uint32_t& out, std::string& err) {
    if (pos >= len) { err = "truncated"; return false; }
    const uint8_t lead = data[pos++];
    if (!(lead & 0x80)) { out = lead; return true; }

    const size_t n = lead & 0x0F;
    if (n == 0 || n > 4) { err = "bad_count_form:0x" + to_hex(&lead, 1); return false; }
    if (pos + n > len) { err = "truncated"; return false; }

    uint32_t v = 0;
    for (size_t k = 0; k < n; ++k)
        v |= static_cast<uint32_t>(data[pos + k]) << (8 * k);
    pos += n;
    out = v;
    return true;
}

// Decode one array field; payload receives the occupied bytes, width the element size.
static bool take_array(const uint8_t* data, size_t len, size_t& pos,
                       Bytes& payload, size_t& width, std::string& err) {
    if (pos >= len) { err = "truncated"; return false; }
    const uint8_t tag = data[pos];
    width = element_width_for_tag(tag);
    if (!width) { err = "bad_tag:0x" + to_hex(&tag, 1); return false; }
    ++pos;

    uint32_t occupied = 0;
    if (!take_count(data, len, pos, occupied, err)) return false;
    const uint64_t occupied_bytes = static_cast<uint64_t>(occupied) * width;

    uint32_t slot = 0, padding = 0;
    if (!take_int(data, len, pos, slot, err)) return false;
    if (!take_int(data, len, pos, padding, err)) return false;

    // A zero slot size shows up in some firmware replies. Treat it as "size
    // omitted" and use the occupied bytes as the slot.
    if (slot != 0 && slot != occupied_bytes + padding) {
        err = "slot_mismatch:" + std::to_string(slot);
        return false;
    }

    if (pos + occupied_bytes + padding > len) { err = "truncated"; return false; }
    payload.assign(data + pos, data + pos + occupied_bytes);
    pos += static_cast<size_t>(occupied_bytes + padding);
    return true;
}

bool unpack(const std::string& fmt, const uint8_t* data, size_t len,
            std::vector<Value>& out, std::string& err) {
    std::vector<Value> vals;
    size_t pos = 0;
    size_t i = 0;

    while (i < fmt.size()) {
        const char ch = fmt[i++];

        if (ch == 'n' || scalar_width(ch)) {
            uint32_t v = 0;
            if (!take_int(data, len, pos, v, err)) return false;
            vals.emplace_back(v);
            continue;
        }

        if (ch == 's') {
            uint32_t ignored = 0;
            take_decimal(fmt, i, ignored);      // capacity is optional on decode
            Bytes payload;
            size_t width = 0;
            if (!take_array(data, len, pos, payload, width, err)) return false;
            vals.emplace_back(std::move(payload));
            continue;
        }

        if (ch == 'S') {
            if (i >= fmt.size() || !scalar_width(fmt[i])) { err = "bad_element_type:S"; return false; }
            const size_t want = scalar_width(fmt[i++]);
            uint32_t ignored = 0;
            take_decimal(fmt, i, ignored);

            Bytes payload;
            size_t width = 0;
            if (!take_array(data, len, pos, payload, width, err)) return false;
            if (width != want) { err = "tag_mismatch:S"; return false; }

            Elements elems;
            elems.reserve(payload.size() / width);
            for (size_t k = 0; k + width <= payload.size(); k += width) {
                uint32_t e = 0;
                for (size_t j = 0; j < width; ++j)
                    e |= static_cast<uint32_t>(payload[k + j]) << (8 * j);
                elems.push_back(e);
            }
            vals.emplace_back(std::move(elems));
            continue;
        }

        err = std::string("unknown_format:") + ch;
        return false;
    }

    out = std::move(vals);
    return true;
}

bool unpack(const std::string& fmt, const Bytes& data, std::vector<Value>& out, std::string& err) {
    return unpack(fmt, data.data(), data.size(), out, err);
}

} // namespace wire
} // namespace xmmrpc
