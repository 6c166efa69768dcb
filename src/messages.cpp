// ============================================================================
// messages.cpp: implementation for messages.hpp
// ============================================================================

#include "messages.hpp"
#include "xmmrpc/log.hpp"

#include <algorithm>
#include <utility>
#include <variant>

#include <arpa/inet.h>   // inet_ntop

namespace xmmrpc {

// ============================================================================
// Helpers
// ============================================================================

static inline wire::Value u32(uint32_t v) { return wire::Value(v); }

static inline wire::Value zeros(size_t n) { return wire::Value(wire::Bytes(n, uint8_t{0})); }

// Pack a builder whose format and values are fixed. Failure means the layout
// table itself is wrong; the body comes back empty.
static wire::Bytes pack_fixed(const std::string& fmt, const std::vector<wire::Value>& args) {
    wire::Bytes out;
    std::string err;
    if (!wire::pack(fmt, args, out, err))
        log_event(LogLevel::Error, "bad_builder", "fmt=" + fmt + " reason=" + err);
    return out;
}

// ---------------------------------------------------------------------------
// One PDP profile block of the attach config (32 fields).
//
//   s260 L s66 s65 s250 B s252 H L*21 s20 L s<apn_cap>
//
// @p ints fills the 21 L fields, @p apn_type the L before the APN buffer.
// ---------------------------------------------------------------------------
static constexpr size_t PROFILE_INT_FIELDS = 21;

static void append_profile(std::string& fmt, std::vector<wire::Value>& args,
                           const uint32_t (&ints)[PROFILE_INT_FIELDS],
                           uint32_t apn_type, const wire::Bytes& apn, size_t apn_cap) {
    fmt += "s260Ls66s65s250Bs252H";
    args.push_back(zeros(257));
    args.push_back(u32(0));
    args.push_back(zeros(65));
    args.push_back(zeros(65));
    args.push_back(zeros(250));
    args.push_back(u32(0));
    args.push_back(zeros(250));
    args.push_back(u32(0));

    for (uint32_t v : ints) {
        fmt += 'L';
        args.push_back(u32(v));
    }

    fmt += "s20L";
    args.push_back(zeros(20));
    args.push_back(u32(apn_type));

    fmt += "s" + std::to_string(apn_cap);
    args.push_back(wire::Value(apn));
}

// ---------------------------------------------------------------------------
// Address formatting
// ---------------------------------------------------------------------------
static std::string ipv4_string(const uint8_t* p) {
    char buf[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, p, buf, sizeof(buf));
    return buf;
}

static std::string ipv6_string(const uint8_t* p) {
    char buf[INET6_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET6, p, buf, sizeof(buf));
    return buf;
}

// ============================================================================
// Builders
// ============================================================================

bool make_attach_apn_config(const std::string& apn, wire::Bytes& out, std::string& err) {
    if (apn.size() >= APN_BUFFER_BYTES) { err = "bad_value:apn"; return false; }
    for (char c : apn) {
        if (static_cast<unsigned char>(c) > 0x7F) { err = "bad_value:apn"; return false; }
    }

    wire::Bytes apn_buf(APN_BUFFER_BYTES, uint8_t{0});
    std::copy(apn.begin(), apn.end(), apn_buf.begin());
    const wire::Bytes blank_apn(APN_BUFFER_BYTES, uint8_t{0});

    static const uint32_t kUnused[PROFILE_INT_FIELDS] = {0};
    static const uint32_t kActive[PROFILE_INT_FIELDS] = {
        0, 0, 0, 0, 1, 0, 0, 0, 0, 0, 0, 0, 1, 0, 0, 0x404, 1, 0, 1, 0, 0
    };

    std::string fmt = "B";
    std::vector<wire::Value> args{u32(0)};

    // Two blank profiles, then the APN twice. The last buffer is declared one
    // byte shorter by the firmware.
    append_profile(fmt, args, kUnused, 0, blank_apn, 104);
    append_profile(fmt, args, kUnused, 0, blank_apn, 104);
    append_profile(fmt, args, kActive, 3, apn_buf, 104);
    append_profile(fmt, args, kActive, 3, apn_buf, 103);

    fmt += "BL";
    args.push_back(u32(3));
    args.push_back(u32(0));

    return wire::pack(fmt, args, out, err);
}

wire::Bytes make_net_attach() {
    return pack_fixed("BLLLLHHLL",
                      {u32(0), u32(0), u32(0), u32(0), u32(0), u32(0xffff), u32(0xffff), u32(0), u32(0)});
}

wire::Bytes make_get_neg_ip_addr() {
    return pack_fixed("BLL", {u32(0), u32(0), u32(0)});
}

wire::Bytes make_get_negotiated_dns() {
    return pack_fixed("BLL", {u32(0), u32(0), u32(0)});
}

wire::Bytes make_ps_connect() {
    return pack_fixed("BLLL", {u32(0), u32(6), u32(0), u32(0)});
}

bool make_connect_to_datachannel(const std::string& path, wire::Bytes& out, std::string& err) {
    if (path.empty() || path.size() >= DATACHANNEL_PATH_CAPACITY) { err = "bad_value:path"; return false; }

    wire::Bytes bpath(path.begin(), path.end());
    bpath.push_back(0);
    return wire::pack("s" + std::to_string(DATACHANNEL_PATH_CAPACITY), {wire::Value(bpath)}, out, err);
}

wire::Bytes make_empty() {
    wire::Bytes b;
    wire::put_int(b, 0);
    return b;
}

// ============================================================================
// Parsers
// ============================================================================

bool parse_neg_ip_addr(const wire::Bytes& body, std::array<std::string, 3>& out, std::string& err) {
    std::vector<wire::Value> vals;
    if (!wire::unpack("nsnnnn", body, vals, err)) return false;

    const auto& addrs = std::get<wire::Bytes>(vals[1]);
    if (addrs.size() < 12) { err = "short_address"; return false; }

    for (size_t i = 0; i < out.size(); ++i)
        out[i] = ipv4_string(addrs.data() + 4 * i);
    return true;
}

bool parse_negotiated_dns(const wire::Bytes& body, DnsServers& out, std::string& err) {
    static constexpr size_t kEntries = 16;

    std::string fmt = "n";
    for (size_t i = 0; i < kEntries; ++i) fmt += "sn";
    fmt += "nsnnnn";

    std::vector<wire::Value> vals;
    if (!wire::unpack(fmt, body, vals, err)) return false;

    DnsServers dns;
    for (size_t i = 0; i < kEntries; ++i) {
        const auto& addr = std::get<wire::Bytes>(vals[2 * i + 1]);
        const uint32_t type = std::get<uint32_t>(vals[2 * i + 2]);

        if (type == 1) {
            if (addr.size() < 4) { err = "short_address"; return false; }
            dns.v4.push_back(ipv4_string(addr.data()));
        } else if (type == 2) {
            if (addr.size() < 16) { err = "short_address"; return false; }
            dns.v6.push_back(ipv6_string(addr.data()));
        }
    }

    out = std::move(dns);
    return true;
}

} // namespace xmmrpc
