#pragma once
/**
 * @page xr-messages xmmrpc Message Catalog
 * @file messages.hpp
 * @brief Request body builders and response parsers for the modem data-session bring-up.
 *
 * @details
 * PURPOSE
 * -------
 * The wire codec knows how to encode fields; it does not know which fields a
 * given firmware message wants. This file is that knowledge for the handful of
 * requests a host needs to bring a packet-data session up:
 *
 *   attach APN config ─► net attach ─► PS connect ─► get IP / DNS ─► datachannel
 *
 * Every builder returns the encoded BODY only. Framing, transaction ids and the
 * command code belong to the dispatcher; command codes are firmware-build
 * specific and come from the configuration's command table (see config.hpp).
 *
 * RELATIONSHIP TO OTHER FILES
 * ---------------------------
 * - **xmmrpc/wire_codec.hpp**: every builder is one pack() call with a fixed
 *   format string.
 * - **message_dispatch.hpp**: maps CLI names ("net_attach", "neg_ip", ...) to
 *   these builders and parsers.
 *
 * LAYOUTS
 * -------
 *   UtaMsNetAttachReq              BLLLLHHLL   0,0,0,0,0,0xffff,0xffff,0,0
 *   UtaMsCallPsGetNegIpAddrReq     BLL         0,0,0
 *   UtaMsCallPsGetNegotiatedDnsReq BLL         0,0,0
 *   UtaMsCallPsConnectReq          BLLL        0,6,0,0
 *   UtaRPCPsConnectToDatachannelReq s24        NUL-terminated path
 *   UtaMsCallPsAttachApnConfigReq  four 32-field profile blocks + B,L trailer;
 *                                  the APN goes into the last two blocks.
 *
 * Responses:
 *   GetNegIpAddr      nsnnnn              three IPv4 addresses at bytes 0/4/8
 *   GetNegotiatedDns  n (sn)x16 nsnnnn    per entry: address buffer + type
 *                                         (1 = IPv4, 2 = IPv6, else unused)
 *
 * ERRORS
 * ------
 * Builders that take input return bool with a stable token ("bad_value:apn",
 * "bad_value:path"). Parsers forward codec tokens or report "short_address".
 */

#include "xmmrpc/wire_codec.hpp"

#include <array>
#include <string>
#include <vector>

namespace xmmrpc {

/// Default data channel on PCIe modems.
static constexpr const char* DEFAULT_DATACHANNEL_PATH = "/sioscc/PCIE/IOSM/IPS/0";

/// APN buffer size in the attach config (including the terminating NUL).
static constexpr size_t APN_BUFFER_BYTES = 101;

/// Datachannel path buffer capacity.
static constexpr size_t DATACHANNEL_PATH_CAPACITY = 24;

// ============================== Builders ==============================

/**
 * @brief UtaMsCallPsAttachApnConfigReq for @p apn.
 *
 * The APN is written zero-padded into a 101-byte buffer, so at most 100 ASCII
 * characters are accepted.
 */
bool make_attach_apn_config(const std::string& apn, wire::Bytes& out, std::string& err);

/// UtaMsNetAttachReq.
wire::Bytes make_net_attach();

/// UtaMsCallPsGetNegIpAddrReq.
wire::Bytes make_get_neg_ip_addr();

/// UtaMsCallPsGetNegotiatedDnsReq.
wire::Bytes make_get_negotiated_dns();

/// UtaMsCallPsConnectReq.
wire::Bytes make_ps_connect();

/**
 * @brief UtaRPCPsConnectToDatachannelReq. The path travels NUL-terminated,
 * so it may be at most 23 characters.
 */
bool make_connect_to_datachannel(const std::string& path, wire::Bytes& out, std::string& err);

/// Body sent when a command takes no arguments: one 32-bit zero.
wire::Bytes make_empty();

// ============================== Parsers ===============================

/// Three dotted-quad addresses from a GetNegIpAddr completion body.
bool parse_neg_ip_addr(const wire::Bytes& body, std::array<std::string, 3>& out, std::string& err);

struct DnsServers {
    std::vector<std::string> v4;
    std::vector<std::string> v6;
};

/// DNS servers from a GetNegotiatedDns completion body, in firmware order.
bool parse_negotiated_dns(const wire::Bytes& body, DnsServers& out, std::string& err);

} // namespace xmmrpc
