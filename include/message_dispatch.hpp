#pragma once
/**
 * @page xr-message-dispatch xmmrpc Message Dispatcher
 * @file message_dispatch.hpp
 * @brief Centralized resolution of CLI words → request bodies and command codes.
 *
 * @details
 * PURPOSE
 * -------
 * Glue between the CLI and the message catalog (messages.hpp), so that
 * cli/main.cpp never names an individual builder:
 *
 *   - name_to_kind()          "net_attach" → MessageKind::NET_ATTACH
 *   - build_body_from_kind()  MessageKind + optional --arg → encoded body
 *   - kind_message_name()     MessageKind → firmware message name, the key
 *                             looked up in the configuration's command table
 *   - resolve_command_code()  "0x1234" or "UtaMsNetAttachReq" → code
 *   - describe_response()     completion body → "ip0=10.0.0.2 ..." for the
 *                             kinds that have a parser
 *
 * It also converts the textual values of the --pack/--unpack modes
 * (parse_pack_args(), describe_values()) so the codec can be driven from a shell.
 *
 * PROCESS FLOW
 * ------------
 * 1. `xmmrpc-cli --msg neg_ip` parsed in cli/main.cpp.
 * 2. name_to_kind("neg_ip") → NEG_IP.
 * 3. build_body_from_kind(NEG_IP, "", body, err) → make_get_neg_ip_addr().
 * 4. kind_message_name(NEG_IP) → "UtaMsCallPsGetNegIpAddrReq" → code from config.
 * 5. Completion body → describe_response(NEG_IP, body) → "ip0=... ip1=... ip2=...".
 *
 * MAINTENANCE
 * -----------
 * Adding a message: builder in messages.cpp, enum entry, name in
 * name_to_kind(), case in build_body_from_kind() and kind_message_name().
 *
 * @note Errors are stable strings: "unknown_msg", "unknown_command:<name>",
 *       "bad_value:<what>", "missing_value:apn".
 */

#include "xmmrpc/wire_codec.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace xmmrpc {

enum class MessageKind {
    /** UtaMsCallPsAttachApnConfigReq; --arg is the APN. */
    ATTACH_APN,

    /** UtaMsNetAttachReq. */
    NET_ATTACH,

    /** UtaMsCallPsGetNegIpAddrReq. */
    NEG_IP,

    /** UtaMsCallPsGetNegotiatedDnsReq. */
    NEG_DNS,

    /** UtaMsCallPsConnectReq. */
    PS_CONNECT,

    /** UtaRPCPsConnectToDatachannelReq; --arg overrides the path. */
    DATACHANNEL,

    /** Any argument-less command: a single 32-bit zero. */
    EMPTY
};

/**
 * @brief Map a user-facing name to a MessageKind.
 * Accepts: attach_apn, net_attach, neg_ip, neg_dns, ps_connect, datachannel, empty
 * (case-insensitive; '-' is treated as '_').
 */
bool name_to_kind(const std::string& name, MessageKind& out_kind);

/// Firmware message name for @p kind ("" for EMPTY).
const char* kind_message_name(MessageKind kind);

/**
 * @brief Build the request body for @p kind.
 * @param value --arg text: the APN for ATTACH_APN (required), the datachannel
 *              path for DATACHANNEL (optional), ignored otherwise.
 */
bool build_body_from_kind(MessageKind kind, const std::string& value,
                          wire::Bytes& out, std::string& err);

/**
 * @brief Resolve "--cmd" text to a command code.
 *
 * Numeric text (decimal or 0x-hex) is taken as is; anything else is looked up
 * in @p commands (the configuration's name → code table).
 */
bool resolve_command_code(const std::string& text,
                          const std::map<std::string, uint32_t>& commands,
                          uint32_t& code, std::string& err);

/// One-line key=value rendering of a completion body ("body=<hex>" fallback).
std::string describe_response(MessageKind kind, const wire::Bytes& body);

/// Strict hex → bytes. Whitespace and ':' separators are skipped.
bool parse_hex(const std::string& text, wire::Bytes& out);

/// Strict decimal / 0x-hex → u32.
bool parse_u32(const std::string& text, uint32_t& out);

/**
 * @brief Turn shell words into codec values for @p fmt.
 *
 * Scalars take numbers, `s` takes hex, `S<t>` takes a comma-separated
 * number list ("1,2,3").
 */
bool parse_pack_args(const std::string& fmt, const std::vector<std::string>& words,
                     std::vector<wire::Value>& out, std::string& err);

/// "v0=0x00000000 v1=<hex> v2=[1,2]" rendering of unpacked values.
std::string describe_values(const std::vector<wire::Value>& vals);

} // namespace xmmrpc
