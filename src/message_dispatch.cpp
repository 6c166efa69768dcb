// -----------------------------------------------------------------------------
// Implementation for message_dispatch.hpp
//
// - See message_dispatch.hpp for the API contract and process flow.
// - Parsing is done with strtoul, never exceptions; failure is "false" plus a
//   stable token.
// -----------------------------------------------------------------------------

#include "message_dispatch.hpp"
#include "messages.hpp"
#include "xmmrpc/log.hpp"

#include <array>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <variant>

namespace xmmrpc {

// ---------- local helpers ----------

static std::string normalize(const std::string& s) {
    std::string r;
    r.reserve(s.size());
    for (char c : s) {
        if (c == '-') r.push_back('_');
        else r.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return r;
}

static int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool parse_u32(const std::string& text, uint32_t& out) {
    if (text.empty() || text[0] == '-' || std::isspace(static_cast<unsigned char>(text[0]))) return false;
    char* e = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(text.c_str(), &e, 0);
    if (!e || *e || errno == ERANGE) return false;
    if (v > 0xFFFFFFFFull) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

bool parse_hex(const std::string& text, wire::Bytes& out) {
    wire::Bytes b;
    int hi = -1;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == ':') continue;
        int n = hex_nibble(c);
        if (n < 0) return false;
        if (hi < 0) {
            hi = n;
        } else {
            b.push_back(static_cast<uint8_t>((hi << 4) | n));
            hi = -1;
        }
    }
    if (hi >= 0) return false;      // odd digit count
    out = std::move(b);
    return true;
}

// ---------- names ----------

bool name_to_kind(const std::string& name, MessageKind& out_kind) {
    const std::string n = normalize(name);

    if (n == "attach_apn")                     { out_kind = MessageKind::ATTACH_APN;  return true; }
    if (n == "net_attach" || n == "attach")    { out_kind = MessageKind::NET_ATTACH;  return true; }
    if (n == "neg_ip" || n == "ip")            { out_kind = MessageKind::NEG_IP;      return true; }
    if (n == "neg_dns" || n == "dns")          { out_kind = MessageKind::NEG_DNS;     return true; }
    if (n == "ps_connect" || n == "connect")   { out_kind = MessageKind::PS_CONNECT;  return true; }
    if (n == "datachannel")                    { out_kind = MessageKind::DATACHANNEL; return true; }
    if (n == "empty")                          { out_kind = MessageKind::EMPTY;       return true; }
    return false;
}

const char* kind_message_name(MessageKind kind) {
    switch (kind) {
        case MessageKind::ATTACH_APN:  return "UtaMsCallPsAttachApnConfigReq";
        case MessageKind::NET_ATTACH:  return "UtaMsNetAttachReq";
        case MessageKind::NEG_IP:      return "UtaMsCallPsGetNegIpAddrReq";
        case MessageKind::NEG_DNS:     return "UtaMsCallPsGetNegotiatedDnsReq";
        case MessageKind::PS_CONNECT:  return "UtaMsCallPsConnectReq";
        case MessageKind::DATACHANNEL: return "UtaRPCPsConnectToDatachannelReq";
        case MessageKind::EMPTY:       return "";
    }
    return "";
}

// ---------- bodies ----------

bool build_body_from_kind(MessageKind kind, const std::string& value,
                          wire::Bytes& out, std::string& err) {
    switch (kind) {
        case MessageKind::ATTACH_APN:
            if (value.empty()) { err = "missing_value:apn"; return false; }
            return make_attach_apn_config(value, out, err);

        case MessageKind::NET_ATTACH:  out = make_net_attach();         return true;
        case MessageKind::NEG_IP:      out = make_get_neg_ip_addr();    return true;
        case MessageKind::NEG_DNS:     out = make_get_negotiated_dns(); return true;
        case MessageKind::PS_CONNECT:  out = make_ps_connect();         return true;

        case MessageKind::DATACHANNEL:
            return make_connect_to_datachannel(value.empty() ? DEFAULT_DATACHANNEL_PATH : value, out, err);

        case MessageKind::EMPTY:       out = make_empty();              return true;
    }
    err = "unknown_msg";
    return false;
}

bool resolve_command_code(const std::string& text,
                          const std::map<std::string, uint32_t>& commands,
                          uint32_t& code, std::string& err) {
    if (text.empty()) { err = "bad_value:cmd"; return false; }
    if (std::isdigit(static_cast<unsigned char>(text[0]))) {
        if (!parse_u32(text, code)) { err = "bad_value:cmd"; return false; }
        return true;
    }
    auto it = commands.find(text);
    if (it == commands.end()) { err = "unknown_command:" + text; return false; }
    code = it->second;
    return true;
}

// ---------- rendering ----------

std::string describe_response(MessageKind kind, const wire::Bytes& body) {
    std::ostringstream os;
    std::string err;

    if (kind == MessageKind::NEG_IP) {
        std::array<std::string, 3> ips;
        if (parse_neg_ip_addr(body, ips, err)) {
            os << "ip0=" << ips[0] << " ip1=" << ips[1] << " ip2=" << ips[2];
            return os.str();
        }
        log_event(LogLevel::Warn, "bad_response", "msg=neg_ip reason=" + err);
    } else if (kind == MessageKind::NEG_DNS) {
        DnsServers dns;
        if (parse_negotiated_dns(body, dns, err)) {
            os << "dns_v4=";
            for (size_t i = 0; i < dns.v4.size(); ++i) os << (i ? "," : "") << dns.v4[i];
            os << " dns_v6=";
            for (size_t i = 0; i < dns.v6.size(); ++i) os << (i ? "," : "") << dns.v6[i];
            return os.str();
        }
        log_event(LogLevel::Warn, "bad_response", "msg=neg_dns reason=" + err);
    }

    os << "body=" << to_hex(body.data(), body.size());
    return os.str();
}

// ---------- --pack / --unpack ----------

static bool parse_u32_list(const std::string& text, wire::Elements& out) {
    wire::Elements e;
    if (!text.empty()) {
        std::istringstream in(text);
        std::string item;
        while (std::getline(in, item, ',')) {
            uint32_t v = 0;
            if (!parse_u32(item, v)) return false;
            e.push_back(v);
        }
    }
    out = std::move(e);
    return true;
}

bool parse_pack_args(const std::string& fmt, const std::vector<std::string>& words,
                     std::vector<wire::Value>& out, std::string& err) {
    std::vector<wire::Value> vals;
    size_t w = 0;
    size_t i = 0;

    auto skip_digits = [&fmt, &i] {
        while (i < fmt.size() && std::isdigit(static_cast<unsigned char>(fmt[i]))) ++i;
    };

    while (i < fmt.size()) {
        const char c = fmt[i++];
        if (c != 'B' && c != 'H' && c != 'L' && c != 's' && c != 'S') {
            err = std::string("unknown_format:") + c;
            return false;
        }
        if (w >= words.size()) { err = "too_few_args"; return false; }
        const std::string& word = words[w];
        const std::string where = "arg" + std::to_string(w);
        ++w;

        if (c == 's') {
            skip_digits();
            wire::Bytes b;
            if (!parse_hex(word, b)) { err = "bad_value:" + where; return false; }
            vals.emplace_back(std::move(b));
        } else if (c == 'S') {
            if (i < fmt.size()) ++i;          // element type, checked by pack()
            skip_digits();
            wire::Elements e;
            if (!parse_u32_list(word, e)) { err = "bad_value:" + where; return false; }
            vals.emplace_back(std::move(e));
        } else {
            uint32_t v = 0;
            if (!parse_u32(word, v)) { err = "bad_value:" + where; return false; }
            vals.emplace_back(v);
        }
    }

    if (w < words.size()) { err = "too_many_args"; return false; }
    out = std::move(vals);
    return true;
}

std::string describe_values(const std::vector<wire::Value>& vals) {
    std::ostringstream os;
    for (size_t i = 0; i < vals.size(); ++i) {
        if (i) os << ' ';
        os << 'v' << i << '=';
        const wire::Value& v = vals[i];
        if (const auto* n = std::get_if<uint32_t>(&v)) {
            os << hex32(*n);
        } else if (const auto* b = std::get_if<wire::Bytes>(&v)) {
            os << to_hex(b->data(), b->size());
        } else if (const auto* e = std::get_if<wire::Elements>(&v)) {
            os << '[';
            for (size_t k = 0; k < e->size(); ++k) os << (k ? "," : "") << (*e)[k];
            os << ']';
        }
    }
    return os.str();
}

} // namespace xmmrpc
