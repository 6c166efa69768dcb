// ============================================================================
// config.cpp: implementation for config.hpp
// ============================================================================

#include "config.hpp"
#include "message_dispatch.hpp"   // parse_u32

#include <fstream>
#include <sstream>
#include <utility>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace xmmrpc {

// Unsigned integer in [lo, hi]. JSON numbers only.
static bool read_uint(const json& j, const char* key, uint64_t lo, uint64_t hi,
                      uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number_unsigned()) { err = std::string("bad_value:") + key; return false; }
    uint64_t v = it->get<uint64_t>();
    if (v < lo || v > hi) { err = std::string("bad_value:") + key; return false; }
    out = v;
    return true;
}

static bool read_command_code(const json& v, uint32_t& out) {
    if (v.is_number_unsigned()) {
        uint64_t n = v.get<uint64_t>();
        if (n > 0xFFFFFFFFull) return false;
        out = static_cast<uint32_t>(n);
        return true;
    }
    if (v.is_string()) return parse_u32(v.get<std::string>(), out);
    return false;
}

bool parse_config(const std::string& text, Config& out, std::string& err) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        err = std::string("bad_json:") + e.what();
        return false;
    }
    if (!j.is_object()) { err = "bad_json:not_an_object"; return false; }

    Config cfg;

    if (auto it = j.find("device"); it != j.end()) {
        if (!it->is_string() || it->get<std::string>().empty()) { err = "bad_value:device"; return false; }
        cfg.device = it->get<std::string>();
    }

    uint64_t chunk = cfg.client.read_chunk_bytes;
    uint64_t max_frame = cfg.client.max_frame_bytes;
    uint64_t workers = cfg.client.callback_workers;
    if (!read_uint(j, "read_chunk_bytes", 64, 16u * 1024u * 1024u, chunk, err)) return false;
    if (!read_uint(j, "max_frame_bytes", 16, 0xFFFFFFFFull, max_frame, err)) return false;
    if (!read_uint(j, "callback_workers", 1, 64, workers, err)) return false;
    cfg.client.read_chunk_bytes = static_cast<size_t>(chunk);
    cfg.client.max_frame_bytes = static_cast<uint32_t>(max_frame);
    cfg.client.callback_workers = static_cast<size_t>(workers);

    if (auto it = j.find("log_level"); it != j.end()) {
        if (!it->is_string() || !parse_log_level(it->get<std::string>(), cfg.log_level)) {
            err = "bad_value:log_level";
            return false;
        }
    }

    if (auto it = j.find("commands"); it != j.end()) {
        if (!it->is_object()) { err = "bad_value:commands"; return false; }
        for (auto c = it->begin(); c != it->end(); ++c) {
            uint32_t code = 0;
            if (!read_command_code(c.value(), code)) { err = "bad_value:commands." + c.key(); return false; }
            cfg.commands[c.key()] = code;
        }
    }

    out = std::move(cfg);
    return true;
}

bool load_config(const std::string& path, Config& out, std::string& err) {
    std::ifstream in(path);
    if (!in) { err = "open_failed:" + path; return false; }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_config(ss.str(), out, err);
}

} // namespace xmmrpc
