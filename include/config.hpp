#pragma once
/**
 * @file config.hpp
 * @brief JSON configuration for the host tools (device path, client tuning, command table).
 *
 * File layout (every key optional, unknown keys ignored):
 * @code
 *   {
 *     "device": "/dev/xmm0/rpc",
 *     "read_chunk_bytes": 32768,
 *     "max_frame_bytes": 1048576,
 *     "callback_workers": 2,
 *     "log_level": "info",
 *     "commands": { "UtaMsNetAttachReq": 1234, "UtaMsSimOpenReq": "0x4d2" }
 *   }
 * @endcode
 *
 * Command codes differ between firmware builds, so they are data, not code.
 * A code may be a JSON number or a decimal / 0x-hex string.
 *
 * Errors: "open_failed:<path>", "bad_json:<what>", "bad_value:<key>"
 * (for command entries "bad_value:commands.<name>").
 */

#include "xmmrpc/client.hpp"
#include "xmmrpc/log.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace xmmrpc {

struct Config {
    std::string device{"/dev/xmm0/rpc"};
    ClientConfig client;
    LogLevel log_level{LogLevel::Info};
    std::map<std::string, uint32_t> commands;
};

/// Parse configuration text. @p out is assigned only on success.
bool parse_config(const std::string& text, Config& out, std::string& err);

/// Read and parse @p path.
bool load_config(const std::string& path, Config& out, std::string& err);

} // namespace xmmrpc
