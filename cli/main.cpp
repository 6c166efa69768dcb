/**
 * @file main.cpp
 * @brief xmmrpc-cli: one-shot RPC calls against the modem, plus offline codec modes.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and the optional JSON config (config.hpp).
 *  - --pack / --unpack: drive the wire codec from the shell; no device is opened.
 *  - Otherwise resolve one request (--cmd and/or --msg, --body), open the RPC
 *    device, run one call on the sync lane (or the transaction lane with
 *    --async), print the answer and stop.
 *
 * Output:
 *  - stdout: "status=ok code=0x... body=<hex>" (or the decoded fields for --msg
 *    kinds that have a parser).
 *  - stderr: "status=error reason=<token>" with a non-zero exit code.
 *
 * Exit codes: 0 ok, 1 device/transport, 2 usage/config, 3 call failed.
 */

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"

#include "config.hpp"
#include "message_dispatch.hpp"
#include "xmmrpc/client.hpp"
#include "xmmrpc/log.hpp"
#include "xmmrpc/transport/transport_device.hpp"
#include "xmmrpc/wire_codec.hpp"

using namespace xmmrpc;

static int fail(int code, const std::string& reason) {
    std::cerr << "status=error reason=" << reason << "\n";
    return code;
}

// ---------- offline codec modes ----------

static int run_pack(const std::vector<std::string>& words) {
    if (words.empty()) return fail(2, "missing_format");
    const std::string fmt = words.front();
    const std::vector<std::string> rest(words.begin() + 1, words.end());

    std::vector<wire::Value> vals;
    std::string err;
    if (!parse_pack_args(fmt, rest, vals, err)) return fail(2, err);

    wire::Bytes out;
    if (!wire::pack(fmt, vals, out, err)) return fail(2, err);

    std::cout << "status=ok len=" << out.size() << " body=" << to_hex(out.data(), out.size()) << "\n";
    return 0;
}

static int run_unpack(const std::vector<std::string>& words) {
    if (words.size() != 2) return fail(2, "need_format_and_hex");

    wire::Bytes data;
    if (!parse_hex(words[1], data)) return fail(2, "bad_value:hex");

    std::vector<wire::Value> vals;
    std::string err;
    if (!wire::unpack(words[0], data, vals, err)) return fail(2, err);

    std::cout << "status=ok " << describe_values(vals) << "\n";
    return 0;
}

int main(int argc, char** argv) {
    // ---- config / device ----
    std::string config_path;
    std::string dev;
    std::string log_level_name;

    // ---- request ----
    std::string cmd;                     // --cmd <code|name>
    std::string body_hex;                // --body <hex>
    std::string msg_name;                // --msg <kind>
    std::string msg_arg;                 // --arg <value>
    bool use_async = false;

    // ---- offline ----
    std::vector<std::string> pack_words;
    std::vector<std::string> unpack_words;

    CLI::App app{"xmmrpc CLI"};

    app.add_option("--config", config_path, "JSON config (device, tuning, command table)");
    app.add_option("--dev", dev, "RPC device (default /dev/xmm0/rpc)");
    app.add_option("--log-level", log_level_name, "debug|info|warn|error")
        ->check(CLI::IsMember({"debug", "info", "warn", "error"}));

    app.add_option("--cmd", cmd, "Command code (0x..) or name from the config command table");
    auto* opt_body = app.add_option("--body", body_hex, "Request body as hex");
    auto* opt_msg = app.add_option("--msg", msg_name,
        "Built-in body: attach_apn|net_attach|neg_ip|neg_dns|ps_connect|datachannel|empty");
    app.add_option("--arg", msg_arg, "Argument for --msg (APN, datachannel path)");
    app.add_flag("--async", use_async, "Use the transaction lane and wait for completion");
    opt_body->excludes(opt_msg);

    auto* opt_pack = app.add_option("--pack", pack_words, "Encode only: --pack <format> <values...>");
    auto* opt_unpack = app.add_option("--unpack", unpack_words, "Decode only: --unpack <format> <hex>");
    opt_pack->excludes(opt_unpack);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    // -------- config --------
    Config cfg;
    std::string err;
    if (!config_path.empty() && !load_config(config_path, cfg, err)) return fail(2, err);

    LogLevel lvl = cfg.log_level;
    if (!log_level_name.empty() && !parse_log_level(log_level_name, lvl)) return fail(2, "bad_value:log_level");
    set_log_level(lvl);

    // -------- offline modes --------
    if (opt_pack->count() > 0) return run_pack(pack_words);
    if (opt_unpack->count() > 0) return run_unpack(unpack_words);

    // -------- build request --------
    if (cmd.empty() && msg_name.empty()) return fail(2, "need_cmd_or_msg");

    MessageKind kind = MessageKind::EMPTY;
    const bool have_kind = !msg_name.empty();
    if (have_kind && !name_to_kind(msg_name, kind)) return fail(2, "unknown_msg");

    wire::Bytes body;
    if (!body_hex.empty()) {
        if (!parse_hex(body_hex, body)) return fail(2, "bad_value:body");
    } else if (!build_body_from_kind(kind, msg_arg, body, err)) {
        return fail(2, err);
    }

    uint32_t code = 0;
    const std::string cmd_text = !cmd.empty() ? cmd : std::string(kind_message_name(kind));
    if (cmd_text.empty()) return fail(2, "need_cmd");
    if (!resolve_command_code(cmd_text, cfg.commands, code, err)) return fail(2, err);

    // -------- device --------
    if (dev.empty()) dev = cfg.device;

    transport::DeviceTransport device;
    if (!device.open(dev, err)) return fail(1, err + " dev=" + dev);

    Client client(device, cfg.client);
    if (!client.start(err)) return fail(1, err);

    Response resp;
    const bool ok = use_async ? client.call_async_blocking(code, body, resp, err)
                              : client.call_sync(code, body, resp, err);
    client.stop();

    if (!ok) return fail(3, err);

    std::cout << "status=ok code=" << hex32(resp.code) << " ";
    if (have_kind) std::cout << describe_response(kind, resp.body);
    else           std::cout << "body=" << to_hex(resp.body.data(), resp.body.size());
    std::cout << "\n";
    return 0;
}
