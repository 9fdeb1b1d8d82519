#include "cli.hpp"

namespace {

bool is_log_level(const std::string& s) {
    return s == "debug" || s == "info" || s == "warn" || s == "error";
}

} // namespace

bool parse_cli(const std::vector<std::string>& args, CliArgs& out, std::string& err) {
    CliArgs a;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            a.help = true;
            out = a;
            return true;
        }
        if (arg == "--force") {
            a.force = true;
            continue;
        }
        if (arg == "--config" || arg == "--server" || arg == "--log-file" || arg == "--log-level") {
            if (i + 1 >= args.size()) {
                err = arg + " needs a value";
                return false;
            }
            const std::string& v = args[++i];
            if (arg == "--config") {
                a.config_path = v;
            } else if (arg == "--server") {
                a.server_url = v;
            } else if (arg == "--log-file") {
                a.log_file = v;
            } else {
                if (!is_log_level(v)) {
                    err = "unknown log level: " + v;
                    return false;
                }
                a.log_level = v;
            }
            continue;
        }
        if (arg == "--") {
            positional.insert(positional.end(), args.begin() + static_cast<long>(i) + 1, args.end());
            break;
        }
        if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            err = "unknown option: " + arg;
            return false;
        }
        positional.push_back(arg);
    }

    if (positional.empty()) {
        err = "missing command";
        return false;
    }
    const std::string cmd = positional[0];
    if (positional.size() < 2 || positional[1].empty()) {
        err = cmd + ": missing room id";
        return false;
    }
    a.room = positional[1];

    if (cmd == "send") {
        if (positional.size() < 3) {
            err = "usage: send <room> <path>...";
            return false;
        }
        a.mode = relaycp::ClientMode::SEND_FILE;
        a.paths.assign(positional.begin() + 2, positional.end());
    } else if (cmd == "send-text") {
        if (positional.size() < 3) {
            err = "usage: send-text <room> <text>";
            return false;
        }
        a.mode = relaycp::ClientMode::SEND_TEXT;
        for (size_t i = 2; i < positional.size(); ++i) {
            if (i > 2) a.text += ' ';
            a.text += positional[i];
        }
    } else if (cmd == "receive") {
        if (positional.size() > 3) {
            err = "usage: receive <room> [outdir]";
            return false;
        }
        a.mode = relaycp::ClientMode::RECEIVE;
        if (positional.size() == 3) a.out_dir = positional[2];
    } else {
        err = "unknown command: " + cmd;
        return false;
    }

    out = a;
    return true;
}

void print_usage(Console& c, const std::string& argv0) {
    c.println("usage:");
    c.println("  " + argv0 + " send <room> <path>...       send a file, a folder or several paths");
    c.println("  " + argv0 + " send-text <room> <text>     send a text message");
    c.println("  " + argv0 + " receive <room> [outdir]     wait for one transfer");
    c.println("options:");
    c.println("  --config <path>      client config file");
    c.println("  --server <url>       relay url (ws://host:port/ws)");
    c.println("  --log-file <path>    diagnostics log (empty = stderr)");
    c.println("  --log-level <lvl>    debug|info|warn|error");
    c.println("  --force              overwrite existing files when receiving");
}
