#include <boost/asio.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli.hpp"
#include "client_session.hpp"
#include "config.hpp"
#include "console.hpp"
#include "logger.hpp"

int main(int argc, char** argv) {
    Console console;
    const std::string argv0 = argc > 0 ? argv[0] : "relaycp";

    CliArgs args;
    std::string err;
    if (!parse_cli(std::vector<std::string>(argv + 1, argv + argc), args, err)) {
        console.warn(err);
        print_usage(console, argv0);
        return 2;
    }
    if (args.help) {
        print_usage(console, argv0);
        return 0;
    }

    Config cfg;
    if (!args.config_path.empty() && !load_config(args.config_path, cfg, err)) {
        console.warn(err);
        return 2;
    }
    if (args.server_url) cfg.server_url = *args.server_url;
    if (args.log_file) cfg.log_file = *args.log_file;
    if (args.log_level) cfg.log_level = *args.log_level;

    relaycp::WsUrl url;
    if (!relaycp::parse_ws_url(cfg.server_url, url, err)) {
        console.warn(err);
        return 2;
    }

    Logger logger(cfg.log_file, parse_log_level(cfg.log_level));
    logger.set_mirror_stderr(cfg.log_stderr);

    relaycp::ClientOptions opts;
    opts.mode = args.mode;
    opts.room = args.room;
    opts.paths = args.paths;
    opts.text = args.text;
    opts.out_dir = args.out_dir;
    opts.force = args.force;
    opts.transfer = cfg.transfer;

    boost::asio::io_context io;
    auto session = std::make_shared<relaycp::ClientSession>(io, url, opts, console, logger);

    // The session cleans up and closes; the timer only covers a relay that
    // never answers the close.
    bool interrupted = false;
    boost::asio::steady_timer give_up(io);
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) return;
        interrupted = true;
        session->interrupt();
        give_up.expires_after(std::chrono::seconds(3));
        give_up.async_wait([&io](const boost::system::error_code& wait_ec) {
            if (!wait_ec) io.stop();
        });
    });
    session->set_on_closed([&signals, &give_up]() {
        boost::system::error_code ignored;
        signals.cancel(ignored);
        give_up.cancel();
    });

    session->start();
    io.run();

    return interrupted ? 130 : session->exit_code();
}
