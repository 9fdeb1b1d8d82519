#include <boost/asio.hpp>

#include <algorithm>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "config.hpp"
#include "io_layer.hpp"
#include "logger.hpp"
#include "protocol.hpp"
#include "room_registry.hpp"
#include "session_journal.hpp"

namespace {

void usage(const char* argv0) {
    std::cout << "Usage:\n";
    std::cout << "  " << argv0 << " [config_path]\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string cfg_path;
    if (argc == 2) {
        cfg_path = argv[1];
    } else if (argc > 2) {
        usage(argv[0]);
        return 2;
    }

    Config cfg;
    std::string err;
    if (!cfg_path.empty() && !load_config(cfg_path, cfg, err)) {
        std::cerr << err << "\n";
        return 2;
    }
    proto::Encoding default_encoding = proto::Encoding::BINARY;
    if (!proto::parse_encoding(cfg.default_encoding, default_encoding)) {
        std::cerr << "default_encoding must be 'binary' or 'text'\n";
        return 2;
    }

    Logger logger(cfg.log_file, parse_log_level(cfg.log_level));
    logger.set_mirror_stderr(cfg.log_stderr);

    relaycp::RegistryLimits limits;
    limits.max_rooms = cfg.max_rooms;
    limits.max_rooms_per_source = cfg.max_rooms_per_source;
    limits.max_peers_per_room = cfg.max_peers_per_room;
    relaycp::RoomRegistry registry(limits, logger);

    std::unique_ptr<relaycp::FileSessionJournal> journal;
    if (!cfg.session_log_file.empty()) {
        journal = std::make_unique<relaycp::FileSessionJournal>(cfg.session_log_file, logger);
    }

    boost::asio::io_context io;

    IoLayer::Options opts;
    opts.max_frame_bytes = cfg.max_frame_bytes;
    opts.max_outbound_frames = cfg.max_outbound_frames;
    opts.trust_proxy_headers = cfg.trust_proxy_headers;
    opts.default_encoding = default_encoding;

    IoLayer io_layer(io, registry, journal && journal->enabled() ? journal.get() : nullptr, logger, opts);
    if (!io_layer.start(cfg.bind_ip, cfg.port)) {
        std::cerr << "failed to start listener on " << cfg.bind_ip << ":" << cfg.port << "\n";
        return 2;
    }

    size_t threads = cfg.threads;
    if (threads == 0) threads = std::max(1u, std::thread::hardware_concurrency());

    logger.info("relay listening on " + cfg.bind_ip + ":" + std::to_string(io_layer.local_endpoint().port()) +
                " with " + std::to_string(threads) + " thread(s)");
    std::cout << "relaycp relay listening on " << cfg.bind_ip << ":" << io_layer.local_endpoint().port()
              << std::endl;

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        logger.info("shutting down");
        io_layer.stop();
        io.stop();
    });

    std::vector<std::thread> workers;
    workers.reserve(threads - 1);
    for (size_t i = 1; i < threads; ++i) {
        workers.emplace_back([&io, &logger]() {
            try {
                io.run();
            } catch (const std::exception& e) {
                logger.error(std::string("worker stopped: ") + e.what());
            }
        });
    }
    try {
        io.run();
    } catch (const std::exception& e) {
        logger.error(std::string("worker stopped: ") + e.what());
    }
    io.stop();
    for (auto& t : workers) t.join();

    if (journal) journal->stop();
    return 0;
}
