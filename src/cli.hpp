#pragma once

#include <optional>
#include <string>
#include <vector>

#include "console.hpp"
#include "transfer_client.hpp"

// Parsed command line of the relaycp client. Overrides stay unset when the
// flag is absent so the config file value wins.
struct CliArgs {
    relaycp::ClientMode mode = relaycp::ClientMode::RECEIVE;
    std::string room;
    std::vector<std::string> paths;
    std::string text;
    std::string out_dir = ".";
    bool force = false;
    bool help = false;

    std::string config_path;
    std::optional<std::string> server_url;
    std::optional<std::string> log_file;
    std::optional<std::string> log_level;
};

// args excludes argv[0]. False with err set on a usage error.
bool parse_cli(const std::vector<std::string>& args, CliArgs& out, std::string& err);

void print_usage(Console& c, const std::string& argv0);
