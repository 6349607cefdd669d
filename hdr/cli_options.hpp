#pragma once

#include "config.hpp"
#include <boost/program_options.hpp>

namespace po = boost::program_options;

// Keeps running (no exit code yet) when parse_command_line returns this.
constexpr int CLI_CONTINUE = -1;

// Adds one option per Config key, with the current value of `cfg` as default.
void add_config_options(po::options_description& desc, Config& cfg, bool with_usrp_keys);

/**
 * Builds the effective configuration: defaults, then the YAML file named by --config, then the
 * remaining command line on top. Handles --help and --save-config and validates the result.
 *
 * `extra` holds executable-specific options; they are parsed into `vm` alongside the config keys.
 * Returns CLI_CONTINUE, or the exit code the program should terminate with.
 */
int parse_command_line(int argc, char* argv[], Config& cfg, const std::string& caption,
                       const po::options_description& extra, po::variables_map& vm,
                       bool with_usrp_keys);

void print_config_summary(const Config& cfg, bool with_usrp_keys);
