#pragma once

#include <cstdint>
#include <string>

#include <CLI/CLI.hpp>

#include "clewdr/core/config.hpp"

namespace clewdr::cli {

/// Flags of the `serve` subcommand; zero / empty keep the config values.
struct ServeOptions {
    uint16_t port = 0;
    std::string bind;
};

/// Register the `serve` subcommand.
auto register_serve_command(CLI::App& app, ServeOptions& options) -> CLI::App*;

/// Register the `config` subcommand.
auto register_config_command(CLI::App& app) -> CLI::App*;

/// Runs the gateway until SIGINT or SIGTERM.
/// @returns Process exit code.
auto run_serve(Config& config, const ServeOptions& options) -> int;

/// Prints the effective configuration with secrets masked.
auto run_config(const Config& config) -> int;

} // namespace clewdr::cli
