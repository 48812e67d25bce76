#pragma once

#include <memory>
#include <string>

#include <CLI/CLI.hpp>

#include "clewdr/cli/commands.hpp"
#include "clewdr/core/config.hpp"

namespace clewdr::cli {

/// Top-level CLI application.
///
/// Parses the command line, loads the config file, applies environment
/// and flag overrides, initialises logging and then runs the selected
/// subcommand.
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    void load();

    CLI::App cli_;
    Config config_;
    std::string config_path_;
    std::string log_level_;

    ServeOptions serve_options_;
    CLI::App* serve_cmd_ = nullptr;
    CLI::App* config_cmd_ = nullptr;
};

} // namespace clewdr::cli
