#include "clewdr/cli/app.hpp"
#include "clewdr/core/logger.hpp"
#include "clewdr/core/version.hpp"

#include <filesystem>

namespace clewdr::cli {

App::App()
    : cli_("clewdr", "Claude.ai reverse proxy with Messages and chat completion endpoints")
{
    cli_.set_version_flag("--version", std::string(kTitle), "Display version information");

    cli_.add_option("-c,--config", config_path_, "Path to configuration file (JSON)")
        ->envname("CLEWDR_CONFIG");

    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical)");

    serve_cmd_ = register_serve_command(cli_, serve_options_);
    config_cmd_ = register_config_command(cli_);

    cli_.require_subcommand(1);
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    load();

    if (serve_cmd_->parsed()) {
        return run_serve(config_, serve_options_);
    }
    if (config_cmd_->parsed()) {
        return run_config(config_);
    }
    return 0;
}

void App::load() {
    // Log at the flag's level while the config is read; re-init below once
    // the file's level and log_file are known.
    Logger::init("clewdr", log_level_.empty() ? "info" : log_level_);

    if (!config_path_.empty()) {
        LOG_INFO("Loading configuration from: {}", config_path_);
        config_ = load_config(std::filesystem::path(config_path_));
    } else {
        config_ = default_config();
    }
    apply_env_overrides(config_);

    if (!log_level_.empty()) {
        config_.log_level = log_level_;
    }
    Logger::init("clewdr", config_.log_level, config_.log_file.value_or(""));
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() const -> const Config& {
    return config_;
}

} // namespace clewdr::cli
