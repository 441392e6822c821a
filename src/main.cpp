#include "cli.hpp"
#include "errors.hpp"
#include "instance.hpp"
#include "log.hpp"

#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace {
std::shared_ptr<spdlog::logger> main_log() {
  static auto logger = [] {
    octo::ensure_default_logger();
    return octo::category_logger("cli");
  }();
  return logger;
}

void setup_logging(const octo::ClientConfig &config) {
  octo::init_logger(config.log_options());
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level_str] : config.log_categories()) {
    try {
      category_levels[category] = octo::parse_log_level(level_str);
    } catch (const octo::ConfigError &e) {
      main_log()->warn("Ignoring log category '{}': {}", category, e.what());
    }
  }
  octo::configure_log_categories(category_levels);
}
} // namespace

/**
 * Program entry point: parse the command line, configure logging and the
 * shared client, then run the requested call.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code.
 */
int main(int argc, char **argv) {
  octo::CliOptions options;
  try {
    options = octo::parse_cli(argc, argv);
  } catch (const octo::CliParseExit &e) {
    return e.exit_code();
  }
  int rc = 1;
  try {
    octo::ClientConfig config = octo::make_config(options);
    setup_logging(config);
    auto client = octo::initialise(config);
    rc = octo::run_cli(options, *client, std::cout, std::cerr);
  } catch (const octo::ConfigError &e) {
    std::cerr << "Configuration error: " << e.what() << '\n';
    rc = 1;
  }
  octo::reset_instance();
  spdlog::shutdown();
  return rc;
}
