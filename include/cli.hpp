/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for octoclient-cli.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef OCTOCLIENT_CLI_HPP
#define OCTOCLIENT_CLI_HPP

#include "config.hpp"
#include "errors.hpp"
#include <cstddef>
#include <cstdint>
#include <exception>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace octo {

class GitHubClient;

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /**
   * Retrieve the exit code that triggered the exception.
   *
   * @return Numeric process exit code.
   */
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options supplied via the CLI.
 *
 * Empty strings mean "not given" so configuration file values stay in
 * effect.
 */
struct CliOptions {
  std::string config_file;      ///< Path to configuration file
  std::string api_base;         ///< Override of the API base URL
  std::string token;            ///< Personal access token
  std::string token_file;       ///< File holding a token
  std::string app_id;           ///< GitHub App id
  std::string private_key_file; ///< PEM key of the GitHub App
  std::uint64_t installation_id{0}; ///< Installation to act as
  std::string method{"GET"};    ///< HTTP verb
  std::string data;             ///< JSON request body
  std::vector<std::string> query; ///< `key=value` query parameters
  std::string accept;           ///< Override of the Accept header
  bool paginate{false};         ///< Follow Link headers and merge pages
  std::size_t limit{0};         ///< Maximum items when paginating (0 = all)
  bool no_retry{false};         ///< Disable retries
  std::string log_level;        ///< Logging verbosity override
  std::string log_file;         ///< Rotating log file override
  std::unordered_map<std::string, std::string>
      log_categories;           ///< Category level overrides
  std::string route;            ///< Route or absolute URL to request
};

/**
 * Parse command line arguments and return the normalized options structure.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Null-terminated array of raw CLI argument strings.
 * @return Populated options structure describing the requested call.
 * @throws CliParseExit When parsing fails or `--help`/`--version` was given.
 */
CliOptions parse_cli(int argc, char **argv);

/**
 * Combine the configuration file named in @p options with the CLI overrides.
 *
 * @throws ConfigError When the file or an override is invalid.
 */
ClientConfig make_config(const CliOptions &options);

/// Process exit code for a failed call: 3 auth, 4 retryable, 2 otherwise.
int exit_code_for(const Error &error);

/**
 * Execute the request described by @p options.
 *
 * Writes the decoded JSON to @p out, or the error envelope to @p err.
 *
 * @return Process exit code, 0 on success.
 */
int run_cli(const CliOptions &options, GitHubClient &client, std::ostream &out,
            std::ostream &err);

} // namespace octo

#endif // OCTOCLIENT_CLI_HPP
