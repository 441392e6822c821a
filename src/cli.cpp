#include "cli.hpp"
#include "github_client.hpp"
#include "log.hpp"
#include "token_loader.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <limits>
#include <sstream>
#include <string_view>

#include <spdlog/spdlog.h>

namespace octo {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 9> categories = {
      "auth",     "cli",      "config",     "github.client", "http",
      "logging",  "pagination", "registry", "token.cache"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., http=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}

Method parse_method(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (upper == "GET")
    return Method::Get;
  if (upper == "HEAD")
    return Method::Head;
  if (upper == "POST")
    return Method::Post;
  if (upper == "PUT")
    return Method::Put;
  if (upper == "PATCH")
    return Method::Patch;
  if (upper == "DELETE")
    return Method::Delete;
  throw ConfigError("Unsupported HTTP method '" + name + "'");
}

void report_error(const Error &error, std::ostream &err) {
  err << error.describe() << '\n';
  if (error.github) {
    err << error.github->to_string() << '\n';
  } else if (!error.body.empty()) {
    err << error.body << '\n';
  }
}

} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"octoclient command line: send one request to the GitHub API"};
  app.footer(log_category_help_text());
  CliOptions options;
  app.add_option("route", options.route,
                 "Route relative to the API base, or an absolute URL")
      ->required()
      ->group("Request");
  app.add_option("-X,--method", options.method, "HTTP method")
      ->type_name("VERB")
      ->check(CLI::IsMember({"GET", "HEAD", "POST", "PUT", "PATCH", "DELETE"},
                            CLI::ignore_case))
      ->default_val("GET")
      ->group("Request");
  app.add_option("-d,--data", options.data, "JSON request body")
      ->type_name("JSON")
      ->group("Request");
  app.add_option("-q,--query", options.query,
                 "Query parameter, may be repeated")
      ->type_name("KEY=VALUE")
      ->group("Request");
  app.add_option("--accept", options.accept, "Override the Accept header")
      ->type_name("MEDIA_TYPE")
      ->group("Request");
  app.add_flag("-p,--paginate", options.paginate,
               "Follow Link headers and print every page")
      ->group("Request");
  app.add_option("--limit", options.limit,
                 "Stop paginating after this many items (0 = all)")
      ->type_name("N")
      ->group("Request");
  app.add_flag("--no-retry", options.no_retry, "Disable retries")
      ->group("Request");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("General");
  app.add_option("--api-base", options.api_base, "Base URL of the REST API")
      ->type_name("URL")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "octoclient " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  auto *token_opt =
      app.add_option("--token", options.token, "Personal access token")
          ->type_name("TOKEN")
          ->group("Authentication");
  app.add_option("--token-file", options.token_file,
                 "File containing a token (plain, JSON, YAML or TOML)")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->excludes(token_opt)
      ->group("Authentication");
  auto *app_id_opt =
      app.add_option("--app-id", options.app_id, "GitHub App id")
          ->type_name("ID")
          ->excludes(token_opt)
          ->group("Authentication");
  app.add_option("--private-key-file", options.private_key_file,
                 "PEM private key of the GitHub App")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->needs(app_id_opt)
      ->group("Authentication");
  app.add_option("--installation-id", options.installation_id,
                 "Installation the GitHub App acts as")
      ->type_name("ID")
      ->needs(app_id_opt)
      ->group("Authentication");
  app.add_option(
         "-G,--log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
         },
         "Enable a logging category (NAME or NAME=LEVEL). See help footer for "
         "available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");
  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  return options;
}

ClientConfig make_config(const CliOptions &options) {
  ClientConfig config = options.config_file.empty()
                            ? ClientConfig{}
                            : ClientConfig::from_file(options.config_file);
  if (!options.api_base.empty()) {
    config.set_api_base(options.api_base);
  }
  if (!options.token.empty()) {
    config.set_token(options.token);
  } else if (!options.token_file.empty()) {
    config.set_token(load_token_from_file(options.token_file));
  }
  if (!options.app_id.empty()) {
    config.set_token({});
    config.set_app_id(options.app_id);
  }
  if (!options.private_key_file.empty()) {
    config.set_private_key(read_secret_file(options.private_key_file));
  }
  if (options.installation_id != 0) {
    config.set_installation_id(options.installation_id);
  }
  if (options.no_retry) {
    RetryPolicy policy = config.retry();
    policy.enabled = false;
    config.set_retry(policy);
  }
  if (!options.log_level.empty()) {
    config.set_log_level(options.log_level);
  }
  if (!options.log_file.empty()) {
    config.set_log_file(options.log_file);
  }
  if (!options.log_categories.empty()) {
    auto categories = config.log_categories();
    for (const auto &[name, level] : options.log_categories) {
      categories[name] = level;
    }
    config.set_log_categories(categories);
  }
  // Validate the credential combination before any request is attempted.
  (void)config.credential();
  return config;
}

int exit_code_for(const Error &error) {
  if (error.is_auth_error()) {
    return 3;
  }
  if (error.is_retryable()) {
    return 4;
  }
  return 2;
}

int run_cli(const CliOptions &options, GitHubClient &client, std::ostream &out,
            std::ostream &err) {
  Method method = Method::Get;
  QueryParams query;
  std::optional<nlohmann::json> body;
  try {
    method = parse_method(options.method);
    for (const auto &raw : options.query) {
      auto pos = raw.find('=');
      if (pos == std::string::npos || pos == 0) {
        throw ConfigError("Query parameter must be KEY=VALUE: " + raw);
      }
      query.emplace_back(raw.substr(0, pos), raw.substr(pos + 1));
    }
    if (!options.data.empty()) {
      body = nlohmann::json::parse(options.data);
    }
  } catch (const ConfigError &e) {
    err << e.what() << '\n';
    return 2;
  } catch (const nlohmann::json::parse_error &e) {
    err << "Request body is not valid JSON: " << e.what() << '\n';
    return 2;
  }
  if (options.paginate && method != Method::Get) {
    err << "--paginate requires GET\n";
    return 2;
  }

  Request request = client.build(method, options.route, query, body);
  if (!options.accept.empty()) {
    request.set_header("Accept", options.accept);
  }
  cli_log()->debug("{} {}", to_string(method), request.url);

  if (options.paginate) {
    auto first = client.send<Page<nlohmann::json>>(std::move(request));
    if (!first) {
      report_error(first.error(), err);
      return exit_code_for(first.error());
    }
    const std::size_t limit = options.limit == 0
                                  ? std::numeric_limits<std::size_t>::max()
                                  : options.limit;
    auto items = client.all_pages(std::move(first).value(), limit);
    if (!items) {
      report_error(items.error(), err);
      return exit_code_for(items.error());
    }
    out << nlohmann::json(items.value()).dump(2) << '\n';
    return 0;
  }

  auto result = client.send<nlohmann::json>(std::move(request));
  if (!result) {
    report_error(result.error(), err);
    return exit_code_for(result.error());
  }
  if (!result.value().is_null()) {
    out << result.value().dump(2) << '\n';
  }
  return 0;
}

} // namespace octo
