#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "token_loader.hpp"
#include "util/duration.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace octo {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/// Typed JSON value for a YAML scalar: booleans and numbers are recognised,
/// anything else stays a string.
nlohmann::json yaml_scalar(const std::string &text) {
  static const std::array<std::string_view, 3> truthy = {"true", "True", "TRUE"};
  static const std::array<std::string_view, 3> falsy = {"false", "False",
                                                       "FALSE"};
  if (std::find(truthy.begin(), truthy.end(), text) != truthy.end()) {
    return true;
  }
  if (std::find(falsy.begin(), falsy.end(), text) != falsy.end()) {
    return false;
  }
  const unsigned char lead = text.empty() ? 0 : text.front();
  if (!std::isdigit(lead) && lead != '-' && lead != '+' && lead != '.') {
    return text;
  }
  if (text.find_first_of("xXnN") != std::string::npos) {
    return text;
  }
  const char *begin = text.c_str();
  char *end = nullptr;
  errno = 0;
  long long integer = std::strtoll(begin, &end, 10);
  if (errno == 0 && end == begin + text.size()) {
    return integer;
  }
  errno = 0;
  double real = std::strtod(begin, &end);
  if (errno == 0 && end == begin + text.size()) {
    return real;
  }
  return text;
}

nlohmann::json from_yaml(const YAML::Node &node) {
  if (node.IsMap()) {
    nlohmann::json object = nlohmann::json::object();
    for (const auto &entry : node) {
      object[entry.first.as<std::string>()] = from_yaml(entry.second);
    }
    return object;
  }
  if (node.IsSequence()) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto &item : node) {
      array.push_back(from_yaml(item));
    }
    return array;
  }
  if (node.IsScalar()) {
    return yaml_scalar(node.Scalar());
  }
  return nullptr;
}

/// Dates and times are kept in their TOML text form.
nlohmann::json from_toml(const toml::node &node) {
  return node.visit([](const auto &n) -> nlohmann::json {
    using N = std::decay_t<decltype(n)>;
    if constexpr (toml::is_table<N>) {
      nlohmann::json object = nlohmann::json::object();
      for (const auto &[key, child] : n) {
        object[std::string(key.str())] = from_toml(child);
      }
      return object;
    } else if constexpr (toml::is_array<N>) {
      nlohmann::json array = nlohmann::json::array();
      for (const auto &child : n) {
        array.push_back(from_toml(child));
      }
      return array;
    } else if constexpr (toml::is_date<N> || toml::is_time<N> ||
                         toml::is_date_time<N>) {
      std::ostringstream text;
      text << n;
      return text.str();
    } else {
      return *n;
    }
  });
}

/// Files may group keys under `network`, `auth`, `logging` or `cache`; their
/// entries are lifted to the top level.
nlohmann::json flatten_sections(const nlohmann::json &document) {
  static const std::array<const char *, 4> sections = {"network", "auth",
                                                       "logging", "cache"};
  nlohmann::json flat = document;
  for (const char *section : sections) {
    auto it = document.find(section);
    if (it == document.end() || !it->is_object()) {
      continue;
    }
    for (const auto &[key, value] : it->items()) {
      flat[key] = value;
    }
  }
  return flat;
}

/// Durations are strings such as "1m30s" or plain milliseconds.
std::chrono::milliseconds duration_value(const nlohmann::json &value,
                                         const std::string &key) {
  if (value.is_number_integer()) {
    return std::chrono::milliseconds(value.get<long long>());
  }
  if (value.is_string()) {
    return parse_duration(value.get<std::string>());
  }
  throw ConfigError("Expected a duration for '" + key + "'");
}

std::uint64_t installation_value(const nlohmann::json &value) {
  if (value.is_number_unsigned() || value.is_number_integer()) {
    return value.get<std::uint64_t>();
  }
  if (value.is_string()) {
    try {
      std::size_t idx = 0;
      std::string raw = value.get<std::string>();
      unsigned long long id = std::stoull(raw, &idx);
      if (idx == raw.size()) {
        return id;
      }
    } catch (const std::exception &) {
    }
  }
  throw ConfigError("installation_id must be a positive integer");
}

void load_retry(const nlohmann::json &cfg, RetryPolicy &policy) {
  if (cfg.contains("retry")) {
    const auto &retry = cfg["retry"];
    if (retry.is_boolean()) {
      policy.enabled = retry.get<bool>();
    } else if (retry.is_object()) {
      if (retry.contains("enabled"))
        policy.enabled = retry["enabled"].get<bool>();
      if (retry.contains("max_attempts"))
        policy.max_attempts = retry["max_attempts"].get<int>();
      if (retry.contains("base_delay"))
        policy.base_delay = duration_value(retry["base_delay"], "base_delay");
      if (retry.contains("max_delay"))
        policy.max_delay = duration_value(retry["max_delay"], "max_delay");
      if (retry.contains("jitter"))
        policy.jitter = retry["jitter"].get<double>();
      if (retry.contains("max_rate_limit_wait"))
        policy.max_rate_limit_wait = duration_value(
            retry["max_rate_limit_wait"], "max_rate_limit_wait");
    } else {
      throw ConfigError("retry must be a boolean or a table");
    }
  }
  if (cfg.contains("max_attempts")) {
    policy.max_attempts = cfg["max_attempts"].get<int>();
  }
  if (policy.max_attempts < 1) {
    throw ConfigError("max_attempts must be at least 1");
  }
  if (policy.jitter < 0.0 || policy.jitter >= 1.0) {
    throw ConfigError("retry jitter must be in [0, 1)");
  }
  if (policy.base_delay.count() < 0 || policy.max_delay < policy.base_delay) {
    throw ConfigError("retry delays must satisfy 0 <= base_delay <= max_delay");
  }
}

std::unordered_map<std::string, std::string>
load_log_categories(const nlohmann::json &value) {
  std::unordered_map<std::string, std::string> categories;
  auto assign_category = [&categories](std::string name, std::string level) {
    if (name.empty()) {
      return;
    }
    if (level.empty()) {
      level = "debug";
    }
    categories[std::move(name)] = std::move(level);
  };
  auto assign_raw = [&assign_category](const std::string &raw) {
    auto pos = raw.find('=');
    assign_category(pos == std::string::npos ? raw : raw.substr(0, pos),
                    pos == std::string::npos ? std::string{"debug"}
                                             : raw.substr(pos + 1));
  };
  if (value.is_object()) {
    for (const auto &[key, v] : value.items()) {
      if (v.is_string()) {
        assign_category(key, v.get<std::string>());
      } else if (v.is_null()) {
        assign_category(key, "debug");
      } else {
        config_log()->warn("Unsupported value for log category '{}'; "
                           "expected string or null",
                           key);
      }
    }
  } else if (value.is_array()) {
    for (const auto &item : value) {
      if (item.is_string()) {
        assign_raw(item.get<std::string>());
      }
    }
  } else if (value.is_string()) {
    assign_raw(value.get<std::string>());
  }
  return categories;
}

} // namespace

Credential ClientConfig::credential() const {
  int kinds = 0;
  kinds += token_.empty() ? 0 : 1;
  kinds += oauth_token_.empty() ? 0 : 1;
  kinds += basic_user_.empty() ? 0 : 1;
  kinds += app_id_.empty() ? 0 : 1;
  if (kinds > 1) {
    throw ConfigError("Configure only one of token, oauth_token, basic_user "
                      "or app_id");
  }
  if (installation_id_ != 0 && app_id_.empty()) {
    throw ConfigError("installation_id requires app_id");
  }
  if (!token_.empty()) {
    return BearerToken{token_};
  }
  if (!oauth_token_.empty()) {
    return OAuthAppToken{oauth_token_};
  }
  if (!basic_user_.empty()) {
    return BasicAuth{basic_user_, basic_password_};
  }
  if (!app_id_.empty()) {
    if (private_key_.empty()) {
      throw ConfigError("app_id requires private_key or private_key_file");
    }
    GitHubApp app{app_id_, private_key_};
    if (installation_id_ != 0) {
      return Installation{std::move(app), installation_id_};
    }
    return app;
  }
  return NoAuth{};
}

LogOptions ClientConfig::log_options() const {
  LogOptions options;
  options.level = parse_log_level(log_level_);
  options.pattern = log_pattern_;
  options.file = log_file_;
  options.rotate_files = static_cast<std::size_t>(log_rotate_);
  options.compress_rotations = log_compress_;
  return options;
}

/**
 * Apply the settings found in a configuration document.
 *
 * @param j JSON document with configuration values; `network`, `auth`,
 *        `logging` and `cache` sections are flattened first.
 * @throws ConfigError When a value is invalid.
 * @throws nlohmann::json::exception When value conversions fail.
 */
void ClientConfig::load_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw ConfigError("Configuration document must be an object");
  }
  nlohmann::json cfg = flatten_sections(j);

  if (cfg.contains("api_base")) {
    set_api_base(cfg["api_base"].get<std::string>());
  }
  if (cfg.contains("graphql_base")) {
    set_graphql_base(cfg["graphql_base"].get<std::string>());
  }
  if (cfg.contains("user_agent")) {
    set_user_agent(cfg["user_agent"].get<std::string>());
  }
  if (cfg.contains("api_version")) {
    set_api_version(cfg["api_version"].get<std::string>());
  }
  if (cfg.contains("previews")) {
    set_previews(cfg["previews"].get<std::vector<std::string>>());
  }
  if (cfg.contains("token")) {
    set_token(cfg["token"].get<std::string>());
  }
  if (cfg.contains("token_file")) {
    set_token(load_token_from_file(cfg["token_file"].get<std::string>()));
  }
  if (cfg.contains("oauth_token")) {
    set_oauth_token(cfg["oauth_token"].get<std::string>());
  }
  if (cfg.contains("basic_user")) {
    set_basic_auth(cfg["basic_user"].get<std::string>(),
                   cfg.value("basic_password", std::string{}));
  }
  if (cfg.contains("app_id")) {
    const auto &id = cfg["app_id"];
    set_app_id(id.is_string() ? id.get<std::string>()
                              : std::to_string(id.get<std::uint64_t>()));
  }
  if (cfg.contains("private_key")) {
    set_private_key(cfg["private_key"].get<std::string>());
  }
  if (cfg.contains("private_key_file")) {
    set_private_key(
        read_secret_file(cfg["private_key_file"].get<std::string>()));
  }
  if (cfg.contains("installation_id")) {
    set_installation_id(installation_value(cfg["installation_id"]));
  }
  if (cfg.contains("timeout")) {
    set_timeout(duration_value(cfg["timeout"], "timeout"));
  }
  if (cfg.contains("token_safety_margin")) {
    set_token_safety_margin(std::chrono::duration_cast<std::chrono::seconds>(
        duration_value(cfg["token_safety_margin"], "token_safety_margin")));
  }
  load_retry(cfg, retry_);
  if (cfg.contains("cache_enabled")) {
    set_cache_enabled(cfg["cache_enabled"].get<bool>());
  }
  if (cfg.contains("cache_file")) {
    set_cache_file(cfg["cache_file"].get<std::string>());
  }
  if (cfg.contains("http_proxy")) {
    set_http_proxy(cfg["http_proxy"].get<std::string>());
  }
  if (cfg.contains("https_proxy")) {
    set_https_proxy(cfg["https_proxy"].get<std::string>());
  }
  if (cfg.contains("download_limit")) {
    set_download_limit(cfg["download_limit"].get<long long>());
  }
  if (cfg.contains("upload_limit")) {
    set_upload_limit(cfg["upload_limit"].get<long long>());
  }
  if (cfg.contains("workers")) {
    set_workers(std::max(1, cfg["workers"].get<int>()));
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_compress")) {
    set_log_compress(cfg["log_compress"].get<bool>());
  }
  if (cfg.contains("log_categories")) {
    set_log_categories(load_log_categories(cfg["log_categories"]));
  }
}

/**
 * Construct a configuration object from a JSON representation.
 *
 * @param j JSON document with configuration values.
 * @return Populated configuration instance.
 */
ClientConfig ClientConfig::from_json(const nlohmann::json &j) {
  ClientConfig cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown as ConfigError.
 *
 * @param path Filesystem location of the configuration file.
 * @return Fully populated configuration object.
 * @throws ConfigError When the file cannot be opened or parsed, or when the
 *         extension is unsupported.
 */
ClientConfig ClientConfig::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw ConfigError("Unknown config file extension: " + path);
  }
  std::string ext = path.substr(pos + 1);
  std::string ext_lower = to_lower_copy(ext);
  config_log()->debug("Detected config file type: {}", ext_lower);
  nlohmann::json j;
  try {
    if (ext_lower == "yaml" || ext_lower == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = from_yaml(node);
    } else if (ext_lower == "json") {
      std::ifstream f(path);
      if (!f) {
        throw ConfigError("Failed to open config file " + path);
      }
      f >> j;
    } else if (ext_lower == "toml" || ext_lower == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = from_toml(tbl);
    } else {
      throw ConfigError("Unsupported config format: " + ext);
    }
  } catch (const ConfigError &e) {
    config_log()->error("{}", e.what());
    throw;
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw ConfigError("Failed to load config " + path + ": " + e.what());
  }
  ClientConfig cfg;
  try {
    cfg.load_json(j);
  } catch (const nlohmann::json::exception &e) {
    throw ConfigError("Invalid value in " + path + ": " + e.what());
  }
  config_log()->info("Config loaded successfully from {}", path);
  return cfg;
}

} // namespace octo
