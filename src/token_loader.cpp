#include "token_loader.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace octo {

namespace {

std::string trim(const std::string &value) {
  auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) {
                return std::isspace(c);
              }).base();
  return first < last ? std::string(first, last) : std::string{};
}

std::string require_token(std::string token, const std::string &path) {
  token = trim(token);
  if (token.empty()) {
    throw ConfigError("No token found in " + path);
  }
  return token;
}

} // namespace

std::string read_secret_file(const std::string &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    throw ConfigError("Failed to open secret file " + path);
  }
  std::string content((std::istreambuf_iterator<char>(f)),
                      std::istreambuf_iterator<char>());
  if (trim(content).empty()) {
    throw ConfigError("Secret file " + path + " is empty");
  }
  return content;
}

/**
 * Load an access token from a supported secrets file.
 *
 * @param path Filesystem path to the token file.
 * @return Token found in the file.
 * @throws ConfigError When the file cannot be parsed or holds no token.
 */
std::string load_token_from_file(const std::string &path) {
  std::string ext;
  auto pos = path.find_last_of('.');
  auto slash = path.find_last_of("/\\");
  if (pos != std::string::npos && (slash == std::string::npos || pos > slash)) {
    ext = path.substr(pos + 1);
  }
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  try {
    if (ext == "yaml" || ext == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      if (node.IsScalar()) {
        return require_token(node.as<std::string>(), path);
      }
      if (node.IsMap() && node["token"]) {
        return require_token(node["token"].as<std::string>(), path);
      }
      throw ConfigError("YAML token file must contain a token entry");
    }
    if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        throw ConfigError("Failed to open token file " + path);
      }
      nlohmann::json j;
      f >> j;
      if (j.is_string()) {
        return require_token(j.get<std::string>(), path);
      }
      if (j.is_object() && j.contains("token") && j["token"].is_string()) {
        return require_token(j["token"].get<std::string>(), path);
      }
      throw ConfigError("JSON token file must contain a token string");
    }
    if (ext == "toml" || ext == "tml") {
      toml::table tbl = toml::parse_file(path);
      if (auto single = tbl["token"].value<std::string>()) {
        return require_token(*single, path);
      }
      throw ConfigError("TOML token file must contain a token string");
    }
  } catch (const ConfigError &) {
    throw;
  } catch (const std::exception &e) {
    throw ConfigError("Failed to read token file " + path + ": " + e.what());
  }
  return require_token(read_secret_file(path), path);
}

} // namespace octo
