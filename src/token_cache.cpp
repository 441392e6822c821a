#include "token_cache.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <ctime>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>

namespace octo {

namespace {

std::shared_ptr<spdlog::logger> cache_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("token.cache");
  }();
  return logger;
}

} // namespace

std::optional<std::chrono::system_clock::time_point>
parse_github_timestamp(const std::string &value) {
  std::tm tm{};
  std::istringstream in(value);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }
  // Fractional seconds and the trailing `Z` are ignored; GitHub reports UTC.
  std::time_t seconds = timegm(&tm);
  if (seconds == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(seconds);
}

InstallationToken
parse_installation_token(const std::string &body,
                         std::chrono::system_clock::time_point now) {
  nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object() || !j.contains("token") ||
      !j["token"].is_string() || j["token"].get<std::string>().empty()) {
    throw AuthError("Installation token response did not contain a token");
  }
  InstallationToken token;
  token.token = j["token"].get<std::string>();
  token.expires_at = now + std::chrono::hours(1);
  if (j.contains("expires_at") && j["expires_at"].is_string()) {
    auto parsed = parse_github_timestamp(j["expires_at"].get<std::string>());
    if (parsed) {
      token.expires_at = *parsed;
    } else {
      cache_log()->warn("Unparseable expires_at '{}', assuming one hour",
                        j["expires_at"].get<std::string>());
    }
  }
  return token;
}

TokenCache::TokenCache(std::chrono::seconds safety_margin, Clock clock)
    : safety_margin_(safety_margin), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

std::shared_ptr<TokenCache::Entry>
TokenCache::entry(std::uint64_t installation_id) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto &slot = entries_[installation_id];
  if (!slot) {
    slot = std::make_shared<Entry>();
  }
  return slot;
}

std::shared_ptr<TokenCache::Entry>
TokenCache::find(std::uint64_t installation_id) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = entries_.find(installation_id);
  return it == entries_.end() ? nullptr : it->second;
}

bool TokenCache::is_fresh(const InstallationToken &token) const {
  return clock_() < token.expires_at - safety_margin_;
}

std::string TokenCache::get(std::uint64_t installation_id,
                            const Refresh &refresh) {
  auto slot = entry(installation_id);
  std::lock_guard<std::mutex> lock(slot->mutex);
  if (slot->token && is_fresh(*slot->token)) {
    return slot->token->token;
  }
  cache_log()->debug("Refreshing installation token for {}", installation_id);
  slot->token.reset();
  InstallationToken fresh = refresh(installation_id);
  slot->token = fresh;
  cache_log()->info("Installation {} token refreshed", installation_id);
  return fresh.token;
}

std::optional<InstallationToken>
TokenCache::peek(std::uint64_t installation_id) const {
  auto slot = find(installation_id);
  if (!slot) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(slot->mutex);
  return slot->token;
}

void TokenCache::invalidate(std::uint64_t installation_id) {
  auto slot = find(installation_id);
  if (!slot) {
    return;
  }
  std::lock_guard<std::mutex> lock(slot->mutex);
  slot->token.reset();
  cache_log()->debug("Installation {} token invalidated", installation_id);
}

bool TokenCache::invalidate_if(std::uint64_t installation_id,
                               const std::string &rejected) {
  auto slot = find(installation_id);
  if (!slot) {
    return false;
  }
  std::lock_guard<std::mutex> lock(slot->mutex);
  if (!slot->token || slot->token->token != rejected) {
    cache_log()->debug("Installation {} token already replaced; keeping it",
                       installation_id);
    return false;
  }
  slot->token.reset();
  cache_log()->debug("Installation {} token invalidated", installation_id);
  return true;
}

std::size_t TokenCache::size() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  std::size_t count = 0;
  for (const auto &[id, slot] : entries_) {
    std::lock_guard<std::mutex> entry_lock(slot->mutex);
    if (slot->token) {
      ++count;
    }
  }
  return count;
}

} // namespace octo
