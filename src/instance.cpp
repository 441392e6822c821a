#include "instance.hpp"
#include "log.hpp"

#include <mutex>
#include <spdlog/spdlog.h>
#include <utility>

namespace octo {

namespace {

std::mutex g_init_mutex;
std::mutex g_slot_mutex;
std::shared_ptr<GitHubClient> g_client;

std::shared_ptr<spdlog::logger> registry_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("registry");
  }();
  return logger;
}

} // namespace

std::shared_ptr<GitHubClient> initialise(const ClientConfig &config,
                                         std::unique_ptr<HttpClient> http) {
  std::lock_guard<std::mutex> init_lock(g_init_mutex);
  auto client = std::make_shared<GitHubClient>(config, std::move(http));
  std::shared_ptr<GitHubClient> previous;
  {
    std::lock_guard<std::mutex> lock(g_slot_mutex);
    previous = std::exchange(g_client, client);
  }
  registry_log()->info("Installed client for {}{}", client->builder().base_url(),
                       previous ? " (replacing previous instance)" : "");
  return client;
}

std::shared_ptr<GitHubClient> instance() {
  {
    std::lock_guard<std::mutex> lock(g_slot_mutex);
    if (g_client) {
      return g_client;
    }
  }
  std::lock_guard<std::mutex> init_lock(g_init_mutex);
  std::lock_guard<std::mutex> lock(g_slot_mutex);
  if (!g_client) {
    g_client = std::make_shared<GitHubClient>();
    registry_log()->debug("Created default client");
  }
  return g_client;
}

void reset_instance() {
  std::shared_ptr<GitHubClient> previous;
  {
    std::lock_guard<std::mutex> init_lock(g_init_mutex);
    std::lock_guard<std::mutex> lock(g_slot_mutex);
    previous = std::move(g_client);
    g_client.reset();
  }
}

} // namespace octo
