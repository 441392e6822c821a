#include "log.hpp"
#include "errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

namespace fs = std::filesystem;

constexpr const char *kRootLogger = "octo";
constexpr std::size_t kQueueSize = 32768;
constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024;

std::weak_ptr<spdlog::logger> g_root;
std::mutex g_registry_mutex;
std::once_flag g_pool_once;

void start_log_thread() {
  std::call_once(g_pool_once, [] { spdlog::init_thread_pool(kQueueSize, 1); });
}

std::shared_ptr<spdlog::details::thread_pool> log_thread() {
  auto pool = spdlog::thread_pool();
  if (!pool) {
    start_log_thread();
    pool = spdlog::thread_pool();
  }
  return pool;
}

std::shared_ptr<spdlog::logger> make_async(const std::string &name,
                                           std::vector<spdlog::sink_ptr> sinks) {
  return std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), log_thread(),
      spdlog::async_overflow_policy::block);
}

/**
 * Gzip archive of rotated log files.
 *
 * spdlog names rotations `app.1.log`, `app.2.log`, ...; archived copies carry
 * an extra `.gz` suffix and are shifted up before each rotation so at most
 * `keep` archives exist.
 */
class RotationArchive {
public:
  RotationArchive(std::string base, std::size_t keep)
      : base_(std::move(base)), keep_(keep) {}

  /// Path spdlog uses for rotation @p index (0 is the live file).
  fs::path rotated(std::size_t index) const {
    fs::path base(base_);
    if (index == 0) {
      return base;
    }
    std::string stem = base.filename().string();
    std::string ext;
    auto dot = stem.find_last_of('.');
    if (dot != std::string::npos && dot != 0) {
      ext = stem.substr(dot);
      stem.erase(dot);
    }
    return base.parent_path() / (stem + "." + std::to_string(index) + ext);
  }

  fs::path archived(std::size_t index) const {
    return fs::path(rotated(index).string() + ".gz");
  }

  /// Make room for a new archive: drop the oldest and renumber the rest.
  void shift() const {
    if (keep_ == 0) {
      return;
    }
    std::error_code ec;
    fs::remove(archived(keep_), ec);
    for (std::size_t i = keep_; i > 1; --i) {
      if (!fs::exists(archived(i - 1))) {
        continue;
      }
      fs::remove(archived(i), ec);
      fs::rename(archived(i - 1), archived(i), ec);
    }
  }

  /// Compress the newest rotation into its archive and remove the original.
  bool archive_newest() const {
    const fs::path source = rotated(1);
    if (!fs::exists(source)) {
      return false;
    }
    auto log = octo::category_logger("logging");
    std::ifstream in(source, std::ios::binary);
    if (!in) {
      log->warn("Cannot read rotated log {}", source.string());
      return false;
    }
    const std::string target = archived(1).string();
    gzFile gz = gzopen(target.c_str(), "wb");
    if (gz == nullptr) {
      log->warn("Cannot create log archive {}", target);
      return false;
    }
    std::array<char, 16 * 1024> buffer{};
    while (in) {
      in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      const auto got = in.gcount();
      if (got <= 0) {
        continue;
      }
      if (gzwrite(gz, buffer.data(), static_cast<unsigned>(got)) != got) {
        int code = 0;
        const char *msg = gzerror(gz, &code);
        log->warn("Archiving {} failed: {}", source.string(),
                  msg != nullptr ? msg : "unknown zlib error");
        gzclose(gz);
        std::error_code ec;
        fs::remove(target, ec);
        return false;
      }
    }
    gzclose(gz);
    in.close();
    std::error_code ec;
    fs::remove(source, ec);
    if (ec) {
      log->warn("Archived {} but could not remove it: {}", source.string(),
                ec.message());
    }
    log->debug("Archived rotated log to {}", target);
    return true;
  }

private:
  std::string base_;
  std::size_t keep_;
};

std::vector<spdlog::sink_ptr> make_sinks(const octo::LogOptions &options) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (options.file.empty()) {
    return sinks;
  }
  if (options.rotate_files == 0) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file, true));
    return sinks;
  }
  spdlog::file_event_handlers handlers;
  if (options.compress_rotations) {
    const std::size_t keep = options.rotate_files;
    handlers.before_open = [keep](const spdlog::filename_t &filename) {
      RotationArchive archive(spdlog::details::os::filename_to_str(filename),
                              keep);
      archive.shift();
      archive.archive_newest();
    };
  }
  sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      options.file, kMaxFileSize, options.rotate_files, false, handlers));
  return sinks;
}

} // namespace

namespace octo {

void init_logger(const LogOptions &options) {
  start_log_thread();
  std::shared_ptr<spdlog::logger> root = spdlog::get(kRootLogger);
  if (!root) {
    // Opening a rotating sink may archive old files, which logs.
    auto sinks = make_sinks(options);
    std::lock_guard<std::mutex> lock(g_registry_mutex);
    root = spdlog::get(kRootLogger);
    if (!root) {
      root = make_async(kRootLogger, std::move(sinks));
      spdlog::set_default_logger(root);
      g_root = root;
    }
  }
  root->set_level(options.level);
  if (!options.pattern.empty()) {
    spdlog::set_pattern(options.pattern);
  }
  root->debug("Logging at {} (file='{}', rotate={}, compress={})",
              spdlog::level::to_string_view(options.level), options.file,
              options.rotate_files, options.compress_rotations);
}

void ensure_default_logger() {
  auto current = spdlog::default_logger();
  auto root = g_root.lock();
  if (current && root && current.get() == root.get()) {
    return;
  }
  init_logger(LogOptions{});
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  const std::string name = std::string(kRootLogger) + "." + category;
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  if (!spdlog::default_logger()) {
    init_logger(LogOptions{});
  }
  std::lock_guard<std::mutex> lock(g_registry_mutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto parent = spdlog::default_logger();
  std::vector<spdlog::sink_ptr> sinks;
  if (parent) {
    sinks = parent->sinks();
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }
  auto logger = make_async(name, std::move(sinks));
  logger->set_level(parent ? parent->level() : spdlog::level::info);
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  if (!overrides.empty()) {
    category_logger("logging")->debug("Applied {} category level override(s)",
                                      overrides.size());
  }
}

spdlog::level::level_enum parse_log_level(const std::string &name) {
  static const std::unordered_map<std::string, spdlog::level::level_enum>
      levels = {{"trace", spdlog::level::trace},
                {"debug", spdlog::level::debug},
                {"info", spdlog::level::info},
                {"warn", spdlog::level::warn},
                {"warning", spdlog::level::warn},
                {"error", spdlog::level::err},
                {"err", spdlog::level::err},
                {"critical", spdlog::level::critical},
                {"off", spdlog::level::off}};
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  auto it = levels.find(lower);
  if (it == levels.end()) {
    throw ConfigError("Unknown log level '" + name + "'");
  }
  return it->second;
}

std::string redact_secret(const std::string &secret) {
  if (secret.empty()) {
    return "<empty>";
  }
  if (secret.size() <= 8) {
    return "****";
  }
  return secret.substr(0, 4) + "****";
}

} // namespace octo
