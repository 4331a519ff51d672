#include "log.hpp"
#include <cstdio>
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
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char *kRootLoggerName = "prdeck";

std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;
std::mutex g_thread_pool_mutex;
std::shared_ptr<spdlog::sinks::dist_sink_mt> g_dist_sink;
std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> g_ring_sink;
std::size_t g_ring_capacity = 500;

void ensure_thread_pool() {
  std::lock_guard<std::mutex> lock(g_thread_pool_mutex);
  if (!spdlog::thread_pool()) {
    constexpr std::size_t queue_size = 32768;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
  }
}

/// Shared fan-out sink; every prdeck logger writes through it. Requires
/// g_logger_mutex.
std::shared_ptr<spdlog::sinks::dist_sink_mt> dist_sink_locked() {
  if (!g_dist_sink) {
    g_dist_sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
  }
  return g_dist_sink;
}

std::shared_ptr<spdlog::logger>
make_async_logger(const std::string &name,
                  const std::shared_ptr<spdlog::sinks::dist_sink_mt> &sink) {
  ensure_thread_pool();
  return std::make_shared<spdlog::async_logger>(
      name, sink, spdlog::thread_pool(), spdlog::async_overflow_policy::block);
}

namespace fs = std::filesystem;

/**
 * Compute the filesystem path for a rotated log file.
 *
 * @param base Base log file path.
 * @param index Rotation index to compute.
 * @return Filesystem path pointing to the rotated file.
 */
fs::path calc_rotated_path(const std::string &base, std::size_t index) {
  fs::path base_path(base);
  fs::path parent = base_path.parent_path();
  std::string filename = base_path.filename().string();
  if (index == 0) {
    return parent.empty() ? fs::path(filename) : parent / filename;
  }
  std::string stem = filename;
  std::string ext;
  auto pos = filename.find_last_of('.');
  if (pos != std::string::npos && pos != 0) {
    stem = filename.substr(0, pos);
    ext = filename.substr(pos);
  }
  std::string rotated = stem + "." + std::to_string(index) + ext;
  return parent.empty() ? fs::path(rotated) : parent / rotated;
}

/**
 * Shift compressed archives one slot up, dropping the oldest.
 *
 * @param base Base log file path.
 * @param max_files Maximum number of compressed files to retain.
 */
void shift_compressed_logs(const std::string &base, std::size_t max_files) {
  if (max_files == 0) {
    return;
  }
  std::error_code ec;
  fs::remove(calc_rotated_path(base, max_files).string() + ".gz", ec);
  for (std::size_t i = max_files; i > 1; --i) {
    fs::path src_gz = calc_rotated_path(base, i - 1).string() + ".gz";
    if (!fs::exists(src_gz)) {
      continue;
    }
    fs::path target_gz = calc_rotated_path(base, i).string() + ".gz";
    fs::remove(target_gz, ec);
    fs::rename(src_gz, target_gz, ec);
  }
}

/**
 * Compress a rotated log file into gzip format and remove the original.
 *
 * Runs inside the file sink's rotation hook, so failures are reported on
 * stderr instead of through the logger that is being rotated.
 *
 * @param path Filesystem path to the log file to compress.
 * @return `true` if compression succeeded, otherwise `false`.
 */
bool gzip_rotated_file(const std::string &path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    return false;
  }
  const std::string gz_path = path + ".gz";
  gzFile gz = gzopen(gz_path.c_str(), "wb");
  if (!gz) {
    std::fprintf(stderr, "prdeck: cannot open %s for compression\n",
                 gz_path.c_str());
    return false;
  }
  char buffer[16 * 1024];
  while (input) {
    input.read(buffer, sizeof(buffer));
    std::streamsize read = input.gcount();
    if (read <= 0) {
      continue;
    }
    int written = gzwrite(gz, buffer, static_cast<unsigned>(read));
    if (written != read) {
      int err = 0;
      const char *msg = gzerror(gz, &err);
      std::fprintf(stderr, "prdeck: failed to compress %s: %s\n", path.c_str(),
                   msg ? msg : "unknown");
      gzclose(gz);
      std::error_code ec;
      fs::remove(fs::path(gz_path), ec);
      return false;
    }
  }
  gzclose(gz);
  input.close();
  std::error_code ec;
  fs::remove(fs::path(path), ec);
  return !ec;
}

std::vector<spdlog::sink_ptr> build_sinks(const std::string &file,
                                          std::size_t rotate_files,
                                          bool compress_rotations,
                                          bool console) {
  std::vector<spdlog::sink_ptr> sinks;
  if (console) {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }
  g_ring_sink =
      std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(g_ring_capacity);
  sinks.push_back(g_ring_sink);
  if (file.empty()) {
    return sinks;
  }
  if (rotate_files == 0) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true));
    return sinks;
  }
  spdlog::file_event_handlers handlers;
  if (compress_rotations) {
    handlers.before_open = [rotate_files](const spdlog::filename_t &filename) {
      const auto base = spdlog::details::os::filename_to_str(filename);
      shift_compressed_logs(base, rotate_files);
      fs::path newest = calc_rotated_path(base, 1);
      if (fs::exists(newest)) {
        gzip_rotated_file(newest.string());
      }
    };
  }
  sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      file, 1024 * 1024 * 5, rotate_files, false, handlers));
  return sinks;
}
} // namespace

namespace prdeck {

/**
 * Initialize (or reconfigure) the global spdlog logger.
 *
 * All prdeck loggers share one distributing sink, so reinitialising swaps the
 * destinations of category loggers created earlier as well.
 */
void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations, bool console) {
  ensure_thread_pool();
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto dist = dist_sink_locked();
  dist->set_sinks(
      build_sinks(file, rotate_files, compress_rotations, console));
  auto logger = spdlog::get(kRootLoggerName);
  if (!logger) {
    logger = make_async_logger(kRootLoggerName, dist);
    spdlog::register_logger(logger);
  }
  spdlog::set_default_logger(logger);
  g_logger = logger;
  lock.unlock();
  logger->set_level(level);
  spdlog::apply_all([level](const std::shared_ptr<spdlog::logger> &l) {
    if (l->name().rfind(std::string(kRootLoggerName) + ".", 0) == 0) {
      l->set_level(level);
    }
  });
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->info("Logger initialised (level={}, file='{}', rotate={}, "
               "compress={}, console={})",
               spdlog::level::to_string_view(level), file, rotate_files,
               compress_rotations, console);
}

/**
 * Ensure that the default logger exists before logging.
 *
 * Creates a new logger when previous initialization was skipped or lost.
 */
void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  ensure_thread_pool();
  const std::string name = std::string(kRootLoggerName) + "." + category;
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(name);
  if (logger) {
    return logger;
  }
  if (!g_logger.lock()) {
    lock.unlock();
    init_logger(spdlog::level::info);
    lock.lock();
    logger = spdlog::get(name);
    if (logger) {
      return logger;
    }
  }
  auto new_logger = make_async_logger(name, dist_sink_locked());
  auto root = g_logger.lock();
  new_logger->set_level(root ? root->level() : spdlog::level::info);
  spdlog::register_logger(new_logger);
  return new_logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  if (overrides.empty()) {
    return;
  }
  for (const auto &[category, level] : overrides) {
    auto logger = category_logger(category);
    logger->set_level(level);
    logger->info("Category '{}' set to level {}", category,
                 spdlog::level::to_string_view(level));
  }
  category_logger("logging")->info("Applied {} log category override(s)",
                                   overrides.size());
}

std::vector<std::string> recent_log_lines(std::size_t limit) {
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> ring;
  {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    ring = g_ring_sink;
  }
  if (!ring) {
    return {};
  }
  return ring->last_formatted(limit);
}

void set_log_buffer_capacity(std::size_t capacity) {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  g_ring_capacity = capacity == 0 ? 1 : capacity;
}

} // namespace prdeck
