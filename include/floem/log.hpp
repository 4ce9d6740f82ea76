#pragma once

#if defined(FLOEM_LOG_DEBUG)

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <ostream>
#include <set>
#include <source_location>
#include <sstream>
#include <string>
#include <utility>

namespace floem {

class TaggedLogger {
public:
  struct LogMessage {
    std::chrono::system_clock::time_point timestamp;
    std::set<std::string> tags;
    std::string message;
    std::source_location location;
  };

  TaggedLogger() = default;
  TaggedLogger(const TaggedLogger &) = delete;
  TaggedLogger &operator=(const TaggedLogger &) = delete;

  template <typename... Tags>
  void log_impl(const std::string &message, const std::source_location &location,
                Tags &&...tags) {
    std::lock_guard<std::mutex> lock{mutex_};
    if (!enabled_) {
      return;
    }
    write(LogMessage{std::chrono::system_clock::now(),
                     {std::string{std::forward<Tags>(tags)}...},
                     message,
                     location});
  }

  void set_logging_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock{mutex_};
    enabled_ = enabled;
  }

  bool logging_enabled() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return enabled_;
  }

  // nullptr restores std::cerr.
  void set_sink(std::ostream *sink) {
    std::lock_guard<std::mutex> lock{mutex_};
    sink_ = sink;
  }

  void enable_tag(std::string tag) {
    std::lock_guard<std::mutex> lock{mutex_};
    enabled_tags_.insert(std::move(tag));
  }

  void skip_tag(std::string tag) {
    std::lock_guard<std::mutex> lock{mutex_};
    skip_tags_.insert(std::move(tag));
  }

  void clear_tags() {
    std::lock_guard<std::mutex> lock{mutex_};
    enabled_tags_.clear();
    skip_tags_.clear();
  }

private:
  static std::string short_path(const char *filepath) {
    std::filesystem::path p{filepath};
    if (p.has_parent_path()) {
      return (p.parent_path().filename() / p.filename()).string();
    }
    return p.filename().string();
  }

  void write(const LogMessage &msg) const {
    if (!enabled_tags_.empty()) {
      for (const auto &tag : msg.tags) {
        if (!enabled_tags_.contains(tag)) {
          return;
        }
      }
    }
    for (const auto &tag : skip_tags_) {
      if (msg.tags.contains(tag)) {
        return;
      }
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        msg.timestamp.time_since_epoch()) %
                    1000;
    const auto t = std::chrono::system_clock::to_time_t(msg.timestamp);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << ms.count() << ' ';
    oss << '[';
    bool first = true;
    for (const auto &tag : msg.tags) {
      if (!std::exchange(first, false)) {
        oss << "][";
      }
      oss << tag;
    }
    oss << "] ";
    oss << '[' << short_path(msg.location.file_name()) << ':'
        << msg.location.line() << "] ";
    oss << msg.message << '\n';

    std::ostream &out = sink_ ? *sink_ : std::cerr;
    out << oss.str() << std::flush;
  }

  mutable std::mutex mutex_{};
  bool enabled_{false};
  std::ostream *sink_{};
  std::set<std::string> enabled_tags_{};
  std::set<std::string> skip_tags_{};
};

inline TaggedLogger &logger() {
  static TaggedLogger instance;
  return instance;
}

inline void set_logging_enabled(bool enabled) {
  logger().set_logging_enabled(enabled);
}

} // namespace floem

#define floem_log(message, ...)                                                \
  ::floem::logger().log_impl(message, std::source_location::current()         \
                                          __VA_OPT__(, ) __VA_ARGS__)

#else
#define floem_log(message, ...) ((void)0)
#endif // FLOEM_LOG_DEBUG
