#pragma once

// ============================================================================
// 事件日志: 每个落库事件一行 json, 追加写
// ============================================================================

#include <ctime>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

#include "../core/errors.hpp"

using json = nlohmann::json;

inline std::string format_utc(int64_t epoch_seconds) {
  std::time_t t = static_cast<std::time_t>(epoch_seconds);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

class EventJournal {
public:
  explicit EventJournal(const std::string &path) : path_(path) {
    out_.open(path, std::ios::app);
    if (!out_.is_open())
      throw ConfigError("cannot open event journal: " + path);
  }

  void append(const json &entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << entry.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    out_.flush();
  }

  const std::string &path() const { return path_; }

private:
  std::string path_;
  std::ofstream out_;
  std::mutex mutex_;
};
