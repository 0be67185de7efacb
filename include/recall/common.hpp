#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace recall {

using json = nlohmann::json;
namespace fs = std::filesystem;

// Milliseconds since the Unix epoch.
using Clock = std::function<int64_t()>;

inline std::string trim(const std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

inline std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline std::string home_dir() {
#ifdef _WIN32
  const char* p = std::getenv("USERPROFILE");
#else
  const char* p = std::getenv("HOME");
#endif
  return p ? std::string(p) : std::string(".");
}

inline fs::path expand_user_path(const std::string& p) {
  if (!p.empty() && p[0] == '~') {
    std::string suffix = p.substr(1);
    while (!suffix.empty() && (suffix.front() == '/' || suffix.front() == '\\')) {
      suffix.erase(suffix.begin());
    }
    return fs::path(home_dir()) / suffix;
  }
  return fs::path(p);
}

inline std::string read_text_file(const fs::path& p) {
  std::ifstream in(p, std::ios::in | std::ios::binary);
  if (!in) {
    return "";
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

inline bool write_text_file(const fs::path& p, const std::string& content) {
  std::error_code ec;
  fs::create_directories(p.parent_path(), ec);
  std::ofstream out(p, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out << content;
  return static_cast<bool>(out);
}

inline std::string format_iso8601(int64_t ms) {
  const std::time_t t = static_cast<std::time_t>(ms / 1000);
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return ss.str();
}

inline int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline std::string now_iso8601() { return format_iso8601(now_ms()); }

inline Clock system_clock() {
  return []() { return now_ms(); };
}

inline bool is_valid_utf8(const std::string& text) {
  try {
    (void)json(text).dump();
  } catch (const json::type_error&) {
    return false;
  }
  return true;
}

class Logger {
 public:
  enum class Level { kInfo, kWarn, kError, kDebug };

  static void set_json(bool enabled) { json_mode().store(enabled); }
  static void set_min_level(Level level) { min_level().store(level_rank(level)); }

  static bool parse_level(const std::string& name, Level* out) {
    const std::string n = to_lower(trim(name));
    if (n == "debug") {
      *out = Level::kDebug;
    } else if (n == "info") {
      *out = Level::kInfo;
    } else if (n == "warn" || n == "warning") {
      *out = Level::kWarn;
    } else if (n == "error") {
      *out = Level::kError;
    } else {
      return false;
    }
    return true;
  }

  static void log(Level level, const std::string& msg) {
    if (level_rank(level) < min_level().load()) {
      return;
    }
    static std::mutex mu;
    std::lock_guard<std::mutex> lock(mu);
    if (json_mode().load()) {
      json j;
      j["time"] = now_iso8601();
      j["level"] = level_name(level);
      j["msg"] = msg;
      std::cerr << j.dump() << "\n";
    } else {
      std::cerr << "[" << level_name(level) << "] " << msg << "\n";
    }
  }

 private:
  static int level_rank(Level level) {
    switch (level) {
      case Level::kDebug:
        return 0;
      case Level::kInfo:
        return 1;
      case Level::kWarn:
        return 2;
      case Level::kError:
      default:
        return 3;
    }
  }

  static std::atomic<bool>& json_mode() {
    static std::atomic<bool> v{false};
    return v;
  }

  static std::atomic<int>& min_level() {
    static std::atomic<int> v{1};
    return v;
  }

  static const char* level_name(Level level) {
    switch (level) {
      case Level::kInfo:
        return "INFO";
      case Level::kWarn:
        return "WARN";
      case Level::kError:
        return "ERROR";
      case Level::kDebug:
      default:
        return "DEBUG";
    }
  }
};

}  // namespace recall
