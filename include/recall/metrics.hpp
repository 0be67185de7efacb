#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "recall/common.hpp"

namespace recall {

class Metrics {
 public:
  void inc(const std::string& key, uint64_t delta = 1) {
    std::lock_guard<std::mutex> lock(mu_);
    counters_[key] += delta;
  }

  uint64_t get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = counters_.find(key);
    return it == counters_.end() ? 0 : it->second;
  }

  json to_json() const {
    std::lock_guard<std::mutex> lock(mu_);
    json j = json::object();
    for (const auto& kv : counters_) {
      j[kv.first] = kv.second;
    }
    j["updatedAt"] = now_iso8601();
    return j;
  }

 private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, uint64_t> counters_;
};

inline Metrics& metrics() {
  static Metrics m;
  return m;
}

inline fs::path default_metrics_path() {
  return expand_user_path("~/.recall") / "state" / "metrics.json";
}

// Adds this process's counters to the snapshot already on disk.
inline bool write_metrics_snapshot(const fs::path& path = default_metrics_path()) {
  json merged = json::object();
  const std::string raw = read_text_file(path);
  if (!trim(raw).empty()) {
    try {
      merged = json::parse(raw);
    } catch (const json::exception& e) {
      Logger::log(Logger::Level::kWarn, std::string("Discarding unreadable metrics snapshot: ") + e.what());
      merged = json::object();
    }
  }
  const json current = metrics().to_json();
  for (auto it = current.begin(); it != current.end(); ++it) {
    if (it.value().is_number_unsigned()) {
      const uint64_t prev = merged.contains(it.key()) && merged[it.key()].is_number_unsigned()
                                ? merged[it.key()].get<uint64_t>()
                                : 0;
      merged[it.key()] = prev + it.value().get<uint64_t>();
    } else {
      merged[it.key()] = it.value();
    }
  }
  return write_text_file(path, merged.dump(2));
}

}  // namespace recall
