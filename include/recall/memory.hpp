#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "recall/common.hpp"
#include "recall/errors.hpp"

namespace recall {

constexpr int kMinImportance = 1;
constexpr int kMaxImportance = 10;

enum class MemoryKind { kObservation, kReflection, kPlan };

inline const char* kind_name(MemoryKind kind) {
  switch (kind) {
    case MemoryKind::kReflection:
      return "reflection";
    case MemoryKind::kPlan:
      return "plan";
    case MemoryKind::kObservation:
    default:
      return "observation";
  }
}

inline std::optional<MemoryKind> parse_kind(const std::string& name) {
  const std::string n = to_lower(trim(name));
  if (n == "observation") {
    return MemoryKind::kObservation;
  }
  if (n == "reflection") {
    return MemoryKind::kReflection;
  }
  if (n == "plan") {
    return MemoryKind::kPlan;
  }
  return std::nullopt;
}

struct MemoryRecord {
  uint64_t id{0};
  std::string text;
  std::vector<float> embedding;
  MemoryKind kind{MemoryKind::kObservation};
  int importance{kMinImportance};
  int64_t created_at{0};
  int64_t last_accessed_at{0};
  std::vector<uint64_t> source_ids;
};

struct ImportanceRange {
  int min{kMinImportance};
  int max{kMinImportance};
};

// Append-only store of one identity's memories. Records are kept in insertion
// order (ids and created_at both non-decreasing) with an id index for lookup.
class MemoryStream {
 public:
  MemoryStream() = default;
  MemoryStream(const MemoryStream& other) {
    std::lock_guard<std::mutex> lock(other.mu_);
    records_ = other.records_;
    index_ = other.index_;
    next_id_ = other.next_id_;
    range_ = other.range_;
  }
  MemoryStream& operator=(const MemoryStream&) = delete;

  uint64_t insert(MemoryRecord record) {
    std::lock_guard<std::mutex> lock(mu_);
    record.id = next_id_;
    return append_locked(std::move(record));
  }

  // Inserts every record or none of them.
  std::vector<uint64_t> insert_all(std::vector<MemoryRecord> records) {
    std::lock_guard<std::mutex> lock(mu_);
    const uint64_t first_id = next_id_;
    std::vector<uint64_t> ids;
    ids.reserve(records.size());
    try {
      for (auto& r : records) {
        r.id = next_id_;
        ids.push_back(append_locked(std::move(r)));
      }
    } catch (const InvalidRecord&) {
      rollback_locked(first_id);
      throw;
    }
    return ids;
  }

  // Drops every record with an id at or above first_id and hands those ids out
  // again. Used to undo the records of an aborted turn before they are saved.
  void rollback_to(uint64_t first_id) {
    std::lock_guard<std::mutex> lock(mu_);
    rollback_locked(first_id);
  }

  // Re-inserts a record read back from storage, keeping its id.
  uint64_t restore(MemoryRecord record) {
    std::lock_guard<std::mutex> lock(mu_);
    if (record.id < next_id_) {
      throw InvalidRecord("restored id " + std::to_string(record.id) + " is not above " +
                          std::to_string(next_id_ - 1));
    }
    return append_locked(std::move(record));
  }

  MemoryRecord get(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return records_[position_locked(id)];
  }

  bool contains(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return index_.count(id) > 0;
  }

  std::vector<MemoryRecord> all() const {
    std::lock_guard<std::mutex> lock(mu_);
    return records_;
  }

  // Read-only pass over every record in insertion order. fn must not call back
  // into the stream.
  template <typename Fn>
  void visit(Fn&& fn) const {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& r : records_) {
      fn(r);
    }
  }

  void touch(uint64_t id, int64_t timestamp) {
    std::lock_guard<std::mutex> lock(mu_);
    MemoryRecord& r = records_[position_locked(id)];
    if (timestamp < r.last_accessed_at) {
      throw InvalidRecord("access time of record " + std::to_string(id) + " would move backwards (" +
                          std::to_string(timestamp) + " < " + std::to_string(r.last_accessed_at) + ")");
    }
    r.last_accessed_at = timestamp;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return records_.size();
  }

  bool empty() const { return size() == 0; }

  int64_t latest_created_at() const {
    std::lock_guard<std::mutex> lock(mu_);
    return records_.empty() ? 0 : records_.back().created_at;
  }

  ImportanceRange importance_range() const {
    std::lock_guard<std::mutex> lock(mu_);
    return range_;
  }

  uint64_t next_id() const {
    std::lock_guard<std::mutex> lock(mu_);
    return next_id_;
  }

 private:
  std::size_t position_locked(uint64_t id) const {
    const auto it = index_.find(id);
    if (it == index_.end()) {
      throw NotFound(id);
    }
    return it->second;
  }

  void validate_locked(const MemoryRecord& r) const {
    if (trim(r.text).empty()) {
      throw InvalidRecord("text is empty");
    }
    if (!is_valid_utf8(r.text)) {
      throw InvalidRecord("text is not valid UTF-8");
    }
    if (r.embedding.empty()) {
      throw InvalidRecord("embedding is empty");
    }
    if (!records_.empty() && r.embedding.size() != records_.front().embedding.size()) {
      throw InvalidRecord("embedding dimension " + std::to_string(r.embedding.size()) + " does not match " +
                          std::to_string(records_.front().embedding.size()));
    }
    if (r.importance < kMinImportance || r.importance > kMaxImportance) {
      throw InvalidRecord("importance " + std::to_string(r.importance) + " outside [" +
                          std::to_string(kMinImportance) + ", " + std::to_string(kMaxImportance) + "]");
    }
    if (!records_.empty() && r.created_at < records_.back().created_at) {
      throw InvalidRecord("created_at " + std::to_string(r.created_at) + " precedes latest record (" +
                          std::to_string(records_.back().created_at) + ")");
    }
    if (r.last_accessed_at < r.created_at) {
      throw InvalidRecord("last_accessed_at precedes created_at");
    }
    std::unordered_set<uint64_t> seen;
    for (uint64_t src : r.source_ids) {
      if (src == r.id) {
        throw InvalidRecord("record " + std::to_string(r.id) + " lists itself as a source");
      }
      if (index_.count(src) == 0) {
        throw InvalidRecord("source id " + std::to_string(src) + " does not exist");
      }
      if (!seen.insert(src).second) {
        throw InvalidRecord("source id " + std::to_string(src) + " listed twice");
      }
    }
  }

  uint64_t append_locked(MemoryRecord record) {
    if (record.last_accessed_at == 0) {
      record.last_accessed_at = record.created_at;
    }
    validate_locked(record);

    if (records_.empty()) {
      range_ = ImportanceRange{record.importance, record.importance};
    } else {
      range_.min = (std::min)(range_.min, record.importance);
      range_.max = (std::max)(range_.max, record.importance);
    }

    const uint64_t id = record.id;
    index_[id] = records_.size();
    records_.push_back(std::move(record));
    next_id_ = id + 1;
    return id;
  }

  void rollback_locked(uint64_t first_id) {
    if (first_id >= next_id_) {
      return;
    }
    while (!records_.empty() && records_.back().id >= first_id) {
      index_.erase(records_.back().id);
      records_.pop_back();
    }
    range_ = ImportanceRange{};
    for (std::size_t i = 0; i < records_.size(); ++i) {
      const int v = records_[i].importance;
      range_ = i == 0 ? ImportanceRange{v, v}
                      : ImportanceRange{(std::min)(range_.min, v), (std::max)(range_.max, v)};
    }
    next_id_ = (std::max<uint64_t>)(1, first_id);
  }

  mutable std::mutex mu_;
  std::vector<MemoryRecord> records_;
  std::unordered_map<uint64_t, std::size_t> index_;
  uint64_t next_id_{1};
  ImportanceRange range_{};
};

}  // namespace recall
