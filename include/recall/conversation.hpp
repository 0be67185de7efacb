#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

#include "recall/common.hpp"

namespace recall {

struct ConversationEntry {
  std::string speaker;
  std::string text;
  int64_t timestamp{0};
};

// Oldest first; the oldest entries are dropped once the buffer is full.
class ConversationBuffer {
 public:
  explicit ConversationBuffer(std::size_t capacity = 200) : capacity_((std::max<std::size_t>)(1, capacity)) {}

  void add(const std::string& speaker, const std::string& text, int64_t timestamp) {
    entries_.push_back(ConversationEntry{speaker, text, timestamp});
    while (entries_.size() > capacity_) {
      entries_.pop_front();
    }
  }

  // Last n entries, oldest first.
  std::vector<ConversationEntry> tail(std::size_t n) const {
    const std::size_t start = entries_.size() > n ? entries_.size() - n : 0;
    return std::vector<ConversationEntry>(entries_.begin() + static_cast<std::ptrdiff_t>(start), entries_.end());
  }

  std::vector<ConversationEntry> entries() const { return {entries_.begin(), entries_.end()}; }

  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  std::size_t capacity() const { return capacity_; }

 private:
  std::size_t capacity_;
  std::deque<ConversationEntry> entries_;
};

inline std::string format_entry(const ConversationEntry& e) { return e.speaker + ": " + e.text; }

}  // namespace recall
