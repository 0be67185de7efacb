#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace recall {

class RecallError : public std::runtime_error {
 public:
  explicit RecallError(const std::string& what) : std::runtime_error(what) {}
};

// Unknown record id.
class NotFound : public RecallError {
 public:
  explicit NotFound(uint64_t id) : RecallError("memory record not found: " + std::to_string(id)), id_(id) {}

  uint64_t id() const { return id_; }

 private:
  uint64_t id_;
};

// Dangling source ids, non-monotonic timestamps, malformed fields.
class InvalidRecord : public RecallError {
 public:
  explicit InvalidRecord(const std::string& what) : RecallError("invalid memory record: " + what) {}
};

// Content that can never fit in the budget it was offered for.
class BudgetExceeded : public RecallError {
 public:
  explicit BudgetExceeded(const std::string& what) : RecallError("budget exceeded: " + what) {}
};

// Embedding or language model adapter error, including timeouts.
class ExternalCallFailure : public RecallError {
 public:
  explicit ExternalCallFailure(const std::string& what) : RecallError("external call failed: " + what) {}
};

}  // namespace recall
