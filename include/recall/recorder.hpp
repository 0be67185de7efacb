#pragma once

#include <future>
#include <string>
#include <vector>

#include "recall/common.hpp"
#include "recall/embedding.hpp"
#include "recall/errors.hpp"
#include "recall/memory.hpp"
#include "recall/metrics.hpp"
#include "recall/provider.hpp"

namespace recall {

struct PreparedMemory {
  std::string text;
  Embedding embedding;
  int importance{kMinImportance};
};

// Builds records all-or-nothing: the embedding and the importance rating are
// requested concurrently and nothing reaches the stream unless both succeed.
class MemoryRecorder {
 public:
  MemoryRecorder(Embedder* embedder, LanguageModel* model) : embedder_(embedder), model_(model) {}

  PreparedMemory prepare(const std::string& text) {
    if (!is_valid_utf8(text)) {
      throw InvalidRecord("text is not valid UTF-8");
    }
    auto embedding = std::async(std::launch::async, [this, text]() { return embedder_->embed(text); });
    auto importance = std::async(std::launch::async, [this, text]() { return model_->score_importance(text); });
    PreparedMemory out;
    out.text = text;
    // Both futures are drained before an exception leaves this frame.
    std::exception_ptr failure;
    try {
      out.embedding = embedding.get();
    } catch (...) {
      failure = std::current_exception();
    }
    try {
      out.importance = importance.get();
    } catch (...) {
      if (!failure) {
        failure = std::current_exception();
      }
    }
    if (failure) {
      std::rethrow_exception(failure);
    }
    return out;
  }

  std::vector<PreparedMemory> prepare_all(const std::vector<std::string>& texts) {
    std::vector<std::future<PreparedMemory>> pending;
    pending.reserve(texts.size());
    for (const auto& t : texts) {
      pending.push_back(std::async(std::launch::async, [this, t]() { return prepare(t); }));
    }
    std::vector<PreparedMemory> out;
    out.reserve(texts.size());
    std::exception_ptr failure;
    for (auto& f : pending) {
      try {
        out.push_back(f.get());
      } catch (...) {
        if (!failure) {
          failure = std::current_exception();
        }
      }
    }
    if (failure) {
      std::rethrow_exception(failure);
    }
    return out;
  }

  static MemoryRecord to_record(PreparedMemory prepared, MemoryKind kind, int64_t created_at,
                                std::vector<uint64_t> source_ids = {}) {
    MemoryRecord r;
    r.text = std::move(prepared.text);
    r.embedding = std::move(prepared.embedding);
    r.kind = kind;
    r.importance = prepared.importance;
    r.created_at = created_at;
    r.last_accessed_at = created_at;
    r.source_ids = std::move(source_ids);
    return r;
  }

  uint64_t record(MemoryStream* stream, const std::string& text, MemoryKind kind, int64_t now) {
    PreparedMemory prepared = prepare(text);
    const int64_t created_at = (std::max)(now, stream->latest_created_at());
    const uint64_t id = stream->insert(to_record(std::move(prepared), kind, created_at));
    metrics().inc("record.created");
    return id;
  }

 private:
  Embedder* embedder_;
  LanguageModel* model_;
};

}  // namespace recall
