#pragma once

#include <string>
#include <vector>

#include "recall/common.hpp"
#include "recall/errors.hpp"
#include "recall/memory.hpp"
#include "recall/metrics.hpp"
#include "recall/provider.hpp"
#include "recall/recorder.hpp"
#include "recall/retriever.hpp"

namespace recall {

struct ReflectionConfig {
  int importance_threshold{40};  // <= 0 disables automatic reflection
  std::size_t top_k{12};
  std::size_t budget{1500};
  std::size_t max_insights{5};
  std::string query{"What are the high-level insights from recent experience?"};
  std::string plan_query{"What should I keep in mind or follow up on in upcoming conversations?"};
};

struct ReflectionOutcome {
  bool fired{false};
  std::vector<uint64_t> created_ids;
  std::vector<uint64_t> source_ids;
};

// Turns accumulated observations into reflection records once their summed
// importance crosses a threshold. Reflections land in the same stream and are
// themselves candidates for later retrieval and reflection.
class ReflectionEngine {
 public:
  ReflectionEngine(MemoryStream* stream, Retriever* retriever, LanguageModel* model, Embedder* embedder,
                   ReflectionConfig config = {})
      : stream_(stream), retriever_(retriever), model_(model), recorder_(embedder, model), config_(std::move(config)) {}

  void note_observation(int importance) { pending_ += importance; }

  bool due() const { return config_.importance_threshold > 0 && pending_ >= config_.importance_threshold; }

  int pending_importance() const { return pending_; }

  void reset_pending() { pending_ = 0; }

  void restore_pending(int value) { pending_ = value; }

  // Rebuilds the counter from the stream: observations newer than the newest
  // reflection have not been reflected on yet.
  void recount() {
    uint64_t last_reflection = 0;
    stream_->visit([&](const MemoryRecord& r) {
      if (r.kind == MemoryKind::kReflection) {
        last_reflection = r.id;
      }
    });
    int sum = 0;
    stream_->visit([&](const MemoryRecord& r) {
      if (r.kind == MemoryKind::kObservation && r.id > last_reflection) {
        sum += r.importance;
      }
    });
    pending_ = sum;
  }

  ReflectionOutcome maybe_reflect(int64_t now) {
    if (!due()) {
      return {};
    }
    return reflect(now);
  }

  // Reflects regardless of the counter. The counter is reset only when new
  // reflections were written.
  ReflectionOutcome reflect(int64_t now) {
    ReflectionOutcome outcome = synthesize_into(MemoryKind::kReflection, config_.query, now);
    if (outcome.fired) {
      metrics().inc("reflection.fired");
      Logger::log(Logger::Level::kInfo, "Reflection wrote " + std::to_string(outcome.created_ids.size()) +
                                            " insight(s) from " + std::to_string(outcome.source_ids.size()) +
                                            " memories");
      reset_pending();
    }
    return outcome;
  }

  ReflectionOutcome plan(int64_t now) { return synthesize_into(MemoryKind::kPlan, config_.plan_query, now); }

 private:
  ReflectionOutcome synthesize_into(MemoryKind kind, const std::string& query, int64_t now) {
    ReflectionOutcome outcome;
    const RetrievalResult consulted = retriever_->retrieve_at(query, config_.budget, now, config_.top_k);
    if (consulted.empty()) {
      return outcome;
    }

    const std::vector<MemoryRecord> sources = consulted.records();
    const std::vector<std::string> statements =
        kind == MemoryKind::kPlan ? model_->draft_plans(sources) : model_->synthesize(sources);

    std::vector<std::string> usable;
    for (const auto& s : statements) {
      if (usable.size() >= config_.max_insights) {
        break;
      }
      if (!trim(s).empty()) {
        usable.push_back(trim(s));
      }
    }
    if (usable.empty()) {
      metrics().inc("reflection.empty");
      Logger::log(Logger::Level::kWarn, std::string("Model returned no ") + kind_name(kind) + " statements");
      return outcome;
    }

    std::vector<PreparedMemory> prepared = recorder_.prepare_all(usable);

    const int64_t created_at = (std::max)(now, stream_->latest_created_at());
    outcome.source_ids = consulted.ids();
    std::vector<MemoryRecord> records;
    records.reserve(prepared.size());
    for (auto& p : prepared) {
      records.push_back(MemoryRecorder::to_record(std::move(p), kind, created_at, outcome.source_ids));
    }
    outcome.created_ids = stream_->insert_all(std::move(records));
    metrics().inc("record.created", outcome.created_ids.size());
    outcome.fired = true;
    return outcome;
  }

  MemoryStream* stream_;
  Retriever* retriever_;
  LanguageModel* model_;
  MemoryRecorder recorder_;
  ReflectionConfig config_;
  int pending_{0};
};

}  // namespace recall
