#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

#include "recall/common.hpp"
#include "recall/embedding.hpp"
#include "recall/errors.hpp"
#include "recall/memory.hpp"
#include "recall/metrics.hpp"
#include "recall/scoring.hpp"
#include "recall/tokens.hpp"

namespace recall {

struct RetrievedMemory {
  MemoryRecord record;
  ScoreBreakdown score;
  std::size_t units{0};
};

struct RetrievalResult {
  std::vector<RetrievedMemory> memories;  // ranked, best first
  std::vector<uint64_t> oversized;        // records that alone exceed the budget
  std::size_t units_used{0};

  bool empty() const { return memories.empty(); }

  std::vector<uint64_t> ids() const {
    std::vector<uint64_t> out;
    out.reserve(memories.size());
    for (const auto& m : memories) {
      out.push_back(m.record.id);
    }
    return out;
  }

  std::vector<MemoryRecord> records() const {
    std::vector<MemoryRecord> out;
    out.reserve(memories.size());
    for (const auto& m : memories) {
      out.push_back(m.record);
    }
    return out;
  }
};

// Ranks a stream against a query and greedily packs the best records into a
// unit budget. Selected records are touched, so retrieval feeds recency.
class Retriever {
 public:
  static constexpr std::size_t kUnlimited = 0;

  Retriever(MemoryStream* stream, Embedder* embedder, const TokenCounter* counter, Scorer scorer = Scorer{})
      : stream_(stream), embedder_(embedder), counter_(counter), scorer_(std::move(scorer)) {}

  RetrievalResult retrieve(const std::string& query_text, std::size_t budget) {
    return retrieve_at(query_text, budget, now_ms());
  }

  RetrievalResult retrieve_at(const std::string& query_text, std::size_t budget, int64_t now,
                              std::size_t max_records = kUnlimited) {
    if (stream_->empty()) {
      return {};
    }
    const Embedding query = embedder_->embed(query_text);
    return retrieve_embedding(query, budget, now, max_records);
  }

  RetrievalResult retrieve_embedding(const Embedding& query, std::size_t budget, int64_t now,
                                     std::size_t max_records = kUnlimited) {
    metrics().inc("retrieve.total");
    RetrievalResult result;

    struct Candidate {
      uint64_t id;
      int64_t created_at;
      ScoreBreakdown score;
    };
    std::vector<Candidate> ranked;
    ranked.reserve(stream_->size());

    const ImportanceRange range = stream_->importance_range();
    stream_->visit([&](const MemoryRecord& r) {
      ranked.push_back(Candidate{r.id, r.created_at, scorer_.score(r, query, now, range)});
    });
    if (ranked.empty()) {
      return result;
    }

    std::sort(ranked.begin(), ranked.end(), [](const Candidate& a, const Candidate& b) {
      if (a.score.combined != b.score.combined) {
        return a.score.combined > b.score.combined;
      }
      if (a.created_at != b.created_at) {
        return a.created_at > b.created_at;
      }
      return a.id < b.id;
    });

    for (const auto& c : ranked) {
      if (max_records != kUnlimited && result.memories.size() >= max_records) {
        break;
      }
      MemoryRecord record = stream_->get(c.id);
      const std::size_t units = counter_->count_units(record.text);
      if (units > budget) {
        result.oversized.push_back(c.id);
        metrics().inc("retrieve.oversized");
        Logger::log(Logger::Level::kDebug, BudgetExceeded("record " + std::to_string(c.id) + " needs " +
                                                          std::to_string(units) + " units, budget is " +
                                                          std::to_string(budget))
                                               .what());
        continue;
      }
      if (result.units_used + units > budget) {
        break;
      }
      result.units_used += units;
      result.memories.push_back(RetrievedMemory{std::move(record), c.score, units});
    }

    for (auto& m : result.memories) {
      try {
        stream_->touch(m.record.id, now);
        m.record.last_accessed_at = now;
      } catch (const InvalidRecord& e) {
        Logger::log(Logger::Level::kWarn, std::string("Skipping access update: ") + e.what());
      }
    }

    return result;
  }

 private:
  MemoryStream* stream_;
  Embedder* embedder_;
  const TokenCounter* counter_;
  Scorer scorer_;
};

}  // namespace recall
