#pragma once

#include <cmath>

#include "recall/common.hpp"
#include "recall/embedding.hpp"
#include "recall/memory.hpp"

namespace recall {

// Relative weights of the three sub-scores. Only their ratios matter.
struct ScoringWeights {
  double recency{1.0};
  double importance{1.0};
  double relevance{1.0};

  ScoringWeights normalized() const {
    const double sum = recency + importance + relevance;
    if (!(sum > 0.0) || recency < 0.0 || importance < 0.0 || relevance < 0.0) {
      Logger::log(Logger::Level::kWarn, "Invalid scoring weights, falling back to equal weighting");
      return ScoringWeights{1.0 / 3.0, 1.0 / 3.0, 1.0 / 3.0};
    }
    return ScoringWeights{recency / sum, importance / sum, relevance / sum};
  }
};

struct ScoringConfig {
  ScoringWeights weights{};
  double decay_factor{0.99};  // per hour since last access
};

struct ScoreBreakdown {
  double recency{0.0};
  double importance{0.0};
  double relevance{0.0};
  double combined{0.0};
};

class Scorer {
 public:
  static constexpr double kDefaultDecayFactor = 0.99;
  static constexpr double kMsPerHour = 3600.0 * 1000.0;

  explicit Scorer(const ScoringConfig& config = {}) : weights_(config.weights.normalized()) {
    decay_factor_ = config.decay_factor;
    if (!(decay_factor_ > 0.0 && decay_factor_ <= 1.0)) {
      Logger::log(Logger::Level::kWarn,
                  "Decay factor " + std::to_string(decay_factor_) + " outside (0, 1], using default");
      decay_factor_ = kDefaultDecayFactor;
    }
  }

  // Tracks time since last access, not since creation.
  double recency(const MemoryRecord& r, int64_t now) const {
    const double hours = (std::max)(0.0, static_cast<double>(now - r.last_accessed_at) / kMsPerHour);
    return std::pow(decay_factor_, hours);
  }

  double importance(const MemoryRecord& r, const ImportanceRange& range) const {
    if (range.max <= range.min) {
      return 1.0;
    }
    const double scaled = static_cast<double>(r.importance - range.min) / static_cast<double>(range.max - range.min);
    return std::clamp(scaled, 0.0, 1.0);
  }

  double relevance(const Embedding& query, const MemoryRecord& r) const {
    return (cosine_similarity(query, r.embedding) + 1.0) / 2.0;
  }

  ScoreBreakdown score(const MemoryRecord& r, const Embedding& query, int64_t now,
                       const ImportanceRange& range) const {
    ScoreBreakdown s;
    s.recency = recency(r, now);
    s.importance = importance(r, range);
    s.relevance = relevance(query, r);
    s.combined = weights_.recency * s.recency + weights_.importance * s.importance + weights_.relevance * s.relevance;
    return s;
  }

  const ScoringWeights& weights() const { return weights_; }
  double decay_factor() const { return decay_factor_; }

 private:
  ScoringWeights weights_;
  double decay_factor_;
};

}  // namespace recall
