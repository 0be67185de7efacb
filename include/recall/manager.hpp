#pragma once

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "recall/common.hpp"
#include "recall/context.hpp"
#include "recall/conversation.hpp"
#include "recall/embedding.hpp"
#include "recall/errors.hpp"
#include "recall/memory.hpp"
#include "recall/metrics.hpp"
#include "recall/provider.hpp"
#include "recall/recorder.hpp"
#include "recall/reflection.hpp"
#include "recall/repository.hpp"
#include "recall/retriever.hpp"
#include "recall/tokens.hpp"

namespace recall {

struct ManagerOptions {
  std::size_t memory_budget{1200};
  std::size_t context_budget{3000};
  std::size_t tail_messages{24};
  std::size_t buffer_capacity{200};
  int response_max_tokens{512};
  ScoringConfig scoring{};
  ReflectionConfig reflection{};
  bool plan_after_reflection{false};
};

enum class TurnStage { kIdle, kRecordIncoming, kMaybeReflect, kRetrieve, kAssemble, kInvoke, kRecordResponse };

inline const char* stage_name(TurnStage stage) {
  switch (stage) {
    case TurnStage::kRecordIncoming:
      return "record-incoming";
    case TurnStage::kMaybeReflect:
      return "maybe-reflect";
    case TurnStage::kRetrieve:
      return "retrieve";
    case TurnStage::kAssemble:
      return "assemble";
    case TurnStage::kInvoke:
      return "invoke";
    case TurnStage::kRecordResponse:
      return "record-response";
    case TurnStage::kIdle:
    default:
      return "idle";
  }
}

struct TurnResult {
  std::string response;
  uint64_t incoming_id{0};
  uint64_t response_id{0};
  std::vector<uint64_t> recalled_ids;
  std::vector<uint64_t> reflection_ids;
  std::vector<uint64_t> plan_ids;
  std::size_t prompt_units{0};
  std::string prompt;
};

// Runs conversation turns for any number of identities. Each identity owns
// its memory stream, transcript and reflection counter; turns for one
// identity are serialized, different identities proceed in parallel.
class ConversationManager {
 public:
  ConversationManager(LanguageModel* model, Embedder* embedder, const TokenCounter* counter, std::string persona,
                      ManagerOptions options = {}, MemoryRepository* repository = nullptr,
                      Clock clock = system_clock())
      : model_(model),
        embedder_(embedder),
        counter_(counter),
        default_persona_(std::move(persona)),
        options_(std::move(options)),
        repository_(repository),
        clock_(std::move(clock)),
        recorder_(embedder_, model_),
        assembler_(counter_) {}

  // Throws ExternalCallFailure, BudgetExceeded or InvalidRecord when the turn
  // aborts. An aborted turn leaves no records, transcript entries or pending
  // importance behind, so the caller may retry it as is.
  TurnResult process_turn(const std::string& identity, const std::string& speaker, const std::string& text) {
    AgentState& st = state_for(identity);
    std::lock_guard<std::mutex> lock(st.mu);
    metrics().inc("turn.total");
    TurnScope scope(this, identity, &st);
    const uint64_t first_id = st.stream.next_id();
    const int pending = st.reflection.pending_importance();
    ConversationBuffer buffer = st.buffer;
    try {
      return run_turn(identity, st, speaker, text);
    } catch (const std::exception& e) {
      st.stream.rollback_to(first_id);
      st.buffer = std::move(buffer);
      st.reflection.restore_pending(pending);
      metrics().inc("turn.error");
      Logger::log(Logger::Level::kError, "Turn for " + identity + " failed during " +
                                             stage_name(st.stage) + ": " + e.what());
      throw;
    }
  }

  RetrievalResult recall(const std::string& identity, const std::string& query, std::size_t budget) {
    AgentState& st = state_for(identity);
    std::lock_guard<std::mutex> lock(st.mu);
    TurnScope scope(this, identity, &st);
    return st.retriever.retrieve_at(query, budget, clock_());
  }

  // Reflects now, whatever the accumulated importance.
  ReflectionOutcome reflect(const std::string& identity) {
    AgentState& st = state_for(identity);
    std::lock_guard<std::mutex> lock(st.mu);
    TurnScope scope(this, identity, &st);
    try {
      ReflectionOutcome outcome = st.reflection.reflect(clock_());
      if (outcome.fired && options_.plan_after_reflection) {
        st.reflection.plan(clock_());
      }
      return outcome;
    } catch (const ExternalCallFailure&) {
      metrics().inc("reflection.error");
      throw;
    }
  }

  void set_persona(const std::string& identity, const std::string& persona) {
    AgentState& st = state_for(identity);
    std::lock_guard<std::mutex> lock(st.mu);
    st.persona = persona;
  }

  std::vector<MemoryRecord> memories(const std::string& identity) {
    AgentState& st = state_for(identity);
    return st.stream.all();
  }

  std::vector<ConversationEntry> transcript(const std::string& identity) {
    AgentState& st = state_for(identity);
    std::lock_guard<std::mutex> lock(st.mu);
    return st.buffer.entries();
  }

  std::size_t stream_size(const std::string& identity) { return state_for(identity).stream.size(); }

  int pending_importance(const std::string& identity) {
    AgentState& st = state_for(identity);
    std::lock_guard<std::mutex> lock(st.mu);
    return st.reflection.pending_importance();
  }

  std::vector<std::string> identities() const {
    std::lock_guard<std::mutex> lock(states_mu_);
    std::vector<std::string> out;
    out.reserve(states_.size());
    for (const auto& kv : states_) {
      out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
  }

 private:
  struct AgentState {
    AgentState(Embedder* embedder, LanguageModel* model, const TokenCounter* counter, const ManagerOptions& options,
               std::string persona_text)
        : buffer(options.buffer_capacity),
          retriever(&stream, embedder, counter, Scorer(options.scoring)),
          reflection(&stream, &retriever, model, embedder, options.reflection),
          persona(std::move(persona_text)) {}

    MemoryStream stream;
    ConversationBuffer buffer;
    Retriever retriever;
    ReflectionEngine reflection;
    std::string persona;
    TurnStage stage{TurnStage::kIdle};
    std::mutex mu;
  };

  // Persists the identity when a turn or command ends, whichever way it ends.
  class TurnScope {
   public:
    TurnScope(ConversationManager* owner, const std::string& identity, AgentState* st)
        : owner_(owner), identity_(identity), st_(st) {}

    ~TurnScope() {
      st_->stage = TurnStage::kIdle;
      if (owner_->repository_) {
        if (!owner_->repository_->save_stream(identity_, st_->stream)) {
          metrics().inc("persist.error");
        }
        if (!owner_->repository_->save_transcript(identity_, st_->buffer)) {
          metrics().inc("persist.error");
        }
      }
    }

   private:
    ConversationManager* owner_;
    const std::string& identity_;
    AgentState* st_;
  };

  AgentState& state_for(const std::string& identity) {
    std::lock_guard<std::mutex> lock(states_mu_);
    auto it = states_.find(identity);
    if (it != states_.end()) {
      return *it->second;
    }

    auto st = std::make_unique<AgentState>(embedder_, model_, counter_, options_, default_persona_);
    if (repository_) {
      repository_->load_stream(identity, &st->stream);
      repository_->load_transcript(identity, &st->buffer);
      st->reflection.recount();
      if (!st->stream.empty()) {
        Logger::log(Logger::Level::kInfo, "Loaded " + std::to_string(st->stream.size()) + " memories for " +
                                              identity);
      }
    }
    AgentState& ref = *st;
    states_.emplace(identity, std::move(st));
    return ref;
  }

  void enter(AgentState& st, const std::string& identity, TurnStage stage) {
    st.stage = stage;
    Logger::log(Logger::Level::kDebug, "[" + identity + "] " + stage_name(stage));
  }

  TurnResult run_turn(const std::string& identity, AgentState& st, const std::string& speaker,
                      const std::string& text) {
    TurnResult out;

    enter(st, identity, TurnStage::kRecordIncoming);
    const int64_t received_at = clock_();
    out.incoming_id = recorder_.record(&st.stream, speaker + ": " + text, MemoryKind::kObservation, received_at);
    st.buffer.add(speaker, text, received_at);
    st.reflection.note_observation(st.stream.get(out.incoming_id).importance);

    enter(st, identity, TurnStage::kMaybeReflect);
    try {
      const ReflectionOutcome reflection = st.reflection.maybe_reflect(clock_());
      out.reflection_ids = reflection.created_ids;
      if (reflection.fired && options_.plan_after_reflection) {
        out.plan_ids = st.reflection.plan(clock_()).created_ids;
      }
    } catch (const ExternalCallFailure& e) {
      metrics().inc("reflection.error");
      Logger::log(Logger::Level::kWarn, "Reflection for " + identity + " postponed: " + e.what());
    }

    enter(st, identity, TurnStage::kRetrieve);
    const RetrievalResult recalled = st.retriever.retrieve_at(text, options_.memory_budget, clock_());
    out.recalled_ids = recalled.ids();

    enter(st, identity, TurnStage::kAssemble);
    const AssembledContext context = assembler_.assemble(
        recalled.records(), st.buffer.tail(options_.tail_messages), st.persona, options_.context_budget);
    if (!context.ok) {
      throw BudgetExceeded(context.error);
    }
    out.prompt = context.prompt;
    out.prompt_units = context.units_used;

    enter(st, identity, TurnStage::kInvoke);
    out.response = trim(model_->complete(context.prompt, options_.response_max_tokens));
    if (out.response.empty()) {
      throw ExternalCallFailure("model returned an empty completion");
    }

    enter(st, identity, TurnStage::kRecordResponse);
    const int64_t answered_at = clock_();
    out.response_id =
        recorder_.record(&st.stream, identity + ": " + out.response, MemoryKind::kObservation, answered_at);
    st.buffer.add(identity, out.response, answered_at);
    st.reflection.note_observation(st.stream.get(out.response_id).importance);

    return out;
  }

  LanguageModel* model_;
  Embedder* embedder_;
  const TokenCounter* counter_;
  std::string default_persona_;
  ManagerOptions options_;
  MemoryRepository* repository_;
  Clock clock_;
  MemoryRecorder recorder_;
  ContextAssembler assembler_;

  mutable std::mutex states_mu_;
  std::unordered_map<std::string, std::unique_ptr<AgentState>> states_;
};

}  // namespace recall
