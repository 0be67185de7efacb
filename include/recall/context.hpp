#pragma once

#include <string>
#include <vector>

#include "recall/common.hpp"
#include "recall/conversation.hpp"
#include "recall/memory.hpp"
#include "recall/tokens.hpp"

namespace recall {

struct AssembledContext {
  bool ok{false};
  std::string prompt;
  std::string error;
  std::vector<uint64_t> memory_ids;
  std::size_t tail_entries{0};
  std::size_t units_used{0};
};

// Packs persona, recalled memories and the conversation tail, in that
// priority, into one prompt that never exceeds the budget. Every piece is
// measured on its own; counters must be subadditive over concatenation.
class ContextAssembler {
 public:
  explicit ContextAssembler(const TokenCounter* counter) : counter_(counter) {}

  AssembledContext assemble(const std::vector<MemoryRecord>& retrieved, const std::vector<ConversationEntry>& tail,
                            const std::string& persona, std::size_t total_budget) const {
    AssembledContext out;
    const std::size_t persona_units = counter_->count_units(persona);
    if (persona_units > total_budget) {
      out.error = "persona needs " + std::to_string(persona_units) + " units, budget is " +
                  std::to_string(total_budget);
      return out;
    }
    std::size_t used = persona_units;

    std::ostringstream memories;
    const std::string memory_header = "\n\n# Relevant memories\n";
    const std::size_t memory_header_units = counter_->count_units(memory_header);
    bool memory_header_written = false;
    for (const auto& r : retrieved) {
      const std::string line = render_memory(r);
      const std::size_t units = counter_->count_units(line) + (memory_header_written ? 0 : memory_header_units);
      if (used + units > total_budget) {
        break;
      }
      if (!memory_header_written) {
        memories << memory_header;
        memory_header_written = true;
      }
      memories << line;
      used += units;
      out.memory_ids.push_back(r.id);
    }

    // Newest entries win; the kept suffix is then written oldest first.
    const std::string tail_header = "\n\n# Conversation\n";
    const std::size_t tail_header_units = counter_->count_units(tail_header);
    std::size_t keep = 0;
    for (std::size_t i = tail.size(); i > 0; --i) {
      const std::size_t units =
          counter_->count_units(format_entry(tail[i - 1]) + "\n") + (keep == 0 ? tail_header_units : 0);
      if (used + units > total_budget) {
        break;
      }
      used += units;
      ++keep;
    }

    std::ostringstream prompt;
    prompt << persona << memories.str();
    if (keep > 0) {
      prompt << tail_header;
      for (std::size_t i = tail.size() - keep; i < tail.size(); ++i) {
        prompt << format_entry(tail[i]) << "\n";
      }
    }

    out.ok = true;
    out.prompt = prompt.str();
    out.tail_entries = keep;
    out.units_used = used;
    return out;
  }

  static std::string render_memory(const MemoryRecord& r) {
    return "- [" + std::string(kind_name(r.kind)) + ", " + format_iso8601(r.created_at).substr(0, 16) + "] " +
           r.text + "\n";
  }

 private:
  const TokenCounter* counter_;
};

}  // namespace recall
