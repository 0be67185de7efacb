#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "recall/config.hpp"
#include "recall/embedding.hpp"
#include "recall/errors.hpp"
#include "recall/manager.hpp"
#include "recall/metrics.hpp"
#include "recall/provider.hpp"
#include "recall/repository.hpp"
#include "recall/tokens.hpp"

namespace {

using namespace recall;

void print_usage() {
  std::cout << "recall - conversational agent with long-term memory\n\n"
            << "Usage:\n"
            << "  recall onboard\n"
            << "  recall status\n"
            << "  recall chat [-m MESSAGE] [-a AGENT] [-s SPEAKER]\n"
            << "  recall recall -q QUERY [-a AGENT] [--budget N] [--json]\n"
            << "  recall reflect [-a AGENT]\n"
            << "  recall memories [-a AGENT] [--json]\n"
            << "  recall metrics [--json]\n"
            << "  recall --version\n";
}

bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
  return std::find(args.begin(), args.end(), flag) != args.end();
}

std::string get_flag_value(const std::vector<std::string>& args, const std::string& flag,
                           const std::string& fallback = "") {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag) {
      return args[i + 1];
    }
  }
  return fallback;
}

int get_int_flag_value(const std::vector<std::string>& args, const std::string& flag, int fallback, int min_value,
                       int max_value) {
  const std::string raw = trim(get_flag_value(args, flag, std::to_string(fallback)));
  try {
    const int v = std::stoi(raw);
    return std::clamp(v, min_value, max_value);
  } catch (const std::exception&) {
    std::cerr << "Ignoring invalid value for " << flag << ": " << raw << "\n";
    return fallback;
  }
}

void configure_logging() {
  const char* json_env = std::getenv("RECALL_LOG_JSON");
  if (json_env && *json_env && std::string(json_env) != "0") {
    Logger::set_json(true);
  }
  const char* level_env = std::getenv("RECALL_LOG_LEVEL");
  if (level_env && *level_env) {
    Logger::Level level = Logger::Level::kInfo;
    if (Logger::parse_level(level_env, &level)) {
      Logger::set_min_level(level);
    } else {
      Logger::log(Logger::Level::kWarn, std::string("Unknown RECALL_LOG_LEVEL: ") + level_env);
    }
  }
}

ManagerOptions manager_options(const Config& cfg) {
  ManagerOptions o;
  o.memory_budget = static_cast<std::size_t>(cfg.agent.memory_budget);
  o.context_budget = static_cast<std::size_t>(cfg.agent.context_budget);
  o.tail_messages = static_cast<std::size_t>(cfg.agent.tail_messages);
  o.response_max_tokens = cfg.agent.max_tokens;
  o.scoring = cfg.scoring;
  o.reflection = cfg.reflection;
  o.plan_after_reflection = cfg.plan_after_reflection;
  return o;
}

// Everything one command needs, wired from the config file.
struct Runtime {
  explicit Runtime(const Config& config)
      : cfg(config),
        provider(cfg.provider.api_key, cfg.provider.api_base, cfg.agent.model, cfg.agent.timeout),
        model(&provider, cfg.agent.model,
              SamplingOptions{cfg.agent.max_tokens, cfg.agent.temperature, cfg.agent.top_p},
              cfg.reflection.max_insights),
        embedder(cfg.provider.api_key, cfg.provider.api_base, cfg.embedding.model, cfg.embedding.timeout),
        counter(make_token_counter(cfg.storage.token_counter)),
        repository(expand_user_path(cfg.storage.dir)),
        manager(&model, &embedder, counter.get(), load_persona(cfg), manager_options(cfg), &repository) {}

  Config cfg;
  OpenAICompatibleProvider provider;
  ProviderLanguageModel model;
  OpenAICompatibleEmbedder embedder;
  std::unique_ptr<TokenCounter> counter;
  MemoryRepository repository;
  ConversationManager manager;
};

std::string agent_name(const std::vector<std::string>& args, const Config& cfg) {
  const std::string name = trim(get_flag_value(args, "-a", get_flag_value(args, "--agent", cfg.agent.name)));
  return name.empty() ? cfg.agent.name : name;
}

int run_onboard() {
  const fs::path config_path = get_config_path();
  if (fs::exists(config_path)) {
    std::cout << "Config already exists: " << config_path.string() << "\n";
  } else {
    if (!save_default_config(config_path)) {
      std::cerr << "Failed to write config: " << config_path.string() << "\n";
      return 1;
    }
    std::cout << "Created config: " << config_path.string() << "\n";
  }

  const Config cfg = load_config(config_path);
  const fs::path storage = expand_user_path(cfg.storage.dir);
  std::error_code ec;
  fs::create_directories(storage, ec);
  if (ec) {
    std::cerr << "Failed to create storage directory " << storage.string() << ": " << ec.message() << "\n";
    return 1;
  }
  std::cout << "Memory storage ready: " << storage.string() << "\n";
  std::cout << "Next: set your API key in " << config_path.string() << "\n";
  return 0;
}

int run_status() {
  const fs::path config_path = get_config_path();
  const Config cfg = load_config(config_path);
  const MemoryRepository repository(expand_user_path(cfg.storage.dir));

  std::cout << "recall status\n\n";
  std::cout << "Config: " << config_path.string() << (fs::exists(config_path) ? " [ok]" : " [missing]") << "\n";
  std::cout << "Storage: " << repository.dir().string() << (fs::exists(repository.dir()) ? " [ok]" : " [missing]")
            << "\n";
  std::cout << "Model: " << cfg.agent.model << "\n";
  std::cout << "Embedding model: " << cfg.embedding.model << "\n";
  std::cout << "Provider key: " << (cfg.provider.api_key.empty() ? "not set" : "set") << "\n";
  std::cout << "Provider base: " << cfg.provider.api_base << "\n";
  std::cout << "Reflection threshold: " << cfg.reflection.importance_threshold
            << (cfg.reflection.importance_threshold <= 0 ? " (disabled)" : "") << "\n";

  const auto names = repository.identities();
  std::cout << "Agents: " << (names.empty() ? "none yet" : std::to_string(names.size())) << "\n";
  for (const auto& name : names) {
    MemoryStream stream;
    try {
      repository.load_stream(name, &stream);
      std::cout << "  " << name << ": " << stream.size() << " memories\n";
    } catch (const InvalidRecord& e) {
      std::cout << "  " << name << ": unreadable (" << e.what() << ")\n";
    }
  }
  return 0;
}

int run_metrics(const std::vector<std::string>& args) {
  const bool json_out = has_flag(args, "--json");
  const fs::path path = default_metrics_path();
  const std::string raw = read_text_file(path);
  if (json_out) {
    if (trim(raw).empty()) {
      std::cout << "{}\n";
    } else {
      std::cout << raw << "\n";
    }
    return 0;
  }
  std::cout << (trim(raw).empty() ? "(no metrics snapshot yet)\n" : raw + "\n");
  return 0;
}

bool chat_once(Runtime& rt, const std::string& agent, const std::string& speaker, const std::string& message) {
  try {
    const TurnResult turn = rt.manager.process_turn(agent, speaker, message);
    std::cout << "\n" << agent << "\n" << turn.response << "\n";
    if (!turn.reflection_ids.empty()) {
      std::cout << "(reflected: " << turn.reflection_ids.size() << " new insight(s))\n";
    }
    return true;
  } catch (const RecallError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return false;
  }
}

int run_chat(const std::vector<std::string>& args) {
  Runtime rt(load_config());
  const std::string agent = agent_name(args, rt.cfg);
  const std::string speaker = trim(get_flag_value(args, "-s", get_flag_value(args, "--speaker", "user")));
  const std::string message = get_flag_value(args, "-m", get_flag_value(args, "--message"));

  if (!message.empty()) {
    const bool ok = chat_once(rt, agent, speaker.empty() ? "user" : speaker, message);
    write_metrics_snapshot();
    return ok ? 0 : 1;
  }

  std::cout << "recall interactive mode with " << agent << " (type exit to quit)\n\n";
  while (true) {
    std::cout << "You: ";
    std::string line;
    if (!std::getline(std::cin, line)) {
      break;
    }
    const std::string cmd = trim(line);
    if (cmd.empty()) {
      continue;
    }
    if (cmd == "exit" || cmd == "quit" || cmd == "/exit" || cmd == "/quit") {
      break;
    }
    if (cmd == "/reflect") {
      try {
        const ReflectionOutcome outcome = rt.manager.reflect(agent);
        std::cout << (outcome.fired ? "Reflected: " + std::to_string(outcome.created_ids.size()) + " insight(s)"
                                    : std::string("Nothing to reflect on"))
                  << "\n\n";
      } catch (const RecallError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
      }
      continue;
    }
    chat_once(rt, agent, speaker.empty() ? "user" : speaker, cmd);
    std::cout << "\n";
  }

  write_metrics_snapshot();
  return 0;
}

json retrieved_to_json(const RetrievedMemory& m) {
  return json{{"id", m.record.id},
              {"kind", kind_name(m.record.kind)},
              {"text", m.record.text},
              {"importance", m.record.importance},
              {"createdAt", format_iso8601(m.record.created_at)},
              {"units", m.units},
              {"score",
               {{"recency", m.score.recency},
                {"importance", m.score.importance},
                {"relevance", m.score.relevance},
                {"combined", m.score.combined}}}};
}

int run_recall(const std::vector<std::string>& args) {
  const std::string query = trim(get_flag_value(args, "-q", get_flag_value(args, "--query")));
  if (query.empty()) {
    std::cerr << "recall requires -q QUERY\n";
    return 1;
  }

  Runtime rt(load_config());
  const std::string agent = agent_name(args, rt.cfg);
  const int budget = get_int_flag_value(args, "--budget", rt.cfg.agent.memory_budget, 0, 1 << 24);
  const bool json_out = has_flag(args, "--json");

  RetrievalResult result;
  try {
    result = rt.manager.recall(agent, query, static_cast<std::size_t>(budget));
  } catch (const RecallError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    write_metrics_snapshot();
    return 1;
  }
  write_metrics_snapshot();

  if (json_out) {
    json out = {{"agent", agent}, {"query", query}, {"budget", budget}, {"unitsUsed", result.units_used}};
    out["memories"] = json::array();
    for (const auto& m : result.memories) {
      out["memories"].push_back(retrieved_to_json(m));
    }
    out["oversized"] = result.oversized;
    std::cout << out.dump(2) << "\n";
    return 0;
  }

  if (result.empty()) {
    std::cout << "No memories for " << agent << " within " << budget << " units.\n";
    return 0;
  }
  std::cout << std::fixed << std::setprecision(3);
  for (const auto& m : result.memories) {
    std::cout << "#" << m.record.id << " [" << kind_name(m.record.kind) << "] " << m.score.combined
              << " (rec " << m.score.recency << ", imp " << m.score.importance << ", rel " << m.score.relevance
              << ")\n    " << m.record.text << "\n";
  }
  std::cout << result.units_used << "/" << budget << " units";
  if (!result.oversized.empty()) {
    std::cout << ", " << result.oversized.size() << " record(s) too large for the budget";
  }
  std::cout << "\n";
  return 0;
}

int run_reflect(const std::vector<std::string>& args) {
  Runtime rt(load_config());
  const std::string agent = agent_name(args, rt.cfg);
  try {
    const ReflectionOutcome outcome = rt.manager.reflect(agent);
    write_metrics_snapshot();
    if (!outcome.fired) {
      std::cout << "Nothing to reflect on for " << agent << "\n";
      return 0;
    }
    std::cout << "Reflected on " << outcome.source_ids.size() << " memories:\n";
    for (const auto& r : rt.manager.memories(agent)) {
      if (std::find(outcome.created_ids.begin(), outcome.created_ids.end(), r.id) != outcome.created_ids.end()) {
        std::cout << "  - " << r.text << "\n";
      }
    }
    return 0;
  } catch (const RecallError& e) {
    write_metrics_snapshot();
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

int run_memories(const std::vector<std::string>& args) {
  const Config cfg = load_config();
  const std::string agent = agent_name(args, cfg);
  const MemoryRepository repository(expand_user_path(cfg.storage.dir));
  MemoryStream stream;
  try {
    repository.load_stream(agent, &stream);
  } catch (const InvalidRecord& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  if (has_flag(args, "--json")) {
    json out = json::array();
    stream.visit([&](const MemoryRecord& r) {
      json row = record_to_json(r);
      row.erase("embedding");
      out.push_back(row);
    });
    std::cout << out.dump(2) << "\n";
    return 0;
  }

  if (stream.empty()) {
    std::cout << "No memories for " << agent << "\n";
    return 0;
  }
  stream.visit([](const MemoryRecord& r) {
    std::cout << "#" << r.id << " " << format_iso8601(r.created_at) << " [" << kind_name(r.kind) << ", "
              << r.importance << "] " << r.text << "\n";
  });
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  configure_logging();

  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  if (args.size() <= 1) {
    print_usage();
    return 0;
  }

  const std::string command = args[1];
  const std::vector<std::string> sub(args.begin() + 2, args.end());

  if (command == "--version" || command == "-v") {
    std::cout << "recall v0.1.0\n";
    return 0;
  }
  if (command == "onboard") {
    return run_onboard();
  }
  if (command == "status") {
    return run_status();
  }
  if (command == "chat") {
    return run_chat(sub);
  }
  if (command == "recall") {
    return run_recall(sub);
  }
  if (command == "reflect") {
    return run_reflect(sub);
  }
  if (command == "memories") {
    return run_memories(sub);
  }
  if (command == "metrics") {
    return run_metrics(sub);
  }

  print_usage();
  return 1;
}
