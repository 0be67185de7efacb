#pragma once

#include <optional>
#include <string>

#include "recall/common.hpp"
#include "recall/reflection.hpp"
#include "recall/scoring.hpp"

namespace recall {

struct ProviderConfig {
  std::string api_key;
  std::string api_base;
};

struct AgentDefaults {
  std::string name{"assistant"};
  std::string persona{"You are a helpful assistant with a long-term memory of past conversations."};
  std::string persona_file;
  std::string model{"gpt-3.5-turbo"};
  int max_tokens{512};
  double temperature{0.7};
  double top_p{1.0};
  int context_budget{3000};
  int memory_budget{1200};
  int tail_messages{24};
  int timeout{90};
};

struct EmbeddingConfig {
  std::string model{"text-embedding-ada-002"};
  int timeout{30};
};

struct StorageConfig {
  std::string dir{"~/.recall/agents"};
  std::string token_counter{"approx"};
};

struct Config {
  AgentDefaults agent{};
  ProviderConfig provider{};
  EmbeddingConfig embedding{};
  ScoringConfig scoring{};
  ReflectionConfig reflection{};
  bool plan_after_reflection{false};
  StorageConfig storage{};
};

inline std::string default_api_base_for_provider(const std::string& provider_key) {
  const std::string key = to_lower(provider_key);
  if (key == "openrouter") {
    return "https://openrouter.ai/api/v1";
  }
  if (key == "openai") {
    return "https://api.openai.com/v1";
  }
  return "";
}

inline std::string default_api_key_env_for_provider(const std::string& provider_key) {
  const std::string key = to_lower(provider_key);
  if (key == "openrouter") {
    return "OPENROUTER_API_KEY";
  }
  if (key == "openai") {
    return "OPENAI_API_KEY";
  }
  return "";
}

inline std::string resolve_env_ref(const std::string& value) {
  if (value.empty()) {
    return "";
  }

  // Supports "$ENV_NAME" and "${ENV_NAME}".
  if (value[0] != '$') {
    return value;
  }

  std::string env_name = value.substr(1);
  if (!env_name.empty() && env_name.front() == '{' && env_name.back() == '}') {
    env_name = env_name.substr(1, env_name.size() - 2);
  }
  if (env_name.empty()) {
    return value;
  }
  const char* v = std::getenv(env_name.c_str());
  return (v && *v) ? std::string(v) : "";
}

inline fs::path get_data_dir() {
  return expand_user_path("~/.recall");
}

inline fs::path get_config_path() {
  return get_data_dir() / "config.json";
}

inline json default_config_json() {
  const Config d{};
  return json{
      {"providers",
       {
           {"openai", {{"apiKey", ""}, {"apiBase", "https://api.openai.com/v1"}}},
           {"openrouter", {{"apiKey", ""}, {"apiBase", "https://openrouter.ai/api/v1"}}},
       }},
      {"agent",
       {
           {"name", d.agent.name},
           {"persona", d.agent.persona},
           {"personaFile", ""},
           {"model", d.agent.model},
           {"maxTokens", d.agent.max_tokens},
           {"temperature", d.agent.temperature},
           {"topP", d.agent.top_p},
           {"contextBudget", d.agent.context_budget},
           {"memoryBudget", d.agent.memory_budget},
           {"tailMessages", d.agent.tail_messages},
           {"timeout", d.agent.timeout},
       }},
      {"embedding", {{"model", d.embedding.model}, {"timeout", d.embedding.timeout}}},
      {"scoring",
       {
           {"recencyWeight", d.scoring.weights.recency},
           {"importanceWeight", d.scoring.weights.importance},
           {"relevanceWeight", d.scoring.weights.relevance},
           {"decayFactor", d.scoring.decay_factor},
       }},
      {"reflection",
       {
           {"importanceThreshold", d.reflection.importance_threshold},
           {"topK", d.reflection.top_k},
           {"budget", d.reflection.budget},
           {"maxInsights", d.reflection.max_insights},
           {"query", d.reflection.query},
           {"planAfterReflection", d.plan_after_reflection},
           {"planQuery", d.reflection.plan_query},
       }},
      {"storage", {{"dir", d.storage.dir}, {"tokenCounter", d.storage.token_counter}}}};
}

inline std::optional<ProviderConfig> pick_provider(const json& providers, const std::string& key) {
  if (!providers.contains(key) || !providers[key].is_object()) {
    return std::nullopt;
  }
  const auto& p = providers[key];
  ProviderConfig out;
  out.api_key = resolve_env_ref(p.value("apiKey", ""));
  if (out.api_key.empty()) {
    const std::string env_name = default_api_key_env_for_provider(key);
    if (!env_name.empty()) {
      const char* env_val = std::getenv(env_name.c_str());
      if (env_val && *env_val) {
        out.api_key = std::string(env_val);
      }
    }
  }
  out.api_base = p.value("apiBase", "");
  if (out.api_base.empty()) {
    out.api_base = default_api_base_for_provider(key);
  }
  if (out.api_key.empty()) {
    return std::nullopt;
  }
  return out;
}

inline std::optional<ProviderConfig> extract_provider(const json& root, const std::string& model_hint) {
  if (!root.contains("providers") || !root["providers"].is_object()) {
    return std::nullopt;
  }
  const auto& providers = root["providers"];

  // "vendor/model" ids are routed through OpenRouter.
  if (model_hint.find('/') != std::string::npos) {
    if (auto p = pick_provider(providers, "openrouter")) {
      return p;
    }
  }
  if (auto p = pick_provider(providers, "openai")) {
    return p;
  }
  for (auto it = providers.begin(); it != providers.end(); ++it) {
    if (auto p = pick_provider(providers, it.key())) {
      return p;
    }
  }
  return std::nullopt;
}

template <typename T>
T clamped(const char* name, T value, T lo, T hi) {
  if (value < lo || value > hi) {
    const T fixed = std::clamp(value, lo, hi);
    std::ostringstream msg;
    msg << "Config " << name << "=" << value << " out of range, using " << fixed;
    Logger::log(Logger::Level::kWarn, msg.str());
    return fixed;
  }
  return value;
}

inline Config load_config(const fs::path& path = get_config_path()) {
  Config cfg{};
  const std::string raw = read_text_file(path);
  if (raw.empty()) {
    if (auto p = extract_provider(default_config_json(), cfg.agent.model)) {
      cfg.provider = *p;
    }
    return cfg;
  }

  try {
    const json root = json::parse(raw);

    if (root.contains("agent") && root["agent"].is_object()) {
      const auto& a = root["agent"];
      cfg.agent.name = a.value("name", cfg.agent.name);
      cfg.agent.persona = a.value("persona", cfg.agent.persona);
      cfg.agent.persona_file = a.value("personaFile", cfg.agent.persona_file);
      cfg.agent.model = a.value("model", cfg.agent.model);
      cfg.agent.max_tokens = clamped("agent.maxTokens", a.value("maxTokens", cfg.agent.max_tokens), 1, 1 << 20);
      cfg.agent.temperature = clamped("agent.temperature", a.value("temperature", cfg.agent.temperature), 0.0, 2.0);
      cfg.agent.top_p = clamped("agent.topP", a.value("topP", cfg.agent.top_p), 0.0, 1.0);
      cfg.agent.context_budget =
          clamped("agent.contextBudget", a.value("contextBudget", cfg.agent.context_budget), 1, 1 << 24);
      cfg.agent.memory_budget =
          clamped("agent.memoryBudget", a.value("memoryBudget", cfg.agent.memory_budget), 0, 1 << 24);
      cfg.agent.tail_messages =
          clamped("agent.tailMessages", a.value("tailMessages", cfg.agent.tail_messages), 0, 100000);
      cfg.agent.timeout = clamped("agent.timeout", a.value("timeout", cfg.agent.timeout), 1, 3600);
    }

    if (auto provider = extract_provider(root, cfg.agent.model)) {
      cfg.provider = *provider;
    }

    if (root.contains("embedding") && root["embedding"].is_object()) {
      const auto& e = root["embedding"];
      cfg.embedding.model = e.value("model", cfg.embedding.model);
      cfg.embedding.timeout = clamped("embedding.timeout", e.value("timeout", cfg.embedding.timeout), 1, 3600);
    }

    if (root.contains("scoring") && root["scoring"].is_object()) {
      const auto& s = root["scoring"];
      cfg.scoring.weights.recency = s.value("recencyWeight", cfg.scoring.weights.recency);
      cfg.scoring.weights.importance = s.value("importanceWeight", cfg.scoring.weights.importance);
      cfg.scoring.weights.relevance = s.value("relevanceWeight", cfg.scoring.weights.relevance);
      cfg.scoring.decay_factor = s.value("decayFactor", cfg.scoring.decay_factor);
    }

    if (root.contains("reflection") && root["reflection"].is_object()) {
      const auto& r = root["reflection"];
      cfg.reflection.importance_threshold = r.value("importanceThreshold", cfg.reflection.importance_threshold);
      cfg.reflection.top_k = r.value("topK", cfg.reflection.top_k);
      cfg.reflection.budget = r.value("budget", cfg.reflection.budget);
      cfg.reflection.max_insights = clamped<std::size_t>(
          "reflection.maxInsights", r.value("maxInsights", cfg.reflection.max_insights), 1, 50);
      cfg.reflection.query = r.value("query", cfg.reflection.query);
      cfg.reflection.plan_query = r.value("planQuery", cfg.reflection.plan_query);
      cfg.plan_after_reflection = r.value("planAfterReflection", cfg.plan_after_reflection);
    }

    if (root.contains("storage") && root["storage"].is_object()) {
      const auto& st = root["storage"];
      cfg.storage.dir = st.value("dir", cfg.storage.dir);
      cfg.storage.token_counter = st.value("tokenCounter", cfg.storage.token_counter);
    }
  } catch (const std::exception& e) {
    Logger::log(Logger::Level::kWarn, std::string("Failed to parse config: ") + e.what());
  }

  return cfg;
}

// Persona text from agent.personaFile when set and readable, else agent.persona.
inline std::string load_persona(const Config& cfg) {
  if (!trim(cfg.agent.persona_file).empty()) {
    const std::string text = read_text_file(expand_user_path(cfg.agent.persona_file));
    if (!trim(text).empty()) {
      return trim(text);
    }
    Logger::log(Logger::Level::kWarn, "Persona file is empty or missing: " + cfg.agent.persona_file);
  }
  return cfg.agent.persona;
}

inline bool save_default_config(const fs::path& path = get_config_path()) {
  return write_text_file(path, default_config_json().dump(2));
}

}  // namespace recall
