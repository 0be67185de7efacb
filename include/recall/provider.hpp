#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "recall/common.hpp"
#include "recall/errors.hpp"
#include "recall/http.hpp"
#include "recall/memory.hpp"

namespace recall {

struct LLMResponse {
  std::string content;
  std::string finish_reason{"stop"};
  json usage{json::object()};

  bool is_error() const { return finish_reason == "error"; }
};

struct SamplingOptions {
  int max_tokens{512};
  double temperature{0.7};
  double top_p{1.0};

  // Empty when the values are acceptable to an OpenAI-style endpoint.
  std::optional<std::string> validate() const {
    if (max_tokens < 1) {
      return "max_tokens must be at least 1";
    }
    if (temperature < 0.0 || temperature > 2.0) {
      return "temperature must be between 0 and 2";
    }
    if (top_p < 0.0 || top_p > 1.0) {
      return "top_p must be between 0 and 1";
    }
    return std::nullopt;
  }
};

class LLMProvider {
 public:
  virtual ~LLMProvider() = default;

  virtual LLMResponse chat(const json& messages, const std::string& model, const SamplingOptions& options) = 0;
};

class OpenAICompatibleProvider : public LLMProvider {
 public:
  OpenAICompatibleProvider(std::string api_key, std::string api_base, std::string default_model, int timeout_s = 90)
      : api_key_(std::move(api_key)),
        api_base_(std::move(api_base)),
        default_model_(std::move(default_model)),
        timeout_s_(timeout_s) {
    if (api_base_.empty()) {
      api_base_ = "https://api.openai.com/v1";
    }
  }

  LLMResponse chat(const json& messages, const std::string& model, const SamplingOptions& options) override {
    LLMResponse out;
    if (api_key_.empty()) {
      out.content = "Error: no API key configured";
      out.finish_reason = "error";
      return out;
    }
    if (const auto problem = options.validate()) {
      out.content = "Error: " + *problem;
      out.finish_reason = "error";
      return out;
    }

    const json payload = {{"model", model.empty() ? default_model_ : model},
                          {"messages", messages},
                          {"max_tokens", options.max_tokens},
                          {"temperature", options.temperature},
                          {"top_p", options.top_p}};

    const std::map<std::string, std::string> headers = {
        {"Authorization", "Bearer " + api_key_},
        {"Content-Type", "application/json"},
    };

    std::string body;
    try {
      body = payload.dump();
    } catch (const json::exception& e) {
      out.content = std::string("Error: cannot encode request: ") + e.what();
      out.finish_reason = "error";
      return out;
    }

    thread_local HttpClient client;
    const HttpResponse resp = client.post(api_base_ + "/chat/completions", body, headers, timeout_s_);
    if (!resp.ok()) {
      out.content = "Error calling LLM: " + resp.describe_failure();
      out.finish_reason = "error";
      return out;
    }

    try {
      const json data = json::parse(resp.body);
      if (!data.contains("choices") || !data["choices"].is_array() || data["choices"].empty()) {
        out.content = "Error: malformed LLM response";
        out.finish_reason = "error";
        return out;
      }

      const json& choice = data["choices"][0];
      if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        out.finish_reason = choice["finish_reason"].get<std::string>();
      }
      if (data.contains("usage") && data["usage"].is_object()) {
        out.usage = data["usage"];
      }
      if (!choice.contains("message") || !choice["message"].is_object()) {
        out.content = "Error: missing message in LLM response";
        out.finish_reason = "error";
        return out;
      }

      const json& message = choice["message"];
      if (message.contains("content") && message["content"].is_string()) {
        out.content = message["content"].get<std::string>();
      }
    } catch (const json::exception& e) {
      out.content = std::string("Error parsing LLM response: ") + e.what();
      out.finish_reason = "error";
    }

    return out;
  }

 private:
  std::string api_key_;
  std::string api_base_;
  std::string default_model_;
  int timeout_s_;
};

// The language-model capabilities the memory engine depends on. Every method
// throws ExternalCallFailure when the model cannot be reached or its answer
// cannot be used.
class LanguageModel {
 public:
  virtual ~LanguageModel() = default;

  virtual std::string complete(const std::string& prompt, int max_tokens) = 0;

  // Salience of a memory in [kMinImportance, kMaxImportance].
  virtual int score_importance(const std::string& text) = 0;

  // Higher-level insight statements drawn from the given records.
  virtual std::vector<std::string> synthesize(const std::vector<MemoryRecord>& records) = 0;

  virtual std::vector<std::string> draft_plans(const std::vector<MemoryRecord>& records) = 0;
};

// First integer in the reply, clamped to the importance scale.
inline std::optional<int> parse_importance(const std::string& reply) {
  std::size_t i = 0;
  while (i < reply.size() && !std::isdigit(static_cast<unsigned char>(reply[i]))) {
    ++i;
  }
  if (i == reply.size()) {
    return std::nullopt;
  }
  int value = 0;
  while (i < reply.size() && std::isdigit(static_cast<unsigned char>(reply[i])) && value <= kMaxImportance) {
    value = value * 10 + (reply[i] - '0');
    ++i;
  }
  return std::clamp(value, kMinImportance, kMaxImportance);
}

// One statement per non-empty line, with list markers ("-", "*", "1.", "2)")
// stripped.
inline std::vector<std::string> parse_statements(const std::string& reply, std::size_t max_items) {
  std::vector<std::string> out;
  std::istringstream in(reply);
  std::string line;
  while (std::getline(in, line) && out.size() < max_items) {
    std::string s = trim(line);
    std::size_t p = 0;
    while (p < s.size() && std::isdigit(static_cast<unsigned char>(s[p]))) {
      ++p;
    }
    if (p > 0 && p < s.size() && (s[p] == '.' || s[p] == ')')) {
      s = trim(s.substr(p + 1));
    } else if (!s.empty() && (s[0] == '-' || s[0] == '*')) {
      s = trim(s.substr(1));
    }
    if (!s.empty()) {
      out.push_back(s);
    }
  }
  return out;
}

class ProviderLanguageModel : public LanguageModel {
 public:
  ProviderLanguageModel(LLMProvider* provider, std::string model, SamplingOptions options,
                        std::size_t max_statements = 5)
      : provider_(provider), model_(std::move(model)), options_(options), max_statements_(max_statements) {}

  std::string complete(const std::string& prompt, int max_tokens) override {
    SamplingOptions opts = options_;
    opts.max_tokens = max_tokens;
    return ask(prompt, opts);
  }

  int score_importance(const std::string& text) override {
    std::ostringstream prompt;
    prompt << "On a scale of " << kMinImportance << " to " << kMaxImportance
           << ", where 1 is purely mundane (small talk, routine) and 10 is extremely poignant "
              "(a lasting fact, a decision, a strong emotion), rate the likely importance of the "
              "following memory. Answer with a single integer.\n\nMemory: "
           << text << "\nRating:";
    SamplingOptions opts = options_;
    opts.max_tokens = 4;
    opts.temperature = 0.0;
    const std::string reply = ask(prompt.str(), opts);
    const auto value = parse_importance(reply);
    if (!value.has_value()) {
      throw ExternalCallFailure("importance reply has no rating: '" + trim(reply) + "'");
    }
    return *value;
  }

  std::vector<std::string> synthesize(const std::vector<MemoryRecord>& records) override {
    std::ostringstream prompt;
    prompt << "Statements about recent experience:\n" << numbered(records) << "\nWhat " << max_statements_
           << " high-level insights can you infer from the statements above? "
              "Write one insight per line, without commentary.";
    return parse_statements(ask(prompt.str(), options_), max_statements_);
  }

  std::vector<std::string> draft_plans(const std::vector<MemoryRecord>& records) override {
    std::ostringstream prompt;
    prompt << "Relevant memories:\n" << numbered(records) << "\nGiven the memories above, write up to "
           << max_statements_ << " concrete intentions for upcoming conversations. One per line, without commentary.";
    return parse_statements(ask(prompt.str(), options_), max_statements_);
  }

 private:
  static std::string numbered(const std::vector<MemoryRecord>& records) {
    std::ostringstream out;
    for (std::size_t i = 0; i < records.size(); ++i) {
      out << (i + 1) << ". " << records[i].text << "\n";
    }
    return out.str();
  }

  std::string ask(const std::string& prompt, const SamplingOptions& opts) {
    if (!provider_) {
      throw ExternalCallFailure("no language model provider configured");
    }
    const json messages = json::array({{{"role", "user"}, {"content", prompt}}});
    const LLMResponse resp = provider_->chat(messages, model_, opts);
    if (resp.is_error()) {
      throw ExternalCallFailure(resp.content);
    }
    return resp.content;
  }

  LLMProvider* provider_;
  std::string model_;
  SamplingOptions options_;
  std::size_t max_statements_;
};

}  // namespace recall
