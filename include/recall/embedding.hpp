#pragma once

#include <cmath>
#include <map>
#include <string>
#include <vector>

#include "recall/common.hpp"
#include "recall/errors.hpp"
#include "recall/http.hpp"
#include "recall/tokens.hpp"

namespace recall {

using Embedding = std::vector<float>;

class Embedder {
 public:
  virtual ~Embedder() = default;

  // Throws ExternalCallFailure on any error. Identical text must embed to
  // (nearly) identical vectors.
  virtual Embedding embed(const std::string& text) = 0;
};

// Zero when either vector has no magnitude or the dimensions differ.
inline double cosine_similarity(const Embedding& a, const Embedding& b) {
  if (a.size() != b.size() || a.empty()) {
    return 0.0;
  }
  double dot = 0.0;
  double na = 0.0;
  double nb = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    na += static_cast<double>(a[i]) * a[i];
    nb += static_cast<double>(b[i]) * b[i];
  }
  if (na <= 0.0 || nb <= 0.0) {
    return 0.0;
  }
  return std::clamp(dot / (std::sqrt(na) * std::sqrt(nb)), -1.0, 1.0);
}

class OpenAICompatibleEmbedder : public Embedder {
 public:
  static constexpr std::size_t kMaxInputUnits = 8191;

  OpenAICompatibleEmbedder(std::string api_key, std::string api_base, std::string model, int timeout_s = 30)
      : api_key_(std::move(api_key)), api_base_(std::move(api_base)), model_(std::move(model)), timeout_s_(timeout_s) {
    if (api_base_.empty()) {
      api_base_ = "https://api.openai.com/v1";
    }
  }

  Embedding embed(const std::string& text) override {
    if (api_key_.empty()) {
      throw ExternalCallFailure("no embedding API key configured");
    }
    const std::size_t units = counter_.count_units(text);
    if (units > kMaxInputUnits) {
      throw ExternalCallFailure("embedding input of " + std::to_string(units) + " units exceeds " +
                                std::to_string(kMaxInputUnits));
    }

    const json payload = {{"input", text}, {"model", model_}};
    const std::map<std::string, std::string> headers = {
        {"Authorization", "Bearer " + api_key_},
        {"Content-Type", "application/json"},
    };

    std::string body;
    try {
      body = payload.dump();
    } catch (const json::exception& e) {
      throw ExternalCallFailure(std::string("cannot encode embedding request: ") + e.what());
    }

    thread_local HttpClient client;
    const HttpResponse resp = client.post(api_base_ + "/embeddings", body, headers, timeout_s_);
    if (!resp.ok()) {
      throw ExternalCallFailure("embedding request: " + resp.describe_failure());
    }

    Embedding out;
    try {
      const json data = json::parse(resp.body);
      if (!data.contains("data") || !data["data"].is_array() || data["data"].empty() ||
          !data["data"][0].contains("embedding") || !data["data"][0]["embedding"].is_array()) {
        throw ExternalCallFailure("malformed embedding response");
      }
      out = data["data"][0]["embedding"].get<Embedding>();
    } catch (const json::exception& e) {
      throw ExternalCallFailure(std::string("cannot parse embedding response: ") + e.what());
    }
    if (out.empty()) {
      throw ExternalCallFailure("embedding response is empty");
    }
    return out;
  }

 private:
  std::string api_key_;
  std::string api_base_;
  std::string model_;
  int timeout_s_;
  ApproxTokenCounter counter_;
};

}  // namespace recall
