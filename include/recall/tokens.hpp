#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "recall/common.hpp"

namespace recall {

// Measures text in the model's budget units. The same instance must be shared
// by everything that accounts against one budget.
class TokenCounter {
 public:
  virtual ~TokenCounter() = default;

  virtual std::size_t count_units(const std::string& text) const = 0;
};

// Roughly one token per four bytes of English text.
class ApproxTokenCounter : public TokenCounter {
 public:
  std::size_t count_units(const std::string& text) const override { return (text.size() + 3) / 4; }
};

class CharCounter : public TokenCounter {
 public:
  std::size_t count_units(const std::string& text) const override { return text.size(); }
};

inline std::unique_ptr<TokenCounter> make_token_counter(const std::string& name) {
  const std::string n = to_lower(trim(name));
  if (n == "chars" || n == "characters") {
    return std::make_unique<CharCounter>();
  }
  if (n != "approx" && !n.empty()) {
    Logger::log(Logger::Level::kWarn, "Unknown token counter '" + name + "', using approx");
  }
  return std::make_unique<ApproxTokenCounter>();
}

}  // namespace recall
