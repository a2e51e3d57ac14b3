#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "oshub/prompts/prompt.hpp"

namespace oshub::prompts {

class PromptManager {
 public:
  /// Throws Error if a prompt with the same name is already registered.
  void add(Prompt p);
  const Prompt& get(const std::string& name) const;
  bool has(const std::string& name) const { return index_.count(name) > 0; }
  const std::vector<Prompt>& list() const { return prompts_; }

  /// Throws NotFoundError for an unknown prompt and ValidationError when a
  /// required argument is missing; generator failures propagate unchanged.
  std::vector<PromptMessage> render(const std::string& name, const Json& arguments) const;

 private:
  std::vector<Prompt> prompts_;
  std::unordered_map<std::string, size_t> index_;
};

} // namespace oshub::prompts
