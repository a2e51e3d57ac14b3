#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "oshub/tools/tool.hpp"
#include "oshub/exceptions.hpp"

namespace oshub::tools {

/// Tool registry. Lists in registration order; names are unique.
class ToolManager {
 public:
  /// Throws Error if a tool with the same name is already registered.
  void register_tool(Tool t);

  bool has(const std::string& name) const { return index_.count(name) > 0; }
  const Tool& get(const std::string& name) const;
  const std::vector<Tool>& list() const { return tools_; }
  size_t size() const { return tools_.size(); }

  /// Validate `arguments` against the tool's input schema, then run it.
  /// Never throws: lookup, validation and handler failures come back as ToolError.
  ToolOutcome dispatch(const std::string& name, const Json& arguments) const;

 private:
  std::vector<Tool> tools_;
  std::unordered_map<std::string, size_t> index_;
};

} // namespace oshub::tools
