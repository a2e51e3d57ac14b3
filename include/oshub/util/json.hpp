#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace oshub::util::json {

using json = nlohmann::json;

inline json parse(const std::string& s) { return json::parse(s); }

// Invalid UTF-8 coming from upstream payloads is replaced rather than thrown on,
// so serializing a well-formed value never fails.
inline std::string dump(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
inline std::string dump_pretty(const json& j, int indent = 2) {
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace oshub::util::json
