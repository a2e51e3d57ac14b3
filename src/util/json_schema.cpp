#include "oshub/util/json_schema.hpp"

namespace oshub::util::schema {

static bool is_type(const Json& inst, const std::string& type) {
  if (type == "object") return inst.is_object();
  if (type == "array") return inst.is_array();
  if (type == "string") return inst.is_string();
  if (type == "number") return inst.is_number();
  if (type == "integer") return inst.is_number_integer();
  if (type == "boolean") return inst.is_boolean();
  if (type == "null") return inst.is_null();
  return true; // unknown treated as pass-through
}

std::string type_name(const Json& inst) {
  if (inst.is_object()) return "object";
  if (inst.is_array()) return "array";
  if (inst.is_string()) return "string";
  if (inst.is_number_integer()) return "integer";
  if (inst.is_number()) return "number";
  if (inst.is_boolean()) return "boolean";
  return "null";
}

static void validate_object(const Json& schema, const Json& inst) {
  if (!inst.is_object()) throw ValidationError("arguments must be an object");
  // required
  if (schema.contains("required") && schema["required"].is_array()) {
    for (auto& req : schema["required"]) {
      if (!req.is_string()) continue;
      auto key = req.get<std::string>();
      if (!inst.contains(key)) throw ValidationError("Missing required argument '" + key + "'");
    }
  }
  // properties types
  if (schema.contains("properties") && schema["properties"].is_object()) {
    for (auto& [name, subschema] : schema["properties"].items()) {
      if (!inst.contains(name)) continue;
      if (subschema.contains("type") && subschema["type"].is_string()) {
        auto t = subschema["type"].get<std::string>();
        if (!is_type(inst[name], t))
          throw ValidationError("Argument '" + name + "' must be of type " + t + ", got " +
                                type_name(inst[name]));
      }
    }
  }
}

void validate(const Json& schema, const Json& instance) {
  if (!schema.is_object() || !schema.contains("type") || !schema["type"].is_string()) return;
  auto t = schema["type"].get<std::string>();
  if (t == "object") {
    validate_object(schema, instance);
    return;
  }
  if (!is_type(instance, t))
    throw ValidationError("expected " + t + ", got " + type_name(instance));
}

} // namespace oshub::util::schema
