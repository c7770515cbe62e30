// src/config.cpp
#include "config.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace {
uint64_t get_count(const json& j, const char* key) {
  const auto& v = j.at(key);
  if (!v.is_number_unsigned()) throw ConfigError(std::string("config: '") + key + "' must be a non-negative integer");
  return v.get<uint64_t>();
}

bool get_flag(const json& j, const char* key) {
  const auto& v = j.at(key);
  if (!v.is_boolean()) throw ConfigError(std::string("config: '") + key + "' must be a boolean");
  return v.get<bool>();
}

std::string get_string(const json& j, const char* key) {
  const auto& v = j.at(key);
  if (!v.is_string()) throw ConfigError(std::string("config: '") + key + "' must be a string");
  return v.get<std::string>();
}
}

void apply_config_json(Args& a, const std::string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("config: ") + e.what());
  }
  if (!j.is_object()) throw ConfigError("config: top level must be an object");

  auto wants = [&](const char* key, const char* flag) {
    return j.contains(key) && !a.given.count(flag);
  };

  if (wants("chunk_size", "chunk-size")) a.chunk_size = get_count(j, "chunk_size");
  if (wants("max_size", "max-size")) a.max_size = get_count(j, "max_size");
  if (wants("model_context", "model-context")) a.model_context = get_count(j, "model_context");
  if (wants("escape_xml", "escape-xml")) a.escape_xml = get_flag(j, "escape_xml");
  if (wants("git_info", "git-info")) a.git_info = get_flag(j, "git_info");
  if (wants("multi_step", "multi-step")) a.multi_step = get_flag(j, "multi_step");
  if (wants("tokenizer", "tokenizer")) a.tokenizer = get_string(j, "tokenizer");
  if (wants("tokenizer_model", "tokenizer-model")) a.tokenizer_model = get_string(j, "tokenizer_model");
  if (wants("exclude", "exclude")) {
    const auto& arr = j.at("exclude");
    if (!arr.is_array()) throw ConfigError("config: 'exclude' must be an array of strings");
    a.exclude.clear();
    for (auto& s : arr) {
      if (!s.is_string()) throw ConfigError("config: 'exclude' must be an array of strings");
      a.exclude.push_back(s.get<std::string>());
    }
  }
}

void apply_config_file(Args& a, const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ConfigError("config: cannot open " + path);
  std::ostringstream ss; ss << in.rdbuf();
  apply_config_json(a, ss.str());
}

void apply_environment(Args& a) {
  if (!a.tokenizer_model.empty()) return;
  if (const char* m = std::getenv("CTXGATHER_TOKENIZER_MODEL")) a.tokenizer_model = m;
}
