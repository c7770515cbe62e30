#pragma once
#include "cli.hpp"
#include <stdexcept>
#include <string>

struct ConfigError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Fills `a` from a JSON object file. Flags given on the command line win.
// Keys: chunk_size, max_size, exclude, escape_xml, git_info, multi_step,
// tokenizer, tokenizer_model, model_context. Unknown keys are ignored.
void apply_config_file(Args& a, const std::string& path);

// Same, from JSON text (used by apply_config_file).
void apply_config_json(Args& a, const std::string& text);

// Settings that are not flags: CTXGATHER_TOKENIZER_MODEL.
void apply_environment(Args& a);
