#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

// Counts tokens in rendered text. Implementations must be deterministic and
// safe to call repeatedly from one thread without further setup.
class Tokenizer {
public:
  virtual ~Tokenizer() = default;
  virtual size_t count(std::string_view text) const = 0;
  virtual std::string name() const = 0;
};

// BPE-style pre-token approximation on RE2; no model file needed.
class RegexTokenizer : public Tokenizer {
public:
  RegexTokenizer();
  ~RegexTokenizer() override;

  size_t count(std::string_view text) const override;
  std::string name() const override { return "regex"; }

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// Exact counts from a GGUF vocabulary (llama.cpp, vocab only).
class LlamaTokenizer : public Tokenizer {
public:
  explicit LlamaTokenizer(const std::string& model_path);
  ~LlamaTokenizer() override;

  size_t count(std::string_view text) const override;
  std::string name() const override { return "llama"; }

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

struct TokenizerConfig {
  std::string kind = "regex";  // "regex" or "llama"
  std::string model_path;      // required for "llama"

  bool operator==(const TokenizerConfig& o) const {
    return kind == o.kind && model_path == o.model_path;
  }
  bool operator!=(const TokenizerConfig& o) const { return !(*this == o); }
};

std::unique_ptr<Tokenizer> make_tokenizer(const TokenizerConfig& cfg);

// Process-wide tokenizer. First call wins; calling again with a different
// config throws std::runtime_error.
const Tokenizer& init_tokenizer(const TokenizerConfig& cfg);

// Returns the process-wide tokenizer, selecting the default one if needed.
const Tokenizer& shared_tokenizer();
