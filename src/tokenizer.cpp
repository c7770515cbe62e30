// src/tokenizer.cpp
#include "tokenizer.hpp"
#include <llama.h>
#include <re2/re2.h>
#include <mutex>
#include <stdexcept>
#include <string>

namespace {
// Letter runs (one optional leading non-letter), short digit groups,
// punctuation runs, newline runs, then any other whitespace.
const char* PRETOKEN_PATTERN =
  "[^\\r\\n\\p{L}\\p{N}]?\\p{L}+"
  "|\\p{N}{1,3}"
  "| ?[^\\s\\p{L}\\p{N}]+[\\r\\n]*"
  "|\\s*[\\r\\n]+"
  "|\\s+";

constexpr size_t kBytesPerToken = 6;
}

struct RegexTokenizer::Impl {
  RE2 re;
  Impl() : re(PRETOKEN_PATTERN) {
    if (!re.ok()) throw std::runtime_error("tokenizer: bad pretoken pattern: " + re.error());
  }
};

RegexTokenizer::RegexTokenizer() : impl_(new Impl) {}
RegexTokenizer::~RegexTokenizer() = default;

size_t RegexTokenizer::count(std::string_view text) const {
  re2::StringPiece input(text.data(), text.size());
  re2::StringPiece piece;
  size_t pos = 0;
  size_t n = 0;
  while (pos < input.size()) {
    if (!impl_->re.Match(input, pos, input.size(), RE2::ANCHOR_START, &piece, 1) || piece.empty()) {
      // stray byte (invalid UTF-8 and the like)
      ++n;
      ++pos;
      continue;
    }
    n += (piece.size() + kBytesPerToken - 1) / kBytesPerToken;
    pos += piece.size();
  }
  return n;
}

struct LlamaTokenizer::Impl {
  llama_model* model = nullptr;
  const llama_vocab* vocab = nullptr;

  explicit Impl(const std::string& model_path) {
    llama_backend_init();

    llama_model_params mp = llama_model_default_params();
    mp.n_gpu_layers = 0;
    mp.vocab_only = true;  // counting only, no weights
    model = llama_load_model_from_file(model_path.c_str(), mp);
    if (!model) {
      llama_backend_free();
      throw std::runtime_error("tokenizer: failed to load model " + model_path);
    }
    vocab = llama_model_get_vocab(model);
  }

  ~Impl() {
    if (model) llama_free_model(model);
    llama_backend_free();
  }
};

LlamaTokenizer::LlamaTokenizer(const std::string& model_path) : impl_(new Impl(model_path)) {}
LlamaTokenizer::~LlamaTokenizer() = default;

size_t LlamaTokenizer::count(std::string_view text) const {
  if (text.empty()) return 0;
  // With no output buffer llama_tokenize reports the required size, negated.
  int32_t n = llama_tokenize(impl_->vocab, text.data(), (int32_t)text.size(),
                             nullptr, 0, /*add_special=*/false, /*parse_special=*/true);
  return (size_t)(n < 0 ? -n : n);
}

std::unique_ptr<Tokenizer> make_tokenizer(const TokenizerConfig& cfg) {
  if (cfg.kind == "regex") return std::unique_ptr<Tokenizer>(new RegexTokenizer());
  if (cfg.kind == "llama") {
    if (cfg.model_path.empty())
      throw std::runtime_error("tokenizer: llama tokenizer needs a model path");
    return std::unique_ptr<Tokenizer>(new LlamaTokenizer(cfg.model_path));
  }
  throw std::runtime_error("tokenizer: unknown kind '" + cfg.kind + "'");
}

namespace {
std::mutex g_mu;
std::unique_ptr<Tokenizer> g_tok;
TokenizerConfig g_cfg;
}

const Tokenizer& init_tokenizer(const TokenizerConfig& cfg) {
  std::lock_guard<std::mutex> lock(g_mu);
  if (g_tok) {
    if (cfg != g_cfg) throw std::runtime_error("tokenizer already initialized as '" + g_tok->name() + "'");
    return *g_tok;
  }
  g_tok = make_tokenizer(cfg);
  g_cfg = cfg;
  return *g_tok;
}

const Tokenizer& shared_tokenizer() {
  {
    std::lock_guard<std::mutex> lock(g_mu);
    if (g_tok) return *g_tok;
  }
  return init_tokenizer(TokenizerConfig{});
}
