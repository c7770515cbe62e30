#include "tokenizer.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

TEST(RegexTokenizer, EmptyTextIsZero) {
  RegexTokenizer tok;
  EXPECT_EQ(tok.count(""), 0u);
}

TEST(RegexTokenizer, WordsWithLeadingSpaceAreOnePieceEach) {
  RegexTokenizer tok;
  EXPECT_EQ(tok.count("tok tok tok"), 3u);
}

TEST(RegexTokenizer, NewlineRunIsOnePiece) {
  RegexTokenizer tok;
  EXPECT_EQ(tok.count("hello\n\nworld"), 3u);
}

TEST(RegexTokenizer, LongPiecesCostPerSixBytes) {
  RegexTokenizer tok;
  EXPECT_EQ(tok.count("abcdefghijklm"), 3u);  // 13 bytes
  EXPECT_EQ(tok.count("12345"), 2u);          // "123" "45"
}

TEST(RegexTokenizer, StrayByteCountsOnce) {
  RegexTokenizer tok;
  EXPECT_EQ(tok.count("\xff"), 1u);
}

TEST(RegexTokenizer, Deterministic) {
  RegexTokenizer tok;
  const std::string s = "<file-contents path=\"a.cpp\">\nint main() { return 0; }\n</file-contents>\n";
  EXPECT_EQ(tok.count(s), tok.count(s));
  EXPECT_GT(tok.count(s), 10u);
}

TEST(MakeTokenizer, RejectsUnknownKindAndMissingModel) {
  EXPECT_THROW(make_tokenizer(TokenizerConfig{ "bogus", "" }), std::runtime_error);
  EXPECT_THROW(make_tokenizer(TokenizerConfig{ "llama", "" }), std::runtime_error);
  EXPECT_EQ(make_tokenizer(TokenizerConfig{})->name(), "regex");
}

TEST(LlamaTokenizer, MissingModelThrows) {
  EXPECT_THROW(LlamaTokenizer("/nonexistent/ctxgather-model.gguf"), std::runtime_error);
}

TEST(SharedTokenizer, FirstSelectionWins) {
  const Tokenizer& a = init_tokenizer(TokenizerConfig{});
  const Tokenizer& b = init_tokenizer(TokenizerConfig{ "regex", "" });
  EXPECT_EQ(&a, &b);
  EXPECT_EQ(&a, &shared_tokenizer());
  EXPECT_THROW(init_tokenizer(TokenizerConfig{ "llama", "/some/model.gguf" }), std::runtime_error);
}
