#include "packer.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace {
RenderedBlock block_of(size_t tokens) {
  return RenderedBlock{ 0, 1, 1, "x", tokens };
}

bool has_warning(const std::vector<PackWarning>& ws, PackWarning::Kind k) {
  for (auto& w : ws) if (w.kind == k) return true;
  return false;
}

std::vector<std::string> body_xmls(const PackResult& r) {
  std::vector<std::string> out;
  for (auto& b : r.bodies) out.push_back(b.xml());
  return out;
}
}

TEST(SplitLines, KeepsNewlinesAndAddsOneAtTheEnd) {
  EXPECT_EQ(split_lines("a\nb"), (std::vector<std::string>{ "a\n", "b\n" }));
  EXPECT_EQ(split_lines("a\n"), (std::vector<std::string>{ "a\n", "\n" }));
  EXPECT_EQ(split_lines(""), (std::vector<std::string>{ "\n" }));
}

TEST(ChunkBody, TracksTokens) {
  ChunkBody b;
  EXPECT_TRUE(b.empty());
  b.add(block_of(4));
  b.add(block_of(6));
  EXPECT_EQ(b.tokens(), 10u);
  EXPECT_EQ(b.size(), 2u);
  auto last = b.pop_back();
  EXPECT_EQ(last.tokens, 6u);
  EXPECT_EQ(b.tokens(), 4u);
  b.pop_back();
  EXPECT_THROW(b.pop_back(), std::runtime_error);
}

TEST(PackState, ClosesBodyWhenNextBlockDoesNotFit) {
  PackState s(10);
  s.push(block_of(4));
  s.push(block_of(4));
  s.push(block_of(4));
  auto bodies = s.finish();
  ASSERT_EQ(bodies.size(), 2u);
  EXPECT_EQ(bodies[0].tokens(), 8u);
  EXPECT_EQ(bodies[1].tokens(), 4u);
}

TEST(PackState, OversizeBlockGetsItsOwnBody) {
  PackState s(10);
  s.push(block_of(3));
  s.push(block_of(25));
  s.push(block_of(3));
  auto bodies = s.finish();
  ASSERT_EQ(bodies.size(), 3u);
  EXPECT_EQ(bodies[1].tokens(), 25u);
}

TEST(PackState, ZeroLimitNeverCloses) {
  PackState s(0);
  for (int i = 0; i < 5; ++i) s.push(block_of(100));
  EXPECT_EQ(s.finish().size(), 1u);
}

TEST(ChunkPacker, SmallFilesShareOneBody) {
  TokTokenizer tok;
  std::vector<FileContent> files{ make_file("a", repeat("tok ", 10)), make_file("b", repeat("tok ", 5)) };
  ChunkPacker packer(tok, false);
  for (size_t limit : { 15u, 100u }) {
    auto r = packer.pack(files, limit);
    ASSERT_EQ(r.bodies.size(), 1u);
    ASSERT_EQ(r.metas.size(), 2u);
    EXPECT_EQ(r.metas[0].parts, 1u);
    EXPECT_EQ(r.metas[1].parts, 1u);
    EXPECT_EQ(r.metas[0].tokens, 10u);
    EXPECT_EQ(r.metas[1].tokens, 5u);
    EXPECT_TRUE(r.warnings.empty());
  }
}

TEST(ChunkPacker, OversizeFileSplitsIntoTwoParts) {
  TokTokenizer tok;
  std::vector<FileContent> files{ make_file("big.txt", repeat("tok\n", 15)) };
  ChunkPacker packer(tok, false);
  auto r = packer.pack(files, 10);
  ASSERT_EQ(r.bodies.size(), 2u);
  EXPECT_EQ(r.metas[0].parts, 2u);
  EXPECT_EQ(r.metas[0].tokens, 15u);
  EXPECT_LE(r.bodies[0].tokens(), 10u);
  EXPECT_EQ(r.bodies[0].blocks()[0].part_index, 1u);
  EXPECT_EQ(r.bodies[1].blocks()[0].part_index, 2u);
  EXPECT_EQ(r.bodies[1].blocks()[0].parts_total, 2u);
  EXPECT_NE(r.bodies[0].xml().find("part=\"1/2\""), std::string::npos);
  EXPECT_TRUE(r.warnings.empty());
}

TEST(ChunkPacker, ZeroLimitDisablesSplitting) {
  TokTokenizer tok;
  std::vector<FileContent> files{ make_file("a", repeat("tok\n", 500)), make_file("b", "tok") };
  ChunkPacker packer(tok, false);
  auto r = packer.pack(files, 0);
  ASSERT_EQ(r.bodies.size(), 1u);
  EXPECT_EQ(r.bodies[0].size(), 2u);
  EXPECT_EQ(r.metas[0].parts, 1u);
  EXPECT_EQ(r.bodies[0].xml().find("part="), std::string::npos);
}

TEST(ChunkPacker, NoFilesNoBodies) {
  TokTokenizer tok;
  ChunkPacker packer(tok, false);
  auto r = packer.pack({}, 50);
  EXPECT_TRUE(r.bodies.empty());
  EXPECT_TRUE(r.metas.empty());
}

TEST(ChunkPacker, IndivisibleLineIsEmittedWholeWithWarning) {
  TokTokenizer tok;
  const std::string line = repeat("tok ", 15);
  std::vector<FileContent> files{ make_file("wide.txt", "head\n" + line + "\ntail") };
  ChunkPacker packer(tok, false);
  auto r = packer.pack(files, 10);
  EXPECT_TRUE(has_warning(r.warnings, PackWarning::Kind::OversizeLine));
  EXPECT_EQ(reassemble(body_xmls(r), "wide.txt"), files[0].text + "\n");

  bool found = false;
  for (auto& b : r.bodies)
    for (auto& blk : b.blocks())
      if (blk.xml.find(line) != std::string::npos) { found = true; EXPECT_GT(blk.tokens, 10u); }
  EXPECT_TRUE(found);
}

TEST(ChunkPacker, KeepsFileAndLineOrder) {
  WordTokenizer tok;
  std::vector<FileContent> files;
  for (int i = 0; i < 4; ++i) {
    std::string text;
    for (int l = 0; l < 40; ++l) text += "f" + std::to_string(i) + " line " + std::to_string(l) + "\n";
    files.push_back(make_file("dir/f" + std::to_string(i) + ".txt", text));
  }
  ChunkPacker packer(tok, false);
  auto r = packer.pack(files, 60);

  size_t last_file = 0, last_part = 0;
  for (auto& b : r.bodies) {
    EXPECT_LE(b.tokens(), 60u);
    for (auto& blk : b.blocks()) {
      if (blk.file_index == last_file) EXPECT_GE(blk.part_index, last_part);
      else EXPECT_GT(blk.file_index, last_file);
      last_file = blk.file_index;
      last_part = blk.part_index;
    }
  }
  auto xmls = body_xmls(r);
  for (auto& f : files) EXPECT_EQ(reassemble(xmls, f.path), f.text + "\n");
}

TEST(ChunkPacker, MetaTokensAreSumOfParts) {
  WordTokenizer tok;
  std::string text;
  for (int l = 0; l < 30; ++l) text += "alpha beta gamma\n";
  std::vector<FileContent> files{ make_file("a.txt", text) };
  ChunkPacker packer(tok, false);
  auto r = packer.pack(files, 25);
  size_t sum = 0, parts = 0;
  for (auto& b : r.bodies)
    for (auto& blk : b.blocks()) { sum += blk.tokens; ++parts; }
  EXPECT_EQ(r.metas[0].tokens, sum);
  EXPECT_EQ(r.metas[0].parts, parts);
  EXPECT_GT(parts, 1u);
}
