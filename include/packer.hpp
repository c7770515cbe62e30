#pragma once
#include "file_content.hpp"
#include "renderer.hpp"
#include "tokenizer.hpp"
#include <string>
#include <vector>

// A fidelity or convergence problem. Never fatal: the output is still complete.
struct PackWarning {
  enum class Kind {
    OversizeLine,        // one line alone does not fit
    OversizePart,        // a rendered file part exceeds the limit
    OversizeChunk,       // a single-block chunk exceeds the limit after markers
    OversizeHeader,      // the manifest chunk exceeds the limit
    SplitNotConverged,   // part count did not settle within the attempt ceiling
    PackingNotConverged  // effective limit did not settle within the pass ceiling
  };
  Kind kind;
  std::string message;
};

struct FileMeta {
  size_t id;
  std::string path;
  size_t tokens;   // sum over the file's rendered blocks
  size_t parts;
};

// Ordered blocks of one chunk, without the chunk markers.
class ChunkBody {
public:
  void add(RenderedBlock b);
  RenderedBlock pop_back();

  const std::vector<RenderedBlock>& blocks() const { return blocks_; }
  size_t tokens() const { return tokens_; }
  size_t size() const { return blocks_.size(); }
  bool empty() const { return blocks_.empty(); }

  // Concatenated block xml.
  std::string xml() const;

private:
  std::vector<RenderedBlock> blocks_;
  size_t tokens_ = 0;
};

// Greedy accumulator used while packing: the closed bodies plus the open one.
class PackState {
public:
  explicit PackState(size_t limit) : limit_(limit) {}

  // Appends to the open body, closing it first when `b` would not fit.
  void push(RenderedBlock b);
  std::vector<ChunkBody> finish();

private:
  size_t limit_;
  std::vector<ChunkBody> closed_;
  ChunkBody current_;
};

struct PackResult {
  std::vector<ChunkBody> bodies;
  std::vector<FileMeta> metas;
  std::vector<PackWarning> warnings;
};

class ChunkPacker {
public:
  static constexpr int kMaxSplitAttempts = 16;

  ChunkPacker(const Tokenizer& tok, bool escape_xml) : tok_(tok), escape_xml_(escape_xml) {}

  // limit == 0 puts every whole-file block into one body.
  PackResult pack(const std::vector<FileContent>& files, size_t limit) const;

  // Splits one file into the fewest line runs whose rendered parts fit `limit`.
  std::vector<RenderedBlock> split_file(const FileContent& f, size_t file_index, size_t limit,
                                        std::vector<PackWarning>& warnings) const;

private:
  struct SplitAttempt {
    std::vector<std::string> parts;
    std::vector<size_t> oversize_lines;  // 1-based
  };
  SplitAttempt split_with_total(const FileContent& f, const std::vector<std::string>& lines,
                                size_t limit, size_t total) const;
  size_t part_tokens(const FileContent& f, size_t part, size_t total, const std::string& lines) const;

  const Tokenizer& tok_;
  bool escape_xml_;
};

// Splits on '\n', re-appending '\n' to every piece (the last one included).
std::vector<std::string> split_lines(const std::string& text);
