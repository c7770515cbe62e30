#pragma once
#include "file_content.hpp"
#include "git_info.hpp"
#include "packer.hpp"
#include "tokenizer.hpp"
#include <optional>
#include <string>
#include <vector>

// One on-wire unit: exactly what is printed or copied.
struct RenderedChunk {
  std::string xml;
  size_t tokens;
};

struct AssemblyOptions {
  bool escape_xml = false;
  std::string generated_at;        // fixed timestamp; empty means "now", taken once
  bool include_git = false;
  std::optional<GitInfo> git;
};

struct AssemblyResult {
  std::vector<RenderedChunk> chunks;   // [0] is the header unless limit == 0
  std::vector<FileMeta> metas;
  std::vector<PackWarning> warnings;
};

constexpr int kMaxConvergencePasses = 8;

// Packs `files` so that every rendered chunk, markers included, fits `limit`
// where that is possible at all. limit == 0 yields a single unwrapped chunk.
// Deterministic for a fixed opts.generated_at.
AssemblyResult assemble_chunks(const std::vector<FileContent>& files, size_t limit,
                               const AssemblyOptions& opts, const Tokenizer& tok);

// Multi-step mode: a single header chunk advertising total-chunks="1", left
// open (no </shared-context>) because files follow on request. Every file is
// listed as one part.
AssemblyResult assemble_header_only(const std::vector<FileContent>& files, size_t limit,
                                    const AssemblyOptions& opts, const Tokenizer& tok);

// Wraps chunk `idx`: the header (idx 0) or <context-chunk id="idx/total">, then
// <more remaining="R"/> or the closing </shared-context> on the last chunk.
std::string render_chunk_snippet(const std::string& header_xml,
                                 const std::vector<std::string>& body_xmls,
                                 size_t idx);
