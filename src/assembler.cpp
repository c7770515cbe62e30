#include "assembler.hpp"
#include "header.hpp"
#include <algorithm>
#include <stdexcept>

std::string render_chunk_snippet(const std::string& header_xml,
                                 const std::vector<std::string>& body_xmls,
                                 size_t idx) {
  const size_t total = body_xmls.size() + 1;
  if (idx >= total) throw std::out_of_range("chunk index out of range");
  const size_t rem = total - idx - 1;

  std::string s;
  if (idx == 0) {
    s = header_xml;
  } else {
    s = "<context-chunk id=\"" + std::to_string(idx) + "/" + std::to_string(total) + "\">\n";
    s += body_xmls[idx - 1];
    s += "</context-chunk>\n";
  }
  if (rem > 0) s += "<more remaining=\"" + std::to_string(rem) + "\"/>\n";
  else s += "</shared-context>\n";
  return s;
}

namespace {

std::vector<RenderedChunk> render_all(const std::vector<ChunkBody>& bodies,
                                      const std::vector<FileMeta>& metas,
                                      size_t limit, const HeaderOptions& hopts,
                                      const Tokenizer& tok) {
  const std::string header_xml =
    "<shared-context>\n" + make_header(bodies.size() + 1, limit, metas, hopts) + "\n";
  std::vector<std::string> body_xmls;
  body_xmls.reserve(bodies.size());
  for (auto& b : bodies) body_xmls.push_back(b.xml());

  std::vector<RenderedChunk> chunks;
  chunks.reserve(bodies.size() + 1);
  for (size_t i = 0; i <= bodies.size(); ++i) {
    std::string xml = render_chunk_snippet(header_xml, body_xmls, i);
    size_t n = tok.count(xml);
    chunks.push_back(RenderedChunk{ std::move(xml), n });
  }
  return chunks;
}

void add_oversize_warnings(const std::vector<RenderedChunk>& chunks, size_t limit,
                           std::vector<PackWarning>& warnings) {
  if (chunks[0].tokens > limit) {
    warnings.push_back({ PackWarning::Kind::OversizeHeader,
      "header has " + std::to_string(chunks[0].tokens) + " tokens, over chunk size " +
      std::to_string(limit) + "; increase --chunk-size or disable git info" });
  }
  for (size_t i = 1; i < chunks.size(); ++i) {
    if (chunks[i].tokens <= limit) continue;
    warnings.push_back({ PackWarning::Kind::OversizeChunk,
      "chunk " + std::to_string(i) + " has " + std::to_string(chunks[i].tokens) +
      " tokens, over chunk size " + std::to_string(limit) + " due to an oversize file part" });
  }
}

}

static HeaderOptions header_options(const AssemblyOptions& opts) {
  const HeaderOptions hopts = header_options(opts);
  return hopts;
}

AssemblyResult assemble_header_only(const std::vector<FileContent>& files, size_t limit,
                                    const AssemblyOptions& opts, const Tokenizer& tok) {
  ChunkPacker packer(tok, opts.escape_xml);
  AssemblyResult r;
  r.metas = packer.pack(files, 0).metas;
  std::string xml = "<shared-context>\n" + make_header(1, limit, r.metas, header_options(opts)) + "\n";
  size_t n = tok.count(xml);
  r.chunks.push_back(RenderedChunk{ std::move(xml), n });
  if (limit > 0 && n > limit) {
    r.warnings.push_back({ PackWarning::Kind::OversizeHeader,
      "header has " + std::to_string(n) + " tokens, over chunk size " + std::to_string(limit) });
  }
  return r;
}

AssemblyResult assemble_chunks(const std::vector<FileContent>& files, size_t limit,
                               const AssemblyOptions& opts, const Tokenizer& tok) {
  ChunkPacker packer(tok, opts.escape_xml);
  AssemblyResult r;

  if (limit == 0) {
    PackResult p = packer.pack(files, 0);
    std::string xml = p.bodies.empty() ? std::string() : p.bodies.front().xml();
    size_t n = tok.count(xml);
    r.chunks.push_back(RenderedChunk{ std::move(xml), n });
    r.metas = std::move(p.metas);
    r.warnings = std::move(p.warnings);
    return r;
  }

  HeaderOptions hopts;
  hopts.escape_xml = opts.escape_xml;
  hopts.generated_at = opts.generated_at.empty() ? utc_timestamp_now() : opts.generated_at;
  hopts.include_git = opts.include_git;
  hopts.git = opts.git;

  size_t effective = limit;
  for (int pass = 0; pass < kMaxConvergencePasses; ++pass) {
    PackResult packed = packer.pack(files, effective);
    std::vector<ChunkBody>& bodies = packed.bodies;

    size_t max_splits = 0;
    for (auto& b : bodies) max_splits += b.size();
    size_t splits = 0;

    std::vector<RenderedChunk> chunks;
    for (;;) {
      chunks = render_all(bodies, packed.metas, limit, hopts, tok);

      // Markers pushed a multi-block chunk over: move its last block out.
      size_t split_at = 0;
      bool split = false;
      for (size_t i = 1; i < chunks.size() && splits < max_splits; ++i) {
        if (chunks[i].tokens > limit && bodies[i - 1].size() > 1) {
          split_at = i - 1;
          split = true;
          break;
        }
      }
      if (!split) break;
      ChunkBody tail;
      tail.add(bodies[split_at].pop_back());
      bodies.insert(bodies.begin() + (long)split_at + 1, std::move(tail));
      ++splits;
    }

    // Single-block chunks still over: leave room for their markers next pass.
    bool shrink = false;
    size_t required = effective;
    for (size_t i = 1; i < chunks.size(); ++i) {
      if (chunks[i].tokens <= limit || bodies[i - 1].size() != 1) continue;
      size_t block_tokens = bodies[i - 1].blocks().front().tokens;
      size_t overhead = chunks[i].tokens > block_tokens ? chunks[i].tokens - block_tokens : 0;
      size_t candidate = limit > overhead ? limit - overhead : 0;
      if (candidate > 0 && candidate < required) {
        required = candidate;
        shrink = true;
      }
    }

    r.chunks = std::move(chunks);
    r.metas = std::move(packed.metas);
    r.warnings = std::move(packed.warnings);
    if (!shrink) {
      add_oversize_warnings(r.chunks, limit, r.warnings);
      return r;
    }
    effective = required;
  }

  add_oversize_warnings(r.chunks, limit, r.warnings);
  r.warnings.push_back({ PackWarning::Kind::PackingNotConverged,
    "chunk packing did not settle after " + std::to_string(kMaxConvergencePasses) +
    " passes; using the last attempt" });
  return r;
}
