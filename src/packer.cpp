#include "packer.hpp"
#include "xml.hpp"
#include <stdexcept>
#include <utility>

void ChunkBody::add(RenderedBlock b) {
  tokens_ += b.tokens;
  blocks_.push_back(std::move(b));
}

RenderedBlock ChunkBody::pop_back() {
  if (blocks_.empty()) throw std::runtime_error("ChunkBody::pop_back on empty body");
  RenderedBlock b = std::move(blocks_.back());
  blocks_.pop_back();
  tokens_ = tokens_ > b.tokens ? tokens_ - b.tokens : 0;
  return b;
}

std::string ChunkBody::xml() const {
  std::string s;
  for (auto& b : blocks_) s += b.xml;
  return s;
}

void PackState::push(RenderedBlock b) {
  if (limit_ > 0 && !current_.empty() && current_.tokens() + b.tokens > limit_) {
    closed_.push_back(std::move(current_));
    current_ = ChunkBody();
  }
  current_.add(std::move(b));
}

std::vector<ChunkBody> PackState::finish() {
  if (!current_.empty()) {
    closed_.push_back(std::move(current_));
    current_ = ChunkBody();
  }
  return std::move(closed_);
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  size_t start = 0;
  for (;;) {
    size_t nl = text.find('\n', start);
    if (nl == std::string::npos) {
      lines.push_back(text.substr(start) + "\n");
      break;
    }
    lines.push_back(text.substr(start, nl - start + 1));
    start = nl + 1;
  }
  return lines;
}

size_t ChunkPacker::part_tokens(const FileContent& f, size_t part, size_t total,
                                const std::string& lines) const {
  return tok_.count(render_part_block(f, part, total, lines, escape_xml_));
}

// One greedy pass with the part attribute rendered as "i/total".
ChunkPacker::SplitAttempt ChunkPacker::split_with_total(const FileContent& f,
                                                        const std::vector<std::string>& lines,
                                                        size_t limit, size_t total) const {
  SplitAttempt a;
  std::string current;
  size_t part = 1;

  auto close_oversize = [&](size_t line_no) {
    a.oversize_lines.push_back(line_no);
    a.parts.push_back(std::move(current));
    current.clear();
    ++part;
  };

  for (size_t i = 0; i < lines.size(); ++i) {
    const std::string& line = lines[i];
    if (current.empty()) {
      current = line;
      if (part_tokens(f, part, total, current) > limit) close_oversize(i + 1);
      continue;
    }

    size_t prev_len = current.size();
    current += line;
    if (part_tokens(f, part, total, current) <= limit) continue;

    current.resize(prev_len);
    a.parts.push_back(std::move(current));
    ++part;
    current = line;
    if (part_tokens(f, part, total, current) > limit) close_oversize(i + 1);
  }
  if (!current.empty()) a.parts.push_back(std::move(current));
  return a;
}

std::vector<RenderedBlock> ChunkPacker::split_file(const FileContent& f, size_t file_index, size_t limit,
                                                   std::vector<PackWarning>& warnings) const {
  const auto lines = split_lines(f.text);
  const std::string path = slash_path(f.path);

  // The part attribute's width depends on the total being decided, so iterate
  // until the observed part count matches the guess.
  size_t target = 1;
  SplitAttempt attempt;
  bool converged = false;
  for (int i = 0; i < kMaxSplitAttempts; ++i) {
    attempt = split_with_total(f, lines, limit, target);
    size_t actual = attempt.parts.empty() ? 1 : attempt.parts.size();
    if (actual == target) { converged = true; break; }
    target = actual;
  }
  if (!converged) {
    warnings.push_back({ PackWarning::Kind::SplitNotConverged,
      "splitting " + path + " did not settle after " + std::to_string(kMaxSplitAttempts) +
      " attempts; using " + std::to_string(attempt.parts.size()) + " parts" });
  }
  if (attempt.parts.empty()) attempt.parts.push_back(std::string());

  for (size_t line_no : attempt.oversize_lines) {
    warnings.push_back({ PackWarning::Kind::OversizeLine,
      "line " + std::to_string(line_no) + " of " + path + " exceeds chunk size " +
      std::to_string(limit) + "; emitting oversize part" });
  }

  const size_t total = attempt.parts.size();
  std::vector<RenderedBlock> blocks;
  blocks.reserve(total);
  for (size_t i = 0; i < total; ++i) {
    auto b = make_part_block(tok_, f, file_index, i + 1, total, attempt.parts[i], escape_xml_);
    // Converged splits already reported their oversize lines.
    if (!converged && b.tokens > limit) {
      warnings.push_back({ PackWarning::Kind::OversizePart,
        "file " + path + " part " + std::to_string(i + 1) + "/" + std::to_string(total) +
        " has " + std::to_string(b.tokens) + " tokens, over chunk size " + std::to_string(limit) });
    }
    blocks.push_back(std::move(b));
  }
  return blocks;
}

PackResult ChunkPacker::pack(const std::vector<FileContent>& files, size_t limit) const {
  PackResult r;
  PackState state(limit);
  r.metas.reserve(files.size());

  for (size_t i = 0; i < files.size(); ++i) {
    const auto& f = files[i];
    auto whole = make_file_block(tok_, f, i, escape_xml_);
    if (limit == 0 || whole.tokens <= limit) {
      r.metas.push_back(FileMeta{ i, slash_path(f.path), whole.tokens, 1 });
      state.push(std::move(whole));
      continue;
    }

    auto parts = split_file(f, i, limit, r.warnings);
    FileMeta m{ i, slash_path(f.path), 0, parts.size() };
    for (auto& p : parts) {
      m.tokens += p.tokens;
      state.push(std::move(p));
    }
    r.metas.push_back(std::move(m));
  }

  r.bodies = state.finish();
  return r;
}
