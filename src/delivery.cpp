#include "delivery.hpp"
#include "gather.hpp"
#include "renderer.hpp"
#include "xml.hpp"
#include <re2/re2.h>
#include <cstdio>
#include <iostream>
#include <stdexcept>

void write_stdout(const std::string& text) {
  std::cout << text << std::flush;
  if (!std::cout) throw std::runtime_error("stdout: write failed");
}

static bool pipe_to(const std::string& cmd, const std::string& text) {
  FILE* pipe = popen(cmd.c_str(), "w");
  if (!pipe) return false;
  size_t n = fwrite(text.data(), 1, text.size(), pipe);
  int status = pclose(pipe);
  return n == text.size() && status == 0;
}

void copy_to_clipboard(const std::string& text) {
  static const char* tools[] = {
    "pbcopy 2>/dev/null",
    "wl-copy 2>/dev/null",
    "xclip -selection clipboard 2>/dev/null",
    "xsel --clipboard --input 2>/dev/null",
  };
  for (auto* t : tools) {
    if (pipe_to(t, text)) return;
  }
  throw std::runtime_error("clipboard: no working copy command (tried pbcopy, wl-copy, xclip, xsel)");
}

static bool parse_index(const std::string& s, size_t& out) {
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) return false;
  try {
    out = (size_t)std::stoull(s);
  } catch (const std::out_of_range&) {
    return false;
  }
  return true;
}

static std::string trim(const std::string& s) {
  auto a = s.find_first_not_of(" \t\r");
  auto b = s.find_last_not_of(" \t\r");
  return a == std::string::npos ? "" : s.substr(a, b - a + 1);
}

void stream_chunks(const std::vector<RenderedChunk>& chunks, const ChunkSink& deliver,
                   std::istream& in, std::ostream& ui) {
  if (chunks.empty()) return;
  const size_t total = chunks.size();
  size_t idx = 0;
  ui << "Streaming " << total << " chunks (0.." << total - 1 << ").\n";
  ui << "Commands: press Enter for next chunk, number to jump, or 'q' to quit.\n";
  bool moved = true;
  for (;;) {
    if (moved) deliver(idx, chunks[idx].xml);
    moved = true;
    ui << "Enter chunk # (0.." << total - 1 << ") or 'q' to quit: " << std::flush;

    std::string cmd;
    if (!std::getline(in, cmd)) break;
    cmd = trim(cmd);

    if (cmd == "q" || cmd == "Q") break;
    if (cmd.empty()) {
      idx = (idx + 1) % total;
      continue;
    }
    size_t next;
    if (!parse_index(cmd, next) || next >= total) {
      ui << "Invalid chunk: " << cmd << "\n";
      moved = false;
      continue;
    }
    idx = next;
  }
}

void serve_files(const std::vector<FileContent>& files, bool escape_xml, const ChunkSink& deliver,
                 std::istream& in, std::ostream& ui) {
  ui << "Commands: enter file ids, file paths, or glob patterns; type 'q' to quit.\n";
  for (;;) {
    ui << "Request file id or glob (or 'q' to quit): " << std::flush;
    std::string cmd;
    if (!std::getline(in, cmd)) break;
    cmd = trim(cmd);
    if (cmd == "q" || cmd == "Q") break;
    if (cmd.empty()) continue;

    std::vector<size_t> selected;
    size_t id;
    if (parse_index(cmd, id)) {
      if (id >= files.size()) {
        ui << "Invalid file id: " << cmd << "\n";
        continue;
      }
      selected.push_back(id);
    } else {
      std::string re_src;
      if (!glob_to_regex(slash_path(cmd), re_src)) {
        ui << "Invalid request: " << cmd << "\n";
        continue;
      }
      RE2 re(re_src);
      if (!re.ok()) {
        ui << "Invalid request: " << cmd << "\n";
        continue;
      }
      for (size_t i = 0; i < files.size(); ++i)
        if (RE2::FullMatch(slash_path(files[i].path), re)) selected.push_back(i);
      if (selected.empty()) {
        ui << "No files match pattern: " << cmd << "\n";
        continue;
      }
    }
    for (size_t i : selected) deliver(i, render_served_file(files[i], i, escape_xml));
  }
}
