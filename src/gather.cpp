#include "gather.hpp"
#include "xml.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using std::string;
namespace fs = std::filesystem;

static string join_patterns(const std::vector<string>& pats) {
  string s;
  for (auto& p : pats) {
    if (!s.empty()) s += ", ";
    s += "\"" + p + "\"";
  }
  return s;
}

InvalidExcludePatterns::InvalidExcludePatterns(const std::vector<string>& pats)
  : std::runtime_error("every --exclude pattern was invalid: [" + join_patterns(pats) + "]"),
    patterns(pats) {}

static string normalize(const fs::path& p) {
  auto s = p.lexically_normal().generic_string();
  if (s.size() > 1 && s.back() == '/') s.pop_back();
  return s;
}

namespace {
// One compiled .gitignore line. `base` is the directory holding the file.
struct IgnoreRule {
  fs::path base;
  std::unique_ptr<RE2> re;
  bool negate = false;
  bool dir_only = false;
};

// Rules of every .gitignore seen while walking, parents before children.
// A rule only applies below its own directory; the last match wins.
class GitignoreRules {
public:
  void load(const fs::path& dir) {
    std::ifstream in(dir / ".gitignore");
    string line;
    while (std::getline(in, line)) add(dir, line);
  }

  bool ignored(const fs::path& path, bool is_dir) const {
    bool result = false;
    for (auto& r : rules_) {
      if (r.dir_only && !is_dir) continue;
      auto rel = path.lexically_relative(r.base);
      if (rel.empty() || rel.native().rfind("..", 0) == 0) continue;
      if (RE2::FullMatch(rel.generic_string(), *r.re)) result = !r.negate;
    }
    return result;
  }

private:
  void add(const fs::path& base, string pat) {
    while (!pat.empty() && (pat.back() == '\r' || pat.back() == ' ' || pat.back() == '\t'))
      pat.pop_back();
    if (pat.empty() || pat[0] == '#') return;

    IgnoreRule r;
    r.base = base;
    if (pat[0] == '!') { r.negate = true; pat.erase(0, 1); }
    else if (pat.rfind("\\!", 0) == 0 || pat.rfind("\\#", 0) == 0) pat.erase(0, 1);
    while (!pat.empty() && pat.back() == '/') { r.dir_only = true; pat.pop_back(); }
    if (pat.empty()) return;

    // A slash anywhere but the end anchors the pattern to `base`.
    const bool anchored = pat.find('/') != string::npos;
    if (pat[0] == '/') pat.erase(0, 1);
    string re;
    if (!glob_to_regex(anchored ? pat : "**/" + pat, re, false)) return;
    r.re.reset(new RE2(re));
    if (!r.re->ok()) return;
    rules_.push_back(std::move(r));
  }

  std::vector<IgnoreRule> rules_;
};

bool has_glob_chars(const string& s) {
  return s.find_first_of("*?[{") != string::npos;
}
}

static void walk_dir(const fs::path& root, std::vector<string>& out) {
  GitignoreRules rules;
  rules.load(root);
  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    std::cerr << "warning: could not walk " << root.generic_string() << ": " << ec.message() << "\n";
    return;
  }
  const fs::recursive_directory_iterator end;
  while (it != end) {
    const fs::path path = it->path();
    const auto name = path.filename().string();
    std::error_code type_ec;
    const bool is_dir = it->is_directory(type_ec);
    if ((!name.empty() && name[0] == '.') || rules.ignored(path, is_dir)) {
      if (is_dir) it.disable_recursion_pending();
    } else if (is_dir) {
      rules.load(path);
    } else if (it->is_regular_file(type_ec)) {
      out.push_back(normalize(path));
    }

    it.increment(ec);
    if (ec) {
      std::cerr << "warning: could not process entry in " << root.generic_string() << ": " << ec.message() << "\n";
      ec.clear();
      // Leave the directory that failed and carry on with the rest.
      if (it != end) {
        it.pop(ec);
        if (ec) {
          std::cerr << "warning: giving up on " << root.generic_string() << ": " << ec.message() << "\n";
          return;
        }
      }
    }
  }
}

// Matches `pattern` against the tree under its literal prefix. Matching
// directories are walked like directory arguments. Returns false when nothing
// matched.
static bool expand_glob(const string& pattern, std::vector<string>& out) {
  const fs::path pat = fs::path(pattern).lexically_normal();
  fs::path prefix;
  size_t rest = 0;
  for (auto& comp : pat) {
    if (rest == 0 && !has_glob_chars(comp.string())) prefix /= comp;
    else ++rest;
  }
  if (rest == 0) return false;
  if (prefix.empty()) prefix = ".";

  string re_src;
  if (!glob_to_regex(pat.generic_string(), re_src, false)) return false;
  RE2 re(re_src);
  if (!re.ok()) return false;
  const bool any_depth = pattern.find("**") != string::npos;

  std::error_code ec;
  fs::recursive_directory_iterator it(prefix, fs::directory_options::skip_permission_denied, ec);
  if (ec) return false;
  bool matched = false;
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) break;
    std::error_code type_ec;
    const bool is_dir = it->is_directory(type_ec);
    if (RE2::FullMatch(normalize(it->path()), re)) {
      matched = true;
      if (is_dir) {
        walk_dir(it->path(), out);
        it.disable_recursion_pending();
        continue;
      }
      if (it->is_regular_file(type_ec)) out.push_back(normalize(it->path()));
    }
    if (is_dir && !any_depth && (size_t)it.depth() + 1 >= rest) it.disable_recursion_pending();
  }
  return matched;
}

std::vector<string> expand_inputs(const std::vector<string>& paths) {
  std::vector<string> out;
  for (auto& raw : paths) {
    const string slashed = slash_path(raw);
    fs::path p(slashed);
    std::error_code ec;
    if (fs::is_directory(p, ec)) walk_dir(p, out);
    else if (fs::exists(p, ec) || !has_glob_chars(slashed) || !expand_glob(slashed, out))
      out.push_back(normalize(p));
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

bool glob_to_regex(const string& glob, string& re, bool star_crosses_slash) {
  const char* star = star_crosses_slash ? ".*" : "[^/]*";
  re.clear();
  bool in_braces = false;
  for (size_t i = 0; i < glob.size(); ++i) {
    char c = glob[i];
    switch (c) {
      case '*':
        if (i + 1 < glob.size() && glob[i + 1] == '*') {
          ++i;
          if (i + 1 < glob.size() && glob[i + 1] == '/') {
            ++i;
            re += "(?:.*/)?";
          } else {
            re += ".*";
          }
        } else {
          re += star;
        }
        break;
      case '?':
        re += star_crosses_slash ? "." : "[^/]";
        break;
      case '[': {
        size_t j = i + 1;
        string cls = "[";
        if (j < glob.size() && (glob[j] == '!' || glob[j] == '^')) { cls += '^'; ++j; }
        if (j < glob.size() && glob[j] == ']') { cls += "\\]"; ++j; }
        while (j < glob.size() && glob[j] != ']') {
          if (glob[j] == '\\' || glob[j] == '[') cls += '\\';
          cls += glob[j++];
        }
        if (j >= glob.size()) return false;  // unclosed class
        re += cls + "]";
        i = j;
        break;
      }
      case '{':
        if (in_braces) return false;  // no nesting
        in_braces = true;
        re += "(?:";
        break;
      case '}':
        if (!in_braces) return false;
        in_braces = false;
        re += ")";
        break;
      case ',':
        re += in_braces ? "|" : ",";
        break;
      default:
        re += RE2::QuoteMeta(string(1, c));
    }
  }
  return !in_braces;
}

struct ExcludeFilter::Impl {
  std::vector<std::unique_ptr<RE2>> res;
  fs::path root;
};

ExcludeFilter::ExcludeFilter(const std::vector<string>& globs, const string& root) : impl_(new Impl) {
  std::error_code ec;
  impl_->root = root.empty() ? fs::current_path(ec) : fs::path(root);
  std::vector<string> normalized;
  for (auto& g : globs) {
    string pat = slash_path(g);
    normalized.push_back(pat);
    string re;
    if (!glob_to_regex(pat, re)) continue;
    std::unique_ptr<RE2> compiled(new RE2(re));
    if (!compiled->ok()) continue;
    impl_->res.push_back(std::move(compiled));
  }
  if (!globs.empty() && impl_->res.empty()) throw InvalidExcludePatterns(normalized);
}

ExcludeFilter::~ExcludeFilter() = default;

size_t ExcludeFilter::size() const { return impl_->res.size(); }

bool ExcludeFilter::excluded(const string& path) const {
  if (impl_->res.empty()) return false;
  std::error_code ec;
  fs::path abs = fs::absolute(fs::path(path), ec);
  const string abs_s = ec ? slash_path(path) : normalize(abs);
  string rel_s = slash_path(path);
  if (!ec && !impl_->root.empty()) {
    auto rel = abs.lexically_normal().lexically_relative(impl_->root.lexically_normal());
    if (!rel.empty() && rel.native().rfind("..", 0) != 0) rel_s = rel.generic_string();
  }
  for (auto& re : impl_->res) {
    if (RE2::FullMatch(rel_s, *re) || RE2::FullMatch(abs_s, *re)) return true;
  }
  return false;
}

std::vector<string> ExcludeFilter::apply(const std::vector<string>& paths) const {
  std::vector<string> kept;
  kept.reserve(paths.size());
  for (auto& p : paths)
    if (!excluded(p)) kept.push_back(p);
  return kept;
}

bool looks_binary(const string& data) {
  const size_t n = std::min<size_t>(data.size(), 4096);
  const bool truncated = data.size() > n;
  size_t i = 0;
  while (i < n) {
    unsigned char c = (unsigned char)data[i];
    if (c == 0) return true;
    size_t len;
    if (c < 0x80) len = 1;
    else if ((c & 0xE0) == 0xC0 && c >= 0xC2) len = 2;
    else if ((c & 0xF0) == 0xE0) len = 3;
    else if ((c & 0xF8) == 0xF0 && c <= 0xF4) len = 4;
    else return true;
    if (i + len > n) return !truncated;  // sequence cut by the sample window
    for (size_t k = 1; k < len; ++k) {
      if (((unsigned char)data[i + k] & 0xC0) != 0x80) return true;
    }
    i += len;
  }
  return false;
}

std::vector<FileContent> collect_file_data(const std::vector<string>& paths, uint64_t max_size) {
  std::vector<FileContent> out;
  for (auto& path : paths) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
      std::cerr << "warning: could not read " << path << ": " << ec.message() << ". Skipping.\n";
      continue;
    }
    if (size > max_size) {
      std::cerr << "warning: " << path << " exceeds " << max_size << " bytes. Skipping.\n";
      continue;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      std::cerr << "warning: could not open " << path << ". Skipping.\n";
      continue;
    }
    string data;
    {
      std::ostringstream ss; ss << in.rdbuf(); data = ss.str();
    }
    if (looks_binary(data)) {
      std::cerr << "warning: " << path << " appears to be a binary file. Skipping.\n";
      continue;
    }
    string folder = fs::path(path).parent_path().generic_string();
    out.push_back(FileContent{ folder, slash_path(path), std::move(data) });
  }
  std::stable_sort(out.begin(), out.end(), [](const FileContent& a, const FileContent& b) {
    if (a.folder != b.folder) return a.folder < b.folder;
    return a.path < b.path;
  });
  return out;
}
