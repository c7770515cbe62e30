#pragma once
#include "file_content.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Thrown when --exclude patterns were given and none of them compiled.
struct InvalidExcludePatterns : std::runtime_error {
  explicit InvalidExcludePatterns(const std::vector<std::string>& pats);
  std::vector<std::string> patterns;
};

// Directories are walked recursively, skipping hidden entries and whatever the
// .gitignore files met along the way exclude. An argument that names no
// existing path but contains glob characters is matched against the tree
// under its literal prefix; it is kept as given when nothing matches.
// Result is normalized, sorted and de-duplicated.
std::vector<std::string> expand_inputs(const std::vector<std::string>& paths);

// Glob to an anchored RE2 pattern: "**/" matches any depth, [..] and {a,b}
// are supported. '*' and '?' cross '/' unless `star_crosses_slash` is false.
// Returns false on malformed globs.
bool glob_to_regex(const std::string& glob, std::string& regex, bool star_crosses_slash = true);

class ExcludeFilter {
public:
  // Throws InvalidExcludePatterns when every pattern is invalid.
  explicit ExcludeFilter(const std::vector<std::string>& globs, const std::string& root = "");
  ~ExcludeFilter();

  // Matches against both the root-relative and the absolute slash path.
  bool excluded(const std::string& path) const;
  std::vector<std::string> apply(const std::vector<std::string>& paths) const;
  size_t size() const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// NUL bytes or invalid UTF-8 in the first 4096 bytes.
bool looks_binary(const std::string& data);

// Reads files, skipping (with a warning) oversize, binary and unreadable ones.
// Sorted by folder, then path.
std::vector<FileContent> collect_file_data(const std::vector<std::string>& paths, uint64_t max_size);
