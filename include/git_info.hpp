#pragma once
#include <optional>
#include <string>
#include <vector>

struct GitInfo {
  std::string branch;
  std::vector<std::string> commits;        // subjects, newest first
  std::vector<std::string> changed_paths;  // relative to the repository root
};

// Runs git in `dir`; nullopt when it is not a repository or git is missing.
std::optional<GitInfo> collect_git_info(const std::string& dir, int max_commits = 5);
