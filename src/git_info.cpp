#include "git_info.hpp"
#include <cstdio>
#include <sstream>

namespace {
// Runs `cmd` through the shell; false on launch failure or non-zero exit.
bool run_capture(const std::string& cmd, std::string& out) {
  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) return false;
  out.clear();
  char buf[4096];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), pipe)) > 0) out.append(buf, n);
  return pclose(pipe) == 0;
}

std::string shell_quote(const std::string& s) {
  std::string q = "'";
  for (char c : s) {
    if (c == '\'') q += "'\\''";
    else q += c;
  }
  q += "'";
  return q;
}

std::vector<std::string> non_empty_lines(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream in(s);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!line.empty()) out.push_back(line);
  }
  return out;
}
}

std::optional<GitInfo> collect_git_info(const std::string& dir, int max_commits) {
  const std::string git = "git -C " + shell_quote(dir) + " ";
  const std::string quiet = " 2>/dev/null";
  std::string out;

  GitInfo info;
  if (!run_capture(git + "rev-parse --abbrev-ref HEAD" + quiet, out)) return std::nullopt;
  auto branch = non_empty_lines(out);
  if (branch.empty()) return std::nullopt;
  info.branch = branch.front();

  if (!run_capture(git + "log -n " + std::to_string(max_commits) + " --pretty=format:%s" + quiet, out))
    return std::nullopt;
  info.commits = non_empty_lines(out);

  if (!run_capture(git + "diff --name-only HEAD" + quiet, out)) return std::nullopt;
  info.changed_paths = non_empty_lines(out);
  return info;
}
