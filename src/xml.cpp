#include "xml.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

static std::string escape_chars(const std::string& s, bool quotes) {
  std::string out;
  out.reserve(s.size() + s.size() / 8);
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': if (quotes) out += "&quot;"; else out += c; break;
      case '\'': if (quotes) out += "&apos;"; else out += c; break;
      default: out += c;
    }
  }
  return out;
}

std::string escape_text(const std::string& s) { return escape_chars(s, false); }
std::string escape_attr(const std::string& s) { return escape_chars(s, true); }

std::string maybe_escape_text(const std::string& s, bool escape) {
  return escape ? escape_text(s) : s;
}

std::string maybe_escape_attr(const std::string& s, bool escape) {
  if (escape || s.find_first_of("\"<>&") != std::string::npos) return escape_attr(s);
  return s;
}

std::string slash_path(const std::string& path) {
  std::string s = path;
  std::replace(s.begin(), s.end(), '\\', '/');
  return s;
}

std::string file_name_of(const std::string& path) {
  return fs::path(slash_path(path)).filename().generic_string();
}

std::string folder_of(const std::string& path) {
  auto folder = fs::path(slash_path(path)).parent_path().generic_string();
  return folder.empty() ? "." : folder;
}
