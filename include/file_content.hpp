#pragma once
#include <string>

// One gathered source file. Paths are kept in generic (slash) form.
struct FileContent {
  std::string folder;
  std::string path;
  std::string text;
};
