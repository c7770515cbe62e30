#pragma once
#include <cstdint>
#include <set>
#include <string>
#include <vector>

struct Args {
  std::vector<std::string> paths;    // defaults to "."
  bool to_stdout = false;
  bool no_clipboard = false;
  uint64_t max_size = 1048576;
  std::vector<std::string> exclude;
  uint64_t model_context = 0;        // 0: no check
  uint64_t chunk_size = 0;           // 0: one unchunked output
  long long chunk_index = -1;        // -1: unset
  bool escape_xml = false;
  bool git_info = false;
  bool interactive = false;
  bool multi_step = false;           // header only, then serve files on request
  std::string tokenizer = "regex";
  std::string tokenizer_model;
  std::string config_path;

  std::set<std::string> given;       // long names of flags set on the command line
};

// Exits with status 1 on usage errors, 0 after --help.
Args parse_cli(int argc, char** argv);
