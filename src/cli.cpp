#include "cli.hpp"
#include <iostream>
#include <cstdlib>
#include <stdexcept>

static const char* USAGE =
"ctxgather [paths...] [options]\n"
"  -c, --chunk-size N       token limit per chunk (0 = single unchunked output)\n"
"      --chunk-index N      chunk to copy to the clipboard (needs --chunk-size)\n"
"      --stdout             print output to stdout\n"
"      --no-clipboard       do not copy to the clipboard\n"
"      --max-size N         skip files larger than N bytes (default 1048576)\n"
"      --exclude GLOB       exclude matching paths (repeatable)\n"
"      --model-context N    warn when the total token count exceeds N\n"
"      --escape-xml         escape file contents\n"
"      --git-info           add branch, recent commits and changed files to the header\n"
"      --tokenizer KIND     regex (default) or llama\n"
"      --tokenizer-model P  GGUF model for the llama tokenizer\n"
"      --config PATH        JSON file with defaults\n"
"  -i, --interactive        step through chunks interactively\n"
"  -m, --multi-step         deliver only the header, then serve files by id or glob\n"
"  -h, --help               show this help\n";

static uint64_t to_number(const std::string& flag, const std::string& v) {
  if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos) {
    std::cerr << "Invalid value for " << flag << ": " << v << "\n" << USAGE;
    std::exit(1);
  }
  try {
    return std::stoull(v);
  } catch (const std::out_of_range&) {
    std::cerr << "Value out of range for " << flag << ": " << v << "\n";
    std::exit(1);
  }
}

Args parse_cli(int argc, char** argv) {
  Args a;
  int i = 1;
  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&](std::string& dst){
      if (i >= argc) { std::cerr << "Missing value after " << f << "\n"; std::exit(1); }
      dst = argv[i++];
    };
    auto number = [&]() {
      std::string v; next(v);
      return to_number(f, v);
    };

    if (f == "-h" || f == "--help") { std::cout << USAGE; std::exit(0); }
    else if (f == "--stdout") { a.to_stdout = true; a.given.insert("stdout"); }
    else if (f == "--no-clipboard") { a.no_clipboard = true; a.given.insert("no-clipboard"); }
    else if (f == "--max-size") { a.max_size = number(); a.given.insert("max-size"); }
    else if (f == "--exclude") { std::string v; next(v); a.exclude.push_back(v); a.given.insert("exclude"); }
    else if (f == "--model-context") { a.model_context = number(); a.given.insert("model-context"); }
    else if (f == "-c" || f == "--chunk-size") { a.chunk_size = number(); a.given.insert("chunk-size"); }
    else if (f == "--chunk-index") { a.chunk_index = (long long)number(); a.given.insert("chunk-index"); }
    else if (f == "--escape-xml") { a.escape_xml = true; a.given.insert("escape-xml"); }
    else if (f == "--git-info") { a.git_info = true; a.given.insert("git-info"); }
    else if (f == "-i" || f == "--interactive") { a.interactive = true; a.given.insert("interactive"); }
    else if (f == "-m" || f == "--multi-step") { a.multi_step = true; a.given.insert("multi-step"); }
    else if (f == "--tokenizer") { next(a.tokenizer); a.given.insert("tokenizer"); }
    else if (f == "--tokenizer-model") { next(a.tokenizer_model); a.given.insert("tokenizer-model"); }
    else if (f == "--config") { next(a.config_path); a.given.insert("config"); }
    else if (f == "--") { while (i < argc) a.paths.push_back(argv[i++]); }
    else if (f.size() > 1 && f[0] == '-') { std::cerr << "Unknown flag: " << f << "\n" << USAGE; std::exit(1); }
    else a.paths.push_back(f);
  }
  if (a.paths.empty()) a.paths.push_back(".");
  return a;
}
