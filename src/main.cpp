#include "assembler.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "delivery.hpp"
#include "gather.hpp"
#include "git_info.hpp"
#include "tokenizer.hpp"

#include <iostream>

static void deliver(const Args& args, size_t idx, const std::string& xml, bool copy) {
  if (args.to_stdout) write_stdout(xml);
  if (copy && !args.no_clipboard) {
    copy_to_clipboard(xml);
    std::cerr << "Copied chunk " << idx << "\n";
  }
}

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);

  if (!args.config_path.empty()) {
    try {
      apply_config_file(args, args.config_path);
    } catch (const ConfigError& e) {
      std::cerr << "error: " << e.what() << "\n";
      return 2;
    }
  }
  apply_environment(args);

  if (args.chunk_index >= 0 && args.chunk_size == 0) {
    std::cerr << "error: --chunk-index requires --chunk-size\n";
    return 2;
  }

  try {
    const Tokenizer& tok = init_tokenizer(TokenizerConfig{ args.tokenizer, args.tokenizer_model });

    auto candidates = expand_inputs(args.paths);
    try {
      ExcludeFilter filter(args.exclude);
      candidates = filter.apply(candidates);
    } catch (const InvalidExcludePatterns& e) {
      std::cerr << "error: " << e.what() << "\n";
      return 2;
    }
    auto files = collect_file_data(candidates, args.max_size);

    AssemblyOptions opts;
    opts.escape_xml = args.escape_xml;
    opts.include_git = args.git_info;
    if (args.git_info) opts.git = collect_git_info(".");

    if (args.multi_step) {
      auto header = assemble_header_only(files, (size_t)args.chunk_size, opts, tok);
      for (auto& w : header.warnings) std::cerr << "warning: " << w.message << "\n";
      deliver(args, 0, header.chunks[0].xml, true);
      serve_files(files, args.escape_xml,
                  [&](size_t id, const std::string& xml) {
                    if (args.to_stdout) write_stdout(xml);
                    if (!args.no_clipboard) {
                      copy_to_clipboard(xml);
                      std::cerr << "Copied file id " << id << "\n";
                    }
                  },
                  std::cin, std::cerr);
      return 0;
    }

    auto result = assemble_chunks(files, (size_t)args.chunk_size, opts, tok);
    for (auto& w : result.warnings) std::cerr << "warning: " << w.message << "\n";
    const auto& chunks = result.chunks;

    long long copy_idx = args.chunk_index;
    if (copy_idx == -1 && !args.no_clipboard) copy_idx = 0;
    if (copy_idx >= (long long)chunks.size()) {
      std::cerr << "error: --chunk-index " << copy_idx << " out of range (0.."
                << chunks.size() - 1 << ")\n";
      return 3;
    }

    if (args.interactive) {
      stream_chunks(chunks,
                    [&](size_t idx, const std::string& xml) { deliver(args, idx, xml, true); },
                    std::cin, std::cerr);
      return 0;
    }

    size_t total_tokens = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
      deliver(args, i, chunks[i].xml, copy_idx == (long long)i);
      total_tokens += chunks[i].tokens;
    }

    std::cout << "OK " << files.size() << " files, " << total_tokens << " tokens, "
              << chunks.size() << (chunks.size() == 1 ? " chunk" : " chunks") << ", copied="
              << (copy_idx >= 0 && !args.no_clipboard ? std::to_string(copy_idx) : std::string("none"))
              << "\n";
    if (args.no_clipboard && !args.to_stdout)
      std::cerr << "Note: neither --stdout nor clipboard copy requested; nothing visible.\n";
    if (args.model_context > 0 && total_tokens > args.model_context)
      std::cerr << "warning: token count " << total_tokens << " exceeds model context limit "
                << args.model_context << "\n";
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
