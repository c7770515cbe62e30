#pragma once
#include "assembler.hpp"
#include "file_content.hpp"
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

// Writes `text` to stdout as-is and flushes. Throws std::runtime_error when
// the stream fails (closed pipe and the like).
void write_stdout(const std::string& text);

// Pipes `text` into the first available clipboard tool (pbcopy, wl-copy,
// xclip, xsel). Throws std::runtime_error when none succeeds.
void copy_to_clipboard(const std::string& text);

// Receives one finished snippet at a time.
using ChunkSink = std::function<void(size_t idx, const std::string& xml)>;

// Interactive loop over finished chunks: Enter = next (wrapping), a number
// jumps, 'q' quits. Prompts and errors go to `ui`. Never re-packs.
void stream_chunks(const std::vector<RenderedChunk>& chunks, const ChunkSink& deliver,
                   std::istream& in, std::ostream& ui);

// Multi-step loop: each request is a file id or a glob over the slash paths of
// `files`; every selected file is rendered on its own and handed to `deliver`
// with its id. 'q' or end of input quits. Prompts and errors go to `ui`.
void serve_files(const std::vector<FileContent>& files, bool escape_xml, const ChunkSink& deliver,
                 std::istream& in, std::ostream& ui);
