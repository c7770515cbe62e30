#pragma once
#include "file_content.hpp"
#include "tokenizer.hpp"
#include <cstddef>
#include <string>

// One <file-contents> block: a whole file (part 1/1, no part attribute) or a
// contiguous run of its lines.
struct RenderedBlock {
  size_t file_index;   // index into the input file list
  size_t part_index;   // 1-based
  size_t parts_total;
  std::string xml;
  size_t tokens;
};

// <file-contents path=".." name=".." folder="..">\n{text}\n</file-contents>
std::string render_file_block(const FileContent& f, bool escape_xml);

// Same container with part="i/total"; `lines` keep their own newlines.
std::string render_part_block(const FileContent& f, size_t part, size_t total,
                              const std::string& lines, bool escape_xml);

// A file served on request: <file-contents id=".." path=".." name="..">, no
// indentation and no folder attribute.
std::string render_served_file(const FileContent& f, size_t id, bool escape_xml);

RenderedBlock make_file_block(const Tokenizer& tok, const FileContent& f,
                              size_t file_index, bool escape_xml);

RenderedBlock make_part_block(const Tokenizer& tok, const FileContent& f, size_t file_index,
                              size_t part, size_t total, const std::string& lines, bool escape_xml);
