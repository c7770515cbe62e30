#include "renderer.hpp"
#include "xml.hpp"

static std::string open_tag(const FileContent& f, bool escape_xml) {
  std::string s = "    <file-contents path=\"";
  s += maybe_escape_attr(slash_path(f.path), escape_xml);
  s += "\" name=\"";
  s += maybe_escape_attr(file_name_of(f.path), escape_xml);
  s += "\" folder=\"";
  s += maybe_escape_attr(folder_of(f.path), escape_xml);
  s += "\"";
  return s;
}

static const char* CLOSE_TAG = "    </file-contents>\n";

std::string render_file_block(const FileContent& f, bool escape_xml) {
  std::string s = open_tag(f, escape_xml);
  s += ">\n";
  s += maybe_escape_text(f.text, escape_xml);
  s += "\n";
  s += CLOSE_TAG;
  return s;
}

std::string render_part_block(const FileContent& f, size_t part, size_t total,
                              const std::string& lines, bool escape_xml) {
  std::string s = open_tag(f, escape_xml);
  s += " part=\"" + std::to_string(part) + "/" + std::to_string(total) + "\">\n";
  s += maybe_escape_text(lines, escape_xml);
  s += CLOSE_TAG;
  return s;
}

std::string render_served_file(const FileContent& f, size_t id, bool escape_xml) {
  std::string s = "<file-contents id=\"" + std::to_string(id) + "\" path=\"";
  s += maybe_escape_attr(slash_path(f.path), escape_xml);
  s += "\" name=\"";
  s += maybe_escape_attr(file_name_of(f.path), escape_xml);
  s += "\">\n";
  s += maybe_escape_text(f.text, escape_xml);
  s += "\n</file-contents>\n";
  return s;
}

RenderedBlock make_file_block(const Tokenizer& tok, const FileContent& f,
                              size_t file_index, bool escape_xml) {
  RenderedBlock b{ file_index, 1, 1, render_file_block(f, escape_xml), 0 };
  b.tokens = tok.count(b.xml);
  return b;
}

RenderedBlock make_part_block(const Tokenizer& tok, const FileContent& f, size_t file_index,
                              size_t part, size_t total, const std::string& lines, bool escape_xml) {
  RenderedBlock b{ file_index, part, total, render_part_block(f, part, total, lines, escape_xml), 0 };
  b.tokens = tok.count(b.xml);
  return b;
}
