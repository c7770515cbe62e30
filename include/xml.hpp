#pragma once
#include <string>

// Escapes & < > for element text.
std::string escape_text(const std::string& s);

// Escapes & < > " ' for attribute values.
std::string escape_attr(const std::string& s);

// Body text: escaped when `escape` is set, raw otherwise.
std::string maybe_escape_text(const std::string& s, bool escape);

// Attribute values are escaped when `escape` is set, and also whenever the
// raw value would break out of its quotes or the tag.
std::string maybe_escape_attr(const std::string& s, bool escape);

// File name, parent folder ("." when empty) and slash form of a path.
std::string file_name_of(const std::string& path);
std::string folder_of(const std::string& path);
std::string slash_path(const std::string& path);
