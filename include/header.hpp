#pragma once
#include "git_info.hpp"
#include "packer.hpp"
#include <optional>
#include <string>
#include <vector>

struct HeaderOptions {
  bool escape_xml = false;
  std::string generated_at;          // RFC3339; empty means "now"
  bool include_git = false;
  std::optional<GitInfo> git;        // nullopt with include_git renders a placeholder
};

// RFC3339 UTC timestamp with seconds precision, e.g. 2024-01-02T03:04:05Z.
std::string utc_timestamp_now();

// <shared-context-header ...> with the file map, instructions and optional
// git section. Advertises `total_chunks`, so it is rebuilt when that changes.
std::string make_header(size_t total_chunks, size_t limit,
                        const std::vector<FileMeta>& files,
                        const HeaderOptions& opts);
