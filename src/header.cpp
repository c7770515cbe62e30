#include "header.hpp"
#include "xml.hpp"
#include <ctime>
#include <sstream>

std::string utc_timestamp_now() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

static void write_git_section(std::ostringstream& out, const HeaderOptions& opts) {
  if (!opts.git) {
    out << "  <!-- git info unavailable -->\n";
    return;
  }
  const GitInfo& g = *opts.git;
  out << "  <git-info branch=\"" << maybe_escape_attr(g.branch, opts.escape_xml) << "\">\n";
  for (auto& c : g.commits)
    out << "    <commit>" << maybe_escape_text(c, opts.escape_xml) << "</commit>\n";
  out << "  </git-info>\n";
  out << "  <changed-files>\n";
  for (auto& p : g.changed_paths)
    out << "    <file path=\"" << maybe_escape_attr(p, opts.escape_xml) << "\"/>\n";
  out << "  </changed-files>\n";
}

std::string make_header(size_t total_chunks, size_t limit,
                        const std::vector<FileMeta>& files,
                        const HeaderOptions& opts) {
  const std::string ts = opts.generated_at.empty() ? utc_timestamp_now() : opts.generated_at;

  std::ostringstream out;
  out << "<shared-context-header version=\"1\" total-chunks=\"" << total_chunks
      << "\" chunk-size=\"" << limit << "\" generated-at=\"" << ts << "\">\n";
  out << "  <file-map total-files=\"" << files.size() << "\">\n";
  for (auto& f : files) {
    out << "    <file id=\"" << f.id << "\" path=\"" << maybe_escape_attr(f.path, opts.escape_xml)
        << "\" tokens=\"" << f.tokens << "\" parts=\"" << f.parts << "\"/>\n";
  }
  out << "  </file-map>\n";
  out << "  <instructions>\n"
      << "    You will receive " << total_chunks << " chunks (including this header). "
      << "Study these carefully, your understanding of the shared context is critical to your "
      << "ability to help the user with their task.\n"
      << "    Reassemble split files from their parts in file-map order. "
      << "Respond \"READY\" after the final chunk after you have read and understood the shared context.\n"
      << "  </instructions>\n";
  if (opts.include_git) write_git_section(out, opts);
  out << "</shared-context-header>\n";
  return out.str();
}
