#include "extract.h"
#include "tui.h"
#include "util.h"

#include "archive.h"
#include "archive_entry.h"

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace xpm {
namespace {

constexpr std::size_t kReadBlock{ 64 * 1024 };
constexpr std::size_t kDataChunk{ 256 * 1024 };

struct archive_reader : unmovable {
  archive_reader() : handle(archive_read_new()) {
    if (!handle) { throw std::runtime_error("extract: archive_read_new failed"); }
    archive_read_support_filter_all(handle);
    archive_read_support_format_all(handle);
  }

  ~archive_reader() {
    if (handle) {
      archive_read_close(handle);
      archive_read_free(handle);
    }
  }

  archive *handle{ nullptr };
};

// Feeds libarchive from an istream one block at a time.
struct stream_source {
  std::istream &in;
  std::vector<char> block;
};

la_ssize_t stream_read(archive *a, void *client_data, void const **buffer) {
  auto *src{ static_cast<stream_source *>(client_data) };
  src->in.read(src->block.data(), static_cast<std::streamsize>(src->block.size()));
  if (src->in.bad()) {
    archive_set_error(a, EIO, "input stream read failed");
    return -1;
  }
  *buffer = src->block.data();
  return static_cast<la_ssize_t>(src->in.gcount());
}

bool is_safe_entry_path(std::string_view path) {
  if (path.empty() || path.front() == '/') { return false; }

  std::size_t start{ 0 };
  while (start <= path.size()) {
    auto const end{ path.find('/', start) };
    auto const component{ path.substr(start,
                                      end == std::string_view::npos ? std::string_view::npos
                                                                    : end - start) };
    if (component == "..") { return false; }
    if (end == std::string_view::npos) { break; }
    start = end + 1;
  }
  return true;
}

}  // namespace

std::optional<std::string> extract_strip_components(std::string_view path,
                                                    int strip_count) {
  if (strip_count <= 0) {
    if (path.empty()) { return std::nullopt; }
    return std::string(path);
  }

  std::size_t p{ 0 };
  int components_stripped{ 0 };

  // Skip leading slashes
  while (p < path.size() && path[p] == '/') { ++p; }

  while (components_stripped < strip_count) {
    if (p >= path.size()) { return std::nullopt; }
    if (path[p] == '/') {
      ++components_stripped;
      // Skip multiple consecutive slashes
      while (p < path.size() && path[p] == '/') { ++p; }
    } else {
      ++p;
    }
  }

  if (p >= path.size()) { return std::nullopt; }
  return std::string(path.substr(p));
}

package_index extract_to_store(std::istream &archive_in, content_store &store) {
  archive_reader reader;
  stream_source src{ .in = archive_in, .block = std::vector<char>(kReadBlock) };

  if (archive_read_open(reader.handle, &src, nullptr, stream_read, nullptr) !=
      ARCHIVE_OK) {
    throw std::runtime_error(std::string("extract: failed to open archive: ") +
                             archive_error_string(reader.handle));
  }

  package_index index;
  std::vector<char> buffer(kDataChunk);
  archive_entry *entry{ nullptr };

  while (true) {
    int const r{ archive_read_next_header(reader.handle, &entry) };
    if (r == ARCHIVE_EOF) { break; }
    if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
      throw std::runtime_error(std::string("extract: failed to read archive header: ") +
                               archive_error_string(reader.handle));
    }

    char const *entry_path{ archive_entry_pathname(entry) };
    if (!entry_path) { throw std::runtime_error("extract: archive entry has null pathname"); }

    if (archive_entry_filetype(entry) != AE_IFREG || archive_entry_hardlink(entry)) {
      archive_read_data_skip(reader.handle);
      continue;
    }

    if (!is_safe_entry_path(entry_path)) {
      tui::warn("extract: skipping unsafe archive path '%s'", entry_path);
      archive_read_data_skip(reader.handle);
      continue;
    }

    auto writer{ store.begin_blob() };

    la_ssize_t bytes_read{ 0 };
    while ((bytes_read = archive_read_data(reader.handle, buffer.data(), buffer.size())) >
           0) {
      writer->write(buffer.data(), static_cast<std::size_t>(bytes_read));
    }

    if (bytes_read < 0) {
      throw std::runtime_error(std::string("extract: failed to read entry data for ") +
                               entry_path + ": " + archive_error_string(reader.handle));
    }

    index[entry_path] = writer->commit();
  }

  tui::debug("extract: stored %zu file(s)", index.size());
  return index;
}

package_index extract_to_store(std::filesystem::path const &archive_path,
                               content_store &store) {
  std::ifstream in{ archive_path, std::ios::binary };
  if (!in) {
    throw std::runtime_error("extract: failed to open " + archive_path.string());
  }
  return extract_to_store(in, store);
}

}  // namespace xpm
