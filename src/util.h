#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace xpm {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

// Convert bytes to lowercase hex string
std::string util_bytes_to_hex(void const *data, size_t length);

// Convert hex string to bytes (case-insensitive)
std::vector<unsigned char> util_hex_to_bytes(std::string const &hex);

// Convert single hex character to value (0-15). Returns -1 if invalid.
int util_hex_char_to_int(char c);

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as bytes.
// Throws std::runtime_error if file cannot be opened or read.
std::vector<unsigned char> util_load_file(std::filesystem::path const &path);

// Same as util_load_file, returned as text.
std::string util_load_text_file(std::filesystem::path const &path);

// Write contents to a sibling temp file, then rename over path.
void util_write_file_atomic(std::filesystem::path const &path, std::string_view contents);

// Human-readable byte formatter (B, KB, MB, GB, TB). B uses integer form, higher
// units use two decimal places (e.g., 1536 -> "1.50KB").
std::string util_format_bytes(std::uint64_t bytes);

// Directory/file stem used for a package version everywhere on disk:
// "@scope/pkg", "1.0.0" -> "@scope+pkg@1.0.0"
std::string util_package_store_name(std::string_view name, std::string_view version);

// <virtual_store>/<store name>/node_modules/<name>
std::filesystem::path util_virtual_store_package_dir(std::filesystem::path const &virtual_store,
                                                     std::string_view name,
                                                     std::string_view version);

// Replace whatever sits at link_path with a symlink to target, expressed relative
// to link_path's parent. Creates missing parent directories.
void util_replace_with_relative_symlink(std::filesystem::path const &target,
                                        std::filesystem::path const &link_path);

class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace xpm
