#pragma once

#include "util.h"

#include <cstddef>
#include <filesystem>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace xpm {

// Lowercase hex BLAKE3 digest of a blob's bytes.
using content_hash = std::string;

// Archive-relative path -> blob hash for one package version.
using package_index = std::map<std::string, content_hash>;

class content_store : unmovable {
 public:
  using path = std::filesystem::path;

  // Staged blob: bytes are hashed and written to temp/ as they arrive, then
  // committed into files/ under their hash. Discarded if never committed.
  class writer : unmovable {
   public:
    using ptr_t = std::unique_ptr<writer>;

    ~writer();

    void write(void const *data, std::size_t size);
    content_hash commit();

   private:
    friend class content_store;
    writer(content_store &store, path temp_path);

    struct impl;
    std::unique_ptr<impl> m;
  };

  explicit content_store(path root);
  ~content_store();

  path const &root() const;
  path files_dir() const;
  path indices_dir() const;
  path temp_dir() const;
  path tarballs_dir() const;

  writer::ptr_t begin_blob();
  content_hash store_stream(std::istream &in);
  content_hash store_bytes(std::string_view bytes);

  bool contains(content_hash const &hash) const;
  path blob_path(content_hash const &hash) const;  // files/<h0:2>/<h2:4>/<h4:>

  void store_index(std::string_view name,
                   std::string_view version,
                   package_index const &index);
  std::optional<package_index> get_index(std::string_view name,
                                         std::string_view version) const;
  path index_path(std::string_view name, std::string_view version) const;

 private:
  content_hash commit_staged(path const &temp_path, content_hash hash);

  struct impl;
  std::unique_ptr<impl> m;
};

}  // namespace xpm
