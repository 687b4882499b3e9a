#include "content_store.h"

#include "blake3_util.h"
#include "platform.h"
#include "tui.h"

#include "picojson.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <mutex>
#include <random>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace xpm {

namespace {

constexpr std::size_t kStreamChunk{ 256 * 1024 };

bool is_hex_hash(std::string_view hash) {
  return hash.size() > 4 && std::all_of(hash.begin(), hash.end(), [](char c) {
           return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
         });
}

}  // namespace

struct content_store::impl {
  path root_;
  std::mutex commit_mutex_;  // guards exists-check + rename into files/

  path files_dir() const { return root_ / "files"; }
  path indices_dir() const { return root_ / "indices"; }
  path temp_dir() const { return root_ / "temp"; }
  path tarballs_dir() const { return root_ / "tarballs"; }
};

struct content_store::writer::impl {
  content_store &store_;
  path temp_path_;
  file_ptr_t file_;
  blake3_stream hasher_;
  bool committed_{ false };

  impl(content_store &store, path temp_path)
      : store_{ store }, temp_path_{ std::move(temp_path) } {}
};

content_store::writer::writer(content_store &store, path temp_path)
    : m{ std::make_unique<impl>(store, std::move(temp_path)) } {
  m->file_ = util_open_file(m->temp_path_, "wbx");
  if (!m->file_) {
    throw std::system_error(errno,
                            std::system_category(),
                            "content_store: failed to create staging file " +
                                m->temp_path_.string());
  }
}

content_store::writer::~writer() {
  if (m->committed_) { return; }
  m->file_.reset();
  std::error_code ec;
  std::filesystem::remove(m->temp_path_, ec);
}

void content_store::writer::write(void const *data, std::size_t size) {
  if (m->committed_) {
    throw std::logic_error("content_store: write after commit");
  }
  if (size == 0) { return; }

  m->hasher_.update(data, size);
  if (std::fwrite(data, 1, size, m->file_.get()) != size) {
    throw std::runtime_error("content_store: short write to " + m->temp_path_.string());
  }
}

content_hash content_store::writer::commit() {
  if (m->committed_) { throw std::logic_error("content_store: commit called twice"); }

  if (std::fflush(m->file_.get()) != 0) {
    throw std::runtime_error("content_store: flush failed for " + m->temp_path_.string());
  }
  m->file_.reset();

  auto hash{ m->store_.commit_staged(m->temp_path_, m->hasher_.finish_hex()) };
  m->committed_ = true;
  return hash;
}

content_store::content_store(path root) : m{ std::make_unique<impl>() } {
  if (root.empty()) { throw std::invalid_argument("content_store: root is empty"); }
  m->root_ = std::filesystem::absolute(root).lexically_normal();

  for (auto const &dir : { m->files_dir(), m->indices_dir(), m->temp_dir() }) {
    std::filesystem::create_directories(dir);
  }
}

content_store::~content_store() = default;

content_store::path const &content_store::root() const { return m->root_; }
content_store::path content_store::files_dir() const { return m->files_dir(); }
content_store::path content_store::indices_dir() const { return m->indices_dir(); }
content_store::path content_store::temp_dir() const { return m->temp_dir(); }
content_store::path content_store::tarballs_dir() const { return m->tarballs_dir(); }

content_store::writer::ptr_t content_store::begin_blob() {
  static thread_local std::mt19937_64 rng{ std::random_device{}() };

  char name[17]{};
  std::snprintf(name,
                sizeof(name),
                "%016llx",
                static_cast<unsigned long long>(rng()));
  return writer::ptr_t{ new writer{ *this, m->temp_dir() / name } };
}

content_hash content_store::store_stream(std::istream &in) {
  auto w{ begin_blob() };

  std::vector<char> buffer(kStreamChunk);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto const got{ in.gcount() };
    if (got > 0) { w->write(buffer.data(), static_cast<std::size_t>(got)); }
  }
  if (in.bad()) { throw std::runtime_error("content_store: input stream failed"); }

  return w->commit();
}

content_hash content_store::store_bytes(std::string_view bytes) {
  auto w{ begin_blob() };
  w->write(bytes.data(), bytes.size());
  return w->commit();
}

bool content_store::contains(content_hash const &hash) const {
  if (!is_hex_hash(hash)) { return false; }
  return std::filesystem::exists(blob_path(hash));
}

content_store::path content_store::blob_path(content_hash const &hash) const {
  if (!is_hex_hash(hash)) {
    throw std::invalid_argument("content_store: malformed hash '" + hash + "'");
  }
  return m->files_dir() / hash.substr(0, 2) / hash.substr(2, 2) / hash.substr(4);
}

content_hash content_store::commit_staged(path const &temp_path, content_hash hash) {
  auto const dest{ blob_path(hash) };

  std::lock_guard lock{ m->commit_mutex_ };

  if (std::filesystem::exists(dest)) {  // identical bytes already stored
    std::error_code ec;
    std::filesystem::remove(temp_path, ec);
    return hash;
  }

  std::filesystem::create_directories(dest.parent_path());
  platform::atomic_rename(temp_path, dest);
  platform::make_read_only(dest);
  return hash;
}

content_store::path content_store::index_path(std::string_view name,
                                              std::string_view version) const {
  return m->indices_dir() / (util_package_store_name(name, version) + ".json");
}

void content_store::store_index(std::string_view name,
                                std::string_view version,
                                package_index const &index) {
  picojson::object obj;
  for (auto const &[file, hash] : index) { obj.emplace(file, picojson::value(hash)); }
  util_write_file_atomic(index_path(name, version), picojson::value(obj).serialize());
}

std::optional<package_index> content_store::get_index(std::string_view name,
                                                      std::string_view version) const {
  auto const p{ index_path(name, version) };
  if (!std::filesystem::exists(p)) { return std::nullopt; }

  picojson::value root;
  if (std::string const err{ picojson::parse(root, util_load_text_file(p)) }; !err.empty()) {
    throw std::runtime_error("content_store: malformed index " + p.string() + ": " + err);
  }

  if (!root.is<picojson::object>()) {
    throw std::runtime_error("content_store: index is not an object: " + p.string());
  }

  package_index index;
  for (auto const &[file, hash] : root.get<picojson::object>()) {
    if (!hash.is<std::string>()) {
      throw std::runtime_error("content_store: index entry '" + file +
                               "' is not a string in " + p.string());
    }
    index.emplace(file, hash.get<std::string>());
  }

  // An index whose blobs were pruned from files/ cannot be materialized.
  for (auto const &[file, hash] : index) {
    if (!contains(hash)) {
      tui::warn("content_store: index %s references missing blob %s, ignoring index",
                p.filename().c_str(),
                hash.c_str());
      return std::nullopt;
    }
  }

  return index;
}

}  // namespace xpm
