#include "blake3_util.h"

#include <blake3.h>

namespace xpm {

blake3_t blake3_hash(void const *data, size_t length) {
  blake3_t digest;
  blake3_hasher hasher;

  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, length);
  blake3_hasher_finalize(&hasher, digest.data(), digest.size());
  return digest;
}

struct blake3_stream::impl {
  blake3_hasher hasher;
};

blake3_stream::blake3_stream() : m{ std::make_unique<impl>() } {
  blake3_hasher_init(&m->hasher);
}

blake3_stream::~blake3_stream() = default;

void blake3_stream::update(void const *data, size_t length) {
  blake3_hasher_update(&m->hasher, data, length);
}

blake3_t blake3_stream::finish() {
  blake3_t digest;
  blake3_hasher_finalize(&m->hasher, digest.data(), digest.size());
  return digest;
}

std::string blake3_stream::finish_hex() {
  auto const digest{ finish() };
  return util_bytes_to_hex(digest.data(), digest.size());
}

}  // namespace xpm
