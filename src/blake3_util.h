#pragma once

#include "util.h"

#include <array>
#include <cstddef>
#include <memory>
#include <string>

namespace xpm {

using blake3_t = std::array<unsigned char, 32>;
blake3_t blake3_hash(void const *data, size_t length);

// Incremental hasher for content too large to hold in memory.
class blake3_stream : unmovable {
 public:
  blake3_stream();
  ~blake3_stream();

  void update(void const *data, size_t length);
  blake3_t finish();
  std::string finish_hex();

 private:
  struct impl;
  std::unique_ptr<impl> m;
};

}  // namespace xpm
