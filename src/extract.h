#pragma once

#include "content_store.h"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace xpm {

// Stream a gzip-compressed tarball into the store. Every regular file becomes one
// blob; the returned index maps its archive path to that blob's hash. Directories,
// links and device entries are skipped, as is any path that is absolute or climbs
// out with "..". Throws std::runtime_error on corrupt input.
package_index extract_to_store(std::istream &archive, content_store &store);
package_index extract_to_store(std::filesystem::path const &archive_path,
                               content_store &store);

// "package/lib/a.js", 1 -> "lib/a.js". nullopt when nothing is left.
std::optional<std::string> extract_strip_components(std::string_view path, int strip_count);

}  // namespace xpm
