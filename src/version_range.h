#pragma once

#include "semver.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xpm {

// npm-style range: comparator sets joined by "||", each a whitespace-separated AND of
// comparators. Caret, tilde, x-range, partial and hyphen forms are desugared into
// plain comparators at parse time.
class version_range {
 public:
  enum class op { lt, le, gt, ge, eq };

  struct comparator {
    op kind;
    semver::version<> bound;
    int major;
    int minor;
    int patch;
    bool prerelease;
  };
  using comparator_set = std::vector<comparator>;

  // nullopt if text is not a range (for example a dist-tag like "latest").
  static std::optional<version_range> parse(std::string_view text);

  // Prerelease versions only match a set that names a prerelease of the same
  // major.minor.patch.
  bool satisfied_by(std::string_view version) const;

  std::vector<comparator_set> const &sets() const { return sets_; }

 private:
  std::vector<comparator_set> sets_;
};

// Greatest version in candidates satisfying range; unparseable candidates are ignored.
std::optional<std::string> version_max_satisfying(std::vector<std::string> const &candidates,
                                                  version_range const &range);

// "1.2.3", "=1.2.3", "v1.2.3-beta.1" are exact; "^1.2.3", "1.2", "latest" are not.
bool version_is_exact(std::string_view text);

// Strips a leading "=" or "v" from an exact version.
std::string version_strip_exact(std::string_view text);

}  // namespace xpm
