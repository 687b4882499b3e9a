#include "version_range.h"

#include <cctype>
#include <cstdio>
#include <limits>

namespace xpm {

namespace {

constexpr int kWild{ -1 };

struct partial_version {
  int major{ kWild };
  int minor{ kWild };
  int patch{ kWild };
  std::string prerelease;

  bool full() const { return patch != kWild; }
};

std::string_view trim(std::string_view s) {
  auto const start{ s.find_first_not_of(" \t\n\r") };
  if (start == std::string_view::npos) { return {}; }
  return s.substr(start, s.find_last_not_of(" \t\n\r") - start + 1);
}

std::string_view strip_prefix(std::string_view s) {
  while (!s.empty() && (s.front() == '=' || s.front() == 'v' || s.front() == 'V')) {
    s.remove_prefix(1);
  }
  return trim(s);
}

bool is_wild(std::string_view part) { return part == "x" || part == "X" || part == "*"; }

std::optional<int> parse_number(std::string_view part) {
  if (part.empty() || part.size() > 9) { return std::nullopt; }
  int value{ 0 };
  for (char const c : part) {
    if (!std::isdigit(static_cast<unsigned char>(c))) { return std::nullopt; }
    value = value * 10 + (c - '0');
  }
  return value;
}

std::optional<partial_version> parse_partial(std::string_view text) {
  text = strip_prefix(text);
  if (text.empty()) { return partial_version{}; }

  if (auto const plus{ text.find('+') }; plus != std::string_view::npos) {
    text = text.substr(0, plus);
  }

  partial_version out;
  if (auto const dash{ text.find('-') }; dash != std::string_view::npos) {
    out.prerelease = std::string(text.substr(dash + 1));
    text = text.substr(0, dash);
    if (out.prerelease.empty()) { return std::nullopt; }
  }

  int *const slots[]{ &out.major, &out.minor, &out.patch };
  std::size_t slot{ 0 };
  bool wild_seen{ false };

  while (!text.empty()) {
    if (slot == 3) { return std::nullopt; }
    auto const dot{ text.find('.') };
    auto const part{ text.substr(0, dot) };

    if (is_wild(part)) {
      wild_seen = true;
    } else {
      auto const n{ parse_number(part) };
      if (!n) { return std::nullopt; }
      if (!wild_seen) { *slots[slot] = *n; }  // 1.x.3 means 1.x
    }
    ++slot;

    if (dot == std::string_view::npos) { break; }
    text.remove_prefix(dot + 1);
    if (text.empty()) { return std::nullopt; }
  }

  if (!out.full()) { out.prerelease.clear(); }
  return out;
}

std::optional<version_range::comparator> make_comparator(version_range::op kind,
                                                         int major,
                                                         int minor,
                                                         int patch,
                                                         std::string const &prerelease) {
  char buf[64]{};
  std::snprintf(buf, sizeof buf, "%d.%d.%d", major, minor, patch);
  std::string text{ buf };
  if (!prerelease.empty()) { text += "-" + prerelease; }

  version_range::comparator c{ .kind = kind,
                               .bound = {},
                               .major = major,
                               .minor = minor,
                               .patch = patch,
                               .prerelease = !prerelease.empty() };
  if (!semver::parse(std::string_view{ text }, c.bound)) { return std::nullopt; }
  return c;
}

using op = version_range::op;
using comparator_set = version_range::comparator_set;

// Appends the comparators for ">=p" where p may be partial.
bool add_lower(comparator_set &set, partial_version const &p) {
  auto c{ make_comparator(op::ge,
                          p.major == kWild ? 0 : p.major,
                          p.minor == kWild ? 0 : p.minor,
                          p.patch == kWild ? 0 : p.patch,
                          p.prerelease) };
  if (!c) { return false; }
  set.push_back(*c);
  return true;
}

bool add_exclusive_upper(comparator_set &set, int major, int minor, int patch) {
  auto c{ make_comparator(op::lt, major, minor, patch, "0") };
  if (!c) { return false; }
  set.push_back(*c);
  return true;
}

bool add_any(comparator_set &set) { return add_lower(set, partial_version{}); }

// Bare partial: "1" -> >=1.0.0 <2.0.0-0, "1.2" -> >=1.2.0 <1.3.0-0, full -> =.
bool add_x_range(comparator_set &set, partial_version const &p) {
  if (p.major == kWild) { return add_any(set); }
  if (p.full()) {
    auto c{ make_comparator(op::eq, p.major, p.minor, p.patch, p.prerelease) };
    if (!c) { return false; }
    set.push_back(*c);
    return true;
  }
  if (!add_lower(set, p)) { return false; }
  if (p.minor == kWild) { return add_exclusive_upper(set, p.major + 1, 0, 0); }
  return add_exclusive_upper(set, p.major, p.minor + 1, 0);
}

bool add_caret(comparator_set &set, partial_version const &p) {
  if (p.major == kWild) { return add_any(set); }
  if (!add_lower(set, p)) { return false; }

  if (p.major > 0 || p.minor == kWild) {
    return add_exclusive_upper(set, p.major + 1, 0, 0);
  }
  if (p.minor > 0 || p.patch == kWild) {
    return add_exclusive_upper(set, 0, p.minor + 1, 0);
  }
  return add_exclusive_upper(set, 0, 0, p.patch + 1);
}

bool add_tilde(comparator_set &set, partial_version const &p) {
  if (p.major == kWild) { return add_any(set); }
  if (!add_lower(set, p)) { return false; }
  if (p.minor == kWild) { return add_exclusive_upper(set, p.major + 1, 0, 0); }
  return add_exclusive_upper(set, p.major, p.minor + 1, 0);
}

bool add_hyphen(comparator_set &set, partial_version const &lo, partial_version const &hi) {
  if (!add_lower(set, lo)) { return false; }
  if (hi.major == kWild) { return true; }
  if (hi.full()) {
    auto c{ make_comparator(op::le, hi.major, hi.minor, hi.patch, hi.prerelease) };
    if (!c) { return false; }
    set.push_back(*c);
    return true;
  }
  if (hi.minor == kWild) { return add_exclusive_upper(set, hi.major + 1, 0, 0); }
  return add_exclusive_upper(set, hi.major, hi.minor + 1, 0);
}

// Operator comparators with partial operands follow npm: ">1.2" means ">=1.3.0",
// "<=1.2" means "<1.3.0-0".
bool add_operator(comparator_set &set, std::string_view oper, partial_version const &p) {
  if (p.full()) {
    op kind{ op::eq };
    if (oper == "<") {
      kind = op::lt;
    } else if (oper == "<=") {
      kind = op::le;
    } else if (oper == ">") {
      kind = op::gt;
    } else if (oper == ">=") {
      kind = op::ge;
    }
    auto c{ make_comparator(kind, p.major, p.minor, p.patch, p.prerelease) };
    if (!c) { return false; }
    set.push_back(*c);
    return true;
  }

  if (p.major == kWild) {
    if (oper == "<" || oper == ">") {  // matches nothing
      return add_exclusive_upper(set, 0, 0, 0);
    }
    return add_any(set);
  }

  if (oper == ">=") { return add_lower(set, p); }
  if (oper == "<") {
    return add_exclusive_upper(set, p.major, p.minor == kWild ? 0 : p.minor, 0);
  }
  if (oper == ">") {
    partial_version next{ .major = p.minor == kWild ? p.major + 1 : p.major,
                          .minor = p.minor == kWild ? 0 : p.minor + 1,
                          .patch = 0 };
    return add_lower(set, next);
  }
  if (oper == "<=") {
    if (p.minor == kWild) { return add_exclusive_upper(set, p.major + 1, 0, 0); }
    return add_exclusive_upper(set, p.major, p.minor + 1, 0);
  }
  return add_x_range(set, p);
}

std::vector<std::string_view> tokenize(std::string_view s) {
  std::vector<std::string_view> tokens;
  std::size_t i{ 0 };
  while (i < s.size()) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) { ++i; }
    auto const start{ i };
    while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) { ++i; }
    if (i > start) { tokens.push_back(s.substr(start, i - start)); }
  }
  return tokens;
}

std::optional<comparator_set> parse_set(std::string_view text) {
  comparator_set set;
  auto tokens{ tokenize(text) };

  if (tokens.empty()) {
    if (!add_any(set)) { return std::nullopt; }
    return set;
  }

  if (tokens.size() == 3 && tokens[1] == "-") {
    auto const lo{ parse_partial(tokens[0]) };
    auto const hi{ parse_partial(tokens[2]) };
    if (!lo || !hi || !add_hyphen(set, *lo, *hi)) { return std::nullopt; }
    return set;
  }

  for (std::size_t i{ 0 }; i < tokens.size(); ++i) {
    auto token{ tokens[i] };

    std::string_view oper;
    for (std::string_view const candidate : { ">=", "<=", ">", "<", "=", "^", "~>", "~" }) {
      if (token.substr(0, candidate.size()) == candidate) {
        oper = candidate;
        break;
      }
    }
    token.remove_prefix(oper.size());

    if (token.empty() && !oper.empty()) {  // "> 1.2.3"
      if (++i == tokens.size()) { return std::nullopt; }
      token = tokens[i];
    }

    auto const p{ parse_partial(token) };
    if (!p) { return std::nullopt; }

    bool ok{ false };
    if (oper == "^") {
      ok = add_caret(set, *p);
    } else if (oper == "~" || oper == "~>") {
      ok = add_tilde(set, *p);
    } else if (oper.empty() || oper == "=") {
      ok = add_x_range(set, *p);
    } else {
      ok = add_operator(set, oper, *p);
    }
    if (!ok) { return std::nullopt; }
  }

  return set;
}

bool test(version_range::comparator const &c, semver::version<> const &v) {
  switch (c.kind) {
    case op::lt: return v < c.bound;
    case op::le: return v <= c.bound;
    case op::gt: return v > c.bound;
    case op::ge: return v >= c.bound;
    case op::eq: return v == c.bound;
  }
  return false;
}

}  // namespace

std::optional<version_range> version_range::parse(std::string_view text) {
  text = trim(text);

  version_range range;
  std::size_t start{ 0 };
  while (true) {
    auto const bar{ text.find("||", start) };
    auto const part{ text.substr(start, bar == std::string_view::npos ? bar : bar - start) };

    auto set{ parse_set(part) };
    if (!set) { return std::nullopt; }
    range.sets_.push_back(std::move(*set));

    if (bar == std::string_view::npos) { break; }
    start = bar + 2;
  }

  return range;
}

bool version_range::satisfied_by(std::string_view version) const {
  auto const stripped{ strip_prefix(version) };
  auto const p{ parse_partial(stripped) };
  if (!p || !p->full()) { return false; }

  semver::version<> v;
  if (!semver::parse(stripped, v)) { return false; }

  for (auto const &set : sets_) {
    bool all{ true };
    for (auto const &c : set) {
      if (!test(c, v)) {
        all = false;
        break;
      }
    }
    if (!all) { continue; }
    if (p->prerelease.empty()) { return true; }

    for (auto const &c : set) {
      if (c.prerelease && c.major == p->major && c.minor == p->minor &&
          c.patch == p->patch) {
        return true;
      }
    }
  }
  return false;
}

std::optional<std::string> version_max_satisfying(std::vector<std::string> const &candidates,
                                                  version_range const &range) {
  std::optional<std::string> best;
  semver::version<> best_version;

  for (auto const &candidate : candidates) {
    if (!range.satisfied_by(candidate)) { continue; }
    semver::version<> v;
    if (!semver::parse(strip_prefix(candidate), v)) { continue; }
    if (!best || v > best_version) {
      best = candidate;
      best_version = v;
    }
  }
  return best;
}

bool version_is_exact(std::string_view text) {
  auto const p{ parse_partial(trim(text)) };
  if (!p || !p->full()) { return false; }
  semver::version<> v;
  return semver::parse(strip_prefix(text), v);
}

std::string version_strip_exact(std::string_view text) {
  return std::string(strip_prefix(text));
}

}  // namespace xpm
