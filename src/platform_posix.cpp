#include "platform.h"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <system_error>

namespace xpm::platform {

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

void make_read_only(std::filesystem::path const &path, bool executable) {
  mode_t const mode{ static_cast<mode_t>(executable ? 0555 : 0444) };
  if (::chmod(path.c_str(), mode) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to chmod " + path.string());
  }
}

void make_executable(std::filesystem::path const &path) {
  if (::chmod(path.c_str(), 0755) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to chmod " + path.string());
  }
}

std::optional<std::filesystem::path> get_default_store_root() {
  // XPM_STORE_ROOT takes precedence
  if (char const *env_root{ std::getenv("XPM_STORE_ROOT") }) {
    return std::filesystem::path{ env_root };
  }

#ifdef __APPLE__
  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / "Library" / "Application Support" / "xpm" /
           "store";
  }
#else
  if (char const *xdg_data{ std::getenv("XDG_DATA_HOME") }) {
    return std::filesystem::path{ xdg_data } / "xpm" / "store";
  }

  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / ".local" / "share" / "xpm" / "store";
  }
#endif

  return std::nullopt;
}

char const *get_default_store_root_env_vars() {
#ifdef __APPLE__
  return "XPM_STORE_ROOT or HOME";
#else
  return "XPM_STORE_ROOT, XDG_DATA_HOME or HOME";
#endif
}

std::optional<std::filesystem::path> home_dir() {
  if (char const *home{ std::getenv("HOME") }; home && *home) {
    return std::filesystem::path{ home };
  }
  return std::nullopt;
}

std::string_view os_name() {
#if defined(__APPLE__) && defined(__MACH__)
  return "darwin";
#elif defined(__linux__)
  return "linux";
#else
#error "unsupported POSIX OS"
#endif
}

std::string_view cpu_name() {
#if defined(__aarch64__) || defined(__arm64__)
  return "arm64";
#elif defined(__x86_64__)
  return "x64";
#else
#error "unsupported architecture"
#endif
}

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

}  // namespace xpm::platform
