#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

namespace xpm::platform {

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);

// Strip write bits (0444, or 0555 when executable is set).
void make_read_only(std::filesystem::path const &path, bool executable = false);
void make_executable(std::filesystem::path const &path);

std::optional<std::filesystem::path> get_default_store_root();
char const *get_default_store_root_env_vars();

std::optional<std::filesystem::path> home_dir();

// Host names as they appear in registry "os" and "cpu" fields.
std::string_view os_name();
std::string_view cpu_name();

bool is_tty();

}  // namespace xpm::platform
