#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace xpm {

using shell_env_t = std::unordered_map<std::string, std::string>;

enum class shell_stream { std_out, std_err };

struct shell_result {
  int exit_code;
  std::optional<int> signal;
  bool timed_out{ false };
};

struct shell_run_cfg {
  std::function<void(std::string_view)> on_stdout_line;
  std::function<void(std::string_view)> on_stderr_line;
  std::function<void(std::string_view)> on_output_line;  // both streams
  std::optional<std::filesystem::path> cwd;
  shell_env_t env;
  // On expiry the child's whole process group is SIGKILLed.
  std::optional<std::chrono::milliseconds> timeout;
};

shell_env_t shell_getenv();

// Runs script with "/bin/sh -c" and streams output line by line as it arrives.
shell_result shell_run(std::string_view script, shell_run_cfg const &cfg);

}  // namespace xpm
