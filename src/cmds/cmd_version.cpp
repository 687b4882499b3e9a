#include "cmd_version.h"

#include "platform.h"
#include "tui.h"

#include "archive.h"
#include "mbedtls/version.h"
#include "semver.hpp"
#include "tbb/version.h"

#include <CLI/CLI.hpp>
#include <blake3.h>
#include <curl/curl.h>

#include <array>
#include <memory>
#include <string>
#include <vector>

#ifndef XPM_VERSION_STR
#error "XPM_VERSION_STR must be defined by the build system"
#endif

namespace xpm {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_flag("--components",
                cfg_ptr->show_components,
                "Also list third-party component versions");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_version::cmd_version(cmd_version::cfg cfg,
                         std::optional<std::filesystem::path> const & /*cli_store_root*/)
    : cfg_{ std::move(cfg) } {}

bool cmd_version::execute() {
  tui::print_stdout("xpm %s (%s-%s)\n",
                    XPM_VERSION_STR,
                    std::string{ platform::os_name() }.c_str(),
                    std::string{ platform::cpu_name() }.c_str());
  if (!cfg_.show_components) { return true; }

  curl_version_info_data const *curl_info{ curl_version_info(CURLVERSION_NOW) };
  std::vector<std::string> curl_features;
  if (curl_info->features & CURL_VERSION_BROTLI) { curl_features.push_back("brotli"); }
  if (curl_info->features & CURL_VERSION_LIBZ) { curl_features.push_back("zlib"); }
  if (curl_info->features & CURL_VERSION_HTTP2) { curl_features.push_back("http2"); }
  if (!curl_features.empty()) {
    std::string features;
    for (size_t i{ 0 }; i < curl_features.size(); ++i) {
      if (i > 0) features.append(", ");
      features.append(curl_features[i]);
    }
    tui::print_stdout("  libcurl: %s (%s)\n", curl_info->version, features.c_str());
  } else {
    tui::print_stdout("  libcurl: %s\n", curl_info->version);
  }

  std::array<char, 32> mbedtls_version{};
  mbedtls_version_get_string_full(mbedtls_version.data());
  tui::print_stdout("  mbedTLS: %s\n", mbedtls_version.data());

  tui::print_stdout("  libarchive: %s\n", archive_version_details());
  tui::print_stdout("  BLAKE3: %s\n", BLAKE3_VERSION_STRING);
  tui::print_stdout("  oneTBB: %s\n", TBB_VERSION_STRING);
  tui::print_stdout("  Semver: %d.%d.%d\n",
                    SEMVER_VERSION_MAJOR,
                    SEMVER_VERSION_MINOR,
                    SEMVER_VERSION_PATCH);
  tui::print_stdout("  CLI11: %s\n", CLI11_VERSION);
  return true;
}

}  // namespace xpm
