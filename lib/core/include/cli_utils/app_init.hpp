#pragma once

#include <cli_utils/cli_parser.hpp>
#include <fmt/core.h>
#include <internal_use_only/config.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace gift_relay::cli_utils {

/**
 * @brief Routes logs to stderr, keeping stdout for command output.
 */
inline auto configure_logging(const cli_args &args) -> void
{
  spdlog::set_default_logger(spdlog::stderr_color_mt("gift_relay"));

  if (args.verbose) {
    spdlog::set_level(spdlog::level::debug);
  } else {
    spdlog::set_level(spdlog::level::warn);
  }
}

inline auto print_version() -> void
{
  fmt::print("{} v{}\n", gift_relay::cmake::project_name, gift_relay::cmake::project_version);
}

}// namespace gift_relay::cli_utils
