#pragma once

#include <cli_utils/cli_parser.hpp>
#include <fmt/core.h>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "internal_use_only/config.hpp"

namespace saltgen::cli_utils {

// Diagnostics go to stderr; stdout only carries the report lines.
inline auto configure_logging(const cli_args &args) -> void
{
  auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>("saltgen", stderr_sink);
  spdlog::set_default_logger(logger);

  spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::info);
}

inline auto print_version() -> void { fmt::print("saltgen v{}\n", saltgen::cmake::project_version); }

}// namespace saltgen::cli_utils
