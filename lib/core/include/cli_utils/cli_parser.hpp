#pragma once

#include <CLI/CLI.hpp>
#include <core/secret_file.hpp>
#include <core/secret_generator.hpp>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <string>

namespace saltgen::cli_utils {

struct cli_args
{
  std::string output_path = core::default_output_path;
  std::string key = core::default_secret_key;
  bool write_file = false;
  bool verbose = false;
  bool show_version = false;
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void;

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "saltgen - secret salt generator", "saltgen" };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    const auto exit_code = app.exit(e);
    std::exit(exit_code);// NOLINT(concurrency-mt-unsafe)
  }

  return args;
}

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.add_option("-o,--output", args.output_path, "Path of the TOML file receiving the secret");
  app.add_option("-k,--key", args.key, "TOML key holding the secret");
  app.add_flag("-w,--write", args.write_file, "Write the secret to the output file");
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_flag("--version", args.show_version, "Show version information");
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  if (args.output_path.empty()) {
    spdlog::error("Output path must not be empty");
    return false;
  }

  if (args.write_file and not core::is_toml_bare_key(args.key)) {
    spdlog::error("Invalid key: '{}' (allowed: A-Z a-z 0-9 _ -)", args.key);
    return false;
  }

  return true;
}

[[nodiscard]] inline auto to_secret_options(const cli_args &args) -> core::secret_options
{
  return core::secret_options{ .output_path = args.output_path, .key = args.key, .write_file = args.write_file };
}

}// namespace saltgen::cli_utils
