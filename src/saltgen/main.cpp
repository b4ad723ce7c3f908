#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <core/stdout_printer.hpp>
#include <core/secret_generator.hpp>
#include <cstdlib>
#include <exception>
#include <memory>
#include <spdlog/spdlog.h>

auto main(int argc, char **argv) -> int
{
  auto args = saltgen::cli_utils::parse_cli_args(argc, argv);

  saltgen::cli_utils::configure_logging(args);

  if (not saltgen::cli_utils::validate_cli_args(args)) { return EXIT_FAILURE; }

  if (args.show_version) {
    saltgen::cli_utils::print_version();
    return EXIT_SUCCESS;
  }

  const saltgen::core::secret_generator generator{ std::make_shared<saltgen::core::stdout_printer>() };

  try {
    const auto result = generator.run(saltgen::cli_utils::to_secret_options(args));
    spdlog::debug("Secret {} for {}", result.written ? "persisted" : "printed only", result.output_path.string());
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
