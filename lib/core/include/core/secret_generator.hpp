#pragma once

#include <concepts/printer.hpp>
#include <core/secret_file.hpp>
#include <core/uuid_generator.hpp>
#include <filesystem>
#include <fmt/core.h>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace saltgen::core {

inline constexpr auto default_output_path = "secret.toml";
inline constexpr auto default_secret_key = "secret_salt";

struct secret_options
{
  std::filesystem::path output_path{ default_output_path };
  std::string key{ default_secret_key };
  bool write_file = false;
};

struct generated_secret
{
  std::string value;
  std::filesystem::path output_path;
  bool written = false;
};

/**
 * @brief Produces a fresh secret salt and reports it.
 *
 * @tparam Printer Type satisfying the line_printer concept
 *
 * One call to run() generates a UUID4, makes sure the directory of the output
 * file exists, optionally persists the secret as a single-key TOML document and
 * finally prints the two report lines. Any failure propagates before anything
 * is printed.
 */
template<concepts::line_printer Printer> class secret_generator
{
public:
  explicit secret_generator(std::shared_ptr<Printer> printer) : printer_(std::move(printer)) {}

  /**
   * @brief Runs one generation.
   *
   * @param options Output path, TOML key and persistence switch
   * @return The generated secret and what was done with it
   * @throws std::filesystem::filesystem_error if the output directory cannot be created
   * @throws std::runtime_error if persistence is enabled and the file cannot be written
   */
  [[nodiscard]] auto run(const secret_options &options) const -> generated_secret
  {
    generated_secret result{ .value = uuid_generator::generate(), .output_path = options.output_path };

    ensure_parent_directory(result.output_path);

    if (options.write_file) {
      write_secret_file(result.output_path, options.key, result.value);
      result.written = true;
    } else {
      spdlog::debug("Persistence disabled, {} left untouched", result.output_path.string());
    }

    printer_->print_line(fmt::format("Secret Generated -> {}", result.value));
    printer_->print_line(fmt::format("Secret UUID4 generated and written to {}", result.output_path.string()));

    return result;
  }

private:
  std::shared_ptr<Printer> printer_;
};

}// namespace saltgen::core
