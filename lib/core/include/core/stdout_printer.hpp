#pragma once

#include <fmt/core.h>
#include <string_view>

namespace saltgen::core {

/**
 * @brief Writes each report line, newline terminated, to stdout.
 */
class stdout_printer
{
public:
  auto print_line(std::string_view line) const -> void { fmt::print("{}\n", line); }
};

}// namespace saltgen::core
