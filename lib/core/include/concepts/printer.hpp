#pragma once

#include <concepts>
#include <string_view>

namespace saltgen::concepts {

template<typename T>
concept line_printer = requires(T printer, std::string_view line) {
  { printer.print_line(line) } -> std::same_as<void>;
};

}// namespace saltgen::concepts
