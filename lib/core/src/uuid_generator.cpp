#include <core/uuid_generator.hpp>

#include <array>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstddef>

namespace saltgen::core {

namespace {
constexpr std::size_t canonical_length = 36;
constexpr std::array<std::size_t, 4> hyphen_positions{ 8, 13, 18, 23 };
constexpr std::size_t version_position = 14;
constexpr std::size_t variant_position = 19;

auto is_lower_hex(char c) -> bool { return (c >= '0' and c <= '9') or (c >= 'a' and c <= 'f'); }

auto is_hyphen_position(std::size_t index) -> bool
{
  for (const auto position : hyphen_positions) {
    if (position == index) { return true; }
  }
  return false;
}
}// namespace

auto uuid_generator::generate() -> std::string
{
  static thread_local boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

auto uuid_generator::is_canonical_uuid4(std::string_view text) -> bool
{
  if (text.size() != canonical_length) { return false; }

  for (std::size_t i = 0; i < text.size(); ++i) {
    if (is_hyphen_position(i)) {
      if (text[i] != '-') { return false; }
    } else if (not is_lower_hex(text[i])) {
      return false;
    }
  }

  if (text[version_position] != '4') { return false; }

  const auto variant = text[variant_position];
  return variant == '8' or variant == '9' or variant == 'a' or variant == 'b';
}

}// namespace saltgen::core
