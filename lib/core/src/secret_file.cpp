#include <core/secret_file.hpp>

#include <fmt/core.h>
#include <fstream>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace saltgen::core {

auto ensure_parent_directory(const std::filesystem::path &file_path) -> bool
{
  const auto parent = file_path.parent_path();
  if (parent.empty()) { return false; }

  const auto created = std::filesystem::create_directories(parent);
  if (created) { spdlog::debug("Created directory {}", parent.string()); }
  return created;
}

auto is_toml_bare_key(std::string_view key) -> bool
{
  if (key.empty()) { return false; }

  for (const auto c : key) {
    const auto is_alpha = (c >= 'A' and c <= 'Z') or (c >= 'a' and c <= 'z');
    const auto is_digit = c >= '0' and c <= '9';
    if (not is_alpha and not is_digit and c != '_' and c != '-') { return false; }
  }
  return true;
}

auto escape_toml_string(std::string_view value) -> std::string
{
  constexpr auto first_printable = 0x20;
  constexpr auto delete_char = 0x7f;

  std::string escaped;
  escaped.reserve(value.size());

  for (const auto c : value) {
    switch (c) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\f':
      escaped += "\\f";
      break;
    case '\r':
      escaped += "\\r";
      break;
    default: {
      const auto code = static_cast<unsigned char>(c);
      if (code < first_printable or code == delete_char) {
        escaped += fmt::format("\\u{:04X}", static_cast<unsigned int>(code));
      } else {
        escaped += c;
      }
    }
    }
  }
  return escaped;
}

auto format_secret_toml(std::string_view key, std::string_view value) -> std::string
{
  if (not is_toml_bare_key(key)) { throw std::invalid_argument(fmt::format("Invalid TOML key: '{}'", key)); }
  return fmt::format("{} = \"{}\"\n", key, escape_toml_string(value));
}

auto write_secret_file(const std::filesystem::path &file_path, std::string_view key, std::string_view value) -> void
{
  const auto document = format_secret_toml(key, value);

  std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
  if (not file.is_open()) { throw std::runtime_error(fmt::format("Cannot open {} for writing", file_path.string())); }

  file << document;
  file.flush();
  if (not file) { throw std::runtime_error(fmt::format("Failed to write {}", file_path.string())); }

  spdlog::debug("Wrote key '{}' to {}", key, file_path.string());
}

}// namespace saltgen::core
