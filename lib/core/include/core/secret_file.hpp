#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace saltgen::core {

/**
 * @brief Creates the parent directory of a file path, including intermediates.
 *
 * A path without a parent component refers to the current directory and is
 * left untouched. Existing directories are not an error.
 *
 * @param file_path Path of the file whose directory must exist
 * @return true if a directory was created
 * @throws std::filesystem::filesystem_error if the directory cannot be created
 */
auto ensure_parent_directory(const std::filesystem::path &file_path) -> bool;

/**
 * @brief Checks whether a key can be written as a TOML bare key.
 *
 * @param key Candidate key
 * @return true if key is non-empty and only contains A-Z, a-z, 0-9, '_' or '-'
 */
[[nodiscard]] auto is_toml_bare_key(std::string_view key) -> bool;

/**
 * @brief Escapes a value for use inside a TOML basic string.
 *
 * @param value Raw string value
 * @return Escaped value without surrounding quotes
 */
[[nodiscard]] auto escape_toml_string(std::string_view value) -> std::string;

/**
 * @brief Renders a TOML document holding a single top-level string key.
 *
 * @param key Bare key name
 * @param value String value
 * @return Document text, e.g. "secret_salt = \"...\"\n"
 * @throws std::invalid_argument if key is not a bare key
 */
[[nodiscard]] auto format_secret_toml(std::string_view key, std::string_view value) -> std::string;

/**
 * @brief Writes the single-key TOML document to a file, replacing any previous content.
 *
 * @param file_path Destination file
 * @param key Bare key name
 * @param value Secret value
 * @throws std::invalid_argument if key is not a bare key
 * @throws std::runtime_error if the file cannot be opened or written
 */
auto write_secret_file(const std::filesystem::path &file_path, std::string_view key, std::string_view value) -> void;

}// namespace saltgen::core
