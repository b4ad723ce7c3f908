#pragma once

#include <string>
#include <string_view>

namespace saltgen::core {

/**
 * @brief Utility for generating RFC 4122 version 4 UUIDs.
 */
class uuid_generator
{
public:
  /**
   * @brief Generates a new random UUID string.
   *
   * @return UUID in canonical lowercase form (e.g., "550e8400-e29b-41d4-a716-446655440000")
   */
  [[nodiscard]] static auto generate() -> std::string;

  /**
   * @brief Checks that a string is a canonical lowercase version 4 UUID.
   *
   * Requires the 8-4-4-4-12 hyphenated layout, version nibble 4 and
   * an RFC 4122 variant nibble (8, 9, a or b).
   *
   * @param text Candidate string
   * @return true if text is a canonical UUID4
   */
  [[nodiscard]] static auto is_canonical_uuid4(std::string_view text) -> bool;
};

}// namespace saltgen::core
