#include <catch2/catch_test_macros.hpp>
#include <core/secret_generator.hpp>
#include <core/uuid_generator.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <regex>
#include <string>
#include <tuple>
#include <vector>

#include "test_doubles/scoped_temp_dir.hpp"
#include "test_doubles/recording_printer.hpp"

namespace {

auto read_file(const std::filesystem::path &path) -> std::string
{
  std::ifstream file(path, std::ios::binary);
  return { std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>() };
}

}// namespace

TEST_CASE("secret_options default to print only secret.toml", "[core][secret_generator]")
{
  const saltgen::core::secret_options options;

  REQUIRE(options.output_path == std::filesystem::path{ "secret.toml" });
  REQUIRE(options.key == "secret_salt");
  REQUIRE(options.write_file == false);
}

TEST_CASE("secret_generator prints the two report lines", "[core][secret_generator]")
{
  auto printer = std::make_shared<saltgen_test::RecordingPrinter>();
  const saltgen::core::secret_generator generator{ printer };

  SECTION("default options print without touching the file")
  {
    const auto result = generator.run(saltgen::core::secret_options{});

    REQUIRE(saltgen::core::uuid_generator::is_canonical_uuid4(result.value));
    REQUIRE(result.written == false);
    REQUIRE(printer->lines()
            == std::vector<std::string>{
              "Secret Generated -> " + result.value, "Secret UUID4 generated and written to secret.toml" });
  }

  SECTION("output matches the documented layout")
  {
    std::ignore = generator.run(saltgen::core::secret_options{});

    const std::regex secret_line(
      "Secret Generated -> [0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}");
    REQUIRE(printer->lines().size() == 2);
    REQUIRE(std::regex_match(printer->lines()[0], secret_line));
    REQUIRE(printer->lines()[1] == "Secret UUID4 generated and written to secret.toml");
  }

  SECTION("consecutive runs report different secrets")
  {
    const auto first = generator.run(saltgen::core::secret_options{});
    const auto second = generator.run(saltgen::core::secret_options{});

    REQUIRE(first.value != second.value);
  }
}

TEST_CASE("secret_generator prepares the output directory", "[core][secret_generator]")
{
  const saltgen_test::ScopedTempDir temp_dir("saltgen_generator_dir");
  auto printer = std::make_shared<saltgen_test::RecordingPrinter>();
  const saltgen::core::secret_generator generator{ printer };

  SECTION("missing directories are created in print only mode")
  {
    const auto target = temp_dir.path() / "config" / "nested" / "secret.toml";

    const auto result = generator.run(saltgen::core::secret_options{ .output_path = target });

    REQUIRE(std::filesystem::is_directory(target.parent_path()));
    REQUIRE_FALSE(std::filesystem::exists(target));
    REQUIRE(result.output_path == target);
  }

  SECTION("directory creation failure prints nothing")
  {
    const auto blocker = temp_dir.path() / "blocker";
    std::ofstream(blocker) << "file";

    const saltgen::core::secret_options options{ .output_path = blocker / "secret.toml", .write_file = true };

    REQUIRE_THROWS_AS(std::ignore = generator.run(options), std::filesystem::filesystem_error);
    REQUIRE(printer->lines().empty());
  }
}

TEST_CASE("secret_generator persists the secret when enabled", "[core][secret_generator]")
{
  const saltgen_test::ScopedTempDir temp_dir("saltgen_generator_write");
  auto printer = std::make_shared<saltgen_test::RecordingPrinter>();
  const saltgen::core::secret_generator generator{ printer };
  const auto target = temp_dir.path() / "out" / "secret.toml";

  SECTION("file holds the printed secret under the default key")
  {
    const auto result = generator.run(saltgen::core::secret_options{ .output_path = target, .write_file = true });

    REQUIRE(result.written == true);
    REQUIRE(read_file(target) == "secret_salt = \"" + result.value + "\"\n");
    REQUIRE(printer->lines()
            == std::vector<std::string>{
              "Secret Generated -> " + result.value, "Secret UUID4 generated and written to " + target.string() });
  }

  SECTION("custom key is used")
  {
    const auto result =
      generator.run(saltgen::core::secret_options{ .output_path = target, .key = "salt", .write_file = true });

    REQUIRE(read_file(target) == "salt = \"" + result.value + "\"\n");
  }

  SECTION("a second run replaces the previous secret")
  {
    const saltgen::core::secret_options options{ .output_path = target, .write_file = true };
    std::ignore = generator.run(options);
    const auto second = generator.run(options);

    REQUIRE(read_file(target) == "secret_salt = \"" + second.value + "\"\n");
  }

  SECTION("write failure prints nothing")
  {
    std::filesystem::create_directories(target);

    REQUIRE_THROWS_AS(
      std::ignore = generator.run(saltgen::core::secret_options{ .output_path = target, .write_file = true }),
      std::runtime_error);
    REQUIRE(printer->lines().empty());
  }
}
