#include "Headers.hpp"
#include "TestHeaders.hpp"

using namespace tt;

TEST_CASE("replaceAll replaces all occurrences", "[StringUtils]") {
  std::string str = "hello world, hello universe, hello everyone";
  int count = replaceAll(str, "hello", "hi");

  REQUIRE(count == 3);
  REQUIRE(str == "hi world, hi universe, hi everyone");
}

TEST_CASE("replaceAll handles no matches", "[StringUtils]") {
  std::string str = "hello world";
  int count = replaceAll(str, "goodbye", "hi");

  REQUIRE(count == 0);
  REQUIRE(str == "hello world");
}

TEST_CASE("replaceAll returns 0 for empty pattern", "[StringUtils]") {
  std::string str = "hello world";
  int count = replaceAll(str, "", "hi");

  REQUIRE(count == 0);
  REQUIRE(str == "hello world");
}

TEST_CASE("replaceAll does not rescan replacements", "[StringUtils]") {
  std::string str = "{{x}}";
  int count = replaceAll(str, "{{x}}", "{{x}}{{x}}");

  REQUIRE(count == 1);
  REQUIRE(str == "{{x}}{{x}}");
}

TEST_CASE("split breaks on the delimiter", "[StringUtils]") {
  auto parts = split("data.items[0].name", '.');
  REQUIRE(parts.size() == 3);
  REQUIRE(parts[0] == "data");
  REQUIRE(parts[1] == "items[0]");
  REQUIRE(parts[2] == "name");
}

TEST_CASE("trim strips surrounding whitespace", "[StringUtils]") {
  REQUIRE(trim("  hello\n") == "hello");
  REQUIRE(trim("\t\r\n ") == "");
  REQUIRE(trim("a b") == "a b");
}

TEST_CASE("toUpper uppercases ascii", "[StringUtils]") {
  REQUIRE(toUpper("city_name") == "CITY_NAME");
}
