#include "Headers.hpp"
#include "TestHeaders.hpp"

using namespace capterm;

TEST_CASE("splitOnWhitespace splits on runs of whitespace", "[StringUtils]") {
  auto tokens = splitOnWhitespace("  ls\t-la   /tmp \n");

  REQUIRE(tokens.size() == 3);
  REQUIRE(tokens[0] == "ls");
  REQUIRE(tokens[1] == "-la");
  REQUIRE(tokens[2] == "/tmp");
}

TEST_CASE("splitOnWhitespace returns nothing for blank input",
          "[StringUtils]") {
  REQUIRE(splitOnWhitespace("").empty());
  REQUIRE(splitOnWhitespace(" \t \n ").empty());
}

TEST_CASE("splitOnWhitespace does not honor quotes", "[StringUtils]") {
  auto tokens = splitOnWhitespace("echo 'a b'");

  REQUIRE(tokens.size() == 3);
  REQUIRE(tokens[1] == "'a");
  REQUIRE(tokens[2] == "b'");
}

TEST_CASE("split keeps empty fields between delimiters", "[StringUtils]") {
  auto tokens = split("1;;3", ';');

  REQUIRE(tokens.size() == 3);
  REQUIRE(tokens[0] == "1");
  REQUIRE(tokens[1] == "");
  REQUIRE(tokens[2] == "3");
}

TEST_CASE("trimRight strips only the given trailing characters",
          "[StringUtils]") {
  REQUIRE(trimRight("  text \t ", " \t") == "  text");
  REQUIRE(trimRight("text\n", " \t") == "text\n");
  REQUIRE(trimRight("   ", " ") == "");
  REQUIRE(trimRight("", " ") == "");
}

TEST_CASE("isBlank", "[StringUtils]") {
  REQUIRE(isBlank(""));
  REQUIRE(isBlank(" \t "));
  REQUIRE_FALSE(isBlank("  x "));
}

TEST_CASE("join puts the delimiter between elements only", "[StringUtils]") {
  REQUIRE(join({}, ",") == "");
  REQUIRE(join({"one"}, ",") == "one");
  REQUIRE(join({"a", "", "c"}, "\n") == "a\n\nc");
}
