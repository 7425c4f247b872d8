#include "util/command.hpp"

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

namespace command = waywidgets::util::command;

TEST_CASE("Run a command", "[command]") {
  SECTION("captures stdout without the last newline") {
    auto res = command::exec({"/bin/sh", "-c", "printf 'one\\ntwo\\n'"});
    REQUIRE(res.exit_code == 0);
    REQUIRE(res.out == "one\ntwo");
  }
  SECTION("reports the exit code") {
    auto res = command::exec({"/bin/sh", "-c", "echo partial; exit 3"});
    REQUIRE(res.exit_code == 3);
    REQUIRE(res.out == "partial");
  }
  SECTION("arguments are not split or expanded") {
    auto res = command::exec({"printf", "%s|", "a b", "$HOME", "\"quoted\""});
    REQUIRE(res.out == "a b|$HOME|\"quoted\"|");
  }
  SECTION("missing executable") {
    auto res = command::exec({"waywidgets-no-such-command"});
    REQUIRE(res.exit_code == 127);
    REQUIRE(res.out.empty());
  }
  SECTION("empty command") {
    auto res = command::exec(std::vector<std::string>{});
    REQUIRE(res.exit_code == -1);
  }
  SECTION("killed command") {
    auto res = command::exec({"/bin/sh", "-c", "kill -9 $$"});
    REQUIRE(res.exit_code == -1);
  }
}

TEST_CASE("Feed a command's stdin", "[command]") {
  SECTION("round trip through cat") {
    auto res = command::exec({"cat"}, "a\tb\nc\td\n");
    REQUIRE(res.exit_code == 0);
    REQUIRE(res.out == "a\tb\nc\td");
  }
  SECTION("input larger than a pipe buffer") {
    std::string input;
    for (int i = 0; i < 20000; ++i) {
      input += "line " + std::to_string(i) + "\n";
    }
    auto res = command::exec({"cat"}, input);
    REQUIRE(res.out.size() + 1 == input.size());
  }
  SECTION("command that ignores its input") {
    std::string input(1 << 20, 'x');
    auto res = command::exec({"/bin/sh", "-c", "echo done"}, input);
    REQUIRE(res.exit_code == 0);
    REQUIRE(res.out == "done");
  }
  SECTION("picker style selection") {
    auto res = command::exec({"sed", "-n", "2p"}, "first\nsecond\nthird\n");
    REQUIRE(res.out == "second");
  }
}

TEST_CASE("Run a command without its output", "[command]") {
  auto res = command::execNoRead({"/bin/sh", "-c", "echo ignored; exit 1"});
  REQUIRE(res.exit_code == 1);
  REQUIRE(res.out.empty());
}
