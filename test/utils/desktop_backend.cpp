#include "util/desktop_backend.hpp"

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

using waywidgets::util::DmenuPicker;
using waywidgets::util::NotifySend;

TEST_CASE("notify-send arguments", "[notify]") {
  NotifySend notifier({"notify-send", "-a", "waywidgets"});

  SECTION("profile change popup") {
    auto args = notifier.buildArgs({"Quiet Power Profile", "", "low", "sys-notify"});
    REQUIRE(args == std::vector<std::string>{"notify-send", "-a", "waywidgets", "-u", "low", "-h",
                                             "string:x-canonical-private-synchronous:sys-notify",
                                             "Quiet Power Profile"});
  }
  SECTION("title and body only") {
    auto args = notifier.buildArgs({"No History", "Your notification history is empty", "", ""});
    REQUIRE(args == std::vector<std::string>{"notify-send", "-a", "waywidgets", "No History",
                                             "Your notification history is empty"});
  }
  SECTION("exit status is reported") {
    REQUIRE(NotifySend({"true"}).notify({"title", "body", "", ""}));
    REQUIRE_FALSE(NotifySend({"false"}).notify({"title", "body", "", ""}));
  }
}

TEST_CASE("dmenu pickers", "[picker]") {
  SECTION("returns the chosen line") {
    DmenuPicker picker({"sed", "-n", "2p"});
    REQUIRE(picker.pick("icon\tfirst\n\tsecond\n") == "\tsecond");
  }
  SECTION("dismissed picker") {
    DmenuPicker picker({"/bin/sh", "-c", "cat >/dev/null; exit 1"});
    REQUIRE(picker.pick("a\tb\n").empty());
  }
  SECTION("missing picker") {
    DmenuPicker picker({"waywidgets-no-such-picker"});
    REQUIRE(picker.pick("a\tb\n").empty());
  }
}
