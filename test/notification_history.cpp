#include "modules/notification_history.hpp"

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

#include <sstream>

#include "fixtures/FakeBackends.hpp"

using waywidgets::modules::NotificationHistory;

namespace {

const char* EMPTY_COUNT = R"({"text": "", "tooltip": "No notification history", "alt": "none"})";

struct Harness {
  Harness(bool reachable, std::optional<std::string> document, std::string choice = "",
          Json::Value config = Json::objectValue)
      : journal(makeJournal()),
        history(std::make_shared<FakeHistoryBackend>(journal, reachable, std::move(document))),
        picker(std::make_shared<FakePicker>(journal, std::move(choice))),
        notifier(std::make_shared<FakeNotifier>(journal)),
        widget(config, out, history, picker, notifier, makeStreamLogger(trace)) {}

  Journal journal;
  std::shared_ptr<FakeHistoryBackend> history;
  std::shared_ptr<FakePicker> picker;
  std::shared_ptr<FakeNotifier> notifier;
  std::ostringstream out;
  std::ostringstream trace;
  NotificationHistory widget;
};

const auto sixRecords = makoHistory({{"A", "body a", "mail"},
                                     {"B", "body b", ""},
                                     {"C", "", "chat"},
                                     {"D", "body d", ""},
                                     {"E", "body e", ""},
                                     {"F", "body f", ""}});

}  // namespace

TEST_CASE("Count", "[notification-history][count]") {
  SECTION("daemon unreachable") {
    Harness h(false, makoHistory({{"A", "a", ""}}));
    h.widget.doAction("count");
    REQUIRE(h.out.str() == std::string(EMPTY_COUNT) + "\n");
    REQUIRE(*h.journal == std::vector<std::string>{"probe"});
  }
  SECTION("three notifications") {
    Harness h(true, makoHistory({{"A", "a", ""}, {"B", "b", ""}, {"C", "c", ""}}));
    h.widget.doAction("count");
    REQUIRE(h.out.str() ==
            "{\"text\": \"3\", \"tooltip\": \"3 notifications in history\", \"alt\": "
            "\"notification\"}\n");
  }
  SECTION("empty history") {
    Harness h(true, makoHistory({}));
    h.widget.doAction("count");
    REQUIRE(h.out.str() == std::string(EMPTY_COUNT) + "\n");
  }
  SECTION("history query fails") {
    Harness h(true, std::nullopt);
    h.widget.doAction("count");
    REQUIRE(h.out.str() == std::string(EMPTY_COUNT) + "\n");
  }
  SECTION("malformed history") {
    Harness h(true, std::string("{\"data\": null"));
    h.widget.doAction("count");
    REQUIRE(h.out.str() == std::string(EMPTY_COUNT) + "\n");
  }
}

TEST_CASE("Tooltip", "[notification-history][tooltip]") {
  SECTION("keeps the first five summaries joined by a literal backslash-n") {
    Harness h(true, sixRecords);
    h.widget.doAction("tooltip");
    REQUIRE(h.out.str() == "A\\nB\\nC\\nD\\nE\n");
  }
  SECTION("fewer records than the limit") {
    Harness h(true, makoHistory({{"only", "x", ""}}));
    h.widget.doAction("tooltip");
    REQUIRE(h.out.str() == "only\n");
  }
  SECTION("configured limit") {
    Json::Value config;
    config["tooltip-limit"] = 2;
    Harness h(true, sixRecords, "", config);
    h.widget.doAction("tooltip");
    REQUIRE(h.out.str() == "A\\nB\n");
  }
  SECTION("summaries are printed as the daemon sent them") {
    Harness h(true, makoHistory({{R"(C:\\xdata)", "", ""}}));
    h.widget.doAction("tooltip");
    REQUIRE(h.out.str() == "C:\\xdata\n");
  }
  SECTION("does not probe and prints an empty line on failure") {
    Harness h(false, std::nullopt);
    h.widget.doAction("tooltip");
    REQUIRE(h.out.str() == "\n");
    REQUIRE(*h.journal == std::vector<std::string>{"fetch"});
  }
}

TEST_CASE("Show", "[notification-history][show]") {
  SECTION("daemon unreachable") {
    Harness h(false, sixRecords, "mail\tA");
    h.widget.doAction("show");
    REQUIRE(*h.journal == std::vector<std::string>{"probe", "notify"});
    REQUIRE(h.notifier->sent.front().title == "No History");
    REQUIRE(h.notifier->sent.front().body == "Your notification history is empty");
  }
  SECTION("empty history never opens the picker") {
    Harness h(true, makoHistory({}), "mail\tA");
    h.widget.doAction("show");
    REQUIRE(*h.journal == std::vector<std::string>{"probe", "fetch", "notify"});
    REQUIRE(h.notifier->sent.front().title == "No History");
  }
  SECTION("picker lists icon and summary of every record") {
    Harness h(true, sixRecords, "");
    h.widget.doAction("show");
    REQUIRE(h.picker->offered.size() == 1);
    REQUIRE(h.picker->offered.front() == "mail\tA\n\tB\nchat\tC\n\tD\n\tE\n\tF\n");
  }
  SECTION("dismissed picker sends nothing") {
    Harness h(true, sixRecords, "");
    h.widget.doAction("show");
    REQUIRE(*h.journal == std::vector<std::string>{"probe", "fetch", "pick"});
    REQUIRE(h.out.str().empty());
  }
  SECTION("picked notification is shown again") {
    Harness h(true, sixRecords, "mail\tA\n");
    h.widget.doAction("show");
    REQUIRE(h.notifier->sent.size() == 1);
    REQUIRE(h.notifier->sent.front().title == "History Notification");
    REQUIRE(h.notifier->sent.front().body == "body a");
  }
  SECTION("picked notification without an icon") {
    Harness h(true, sixRecords, "\tD");
    h.widget.doAction("show");
    REQUIRE(h.notifier->sent.front().body == "body d");
  }
  SECTION("picked notification with an empty body") {
    Harness h(true, sixRecords, "chat\tC");
    h.widget.doAction("show");
    REQUIRE(h.notifier->sent.front().body == NotificationHistory::NO_DETAILS);
  }
  SECTION("selection matching no record") {
    Harness h(true, sixRecords, "typed by hand");
    h.widget.doAction("show");
    REQUIRE(h.notifier->sent.front().title == "History Notification");
    REQUIRE(h.notifier->sent.front().body == NotificationHistory::NO_DETAILS);
  }
  SECTION("duplicate summaries resolve to the first record") {
    Harness h(true, makoHistory({{"Same", "first", ""}, {"Same", "second", ""}}), "\tSame");
    h.widget.doAction("show");
    REQUIRE(h.notifier->sent.front().body == "first");
  }
  SECTION("raw history and picker input are traced") {
    Harness h(true, makoHistory({{"A", "a", "mail"}}), "");
    h.widget.doAction("show");
    auto trace = h.trace.str();
    REQUIRE(trace.find("\"summary\"") != std::string::npos);
    REQUIRE(trace.find("mail\tA") != std::string::npos);
  }
}

TEST_CASE("Unknown actions are silent", "[notification-history]") {
  for (const auto* action : {"", "Count", "list", "show "}) {
    Harness h(true, sixRecords, "mail\tA");
    h.widget.doAction(action);
    REQUIRE(h.out.str().empty());
    REQUIRE(h.journal->empty());
  }
}

TEST_CASE("Picked lines", "[notification-history]") {
  SECTION("the summary survives any icon") {
    for (const auto* icon : {"", "mail", "/usr/share/icons/a b.png", "x:y"}) {
      waywidgets::util::NotificationRecord record{"Build finished", "", icon};
      auto line = NotificationHistory::pickerInput({record});
      REQUIRE(NotificationHistory::selectedSummary(line) == "Build finished");
    }
  }
  SECTION("only the first tab separates the icon") {
    REQUIRE(NotificationHistory::selectedSummary("icon\ta\tb") == "a\tb");
  }
  SECTION("a line without a tab is kept as is") {
    REQUIRE(NotificationHistory::selectedSummary("plain") == "plain");
  }
}
