#include <catch2/catch_test_macros.hpp>
#include "command_table.hpp"
#include <string>
#include <vector>

using namespace cerberus_dash;

namespace {

// Same shape as the console's table; handlers record what ran
CommandTable make_table(std::vector<std::string>& ran) {
    CommandTable table;
    table.add({"quit", "q", "Exit the dashboard", [&ran]() { ran.push_back("quit"); }});
    table.add({"pause", "p", "Freeze the stream pane", [&ran]() { ran.push_back("pause"); }});
    table.add({"clear", "", "Clear the stream pane", [&ran]() { ran.push_back("clear"); }});
    table.add({"sources", "", "List configured sources", [&ran]() { ran.push_back("sources"); }});
    table.add({"status", "", "Query service status", [&ran]() { ran.push_back("status"); }});
    table.add({"help", "h", "Show this list", [&ran]() { ran.push_back("help"); }});
    return table;
}

} // namespace

TEST_CASE("Command word extraction", "[commands]") {
    REQUIRE(CommandTable::command_word("/pause") == "pause");
    REQUIRE(CommandTable::command_word("  /pause now ") == "pause");
    REQUIRE(CommandTable::command_word("status") == "status");
    REQUIRE(CommandTable::command_word("/") == "");
    REQUIRE(CommandTable::command_word("   ") == "");
    REQUIRE(CommandTable::command_word("//quit") == "/quit");
}

TEST_CASE("Commands run by name or alias", "[commands]") {
    std::vector<std::string> ran;
    auto table = make_table(ran);
    std::string word;

    SECTION("Full name") {
        REQUIRE(table.execute("/sources", word) == CommandTable::Outcome::Executed);
        REQUIRE(word == "sources");
        REQUIRE(ran == std::vector<std::string>{"sources"});
    }

    SECTION("Alias and trailing arguments") {
        REQUIRE(table.execute(" /q please", word) == CommandTable::Outcome::Executed);
        REQUIRE(word == "q");
        REQUIRE(ran == std::vector<std::string>{"quit"});
    }

    SECTION("Commands without an alias do not match the empty alias") {
        REQUIRE(table.find("") == nullptr);
        REQUIRE(table.find("clear") != nullptr);
        REQUIRE(table.find("c") == nullptr);
    }

    SECTION("Unknown command reports the word and runs nothing") {
        REQUIRE(table.execute("/restart tor", word) == CommandTable::Outcome::Unknown);
        REQUIRE(word == "restart");
        REQUIRE(ran.empty());
    }

    SECTION("Blank input") {
        REQUIRE(table.execute("", word) == CommandTable::Outcome::Empty);
        REQUIRE(table.execute("  / ", word) == CommandTable::Outcome::Empty);
        REQUIRE(ran.empty());
    }

    SECTION("A command with no handler still counts as executed") {
        table.add({"noop", "", "Does nothing", nullptr});
        REQUIRE(table.execute("/noop", word) == CommandTable::Outcome::Executed);
    }
}

TEST_CASE("Prefix matching uses names only", "[commands]") {
    std::vector<std::string> ran;
    auto table = make_table(ran);

    REQUIRE(table.with_prefix("s") == std::vector<std::string>{"sources", "status"});
    REQUIRE(table.with_prefix("p") == std::vector<std::string>{"pause"});
    REQUIRE(table.with_prefix("").size() == 6);
    REQUIRE(table.with_prefix("x").empty());
}

TEST_CASE("Tab completion", "[commands]") {
    std::vector<std::string> ran;
    auto table = make_table(ran);

    SECTION("Unique prefix completes the whole name") {
        REQUIRE(table.complete("/pa") == "/pause");
        REQUIRE(table.complete("/he") == "/help");
    }

    SECTION("Shared prefix extends only as far as the candidates agree") {
        REQUIRE(table.complete("/s") == "/s");
        REQUIRE(table.complete("/so") == "/sources");
        REQUIRE(table.complete("/st") == "/status");
    }

    SECTION("Missing slash is added") {
        REQUIRE(table.complete("cl") == "/clear");
        REQUIRE(table.complete("") == "/");
    }

    SECTION("No match leaves the text alone") {
        REQUIRE(table.complete("/zzz") == "/zzz");
        REQUIRE(table.complete("zzz") == "/zzz");
    }

    SECTION("Completion never runs a command") {
        table.complete("/qu");
        REQUIRE(ran.empty());
    }
}

TEST_CASE("Input hints", "[commands]") {
    std::vector<std::string> ran;
    auto table = make_table(ran);

    REQUIRE(table.hint("") == "Type /help for commands");
    REQUIRE(table.hint("pause") == "Commands start with /");
    REQUIRE(table.hint("/s") == "Tab: sources, status");
    REQUIRE(table.hint("/status") == "");
    REQUIRE(table.hint("/h") == "");
    REQUIRE(table.hint("/nope") == "(no match)");
}
