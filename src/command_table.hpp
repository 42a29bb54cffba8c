#pragma once

#include <functional>
#include <string>
#include <vector>

namespace cerberus_dash {

// Console command, typed as "/name" or "/alias"
struct SlashCommand {
    std::string name;
    std::string alias;
    std::string description;
    std::function<void()> handler;
};

// Slash-command lookup, execution and tab completion for the console input
// line. Knows nothing about the terminal, so it can run headless.
class CommandTable {
public:
    enum class Outcome {
        Empty,      // Blank input, nothing to do
        Executed,
        Unknown
    };

    void add(SlashCommand command);
    const std::vector<SlashCommand>& commands() const { return commands_; }

    // Matches a name or an alias, without the leading '/'
    const SlashCommand* find(const std::string& word) const;

    // Names (not aliases) starting with `prefix`, in registration order
    std::vector<std::string> with_prefix(const std::string& prefix) const;

    // First word of an input line with surrounding blanks and one leading
    // '/' removed: "  /pause now" -> "pause"
    static std::string command_word(const std::string& input);

    // Runs the handler named by `input`; `word` receives the looked-up word
    Outcome execute(const std::string& input, std::string& word) const;

    // Input line after Tab: always starts with '/', extended to the longest
    // prefix shared by every matching name
    std::string complete(const std::string& input) const;

    // Status-bar text for a partially typed line
    std::string hint(const std::string& input) const;

private:
    std::vector<SlashCommand> commands_;
};

} // namespace cerberus_dash
