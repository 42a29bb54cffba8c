#include "command_table.hpp"
#include "log_normalizer.hpp"
#include <algorithm>

namespace cerberus_dash {

void CommandTable::add(SlashCommand command) {
    commands_.push_back(std::move(command));
}

const SlashCommand* CommandTable::find(const std::string& word) const {
    if (word.empty()) return nullptr;
    for (const auto& command : commands_) {
        if (word == command.name || (!command.alias.empty() && word == command.alias)) {
            return &command;
        }
    }
    return nullptr;
}

std::vector<std::string> CommandTable::with_prefix(const std::string& prefix) const {
    std::vector<std::string> names;
    for (const auto& command : commands_) {
        if (command.name.compare(0, prefix.size(), prefix) == 0) {
            names.push_back(command.name);
        }
    }
    return names;
}

std::string CommandTable::command_word(const std::string& input) {
    std::string line = trim(input);
    if (!line.empty() && line.front() == '/') line.erase(0, 1);
    return line.substr(0, line.find(' '));
}

CommandTable::Outcome CommandTable::execute(const std::string& input, std::string& word) const {
    word = command_word(input);
    if (word.empty()) return Outcome::Empty;

    const auto* command = find(word);
    if (!command) return Outcome::Unknown;

    if (command->handler) command->handler();
    return Outcome::Executed;
}

std::string CommandTable::complete(const std::string& input) const {
    std::string line = input;
    if (line.empty() || line.front() != '/') {
        line = "/" + line;
    }

    auto matches = with_prefix(line.substr(1));
    if (matches.empty()) return line;

    std::string common = matches.front();
    for (const auto& name : matches) {
        auto diverge = std::mismatch(common.begin(), common.end(), name.begin(), name.end());
        common.erase(diverge.first, common.end());
    }
    if (common.size() + 1 > line.size()) {
        line = "/" + common;
    }
    return line;
}

std::string CommandTable::hint(const std::string& input) const {
    if (input.empty()) return "Type /help for commands";
    if (input.front() != '/') return "Commands start with /";

    std::string prefix = input.substr(1);
    if (find(prefix)) return "";

    auto matches = with_prefix(prefix);
    if (matches.empty()) return "(no match)";

    std::string hint = "Tab: ";
    for (size_t i = 0; i < matches.size(); ++i) {
        hint += (i == 0 ? "" : ", ") + matches[i];
    }
    return hint;
}

} // namespace cerberus_dash
