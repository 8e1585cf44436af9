#include "app/ConsoleCommands.h"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace app {
namespace {

std::vector<std::string> splitWords(std::string_view line) {
    std::istringstream iss{std::string(line)};
    std::vector<std::string> words;
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::int64_t parseTime(const std::string& value) {
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid time '" + value + "'");
    }
    if (consumed != value.size() || parsed <= 0) {
        throw std::invalid_argument("invalid time '" + value + "'");
    }
    return static_cast<std::int64_t>(parsed);
}

void expectArgs(const std::vector<std::string>& words, std::size_t count, const char* usage) {
    if (words.size() != count + 1) {
        throw std::invalid_argument(std::string("usage: ") + usage);
    }
}

}  // namespace

std::optional<Command> parseCommand(std::string_view line) {
    const auto words = splitWords(line);
    if (words.empty()) {
        return std::nullopt;
    }

    Command command;
    const auto& verb = words.front();
    if (verb == "older" || verb == "newer") {
        expectArgs(words, 1, "older|newer <time-seconds>");
        command.kind = verb == "older" ? CommandKind::Older : CommandKind::Newer;
        command.time = parseTime(words[1]);
    } else if (verb == "switch") {
        expectArgs(words, 2, "switch <symbol> <granularity>");
        const auto granularity = domain::granularityFromString(words[2]);
        if (!granularity) {
            throw std::invalid_argument("unsupported granularity '" + words[2] + "'");
        }
        command.kind = CommandKind::Switch;
        command.key = domain::makeSeriesKey(words[1], *granularity);
        if (command.key.symbol.empty()) {
            throw std::invalid_argument("symbol cannot be empty");
        }
    } else if (verb == "status") {
        expectArgs(words, 0, "status");
        command.kind = CommandKind::Status;
    } else if (verb == "quit" || verb == "exit") {
        expectArgs(words, 0, "quit");
        command.kind = CommandKind::Quit;
    } else {
        throw std::invalid_argument("unknown command '" + verb + "'");
    }
    return command;
}

}  // namespace app
