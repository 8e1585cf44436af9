#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "domain/Types.h"

namespace app {

enum class CommandKind {
    Older,
    Newer,
    Switch,
    Status,
    Quit,
};

struct Command {
    CommandKind kind{CommandKind::Status};
    std::int64_t time{0};
    domain::SeriesKey key;
};

// Parses one console line:
//   older <time> | newer <time> | switch <symbol> <granularity> | status | quit
// Blank lines yield nullopt; anything else malformed throws std::invalid_argument.
std::optional<Command> parseCommand(std::string_view line);

}  // namespace app
