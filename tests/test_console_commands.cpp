#include <iostream>
#include <stdexcept>
#include <string>

#include "app/ConsoleCommands.h"

int main() {
    using app::CommandKind;
    using app::parseCommand;

    {
        const auto older = parseCommand("older 1699999200");
        const auto newer = parseCommand("  newer   1700003600 ");
        if (!older || older->kind != CommandKind::Older || older->time != 1699999200 || !newer ||
            newer->kind != CommandKind::Newer || newer->time != 1700003600) {
            std::cerr << "Viewport commands not parsed\n";
            return 1;
        }
    }

    {
        const auto command = parseCommand("switch ethusdt 4h");
        if (!command || command->kind != CommandKind::Switch || command->key.symbol != "ETHUSDT" ||
            command->key.granularity != domain::Granularity::FourHours) {
            std::cerr << "Switch command not parsed\n";
            return 1;
        }
    }

    if (parseCommand("   ").has_value() || parseCommand("quit")->kind != CommandKind::Quit ||
        parseCommand("status")->kind != CommandKind::Status) {
        std::cerr << "Simple commands not parsed\n";
        return 1;
    }

    for (const std::string bad : {"older", "older soon", "older -5", "switch BTCUSDT", "switch BTCUSDT 1M", "jump 5",
                                  "quit now"}) {
        try {
            parseCommand(bad);
            std::cerr << "Expected '" << bad << "' to be rejected\n";
            return 1;
        } catch (const std::invalid_argument&) {
        }
    }

    std::cout << "test_console_commands passed\n";
    return 0;
}
