#ifndef LISTOY_COMMAND_PROCESSOR_HPP
#define LISTOY_COMMAND_PROCESSOR_HPP

#include <ostream>
#include <string>
#include <vector>

#include "list.hpp"

namespace listoy {

enum class CommandStatus {
    Continue,
    Quit
};

// Applies one parsed shell command to a list and writes the reply.
class CommandProcessor {
    public:
        // command arguments, the reply stream and the list being driven
        struct CommandContext {
            const std::vector<std::string>& args;
            std::ostream& out;
            TextList& list;
        };

        // Unknown commands and wrong argument counts are answered with an
        // error reply; nothing here throws for bad input.
        static CommandStatus process_command(CommandContext ctx);
    };

} // namespace listoy

#endif // LISTOY_COMMAND_PROCESSOR_HPP
