#include "listoy/command_processor.hpp"
#include "listoy/debug.hpp"
#include "listoy/response_writer.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>
#include <string_view>
#include <unordered_map>

namespace listoy {

namespace {

using CommandContext = CommandProcessor::CommandContext;
using Handler = CommandStatus (*)(CommandContext);

// lambda function to convert a string to lowercase
constexpr auto to_lower = [](std::string_view str) {
    std::string result;
    result.reserve(str.size());
    std::ranges::transform(str, std::back_inserter(result),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
};

bool require_args(CommandContext ctx, std::size_t expected, std::string_view usage) {
    if (ctx.args.size() == expected) {
        return true;
    }
    ResponseWriter::write_error(ctx.out, std::format("wrong number of arguments, usage: {}", usage));
    return false;
}

CommandStatus insert(CommandContext ctx, bool at_front) {
    if (!require_args(ctx, 2, at_front ? "prepend <value>" : "append <value>")) {
        return CommandStatus::Continue;
    }

    auto result = at_front ? ctx.list.prepend(ctx.args[1]) : ctx.list.append(ctx.args[1]);
    if (!result) {
        ResponseWriter::write_error(ctx.out, result.error().message());
        return CommandStatus::Continue;
    }
    ResponseWriter::write_integer(ctx.out, static_cast<std::int64_t>(ctx.list.count()));
    return CommandStatus::Continue;
}

CommandStatus handle_append(CommandContext ctx) {
    return insert(ctx, false);
}

CommandStatus handle_prepend(CommandContext ctx) {
    return insert(ctx, true);
}

CommandStatus handle_delete(CommandContext ctx) {
    if (require_args(ctx, 2, "delete <value>")) {
        ResponseWriter::write_integer(ctx.out, ctx.list.remove(ctx.args[1]) ? 1 : 0);
    }
    return CommandStatus::Continue;
}

CommandStatus handle_contains(CommandContext ctx) {
    if (require_args(ctx, 2, "contains <value>")) {
        ResponseWriter::write_integer(ctx.out, ctx.list.contains(ctx.args[1]) ? 1 : 0);
    }
    return CommandStatus::Continue;
}

CommandStatus write_optional(CommandContext ctx, std::optional<std::string_view> value) {
    if (value) {
        ResponseWriter::write_string(ctx.out, *value);
    } else {
        ResponseWriter::write_nil(ctx.out);
    }
    return CommandStatus::Continue;
}

CommandStatus handle_first(CommandContext ctx) {
    if (!require_args(ctx, 1, "first")) {
        return CommandStatus::Continue;
    }
    return write_optional(ctx, ctx.list.first());
}

CommandStatus handle_last(CommandContext ctx) {
    if (!require_args(ctx, 1, "last")) {
        return CommandStatus::Continue;
    }
    return write_optional(ctx, ctx.list.last());
}

CommandStatus handle_count(CommandContext ctx) {
    if (require_args(ctx, 1, "count")) {
        ResponseWriter::write_integer(ctx.out, static_cast<std::int64_t>(ctx.list.count()));
    }
    return CommandStatus::Continue;
}

CommandStatus handle_dump(CommandContext ctx) {
    if (require_args(ctx, 1, "dump")) {
        dump(ctx.list, ctx.out);
    }
    return CommandStatus::Continue;
}

CommandStatus handle_dump_reversed(CommandContext ctx) {
    if (require_args(ctx, 1, "dump-reversed")) {
        dump_reversed(ctx.list, ctx.out);
    }
    return CommandStatus::Continue;
}

CommandStatus walk(CommandContext ctx, Direction direction) {
    std::vector<std::string_view> items;
    items.reserve(ctx.list.count());

    ListIterator it = ctx.list.iterate(direction);
    while (auto value = it.next()) {
        items.push_back(*value);
    }
    ResponseWriter::write_array(ctx.out, items);
    return CommandStatus::Continue;
}

CommandStatus handle_iterate(CommandContext ctx) {
    if (!require_args(ctx, 1, "iterate")) {
        return CommandStatus::Continue;
    }
    return walk(ctx, Direction::Forward);
}

CommandStatus handle_reverse_iterate(CommandContext ctx) {
    if (!require_args(ctx, 1, "reverse-iterate")) {
        return CommandStatus::Continue;
    }
    return walk(ctx, Direction::Backward);
}

CommandStatus handle_clear(CommandContext ctx) {
    if (require_args(ctx, 1, "clear")) {
        ctx.list.clear();
        ResponseWriter::write_ok(ctx.out);
    }
    return CommandStatus::Continue;
}

CommandStatus handle_check(CommandContext ctx) {
    if (!require_args(ctx, 1, "check")) {
        return CommandStatus::Continue;
    }
    if (auto result = ctx.list.check_invariants(); !result) {
        ResponseWriter::write_error(ctx.out, result.error().message());
    } else {
        ResponseWriter::write_ok(ctx.out);
    }
    return CommandStatus::Continue;
}

CommandStatus handle_help(CommandContext ctx) {
    if (!require_args(ctx, 1, "help")) {
        return CommandStatus::Continue;
    }
    ctx.out << "append <value>      add value at the end\n"
               "prepend <value>     add value at the front\n"
               "delete <value>      remove the first matching value\n"
               "contains <value>    1 if value is present\n"
               "first | last        value at either end\n"
               "count               number of values\n"
               "dump                print values in order\n"
               "dump-reversed       print values in reverse order\n"
               "iterate             list values front to back\n"
               "reverse-iterate     list values back to front\n"
               "clear               remove every value\n"
               "check               verify the list linkage\n"
               "quit                leave the shell\n"
               "Quote a value (\"...\") to keep surrounding blanks or pass an empty string.\n";
    return CommandStatus::Continue;
}

CommandStatus handle_quit(CommandContext ctx) {
    if (!require_args(ctx, 1, "quit")) {
        return CommandStatus::Continue;
    }
    return CommandStatus::Quit;
}

const std::unordered_map<std::string_view, Handler> command_handlers = {
    {"append", handle_append},
    {"prepend", handle_prepend},
    {"delete", handle_delete},
    {"contains", handle_contains},
    {"first", handle_first},
    {"last", handle_last},
    {"count", handle_count},
    {"dump", handle_dump},
    {"dump-reversed", handle_dump_reversed},
    {"iterate", handle_iterate},
    {"reverse-iterate", handle_reverse_iterate},
    {"clear", handle_clear},
    {"check", handle_check},
    {"help", handle_help},
    {"quit", handle_quit},
};

} // namespace

CommandStatus CommandProcessor::process_command(CommandContext ctx) {
    if (ctx.args.empty()) {
        return CommandStatus::Continue;
    }

    const auto command_it = command_handlers.find(to_lower(ctx.args[0]));
    if (command_it == command_handlers.end()) {
        ResponseWriter::write_error(ctx.out, std::format("unknown command '{}', try 'help'", ctx.args[0]));
        return CommandStatus::Continue;
    }

    return command_it->second(ctx);
}

} // namespace listoy
