#ifndef LISTOY_LOGGING_HPP
#define LISTOY_LOGGING_HPP

#include <iostream>
#include <string_view>
#include <chrono>
#include <ctime>
#include <source_location>
#include <format>

namespace listoy {

// Carries the format string together with the caller's location, so the
// location can be captured even though the arguments are variadic.
struct LogFormat {
    template<typename T>
    LogFormat(const T& text,
              const std::source_location& loc = std::source_location::current())
        : format(text), location(loc) {}

    std::string_view format;
    std::source_location location;
};

// variadic templates for multiple arguments.
template<typename... Args>
void log_message(LogFormat fmt, const Args&... args) {
    auto time_t_val = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()); // Get the current time and convert to "time_t".
    std::tm local_tm{};
    localtime_r(&time_t_val, &local_tm);
    char time_str[20]; // create a buffer of characters.
    std::strftime(time_str, sizeof(time_str), "%Y-%m-%d %H:%M:%S", &local_tm);

    std::cerr << std::format("[{}] {}:{} - ",
                             time_str,
                             fmt.location.file_name(),
                             fmt.location.line());

    std::cerr << std::vformat(fmt.format, std::make_format_args(args...)) << '\n';
}

/*

Example Usage:
log_message("append rejected: list already holds {} nodes", 4096);
log_message("invariant broken at slot {}: {}", 7, "previous.next != self");

Output:
[2026-10-16 18:05:12] list.cpp:58 - append rejected: list already holds 4096 nodes
[2026-10-16 18:05:12] list.cpp:203 - invariant broken at slot 7: previous.next != self

*/

} // namespace listoy

#endif // LISTOY_LOGGING_HPP
