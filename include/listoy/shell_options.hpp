#ifndef LISTOY_SHELL_OPTIONS_HPP
#define LISTOY_SHELL_OPTIONS_HPP

#include <string_view>
#include <vector>

#include "common.hpp"

namespace listoy {

// Builds the list configuration from the shell's flags (argv without the
// program name). A bad flag is logged and reported as invalid_argument.
[[nodiscard]] Result<ListConfig> parse_shell_args(const std::vector<std::string_view>& args);

} // namespace listoy

#endif // LISTOY_SHELL_OPTIONS_HPP
