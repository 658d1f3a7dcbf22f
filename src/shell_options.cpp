#include "listoy/shell_options.hpp"
#include "listoy/logging.hpp"

#include <charconv>
#include <system_error>

namespace listoy {

Result<ListConfig> parse_shell_args(const std::vector<std::string_view>& args) {
    auto invalid = [] { return std::unexpected(std::make_error_code(std::errc::invalid_argument)); };

    ListConfig config;
    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];
        if (arg == "--check-invariants") {
            config.check_invariants = true;
        } else if (arg == "--max-nodes") {
            if (i + 1 == args.size()) {
                log_message("missing value for --max-nodes");
                return invalid();
            }
            std::string_view value = args[++i];
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), config.max_nodes);
            if (ec != std::errc{} || end != value.data() + value.size()) {
                log_message("invalid --max-nodes value '{}'", value);
                return invalid();
            }
        } else {
            log_message("unrecognised argument '{}'", arg);
            return invalid();
        }
    }
    return config;
}

} // namespace listoy
