#ifndef LISTOY_REQUEST_PARSER_HPP
#define LISTOY_REQUEST_PARSER_HPP

#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "common.hpp"

namespace listoy {

// Splits one shell line into a command word and at most one argument.
// The argument is either the rest of the line, leading blanks dropped, or a
// double-quoted string with \" and \\ escapes.
class RequestParser {
    public:
        static Result<std::vector<std::string>> parse(std::string_view line) {
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }

            line = skip_blanks(line);
            std::vector<std::string> cmd;
            if (line.empty()) {
                return cmd;
            }

            std::size_t word_end = line.find_first_of(BLANKS);
            cmd.emplace_back(line.substr(0, word_end));
            if (word_end == std::string_view::npos) {
                return cmd;
            }

            std::string_view rest = skip_blanks(line.substr(word_end));
            if (rest.empty()) {
                return cmd;
            }
            if (rest.front() != '"') {
                cmd.emplace_back(rest);
                return cmd;
            }

            std::string arg;
            std::size_t pos = 1;
            while (true) {
                if (pos >= rest.size()) {
                    return std::unexpected(std::make_error_code(std::errc::bad_message)); // unterminated quote
                }
                char c = rest[pos++];
                if (c == '"') {
                    break;
                }
                if (c == '\\') {
                    if (pos >= rest.size()) {
                        return std::unexpected(std::make_error_code(std::errc::bad_message));
                    }
                    c = rest[pos++];
                    if (c != '"' && c != '\\') {
                        return std::unexpected(std::make_error_code(std::errc::bad_message));
                    }
                }
                arg.push_back(c);
            }

            if (!skip_blanks(rest.substr(pos)).empty()) {
                return std::unexpected(std::make_error_code(std::errc::bad_message)); // text after the closing quote
            }

            cmd.push_back(std::move(arg));
            return cmd;
        }

    private:
        static constexpr std::string_view BLANKS = " \t";

        static std::string_view skip_blanks(std::string_view text) noexcept {
            std::size_t start = text.find_first_not_of(BLANKS);
            return start == std::string_view::npos ? std::string_view{} : text.substr(start);
        }
    };

} // namespace listoy

#endif // LISTOY_REQUEST_PARSER_HPP
