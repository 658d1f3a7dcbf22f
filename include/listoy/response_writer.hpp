#ifndef LISTOY_RESPONSE_WRITER_HPP
#define LISTOY_RESPONSE_WRITER_HPP

#include <cstdint>
#include <ostream>
#include <string_view>
#include <vector>

namespace listoy {

// Renders shell replies, one typed value per call.
class ResponseWriter {
    public:
        static void write_nil(std::ostream& out) {
            out << "(nil)\n";
        }

        static void write_ok(std::ostream& out) {
            out << "OK\n";
        }

        static void write_error(std::ostream& out, std::string_view msg) {
            out << "(error) ERR " << msg << '\n';
        }

        static void write_integer(std::ostream& out, std::int64_t value) {
            out << "(integer) " << value << '\n';
        }

        static void write_string(std::ostream& out, std::string_view str) {
            append_quoted(out, str);
            out << '\n';
        }

        static void write_array(std::ostream& out, const std::vector<std::string_view>& items) {
            if (items.empty()) {
                out << "(empty array)\n";
                return;
            }
            for (std::size_t i = 0; i < items.size(); ++i) {
                out << (i + 1) << ") ";
                append_quoted(out, items[i]);
                out << '\n';
            }
        }

    private:
        // same escapes the request parser accepts
        static void append_quoted(std::ostream& out, std::string_view str) {
            out << '"';
            for (char c : str) {
                if (c == '"' || c == '\\') {
                    out << '\\';
                }
                out << c;
            }
            out << '"';
        }
    };

} // namespace listoy

#endif // LISTOY_RESPONSE_WRITER_HPP
