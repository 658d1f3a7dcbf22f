// Interactive shell over a single TextList
#include <cstdlib>       // EXIT_SUCCESS, EXIT_FAILURE
#include <exception>     // std::exception
#include <iostream>      // std::cin, std::cout, std::cerr
#include <string>
#include <string_view>
#include <vector>
#include <unistd.h>      // isatty

#include "listoy/command_processor.hpp"
#include "listoy/common.hpp"
#include "listoy/list.hpp"
#include "listoy/request_parser.hpp"
#include "listoy/response_writer.hpp"
#include "listoy/shell_options.hpp"

namespace {

void print_usage(std::ostream& out) {
    out << "usage: listoy-shell [--max-nodes N] [--check-invariants] [--help]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        for (int i = 1; i < argc; ++i) {
            if (std::string_view(argv[i]) == "--help") {
                print_usage(std::cout);
                return EXIT_SUCCESS;
            }
        }

        auto config = listoy::parse_shell_args(std::vector<std::string_view>(argv + 1, argv + argc));
        if (!config) {
            print_usage(std::cerr);
            return EXIT_FAILURE;
        }

        listoy::TextList list(*config);
        const bool interactive = isatty(STDIN_FILENO) != 0;

        std::string line;
        while (true) {
            if (interactive) {
                std::cout << "listoy> " << std::flush;
            }
            if (!std::getline(std::cin, line)) {
                break;
            }

            auto request = listoy::RequestParser::parse(line);
            if (!request) {
                listoy::ResponseWriter::write_error(std::cout, "malformed request: " + request.error().message());
                continue;
            }

            auto status = listoy::CommandProcessor::process_command({*request, std::cout, list});
            if (status == listoy::CommandStatus::Quit) {
                break;
            }
        }
        return EXIT_SUCCESS;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}
