#include "listoy/debug.hpp"

namespace listoy {

void dump(const TextList& list, std::ostream& out) {
    for (std::string_view value : list) {
        out << value;
    }
    out << '\n';
}

void dump_reversed(const TextList& list, std::ostream& out) {
    for (auto it = list.rbegin(); it != list.rend(); ++it) {
        out << *it;
    }
    out << '\n';
}

} // namespace listoy
