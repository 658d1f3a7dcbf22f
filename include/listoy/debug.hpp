#ifndef LISTOY_DEBUG_HPP
#define LISTOY_DEBUG_HPP

#include <iostream>
#include <ostream>

#include "list.hpp"

namespace listoy {

// Prints every value in order, with no separator, followed by a newline.
void dump(const TextList& list, std::ostream& out = std::cout);
void dump_reversed(const TextList& list, std::ostream& out = std::cout);

} // namespace listoy

#endif // LISTOY_DEBUG_HPP
