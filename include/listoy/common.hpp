#ifndef LISTOY_COMMON_HPP
#define LISTOY_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <system_error>

namespace listoy {

// Error handling with std::expected
template<typename T>
using Result = std::expected<T, std::error_code>;

using NodeIndex = std::uint32_t;

// slots 0 and 1 of every arena are the head and tail sentinels
constexpr NodeIndex HEAD = 0;
constexpr NodeIndex TAIL = 1;
constexpr std::size_t RESERVED_SLOTS = 2;

constexpr std::size_t MAX_INDEXABLE_NODES =
    std::numeric_limits<NodeIndex>::max() - RESERVED_SLOTS;
constexpr std::size_t DEFAULT_MAX_NODES = MAX_INDEXABLE_NODES;

struct ListConfig {
    std::size_t max_nodes = DEFAULT_MAX_NODES; // elements allowed before append/prepend fail
    std::size_t initial_capacity = 0; // arena slots reserved up front
    bool check_invariants = false; // verify the linkage after every mutation
};

} // namespace listoy

#endif // LISTOY_COMMON_HPP
