#ifndef LISTOY_LIST_HPP
#define LISTOY_LIST_HPP

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "common.hpp"

namespace listoy {

enum class Direction : std::uint8_t {
    Forward,  // follows next, ends at the tail sentinel
    Backward  // follows previous, ends at the head sentinel
};

// Thrown by ListIterator::next() when the list changed after the iterator
// was created.
class IteratorInvalidated : public std::logic_error {
public:
    IteratorInvalidated() : std::logic_error("list was modified while being iterated") {}
};

class TextList;
struct TextListTestAccess;

// Lazy, finite, non-restartable cursor over a TextList. Holds a position,
// never ownership: it must not outlive the list it was created from, and
// the list must not be mutated while it is being iterated.
class ListIterator {
public:
    // Yields the value under the cursor and advances, or std::nullopt once
    // the boundary sentinel is reached. The view stays valid until that
    // element is removed or the list is cleared or destroyed.
    std::optional<std::string_view> next();

    [[nodiscard]] Direction direction() const noexcept { return direction_; }
    [[nodiscard]] bool exhausted() const noexcept { return current_ == end_; }

    // Parks the cursor on its boundary sentinel for good.
    void finish() noexcept { current_ = end_; }

private:
    ListIterator(const TextList& list, Direction direction) noexcept;

    const TextList* list_;
    NodeIndex current_;
    NodeIndex end_;
    Direction direction_;
    std::uint64_t generation_;

    friend class TextList;
};

// Doubly linked list of owned strings between two permanent sentinels.
// Nodes live in a vector-backed arena and link to each other by index;
// slot HEAD and slot TAIL are the sentinels and never carry a value.
//
// Not thread-safe: concurrent users must guard the whole list with one
// external lock.
class TextList {
public:
    class const_iterator {
    public:
        using iterator_category = std::bidirectional_iterator_tag;
        using value_type = std::string_view;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = std::string_view;

        const_iterator() noexcept = default;

        reference operator*() const noexcept { return *list_->nodes_[current_].value; }

        const_iterator& operator++() noexcept {
            current_ = list_->nodes_[current_].next;
            return *this;
        }

        const_iterator operator++(int) noexcept {
            const_iterator tmp = *this;
            ++*this;
            return tmp;
        }

        const_iterator& operator--() noexcept {
            current_ = list_->nodes_[current_].previous;
            return *this;
        }

        const_iterator operator--(int) noexcept {
            const_iterator tmp = *this;
            --*this;
            return tmp;
        }

        bool operator==(const const_iterator& other) const noexcept {
            return current_ == other.current_ && list_ == other.list_;
        }

    private:
        const_iterator(const TextList* list, NodeIndex node) noexcept
            : list_(list), current_(node) {}

        const TextList* list_{nullptr};
        NodeIndex current_{TAIL};

        friend class TextList;
    };

    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    TextList();
    explicit TextList(const ListConfig& config);
    ~TextList() = default;

    // Iterators refer to the list by address.
    TextList(const TextList&) = delete;
    TextList& operator=(const TextList&) = delete;
    TextList(TextList&&) = delete;
    TextList& operator=(TextList&&) = delete;

    [[nodiscard]] Result<void> append(std::string_view value);
    [[nodiscard]] Result<void> prepend(std::string_view value);

    // Removes the first element equal to value. Returns false, leaving the
    // list untouched, when there is no such element.
    bool remove(std::string_view value);

    // Releases every element; the sentinels stay.
    void clear() noexcept;

    // The returned view stays valid until that element is removed or the
    // list is cleared or destroyed; other insertions do not move it.
    [[nodiscard]] std::optional<std::string_view> first() const noexcept {
        return value_at(nodes_[HEAD].next);
    }
    [[nodiscard]] std::optional<std::string_view> last() const noexcept {
        return value_at(nodes_[TAIL].previous);
    }

    [[nodiscard]] std::size_t count() const noexcept { return count_; }
    [[nodiscard]] bool empty() const noexcept { return count_ == 0; }
    [[nodiscard]] bool contains(std::string_view value) const noexcept;

    [[nodiscard]] ListIterator iterate(Direction direction = Direction::Forward) const noexcept;
    [[nodiscard]] ListIterator reverse_iterate() const noexcept { return iterate(Direction::Backward); }

    [[nodiscard]] const_iterator begin() const noexcept { return {this, nodes_[HEAD].next}; }
    [[nodiscard]] const_iterator end() const noexcept { return {this, TAIL}; }
    [[nodiscard]] const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator(end()); }
    [[nodiscard]] const_reverse_iterator rend() const noexcept { return const_reverse_iterator(begin()); }

    // Walks the chain both ways and the free slots, logging the first
    // violation found.
    [[nodiscard]] Result<void> check_invariants() const;

    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }
    [[nodiscard]] const ListConfig& config() const noexcept { return config_; }

private:
    struct Node {
        NodeIndex previous{HEAD};
        NodeIndex next{TAIL};
        // set iff the slot holds an element; boxed so that growing the
        // arena never moves the characters a caller is viewing
        std::unique_ptr<std::string> value;
    };

    std::vector<Node> nodes_;
    std::vector<NodeIndex> free_slots_;
    std::size_t count_{0};
    std::uint64_t generation_{0};
    ListConfig config_;

    Result<NodeIndex> allocate_node(std::string_view value);
    void release_node(NodeIndex node) noexcept;

    void link_after(NodeIndex anchor, NodeIndex node) noexcept;
    void unlink(NodeIndex node) noexcept;

    // Index of the first element equal to value, or TAIL when absent.
    [[nodiscard]] NodeIndex find(std::string_view value) const noexcept;
    [[nodiscard]] NodeIndex step(NodeIndex node, Direction direction) const noexcept;

    // Empty for the sentinels, whose value slot is never set.
    [[nodiscard]] std::optional<std::string_view> value_at(NodeIndex node) const noexcept {
        if (!nodes_[node].value) {
            return std::nullopt;
        }
        return *nodes_[node].value;
    }

    Result<void> insert_after(NodeIndex anchor, std::string_view value);
    // Throws std::logic_error when config_.check_invariants is set and the
    // chain no longer holds together.
    void verify_after_mutation() const;

    friend class ListIterator;
    friend struct TextListTestAccess;
};

} // namespace listoy

#endif // LISTOY_LIST_HPP
