#include "listoy/list.hpp"
#include "listoy/logging.hpp"

#include <algorithm>
#include <memory>
#include <new>

namespace listoy {

TextList::TextList() : TextList(ListConfig{}) {}

TextList::TextList(const ListConfig& config) : config_(config) {
    config_.max_nodes = std::min(config_.max_nodes, MAX_INDEXABLE_NODES);

    nodes_.reserve(RESERVED_SLOTS + std::min(config_.initial_capacity, config_.max_nodes));
    nodes_.resize(RESERVED_SLOTS);

    // the sentinels are the anchor points for every insertion and deletion;
    // they are only released together with the arena
    nodes_[HEAD].previous = HEAD;
    nodes_[HEAD].next = TAIL;
    nodes_[TAIL].previous = HEAD;
    nodes_[TAIL].next = TAIL;
}

Result<void> TextList::append(std::string_view value) {
    return insert_after(nodes_[TAIL].previous, value);
}

Result<void> TextList::prepend(std::string_view value) {
    return insert_after(HEAD, value);
}

bool TextList::remove(std::string_view value) {
    NodeIndex node = find(value);
    if (node == TAIL) {
        return false;
    }

    unlink(node);
    release_node(node);
    count_--;
    generation_++;
    verify_after_mutation();
    return true;
}

void TextList::clear() noexcept {
    NodeIndex it = nodes_[HEAD].next;
    while (it != TAIL) {
        NodeIndex next = nodes_[it].next; // read before the slot is released
        nodes_[it].value.reset();
        it = next;
    }

    nodes_.erase(nodes_.begin() + RESERVED_SLOTS, nodes_.end());
    free_slots_.clear();
    nodes_[HEAD].next = TAIL;
    nodes_[TAIL].previous = HEAD;
    count_ = 0;
    generation_++;
}

bool TextList::contains(std::string_view value) const noexcept {
    return find(value) != TAIL;
}

ListIterator TextList::iterate(Direction direction) const noexcept {
    return ListIterator(*this, direction);
}

Result<void> TextList::check_invariants() const {
    auto broken = [](std::string_view what, NodeIndex node) -> Result<void> {
        log_message("list invariant broken at slot {}: {}", node, what);
        return std::unexpected(std::make_error_code(std::errc::state_not_recoverable));
    };

    if (nodes_.size() < RESERVED_SLOTS || nodes_[HEAD].value || nodes_[TAIL].value) {
        return broken("sentinel carries a value", HEAD);
    }
    if ((nodes_[HEAD].next == TAIL) != (count_ == 0) ||
        (nodes_[TAIL].previous == HEAD) != (count_ == 0)) {
        return broken("sentinels linked to each other iff the list is empty", HEAD);
    }

    std::size_t seen = 0;
    for (NodeIndex it = nodes_[HEAD].next; it != TAIL; it = nodes_[it].next) {
        if (it >= nodes_.size() || it == HEAD) {
            return broken("forward link out of range", it);
        }
        const Node& node = nodes_[it];
        if (node.previous >= nodes_.size() || node.next >= nodes_.size()) {
            return broken("link out of range", it);
        }
        if (!node.value) {
            return broken("reachable slot holds no value", it);
        }
        if (nodes_[node.previous].next != it || nodes_[node.next].previous != it) {
            return broken("neighbours do not link back", it);
        }
        if (++seen > count_) {
            return broken("forward walk longer than count", it);
        }
    }
    if (seen != count_) {
        return broken("forward walk shorter than count", TAIL);
    }

    seen = 0;
    for (NodeIndex it = nodes_[TAIL].previous; it != HEAD; it = nodes_[it].previous) {
        if (it >= nodes_.size() || it == TAIL) {
            return broken("backward link out of range", it);
        }
        if (++seen > count_) {
            return broken("backward walk longer than count", it);
        }
    }
    if (seen != count_) {
        return broken("backward walk shorter than count", HEAD);
    }

    for (NodeIndex slot : free_slots_) {
        if (slot < RESERVED_SLOTS || slot >= nodes_.size() || nodes_[slot].value) {
            return broken("free slot is in use", slot);
        }
    }
    if (count_ + free_slots_.size() + RESERVED_SLOTS != nodes_.size()) {
        return broken("arena slots unaccounted for", TAIL);
    }

    return {};
}

Result<NodeIndex> TextList::allocate_node(std::string_view value) {
    if (count_ >= config_.max_nodes) {
        log_message("insert rejected: list already holds {} of {} nodes", count_, config_.max_nodes);
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    try {
        if (!free_slots_.empty()) {
            NodeIndex slot = free_slots_.back();
            nodes_[slot].value = std::make_unique<std::string>(value); // copy first so a failure loses no slot
            free_slots_.pop_back();
            return slot;
        }

        nodes_.push_back(Node{HEAD, TAIL, std::make_unique<std::string>(value)});
        try {
            // keeps release_node() from ever allocating; grows geometrically
            // so that appends stay amortised constant
            if (free_slots_.capacity() < nodes_.size()) {
                free_slots_.reserve(2 * nodes_.size());
            }
        } catch (const std::bad_alloc&) {
            nodes_.pop_back();
            throw;
        }
        return static_cast<NodeIndex>(nodes_.size() - 1);
    } catch (const std::bad_alloc&) {
        log_message("insert rejected: out of memory copying a {} byte value", value.size());
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

void TextList::release_node(NodeIndex node) noexcept {
    nodes_[node].value.reset();
    nodes_[node].previous = HEAD;
    nodes_[node].next = TAIL;
    free_slots_.push_back(node);
}

void TextList::link_after(NodeIndex anchor, NodeIndex node) noexcept {
    NodeIndex next = nodes_[anchor].next;
    nodes_[node].next = next;
    nodes_[next].previous = node;
    nodes_[anchor].next = node;
    nodes_[node].previous = anchor;
}

void TextList::unlink(NodeIndex node) noexcept {
    nodes_[nodes_[node].previous].next = nodes_[node].next;
    nodes_[nodes_[node].next].previous = nodes_[node].previous;
}

NodeIndex TextList::find(std::string_view value) const noexcept {
    for (NodeIndex it = nodes_[HEAD].next; it != TAIL; it = nodes_[it].next) {
        if (*nodes_[it].value == value) {
            return it;
        }
    }
    return TAIL;
}

NodeIndex TextList::step(NodeIndex node, Direction direction) const noexcept {
    switch (direction) {
        case Direction::Forward:
            return nodes_[node].next;
        case Direction::Backward:
            return nodes_[node].previous;
    }
    return node;
}

Result<void> TextList::insert_after(NodeIndex anchor, std::string_view value) {
    auto node = allocate_node(value);
    if (!node) {
        return std::unexpected(node.error());
    }

    link_after(anchor, *node);
    count_++;
    generation_++;
    verify_after_mutation();
    return {};
}

void TextList::verify_after_mutation() const {
    if (config_.check_invariants && !check_invariants()) {
        throw std::logic_error("list linkage corrupted by the last mutation");
    }
}

} // namespace listoy
