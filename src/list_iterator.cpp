#include "listoy/list.hpp"
#include "listoy/logging.hpp"

namespace listoy {

ListIterator::ListIterator(const TextList& list, Direction direction) noexcept
    : list_(&list),
      current_(direction == Direction::Forward ? list.nodes_[HEAD].next : list.nodes_[TAIL].previous),
      end_(direction == Direction::Forward ? TAIL : HEAD),
      direction_(direction),
      generation_(list.generation_) {}

std::optional<std::string_view> ListIterator::next() {
    if (current_ == end_) {
        return std::nullopt;
    }

    if (generation_ != list_->generation_) {
        log_message("iterator created at generation {} used after the list moved to generation {}",
                    generation_, list_->generation_);
        throw IteratorInvalidated();
    }

    std::string_view value = *list_->nodes_[current_].value;
    current_ = list_->step(current_, direction_);
    return value;
}

} // namespace listoy
