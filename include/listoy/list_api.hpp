#ifndef LISTOY_LIST_API_HPP
#define LISTOY_LIST_API_HPP

#include <iostream>
#include <memory>
#include <optional>
#include <string_view>

#include "common.hpp"
#include "list.hpp"

// Free-function surface over TextList and ListIterator: the value comes
// first and the list last. dispose() and dispose_iterator() take ownership,
// so a disposed handle cannot be used again.

namespace listoy {

[[nodiscard]] std::unique_ptr<TextList> create(const ListConfig& config = {});
void dispose(std::unique_ptr<TextList> list) noexcept;

// Views into the list; each stays valid until its element is removed or the
// list is cleared or disposed.
[[nodiscard]] std::optional<std::string_view> first(const TextList& list) noexcept;
[[nodiscard]] std::optional<std::string_view> last(const TextList& list) noexcept;
[[nodiscard]] std::size_t count(const TextList& list) noexcept;

[[nodiscard]] Result<void> append(std::string_view value, TextList& list);
[[nodiscard]] Result<void> prepend(std::string_view value, TextList& list);
bool remove(std::string_view value, TextList& list);
[[nodiscard]] bool contains(std::string_view value, const TextList& list) noexcept;

[[nodiscard]] ListIterator iterate(const TextList& list) noexcept;
[[nodiscard]] ListIterator reverse_iterate(const TextList& list) noexcept;
void dispose_iterator(ListIterator&& iterator) noexcept;

std::optional<std::string_view> next(ListIterator& iterator);

} // namespace listoy

#endif // LISTOY_LIST_API_HPP
