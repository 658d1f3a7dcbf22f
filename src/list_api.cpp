#include "listoy/list_api.hpp"

namespace listoy {

std::unique_ptr<TextList> create(const ListConfig& config) {
    return std::make_unique<TextList>(config);
}

void dispose(std::unique_ptr<TextList> list) noexcept {
    list.reset();
}

std::optional<std::string_view> first(const TextList& list) noexcept { return list.first(); }
std::optional<std::string_view> last(const TextList& list) noexcept { return list.last(); }
std::size_t count(const TextList& list) noexcept { return list.count(); }

Result<void> append(std::string_view value, TextList& list) { return list.append(value); }
Result<void> prepend(std::string_view value, TextList& list) { return list.prepend(value); }
bool remove(std::string_view value, TextList& list) { return list.remove(value); }

bool contains(std::string_view value, const TextList& list) noexcept {
    return list.contains(value);
}

ListIterator iterate(const TextList& list) noexcept { return list.iterate(); }
ListIterator reverse_iterate(const TextList& list) noexcept { return list.reverse_iterate(); }

void dispose_iterator(ListIterator&& iterator) noexcept {
    iterator.finish();
}

std::optional<std::string_view> next(ListIterator& iterator) { return iterator.next(); }

} // namespace listoy
