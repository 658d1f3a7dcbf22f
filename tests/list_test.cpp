#include <gtest/gtest.h>
#include "listoy/list.hpp"
#include <algorithm>
#include <list>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using listoy::ListConfig;
using listoy::TextList;

namespace listoy {

// Reaches into the arena to corrupt it or observe its bookkeeping.
struct TextListTestAccess {
    static void set_count(TextList& list, std::size_t count) { list.count_ = count; }

    // Points the second element's back link at itself.
    static void break_back_link(TextList& list) {
        NodeIndex second = list.nodes_[list.nodes_[HEAD].next].next;
        list.nodes_[second].previous = second;
    }

    static std::size_t arena_size(const TextList& list) { return list.nodes_.size(); }
    static std::size_t free_slot_capacity(const TextList& list) { return list.free_slots_.capacity(); }
};

} // namespace listoy

using listoy::TextListTestAccess;

static std::vector<std::string> forward_values(const TextList& list) {
    return {list.begin(), list.end()};
}

static std::vector<std::string> backward_values(const TextList& list) {
    return {list.rbegin(), list.rend()};
}

/* ///////////////////
EMPTY LIST
*/ ///////////////////

TEST(TextListTest, EmptyListHasZeroElements) {
    TextList list;
    EXPECT_EQ(list.count(), 0u);
    EXPECT_TRUE(list.empty());
    EXPECT_TRUE(list.check_invariants());
}

TEST(TextListTest, FirstAndLastAreAbsentOnEmptyList) {
    TextList list;
    EXPECT_FALSE(list.first().has_value());
    EXPECT_FALSE(list.last().has_value());
}

TEST(TextListTest, EmptyListContainsNothing) {
    TextList list;
    EXPECT_FALSE(list.contains(""));
    EXPECT_FALSE(list.contains("anything"));
    EXPECT_TRUE(list.begin() == list.end());
}

/* ///////////////////
INSERTION
*/ ///////////////////

TEST(TextListTest, AppendSingleElement) {
    TextList list;
    EXPECT_FALSE(list.contains("last"));
    ASSERT_TRUE(list.append("last"));

    EXPECT_TRUE(list.contains("last"));
    EXPECT_EQ(list.count(), 1u);
    EXPECT_EQ(list.first().value_or("<none>"), "last");
    EXPECT_EQ(list.last().value_or("<none>"), "last");
}

TEST(TextListTest, PrependSingleElement) {
    TextList list;
    EXPECT_FALSE(list.contains("first"));
    ASSERT_TRUE(list.prepend("first"));

    EXPECT_TRUE(list.contains("first"));
    EXPECT_EQ(list.count(), 1u);
    EXPECT_EQ(list.first().value_or("<none>"), "first");
    EXPECT_EQ(list.last().value_or("<none>"), "first");
}

TEST(TextListTest, PrependAppendDeleteScenario) {
    TextList list;

    ASSERT_TRUE(list.prepend("first"));
    EXPECT_EQ(list.count(), 1u);
    EXPECT_EQ(list.first().value_or("<none>"), "first");
    EXPECT_EQ(list.last().value_or("<none>"), "first");

    ASSERT_TRUE(list.append("last"));
    EXPECT_EQ(list.count(), 2u);
    EXPECT_EQ(list.first().value_or("<none>"), "first");
    EXPECT_EQ(list.last().value_or("<none>"), "last");

    EXPECT_TRUE(list.remove("first"));
    EXPECT_EQ(list.count(), 1u);
    EXPECT_FALSE(list.contains("first"));
    EXPECT_TRUE(list.contains("last"));
    EXPECT_TRUE(list.check_invariants());
}

TEST(TextListTest, AppendAndPrependKeepOrder) {
    TextList list;
    ASSERT_TRUE(list.append("b"));
    ASSERT_TRUE(list.append("c"));
    ASSERT_TRUE(list.prepend("a"));
    ASSERT_TRUE(list.append("d"));

    EXPECT_EQ(forward_values(list), (std::vector<std::string>{"a", "b", "c", "d"}));
    EXPECT_EQ(backward_values(list), (std::vector<std::string>{"d", "c", "b", "a"}));
}

TEST(TextListTest, StoresIndependentCopy) {
    TextList list;
    std::string buffer = "original";
    ASSERT_TRUE(list.append(buffer));

    buffer.assign("overwritten");
    buffer.clear();
    buffer.shrink_to_fit();

    EXPECT_EQ(list.first().value_or("<none>"), "original");
    EXPECT_TRUE(list.contains("original"));
}

TEST(TextListTest, EmptyStringIsAValue) {
    TextList list;
    ASSERT_TRUE(list.append(""));

    ASSERT_TRUE(list.first().has_value());
    EXPECT_EQ(*list.first(), "");
    EXPECT_TRUE(list.contains(""));
    EXPECT_TRUE(list.remove(""));
    EXPECT_TRUE(list.empty());
}

TEST(TextListTest, ComparesBytesNotPrefixes) {
    TextList list;
    ASSERT_TRUE(list.append(std::string("a\0b", 3)));

    EXPECT_FALSE(list.contains("a"));
    EXPECT_TRUE(list.contains(std::string("a\0b", 3)));
    EXPECT_FALSE(list.contains("A\0b"));
}

TEST(TextListTest, FirstAndLastViewsSurviveLaterInsertions) {
    TextList list;
    ASSERT_TRUE(list.append("short"));
    ASSERT_TRUE(list.append("tail"));
    std::optional<std::string_view> first = list.first();
    std::optional<std::string_view> last = list.last();

    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(i % 2 ? list.append("x") : list.prepend("y"));
    }
    EXPECT_TRUE(list.remove("x"));

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(std::string(first->begin(), first->end()), "short");
    EXPECT_EQ(std::string(last->begin(), last->end()), "tail");
}

/* ///////////////////
DELETION
*/ ///////////////////

TEST(TextListTest, DeleteMissingValueLeavesListUnchanged) {
    TextList list;
    ASSERT_TRUE(list.append("one"));
    ASSERT_TRUE(list.append("two"));
    auto generation = list.generation();

    EXPECT_FALSE(list.remove("three"));
    EXPECT_EQ(list.count(), 2u);
    EXPECT_EQ(forward_values(list), (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(list.generation(), generation);
}

TEST(TextListTest, DeleteFromEmptyListReportsNotFound) {
    TextList list;
    EXPECT_FALSE(list.remove("ghost"));
    EXPECT_EQ(list.count(), 0u);
    EXPECT_TRUE(list.check_invariants());
}

TEST(TextListTest, DeleteRemovesOnlyFirstMatch) {
    TextList list;
    for (const char* value : {"x", "y", "x", "z"}) {
        ASSERT_TRUE(list.append(value));
    }

    EXPECT_TRUE(list.remove("x"));
    EXPECT_EQ(forward_values(list), (std::vector<std::string>{"y", "x", "z"}));
    EXPECT_TRUE(list.contains("x"));

    EXPECT_TRUE(list.remove("x"));
    EXPECT_FALSE(list.contains("x"));
    EXPECT_EQ(list.count(), 2u);
}

TEST(TextListTest, DeleteEndsAndMiddle) {
    TextList list;
    for (const char* value : {"a", "b", "c", "d", "e"}) {
        ASSERT_TRUE(list.append(value));
    }

    EXPECT_TRUE(list.remove("a"));
    EXPECT_EQ(list.first().value_or("<none>"), "b");
    EXPECT_TRUE(list.remove("e"));
    EXPECT_EQ(list.last().value_or("<none>"), "d");
    EXPECT_TRUE(list.remove("c"));

    EXPECT_EQ(forward_values(list), (std::vector<std::string>{"b", "d"}));
    EXPECT_EQ(backward_values(list), (std::vector<std::string>{"d", "b"}));
    EXPECT_TRUE(list.check_invariants());
}

TEST(TextListTest, DeleteLastRemainingElementEmptiesList) {
    TextList list;
    ASSERT_TRUE(list.append("only"));
    EXPECT_TRUE(list.remove("only"));

    EXPECT_TRUE(list.empty());
    EXPECT_FALSE(list.first().has_value());
    EXPECT_FALSE(list.last().has_value());
    EXPECT_TRUE(list.check_invariants());
}

TEST(TextListTest, CountIsCorrectAfterMixedOperations) {
    TextList list;
    ASSERT_TRUE(list.append("first"));
    EXPECT_EQ(list.count(), 1u);
    ASSERT_TRUE(list.prepend("last"));
    EXPECT_EQ(list.count(), 2u);
    EXPECT_TRUE(list.remove("first"));
    EXPECT_TRUE(list.remove("last"));
    EXPECT_EQ(list.count(), 0u);
}

/* ///////////////////
ARENA AND CONFIG
*/ ///////////////////

TEST(TextListTest, ReleasedSlotsAreReused) {
    TextList list;
    for (int round = 0; round < 50; ++round) {
        ASSERT_TRUE(list.append("value " + std::to_string(round)));
        ASSERT_TRUE(list.prepend("other " + std::to_string(round)));
        EXPECT_TRUE(list.remove("value " + std::to_string(round)));
        EXPECT_TRUE(list.remove("other " + std::to_string(round)));
        ASSERT_TRUE(list.check_invariants());
    }
    EXPECT_TRUE(list.empty());
}

TEST(TextListTest, FreeSlotReserveGrowsGeometrically) {
    TextList list;
    std::size_t capacity = TextListTestAccess::free_slot_capacity(list);
    int reallocations = 0;

    for (int i = 0; i < 4096; ++i) {
        ASSERT_TRUE(list.append(std::to_string(i)));
        std::size_t now = TextListTestAccess::free_slot_capacity(list);
        EXPECT_GE(now, TextListTestAccess::arena_size(list));
        if (now != capacity) {
            reallocations++;
            capacity = now;
        }
    }
    EXPECT_LE(reallocations, 16);

    // releasing slots only pushes into the reserved space
    for (int i = 0; i < 4096; ++i) {
        ASSERT_TRUE(list.remove(std::to_string(i)));
    }
    EXPECT_EQ(TextListTestAccess::free_slot_capacity(list), capacity);
    EXPECT_TRUE(list.check_invariants());
}

TEST(TextListTest, MaxNodesIsEnforced) {
    TextList list(ListConfig{.max_nodes = 2});
    ASSERT_TRUE(list.append("one"));
    ASSERT_TRUE(list.prepend("zero"));

    testing::internal::CaptureStderr();
    auto result = list.append("two");
    std::string log = testing::internal::GetCapturedStderr();

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), std::make_error_code(std::errc::not_enough_memory));
    EXPECT_NE(log.find("insert rejected"), std::string::npos);
    EXPECT_EQ(list.count(), 2u);
    EXPECT_EQ(forward_values(list), (std::vector<std::string>{"zero", "one"}));

    EXPECT_TRUE(list.remove("zero"));
    EXPECT_TRUE(list.prepend("again"));
    EXPECT_EQ(forward_values(list), (std::vector<std::string>{"again", "one"}));
}

TEST(TextListTest, ZeroMaxNodesRejectsEverything) {
    TextList list(ListConfig{.max_nodes = 0});

    testing::internal::CaptureStderr();
    auto appended = list.append("x");
    auto prepended = list.prepend("x");
    testing::internal::GetCapturedStderr();

    EXPECT_FALSE(appended);
    EXPECT_FALSE(prepended);
    EXPECT_TRUE(list.empty());
    EXPECT_EQ(list.generation(), 0u);
}

TEST(TextListTest, MaxNodesIsClampedToIndexSpace) {
    TextList list(ListConfig{.max_nodes = static_cast<std::size_t>(-1)});
    EXPECT_EQ(list.config().max_nodes, listoy::MAX_INDEXABLE_NODES);
}

TEST(TextListTest, InitialCapacityDoesNotCreateElements) {
    TextList list(ListConfig{.initial_capacity = 64});
    EXPECT_TRUE(list.empty());
    EXPECT_FALSE(list.first().has_value());
    EXPECT_TRUE(list.check_invariants());
}

TEST(TextListTest, CheckedListAcceptsValidMutations) {
    TextList list(ListConfig{.check_invariants = true});
    EXPECT_NO_THROW({
        ASSERT_TRUE(list.append("a"));
        ASSERT_TRUE(list.prepend("b"));
        EXPECT_TRUE(list.remove("a"));
        EXPECT_TRUE(list.remove("b"));
    });
    EXPECT_TRUE(list.empty());
}

/* ///////////////////
INVARIANT CHECKS
*/ ///////////////////

TEST(TextListTest, CheckInvariantsReportsCountMismatch) {
    TextList list;
    ASSERT_TRUE(list.append("a"));
    ASSERT_TRUE(list.append("b"));
    TextListTestAccess::set_count(list, 3);

    testing::internal::CaptureStderr();
    auto result = list.check_invariants();
    std::string log = testing::internal::GetCapturedStderr();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), std::make_error_code(std::errc::state_not_recoverable));
    EXPECT_NE(log.find("list invariant broken at slot"), std::string::npos);
    EXPECT_NE(log.find("forward walk shorter than count"), std::string::npos);
}

TEST(TextListTest, CheckInvariantsReportsBrokenBackLink) {
    TextList list;
    for (const char* value : {"a", "b", "c"}) {
        ASSERT_TRUE(list.append(value));
    }
    TextListTestAccess::break_back_link(list);

    testing::internal::CaptureStderr();
    auto result = list.check_invariants();
    std::string log = testing::internal::GetCapturedStderr();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), std::make_error_code(std::errc::state_not_recoverable));
    EXPECT_NE(log.find("neighbours do not link back"), std::string::npos);
}

TEST(TextListTest, CheckedListThrowsOnCorruptedLinkage) {
    TextList list(ListConfig{.check_invariants = true});
    ASSERT_TRUE(list.append("a"));
    TextListTestAccess::set_count(list, 5);

    testing::internal::CaptureStderr();
    EXPECT_THROW((void)list.append("b"), std::logic_error);
    EXPECT_THROW(list.remove("a"), std::logic_error);
    std::string log = testing::internal::GetCapturedStderr();
    EXPECT_NE(log.find("list invariant broken"), std::string::npos);
}

TEST(TextListTest, UncheckedListDoesNotVerifyMutations) {
    TextList list;
    ASSERT_TRUE(list.append("a"));
    TextListTestAccess::set_count(list, 5);

    testing::internal::CaptureStderr();
    EXPECT_NO_THROW((void)list.append("b"));
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
}

/* ///////////////////
CLEAR
*/ ///////////////////

TEST(TextListTest, ClearReleasesEverything) {
    TextList list;
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(list.append(std::to_string(i)));
    }
    EXPECT_TRUE(list.remove("3"));

    list.clear();
    EXPECT_TRUE(list.empty());
    EXPECT_FALSE(list.first().has_value());
    EXPECT_FALSE(list.contains("0"));
    EXPECT_TRUE(list.check_invariants());

    ASSERT_TRUE(list.append("fresh"));
    EXPECT_EQ(forward_values(list), (std::vector<std::string>{"fresh"}));
}

/* ///////////////////
RANDOMISED
*/ ///////////////////

TEST(TextListTest, RandomOperationsMatchStdList) {
    TextList list;
    std::list<std::string> model;
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> op_dist(0, 3);
    std::uniform_int_distribution<int> value_dist(0, 20);

    for (int i = 0; i < 2000; ++i) {
        std::string value = "v" + std::to_string(value_dist(rng));
        switch (op_dist(rng)) {
            case 0:
                ASSERT_TRUE(list.append(value));
                model.push_back(value);
                break;
            case 1:
                ASSERT_TRUE(list.prepend(value));
                model.push_front(value);
                break;
            case 2: {
                auto it = std::find(model.begin(), model.end(), value);
                bool present = it != model.end();
                if (present) {
                    model.erase(it);
                }
                EXPECT_EQ(list.remove(value), present);
                break;
            }
            case 3:
                EXPECT_EQ(list.contains(value),
                          std::find(model.begin(), model.end(), value) != model.end());
                break;
        }
        ASSERT_EQ(list.count(), model.size());
    }

    EXPECT_TRUE(list.check_invariants());
    EXPECT_EQ(forward_values(list), (std::vector<std::string>(model.begin(), model.end())));
    EXPECT_EQ(backward_values(list), (std::vector<std::string>(model.rbegin(), model.rend())));
    EXPECT_EQ(static_cast<std::size_t>(std::distance(list.begin(), list.end())), list.count());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
