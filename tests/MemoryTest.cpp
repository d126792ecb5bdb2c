#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "Memory.hpp"

TEST(MemoryTest, BanLineIsInclusive) {
    Memory memory(0.7);
    EXPECT_FALSE(memory.isBanned(0.0));
    EXPECT_FALSE(memory.isBanned(0.6999999));
    EXPECT_TRUE(memory.isBanned(0.7));
    EXPECT_TRUE(memory.isBanned(0.95));
}

TEST(MemoryTest, AddStoresAllowedScore) {
    Memory memory(0.7);
    ASSERT_TRUE(memory.add(Category::PHRASES, "good job", 0.25));
    EXPECT_TRUE(memory.contains(Category::PHRASES, "good job"));
    EXPECT_DOUBLE_EQ(memory.get(Category::PHRASES).at("good job"), 0.25);
}

TEST(MemoryTest, AddClampsJustBelowTheLine) {
    Memory memory(0.7);
    ASSERT_TRUE(memory.add(Category::WORDS, "edge", 0.7 - 1e-9));
    double stored = memory.get(Category::WORDS).at("edge");
    EXPECT_LT(stored, 0.7);
    EXPECT_DOUBLE_EQ(stored, 0.7 - Memory::CLAMP_MARGIN);
}

TEST(MemoryTest, AddRejectsBannedScore) {
    Memory memory(0.7);
    EXPECT_FALSE(memory.add(Category::WORDS, "bad", 0.7));
    EXPECT_FALSE(memory.add(Category::WORDS, "worse", 0.99));
    EXPECT_EQ(memory.size(Category::WORDS), 0u);
}

TEST(MemoryTest, AddRejectsNonFiniteScore) {
    Memory memory(0.7);
    EXPECT_FALSE(memory.add(Category::WORDS, "nan", std::numeric_limits<double>::quiet_NaN()));
    EXPECT_EQ(memory.size(Category::WORDS), 0u);
}

TEST(MemoryTest, AddOverwritesExistingText) {
    Memory memory(0.7);
    memory.add(Category::PHRASES, "hi", 0.1);
    memory.add(Category::PHRASES, "hi", 0.3);
    EXPECT_EQ(memory.size(Category::PHRASES), 1u);
    EXPECT_DOUBLE_EQ(memory.get(Category::PHRASES).at("hi"), 0.3);
}

TEST(MemoryTest, RejectedAddKeepsPreviousEntry) {
    Memory memory(0.7);
    memory.add(Category::PHRASES, "hi", 0.1);
    EXPECT_FALSE(memory.add(Category::PHRASES, "hi", 0.8));
    EXPECT_DOUBLE_EQ(memory.get(Category::PHRASES).at("hi"), 0.1);
}

TEST(MemoryTest, UnknownCategoryNameChangesNothing) {
    Memory memory(0.7);
    memory.add(Category::WORDS, "hello", 0.1);

    EXPECT_FALSE(memory.add("emojis", "smile", 0.1));
    EXPECT_FALSE(memory.add("Words", "smile", 0.1));
    EXPECT_FALSE(memory.remove("emojis", "hello"));
    EXPECT_TRUE(memory.getAllowed("emojis").empty());

    EXPECT_EQ(memory.size(Category::WORDS), 1u);
    EXPECT_EQ(memory.size(Category::PHRASES), 0u);
    EXPECT_EQ(memory.size(Category::GAME_IDEAS), 0u);
}

TEST(MemoryTest, CategoryNamesDispatchToPartitions) {
    Memory memory(0.7);
    EXPECT_TRUE(memory.add("game_ideas", "race snails", 0.2));
    EXPECT_TRUE(memory.contains(Category::GAME_IDEAS, "race snails"));
    EXPECT_FALSE(memory.contains(Category::PHRASES, "race snails"));
    EXPECT_EQ(memory.getAllowed("game_ideas").size(), 1u);
    EXPECT_TRUE(memory.remove("game_ideas", "race snails"));
    EXPECT_FALSE(memory.contains(Category::GAME_IDEAS, "race snails"));
}

TEST(MemoryTest, CategoriesAreIndependent) {
    Memory memory(0.7);
    memory.add(Category::WORDS, "same", 0.1);
    memory.add(Category::PHRASES, "same", 0.2);
    memory.remove(Category::WORDS, "same");
    EXPECT_FALSE(memory.contains(Category::WORDS, "same"));
    EXPECT_DOUBLE_EQ(memory.get(Category::PHRASES).at("same"), 0.2);
}

TEST(MemoryTest, RemoveAbsentIsNoOp) {
    Memory memory(0.7);
    memory.add(Category::WORDS, "keep", 0.1);
    memory.remove(Category::WORDS, "missing");
    EXPECT_EQ(memory.size(Category::WORDS), 1u);
}

TEST(MemoryTest, GetAllowedHidesForcedBannedEntries) {
    Memory memory(0.7);
    memory.add(Category::WORDS, "nice", 0.1);
    memory.forceAdd(Category::WORDS, "badword", 0.9);

    EXPECT_EQ(memory.size(Category::WORDS), 2u);
    auto allowed = memory.getAllowed(Category::WORDS);
    EXPECT_EQ(allowed.size(), 1u);
    EXPECT_EQ(allowed.count("nice"), 1u);
    EXPECT_DOUBLE_EQ(memory.get(Category::WORDS).at("badword"), 0.9);
}

TEST(MemoryTest, ClearEmptiesEveryCategory) {
    Memory memory(0.7);
    for (Category category : ALL_CATEGORIES) {
        memory.add(category, "x", 0.1);
    }
    memory.clear();
    for (Category category : ALL_CATEGORIES) {
        EXPECT_EQ(memory.size(category), 0u);
    }
}

TEST(MemoryTest, ThresholdIsPerInstance) {
    Memory strict(0.3);
    Memory lenient(0.9);
    EXPECT_FALSE(strict.add(Category::WORDS, "meh", 0.5));
    EXPECT_TRUE(lenient.add(Category::WORDS, "meh", 0.5));
    EXPECT_DOUBLE_EQ(strict.banThreshold(), 0.3);
}
