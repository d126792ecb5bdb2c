#include <gtest/gtest.h>

#include <string>

#include "Classifier.hpp"
#include "Encoder.hpp"
#include "TestSupport.hpp"

TEST(ClassifierTest, ScoreIsFirstOutputUnit) {
    Classifier pyx(testConfig());
    auto output = pyx.network().predict(Encoder::encode("hello", 64));
    EXPECT_DOUBLE_EQ(pyx.score("hello"), output[0]);
    EXPECT_GT(pyx.score("hello"), 0.0);
    EXPECT_LT(pyx.score("hello"), 1.0);
}

TEST(ClassifierTest, SafeLabelStoresBelowTheLine) {
    Classifier pyx(testConfig());
    EXPECT_EQ(pyx.setLabel("eat your veggies", true, "phrases"), "Marked SAFE and added.");

    const auto& phrases = pyx.memory().get(Category::PHRASES);
    ASSERT_EQ(phrases.count("eat your veggies"), 1u);
    EXPECT_LT(phrases.at("eat your veggies"), 0.7);
    EXPECT_EQ(pyx.memory().getAllowed("phrases").count("eat your veggies"), 1u);
}

TEST(ClassifierTest, BadLabelLeavesNoEntry) {
    Classifier pyx(testConfig());
    EXPECT_EQ(pyx.setLabel("kill yourself", false, "phrases"), "Marked BAD and removed.");
    EXPECT_FALSE(pyx.memory().contains(Category::PHRASES, "kill yourself"));
}

TEST(ClassifierTest, BadLabelRemovesEarlierSafeEntry) {
    Classifier pyx(testConfig());
    pyx.setLabel("shut up", true, Category::WORDS);
    ASSERT_TRUE(pyx.memory().contains(Category::WORDS, "shut up"));

    pyx.setLabel("shut up", false, Category::WORDS);
    EXPECT_FALSE(pyx.memory().contains(Category::WORDS, "shut up"));
}

TEST(ClassifierTest, LaterLabelWins) {
    Classifier pyx(testConfig());
    pyx.setLabel("cookie", false, Category::WORDS);
    pyx.setLabel("cookie", true, Category::WORDS);
    EXPECT_TRUE(pyx.memory().contains(Category::WORDS, "cookie"));
}

TEST(ClassifierTest, AddItemUnsafeStoresOverrideScore) {
    Classifier pyx(testConfig());
    pyx.addItem("badword", false, "words");

    const auto& words = pyx.memory().get(Category::WORDS);
    ASSERT_EQ(words.count("badword"), 1u);
    EXPECT_EQ(words.at("badword"), 0.9);
    EXPECT_TRUE(pyx.getWords().empty());
}

TEST(ClassifierTest, AddItemSafeStoresCurrentScore) {
    Classifier pyx(testConfig());
    pyx.addItem("rainbow", true, Category::WORDS);

    const auto& words = pyx.memory().get(Category::WORDS);
    ASSERT_EQ(words.count("rainbow"), 1u);
    EXPECT_DOUBLE_EQ(words.at("rainbow"), pyx.score("rainbow"));
}

TEST(ClassifierTest, UnsafeTrainingNeverStores) {
    Classifier pyx(testConfig());
    pyx.train("hurt other players", false, Category::GAME_IDEAS);
    pyx.train("hurt other players", false, Category::GAME_IDEAS, 20);
    EXPECT_EQ(pyx.memory().size(Category::GAME_IDEAS), 0u);
}

TEST(ClassifierTest, SafeTrainingStoresAndLowersScore) {
    Classifier pyx(testConfig());
    double before = pyx.score("thank you");
    pyx.train("thank you", true, Category::PHRASES);
    EXPECT_LT(pyx.score("thank you"), before);
    EXPECT_TRUE(pyx.memory().contains(Category::PHRASES, "thank you"));
}

TEST(ClassifierTest, ZeroEpochsReportsUnitLoss) {
    Classifier pyx(testConfig());
    EXPECT_DOUBLE_EQ(pyx.train("anything", true, Category::PHRASES, 0), 1.0);
}

TEST(ClassifierTest, AiDecideStoresSafeText) {
    ClassifierConfig cfg = testConfig();
    cfg.ban_threshold = 0.99;
    Classifier pyx(cfg);

    auto decision = pyx.aiDecide("let's play together", "phrases");
    EXPECT_TRUE(decision.safe);
    EXPECT_LT(decision.score, 0.99);
    EXPECT_TRUE(pyx.memory().contains(Category::PHRASES, "let's play together"));
}

TEST(ClassifierTest, AiDecideLeavesBannedTextAlone) {
    ClassifierConfig cfg = testConfig();
    cfg.ban_threshold = 0.01;
    Classifier pyx(cfg);

    double before = pyx.score("nobody likes you");
    auto decision = pyx.aiDecide("nobody likes you", "phrases");
    EXPECT_FALSE(decision.safe);
    EXPECT_DOUBLE_EQ(decision.score, before);
    EXPECT_EQ(pyx.memory().size(Category::PHRASES), 0u);
    // No training happened
    EXPECT_DOUBLE_EQ(pyx.score("nobody likes you"), before);
}

TEST(ClassifierTest, RespondFindsNearMatch) {
    Classifier pyx(testConfig());
    pyx.setLabel("playing Minecraft", true, "phrases");

    // Only the 'M'/'m' slot differs: similarity is about 0.576
    double similarity = Encoder::similarity(Encoder::encode("playing minecraft", 64),
                                            Encoder::encode("playing Minecraft", 64));
    ASSERT_GT(similarity, Classifier::MATCH_THRESHOLD);

    auto match = pyx.respond("playing minecraft", "phrases");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(*match, "playing Minecraft");
}

TEST(ClassifierTest, RespondRejectsDistantPrompt) {
    Classifier pyx(testConfig());
    pyx.setLabel("playing Minecraft", true, "phrases");
    EXPECT_FALSE(pyx.respond("the quick brown fox jumps over the lazy dog", "phrases").has_value());
}

TEST(ClassifierTest, RespondOnEmptyCategory) {
    Classifier pyx(testConfig());
    pyx.setLabel("playing Minecraft", true, "phrases");
    EXPECT_FALSE(pyx.respond("playing Minecraft", "words").has_value());
}

TEST(ClassifierTest, RespondBreaksTiesByText) {
    // '!' (33) and 'a' (97) hash to the same slot: identical encodings
    ASSERT_EQ(Encoder::encode("!", 64), Encoder::encode("a", 64));

    Classifier pyx(testConfig());
    pyx.setLabel("a", true, Category::WORDS);
    pyx.setLabel("!", true, Category::WORDS);
    ASSERT_EQ(pyx.memory().size(Category::WORDS), 2u);

    auto match = pyx.respond("a", Category::WORDS);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(*match, "!");
}

TEST(ClassifierTest, RespondSkipsItemsNowBanned) {
    Classifier pyx(testConfig());
    pyx.setLabel("hello", true, Category::WORDS);
    ASSERT_TRUE(pyx.memory().contains(Category::WORDS, "hello"));

    // Push the network's opinion of "hello" over the line without touching the store
    for (int i = 0; i < 200 && !pyx.isBanned(pyx.score("hello")); ++i) {
        pyx.train("hello", false, Category::WORDS, 5);
    }
    ASSERT_TRUE(pyx.isBanned(pyx.score("hello")));
    ASSERT_TRUE(pyx.memory().contains(Category::WORDS, "hello"));
    EXPECT_FALSE(pyx.respond("hello", Category::WORDS).has_value());
}

TEST(ClassifierTest, UnknownCategoryIsReported) {
    Classifier pyx(testConfig());
    EXPECT_THROW(pyx.train("x", true, "emojis"), UnknownCategoryError);
    EXPECT_THROW(pyx.addItem("x", true, "emojis"), UnknownCategoryError);
    EXPECT_THROW(pyx.aiDecide("x", "emojis"), UnknownCategoryError);
    EXPECT_THROW(pyx.setLabel("x", true, "emojis"), UnknownCategoryError);
    EXPECT_THROW(pyx.respond("x", "emojis"), UnknownCategoryError);
    for (Category category : ALL_CATEGORIES) {
        EXPECT_EQ(pyx.memory().size(category), 0u);
    }
}

TEST(ClassifierTest, ListingAccessorsFollowCategories) {
    Classifier pyx(testConfig());
    pyx.setLabel("puppy", true, Category::WORDS);
    pyx.setLabel("good job", true, Category::PHRASES);
    pyx.setLabel("race snails to the finish line", true, Category::GAME_IDEAS);

    EXPECT_EQ(pyx.getWords(), std::vector<std::string>{"puppy"});
    EXPECT_EQ(pyx.getPhrases(), std::vector<std::string>{"good job"});
    EXPECT_EQ(pyx.getGameIdeas(), std::vector<std::string>{"race snails to the finish line"});
}

TEST(ClassifierTest, WeightsStayFinite) {
    Classifier pyx(testConfig());
    for (int i = 0; i < 50; ++i) {
        pyx.setLabel("i hate you", false, Category::PHRASES);
        pyx.setLabel("you can do it", true, Category::PHRASES);
    }
    EXPECT_TRUE(pyx.network().isFinite());
}

TEST(ClassifierTest, SaveAndLoadThroughConfiguredPath) {
    TempDir dir;
    const std::string path = dir.file("data/pyx_memory.json");

    Classifier first(testConfig(path));
    first.setLabel("good job", true, Category::PHRASES);
    first.addItem("badword", false, Category::WORDS);
    ASSERT_TRUE(first.save());

    Classifier second(testConfig(path));
    ASSERT_EQ(second.load(), MemoryFile::LoadStatus::LOADED);
    for (Category category : ALL_CATEGORIES) {
        EXPECT_EQ(second.memory().get(category), first.memory().get(category));
    }
}

TEST(ClassifierTest, IndependentInstancesKeepTheirOwnSettings) {
    ClassifierConfig strict = testConfig();
    strict.ban_threshold = 0.2;
    ClassifierConfig lenient = testConfig();
    lenient.ban_threshold = 0.95;

    Classifier a(strict);
    Classifier b(lenient);
    EXPECT_TRUE(a.isBanned(0.5));
    EXPECT_FALSE(b.isBanned(0.5));
    EXPECT_DOUBLE_EQ(a.config().ban_threshold, 0.2);
}
