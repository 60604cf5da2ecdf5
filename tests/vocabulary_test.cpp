#include "chatbot/vocabulary.h"

#include "chatbot/config.h"
#include "chatbot/errors.h"

#include <gtest/gtest.h>

#include <iostream>

namespace chatbot {
namespace {

void add_times(VocabularyBuilder& builder, const std::string& word, int times) {
    for (int i = 0; i < times; ++i) builder.add_word(word);
}

void expect_inverse_maps(const Vocabulary& vocab) {
    EXPECT_EQ(vocab.word2idx().size(), vocab.idx2word().size());
    for (const auto& entry : vocab.idx2word()) {
        if (entry.first < NUM_RESERVED) continue;
        ASSERT_TRUE(vocab.find(entry.second).has_value()) << entry.second;
        EXPECT_EQ(*vocab.find(entry.second), entry.first);
    }
    for (const auto& entry : vocab.word2idx()) {
        EXPECT_EQ(vocab.word_at(entry.second), entry.first);
    }
}

TEST(VocabularyTest, StartsWithReservedTokens) {
    VocabularyBuilder builder("test");
    const Vocabulary& vocab = builder.view();
    EXPECT_EQ(vocab.num_words(), 3);
    EXPECT_EQ(vocab.word_at(PAD_TOKEN), "<PAD>");
    EXPECT_EQ(vocab.word_at(SOS_TOKEN), "<SOS>");
    EXPECT_EQ(vocab.word_at(EOS_TOKEN), "<EOS>");
    EXPECT_TRUE(vocab.word2cnt().empty());
    EXPECT_FALSE(vocab.trimmed());
}

TEST(VocabularyTest, AssignsIndicesInFirstSeenOrderAndCounts) {
    VocabularyBuilder builder("test");
    builder.add_sentence("hi there hi");
    builder.add_sentence("you  there");

    const Vocabulary& vocab = builder.view();
    EXPECT_EQ(vocab.num_words(), 6);
    EXPECT_EQ(*vocab.find("hi"), 3);
    EXPECT_EQ(*vocab.find("there"), 4);
    EXPECT_EQ(*vocab.find("you"), 5);
    EXPECT_EQ(vocab.count("hi"), 2);
    EXPECT_EQ(vocab.count("there"), 2);
    EXPECT_EQ(vocab.count("you"), 1);
    EXPECT_FALSE(vocab.find("nope").has_value());
    expect_inverse_maps(vocab);
}

TEST(VocabularyTest, IndexesFromSentenceAppendsEos) {
    VocabularyBuilder builder("test");
    builder.add_sentence("hi there");
    auto vocab = builder.freeze();

    EXPECT_EQ(vocab->indexes_from_sentence("hi there"), (std::vector<int64_t>{3, 4, 2}));
    EXPECT_EQ(vocab->indexes_from_sentence("hi"), (std::vector<int64_t>{3, 2}));
    EXPECT_EQ(vocab->indexes_from_sentence(""), (std::vector<int64_t>{EOS_TOKEN}));
}

TEST(VocabularyTest, UnknownTokenIsALookupError) {
    VocabularyBuilder builder("test");
    builder.add_sentence("hi there");
    auto vocab = builder.freeze();

    EXPECT_THROW(vocab->indexes_from_sentence("hi stranger"), LookupError);
    EXPECT_FALSE(vocab->contains_all("hi stranger"));
    EXPECT_TRUE(vocab->contains_all("there hi"));
}

TEST(VocabularyTest, TrimKeepsFrequentWordsAndReportsRatio) {
    VocabularyBuilder builder("test");
    add_times(builder, "a", 5);
    add_times(builder, "b", 2);
    add_times(builder, "c", 1);

    std::optional<TrimStats> stats = builder.trim(3);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->kept, 1);
    EXPECT_EQ(stats->total, 3);
    EXPECT_DOUBLE_EQ(stats->ratio(), 1.0 / 3.0);

    const Vocabulary& vocab = builder.view();
    EXPECT_TRUE(vocab.trimmed());
    EXPECT_EQ(vocab.num_words(), 4);
    EXPECT_EQ(*vocab.find("a"), 3);
    EXPECT_FALSE(vocab.find("b").has_value());
    EXPECT_FALSE(vocab.find("c").has_value());
    expect_inverse_maps(vocab);
}

// Rebuilding re-adds survivors once each, so their counts drop back to 1.
TEST(VocabularyTest, TrimResetsSurvivorCountsToOne) {
    VocabularyBuilder builder("test");
    add_times(builder, "a", 5);
    builder.trim(3);
    EXPECT_EQ(builder.view().count("a"), 1);
}

TEST(VocabularyTest, TrimPreservesFirstSeenOrder) {
    VocabularyBuilder builder("test");
    builder.add_sentence("x y z w");
    builder.add_sentence("y z w");
    builder.add_sentence("w z y");

    builder.trim(3);
    const Vocabulary& vocab = builder.view();
    EXPECT_FALSE(vocab.find("x").has_value());
    EXPECT_EQ(*vocab.find("y"), 3);
    EXPECT_EQ(*vocab.find("z"), 4);
    EXPECT_EQ(*vocab.find("w"), 5);
    expect_inverse_maps(vocab);
}

TEST(VocabularyTest, TrimRunsOnlyOnce) {
    VocabularyBuilder builder("test");
    add_times(builder, "a", 5);
    add_times(builder, "b", 2);
    builder.trim(2);
    auto before = builder.freeze();

    EXPECT_FALSE(builder.trim(5).has_value());
    const Vocabulary& after = builder.view();
    EXPECT_EQ(after.word2idx(), before->word2idx());
    EXPECT_EQ(after.word2cnt(), before->word2cnt());
    EXPECT_EQ(after.idx2word(), before->idx2word());
}

TEST(VocabularyTest, TrimmedBuilderRejectsNewWords) {
    VocabularyBuilder builder("test");
    add_times(builder, "a", 3);
    builder.trim(3);

    EXPECT_THROW(builder.add_word("a"), ValidationError);
    EXPECT_THROW(builder.add_sentence("b c"), ValidationError);
    EXPECT_EQ(builder.view().num_words(), 4);
    EXPECT_EQ(builder.view().count("a"), 1);
}

TEST(VocabularyTest, TrimLeavesStdoutFormattingAlone) {
    VocabularyBuilder builder("test");
    add_times(builder, "a", 3);
    const std::ios_base::fmtflags flags = std::cout.flags();
    const std::streamsize precision = std::cout.precision();

    builder.trim(3);
    EXPECT_EQ(std::cout.flags(), flags);
    EXPECT_EQ(std::cout.precision(), precision);
}

TEST(VocabularyTest, TrimOnEmptyVocabularyHasZeroRatio) {
    VocabularyBuilder builder("empty");
    std::optional<TrimStats> stats = builder.trim(3);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total, 0);
    EXPECT_DOUBLE_EQ(stats->ratio(), 0.0);
    EXPECT_EQ(builder.view().num_words(), 3);
}

TEST(VocabularyTest, FrozenCopyIsIndependentOfBuilder) {
    VocabularyBuilder builder("test");
    builder.add_sentence("hi");
    auto frozen = builder.freeze();
    builder.add_sentence("there");
    EXPECT_EQ(frozen->num_words(), 4);
    EXPECT_FALSE(frozen->find("there").has_value());
}

TEST(VocabularyPersistenceTest, PersistedFormExcludesReservedTokens) {
    VocabularyBuilder builder("test");
    builder.add_sentence("hi there hi");
    nlohmann::json persisted = builder.view().to_json();

    EXPECT_EQ(persisted["word2idx"].size(), 2u);
    EXPECT_EQ(persisted["word2idx"]["hi"], 3);
    EXPECT_EQ(persisted["word2cnt"]["hi"], 2);
    EXPECT_EQ(persisted["idx2word"]["4"], "there");
    EXPECT_FALSE(persisted["word2idx"].contains("<PAD>"));
    EXPECT_FALSE(persisted["idx2word"].contains("0"));
}

TEST(VocabularyPersistenceTest, LoadReinsertsReservedTokens) {
    VocabularyBuilder builder("test");
    builder.add_sentence("hi there hi");
    builder.trim(1);

    Vocabulary loaded = Vocabulary::from_json(builder.view().to_json(), "loaded");
    EXPECT_EQ(loaded.name(), "loaded");
    EXPECT_TRUE(loaded.trimmed());
    EXPECT_EQ(loaded.num_words(), 5);
    EXPECT_EQ(*loaded.find("<PAD>"), PAD_TOKEN);
    EXPECT_EQ(*loaded.find("<SOS>"), SOS_TOKEN);
    EXPECT_EQ(*loaded.find("<EOS>"), EOS_TOKEN);
    EXPECT_EQ(loaded.indexes_from_sentence("hi there"), (std::vector<int64_t>{3, 4, 2}));
    EXPECT_EQ(loaded.word2cnt(), builder.view().word2cnt());
    expect_inverse_maps(loaded);
}

TEST(VocabularyPersistenceTest, LoadRejectsReservedEntries) {
    nlohmann::json with_pad = {{"word2idx", {{"<PAD>", 0}, {"hi", 3}}},
                               {"word2cnt", {{"hi", 1}}},
                               {"idx2word", {{"3", "hi"}}}};
    EXPECT_THROW(Vocabulary::from_json(with_pad, "bad"), ValidationError);

    nlohmann::json with_reserved_id = {{"word2idx", {{"hi", 1}}}, {"word2cnt", {{"hi", 1}}}, {"idx2word", {{"1", "hi"}}}};
    EXPECT_THROW(Vocabulary::from_json(with_reserved_id, "bad"), ValidationError);
}

TEST(VocabularyPersistenceTest, LoadRejectsInconsistentMaps) {
    nlohmann::json mismatch = {{"word2idx", {{"hi", 3}}}, {"word2cnt", {{"hi", 1}}}, {"idx2word", {{"3", "bye"}}}};
    EXPECT_THROW(Vocabulary::from_json(mismatch, "bad"), ValidationError);

    nlohmann::json missing = {{"word2idx", {{"hi", 3}}}};
    EXPECT_THROW(Vocabulary::from_json(missing, "bad"), ValidationError);

    nlohmann::json bad_key = {{"word2idx", {{"hi", 3}}}, {"word2cnt", {{"hi", 1}}}, {"idx2word", {{"three", "hi"}}}};
    EXPECT_THROW(Vocabulary::from_json(bad_key, "bad"), ValidationError);
}

} // namespace
} // namespace chatbot
