#pragma once

#include "chatbot/config.h"
#include "chatbot/text.h"
#include "chatbot/vocabulary.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chatbot {

// Tab separated "input\ttarget" lines. With normalize=true both sides go through normalize_string.
std::vector<SentencePair> read_pairs(const std::string& path, bool normalize = false);
void write_pairs(const std::string& path, const std::vector<SentencePair>& pairs);

struct PreparedData {
    VocabularyBuilder builder;
    std::vector<SentencePair> pairs;
};

// Read, normalize and length-filter the pairs file, then count every word.
PreparedData prepare_data(const std::string& datafile, const std::string& corpus_name = CORPUS_NAME);

// Trims the vocabulary and drops every pair that now contains an unknown word.
std::vector<SentencePair> trim_rare_words(VocabularyBuilder& builder, const std::vector<SentencePair>& pairs,
                                          int64_t min_count = MIN_WORD_COUNT);

void save_vocabulary(const Vocabulary& vocab, const std::string& path);
std::shared_ptr<const Vocabulary> load_vocabulary(const std::string& path, const std::string& name = CORPUS_NAME);

} // namespace chatbot
