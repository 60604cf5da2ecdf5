#include "chatbot/vocabulary.h"

#include "chatbot/config.h"
#include "chatbot/errors.h"
#include "chatbot/text.h"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace chatbot {

namespace {

bool is_reserved_word(const std::string& word) {
    return word == PAD_WORD || word == SOS_WORD || word == EOS_WORD;
}

int64_t parse_index(const std::string& key) {
    size_t consumed = 0;
    int64_t index = -1;
    try {
        index = std::stoll(key, &consumed);
    } catch (const std::logic_error&) {
        throw ValidationError("persisted vocabulary: idx2word key '" + key + "' is not an integer");
    }
    if (consumed != key.size())
        throw ValidationError("persisted vocabulary: idx2word key '" + key + "' is not an integer");
    return index;
}

const nlohmann::json& require_object(const nlohmann::json& persisted, const char* field) {
    if (!persisted.contains(field) || !persisted.at(field).is_object())
        throw ValidationError(std::string("persisted vocabulary: missing object '") + field + "'");
    return persisted.at(field);
}

} // namespace

Vocabulary::Vocabulary(std::string name) : name_(std::move(name)) {
    reset();
}

void Vocabulary::reset() {
    word2idx_.clear();
    word2cnt_.clear();
    idx2word_.clear();
    word2idx_[PAD_WORD] = PAD_TOKEN; idx2word_[PAD_TOKEN] = PAD_WORD;
    word2idx_[SOS_WORD] = SOS_TOKEN; idx2word_[SOS_TOKEN] = SOS_WORD;
    word2idx_[EOS_WORD] = EOS_TOKEN; idx2word_[EOS_TOKEN] = EOS_WORD;
}

void Vocabulary::add_word(const std::string& word) {
    auto it = word2idx_.find(word);
    if (it == word2idx_.end()) {
        const int64_t index = num_words();
        word2idx_[word] = index;
        word2cnt_[word] = 1;
        idx2word_[index] = word;
    } else if (it->second >= NUM_RESERVED) {
        ++word2cnt_[word];
    }
}

std::optional<int64_t> Vocabulary::find(const std::string& word) const {
    auto it = word2idx_.find(word);
    if (it == word2idx_.end()) return std::nullopt;
    return it->second;
}

const std::string& Vocabulary::word_at(int64_t index) const {
    auto it = idx2word_.find(index);
    if (it == idx2word_.end())
        throw LookupError("index " + std::to_string(index) + " is not in vocabulary '" + name_ + "'");
    return it->second;
}

int64_t Vocabulary::count(const std::string& word) const {
    auto it = word2cnt_.find(word);
    return it == word2cnt_.end() ? 0 : it->second;
}

std::vector<int64_t> Vocabulary::indexes_from_sentence(const std::string& sentence) const {
    std::vector<int64_t> indexes;
    for (const auto& word : split_words(sentence)) {
        std::optional<int64_t> index = find(word);
        if (!index)
            throw LookupError("word '" + word + "' is not in vocabulary '" + name_ + "'");
        indexes.push_back(*index);
    }
    indexes.push_back(EOS_TOKEN);
    return indexes;
}

bool Vocabulary::contains_all(const std::string& sentence) const {
    for (const auto& word : split_words(sentence)) {
        if (!find(word)) return false;
    }
    return true;
}

nlohmann::json Vocabulary::to_json() const {
    nlohmann::json word2idx = nlohmann::json::object();
    nlohmann::json word2cnt = nlohmann::json::object();
    nlohmann::json idx2word = nlohmann::json::object();
    for (const auto& entry : idx2word_) {
        if (entry.first < NUM_RESERVED) continue;
        word2idx[entry.second] = entry.first;
        word2cnt[entry.second] = count(entry.second);
        idx2word[std::to_string(entry.first)] = entry.second;
    }
    return {{"name", name_}, {"word2idx", word2idx}, {"word2cnt", word2cnt}, {"idx2word", idx2word}};
}

Vocabulary Vocabulary::from_json(const nlohmann::json& persisted, const std::string& name) {
    if (!persisted.is_object())
        throw ValidationError("persisted vocabulary is not a JSON object");
    const nlohmann::json& word2idx = require_object(persisted, "word2idx");
    const nlohmann::json& word2cnt = require_object(persisted, "word2cnt");
    const nlohmann::json& idx2word = require_object(persisted, "idx2word");

    Vocabulary vocab(name);
    vocab.trimmed_ = true;

    for (auto it = word2idx.begin(); it != word2idx.end(); ++it) {
        if (!it.value().is_number_integer())
            throw ValidationError("persisted vocabulary: index of '" + it.key() + "' is not an integer");
        const int64_t index = it.value().get<int64_t>();
        if (is_reserved_word(it.key()) || index < NUM_RESERVED)
            throw ValidationError("persisted vocabulary already contains reserved entry '" + it.key() + "'");
        if (vocab.idx2word_.count(index))
            throw ValidationError("persisted vocabulary: index " + std::to_string(index) + " is used twice");
        vocab.word2idx_[it.key()] = index;
        vocab.idx2word_[index] = it.key();
    }

    for (auto it = idx2word.begin(); it != idx2word.end(); ++it) {
        const int64_t index = parse_index(it.key());
        if (index < NUM_RESERVED)
            throw ValidationError("persisted vocabulary already contains reserved id " + it.key());
        auto known = vocab.idx2word_.find(index);
        if (!it.value().is_string() || known == vocab.idx2word_.end() || known->second != it.value().get<std::string>())
            throw ValidationError("persisted vocabulary: idx2word[" + it.key() + "] does not match word2idx");
    }
    if (idx2word.size() != word2idx.size())
        throw ValidationError("persisted vocabulary: idx2word and word2idx differ in size");

    for (auto it = word2cnt.begin(); it != word2cnt.end(); ++it) {
        if (!vocab.word2idx_.count(it.key()) || is_reserved_word(it.key()))
            throw ValidationError("persisted vocabulary: count for unknown word '" + it.key() + "'");
        if (!it.value().is_number_integer() || it.value().get<int64_t>() < 1)
            throw ValidationError("persisted vocabulary: count of '" + it.key() + "' is not a positive integer");
        vocab.word2cnt_[it.key()] = it.value().get<int64_t>();
    }
    return vocab;
}

void VocabularyBuilder::add_word(const std::string& word) {
    if (vocab_.trimmed_)
        throw ValidationError("vocabulary '" + vocab_.name_ + "' is trimmed and can no longer grow");
    vocab_.add_word(word);
}

void VocabularyBuilder::add_sentence(const std::string& sentence) {
    if (vocab_.trimmed_)
        throw ValidationError("vocabulary '" + vocab_.name_ + "' is trimmed and can no longer grow");
    for (const auto& word : split_words(sentence)) {
        vocab_.add_word(word);
    }
}

std::optional<TrimStats> VocabularyBuilder::trim(int64_t min_count) {
    if (vocab_.trimmed_) return std::nullopt;
    vocab_.trimmed_ = true;

    std::vector<std::string> keep_words;
    for (const auto& entry : vocab_.idx2word_) {
        if (entry.first < NUM_RESERVED) continue;
        if (vocab_.count(entry.second) >= min_count) keep_words.push_back(entry.second);
    }

    TrimStats stats;
    stats.kept = static_cast<int64_t>(keep_words.size());
    stats.total = static_cast<int64_t>(vocab_.word2cnt_.size());
    std::ostringstream ratio_text;
    ratio_text << std::fixed << std::setprecision(4) << stats.ratio();
    std::cout << "Vocab trimmed to " << stats.kept << "/" << stats.total << " = " << ratio_text.str() << std::endl;

    vocab_.reset();
    for (const auto& word : keep_words) {
        vocab_.add_word(word);
    }
    return stats;
}

} // namespace chatbot
