#pragma once

#include <cstdint>
#include <map>
#include <utility>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace chatbot {

// Outcome of one trim pass. ratio() is 0 for an empty vocabulary.
struct TrimStats {
    int64_t kept = 0;
    int64_t total = 0;

    double ratio() const { return total == 0 ? 0.0 : static_cast<double>(kept) / static_cast<double>(total); }
};

// Word <-> index tables. Ids 0/1/2 always hold <PAD>/<SOS>/<EOS>; every other
// word gets the next id in first-seen order. Instances handed out by
// VocabularyBuilder::freeze() or load are never mutated again.
class Vocabulary {
public:
    explicit Vocabulary(std::string name);

    const std::string& name() const { return name_; }
    bool trimmed() const { return trimmed_; }
    int64_t num_words() const { return static_cast<int64_t>(idx2word_.size()); }

    std::optional<int64_t> find(const std::string& word) const;
    const std::string& word_at(int64_t index) const;
    int64_t count(const std::string& word) const;

    // Token ids of `sentence` followed by EOS. Throws LookupError on the first unknown token.
    std::vector<int64_t> indexes_from_sentence(const std::string& sentence) const;
    bool contains_all(const std::string& sentence) const;

    const std::unordered_map<std::string, int64_t>& word2idx() const { return word2idx_; }
    const std::unordered_map<std::string, int64_t>& word2cnt() const { return word2cnt_; }
    const std::map<int64_t, std::string>& idx2word() const { return idx2word_; }

    // Persisted form: reserved entries are left out of all three tables.
    nlohmann::json to_json() const;
    // Rebuilds a trimmed vocabulary and re-inserts the reserved tokens.
    // Throws ValidationError on malformed input or reserved ids/words in the data.
    static Vocabulary from_json(const nlohmann::json& persisted, const std::string& name);

private:
    friend class VocabularyBuilder;

    void reset();
    void add_word(const std::string& word);

    std::string name_;
    bool trimmed_ = false;
    std::unordered_map<std::string, int64_t> word2idx_;
    std::unordered_map<std::string, int64_t> word2cnt_;
    std::map<int64_t, std::string> idx2word_;
};

// Single writer used while scanning the corpus.
class VocabularyBuilder {
public:
    explicit VocabularyBuilder(std::string name) : vocab_(std::move(name)) {}

    // Both throw ValidationError once trim() has run.
    void add_word(const std::string& word);
    void add_sentence(const std::string& sentence);

    // Keeps words seen at least `min_count` times. Survivors are re-added in
    // first-seen order, which resets their counts to 1. Runs once; later
    // calls return std::nullopt and change nothing.
    std::optional<TrimStats> trim(int64_t min_count);

    const Vocabulary& view() const { return vocab_; }
    std::shared_ptr<const Vocabulary> freeze() const { return std::make_shared<const Vocabulary>(vocab_); }

private:
    Vocabulary vocab_;
};

} // namespace chatbot
