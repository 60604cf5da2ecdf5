#pragma once

#include "chatbot/text.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace chatbot {

// --- Cornell Movie-Dialogs records ---
struct MovieLine {
    std::string line_id;
    std::string character_id;
    std::string movie_id;
    std::string character;
    std::string text;
};

struct Conversation {
    std::string character1_id;
    std::string character2_id;
    std::string movie_id;
    std::string utterance_ids; // e.g. "['L194', 'L195']"
    std::vector<MovieLine> lines;
};

// movie_lines.txt -> line id -> record. Input is ISO-8859-1, fields come back as UTF-8.
std::unordered_map<std::string, MovieLine> load_lines(const std::string& path);

// movie_conversations.txt; every referenced line id must exist in `lines` (LookupError otherwise).
std::vector<Conversation> load_conversations(const std::string& path,
                                             const std::unordered_map<std::string, MovieLine>& lines);

// Each line paired with the one that answers it; pairs with an empty side are skipped.
std::vector<SentencePair> extract_sentence_pairs(const std::vector<Conversation>& conversations);

} // namespace chatbot
