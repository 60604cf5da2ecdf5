#pragma once

#include <string>
#include <utility>
#include <vector>

namespace chatbot {

using SentencePair = std::pair<std::string, std::string>; // (input, target)

// Whitespace tokenization shared by the vocabulary and the batch assembler.
std::vector<std::string> split_words(const std::string& text);

// Lowercase, strip combining marks (canonical decomposition), separate
// sentence-final punctuation and reduce everything outside [a-z.!?] to
// single spaces. normalize_string(normalize_string(s)) == normalize_string(s).
std::string normalize_string(const std::string& text);

// True if both sides have fewer than MAX_SENT_LENGTH tokens (room left for EOS).
bool filter_pair(const SentencePair& pair);
std::vector<SentencePair> filter_pairs(const std::vector<SentencePair>& pairs);

} // namespace chatbot
