#pragma once

#include <cstdint>
#include <string>

namespace chatbot {

// --- Special token indices ---
const int64_t PAD_TOKEN = 0;
const int64_t SOS_TOKEN = 1; // Start of Sentence
const int64_t EOS_TOKEN = 2; // End of Sentence
const int64_t NUM_RESERVED = 3;

const char* const PAD_WORD = "<PAD>";
const char* const SOS_WORD = "<SOS>";
const char* const EOS_WORD = "<EOS>";

// --- Corpus preparation ---
const int64_t MAX_SENT_LENGTH = 10;   // Pairs need strictly fewer tokens than this on both sides
const int64_t MIN_WORD_COUNT = 3;     // Trimming threshold
const char* const CORPUS_NAME = "Cornell_Movie";
const char* const CORNELL_FIELD_SEPARATOR = " +++$+++ ";

// --- Model (Luong attention seq2seq) ---
struct ModelConfig {
    std::string attn_method = "dot"; // "dot", "general" or "concat"
    int64_t hidden_size = 500;
    int64_t encoder_n_layers = 2;
    int64_t decoder_n_layers = 2;
    double dropout = 0.1;
};

} // namespace chatbot
