#include "chatbot/config.h"
#include "chatbot/errors.h"
#include "chatbot/pipeline.h"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

// Usage: build_vocab [base_path] [min_count]
// Reads <base_path>/formatted_pairs.txt, writes vocab.json and processed_pairs.txt next to it.
int main(int argc, char* argv[]) {
    const fs::path base_path = argc > 1 ? fs::path(argv[1]) : fs::path("generated");

    try {
        const int64_t min_count = argc > 2 ? std::stoll(argv[2]) : chatbot::MIN_WORD_COUNT;
        chatbot::PreparedData data = chatbot::prepare_data((base_path / "formatted_pairs.txt").string(),
                                                           chatbot::CORPUS_NAME);
        auto pairs = chatbot::trim_rare_words(data.builder, data.pairs, min_count);

        std::cout << "Saving Vocab & Processed Pairs..." << std::endl;
        chatbot::save_vocabulary(data.builder.view(), (base_path / "vocab.json").string());
        chatbot::write_pairs((base_path / "processed_pairs.txt").string(), pairs);
    } catch (const chatbot::IOError& e) {
        std::cerr << "I/O error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error building vocabulary: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
