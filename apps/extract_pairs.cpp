#include "chatbot/corpus.h"
#include "chatbot/errors.h"
#include "chatbot/pipeline.h"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

// Usage: extract_pairs [corpus_dir] [output_file]
int main(int argc, char* argv[]) {
    const fs::path corpus_dir = argc > 1 ? fs::path(argv[1]) : fs::path("data") / "cornell movie-dialogs corpus";
    const fs::path output_file = argc > 2 ? fs::path(argv[2]) : fs::path("generated") / "formatted_pairs.txt";

    if (!fs::exists(corpus_dir)) {
        std::cerr << "Data directory does not exist: " << corpus_dir << std::endl;
        return 1;
    }

    try {
        if (output_file.has_parent_path()) fs::create_directories(output_file.parent_path());

        std::cout << "Loading Corpus..." << std::endl;
        auto lines = chatbot::load_lines((corpus_dir / "movie_lines.txt").string());
        std::cout << "Loading Conversations..." << std::endl;
        auto conversations = chatbot::load_conversations((corpus_dir / "movie_conversations.txt").string(), lines);
        std::cout << "Extracting Sentence Pairs..." << std::endl;
        auto pairs = chatbot::extract_sentence_pairs(conversations);

        std::cout << "Writing " << pairs.size() << " pairs to " << output_file << std::endl;
        chatbot::write_pairs(output_file.string(), pairs);
    } catch (const chatbot::IOError& e) {
        std::cerr << "I/O error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error extracting pairs: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
